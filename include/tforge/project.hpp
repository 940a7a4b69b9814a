#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QUuid>

namespace tforge {

// A tweak project rooted at |rootPath|, described by <root>/project.json.
struct Project {
    QUuid id;
    QString name;
    QString bundleId;
    QString targetApp;
    QString rootPath;
    QDateTime createdAt;

    [[nodiscard]] bool isValid() const { return !id.isNull() && !rootPath.isEmpty(); }
    [[nodiscard]] QString makefilePath() const;
    [[nodiscard]] QString metadataPath() const;
    [[nodiscard]] QString outputPath(const QString& outputDirectory) const;
    [[nodiscard]] bool isBuildable() const;

    [[nodiscard]] QJsonObject toJson() const;
    // The stored path is informational; |directory| always wins.
    static Project fromJson(const QJsonObject& object, const QString& directory);
};

}  // namespace tforge

Q_DECLARE_METATYPE(tforge::Project)
