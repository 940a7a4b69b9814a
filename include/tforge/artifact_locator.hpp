#pragma once

#include <QString>
#include <QStringList>

namespace tforge {

class ArtifactLocator {
public:
    // Absolute path of the most recently modified file ending in |extension|,
    // or an empty string when the directory holds none or cannot be read.
    static QString findLatest(const QString& directory, const QString& extension);

    // Every matching file, newest first.
    static QStringList listArtifacts(const QString& directory, const QString& extension);
};

}  // namespace tforge
