#include "tforge/project.hpp"

#include <QDir>
#include <QFileInfo>

namespace tforge {

QString Project::makefilePath() const {
    return QDir(rootPath).filePath("Makefile");
}

QString Project::metadataPath() const {
    return QDir(rootPath).filePath("project.json");
}

QString Project::outputPath(const QString& outputDirectory) const {
    if (QDir::isAbsolutePath(outputDirectory)) {
        return outputDirectory;
    }
    return QDir(rootPath).filePath(outputDirectory);
}

bool Project::isBuildable() const {
    return QFileInfo(makefilePath()).isFile();
}

QJsonObject Project::toJson() const {
    return {
        {"id", id.toString(QUuid::WithoutBraces)},
        {"name", name},
        {"bundleId", bundleId},
        {"targetApp", targetApp},
        {"path", rootPath},
        {"createdDate", createdAt.toUTC().toString(Qt::ISODate)},
    };
}

Project Project::fromJson(const QJsonObject& object, const QString& directory) {
    Project project;
    project.id = QUuid::fromString(object.value("id").toString());
    project.name = object.value("name").toString();
    project.bundleId = object.value("bundleId").toString();
    project.targetApp = object.value("targetApp").toString();
    project.rootPath = QDir(directory).absolutePath();
    project.createdAt = QDateTime::fromString(object.value("createdDate").toString(), Qt::ISODate);
    if (!project.createdAt.isValid()) {
        project.createdAt = QFileInfo(directory).birthTime();
    }
    return project;
}

}  // namespace tforge
