#include "tforge/artifact_locator.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QFileInfoList>

#include <algorithm>

namespace tforge {

namespace {

QFileInfoList matchingFiles(const QString& directory, const QString& extension) {
    const QDir dir(directory);
    if (!dir.exists()) {
        return {};
    }
    QFileInfoList out;
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::Unsorted);
    for (const QFileInfo& entry : entries) {
        if (entry.fileName().endsWith(extension, Qt::CaseSensitive)) {
            out.append(entry);
        }
    }
    return out;
}

}  // namespace

QString ArtifactLocator::findLatest(const QString& directory, const QString& extension) {
    const QFileInfoList files = matchingFiles(directory, extension);
    if (files.isEmpty()) {
        return {};
    }
    QFileInfo newest = files.first();
    for (const QFileInfo& candidate : files) {
        if (candidate.lastModified() > newest.lastModified()) {
            newest = candidate;
        }
    }
    return newest.absoluteFilePath();
}

QStringList ArtifactLocator::listArtifacts(const QString& directory, const QString& extension) {
    QFileInfoList files = matchingFiles(directory, extension);
    std::stable_sort(files.begin(), files.end(), [](const QFileInfo& left, const QFileInfo& right) {
        return left.lastModified() > right.lastModified();
    });
    QStringList out;
    for (const QFileInfo& file : files) {
        out.append(file.absoluteFilePath());
    }
    return out;
}

}  // namespace tforge
