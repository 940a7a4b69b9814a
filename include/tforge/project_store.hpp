#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "tforge/app_config.hpp"
#include "tforge/container_resolver.hpp"
#include "tforge/process_runner.hpp"
#include "tforge/project.hpp"

namespace tforge {

// On-disk catalogue of tweak projects: one directory per project under a
// writable root, each described by its project.json.
class ProjectStore {
public:
    ProjectStore(const AppConfig& config, const ProcessRunner* runner, const ContainerResolver* resolver);

    // First candidate root that can be created and written to. The result is
    // remembered and returned by root().
    QString resolveWritableRoot();
    [[nodiscard]] QString root() const { return root_; }
    [[nodiscard]] QStringList candidateRoots() const;

    // Sorted by name. Directories without a readable project.json are skipped.
    QVector<Project> loadProjects();
    QJsonObject loadProject(const QString& directory, Project* project) const;
    // |reference| may be a project directory, an id or a name.
    QJsonObject findProject(const QString& reference, Project* project);

    QJsonObject createProject(
        const QString& name,
        const QString& bundleId,
        const QString& targetApp,
        Project* project);
    QJsonObject deleteProject(const Project& project);
    QJsonObject importArchive(const QString& archivePath, Project* project);

    static QString makefileTemplate(const QString& name);
    static QString tweakTemplate(const QString& name, const QString& targetApp);
    static QString controlTemplate(const QString& name, const QString& bundleId);
    static QString filterPlistTemplate(const QString& targetApp);

private:
    bool probeRoot(const QString& candidate) const;
    QString ensureRoot();

    StoreSettings store_;
    const ProcessRunner* runner_;
    const ContainerResolver* resolver_;
    QString root_;
};

}  // namespace tforge
