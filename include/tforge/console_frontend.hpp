#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include <memory>

#include "tforge/app_config.hpp"
#include "tforge/build_log.hpp"
#include "tforge/container_resolver.hpp"
#include "tforge/process_runner.hpp"
#include "tforge/project_store.hpp"

namespace tforge {

// Command-line collaborator of the build pipeline and install runner. Prints
// every log entry with a severity prefix and maps outcomes to exit codes.
class ConsoleFrontend final : public QObject {
    Q_OBJECT

public:
    explicit ConsoleFrontend(const AppConfig& config, QObject* parent = nullptr);

    // |arguments| are the positional arguments: the command and its operands.
    int run(const QStringList& arguments);

    static QString usage();

private:
    int listProjects();
    int createProject(const QStringList& operands);
    int buildProject(const QString& reference);
    int installPackage(const QString& reference);
    int repairProject(const QString& reference);
    int importArchive(const QString& archivePath);
    int deleteProject(const QString& reference);
    int printEnvironment();

    bool resolveProject(const QString& reference, Project* project);
    void printEntry(const BuildLogEntry& entry);
    void printError(const QString& message);

    AppConfig config_;
    ProcessRunner runner_;
    std::unique_ptr<ContainerResolver> resolver_;
    ProjectStore store_;
    QTextStream out_;
    QTextStream err_;
};

}  // namespace tforge
