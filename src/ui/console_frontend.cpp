#include "tforge/console_frontend.hpp"

#include <QEventLoop>
#include <QFileInfo>

#include "tforge/artifact_locator.hpp"
#include "tforge/build_pipeline.hpp"
#include "tforge/install_runner.hpp"

namespace tforge {

ConsoleFrontend::ConsoleFrontend(const AppConfig& config, QObject* parent)
    : QObject(parent),
      config_(config),
      runner_(config.runner, config.toolchain),
      resolver_(makeContainerResolver(config)),
      store_(config, &runner_, resolver_.get()),
      out_(stdout),
      err_(stderr) {}

QString ConsoleFrontend::usage() {
    return QStringLiteral(
        "Commands:\n"
        "  list                                 List projects\n"
        "  create <name> <bundle-id> <target>   Create a project from the tweak template\n"
        "  build <project>                      Clean and package a project\n"
        "  install <project|package.deb>        Install a package and refresh the icon cache\n"
        "  repair <project>                     Rewrite hardcoded Theos paths in the Makefile\n"
        "  import <archive.zip>                 Import a zipped project\n"
        "  delete <project>                     Delete a project directory\n"
        "  env                                  Show the toolchain environment\n"
        "\n"
        "<project> is a project directory, id or name.\n");
}

int ConsoleFrontend::run(const QStringList& arguments) {
    if (arguments.isEmpty()) {
        err_ << usage();
        err_.flush();
        return 2;
    }

    const QString command = arguments.first();
    const QStringList operands = arguments.mid(1);
    if (command == "list" && operands.isEmpty()) {
        return listProjects();
    }
    if (command == "create") {
        return createProject(operands);
    }
    if (command == "env" && operands.isEmpty()) {
        return printEnvironment();
    }
    if (operands.size() == 1) {
        if (command == "build") {
            return buildProject(operands.first());
        }
        if (command == "install") {
            return installPackage(operands.first());
        }
        if (command == "repair") {
            return repairProject(operands.first());
        }
        if (command == "import") {
            return importArchive(operands.first());
        }
        if (command == "delete") {
            return deleteProject(operands.first());
        }
    }

    printError(QString("Unknown command or wrong number of arguments: %1").arg(arguments.join(' ')));
    err_ << usage();
    err_.flush();
    return 2;
}

void ConsoleFrontend::printEntry(const BuildLogEntry& entry) {
    QTextStream& stream = entry.severity == LogSeverity::Error ? err_ : out_;
    stream << "[" << entry.timestamp.toLocalTime().toString("HH:mm:ss") << "] "
           << severityName(entry.severity).toUpper() << ": " << entry.message << "\n";
    stream.flush();
}

void ConsoleFrontend::printError(const QString& message) {
    err_ << "error: " << message << "\n";
    err_.flush();
}

bool ConsoleFrontend::resolveProject(const QString& reference, Project* project) {
    const QJsonObject found = store_.findProject(reference, project);
    if (!found.value("success").toBool(false)) {
        printError(found.value("error").toString());
        return false;
    }
    return true;
}

int ConsoleFrontend::listProjects() {
    const QVector<Project> projects = store_.loadProjects();
    out_ << "Projects in " << store_.root() << "\n";
    if (projects.isEmpty()) {
        out_ << "  (none)\n";
    }
    for (const Project& project : projects) {
        out_ << "  " << project.id.toString(QUuid::WithoutBraces) << "  " << project.name << "  "
             << project.bundleId << " -> " << project.targetApp;
        if (!project.isBuildable()) {
            out_ << "  [no Makefile]";
        }
        out_ << "\n";
    }
    out_.flush();
    return 0;
}

int ConsoleFrontend::createProject(const QStringList& operands) {
    if (operands.size() != 3) {
        printError("create expects <name> <bundle-id> <target>");
        return 2;
    }
    Project project;
    const QJsonObject created = store_.createProject(operands.at(0), operands.at(1), operands.at(2), &project);
    if (!created.value("success").toBool(false)) {
        printError(created.value("error").toString());
        return 1;
    }
    out_ << "Created " << project.name << " at " << project.rootPath << "\n";
    out_.flush();
    return 0;
}

int ConsoleFrontend::buildProject(const QString& reference) {
    Project project;
    if (!resolveProject(reference, &project)) {
        return 1;
    }

    BuildPipeline pipeline(config_, &runner_);
    QEventLoop loop;
    connect(&pipeline, &BuildPipeline::logAppended, this, [this](const BuildLogEntry& entry) {
        printEntry(entry);
    });
    connect(&pipeline, &BuildPipeline::finished, &loop, &QEventLoop::quit);
    if (!pipeline.compile(project)) {
        printError("A build is already running.");
        return 1;
    }
    loop.exec();

    const std::optional<BuildResult> result = pipeline.lastResult();
    return result.has_value() && result->success ? 0 : 1;
}

int ConsoleFrontend::installPackage(const QString& reference) {
    QString packagePath;
    const QFileInfo asFile(reference);
    if (asFile.isFile() && reference.endsWith(config_.build.artifactExtension)) {
        packagePath = asFile.absoluteFilePath();
    } else {
        Project project;
        if (!resolveProject(reference, &project)) {
            return 1;
        }
        packagePath = ArtifactLocator::findLatest(
            project.outputPath(config_.build.outputDirectory),
            config_.build.artifactExtension);
        if (packagePath.isEmpty()) {
            printError(QString("No package found for %1. Build it first.").arg(project.name));
            return 1;
        }
    }

    InstallRunner installer(config_, &runner_);
    QEventLoop loop;
    connect(&installer, &InstallRunner::logAppended, this, [this](const BuildLogEntry& entry) {
        printEntry(entry);
    });
    connect(&installer, &InstallRunner::finished, &loop, &QEventLoop::quit);
    if (!installer.install(packagePath)) {
        printError("An install is already running.");
        return 1;
    }
    loop.exec();

    const std::optional<InstallResult> result = installer.lastResult();
    return result.has_value() && result->success ? 0 : 1;
}

int ConsoleFrontend::repairProject(const QString& reference) {
    Project project;
    if (!resolveProject(reference, &project)) {
        return 1;
    }

    BuildPipeline pipeline(config_, &runner_);
    QEventLoop loop;
    bool repaired = false;
    connect(&pipeline, &BuildPipeline::logAppended, this, [this](const BuildLogEntry& entry) {
        printEntry(entry);
    });
    connect(&pipeline, &BuildPipeline::repairFinished, &loop, [&loop, &repaired](const QJsonObject& result) {
        repaired = result.value("success").toBool(false);
        loop.quit();
    });
    if (!pipeline.repair(project)) {
        printError("A build is already running.");
        return 1;
    }
    loop.exec();
    return repaired ? 0 : 1;
}

int ConsoleFrontend::importArchive(const QString& archivePath) {
    Project project;
    const QJsonObject imported = store_.importArchive(archivePath, &project);
    if (!imported.value("success").toBool(false)) {
        printError(imported.value("error").toString());
        return 1;
    }
    out_ << "Imported " << project.name << " at " << project.rootPath << "\n";
    out_.flush();
    return 0;
}

int ConsoleFrontend::deleteProject(const QString& reference) {
    Project project;
    if (!resolveProject(reference, &project)) {
        return 1;
    }
    const QJsonObject deleted = store_.deleteProject(project);
    if (!deleted.value("success").toBool(false)) {
        printError(deleted.value("error").toString());
        return 1;
    }
    out_ << "Deleted " << project.name << "\n";
    out_.flush();
    return 0;
}

int ConsoleFrontend::printEnvironment() {
    const ProcessIdentity identity = runner_.defaultIdentity();
    out_ << "identity: uid=" << identity.uid << " gid=" << identity.gid << "\n";
    out_ << "shell: " << runner_.resolveExecutable(config_.runner.shell) << "\n";
    out_ << "build tool: " << runner_.resolveExecutable(config_.build.tool) << "\n";
    out_ << "package manager: " << runner_.resolveExecutable(config_.install.packageManager) << "\n";
    out_ << "container: " << resolver_->name() << " " << resolver_->containerPath() << "\n";
    out_ << "projects root: " << store_.resolveWritableRoot() << "\n";
    out_ << "environment:\n";
    for (const QString& entry : runner_.environment()) {
        out_ << "  " << entry << "\n";
    }
    out_.flush();
    return 0;
}

}  // namespace tforge
