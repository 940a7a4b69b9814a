#include "tforge/project_store.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QPair>
#include <QRegularExpression>
#include <QSaveFile>
#include <QStandardPaths>
#include <QUuid>
#include <QVector>

#include <algorithm>

#include "tforge/telemetry.hpp"

namespace tforge {

namespace {

constexpr const char* kRootName = "TweakProjects";
constexpr const char* kMetadataFile = "project.json";

QJsonObject writeTextFile(const QString& filePath, const QString& content) {
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return {
            {"success", false},
            {"error", QString("Failed to open %1 for writing.").arg(QFileInfo(filePath).fileName())},
            {"path", filePath},
        };
    }
    file.write(content.toUtf8());
    if (!file.commit()) {
        return {
            {"success", false},
            {"error", QString("Failed to write %1: %2").arg(QFileInfo(filePath).fileName(), file.errorString())},
            {"path", filePath},
        };
    }
    return {
        {"success", true},
        {"path", filePath},
    };
}

QJsonObject writeMetadata(const Project& project) {
    return writeTextFile(
        project.metadataPath(),
        QString::fromUtf8(QJsonDocument(project.toJson()).toJson(QJsonDocument::Indented)));
}

QString bundleIdFromName(const QString& name) {
    QString slug = name.toLower();
    slug.replace(QRegularExpression("[^a-z0-9]+"), "");
    if (slug.isEmpty()) {
        slug = "tweak";
    }
    return "com.tweakforge." + slug;
}

// Moves everything in |from| into |to| and removes |from|. |from| is renamed
// aside first so an entry sharing its name can take its place.
bool hoistDirectory(const QString& from, const QString& to) {
    const QString staging =
        QDir(to).filePath(".hoist-" + QUuid::createUuid().toString(QUuid::WithoutBraces));
    if (!QDir().rename(from, staging)) {
        return false;
    }
    QDir source(staging);
    const QStringList entries = source.entryList(QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        if (!QDir().rename(source.filePath(entry), QDir(to).filePath(entry))) {
            return false;
        }
    }
    return source.removeRecursively();
}

}  // namespace

ProjectStore::ProjectStore(const AppConfig& config, const ProcessRunner* runner, const ContainerResolver* resolver)
    : store_(config.store),
      runner_(runner),
      resolver_(resolver) {}

QStringList ProjectStore::candidateRoots() const {
    QStringList out;
    if (!store_.projectsDirectory.trimmed().isEmpty()) {
        out.append(QDir(store_.projectsDirectory).absolutePath());
    }
    const QString container = resolver_ != nullptr ? resolver_->containerPath() : QString();
    if (!container.isEmpty()) {
        out.append(QDir(container).filePath(QString("Documents/%1").arg(kRootName)));
    }
    const QString cache = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    if (!cache.isEmpty()) {
        out.append(QDir(cache).filePath(kRootName));
    }
    out.append(QDir(QDir::tempPath()).filePath(kRootName));
    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!appData.isEmpty()) {
        out.append(QDir(appData).filePath(kRootName));
    }
    out.removeDuplicates();
    return out;
}

bool ProjectStore::probeRoot(const QString& candidate) const {
    if (!QDir().mkpath(candidate)) {
        return false;
    }
    QFile probe(QDir(candidate).filePath(".permcheck"));
    if (!probe.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const bool written = probe.write("ok") == 2;
    probe.close();
    return probe.remove() && written;
}

QString ProjectStore::resolveWritableRoot() {
    for (const QString& candidate : candidateRoots()) {
        if (probeRoot(candidate)) {
            root_ = candidate;
            Telemetry::instance().recordEvent("store.root", {{"path", candidate}});
            return root_;
        }
        Telemetry::instance().recordEvent("store.root_rejected", {{"path", candidate}});
    }
    root_ = QDir(QDir::tempPath()).filePath(kRootName);
    return root_;
}

QString ProjectStore::ensureRoot() {
    if (root_.isEmpty()) {
        resolveWritableRoot();
    }
    return root_;
}

QVector<Project> ProjectStore::loadProjects() {
    QVector<Project> projects;
    const QDir root(ensureRoot());
    const QStringList directories = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString& directory : directories) {
        Project project;
        if (loadProject(root.filePath(directory), &project).value("success").toBool(false)) {
            projects.append(project);
        }
    }
    std::sort(projects.begin(), projects.end(), [](const Project& left, const Project& right) {
        return left.name < right.name;
    });
    return projects;
}

QJsonObject ProjectStore::loadProject(const QString& directory, Project* project) const {
    const QString metadataPath = QDir(directory).filePath(kMetadataFile);
    QFile file(metadataPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open project.json."},
            {"path", metadataPath},
        };
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return {
            {"success", false},
            {"error", "project.json must contain a JSON object."},
            {"path", metadataPath},
        };
    }

    const Project loaded = Project::fromJson(doc.object(), directory);
    if (!loaded.isValid() || loaded.name.isEmpty()) {
        return {
            {"success", false},
            {"error", "project.json is missing its id or name."},
            {"path", metadataPath},
        };
    }
    if (project != nullptr) {
        *project = loaded;
    }
    return {
        {"success", true},
        {"path", loaded.rootPath},
    };
}

QJsonObject ProjectStore::findProject(const QString& reference, Project* project) {
    const QFileInfo asPath(reference);
    if (asPath.isDir()) {
        return loadProject(asPath.absoluteFilePath(), project);
    }

    const QUuid asId = QUuid::fromString(reference);
    for (const Project& candidate : loadProjects()) {
        const bool matches = (!asId.isNull() && candidate.id == asId) || candidate.name == reference;
        if (matches) {
            if (project != nullptr) {
                *project = candidate;
            }
            return {
                {"success", true},
                {"path", candidate.rootPath},
            };
        }
    }
    return {
        {"success", false},
        {"error", QString("No project matches '%1'.").arg(reference)},
        {"path", root_},
    };
}

QString ProjectStore::makefileTemplate(const QString& name) {
    return QString(
               "export ARCHS = arm64\n"
               "export TARGET = iphone:clang:14.5:latest\n"
               "\n"
               "include $(THEOS)/makefiles/common.mk\n"
               "\n"
               "TWEAK_NAME = %1\n"
               "%1_FILES = Tweak.x\n"
               "%1_FRAMEWORKS = UIKit Foundation\n"
               "\n"
               "include $(THEOS_MAKE_PATH)/tweak.mk\n"
               "\n"
               "after-install::\n"
               "\tinstall.exec \"sbreload\"\n")
        .arg(name);
}

QString ProjectStore::tweakTemplate(const QString& name, const QString& targetApp) {
    return QString(
               "%hook SpringBoard\n"
               "\n"
               "- (void)applicationDidFinishLaunching:(id)application {\n"
               "    %orig;\n"
               "    NSLog(@\"%1 loaded for %2!\");\n"
               "}\n"
               "\n"
               "%end\n")
        .arg(name, targetApp);
}

QString ProjectStore::controlTemplate(const QString& name, const QString& bundleId) {
    return QString(
               "Package: %1\n"
               "Name: %2\n"
               "Version: 1.0.0\n"
               "Architecture: iphoneos-arm\n"
               "Description: Tweak created with TweakForge\n"
               "Maintainer: Unknown\n"
               "Author: Unknown\n"
               "Section: Tweaks\n"
               "Depends: mobilesubstrate\n")
        .arg(bundleId, name);
}

QString ProjectStore::filterPlistTemplate(const QString& targetApp) {
    return QString(
               "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
               "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
               "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
               "<plist version=\"1.0\">\n"
               "<dict>\n"
               "    <key>Filter</key>\n"
               "    <dict>\n"
               "        <key>Bundles</key>\n"
               "        <array>\n"
               "            <string>%1</string>\n"
               "        </array>\n"
               "    </dict>\n"
               "</dict>\n"
               "</plist>\n")
        .arg(targetApp);
}

QJsonObject ProjectStore::createProject(
    const QString& name,
    const QString& bundleId,
    const QString& targetApp,
    Project* project) {
    const QString trimmedName = name.trimmed();
    if (trimmedName.isEmpty() || trimmedName.contains('/') || trimmedName.startsWith('.')) {
        return {
            {"success", false},
            {"error", "Project name must be non-empty and must not contain '/'."},
        };
    }
    if (bundleId.trimmed().isEmpty() || targetApp.trimmed().isEmpty()) {
        return {
            {"success", false},
            {"error", "Bundle id and target app are required."},
        };
    }

    resolveWritableRoot();

    Project created;
    created.id = QUuid::createUuid();
    created.name = trimmedName;
    created.bundleId = bundleId.trimmed();
    created.targetApp = targetApp.trimmed();
    created.rootPath = QDir(root_).filePath(created.id.toString(QUuid::WithoutBraces).toUpper());
    created.createdAt = QDateTime::currentDateTimeUtc();

    const QDir projectDir(created.rootPath);
    if (!QDir().mkpath(projectDir.filePath("packages"))) {
        return {
            {"success", false},
            {"error", "Failed to create project directory."},
            {"path", created.rootPath},
        };
    }

    const QVector<QPair<QString, QString>> files = {
        {"Makefile", makefileTemplate(created.name)},
        {"Tweak.x", tweakTemplate(created.name, created.targetApp)},
        {"control", controlTemplate(created.name, created.bundleId)},
        {created.name + ".plist", filterPlistTemplate(created.targetApp)},
    };
    for (const auto& file : files) {
        const QJsonObject written = writeTextFile(projectDir.filePath(file.first), file.second);
        if (!written.value("success").toBool(false)) {
            QDir(created.rootPath).removeRecursively();
            return written;
        }
    }
    const QJsonObject metadata = writeMetadata(created);
    if (!metadata.value("success").toBool(false)) {
        QDir(created.rootPath).removeRecursively();
        return metadata;
    }

    Telemetry::instance().incrementCounter("store.projects_created");
    if (project != nullptr) {
        *project = created;
    }
    return {
        {"success", true},
        {"id", created.id.toString(QUuid::WithoutBraces)},
        {"path", created.rootPath},
    };
}

QJsonObject ProjectStore::deleteProject(const Project& project) {
    const QFileInfo info(project.rootPath);
    if (project.rootPath.isEmpty() || !info.isDir()) {
        return {
            {"success", false},
            {"error", "Project directory does not exist."},
            {"path", project.rootPath},
        };
    }
    if (!QDir(project.rootPath).removeRecursively()) {
        return {
            {"success", false},
            {"error", "Failed to remove project directory."},
            {"path", project.rootPath},
        };
    }
    Telemetry::instance().incrementCounter("store.projects_deleted");
    return {
        {"success", true},
        {"path", project.rootPath},
    };
}

QJsonObject ProjectStore::importArchive(const QString& archivePath, Project* project) {
    const QFileInfo archive(archivePath);
    if (!archive.isFile()) {
        return {
            {"success", false},
            {"error", "Archive does not exist."},
            {"path", archivePath},
        };
    }

    resolveWritableRoot();
    const QUuid id = QUuid::createUuid();
    const QString destination = QDir(root_).filePath(id.toString(QUuid::WithoutBraces).toUpper());
    if (!QDir().mkpath(destination)) {
        return {
            {"success", false},
            {"error", "Failed to create import directory."},
            {"path", destination},
        };
    }

    const ProcessExecutionResult unzip =
        runner_->run(store_.archiveTool, {"-q", archive.absoluteFilePath(), "-d", destination});
    if (!unzip.success()) {
        QDir(destination).removeRecursively();
        Telemetry::instance().incrementCounter("store.import_failed");
        const QString detail = unzip.stderrText.trimmed();
        return {
            {"success", false},
            {"error", QString("Extraction failed with exit code %1%2")
                          .arg(unzip.exitCode)
                          .arg(detail.isEmpty() ? QString() : ": " + detail)},
            {"exit_code", unzip.exitCode},
            {"path", archivePath},
        };
    }

    // Archives made by zipping the project folder itself hold a single
    // top-level directory.
    QDir extracted(destination);
    if (!QFileInfo(extracted.filePath(kMetadataFile)).isFile()
        && !QFileInfo(extracted.filePath("Makefile")).isFile()) {
        const QStringList children = extracted.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
        if (children.size() == 1) {
            const QString nested = extracted.filePath(children.first());
            const bool hasProject = QFileInfo(QDir(nested).filePath(kMetadataFile)).isFile()
                || QFileInfo(QDir(nested).filePath("Makefile")).isFile();
            if (hasProject && !hoistDirectory(nested, destination)) {
                QDir(destination).removeRecursively();
                return {
                    {"success", false},
                    {"error", "Failed to unpack nested project directory."},
                    {"path", archivePath},
                };
            }
        }
    }

    Project imported;
    if (loadProject(destination, &imported).value("success").toBool(false)) {
        // A copy of an existing project must not share its id.
        imported.id = id;
    } else if (QFileInfo(extracted.filePath("Makefile")).isFile()) {
        imported.id = id;
        imported.name = archive.completeBaseName();
        imported.bundleId = bundleIdFromName(imported.name);
        imported.targetApp = "com.apple.springboard";
        imported.rootPath = QDir(destination).absolutePath();
        imported.createdAt = QDateTime::currentDateTimeUtc();
    } else {
        QDir(destination).removeRecursively();
        Telemetry::instance().incrementCounter("store.import_failed");
        return {
            {"success", false},
            {"error", "Archive contains neither project.json nor a Makefile."},
            {"path", archivePath},
        };
    }

    const QJsonObject metadata = writeMetadata(imported);
    if (!metadata.value("success").toBool(false)) {
        QDir(destination).removeRecursively();
        return metadata;
    }
    QDir().mkpath(imported.outputPath("packages"));

    Telemetry::instance().incrementCounter("store.projects_imported");
    if (project != nullptr) {
        *project = imported;
    }
    return {
        {"success", true},
        {"id", imported.id.toString(QUuid::WithoutBraces)},
        {"path", imported.rootPath},
    };
}

}  // namespace tforge
