#include "tforge/app_config.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>

#ifdef Q_OS_UNIX
#include <pwd.h>
#include <sys/types.h>
#endif

namespace tforge {

namespace {

QString homeForUid(quint32 uid) {
#ifdef Q_OS_UNIX
    const passwd* entry = ::getpwuid(static_cast<uid_t>(uid));
    if (entry != nullptr && entry->pw_dir != nullptr && entry->pw_dir[0] != '\0') {
        return QString::fromLocal8Bit(entry->pw_dir);
    }
#else
    Q_UNUSED(uid);
#endif
    return QStringLiteral("/var/mobile");
}

QStringList toStringList(const QJsonValue& value, const QStringList& fallback) {
    if (!value.isArray()) {
        return fallback;
    }
    QStringList out;
    for (const QJsonValue& item : value.toArray()) {
        const QString text = item.toString().trimmed();
        if (!text.isEmpty()) {
            out.append(text);
        }
    }
    return out;
}

QJsonArray toJsonArray(const QStringList& values) {
    QJsonArray out;
    for (const QString& value : values) {
        out.append(value);
    }
    return out;
}

}  // namespace

AppConfig AppConfig::defaults() {
    AppConfig config;
    config.runner.searchDirectories = {"/var/jb/usr/bin", "/var/jb/bin", "/usr/bin", "/bin"};
    config.runner.pathEntries = {
        "/var/jb/usr/bin",
        "/var/jb/bin",
        "/usr/bin",
        "/bin",
        "/usr/sbin",
        "/sbin",
    };
    config.runner.homeDirectory = homeForUid(config.runner.uid);
    config.runner.tempDirectory = QDir::tempPath();
    return config;
}

void AppConfig::applyJson(const QJsonObject& object) {
    const QJsonObject runnerObj = object.value("runner").toObject();
    runner.uid = static_cast<quint32>(runnerObj.value("uid").toInteger(runner.uid));
    runner.gid = static_cast<quint32>(runnerObj.value("gid").toInteger(runner.gid));
    runner.shell = runnerObj.value("shell").toString(runner.shell);
    runner.searchDirectories =
        toStringList(runnerObj.value("search_directories"), runner.searchDirectories);
    runner.pathEntries = toStringList(runnerObj.value("path_entries"), runner.pathEntries);
    if (runnerObj.contains("home")) {
        runner.homeDirectory = runnerObj.value("home").toString(runner.homeDirectory);
    } else if (runnerObj.contains("uid")) {
        runner.homeDirectory = homeForUid(runner.uid);
    }
    runner.tempDirectory = runnerObj.value("tmpdir").toString(runner.tempDirectory);
    runner.terminateGraceMs =
        qMax(0, runnerObj.value("terminate_grace_ms").toInt(runner.terminateGraceMs));

    const QJsonObject toolchainObj = object.value("toolchain").toObject();
    toolchain.theosRoot = toolchainObj.value("theos").toString(toolchain.theosRoot);
    toolchain.deviceIp = toolchainObj.value("device_ip").toString(toolchain.deviceIp);
    toolchain.devicePort = toolchainObj.value("device_port").toInt(toolchain.devicePort);
    toolchain.packageScheme =
        toolchainObj.value("package_scheme").toString(toolchain.packageScheme);

    const QJsonObject buildObj = object.value("build").toObject();
    build.tool = buildObj.value("tool").toString(build.tool);
    build.cleanBeforeBuild = buildObj.value("clean_before_build").toBool(build.cleanBeforeBuild);
    build.autoRepairMakefile =
        buildObj.value("auto_repair_makefile").toBool(build.autoRepairMakefile);
    build.outputDirectory = buildObj.value("output_directory").toString(build.outputDirectory);
    build.artifactExtension =
        buildObj.value("artifact_extension").toString(build.artifactExtension);

    const QJsonObject installObj = object.value("install").toObject();
    install.packageManager =
        installObj.value("package_manager").toString(install.packageManager);
    install.cacheRefresh = installObj.value("cache_refresh").toString(install.cacheRefresh);
    install.cacheRefreshArguments = toStringList(
        installObj.value("cache_refresh_arguments"), install.cacheRefreshArguments);

    const QJsonObject storeObj = object.value("store").toObject();
    store.projectsDirectory =
        storeObj.value("projects_directory").toString(store.projectsDirectory);
    store.containerResolver =
        storeObj.value("container_resolver").toString(store.containerResolver);
    store.archiveTool = storeObj.value("archive_tool").toString(store.archiveTool);

    telemetryExportPath =
        object.value("telemetry_export_path").toString(telemetryExportPath);
}

QJsonObject AppConfig::toJson() const {
    QJsonObject runnerObj;
    runnerObj.insert("uid", static_cast<qint64>(runner.uid));
    runnerObj.insert("gid", static_cast<qint64>(runner.gid));
    runnerObj.insert("shell", runner.shell);
    runnerObj.insert("search_directories", toJsonArray(runner.searchDirectories));
    runnerObj.insert("path_entries", toJsonArray(runner.pathEntries));
    runnerObj.insert("home", runner.homeDirectory);
    runnerObj.insert("tmpdir", runner.tempDirectory);
    runnerObj.insert("terminate_grace_ms", runner.terminateGraceMs);

    QJsonObject toolchainObj;
    toolchainObj.insert("theos", toolchain.theosRoot);
    toolchainObj.insert("device_ip", toolchain.deviceIp);
    toolchainObj.insert("device_port", toolchain.devicePort);
    toolchainObj.insert("package_scheme", toolchain.packageScheme);

    QJsonObject buildObj;
    buildObj.insert("tool", build.tool);
    buildObj.insert("clean_before_build", build.cleanBeforeBuild);
    buildObj.insert("auto_repair_makefile", build.autoRepairMakefile);
    buildObj.insert("output_directory", build.outputDirectory);
    buildObj.insert("artifact_extension", build.artifactExtension);

    QJsonObject installObj;
    installObj.insert("package_manager", install.packageManager);
    installObj.insert("cache_refresh", install.cacheRefresh);
    installObj.insert("cache_refresh_arguments", toJsonArray(install.cacheRefreshArguments));

    QJsonObject storeObj;
    storeObj.insert("projects_directory", store.projectsDirectory);
    storeObj.insert("container_resolver", store.containerResolver);
    storeObj.insert("archive_tool", store.archiveTool);

    QJsonObject out;
    out.insert("runner", runnerObj);
    out.insert("toolchain", toolchainObj);
    out.insert("build", buildObj);
    out.insert("install", installObj);
    out.insert("store", storeObj);
    out.insert("telemetry_export_path", telemetryExportPath);
    return out;
}

QJsonObject AppConfig::loadFromFile(const QString& filePath, AppConfig* config) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open configuration file."},
            {"path", filePath},
        };
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return {
            {"success", false},
            {"error", "Configuration file must contain a JSON object."},
            {"path", filePath},
        };
    }

    if (config != nullptr) {
        config->applyJson(doc.object());
    }
    return {
        {"success", true},
        {"path", filePath},
    };
}

QJsonObject AppConfig::saveToFile(const QString& filePath) const {
    const QDir dir = QFileInfo(filePath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        return {
            {"success", false},
            {"error", "Failed to create configuration directory."},
            {"path", filePath},
        };
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open configuration file for writing."},
            {"path", filePath},
        };
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        return {
            {"success", false},
            {"error", QString("Failed to write configuration file: %1").arg(file.errorString())},
            {"path", filePath},
        };
    }
    return {
        {"success", true},
        {"path", filePath},
    };
}

}  // namespace tforge
