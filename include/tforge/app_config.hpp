#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace tforge {

struct RunnerSettings {
    quint32 uid = 501;
    quint32 gid = 501;
    QString shell = "bash";
    // Probed in order when a bare program name has to be resolved.
    QStringList searchDirectories;
    // Exported to the child as PATH.
    QStringList pathEntries;
    QString homeDirectory;
    QString tempDirectory;
    int terminateGraceMs = 2000;
};

struct ToolchainSettings {
    QString theosRoot = "/var/theos";
    QString deviceIp = "localhost";
    int devicePort = 22;
    QString packageScheme = "rootless";
};

struct BuildSettings {
    QString tool = "make";
    bool cleanBeforeBuild = true;
    bool autoRepairMakefile = true;
    QString outputDirectory = "packages";
    QString artifactExtension = ".deb";
};

struct InstallSettings {
    QString packageManager = "dpkg";
    QString cacheRefresh = "uicache";
    QStringList cacheRefreshArguments = {"-a"};
};

struct StoreSettings {
    QString projectsDirectory;
    QString containerResolver = "standard";
    QString archiveTool = "unzip";
};

// Resolved once at startup and handed to every service by value.
struct AppConfig {
    RunnerSettings runner;
    ToolchainSettings toolchain;
    BuildSettings build;
    InstallSettings install;
    StoreSettings store;
    QString telemetryExportPath = "logs/telemetry_last_exit.json";

    static AppConfig defaults();

    // Overrides only the keys present in the file. On failure |config| is untouched.
    static QJsonObject loadFromFile(const QString& filePath, AppConfig* config);
    QJsonObject saveToFile(const QString& filePath) const;

    [[nodiscard]] QJsonObject toJson() const;
    void applyJson(const QJsonObject& object);
};

}  // namespace tforge
