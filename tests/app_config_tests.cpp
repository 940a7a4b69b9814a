#include <gtest/gtest.h>

#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <pwd.h>

#include "test_support.hpp"
#include "tforge/app_config.hpp"
#include "tforge/container_resolver.hpp"

namespace tforge {
namespace {

TEST(AppConfig, DefaultsMatchTheDeviceToolchain) {
    const AppConfig config = AppConfig::defaults();
    EXPECT_EQ(config.runner.uid, 501u);
    EXPECT_EQ(config.runner.gid, 501u);
    EXPECT_EQ(config.runner.searchDirectories,
              QStringList({"/var/jb/usr/bin", "/var/jb/bin", "/usr/bin", "/bin"}));
    EXPECT_EQ(config.runner.pathEntries.join(':'),
              QString("/var/jb/usr/bin:/var/jb/bin:/usr/bin:/bin:/usr/sbin:/sbin"));
    EXPECT_EQ(config.toolchain.theosRoot, QString("/var/theos"));
    EXPECT_EQ(config.toolchain.devicePort, 22);
    EXPECT_EQ(config.build.tool, QString("make"));
    EXPECT_TRUE(config.build.autoRepairMakefile);
    EXPECT_EQ(config.install.cacheRefreshArguments, QStringList({"-a"}));
}

TEST(AppConfig, FileOverridesOnlyPresentKeys) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath("tforge.json");
    ASSERT_TRUE(test::writeTextFile(
        path,
        R"({"runner": {"uid": 0, "search_directories": ["/opt/bin"]},
            "toolchain": {"theos": "/opt/theos"},
            "build": {"auto_repair_makefile": false}})"));

    AppConfig config = AppConfig::defaults();
    const QJsonObject status = AppConfig::loadFromFile(path, &config);
    ASSERT_TRUE(status.value("success").toBool());
    EXPECT_EQ(config.runner.uid, 0u);
    EXPECT_EQ(config.runner.gid, 501u);
    EXPECT_EQ(config.runner.searchDirectories, QStringList({"/opt/bin"}));
    EXPECT_EQ(config.toolchain.theosRoot, QString("/opt/theos"));
    EXPECT_EQ(config.toolchain.packageScheme, QString("rootless"));
    EXPECT_FALSE(config.build.autoRepairMakefile);
    EXPECT_TRUE(config.build.cleanBeforeBuild);
}

TEST(AppConfig, RejectsMalformedDocument) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath("broken.json");
    ASSERT_TRUE(test::writeTextFile(path, "[1, 2"));

    AppConfig config = AppConfig::defaults();
    const QJsonObject status = AppConfig::loadFromFile(path, &config);
    EXPECT_FALSE(status.value("success").toBool(true));
    EXPECT_EQ(config.toolchain.theosRoot, QString("/var/theos"));

    EXPECT_FALSE(AppConfig::loadFromFile(QDir(dir.path()).filePath("absent.json"), &config)
                     .value("success")
                     .toBool(true));
}

TEST(AppConfig, SavedFileLoadsBackTheSameValues) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath("nested/tforge.json");

    AppConfig original = AppConfig::defaults();
    original.toolchain.deviceIp = "192.168.1.20";
    original.install.cacheRefreshArguments = {"-p", "/Applications/Demo.app"};
    ASSERT_TRUE(original.saveToFile(path).value("success").toBool());

    AppConfig loaded = AppConfig::defaults();
    ASSERT_TRUE(AppConfig::loadFromFile(path, &loaded).value("success").toBool());
    EXPECT_EQ(loaded.toJson(), original.toJson());
}

TEST(AppConfig, IdentityChangeMovesHomeUnlessHomeIsGiven) {
    const passwd* rootEntry = ::getpwuid(0);
    ASSERT_NE(rootEntry, nullptr);

    AppConfig config = AppConfig::defaults();
    config.runner.homeDirectory = "/var/mobile";
    config.applyJson(QJsonDocument::fromJson(R"({"runner": {"uid": 0}})").object());
    EXPECT_EQ(config.runner.uid, 0u);
    EXPECT_EQ(config.runner.homeDirectory, QString::fromLocal8Bit(rootEntry->pw_dir));

    config.applyJson(QJsonDocument::fromJson(R"({"runner": {"uid": 0, "home": "/srv/builder"}})").object());
    EXPECT_EQ(config.runner.homeDirectory, QString("/srv/builder"));

    config.applyJson(QJsonDocument::fromJson(R"({"runner": {"gid": 0}})").object());
    EXPECT_EQ(config.runner.homeDirectory, QString("/srv/builder"));
}

TEST(AppConfig, SaveReportsUnwritableLocation) {
    const AppConfig config = AppConfig::defaults();
    const QJsonObject status = config.saveToFile("/proc/tforge-not-writable/tforge.json");
    EXPECT_FALSE(status.value("success").toBool(true));
    EXPECT_FALSE(status.value("error").toString().isEmpty());
}

TEST(ContainerResolver, FactoryHonoursConfiguredKind) {
    AppConfig config = AppConfig::defaults();
    config.store.containerResolver = "none";
    const std::unique_ptr<ContainerResolver> none = makeContainerResolver(config);
    EXPECT_EQ(none->name(), QString("none"));
    EXPECT_TRUE(none->containerPath().isEmpty());

    config.store.containerResolver = "standard";
    EXPECT_EQ(makeContainerResolver(config)->name(), QString("standard"));
}

}  // namespace
}  // namespace tforge
