#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "test_support.hpp"
#include "tforge/install_runner.hpp"
#include "tforge/telemetry.hpp"

namespace tforge {
namespace {

class InstallRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(stubs_.isValid());
        ASSERT_TRUE(packages_.isValid());
        config_ = test::stubConfig(stubs_.path());
        refreshMarker_ = QDir(stubs_.path()).filePath("uicache.args");
        package_ = QDir(packages_.path()).filePath("com.example.demo_1.0.0_iphoneos-arm.deb");
        ASSERT_TRUE(test::writeTextFile(package_, "!<arch>\n"));

        ASSERT_TRUE(test::writeScript(
            QDir(stubs_.path()).filePath("dpkg"),
            "if [ ! -f \"$2\" ]; then\n"
            "  echo \"dpkg: error: cannot access archive '$2': No such file or directory\" >&2\n"
            "  exit 2\n"
            "fi\n"
            "echo 'Selecting previously unselected package com.example.demo.'\n"
            "echo 'Setting up com.example.demo (1.0.0) ...'\n"));
        stubRefresh(0);
    }

    void stubRefresh(int exitCode) {
        ASSERT_TRUE(test::writeScript(
            QDir(stubs_.path()).filePath("uicache"),
            QString("echo \"$@\" > '%1'\n"
                    "if [ %2 -ne 0 ]; then echo 'uicache: failed to register' >&2; fi\n"
                    "exit %2\n")
                .arg(refreshMarker_)
                .arg(exitCode)));
    }

    InstallResult runInstall(InstallRunner& installer, const QString& path) {
        EXPECT_TRUE(installer.install(path));
        EXPECT_TRUE(test::waitFor([&installer]() { return !installer.isRunning(); }));
        EXPECT_TRUE(installer.lastResult().has_value());
        return installer.lastResult().value_or(InstallResult{});
    }

    static bool hasEntry(const InstallRunner& installer, const QString& text, LogSeverity severity) {
        for (const BuildLogEntry& entry : installer.log()) {
            if (entry.severity == severity && entry.message.contains(text)) {
                return true;
            }
        }
        return false;
    }

    QTemporaryDir stubs_;
    QTemporaryDir packages_;
    AppConfig config_;
    QString refreshMarker_;
    QString package_;
};

TEST_F(InstallRunnerTest, SuccessfulInstallRefreshesIconCache) {
    const ProcessRunner runner(config_.runner, config_.toolchain);
    InstallRunner installer(config_, &runner);

    const InstallResult result = runInstall(installer, package_);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_TRUE(result.cacheRefreshAttempted);
    EXPECT_TRUE(result.cacheRefreshSucceeded);
    EXPECT_EQ(installer.state(), RunState::Succeeded);
    EXPECT_EQ(test::readTextFile(refreshMarker_).trimmed(), QString("-a"));

    EXPECT_TRUE(hasEntry(installer, "Installing com.example.demo_1.0.0_iphoneos-arm.deb...", LogSeverity::Info));
    EXPECT_TRUE(hasEntry(installer, "Setting up com.example.demo (1.0.0) ...", LogSeverity::Output));
    ASSERT_FALSE(installer.log().isEmpty());
    EXPECT_EQ(installer.log().last().message, QString("Done! Respring may be required."));
    EXPECT_DOUBLE_EQ(
        Telemetry::instance().snapshot().value("gauges").toObject().value("install.running").toDouble(-1.0),
        0.0);
}

TEST_F(InstallRunnerTest, MissingPackageFailsAndSkipsRefresh) {
    const ProcessRunner runner(config_.runner, config_.toolchain);
    InstallRunner installer(config_, &runner);
    const qint64 failedBefore = Telemetry::instance().counter("install.failed");

    const InstallResult result = runInstall(installer, QDir(packages_.path()).filePath("absent.deb"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, 2);
    EXPECT_FALSE(result.cacheRefreshAttempted);
    EXPECT_FALSE(QFile::exists(refreshMarker_));
    EXPECT_EQ(installer.state(), RunState::Failed);
    EXPECT_TRUE(hasEntry(installer, "Installation failed with exit code 2", LogSeverity::Error));
    EXPECT_TRUE(hasEntry(installer, "cannot access archive", LogSeverity::Error));
    EXPECT_TRUE(hasEntry(installer, "Skipping icon cache refresh", LogSeverity::Info));
    EXPECT_EQ(Telemetry::instance().counter("install.failed"), failedBefore + 1);
}

TEST_F(InstallRunnerTest, RefreshFailureIsOnlyAWarning) {
    stubRefresh(1);
    const ProcessRunner runner(config_.runner, config_.toolchain);
    InstallRunner installer(config_, &runner);

    const InstallResult result = runInstall(installer, package_);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.cacheRefreshAttempted);
    EXPECT_FALSE(result.cacheRefreshSucceeded);
    EXPECT_TRUE(hasEntry(installer, "Icon cache refresh failed with exit code 1", LogSeverity::Warning));
    EXPECT_TRUE(hasEntry(installer, "uicache: failed to register", LogSeverity::Warning));
}

TEST_F(InstallRunnerTest, MissingPackageManagerIsLaunchFailure) {
    config_.install.packageManager = "/nonexistent/dpkg";
    const ProcessRunner runner(config_.runner, config_.toolchain);
    InstallRunner installer(config_, &runner);

    const InstallResult result = runInstall(installer, package_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, ProcessExecutionResult::kLaunchFailure);
    EXPECT_FALSE(result.cacheRefreshAttempted);
}

TEST_F(InstallRunnerTest, OneInstallAtATimeAndStopCancels) {
    ASSERT_TRUE(test::writeScript(QDir(stubs_.path()).filePath("dpkg"), "sleep 30\n"));
    const ProcessRunner runner(config_.runner, config_.toolchain);
    InstallRunner installer(config_, &runner);

    ASSERT_TRUE(installer.install(package_));
    EXPECT_FALSE(installer.install(package_));
    ASSERT_TRUE(test::waitFor([&installer]() { return installer.log().size() >= 2; }));

    installer.stop();
    ASSERT_TRUE(test::waitFor([&installer]() { return !installer.isRunning(); }, 10000));
    EXPECT_EQ(installer.state(), RunState::Cancelled);
    ASSERT_TRUE(installer.lastResult().has_value());
    EXPECT_TRUE(installer.lastResult()->cancelled);
    EXPECT_FALSE(installer.lastResult()->cacheRefreshAttempted);
}

TEST_F(InstallRunnerTest, StopDuringRefreshIsReportedAsCancellation) {
    ASSERT_TRUE(test::writeScript(QDir(stubs_.path()).filePath("uicache"), "sleep 30\n"));
    const ProcessRunner runner(config_.runner, config_.toolchain);
    InstallRunner installer(config_, &runner);

    ASSERT_TRUE(installer.install(package_));
    ASSERT_TRUE(test::waitFor([&installer]() {
        return hasEntry(installer, "Refreshing icon cache...", LogSeverity::Info);
    }));

    installer.stop();
    ASSERT_TRUE(test::waitFor([&installer]() { return !installer.isRunning(); }, 10000));
    EXPECT_EQ(installer.state(), RunState::Cancelled);
    ASSERT_TRUE(installer.lastResult().has_value());
    EXPECT_TRUE(installer.lastResult()->success);
    EXPECT_TRUE(installer.lastResult()->cancelled);
    EXPECT_TRUE(installer.lastResult()->cacheRefreshAttempted);
    EXPECT_FALSE(installer.lastResult()->cacheRefreshSucceeded);
    EXPECT_TRUE(hasEntry(installer, "Icon cache refresh cancelled", LogSeverity::Warning));
    EXPECT_FALSE(hasEntry(installer, "Icon cache refresh failed", LogSeverity::Warning));
    EXPECT_FALSE(hasEntry(installer, "Done! Respring may be required.", LogSeverity::Success));
}

}  // namespace
}  // namespace tforge
