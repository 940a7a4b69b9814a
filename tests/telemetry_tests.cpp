#include <gtest/gtest.h>

#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "test_support.hpp"
#include "tforge/process_runner.hpp"
#include "tforge/telemetry.hpp"

namespace tforge {
namespace {

class TelemetryTest : public ::testing::Test {
protected:
    void SetUp() override { Telemetry::instance().reset(); }
    void TearDown() override { Telemetry::instance().reset(); }
};

TEST_F(TelemetryTest, ProcessResultsFeedCountersAndDurations) {
    ProcessExecutionResult launchFailure;
    ProcessExecutionResult failed;
    failed.exitCode = 2;
    failed.elapsedMs = 40;
    ProcessExecutionResult cancelled;
    cancelled.exitCode = 143;
    cancelled.cancelled = true;
    cancelled.elapsedMs = 10;

    Telemetry& telemetry = Telemetry::instance();
    telemetry.recordProcess("dpkg", launchFailure);
    telemetry.recordProcess("make", failed);
    telemetry.recordProcess("make", cancelled);

    EXPECT_EQ(telemetry.counter("process.spawned"), 3);
    EXPECT_EQ(telemetry.counter("process.launch_failures"), 1);
    EXPECT_EQ(telemetry.counter("process.non_zero_exit"), 2);
    EXPECT_EQ(telemetry.counter("process.cancelled"), 1);

    const QJsonObject snapshot = telemetry.snapshot();
    const QJsonObject durations = snapshot.value("durations").toObject().value("process.duration_ms").toObject();
    EXPECT_EQ(durations.value("count").toInt(), 3);
    EXPECT_EQ(durations.value("max_ms").toInt(), 40);
    const QJsonArray events = snapshot.value("events").toArray();
    ASSERT_EQ(events.size(), 3);
    EXPECT_EQ(events.at(1).toObject().value("program").toString(), QString("make"));
    EXPECT_EQ(events.at(1).toObject().value("type").toString(), QString("process"));
}

TEST_F(TelemetryTest, EventRingIsBounded) {
    for (int i = 0; i < 1100; ++i) {
        Telemetry::instance().recordEvent("tick", {{"index", i}});
    }
    const QJsonArray events = Telemetry::instance().snapshot().value("events").toArray();
    ASSERT_EQ(events.size(), 1000);
    EXPECT_EQ(events.first().toObject().value("index").toInt(), 100);
}

TEST_F(TelemetryTest, ExportWritesSnapshotDocument) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    Telemetry::instance().incrementCounter("build.started");
    const QString path = QDir(dir.path()).filePath("logs/telemetry_last_exit.json");

    const QJsonObject status = Telemetry::instance().exportToFile(path);
    ASSERT_TRUE(status.value("success").toBool());
    const QJsonObject exported = QJsonDocument::fromJson(test::readTextFile(path).toUtf8()).object();
    EXPECT_EQ(exported.value("counters").toObject().value("build.started").toInt(), 1);
}

}  // namespace
}  // namespace tforge
