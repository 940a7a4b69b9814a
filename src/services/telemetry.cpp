#include "tforge/telemetry.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>

#include "tforge/process_runner.hpp"

namespace tforge {

Telemetry& Telemetry::instance() {
    static Telemetry singleton;
    return singleton;
}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    counters_[key] += delta;
}

void Telemetry::setGauge(const QString& key, double value) {
    QMutexLocker lock(&mutex_);
    gauges_.insert(key, value);
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    DurationStats& stats = durations_[key];
    stats.count++;
    stats.totalMs += durationMs;
    stats.maxMs = qMax(stats.maxMs, durationMs);
}

void Telemetry::trimEventsLocked() {
    while (events_.size() > maxEvents_) {
        events_.removeFirst();
    }
}

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    QMutexLocker lock(&mutex_);
    QJsonObject row = payload;
    row.insert("type", type);
    row.insert("timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    events_.append(row);
    trimEventsLocked();
}

void Telemetry::recordProcess(const QString& program, const ProcessExecutionResult& result) {
    incrementCounter("process.spawned");
    if (result.launchFailed()) {
        incrementCounter("process.launch_failures");
    } else if (result.exitCode != 0) {
        incrementCounter("process.non_zero_exit");
    }
    if (result.cancelled) {
        incrementCounter("process.cancelled");
    }
    if (result.timedOut) {
        incrementCounter("process.timeouts");
    }
    recordDurationMs("process.duration_ms", result.elapsedMs);
    recordEvent(
        "process",
        {
            {"program", program},
            {"exit_code", result.exitCode},
            {"elapsed_ms", static_cast<double>(result.elapsedMs)},
            {"stdout_bytes", result.stdoutText.size()},
            {"stderr_bytes", result.stderrText.size()},
            {"cancelled", result.cancelled},
            {"timed_out", result.timedOut},
        });
}

qint64 Telemetry::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return counters_.value(key, 0);
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);
    QJsonObject counters;
    for (auto it = counters_.constBegin(); it != counters_.constEnd(); ++it) {
        counters.insert(it.key(), static_cast<double>(it.value()));
    }
    QJsonObject gauges;
    for (auto it = gauges_.constBegin(); it != gauges_.constEnd(); ++it) {
        gauges.insert(it.key(), it.value());
    }
    QJsonObject durations;
    for (auto it = durations_.constBegin(); it != durations_.constEnd(); ++it) {
        const DurationStats& stats = it.value();
        QJsonObject obj;
        obj.insert("count", static_cast<double>(stats.count));
        obj.insert("total_ms", static_cast<double>(stats.totalMs));
        obj.insert("max_ms", static_cast<double>(stats.maxMs));
        obj.insert(
            "avg_ms",
            stats.count > 0 ? static_cast<double>(stats.totalMs) / static_cast<double>(stats.count)
                            : 0.0);
        durations.insert(it.key(), obj);
    }

    QJsonObject out;
    out.insert("counters", counters);
    out.insert("gauges", gauges);
    out.insert("durations", durations);
    out.insert("events", events_);
    out.insert("timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    return out;
}

QJsonObject Telemetry::exportToFile(const QString& filePath) const {
    const QJsonObject payload = snapshot();

    const QDir dir = QFileInfo(filePath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        return {
            {"success", false},
            {"error", "Failed to create telemetry export directory."},
            {"path", filePath},
        };
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open telemetry export path."},
            {"path", filePath},
        };
    }
    file.write(QJsonDocument(payload).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        return {
            {"success", false},
            {"error", QString("Failed to write telemetry export: %1").arg(file.errorString())},
            {"path", filePath},
        };
    }
    return {
        {"success", true},
        {"path", filePath},
    };
}

void Telemetry::reset() {
    QMutexLocker lock(&mutex_);
    counters_.clear();
    gauges_.clear();
    durations_.clear();
    events_ = QJsonArray{};
}

}  // namespace tforge
