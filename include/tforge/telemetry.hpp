#pragma once

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QString>

namespace tforge {

struct ProcessExecutionResult;

// Process-wide counters, duration stats and a bounded event ring. Safe to use
// from the worker threads.
class Telemetry final {
public:
    static Telemetry& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void setGauge(const QString& key, double value);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});

    // Counters, duration and an event row for one spawned command.
    void recordProcess(const QString& program, const ProcessExecutionResult& result);

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] QJsonObject snapshot() const;
    QJsonObject exportToFile(const QString& filePath) const;
    void reset();

private:
    Telemetry() = default;

    struct DurationStats {
        qint64 count = 0;
        qint64 totalMs = 0;
        qint64 maxMs = 0;
    };

    void trimEventsLocked();

    mutable QMutex mutex_;
    QHash<QString, qint64> counters_;
    QHash<QString, double> gauges_;
    QHash<QString, DurationStats> durations_;
    QJsonArray events_;

    int maxEvents_ = 1000;
};

}  // namespace tforge
