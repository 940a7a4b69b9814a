#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

namespace tforge {

struct ProcessExecutionResult;

enum class LogSeverity {
    Info,
    Output,
    Warning,
    Error,
    Success,
};

QString severityName(LogSeverity severity);

struct BuildLogEntry {
    QString message;
    LogSeverity severity = LogSeverity::Info;
    QDateTime timestamp;

    static BuildLogEntry make(const QString& message, LogSeverity severity);
    [[nodiscard]] QJsonObject toJson() const;
};

// Non-empty lines of captured process output.
QStringList outputLines(const QString& text);

// stdout lines as Output entries followed by stderr lines tagged |stderrSeverity|.
QVector<BuildLogEntry> entriesFromProcess(
    const ProcessExecutionResult& result,
    LogSeverity stderrSeverity);

}  // namespace tforge

Q_DECLARE_METATYPE(tforge::BuildLogEntry)
