#include "tforge/build_log.hpp"

#include <QRegularExpression>

#include "tforge/process_runner.hpp"

namespace tforge {

QString severityName(LogSeverity severity) {
    switch (severity) {
    case LogSeverity::Info:
        return "info";
    case LogSeverity::Output:
        return "output";
    case LogSeverity::Warning:
        return "warning";
    case LogSeverity::Error:
        return "error";
    case LogSeverity::Success:
        return "success";
    }
    return "info";
}

BuildLogEntry BuildLogEntry::make(const QString& message, LogSeverity severity) {
    BuildLogEntry entry;
    entry.message = message;
    entry.severity = severity;
    entry.timestamp = QDateTime::currentDateTimeUtc();
    return entry;
}

QJsonObject BuildLogEntry::toJson() const {
    return {
        {"message", message},
        {"severity", severityName(severity)},
        {"timestamp_utc", timestamp.toString(Qt::ISODateWithMs)},
    };
}

QStringList outputLines(const QString& text) {
    static const QRegularExpression lineBreak("\r\n|\n|\r");
    return text.split(lineBreak, Qt::SkipEmptyParts);
}

QVector<BuildLogEntry> entriesFromProcess(
    const ProcessExecutionResult& result,
    LogSeverity stderrSeverity) {
    QVector<BuildLogEntry> entries;
    for (const QString& line : outputLines(result.stdoutText)) {
        entries.append(BuildLogEntry::make(line, LogSeverity::Output));
    }
    for (const QString& line : outputLines(result.stderrText)) {
        entries.append(BuildLogEntry::make(line, stderrSeverity));
    }
    return entries;
}

}  // namespace tforge
