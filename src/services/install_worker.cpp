#include "tforge/install_worker.hpp"

#include <QDateTime>
#include <QElapsedTimer>
#include <QFileInfo>

#include "tforge/telemetry.hpp"

namespace tforge {

InstallWorker::InstallWorker(const AppConfig& config, const ProcessRunner* runner, QObject* parent)
    : QObject(parent),
      install_(config.install),
      runner_(runner) {}

void InstallWorker::log(const QString& message, LogSeverity severity) {
    emit logEntry(BuildLogEntry::make(message, severity));
}

void InstallWorker::logLines(const QString& text, LogSeverity severity) {
    for (const QString& line : outputLines(text)) {
        log(line, severity);
    }
}

void InstallWorker::install(const QString& artifactPath, const CancellationHandle& cancellation) {
    QElapsedTimer timer;
    timer.start();
    Telemetry::instance().incrementCounter("install.started");

    InstallResult result;
    result.artifactPath = artifactPath;

    log(QString("Installing %1...").arg(QFileInfo(artifactPath).fileName()), LogSeverity::Info);
    log(QString("Path: %1").arg(artifactPath), LogSeverity::Info);

    const ProcessExecutionResult package =
        runner_->run(install_.packageManager, {"-i", artifactPath}, {}, cancellation);
    result.exitCode = package.exitCode;

    if (package.cancelled) {
        logLines(package.stdoutText, LogSeverity::Output);
        logLines(package.stderrText, LogSeverity::Warning);
        log("Installation cancelled, package manager terminated", LogSeverity::Warning);
        result.cancelled = true;
        finish(result, timer.elapsed());
        return;
    }

    if (!package.success()) {
        log(QString("Installation failed with exit code %1").arg(package.exitCode), LogSeverity::Error);
        logLines(package.stdoutText, LogSeverity::Output);
        logLines(package.stderrText, LogSeverity::Error);
        log("Skipping icon cache refresh", LogSeverity::Info);
        finish(result, timer.elapsed());
        return;
    }

    result.success = true;
    log("Installation successful!", LogSeverity::Success);
    logLines(package.stdoutText, LogSeverity::Output);
    logLines(package.stderrText, LogSeverity::Warning);

    log("Refreshing icon cache...", LogSeverity::Info);
    result.cacheRefreshAttempted = true;
    const ProcessExecutionResult refresh =
        runner_->run(install_.cacheRefresh, install_.cacheRefreshArguments, {}, cancellation);
    result.cacheRefreshSucceeded = refresh.success();
    if (refresh.cancelled) {
        log("Icon cache refresh cancelled, the package stays installed", LogSeverity::Warning);
        result.cancelled = true;
        finish(result, timer.elapsed());
        return;
    }
    if (!refresh.success()) {
        log(QString("Icon cache refresh failed with exit code %1").arg(refresh.exitCode),
            LogSeverity::Warning);
        logLines(refresh.stderrText, LogSeverity::Warning);
        Telemetry::instance().incrementCounter("install.cache_refresh_failed");
    }
    log("Done! Respring may be required.", LogSeverity::Success);
    finish(result, timer.elapsed());
}

void InstallWorker::finish(InstallResult result, qint64 elapsedMs) {
    result.timestamp = QDateTime::currentDateTimeUtc();
    Telemetry& telemetry = Telemetry::instance();
    if (result.cancelled) {
        telemetry.incrementCounter("install.cancelled");
    } else {
        telemetry.incrementCounter(result.success ? "install.succeeded" : "install.failed");
    }
    telemetry.recordDurationMs("install.duration_ms", elapsedMs);
    telemetry.recordEvent("install", result.toJson());
    emit installFinished(result);
}

}  // namespace tforge
