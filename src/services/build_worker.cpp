#include "tforge/build_worker.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include "tforge/artifact_locator.hpp"
#include "tforge/makefile_repair.hpp"
#include "tforge/telemetry.hpp"

namespace tforge {

namespace {

bool isCancelled(const CancellationHandle& cancellation) {
    return cancellation != nullptr && cancellation->isCancelled();
}

}  // namespace

BuildWorker::BuildWorker(const AppConfig& config, const ProcessRunner* runner, QObject* parent)
    : QObject(parent),
      build_(config.build),
      runner_(runner) {}

void BuildWorker::log(const QString& message, LogSeverity severity) {
    emit logEntry(BuildLogEntry::make(message, severity));
}

void BuildWorker::logProcess(const ProcessExecutionResult& result, LogSeverity stderrSeverity) {
    for (const BuildLogEntry& entry : entriesFromProcess(result, stderrSeverity)) {
        emit logEntry(entry);
    }
}

ProcessExecutionResult BuildWorker::runTool(
    const Project& project,
    const QString& action,
    const CancellationHandle& cancellation) const {
    return runner_->run(build_.tool, {action}, project.rootPath, cancellation);
}

QJsonObject BuildWorker::applyRepair(const Project& project, bool reportUnchanged) {
    const QJsonObject result = MakefileRepair::repairFile(project.makefilePath());
    if (!result.value("success").toBool(false)) {
        log(QString("Could not fix Makefile: %1").arg(result.value("error").toString()),
            LogSeverity::Warning);
    } else if (result.value("changed").toBool(false)) {
        log("Detected hardcoded Theos paths, fixing...", LogSeverity::Warning);
        log(QString("Fixed Makefile paths (%1 definitions commented, %2 lines rewritten)")
                .arg(result.value("commented_lines").toInt())
                .arg(result.value("rewritten_lines").toInt()),
            LogSeverity::Success);
    } else if (reportUnchanged) {
        log("Makefile has no hardcoded Theos paths", LogSeverity::Info);
    }
    return result;
}

void BuildWorker::compile(const Project& project, const CancellationHandle& cancellation) {
    QElapsedTimer timer;
    timer.start();
    Telemetry::instance().incrementCounter("build.started");

    log("Checking project structure...", LogSeverity::Output);
    emit progressChanged(0.1);

    const QString makefilePath = project.makefilePath();
    if (!QFileInfo(makefilePath).isFile()) {
        log(QString("Error: Makefile not found at %1").arg(makefilePath), LogSeverity::Error);
        finish(project, BuildOutcome::Failed, {}, timer);
        return;
    }

    if (isCancelled(cancellation)) {
        finish(project, BuildOutcome::Cancelled, {}, timer);
        return;
    }

    if (build_.autoRepairMakefile) {
        applyRepair(project, false);
    }

    const QString outputPath = project.outputPath(build_.outputDirectory);
    if (!QFileInfo(outputPath).isDir()) {
        if (QDir().mkpath(outputPath)) {
            log("Created packages directory", LogSeverity::Output);
        } else {
            log(QString("Warning: Could not create packages directory %1").arg(outputPath),
                LogSeverity::Warning);
        }
    }

    if (build_.cleanBeforeBuild && !isCancelled(cancellation)) {
        log("Cleaning previous build...", LogSeverity::Output);
        emit progressChanged(0.2);
        const ProcessExecutionResult clean = runTool(project, "clean", cancellation);
        logProcess(clean, LogSeverity::Warning);
        if (!clean.success() && !clean.cancelled) {
            log(QString("Clean step exited with code %1, continuing").arg(clean.exitCode),
                LogSeverity::Info);
        }
    }

    if (isCancelled(cancellation)) {
        finish(project, BuildOutcome::Cancelled, {}, timer);
        return;
    }

    log("Building tweak...", LogSeverity::Output);
    emit progressChanged(0.4);
    const ProcessExecutionResult package = runTool(project, "package", cancellation);
    if (package.cancelled) {
        logProcess(package, LogSeverity::Warning);
        finish(project, BuildOutcome::Cancelled, {}, timer);
        return;
    }

    const bool built = package.success();
    // Toolchains print progress on stderr; only a failed step makes it an error.
    logProcess(package, built ? LogSeverity::Warning : LogSeverity::Error);
    if (package.launchFailed()) {
        log(QString("Could not launch build tool '%1'").arg(build_.tool), LogSeverity::Error);
    } else if (!built) {
        log(QString("%1 package exited with code %2").arg(build_.tool).arg(package.exitCode),
            LogSeverity::Error);
    }
    emit progressChanged(0.8);

    QString artifactPath;
    if (built) {
        log("Looking for generated package...", LogSeverity::Output);
        artifactPath = ArtifactLocator::findLatest(outputPath, build_.artifactExtension);
    }

    emit progressChanged(1.0);
    BuildOutcome outcome = BuildOutcome::Failed;
    if (built) {
        outcome = artifactPath.isEmpty() ? BuildOutcome::SucceededWithoutArtifact
                                         : BuildOutcome::Succeeded;
    }
    finish(project, outcome, artifactPath, timer);
}

void BuildWorker::repair(const Project& project) {
    if (!QFileInfo(project.makefilePath()).isFile()) {
        log(QString("Error: Makefile not found at %1").arg(project.makefilePath()),
            LogSeverity::Error);
        emit repairFinished({
            {"success", false},
            {"changed", false},
            {"error", "Makefile not found."},
            {"path", project.makefilePath()},
        });
        return;
    }
    emit repairFinished(applyRepair(project, true));
}

void BuildWorker::finish(
    const Project& project,
    BuildOutcome outcome,
    const QString& artifactPath,
    const QElapsedTimer& timer) {
    switch (outcome) {
    case BuildOutcome::Succeeded:
        log("Compilation successful!", LogSeverity::Success);
        log(QString("Package created: %1").arg(QFileInfo(artifactPath).fileName()),
            LogSeverity::Success);
        log(QString("Location: %1").arg(artifactPath), LogSeverity::Info);
        break;
    case BuildOutcome::SucceededWithoutArtifact:
        log("Compilation successful!", LogSeverity::Success);
        log("Package may have been created but could not be located", LogSeverity::Warning);
        break;
    case BuildOutcome::Failed:
        log("Compilation failed", LogSeverity::Error);
        log("Check the log above for errors", LogSeverity::Error);
        break;
    case BuildOutcome::Cancelled:
        log("Compilation cancelled, toolchain process terminated", LogSeverity::Warning);
        break;
    }

    BuildResult result;
    result.success =
        outcome == BuildOutcome::Succeeded || outcome == BuildOutcome::SucceededWithoutArtifact;
    result.outcome = outcome;
    result.project = project;
    result.artifactPath = artifactPath;
    result.timestamp = QDateTime::currentDateTimeUtc();

    Telemetry::instance().incrementCounter("build." + buildOutcomeName(outcome));
    Telemetry::instance().recordDurationMs("build.duration_ms", timer.elapsed());
    Telemetry::instance().recordEvent("build", result.toJson());
    emit buildFinished(result);
}

}  // namespace tforge
