#include "tforge/build_pipeline.hpp"

#include "tforge/build_worker.hpp"
#include "tforge/telemetry.hpp"

namespace tforge {

BuildPipeline::BuildPipeline(const AppConfig& config, const ProcessRunner* runner, QObject* parent)
    : QObject(parent) {
    registerMetaTypes();
    setupWorker(config, runner);
    setupConnections();
}

BuildPipeline::~BuildPipeline() {
    if (cancellation_ != nullptr) {
        cancellation_->cancel();
    }
    if (workerThread_ != nullptr) {
        workerThread_->quit();
        workerThread_->wait();
    }
}

void BuildPipeline::setupWorker(const AppConfig& config, const ProcessRunner* runner) {
    workerThread_ = new QThread(this);
    worker_ = new BuildWorker(config, runner);
    worker_->moveToThread(workerThread_);
    connect(workerThread_, &QThread::finished, worker_, &QObject::deleteLater);
    workerThread_->start();
}

void BuildPipeline::setupConnections() {
    connect(this, &BuildPipeline::compileRequested, worker_, &BuildWorker::compile, Qt::QueuedConnection);
    connect(this, &BuildPipeline::repairRequested, worker_, &BuildWorker::repair, Qt::QueuedConnection);

    connect(
        worker_,
        &BuildWorker::logEntry,
        this,
        [this](const BuildLogEntry& entry) { appendLog(entry); },
        Qt::QueuedConnection);
    connect(
        worker_,
        &BuildWorker::progressChanged,
        this,
        [this](double fraction) { setProgress(fraction); },
        Qt::QueuedConnection);
    connect(
        worker_,
        &BuildWorker::buildFinished,
        this,
        [this](const BuildResult& result) {
            cancellation_.reset();
            lastResult_ = result;
            switch (result.outcome) {
            case BuildOutcome::Succeeded:
            case BuildOutcome::SucceededWithoutArtifact:
                setState(RunState::Succeeded);
                break;
            case BuildOutcome::Cancelled:
                setState(RunState::Cancelled);
                break;
            case BuildOutcome::Failed:
                setState(RunState::Failed);
                break;
            }
            emit finished(result);
        },
        Qt::QueuedConnection);
    connect(
        worker_,
        &BuildWorker::repairFinished,
        this,
        [this](const QJsonObject& result) {
            setState(result.value("success").toBool(false) ? RunState::Succeeded : RunState::Failed);
            emit repairFinished(result);
        },
        Qt::QueuedConnection);
}

bool BuildPipeline::compile(const Project& project) {
    if (isRunning()) {
        Telemetry::instance().incrementCounter("build.rejected_busy");
        return false;
    }

    clearLog();
    setProgress(0.0);
    appendLog(QString("Starting compilation for %1...").arg(project.name), LogSeverity::Info);
    appendLog(QString("Project path: %1").arg(project.rootPath), LogSeverity::Info);

    cancellation_ = std::make_shared<CancellationToken>();
    setState(RunState::Running);
    emit compileRequested(project, cancellation_);
    return true;
}

bool BuildPipeline::repair(const Project& project) {
    if (isRunning()) {
        Telemetry::instance().incrementCounter("build.rejected_busy");
        return false;
    }

    appendLog(QString("Checking Makefile of %1 for hardcoded Theos paths...").arg(project.name),
              LogSeverity::Info);
    setState(RunState::Running);
    emit repairRequested(project);
    return true;
}

void BuildPipeline::stop() {
    if (!isRunning() || cancellation_ == nullptr || cancellation_->isCancelled()) {
        return;
    }
    appendLog("Compilation stopped by user, terminating toolchain process", LogSeverity::Warning);
    cancellation_->cancel();
}

void BuildPipeline::clearLog() {
    log_.clear();
}

void BuildPipeline::appendLog(const BuildLogEntry& entry) {
    log_.append(entry);
    emit logAppended(entry);
}

void BuildPipeline::appendLog(const QString& message, LogSeverity severity) {
    appendLog(BuildLogEntry::make(message, severity));
}

void BuildPipeline::setProgress(double fraction) {
    progress_ = fraction;
    Telemetry::instance().setGauge("build.progress", fraction);
    emit progressChanged(fraction);
}

void BuildPipeline::setState(RunState state) {
    if (state_ == state) {
        return;
    }
    state_ = state;
    Telemetry::instance().recordEvent("build.state", {{"state", runStateName(state)}});
    emit stateChanged(state);
}

}  // namespace tforge
