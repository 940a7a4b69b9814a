#include "tforge/install_runner.hpp"

#include "tforge/install_worker.hpp"
#include "tforge/telemetry.hpp"

namespace tforge {

InstallRunner::InstallRunner(const AppConfig& config, const ProcessRunner* runner, QObject* parent)
    : QObject(parent) {
    registerMetaTypes();
    setupWorker(config, runner);
    setupConnections();
}

InstallRunner::~InstallRunner() {
    if (cancellation_ != nullptr) {
        cancellation_->cancel();
    }
    if (workerThread_ != nullptr) {
        workerThread_->quit();
        workerThread_->wait();
    }
}

void InstallRunner::setupWorker(const AppConfig& config, const ProcessRunner* runner) {
    workerThread_ = new QThread(this);
    worker_ = new InstallWorker(config, runner);
    worker_->moveToThread(workerThread_);
    connect(workerThread_, &QThread::finished, worker_, &QObject::deleteLater);
    workerThread_->start();
}

void InstallRunner::setupConnections() {
    connect(this, &InstallRunner::installRequested, worker_, &InstallWorker::install, Qt::QueuedConnection);

    connect(
        worker_,
        &InstallWorker::logEntry,
        this,
        [this](const BuildLogEntry& entry) { appendLog(entry); },
        Qt::QueuedConnection);
    connect(
        worker_,
        &InstallWorker::installFinished,
        this,
        [this](const InstallResult& result) {
            cancellation_.reset();
            lastResult_ = result;
            if (result.cancelled) {
                setState(RunState::Cancelled);
            } else {
                setState(result.success ? RunState::Succeeded : RunState::Failed);
            }
            emit finished(result);
        },
        Qt::QueuedConnection);
}

bool InstallRunner::install(const QString& artifactPath) {
    if (isRunning()) {
        Telemetry::instance().incrementCounter("install.rejected_busy");
        return false;
    }
    log_.clear();
    cancellation_ = std::make_shared<CancellationToken>();
    setState(RunState::Running);
    emit installRequested(artifactPath, cancellation_);
    return true;
}

void InstallRunner::stop() {
    if (!isRunning() || cancellation_ == nullptr || cancellation_->isCancelled()) {
        return;
    }
    appendLog(BuildLogEntry::make("Installation stopped by user", LogSeverity::Warning));
    cancellation_->cancel();
}

void InstallRunner::appendLog(const BuildLogEntry& entry) {
    log_.append(entry);
    emit logAppended(entry);
}

void InstallRunner::setState(RunState state) {
    if (state_ == state) {
        return;
    }
    state_ = state;
    Telemetry::instance().setGauge("install.running", state == RunState::Running ? 1.0 : 0.0);
    Telemetry::instance().recordEvent("install.state", {{"state", runStateName(state)}});
    emit stateChanged(state);
}

}  // namespace tforge
