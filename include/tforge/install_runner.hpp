#pragma once

#include <QObject>
#include <QString>
#include <QThread>
#include <QVector>

#include <optional>

#include "tforge/app_config.hpp"
#include "tforge/build_log.hpp"
#include "tforge/build_result.hpp"
#include "tforge/process_runner.hpp"

namespace tforge {

class InstallWorker;

// Caller-side state for package installation; one install at a time.
class InstallRunner final : public QObject {
    Q_OBJECT

public:
    InstallRunner(const AppConfig& config, const ProcessRunner* runner, QObject* parent = nullptr);
    ~InstallRunner() override;

    bool install(const QString& artifactPath);
    void stop();

    [[nodiscard]] RunState state() const { return state_; }
    [[nodiscard]] bool isRunning() const { return state_ == RunState::Running; }
    [[nodiscard]] const QVector<BuildLogEntry>& log() const { return log_; }
    [[nodiscard]] std::optional<InstallResult> lastResult() const { return lastResult_; }

signals:
    void installRequested(const QString& artifactPath, const tforge::CancellationHandle& cancellation);

    void logAppended(const tforge::BuildLogEntry& entry);
    void stateChanged(tforge::RunState state);
    void finished(const tforge::InstallResult& result);

private:
    void setupWorker(const AppConfig& config, const ProcessRunner* runner);
    void setupConnections();
    void appendLog(const BuildLogEntry& entry);
    void setState(RunState state);

    QThread* workerThread_ = nullptr;
    InstallWorker* worker_ = nullptr;

    RunState state_ = RunState::Idle;
    QVector<BuildLogEntry> log_;
    std::optional<InstallResult> lastResult_;
    CancellationHandle cancellation_;
};

}  // namespace tforge
