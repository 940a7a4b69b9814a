#pragma once

#include <QJsonObject>
#include <QObject>
#include <QThread>
#include <QVector>

#include <optional>

#include "tforge/app_config.hpp"
#include "tforge/build_log.hpp"
#include "tforge/build_result.hpp"
#include "tforge/process_runner.hpp"
#include "tforge/project.hpp"

namespace tforge {

class BuildWorker;

// Front end of the build steps. Lives on the caller's thread, owns the log and
// the state, and hands the actual work to a BuildWorker on its own thread.
class BuildPipeline final : public QObject {
    Q_OBJECT

public:
    BuildPipeline(const AppConfig& config, const ProcessRunner* runner, QObject* parent = nullptr);
    ~BuildPipeline() override;

    // Returns false without side effects while a build or repair is running.
    bool compile(const Project& project);
    bool repair(const Project& project);
    // Terminates the running toolchain process, if any.
    void stop();

    [[nodiscard]] RunState state() const { return state_; }
    [[nodiscard]] bool isRunning() const { return state_ == RunState::Running; }
    [[nodiscard]] double progress() const { return progress_; }
    [[nodiscard]] const QVector<BuildLogEntry>& log() const { return log_; }
    [[nodiscard]] std::optional<BuildResult> lastResult() const { return lastResult_; }
    void clearLog();

signals:
    void compileRequested(const tforge::Project& project, const tforge::CancellationHandle& cancellation);
    void repairRequested(const tforge::Project& project);

    void logAppended(const tforge::BuildLogEntry& entry);
    void progressChanged(double fraction);
    void stateChanged(tforge::RunState state);
    void finished(const tforge::BuildResult& result);
    void repairFinished(const QJsonObject& result);

private:
    void setupWorker(const AppConfig& config, const ProcessRunner* runner);
    void setupConnections();
    void appendLog(const BuildLogEntry& entry);
    void appendLog(const QString& message, LogSeverity severity);
    void setProgress(double fraction);
    void setState(RunState state);

    QThread* workerThread_ = nullptr;
    BuildWorker* worker_ = nullptr;

    RunState state_ = RunState::Idle;
    double progress_ = 0.0;
    QVector<BuildLogEntry> log_;
    std::optional<BuildResult> lastResult_;
    CancellationHandle cancellation_;
};

}  // namespace tforge
