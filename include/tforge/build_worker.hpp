#pragma once

#include <QElapsedTimer>
#include <QJsonObject>
#include <QObject>
#include <QString>

#include "tforge/app_config.hpp"
#include "tforge/build_log.hpp"
#include "tforge/build_result.hpp"
#include "tforge/process_runner.hpp"
#include "tforge/project.hpp"

namespace tforge {

// Runs the build steps for one project on whatever thread it lives in. Owns
// no UI state; everything is reported through signals.
class BuildWorker final : public QObject {
    Q_OBJECT

public:
    BuildWorker(const AppConfig& config, const ProcessRunner* runner, QObject* parent = nullptr);

public slots:
    void compile(const tforge::Project& project, const tforge::CancellationHandle& cancellation);
    void repair(const tforge::Project& project);

signals:
    void logEntry(const tforge::BuildLogEntry& entry);
    void progressChanged(double fraction);
    void buildFinished(const tforge::BuildResult& result);
    void repairFinished(const QJsonObject& result);

private:
    void log(const QString& message, LogSeverity severity);
    void logProcess(const ProcessExecutionResult& result, LogSeverity stderrSeverity);
    QJsonObject applyRepair(const Project& project, bool reportUnchanged);
    ProcessExecutionResult runTool(
        const Project& project,
        const QString& action,
        const CancellationHandle& cancellation) const;
    void finish(
        const Project& project,
        BuildOutcome outcome,
        const QString& artifactPath,
        const QElapsedTimer& timer);

    BuildSettings build_;
    const ProcessRunner* runner_;
};

}  // namespace tforge
