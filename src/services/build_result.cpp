#include "tforge/build_result.hpp"

#include "tforge/build_log.hpp"
#include "tforge/process_runner.hpp"

namespace tforge {

QString runStateName(RunState state) {
    switch (state) {
    case RunState::Idle:
        return "idle";
    case RunState::Running:
        return "running";
    case RunState::Succeeded:
        return "succeeded";
    case RunState::Failed:
        return "failed";
    case RunState::Cancelled:
        return "cancelled";
    }
    return "idle";
}

QString buildOutcomeName(BuildOutcome outcome) {
    switch (outcome) {
    case BuildOutcome::Succeeded:
        return "succeeded";
    case BuildOutcome::SucceededWithoutArtifact:
        return "succeeded_without_artifact";
    case BuildOutcome::Failed:
        return "failed";
    case BuildOutcome::Cancelled:
        return "cancelled";
    }
    return "failed";
}

QJsonObject BuildResult::toJson() const {
    QJsonObject out;
    out.insert("success", success);
    out.insert("outcome", buildOutcomeName(outcome));
    out.insert("project", project.name);
    out.insert("project_path", project.rootPath);
    if (hasArtifact()) {
        out.insert("artifact_path", artifactPath);
    }
    out.insert("timestamp_utc", timestamp.toString(Qt::ISODate));
    return out;
}

QJsonObject InstallResult::toJson() const {
    return {
        {"success", success},
        {"exit_code", exitCode},
        {"artifact_path", artifactPath},
        {"cache_refresh_attempted", cacheRefreshAttempted},
        {"cache_refresh_succeeded", cacheRefreshSucceeded},
        {"cancelled", cancelled},
        {"timestamp_utc", timestamp.toString(Qt::ISODate)},
    };
}

void registerMetaTypes() {
    qRegisterMetaType<tforge::Project>("tforge::Project");
    qRegisterMetaType<tforge::BuildLogEntry>("tforge::BuildLogEntry");
    qRegisterMetaType<tforge::BuildResult>("tforge::BuildResult");
    qRegisterMetaType<tforge::InstallResult>("tforge::InstallResult");
    qRegisterMetaType<tforge::RunState>("tforge::RunState");
    qRegisterMetaType<tforge::CancellationHandle>("tforge::CancellationHandle");
}

}  // namespace tforge
