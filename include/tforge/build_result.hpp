#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QString>

#include "tforge/project.hpp"

namespace tforge {

enum class RunState {
    Idle,
    Running,
    Succeeded,
    Failed,
    Cancelled,
};

QString runStateName(RunState state);

enum class BuildOutcome {
    Succeeded,
    SucceededWithoutArtifact,
    Failed,
    Cancelled,
};

QString buildOutcomeName(BuildOutcome outcome);

struct BuildResult {
    bool success = false;
    BuildOutcome outcome = BuildOutcome::Failed;
    Project project;
    QString artifactPath;
    QDateTime timestamp;

    [[nodiscard]] bool hasArtifact() const { return !artifactPath.isEmpty(); }
    [[nodiscard]] QJsonObject toJson() const;
};

struct InstallResult {
    bool success = false;
    int exitCode = -1;
    QString artifactPath;
    bool cacheRefreshAttempted = false;
    bool cacheRefreshSucceeded = false;
    bool cancelled = false;
    QDateTime timestamp;

    [[nodiscard]] QJsonObject toJson() const;
};

// Registers every type carried by queued worker signals. Safe to call repeatedly.
void registerMetaTypes();

}  // namespace tforge

Q_DECLARE_METATYPE(tforge::RunState)
Q_DECLARE_METATYPE(tforge::BuildResult)
Q_DECLARE_METATYPE(tforge::InstallResult)
