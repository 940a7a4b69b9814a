#pragma once

#include <QMetaType>
#include <QString>
#include <QStringList>

#include <atomic>
#include <memory>

#include "tforge/app_config.hpp"

namespace tforge {

// Shared between the thread that requests a stop and the worker blocked in
// ProcessRunner::execute.
class CancellationToken final {
public:
    void cancel() { cancelled_.store(true); }
    [[nodiscard]] bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationHandle = std::shared_ptr<CancellationToken>;

struct ProcessIdentity {
    quint32 uid = 501;
    quint32 gid = 501;
};

struct ProcessExecutionRequest {
    QString program;
    QStringList arguments;
    QString workingDirectory;
    ProcessIdentity identity;
    int timeoutMs = 0;
    CancellationHandle cancellation;
};

struct ProcessExecutionResult {
    static constexpr int kLaunchFailure = -1;

    int exitCode = kLaunchFailure;
    QString stdoutText;
    QString stderrText;
    bool timedOut = false;
    bool cancelled = false;
    qint64 elapsedMs = 0;

    [[nodiscard]] bool success() const { return !timedOut && !cancelled && exitCode == 0; }
    [[nodiscard]] bool launchFailed() const { return exitCode == kLaunchFailure; }
};

// Runs one external command to completion with a fabricated environment and
// a fixed identity. Never throws; every failure comes back as a result.
class ProcessRunner {
public:
    ProcessRunner(RunnerSettings runner, ToolchainSettings toolchain);
    virtual ~ProcessRunner() = default;

    virtual ProcessExecutionResult execute(const ProcessExecutionRequest& request) const;

    ProcessExecutionResult run(
        const QString& program,
        const QStringList& arguments = {},
        const QString& workingDirectory = {},
        const CancellationHandle& cancellation = {}) const;

    // Runs |commandLine| through the configured shell and keeps only the exit code.
    int runShell(const QString& commandLine, const QString& workingDirectory = {}) const;

    [[nodiscard]] ProcessIdentity defaultIdentity() const;
    [[nodiscard]] QString resolveExecutable(const QString& program) const;
    [[nodiscard]] QStringList environment() const { return environment_; }
    [[nodiscard]] const RunnerSettings& settings() const { return runner_; }

    static QString quoteArgument(const QString& argument);
    static QString composeShellCommand(
        const QString& workingDirectory,
        const QString& program,
        const QStringList& arguments);
    static QStringList buildEnvironment(
        const RunnerSettings& runner,
        const ToolchainSettings& toolchain);

private:
    RunnerSettings runner_;
    ToolchainSettings toolchain_;
    QStringList environment_;
};

}  // namespace tforge

Q_DECLARE_METATYPE(tforge::CancellationHandle)
