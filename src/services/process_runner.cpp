#include "tforge/process_runner.hpp"

#include <QByteArray>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#if defined(__APPLE__)
#include <spawn.h>
#else
#include <grp.h>
#endif

#include "tforge/telemetry.hpp"

#if defined(__APPLE__)
// Private libsystem entry points. Inside the app sandbox a plain uid/gid
// change is ignored unless a persona is selected on the spawn attributes first.
extern "C" {
int posix_spawnattr_set_persona_np(const posix_spawnattr_t* attr, uid_t personaId, uint32_t flags);
int posix_spawnattr_set_persona_uid_np(const posix_spawnattr_t* attr, uid_t uid);
int posix_spawnattr_set_persona_gid_np(const posix_spawnattr_t* attr, gid_t gid);
}
#endif

namespace tforge {

namespace {

constexpr int kPollIntervalMs = 50;
constexpr unsigned long kReapIntervalMs = 20;
constexpr std::size_t kReadChunk = 4096;

#if defined(__APPLE__)
constexpr uid_t kPersonaId = 99;
constexpr uint32_t kPersonaOverride = 1;
#else
constexpr int kChildSetupExit = 127;

enum ChildStage : int {
    kStageRedirect = 1,
    kStageGroups,
    kStageGid,
    kStageUid,
    kStageExec,
};

struct ChildFailure {
    int stage = 0;
    int error = 0;
};
#endif

QString errnoText(int error) {
    return QString::fromLocal8Bit(std::strerror(error));
}

class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

bool openPipe(ScopedFd& readEnd, ScopedFd& writeEnd) {
    int fds[2] = {-1, -1};
#if defined(__linux__)
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

// NULL-terminated argv/envp block that outlives the spawn call.
class CStringArray {
public:
    explicit CStringArray(const QStringList& values) {
        storage_.reserve(static_cast<std::size_t>(values.size()));
        for (const QString& value : values) {
            storage_.push_back(value.toLocal8Bit());
        }
        pointers_.reserve(storage_.size() + 1);
        for (QByteArray& item : storage_) {
            pointers_.push_back(item.data());
        }
        pointers_.push_back(nullptr);
    }

    [[nodiscard]] char* const* data() const { return pointers_.data(); }

private:
    std::vector<QByteArray> storage_;
    std::vector<char*> pointers_;
};

void signalGroup(pid_t pid, int signalCode) {
    if (::kill(-pid, signalCode) != 0) {
        ::kill(pid, signalCode);
    }
}

int decodeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

// Applies cancellation and timeout to a running child: SIGTERM to its
// process group first, SIGKILL once the grace period is over.
class ChildSupervisor {
public:
    ChildSupervisor(
        pid_t pid,
        const ProcessExecutionRequest& request,
        int graceMs,
        const QElapsedTimer& timer)
        : pid_(pid), request_(request), graceMs_(graceMs), timer_(timer) {}

    [[nodiscard]] bool supervised() const {
        return request_.cancellation != nullptr || request_.timeoutMs > 0;
    }

    void check() {
        if (!terminating_) {
            if (request_.cancellation && request_.cancellation->isCancelled()) {
                cancelled_ = true;
            } else if (request_.timeoutMs > 0 && timer_.elapsed() >= request_.timeoutMs) {
                timedOut_ = true;
            } else {
                return;
            }
            signalGroup(pid_, SIGTERM);
            terminating_ = true;
            killDeadlineMs_ = timer_.elapsed() + graceMs_;
            return;
        }
        if (!killed_ && timer_.elapsed() >= killDeadlineMs_) {
            signalGroup(pid_, SIGKILL);
            killed_ = true;
        }
    }

    [[nodiscard]] bool cancelled() const { return cancelled_; }
    [[nodiscard]] bool timedOut() const { return timedOut_; }

private:
    pid_t pid_;
    const ProcessExecutionRequest& request_;
    int graceMs_;
    const QElapsedTimer& timer_;
    bool terminating_ = false;
    bool killed_ = false;
    bool cancelled_ = false;
    bool timedOut_ = false;
    qint64 killDeadlineMs_ = 0;
};

#if !defined(__APPLE__)
QString describeChildFailure(const ChildFailure& failure, const ProcessIdentity& identity) {
    switch (failure.stage) {
    case kStageRedirect:
        return QString("Failed to redirect child output: %1").arg(errnoText(failure.error));
    case kStageGroups:
    case kStageGid:
    case kStageUid:
        return QString("Failed to assume identity %1:%2: %3")
            .arg(identity.uid)
            .arg(identity.gid)
            .arg(errnoText(failure.error));
    default:
        return QString("Failed to spawn process: %1").arg(errnoText(failure.error));
    }
}
#endif

// Returns the child pid, or -1 with |error| describing why nothing runs.
pid_t spawnChild(
    const QByteArray& path,
    const CStringArray& argv,
    const CStringArray& envp,
    const ProcessIdentity& identity,
    int stdinFd,
    int stdoutFd,
    int stderrFd,
    QString* error) {
#if defined(__APPLE__)
    posix_spawn_file_actions_t actions;
    if (::posix_spawn_file_actions_init(&actions) != 0) {
        *error = "Failed to prepare spawn file actions.";
        return -1;
    }
    posix_spawnattr_t attr;
    if (::posix_spawnattr_init(&attr) != 0) {
        ::posix_spawn_file_actions_destroy(&actions);
        *error = "Failed to prepare spawn attributes.";
        return -1;
    }

    if (stdinFd >= 0) {
        ::posix_spawn_file_actions_adddup2(&actions, stdinFd, STDIN_FILENO);
    }
    ::posix_spawn_file_actions_adddup2(&actions, stdoutFd, STDOUT_FILENO);
    ::posix_spawn_file_actions_adddup2(&actions, stderrFd, STDERR_FILENO);

    ::posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_CLOEXEC_DEFAULT);
    ::posix_spawnattr_setpgroup(&attr, 0);
    // Persona must be selected before the uid/gid overrides take effect.
    posix_spawnattr_set_persona_np(&attr, kPersonaId, kPersonaOverride);
    posix_spawnattr_set_persona_uid_np(&attr, static_cast<uid_t>(identity.uid));
    posix_spawnattr_set_persona_gid_np(&attr, static_cast<gid_t>(identity.gid));

    pid_t pid = -1;
    const int rc = ::posix_spawn(&pid, path.constData(), &actions, &attr, argv.data(), envp.data());
    ::posix_spawn_file_actions_destroy(&actions);
    ::posix_spawnattr_destroy(&attr);

    if (rc != 0) {
        *error = QString("Failed to spawn process: %1").arg(errnoText(rc));
        return -1;
    }
    return pid;
#else
    ScopedFd statusRead;
    ScopedFd statusWrite;
    if (!openPipe(statusRead, statusWrite)) {
        *error = QString("Failed to create status pipe: %1").arg(errnoText(errno));
        return -1;
    }

    const uid_t uid = static_cast<uid_t>(identity.uid);
    const gid_t gid = static_cast<gid_t>(identity.gid);
    const bool switchIdentity = uid != ::geteuid() || gid != ::getegid();

    const pid_t pid = ::fork();
    if (pid < 0) {
        *error = QString("Failed to spawn process: %1").arg(errnoText(errno));
        return -1;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only until execve.
        ChildFailure failure;
        ::setpgid(0, 0);
        if ((stdinFd >= 0 && ::dup2(stdinFd, STDIN_FILENO) < 0)
            || ::dup2(stdoutFd, STDOUT_FILENO) < 0
            || ::dup2(stderrFd, STDERR_FILENO) < 0) {
            failure = {kStageRedirect, errno};
        } else if (switchIdentity && ::setgroups(0, nullptr) != 0) {
            failure = {kStageGroups, errno};
        } else if (switchIdentity && ::setgid(gid) != 0) {
            failure = {kStageGid, errno};
        } else if (switchIdentity && ::setuid(uid) != 0) {
            failure = {kStageUid, errno};
        } else {
            ::execve(path.constData(), argv.data(), envp.data());
            failure = {kStageExec, errno};
        }
        const ssize_t written = ::write(statusWrite.get(), &failure, sizeof(failure));
        static_cast<void>(written);
        ::_exit(kChildSetupExit);
    }

    // A successful execve closes the CLOEXEC status pipe, so EOF means launched.
    statusWrite.reset();
    ChildFailure failure;
    ssize_t count = 0;
    do {
        count = ::read(statusRead.get(), &failure, sizeof(failure));
    } while (count < 0 && errno == EINTR);

    if (count == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        *error = describeChildFailure(failure, identity);
        return -1;
    }
    return pid;
#endif
}

// Drains both pipes concurrently until each reaches end-of-stream. Returns 0
// or the errno that interrupted the capture.
int drainPipes(
    ScopedFd& stdoutRead,
    ScopedFd& stderrRead,
    ChildSupervisor& supervisor,
    QByteArray* stdoutBytes,
    QByteArray* stderrBytes) {
    char buffer[kReadChunk];
    while (stdoutRead.valid() || stderrRead.valid()) {
        supervisor.check();

        pollfd fds[2];
        ScopedFd* owners[2] = {nullptr, nullptr};
        QByteArray* sinks[2] = {nullptr, nullptr};
        nfds_t count = 0;
        if (stdoutRead.valid()) {
            fds[count] = {stdoutRead.get(), POLLIN, 0};
            owners[count] = &stdoutRead;
            sinks[count] = stdoutBytes;
            ++count;
        }
        if (stderrRead.valid()) {
            fds[count] = {stderrRead.get(), POLLIN, 0};
            owners[count] = &stderrRead;
            sinks[count] = stderrBytes;
            ++count;
        }

        const int ready = ::poll(fds, count, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) == 0) {
                continue;
            }
            const ssize_t bytesRead = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (bytesRead > 0) {
                sinks[i]->append(buffer, static_cast<int>(bytesRead));
            } else if (bytesRead == 0 || errno != EINTR) {
                owners[i]->reset();
            }
        }
    }
    return 0;
}

// Returns 0 once |status| holds the child's wait status, otherwise the errno.
int reapChild(pid_t pid, ChildSupervisor& supervisor, int* status) {
    if (!supervisor.supervised()) {
        while (::waitpid(pid, status, 0) < 0) {
            if (errno != EINTR) {
                return errno;
            }
        }
        return 0;
    }

    while (true) {
        const pid_t done = ::waitpid(pid, status, WNOHANG);
        if (done == pid) {
            return 0;
        }
        if (done < 0 && errno != EINTR) {
            return errno;
        }
        supervisor.check();
        QThread::msleep(kReapIntervalMs);
    }
}

ProcessExecutionResult launchFailure(const QString& message) {
    ProcessExecutionResult result;
    result.exitCode = ProcessExecutionResult::kLaunchFailure;
    result.stderrText = message;
    return result;
}

}  // namespace

ProcessRunner::ProcessRunner(RunnerSettings runner, ToolchainSettings toolchain)
    : runner_(std::move(runner)),
      toolchain_(std::move(toolchain)),
      environment_(buildEnvironment(runner_, toolchain_)) {}

ProcessIdentity ProcessRunner::defaultIdentity() const {
    return {runner_.uid, runner_.gid};
}

QString ProcessRunner::quoteArgument(const QString& argument) {
    QString escaped = argument;
    escaped.replace('\'', QStringLiteral("'\\''"));
    return QStringLiteral("'") + escaped + QStringLiteral("'");
}

QString ProcessRunner::composeShellCommand(
    const QString& workingDirectory,
    const QString& program,
    const QStringList& arguments) {
    QStringList tokens;
    tokens.append(quoteArgument(program));
    for (const QString& argument : arguments) {
        tokens.append(quoteArgument(argument));
    }
    return QString("cd %1 && %2").arg(quoteArgument(workingDirectory), tokens.join(' '));
}

QStringList ProcessRunner::buildEnvironment(
    const RunnerSettings& runner,
    const ToolchainSettings& toolchain) {
    const QString theos = toolchain.theosRoot;
    return {
        "PATH=" + runner.pathEntries.join(':'),
        "HOME=" + runner.homeDirectory,
        "TMPDIR=" + runner.tempDirectory,
        "THEOS=" + theos,
        "THEOS_MAKE_PATH=" + theos + "/makefiles",
        "THEOS_BIN_PATH=" + theos + "/bin",
        "THEOS_LIBRARY_PATH=" + theos + "/lib",
        "THEOS_INCLUDE_PATH=" + theos + "/include",
        "THEOS_VENDOR_LIBRARY_PATH=" + theos + "/vendor/lib",
        "THEOS_VENDOR_INCLUDE_PATH=" + theos + "/vendor/include",
        "THEOS_DEVICE_IP=" + toolchain.deviceIp,
        "THEOS_DEVICE_PORT=" + QString::number(toolchain.devicePort),
        "THEOS_PACKAGE_SCHEME=" + toolchain.packageScheme,
    };
}

QString ProcessRunner::resolveExecutable(const QString& program) const {
    if (program.isEmpty() || program.contains('/')) {
        return program;
    }
    for (const QString& directory : runner_.searchDirectories) {
        const QFileInfo candidate(QDir(directory).filePath(program));
        if (candidate.isFile() && candidate.isExecutable()) {
            return candidate.absoluteFilePath();
        }
    }
    return program;
}

ProcessExecutionResult ProcessRunner::execute(const ProcessExecutionRequest& request) const {
    QElapsedTimer timer;
    timer.start();

    ProcessExecutionResult result;
    if (request.program.trimmed().isEmpty()) {
        result = launchFailure("No program specified.");
    } else if (!request.workingDirectory.isEmpty() && !QFileInfo(request.workingDirectory).isDir()) {
        result = launchFailure(
            QString("Working directory does not exist: %1").arg(request.workingDirectory));
    } else {
        const QString resolved = resolveExecutable(request.program);
        QString program = resolved;
        QStringList arguments = request.arguments;
        if (!request.workingDirectory.isEmpty()) {
            program = resolveExecutable(runner_.shell);
            arguments = {
                "-c",
                composeShellCommand(request.workingDirectory, resolved, request.arguments),
            };
        }

        QStringList argvList;
        argvList.append(QFileInfo(program).fileName());
        argvList.append(arguments);
        const CStringArray argv(argvList);
        const CStringArray envp(environment_);
        const QByteArray path = QFile::encodeName(program);

        ScopedFd stdoutRead;
        ScopedFd stdoutWrite;
        ScopedFd stderrRead;
        ScopedFd stderrWrite;
        if (!openPipe(stdoutRead, stdoutWrite) || !openPipe(stderrRead, stderrWrite)) {
            const int pipeError = errno;
            result = launchFailure(QString("Failed to create pipes: %1").arg(errnoText(pipeError)));
        } else {
            const ScopedFd devNull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
            QString spawnError;
            const pid_t pid = spawnChild(
                path,
                argv,
                envp,
                request.identity,
                devNull.get(),
                stdoutWrite.get(),
                stderrWrite.get(),
                &spawnError);

            if (pid < 0) {
                result = launchFailure(spawnError);
            } else {
                // The child holds its own copies; EOF arrives once it exits.
                stdoutWrite.reset();
                stderrWrite.reset();

                ChildSupervisor supervisor(pid, request, runner_.terminateGraceMs, timer);
                QByteArray stdoutBytes;
                QByteArray stderrBytes;
                const int drainError =
                    drainPipes(stdoutRead, stderrRead, supervisor, &stdoutBytes, &stderrBytes);
                stdoutRead.reset();
                stderrRead.reset();

                int status = 0;
                const int reapError = reapChild(pid, supervisor, &status);

                result.stdoutText = QString::fromUtf8(stdoutBytes);
                result.stderrText = QString::fromUtf8(stderrBytes);
                result.cancelled = supervisor.cancelled();
                result.timedOut = supervisor.timedOut();
                if (drainError != 0) {
                    result.stderrText +=
                        QString("\nOutput capture interrupted: %1").arg(errnoText(drainError));
                }
                if (reapError == 0) {
                    result.exitCode = decodeExitStatus(status);
                } else {
                    result.exitCode = ProcessExecutionResult::kLaunchFailure;
                    result.stderrText +=
                        QString("\nFailed to collect exit status: %1").arg(errnoText(reapError));
                }
            }
        }
    }

    result.elapsedMs = timer.elapsed();
    Telemetry::instance().recordProcess(request.program, result);
    return result;
}

ProcessExecutionResult ProcessRunner::run(
    const QString& program,
    const QStringList& arguments,
    const QString& workingDirectory,
    const CancellationHandle& cancellation) const {
    ProcessExecutionRequest request;
    request.program = program;
    request.arguments = arguments;
    request.workingDirectory = workingDirectory;
    request.identity = defaultIdentity();
    request.cancellation = cancellation;
    return execute(request);
}

int ProcessRunner::runShell(const QString& commandLine, const QString& workingDirectory) const {
    return run(runner_.shell, {"-c", commandLine}, workingDirectory).exitCode;
}

}  // namespace tforge
