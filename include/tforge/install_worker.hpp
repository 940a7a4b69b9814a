#pragma once

#include <QObject>
#include <QString>

#include "tforge/app_config.hpp"
#include "tforge/build_log.hpp"
#include "tforge/build_result.hpp"
#include "tforge/process_runner.hpp"

namespace tforge {

// Installs a package through the package manager, then refreshes the icon cache.
class InstallWorker final : public QObject {
    Q_OBJECT

public:
    InstallWorker(const AppConfig& config, const ProcessRunner* runner, QObject* parent = nullptr);

public slots:
    void install(const QString& artifactPath, const tforge::CancellationHandle& cancellation);

signals:
    void logEntry(const tforge::BuildLogEntry& entry);
    void installFinished(const tforge::InstallResult& result);

private:
    void log(const QString& message, LogSeverity severity);
    void logLines(const QString& text, LogSeverity severity);
    void finish(InstallResult result, qint64 elapsedMs);

    InstallSettings install_;
    const ProcessRunner* runner_;
};

}  // namespace tforge
