#pragma once

#include <QString>
#include <QStringList>

#include <functional>

#include "tforge/app_config.hpp"

namespace tforge::test {

// Configuration whose toolchain binaries are looked up in |stubDirectory|
// first and whose identity is the test process's own.
AppConfig stubConfig(const QString& stubDirectory);

// Writes an executable /bin/sh script.
bool writeScript(const QString& path, const QString& body);
bool writeTextFile(const QString& path, const QString& content);
QString readTextFile(const QString& path);

// Spins the event loop until |predicate| holds or |timeoutMs| passes.
bool waitFor(const std::function<bool()>& predicate, int timeoutMs = 15000);

}  // namespace tforge::test
