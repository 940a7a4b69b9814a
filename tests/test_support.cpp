#include "test_support.hpp"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QFile>
#include <QThread>

#include <unistd.h>

namespace tforge::test {

AppConfig stubConfig(const QString& stubDirectory) {
    AppConfig config = AppConfig::defaults();
    config.runner.uid = static_cast<quint32>(::geteuid());
    config.runner.gid = static_cast<quint32>(::getegid());
    config.runner.shell = "sh";
    config.runner.searchDirectories = {stubDirectory, "/usr/bin", "/bin"};
    config.runner.pathEntries = {stubDirectory, "/usr/bin", "/bin"};
    config.runner.terminateGraceMs = 500;
    config.store.containerResolver = "none";
    return config;
}

bool writeScript(const QString& path, const QString& body) {
    if (!writeTextFile(path, "#!/bin/sh\n" + body)) {
        return false;
    }
    return QFile::setPermissions(
        path,
        QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner
            | QFileDevice::ReadGroup | QFileDevice::ExeGroup
            | QFileDevice::ReadOther | QFileDevice::ExeOther);
}

bool writeTextFile(const QString& path, const QString& content) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray bytes = content.toUtf8();
    return file.write(bytes) == bytes.size();
}

QString readTextFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return QString::fromUtf8(file.readAll());
}

bool waitFor(const std::function<bool()>& predicate, int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
        QThread::msleep(5);
    }
    return true;
}

}  // namespace tforge::test
