#include "gemrun/ephemeral_workspace.hpp"

#include <QAtomicInt>
#include <QDir>
#include <QFile>
#include <QtGlobal>

#include "gemrun/telemetry.hpp"

namespace gemrun {

namespace {

QAtomicInt activeWorkspaces;

QString templateFor(const QString& parentDir) {
    return QDir(parentDir).filePath("gemrun-XXXXXX");
}

}  // namespace

EphemeralWorkspace::EphemeralWorkspace(const QString& parentDir)
    : dir_(templateFor(parentDir)) {
    dir_.setAutoRemove(false);
    if (dir_.isValid()) {
        path_ = dir_.path();
        Telemetry::instance().setGauge("workspaces.active", activeWorkspaces.fetchAndAddOrdered(1) + 1);
    } else {
        removed_ = true;
    }
}

EphemeralWorkspace::~EphemeralWorkspace() {
    remove();
}

bool EphemeralWorkspace::isValid() const {
    return dir_.isValid();
}

QString EphemeralWorkspace::errorString() const {
    return dir_.errorString();
}

QString EphemeralWorkspace::path() const {
    return path_;
}

QString EphemeralWorkspace::filePath(const QString& fileName) const {
    return QDir(path_).filePath(fileName);
}

bool EphemeralWorkspace::writeFile(const QString& fileName, const QString& content, QString* error) const {
    QFile file(filePath(fileName));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error != nullptr) {
            *error = file.errorString();
        }
        return false;
    }
    const QByteArray bytes = content.toUtf8();
    if (file.write(bytes) != bytes.size()) {
        if (error != nullptr) {
            *error = file.errorString();
        }
        return false;
    }
    file.close();
    return true;
}

bool EphemeralWorkspace::remove() {
    if (removed_) {
        return true;
    }
    removed_ = true;
    Telemetry::instance().setGauge("workspaces.active", activeWorkspaces.fetchAndAddOrdered(-1) - 1);

    if (dir_.remove() || !QDir(path_).exists()) {
        return true;
    }
    Telemetry::instance().incrementCounter("workspaces.cleanup_failures");
    Telemetry::instance().recordEvent("workspace_cleanup_failed", {{"path", path_}});
    qWarning("gemrun: failed to remove workspace %s", qPrintable(path_));
    return false;
}

int EphemeralWorkspace::activeCount() {
    return activeWorkspaces.loadAcquire();
}

}  // namespace gemrun
