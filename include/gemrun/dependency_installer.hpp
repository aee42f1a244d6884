#pragma once

#include <QString>
#include <QStringList>

#include "gemrun/command_runner.hpp"
#include "gemrun/execution_environment.hpp"

namespace gemrun {

class DependencyInstaller {
public:
    DependencyInstaller(
        QString packageManager = "gem",
        int timeoutMs = CommandRunner::kDefaultTimeoutMs,
        bool skipInstalled = true);

    // Installs packages into the store env points at. An empty request is a
    // no-op success and spawns nothing. In shared mode packages already in
    // the store are dropped first and --user-install is passed; in isolated
    // mode every package is installed and GEM_HOME alone selects the root.
    CommandResult install(const QStringList& packages, const ExecutionEnvironment& env) const;

    // Shared-mode install into the user's default store with the host
    // environment untouched. Used by the shared execution path so that
    // --user-install is never combined with a GEM_HOME override.
    CommandResult install(const QStringList& packages) const;

    // Asks the package manager whether an exact match is installed. Anything
    // other than a clean "true" counts as not installed.
    bool isInstalled(const QString& package, const ExecutionEnvironment& env) const;
    QStringList filterInstalled(const QStringList& packages, const ExecutionEnvironment& env) const;

    static QStringList installArguments(const QStringList& packages, IsolationMode mode);
    static QStringList normalizePackages(const QStringList& packages);

private:
    QString packageManager_;
    int timeoutMs_;
    bool skipInstalled_;
};

}  // namespace gemrun
