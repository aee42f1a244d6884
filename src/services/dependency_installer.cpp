#include "gemrun/dependency_installer.hpp"

#include <QJsonArray>

#include <utility>

#include "gemrun/telemetry.hpp"

namespace gemrun {

DependencyInstaller::DependencyInstaller(QString packageManager, int timeoutMs, bool skipInstalled)
    : packageManager_(std::move(packageManager)),
      timeoutMs_(timeoutMs),
      skipInstalled_(skipInstalled) {}

QStringList DependencyInstaller::normalizePackages(const QStringList& packages) {
    QStringList out;
    for (const QString& raw : packages) {
        const QString name = raw.trimmed();
        if (!name.isEmpty()) {
            out.append(name);
        }
    }
    return out;
}

QStringList DependencyInstaller::installArguments(const QStringList& packages, IsolationMode mode) {
    QStringList args = {"install"};
    if (mode == IsolationMode::Shared) {
        args.append("--user-install");
    }
    args.append(packages);
    return args;
}

bool DependencyInstaller::isInstalled(const QString& package, const ExecutionEnvironment& env) const {
    const CommandResult query = CommandRunner::run(
        packageManager_,
        {"list", "--installed", "--exact", package},
        timeoutMs_,
        env.variables);
    return query.success() && query.stdoutText == "true";
}

QStringList DependencyInstaller::filterInstalled(
    const QStringList& packages,
    const ExecutionEnvironment& env) const {
    QStringList missing;
    for (const QString& package : packages) {
        if (isInstalled(package, env)) {
            Telemetry::instance().incrementCounter("installs.skipped_packages");
            continue;
        }
        missing.append(package);
    }
    return missing;
}

CommandResult DependencyInstaller::install(
    const QStringList& packages,
    const ExecutionEnvironment& env) const {
    QStringList pending = normalizePackages(packages);
    if (pending.isEmpty()) {
        return CommandResult::ok();
    }

    if (env.mode == IsolationMode::Shared && skipInstalled_) {
        pending = filterInstalled(pending, env);
        if (pending.isEmpty()) {
            return CommandResult::ok();
        }
    }

    Telemetry::instance().incrementCounter("installs.count");
    const CommandResult result = CommandRunner::run(
        packageManager_,
        installArguments(pending, env.mode),
        timeoutMs_,
        env.variables);
    if (!result.success()) {
        Telemetry::instance().incrementCounter("installs.failures");
        Telemetry::instance().recordEvent(
            "install_failed",
            {
                {"mode", isolationModeName(env.mode)},
                {"packages", QJsonArray::fromStringList(pending)},
                {"returncode", result.status},
            });
    }
    return result;
}

CommandResult DependencyInstaller::install(const QStringList& packages) const {
    ExecutionEnvironment hostOnly;
    hostOnly.variables = QProcessEnvironment::systemEnvironment();
    return install(packages, hostOnly);
}

}  // namespace gemrun
