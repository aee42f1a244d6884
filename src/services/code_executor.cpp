#include "gemrun/code_executor.hpp"

#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonValue>
#include <QProcessEnvironment>

#include <utility>

#include "gemrun/ephemeral_workspace.hpp"
#include "gemrun/telemetry.hpp"

namespace gemrun {

ExecutionRequest ExecutionRequest::fromJson(const QJsonObject& object) {
    ExecutionRequest request;
    request.code = object.value("code").toString();
    for (const QJsonValue& value : object.value("packages").toArray()) {
        if (value.isString()) {
            request.packages.append(value.toString());
        }
    }
    request.isolated = object.value("isolated").toBool(object.value("use_temp_dir").toBool(false));
    return request;
}

CodeExecutor::CodeExecutor(ExecutorConfig config)
    : config_(std::move(config)),
      installer_(config_.packageManager, config_.timeoutMs, config_.skipInstalled) {}

IsolationMode CodeExecutor::modeFor(const ExecutionRequest& request) const {
    return request.isolated || config_.alwaysIsolated ? IsolationMode::Isolated : IsolationMode::Shared;
}

CommandResult CodeExecutor::execute(const QString& code, const QStringList& packages, bool isolated) const {
    ExecutionRequest request;
    request.code = code;
    request.packages = packages;
    request.isolated = isolated;
    return execute(request);
}

CommandResult CodeExecutor::execute(const ExecutionRequest& request) const {
    QElapsedTimer elapsed;
    elapsed.start();

    const IsolationMode mode = modeFor(request);
    const CommandResult result =
        mode == IsolationMode::Isolated ? executeIsolated(request) : executeShared(request);

    Telemetry::instance().incrementCounter("executions." + isolationModeName(mode));
    Telemetry::instance().recordDurationMs("executions.duration_ms", elapsed.elapsed());
    return result;
}

CommandResult CodeExecutor::installFailure(const CommandResult& install) {
    CommandResult result;
    result.status = install.status;
    result.stdoutText = install.stdoutText;
    result.stderrText = kInstallFailurePrefix + install.stderrText;
    result.timedOut = install.timedOut;
    return result;
}

CommandResult CodeExecutor::executeShared(const ExecutionRequest& request) const {
    const ExecutionEnvironment env = ExecutionEnvironment::shared(
        QProcessEnvironment::systemEnvironment(),
        config_.resolvedUserGemHome());

    // --user-install picks the install root, so the host environment is
    // left as is; only the run sees the GEM_HOME override.
    const CommandResult install = installer_.install(request.packages);
    if (!install.success()) {
        return installFailure(install);
    }
    return CommandRunner::runArgv(
        {config_.interpreter, config_.inlineFlag, request.code},
        config_.timeoutMs,
        env.variables);
}

CommandResult CodeExecutor::executeIsolated(const ExecutionRequest& request) const {
    EphemeralWorkspace workspace(config_.resolvedWorkspaceRoot());
    if (!workspace.isValid()) {
        return CommandResult::frameworkError(
            QString("Failed to create workspace: %1").arg(workspace.errorString()));
    }

    const ExecutionEnvironment env = ExecutionEnvironment::isolated(
        QProcessEnvironment::systemEnvironment(),
        workspace.path());

    CommandResult result;
    const CommandResult install = installer_.install(request.packages, env);
    if (!install.success()) {
        result = installFailure(install);
    } else {
        QString writeError;
        if (workspace.writeFile(config_.scriptFileName, request.code, &writeError)) {
            result = CommandRunner::runArgv(
                {config_.interpreter, workspace.filePath(config_.scriptFileName)},
                config_.timeoutMs,
                env.variables);
        } else {
            result = CommandResult::frameworkError(
                QString("Failed to write script file: %1").arg(writeError));
        }
    }

    // An exception skips this call; the destructor removes the tree then.
    workspace.remove();
    return result;
}

}  // namespace gemrun
