#include "gemrun/command_runner.hpp"

#include <QElapsedTimer>
#include <QProcess>

#include "gemrun/process_tree.hpp"
#include "gemrun/telemetry.hpp"

namespace gemrun {

QJsonObject CommandResult::toJson() const {
    return {
        {"returncode", status},
        {"stdout", stdoutText},
        {"stderr", stderrText},
    };
}

CommandResult CommandResult::ok() {
    return {};
}

CommandResult CommandResult::frameworkError(const QString& reason) {
    CommandResult result;
    result.status = kStatusFrameworkError;
    result.stderrText = reason;
    return result;
}

CommandResult CommandRunner::run(
    const QString& program,
    const QStringList& args,
    int timeoutMs,
    const std::optional<QProcessEnvironment>& env) {
    QProcess process;
    QElapsedTimer elapsed;
    elapsed.start();
    if (env) {
        process.setProcessEnvironment(*env);
    }
    process.setStandardInputFile(QProcess::nullDevice());
    process.start(program, args);

    if (!process.waitForStarted(timeoutMs)) {
        const CommandResult result = CommandResult::frameworkError(
            QString("Failed to start %1: %2").arg(program, process.errorString()));
        Telemetry::instance().incrementCounter("commands.start_failures");
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    const int remainingMs = qMax(0, timeoutMs - static_cast<int>(elapsed.elapsed()));
    const bool finished = process.waitForFinished(remainingMs);
    if (!finished && process.state() != QProcess::NotRunning) {
        ProcessTree::killTree(process.processId());
        process.kill();
        process.waitForFinished(1000);

        CommandResult result;
        result.status = kStatusTimedOut;
        result.stderrText = kTimeoutMessage;
        result.timedOut = true;
        Telemetry::instance().incrementCounter("commands.timeouts");
        Telemetry::instance().recordEvent(
            "command_timeout",
            {
                {"program", program},
                {"timeout_ms", timeoutMs},
            });
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    CommandResult result;
    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput()).trimmed();
    result.stderrText = QString::fromUtf8(process.readAllStandardError()).trimmed();
    if (process.exitStatus() == QProcess::CrashExit) {
        // A signal exit has no meaningful exit code.
        result.status = kStatusFrameworkError;
        const QString reason = QString("Process crashed: %1").arg(process.errorString());
        result.stderrText = result.stderrText.isEmpty() ? reason : reason + "\n" + result.stderrText;
    } else {
        result.status = process.exitCode();
    }

    Telemetry::instance().incrementCounter("commands.count");
    if (result.status != 0) {
        Telemetry::instance().incrementCounter("commands.non_zero_exit");
    }
    Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
    return result;
}

CommandResult CommandRunner::runArgv(
    const QStringList& argv,
    int timeoutMs,
    const std::optional<QProcessEnvironment>& env) {
    if (argv.isEmpty()) {
        return CommandResult::frameworkError("Empty command line.");
    }
    return run(argv.first(), argv.mid(1), timeoutMs, env);
}

}  // namespace gemrun
