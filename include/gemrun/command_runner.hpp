#pragma once

#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <optional>

namespace gemrun {

// Status values reserved for failures outside the child's own exit code.
constexpr int kStatusFrameworkError = -1;
constexpr int kStatusTimedOut = -2;

constexpr const char* kTimeoutMessage = "Error: Execution timed out";

struct CommandResult {
    int status = 0;
    QString stdoutText;
    QString stderrText;
    bool timedOut = false;

    [[nodiscard]] bool success() const { return !timedOut && status == 0; }

    // {returncode, stdout, stderr}
    [[nodiscard]] QJsonObject toJson() const;

    static CommandResult ok();
    static CommandResult frameworkError(const QString& reason);
};

class CommandRunner {
public:
    static constexpr int kDefaultTimeoutMs = 60000;

    // Runs program with args, stdin closed, and both output streams captured.
    // Without env the child inherits the host environment. Never retries.
    static CommandResult run(
        const QString& program,
        const QStringList& args = {},
        int timeoutMs = kDefaultTimeoutMs,
        const std::optional<QProcessEnvironment>& env = std::nullopt);

    // argv[0] is the program.
    static CommandResult runArgv(
        const QStringList& argv,
        int timeoutMs = kDefaultTimeoutMs,
        const std::optional<QProcessEnvironment>& env = std::nullopt);
};

}  // namespace gemrun
