#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "gemrun/command_runner.hpp"
#include "gemrun/dependency_installer.hpp"
#include "gemrun/execution_environment.hpp"
#include "gemrun/executor_config.hpp"

namespace gemrun {

constexpr const char* kInstallFailurePrefix = "Dependency install failed:\n";

struct ExecutionRequest {
    QString code;
    QStringList packages;
    bool isolated = false;

    // Accepts {code, packages?, isolated?}; "use_temp_dir" is read as an
    // alias of "isolated".
    static ExecutionRequest fromJson(const QJsonObject& object);
};

// Installs the requested gems, then runs the code, with one of two package
// isolation strategies:
//   shared    - gems go to the user's persistent store, code runs via -e.
//   isolated  - gems go to a throwaway workspace that also holds the script;
//               the workspace is deleted on every exit path.
// Not a security sandbox: the code keeps full filesystem, network and
// process access.
class CodeExecutor {
public:
    explicit CodeExecutor(ExecutorConfig config = {});

    CommandResult execute(const ExecutionRequest& request) const;
    CommandResult execute(
        const QString& code,
        const QStringList& packages = {},
        bool isolated = false) const;

    [[nodiscard]] const ExecutorConfig& config() const { return config_; }
    [[nodiscard]] IsolationMode modeFor(const ExecutionRequest& request) const;

private:
    CommandResult executeShared(const ExecutionRequest& request) const;
    CommandResult executeIsolated(const ExecutionRequest& request) const;

    static CommandResult installFailure(const CommandResult& install);

    ExecutorConfig config_;
    DependencyInstaller installer_;
};

}  // namespace gemrun
