#include "gemrun/execution_environment.hpp"

#include <QDir>

namespace gemrun {

namespace {

constexpr const char* kGemHomeKey = "GEM_HOME";
constexpr const char* kGemPathKey = "GEM_PATH";
constexpr const char* kPathKey = "PATH";

}  // namespace

QString isolationModeName(IsolationMode mode) {
    return mode == IsolationMode::Isolated ? "isolated" : "shared";
}

QString expandUserPath(const QString& path) {
    if (path == "~") {
        return QDir::homePath();
    }
    if (path.startsWith("~/")) {
        return QDir::cleanPath(QDir::homePath() + path.mid(1));
    }
    return path;
}

ExecutionEnvironment ExecutionEnvironment::shared(
    const QProcessEnvironment& host,
    const QString& userGemHome) {
    ExecutionEnvironment env;
    env.mode = IsolationMode::Shared;
    env.gemHome = expandUserPath(userGemHome);
    env.variables = host;
    env.variables.insert(kGemHomeKey, env.gemHome);
    return env;
}

ExecutionEnvironment ExecutionEnvironment::isolated(
    const QProcessEnvironment& host,
    const QString& workspacePath) {
    ExecutionEnvironment env;
    env.mode = IsolationMode::Isolated;
    env.gemHome = QDir(workspacePath).filePath(".gem");
    env.variables = host;
    env.variables.insert(kGemHomeKey, env.gemHome);
    env.variables.insert(kGemPathKey, env.gemHome);

    QString path = env.gemBinDir();
    const QString hostPath = host.value(kPathKey);
    if (!hostPath.isEmpty()) {
        path += QDir::listSeparator() + hostPath;
    }
    env.variables.insert(kPathKey, path);
    return env;
}

QString ExecutionEnvironment::gemBinDir() const {
    return QDir(gemHome).filePath("bin");
}

}  // namespace gemrun
