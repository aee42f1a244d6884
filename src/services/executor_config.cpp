#include "gemrun/executor_config.hpp"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include "gemrun/execution_environment.hpp"

namespace gemrun {

namespace {

QString stringOr(const QJsonObject& object, const char* key, const QString& fallback) {
    const QJsonValue value = object.value(key);
    return value.isString() ? value.toString() : fallback;
}

bool boolOr(const QJsonObject& object, const char* key, bool fallback) {
    return object.value(key).toBool(fallback);
}

}  // namespace

QJsonObject ExecutorConfig::applyJson(const QJsonObject& object) {
    ExecutorConfig next = *this;
    next.interpreter = stringOr(object, "interpreter", interpreter);
    next.inlineFlag = stringOr(object, "inline_flag", inlineFlag);
    next.packageManager = stringOr(object, "package_manager", packageManager);
    next.scriptFileName = stringOr(object, "script_file_name", scriptFileName);
    next.alwaysIsolated = boolOr(object, "always_isolated", alwaysIsolated);
    next.userGemHome = stringOr(object, "user_gem_home", userGemHome);
    next.skipInstalled = boolOr(object, "skip_installed", skipInstalled);
    next.workspaceRoot = stringOr(object, "workspace_root", workspaceRoot);
    if (object.contains("timeout_ms")) {
        next.timeoutMs = object.value("timeout_ms").toInt(0);
    }

    if (next.interpreter.trimmed().isEmpty() || next.packageManager.trimmed().isEmpty()
        || next.inlineFlag.trimmed().isEmpty()) {
        return {
            {"success", false},
            {"error", "interpreter, inline_flag and package_manager must not be empty."},
        };
    }
    if (next.scriptFileName.trimmed().isEmpty() || next.scriptFileName.contains('/')) {
        return {
            {"success", false},
            {"error", "script_file_name must be a plain file name."},
        };
    }
    if (next.timeoutMs <= 0) {
        return {
            {"success", false},
            {"error", "timeout_ms must be a positive integer."},
        };
    }

    *this = next;
    return {{"success", true}};
}

QJsonObject ExecutorConfig::loadFromFile(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open executor config file."},
            {"path", filePath},
        };
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError) {
        return {
            {"success", false},
            {"error", QString("Malformed executor config: %1").arg(parseError.errorString())},
            {"path", filePath},
        };
    }
    if (!doc.isObject()) {
        return {
            {"success", false},
            {"error", "Executor config file must contain a JSON object."},
            {"path", filePath},
        };
    }

    QJsonObject out = applyJson(doc.object());
    out.insert("path", filePath);
    return out;
}

QJsonObject ExecutorConfig::toJson() const {
    return {
        {"interpreter", interpreter},
        {"inline_flag", inlineFlag},
        {"package_manager", packageManager},
        {"script_file_name", scriptFileName},
        {"timeout_ms", timeoutMs},
        {"always_isolated", alwaysIsolated},
        {"user_gem_home", userGemHome},
        {"skip_installed", skipInstalled},
        {"workspace_root", workspaceRoot},
    };
}

QString ExecutorConfig::resolvedUserGemHome() const {
    return expandUserPath(userGemHome);
}

QString ExecutorConfig::resolvedWorkspaceRoot() const {
    return workspaceRoot.trimmed().isEmpty() ? QDir::tempPath() : expandUserPath(workspaceRoot);
}

}  // namespace gemrun
