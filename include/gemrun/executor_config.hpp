#pragma once

#include <QJsonObject>
#include <QString>

namespace gemrun {

// Construction-time settings for CodeExecutor. Plain value, no globals.
struct ExecutorConfig {
    QString interpreter = "ruby";
    QString inlineFlag = "-e";
    QString packageManager = "gem";
    QString scriptFileName = "script.rb";
    int timeoutMs = 60000;
    bool alwaysIsolated = false;
    QString userGemHome = "~/.gem";
    bool skipInstalled = true;
    QString workspaceRoot;  // empty means the system temp directory

    // Absent keys keep their current values; unknown keys are ignored.
    // On failure nothing is changed and {success: false, error} is returned.
    QJsonObject loadFromFile(const QString& filePath);
    QJsonObject applyJson(const QJsonObject& object);
    [[nodiscard]] QJsonObject toJson() const;

    [[nodiscard]] QString resolvedUserGemHome() const;
    [[nodiscard]] QString resolvedWorkspaceRoot() const;
};

}  // namespace gemrun
