#pragma once

#include <QProcessEnvironment>
#include <QString>

namespace gemrun {

enum class IsolationMode {
    Shared,
    Isolated,
};

QString isolationModeName(IsolationMode mode);

// Child-process environment for one execution attempt. Always a copy of the
// host environment; the host process's own environment is never modified.
struct ExecutionEnvironment {
    IsolationMode mode = IsolationMode::Shared;
    QString gemHome;
    QProcessEnvironment variables;

    // GEM_HOME points at the user's persistent gem store.
    static ExecutionEnvironment shared(
        const QProcessEnvironment& host,
        const QString& userGemHome);

    // GEM_HOME and GEM_PATH point inside workspacePath and the gem bin
    // directory is prepended to PATH.
    static ExecutionEnvironment isolated(
        const QProcessEnvironment& host,
        const QString& workspacePath);

    [[nodiscard]] QString gemBinDir() const;
};

// Expands a leading "~" against the user's home directory.
QString expandUserPath(const QString& path);

}  // namespace gemrun
