#include "gemrun/process_tree.hpp"

#include <QDir>
#include <QFile>
#include <QStringList>

#ifdef __linux__
#include <csignal>
#include <sys/types.h>
#endif

namespace gemrun {

bool ProcessTree::isNumeric(const QString& value) {
    for (const QChar c : value) {
        if (!c.isDigit()) {
            return false;
        }
    }
    return !value.isEmpty();
}

QString ProcessTree::readFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return QString::fromUtf8(file.readAll());
}

qint64 ProcessTree::parseParentPid(const QString& statLine) {
    // The command name is parenthesised and may itself contain spaces or ')'.
    const int endParen = statLine.lastIndexOf(')');
    if (endParen < 0 || endParen + 2 >= statLine.size()) {
        return -1;
    }
    const QStringList tokens = statLine.mid(endParen + 2).split(' ', Qt::SkipEmptyParts);
    if (tokens.size() < 2) {
        return -1;
    }
    return tokens[1].toLongLong();
}

QList<qint64> ProcessTree::listChildren(qint64 parentPid) {
    QList<qint64> children;
    const QDir procDir("/proc");
    const QStringList entries = procDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        if (!isNumeric(entry)) {
            continue;
        }
        if (parseParentPid(readFile("/proc/" + entry + "/stat")) == parentPid) {
            children.append(entry.toLongLong());
        }
    }
    return children;
}

void ProcessTree::collectChildrenRecursive(qint64 pid, QSet<qint64>& outSet) {
    const QList<qint64> children = listChildren(pid);
    for (qint64 child : children) {
        if (outSet.contains(child)) {
            continue;
        }
        outSet.insert(child);
        collectChildrenRecursive(child, outSet);
    }
}

QSet<qint64> ProcessTree::descendants(qint64 pid) {
    QSet<qint64> out;
    if (pid > 0) {
        collectChildrenRecursive(pid, out);
    }
    return out;
}

bool ProcessTree::killTree(qint64 pid) {
#ifndef __linux__
    Q_UNUSED(pid);
    return false;
#else
    if (pid <= 0) {
        return false;
    }
    // Freeze the root first so it cannot fork new children while we walk /proc.
    if (::kill(static_cast<pid_t>(pid), SIGSTOP) != 0) {
        return false;
    }

    bool success = true;
    const QSet<qint64> children = descendants(pid);
    for (qint64 child : children) {
        if (::kill(static_cast<pid_t>(child), SIGKILL) != 0) {
            success = false;
        }
    }
    if (::kill(static_cast<pid_t>(pid), SIGKILL) != 0) {
        success = false;
    }
    return success;
#endif
}

}  // namespace gemrun
