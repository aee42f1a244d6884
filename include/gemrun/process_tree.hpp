#pragma once

#include <QList>
#include <QSet>
#include <QString>

namespace gemrun {

// Descendant discovery and teardown through /proc parent links.
class ProcessTree {
public:
    [[nodiscard]] static QSet<qint64> descendants(qint64 pid);

    // SIGKILLs every descendant of pid, then pid itself. Returns false if any
    // signal could not be delivered (typically because the target already exited).
    static bool killTree(qint64 pid);

private:
    static bool isNumeric(const QString& value);
    static QString readFile(const QString& path);
    static qint64 parseParentPid(const QString& statLine);
    static QList<qint64> listChildren(qint64 parentPid);
    static void collectChildrenRecursive(qint64 pid, QSet<qint64>& outSet);
};

}  // namespace gemrun
