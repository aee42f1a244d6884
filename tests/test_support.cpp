#include "test_support.hpp"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileDevice>
#include <QThread>

namespace gemrun::test {

QString writeShellScript(const QString& dir, const QString& name, const QString& body) {
    const QString path = QDir(dir).filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {};
    }
    file.write(("#!/bin/sh\n" + body).toUtf8());
    file.close();
    file.setPermissions(
        QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner
        | QFileDevice::ReadGroup | QFileDevice::ExeGroup);
    return path;
}

QString readText(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return QString::fromUtf8(file.readAll());
}

QStringList readLines(const QString& path) {
    return readText(path).split('\n', Qt::SkipEmptyParts);
}

QStringList entriesOf(const QString& dir) {
    return QDir(dir).entryList(QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot);
}

bool isProcessAlive(qint64 pid) {
    const QString stat = readText(QString("/proc/%1/stat").arg(pid));
    if (stat.isEmpty()) {
        return false;
    }
    const int endParen = stat.lastIndexOf(')');
    return endParen < 0 || stat.mid(endParen + 2, 1) != "Z";
}

bool waitUntilGone(qint64 pid, int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        if (!isProcessAlive(pid)) {
            return true;
        }
        QThread::msleep(50);
    }
    return !isProcessAlive(pid);
}

FakeGem::FakeGem() {
    logPath_ = QDir(dir_.path()).filePath("gem.log");
    installedPath_ = QDir(dir_.path()).filePath("installed.txt");
    const QString body = QString(
        "echo \"$* | GEM_HOME=$GEM_HOME\" >> '%1'\n"
        "case \"$1\" in\n"
        "  list)\n"
        "    if grep -qx \"$4\" '%2' 2>/dev/null; then echo true; exit 0; fi\n"
        "    echo false\n"
        "    exit 1\n"
        "    ;;\n"
        "  install)\n"
        "    shift\n"
        "    for pkg in \"$@\"; do\n"
        "      case \"$pkg\" in\n"
        "        *fail*) echo \"Fetching $pkg\"; echo \"ERROR:  Could not find a valid gem '$pkg'\" >&2; exit 2 ;;\n"
        "      esac\n"
        "    done\n"
        "    case \" $* \" in\n"
        "      *' --user-install '*) ;;\n"
        "      *) mkdir -p \"$GEM_HOME/bin\" ;;\n"
        "    esac\n"
        "    echo \"Successfully installed $*\"\n"
        "    ;;\n"
        "esac\n")
                             .arg(logPath_, installedPath_);
    program_ = writeShellScript(dir_.path(), "gem", body);
}

QStringList FakeGem::log() const {
    return readLines(logPath_);
}

QStringList FakeGem::installCalls() const {
    QStringList out;
    for (const QString& line : log()) {
        if (line.startsWith("install")) {
            out.append(line);
        }
    }
    return out;
}

QStringList FakeGem::listCalls() const {
    QStringList out;
    for (const QString& line : log()) {
        if (line.startsWith("list")) {
            out.append(line);
        }
    }
    return out;
}

void FakeGem::markInstalled(const QStringList& packages) const {
    QFile file(installedPath_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        return;
    }
    for (const QString& package : packages) {
        file.write((package + "\n").toUtf8());
    }
}

ExecutorConfig FakeGem::config(const QString& workspaceRoot) const {
    ExecutorConfig config;
    config.interpreter = "/bin/sh";
    config.inlineFlag = "-c";
    config.packageManager = program_;
    config.scriptFileName = "script.sh";
    config.timeoutMs = 10000;
    config.userGemHome = QDir(dir_.path()).filePath("user-gems");
    config.workspaceRoot = workspaceRoot;
    return config;
}

}  // namespace gemrun::test
