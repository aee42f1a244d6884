#pragma once

#include <QString>
#include <QTemporaryDir>

namespace gemrun {

// Uniquely named scratch directory for one isolated execution. The
// directory is removed by remove() or, at the latest, by the destructor.
class EphemeralWorkspace {
public:
    explicit EphemeralWorkspace(const QString& parentDir);
    ~EphemeralWorkspace();

    EphemeralWorkspace(const EphemeralWorkspace&) = delete;
    EphemeralWorkspace& operator=(const EphemeralWorkspace&) = delete;

    [[nodiscard]] bool isValid() const;
    [[nodiscard]] QString errorString() const;
    [[nodiscard]] QString path() const;
    [[nodiscard]] QString filePath(const QString& fileName) const;

    bool writeFile(const QString& fileName, const QString& content, QString* error) const;

    // Idempotent. Returns false and reports through telemetry when the tree
    // could not be deleted.
    bool remove();

    static int activeCount();

private:
    QTemporaryDir dir_;
    QString path_;
    bool removed_ = false;
};

}  // namespace gemrun
