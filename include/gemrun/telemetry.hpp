#pragma once

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QMutex>
#include <QString>

namespace gemrun {

// Run statistics for one gemrun process. Services bump counters and record
// durations as they go; main() writes the whole registry out on exit.
class Telemetry final {
public:
    static Telemetry& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void setGauge(const QString& key, double value);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});

    [[nodiscard]] qint64 counter(const QString& key) const;

    // {counters, gauges, durations, events, timestamp_utc}
    [[nodiscard]] QJsonObject snapshot() const;

    // Replaces filePath as a whole; {success, path} or {success, error, path}.
    QJsonObject exportToFile(const QString& filePath) const;

    static constexpr int kMaxEvents = 500;

private:
    struct DurationStats {
        qint64 count = 0;
        qint64 totalMs = 0;
        qint64 minMs = 0;
        qint64 maxMs = 0;

        void add(qint64 durationMs);
        [[nodiscard]] QJsonObject toJson() const;
    };

    struct Event {
        QString type;
        qint64 epochMs = 0;
        QJsonObject payload;

        [[nodiscard]] QJsonObject toJson() const;
    };

    Telemetry() = default;

    mutable QMutex mutex_;
    QHash<QString, qint64> counters_;
    QHash<QString, double> gauges_;
    QHash<QString, DurationStats> durations_;
    QList<Event> events_;
};

}  // namespace gemrun
