#include "gemrun/telemetry.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>

namespace gemrun {

namespace {

QString isoUtc(qint64 epochMs) {
    return QDateTime::fromMSecsSinceEpoch(epochMs, Qt::UTC).toString(Qt::ISODateWithMs);
}

template <typename Map, typename ToJson>
QJsonObject toJsonObject(const Map& map, ToJson toJson) {
    QJsonObject out;
    for (auto it = map.cbegin(); it != map.cend(); ++it) {
        out.insert(it.key(), toJson(it.value()));
    }
    return out;
}

}  // namespace

void Telemetry::DurationStats::add(qint64 durationMs) {
    if (count == 0 || durationMs < minMs) {
        minMs = durationMs;
    }
    maxMs = qMax(maxMs, durationMs);
    totalMs += durationMs;
    ++count;
}

QJsonObject Telemetry::DurationStats::toJson() const {
    return {
        {"count", static_cast<double>(count)},
        {"total_ms", static_cast<double>(totalMs)},
        {"min_ms", static_cast<double>(minMs)},
        {"max_ms", static_cast<double>(maxMs)},
        {"avg_ms", count > 0 ? static_cast<double>(totalMs) / static_cast<double>(count) : 0.0},
    };
}

QJsonObject Telemetry::Event::toJson() const {
    QJsonObject row = payload;
    row.insert("type", type);
    row.insert("epoch_ms", static_cast<double>(epochMs));
    row.insert("timestamp_utc", isoUtc(epochMs));
    return row;
}

Telemetry& Telemetry::instance() {
    static Telemetry registry;
    return registry;
}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    counters_[key] += delta;
}

void Telemetry::setGauge(const QString& key, double value) {
    QMutexLocker lock(&mutex_);
    gauges_.insert(key, value);
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    durations_[key].add(durationMs);
}

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QMutexLocker lock(&mutex_);
    if (events_.size() >= kMaxEvents) {
        events_.removeFirst();
    }
    events_.append(Event{type, now, payload});
}

qint64 Telemetry::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return counters_.value(key, 0);
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);
    QJsonArray events;
    for (const Event& event : events_) {
        events.append(event.toJson());
    }
    return {
        {"counters", toJsonObject(counters_, [](qint64 v) { return static_cast<double>(v); })},
        {"gauges", toJsonObject(gauges_, [](double v) { return v; })},
        {"durations", toJsonObject(durations_, [](const DurationStats& s) { return s.toJson(); })},
        {"events", events},
        {"timestamp_utc", isoUtc(QDateTime::currentMSecsSinceEpoch())},
    };
}

QJsonObject Telemetry::exportToFile(const QString& filePath) const {
    const QByteArray payload = QJsonDocument(snapshot()).toJson(QJsonDocument::Indented);

    const QDir dir = QFileInfo(filePath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        return {
            {"success", false},
            {"error", "Cannot create directory " + dir.path()},
            {"path", filePath},
        };
    }

    // Written beside the target and renamed over it, so a reader never sees half a file.
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly) || file.write(payload) != payload.size() || !file.commit()) {
        return {
            {"success", false},
            {"error", file.errorString()},
            {"path", filePath},
        };
    }
    return {
        {"success", true},
        {"path", filePath},
    };
}

}  // namespace gemrun
