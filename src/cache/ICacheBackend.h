#pragma once

#include <QDateTime>
#include <QString>
#include <QVariant>
#include <optional>

struct CacheEntry {
    QString  key;
    QVariant value;
    qint64   createdAtMs = 0;
    int      ttlSeconds = 3600;

    bool isExpired(qint64 nowMs = QDateTime::currentMSecsSinceEpoch()) const
    {
        return nowMs - createdAtMs > qint64(ttlSeconds) * 1000;
    }
};

// Key/value store with per-entry TTL. Implementations are thread-safe.
// Backends that depend on an external resource throw CacheFailure when
// it is unavailable; the in-process backend never throws.
class ICacheBackend {
public:
    virtual ~ICacheBackend() = default;

    virtual std::optional<QVariant> get(const QString& key) = 0;
    virtual void set(const QString& key, const QVariant& value, int ttlSeconds) = 0;
    virtual bool remove(const QString& key) = 0;
    virtual bool exists(const QString& key) = 0;
    virtual void clear() = 0;

    virtual QString name() const = 0;
};
