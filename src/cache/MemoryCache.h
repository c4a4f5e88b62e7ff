#pragma once

#include "ICacheBackend.h"

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QWaitCondition>

class QThread;

class MemoryCache : public QObject, public ICacheBackend {
    Q_OBJECT
public:
    explicit MemoryCache(int sweepIntervalSeconds = 300, QObject* parent = nullptr);
    ~MemoryCache() override;

    std::optional<QVariant> get(const QString& key) override;
    void set(const QString& key, const QVariant& value, int ttlSeconds) override;
    bool remove(const QString& key) override;
    bool exists(const QString& key) override;
    void clear() override;
    QString name() const override { return QStringLiteral("memory"); }

    // Periodic eviction of expired entries on a worker thread owned by the
    // cache. Runs without an event loop on the caller's side.
    void start();
    void stop();
    bool isSweeping() const { return m_sweeper != nullptr; }

    int size() const;

public slots:
    int sweep();

signals:
    void swept(int evicted);

private:
    QHash<QString, CacheEntry> m_entries;
    mutable QMutex m_mutex;

    QThread* m_sweeper = nullptr;
    QMutex m_sweepMutex;
    QWaitCondition m_sweepWake;
    bool m_stopping = false;
    int m_intervalMs;
};
