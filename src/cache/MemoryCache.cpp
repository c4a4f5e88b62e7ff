#include "MemoryCache.h"

#include <QDeadlineTimer>
#include <QDebug>
#include <QMutexLocker>
#include <QThread>

MemoryCache::MemoryCache(int sweepIntervalSeconds, QObject* parent)
    : QObject(parent)
    , m_intervalMs(qMax(sweepIntervalSeconds, 1) * 1000)
{
}

MemoryCache::~MemoryCache()
{
    stop();
}

// ── Lookup (lazy eviction) ──────────────────────────────────────────
std::optional<QVariant> MemoryCache::get(const QString& key)
{
    QMutexLocker lock(&m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return std::nullopt;
    if (it->isExpired()) {
        m_entries.erase(it);
        return std::nullopt;
    }
    return it->value;
}

bool MemoryCache::exists(const QString& key)
{
    QMutexLocker lock(&m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;
    if (it->isExpired()) {
        m_entries.erase(it);
        return false;
    }
    return true;
}

void MemoryCache::set(const QString& key, const QVariant& value, int ttlSeconds)
{
    CacheEntry entry;
    entry.key = key;
    entry.value = value;
    entry.createdAtMs = QDateTime::currentMSecsSinceEpoch();
    entry.ttlSeconds = ttlSeconds;

    QMutexLocker lock(&m_mutex);
    m_entries.insert(key, entry);
}

bool MemoryCache::remove(const QString& key)
{
    QMutexLocker lock(&m_mutex);
    return m_entries.remove(key) > 0;
}

void MemoryCache::clear()
{
    QMutexLocker lock(&m_mutex);
    m_entries.clear();
}

int MemoryCache::size() const
{
    QMutexLocker lock(&m_mutex);
    return m_entries.size();
}

// ── Background sweep ────────────────────────────────────────────────
void MemoryCache::start()
{
    if (m_sweeper)
        return;

    m_stopping = false;
    m_sweeper = QThread::create([this]() {
        QMutexLocker lock(&m_sweepMutex);
        while (!m_stopping) {
            m_sweepWake.wait(&m_sweepMutex, QDeadlineTimer(m_intervalMs));
            if (m_stopping)
                break;
            lock.unlock();
            sweep();
            lock.relock();
        }
    });
    m_sweeper->setObjectName(QStringLiteral("MemoryCacheSweep"));
    m_sweeper->start(QThread::LowPriority);
    qDebug() << "[Cache] Memory sweep every" << m_intervalMs / 1000 << "s";
}

void MemoryCache::stop()
{
    if (!m_sweeper)
        return;

    {
        QMutexLocker lock(&m_sweepMutex);
        m_stopping = true;
        m_sweepWake.wakeAll();
    }
    m_sweeper->wait();
    delete m_sweeper;
    m_sweeper = nullptr;
}

int MemoryCache::sweep()
{
    int evicted = 0;
    {
        QMutexLocker lock(&m_mutex);
        const qint64 now = QDateTime::currentMSecsSinceEpoch();
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (it->isExpired(now)) {
                it = m_entries.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }

    if (evicted > 0)
        qDebug() << "[Cache] Swept" << evicted << "expired entries";
    emit swept(evicted);
    return evicted;
}
