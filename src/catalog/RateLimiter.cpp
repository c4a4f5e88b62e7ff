#include "RateLimiter.h"

#include <QMutexLocker>
#include <QThread>

RateLimiter::RateLimiter(int requestsPerSecond)
    : m_intervalMs(1000 / qMax(requestsPerSecond, 1))
{
    m_clock.start();
}

void RateLimiter::acquire()
{
    qint64 waitMs = 0;
    {
        QMutexLocker lock(&m_mutex);
        const qint64 now = m_clock.elapsed();
        // First caller goes immediately, later ones queue behind the reserved slot
        const qint64 slot = qMax(now, m_nextSlotMs);
        m_nextSlotMs = slot + m_intervalMs;
        waitMs = slot - now;
    }

    if (waitMs > 0)
        QThread::msleep(static_cast<unsigned long>(waitMs));
}

void RateLimiter::clear()
{
    QMutexLocker lock(&m_mutex);
    m_nextSlotMs = 0;
}
