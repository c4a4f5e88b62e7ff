#pragma once

#include <QElapsedTimer>
#include <QMutex>

// Spaces calls at least 1000/requestsPerSecond ms apart across all
// threads. acquire() blocks the caller until its slot comes up.
class RateLimiter {
public:
    explicit RateLimiter(int requestsPerSecond);

    void acquire();
    void clear();

    int intervalMs() const { return m_intervalMs; }

private:
    QMutex m_mutex;
    QElapsedTimer m_clock;
    qint64 m_nextSlotMs = 0;
    int m_intervalMs;
};
