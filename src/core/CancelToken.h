#pragma once

#include <atomic>

// Cooperative cancellation flag shared between the driver (signal handler)
// and long-running workers. Safe to set from a signal handler.
class CancelToken {
public:
    void cancel() noexcept { m_cancelled.store(true, std::memory_order_relaxed); }
    bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_relaxed); }
    void reset() noexcept { m_cancelled.store(false, std::memory_order_relaxed); }

private:
    std::atomic<bool> m_cancelled{false};
};

inline bool isCancelled(const CancelToken* token)
{
    return token && token->isCancelled();
}
