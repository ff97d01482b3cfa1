/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag with an interruptible wait.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace docgen::infrastructure {

class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_cancelled;
    }

    /**
     * @brief Sleeps for up to @p duration, returning early on cancel().
     * @return true if the token was cancelled.
     */
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, duration, [this] { return m_cancelled; });
    }

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_cancelled = false;
};

} // namespace docgen::infrastructure
