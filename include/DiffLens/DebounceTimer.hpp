// =================================================================
// include/DiffLens/DebounceTimer.hpp
// =================================================================
// Single-slot cancellable delayed task.

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace DiffLens {

/**
 * @brief Runs a callback once a burst of arm() calls has gone quiet.
 *
 * There is at most one pending deadline. arm() replaces it, so a burst of
 * calls closer together than the delay yields a single callback, fired
 * delay after the last call. The callback runs on the timer's own thread.
 */
class DebounceTimer {
public:
    using Callback = std::function<void()>;

    DebounceTimer(std::chrono::milliseconds delay, Callback callback);

    /**
     * @brief Cancels any pending callback and joins the timer thread.
     */
    ~DebounceTimer();

    DebounceTimer(const DebounceTimer&) = delete;
    DebounceTimer& operator=(const DebounceTimer&) = delete;

    /**
     * @brief Schedules the callback delay from now, replacing any pending one.
     */
    void arm();

    /**
     * @brief Drops the pending callback, if any.
     */
    void cancel();

    bool isPending() const;

    std::chrono::milliseconds delay() const { return m_delay; }

private:
    void run();

    std::chrono::milliseconds m_delay;
    Callback m_callback;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::optional<std::chrono::steady_clock::time_point> m_deadline;
    bool m_shutdown;
    std::thread m_worker;
};

} // namespace DiffLens
