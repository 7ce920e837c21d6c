// =================================================================
// src/DiffLens/DebounceTimer.cpp
// =================================================================
// Implementation of the debounce timer.

#include "DiffLens/DebounceTimer.hpp"
#include "DiffLens/Logger.hpp"

namespace DiffLens {

DebounceTimer::DebounceTimer(std::chrono::milliseconds delay, Callback callback)
    : m_delay(delay),
      m_callback(std::move(callback)),
      m_shutdown(false)
{
    m_worker = std::thread(&DebounceTimer::run, this);
}

DebounceTimer::~DebounceTimer() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        m_deadline.reset();
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void DebounceTimer::arm() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_deadline = std::chrono::steady_clock::now() + m_delay;
    }
    m_cv.notify_all();
}

void DebounceTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_deadline.reset();
    }
    m_cv.notify_all();
}

bool DebounceTimer::isPending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_deadline.has_value();
}

void DebounceTimer::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_shutdown) {
        if (!m_deadline) {
            m_cv.wait(lock, [this] { return m_shutdown || m_deadline.has_value(); });
            continue;
        }

        auto deadline = *m_deadline;
        if (m_cv.wait_until(lock, deadline) != std::cv_status::timeout) {
            // Re-armed, cancelled or shut down; re-evaluate.
            continue;
        }
        if (!m_deadline || *m_deadline != deadline) {
            continue;
        }

        m_deadline.reset();
        lock.unlock();
        try {
            m_callback();
        } catch (const std::exception& e) {
            LOG_ERROR("DebounceTimer", std::string("Debounced action failed: ") + e.what());
        }
        lock.lock();
    }
}

} // namespace DiffLens
