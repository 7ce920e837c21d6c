// =================================================================
// include/DiffLens/TtlCache.hpp
// =================================================================
// Small keyed cache whose entries expire after a fixed time-to-live.

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace DiffLens {

/**
 * @brief Thread-safe map with per-entry expiry.
 *
 * Expired entries are dropped lazily on lookup. No ordering is kept, and
 * clear() discards everything at once.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit TtlCache(std::chrono::milliseconds ttl,
                      std::function<Clock::time_point()> now = &Clock::now)
        : m_ttl(ttl), m_now(std::move(now)) {}

    /**
     * @brief Returns the cached value if present and still valid.
     */
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        if (it->second.expiresAt <= m_now()) {
            m_entries.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries[key] = Entry{value, m_now() + m_ttl};
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

private:
    struct Entry {
        Value value;
        Clock::time_point expiresAt;
    };

    std::chrono::milliseconds m_ttl;
    std::function<Clock::time_point()> m_now;
    mutable std::mutex m_mutex;
    std::unordered_map<Key, Entry, Hash> m_entries;
};

} // namespace DiffLens
