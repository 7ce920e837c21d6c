// =================================================================
// include/DiffLens/Broadcaster.hpp
// =================================================================
// Change notifications and the set of sessions that receive them.

#pragma once

#include "DiffLens/WatchMode.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace DiffLens {

/**
 * @brief A session can no longer accept payloads.
 */
class SessionClosedError : public std::runtime_error {
public:
    explicit SessionClosedError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief One connected client of the change stream.
 */
class ClientSession {
public:
    virtual ~ClientSession() = default;

    /**
     * @brief Delivers one serialized notification.
     * @throws std::runtime_error (usually SessionClosedError) if delivery fails
     */
    virtual void send(const std::string& payload) = 0;
};

enum class NotificationType {
    CONNECTED,
    RELOAD
};

struct WatchNotification {
    NotificationType type = NotificationType::RELOAD;
    DiffMode mode = DiffMode::DEFAULT;
    ChangeType changeType = ChangeType::FILE;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
};

std::string toString(NotificationType type);

/**
 * @brief UTC ISO-8601 with milliseconds, e.g. 2024-05-01T10:00:00.123Z
 */
std::string formatTimestamp(std::chrono::system_clock::time_point time);

void to_json(nlohmann::json& j, const WatchNotification& notification);

/**
 * @brief Fans notifications out to every registered session.
 *
 * A session whose send() throws is dropped without affecting delivery to
 * the others. All methods may be called from any thread.
 */
class Broadcaster {
public:
    Broadcaster() = default;

    void setMode(DiffMode mode);
    DiffMode mode() const;

    /**
     * @brief Registers a session and immediately sends it a "connected"
     * notification carrying the current mode.
     */
    void addClient(std::shared_ptr<ClientSession> session);

    void removeClient(const std::shared_ptr<ClientSession>& session);

    /**
     * @brief Sends a "reload" notification for the current mode.
     * @return Number of sessions that received it
     */
    size_t broadcastReload();

    /**
     * @brief Sends one notification to every session.
     * @return Number of sessions that received it
     */
    size_t broadcast(const WatchNotification& notification);

    size_t clientCount() const;

    void clear();

    WatchNotification makeConnected() const;
    WatchNotification makeReload() const;

private:
    bool deliver(const std::shared_ptr<ClientSession>& session, const std::string& payload);

    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<ClientSession>> m_sessions;
    DiffMode m_mode = DiffMode::DEFAULT;
};

} // namespace DiffLens
