// =================================================================
// src/DiffLens/Broadcaster.cpp
// =================================================================
// Implementation of change notification fan-out.

#include "DiffLens/Broadcaster.hpp"
#include "DiffLens/Logger.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace DiffLens {

std::string toString(NotificationType type) {
    return type == NotificationType::CONNECTED ? "connected" : "reload";
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

void to_json(nlohmann::json& j, const WatchNotification& notification) {
    j = nlohmann::json{
        {"type", toString(notification.type)},
        {"mode", toString(notification.mode)},
        {"changeType", toString(notification.changeType)},
        {"timestamp", formatTimestamp(notification.timestamp)},
        {"message", notification.message}
    };
}

void Broadcaster::setMode(DiffMode mode) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_mode = mode;
}

DiffMode Broadcaster::mode() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_mode;
}

WatchNotification Broadcaster::makeConnected() const {
    WatchNotification notification;
    notification.type = NotificationType::CONNECTED;
    notification.mode = mode();
    notification.changeType = ChangeType::FILE;
    notification.timestamp = std::chrono::system_clock::now();
    notification.message = "Connected to file watcher (" + toString(notification.mode) + " mode)";
    return notification;
}

WatchNotification Broadcaster::makeReload() const {
    WatchNotification notification;
    notification.type = NotificationType::RELOAD;
    notification.mode = mode();
    notification.changeType = watchConfigFor(notification.mode).changeType;
    notification.timestamp = std::chrono::system_clock::now();
    notification.message = "Changes detected in " + toString(notification.mode) + " mode";
    return notification;
}

void Broadcaster::addClient(std::shared_ptr<ClientSession> session) {
    if (!session) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sessions.push_back(session);
    }

    nlohmann::json payload = makeConnected();
    if (!deliver(session, payload.dump())) {
        removeClient(session);
    }
    LOG_DEBUG("Broadcaster", "Client connected (" + std::to_string(clientCount()) + " open)");
}

void Broadcaster::removeClient(const std::shared_ptr<ClientSession>& session) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessions.erase(std::remove(m_sessions.begin(), m_sessions.end(), session), m_sessions.end());
}

size_t Broadcaster::broadcastReload() {
    return broadcast(makeReload());
}

size_t Broadcaster::broadcast(const WatchNotification& notification) {
    std::vector<std::shared_ptr<ClientSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sessions = m_sessions;
    }
    if (sessions.empty()) {
        return 0;
    }

    nlohmann::json json = notification;
    std::string payload = json.dump();

    size_t delivered = 0;
    for (const auto& session : sessions) {
        if (deliver(session, payload)) {
            ++delivered;
        } else {
            removeClient(session);
        }
    }

    LOG_INFO("Broadcaster", notification.message + " (" + std::to_string(delivered) + " clients notified)");
    return delivered;
}

bool Broadcaster::deliver(const std::shared_ptr<ClientSession>& session, const std::string& payload) {
    try {
        session->send(payload);
        return true;
    } catch (const std::exception& e) {
        LOG_WARNING("Broadcaster", std::string("Dropping client after failed send: ") + e.what());
        return false;
    }
}

size_t Broadcaster::clientCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

void Broadcaster::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessions.clear();
}

} // namespace DiffLens
