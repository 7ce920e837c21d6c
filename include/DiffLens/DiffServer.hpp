// =================================================================
// include/DiffLens/DiffServer.hpp
// =================================================================
// HTTP endpoints serving diffs, blobs and the change stream.

#pragma once

#include "DiffLens/Broadcaster.hpp"
#include "DiffLens/ChangeWatcher.hpp"
#include "DiffLens/DiffParser.hpp"
#include "nlohmann/json.hpp"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace httplib {
class Server;
class DataSink;
}

namespace DiffLens {

class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A Server-Sent Events connection.
 *
 * send() queues a "data:" frame from any thread; pump() runs on the HTTP
 * connection thread and writes queued frames to the socket.
 */
class SseSession : public ClientSession {
public:
    explicit SseSession(std::chrono::milliseconds keepalive = std::chrono::seconds(15));

    void send(const std::string& payload) override;

    /**
     * @brief Waits for queued frames and writes them.
     * @return false once the session is closed or the client went away
     */
    bool pump(httplib::DataSink& sink);

    /**
     * @brief Takes the queued frames without writing them anywhere.
     */
    std::vector<std::string> drain();

    void close();
    bool isClosed() const;

private:
    std::chrono::milliseconds m_keepalive;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::string> m_frames;
    bool m_closed = false;
};

struct ServerOptions {
    std::string host = "localhost";
    int port = 4966;
    std::string target = "HEAD";
    std::string base = "HEAD^";
    bool ignoreWhitespace = false;
    /// Set when serving a patch read from stdin; revisions are then ignored.
    std::optional<std::string> stdinPatch;
};

/**
 * @brief Result of one API call, independent of the HTTP library.
 */
struct ApiResponse {
    int status = 200;
    std::string body;
    std::string contentType = "application/json";
};

class DiffServer {
public:
    /**
     * @param parser Diff source
     * @param watcher Change watcher for /api/watch, or null when watching is off
     * @param options Listen address and the initially served revisions
     */
    DiffServer(std::shared_ptr<DiffParser> parser, ChangeWatcher* watcher, ServerOptions options);
    ~DiffServer();

    DiffServer(const DiffServer&) = delete;
    DiffServer& operator=(const DiffServer&) = delete;

    /**
     * @brief Binds the listening socket.
     * @throws ServerError if the address is unavailable
     */
    void bind();

    /**
     * @brief Serves requests until stop() is called. Requires bind().
     */
    void listen();

    void stop();

    int port() const { return m_bound_port; }

    /**
     * @brief Forces the next /api/diff to re-parse.
     */
    void invalidateCache();

    /**
     * @brief Parses the first diff eagerly so startup errors surface early.
     */
    DiffResponse loadInitialDiff();

    ApiResponse handleDiff(const std::string& base, const std::string& target,
                           const std::string& ignore_whitespace);
    ApiResponse handleGeneratedStatus(const std::string& raw_path, const std::string& ref);
    ApiResponse handleBlob(const std::string& raw_path, const std::string& ref);

    /**
     * @brief Relative, non-empty and free of ".." segments.
     */
    static bool isSafeRelativePath(const std::string& path);

    /**
     * @brief Turns backslash separators into '/', the form git expects.
     */
    static std::string normalizeRequestPath(const std::string& path);

    static std::string contentTypeFor(const std::string& path);

private:
    struct CacheKey {
        std::string base;
        std::string target;
        bool ignoreWhitespace;

        bool operator==(const CacheKey& other) const {
            return base == other.base && target == other.target && ignoreWhitespace == other.ignoreWhitespace;
        }
    };

    void configureRoutes();
    DiffResponse currentDiff(const CacheKey& key);
    std::string resolveForDisplay(const std::string& revision);
    std::shared_ptr<SseSession> openSession();
    void closeSessions();

    static ApiResponse errorResponse(int status, const std::string& message);

    std::shared_ptr<DiffParser> m_parser;
    ChangeWatcher* m_watcher;
    ServerOptions m_options;
    std::unique_ptr<httplib::Server> m_server;
    int m_bound_port = 0;

    std::mutex m_cache_mutex;
    std::optional<DiffResponse> m_cached;
    std::optional<CacheKey> m_cached_key;
    bool m_cache_valid = false;

    std::mutex m_sessions_mutex;
    std::vector<std::weak_ptr<SseSession>> m_sessions;
};

/**
 * @brief Serializes JSON, replacing invalid UTF-8 from diff content.
 */
std::string dumpJson(const nlohmann::json& json);

} // namespace DiffLens
