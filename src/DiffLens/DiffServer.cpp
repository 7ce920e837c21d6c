// =================================================================
// src/DiffLens/DiffServer.cpp
// =================================================================
// Implementation of the HTTP API.

#include "DiffLens/DiffServer.hpp"
#include "DiffLens/Logger.hpp"
#include "DiffLens/RevisionSpec.hpp"
#include "httplib.h"
#include <algorithm>
#include <cctype>

namespace DiffLens {

std::string dumpJson(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ---- SseSession ----

SseSession::SseSession(std::chrono::milliseconds keepalive)
    : m_keepalive(keepalive)
{
}

void SseSession::send(const std::string& payload) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            throw SessionClosedError("Event stream is closed");
        }
        m_frames.push_back("data: " + payload + "\n\n");
    }
    m_cv.notify_all();
}

bool SseSession::pump(httplib::DataSink& sink) {
    std::deque<std::string> frames;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, m_keepalive, [this] { return m_closed || !m_frames.empty(); });
        if (m_closed) {
            return false;
        }
        frames.swap(m_frames);
    }

    if (!sink.is_writable()) {
        close();
        return false;
    }

    if (frames.empty()) {
        static const std::string keepalive = ": keep-alive\n\n";
        sink.write(keepalive.data(), keepalive.size());
        return true;
    }
    for (const auto& frame : frames) {
        sink.write(frame.data(), frame.size());
    }
    return true;
}

std::vector<std::string> SseSession::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> frames(m_frames.begin(), m_frames.end());
    m_frames.clear();
    return frames;
}

void SseSession::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool SseSession::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

// ---- DiffServer ----

DiffServer::DiffServer(std::shared_ptr<DiffParser> parser, ChangeWatcher* watcher, ServerOptions options)
    : m_parser(std::move(parser)),
      m_watcher(watcher),
      m_options(std::move(options)),
      m_server(std::make_unique<httplib::Server>())
{
    configureRoutes();
}

DiffServer::~DiffServer() {
    stop();
}

ApiResponse DiffServer::errorResponse(int status, const std::string& message) {
    ApiResponse response;
    response.status = status;
    response.body = dumpJson(nlohmann::json{{"error", message}});
    return response;
}

bool DiffServer::isSafeRelativePath(const std::string& path) {
    if (path.empty() || path[0] == '/' || path[0] == '\\') {
        return false;
    }
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find_first_of("/\\", start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (path.compare(start, end - start, "..") == 0 && end - start == 2) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

std::string DiffServer::normalizeRequestPath(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    return normalized;
}

std::string DiffServer::contentTypeFor(const std::string& path) {
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos) {
        return "application/octet-stream";
    }
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "png") return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif") return "image/gif";
    if (ext == "svg") return "image/svg+xml";
    if (ext == "webp") return "image/webp";
    if (ext == "bmp") return "image/bmp";
    if (ext == "ico") return "image/x-icon";
    return "application/octet-stream";
}

void DiffServer::invalidateCache() {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    m_cache_valid = false;
}

DiffResponse DiffServer::loadInitialDiff() {
    return currentDiff(CacheKey{m_options.base, m_options.target, m_options.ignoreWhitespace});
}

DiffResponse DiffServer::currentDiff(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(m_cache_mutex);

    if (m_options.stdinPatch) {
        if (!m_cached) {
            m_cached = m_parser->parsePatch(*m_options.stdinPatch);
        }
        return *m_cached;
    }

    if (m_cached && m_cache_valid && m_cached_key && *m_cached_key == key) {
        return *m_cached;
    }

    if (m_cached_key && !(*m_cached_key == key)) {
        // Generated status is per revision; a new revision pair starts fresh.
        m_parser->clearCaches();
    }

    DiffResponse response = m_parser->parseDiff(key.target, key.base, key.ignoreWhitespace);
    m_cached = response;
    m_cached_key = key;
    m_cache_valid = true;
    return response;
}

std::string DiffServer::resolveForDisplay(const std::string& revision) {
    if (isSpecialRevision(revision)) {
        return revision;
    }
    try {
        return m_parser->resolveCommitish(revision);
    } catch (const GitError& e) {
        LOG_DEBUG("DiffServer", "Could not resolve " + revision + ": " + e.what());
        return revision;
    }
}

ApiResponse DiffServer::handleDiff(const std::string& base, const std::string& target,
                                   const std::string& ignore_whitespace) {
    CacheKey key{
        base.empty() ? m_options.base : base,
        target.empty() ? m_options.target : target,
        ignore_whitespace.empty() ? m_options.ignoreWhitespace : ignore_whitespace == "true"
    };

    try {
        DiffResponse diff = currentDiff(key);
        nlohmann::json json = diff;
        json["ignoreWhitespace"] = key.ignoreWhitespace;
        if (m_options.stdinPatch) {
            json["baseCommitish"] = "stdin";
            json["targetCommitish"] = "stdin";
        } else {
            json["baseCommitish"] = resolveForDisplay(key.base);
            json["targetCommitish"] = resolveForDisplay(key.target);
            json["requestedBaseCommitish"] = key.base;
            json["requestedTargetCommitish"] = key.target;
        }

        ApiResponse response;
        response.body = dumpJson(json);
        return response;
    } catch (const DiffError& e) {
        LOG_ERROR("DiffServer", e.what());
        return errorResponse(400, e.what());
    }
}

ApiResponse DiffServer::handleGeneratedStatus(const std::string& raw_path, const std::string& ref) {
    if (m_options.stdinPatch) {
        return errorResponse(400, "Generated status is not available for stdin diffs");
    }
    if (!isSafeRelativePath(raw_path)) {
        return errorResponse(400, "Invalid file path");
    }
    if (!ref.empty() && !validateCommitish(ref)) {
        return errorResponse(400, "Invalid ref: " + ref);
    }

    const std::string path = normalizeRequestPath(raw_path);
    std::string effective_ref = ref.empty() ? m_options.target : ref;
    GeneratedStatus status = m_parser->getGeneratedStatus(path, effective_ref);

    nlohmann::json json = status;
    json["path"] = path;
    json["ref"] = effective_ref;

    ApiResponse response;
    response.body = dumpJson(json);
    return response;
}

ApiResponse DiffServer::handleBlob(const std::string& raw_path, const std::string& ref) {
    if (m_options.stdinPatch) {
        return errorResponse(400, "File content is not available for stdin diffs");
    }
    if (!isSafeRelativePath(raw_path)) {
        return errorResponse(400, "Invalid file path");
    }
    if (!ref.empty() && !validateCommitish(ref)) {
        return errorResponse(400, "Invalid ref: " + ref);
    }

    const std::string path = normalizeRequestPath(raw_path);
    std::string effective_ref = ref.empty() ? m_options.target : ref;
    try {
        ApiResponse response;
        response.body = m_parser->getBlobContent(path, effective_ref);
        response.contentType = contentTypeFor(path);
        return response;
    } catch (const GitOutputTooLargeError& e) {
        LOG_WARNING("DiffServer", e.what());
        return errorResponse(413, e.what());
    } catch (const GitError& e) {
        LOG_WARNING("DiffServer", e.what());
        return errorResponse(404, e.what());
    }
}

std::shared_ptr<SseSession> DiffServer::openSession() {
    auto session = std::make_shared<SseSession>();
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    m_sessions.erase(std::remove_if(m_sessions.begin(), m_sessions.end(),
                                    [](const std::weak_ptr<SseSession>& weak) { return weak.expired(); }),
                     m_sessions.end());
    m_sessions.push_back(session);
    return session;
}

void DiffServer::closeSessions() {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    for (const auto& weak : m_sessions) {
        if (auto session = weak.lock()) {
            session->close();
        }
    }
    m_sessions.clear();
}

void DiffServer::configureRoutes() {
    auto apply = [](const ApiResponse& api, httplib::Response& res) {
        res.status = api.status;
        res.set_header("Cache-Control", "no-cache");
        res.set_content(api.body, api.contentType.c_str());
    };

    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_DEBUG("DiffServer", req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    m_server->Get("/api/diff", [this, apply](const httplib::Request& req, httplib::Response& res) {
        apply(handleDiff(req.get_param_value("base"), req.get_param_value("target"),
                         req.get_param_value("ignoreWhitespace")), res);
    });

    m_server->Get(R"(/api/generated-status/(.+))", [this, apply](const httplib::Request& req, httplib::Response& res) {
        apply(handleGeneratedStatus(req.matches[1], req.get_param_value("ref")), res);
    });

    m_server->Get(R"(/api/blob/(.+))", [this, apply](const httplib::Request& req, httplib::Response& res) {
        apply(handleBlob(req.matches[1], req.get_param_value("ref")), res);
    });

    m_server->Get("/api/watch", [this, apply](const httplib::Request&, httplib::Response& res) {
        if (!m_watcher) {
            apply(errorResponse(404, "File watching is disabled"), res);
            return;
        }

        auto session = openSession();
        m_watcher->addClient(session);

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        ChangeWatcher* watcher = m_watcher;
        res.set_chunked_content_provider(
            "text/event-stream",
            [session](size_t, httplib::DataSink& sink) {
                return session->pump(sink);
            },
            [session, watcher](bool) {
                session->close();
                watcher->removeClient(session);
            });
    });
}

void DiffServer::bind() {
    if (!m_server->bind_to_port(m_options.host.c_str(), m_options.port)) {
        throw ServerError("Failed to bind " + m_options.host + ":" + std::to_string(m_options.port));
    }
    m_bound_port = m_options.port;
}

void DiffServer::listen() {
    LOG_INFO("DiffServer", "Listening on http://" + m_options.host + ":" + std::to_string(m_bound_port));
    if (!m_server->listen_after_bind()) {
        throw ServerError("Server stopped unexpectedly on port " + std::to_string(m_bound_port));
    }
}

void DiffServer::stop() {
    closeSessions();
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

} // namespace DiffLens
