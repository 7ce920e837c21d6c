// =================================================================
// src/DiffLens/ChangeWatcher.cpp
// =================================================================
// Implementation of repository change detection.

#include "DiffLens/ChangeWatcher.hpp"
#include "DiffLens/Logger.hpp"
#include <algorithm>
#include <filesystem>

namespace DiffLens {

namespace {

std::string normalizePath(const std::filesystem::path& path) {
    std::string normal = std::filesystem::absolute(path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

bool isUnder(const std::string& path, const std::string& base) {
    if (path.compare(0, base.size(), base) != 0) {
        return false;
    }
    return path.size() == base.size() || path[base.size()] == '/' || base == "/";
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

bool ChangeWatcher::WatchState::displayPath(const std::string& absolute, std::string& display,
                                            bool& in_git_dir) const {
    // The git directory may live inside the root, so it is checked first.
    if (!gitDir.empty() && isUnder(absolute, gitDir)) {
        in_git_dir = true;
        display = ".git" + absolute.substr(gitDir.size());
        return true;
    }
    if (isUnder(absolute, root)) {
        in_git_dir = false;
        display = absolute.size() > root.size() ? absolute.substr(root.size() + 1) : "";
        return true;
    }
    return false;
}

ChangeWatcher::ChangeWatcher(std::shared_ptr<GitExecutor> git, std::unique_ptr<WatchBackend> backend)
    : m_git(std::move(git)),
      m_backend(std::move(backend))
{
}

ChangeWatcher::~ChangeWatcher() {
    stop();
}

void ChangeWatcher::setExtraIgnores(const std::vector<std::string>& globs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_extra_ignores = globs;
}

void ChangeWatcher::start(DiffMode mode, const std::string& root_path, std::chrono::milliseconds debounce,
                          InvalidateCallback on_invalidate) {
    stop();

    auto state = std::make_shared<WatchState>();
    state->mode = mode;
    state->config = watchConfigFor(mode);
    state->root = normalizePath(root_path);
    state->onInvalidate = std::move(on_invalidate);
    m_broadcaster.setMode(mode);

    if (mode == DiffMode::SPECIFIC) {
        LOG_INFO("ChangeWatcher", "Comparing fixed revisions, file watching disabled");
        return;
    }

    state->gitDir = resolveGitDir(state->root);
    for (const auto& glob : state->config.ignoreGlobs) {
        state->ignore.addPattern(glob);
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& glob : m_extra_ignores) {
            state->ignore.addPattern(glob);
        }
        m_state = state;
        m_timer = std::make_unique<DebounceTimer>(debounce, [this] { onTimerFired(); });
    }

    if (state->config.watchWorkingTree) {
        subscribeRoot(state, state->root, state->config.watchGitDir);
    }
    if (state->config.watchGitDir) {
        subscribeRoot(state, state->gitDir, false);
    }

    LOG_INFO("ChangeWatcher", "Watching in " + toString(mode) + " mode (" +
             std::to_string(subscriptionCount()) + " roots, " +
             std::to_string(debounce.count()) + "ms debounce)");
}

void ChangeWatcher::subscribeRoot(const std::shared_ptr<const WatchState>& state, const std::string& root,
                                  bool skip_git_dir) {
    std::weak_ptr<const WatchState> weak_state = state;
    DirectoryFilter skip = [weak_state, skip_git_dir](const std::string& directory) {
        auto current = weak_state.lock();
        if (!current) {
            return true;
        }
        std::string display;
        bool in_git_dir = false;
        if (!current->displayPath(directory, display, in_git_dir)) {
            return false;
        }
        if (in_git_dir && skip_git_dir) {
            return true;
        }
        return current->ignore.shouldIgnore(display);
    };

    try {
        auto subscription = m_backend->subscribe(
            root, skip, [this](const std::vector<std::string>& paths) { handleEvents(paths); });
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscriptions.push_back(std::move(subscription));
    } catch (const std::exception& e) {
        Logger::getInstance().error("ChangeWatcher", "Failed to watch " + root + ", continuing without it", e.what());
    }
}

std::string ChangeWatcher::resolveGitDir(const std::string& root) const {
    std::filesystem::path fallback = std::filesystem::path(root) / ".git";
    try {
        std::string output = trim(m_git->run({"rev-parse", "--git-dir"}));
        if (output.empty()) {
            return normalizePath(fallback);
        }
        std::filesystem::path git_dir(output);
        if (git_dir.is_relative()) {
            git_dir = std::filesystem::path(root) / git_dir;
        }
        return normalizePath(git_dir);
    } catch (const GitError& e) {
        Logger::getInstance().warning("ChangeWatcher", "Could not resolve git directory, using " + fallback.string(), e.what());
        return normalizePath(fallback);
    }
}

void ChangeWatcher::stop() {
    std::unique_ptr<DebounceTimer> timer;
    std::vector<std::unique_ptr<WatchSubscription>> subscriptions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        timer = std::move(m_timer);
        subscriptions = std::move(m_subscriptions);
        m_subscriptions.clear();
        m_state.reset();
    }

    if (timer) {
        timer->cancel();
    }

    for (auto& subscription : subscriptions) {
        try {
            subscription->unsubscribe();
        } catch (const std::exception& e) {
            Logger::getInstance().warning("ChangeWatcher", "Error unsubscribing from file watcher", e.what());
        }
    }
    subscriptions.clear();

    // Joins the timer thread, waiting out a callback already in flight.
    timer.reset();
    m_broadcaster.clear();
}

void ChangeWatcher::handleEvents(const std::vector<std::string>& paths) {
    std::shared_ptr<const WatchState> state;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        state = m_state;
    }
    if (!state) {
        return;
    }

    bool relevant = std::any_of(paths.begin(), paths.end(),
                                [this, &state](const std::string& path) { return isRelevant(*state, path); });
    if (!relevant) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_timer && m_state == state) {
        m_timer->arm();
    }
}

bool ChangeWatcher::isRelevant(const WatchState& state, const std::string& path) const {
    auto& logger = Logger::getInstance();

    std::string display;
    bool in_git_dir = false;
    if (!state.displayPath(path, display, in_git_dir)) {
        logger.logWatchEvent(state.root, path, "outside watch roots");
        return false;
    }

    // A subscription reports its own root when the kernel queue overflowed.
    if (in_git_dir ? display == ".git" : display.empty()) {
        logger.logWatchEvent(in_git_dir ? state.gitDir : state.root, path, "events lost, reloading");
        return true;
    }

    if (state.ignore.shouldIgnore(display)) {
        logger.logWatchEvent(state.root, display, "ignored by glob");
        return false;
    }

    if (in_git_dir) {
        const auto& files = state.config.relevantGitFiles;
        if (std::find(files.begin(), files.end(), baseName(display)) == files.end()) {
            logger.logWatchEvent(state.gitDir, display, "irrelevant git file");
            return false;
        }
        logger.logWatchEvent(state.gitDir, display, "relevant");
        return true;
    }

    if (!state.config.watchWorkingTree) {
        return false;
    }

    if (isGitIgnored(display)) {
        logger.logWatchEvent(state.root, display, "ignored by .gitignore");
        return false;
    }

    logger.logWatchEvent(state.root, display, "relevant");
    return true;
}

bool ChangeWatcher::isGitIgnored(const std::string& relative_path) const {
    try {
        m_git->run({"check-ignore", "-q", "--", relative_path});
        return true;
    } catch (const GitError&) {
        // git exits non-zero both for "not ignored" and for real failures.
        return false;
    }
}

void ChangeWatcher::onTimerFired() {
    std::shared_ptr<const WatchState> state;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        state = m_state;
    }
    if (!state) {
        return;
    }

    if (state->onInvalidate) {
        try {
            state->onInvalidate();
        } catch (const std::exception& e) {
            Logger::getInstance().error("ChangeWatcher", "Cache invalidation failed", e.what());
        }
    }
    m_broadcaster.broadcastReload();
}

void ChangeWatcher::addClient(std::shared_ptr<ClientSession> session) {
    m_broadcaster.addClient(std::move(session));
}

void ChangeWatcher::removeClient(const std::shared_ptr<ClientSession>& session) {
    m_broadcaster.removeClient(session);
}

bool ChangeWatcher::isWatching() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state != nullptr;
}

DiffMode ChangeWatcher::mode() const {
    return m_broadcaster.mode();
}

size_t ChangeWatcher::subscriptionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscriptions.size();
}

size_t ChangeWatcher::clientCount() const {
    return m_broadcaster.clientCount();
}

std::string ChangeWatcher::gitDir() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state ? m_state->gitDir : std::string();
}

} // namespace DiffLens
