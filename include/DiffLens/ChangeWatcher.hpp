// =================================================================
// include/DiffLens/ChangeWatcher.hpp
// =================================================================
// Watches the repository for changes relevant to the served diff and
// notifies connected clients once per quiet period.

#pragma once

#include "DiffLens/Broadcaster.hpp"
#include "DiffLens/DebounceTimer.hpp"
#include "DiffLens/GitExecutor.hpp"
#include "DiffLens/IgnorePattern.hpp"
#include "DiffLens/WatchBackend.hpp"
#include "DiffLens/WatchMode.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace DiffLens {

/**
 * @brief Idle/Watching state machine over a set of watch subscriptions.
 *
 * Raw event batches are filtered through the mode's ignore globs, the
 * relevant-file list for the git directory and `git check-ignore` for the
 * working tree. A relevant batch arms a debounce timer; when it fires the
 * invalidation callback runs and a reload notification is broadcast.
 */
class ChangeWatcher {
public:
    using InvalidateCallback = std::function<void()>;

    ChangeWatcher(std::shared_ptr<GitExecutor> git, std::unique_ptr<WatchBackend> backend);
    ~ChangeWatcher();

    ChangeWatcher(const ChangeWatcher&) = delete;
    ChangeWatcher& operator=(const ChangeWatcher&) = delete;

    /**
     * @brief Starts watching for the given mode, tearing down any previous watch.
     *
     * A root that cannot be subscribed is logged and skipped. SPECIFIC mode
     * watches nothing.
     *
     * @param mode Diff mode deciding roots, filters and change type
     * @param root_path Working tree root
     * @param debounce Quiet period before an invalidation
     * @param on_invalidate Run on the timer thread before each broadcast
     */
    void start(DiffMode mode, const std::string& root_path, std::chrono::milliseconds debounce,
               InvalidateCallback on_invalidate);

    /**
     * @brief Cancels the pending timer, releases subscriptions and drops all
     * sessions. Safe to call at any time, any number of times.
     */
    void stop();

    void addClient(std::shared_ptr<ClientSession> session);
    void removeClient(const std::shared_ptr<ClientSession>& session);

    /**
     * @brief Globs added to every mode's ignore set on the next start().
     */
    void setExtraIgnores(const std::vector<std::string>& globs);

    /**
     * @brief Filters one batch of absolute paths and arms the timer if any
     * of them is relevant. Called by the watch backend threads.
     */
    void handleEvents(const std::vector<std::string>& paths);

    bool isWatching() const;
    DiffMode mode() const;
    size_t subscriptionCount() const;
    size_t clientCount() const;

    /**
     * @brief Git directory resolved by the last start(), empty when idle.
     */
    std::string gitDir() const;

private:
    /// Everything the event threads need, fixed for one start().
    struct WatchState {
        DiffMode mode;
        ModeWatchConfig config;
        std::string root;
        std::string gitDir;
        IgnorePatternSet ignore;
        InvalidateCallback onInvalidate;

        /// ".git/<rel>" under the git directory, "<rel>" under the root.
        bool displayPath(const std::string& absolute, std::string& display, bool& in_git_dir) const;
    };

    std::string resolveGitDir(const std::string& root) const;
    bool isRelevant(const WatchState& state, const std::string& path) const;
    bool isGitIgnored(const std::string& relative_path) const;
    void subscribeRoot(const std::shared_ptr<const WatchState>& state, const std::string& root,
                       bool skip_git_dir);
    void onTimerFired();

    std::shared_ptr<GitExecutor> m_git;
    std::unique_ptr<WatchBackend> m_backend;
    Broadcaster m_broadcaster;
    std::vector<std::string> m_extra_ignores;

    mutable std::mutex m_mutex;
    std::shared_ptr<const WatchState> m_state;
    std::unique_ptr<DebounceTimer> m_timer;
    std::vector<std::unique_ptr<WatchSubscription>> m_subscriptions;
};

} // namespace DiffLens
