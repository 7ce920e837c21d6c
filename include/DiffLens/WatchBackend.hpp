// =================================================================
// include/DiffLens/WatchBackend.hpp
// =================================================================
// Filesystem event subscriptions delivering batches of changed paths.

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace DiffLens {

/**
 * @brief A watch root could not be subscribed.
 */
class WatchError : public std::runtime_error {
public:
    explicit WatchError(const std::string& message) : std::runtime_error(message) {}
};

/// Receives the absolute paths of one batch of raw events. The root itself
/// appears in a batch when events were lost and anything may have changed.
using WatchCallback = std::function<void(const std::vector<std::string>& paths)>;

/// True for absolute directory paths that should not be watched at all.
using DirectoryFilter = std::function<bool(const std::string& absolute_path)>;

/**
 * @brief Handle to an active subscription.
 */
class WatchSubscription {
public:
    virtual ~WatchSubscription() = default;

    /**
     * @brief Stops event delivery. Safe to call more than once.
     * @throws WatchError if the underlying watch could not be released.
     */
    virtual void unsubscribe() = 0;
};

class WatchBackend {
public:
    virtual ~WatchBackend() = default;

    /**
     * @brief Starts watching a directory tree.
     * @param root Absolute directory to watch recursively
     * @param skip_directory Directories to leave unwatched; may be empty
     * @param callback Invoked from a backend thread for every batch
     * @throws WatchError if the root cannot be watched
     */
    virtual std::unique_ptr<WatchSubscription> subscribe(const std::string& root,
                                                         DirectoryFilter skip_directory,
                                                         WatchCallback callback) = 0;
};

/**
 * @brief Recursive directory watch on one inotify instance.
 *
 * A reader thread blocks on the inotify descriptor and a shutdown pipe.
 * Each read() of the descriptor becomes one callback batch. Directories
 * created after subscription are watched as they appear.
 */
class InotifySubscription : public WatchSubscription {
public:
    InotifySubscription(const std::string& root, DirectoryFilter skip_directory, WatchCallback callback);
    ~InotifySubscription() override;

    InotifySubscription(const InotifySubscription&) = delete;
    InotifySubscription& operator=(const InotifySubscription&) = delete;

    void unsubscribe() override;

    size_t watchCount() const;

private:
    void readLoop();
    void addWatchesRecursive(const std::string& directory);
    bool addWatch(const std::string& directory);
    bool shouldSkip(const std::string& directory) const;
    void closeDescriptors();

    std::string m_root;
    DirectoryFilter m_skip_directory;
    WatchCallback m_callback;

    int m_inotify_fd;
    int m_pipe_fd[2];
    std::thread m_reader;
    std::atomic<bool> m_stopped;

    mutable std::mutex m_mutex;
    std::unordered_map<int, std::string> m_wd_to_path;
};

class InotifyWatchBackend : public WatchBackend {
public:
    std::unique_ptr<WatchSubscription> subscribe(const std::string& root,
                                                 DirectoryFilter skip_directory,
                                                 WatchCallback callback) override;
};

} // namespace DiffLens
