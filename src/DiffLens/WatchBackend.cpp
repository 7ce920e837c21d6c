// =================================================================
// src/DiffLens/WatchBackend.cpp
// =================================================================
// Implementation of the inotify watch backend.

#include "DiffLens/WatchBackend.hpp"
#include "DiffLens/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace DiffLens {

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_ATTRIB |
                                IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_ONLYDIR;
constexpr int kPollTimeoutMs = 250;
constexpr size_t kEventBufferSize = 64 * 1024;

} // namespace

InotifySubscription::InotifySubscription(const std::string& root, DirectoryFilter skip_directory,
                                         WatchCallback callback)
    : m_root(root),
      m_skip_directory(std::move(skip_directory)),
      m_callback(std::move(callback)),
      m_inotify_fd(-1),
      m_pipe_fd{-1, -1},
      m_stopped(false)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(m_root, ec)) {
        throw WatchError("Watch root is not a directory: " + m_root);
    }

    m_inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_inotify_fd < 0) {
        throw WatchError("inotify_init1 failed: " + std::string(std::strerror(errno)));
    }

    if (pipe2(m_pipe_fd, O_NONBLOCK | O_CLOEXEC) != 0) {
        int saved = errno;
        closeDescriptors();
        throw WatchError("pipe2 failed: " + std::string(std::strerror(saved)));
    }

    if (!addWatch(m_root)) {
        int saved = errno;
        closeDescriptors();
        throw WatchError("Failed to watch " + m_root + ": " + std::strerror(saved));
    }
    addWatchesRecursive(m_root);

    m_reader = std::thread(&InotifySubscription::readLoop, this);
    LOG_DEBUG("InotifySubscription", "Watching " + m_root + " (" + std::to_string(watchCount()) + " directories)");
}

InotifySubscription::~InotifySubscription() {
    try {
        unsubscribe();
    } catch (const WatchError& e) {
        LOG_WARNING("InotifySubscription", e.what());
    }
}

void InotifySubscription::unsubscribe() {
    if (m_stopped.exchange(true)) {
        return;
    }

    if (m_pipe_fd[1] >= 0) {
        char wake = 'x';
        // The reader also polls m_stopped, so a failed wake-up only delays shutdown.
        if (write(m_pipe_fd[1], &wake, 1) < 0) {
            LOG_DEBUG("InotifySubscription", "Shutdown pipe write failed: " + std::string(std::strerror(errno)));
        }
    }

    if (m_reader.joinable()) {
        if (m_reader.get_id() == std::this_thread::get_id()) {
            m_reader.detach();
        } else {
            m_reader.join();
        }
    }

    int inotify_fd = m_inotify_fd;
    m_inotify_fd = -1;
    closeDescriptors();
    if (inotify_fd >= 0 && close(inotify_fd) != 0) {
        throw WatchError("Failed to release watch on " + m_root + ": " + std::strerror(errno));
    }
}

size_t InotifySubscription::watchCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_wd_to_path.size();
}

void InotifySubscription::closeDescriptors() {
    if (m_inotify_fd >= 0) {
        close(m_inotify_fd);
        m_inotify_fd = -1;
    }
    for (int& fd : m_pipe_fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

bool InotifySubscription::shouldSkip(const std::string& directory) const {
    return m_skip_directory && directory != m_root && m_skip_directory(directory);
}

bool InotifySubscription::addWatch(const std::string& directory) {
    int wd = inotify_add_watch(m_inotify_fd, directory.c_str(), kWatchMask);
    if (wd < 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_wd_to_path[wd] = directory;
    return true;
}

void InotifySubscription::addWatchesRecursive(const std::string& directory) {
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        directory, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARNING("InotifySubscription", "Cannot scan " + directory + ": " + ec.message());
        return;
    }

    for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARNING("InotifySubscription", "Directory scan stopped under " + directory + ": " + ec.message());
            return;
        }
        std::error_code type_ec;
        if (it->is_symlink(type_ec) || !it->is_directory(type_ec)) {
            continue;
        }

        std::string path = it->path().string();
        if (shouldSkip(path)) {
            it.disable_recursion_pending();
            continue;
        }
        if (!addWatch(path)) {
            LOG_WARNING("InotifySubscription", "Failed to watch " + path + ": " + std::strerror(errno));
            it.disable_recursion_pending();
        }
    }
}

void InotifySubscription::readLoop() {
    alignas(struct inotify_event) char buffer[kEventBufferSize];

    while (!m_stopped.load()) {
        struct pollfd fds[2];
        fds[0].fd = m_inotify_fd;
        fds[0].events = POLLIN;
        fds[1].fd = m_pipe_fd[0];
        fds[1].events = POLLIN;

        int ready = poll(fds, 2, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("InotifySubscription", "poll failed on " + m_root + ": " + std::strerror(errno));
            return;
        }
        if (ready == 0 || (fds[1].revents & POLLIN)) {
            continue;
        }

        ssize_t length = read(m_inotify_fd, buffer, sizeof(buffer));
        if (length <= 0) {
            continue;
        }

        std::vector<std::string> batch;
        std::vector<std::string> new_directories;
        for (char* ptr = buffer; ptr < buffer + length;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                batch.push_back(m_root);
                continue;
            }

            std::string path;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto found = m_wd_to_path.find(event->wd);
                if (found == m_wd_to_path.end()) {
                    continue;
                }
                path = found->second;
                if (event->mask & IN_IGNORED) {
                    m_wd_to_path.erase(found);
                    continue;
                }
            }
            if (event->len > 0) {
                path += "/";
                path += event->name;
            } else if (path == m_root && !(event->mask & IN_DELETE_SELF)) {
                // The bare root is reserved for lost events.
                continue;
            }

            if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO)) && !shouldSkip(path)) {
                new_directories.push_back(path);
            }
            batch.push_back(path);
        }

        for (const auto& directory : new_directories) {
            if (addWatch(directory)) {
                addWatchesRecursive(directory);
            }
        }

        if (!batch.empty() && !m_stopped.load()) {
            try {
                m_callback(batch);
            } catch (const std::exception& e) {
                LOG_ERROR("InotifySubscription", "Event handler failed for " + m_root + ": " + e.what());
            }
        }
    }
}

std::unique_ptr<WatchSubscription> InotifyWatchBackend::subscribe(const std::string& root,
                                                                  DirectoryFilter skip_directory,
                                                                  WatchCallback callback) {
    return std::make_unique<InotifySubscription>(root, std::move(skip_directory), std::move(callback));
}

} // namespace DiffLens
