// =================================================================
// tests/WatchBackendTest.cpp
// =================================================================
// Tests the inotify backend against a scratch directory.

#include "DiffLens/Logger.hpp"
#include "DiffLens/WatchBackend.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class EventLog {
public:
    void record(const std::vector<std::string>& paths) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_paths.insert(m_paths.end(), paths.begin(), paths.end());
    }

    bool contains(const std::string& path) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::find(m_paths.begin(), m_paths.end(), path) != m_paths.end();
    }

    bool waitFor(const std::string& path, std::chrono::milliseconds timeout = 3000ms) const {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (contains(path)) {
                return true;
            }
            std::this_thread::sleep_for(20ms);
        }
        return contains(path);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_paths.size();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_paths;
};

class WatchBackendTest {
private:
    fs::path m_root;

    void touch(const fs::path& path, const std::string& content = "x\n") {
        std::ofstream file(path);
        file << content;
    }

    DiffLens::DirectoryFilter skipNamed(const std::string& name) {
        return [name](const std::string& directory) { return fs::path(directory).filename() == name; };
    }

public:
    WatchBackendTest() {
        std::string pattern = (fs::temp_directory_path() / "difflens-watch-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!mkdtemp(buffer.data())) {
            throw std::runtime_error("Could not create scratch directory");
        }
        m_root = fs::path(buffer.data());
        fs::create_directories(m_root / "src" / "deep");
        fs::create_directories(m_root / "skipped" / "inner");
    }

    ~WatchBackendTest() {
        std::error_code ec;
        fs::remove_all(m_root, ec);
    }

    void testInitialWatches() {
        std::cout << "Testing initial directory registration..." << std::endl;

        EventLog log;
        DiffLens::InotifySubscription subscription(
            m_root.string(), skipNamed("skipped"),
            [&log](const std::vector<std::string>& paths) { log.record(paths); });

        assert(subscription.watchCount() == 3 && "Root, src and src/deep are watched; skipped subtree is not");
        subscription.unsubscribe();

        std::cout << "✓ Initial registration test passed" << std::endl;
    }

    void testEventsDelivered() {
        std::cout << "Testing event delivery..." << std::endl;

        EventLog log;
        DiffLens::InotifyWatchBackend backend;
        auto subscription = backend.subscribe(
            m_root.string(), skipNamed("skipped"),
            [&log](const std::vector<std::string>& paths) { log.record(paths); });

        fs::path nested = m_root / "src" / "deep" / "file.txt";
        touch(nested);
        assert(log.waitFor(nested.string()) && "Change in a nested directory is reported with its absolute path");

        touch(m_root / "skipped" / "inner" / "hidden.txt");
        std::this_thread::sleep_for(400ms);
        assert(!log.contains((m_root / "skipped" / "inner" / "hidden.txt").string()) &&
               "Skipped directories produce no events");

        subscription->unsubscribe();
        std::cout << "✓ Event delivery test passed" << std::endl;
    }

    void testNewDirectoriesWatched() {
        std::cout << "Testing directories created after subscribing..." << std::endl;

        EventLog log;
        DiffLens::InotifyWatchBackend backend;
        auto subscription = backend.subscribe(
            m_root.string(), nullptr,
            [&log](const std::vector<std::string>& paths) { log.record(paths); });

        fs::path fresh = m_root / "fresh";
        fs::create_directory(fresh);
        assert(log.waitFor(fresh.string()) && "Directory creation is reported");

        // Give the reader a moment to register the new directory.
        std::this_thread::sleep_for(200ms);
        fs::path inside = fresh / "a.txt";
        touch(inside);
        assert(log.waitFor(inside.string()) && "Files in a new directory are reported");

        subscription->unsubscribe();
        std::cout << "✓ New directory test passed" << std::endl;
    }

    void testUnsubscribeStopsDelivery() {
        std::cout << "Testing unsubscribe..." << std::endl;

        EventLog log;
        DiffLens::InotifyWatchBackend backend;
        auto subscription = backend.subscribe(
            m_root.string(), nullptr,
            [&log](const std::vector<std::string>& paths) { log.record(paths); });

        subscription->unsubscribe();
        subscription->unsubscribe();

        size_t before = log.size();
        touch(m_root / "after.txt");
        std::this_thread::sleep_for(400ms);
        assert(log.size() == before && "No events after unsubscribe");

        std::cout << "✓ Unsubscribe test passed" << std::endl;
    }

    void testMissingRoot() {
        std::cout << "Testing a missing root..." << std::endl;

        DiffLens::InotifyWatchBackend backend;
        bool threw = false;
        try {
            backend.subscribe((m_root / "does-not-exist").string(), nullptr,
                              [](const std::vector<std::string>&) {});
        } catch (const DiffLens::WatchError&) {
            threw = true;
        }
        assert(threw && "Subscribing to a missing directory fails");

        std::cout << "✓ Missing root test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running WatchBackend tests in " << m_root << "..." << std::endl;

        testInitialWatches();
        testEventsDelivered();
        testNewDirectoriesWatched();
        testUnsubscribeStopsDelivery();
        testMissingRoot();

        std::cout << "All WatchBackend tests passed!" << std::endl;
    }
};

int main() {
    DiffLens::Logger::getInstance().setFileLogging(false);
    try {
        WatchBackendTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
