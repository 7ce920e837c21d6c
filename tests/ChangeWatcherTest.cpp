// =================================================================
// tests/ChangeWatcherTest.cpp
// =================================================================
// Unit tests for event filtering, debouncing and the watcher lifecycle,
// using an in-process watch backend and a scripted git.

#include "DiffLens/ChangeWatcher.hpp"
#include "DiffLens/Logger.hpp"
#include <atomic>
#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using DiffLens::DiffMode;

class ScriptedGit : public DiffLens::GitExecutor {
public:
    std::map<std::string, std::string> responses;

    std::string run(const std::vector<std::string>& args) override {
        std::string key;
        for (const auto& arg : args) {
            key += (key.empty() ? "" : " ") + arg;
        }
        auto it = responses.find(key);
        if (it == responses.end()) {
            throw DiffLens::GitError("git " + key + " failed", 1);
        }
        return it->second;
    }

    const std::string& repoPath() const override { return m_repo; }

private:
    std::string m_repo = "/work/repo";
};

class FakeWatchBackend;

class FakeSubscription : public DiffLens::WatchSubscription {
public:
    FakeSubscription(FakeWatchBackend* backend, std::string root) : m_backend(backend), m_root(std::move(root)) {}
    void unsubscribe() override;

private:
    FakeWatchBackend* m_backend;
    std::string m_root;
    bool m_done = false;
};

class FakeWatchBackend : public DiffLens::WatchBackend {
public:
    struct Entry {
        DiffLens::DirectoryFilter filter;
        DiffLens::WatchCallback callback;
    };

    std::map<std::string, Entry> active;
    std::set<std::string> failing_roots;
    bool fail_unsubscribe = false;
    int unsubscribe_calls = 0;

    std::unique_ptr<DiffLens::WatchSubscription> subscribe(const std::string& root,
                                                           DiffLens::DirectoryFilter skip_directory,
                                                           DiffLens::WatchCallback callback) override {
        if (failing_roots.count(root)) {
            throw DiffLens::WatchError("cannot watch " + root);
        }
        active[root] = Entry{std::move(skip_directory), std::move(callback)};
        return std::make_unique<FakeSubscription>(this, root);
    }

    void emit(const std::string& root, const std::vector<std::string>& paths) {
        auto it = active.find(root);
        assert(it != active.end() && "Events can only arrive on subscribed roots");
        auto callback = it->second.callback;
        callback(paths);
    }

    bool skips(const std::string& root, const std::string& directory) {
        return active.at(root).filter(directory);
    }
};

void FakeSubscription::unsubscribe() {
    if (m_done) {
        return;
    }
    m_done = true;
    m_backend->unsubscribe_calls++;
    m_backend->active.erase(m_root);
    if (m_backend->fail_unsubscribe) {
        throw DiffLens::WatchError("release failed for " + m_root);
    }
}

class CountingSession : public DiffLens::ClientSession {
public:
    void send(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_payloads.push_back(payload);
    }

    size_t reloads() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t count = 0;
        for (const auto& payload : m_payloads) {
            if (nlohmann::json::parse(payload)["type"] == "reload") {
                ++count;
            }
        }
        return count;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_payloads;
};

class ChangeWatcherTest {
private:
    const std::string m_root = "/work/repo";
    const std::string m_git_dir = "/work/repo/.git";

    struct Fixture {
        std::shared_ptr<ScriptedGit> git = std::make_shared<ScriptedGit>();
        FakeWatchBackend* backend = nullptr;
        std::unique_ptr<DiffLens::ChangeWatcher> watcher;
        std::shared_ptr<CountingSession> session = std::make_shared<CountingSession>();
        std::shared_ptr<std::atomic<int>> invalidations = std::make_shared<std::atomic<int>>(0);

        Fixture() {
            git->responses["rev-parse --git-dir"] = ".git\n";
            auto fake = std::make_unique<FakeWatchBackend>();
            backend = fake.get();
            watcher = std::make_unique<DiffLens::ChangeWatcher>(git, std::move(fake));
        }

        void start(DiffMode mode, const std::string& root, std::chrono::milliseconds debounce) {
            auto counter = invalidations;
            watcher->start(mode, root, debounce, [counter] { ++*counter; });
            watcher->addClient(session);
        }
    };

public:
    void testBurstProducesOneBroadcast() {
        std::cout << "Testing a burst of events produces one broadcast..." << std::endl;

        Fixture f;
        f.start(DiffMode::DEFAULT, m_root, 100ms);
        for (int i = 0; i < 3; ++i) {
            f.backend->emit(m_git_dir, {m_git_dir + "/HEAD"});
            std::this_thread::sleep_for(20ms);
        }
        std::this_thread::sleep_for(400ms);

        assert(*f.invalidations == 1 && "One invalidation per quiet period");
        assert(f.session->reloads() == 1 && "One reload broadcast per quiet period");

        std::cout << "✓ Burst test passed" << std::endl;
    }

    void testSpacedEventsProduceTwoBroadcasts() {
        std::cout << "Testing spaced events produce separate broadcasts..." << std::endl;

        Fixture f;
        f.start(DiffMode::DEFAULT, m_root, 50ms);
        f.backend->emit(m_git_dir, {m_git_dir + "/HEAD"});
        std::this_thread::sleep_for(300ms);
        f.backend->emit(m_git_dir, {m_git_dir + "/HEAD"});
        std::this_thread::sleep_for(300ms);

        assert(*f.invalidations == 2 && "Two quiet periods, two invalidations");
        assert(f.session->reloads() == 2 && "Two reload broadcasts");

        std::cout << "✓ Spaced events test passed" << std::endl;
    }

    void testObjectsNeverBroadcast() {
        std::cout << "Testing .git/objects events never broadcast..." << std::endl;

        for (DiffMode mode : {DiffMode::DEFAULT, DiffMode::WORKING, DiffMode::STAGED, DiffMode::DOT}) {
            Fixture f;
            f.start(mode, m_root, 30ms);
            f.backend->emit(m_git_dir, {m_git_dir + "/objects/ab/cdef", m_git_dir + "/objects/pack/x.idx"});
            std::this_thread::sleep_for(150ms);
            assert(*f.invalidations == 0 && f.session->reloads() == 0 &&
                   "Object writes are ignored in every mode");
        }

        std::cout << "✓ Objects test passed" << std::endl;
    }

    void testGitFileRelevance() {
        std::cout << "Testing relevant git files per mode..." << std::endl;

        Fixture def;
        def.start(DiffMode::DEFAULT, m_root, 30ms);
        def.backend->emit(m_git_dir, {m_git_dir + "/index", m_git_dir + "/config"});
        std::this_thread::sleep_for(150ms);
        assert(*def.invalidations == 0 && "default mode ignores index changes");

        Fixture staged;
        staged.start(DiffMode::STAGED, m_root, 30ms);
        staged.backend->emit(m_git_dir, {m_git_dir + "/index"});
        std::this_thread::sleep_for(150ms);
        assert(*staged.invalidations == 1 && "staged mode reacts to index changes");

        Fixture dot;
        dot.start(DiffMode::DOT, m_root, 30ms);
        dot.backend->emit(m_git_dir, {m_git_dir + "/logs/HEAD", m_git_dir + "/ORIG_HEAD"});
        std::this_thread::sleep_for(150ms);
        assert(*dot.invalidations == 0 && "dot mode ignores reflog and ORIG_HEAD");

        std::cout << "✓ Git file relevance test passed" << std::endl;
    }

    void testWorkingTreeFilters() {
        std::cout << "Testing working tree filters..." << std::endl;

        Fixture f;
        f.git->responses["check-ignore -q -- build.log"] = "";
        f.watcher->setExtraIgnores({"tmp/**"});
        f.start(DiffMode::WORKING, m_root, 30ms);
        assert(f.watcher->subscriptionCount() == 2 && "working mode watches two roots");

        f.backend->emit(m_root, {m_root + "/build.log", m_root + "/node_modules/pkg/a.js", m_root + "/tmp/x"});
        std::this_thread::sleep_for(150ms);
        assert(*f.invalidations == 0 && "gitignored, glob-ignored and extra-ignored files are dropped");

        f.backend->emit(m_root, {m_root + "/src/main.cpp"});
        std::this_thread::sleep_for(150ms);
        assert(*f.invalidations == 1 && "A failed check-ignore means not ignored");

        std::cout << "✓ Working tree filter test passed" << std::endl;
    }

    void testDirectoryFilter() {
        std::cout << "Testing directories skipped at registration..." << std::endl;

        Fixture f;
        f.start(DiffMode::WORKING, m_root, 30ms);
        assert(f.backend->skips(m_root, m_root + "/node_modules") && "Ignored directories are not watched");
        assert(f.backend->skips(m_root, m_git_dir) && "Git directory is left to its own subscription");
        assert(!f.backend->skips(m_root, m_root + "/src") && "Source directories are watched");
        assert(f.backend->skips(m_git_dir, m_git_dir + "/objects") && "Object store is not watched");
        assert(!f.backend->skips(m_git_dir, m_git_dir + "/logs") && "Other git directories are watched");

        std::cout << "✓ Directory filter test passed" << std::endl;
    }

    void testWorktreeGitDir() {
        std::cout << "Testing git directory resolution..." << std::endl;

        Fixture absolute;
        absolute.git->responses["rev-parse --git-dir"] = "/main/.git/worktrees/wt\n";
        absolute.start(DiffMode::DEFAULT, m_root, 30ms);
        assert(absolute.watcher->gitDir() == "/main/.git/worktrees/wt" && "Absolute git dir is used as is");
        absolute.backend->emit("/main/.git/worktrees/wt", {"/main/.git/worktrees/wt/objects/aa/bb"});
        std::this_thread::sleep_for(100ms);
        assert(*absolute.invalidations == 0 && "Globs apply to the resolved git dir");
        absolute.backend->emit("/main/.git/worktrees/wt", {"/main/.git/worktrees/wt/HEAD"});
        std::this_thread::sleep_for(150ms);
        assert(*absolute.invalidations == 1 && "HEAD of a linked worktree is relevant");

        Fixture relative;
        relative.git->responses["rev-parse --git-dir"] = "../shared/.git\n";
        relative.start(DiffMode::DEFAULT, m_root, 30ms);
        assert(relative.watcher->gitDir() == "/work/shared/.git" && "Relative git dir resolves against the root");

        Fixture fallback;
        fallback.git->responses.clear();
        fallback.start(DiffMode::DEFAULT, m_root, 30ms);
        assert(fallback.watcher->gitDir() == m_git_dir && "Failure falls back to <root>/.git");

        std::cout << "✓ Git directory resolution test passed" << std::endl;
    }

    void testPartialDegradation() {
        std::cout << "Testing partial degradation..." << std::endl;

        Fixture f;
        f.backend->failing_roots.insert(m_git_dir);
        f.start(DiffMode::WORKING, m_root, 30ms);
        assert(f.watcher->isWatching() && "Watcher still runs");
        assert(f.watcher->subscriptionCount() == 1 && "Remaining root is still watched");

        f.backend->emit(m_root, {m_root + "/README.md"});
        std::this_thread::sleep_for(150ms);
        assert(*f.invalidations == 1 && "Events on the remaining root still work");

        std::cout << "✓ Partial degradation test passed" << std::endl;
    }

    void testStopLifecycle() {
        std::cout << "Testing stop and restart..." << std::endl;

        Fixture f;
        f.start(DiffMode::DEFAULT, m_root, 100ms);
        f.backend->emit(m_git_dir, {m_git_dir + "/HEAD"});
        f.backend->fail_unsubscribe = true;
        f.watcher->stop();
        std::this_thread::sleep_for(250ms);
        assert(*f.invalidations == 0 && "stop cancels a pending invalidation");
        assert(!f.watcher->isWatching() && "Watcher is idle after stop");
        assert(f.watcher->clientCount() == 0 && "stop drops all sessions");
        assert(f.backend->active.empty() && "Subscriptions are released despite errors");

        f.watcher->stop();
        assert(f.backend->unsubscribe_calls == 1 && "Second stop is a no-op");

        f.backend->fail_unsubscribe = false;
        f.start(DiffMode::WORKING, m_root, 30ms);
        f.start(DiffMode::STAGED, m_root, 30ms);
        assert(f.watcher->subscriptionCount() == 1 && "Restart replaces the previous subscriptions");
        assert(f.backend->unsubscribe_calls == 3 && "Restart released both earlier roots");
        assert(f.watcher->mode() == DiffMode::STAGED && "Mode follows the latest start");

        std::cout << "✓ Stop lifecycle test passed" << std::endl;
    }

    void testLostEventsReload() {
        std::cout << "Testing reload after lost events..." << std::endl;

        for (DiffMode mode : {DiffMode::DEFAULT, DiffMode::STAGED}) {
            Fixture f;
            f.start(mode, m_root, 30ms);
            f.backend->emit(m_git_dir, {m_git_dir});
            std::this_thread::sleep_for(200ms);
            assert(*f.invalidations == 1 && "Overflow on the git directory forces one reload");
            assert(f.session->reloads() == 1 && "Clients are told to reload");
        }

        Fixture working;
        working.start(DiffMode::WORKING, m_root, 30ms);
        working.backend->emit(m_root, {m_root});
        std::this_thread::sleep_for(200ms);
        assert(*working.invalidations == 1 && "Overflow on the working tree forces one reload");

        std::cout << "✓ Lost events test passed" << std::endl;
    }

    void testSpecificModeWatchesNothing() {
        std::cout << "Testing specific mode..." << std::endl;

        Fixture f;
        f.start(DiffMode::SPECIFIC, m_root, 30ms);
        assert(!f.watcher->isWatching() && "Nothing to watch for fixed revisions");
        assert(f.watcher->subscriptionCount() == 0 && "No subscriptions created");
        assert(f.watcher->clientCount() == 1 && "Clients can still connect");

        std::cout << "✓ Specific mode test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ChangeWatcher unit tests..." << std::endl;

        testBurstProducesOneBroadcast();
        testSpacedEventsProduceTwoBroadcasts();
        testObjectsNeverBroadcast();
        testGitFileRelevance();
        testWorkingTreeFilters();
        testDirectoryFilter();
        testWorktreeGitDir();
        testPartialDegradation();
        testStopLifecycle();
        testLostEventsReload();
        testSpecificModeWatchesNothing();

        std::cout << "All ChangeWatcher tests passed!" << std::endl;
    }
};

int main() {
    DiffLens::Logger::getInstance().setFileLogging(false);
    try {
        ChangeWatcherTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
