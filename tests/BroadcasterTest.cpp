// =================================================================
// tests/BroadcasterTest.cpp
// =================================================================
// Unit tests for notification payloads and session fan-out.

#include "DiffLens/Broadcaster.hpp"
#include "DiffLens/Logger.hpp"
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Records payloads; can be told to fail every send.
class RecordingSession : public DiffLens::ClientSession {
public:
    std::vector<std::string> payloads;
    bool fail = false;

    void send(const std::string& payload) override {
        if (fail) {
            throw DiffLens::SessionClosedError("client went away");
        }
        payloads.push_back(payload);
    }
};

class BroadcasterTest {
public:
    void testConnectedNotification() {
        std::cout << "Testing connected notification..." << std::endl;

        DiffLens::Broadcaster broadcaster;
        broadcaster.setMode(DiffLens::DiffMode::WORKING);

        auto session = std::make_shared<RecordingSession>();
        broadcaster.addClient(session);

        assert(broadcaster.clientCount() == 1 && "Client should be registered");
        assert(session->payloads.size() == 1 && "Connected event is sent immediately");

        auto json = nlohmann::json::parse(session->payloads[0]);
        assert(json["type"] == "connected" && "Type is connected");
        assert(json["mode"] == "working" && "Mode is reported");
        assert(json["changeType"] == "file" && "Connected events report file");
        assert(json["message"] == "Connected to file watcher (working mode)" && "Message names the mode");
        std::string timestamp = json["timestamp"];
        assert(timestamp.size() == 24 && timestamp.back() == 'Z' && timestamp[10] == 'T' &&
               "Timestamp is ISO-8601 UTC with milliseconds");

        std::cout << "✓ Connected notification test passed" << std::endl;
    }

    void testReloadChangeTypes() {
        std::cout << "Testing reload change types per mode..." << std::endl;

        DiffLens::Broadcaster broadcaster;
        broadcaster.setMode(DiffLens::DiffMode::STAGED);
        auto staged = broadcaster.makeReload();
        assert(staged.changeType == DiffLens::ChangeType::STAGING && "staged reloads are staging");
        assert(staged.message == "Changes detected in staged mode" && "Reload message names the mode");

        broadcaster.setMode(DiffLens::DiffMode::DOT);
        assert(broadcaster.makeReload().changeType == DiffLens::ChangeType::COMMIT && "dot reloads are commit");

        broadcaster.setMode(DiffLens::DiffMode::WORKING);
        assert(broadcaster.makeReload().changeType == DiffLens::ChangeType::FILE && "working reloads are file");

        std::cout << "✓ Reload change type test passed" << std::endl;
    }

    void testFailureIsolation() {
        std::cout << "Testing failure isolation..." << std::endl;

        DiffLens::Broadcaster broadcaster;
        auto good_a = std::make_shared<RecordingSession>();
        auto bad = std::make_shared<RecordingSession>();
        auto good_b = std::make_shared<RecordingSession>();
        broadcaster.addClient(good_a);
        broadcaster.addClient(bad);
        broadcaster.addClient(good_b);
        bad->fail = true;

        size_t delivered = broadcaster.broadcastReload();
        assert(delivered == 2 && "Healthy sessions still receive the event");
        assert(good_a->payloads.size() == 2 && good_b->payloads.size() == 2 && "Both got connected and reload");
        assert(broadcaster.clientCount() == 2 && "Only the failed session is removed");

        auto json = nlohmann::json::parse(good_b->payloads[1]);
        assert(json["type"] == "reload" && "Second payload is a reload");

        std::cout << "✓ Failure isolation test passed" << std::endl;
    }

    void testFailingOnConnect() {
        std::cout << "Testing a session failing on connect..." << std::endl;

        DiffLens::Broadcaster broadcaster;
        auto bad = std::make_shared<RecordingSession>();
        bad->fail = true;
        broadcaster.addClient(bad);
        assert(broadcaster.clientCount() == 0 && "A session that cannot take the connected event is dropped");

        std::cout << "✓ Failing connect test passed" << std::endl;
    }

    void testRemoveAndClear() {
        std::cout << "Testing remove and clear..." << std::endl;

        DiffLens::Broadcaster broadcaster;
        auto a = std::make_shared<RecordingSession>();
        auto b = std::make_shared<RecordingSession>();
        broadcaster.addClient(a);
        broadcaster.addClient(b);

        broadcaster.removeClient(a);
        assert(broadcaster.clientCount() == 1 && "Removed client is gone");
        broadcaster.removeClient(a);
        assert(broadcaster.clientCount() == 1 && "Removing twice is harmless");

        broadcaster.clear();
        assert(broadcaster.clientCount() == 0 && "clear drops all sessions");
        assert(broadcaster.broadcastReload() == 0 && "Broadcasting to nobody is a no-op");

        std::cout << "✓ Remove and clear test passed" << std::endl;
    }

    void testTimestampFormat() {
        std::cout << "Testing timestamp formatting..." << std::endl;

        auto epoch = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
        assert(DiffLens::formatTimestamp(epoch) == "2023-11-14T22:13:20.123Z" && "Known instant formats exactly");

        std::cout << "✓ Timestamp format test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Broadcaster unit tests..." << std::endl;

        testConnectedNotification();
        testReloadChangeTypes();
        testFailureIsolation();
        testFailingOnConnect();
        testRemoveAndClear();
        testTimestampFormat();

        std::cout << "All Broadcaster tests passed!" << std::endl;
    }
};

int main() {
    DiffLens::Logger::getInstance().setFileLogging(false);
    try {
        BroadcasterTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
