#include <catch2/catch.hpp>
#include <meshgate/gateway/bridge.hpp>
#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace meshgate;
using meshgate::testing::FakeClock;
using meshgate::testing::QuietLogs;

namespace {

// Collects every body a poll callback receives
struct PollRecorder {
    std::vector<std::string> bodies;

    BridgeHub::PollCallback callback() {
        return [this](const std::string& body) { bodies.push_back(body); };
    }

    Json last() const { return Json::parse(bodies.back()); }
};

BridgeHub::Config small_config() {
    BridgeHub::Config cfg;
    cfg.poll_timeout_ms = 30000;
    cfg.max_queue = 3;
    cfg.reap_interval_ms = 10;
    return cfg;
}

} // namespace

TEST_CASE("bridge - poll on an unknown node is refused", "[bridge]") {
    QuietLogs quiet;
    BridgeHub hub(small_config());
    PollRecorder rec;
    REQUIRE_FALSE(hub.poll("ghost", rec.callback()));
    REQUIRE(rec.bodies.empty());
    REQUIRE_FALSE(hub.enqueue("ghost", "{}"));
}

TEST_CASE("bridge - queued messages are returned at once and cleared", "[bridge]") {
    QuietLogs quiet;
    BridgeHub hub(small_config());
    hub.open_mailbox("n1");
    REQUIRE(hub.enqueue("n1", "{\"type\":\"pong\"}"));
    REQUIRE(hub.enqueue("n1", "{\"type\":\"ack\"}"));

    PollRecorder rec;
    REQUIRE(hub.poll("n1", rec.callback()));
    REQUIRE(rec.bodies.size() == 1);
    Json arr = rec.last();
    REQUIRE(arr.size() == 2);
    REQUIRE(arr[0]["type"] == "pong");
    REQUIRE(arr[1]["type"] == "ack");
    REQUIRE(hub.queued_count("n1") == 0);
    REQUIRE(hub.waiter_count() == 0);
}

TEST_CASE("bridge - parked poll wakes on enqueue", "[bridge]") {
    QuietLogs quiet;
    BridgeHub hub(small_config());
    hub.open_mailbox("n1");

    PollRecorder rec;
    REQUIRE(hub.poll("n1", rec.callback()));
    REQUIRE(rec.bodies.empty());
    REQUIRE(hub.waiter_count() == 1);

    hub.enqueue("n1", "{\"type\":\"direct\"}");
    REQUIRE(rec.bodies.size() == 1);
    REQUIRE(rec.last()[0]["type"] == "direct");
    REQUIRE(hub.waiter_count() == 0);
    REQUIRE(hub.queued_count("n1") == 0);
}

TEST_CASE("bridge - parked poll times out with an empty array", "[bridge]") {
    QuietLogs quiet;
    FakeClock clock;
    BridgeHub hub(small_config(), clock.as_clock());
    hub.open_mailbox("n1");

    PollRecorder rec;
    hub.poll("n1", rec.callback());

    clock.advance(29999);
    REQUIRE(hub.expire(clock.now()) == 0);
    REQUIRE(rec.bodies.empty());

    clock.advance(1);
    REQUIRE(hub.expire(clock.now()) == 1);
    REQUIRE(rec.bodies.size() == 1);
    REQUIRE(rec.bodies[0] == "[]");

    // Resolved exactly once
    REQUIRE(hub.expire(clock.now() + 100000) == 0);
    hub.enqueue("n1", "{}");
    REQUIRE(rec.bodies.size() == 1);
}

TEST_CASE("bridge - a second poll releases the first", "[bridge]") {
    QuietLogs quiet;
    BridgeHub hub(small_config());
    hub.open_mailbox("n1");

    PollRecorder first;
    PollRecorder second;
    hub.poll("n1", first.callback());
    hub.poll("n1", second.callback());

    REQUIRE(first.bodies.size() == 1);
    REQUIRE(first.bodies[0] == "[]");
    REQUIRE(second.bodies.empty());
    REQUIRE(hub.waiter_count() == 1);

    hub.enqueue("n1", "{\"type\":\"ack\"}");
    REQUIRE(first.bodies.size() == 1);
    REQUIRE(second.bodies.size() == 1);
    REQUIRE(second.last()[0]["type"] == "ack");
}

TEST_CASE("bridge - mailbox drops the oldest on overflow", "[bridge]") {
    QuietLogs quiet;
    BridgeHub hub(small_config());
    hub.open_mailbox("n1");
    for (int i = 0; i < 5; ++i) {
        hub.enqueue("n1", std::to_string(i));
    }
    REQUIRE(hub.queued_count("n1") == 3);
    REQUIRE(hub.get_stats()["droppedMessages"] == 2);

    PollRecorder rec;
    hub.poll("n1", rec.callback());
    REQUIRE(rec.bodies[0] == "[2,3,4]");
}

TEST_CASE("bridge - closing a mailbox releases its poll", "[bridge]") {
    QuietLogs quiet;
    BridgeHub hub(small_config());
    hub.open_mailbox("n1");

    PollRecorder rec;
    hub.poll("n1", rec.callback());
    hub.close_mailbox("n1");

    REQUIRE(rec.bodies.size() == 1);
    REQUIRE(rec.bodies[0] == "[]");
    REQUIRE_FALSE(hub.has_mailbox("n1"));
    REQUIRE(hub.mailbox_count() == 0);
}

TEST_CASE("bridge - stop releases every parked poll", "[bridge]") {
    QuietLogs quiet;
    BridgeHub hub(small_config());
    hub.start();
    hub.open_mailbox("a");
    hub.open_mailbox("b");

    PollRecorder ra;
    PollRecorder rb;
    hub.poll("a", ra.callback());
    hub.poll("b", rb.callback());
    REQUIRE(hub.waiter_count() == 2);

    hub.stop();
    REQUIRE(ra.bodies.size() == 1);
    REQUIRE(rb.bodies.size() == 1);
    REQUIRE(ra.bodies[0] == "[]");
    REQUIRE(hub.waiter_count() == 0);
}

TEST_CASE("bridge - polls after stop are answered at once", "[bridge]") {
    QuietLogs quiet;
    BridgeHub hub(small_config());
    hub.start();
    hub.open_mailbox("n1");
    hub.stop();

    PollRecorder rec;
    REQUIRE(hub.poll("n1", rec.callback()));
    REQUIRE(rec.bodies.size() == 1);
    REQUIRE(rec.bodies[0] == "[]");
    REQUIRE(hub.waiter_count() == 0);

    // Queued messages are still handed over
    REQUIRE(hub.enqueue("n1", "{\"type\":\"pong\"}"));
    REQUIRE(hub.poll("n1", rec.callback()));
    REQUIRE(rec.bodies.size() == 2);
    REQUIRE(rec.last().size() == 1);

    // A restart parks again
    hub.start();
    REQUIRE(hub.poll("n1", rec.callback()));
    REQUIRE(hub.waiter_count() == 1);
    hub.stop();
    REQUIRE(rec.bodies.size() == 3);
}

TEST_CASE("bridge - reaper thread expires polls", "[bridge]") {
    QuietLogs quiet;
    FakeClock clock;
    BridgeHub hub(small_config(), clock.as_clock());
    hub.start();
    hub.open_mailbox("n1");

    std::atomic<int> calls(0);
    hub.poll("n1", [&calls](const std::string&) { calls.fetch_add(1); });
    clock.advance(30000);

    for (int i = 0; i < 200 && calls.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    hub.stop();
    REQUIRE(calls.load() == 1);
}

TEST_CASE("bridge - connection sends into its mailbox", "[bridge]") {
    QuietLogs quiet;
    BridgeHub hub(small_config());
    std::shared_ptr<BridgeConnection> conn = std::make_shared<BridgeConnection>(hub);

    REQUIRE_FALSE(conn->send("{}"));
    REQUIRE(std::string(conn->transport()) == "http");

    conn->bind("n1");
    REQUIRE(conn->node_id() == "n1");
    REQUIRE(hub.has_mailbox("n1"));
    REQUIRE(conn->send("{\"type\":\"pong\"}"));
    REQUIRE(hub.queued_count("n1") == 1);

    conn->close();
    REQUIRE_FALSE(hub.has_mailbox("n1"));
    REQUIRE_FALSE(conn->send("{}"));
    conn->close();
}
