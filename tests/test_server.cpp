#include <catch2/catch.hpp>
#include <meshgate/gateway/server.hpp>
#include "test_helpers.hpp"

#include <vector>

using namespace meshgate;
using meshgate::testing::FakeClock;
using meshgate::testing::FakeConnection;
using meshgate::testing::FakeConnectionPtr;
using meshgate::testing::QuietLogs;

namespace {

struct ServerFixture {
    QuietLogs quiet;
    FakeClock clock;
    GatewayServer server;

    explicit ServerFixture(const GatewayConfig& cfg = GatewayConfig())
        : server(cfg, clock.as_clock()) {}

    // WebSocket-side client
    SessionPtr ws_client(FakeConnectionPtr& conn, const std::string& name) {
        conn = std::make_shared<FakeConnection>();
        SessionPtr session = std::make_shared<Session>(conn);
        server.handle_frame(*session,
            "{\"type\":\"register\",\"payload\":{\"name\":\"" + name + "\"}}");
        REQUIRE(conn->last()["type"] == "ack");
        return session;
    }

    std::string bridge_register(const std::string& name, const std::string& token = "") {
        Json msg = Json::object();
        msg["type"] = "register";
        msg["payload"] = Json::object();
        msg["payload"]["name"] = name;
        if (!token.empty()) msg["payload"]["token"] = token;

        HttpReply reply = server.bridge_send(msg.dump());
        REQUIRE(reply.status == 200);
        REQUIRE(reply.body["type"] == "registered");
        return reply.body["nodeId"].get<std::string>();
    }

    HttpReply bridge_send(const std::string& node_id, Json msg) {
        msg["nodeId"] = node_id;
        return server.bridge_send(msg.dump());
    }

    // Immediate poll; returns the array or null if the poll was parked
    Json poll_now(const std::string& node_id) {
        std::vector<std::string> bodies;
        HttpReply error;
        REQUIRE(server.bridge_poll(node_id, [&bodies](const std::string& body) {
            bodies.push_back(body);
        }, error));
        if (bodies.empty()) {
            // Swap the parked waiter for one that outlives this frame
            server.bridge_poll(node_id, [](const std::string&) {}, error);
            return Json();
        }
        return Json::parse(bodies[0]);
    }
};

Json message_of(const std::string& type) {
    Json m = Json::object();
    m["type"] = type;
    return m;
}

} // namespace

TEST_CASE("server - bridge register", "[server][bridge]") {
    ServerFixture f;
    std::string id = f.bridge_register("poller");

    NodeInfo info;
    REQUIRE(f.server.registry().get_node(id, info));
    REQUIRE(info.transport == "http");
    REQUIRE(f.server.bridge().has_mailbox(id));
}

TEST_CASE("server - bridge register checks auth and capacity", "[server][bridge][auth]") {
    GatewayConfig cfg;
    cfg.require_auth = true;
    cfg.auth_tokens.push_back("a-valid-token-1234");
    cfg.max_nodes = 1;
    ServerFixture f(cfg);

    HttpReply bad = f.server.bridge_send(
        "{\"type\":\"register\",\"payload\":{\"name\":\"x\",\"token\":\"nope\"}}");
    REQUIRE(bad.status == 401);
    REQUIRE(bad.body["code"] == "AUTH_FAILED");
    REQUIRE(f.server.registry().node_count() == 0);

    f.bridge_register("first", "a-valid-token-1234");

    HttpReply full = f.server.bridge_send(
        "{\"type\":\"register\",\"payload\":{\"name\":\"y\",\"token\":\"a-valid-token-1234\"}}");
    REQUIRE(full.status == 503);
    REQUIRE(full.body["code"] == "MAX_NODES_REACHED");
    REQUIRE(f.server.bridge().mailbox_count() == 1);
}

TEST_CASE("server - bridge send rejects bad requests", "[server][bridge]") {
    ServerFixture f;

    SECTION("invalid envelope") {
        HttpReply r = f.server.bridge_send("not json");
        REQUIRE(r.status == 400);
        REQUIRE(r.body.contains("error"));
    }

    SECTION("missing nodeId") {
        HttpReply r = f.server.bridge_send("{\"type\":\"ping\"}");
        REQUIRE(r.status == 400);
    }

    SECTION("unknown node") {
        HttpReply r = f.bridge_send("nobody", message_of("ping"));
        REQUIRE(r.status == 404);
    }

    SECTION("WebSocket node id is not a bridge node") {
        FakeConnectionPtr conn;
        SessionPtr ws = f.ws_client(conn, "ws-node");
        HttpReply r = f.bridge_send(ws->node_id(), message_of("ping"));
        REQUIRE(r.status == 404);
    }
}

TEST_CASE("server - bridge replies land in the mailbox", "[server][bridge]") {
    ServerFixture f;
    std::string id = f.bridge_register("poller");

    HttpReply r = f.bridge_send(id, message_of("ping"));
    REQUIRE(r.status == 200);
    REQUIRE(r.body["success"] == true);

    Json polled = f.poll_now(id);
    REQUIRE(polled.is_array());
    REQUIRE(polled.size() == 1);
    REQUIRE(polled[0]["type"] == "pong");
}

TEST_CASE("server - bridge node receives WebSocket direct and broadcast", "[server][bridge]") {
    ServerFixture f;
    std::string bridge_id = f.bridge_register("poller");

    FakeConnectionPtr conn;
    SessionPtr ws = f.ws_client(conn, "ws-node");
    std::string ws_id = ws->node_id();

    // Bridge node creates the group, WebSocket node joins it
    Json join = message_of("join_group");
    join["payload"] = Json::object();
    join["payload"]["groupName"] = "mixed";
    join["payload"]["createIfNotExists"] = true;
    REQUIRE(f.bridge_send(bridge_id, join).status == 200);
    Json acks = f.poll_now(bridge_id);
    REQUIRE(acks.size() == 1);
    std::string group_id = acks[0]["groupId"].get<std::string>();

    f.server.handle_frame(*ws,
        "{\"type\":\"join_group\",\"payload\":{\"groupId\":\"" + group_id + "\"}}");
    REQUIRE(conn->last()["type"] == "ack");

    f.server.handle_frame(*ws,
        "{\"type\":\"direct\",\"payload\":{\"targetNodeId\":\"" + bridge_id +
        "\",\"message\":{\"text\":\"hello bridge\"}}}");
    f.server.handle_frame(*ws,
        "{\"type\":\"broadcast\",\"payload\":{\"groupId\":\"" + group_id +
        "\",\"message\":{\"text\":\"hello group\"}}}");

    Json inbox = f.poll_now(bridge_id);
    REQUIRE(inbox.size() == 2);
    REQUIRE(inbox[0]["type"] == "direct");
    REQUIRE(inbox[0]["nodeId"] == ws_id);
    REQUIRE(inbox[0]["payload"]["text"] == "hello bridge");
    REQUIRE(inbox[1]["type"] == "broadcast");
    REQUIRE(inbox[1]["payload"]["text"] == "hello group");

    // And the other way round
    conn->clear();
    Json direct = message_of("direct");
    direct["payload"] = Json::object();
    direct["payload"]["targetNodeId"] = ws_id;
    direct["payload"]["message"] = "hi ws";
    REQUIRE(f.bridge_send(bridge_id, direct).status == 200);
    REQUIRE(conn->messages_of("direct").size() == 1);
}

TEST_CASE("server - bridge poll errors", "[server][bridge]") {
    ServerFixture f;
    HttpReply error;
    bool called = false;
    BridgeHub::PollCallback cb = [&called](const std::string&) { called = true; };

    REQUIRE_FALSE(f.server.bridge_poll("", cb, error));
    REQUIRE(error.status == 400);

    REQUIRE_FALSE(f.server.bridge_poll("ghost", cb, error));
    REQUIRE(error.status == 404);
    REQUIRE_FALSE(called);
}

TEST_CASE("server - parked bridge poll", "[server][bridge]") {
    GatewayConfig cfg;
    cfg.poll_timeout_ms = 30000;
    ServerFixture f(cfg);
    std::string id = f.bridge_register("poller");

    std::vector<std::string> bodies;
    HttpReply error;
    BridgeHub::PollCallback cb = [&bodies](const std::string& body) { bodies.push_back(body); };

    SECTION("times out with an empty array") {
        REQUIRE(f.server.bridge_poll(id, cb, error));
        REQUIRE(bodies.empty());
        f.clock.advance(30000);
        f.server.bridge().expire(f.clock.now());
        REQUIRE(bodies.size() == 1);
        REQUIRE(bodies[0] == "[]");
    }

    SECTION("wakes on delivery") {
        REQUIRE(f.server.bridge_poll(id, cb, error));
        FakeConnectionPtr conn;
        SessionPtr ws = f.ws_client(conn, "sender");
        f.server.handle_frame(*ws,
            "{\"type\":\"direct\",\"payload\":{\"targetNodeId\":\"" + id + "\",\"message\":1}}");
        REQUIRE(bodies.size() == 1);
        REQUIRE(Json::parse(bodies[0])[0]["type"] == "direct");
    }

    SECTION("a second poll releases the first") {
        std::vector<std::string> second;
        REQUIRE(f.server.bridge_poll(id, cb, error));
        REQUIRE(f.server.bridge_poll(id, [&second](const std::string& b) { second.push_back(b); }, error));
        REQUIRE(bodies.size() == 1);
        REQUIRE(bodies[0] == "[]");
        REQUIRE(second.empty());
        f.server.bridge().close_mailbox(id);
        REQUIRE(second.size() == 1);
    }
}

TEST_CASE("server - bridge unregister releases the node", "[server][bridge]") {
    ServerFixture f;
    std::string id = f.bridge_register("poller");

    std::vector<std::string> bodies;
    HttpReply error;
    REQUIRE(f.server.bridge_poll(id, [&bodies](const std::string& b) { bodies.push_back(b); }, error));

    REQUIRE(f.bridge_send(id, message_of("unregister")).status == 200);
    REQUIRE_FALSE(f.server.registry().has_node(id));
    REQUIRE_FALSE(f.server.bridge().has_mailbox(id));
    REQUIRE(bodies.size() == 1);
    REQUIRE(bodies[0] == "[]");

    REQUIRE(f.bridge_send(id, message_of("ping")).status == 404);
}

TEST_CASE("server - eviction removes bridge nodes everywhere", "[server][bridge][heartbeat]") {
    ServerFixture f;
    std::string id = f.bridge_register("poller");

    Json join = message_of("join_group");
    join["payload"] = Json::object();
    join["payload"]["groupName"] = "g";
    join["payload"]["createIfNotExists"] = true;
    f.bridge_send(id, join);

    f.clock.advance(61000);
    REQUIRE(f.server.heartbeat().tick() == 1);

    REQUIRE_FALSE(f.server.registry().has_node(id));
    REQUIRE_FALSE(f.server.bridge().has_mailbox(id));
    REQUIRE(f.server.groups().get_node_groups(id).empty());
    REQUIRE(f.bridge_send(id, message_of("ping")).status == 404);
}

TEST_CASE("server - silent WebSocket node disappears from stats", "[server][heartbeat][stats]") {
    ServerFixture f;
    FakeConnectionPtr conn;
    f.ws_client(conn, "alice");
    REQUIRE(f.server.stats()["gateway"]["totalNodes"] == 1);

    f.clock.advance(30000);
    f.server.heartbeat().tick();
    REQUIRE(f.server.stats()["gateway"]["totalNodes"] == 1);

    f.clock.advance(31000);
    f.server.heartbeat().tick();
    REQUIRE(f.server.stats()["gateway"]["totalNodes"] == 0);
    REQUIRE(conn->closed());
}

TEST_CASE("server - WebSocket close unregisters", "[server]") {
    ServerFixture f;
    FakeConnectionPtr conn;
    SessionPtr ws = f.ws_client(conn, "alice");
    std::string id = ws->node_id();

    f.server.handle_close(*ws);
    REQUIRE_FALSE(f.server.registry().has_node(id));
}

TEST_CASE("server - health", "[server][stats]") {
    GatewayConfig cfg;
    cfg.require_auth = true;
    cfg.auth_tokens.push_back("t");
    cfg.discovery.name = "office";
    ServerFixture f(cfg);

    Json health = f.server.health();
    REQUIRE(health["status"] == "healthy");
    REQUIRE(health["service"] == "meshgate");
    REQUIRE(health["name"] == "office");
    REQUIRE(health["version"] == GATEWAY_VERSION);
    REQUIRE(health["requireAuth"] == true);
    REQUIRE(health["timestamp"] == f.clock.now());
    REQUIRE(health["stats"]["totalNodes"] == 0);
}

TEST_CASE("server - stats", "[server][stats]") {
    ServerFixture f;
    FakeConnectionPtr conn;
    SessionPtr ws = f.ws_client(conn, "alice");
    f.server.handle_frame(*ws,
        "{\"type\":\"join_group\",\"payload\":{\"groupName\":\"g\",\"createIfNotExists\":true}}");
    f.bridge_register("poller");

    f.clock.advance(5000);
    Json stats = f.server.stats();

    Json gw = stats["gateway"];
    REQUIRE(gw["uptime"] == 5000);
    REQUIRE(gw["totalNodes"] == 2);
    REQUIRE(gw["totalGroups"] == 1);
    REQUIRE(gw["messagesProcessed"] == 2);
    REQUIRE(gw["version"] == GATEWAY_VERSION);
    REQUIRE(gw["capabilities"].size() == 4);
    REQUIRE(gw["bridge"]["mailboxes"] == 1);

    REQUIRE(stats["nodes"]["nodes"].size() == 2);
    REQUIRE(stats["groups"]["totalGroups"] == 1);
}
