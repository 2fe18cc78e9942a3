/*
 * meshgate - Gateway Server
 *
 * Owns the shared gateway state and exposes it over HTTP and WebSocket:
 *   /ws            WebSocket transport
 *   /bridge/send   HTTP bridge, one envelope per request
 *   /bridge/poll   HTTP bridge, long-poll for queued envelopes
 *   /health        liveness and summary counters
 *   /stats         full gateway, node and group statistics
 *
 * The transport-independent handlers are public so they can be driven
 * without a listening socket.
 */
#ifndef MESHGATE_GATEWAY_SERVER_HPP
#define MESHGATE_GATEWAY_SERVER_HPP

#include "gateway_config.hpp"
#include "auth.hpp"
#include "node_registry.hpp"
#include "broadcast.hpp"
#include "bridge.hpp"
#include "router.hpp"
#include "heartbeat.hpp"
#include "../discovery/discovery.hpp"
#include "../core/json.hpp"
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>
#include <cstdint>

namespace meshgate {

const char* const GATEWAY_VERSION = "1.0.0";

// Status and JSON body of one HTTP answer
struct HttpReply {
    int status;
    Json body;

    HttpReply() : status(200), body(Json::object()) {}
    HttpReply(int s, const Json& b) : status(s), body(b) {}

    static HttpReply error(int status, const std::string& message) {
        Json body = Json::object();
        body["error"] = message;
        return HttpReply(status, body);
    }
};

// HTTP/WebSocket listener (implementation in .cpp)
class HttpServer;

class GatewayServer {
public:
    typedef std::function<int64_t()> Clock;

    // A null clock means wall-clock milliseconds
    explicit GatewayServer(const GatewayConfig& config, Clock clock = Clock());
    ~GatewayServer();

    // Heartbeat, bridge reaper, discovery, then the listener.
    // False if the listener could not be started.
    bool start();

    // Heartbeat, discovery, pending polls, then the listener
    void stop();

    bool is_running() const { return running_.load(); }

    // ---- WebSocket path ----

    // Inbound frame on a session. Exceptions become INVALID_MESSAGE.
    void handle_frame(Session& session, const std::string& raw);

    // Transport closed
    void handle_close(Session& session);

    // ---- HTTP bridge path ----

    // POST /bridge/send
    HttpReply bridge_send(const std::string& body);

    // GET /bridge/poll. True if `cb` was taken and will fire exactly once;
    // otherwise `error` holds the answer to send.
    bool bridge_poll(const std::string& node_id, BridgeHub::PollCallback cb, HttpReply& error);

    // ---- Housekeeping ----

    Json health() const;
    Json stats() const;

    // Components
    const GatewayConfig& config() const { return config_; }
    AuthGuard& auth() { return auth_; }
    NodeRegistry& registry() { return registry_; }
    GroupManager& groups() { return groups_; }
    BridgeHub& bridge() { return bridge_; }
    MessageRouter& router() { return router_; }
    HeartbeatMonitor& heartbeat() { return heartbeat_; }
    DiscoveryService* discovery() { return discovery_.get(); }

private:
    GatewayServer(const GatewayServer&);
    GatewayServer& operator=(const GatewayServer&);

    // Registry departure hook; runs under the registry lock
    void on_node_departed(const std::string& node_id);

    // Summary counters shared by /health and /stats
    Json gateway_stats() const;

    int64_t now() const;

    void start_discovery();
    void stop_discovery();

    GatewayConfig config_;
    Clock clock_;

    AuthGuard auth_;
    NodeRegistry registry_;
    GroupManager groups_;
    BridgeHub bridge_;
    MessageRouter router_;
    HeartbeatMonitor heartbeat_;
    std::unique_ptr<DiscoveryService> discovery_;

    HttpServer* http_server_;

    std::atomic<bool> running_;
    int64_t started_at_;

    // Sessions of nodes registered through the bridge
    std::map<std::string, SessionPtr> bridge_sessions_;
    std::mutex bridge_mutex_;
};

} // namespace meshgate

#endif // MESHGATE_GATEWAY_SERVER_HPP
