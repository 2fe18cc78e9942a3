/*
 * meshgate - Gateway Server Implementation
 *
 * Uses Crow (https://crowcpp.org) for HTTP and WebSocket functionality.
 */

#include <meshgate/gateway/server.hpp>
#include <meshgate/gateway/validation.hpp>
#include <meshgate/gateway/message.hpp>
#include <meshgate/core/logger.hpp>
#include <meshgate/core/utils.hpp>

#include <crow.h>

#include <sstream>
#include <thread>
#include <atomic>
#include <mutex>
#include <unordered_map>

namespace meshgate {

// ============================================================================
// WebSocket Connection
// ============================================================================

class WsConnection : public Connection {
public:
    explicit WsConnection(crow::websocket::connection* conn)
        : conn_(conn)
        , closed_(false) {}

    virtual bool send(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !conn_) return false;

        try {
            conn_->send_text(text);
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR("[Gateway] WebSocket send failed: %s", e.what());
            return false;
        }
    }

    virtual void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        if (conn_) {
            conn_->close("closed by gateway");
        }
    }

    virtual const char* transport() const { return "ws"; }

    // Crow has torn the socket down; never touch conn_ again
    void mark_closed() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        conn_ = nullptr;
    }

private:
    crow::websocket::connection* conn_;
    bool closed_;
    std::mutex mutex_;
};

// ============================================================================
// HTTP / WebSocket Listener (using Crow)
// ============================================================================

static crow::LogLevel crow_log_level(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:  return crow::LogLevel::Debug;
        case LogLevel::INFO:   return crow::LogLevel::Warning;   // Crow logs every request at Info
        case LogLevel::WARN:   return crow::LogLevel::Warning;
        case LogLevel::ERROR:  return crow::LogLevel::Error;
        default:               return crow::LogLevel::Critical;
    }
}

static crow::response json_response(int status, const Json& body) {
    crow::response res(status, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

class HttpServer {
public:
    explicit HttpServer(GatewayServer* gateway)
        : gateway_(gateway)
        , running_(false)
        , app_() {}

    ~HttpServer() {
        stop();
    }

    bool start(const std::string& bind_host, int port) {
        app_.loglevel(crow_log_level(Logger::instance().level()));
        setup_routes();

        running_ = true;
        server_thread_ = std::thread([this, bind_host, port]() {
            try {
                app_.bindaddr(bind_host).port(static_cast<uint16_t>(port)).multithreaded().run();
            } catch (const std::exception& e) {
                LOG_ERROR("[Gateway] server error: %s", e.what());
            }
            running_ = false;
        });

        // Wait a bit for server to start
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (!running_) {
            LOG_ERROR("[Gateway] could not listen on %s:%d", bind_host.c_str(), port);
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            return false;
        }
        return true;
    }

    void stop() {
        if (server_thread_.joinable()) {
            running_ = false;
            app_.stop();
            server_thread_.join();
        }

        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.clear();
    }

private:
    struct WsClient {
        std::shared_ptr<WsConnection> conn;
        SessionPtr session;
    };

    void setup_routes() {
        CROW_ROUTE(app_, "/health")
        ([this]() {
            return json_response(200, gateway_->health());
        });

        CROW_ROUTE(app_, "/stats")
        ([this]() {
            return json_response(200, gateway_->stats());
        });

        CROW_ROUTE(app_, "/bridge/send").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            HttpReply reply = gateway_->bridge_send(req.body);
            return json_response(reply.status, reply.body);
        });

        // Completed later from the bridge hub; no worker is held while parked
        CROW_ROUTE(app_, "/bridge/poll").methods(crow::HTTPMethod::Get)
        ([this](const crow::request& req, crow::response& res) {
            std::string node_id = req.get_header_value("X-Node-ID");
            crow::response* out = &res;

            HttpReply error;
            bool parked = gateway_->bridge_poll(node_id, [out](const std::string& body) {
                if (out->is_alive()) {
                    out->set_header("Content-Type", "application/json");
                    out->body = body;
                }
                out->end();
            }, error);

            if (!parked) {
                res.code = error.status;
                res.set_header("Content-Type", "application/json");
                res.body = error.body.dump();
                res.end();
            }
        });

        CROW_WEBSOCKET_ROUTE(app_, "/ws")
            .onopen([this](crow::websocket::connection& conn) {
                on_ws_open(conn);
            })
            .onclose([this](crow::websocket::connection& conn, const std::string& reason) {
                on_ws_close(conn, reason);
            })
            .onmessage([this](crow::websocket::connection& conn, const std::string& data, bool is_binary) {
                on_ws_message(conn, data, is_binary);
            });

        CROW_CATCHALL_ROUTE(app_)
        ([]() {
            return json_response(404, HttpReply::error(404, "Not found").body);
        });
    }

    void on_ws_open(crow::websocket::connection& conn) {
        WsClient client;
        client.conn = std::make_shared<WsConnection>(&conn);
        client.session = std::make_shared<Session>(client.conn);

        size_t total = 0;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_[&conn] = client;
            total = connections_.size();
        }

        LOG_DEBUG("[Gateway] WebSocket client connected from %s (open: %zu)",
                  conn.get_remote_ip().c_str(), total);
    }

    void on_ws_close(crow::websocket::connection& conn, const std::string& reason) {
        WsClient client;
        bool found = false;

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            std::unordered_map<crow::websocket::connection*, WsClient>::iterator it = connections_.find(&conn);
            if (it != connections_.end()) {
                client = it->second;
                connections_.erase(it);
                found = true;
            }
        }

        if (found) {
            LOG_DEBUG("[Gateway] WebSocket client disconnected (reason: %s)", reason.c_str());
            client.conn->mark_closed();
            gateway_->handle_close(*client.session);
        }
    }

    void on_ws_message(crow::websocket::connection& conn, const std::string& data, bool /* is_binary */) {
        SessionPtr session;

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            std::unordered_map<crow::websocket::connection*, WsClient>::iterator it = connections_.find(&conn);
            if (it != connections_.end()) {
                session = it->second.session;
            }
        }

        if (session) {
            gateway_->handle_frame(*session, data);
        }
    }

    GatewayServer* gateway_;
    std::atomic<bool> running_;
    crow::SimpleApp app_;
    std::thread server_thread_;

    // Track WebSocket connections
    std::mutex connections_mutex_;
    std::unordered_map<crow::websocket::connection*, WsClient> connections_;
};

// ============================================================================
// GatewayServer
// ============================================================================

static HeartbeatMonitor::Config heartbeat_config(const GatewayConfig& cfg) {
    HeartbeatMonitor::Config hc;
    hc.ping_interval_ms = cfg.ping_interval_ms;
    hc.ping_timeout_ms = cfg.ping_timeout_ms;
    return hc;
}

static BridgeHub::Config bridge_config(const GatewayConfig& cfg) {
    BridgeHub::Config bc;
    bc.poll_timeout_ms = cfg.poll_timeout_ms;
    bc.max_queue = cfg.max_queue;
    return bc;
}

GatewayServer::GatewayServer(const GatewayConfig& config, Clock clock)
    : config_(config)
    , clock_(clock)
    , auth_(config.require_auth, config.auth_tokens)
    , registry_(config.max_nodes, config.rate_limit_messages, config.rate_limit_window_ms, clock)
    , groups_()
    , bridge_(bridge_config(config), clock)
    , router_(registry_, groups_, auth_)
    , heartbeat_(registry_, heartbeat_config(config))
    , http_server_(nullptr)
    , running_(false)
    , started_at_(0) {
    started_at_ = now();
    registry_.set_departure_hook([this](const std::string& node_id) {
        on_node_departed(node_id);
    });
}

GatewayServer::~GatewayServer() {
    stop();
    if (http_server_) {
        delete http_server_;
        http_server_ = nullptr;
    }
}

bool GatewayServer::start() {
    if (running_) {
        LOG_WARN("[Gateway] already running");
        return true;
    }

    started_at_ = now();

    heartbeat_.start();
    bridge_.start();

    if (!http_server_) {
        http_server_ = new HttpServer(this);
    }
    if (!http_server_->start(config_.host, config_.port)) {
        heartbeat_.stop();
        bridge_.stop();
        delete http_server_;
        http_server_ = nullptr;
        return false;
    }

    running_ = true;
    start_discovery();

    LOG_INFO("[Gateway] listening on http://%s:%d (WebSocket on /ws, bridge on /bridge/*)",
             config_.host.c_str(), config_.port);
    LOG_INFO("[Gateway] auth %s, max nodes %zu, ping %lld/%lld ms",
             auth_.is_auth_required() ? "required" : "disabled",
             registry_.max_nodes(),
             static_cast<long long>(config_.ping_interval_ms),
             static_cast<long long>(config_.ping_timeout_ms));
    return true;
}

void GatewayServer::stop() {
    if (!running_) return;

    LOG_INFO("[Gateway] stopping...");

    heartbeat_.stop();
    stop_discovery();
    bridge_.stop();

    if (http_server_) {
        http_server_->stop();
    }

    running_ = false;
    LOG_INFO("[Gateway] stopped after processing %llu message(s)",
             static_cast<unsigned long long>(router_.messages_processed()));
}

void GatewayServer::start_discovery() {
    if (!config_.discovery.enabled) return;

    discovery_ = create_discovery_service(config_.discovery);
    if (!discovery_) return;

    AnnounceConfig ac;
    ac.name = config_.discovery.name;
    ac.port = config_.port;
    ac.require_auth = config_.require_auth;
    ac.capabilities = config_.capabilities;
    ac.version = GATEWAY_VERSION;
    ac.transport = "ws";

    try {
        discovery_->announce(ac);
        LOG_INFO("[Gateway] announcing '%s' via %s", ac.name.c_str(), discovery_->method());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("[Gateway] discovery disabled: %s", e.what());
        discovery_.reset();
    }
}

void GatewayServer::stop_discovery() {
    if (discovery_ && discovery_->is_announcing()) {
        discovery_->stop_announcing();
    }
    discovery_.reset();
}

void GatewayServer::on_node_departed(const std::string& node_id) {
    groups_.remove_node_from_all_groups(node_id);

    std::lock_guard<std::mutex> lock(bridge_mutex_);
    bridge_sessions_.erase(node_id);
}

int64_t GatewayServer::now() const {
    return clock_ ? clock_() : current_timestamp_ms();
}

// ============================================================================
// WebSocket Path
// ============================================================================

void GatewayServer::handle_frame(Session& session, const std::string& raw) {
    try {
        router_.handle_frame(session, raw);
    } catch (const std::exception& e) {
        LOG_ERROR("[Gateway] error handling frame from %s: %s",
                  session.is_bound() ? session.node_id().c_str() : "unregistered client", e.what());
        session.send(make_error(ERR_INVALID_MESSAGE, e.what()));
    }
}

void GatewayServer::handle_close(Session& session) {
    router_.handle_close(session);
}

// ============================================================================
// HTTP Bridge
// ============================================================================

HttpReply GatewayServer::bridge_send(const std::string& body) {
    try {
        ValidationResult result = validate_message(body, now());
        if (!result.ok) {
            return HttpReply::error(400, result.error);
        }
        const GatewayMessage& msg = result.message;

        if (msg.type == MessageType::REGISTER) {
            const RegisterPayload& payload = std::get<RegisterPayload>(msg.payload);
            std::shared_ptr<BridgeConnection> conn = std::make_shared<BridgeConnection>(bridge_);

            NodeInfo node;
            MessageRouter::RegisterStatus status = router_.register_node(conn, payload, node);
            if (status == MessageRouter::RegisterStatus::AUTH_FAILED) {
                HttpReply reply = HttpReply::error(401, "Invalid or missing authentication token");
                reply.body["code"] = ERR_AUTH_FAILED;
                return reply;
            }
            if (status == MessageRouter::RegisterStatus::MAX_NODES_REACHED) {
                HttpReply reply = HttpReply::error(503, "Gateway has reached its node limit");
                reply.body["code"] = ERR_MAX_NODES_REACHED;
                return reply;
            }

            conn->bind(node.id);
            SessionPtr session = std::make_shared<Session>(conn);
            session->bind(node.id);
            {
                std::lock_guard<std::mutex> lock(bridge_mutex_);
                bridge_sessions_[node.id] = session;
            }

            Json reply = make_envelope(MessageType::REGISTERED);
            reply["nodeId"] = node.id;
            return HttpReply(200, reply);
        }

        if (msg.node_id.empty()) {
            return HttpReply::error(400, "nodeId is required");
        }

        SessionPtr session;
        {
            std::lock_guard<std::mutex> lock(bridge_mutex_);
            std::map<std::string, SessionPtr>::iterator it = bridge_sessions_.find(msg.node_id);
            if (it != bridge_sessions_.end()) {
                session = it->second;
            }
        }

        // Registry is consulted outside bridge_mutex_ (lock order registry -> bridge)
        if (!session || !registry_.has_node(msg.node_id)) {
            if (session) {
                std::lock_guard<std::mutex> lock(bridge_mutex_);
                bridge_sessions_.erase(msg.node_id);
            }
            return HttpReply::error(404, "Unknown bridge node: " + msg.node_id);
        }

        router_.handle_message(*session, msg);

        if (!session->is_bound()) {
            std::lock_guard<std::mutex> lock(bridge_mutex_);
            bridge_sessions_.erase(msg.node_id);
        }

        Json reply = Json::object();
        reply["success"] = true;
        return HttpReply(200, reply);
    } catch (const std::exception& e) {
        LOG_ERROR("[Bridge] send failed: %s", e.what());
        return HttpReply::error(500, e.what());
    }
}

bool GatewayServer::bridge_poll(const std::string& node_id, BridgeHub::PollCallback cb,
                                HttpReply& error) {
    if (node_id.empty()) {
        error = HttpReply::error(400, "X-Node-ID header is required");
        return false;
    }
    if (!bridge_.poll(node_id, cb)) {
        error = HttpReply::error(404, "Unknown bridge node: " + node_id);
        return false;
    }
    return true;
}

// ============================================================================
// Housekeeping
// ============================================================================

Json GatewayServer::gateway_stats() const {
    Json nodes = registry_.get_stats();
    int64_t ts = now();

    Json stats = Json::object();
    stats["uptime"] = ts - started_at_;
    stats["totalNodes"] = registry_.node_count();
    stats["totalGroups"] = groups_.group_count();
    stats["messagesProcessed"] = router_.messages_processed();
    stats["startedAt"] = started_at_;
    stats["activeSessions"] = nodes.value("activeSessions", 0);
    stats["sessionNodes"] = nodes.contains("sessionNodes") ? nodes["sessionNodes"] : Json::array();
    return stats;
}

Json GatewayServer::health() const {
    Json health = Json::object();
    health["status"] = "healthy";
    health["service"] = "meshgate";
    health["name"] = config_.discovery.name;
    health["version"] = GATEWAY_VERSION;
    health["requireAuth"] = auth_.is_auth_required();
    health["stats"] = gateway_stats();
    health["timestamp"] = now();
    return health;
}

Json GatewayServer::stats() const {
    Json gateway = gateway_stats();
    gateway["version"] = GATEWAY_VERSION;
    gateway["capabilities"] = config_.capabilities;
    gateway["maxNodes"] = registry_.max_nodes();
    gateway["requireAuth"] = auth_.is_auth_required();
    gateway["bridge"] = bridge_.get_stats();

    Json stats = Json::object();
    stats["gateway"] = gateway;
    stats["nodes"] = registry_.get_stats();
    stats["groups"] = groups_.get_stats();
    return stats;
}

} // namespace meshgate
