#ifndef MESHGATE_GATEWAY_ROUTER_HPP
#define MESHGATE_GATEWAY_ROUTER_HPP

#include "connection.hpp"
#include "message.hpp"
#include "node_registry.hpp"
#include "../core/json.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <cstdint>

namespace meshgate {

class GroupManager;
class AuthGuard;

// One client connection plus the node id bound to it after register
class Session {
public:
    explicit Session(ConnectionPtr conn);

    const ConnectionPtr& connection() const { return conn_; }

    std::string node_id() const;
    bool is_bound() const;
    void bind(const std::string& node_id);
    void unbind();

    // Serialise and send on this session's connection
    bool send(const Json& msg);

private:
    ConnectionPtr conn_;
    std::string node_id_;
    mutable std::mutex mutex_;
};

typedef std::shared_ptr<Session> SessionPtr;

// Transport-independent dispatch of inbound envelopes.
// Shared by the WebSocket path and the HTTP bridge path.
class MessageRouter {
public:
    enum class RegisterStatus {
        OK,
        AUTH_FAILED,
        MAX_NODES_REACHED
    };

    MessageRouter(NodeRegistry& registry, GroupManager& groups, AuthGuard& auth);

    // Validate and dispatch one raw frame. Never throws.
    void handle_frame(Session& session, const std::string& raw);

    // Dispatch an already validated envelope (rate limit, count, route)
    void handle_message(Session& session, const GatewayMessage& msg);

    // Transport went away: detach groups and unregister
    void handle_close(Session& session);

    // Auth and capacity checks, then admit the node on `conn`
    RegisterStatus register_node(ConnectionPtr conn, const RegisterPayload& payload,
                                 NodeInfo& out);

    // Leave every group, then leave the registry
    void detach_node(const std::string& node_id, bool close_connection);

    uint64_t messages_processed() const { return messages_processed_.load(); }

private:
    void handle_register(Session& session, const GatewayMessage& msg);
    void handle_unregister(Session& session);
    void handle_join_group(Session& session, const GatewayMessage& msg);
    void handle_leave_group(Session& session, const GatewayMessage& msg);
    void handle_broadcast(Session& session, const GatewayMessage& msg);
    void handle_direct(Session& session, const GatewayMessage& msg);
    void handle_ping(Session& session);
    void handle_pong(Session& session);

    void send_error(Session& session, const std::string& code, const std::string& message);

    NodeRegistry& registry_;
    GroupManager& groups_;
    AuthGuard& auth_;
    std::atomic<uint64_t> messages_processed_;
};

} // namespace meshgate

#endif // MESHGATE_GATEWAY_ROUTER_HPP
