#include <meshgate/gateway/router.hpp>
#include <meshgate/gateway/validation.hpp>
#include <meshgate/gateway/broadcast.hpp>
#include <meshgate/gateway/auth.hpp>
#include <meshgate/core/logger.hpp>

namespace meshgate {

// ============================================================================
// Session
// ============================================================================

Session::Session(ConnectionPtr conn) : conn_(conn) {}

std::string Session::node_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return node_id_;
}

bool Session::is_bound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !node_id_.empty();
}

void Session::bind(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    node_id_ = node_id;
}

void Session::unbind() {
    std::lock_guard<std::mutex> lock(mutex_);
    node_id_.clear();
}

bool Session::send(const Json& msg) {
    if (!conn_) return false;
    return conn_->send(msg.dump());
}

// ============================================================================
// MessageRouter
// ============================================================================

MessageRouter::MessageRouter(NodeRegistry& registry, GroupManager& groups, AuthGuard& auth)
    : registry_(registry)
    , groups_(groups)
    , auth_(auth)
    , messages_processed_(0) {
}

void MessageRouter::send_error(Session& session, const std::string& code,
                               const std::string& message) {
    session.send(make_error(code, message));
}

void MessageRouter::handle_frame(Session& session, const std::string& raw) {
    ValidationResult result = validate_message(raw, registry_.now());
    if (!result.ok) {
        LOG_DEBUG("Rejected frame from %s: %s",
                  session.is_bound() ? session.node_id().c_str() : "unregistered client",
                  result.error.c_str());
        send_error(session, ERR_INVALID_MESSAGE, result.error);
        return;
    }
    handle_message(session, result.message);
}

void MessageRouter::handle_message(Session& session, const GatewayMessage& msg) {
    std::string node_id = session.node_id();

    // Evicted while the connection was still draining
    if (!node_id.empty() && !registry_.has_node(node_id)) {
        session.unbind();
        node_id.clear();
    }

    // Only bound sessions have something to key the limiter on
    if (!node_id.empty() && !is_rate_limit_exempt(msg.type)) {
        if (registry_.is_rate_limited(node_id)) {
            LOG_DEBUG("Node %s rate limited, dropping %s", node_id.c_str(),
                      message_type_str(msg.type));
            send_error(session, ERR_RATE_LIMITED, "Rate limit exceeded");
            return;
        }
        registry_.record_message(node_id);
    }

    messages_processed_.fetch_add(1);

    switch (msg.type) {
        case MessageType::REGISTER:
            handle_register(session, msg);
            break;
        case MessageType::UNREGISTER:
            handle_unregister(session);
            break;
        case MessageType::JOIN_GROUP:
            handle_join_group(session, msg);
            break;
        case MessageType::LEAVE_GROUP:
            handle_leave_group(session, msg);
            break;
        case MessageType::BROADCAST:
            handle_broadcast(session, msg);
            break;
        case MessageType::DIRECT:
            handle_direct(session, msg);
            break;
        case MessageType::PING:
            handle_ping(session);
            break;
        case MessageType::PONG:
            handle_pong(session);
            break;
        default:
            send_error(session, ERR_UNKNOWN_MESSAGE_TYPE,
                       std::string("Unsupported message type: ") + message_type_str(msg.type));
            break;
    }
}

void MessageRouter::handle_close(Session& session) {
    std::string node_id = session.node_id();
    if (node_id.empty()) return;

    session.unbind();
    detach_node(node_id, false);
}

// ============================================================================
// Registration
// ============================================================================

MessageRouter::RegisterStatus MessageRouter::register_node(ConnectionPtr conn,
                                                           const RegisterPayload& payload,
                                                           NodeInfo& out) {
    if (!auth_.validate_token(payload.token)) {
        LOG_WARN("Registration of '%s' rejected: invalid token", payload.name.c_str());
        return RegisterStatus::AUTH_FAILED;
    }

    if (!registry_.register_node(conn, payload.name, payload.capabilities,
                                 payload.session_id, payload.agent_name, out)) {
        return RegisterStatus::MAX_NODES_REACHED;
    }
    return RegisterStatus::OK;
}

void MessageRouter::detach_node(const std::string& node_id, bool close_connection) {
    groups_.remove_node_from_all_groups(node_id);
    registry_.unregister_node(node_id, close_connection);
}

void MessageRouter::handle_register(Session& session, const GatewayMessage& msg) {
    if (session.is_bound()) {
        send_error(session, ERR_INVALID_REQUEST, "Connection is already registered");
        return;
    }

    const RegisterPayload& payload = std::get<RegisterPayload>(msg.payload);

    NodeInfo node;
    RegisterStatus status = register_node(session.connection(), payload, node);

    if (status == RegisterStatus::AUTH_FAILED) {
        send_error(session, ERR_AUTH_FAILED, "Invalid or missing authentication token");
        session.connection()->close();
        return;
    }
    if (status == RegisterStatus::MAX_NODES_REACHED) {
        send_error(session, ERR_MAX_NODES_REACHED, "Gateway has reached its node limit");
        session.connection()->close();
        return;
    }

    session.bind(node.id);

    Json ack = make_ack();
    ack["nodeId"] = node.id;
    Json info = Json::object();
    info["nodeId"] = node.id;
    info["name"] = node.name;
    if (!node.session_id.empty()) info["sessionId"] = node.session_id;
    if (!node.agent_name.empty()) info["agentName"] = node.agent_name;
    ack["payload"] = info;
    session.send(ack);
}

void MessageRouter::handle_unregister(Session& session) {
    std::string node_id = session.node_id();
    if (node_id.empty()) {
        LOG_DEBUG("Ignoring unregister from an unregistered connection");
        return;
    }

    detach_node(node_id, false);
    session.unbind();
    session.connection()->close();
}

// ============================================================================
// Groups
// ============================================================================

void MessageRouter::handle_join_group(Session& session, const GatewayMessage& msg) {
    std::string node_id = session.node_id();
    if (node_id.empty()) {
        send_error(session, ERR_NOT_REGISTERED, "Node not registered");
        return;
    }

    const JoinGroupPayload& payload = std::get<JoinGroupPayload>(msg.payload);

    Group group;
    bool found = false;

    if (!payload.group_id.empty()) {
        found = groups_.get_group(payload.group_id, group) &&
                groups_.add_node_to_group(group.id, node_id);
    } else if (payload.create_if_not_exists) {
        group = groups_.join_or_create(payload.group_name, node_id, payload.description);
        found = !group.id.empty();
    } else {
        found = groups_.get_group_by_name(payload.group_name, group) &&
                groups_.add_node_to_group(group.id, node_id);
    }

    if (!found) {
        send_error(session, ERR_GROUP_NOT_FOUND, "Group not found");
        return;
    }

    // Evicted since the check in handle_message: the departure hook has
    // already run and will not see this membership
    if (!registry_.add_group(node_id, group.id)) {
        groups_.remove_node_from_group(group.id, node_id);
        session.unbind();
        send_error(session, ERR_NOT_REGISTERED, "Node not registered");
        return;
    }

    Json ack = make_ack();
    ack["nodeId"] = node_id;
    ack["groupId"] = group.id;
    Json info = Json::object();
    info["groupId"] = group.id;
    info["groupName"] = group.name;
    ack["payload"] = info;
    session.send(ack);

    LOG_INFO("Node %s joined group %s", node_id.c_str(), group.name.c_str());
}

void MessageRouter::handle_leave_group(Session& session, const GatewayMessage& msg) {
    std::string node_id = session.node_id();
    const LeaveGroupPayload& payload = std::get<LeaveGroupPayload>(msg.payload);

    if (node_id.empty() || payload.group_id.empty()) {
        send_error(session, ERR_INVALID_REQUEST, "leave_group requires a registered node and a groupId");
        return;
    }

    groups_.remove_node_from_group(payload.group_id, node_id);
    registry_.remove_group(node_id, payload.group_id);

    Json ack = make_ack();
    ack["nodeId"] = node_id;
    ack["groupId"] = payload.group_id;
    session.send(ack);

    LOG_INFO("Node %s left group %s", node_id.c_str(), payload.group_id.c_str());
}

// ============================================================================
// Delivery
// ============================================================================

void MessageRouter::handle_broadcast(Session& session, const GatewayMessage& msg) {
    std::string node_id = session.node_id();
    if (node_id.empty()) {
        send_error(session, ERR_NOT_REGISTERED, "Node not registered");
        return;
    }

    const BroadcastPayload& payload = std::get<BroadcastPayload>(msg.payload);
    if (!groups_.has_group(payload.group_id)) {
        send_error(session, ERR_GROUP_NOT_FOUND, "Group not found");
        return;
    }

    // The sender never receives its own broadcast
    std::vector<std::string> members = groups_.get_group_members(payload.group_id);
    std::vector<std::string> recipients;
    recipients.reserve(members.size());
    for (size_t i = 0; i < members.size(); ++i) {
        if (members[i] != node_id) {
            recipients.push_back(members[i]);
        }
    }

    std::string text = make_broadcast(node_id, payload.group_id, payload.message).dump();
    size_t sent = registry_.broadcast_to_nodes(recipients, text);

    LOG_DEBUG("Broadcast from %s to %zu/%zu node(s) in group %s",
              node_id.c_str(), sent, recipients.size(), payload.group_id.c_str());
}

void MessageRouter::handle_direct(Session& session, const GatewayMessage& msg) {
    std::string node_id = session.node_id();
    if (node_id.empty()) {
        send_error(session, ERR_NOT_REGISTERED, "Node not registered");
        return;
    }

    const DirectPayload& payload = std::get<DirectPayload>(msg.payload);
    if (!registry_.has_node(payload.target_node_id)) {
        send_error(session, ERR_NODE_NOT_FOUND, "Target node not found");
        return;
    }

    std::string text = make_direct(node_id, payload.target_node_id, payload.message).dump();
    if (!registry_.send_to_node(payload.target_node_id, text)) {
        LOG_WARN("Direct message from %s to %s was not delivered",
                 node_id.c_str(), payload.target_node_id.c_str());
    }
}

// ============================================================================
// Liveness
// ============================================================================

void MessageRouter::handle_ping(Session& session) {
    std::string node_id = session.node_id();
    if (!node_id.empty()) {
        registry_.update_ping(node_id);
    }
    session.send(make_pong());
}

void MessageRouter::handle_pong(Session& session) {
    std::string node_id = session.node_id();
    if (!node_id.empty()) {
        registry_.update_ping(node_id);
    }
}

} // namespace meshgate
