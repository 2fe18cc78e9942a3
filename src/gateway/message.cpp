#include <meshgate/gateway/message.hpp>
#include <meshgate/core/utils.hpp>

namespace meshgate {

const char* const ERR_AUTH_FAILED = "AUTH_FAILED";
const char* const ERR_MAX_NODES_REACHED = "MAX_NODES_REACHED";
const char* const ERR_INVALID_MESSAGE = "INVALID_MESSAGE";
const char* const ERR_UNKNOWN_MESSAGE_TYPE = "UNKNOWN_MESSAGE_TYPE";
const char* const ERR_RATE_LIMITED = "RATE_LIMITED";
const char* const ERR_NOT_REGISTERED = "NOT_REGISTERED";
const char* const ERR_GROUP_NOT_FOUND = "GROUP_NOT_FOUND";
const char* const ERR_NODE_NOT_FOUND = "NODE_NOT_FOUND";
const char* const ERR_INVALID_REQUEST = "INVALID_REQUEST";

const char* message_type_str(MessageType t) {
    switch (t) {
        case MessageType::REGISTER:    return "register";
        case MessageType::UNREGISTER:  return "unregister";
        case MessageType::JOIN_GROUP:  return "join_group";
        case MessageType::LEAVE_GROUP: return "leave_group";
        case MessageType::BROADCAST:   return "broadcast";
        case MessageType::DIRECT:      return "direct";
        case MessageType::PING:        return "ping";
        case MessageType::PONG:        return "pong";
        case MessageType::ACK:         return "ack";
        case MessageType::ERROR:       return "error";
        case MessageType::REGISTERED:  return "registered";
    }
    return "unknown";
}

bool parse_message_type(const std::string& s, MessageType& out) {
    static const MessageType inbound[] = {
        MessageType::REGISTER, MessageType::UNREGISTER,
        MessageType::JOIN_GROUP, MessageType::LEAVE_GROUP,
        MessageType::BROADCAST, MessageType::DIRECT,
        MessageType::PING, MessageType::PONG,
        MessageType::ACK, MessageType::ERROR
    };
    for (size_t i = 0; i < sizeof(inbound) / sizeof(inbound[0]); ++i) {
        if (s == message_type_str(inbound[i])) {
            out = inbound[i];
            return true;
        }
    }
    return false;
}

bool is_rate_limit_exempt(MessageType t) {
    return t == MessageType::REGISTER || t == MessageType::PING || t == MessageType::PONG;
}

// ============================================================================
// Outbound envelopes
// ============================================================================

Json make_envelope(MessageType type) {
    Json msg = Json::object();
    msg["type"] = message_type_str(type);
    msg["timestamp"] = current_timestamp_ms();
    return msg;
}

Json make_error(const std::string& code, const std::string& message) {
    Json msg = make_envelope(MessageType::ERROR);
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    msg["payload"] = payload;
    return msg;
}

Json make_ack() {
    return make_envelope(MessageType::ACK);
}

Json make_ping() {
    return make_envelope(MessageType::PING);
}

Json make_pong() {
    return make_envelope(MessageType::PONG);
}

Json make_broadcast(const std::string& sender_id, const std::string& group_id,
                    const Json& message) {
    Json msg = make_envelope(MessageType::BROADCAST);
    msg["nodeId"] = sender_id;
    msg["groupId"] = group_id;
    msg["payload"] = message;
    return msg;
}

Json make_direct(const std::string& sender_id, const std::string& target_id,
                 const Json& message) {
    Json msg = make_envelope(MessageType::DIRECT);
    msg["nodeId"] = sender_id;
    msg["targetNodeId"] = target_id;
    msg["payload"] = message;
    return msg;
}

} // namespace meshgate
