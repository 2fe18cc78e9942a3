#ifndef MESHGATE_GATEWAY_MESSAGE_HPP
#define MESHGATE_GATEWAY_MESSAGE_HPP

#include "../core/json.hpp"
#include <string>
#include <vector>
#include <variant>
#include <cstdint>

namespace meshgate {

// Envelope discriminant. REGISTERED is outbound only (bridge register reply).
enum class MessageType {
    REGISTER,
    UNREGISTER,
    JOIN_GROUP,
    LEAVE_GROUP,
    BROADCAST,
    DIRECT,
    PING,
    PONG,
    ACK,
    ERROR,
    REGISTERED
};

const char* message_type_str(MessageType t);

// Parse an inbound wire name. "registered" is not accepted from clients.
bool parse_message_type(const std::string& s, MessageType& out);

// register, ping and pong bypass the per-node rate limiter
bool is_rate_limit_exempt(MessageType t);

// Error codes carried in error envelopes
extern const char* const ERR_AUTH_FAILED;
extern const char* const ERR_MAX_NODES_REACHED;
extern const char* const ERR_INVALID_MESSAGE;
extern const char* const ERR_UNKNOWN_MESSAGE_TYPE;
extern const char* const ERR_RATE_LIMITED;
extern const char* const ERR_NOT_REGISTERED;
extern const char* const ERR_GROUP_NOT_FOUND;
extern const char* const ERR_NODE_NOT_FOUND;
extern const char* const ERR_INVALID_REQUEST;

// ============ Typed payloads, one per message type ============

struct RegisterPayload {
    std::string name;
    std::vector<std::string> capabilities;
    std::string session_id;      // Empty when absent
    std::string agent_name;      // Empty when absent
    std::string token;           // Empty when absent
};

struct UnregisterPayload {};

struct JoinGroupPayload {
    std::string group_id;
    std::string group_name;
    bool create_if_not_exists;
    std::string description;

    JoinGroupPayload() : create_if_not_exists(false) {}
};

struct LeaveGroupPayload {
    std::string group_id;        // Empty if neither envelope nor payload had one
};

struct BroadcastPayload {
    std::string group_id;
    Json message;
};

struct DirectPayload {
    std::string target_node_id;
    Json message;
};

struct PingPayload {};
struct PongPayload {};

struct AckPayload {
    Json data;
};

struct ErrorPayload {
    std::string code;
    std::string message;
};

typedef std::variant<RegisterPayload, UnregisterPayload, JoinGroupPayload,
                     LeaveGroupPayload, BroadcastPayload, DirectPayload,
                     PingPayload, PongPayload, AckPayload, ErrorPayload> MessagePayload;

// A validated inbound envelope
struct GatewayMessage {
    MessageType type;
    std::string node_id;
    std::string group_id;
    std::string target_node_id;
    int64_t timestamp;           // Unix ms
    MessagePayload payload;

    GatewayMessage() : type(MessageType::PING), timestamp(0), payload(PingPayload()) {}
};

// ============ Outbound envelopes ============

// {type, timestamp} skeleton
Json make_envelope(MessageType type);

Json make_error(const std::string& code, const std::string& message);

Json make_ack();

Json make_ping();
Json make_pong();

// Fan-out envelopes as delivered to recipients
Json make_broadcast(const std::string& sender_id, const std::string& group_id,
                    const Json& message);
Json make_direct(const std::string& sender_id, const std::string& target_id,
                 const Json& message);

} // namespace meshgate

#endif // MESHGATE_GATEWAY_MESSAGE_HPP
