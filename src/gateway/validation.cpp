#include <meshgate/gateway/validation.hpp>
#include <cmath>
#include <cstdint>
#include <limits>

namespace meshgate {

namespace {

// Length in code points; names are limited in characters, not bytes
size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) ++n;
    }
    return n;
}

// Optional string field. False if present with the wrong type.
bool read_optional_string(const Json& obj, const char* key, std::string& out) {
    if (!obj.contains(key) || obj[key].is_null()) return true;
    if (!obj[key].is_string()) return false;
    out = obj[key].get<std::string>();
    return true;
}

std::string type_error(const char* field, const char* expected) {
    return std::string("Invalid field '") + field + "': expected " + expected;
}

// Millisecond timestamp that fits int64_t. Floats are truncated.
bool read_timestamp(const Json& value, int64_t& out) {
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
        out = static_cast<int64_t>(v);
        return true;
    }
    if (value.is_number_integer()) {
        out = value.get<int64_t>();
        return true;
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        // -2^63 is exact; 2^63 is the first double past the range
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return false;
        }
        out = static_cast<int64_t>(d);
        return true;
    }
    return false;
}

ValidationResult parse_register(const Json& payload, GatewayMessage& msg) {
    RegisterPayload p;

    if (!payload.contains("name")) {
        return ValidationResult::failure("Missing required field 'payload.name'");
    }
    if (!payload["name"].is_string()) {
        return ValidationResult::failure(type_error("payload.name", "string"));
    }
    p.name = payload["name"].get<std::string>();
    if (p.name.empty() || utf8_length(p.name) > MAX_NODE_NAME_LENGTH) {
        return ValidationResult::failure("Invalid field 'payload.name': must be 1-100 characters");
    }

    if (payload.contains("capabilities") && !payload["capabilities"].is_null()) {
        const Json& caps = payload["capabilities"];
        if (!caps.is_array()) {
            return ValidationResult::failure(type_error("payload.capabilities", "array of strings"));
        }
        for (size_t i = 0; i < caps.size(); ++i) {
            if (!caps[i].is_string()) {
                return ValidationResult::failure(type_error("payload.capabilities", "array of strings"));
            }
            p.capabilities.push_back(caps[i].get<std::string>());
        }
    }

    if (!read_optional_string(payload, "sessionId", p.session_id)) {
        return ValidationResult::failure(type_error("payload.sessionId", "string"));
    }
    if (!read_optional_string(payload, "agentName", p.agent_name)) {
        return ValidationResult::failure(type_error("payload.agentName", "string"));
    }
    if (!read_optional_string(payload, "token", p.token)) {
        return ValidationResult::failure(type_error("payload.token", "string"));
    }

    msg.payload = p;
    return ValidationResult::success(msg);
}

ValidationResult parse_join_group(const Json& payload, GatewayMessage& msg) {
    JoinGroupPayload p;

    if (!read_optional_string(payload, "groupId", p.group_id)) {
        return ValidationResult::failure(type_error("payload.groupId", "string"));
    }
    if (!read_optional_string(payload, "groupName", p.group_name)) {
        return ValidationResult::failure(type_error("payload.groupName", "string"));
    }
    if (payload.contains("groupName") && payload["groupName"].is_string() &&
        (p.group_name.empty() || utf8_length(p.group_name) > MAX_GROUP_NAME_LENGTH)) {
        return ValidationResult::failure("Invalid field 'payload.groupName': must be 1-100 characters");
    }
    if (payload.contains("createIfNotExists") && !payload["createIfNotExists"].is_null()) {
        if (!payload["createIfNotExists"].is_boolean()) {
            return ValidationResult::failure(type_error("payload.createIfNotExists", "boolean"));
        }
        p.create_if_not_exists = payload["createIfNotExists"].get<bool>();
    }
    if (!read_optional_string(payload, "description", p.description)) {
        return ValidationResult::failure(type_error("payload.description", "string"));
    }
    if (utf8_length(p.description) > MAX_GROUP_DESCRIPTION_LENGTH) {
        return ValidationResult::failure("Invalid field 'payload.description': at most 500 characters");
    }

    if (p.group_id.empty() && p.group_name.empty()) {
        return ValidationResult::failure("join_group requires 'payload.groupId' or 'payload.groupName'");
    }

    msg.payload = p;
    return ValidationResult::success(msg);
}

ValidationResult parse_broadcast(const Json& payload, GatewayMessage& msg) {
    BroadcastPayload p;

    if (!payload.contains("groupId") || !payload["groupId"].is_string() ||
        payload["groupId"].get<std::string>().empty()) {
        return ValidationResult::failure("Missing required field 'payload.groupId'");
    }
    p.group_id = payload["groupId"].get<std::string>();

    if (!payload.contains("message")) {
        return ValidationResult::failure("Missing required field 'payload.message'");
    }
    p.message = payload["message"];

    msg.payload = p;
    return ValidationResult::success(msg);
}

ValidationResult parse_direct(const Json& payload, GatewayMessage& msg) {
    DirectPayload p;

    if (payload.contains("targetNodeId") && !payload["targetNodeId"].is_null()) {
        if (!payload["targetNodeId"].is_string()) {
            return ValidationResult::failure(type_error("payload.targetNodeId", "string"));
        }
        p.target_node_id = payload["targetNodeId"].get<std::string>();
    }
    if (p.target_node_id.empty()) {
        p.target_node_id = msg.target_node_id;
    }
    if (p.target_node_id.empty()) {
        return ValidationResult::failure("Missing required field 'payload.targetNodeId'");
    }

    if (!payload.contains("message")) {
        return ValidationResult::failure("Missing required field 'payload.message'");
    }
    p.message = payload["message"];

    msg.payload = p;
    return ValidationResult::success(msg);
}

ValidationResult parse_error(const Json& payload, GatewayMessage& msg) {
    ErrorPayload p;
    if (!payload.contains("code") || !payload["code"].is_string() ||
        payload["code"].get<std::string>().empty()) {
        return ValidationResult::failure("Missing required field 'payload.code'");
    }
    if (!payload.contains("message") || !payload["message"].is_string() ||
        payload["message"].get<std::string>().empty()) {
        return ValidationResult::failure("Missing required field 'payload.message'");
    }
    p.code = payload["code"].get<std::string>();
    p.message = payload["message"].get<std::string>();
    msg.payload = p;
    return ValidationResult::success(msg);
}

} // anonymous namespace

ValidationResult validate_message(const std::string& raw, int64_t now_ms) {
    Json data = Json::parse(raw, nullptr, false);
    if (data.is_discarded()) {
        return ValidationResult::failure("Invalid JSON");
    }
    return validate_message(data, now_ms);
}

ValidationResult validate_message(const Json& data, int64_t now_ms) {
    if (!data.is_object()) {
        return ValidationResult::failure("Message must be a JSON object");
    }

    if (!data.contains("type")) {
        return ValidationResult::failure("Missing required field 'type'");
    }
    if (!data["type"].is_string()) {
        return ValidationResult::failure(type_error("type", "string"));
    }

    GatewayMessage msg;
    std::string type = data["type"].get<std::string>();
    if (!parse_message_type(type, msg.type)) {
        return ValidationResult::failure("Unknown message type '" + type + "'");
    }

    if (data.contains("timestamp")) {
        if (!read_timestamp(data["timestamp"], msg.timestamp)) {
            return ValidationResult::failure(type_error("timestamp", "number in millisecond range"));
        }
    } else {
        msg.timestamp = now_ms;
    }

    if (!read_optional_string(data, "nodeId", msg.node_id)) {
        return ValidationResult::failure(type_error("nodeId", "string"));
    }
    if (!read_optional_string(data, "groupId", msg.group_id)) {
        return ValidationResult::failure(type_error("groupId", "string"));
    }
    if (!read_optional_string(data, "targetNodeId", msg.target_node_id)) {
        return ValidationResult::failure(type_error("targetNodeId", "string"));
    }

    static const Json empty_object = Json::object();
    const Json& payload = (data.contains("payload") && data["payload"].is_object())
                          ? data["payload"] : empty_object;

    switch (msg.type) {
        case MessageType::REGISTER:
            return parse_register(payload, msg);

        case MessageType::UNREGISTER:
            msg.payload = UnregisterPayload();
            return ValidationResult::success(msg);

        case MessageType::JOIN_GROUP:
            return parse_join_group(payload, msg);

        case MessageType::LEAVE_GROUP: {
            LeaveGroupPayload p;
            p.group_id = msg.group_id;
            if (p.group_id.empty() && !read_optional_string(payload, "groupId", p.group_id)) {
                return ValidationResult::failure(type_error("payload.groupId", "string"));
            }
            msg.payload = p;
            return ValidationResult::success(msg);
        }

        case MessageType::BROADCAST:
            return parse_broadcast(payload, msg);

        case MessageType::DIRECT:
            return parse_direct(payload, msg);

        case MessageType::PING:
            msg.payload = PingPayload();
            return ValidationResult::success(msg);

        case MessageType::PONG:
            msg.payload = PongPayload();
            return ValidationResult::success(msg);

        case MessageType::ACK: {
            AckPayload p;
            if (data.contains("payload")) p.data = data["payload"];
            msg.payload = p;
            return ValidationResult::success(msg);
        }

        case MessageType::ERROR:
            return parse_error(payload, msg);

        case MessageType::REGISTERED:
            break;
    }

    return ValidationResult::failure("Unknown message type '" + type + "'");
}

} // namespace meshgate
