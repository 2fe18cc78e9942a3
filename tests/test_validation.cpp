#include <catch2/catch.hpp>
#include <meshgate/gateway/validation.hpp>

#include <string>

using namespace meshgate;

static const int64_t NOW = 1700000000000LL;

// String literals are ambiguous between the std::string and Json overloads;
// route them to the raw-text overload.
static ValidationResult validate_message(const char* raw, int64_t now_ms) {
    return meshgate::validate_message(std::string(raw), now_ms);
}

TEST_CASE("validation - rejects input that is not an envelope", "[validation]") {
    SECTION("unparseable JSON") {
        ValidationResult r = validate_message("{not json", NOW);
        REQUIRE_FALSE(r.ok);
        REQUIRE(r.error == "Invalid JSON");
    }

    SECTION("not an object") {
        REQUIRE_FALSE(validate_message("[1,2,3]", NOW).ok);
        REQUIRE_FALSE(validate_message("\"register\"", NOW).ok);
    }

    SECTION("missing type") {
        ValidationResult r = validate_message("{\"payload\":{}}", NOW);
        REQUIRE_FALSE(r.ok);
        REQUIRE(r.error.find("type") != std::string::npos);
    }

    SECTION("unknown type") {
        ValidationResult r = validate_message("{\"type\":\"teleport\"}", NOW);
        REQUIRE_FALSE(r.ok);
        REQUIRE(r.error.find("teleport") != std::string::npos);
    }

    SECTION("server-only type") {
        REQUIRE_FALSE(validate_message("{\"type\":\"registered\"}", NOW).ok);
    }

    SECTION("timestamp of the wrong type") {
        REQUIRE_FALSE(validate_message("{\"type\":\"ping\",\"timestamp\":\"soon\"}", NOW).ok);
    }
}

TEST_CASE("validation - timestamp defaults to now", "[validation]") {
    ValidationResult r = validate_message("{\"type\":\"ping\"}", NOW);
    REQUIRE(r.ok);
    REQUIRE(r.message.type == MessageType::PING);
    REQUIRE(r.message.timestamp == NOW);

    r = validate_message("{\"type\":\"pong\",\"timestamp\":42}", NOW);
    REQUIRE(r.ok);
    REQUIRE(r.message.timestamp == 42);
}

TEST_CASE("validation - timestamps outside the int64 range are rejected", "[validation]") {
    SECTION("huge floats") {
        ValidationResult r = validate_message("{\"type\":\"ping\",\"timestamp\":1e300}", NOW);
        REQUIRE_FALSE(r.ok);
        REQUIRE(r.error.find("timestamp") != std::string::npos);
        REQUIRE_FALSE(validate_message("{\"type\":\"ping\",\"timestamp\":-1e300}", NOW).ok);
        REQUIRE_FALSE(validate_message("{\"type\":\"ping\",\"timestamp\":9.3e18}", NOW).ok);
    }

    SECTION("unsigned past int64 max") {
        REQUIRE_FALSE(validate_message(
            "{\"type\":\"ping\",\"timestamp\":18446744073709551615}", NOW).ok);
    }

    SECTION("in-range values still pass") {
        ValidationResult r = validate_message("{\"type\":\"ping\",\"timestamp\":1700000000000.9}", NOW);
        REQUIRE(r.ok);
        REQUIRE(r.message.timestamp == 1700000000000LL);

        r = validate_message("{\"type\":\"ping\",\"timestamp\":-5}", NOW);
        REQUIRE(r.ok);
        REQUIRE(r.message.timestamp == -5);

        r = validate_message("{\"type\":\"ping\",\"timestamp\":9223372036854775807}", NOW);
        REQUIRE(r.ok);
        REQUIRE(r.message.timestamp == 9223372036854775807LL);
    }
}

TEST_CASE("validation - register", "[validation][register]") {
    SECTION("full payload") {
        ValidationResult r = validate_message(
            "{\"type\":\"register\",\"payload\":{\"name\":\"alice\","
            "\"capabilities\":[\"chat\",\"files\"],\"sessionId\":\"s1\","
            "\"agentName\":\"helper\",\"token\":\"t\"}}", NOW);
        REQUIRE(r.ok);
        const RegisterPayload& p = std::get<RegisterPayload>(r.message.payload);
        REQUIRE(p.name == "alice");
        REQUIRE(p.capabilities.size() == 2);
        REQUIRE(p.capabilities[1] == "files");
        REQUIRE(p.session_id == "s1");
        REQUIRE(p.agent_name == "helper");
        REQUIRE(p.token == "t");
    }

    SECTION("name is required") {
        REQUIRE_FALSE(validate_message("{\"type\":\"register\"}", NOW).ok);
        REQUIRE_FALSE(validate_message("{\"type\":\"register\",\"payload\":{\"name\":\"\"}}", NOW).ok);
        REQUIRE_FALSE(validate_message("{\"type\":\"register\",\"payload\":{\"name\":7}}", NOW).ok);
    }

    SECTION("name length is counted in characters") {
        std::string hundred(100, 'a');
        std::string too_long(101, 'a');
        REQUIRE(validate_message("{\"type\":\"register\",\"payload\":{\"name\":\"" + hundred + "\"}}", NOW).ok);
        REQUIRE_FALSE(validate_message("{\"type\":\"register\",\"payload\":{\"name\":\"" + too_long + "\"}}", NOW).ok);

        // 100 two-byte characters is still 100 characters
        std::string accented;
        for (int i = 0; i < 100; ++i) accented += "\xC3\xA9";
        REQUIRE(validate_message("{\"type\":\"register\",\"payload\":{\"name\":\"" + accented + "\"}}", NOW).ok);
    }

    SECTION("capabilities must be strings") {
        ValidationResult r = validate_message(
            "{\"type\":\"register\",\"payload\":{\"name\":\"a\",\"capabilities\":[1]}}", NOW);
        REQUIRE_FALSE(r.ok);
        REQUIRE(r.error.find("capabilities") != std::string::npos);
    }
}

TEST_CASE("validation - join_group", "[validation][groups]") {
    SECTION("by id") {
        ValidationResult r = validate_message(
            "{\"type\":\"join_group\",\"payload\":{\"groupId\":\"g1\"}}", NOW);
        REQUIRE(r.ok);
        REQUIRE(std::get<JoinGroupPayload>(r.message.payload).group_id == "g1");
    }

    SECTION("by name with creation") {
        ValidationResult r = validate_message(
            "{\"type\":\"join_group\",\"payload\":{\"groupName\":\"news\","
            "\"createIfNotExists\":true,\"description\":\"daily\"}}", NOW);
        REQUIRE(r.ok);
        const JoinGroupPayload& p = std::get<JoinGroupPayload>(r.message.payload);
        REQUIRE(p.group_name == "news");
        REQUIRE(p.create_if_not_exists);
        REQUIRE(p.description == "daily");
    }

    SECTION("needs an id or a name") {
        REQUIRE_FALSE(validate_message("{\"type\":\"join_group\",\"payload\":{}}", NOW).ok);
    }

    SECTION("limits") {
        std::string long_name(101, 'g');
        std::string long_desc(501, 'd');
        REQUIRE_FALSE(validate_message(
            "{\"type\":\"join_group\",\"payload\":{\"groupName\":\"" + long_name + "\"}}", NOW).ok);
        REQUIRE_FALSE(validate_message(
            "{\"type\":\"join_group\",\"payload\":{\"groupName\":\"g\",\"description\":\"" + long_desc + "\"}}", NOW).ok);
        REQUIRE_FALSE(validate_message(
            "{\"type\":\"join_group\",\"payload\":{\"groupName\":\"g\",\"createIfNotExists\":\"yes\"}}", NOW).ok);
    }
}

TEST_CASE("validation - leave_group takes the id from the envelope or the payload", "[validation][groups]") {
    ValidationResult r = validate_message("{\"type\":\"leave_group\",\"groupId\":\"env\"}", NOW);
    REQUIRE(r.ok);
    REQUIRE(std::get<LeaveGroupPayload>(r.message.payload).group_id == "env");

    r = validate_message("{\"type\":\"leave_group\",\"payload\":{\"groupId\":\"pl\"}}", NOW);
    REQUIRE(r.ok);
    REQUIRE(std::get<LeaveGroupPayload>(r.message.payload).group_id == "pl");

    // Structurally valid; the router answers INVALID_REQUEST
    r = validate_message("{\"type\":\"leave_group\"}", NOW);
    REQUIRE(r.ok);
    REQUIRE(std::get<LeaveGroupPayload>(r.message.payload).group_id.empty());
}

TEST_CASE("validation - broadcast and direct", "[validation][delivery]") {
    SECTION("broadcast keeps the message as-is") {
        ValidationResult r = validate_message(
            "{\"type\":\"broadcast\",\"payload\":{\"groupId\":\"g\",\"message\":{\"text\":\"hi\"}}}", NOW);
        REQUIRE(r.ok);
        const BroadcastPayload& p = std::get<BroadcastPayload>(r.message.payload);
        REQUIRE(p.group_id == "g");
        REQUIRE(p.message["text"] == "hi");
    }

    SECTION("broadcast needs groupId and message") {
        REQUIRE_FALSE(validate_message(
            "{\"type\":\"broadcast\",\"payload\":{\"message\":1}}", NOW).ok);
        REQUIRE_FALSE(validate_message(
            "{\"type\":\"broadcast\",\"payload\":{\"groupId\":\"g\"}}", NOW).ok);
    }

    SECTION("direct falls back to the envelope target") {
        ValidationResult r = validate_message(
            "{\"type\":\"direct\",\"targetNodeId\":\"n2\",\"payload\":{\"message\":\"yo\"}}", NOW);
        REQUIRE(r.ok);
        REQUIRE(std::get<DirectPayload>(r.message.payload).target_node_id == "n2");
    }

    SECTION("direct needs a target") {
        REQUIRE_FALSE(validate_message(
            "{\"type\":\"direct\",\"payload\":{\"message\":\"yo\"}}", NOW).ok);
    }
}

TEST_CASE("validation - error envelopes need code and message", "[validation]") {
    REQUIRE(validate_message(
        "{\"type\":\"error\",\"payload\":{\"code\":\"X\",\"message\":\"y\"}}", NOW).ok);
    REQUIRE_FALSE(validate_message("{\"type\":\"error\",\"payload\":{\"code\":\"X\"}}", NOW).ok);
}

TEST_CASE("validation - envelope ids must be strings", "[validation]") {
    REQUIRE_FALSE(validate_message("{\"type\":\"ping\",\"nodeId\":5}", NOW).ok);
    ValidationResult r = validate_message("{\"type\":\"ping\",\"nodeId\":\"n1\"}", NOW);
    REQUIRE(r.ok);
    REQUIRE(r.message.node_id == "n1");
}
