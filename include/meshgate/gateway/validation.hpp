#ifndef MESHGATE_GATEWAY_VALIDATION_HPP
#define MESHGATE_GATEWAY_VALIDATION_HPP

#include "message.hpp"
#include <string>
#include <cstdint>

namespace meshgate {

// Field limits
const size_t MAX_NODE_NAME_LENGTH = 100;
const size_t MAX_GROUP_NAME_LENGTH = 100;
const size_t MAX_GROUP_DESCRIPTION_LENGTH = 500;

// Result of validating one inbound frame
struct ValidationResult {
    bool ok;
    GatewayMessage message;
    std::string error;           // Names the offending field

    ValidationResult() : ok(false) {}

    static ValidationResult success(const GatewayMessage& msg) {
        ValidationResult r;
        r.ok = true;
        r.message = msg;
        return r;
    }

    static ValidationResult failure(const std::string& err) {
        ValidationResult r;
        r.ok = false;
        r.error = err;
        return r;
    }
};

// Parse and validate the raw text of one frame or request body.
// `now_ms` fills in a missing timestamp. Never throws.
ValidationResult validate_message(const std::string& raw, int64_t now_ms);

// Same, for an already parsed document
ValidationResult validate_message(const Json& data, int64_t now_ms);

} // namespace meshgate

#endif // MESHGATE_GATEWAY_VALIDATION_HPP
