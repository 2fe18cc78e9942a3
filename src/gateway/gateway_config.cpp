#include <meshgate/gateway/gateway_config.hpp>
#include <meshgate/core/logger.hpp>
#include <cstdlib>
#include <sstream>

namespace meshgate {

const char* const GATEWAY_TOKEN_ENV = "MESHGATE_GATEWAY_TOKEN";

GatewayConfig GatewayConfig::from_config(const Config& cfg) {
    GatewayConfig gc;

    gc.port = static_cast<int>(cfg.get_int("gateway.port", gc.port));
    gc.host = cfg.get_string("gateway.host", gc.host);
    gc.require_auth = cfg.get_bool("gateway.requireAuth", gc.require_auth);
    gc.max_nodes = static_cast<size_t>(cfg.get_int("gateway.maxNodes", static_cast<int64_t>(gc.max_nodes)));
    gc.ping_interval_ms = cfg.get_int("gateway.pingInterval", gc.ping_interval_ms);
    gc.ping_timeout_ms = cfg.get_int("gateway.pingTimeout", gc.ping_timeout_ms);
    gc.rate_limit_messages = static_cast<int>(cfg.get_int("gateway.rateLimit.maxMessages", gc.rate_limit_messages));
    gc.rate_limit_window_ms = cfg.get_int("gateway.rateLimit.windowMs", gc.rate_limit_window_ms);
    gc.poll_timeout_ms = cfg.get_int("gateway.bridge.pollTimeout", gc.poll_timeout_ms);
    gc.max_queue = static_cast<size_t>(cfg.get_int("gateway.bridge.maxQueue", static_cast<int64_t>(gc.max_queue)));
    gc.log_level = cfg.get_string("log_level", gc.log_level);
    std::vector<std::string> caps = cfg.get_string_list("gateway.capabilities");
    if (!caps.empty()) {
        gc.capabilities = caps;
    }

    std::string token = cfg.get_string("gateway.authToken", "");
    if (!token.empty()) {
        gc.auth_tokens.push_back(token);
    }
    std::vector<std::string> tokens = cfg.get_string_list("gateway.authTokens");
    gc.auth_tokens.insert(gc.auth_tokens.end(), tokens.begin(), tokens.end());

    if (gc.auth_tokens.empty()) {
        const char* env = std::getenv(GATEWAY_TOKEN_ENV);
        if (env && *env) {
            gc.auth_tokens.push_back(env);
            LOG_DEBUG("Using gateway token from %s", GATEWAY_TOKEN_ENV);
        }
    }

    gc.discovery.enabled = cfg.get_bool("gateway.discovery.enabled", gc.discovery.enabled);
    gc.discovery.method = cfg.get_string("gateway.discovery.method", gc.discovery.method);
    gc.discovery.name = cfg.get_string("gateway.discovery.name", gc.discovery.name);
    gc.discovery.tag = cfg.get_string("gateway.discovery.tag", gc.discovery.tag);
    gc.discovery.probe_port = static_cast<int>(cfg.get_int("gateway.discovery.probePort", gc.discovery.probe_port));

    return gc;
}

std::string GatewayConfig::validate() const {
    std::ostringstream err;
    if (port <= 0 || port > 65535) {
        err << "gateway.port out of range: " << port;
    } else if (max_nodes == 0) {
        err << "gateway.maxNodes must be positive";
    } else if (ping_interval_ms <= 0) {
        err << "gateway.pingInterval must be positive";
    } else if (ping_timeout_ms <= 0) {
        err << "gateway.pingTimeout must be positive";
    } else if (rate_limit_messages <= 0 || rate_limit_window_ms <= 0) {
        err << "gateway.rateLimit values must be positive";
    } else if (poll_timeout_ms <= 0) {
        err << "gateway.bridge.pollTimeout must be positive";
    } else if (max_queue == 0) {
        err << "gateway.bridge.maxQueue must be positive";
    } else if (discovery.method != "mdns" && discovery.method != "tailscale") {
        err << "gateway.discovery.method must be 'mdns' or 'tailscale', got '"
            << discovery.method << "'";
    }
    return err.str();
}

} // namespace meshgate
