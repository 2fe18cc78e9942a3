#ifndef MESHGATE_GATEWAY_GATEWAY_CONFIG_HPP
#define MESHGATE_GATEWAY_GATEWAY_CONFIG_HPP

#include "../core/config.hpp"
#include "../discovery/discovery.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace meshgate {

// Environment variable consulted when the config carries no token
extern const char* const GATEWAY_TOKEN_ENV;

const int DEFAULT_GATEWAY_PORT = 18789;

// Startup configuration of the gateway service
struct GatewayConfig {
    int port;
    std::string host;
    bool require_auth;
    std::vector<std::string> auth_tokens;
    size_t max_nodes;
    int64_t ping_interval_ms;
    int64_t ping_timeout_ms;
    int rate_limit_messages;
    int64_t rate_limit_window_ms;
    int64_t poll_timeout_ms;
    size_t max_queue;
    std::string log_level;
    std::vector<std::string> capabilities;   // Advertised through discovery and /stats
    DiscoveryOptions discovery;

    GatewayConfig()
        : port(DEFAULT_GATEWAY_PORT)
        , host("127.0.0.1")
        , require_auth(false)
        , max_nodes(1000)
        , ping_interval_ms(30000)
        , ping_timeout_ms(60000)
        , rate_limit_messages(100)
        , rate_limit_window_ms(60000)
        , poll_timeout_ms(30000)
        , max_queue(1000)
        , log_level("info") {
        capabilities.push_back("broadcast");
        capabilities.push_back("direct");
        capabilities.push_back("groups");
        capabilities.push_back("bridge");
    }

    // Read "gateway.*" keys and "log_level"; missing keys keep defaults.
    // Falls back to MESHGATE_GATEWAY_TOKEN when no token is configured.
    static GatewayConfig from_config(const Config& cfg);

    // Empty if valid, otherwise a description of the first bad value
    std::string validate() const;
};

} // namespace meshgate

#endif // MESHGATE_GATEWAY_GATEWAY_CONFIG_HPP
