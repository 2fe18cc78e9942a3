#ifndef MESHGATE_DISCOVERY_DISCOVERY_HPP
#define MESHGATE_DISCOVERY_DISCOVERY_HPP

#include "../core/json.hpp"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace meshgate {

// A gateway found on the network
struct DiscoveryRecord {
    std::string name;
    std::string url;             // ws://host:port/ws
    std::string host;
    int port;
    std::string transport;       // "ws" or "wss"
    bool require_auth;
    std::vector<std::string> capabilities;
    std::string version;

    DiscoveryRecord() : port(0), require_auth(false) {}

    Json to_json() const;
};

// What a gateway advertises about itself
struct AnnounceConfig {
    std::string name;
    int port;
    bool require_auth;
    std::vector<std::string> capabilities;
    std::string version;
    std::string transport;

    AnnounceConfig() : port(0), require_auth(false), transport("ws") {}
};

// Discovery backend selection
struct DiscoveryOptions {
    bool enabled;
    std::string method;          // "mdns" or "tailscale"
    std::string name;            // Advertised instance name
    std::string tag;             // Tailscale ACL tag marking gateways
    int probe_port;              // Port probed on tailnet peers (0 = default gateway port)

    DiscoveryOptions()
        : enabled(false)
        , method("mdns")
        , name("meshgate")
        , tag("tag:meshgate-gateway")
        , probe_port(0) {}
};

// Advertise this gateway and look for others. Purely informational:
// implementations never touch gateway state.
class DiscoveryService {
public:
    virtual ~DiscoveryService() {}

    virtual const char* method() const = 0;

    virtual void announce(const AnnounceConfig& config) = 0;
    virtual void stop_announcing() = 0;
    virtual bool is_announcing() const = 0;

    // Collect gateways until timeout_ms elapses; partial results are fine
    virtual std::vector<DiscoveryRecord> discover(int64_t timeout_ms) = 0;
};

// Null for an unknown method
std::unique_ptr<DiscoveryService> create_discovery_service(const DiscoveryOptions& options);

} // namespace meshgate

#endif // MESHGATE_DISCOVERY_DISCOVERY_HPP
