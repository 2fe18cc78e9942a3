#include <meshgate/discovery/discovery.hpp>
#include <meshgate/discovery/mdns.hpp>
#include <meshgate/discovery/tailscale.hpp>
#include <meshgate/core/logger.hpp>

namespace meshgate {

Json DiscoveryRecord::to_json() const {
    Json j = Json::object();
    j["name"] = name;
    j["url"] = url;
    j["host"] = host;
    j["port"] = port;
    j["transport"] = transport;
    j["requireAuth"] = require_auth;
    j["capabilities"] = capabilities;
    j["version"] = version;
    return j;
}

std::unique_ptr<DiscoveryService> create_discovery_service(const DiscoveryOptions& options) {
    if (options.method == "mdns") {
        return std::unique_ptr<DiscoveryService>(new MdnsDiscovery());
    }
    if (options.method == "tailscale") {
        return std::unique_ptr<DiscoveryService>(
            new TailscaleDiscovery(options.tag, options.probe_port));
    }

    LOG_ERROR("Unknown discovery method '%s' (expected mdns or tailscale)", options.method.c_str());
    return std::unique_ptr<DiscoveryService>();
}

} // namespace meshgate
