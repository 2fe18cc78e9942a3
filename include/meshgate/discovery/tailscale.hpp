/*
 * meshgate - Tailscale discovery
 *
 * Finds gateways among tailnet peers. Advertisement is done by tagging
 * the gateway machine in the Tailscale admin console; discovery reads
 * peer status from the local tailscaled and probes tagged peers.
 */
#ifndef MESHGATE_DISCOVERY_TAILSCALE_HPP
#define MESHGATE_DISCOVERY_TAILSCALE_HPP

#include "discovery.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <atomic>

namespace meshgate {

const char* const TAILSCALED_SOCKET = "/var/run/tailscale/tailscaled.sock";

struct TailscalePeer {
    std::string id;
    std::string hostname;
    std::string ip;
    bool online;
    std::vector<std::string> tags;

    TailscalePeer() : online(false) {}
};

class TailscaleDiscovery : public DiscoveryService {
public:
    TailscaleDiscovery(const std::string& tag, int probe_port,
                       const std::string& socket_path = TAILSCALED_SOCKET);

    virtual const char* method() const { return "tailscale"; }

    // Records the config; the tag in the admin console does the advertising
    virtual void announce(const AnnounceConfig& config);
    virtual void stop_announcing();
    virtual bool is_announcing() const { return announcing_.load(); }

    virtual std::vector<DiscoveryRecord> discover(int64_t timeout_ms);

    // Peers listed in a LocalAPI /status document
    static std::vector<TailscalePeer> parse_peers(const Json& status);

    // Online and carrying `tag` (case-insensitive)
    static bool is_gateway_peer(const TailscalePeer& peer, const std::string& tag);

    // Build a record from a /health body; false if it is not a meshgate gateway
    static bool record_from_health(const Json& health, const std::string& ip, int port,
                                   DiscoveryRecord& out);

    // Fill capabilities and version from a /stats body when present
    static void apply_stats(const Json& stats, DiscoveryRecord& rec);

private:
    std::string tag_;
    int probe_port_;
    std::string socket_path_;

    std::atomic<bool> announcing_;
    AnnounceConfig config_;
    std::mutex mutex_;
};

} // namespace meshgate

#endif // MESHGATE_DISCOVERY_TAILSCALE_HPP
