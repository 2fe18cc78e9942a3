/*
 * meshgate - Tailscale discovery implementation
 */

#include <meshgate/discovery/tailscale.hpp>
#include <meshgate/gateway/gateway_config.hpp>
#include <meshgate/core/http_client.hpp>
#include <meshgate/core/logger.hpp>
#include <meshgate/core/utils.hpp>
#include <algorithm>
#include <chrono>
#include <sstream>

namespace meshgate {

static const char* const LOCALAPI_STATUS_URL = "http://local-tailscaled.sock/localapi/v0/status";
static const long PROBE_TIMEOUT_MS = 2000;

TailscaleDiscovery::TailscaleDiscovery(const std::string& tag, int probe_port,
                                       const std::string& socket_path)
    : tag_(tag)
    , probe_port_(probe_port > 0 ? probe_port : DEFAULT_GATEWAY_PORT)
    , socket_path_(socket_path)
    , announcing_(false) {
}

void TailscaleDiscovery::announce(const AnnounceConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    announcing_.store(true);
    LOG_INFO("[Tailscale] gateway '%s' discoverable by peers via %s",
             config.name.c_str(), tag_.c_str());
}

void TailscaleDiscovery::stop_announcing() {
    std::lock_guard<std::mutex> lock(mutex_);
    announcing_.store(false);
    config_ = AnnounceConfig();
}

// ============================================================================
// Parsing
// ============================================================================

std::vector<TailscalePeer> TailscaleDiscovery::parse_peers(const Json& status) {
    std::vector<TailscalePeer> peers;
    if (!status.is_object() || !status.contains("Peer") || !status["Peer"].is_object()) {
        return peers;
    }

    const Json& peer_map = status["Peer"];
    for (Json::const_iterator it = peer_map.begin(); it != peer_map.end(); ++it) {
        const Json& p = it.value();
        if (!p.is_object()) continue;

        TailscalePeer peer;
        peer.id = it.key();
        peer.hostname = p.value("HostName", std::string(""));
        if (peer.hostname.empty()) {
            std::string dns = p.value("DNSName", std::string(""));
            peer.hostname = dns.empty() ? peer.id : split(dns, '.')[0];
        }

        if (p.contains("TailscaleIPs") && p["TailscaleIPs"].is_array()) {
            // Prefer the IPv4 address; URLs stay simple
            const Json& ips = p["TailscaleIPs"];
            for (size_t i = 0; i < ips.size(); ++i) {
                if (!ips[i].is_string()) continue;
                std::string ip = ips[i].get<std::string>();
                if (ip.find(':') == std::string::npos) {
                    peer.ip = ip;
                    break;
                }
                if (peer.ip.empty()) peer.ip = ip;
            }
        }

        peer.online = p.value("Online", false);

        if (p.contains("Tags") && p["Tags"].is_array()) {
            const Json& tags = p["Tags"];
            for (size_t i = 0; i < tags.size(); ++i) {
                if (tags[i].is_string()) peer.tags.push_back(tags[i].get<std::string>());
            }
        }

        peers.push_back(peer);
    }
    return peers;
}

bool TailscaleDiscovery::is_gateway_peer(const TailscalePeer& peer, const std::string& tag) {
    if (!peer.online || peer.ip.empty()) return false;

    std::string wanted = to_lower(tag);
    for (size_t i = 0; i < peer.tags.size(); ++i) {
        if (to_lower(peer.tags[i]) == wanted) return true;
    }
    return false;
}

bool TailscaleDiscovery::record_from_health(const Json& health, const std::string& ip, int port,
                                            DiscoveryRecord& out) {
    if (!health.is_object() || health.value("service", std::string("")) != "meshgate") {
        return false;
    }

    std::string host = ip.find(':') != std::string::npos ? "[" + ip + "]" : ip;
    std::ostringstream url;
    url << "ws://" << host << ":" << port << "/ws";

    out = DiscoveryRecord();
    out.name = health.value("name", std::string("Gateway-") + ip);
    out.url = url.str();
    out.host = ip;
    out.port = port;
    out.transport = "ws";
    out.require_auth = health.value("requireAuth", false);
    out.version = health.value("version", std::string("1.0.0"));
    out.capabilities.push_back("broadcast");
    out.capabilities.push_back("direct");
    out.capabilities.push_back("groups");
    return true;
}

void TailscaleDiscovery::apply_stats(const Json& stats, DiscoveryRecord& rec) {
    if (!stats.is_object()) return;

    const Json* source = &stats;
    if (stats.contains("gateway") && stats["gateway"].is_object()) {
        source = &stats["gateway"];
    }

    if (source->contains("capabilities") && (*source)["capabilities"].is_array()) {
        std::vector<std::string> caps;
        const Json& arr = (*source)["capabilities"];
        for (size_t i = 0; i < arr.size(); ++i) {
            if (arr[i].is_string()) caps.push_back(arr[i].get<std::string>());
        }
        if (!caps.empty()) rec.capabilities = caps;
    }
    if (source->contains("version") && (*source)["version"].is_string()) {
        rec.version = (*source)["version"].get<std::string>();
    }
}

// ============================================================================
// Discovery
// ============================================================================

std::vector<DiscoveryRecord> TailscaleDiscovery::discover(int64_t timeout_ms) {
    std::vector<DiscoveryRecord> found;
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    HttpClient localapi;
    localapi.set_unix_socket(socket_path_);
    localapi.set_timeout(static_cast<long>(std::max<int64_t>(timeout_ms, 1)));

    HttpResponse status = localapi.get(LOCALAPI_STATUS_URL);
    if (!status.ok()) {
        LOG_ERROR("[Tailscale] status query via %s failed: %s",
                  socket_path_.c_str(), status.error.c_str());
        return found;
    }

    std::vector<TailscalePeer> peers;
    try {
        peers = parse_peers(status.json());
    } catch (const std::exception& e) {
        LOG_ERROR("[Tailscale] unexpected status document: %s", e.what());
        return found;
    }
    LOG_DEBUG("[Tailscale] %zu peer(s) in tailnet", peers.size());

    HttpClient http;
    for (size_t i = 0; i < peers.size(); ++i) {
        if (!is_gateway_peer(peers[i], tag_)) continue;

        int64_t remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            LOG_WARN("[Tailscale] discovery timed out, returning %zu result(s)", found.size());
            break;
        }
        http.set_timeout(static_cast<long>(std::min<int64_t>(remaining, PROBE_TIMEOUT_MS)));

        std::string host = peers[i].ip.find(':') != std::string::npos
                           ? "[" + peers[i].ip + "]" : peers[i].ip;
        std::ostringstream base;
        base << "http://" << host << ":" << probe_port_;

        HttpResponse health = http.get(base.str() + "/health");
        if (!health.ok()) {
            LOG_DEBUG("[Tailscale] %s not reachable: %s",
                      peers[i].hostname.c_str(), health.error.c_str());
            continue;
        }

        DiscoveryRecord rec;
        try {
            if (!record_from_health(health.json(), peers[i].ip, probe_port_, rec)) {
                LOG_DEBUG("[Tailscale] %s is not a meshgate gateway", peers[i].hostname.c_str());
                continue;
            }

            // Optional
            HttpResponse stats = http.get(base.str() + "/stats");
            if (stats.ok()) {
                apply_stats(stats.json(), rec);
            }
        } catch (const std::exception& e) {
            LOG_WARN("[Tailscale] bad response from %s: %s", peers[i].hostname.c_str(), e.what());
            continue;
        }

        LOG_DEBUG("[Tailscale] found %s at %s", rec.name.c_str(), rec.url.c_str());
        found.push_back(rec);
    }

    return found;
}

} // namespace meshgate
