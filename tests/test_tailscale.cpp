#include <catch2/catch.hpp>
#include <meshgate/discovery/tailscale.hpp>

#include <string>
#include <vector>

using namespace meshgate;

static Json sample_status() {
    return Json::parse(R"({
        "Self": {"HostName": "me"},
        "Peer": {
            "nodekey:aaa": {
                "HostName": "gw-office",
                "DNSName": "gw-office.tail1234.ts.net.",
                "TailscaleIPs": ["fd7a:115c:a1e0::1", "100.64.0.5"],
                "Online": true,
                "Tags": ["tag:Meshgate-Gateway"]
            },
            "nodekey:bbb": {
                "DNSName": "laptop.tail1234.ts.net.",
                "TailscaleIPs": ["fd7a:115c:a1e0::2"],
                "Online": false
            },
            "nodekey:ccc": {
                "Online": true
            }
        }
    })");
}

static const TailscalePeer* find_peer(const std::vector<TailscalePeer>& peers, const std::string& id) {
    for (size_t i = 0; i < peers.size(); ++i) {
        if (peers[i].id == id) return &peers[i];
    }
    return NULL;
}

TEST_CASE("tailscale - peers from a status document", "[tailscale]") {
    std::vector<TailscalePeer> peers = TailscaleDiscovery::parse_peers(sample_status());
    REQUIRE(peers.size() == 3);

    const TailscalePeer* gw = find_peer(peers, "nodekey:aaa");
    REQUIRE(gw != NULL);
    REQUIRE(gw->hostname == "gw-office");
    REQUIRE(gw->ip == "100.64.0.5");
    REQUIRE(gw->online);
    REQUIRE(gw->tags.size() == 1);

    const TailscalePeer* laptop = find_peer(peers, "nodekey:bbb");
    REQUIRE(laptop != NULL);
    REQUIRE(laptop->hostname == "laptop");
    REQUIRE(laptop->ip == "fd7a:115c:a1e0::2");
    REQUIRE_FALSE(laptop->online);
    REQUIRE(laptop->tags.empty());

    const TailscalePeer* bare = find_peer(peers, "nodekey:ccc");
    REQUIRE(bare != NULL);
    REQUIRE(bare->hostname == "nodekey:ccc");
    REQUIRE(bare->ip.empty());
}

TEST_CASE("tailscale - documents without peers", "[tailscale]") {
    REQUIRE(TailscaleDiscovery::parse_peers(Json::object()).empty());
    REQUIRE(TailscaleDiscovery::parse_peers(Json::array()).empty());
    REQUIRE(TailscaleDiscovery::parse_peers(Json::parse(R"({"Peer": null})")).empty());
}

TEST_CASE("tailscale - gateway peers are online and tagged", "[tailscale]") {
    TailscalePeer peer;
    peer.ip = "100.64.0.5";
    peer.online = true;
    peer.tags.push_back("tag:Meshgate-Gateway");

    REQUIRE(TailscaleDiscovery::is_gateway_peer(peer, "tag:meshgate-gateway"));
    REQUIRE_FALSE(TailscaleDiscovery::is_gateway_peer(peer, "tag:other"));

    peer.online = false;
    REQUIRE_FALSE(TailscaleDiscovery::is_gateway_peer(peer, "tag:meshgate-gateway"));

    peer.online = true;
    peer.ip.clear();
    REQUIRE_FALSE(TailscaleDiscovery::is_gateway_peer(peer, "tag:meshgate-gateway"));
}

TEST_CASE("tailscale - records from /health", "[tailscale]") {
    DiscoveryRecord rec;

    SECTION("meshgate gateway") {
        Json health = Json::parse(R"({"status":"healthy","service":"meshgate",
            "name":"office","version":"1.2.0","requireAuth":true})");
        REQUIRE(TailscaleDiscovery::record_from_health(health, "100.64.0.5", 18789, rec));
        REQUIRE(rec.name == "office");
        REQUIRE(rec.url == "ws://100.64.0.5:18789/ws");
        REQUIRE(rec.host == "100.64.0.5");
        REQUIRE(rec.port == 18789);
        REQUIRE(rec.require_auth);
        REQUIRE(rec.version == "1.2.0");
        REQUIRE(rec.capabilities.size() == 3);
    }

    SECTION("defaults for a sparse body") {
        Json health = Json::parse(R"({"service":"meshgate"})");
        REQUIRE(TailscaleDiscovery::record_from_health(health, "fd7a::1", 9000, rec));
        REQUIRE(rec.name == "Gateway-fd7a::1");
        REQUIRE(rec.url == "ws://[fd7a::1]:9000/ws");
        REQUIRE_FALSE(rec.require_auth);
        REQUIRE(rec.version == "1.0.0");
    }

    SECTION("some other service") {
        Json health = Json::parse(R"({"status":"ok","service":"grafana"})");
        REQUIRE_FALSE(TailscaleDiscovery::record_from_health(health, "100.64.0.5", 18789, rec));
        REQUIRE_FALSE(TailscaleDiscovery::record_from_health(Json::array(), "100.64.0.5", 18789, rec));
    }
}

TEST_CASE("tailscale - /stats refines a record", "[tailscale]") {
    DiscoveryRecord rec;
    rec.version = "1.0.0";
    rec.capabilities.push_back("broadcast");

    SECTION("nested under gateway") {
        TailscaleDiscovery::apply_stats(Json::parse(
            R"({"gateway":{"version":"2.0.0","capabilities":["direct","groups"]}})"), rec);
        REQUIRE(rec.version == "2.0.0");
        REQUIRE(rec.capabilities.size() == 2);
        REQUIRE(rec.capabilities[0] == "direct");
    }

    SECTION("top level") {
        TailscaleDiscovery::apply_stats(Json::parse(R"({"version":"3.0.0"})"), rec);
        REQUIRE(rec.version == "3.0.0");
        REQUIRE(rec.capabilities.size() == 1);
    }

    SECTION("empty capability lists are ignored") {
        TailscaleDiscovery::apply_stats(Json::parse(R"({"capabilities":[]})"), rec);
        REQUIRE(rec.capabilities.size() == 1);
    }
}
