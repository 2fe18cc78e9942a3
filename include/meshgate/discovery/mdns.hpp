/*
 * meshgate - mDNS discovery
 *
 * Advertises the gateway as a DNS-SD service on the local segment
 * (224.0.0.251:5353) and browses for other gateways. The wire codec is
 * exposed separately so it can be exercised without sockets.
 */
#ifndef MESHGATE_DISCOVERY_MDNS_HPP
#define MESHGATE_DISCOVERY_MDNS_HPP

#include "discovery.hpp"
#include <string>
#include <vector>
#include <map>
#include <thread>
#include <mutex>
#include <atomic>
#include <cstdint>

namespace meshgate {

namespace mdns {

const char* const SERVICE_TYPE = "_meshgate._tcp.local";
const char* const MULTICAST_ADDR = "224.0.0.251";
const uint16_t PORT = 5353;
const uint32_t DEFAULT_TTL = 120;

// Record types
const uint16_t TYPE_A = 1;
const uint16_t TYPE_PTR = 12;
const uint16_t TYPE_TXT = 16;
const uint16_t TYPE_SRV = 33;
const uint16_t TYPE_ANY = 255;

struct Question {
    std::string name;
    uint16_t type;

    Question() : type(0) {}
};

// Resource record with the rdata already interpreted for the types we use
struct Record {
    std::string name;
    uint16_t type;
    uint32_t ttl;
    std::string target;                      // PTR / SRV
    uint16_t port;                           // SRV
    std::map<std::string, std::string> txt;  // TXT key=value
    std::string address;                     // A, dotted quad

    Record() : type(0), ttl(0), port(0) {}
};

struct Packet {
    uint16_t id;
    uint16_t flags;
    std::vector<Question> questions;
    std::vector<Record> records;             // Answers, authority and additional

    Packet() : id(0), flags(0) {}

    bool is_response() const { return (flags & 0x8000) != 0; }
};

// One advertised gateway instance
struct ServiceInstance {
    std::string instance;        // Instance label, e.g. "meshgate"
    std::string hostname;        // "<host>.local"
    uint16_t port;
    std::vector<std::string> addresses;
    std::map<std::string, std::string> txt;

    ServiceInstance() : port(0) {}

    // "<instance>._meshgate._tcp.local"
    std::string full_name() const;
};

// TXT entries advertised for a gateway
std::map<std::string, std::string> make_txt(const AnnounceConfig& config);

std::vector<uint8_t> encode_query(const std::string& name, uint16_t type);

// PTR + SRV + TXT + A records. ttl 0 is a goodbye.
std::vector<uint8_t> encode_response(const ServiceInstance& svc, uint32_t ttl);

// False on truncated or malformed input
bool decode_packet(const uint8_t* data, size_t len, Packet& out);

// Does a query ask about this instance (by service type or full name)?
bool matches_query(const Packet& query, const ServiceInstance& svc);

// Gateways described by a response. `source_ip` stands in when the
// packet carries no A record for the target host.
std::vector<DiscoveryRecord> extract_records(const Packet& response,
                                             const std::string& source_ip);

} // namespace mdns

class MdnsDiscovery : public DiscoveryService {
public:
    MdnsDiscovery();
    virtual ~MdnsDiscovery();

    virtual const char* method() const { return "mdns"; }

    // Throws std::runtime_error on socket failure or if already announcing
    virtual void announce(const AnnounceConfig& config);
    virtual void stop_announcing();
    virtual bool is_announcing() const { return announcing_.load(); }

    virtual std::vector<DiscoveryRecord> discover(int64_t timeout_ms);

private:
    void responder_loop();
    void send_multicast(const std::vector<uint8_t>& data);

    int socket_fd_;
    mdns::ServiceInstance service_;
    std::atomic<bool> announcing_;
    std::thread responder_thread_;
    std::mutex send_mutex_;
};

} // namespace meshgate

#endif // MESHGATE_DISCOVERY_MDNS_HPP
