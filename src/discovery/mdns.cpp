/*
 * meshgate - mDNS discovery implementation
 */

#include <meshgate/discovery/mdns.hpp>
#include <meshgate/core/logger.hpp>
#include <meshgate/core/utils.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <chrono>
#include <sstream>

namespace meshgate {
namespace mdns {

// ============================================================================
// Encoding
// ============================================================================

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    put_u16(out, static_cast<uint16_t>(v >> 16));
    put_u16(out, static_cast<uint16_t>(v & 0xFFFF));
}

// Uncompressed name. Instance labels are sanitised, so every dot separates labels.
void put_name(std::vector<uint8_t>& out, const std::string& name) {
    std::vector<std::string> labels = split(name, '.');
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i].empty()) continue;
        size_t len = std::min(labels[i].size(), static_cast<size_t>(63));
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), labels[i].begin(), labels[i].begin() + len);
    }
    out.push_back(0);
}

void put_header(std::vector<uint8_t>& out, uint16_t id, uint16_t flags,
                uint16_t qd, uint16_t an, uint16_t ns, uint16_t ar) {
    put_u16(out, id);
    put_u16(out, flags);
    put_u16(out, qd);
    put_u16(out, an);
    put_u16(out, ns);
    put_u16(out, ar);
}

// Record header up to and including a placeholder rdlength.
// Returns the offset of rdlength for patching.
size_t begin_record(std::vector<uint8_t>& out, const std::string& name, uint16_t type,
                    bool cache_flush, uint32_t ttl) {
    put_name(out, name);
    put_u16(out, type);
    put_u16(out, cache_flush ? 0x8001 : 0x0001);
    put_u32(out, ttl);
    size_t at = out.size();
    put_u16(out, 0);
    return at;
}

void end_record(std::vector<uint8_t>& out, size_t rdlength_at) {
    size_t rdlength = out.size() - rdlength_at - 2;
    out[rdlength_at] = static_cast<uint8_t>(rdlength >> 8);
    out[rdlength_at + 1] = static_cast<uint8_t>(rdlength & 0xFF);
}

std::string sanitise_label(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size() && out.size() < 63; ++i) {
        out += (s[i] == '.') ? '-' : s[i];
    }
    return out.empty() ? std::string("meshgate") : out;
}

} // anonymous namespace

std::string ServiceInstance::full_name() const {
    return instance + "." + SERVICE_TYPE;
}

std::map<std::string, std::string> make_txt(const AnnounceConfig& config) {
    std::map<std::string, std::string> txt;
    txt["version"] = config.version;
    txt["auth"] = config.require_auth ? "required" : "optional";
    txt["transport"] = config.transport;
    txt["capabilities"] = join(config.capabilities, ",");
    return txt;
}

std::vector<uint8_t> encode_query(const std::string& name, uint16_t type) {
    std::vector<uint8_t> out;
    put_header(out, 0, 0, 1, 0, 0, 0);
    put_name(out, name);
    put_u16(out, type);
    put_u16(out, 0x0001);
    return out;
}

std::vector<uint8_t> encode_response(const ServiceInstance& svc, uint32_t ttl) {
    std::vector<struct in_addr> addrs;
    for (size_t i = 0; i < svc.addresses.size(); ++i) {
        struct in_addr addr;
        if (inet_pton(AF_INET, svc.addresses[i].c_str(), &addr) == 1) {
            addrs.push_back(addr);
        }
    }

    std::vector<uint8_t> out;
    uint16_t answers = static_cast<uint16_t>(3 + addrs.size());
    put_header(out, 0, 0x8400, 0, answers, 0, 0);

    std::string full = svc.full_name();

    // PTR: service type -> instance
    size_t at = begin_record(out, SERVICE_TYPE, TYPE_PTR, false, ttl);
    put_name(out, full);
    end_record(out, at);

    // SRV: instance -> host:port
    at = begin_record(out, full, TYPE_SRV, true, ttl);
    put_u16(out, 0);             // priority
    put_u16(out, 0);             // weight
    put_u16(out, svc.port);
    put_name(out, svc.hostname);
    end_record(out, at);

    // TXT: key=value strings
    at = begin_record(out, full, TYPE_TXT, true, ttl);
    for (std::map<std::string, std::string>::const_iterator it = svc.txt.begin();
         it != svc.txt.end(); ++it) {
        std::string entry = it->first + "=" + it->second;
        if (entry.size() > 255) entry.resize(255);
        out.push_back(static_cast<uint8_t>(entry.size()));
        out.insert(out.end(), entry.begin(), entry.end());
    }
    end_record(out, at);

    // A: host -> addresses
    for (size_t i = 0; i < addrs.size(); ++i) {
        at = begin_record(out, svc.hostname, TYPE_A, true, ttl);
        const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&addrs[i].s_addr);
        out.insert(out.end(), bytes, bytes + 4);
        end_record(out, at);
    }

    return out;
}

// ============================================================================
// Decoding
// ============================================================================

namespace {

bool get_u16(const uint8_t* data, size_t len, size_t& off, uint16_t& v) {
    if (off + 2 > len) return false;
    v = static_cast<uint16_t>((data[off] << 8) | data[off + 1]);
    off += 2;
    return true;
}

bool get_u32(const uint8_t* data, size_t len, size_t& off, uint32_t& v) {
    uint16_t hi, lo;
    if (!get_u16(data, len, off, hi) || !get_u16(data, len, off, lo)) return false;
    v = (static_cast<uint32_t>(hi) << 16) | lo;
    return true;
}

// Follows compression pointers; `off` ends after the name at its original site
bool get_name(const uint8_t* data, size_t len, size_t& off, std::string& name) {
    name.clear();
    size_t pos = off;
    bool jumped = false;
    int jumps = 0;

    while (true) {
        if (pos >= len) return false;
        uint8_t l = data[pos];

        if ((l & 0xC0) == 0xC0) {
            if (pos + 1 >= len || ++jumps > 16) return false;
            size_t target = static_cast<size_t>(((l & 0x3F) << 8) | data[pos + 1]);
            if (!jumped) off = pos + 2;
            jumped = true;
            pos = target;
            continue;
        }
        if (l & 0xC0) return false;

        ++pos;
        if (l == 0) break;
        if (pos + l > len) return false;
        if (!name.empty()) name += '.';
        name.append(reinterpret_cast<const char*>(data + pos), l);
        pos += l;
    }

    if (!jumped) off = pos;
    return true;
}

bool names_equal(const std::string& a, const std::string& b) {
    return to_lower(a) == to_lower(b);
}

} // anonymous namespace

bool decode_packet(const uint8_t* data, size_t len, Packet& out) {
    size_t off = 0;
    uint16_t qd, an, ns, ar;
    if (!get_u16(data, len, off, out.id) || !get_u16(data, len, off, out.flags) ||
        !get_u16(data, len, off, qd) || !get_u16(data, len, off, an) ||
        !get_u16(data, len, off, ns) || !get_u16(data, len, off, ar)) {
        return false;
    }

    for (uint16_t i = 0; i < qd; ++i) {
        Question q;
        uint16_t qclass;
        if (!get_name(data, len, off, q.name) ||
            !get_u16(data, len, off, q.type) ||
            !get_u16(data, len, off, qclass)) {
            return false;
        }
        out.questions.push_back(q);
    }

    size_t total = static_cast<size_t>(an) + ns + ar;
    for (size_t i = 0; i < total; ++i) {
        Record r;
        uint16_t rclass, rdlength;
        if (!get_name(data, len, off, r.name) ||
            !get_u16(data, len, off, r.type) ||
            !get_u16(data, len, off, rclass) ||
            !get_u32(data, len, off, r.ttl) ||
            !get_u16(data, len, off, rdlength)) {
            return false;
        }
        if (off + rdlength > len) return false;

        size_t rd = off;
        size_t rd_end = off + rdlength;

        switch (r.type) {
            case TYPE_PTR:
                if (!get_name(data, len, rd, r.target)) return false;
                break;
            case TYPE_SRV: {
                uint16_t priority, weight;
                if (!get_u16(data, len, rd, priority) || !get_u16(data, len, rd, weight) ||
                    !get_u16(data, len, rd, r.port) || !get_name(data, len, rd, r.target)) {
                    return false;
                }
                break;
            }
            case TYPE_TXT:
                while (rd < rd_end) {
                    uint8_t l = data[rd++];
                    if (rd + l > rd_end) return false;
                    std::string entry(reinterpret_cast<const char*>(data + rd), l);
                    rd += l;
                    size_t eq = entry.find('=');
                    if (eq == std::string::npos) {
                        if (!entry.empty()) r.txt[entry] = "";
                    } else {
                        r.txt[entry.substr(0, eq)] = entry.substr(eq + 1);
                    }
                }
                break;
            case TYPE_A:
                if (rdlength == 4) {
                    char buf[INET_ADDRSTRLEN];
                    if (inet_ntop(AF_INET, data + rd, buf, sizeof(buf))) {
                        r.address = buf;
                    }
                }
                break;
            default:
                break;
        }

        off = rd_end;
        out.records.push_back(r);
    }

    return true;
}

bool matches_query(const Packet& query, const ServiceInstance& svc) {
    if (query.is_response()) return false;

    std::string full = svc.full_name();
    for (size_t i = 0; i < query.questions.size(); ++i) {
        const Question& q = query.questions[i];
        if (names_equal(q.name, SERVICE_TYPE) && (q.type == TYPE_PTR || q.type == TYPE_ANY)) {
            return true;
        }
        if (names_equal(q.name, full)) {
            return true;
        }
    }
    return false;
}

std::vector<DiscoveryRecord> extract_records(const Packet& response,
                                             const std::string& source_ip) {
    std::vector<DiscoveryRecord> found;
    if (!response.is_response()) return found;

    for (size_t i = 0; i < response.records.size(); ++i) {
        const Record& ptr = response.records[i];
        if (ptr.type != TYPE_PTR || !names_equal(ptr.name, SERVICE_TYPE) || ptr.ttl == 0) {
            continue;
        }

        const Record* srv = NULL;
        const Record* txt = NULL;
        for (size_t j = 0; j < response.records.size(); ++j) {
            const Record& r = response.records[j];
            if (!names_equal(r.name, ptr.target)) continue;
            if (r.type == TYPE_SRV && !srv) srv = &r;
            if (r.type == TYPE_TXT && !txt) txt = &r;
        }
        if (!srv) continue;

        std::string host = source_ip;
        for (size_t j = 0; j < response.records.size(); ++j) {
            const Record& r = response.records[j];
            if (r.type == TYPE_A && names_equal(r.name, srv->target) && !r.address.empty()) {
                host = r.address;
                break;
            }
        }

        DiscoveryRecord rec;
        size_t dot = ptr.target.find('.');
        rec.name = dot == std::string::npos ? ptr.target : ptr.target.substr(0, dot);
        rec.host = host;
        rec.port = srv->port;
        rec.transport = "ws";
        rec.version = "1.0.0";

        if (txt) {
            std::map<std::string, std::string>::const_iterator it;
            if ((it = txt->txt.find("transport")) != txt->txt.end() && !it->second.empty()) {
                rec.transport = it->second;
            }
            if ((it = txt->txt.find("version")) != txt->txt.end() && !it->second.empty()) {
                rec.version = it->second;
            }
            if ((it = txt->txt.find("auth")) != txt->txt.end()) {
                rec.require_auth = it->second == "required";
            }
            if ((it = txt->txt.find("capabilities")) != txt->txt.end() && !it->second.empty()) {
                rec.capabilities = split(it->second, ',');
            }
        }

        std::ostringstream url;
        url << rec.transport << "://" << rec.host << ":" << rec.port << "/ws";
        rec.url = url.str();
        found.push_back(rec);
    }

    return found;
}

} // namespace mdns

// ============================================================================
// MdnsDiscovery
// ============================================================================

namespace {

sockaddr_in multicast_endpoint() {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(mdns::PORT);
    inet_pton(AF_INET, mdns::MULTICAST_ADDR, &addr.sin_addr);
    return addr;
}

std::string errno_message(const char* what) {
    return std::string("mDNS: ") + what + ": " + std::strerror(errno);
}

// Socket joined to the mDNS group and bound to 5353
int open_responder_socket() {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        throw std::runtime_error(errno_message("socket"));
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
    setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));
#endif

    sockaddr_in bind_addr;
    std::memset(&bind_addr, 0, sizeof(bind_addr));
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(mdns::PORT);
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (bind(fd, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        std::string msg = errno_message("bind");
        close(fd);
        throw std::runtime_error(msg);
    }

    ip_mreq mreq;
    std::memset(&mreq, 0, sizeof(mreq));
    inet_pton(AF_INET, mdns::MULTICAST_ADDR, &mreq.imr_multiaddr);
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
        std::string msg = errno_message("IP_ADD_MEMBERSHIP");
        close(fd);
        throw std::runtime_error(msg);
    }

    unsigned char ttl = 255;
    setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
    unsigned char loop = 1;
    setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));

    return fd;
}

} // anonymous namespace

MdnsDiscovery::MdnsDiscovery()
    : socket_fd_(-1)
    , announcing_(false) {
}

MdnsDiscovery::~MdnsDiscovery() {
    stop_announcing();
}

void MdnsDiscovery::announce(const AnnounceConfig& config) {
    if (announcing_.load()) {
        throw std::runtime_error("mDNS: already announcing");
    }

    service_ = mdns::ServiceInstance();
    service_.instance = mdns::sanitise_label(config.name);
    service_.hostname = local_hostname() + ".local";
    service_.port = static_cast<uint16_t>(config.port);
    service_.addresses = local_ipv4_addresses();
    service_.txt = mdns::make_txt(config);

    socket_fd_ = open_responder_socket();
    announcing_.store(true);

    send_multicast(mdns::encode_response(service_, mdns::DEFAULT_TTL));
    responder_thread_ = std::thread(&MdnsDiscovery::responder_loop, this);

    LOG_INFO("[mDNS] announcing %s on port %d (%zu address(es))",
             service_.full_name().c_str(), config.port, service_.addresses.size());
}

void MdnsDiscovery::stop_announcing() {
    if (!announcing_.load()) return;

    // Goodbye: same records with TTL 0
    send_multicast(mdns::encode_response(service_, 0));

    announcing_.store(false);
    if (responder_thread_.joinable()) {
        responder_thread_.join();
    }

    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
    LOG_INFO("[mDNS] stopped announcing %s", service_.full_name().c_str());
}

void MdnsDiscovery::send_multicast(const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (socket_fd_ < 0) return;

    sockaddr_in dest = multicast_endpoint();
    if (sendto(socket_fd_, data.data(), data.size(), 0,
               reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0) {
        LOG_WARN("[mDNS] multicast send failed: %s", std::strerror(errno));
    }
}

void MdnsDiscovery::responder_loop() {
    LOG_DEBUG("[mDNS] responder thread started");
    std::vector<uint8_t> buffer(9000);

    while (announcing_.load()) {
        pollfd pfd;
        pfd.fd = socket_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, 250);
        if (ready <= 0) continue;

        sockaddr_in sender;
        socklen_t sender_len = sizeof(sender);
        ssize_t len = recvfrom(socket_fd_, buffer.data(), buffer.size(), 0,
                               reinterpret_cast<sockaddr*>(&sender), &sender_len);
        if (len <= 0) continue;

        mdns::Packet packet;
        if (!mdns::decode_packet(buffer.data(), static_cast<size_t>(len), packet)) {
            continue;
        }
        if (!mdns::matches_query(packet, service_)) {
            continue;
        }

        std::vector<uint8_t> response = mdns::encode_response(service_, mdns::DEFAULT_TTL);

        if (ntohs(sender.sin_port) != mdns::PORT) {
            // One-shot resolver: reply directly, echoing the query id
            response[0] = static_cast<uint8_t>(packet.id >> 8);
            response[1] = static_cast<uint8_t>(packet.id & 0xFF);
            std::lock_guard<std::mutex> lock(send_mutex_);
            if (sendto(socket_fd_, response.data(), response.size(), 0,
                       reinterpret_cast<sockaddr*>(&sender), sender_len) < 0) {
                LOG_WARN("[mDNS] unicast reply failed: %s", std::strerror(errno));
            }
        } else {
            send_multicast(response);
        }
    }

    LOG_DEBUG("[mDNS] responder thread exited");
}

std::vector<DiscoveryRecord> MdnsDiscovery::discover(int64_t timeout_ms) {
    std::vector<DiscoveryRecord> result;

    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        LOG_ERROR("[mDNS] discover: socket: %s", std::strerror(errno));
        return result;
    }

    // Ephemeral source port, so responders answer us by unicast
    std::vector<uint8_t> query = mdns::encode_query(mdns::SERVICE_TYPE, mdns::TYPE_PTR);
    sockaddr_in dest = multicast_endpoint();
    if (sendto(fd, query.data(), query.size(), 0,
               reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0) {
        LOG_ERROR("[mDNS] discover: query failed: %s", std::strerror(errno));
        close(fd);
        return result;
    }

    std::map<std::string, DiscoveryRecord> seen;
    std::vector<uint8_t> buffer(9000);
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        int64_t remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;

        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (::poll(&pfd, 1, static_cast<int>(remaining)) <= 0) continue;

        sockaddr_in sender;
        socklen_t sender_len = sizeof(sender);
        ssize_t len = recvfrom(fd, buffer.data(), buffer.size(), 0,
                               reinterpret_cast<sockaddr*>(&sender), &sender_len);
        if (len <= 0) continue;

        mdns::Packet packet;
        if (!mdns::decode_packet(buffer.data(), static_cast<size_t>(len), packet)) {
            continue;
        }

        char ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &sender.sin_addr, ip, sizeof(ip));

        std::vector<DiscoveryRecord> records = mdns::extract_records(packet, ip);
        for (size_t i = 0; i < records.size(); ++i) {
            if (seen.find(records[i].name) == seen.end()) {
                LOG_DEBUG("[mDNS] found %s at %s", records[i].name.c_str(), records[i].url.c_str());
                seen[records[i].name] = records[i];
            }
        }
    }

    close(fd);

    for (std::map<std::string, DiscoveryRecord>::const_iterator it = seen.begin();
         it != seen.end(); ++it) {
        result.push_back(it->second);
    }
    return result;
}

} // namespace meshgate
