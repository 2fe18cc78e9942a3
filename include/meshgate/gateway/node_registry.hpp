#ifndef MESHGATE_GATEWAY_NODE_REGISTRY_HPP
#define MESHGATE_GATEWAY_NODE_REGISTRY_HPP

#include "connection.hpp"
#include "../core/json.hpp"
#include "../core/rate_limiter.hpp"
#include <string>
#include <vector>
#include <set>
#include <map>
#include <mutex>
#include <functional>
#include <cstdint>

namespace meshgate {

// Snapshot of one registered node
struct NodeInfo {
    std::string id;
    std::string name;
    std::vector<std::string> capabilities;
    std::string session_id;
    std::string agent_name;
    std::set<std::string> groups;
    int64_t connected_at;
    int64_t last_pong_at;
    std::string transport;

    NodeInfo() : connected_at(0), last_pong_at(0) {}
};

// Authoritative table of connected nodes
class NodeRegistry {
public:
    typedef std::function<int64_t()> Clock;
    typedef std::function<std::string()> IdSource;
    typedef std::function<void(const std::string& node_id)> DepartureHook;

    // A null clock means wall-clock milliseconds. A null id source means
    // 16 random bytes in hex; an empty id from it is a failure.
    NodeRegistry(size_t max_nodes, int max_messages, int64_t window_ms,
                 Clock clock = Clock(), IdSource id_source = IdSource());

    // Runs under the registry lock for every evicted node, before removal.
    // Must not call back into the registry.
    void set_departure_hook(DepartureHook hook);

    // Admit a node. False when the registry is at capacity or no id
    // could be drawn from the random source.
    bool register_node(ConnectionPtr conn,
                       const std::string& name,
                       const std::vector<std::string>& capabilities,
                       const std::string& session_id,
                       const std::string& agent_name,
                       NodeInfo& out);

    // Idempotent. Group membership must already be detached by the caller.
    bool unregister_node(const std::string& id, bool close_connection = true);

    bool get_node(const std::string& id, NodeInfo& out) const;
    bool has_node(const std::string& id) const;
    std::vector<std::string> node_ids() const;
    size_t node_count() const;
    size_t max_nodes() const { return max_nodes_; }

    // Fixed-window rate limiting. Unknown ids are never limited.
    bool is_rate_limited(const std::string& id) const;
    void record_message(const std::string& id);

    // lastPongAt = now
    void update_ping(const std::string& id);

    // Mirror of group membership on the node record.
    // add_group is false once the node has left the registry.
    bool add_group(const std::string& id, const std::string& group_id);
    void remove_group(const std::string& id, const std::string& group_id);

    // Evict nodes silent for longer than timeout_ms; returns the count
    size_t remove_stale_nodes(int64_t timeout_ms);

    // Best-effort delivery, performed outside the lock
    bool send_to_node(const std::string& id, const std::string& text);
    size_t broadcast_to_nodes(const std::vector<std::string>& ids, const std::string& text);
    size_t broadcast_to_all(const std::string& text);

    std::vector<NodeInfo> get_nodes_by_session(const std::string& session_id) const;

    Json get_stats() const;

    int64_t now() const;

private:
    struct NodeEntry {
        NodeInfo info;
        ConnectionPtr conn;
        FixedWindowLimiter limiter;

        NodeEntry(int max_messages, int64_t window_ms)
            : limiter(max_messages, window_ms) {}
    };

    static const int MAX_ID_ATTEMPTS = 8;

    // Empty when the random source fails
    std::string generate_node_id() const;

    size_t max_nodes_;
    int max_messages_;
    int64_t window_ms_;
    Clock clock_;
    IdSource id_source_;
    DepartureHook departure_hook_;

    std::map<std::string, NodeEntry> nodes_;
    mutable std::mutex mutex_;
};

} // namespace meshgate

#endif // MESHGATE_GATEWAY_NODE_REGISTRY_HPP
