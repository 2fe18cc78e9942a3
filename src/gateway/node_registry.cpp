#include <meshgate/gateway/node_registry.hpp>
#include <meshgate/core/logger.hpp>
#include <meshgate/core/utils.hpp>
#include <utility>

namespace meshgate {

NodeRegistry::NodeRegistry(size_t max_nodes, int max_messages, int64_t window_ms,
                           Clock clock, IdSource id_source)
    : max_nodes_(max_nodes)
    , max_messages_(max_messages)
    , window_ms_(window_ms)
    , clock_(clock)
    , id_source_(id_source) {
    if (!clock_) {
        clock_ = current_timestamp_ms;
    }
    if (!id_source_) {
        id_source_ = []() { return random_hex(16); };
    }
}

void NodeRegistry::set_departure_hook(DepartureHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    departure_hook_ = hook;
}

int64_t NodeRegistry::now() const {
    return clock_();
}

std::string NodeRegistry::generate_node_id() const {
    for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
        std::string id = id_source_();
        if (id.empty()) {
            LOG_ERROR("Random source failed, cannot assign a node id");
            return "";
        }
        if (nodes_.find(id) == nodes_.end()) {
            return id;
        }
    }
    LOG_ERROR("No unused node id after %d attempts", MAX_ID_ATTEMPTS);
    return "";
}

// ============================================================================
// Registration
// ============================================================================

bool NodeRegistry::register_node(ConnectionPtr conn,
                                 const std::string& name,
                                 const std::vector<std::string>& capabilities,
                                 const std::string& session_id,
                                 const std::string& agent_name,
                                 NodeInfo& out) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (nodes_.size() >= max_nodes_) {
        LOG_WARN("Registry full (%zu nodes), rejecting '%s'", max_nodes_, name.c_str());
        return false;
    }

    int64_t t = now();
    std::string id = generate_node_id();
    if (id.empty()) {
        return false;
    }

    NodeEntry entry(max_messages_, window_ms_);
    entry.info.id = id;
    entry.info.name = name;
    entry.info.capabilities = capabilities;
    entry.info.session_id = session_id;
    entry.info.agent_name = agent_name;
    entry.info.connected_at = t;
    entry.info.last_pong_at = t;
    entry.info.transport = conn ? conn->transport() : "";
    entry.conn = conn;

    out = entry.info;
    nodes_.insert(std::make_pair(entry.info.id, entry));

    LOG_INFO("Node registered: %s (%s) via %s [%zu/%zu]",
             name.c_str(), out.id.c_str(), out.transport.c_str(),
             nodes_.size(), max_nodes_);
    return true;
}

bool NodeRegistry::unregister_node(const std::string& id, bool close_connection) {
    ConnectionPtr conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, NodeEntry>::iterator it = nodes_.find(id);
        if (it == nodes_.end()) return false;

        conn = it->second.conn;
        LOG_INFO("Node unregistered: %s (%s)", it->second.info.name.c_str(), id.c_str());
        nodes_.erase(it);
    }

    if (close_connection && conn) {
        conn->close();
    }
    return true;
}

// ============================================================================
// Lookup
// ============================================================================

bool NodeRegistry::get_node(const std::string& id, NodeInfo& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, NodeEntry>::const_iterator it = nodes_.find(id);
    if (it == nodes_.end()) return false;
    out = it->second.info;
    return true;
}

bool NodeRegistry::has_node(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.find(id) != nodes_.end();
}

std::vector<std::string> NodeRegistry::node_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (std::map<std::string, NodeEntry>::const_iterator it = nodes_.begin();
         it != nodes_.end(); ++it) {
        ids.push_back(it->first);
    }
    return ids;
}

size_t NodeRegistry::node_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

std::vector<NodeInfo> NodeRegistry::get_nodes_by_session(const std::string& session_id) const {
    std::vector<NodeInfo> result;
    if (session_id.empty()) return result;

    std::lock_guard<std::mutex> lock(mutex_);
    for (std::map<std::string, NodeEntry>::const_iterator it = nodes_.begin();
         it != nodes_.end(); ++it) {
        if (it->second.info.session_id == session_id) {
            result.push_back(it->second.info);
        }
    }
    return result;
}

// ============================================================================
// Rate limiting and liveness
// ============================================================================

bool NodeRegistry::is_rate_limited(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, NodeEntry>::const_iterator it = nodes_.find(id);
    if (it == nodes_.end()) return false;
    return !it->second.limiter.check(now()).allowed;
}

void NodeRegistry::record_message(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, NodeEntry>::iterator it = nodes_.find(id);
    if (it != nodes_.end()) {
        it->second.limiter.record(now());
    }
}

void NodeRegistry::update_ping(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, NodeEntry>::iterator it = nodes_.find(id);
    if (it != nodes_.end()) {
        it->second.info.last_pong_at = now();
    }
}

bool NodeRegistry::add_group(const std::string& id, const std::string& group_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, NodeEntry>::iterator it = nodes_.find(id);
    if (it == nodes_.end()) {
        return false;
    }
    it->second.info.groups.insert(group_id);
    return true;
}

void NodeRegistry::remove_group(const std::string& id, const std::string& group_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, NodeEntry>::iterator it = nodes_.find(id);
    if (it != nodes_.end()) {
        it->second.info.groups.erase(group_id);
    }
}

size_t NodeRegistry::remove_stale_nodes(int64_t timeout_ms) {
    std::vector<ConnectionPtr> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t t = now();

        std::map<std::string, NodeEntry>::iterator it = nodes_.begin();
        while (it != nodes_.end()) {
            if (t - it->second.info.last_pong_at > timeout_ms) {
                LOG_WARN("Evicting stale node %s (%s), silent for %lld ms",
                         it->second.info.name.c_str(), it->first.c_str(),
                         static_cast<long long>(t - it->second.info.last_pong_at));
                if (departure_hook_) {
                    departure_hook_(it->first);
                }
                if (it->second.conn) {
                    to_close.push_back(it->second.conn);
                }
                it = nodes_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (size_t i = 0; i < to_close.size(); ++i) {
        to_close[i]->close();
    }
    return to_close.size();
}

// ============================================================================
// Delivery
// ============================================================================

bool NodeRegistry::send_to_node(const std::string& id, const std::string& text) {
    ConnectionPtr conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, NodeEntry>::const_iterator it = nodes_.find(id);
        if (it == nodes_.end()) return false;
        conn = it->second.conn;
    }

    if (!conn) return false;
    if (!conn->send(text)) {
        LOG_DEBUG("Failed to deliver message to node %s", id.c_str());
        return false;
    }
    return true;
}

size_t NodeRegistry::broadcast_to_nodes(const std::vector<std::string>& ids,
                                        const std::string& text) {
    size_t sent = 0;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (send_to_node(ids[i], text)) {
            ++sent;
        }
    }
    return sent;
}

size_t NodeRegistry::broadcast_to_all(const std::string& text) {
    return broadcast_to_nodes(node_ids(), text);
}

// ============================================================================
// Stats
// ============================================================================

Json NodeRegistry::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    // sessionId -> node ids, in registry order
    std::map<std::string, std::vector<const NodeInfo*> > sessions;
    Json nodes = Json::array();

    for (std::map<std::string, NodeEntry>::const_iterator it = nodes_.begin();
         it != nodes_.end(); ++it) {
        const NodeInfo& n = it->second.info;

        Json node = Json::object();
        node["id"] = n.id;
        node["name"] = n.name;
        node["capabilities"] = n.capabilities;
        node["groupCount"] = n.groups.size();
        node["connectedAt"] = n.connected_at;
        node["lastPongAt"] = n.last_pong_at;
        node["transport"] = n.transport;
        if (!n.session_id.empty()) node["sessionId"] = n.session_id;
        if (!n.agent_name.empty()) node["agentName"] = n.agent_name;
        nodes.push_back(node);

        if (!n.session_id.empty()) {
            sessions[n.session_id].push_back(&n);
        }
    }

    Json session_ids = Json::array();
    Json session_nodes = Json::array();
    for (std::map<std::string, std::vector<const NodeInfo*> >::const_iterator it = sessions.begin();
         it != sessions.end(); ++it) {
        session_ids.push_back(it->first);

        Json entry = Json::object();
        entry["sessionId"] = it->first;
        entry["agentName"] = it->second.front()->agent_name;
        Json ids = Json::array();
        for (size_t i = 0; i < it->second.size(); ++i) {
            ids.push_back(it->second[i]->id);
        }
        entry["nodeIds"] = ids;
        session_nodes.push_back(entry);
    }

    Json stats = Json::object();
    stats["totalNodes"] = nodes_.size();
    stats["maxNodes"] = max_nodes_;
    stats["activeSessions"] = sessions.size();
    stats["sessionIds"] = session_ids;
    stats["sessionNodes"] = session_nodes;
    stats["nodes"] = nodes;
    return stats;
}

} // namespace meshgate
