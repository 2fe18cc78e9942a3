#include <meshgate/gateway/broadcast.hpp>
#include <meshgate/core/logger.hpp>
#include <meshgate/core/utils.hpp>

namespace meshgate {

GroupManager::GroupManager(IdSource id_source)
    : next_seq_(0)
    , id_source_(id_source) {
    if (!id_source_) {
        id_source_ = []() { return random_hex(16); };
    }
}

// ============================================================================
// Creation
// ============================================================================

std::map<std::string, GroupManager::GroupEntry>::iterator
GroupManager::create_locked(const std::string& name, const std::string& creator_node_id,
                            const std::string& description) {
    std::string id;
    for (int attempt = 0; attempt < MAX_ID_ATTEMPTS && id.empty(); ++attempt) {
        std::string candidate = id_source_();
        if (candidate.empty()) {
            LOG_ERROR("Random source failed, cannot create '%s'", name.c_str());
            return groups_.end();
        }
        if (groups_.find(candidate) == groups_.end()) {
            id = candidate;
        }
    }
    if (id.empty()) {
        LOG_ERROR("No unused group id for '%s'", name.c_str());
        return groups_.end();
    }

    GroupEntry entry;
    entry.group.id = id;
    entry.group.name = name;
    entry.group.description = description;
    entry.group.created_at = current_timestamp_ms();
    entry.group.created_by = creator_node_id;
    if (!creator_node_id.empty()) {
        entry.group.members.insert(creator_node_id);
    }
    entry.seq = next_seq_++;

    LOG_INFO("Group created: %s (%s) by %s", name.c_str(), id.c_str(), creator_node_id.c_str());
    return groups_.insert(std::make_pair(id, entry)).first;
}

std::string GroupManager::find_by_name_locked(const std::string& name) const {
    std::map<std::string, GroupEntry>::const_iterator best = groups_.end();
    for (std::map<std::string, GroupEntry>::const_iterator it = groups_.begin();
         it != groups_.end(); ++it) {
        if (it->second.group.name == name &&
            (best == groups_.end() || it->second.seq < best->second.seq)) {
            best = it;
        }
    }
    return best == groups_.end() ? std::string() : best->first;
}

Group GroupManager::create_group(const std::string& name, const std::string& creator_node_id,
                                 const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, GroupEntry>::iterator it = create_locked(name, creator_node_id, description);
    return it == groups_.end() ? Group() : it->second.group;
}

Group GroupManager::get_or_create_group(const std::string& name, const std::string& creator_node_id,
                                        const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, GroupEntry>::iterator it = groups_.find(find_by_name_locked(name));
    if (it != groups_.end()) {
        return it->second.group;
    }
    it = create_locked(name, creator_node_id, description);
    return it == groups_.end() ? Group() : it->second.group;
}

Group GroupManager::join_or_create(const std::string& name, const std::string& node_id,
                                   const std::string& description, bool* created) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, GroupEntry>::iterator it = groups_.find(find_by_name_locked(name));
    if (it == groups_.end()) {
        it = create_locked(name, node_id, description);
        if (it == groups_.end()) {
            if (created) *created = false;
            return Group();
        }
        if (created) *created = true;
        return it->second.group;
    }

    if (created) *created = false;
    it->second.group.members.insert(node_id);
    return it->second.group;
}

// ============================================================================
// Lookup
// ============================================================================

bool GroupManager::get_group(const std::string& group_id, Group& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, GroupEntry>::const_iterator it = groups_.find(group_id);
    if (it == groups_.end()) return false;
    out = it->second.group;
    return true;
}

bool GroupManager::get_group_by_name(const std::string& name, Group& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, GroupEntry>::const_iterator it = groups_.find(find_by_name_locked(name));
    if (it == groups_.end()) return false;
    out = it->second.group;
    return true;
}

bool GroupManager::has_group(const std::string& group_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.find(group_id) != groups_.end();
}

std::vector<std::string> GroupManager::get_node_groups(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (std::map<std::string, GroupEntry>::const_iterator it = groups_.begin();
         it != groups_.end(); ++it) {
        if (it->second.group.members.count(node_id)) {
            result.push_back(it->first);
        }
    }
    return result;
}

std::vector<std::string> GroupManager::get_group_members(const std::string& group_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, GroupEntry>::const_iterator it = groups_.find(group_id);
    if (it == groups_.end()) return std::vector<std::string>();
    // std::set iterates in sorted order
    return std::vector<std::string>(it->second.group.members.begin(),
                                    it->second.group.members.end());
}

std::vector<Group> GroupManager::get_all_groups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Group> result;
    result.reserve(groups_.size());
    for (std::map<std::string, GroupEntry>::const_iterator it = groups_.begin();
         it != groups_.end(); ++it) {
        result.push_back(it->second.group);
    }
    return result;
}

size_t GroupManager::group_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.size();
}

// ============================================================================
// Membership
// ============================================================================

bool GroupManager::add_node_to_group(const std::string& group_id, const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, GroupEntry>::iterator it = groups_.find(group_id);
    if (it == groups_.end()) return false;
    it->second.group.members.insert(node_id);
    return true;
}

bool GroupManager::remove_node_from_group(const std::string& group_id, const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, GroupEntry>::iterator it = groups_.find(group_id);
    if (it == groups_.end()) return false;
    return it->second.group.members.erase(node_id) > 0;
}

std::vector<std::string> GroupManager::remove_node_from_all_groups(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> left;
    for (std::map<std::string, GroupEntry>::iterator it = groups_.begin();
         it != groups_.end(); ++it) {
        if (it->second.group.members.erase(node_id) > 0) {
            left.push_back(it->first);
        }
    }
    if (!left.empty()) {
        LOG_DEBUG("Node %s left %zu group(s)", node_id.c_str(), left.size());
    }
    return left;
}

bool GroupManager::delete_group(const std::string& group_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.erase(group_id) > 0;
}

Json GroupManager::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t memberships = 0;
    Json groups = Json::array();
    for (std::map<std::string, GroupEntry>::const_iterator it = groups_.begin();
         it != groups_.end(); ++it) {
        const Group& g = it->second.group;
        memberships += g.members.size();

        Json entry = Json::object();
        entry["id"] = g.id;
        entry["name"] = g.name;
        entry["memberCount"] = g.members.size();
        entry["createdAt"] = g.created_at;
        entry["createdBy"] = g.created_by;
        if (!g.description.empty()) entry["description"] = g.description;
        groups.push_back(entry);
    }

    Json stats = Json::object();
    stats["totalGroups"] = groups_.size();
    stats["totalMemberships"] = memberships;
    stats["groups"] = groups;
    return stats;
}

} // namespace meshgate
