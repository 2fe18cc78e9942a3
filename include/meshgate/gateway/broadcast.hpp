#ifndef MESHGATE_GATEWAY_BROADCAST_HPP
#define MESHGATE_GATEWAY_BROADCAST_HPP

#include "../core/json.hpp"
#include <string>
#include <vector>
#include <set>
#include <map>
#include <mutex>
#include <cstdint>
#include <functional>

namespace meshgate {

// Named broadcast group (snapshot)
struct Group {
    std::string id;
    std::string name;
    std::string description;
    int64_t created_at;
    std::string created_by;
    std::set<std::string> members;

    Group() : created_at(0) {}
};

// Named groups and their many-to-many membership with nodes.
// Empty groups are kept and stay joinable by id or name.
class GroupManager {
public:
    typedef std::function<std::string()> IdSource;

    // A null id source means 16 random bytes in hex
    explicit GroupManager(IdSource id_source = IdSource());

    // New group with the creator as its first member. The returned group
    // has an empty id if creation failed.
    Group create_group(const std::string& name, const std::string& creator_node_id,
                       const std::string& description = "");

    // Existing group with this name, or a new one seeded with the creator
    Group get_or_create_group(const std::string& name, const std::string& creator_node_id,
                              const std::string& description = "");

    // Resolve by name (creating if absent) and add the node, in one step.
    // `created` reports whether a group was made.
    Group join_or_create(const std::string& name, const std::string& node_id,
                         const std::string& description, bool* created = NULL);

    bool get_group(const std::string& group_id, Group& out) const;

    // First-created group with this name
    bool get_group_by_name(const std::string& name, Group& out) const;

    bool has_group(const std::string& group_id) const;

    // False if the group does not exist
    bool add_node_to_group(const std::string& group_id, const std::string& node_id);

    // False if the group does not exist or the node was not a member
    bool remove_node_from_group(const std::string& group_id, const std::string& node_id);

    // Returns the ids of the groups the node left
    std::vector<std::string> remove_node_from_all_groups(const std::string& node_id);

    std::vector<std::string> get_node_groups(const std::string& node_id) const;

    // Sorted member ids; empty for an unknown group
    std::vector<std::string> get_group_members(const std::string& group_id) const;

    std::vector<Group> get_all_groups() const;

    bool delete_group(const std::string& group_id);

    size_t group_count() const;

    Json get_stats() const;

private:
    struct GroupEntry {
        Group group;
        uint64_t seq;            // Creation order
    };

    static const int MAX_ID_ATTEMPTS = 8;

    // Callers hold mutex_. groups_.end() when no id could be generated.
    std::map<std::string, GroupEntry>::iterator create_locked(const std::string& name,
                                                              const std::string& creator_node_id,
                                                              const std::string& description);
    // Id of the first-created group with this name, or empty
    std::string find_by_name_locked(const std::string& name) const;

    std::map<std::string, GroupEntry> groups_;
    uint64_t next_seq_;
    IdSource id_source_;
    mutable std::mutex mutex_;
};

} // namespace meshgate

#endif // MESHGATE_GATEWAY_BROADCAST_HPP
