#include <catch2/catch.hpp>
#include <meshgate/gateway/broadcast.hpp>
#include "test_helpers.hpp"

#include <thread>
#include <vector>

using namespace meshgate;
using meshgate::testing::QuietLogs;

TEST_CASE("groups - create seeds the creator", "[groups]") {
    QuietLogs quiet;
    GroupManager groups;

    Group g = groups.create_group("news", "n1", "daily");
    REQUIRE_FALSE(g.id.empty());
    REQUIRE(g.name == "news");
    REQUIRE(g.description == "daily");
    REQUIRE(g.created_by == "n1");
    REQUIRE(g.members.count("n1") == 1);
    REQUIRE(groups.has_group(g.id));
    REQUIRE(groups.group_count() == 1);
}

TEST_CASE("groups - lookup by name returns the first created", "[groups]") {
    QuietLogs quiet;
    GroupManager groups;

    Group first = groups.create_group("dup", "n1");
    groups.create_group("dup", "n2");

    Group found;
    REQUIRE(groups.get_group_by_name("dup", found));
    REQUIRE(found.id == first.id);
    REQUIRE_FALSE(groups.get_group_by_name("missing", found));

    Group again = groups.get_or_create_group("dup", "n3");
    REQUIRE(again.id == first.id);
    REQUIRE(groups.group_count() == 2);
}

TEST_CASE("groups - membership", "[groups]") {
    QuietLogs quiet;
    GroupManager groups;
    Group g = groups.create_group("team", "n1");

    REQUIRE(groups.add_node_to_group(g.id, "n3"));
    REQUIRE(groups.add_node_to_group(g.id, "n2"));
    REQUIRE_FALSE(groups.add_node_to_group("nope", "n2"));

    std::vector<std::string> members = groups.get_group_members(g.id);
    REQUIRE(members.size() == 3);
    REQUIRE(members[0] == "n1");
    REQUIRE(members[1] == "n2");
    REQUIRE(members[2] == "n3");

    REQUIRE(groups.remove_node_from_group(g.id, "n2"));
    REQUIRE_FALSE(groups.remove_node_from_group(g.id, "n2"));
    REQUIRE(groups.get_group_members(g.id).size() == 2);
    REQUIRE(groups.get_group_members("nope").empty());
}

TEST_CASE("groups - leaving everything keeps empty groups joinable", "[groups]") {
    QuietLogs quiet;
    GroupManager groups;
    Group a = groups.create_group("a", "n1");
    Group b = groups.create_group("b", "n1");
    groups.create_group("c", "n2");

    REQUIRE(groups.get_node_groups("n1").size() == 2);

    std::vector<std::string> left = groups.remove_node_from_all_groups("n1");
    REQUIRE(left.size() == 2);
    REQUIRE(groups.get_node_groups("n1").empty());

    REQUIRE(groups.has_group(a.id));
    REQUIRE(groups.add_node_to_group(b.id, "n9"));
    REQUIRE(groups.group_count() == 3);
}

TEST_CASE("groups - delete", "[groups]") {
    QuietLogs quiet;
    GroupManager groups;
    Group g = groups.create_group("gone", "n1");
    REQUIRE(groups.delete_group(g.id));
    REQUIRE_FALSE(groups.delete_group(g.id));
    REQUIRE_FALSE(groups.has_group(g.id));
}

TEST_CASE("groups - join_or_create reports creation", "[groups]") {
    QuietLogs quiet;
    GroupManager groups;
    bool created = false;

    Group g1 = groups.join_or_create("x", "n1", "", &created);
    REQUIRE(created);
    Group g2 = groups.join_or_create("x", "n2", "", &created);
    REQUIRE_FALSE(created);
    REQUIRE(g1.id == g2.id);
    REQUIRE(g2.members.size() == 2);
}

TEST_CASE("groups - id source failures create nothing", "[groups]") {
    QuietLogs quiet;
    GroupManager groups([]() { return std::string(); });

    REQUIRE(groups.create_group("a", "n1").id.empty());
    REQUIRE(groups.get_or_create_group("a", "n1").id.empty());

    bool created = true;
    Group g = groups.join_or_create("a", "n1", "", &created);
    REQUIRE(g.id.empty());
    REQUIRE_FALSE(created);
    REQUIRE(groups.group_count() == 0);
}

TEST_CASE("groups - concurrent join_or_create makes one group", "[groups][concurrency]") {
    QuietLogs quiet;
    GroupManager groups;
    std::vector<std::thread> threads;
    std::vector<std::string> ids(16);

    for (size_t i = 0; i < ids.size(); ++i) {
        threads.push_back(std::thread([&groups, &ids, i]() {
            ids[i] = groups.join_or_create("x", "n" + std::to_string(i), "").id;
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();

    REQUIRE(groups.group_count() == 1);
    for (size_t i = 1; i < ids.size(); ++i) {
        REQUIRE(ids[i] == ids[0]);
    }
    REQUIRE(groups.get_group_members(ids[0]).size() == ids.size());
}

TEST_CASE("groups - stats", "[groups][stats]") {
    QuietLogs quiet;
    GroupManager groups;
    Group g = groups.create_group("s", "n1", "desc");
    groups.add_node_to_group(g.id, "n2");
    groups.create_group("t", "n3");

    Json stats = groups.get_stats();
    REQUIRE(stats["totalGroups"] == 2);
    REQUIRE(stats["totalMemberships"] == 3);
    REQUIRE(stats["groups"].size() == 2);
}
