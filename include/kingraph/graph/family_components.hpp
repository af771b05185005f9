#pragma once

#include <kingraph/graph/family_graph.hpp>

#include <optional>
#include <string>
#include <vector>

namespace kingraph {

// ---------------------------------------------------------------------------
// FamilyComponent: a maximal set of people connected through parent,
// spouse or child edges.
// ---------------------------------------------------------------------------
struct FamilyComponent {
    // Most frequent `group_name` among the members; ties go to the
    // lexicographically smallest label. Unset when no member has a label.
    std::optional<std::string> name;
    std::vector<std::string> member_ids;  // sorted
    // Member with the earliest birth date; dated beats undated, then name.
    std::string representative_id;

    [[nodiscard]] size_t Size() const { return member_ids.size(); }
};

struct UserCollection {
    std::string name;
    std::vector<std::string> member_ids;  // sorted

    [[nodiscard]] size_t Size() const { return member_ids.size(); }
};

// Link between two user collections. `from_collection` sorts before
// `to_collection`.
struct CollectionConnection {
    std::string from_collection;
    std::string to_collection;
    std::vector<std::string> bridge_people;  // sorted
    size_t relationship_count = 0;           // distinct related person pairs
};

// Components ordered by size (largest first), then representative id.
std::vector<FamilyComponent> FindComponents(const FamilyGraph& graph);

// People grouped by `collection`, ordered by size (largest first), then name.
std::vector<UserCollection> UserCollections(const FamilyGraph& graph);

// Collection pairs joined by a direct parent, spouse or child edge, ordered
// by relationship count (highest first), then collection names.
std::vector<CollectionConnection> CrossCollectionConnections(const FamilyGraph& graph);

// Parent, spouse and child neighbours of `node`, deduplicated, in field order.
std::vector<std::string> DirectRelatives(const PersonNode& node);

} // namespace kingraph
