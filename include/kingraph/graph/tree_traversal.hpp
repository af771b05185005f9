#pragma once

#include <kingraph/core/result.hpp>
#include <kingraph/graph/family_graph.hpp>
#include <kingraph/model/relationship_types.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kingraph {

enum class TraversalKind {
    Ancestors,
    Descendants,
    Full,
};

enum class EdgeCategory {
    Parent,        // parent -> child, walked upward
    Spouse,
    Child,         // parent -> child, walked downward
    Relationship,  // step, adoptive, foster, guardian; carries type and label
};

const char* TraversalKindName(TraversalKind kind);
const char* EdgeCategoryName(EdgeCategory category);

// ---------------------------------------------------------------------------
// TreeEdge: one edge of a traversal result. Parent and child edges always
// point from the parent to the child.
// ---------------------------------------------------------------------------
struct TreeEdge {
    std::string from;
    std::string to;
    EdgeCategory category = EdgeCategory::Parent;
    std::optional<std::string> relationship_type;
    std::optional<std::string> label;

    bool operator==(const TreeEdge& other) const {
        return from == other.from && to == other.to && category == other.category &&
               relationship_type == other.relationship_type && label == other.label;
    }
    bool operator!=(const TreeEdge& other) const { return !(*this == other); }
    bool operator<(const TreeEdge& other) const;
};

// Keep people associated with `place` through any enabled place field.
// Matching ignores case, surrounding whitespace and wikilink brackets.
struct PlaceFilter {
    std::string place;
    bool birth = true;
    bool death = true;
    bool burial = true;
    bool marriage = true;
};

struct TraversalOptions {
    TraversalKind kind = TraversalKind::Ancestors;
    int max_generations = 0;  // 0 = unbounded; ignored by Full
    bool include_spouses = true;
    bool include_step_parents = false;
    bool include_adoptive_parents = false;  // also adopted children going down
    bool include_foster_parents = false;
    bool include_guardians = false;
    std::optional<std::string> collection_filter;
    std::optional<PlaceFilter> place_filter;
};

struct FamilyTree {
    std::string root_id;
    std::map<std::string, PersonNode> nodes;
    std::vector<TreeEdge> edges;

    [[nodiscard]] bool HasNode(std::string_view id) const {
        return nodes.find(std::string(id)) != nodes.end();
    }
};

// Whether `node` passes the collection and place filters of `options`.
bool MatchesFilters(const PersonNode& node, const TraversalOptions& options);

// ---------------------------------------------------------------------------
// Traverse: walk the graph from `root_id`.
//
// The root is always included. A node rejected by the filters is left out
// together with everything reachable only through it. Cycles in malformed
// data are cut at the first repeated node of the current path and logged at
// warning level. When `registry` is given, edges produced by a custom
// relationship type carry that type's display name as label.
//
// Returns Error{category = NotFound} when the root does not exist.
// ---------------------------------------------------------------------------
Result<FamilyTree, Error> Traverse(const FamilyGraph& graph, std::string_view root_id,
                                   const TraversalOptions& options,
                                   const RelationshipTypeRegistry* registry = nullptr);

// All ancestors of `id` through biological and gender-neutral parent edges.
Result<std::vector<PersonNode>, Error> AncestorsOf(const FamilyGraph& graph,
                                                   std::string_view id, bool include_root);

// All descendants of `id`, optionally with their spouses.
Result<std::vector<PersonNode>, Error> DescendantsOf(const FamilyGraph& graph,
                                                     std::string_view id, bool include_root,
                                                     bool include_spouses);

} // namespace kingraph
