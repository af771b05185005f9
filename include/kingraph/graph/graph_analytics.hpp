#pragma once

#include <kingraph/graph/family_components.hpp>
#include <kingraph/graph/family_graph.hpp>

#include <optional>
#include <string>
#include <vector>

namespace kingraph {

struct DataCompleteness {
    int birth_date_percent = 0;
    int death_date_percent = 0;
    int sex_percent = 0;
};

struct RelationshipMetrics {
    size_t with_parents = 0;
    size_t with_spouse = 0;
    size_t with_children = 0;
    size_t orphaned = 0;
    // Parent-child links counted once per pair, spouse links once per couple.
    size_t parent_child_links = 0;
    size_t spouse_links = 0;
};

struct DateRange {
    std::optional<int> earliest;
    std::optional<int> latest;
    std::optional<int> span;  // latest - earliest
};

struct CollectionSize {
    std::string name;
    size_t size = 0;
};

struct CollectionStats {
    size_t total_families = 0;          // detected components
    size_t total_user_collections = 0;
    size_t total_collections = 0;       // families + user collections
    double average_size = 0.0;
    std::optional<CollectionSize> largest;
    std::optional<CollectionSize> smallest;
};

struct CrossCollectionMetrics {
    size_t total_connections = 0;
    size_t total_bridge_people = 0;  // distinct people across all connections
    std::vector<CollectionConnection> top_connections;
};

// ---------------------------------------------------------------------------
// AnalyticsReport: aggregate statistics over one snapshot.
// ---------------------------------------------------------------------------
struct AnalyticsReport {
    size_t total_people = 0;
    size_t living_people = 0;
    DataCompleteness completeness;
    RelationshipMetrics relationships;
    DateRange date_range;
    CollectionStats collections;
    CrossCollectionMetrics cross_collection;

    // Ids of people with no parent, step, adoptive, spouse, child or
    // adopted-child edge. Sorted.
    std::vector<std::string> orphaned_people;
};

struct AnalyticsOptions {
    size_t top_connections = 5;
};

// Display name of a component: its label, or "Family <index + 1>" when it
// has none.
std::string ComponentDisplayName(const FamilyComponent& component, size_t index);

AnalyticsReport ComputeAnalytics(const FamilyGraph& graph, const AnalyticsOptions& options = {});

} // namespace kingraph
