#include <kingraph/graph/graph_analytics.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/core/text.hpp>

#include <algorithm>
#include <cmath>
#include <set>

namespace kingraph {

namespace {

constexpr const char* kComponent = "GraphAnalytics";

int Percent(size_t count, size_t total) {
    if (total == 0) {
        return 0;
    }
    return static_cast<int>(std::lround(100.0 * static_cast<double>(count) /
                                        static_cast<double>(total)));
}

void ObserveYear(DateRange& range, const std::optional<std::string>& date) {
    if (!date) {
        return;
    }
    auto year = ExtractYear(*date);
    if (!year) {
        return;
    }
    if (!range.earliest || *year < *range.earliest) range.earliest = year;
    if (!range.latest || *year > *range.latest) range.latest = year;
}

// Every id at either end of a parent, step, adoptive, spouse, child or
// adopted-child edge.
std::set<std::string> ConnectedPeople(const FamilyGraph& graph) {
    std::set<std::string> connected;
    for (const auto& [id, node] : graph.nodes) {
        std::vector<std::string> targets = node.BiologicalParents();
        for (const auto& t : node.AllStepParents()) targets.push_back(t);
        for (const auto& t : node.AllAdoptiveParents()) targets.push_back(t);
        for (const auto& t : node.SpouseIds()) targets.push_back(t);
        for (const auto& t : node.children) targets.push_back(t);
        for (const auto& t : node.adopted_children) targets.push_back(t);
        if (targets.empty()) {
            continue;
        }
        connected.insert(id);
        connected.insert(targets.begin(), targets.end());
    }
    return connected;
}

} // anonymous namespace

std::string ComponentDisplayName(const FamilyComponent& component, size_t index) {
    if (component.name) {
        return *component.name;
    }
    return "Family " + std::to_string(index + 1);
}

AnalyticsReport ComputeAnalytics(const FamilyGraph& graph, const AnalyticsOptions& options) {
    AnalyticsReport report;
    report.total_people = graph.Size();

    // -- Completeness, relationships, dates --
    size_t with_birth = 0;
    size_t with_death = 0;
    size_t with_sex = 0;
    for (const auto& [id, node] : graph.nodes) {
        if (node.birth_date) ++with_birth;
        if (node.death_date) ++with_death;
        if (node.sex) ++with_sex;
        if (node.IsLiving()) ++report.living_people;

        if (!node.BiologicalParents().empty()) ++report.relationships.with_parents;
        if (!node.spouses.empty()) ++report.relationships.with_spouse;
        if (!node.children.empty()) ++report.relationships.with_children;
        report.relationships.parent_child_links += node.children.size();

        ObserveYear(report.date_range, node.birth_date);
        ObserveYear(report.date_range, node.death_date);
        for (const auto& spouse : node.spouses) {
            ObserveYear(report.date_range, spouse.marriage_date);
            ObserveYear(report.date_range, spouse.divorce_date);
        }
    }
    report.completeness.birth_date_percent = Percent(with_birth, report.total_people);
    report.completeness.death_date_percent = Percent(with_death, report.total_people);
    report.completeness.sex_percent = Percent(with_sex, report.total_people);
    if (report.date_range.earliest && report.date_range.latest) {
        report.date_range.span = *report.date_range.latest - *report.date_range.earliest;
    }

    // Couples recorded on both sides count once.
    std::set<std::pair<std::string, std::string>> couples;
    for (const auto& [id, node] : graph.nodes) {
        for (const auto& partner : node.SpouseIds()) {
            couples.emplace(std::min(id, partner), std::max(id, partner));
        }
    }
    report.relationships.spouse_links = couples.size();

    // -- Orphans --
    auto connected = ConnectedPeople(graph);
    for (const auto& [id, node] : graph.nodes) {
        if (connected.count(id) == 0) {
            report.orphaned_people.push_back(id);
        }
    }
    report.relationships.orphaned = report.orphaned_people.size();

    // -- Collections: detected families and user collections together --
    auto components = FindComponents(graph);
    auto user_collections = UserCollections(graph);

    std::vector<CollectionSize> sizes;
    sizes.reserve(components.size() + user_collections.size());
    for (size_t i = 0; i < components.size(); ++i) {
        sizes.push_back({ComponentDisplayName(components[i], i), components[i].Size()});
    }
    for (const auto& collection : user_collections) {
        sizes.push_back({collection.name, collection.Size()});
    }

    auto& stats = report.collections;
    stats.total_families = components.size();
    stats.total_user_collections = user_collections.size();
    stats.total_collections = sizes.size();
    if (!sizes.empty()) {
        size_t total = 0;
        for (const auto& s : sizes) total += s.size;
        stats.average_size = static_cast<double>(total) / static_cast<double>(sizes.size());
        stats.largest = *std::max_element(sizes.begin(), sizes.end(),
                                          [](const CollectionSize& a, const CollectionSize& b) {
                                              return a.size < b.size;
                                          });
        stats.smallest = *std::min_element(sizes.begin(), sizes.end(),
                                           [](const CollectionSize& a, const CollectionSize& b) {
                                               return a.size < b.size;
                                           });
    }

    // -- Cross-collection bridges --
    auto connections = CrossCollectionConnections(graph);
    std::set<std::string> bridge_people;
    for (const auto& connection : connections) {
        bridge_people.insert(connection.bridge_people.begin(), connection.bridge_people.end());
    }
    report.cross_collection.total_connections = connections.size();
    report.cross_collection.total_bridge_people = bridge_people.size();
    if (connections.size() > options.top_connections) {
        connections.resize(options.top_connections);
    }
    report.cross_collection.top_connections = std::move(connections);

    LogDebug(kComponent, "Analytics: " + std::to_string(report.total_people) + " people, " +
                         std::to_string(stats.total_families) + " families, " +
                         std::to_string(report.relationships.orphaned) + " orphaned");
    return report;
}

} // namespace kingraph
