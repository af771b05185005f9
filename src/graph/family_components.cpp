#include <kingraph/graph/family_components.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/core/text.hpp>

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace kingraph {

namespace {

constexpr const char* kComponent = "FamilyComponents";

// Undirected adjacency over the structural relationship fields.
std::unordered_map<std::string, std::vector<std::string>> BuildAdjacency(
    const FamilyGraph& graph) {
    std::unordered_map<std::string, std::vector<std::string>> adjacency;
    for (const auto& [id, node] : graph.nodes) {
        adjacency[id];
        for (const auto& other : DirectRelatives(node)) {
            if (other == id || !graph.Contains(other)) {
                continue;
            }
            adjacency[id].push_back(other);
            adjacency[other].push_back(id);
        }
    }
    return adjacency;
}

std::optional<std::string> MostFrequentLabel(const FamilyGraph& graph,
                                             const std::vector<std::string>& members) {
    // std::map iterates labels in lexicographic order, so the first label
    // reaching the highest count is the tie-break winner.
    std::map<std::string, size_t> counts;
    for (const auto& id : members) {
        const auto* node = graph.Find(id);
        if (node && node->group_name && !node->group_name->empty()) {
            ++counts[*node->group_name];
        }
    }
    std::optional<std::string> best;
    size_t best_count = 0;
    for (const auto& [label, count] : counts) {
        if (count > best_count) {
            best = label;
            best_count = count;
        }
    }
    return best;
}

bool RepresentativeBefore(const PersonNode& a, const PersonNode& b) {
    auto ka = ParseDateKey(a.birth_date.value_or(""));
    auto kb = ParseDateKey(b.birth_date.value_or(""));
    if (DateKeyLess(ka, kb)) return true;
    if (DateKeyLess(kb, ka)) return false;
    return std::tie(a.name, a.id) < std::tie(b.name, b.id);
}

std::string Representative(const FamilyGraph& graph, const std::vector<std::string>& members) {
    const PersonNode* best = nullptr;
    for (const auto& id : members) {
        const auto* node = graph.Find(id);
        if (node && (best == nullptr || RepresentativeBefore(*node, *best))) {
            best = node;
        }
    }
    return best ? best->id : std::string();
}

std::optional<std::string> CollectionOf(const PersonNode& node) {
    if (!node.collection) {
        return std::nullopt;
    }
    auto trimmed = Trim(*node.collection);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

} // anonymous namespace

std::vector<std::string> DirectRelatives(const PersonNode& node) {
    std::vector<std::string> out = node.BiologicalParents();
    for (const auto& s : node.spouses) AppendUnique(out, s.partner_id);
    for (const auto& c : node.children) AppendUnique(out, c);
    return out;
}

// ---------------------------------------------------------------------------
// FindComponents
// ---------------------------------------------------------------------------
std::vector<FamilyComponent> FindComponents(const FamilyGraph& graph) {
    auto adjacency = BuildAdjacency(graph);
    std::unordered_set<std::string> visited;
    std::vector<FamilyComponent> components;

    for (const auto& [start, node] : graph.nodes) {
        if (visited.count(start) != 0) {
            continue;
        }
        FamilyComponent component;
        std::deque<std::string> queue{start};
        visited.insert(start);
        while (!queue.empty()) {
            auto current = std::move(queue.front());
            queue.pop_front();
            for (const auto& next : adjacency[current]) {
                if (visited.insert(next).second) {
                    queue.push_back(next);
                }
            }
            component.member_ids.push_back(std::move(current));
        }
        std::sort(component.member_ids.begin(), component.member_ids.end());
        component.name = MostFrequentLabel(graph, component.member_ids);
        component.representative_id = Representative(graph, component.member_ids);
        components.push_back(std::move(component));
    }

    std::sort(components.begin(), components.end(),
              [](const FamilyComponent& a, const FamilyComponent& b) {
                  if (a.Size() != b.Size()) return a.Size() > b.Size();
                  return a.representative_id < b.representative_id;
              });

    LogDebug(kComponent, "Found " + std::to_string(components.size()) + " components");
    return components;
}

// ---------------------------------------------------------------------------
// UserCollections
// ---------------------------------------------------------------------------
std::vector<UserCollection> UserCollections(const FamilyGraph& graph) {
    std::map<std::string, std::vector<std::string>> groups;
    for (const auto& [id, node] : graph.nodes) {
        if (auto name = CollectionOf(node)) {
            groups[*name].push_back(id);
        }
    }

    std::vector<UserCollection> collections;
    collections.reserve(groups.size());
    for (auto& [name, members] : groups) {
        collections.push_back(UserCollection{name, std::move(members)});
    }
    std::stable_sort(collections.begin(), collections.end(),
                     [](const UserCollection& a, const UserCollection& b) {
                         if (a.Size() != b.Size()) return a.Size() > b.Size();
                         return a.name < b.name;
                     });
    return collections;
}

// ---------------------------------------------------------------------------
// CrossCollectionConnections
// ---------------------------------------------------------------------------
std::vector<CollectionConnection> CrossCollectionConnections(const FamilyGraph& graph) {
    struct Accumulator {
        std::set<std::string> bridges;
        std::set<std::pair<std::string, std::string>> person_pairs;
    };
    std::map<std::pair<std::string, std::string>, Accumulator> pairs;

    for (const auto& [id, node] : graph.nodes) {
        auto own = CollectionOf(node);
        if (!own) {
            continue;
        }
        for (const auto& other_id : DirectRelatives(node)) {
            const auto* other = graph.Find(other_id);
            if (other == nullptr) {
                continue;
            }
            auto theirs = CollectionOf(*other);
            if (!theirs || *theirs == *own) {
                continue;
            }
            const auto& lo = std::min(*own, *theirs);
            const auto& hi = std::max(*own, *theirs);
            auto& acc = pairs[std::make_pair(lo, hi)];
            acc.bridges.insert(id);
            acc.bridges.insert(other_id);
            acc.person_pairs.emplace(std::min(id, other_id), std::max(id, other_id));
        }
    }

    std::vector<CollectionConnection> connections;
    connections.reserve(pairs.size());
    for (const auto& [key, acc] : pairs) {
        CollectionConnection connection;
        connection.from_collection = key.first;
        connection.to_collection = key.second;
        connection.bridge_people.assign(acc.bridges.begin(), acc.bridges.end());
        connection.relationship_count = acc.person_pairs.size();
        connections.push_back(std::move(connection));
    }
    std::stable_sort(connections.begin(), connections.end(),
                     [](const CollectionConnection& a, const CollectionConnection& b) {
                         return a.relationship_count > b.relationship_count;
                     });
    return connections;
}

} // namespace kingraph
