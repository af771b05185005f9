#include <kingraph/graph/tree_traversal.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/core/text.hpp>

#include <algorithm>
#include <deque>
#include <set>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace kingraph {

namespace {

constexpr const char* kComponent = "TreeTraversal";

std::string NormalizePlace(std::string_view value) {
    return ToLower(StripWikilink(value));
}

bool PlaceMatches(const std::optional<std::string>& value, const std::string& wanted) {
    return value && NormalizePlace(*value) == wanted;
}

// Spouses in display order: indexed ones by ordinal, unindexed ones last.
std::vector<const SpouseRelation*> OrderedSpouses(const PersonNode& node) {
    std::vector<const SpouseRelation*> out;
    out.reserve(node.spouses.size());
    for (const auto& s : node.spouses) {
        out.push_back(&s);
    }
    std::stable_sort(out.begin(), out.end(), [](const SpouseRelation* a, const SpouseRelation* b) {
        return std::make_tuple(a->ordinal == 0, a->ordinal) <
               std::make_tuple(b->ordinal == 0, b->ordinal);
    });
    return out;
}

// One labeled non-blood parent link of a node.
struct SideLink {
    std::string id;
    const char* type;
    const char* label;
};

// Step, adoptive, foster and guardian links of `node` enabled by `options`.
std::vector<SideLink> SideParents(const PersonNode& node, const TraversalOptions& options) {
    std::vector<SideLink> out;
    if (options.include_step_parents) {
        for (const auto& id : node.step_fathers) out.push_back({id, "step_parent", "Step-father"});
        for (const auto& id : node.step_mothers) out.push_back({id, "step_parent", "Step-mother"});
        for (const auto& id : node.step_parents) out.push_back({id, "step_parent", "Step-parent"});
    }
    if (options.include_adoptive_parents) {
        if (node.adoptive_father) {
            out.push_back({*node.adoptive_father, "adoptive_parent", "Adoptive father"});
        }
        if (node.adoptive_mother) {
            out.push_back({*node.adoptive_mother, "adoptive_parent", "Adoptive mother"});
        }
        for (const auto& id : node.adoptive_parents) {
            out.push_back({id, "adoptive_parent", "Adoptive parent"});
        }
    }
    if (options.include_foster_parents) {
        for (const auto& id : node.foster_parents) out.push_back({id, "foster_parent", "Foster parent"});
    }
    if (options.include_guardians) {
        for (const auto& id : node.guardians) out.push_back({id, "guardian", "Guardian"});
    }
    return out;
}

// Inverse of SideParents: step, adopted, foster and ward children of `node`.
std::vector<SideLink> SideChildren(const PersonNode& node, const TraversalOptions& options) {
    std::vector<SideLink> out;
    if (options.include_step_parents) {
        for (const auto& id : node.step_children) out.push_back({id, "step_child", "Step-child"});
    }
    if (options.include_adoptive_parents) {
        for (const auto& id : node.adopted_children) {
            out.push_back({id, "adopted_child", "Adopted child"});
        }
    }
    if (options.include_foster_parents) {
        for (const auto& id : node.foster_children) out.push_back({id, "foster_child", "Foster child"});
    }
    if (options.include_guardians) {
        for (const auto& id : node.wards) out.push_back({id, "ward", "Ward"});
    }
    return out;
}

// Dedup kind shared by both sides of a side link.
std::string LinkKind(std::string_view type) {
    if (type == "adoptive_parent" || type == "adopted_child") return "adoption";
    if (type == "step_parent" || type == "step_child") return "step";
    if (type == "foster_parent" || type == "foster_child") return "foster";
    if (type == "guardian" || type == "ward") return "guardianship";
    return std::string(type);
}

// ---------------------------------------------------------------------------
// Walker: state of one traversal call.
// ---------------------------------------------------------------------------
class Walker {
public:
    Walker(const FamilyGraph& graph, const TraversalOptions& options,
           const RelationshipTypeRegistry* registry, FamilyTree& tree)
        : graph_(graph), options_(options), registry_(registry), tree_(tree) {}

    void Ancestors(const PersonNode& node, int generation);
    void Descendants(const PersonNode& node, int generation);
    void Full(const PersonNode& root);

private:
    // Node `id` if it exists and passes the filters.
    const PersonNode* Admit(const std::string& id) const {
        const auto* node = graph_.Find(id);
        if (node == nullptr || !MatchesFilters(*node, options_)) {
            return nullptr;
        }
        return node;
    }

    void Include(const PersonNode& node) {
        tree_.nodes.emplace(node.id, node);
    }

    bool LimitReached(int generation) const {
        return options_.max_generations > 0 && generation >= options_.max_generations;
    }

    // Recursion guard: false when `id` is on the current path (a cycle) or
    // was already expanded at this generation or a lower one.
    bool ShouldExpand(const std::string& from, const std::string& id, int generation) {
        if (path_.count(id) != 0) {
            LogWarn(kComponent, "Cycle detected: '" + id + "' is its own ancestor or "
                                "descendant (reached from '" + from + "')");
            return false;
        }
        auto it = expanded_at_.find(id);
        return it == expanded_at_.end() || generation < it->second;
    }

    void EmitParentEdge(const std::string& parent, const PersonNode& child,
                        EdgeCategory category);
    void EmitSpouseEdge(const std::string& a, const std::string& b,
                        std::optional<std::string> type = std::nullopt);
    void EmitRelationshipEdge(const std::string& from, const std::string& to,
                              const char* type, const char* label);
    void Emit(std::string key, TreeEdge edge);

    // Override type of the spouse edge between the father and mother of
    // `child`, as recorded on either parent.
    std::optional<std::string> ParentCoupleOverride(const PersonNode& child) const;

    std::optional<std::string> LabelFor(const std::string& type_id) const {
        if (registry_ == nullptr) {
            return std::nullopt;
        }
        const auto* def = registry_->Find(type_id);
        return def ? std::optional<std::string>(def->name) : std::nullopt;
    }

    const FamilyGraph& graph_;
    const TraversalOptions& options_;
    const RelationshipTypeRegistry* registry_;
    FamilyTree& tree_;

    std::unordered_set<std::string> path_;
    std::unordered_map<std::string, int> expanded_at_;
    std::unordered_set<std::string> edge_keys_;
};

void Walker::Emit(std::string key, TreeEdge edge) {
    if (edge_keys_.insert(std::move(key)).second) {
        tree_.edges.push_back(std::move(edge));
    }
}

void Walker::EmitParentEdge(const std::string& parent, const PersonNode& child,
                            EdgeCategory category) {
    TreeEdge edge{parent, child.id, category, std::nullopt, std::nullopt};
    auto override_it = child.relationship_type_overrides.find(parent);
    if (override_it != child.relationship_type_overrides.end()) {
        edge.relationship_type = override_it->second;
        edge.label = LabelFor(override_it->second);
    }
    // One edge per parent/child pair whichever direction found it first.
    Emit("pc|" + parent + "|" + child.id, std::move(edge));
}

void Walker::EmitSpouseEdge(const std::string& a, const std::string& b,
                            std::optional<std::string> type) {
    const auto& lo = std::min(a, b);
    const auto& hi = std::max(a, b);
    TreeEdge edge{a, b, EdgeCategory::Spouse, type, std::nullopt};
    if (type) {
        edge.label = LabelFor(*type);
    }
    Emit("sp|" + lo + "|" + hi, std::move(edge));
}

void Walker::EmitRelationshipEdge(const std::string& from, const std::string& to,
                                  const char* type, const char* label) {
    // A side link seen from either end is one link. `from` is always the
    // parent side.
    Emit("rel|" + LinkKind(type) + "|" + from + "|" + to,
         TreeEdge{from, to, EdgeCategory::Relationship, std::string(type), std::string(label)});
}

// Override type of the spouse edge between `a` and `b`, from either side.
std::optional<std::string> SpouseOverride(const FamilyGraph& graph, const PersonNode& a,
                                          const std::string& b) {
    auto it = a.relationship_type_overrides.find(b);
    if (it != a.relationship_type_overrides.end()) {
        return it->second;
    }
    if (const auto* other = graph.Find(b)) {
        auto back = other->relationship_type_overrides.find(a.id);
        if (back != other->relationship_type_overrides.end()) {
            return back->second;
        }
    }
    return std::nullopt;
}

std::optional<std::string> Walker::ParentCoupleOverride(const PersonNode& child) const {
    const auto* father = graph_.Find(*child.father);
    if (father == nullptr) {
        return std::nullopt;
    }
    return SpouseOverride(graph_, *father, *child.mother);
}

// ---------------------------------------------------------------------------
// Ancestors
// ---------------------------------------------------------------------------
void Walker::Ancestors(const PersonNode& node, int generation) {
    if (LimitReached(generation)) {
        return;
    }
    expanded_at_[node.id] = generation;
    path_.insert(node.id);

    for (const auto& parent_id : node.BiologicalParents()) {
        const auto* parent = Admit(parent_id);
        if (parent == nullptr) {
            continue;
        }
        Include(*parent);
        EmitParentEdge(parent_id, node, EdgeCategory::Parent);
        if (ShouldExpand(node.id, parent_id, generation + 1)) {
            Ancestors(*parent, generation + 1);
        }
    }

    if (options_.include_spouses && node.father && node.mother &&
        tree_.HasNode(*node.father) && tree_.HasNode(*node.mother) &&
        *node.father != *node.mother) {
        EmitSpouseEdge(*node.father, *node.mother, ParentCoupleOverride(node));
    }

    // Not blood lines: emitted as leaves.
    for (const auto& link : SideParents(node, options_)) {
        if (const auto* side = Admit(link.id)) {
            Include(*side);
            EmitRelationshipEdge(link.id, node.id, link.type, link.label);
        }
    }

    path_.erase(node.id);
}

// ---------------------------------------------------------------------------
// Descendants
// ---------------------------------------------------------------------------
void Walker::Descendants(const PersonNode& node, int generation) {
    if (LimitReached(generation)) {
        return;
    }
    expanded_at_[node.id] = generation;
    path_.insert(node.id);

    if (options_.include_spouses) {
        for (const auto* relation : OrderedSpouses(node)) {
            if (const auto* spouse = Admit(relation->partner_id)) {
                Include(*spouse);
                EmitSpouseEdge(node.id, spouse->id, SpouseOverride(graph_, node, spouse->id));
            }
        }
    }

    for (const auto& child_id : node.children) {
        const auto* child = Admit(child_id);
        if (child == nullptr) {
            continue;
        }
        Include(*child);
        EmitParentEdge(node.id, *child, EdgeCategory::Child);
        if (ShouldExpand(node.id, child_id, generation + 1)) {
            Descendants(*child, generation + 1);
        }
    }

    // Not blood lines: emitted as leaves.
    for (const auto& link : SideChildren(node, options_)) {
        if (const auto* side = Admit(link.id)) {
            Include(*side);
            EmitRelationshipEdge(node.id, link.id, link.type, link.label);
        }
    }

    path_.erase(node.id);
}

// ---------------------------------------------------------------------------
// Full network (breadth-first, generation limit ignored)
// ---------------------------------------------------------------------------
void Walker::Full(const PersonNode& root) {
    std::deque<const PersonNode*> queue{&root};
    std::unordered_set<std::string> visited;

    auto enqueue = [&](const PersonNode& next) {
        Include(next);
        if (visited.count(next.id) == 0) {
            queue.push_back(&next);
        }
    };

    while (!queue.empty()) {
        const PersonNode& current = *queue.front();
        queue.pop_front();
        if (!visited.insert(current.id).second) {
            continue;
        }
        Include(current);

        for (const auto& parent_id : current.BiologicalParents()) {
            if (const auto* parent = Admit(parent_id)) {
                EmitParentEdge(parent_id, current, EdgeCategory::Parent);
                enqueue(*parent);
            }
        }

        if (options_.include_spouses) {
            if (current.father && current.mother && *current.father != *current.mother &&
                Admit(*current.father) && Admit(*current.mother)) {
                EmitSpouseEdge(*current.father, *current.mother, ParentCoupleOverride(current));
            }
            for (const auto* relation : OrderedSpouses(current)) {
                if (const auto* spouse = Admit(relation->partner_id)) {
                    EmitSpouseEdge(current.id, spouse->id,
                                   SpouseOverride(graph_, current, spouse->id));
                    enqueue(*spouse);
                }
            }
        }

        for (const auto& child_id : current.children) {
            if (const auto* child = Admit(child_id)) {
                EmitParentEdge(current.id, *child, EdgeCategory::Child);
                enqueue(*child);
            }
        }

        for (const auto& link : SideParents(current, options_)) {
            if (const auto* side = Admit(link.id)) {
                EmitRelationshipEdge(link.id, current.id, link.type, link.label);
                enqueue(*side);
            }
        }

        for (const auto& link : SideChildren(current, options_)) {
            if (const auto* side = Admit(link.id)) {
                EmitRelationshipEdge(current.id, link.id, link.type, link.label);
                enqueue(*side);
            }
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

const char* TraversalKindName(TraversalKind kind) {
    switch (kind) {
        case TraversalKind::Ancestors:   return "ancestors";
        case TraversalKind::Descendants: return "descendants";
        case TraversalKind::Full:        return "full";
    }
    return "ancestors";
}

const char* EdgeCategoryName(EdgeCategory category) {
    switch (category) {
        case EdgeCategory::Parent:       return "parent";
        case EdgeCategory::Spouse:       return "spouse";
        case EdgeCategory::Child:        return "child";
        case EdgeCategory::Relationship: return "relationship";
    }
    return "parent";
}

bool TreeEdge::operator<(const TreeEdge& other) const {
    return std::tie(from, to, category, relationship_type, label) <
           std::tie(other.from, other.to, other.category, other.relationship_type, other.label);
}

bool MatchesFilters(const PersonNode& node, const TraversalOptions& options) {
    if (options.collection_filter) {
        if (!node.collection ||
            !EqualsIgnoreCase(Trim(*node.collection), Trim(*options.collection_filter))) {
            return false;
        }
    }
    if (options.place_filter) {
        const auto& filter = *options.place_filter;
        const auto wanted = NormalizePlace(filter.place);
        bool matched = (filter.birth && PlaceMatches(node.birth_place, wanted)) ||
                       (filter.death && PlaceMatches(node.death_place, wanted)) ||
                       (filter.burial && PlaceMatches(node.burial_place, wanted));
        if (!matched && filter.marriage) {
            matched = std::any_of(node.spouses.begin(), node.spouses.end(),
                                  [&](const SpouseRelation& s) {
                                      return PlaceMatches(s.location, wanted);
                                  });
        }
        if (!matched) {
            return false;
        }
    }
    return true;
}

Result<FamilyTree, Error> Traverse(const FamilyGraph& graph, std::string_view root_id,
                                   const TraversalOptions& options,
                                   const RelationshipTypeRegistry* registry) {
    const auto* root = graph.Find(root_id);
    if (root == nullptr) {
        LogDebug(kComponent, "Root '" + std::string(root_id) + "' not found");
        return Result<FamilyTree, Error>::Err(Error::NotFound("Traverse", std::string(root_id)));
    }

    FamilyTree tree;
    tree.root_id = root->id;
    tree.nodes.emplace(root->id, *root);

    Walker walker(graph, options, registry, tree);
    switch (options.kind) {
        case TraversalKind::Ancestors:
            walker.Ancestors(*root, 0);
            break;
        case TraversalKind::Descendants:
            walker.Descendants(*root, 0);
            break;
        case TraversalKind::Full:
            walker.Full(*root);
            break;
    }

    LogDebug(kComponent, std::string(TraversalKindName(options.kind)) + " traversal from '" +
                         tree.root_id + "': " + std::to_string(tree.nodes.size()) + " nodes, " +
                         std::to_string(tree.edges.size()) + " edges");
    return Result<FamilyTree, Error>::Ok(std::move(tree));
}

namespace {

std::vector<PersonNode> CollectNodes(const FamilyTree& tree, bool include_root) {
    std::vector<PersonNode> out;
    out.reserve(tree.nodes.size());
    for (const auto& [id, node] : tree.nodes) {
        if (include_root || id != tree.root_id) {
            out.push_back(node);
        }
    }
    return out;
}

} // anonymous namespace

Result<std::vector<PersonNode>, Error> AncestorsOf(const FamilyGraph& graph,
                                                   std::string_view id, bool include_root) {
    TraversalOptions options;
    options.kind = TraversalKind::Ancestors;
    options.include_spouses = false;
    return Traverse(graph, id, options).Map([include_root](const FamilyTree& tree) {
        return CollectNodes(tree, include_root);
    });
}

Result<std::vector<PersonNode>, Error> DescendantsOf(const FamilyGraph& graph,
                                                     std::string_view id, bool include_root,
                                                     bool include_spouses) {
    TraversalOptions options;
    options.kind = TraversalKind::Descendants;
    options.include_spouses = include_spouses;
    return Traverse(graph, id, options).Map([include_root](const FamilyTree& tree) {
        return CollectNodes(tree, include_root);
    });
}

} // namespace kingraph
