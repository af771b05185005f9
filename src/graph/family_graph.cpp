#include <kingraph/graph/family_graph.hpp>

#include <kingraph/core/log.hpp>

#include <algorithm>

namespace kingraph {

namespace {

constexpr const char* kComponent = "GraphBuilder";

std::optional<Sex> SexOf(const FamilyGraph& graph, const std::string& id) {
    const auto* node = graph.Find(id);
    return node ? node->sex : std::nullopt;
}

size_t FilterList(std::vector<std::string>& list, const FamilyGraph& graph) {
    auto before = list.size();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const std::string& id) { return !graph.Contains(id); }),
               list.end());
    return before - list.size();
}

size_t FilterSlot(std::optional<std::string>& slot, const FamilyGraph& graph) {
    if (slot && !graph.Contains(*slot)) {
        slot.reset();
        return 1;
    }
    return 0;
}

bool Contains(const std::vector<std::string>& list, const std::string& id) {
    return std::find(list.begin(), list.end(), id) != list.end();
}

} // anonymous namespace

const PersonNode* FamilyGraph::Find(std::string_view id) const {
    auto it = nodes.find(id);
    return it == nodes.end() ? nullptr : &it->second;
}

std::optional<PersonNode> GetNode(const FamilyGraph& graph, std::string_view id) {
    const auto* node = graph.Find(id);
    if (node == nullptr) {
        return std::nullopt;
    }
    return *node;
}

GraphBuilder::GraphBuilder(const RecordExtractor& extractor, GraphBuildOptions options)
    : extractor_(extractor), options_(options) {}

// ---------------------------------------------------------------------------
// Build
// ---------------------------------------------------------------------------
FamilyGraph GraphBuilder::Build(const std::vector<RawRecord>& records) const {
    FamilyGraph graph;
    std::vector<std::string> citations;

    // -- Pass 1: extract and index --
    for (const auto& record : records) {
        ++graph.stats.records_seen;
        auto result = extractor_.Extract(record);
        if (result.IsErr()) {
            const auto& skip = result.Error();
            if (skip.kind == RecordKind::Person) {
                ++graph.stats.missing_identity;
                LogDebug(kComponent, record.path + ": skipped, " + skip.reason);
            } else {
                ++graph.stats.skipped_by_kind[skip.kind];
                for (auto& id : extractor_.CitedPeople(record)) {
                    citations.push_back(std::move(id));
                }
            }
            continue;
        }

        auto node = std::move(result).Value();
        auto id = node.id;
        if (!graph.nodes.emplace(id, std::move(node)).second) {
            ++graph.stats.duplicate_ids;
            LogWarn(kComponent, record.path + ": duplicate identity key '" + id +
                                "', keeping the first record");
        }
    }

    // -- Pass 2: reconcile --
    DropDanglingReferences(graph);
    ReconcileSideLinks(graph);
    if (options_.enable_gendered_parent_slots) {
        DistributeGenderedParents(graph);
    }
    ReconcileAdoptions(graph);
    InferChildren(graph);
    PruneOverrides(graph);

    for (const auto& id : citations) {
        auto it = graph.nodes.find(id);
        if (it != graph.nodes.end()) {
            ++it->second.evidence_count;
        }
    }

    if (options_.research_tracker != nullptr) {
        for (auto& [id, node] : graph.nodes) {
            if (auto scores = options_.research_tracker->ScoresFor(id)) {
                node.research_coverage = scores->coverage;
                node.research_conflicts = scores->conflicts;
            }
        }
    }

    graph.stats.people = graph.nodes.size();
    LogInfo(kComponent, "Built graph: " + std::to_string(graph.stats.people) + " people from " +
                        std::to_string(graph.stats.records_seen) + " records");
    return graph;
}

// ---------------------------------------------------------------------------
// Reconciliation steps
// ---------------------------------------------------------------------------

void GraphBuilder::DropDanglingReferences(FamilyGraph& graph) const {
    size_t dropped = 0;
    for (auto& [id, node] : graph.nodes) {
        dropped += FilterSlot(node.father, graph);
        dropped += FilterSlot(node.mother, graph);
        dropped += FilterSlot(node.adoptive_father, graph);
        dropped += FilterSlot(node.adoptive_mother, graph);
        for (auto* list : {&node.parents, &node.step_fathers, &node.step_mothers,
                           &node.step_parents, &node.adoptive_parents,
                           &node.adopted_children, &node.foster_parents,
                           &node.guardians, &node.children, &node.step_children,
                           &node.foster_children, &node.wards}) {
            dropped += FilterList(*list, graph);
        }
        auto before = node.spouses.size();
        node.spouses.erase(std::remove_if(node.spouses.begin(), node.spouses.end(),
                                          [&](const SpouseRelation& s) {
                                              return !graph.Contains(s.partner_id);
                                          }),
                           node.spouses.end());
        dropped += before - node.spouses.size();
    }
    graph.stats.dropped_references = dropped;
    if (dropped > 0) {
        LogDebug(kComponent, "Dropped " + std::to_string(dropped) +
                             " references to people outside the snapshot");
    }
}

void GraphBuilder::DistributeGenderedParents(FamilyGraph& graph) const {
    for (auto& [id, node] : graph.nodes) {
        std::vector<std::string> neutral_step;
        for (const auto& parent : node.step_parents) {
            auto sex = SexOf(graph, parent);
            if (sex == Sex::Male) {
                AppendUnique(node.step_fathers, parent);
            } else if (sex == Sex::Female) {
                AppendUnique(node.step_mothers, parent);
            } else {
                neutral_step.push_back(parent);
            }
        }
        node.step_parents = std::move(neutral_step);

        std::vector<std::string> neutral_adoptive;
        for (const auto& parent : node.adoptive_parents) {
            auto sex = SexOf(graph, parent);
            if (sex == Sex::Male && !node.adoptive_father) {
                node.adoptive_father = parent;
            } else if (sex == Sex::Female && !node.adoptive_mother) {
                node.adoptive_mother = parent;
            } else if (node.adoptive_father != parent && node.adoptive_mother != parent) {
                neutral_adoptive.push_back(parent);
            }
        }
        node.adoptive_parents = std::move(neutral_adoptive);
    }
}

void GraphBuilder::ReconcileAdoptions(FamilyGraph& graph) const {
    // Adopted child declared on the adopting parent: make the parent an
    // adoptive parent of the child.
    for (auto& [parent_id, parent] : graph.nodes) {
        for (const auto& child_id : parent.adopted_children) {
            auto& child = graph.nodes.find(child_id)->second;
            auto existing = child.AllAdoptiveParents();
            if (Contains(existing, parent_id)) {
                continue;
            }
            if (options_.enable_gendered_parent_slots && parent.sex == Sex::Male &&
                !child.adoptive_father) {
                child.adoptive_father = parent_id;
            } else if (options_.enable_gendered_parent_slots && parent.sex == Sex::Female &&
                       !child.adoptive_mother) {
                child.adoptive_mother = parent_id;
            } else {
                child.adoptive_parents.push_back(parent_id);
            }
        }
    }

    // Adoptive parent declared on the child: record the child on the parent.
    for (auto& [child_id, child] : graph.nodes) {
        for (const auto& parent_id : child.AllAdoptiveParents()) {
            AppendUnique(graph.nodes.find(parent_id)->second.adopted_children, child_id);
        }
    }
}

void GraphBuilder::ReconcileSideLinks(FamilyGraph& graph) const {
    // Child declared on the step, foster or guardian side: record the
    // declarer on the child. Step-parents enter the gender-neutral list and
    // are distributed by sex afterwards.
    for (auto& [parent_id, parent] : graph.nodes) {
        for (const auto& child_id : parent.step_children) {
            auto& child = graph.nodes.find(child_id)->second;
            if (!Contains(child.AllStepParents(), parent_id)) {
                child.step_parents.push_back(parent_id);
            }
        }
        for (const auto& child_id : parent.foster_children) {
            AppendUnique(graph.nodes.find(child_id)->second.foster_parents, parent_id);
        }
        for (const auto& child_id : parent.wards) {
            AppendUnique(graph.nodes.find(child_id)->second.guardians, parent_id);
        }
    }

    // Declared on the child: record the child on the other side.
    for (auto& [child_id, child] : graph.nodes) {
        for (const auto& parent_id : child.AllStepParents()) {
            AppendUnique(graph.nodes.find(parent_id)->second.step_children, child_id);
        }
        for (const auto& parent_id : child.foster_parents) {
            AppendUnique(graph.nodes.find(parent_id)->second.foster_children, child_id);
        }
        for (const auto& guardian_id : child.guardians) {
            AppendUnique(graph.nodes.find(guardian_id)->second.wards, child_id);
        }
    }
}

void GraphBuilder::InferChildren(FamilyGraph& graph) const {
    size_t inferred = 0;
    for (auto& [child_id, child] : graph.nodes) {
        for (const auto& parent_id : child.BiologicalParents()) {
            if (AppendUnique(graph.nodes.find(parent_id)->second.children, child_id)) {
                ++inferred;
            }
        }
    }
    graph.stats.inferred_children = inferred;
}

void GraphBuilder::PruneOverrides(FamilyGraph& graph) const {
    for (auto& [id, node] : graph.nodes) {
        auto parents = node.BiologicalParents();
        for (auto it = node.relationship_type_overrides.begin();
             it != node.relationship_type_overrides.end();) {
            const auto& target = it->first;
            if (Contains(parents, target) || node.HasSpouse(target)) {
                ++it;
            } else {
                it = node.relationship_type_overrides.erase(it);
            }
        }
    }
}

} // namespace kingraph
