#pragma once

#include <kingraph/ingest/i_research_tracker.hpp>
#include <kingraph/ingest/raw_record.hpp>
#include <kingraph/ingest/record_extractor.hpp>
#include <kingraph/model/person_node.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kingraph {

// Counters collected while building a snapshot.
struct BuildStats {
    size_t records_seen = 0;
    size_t people = 0;
    std::map<RecordKind, size_t> skipped_by_kind;
    size_t missing_identity = 0;
    size_t duplicate_ids = 0;
    size_t dropped_references = 0;
    size_t inferred_children = 0;
};

// ---------------------------------------------------------------------------
// FamilyGraph: one immutable snapshot of the kinship graph.
//
// Nodes are keyed by identity key in a sorted map so every iteration over a
// snapshot is deterministic.
// ---------------------------------------------------------------------------
struct FamilyGraph {
    std::map<std::string, PersonNode, std::less<>> nodes;
    BuildStats stats;

    [[nodiscard]] const PersonNode* Find(std::string_view id) const;
    [[nodiscard]] bool Contains(std::string_view id) const { return Find(id) != nullptr; }
    [[nodiscard]] size_t Size() const { return nodes.size(); }
    [[nodiscard]] bool Empty() const { return nodes.empty(); }
};

std::optional<PersonNode> GetNode(const FamilyGraph& graph, std::string_view id);

struct GraphBuildOptions {
    // Move gender-neutral step/adoptive parents into the gendered slots by
    // the target's sex.
    bool enable_gendered_parent_slots = true;
    // Optional; not owned.
    const IResearchTracker* research_tracker = nullptr;
};

// ---------------------------------------------------------------------------
// GraphBuilder: runs the extractor over every record (pass 1) and
// reconciles the result (pass 2):
//   - step/adoptive parents are distributed into gendered slots;
//   - every relationship field is filtered to ids present in the snapshot;
//   - parents gain the child in `children`;
//   - adoptive parents and adopted children are made symmetric;
//   - step, foster and guardian links are made symmetric;
//   - overrides are pruned to targets still present;
//   - evidence counts and research scores are attached.
// A bad record is skipped and counted, never fatal.
// ---------------------------------------------------------------------------
class GraphBuilder {
public:
    explicit GraphBuilder(const RecordExtractor& extractor, GraphBuildOptions options = {});

    [[nodiscard]] FamilyGraph Build(const std::vector<RawRecord>& records) const;

private:
    void DistributeGenderedParents(FamilyGraph& graph) const;
    void DropDanglingReferences(FamilyGraph& graph) const;
    void InferChildren(FamilyGraph& graph) const;
    void ReconcileAdoptions(FamilyGraph& graph) const;
    void ReconcileSideLinks(FamilyGraph& graph) const;
    void PruneOverrides(FamilyGraph& graph) const;

    const RecordExtractor& extractor_;
    GraphBuildOptions options_;
};

} // namespace kingraph
