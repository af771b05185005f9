#pragma once

#include <kingraph/config/engine_config.hpp>
#include <kingraph/core/result.hpp>
#include <kingraph/graph/family_graph.hpp>
#include <kingraph/graph/graph_snapshot.hpp>
#include <kingraph/ingest/alias_resolver.hpp>
#include <kingraph/ingest/i_link_index.hpp>
#include <kingraph/ingest/i_record_classifier.hpp>
#include <kingraph/ingest/i_record_store.hpp>
#include <kingraph/ingest/i_research_tracker.hpp>
#include <kingraph/ingest/record_classifier.hpp>
#include <kingraph/model/relationship_types.hpp>

#include <cstdint>
#include <mutex>
#include <vector>

namespace kingraph {

// Build one snapshot from `records` with the default classifier and a link
// index over the same records.
FamilyGraph BuildGraph(const std::vector<RawRecord>& records,
                       const EngineConfig& config = {});

// ---------------------------------------------------------------------------
// GraphService: owns the configuration-derived collaborators and the
// current snapshot.
//
// Rebuild() reads the whole record set, builds a fresh graph and installs it.
// Rebuilds are serialised; readers keep whatever snapshot they already hold.
// A store failure leaves the current snapshot in place.
//
// The classifier and research tracker, when given, are not owned and must
// outlive the service.
// ---------------------------------------------------------------------------
class GraphService {
public:
    explicit GraphService(EngineConfig config,
                          const IRecordClassifier* classifier = nullptr,
                          const IResearchTracker* research_tracker = nullptr);

    GraphService(const GraphService&) = delete;
    GraphService& operator=(const GraphService&) = delete;

    // Rebuild from `store`. Without `link_index`, references are resolved
    // through a NameLinkIndex over the fetched records. Returns the new
    // snapshot generation.
    [[nodiscard]] Result<uint64_t, Error> Rebuild(const IRecordStore& store,
                                                  const ILinkIndex* link_index = nullptr);

    [[nodiscard]] GraphSnapshot Current() const { return slot_.Current(); }
    [[nodiscard]] uint64_t Generation() const { return slot_.Generation(); }

    [[nodiscard]] const EngineConfig& Config() const { return config_; }
    [[nodiscard]] const RelationshipTypeRegistry& Registry() const { return registry_; }
    [[nodiscard]] const AliasResolver& Resolver() const { return resolver_; }

private:
    EngineConfig config_;
    AliasResolver resolver_;
    RelationshipTypeRegistry registry_;
    RecordClassifier default_classifier_;
    const IRecordClassifier* classifier_;
    const IResearchTracker* research_tracker_;

    std::mutex rebuild_mutex_;
    GraphSnapshotSlot slot_;
};

} // namespace kingraph
