#include <kingraph/graph/graph_service.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/ingest/link_index.hpp>
#include <kingraph/ingest/record_extractor.hpp>

#include <chrono>
#include <memory>

namespace kingraph {

namespace {

constexpr const char* kComponent = "GraphService";

} // anonymous namespace

FamilyGraph BuildGraph(const std::vector<RawRecord>& records, const EngineConfig& config) {
    AliasResolver resolver(config);
    RelationshipTypeRegistry registry(config);
    RecordClassifier classifier(resolver);
    NameLinkIndex link_index(records, resolver);
    RecordExtractor extractor(resolver, registry, classifier, link_index);

    GraphBuildOptions options;
    options.enable_gendered_parent_slots = config.enable_gendered_parent_slots;
    return GraphBuilder(extractor, options).Build(records);
}

GraphService::GraphService(EngineConfig config,
                           const IRecordClassifier* classifier,
                           const IResearchTracker* research_tracker)
    : config_(std::move(config)),
      resolver_(config_),
      registry_(config_),
      default_classifier_(resolver_),
      classifier_(classifier != nullptr ? classifier : &default_classifier_),
      research_tracker_(research_tracker) {}

Result<uint64_t, Error> GraphService::Rebuild(const IRecordStore& store,
                                              const ILinkIndex* link_index) {
    std::lock_guard<std::mutex> lock(rebuild_mutex_);
    auto start = std::chrono::steady_clock::now();

    auto records = store.ListRecords();
    if (records.IsErr()) {
        LogWarn(kComponent, "Rebuild aborted, keeping generation " +
                            std::to_string(slot_.Generation()) + ": " +
                            records.Error().ToString());
        return Result<uint64_t, Error>::Err(records.Error());
    }
    const auto& all = records.Value();

    std::unique_ptr<NameLinkIndex> own_index;
    if (link_index == nullptr) {
        own_index = std::make_unique<NameLinkIndex>(all, resolver_);
        link_index = own_index.get();
    }

    RecordExtractor extractor(resolver_, registry_, *classifier_, *link_index);
    GraphBuildOptions options;
    options.enable_gendered_parent_slots = config_.enable_gendered_parent_slots;
    options.research_tracker = research_tracker_;
    auto graph = GraphBuilder(extractor, options).Build(all);

    auto people = graph.Size();
    auto generation = slot_.Install(std::move(graph));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    LogInfo(kComponent, "Installed generation " + std::to_string(generation) + " with " +
                        std::to_string(people) + " people from " +
                        std::to_string(all.size()) + " records in " +
                        std::to_string(elapsed.count()) + " ms");
    return Result<uint64_t, Error>::Ok(generation);
}

} // namespace kingraph
