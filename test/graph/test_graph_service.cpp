#include <catch2/catch_test_macros.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/graph/graph_service.hpp>

#include "../mocks/mock_link_index.hpp"
#include "../mocks/mock_record_store.hpp"
#include "../mocks/mock_research_tracker.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace kingraph;
using kingraph::testing::MockLinkIndex;
using kingraph::testing::MockRecordStore;
using kingraph::testing::MockResearchTracker;
using kingraph::testing::PersonRecord;

namespace {

// Treats every record as a person, whatever its type field says.
class EverythingIsAPerson : public IRecordClassifier {
public:
    [[nodiscard]] RecordKind Classify(const RawRecord& /*record*/) const override {
        return RecordKind::Person;
    }
};

std::vector<RawRecord> Family() {
    return {
        PersonRecord("F", "Father", {{"spouse", "[[Mother]]"}}),
        PersonRecord("M", "Mother"),
        PersonRecord("C", "Child", {{"father", "[[Father]]"}, {"mother_id", "M"}}),
    };
}

} // anonymous namespace

// ===========================================================================
// Snapshots
// ===========================================================================

TEST_CASE("GraphService: starts with an empty snapshot", "[graph][service]") {
    GraphService service(EngineConfig{});
    CHECK(service.Generation() == 0);
    REQUIRE(service.Current() != nullptr);
    CHECK(service.Current()->Empty());
}

TEST_CASE("GraphService: rebuild installs a new generation", "[graph][service]") {
    MockRecordStore store(Family());
    GraphService service(EngineConfig{});

    auto first = service.Rebuild(store);
    REQUIRE(first.IsOk());
    CHECK(first.Value() == 1);
    CHECK(service.Generation() == 1);
    CHECK(store.CallCount() == 1);

    auto graph = service.Current();
    REQUIRE(graph->Size() == 3);
    const auto* child = graph->Find("C");
    REQUIRE(child != nullptr);
    CHECK(child->father == std::optional<std::string>("F"));
    CHECK(child->mother == std::optional<std::string>("M"));
    CHECK(graph->Find("F")->HasSpouse("M"));

    auto second = service.Rebuild(store);
    REQUIRE(second.IsOk());
    CHECK(second.Value() == 2);
}

TEST_CASE("GraphService: held snapshot survives a rebuild", "[graph][service]") {
    MockRecordStore store(Family());
    GraphService service(EngineConfig{});
    REQUIRE(service.Rebuild(store).IsOk());

    auto before = service.Current();
    store.SetRecords({PersonRecord("Z", "Zoe")});
    REQUIRE(service.Rebuild(store).IsOk());

    CHECK(before->Size() == 3);
    CHECK(before->Contains("C"));
    CHECK(service.Current()->Size() == 1);
    CHECK(service.Current()->Contains("Z"));
}

TEST_CASE("GraphService: store failure keeps the current snapshot", "[graph][service]") {
    MockRecordStore store(Family());
    GraphService service(EngineConfig{});
    REQUIRE(service.Rebuild(store).IsOk());
    auto before = service.Current();

    store.SetError(Error{"ListRecords", "vault", "disk unavailable", ErrorCategory::Internal});
    auto result = service.Rebuild(store);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "disk unavailable");
    CHECK(service.Generation() == 1);
    CHECK(service.Current() == before);
}

// ===========================================================================
// Collaborators
// ===========================================================================

TEST_CASE("GraphService: caller-supplied link index", "[graph][service]") {
    MockRecordStore store(Family());
    MockLinkIndex links;
    links.Add("[[Father]]", "F");
    GraphService service(EngineConfig{});

    REQUIRE(service.Rebuild(store, &links).IsOk());
    auto graph = service.Current();
    CHECK(graph->Find("C")->father == std::optional<std::string>("F"));
    // "[[Mother]]" is unknown to this index, so the spouse link is dropped.
    CHECK_FALSE(graph->Find("F")->HasSpouse("M"));
    CHECK_FALSE(links.Lookups().empty());
}

TEST_CASE("GraphService: custom classifier and research tracker", "[graph][service]") {
    auto records = Family();
    records.push_back(PersonRecord("SRC", "Census 1881", {{"cr_type", "source"}}));
    MockRecordStore store(records);

    SECTION("default classifier skips the source") {
        GraphService service(EngineConfig{});
        REQUIRE(service.Rebuild(store).IsOk());
        CHECK_FALSE(service.Current()->Contains("SRC"));
    }
    SECTION("custom classifier keeps it") {
        EverythingIsAPerson classifier;
        MockResearchTracker tracker;
        tracker.Set("C", 80.0, 1);
        GraphService service(EngineConfig{}, &classifier, &tracker);
        REQUIRE(service.Rebuild(store).IsOk());
        auto graph = service.Current();
        CHECK(graph->Contains("SRC"));
        CHECK(graph->Find("C")->research_coverage == std::optional<double>(80.0));
        CHECK(graph->Find("C")->research_conflicts == std::optional<int>(1));
        CHECK_FALSE(graph->Find("F")->research_coverage.has_value());
    }
}

TEST_CASE("GraphService: configuration feeds the build", "[graph][service]") {
    EngineConfig config;
    config.field_aliases.push_back({"dad", "father"});
    GraphService service(config);
    CHECK(service.Config().field_aliases.size() == 1);
    CHECK(service.Registry().Find("parents") != nullptr);

    MockRecordStore store({
        PersonRecord("F", "Father"),
        PersonRecord("C", "Child", {{"dad", "[[Father]]"}}),
    });
    REQUIRE(service.Rebuild(store).IsOk());
    CHECK(service.Current()->Find("C")->father == std::optional<std::string>("F"));
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_CASE("GraphService: readers see whole snapshots during rebuilds",
          "[graph][service][concurrency]") {
    MockRecordStore store(Family());
    GraphService service(EngineConfig{});
    REQUIRE(service.Rebuild(store).IsOk());

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::thread reader([&] {
        while (!done.load()) {
            auto graph = service.Current();
            auto size = graph->Size();
            if (size != 3 && size != 0) {
                ++torn;
            }
            for (const auto& [id, node] : graph->nodes) {
                for (const auto& child : node.children) {
                    if (!graph->Contains(child)) ++torn;
                }
            }
        }
    });

    int failures = 0;
    for (int i = 0; i < 20; ++i) {
        if (service.Rebuild(store).IsErr()) ++failures;
    }
    done = true;
    reader.join();

    CHECK(failures == 0);
    CHECK(torn.load() == 0);
    CHECK(service.Generation() == 21);
}
