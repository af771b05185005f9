#include <catch2/catch_test_macros.hpp>

#include <kingraph/ingest/link_index.hpp>

#include "../mocks/mock_record_store.hpp"

using namespace kingraph;
using kingraph::testing::PersonRecord;

namespace {

std::vector<RawRecord> Vault() {
    auto jane = PersonRecord("I-1", "Jane Doe");
    jane.path = "People/Doe/Jane Doe.md";
    auto john = PersonRecord("I-2", "John Smith");
    john.path = "People/Smith/js-1850.md";
    auto john_junior = PersonRecord("I-3", "John Smith");
    john_junior.path = "People/Smith/js-1880.md";
    RawRecord no_id;
    no_id.path = "People/Nobody.md";
    no_id.fields = {{"name", "Nobody"}};
    return {jane, john, john_junior, no_id};
}

} // anonymous namespace

TEST_CASE("NameLinkIndex: identity keys and paths", "[link]") {
    AliasResolver resolver;
    NameLinkIndex index(Vault(), resolver);

    CHECK(index.Size() == 3);
    CHECK(index.Resolve("I-2") == std::optional<std::string>("I-2"));
    CHECK(index.Resolve("i-2") == std::optional<std::string>("I-2"));
    CHECK(index.Resolve("People/Doe/Jane Doe") == std::optional<std::string>("I-1"));
    CHECK(index.Resolve("people/doe/jane doe.md") == std::optional<std::string>("I-1"));
}

TEST_CASE("NameLinkIndex: wikilinks and display names", "[link]") {
    AliasResolver resolver;
    NameLinkIndex index(Vault(), resolver);

    CHECK(index.Resolve("[[Jane Doe]]") == std::optional<std::string>("I-1"));
    CHECK(index.Resolve("[[People/Doe/Jane Doe|Grandma]]") == std::optional<std::string>("I-1"));
    CHECK(index.Resolve("[[js-1880]]") == std::optional<std::string>("I-3"));
}

TEST_CASE("NameLinkIndex: ambiguous names stay unresolved", "[link]") {
    AliasResolver resolver;
    NameLinkIndex index(Vault(), resolver);

    // Two records share the display name "John Smith".
    CHECK_FALSE(index.Resolve("[[John Smith]]").has_value());
    CHECK(index.Resolve("[[People/Smith/js-1850]]") == std::optional<std::string>("I-2"));
    CHECK(index.Resolve("js-1850") == std::optional<std::string>("I-2"));
}

TEST_CASE("NameLinkIndex: unknown and empty references", "[link]") {
    AliasResolver resolver;
    NameLinkIndex index(Vault(), resolver);

    CHECK_FALSE(index.Resolve("[[Nobody]]").has_value());
    CHECK_FALSE(index.Resolve("").has_value());
    CHECK_FALSE(index.Resolve("[[]]").has_value());
}

TEST_CASE("NameLinkIndex: names come through field aliases", "[link]") {
    EngineConfig config;
    config.field_aliases = {{"full_name", "name"}};
    AliasResolver resolver(config);

    RawRecord record;
    record.path = "x/I-9.md";
    record.fields = {{"cr_id", "I-9"}, {"full_name", "Ada Lovelace"}};
    NameLinkIndex index({record}, resolver);

    CHECK(index.Resolve("ada lovelace") == std::optional<std::string>("I-9"));
}
