#include <catch2/catch_test_macros.hpp>

#include <kingraph/ingest/alias_resolver.hpp>

#include <nlohmann/json.hpp>

using namespace kingraph;
using nlohmann::json;

namespace {

EngineConfig AliasedConfig() {
    EngineConfig config;
    config.field_aliases = {
        {"birthdate", "born"},
        {"date_of_birth", "born"},
        {"gender", "sex"},
    };
    config.value_aliases["sex"] = {{"Lad", "M"}, {"male", "F"}};
    config.value_aliases["note_type"] = {{"hero", "person"}};
    return config;
}

} // anonymous namespace

// ===========================================================================
// Field resolution
// ===========================================================================

TEST_CASE("ResolveField: canonical field wins over alias", "[alias][field]") {
    AliasResolver resolver(AliasedConfig());
    json fields = {{"born", "1850"}, {"birthdate", "1851"}};

    auto value = resolver.ResolveString(fields, "born");
    REQUIRE(value.has_value());
    CHECK(*value == "1850");
}

TEST_CASE("ResolveField: first configured alias wins", "[alias][field]") {
    AliasResolver resolver(AliasedConfig());
    json fields = {{"date_of_birth", "1852"}, {"birthdate", "1851"}};

    CHECK(resolver.ResolveString(fields, "born") == std::optional<std::string>("1851"));
}

TEST_CASE("ResolveField: null values count as absent", "[alias][field]") {
    AliasResolver resolver(AliasedConfig());
    json fields = {{"born", nullptr}, {"birthdate", "1851"}};

    CHECK(resolver.ResolveString(fields, "born") == std::optional<std::string>("1851"));
    CHECK(resolver.ResolveField(json{{"born", nullptr}}, "born") == nullptr);
}

TEST_CASE("ResolveField: absent without field or alias", "[alias][field]") {
    AliasResolver resolver(AliasedConfig());
    CHECK(resolver.ResolveField(json{{"name", "Jane"}}, "died") == nullptr);
    CHECK(resolver.ResolveField(json::array(), "born") == nullptr);
}

TEST_CASE("ResolveString: scalars, lists and blanks", "[alias][field]") {
    AliasResolver resolver;
    json fields = {
        {"year", 1850},
        {"flag", true},
        {"list", json::array({"", "  second  ", "third"})},
        {"blank", "   "},
        {"object", json::object({{"a", 1}})},
    };

    CHECK(resolver.ResolveString(fields, "year") == std::optional<std::string>("1850"));
    CHECK(resolver.ResolveString(fields, "flag") == std::optional<std::string>("true"));
    CHECK(resolver.ResolveString(fields, "list") == std::optional<std::string>("second"));
    CHECK_FALSE(resolver.ResolveString(fields, "blank").has_value());
    CHECK_FALSE(resolver.ResolveString(fields, "object").has_value());
}

TEST_CASE("AliasesFor: configuration order", "[alias][field]") {
    AliasResolver resolver(AliasedConfig());
    const auto& aliases = resolver.AliasesFor("born");
    REQUIRE(aliases.size() == 2);
    CHECK(aliases[0] == "birthdate");
    CHECK(aliases[1] == "date_of_birth");
    CHECK(resolver.AliasesFor("died").empty());
}

// ===========================================================================
// Value resolution
// ===========================================================================

TEST_CASE("ResolveValue: canonical match ignores case", "[alias][value]") {
    AliasResolver resolver(AliasedConfig());
    CHECK(resolver.ResolveValue(ValueDomain::Sex, "f") == "F");
    CHECK(resolver.ResolveValue(ValueDomain::NoteType, "Person") == "person");
}

TEST_CASE("ResolveValue: user synonym before built-in", "[alias][value]") {
    AliasResolver resolver(AliasedConfig());
    CHECK(resolver.ResolveValue(ValueDomain::Sex, "lad") == "M");
    // The user table shadows the built-in "male" -> "M".
    CHECK(resolver.ResolveValue(ValueDomain::Sex, "Male") == "F");
    CHECK(resolver.ResolveValue(ValueDomain::NoteType, "hero") == "person");
}

TEST_CASE("ResolveValue: built-in synonyms", "[alias][value]") {
    AliasResolver resolver;
    CHECK(resolver.ResolveValue(ValueDomain::Sex, "Female") == "F");
    CHECK(resolver.ResolveValue(ValueDomain::Sex, "non-binary") == "X");
    CHECK(resolver.ResolveValue(ValueDomain::NoteType, "character") == "person");
    CHECK(resolver.ResolveValue(ValueDomain::EventType, "wedding") == "marriage");
    CHECK(resolver.ResolveValue(ValueDomain::PlaceCategory, "fantasy") == "fictional");
}

TEST_CASE("ResolveValue: unknown value passes through unchanged", "[alias][value]") {
    AliasResolver resolver;
    CHECK(resolver.ResolveValue(ValueDomain::Sex, "Dragon") == "Dragon");
    CHECK(resolver.ResolveValue(ValueDomain::EventType, "").empty());
}

TEST_CASE("ParseValueDomain / CanonicalValues", "[alias][value]") {
    CHECK(ParseValueDomain("gender_identity") == ValueDomain::GenderIdentity);
    CHECK_FALSE(ParseValueDomain("eye_color").has_value());
    CHECK(std::string(ValueDomainName(ValueDomain::PlaceCategory)) == "place_category");
    CHECK(CanonicalValues(ValueDomain::Sex).size() == 4);
}
