#include <catch2/catch_test_macros.hpp>

#include <kingraph/model/relationship_types.hpp>

#include <algorithm>
#include <string>

using namespace kingraph;

namespace {

bool Listed(const std::vector<RelationshipTypeDef>& types, const std::string& id) {
    return std::any_of(types.begin(), types.end(),
                       [&](const RelationshipTypeDef& d) { return d.id == id; });
}

RelationshipTypeConfig CustomType(const std::string& id, const std::string& mapping,
                                  bool include) {
    RelationshipTypeConfig def;
    def.id = id;
    def.name = id + " name";
    def.include_on_family_tree = include;
    def.family_graph_mapping = mapping;
    return def;
}

} // anonymous namespace

// ===========================================================================
// Enum parsing
// ===========================================================================

TEST_CASE("ParseFamilyGraphMapping: every structural slot", "[registry]") {
    CHECK(ParseFamilyGraphMapping("parent") == FamilyGraphMapping::Parent);
    CHECK(ParseFamilyGraphMapping("stepparent") == FamilyGraphMapping::StepParent);
    CHECK(ParseFamilyGraphMapping("Adoptive_Parent") == FamilyGraphMapping::AdoptiveParent);
    CHECK(ParseFamilyGraphMapping("foster_parent") == FamilyGraphMapping::FosterParent);
    CHECK(ParseFamilyGraphMapping("guardian") == FamilyGraphMapping::Guardian);
    CHECK(ParseFamilyGraphMapping("spouse") == FamilyGraphMapping::Spouse);
    CHECK(ParseFamilyGraphMapping("child") == FamilyGraphMapping::Child);
    CHECK(ParseFamilyGraphMapping("father") == FamilyGraphMapping::Father);
    CHECK(ParseFamilyGraphMapping("mother") == FamilyGraphMapping::Mother);
    CHECK_FALSE(ParseFamilyGraphMapping("grandparent").has_value());
    CHECK(std::string(FamilyGraphMappingName(FamilyGraphMapping::StepParent)) == "stepparent");
}

TEST_CASE("ParseRelationshipCategory / ParseLineStyle", "[registry]") {
    CHECK(ParseRelationshipCategory("DNA") == RelationshipCategory::Dna);
    CHECK_FALSE(ParseRelationshipCategory("cosmic").has_value());
    CHECK(ParseLineStyle("dotted") == LineStyle::Dotted);
    CHECK(std::string(LineStyleName(LineStyle::Dashed)) == "dashed");
}

// ===========================================================================
// Built-in defaults
// ===========================================================================

TEST_CASE("Registry: built-in inclusion defaults", "[registry]") {
    RelationshipTypeRegistry registry;

    CHECK(registry.FamilyTreeMapping("step_parent") == FamilyGraphMapping::StepParent);
    CHECK(registry.FamilyTreeMapping("adoptive_parent") == FamilyGraphMapping::AdoptiveParent);
    CHECK(registry.FamilyTreeMapping("spouse") == FamilyGraphMapping::Spouse);

    // Mapped but excluded until the user opts in.
    auto foster = registry.Get("foster_parent");
    REQUIRE(foster.has_value());
    CHECK(foster->family_graph_mapping == FamilyGraphMapping::FosterParent);
    CHECK_FALSE(foster->include_on_family_tree);
    CHECK_FALSE(registry.FamilyTreeMapping("foster_parent").has_value());
    CHECK_FALSE(registry.FamilyTreeMapping("guardian").has_value());

    // Social types never feed the family graph.
    CHECK_FALSE(registry.FamilyTreeMapping("godparent").has_value());
    CHECK_FALSE(registry.FamilyTreeMapping("unknown_type").has_value());
}

TEST_CASE("Registry: built-in catalogue is complete and flagged", "[registry]") {
    const auto& builtins = BuiltinRelationshipTypes();
    CHECK(builtins.size() == 29);
    CHECK(std::all_of(builtins.begin(), builtins.end(),
                      [](const RelationshipTypeDef& d) { return d.built_in; }));
    auto dna = std::find_if(builtins.begin(), builtins.end(),
                            [](const RelationshipTypeDef& d) { return d.id == "dna_match"; });
    REQUIRE(dna != builtins.end());
    CHECK(dna->category == RelationshipCategory::Dna);
    CHECK(dna->symmetric);
}

TEST_CASE("Registry: ListByCategory", "[registry]") {
    RelationshipTypeRegistry registry;
    auto legal = registry.ListByCategory(RelationshipCategory::Legal);
    CHECK(Listed(legal, "guardian"));
    CHECK(Listed(legal, "step_parent"));
    CHECK_FALSE(Listed(legal, "spouse"));
}

// ===========================================================================
// User customisation
// ===========================================================================

TEST_CASE("Registry: custom type is excluded unless included and mapped", "[registry]") {
    EngineConfig config;
    config.relationship_types.push_back(CustomType("raised_by", "parent", false));
    config.relationship_types.push_back(CustomType("protector", "", true));
    config.relationship_types.push_back(CustomType("nurtured_by", "parent", true));
    RelationshipTypeRegistry registry(config);

    CHECK_FALSE(registry.FamilyTreeMapping("raised_by").has_value());
    CHECK_FALSE(registry.FamilyTreeMapping("protector").has_value());
    CHECK(registry.FamilyTreeMapping("nurtured_by") == FamilyGraphMapping::Parent);

    auto custom = registry.Get("nurtured_by");
    REQUIRE(custom.has_value());
    CHECK_FALSE(custom->built_in);
    CHECK(custom->name == "nurtured_by name");
    CHECK(custom->category == RelationshipCategory::Social);
}

TEST_CASE("Registry: invalid mapping degrades to no mapping", "[registry]") {
    EngineConfig config;
    config.relationship_types.push_back(CustomType("ancestor_of", "grandparent", true));
    RelationshipTypeRegistry registry(config);

    auto def = registry.Get("ancestor_of");
    REQUIRE(def.has_value());
    CHECK_FALSE(def->family_graph_mapping.has_value());
    CHECK_FALSE(def->FeedsFamilyGraph());
}

TEST_CASE("Registry: user definition replaces built-in in place", "[registry]") {
    EngineConfig config;
    auto custom = CustomType("guardian", "guardian", true);
    custom.name = "Legal guardian";
    config.relationship_types.push_back(custom);
    RelationshipTypeRegistry registry(config);

    auto def = registry.Get("guardian");
    REQUIRE(def.has_value());
    CHECK(def->name == "Legal guardian");
    CHECK_FALSE(def->built_in);
    CHECK(registry.FamilyTreeMapping("guardian") == FamilyGraphMapping::Guardian);

    auto all = registry.ListTypes();
    CHECK(std::count_if(all.begin(), all.end(),
                        [](const RelationshipTypeDef& d) { return d.id == "guardian"; }) == 1);
    CHECK(all.size() == BuiltinRelationshipTypes().size());
}

TEST_CASE("Registry: overrides adjust built-ins", "[registry]") {
    EngineConfig config;
    RelationshipTypeOverride foster;
    foster.id = "foster_parent";
    foster.include_on_family_tree = true;
    foster.color = "#111111";
    RelationshipTypeOverride unknown;
    unknown.id = "no_such_type";
    unknown.name = "Ghost";
    config.relationship_type_overrides = {foster, unknown};
    RelationshipTypeRegistry registry(config);

    CHECK(registry.FamilyTreeMapping("foster_parent") == FamilyGraphMapping::FosterParent);
    CHECK(registry.Find("foster_parent")->color == "#111111");
    CHECK(registry.Find("no_such_type") == nullptr);
}

TEST_CASE("Registry: hidden types and built-in visibility", "[registry]") {
    EngineConfig config;
    config.hidden_relationship_types = {"rival"};
    config.show_builtin_relationship_types = false;
    config.relationship_types.push_back(CustomType("raised_by", "parent", true));
    RelationshipTypeRegistry registry(config);

    auto listed = registry.ListTypes();
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].id == "raised_by");
    CHECK(registry.IsHidden("rival"));

    // Still resolvable for existing declarations.
    CHECK(registry.Get("rival").has_value());
    CHECK(registry.FamilyTreeMapping("step_parent") == FamilyGraphMapping::StepParent);
}

TEST_CASE("Registry: FamilyTreeTypes keeps registry order", "[registry]") {
    RelationshipTypeRegistry registry;
    auto types = registry.FamilyTreeTypes();
    REQUIRE_FALSE(types.empty());
    CHECK(types.front().id == "spouse");
    CHECK(Listed(types, "adopted_child"));
    CHECK_FALSE(Listed(types, "foster_parent"));
}
