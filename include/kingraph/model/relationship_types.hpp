#pragma once

#include <kingraph/config/engine_config.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kingraph {

enum class RelationshipCategory {
    Family,
    Legal,
    Religious,
    Professional,
    Social,
    Feudal,
    Dna,
};

enum class LineStyle {
    Solid,
    Dashed,
    Dotted,
};

// ---------------------------------------------------------------------------
// FamilyGraphMapping: the structural slot a relationship type feeds when it
// is included on family trees.
// ---------------------------------------------------------------------------
enum class FamilyGraphMapping {
    Parent,
    StepParent,
    AdoptiveParent,
    FosterParent,
    Guardian,
    Spouse,
    Child,
    Father,
    Mother,
};

const char* RelationshipCategoryName(RelationshipCategory category);
std::optional<RelationshipCategory> ParseRelationshipCategory(std::string_view value);

const char* LineStyleName(LineStyle style);
std::optional<LineStyle> ParseLineStyle(std::string_view value);

// "parent", "stepparent", "adoptive_parent", "foster_parent", "guardian",
// "spouse", "child", "father", "mother".
const char* FamilyGraphMappingName(FamilyGraphMapping mapping);
std::optional<FamilyGraphMapping> ParseFamilyGraphMapping(std::string_view value);

struct RelationshipTypeDef {
    std::string id;
    std::string name;
    std::string description;
    RelationshipCategory category = RelationshipCategory::Social;
    std::string color;
    LineStyle line_style = LineStyle::Solid;
    std::optional<std::string> inverse;
    bool symmetric = false;
    bool built_in = false;
    bool include_on_family_tree = false;
    std::optional<FamilyGraphMapping> family_graph_mapping;

    // Included and mapped: the type contributes edges to the family graph.
    [[nodiscard]] bool FeedsFamilyGraph() const {
        return include_on_family_tree && family_graph_mapping.has_value();
    }
};

// The built-in catalogue in display order.
const std::vector<RelationshipTypeDef>& BuiltinRelationshipTypes();

// ---------------------------------------------------------------------------
// RelationshipTypeRegistry: built-in types merged with user customisations
// and user-defined types.
//
// A user-defined type with a built-in's id replaces the built-in. Hidden
// types and, when disabled, built-ins are left out of ListTypes() but stay
// resolvable through Get() so existing declarations keep working.
// ---------------------------------------------------------------------------
class RelationshipTypeRegistry {
public:
    RelationshipTypeRegistry();
    explicit RelationshipTypeRegistry(const EngineConfig& config);

    [[nodiscard]] std::vector<RelationshipTypeDef> ListTypes() const;
    [[nodiscard]] std::vector<RelationshipTypeDef> ListByCategory(
        RelationshipCategory category) const;

    [[nodiscard]] const RelationshipTypeDef* Find(std::string_view id) const;
    [[nodiscard]] std::optional<RelationshipTypeDef> Get(std::string_view id) const;

    // Mapping of `id` when the type feeds the family graph, nullopt otherwise.
    [[nodiscard]] std::optional<FamilyGraphMapping> FamilyTreeMapping(
        std::string_view id) const;

    // Every type that feeds the family graph, in registry order.
    [[nodiscard]] std::vector<RelationshipTypeDef> FamilyTreeTypes() const;

    [[nodiscard]] bool IsHidden(std::string_view id) const;

private:
    void Upsert(RelationshipTypeDef def);
    void ApplyOverride(const RelationshipTypeOverride& override_def);

    std::vector<RelationshipTypeDef> types_;
    std::map<std::string, size_t, std::less<>> index_;
    std::vector<std::string> hidden_;
    bool show_builtins_ = true;
};

} // namespace kingraph
