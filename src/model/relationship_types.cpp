#include <kingraph/model/relationship_types.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/core/text.hpp>

#include <algorithm>

namespace kingraph {

namespace {

constexpr const char* kComponent = "RelationshipTypes";

using Cat = RelationshipCategory;
using Line = LineStyle;
using Map = FamilyGraphMapping;

RelationshipTypeDef Builtin(const char* id, const char* name, Cat category,
                            const char* color, Line line,
                            std::optional<std::string> inverse, bool symmetric,
                            bool include, std::optional<Map> mapping,
                            const char* description = "") {
    RelationshipTypeDef def;
    def.id = id;
    def.name = name;
    def.description = description;
    def.category = category;
    def.color = color;
    def.line_style = line;
    def.inverse = std::move(inverse);
    def.symmetric = symmetric;
    def.built_in = true;
    def.include_on_family_tree = include;
    def.family_graph_mapping = mapping;
    return def;
}

std::vector<RelationshipTypeDef> MakeBuiltins() {
    const std::optional<std::string> none;
    return {
        // Family
        Builtin("spouse", "Spouse", Cat::Family, "#a855f7", Line::Solid, none, true, true, Map::Spouse),
        Builtin("parents", "Parent", Cat::Family, "#22c55e", Line::Solid, "children", false, true, Map::Parent),
        Builtin("children", "Child", Cat::Family, "#22c55e", Line::Solid, "parents", false, true, Map::Child),
        Builtin("sibling", "Sibling", Cat::Family, "#84cc16", Line::Solid, none, true, false, std::nullopt),

        // Legal / guardianship
        Builtin("guardian", "Guardian", Cat::Legal, "#14b8a6", Line::Solid, "ward", false, false, Map::Guardian),
        Builtin("ward", "Ward", Cat::Legal, "#14b8a6", Line::Solid, "guardian", false, false, Map::Child),
        Builtin("step_parent", "Step-parent", Cat::Legal, "#14b8a6", Line::Dashed, "step_child", false, true, Map::StepParent),
        Builtin("step_child", "Step-child", Cat::Legal, "#14b8a6", Line::Dashed, "step_parent", false, true, Map::Child),
        Builtin("adoptive_parent", "Adoptive parent", Cat::Legal, "#06b6d4", Line::Dotted, "adopted_child", false, true, Map::AdoptiveParent),
        Builtin("adopted_child", "Adopted child", Cat::Legal, "#06b6d4", Line::Dotted, "adoptive_parent", false, true, Map::Child),
        Builtin("foster_parent", "Foster parent", Cat::Legal, "#0ea5e9", Line::Solid, "foster_child", false, false, Map::FosterParent),
        Builtin("foster_child", "Foster child", Cat::Legal, "#0ea5e9", Line::Solid, "foster_parent", false, false, Map::Child),

        // Religious / spiritual
        Builtin("godparent", "Godparent", Cat::Religious, "#3b82f6", Line::Solid, "godchild", false, false, std::nullopt),
        Builtin("godchild", "Godchild", Cat::Religious, "#3b82f6", Line::Solid, "godparent", false, false, std::nullopt),
        Builtin("mentor", "Mentor", Cat::Religious, "#8b5cf6", Line::Solid, "disciple", false, false, std::nullopt),
        Builtin("disciple", "Disciple", Cat::Religious, "#8b5cf6", Line::Solid, "mentor", false, false, std::nullopt),

        // Professional
        Builtin("master", "Master", Cat::Professional, "#f97316", Line::Solid, "apprentice", false, false, std::nullopt),
        Builtin("apprentice", "Apprentice", Cat::Professional, "#f97316", Line::Solid, "master", false, false, std::nullopt),
        Builtin("employer", "Employer", Cat::Professional, "#ea580c", Line::Solid, "employee", false, false, std::nullopt),
        Builtin("employee", "Employee", Cat::Professional, "#ea580c", Line::Solid, "employer", false, false, std::nullopt),

        // Social
        Builtin("witness", "Witness", Cat::Social, "#6b7280", Line::Dashed, none, false, false, std::nullopt),
        Builtin("neighbor", "Neighbor", Cat::Social, "#9ca3af", Line::Dashed, none, true, false, std::nullopt),
        Builtin("companion", "Companion", Cat::Social, "#22c55e", Line::Solid, none, true, false, std::nullopt),
        Builtin("betrothed", "Betrothed", Cat::Social, "#ec4899", Line::Dashed, none, true, false, std::nullopt),

        // Feudal / world-building
        Builtin("liege", "Liege lord", Cat::Feudal, "#eab308", Line::Solid, "vassal", false, false, std::nullopt),
        Builtin("vassal", "Vassal", Cat::Feudal, "#eab308", Line::Solid, "liege", false, false, std::nullopt),
        Builtin("ally", "Ally", Cat::Feudal, "#10b981", Line::Dashed, none, true, false, std::nullopt),
        Builtin("rival", "Rival", Cat::Feudal, "#ef4444", Line::Dashed, none, true, false, std::nullopt),

        // DNA
        Builtin("dna_match", "DNA match", Cat::Dna, "#9333ea", Line::Dashed, none, true, false, std::nullopt,
                "Genetic DNA match (not a genealogical relationship)"),
    };
}

// Interpret a mapping string from configuration. Invalid strings are treated
// as "no mapping".
std::optional<FamilyGraphMapping> MappingFromConfig(const std::string& type_id,
                                                    const std::optional<std::string>& value) {
    if (!value || Trim(*value).empty()) {
        return std::nullopt;
    }
    auto mapping = ParseFamilyGraphMapping(*value);
    if (!mapping) {
        LogWarn(kComponent, "Relationship type '" + type_id +
                            "' has invalid family_graph_mapping '" + *value +
                            "'; it will not appear on family trees");
    }
    return mapping;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------

const char* RelationshipCategoryName(RelationshipCategory category) {
    switch (category) {
        case Cat::Family:       return "family";
        case Cat::Legal:        return "legal";
        case Cat::Religious:    return "religious";
        case Cat::Professional: return "professional";
        case Cat::Social:       return "social";
        case Cat::Feudal:       return "feudal";
        case Cat::Dna:          return "dna";
    }
    return "social";
}

std::optional<RelationshipCategory> ParseRelationshipCategory(std::string_view value) {
    auto v = ToLower(Trim(value));
    if (v == "family") return Cat::Family;
    if (v == "legal") return Cat::Legal;
    if (v == "religious") return Cat::Religious;
    if (v == "professional") return Cat::Professional;
    if (v == "social") return Cat::Social;
    if (v == "feudal") return Cat::Feudal;
    if (v == "dna") return Cat::Dna;
    return std::nullopt;
}

const char* LineStyleName(LineStyle style) {
    switch (style) {
        case Line::Solid:  return "solid";
        case Line::Dashed: return "dashed";
        case Line::Dotted: return "dotted";
    }
    return "solid";
}

std::optional<LineStyle> ParseLineStyle(std::string_view value) {
    auto v = ToLower(Trim(value));
    if (v == "solid") return Line::Solid;
    if (v == "dashed") return Line::Dashed;
    if (v == "dotted") return Line::Dotted;
    return std::nullopt;
}

const char* FamilyGraphMappingName(FamilyGraphMapping mapping) {
    switch (mapping) {
        case Map::Parent:         return "parent";
        case Map::StepParent:     return "stepparent";
        case Map::AdoptiveParent: return "adoptive_parent";
        case Map::FosterParent:   return "foster_parent";
        case Map::Guardian:       return "guardian";
        case Map::Spouse:         return "spouse";
        case Map::Child:          return "child";
        case Map::Father:         return "father";
        case Map::Mother:         return "mother";
    }
    return "parent";
}

std::optional<FamilyGraphMapping> ParseFamilyGraphMapping(std::string_view value) {
    auto v = ToLower(Trim(value));
    if (v == "parent") return Map::Parent;
    if (v == "stepparent") return Map::StepParent;
    if (v == "adoptive_parent") return Map::AdoptiveParent;
    if (v == "foster_parent") return Map::FosterParent;
    if (v == "guardian") return Map::Guardian;
    if (v == "spouse") return Map::Spouse;
    if (v == "child") return Map::Child;
    if (v == "father") return Map::Father;
    if (v == "mother") return Map::Mother;
    return std::nullopt;
}

const std::vector<RelationshipTypeDef>& BuiltinRelationshipTypes() {
    static const std::vector<RelationshipTypeDef> builtins = MakeBuiltins();
    return builtins;
}

// ---------------------------------------------------------------------------
// RelationshipTypeRegistry
// ---------------------------------------------------------------------------

RelationshipTypeRegistry::RelationshipTypeRegistry()
    : RelationshipTypeRegistry(EngineConfig{}) {}

RelationshipTypeRegistry::RelationshipTypeRegistry(const EngineConfig& config)
    : hidden_(config.hidden_relationship_types),
      show_builtins_(config.show_builtin_relationship_types) {
    for (const auto& def : BuiltinRelationshipTypes()) {
        Upsert(def);
    }
    for (const auto& override_def : config.relationship_type_overrides) {
        ApplyOverride(override_def);
    }

    for (const auto& custom : config.relationship_types) {
        if (Trim(custom.id).empty()) {
            LogWarn(kComponent, "Skipping relationship type without an id");
            continue;
        }
        RelationshipTypeDef def;
        def.id = custom.id;
        def.name = custom.name.empty() ? custom.id : custom.name;
        def.description = custom.description;
        def.category = ParseRelationshipCategory(custom.category).value_or(Cat::Social);
        def.color = custom.color;
        def.line_style = ParseLineStyle(custom.line_style).value_or(Line::Solid);
        def.inverse = custom.inverse;
        def.symmetric = custom.symmetric;
        def.built_in = false;
        def.include_on_family_tree = custom.include_on_family_tree;
        def.family_graph_mapping = MappingFromConfig(custom.id, custom.family_graph_mapping);

        if (Find(def.id) != nullptr) {
            LogDebug(kComponent, "Custom relationship type '" + def.id +
                                 "' replaces the built-in definition");
        }
        Upsert(std::move(def));
    }
}

void RelationshipTypeRegistry::Upsert(RelationshipTypeDef def) {
    auto it = index_.find(def.id);
    if (it != index_.end()) {
        types_[it->second] = std::move(def);
        return;
    }
    index_.emplace(def.id, types_.size());
    types_.push_back(std::move(def));
}

void RelationshipTypeRegistry::ApplyOverride(const RelationshipTypeOverride& override_def) {
    auto it = index_.find(override_def.id);
    if (it == index_.end()) {
        LogWarn(kComponent, "Ignoring override for unknown relationship type '" +
                            override_def.id + "'");
        return;
    }
    auto& def = types_[it->second];
    if (override_def.name) def.name = *override_def.name;
    if (override_def.description) def.description = *override_def.description;
    if (override_def.color) def.color = *override_def.color;
    if (override_def.line_style) {
        if (auto style = ParseLineStyle(*override_def.line_style)) {
            def.line_style = *style;
        } else {
            LogWarn(kComponent, "Ignoring invalid line_style '" +
                                *override_def.line_style + "' for '" + def.id + "'");
        }
    }
    if (override_def.include_on_family_tree) {
        def.include_on_family_tree = *override_def.include_on_family_tree;
    }
    if (override_def.family_graph_mapping) {
        def.family_graph_mapping =
            MappingFromConfig(def.id, override_def.family_graph_mapping);
    }
}

std::vector<RelationshipTypeDef> RelationshipTypeRegistry::ListTypes() const {
    std::vector<RelationshipTypeDef> out;
    for (const auto& def : types_) {
        if (IsHidden(def.id)) continue;
        if (def.built_in && !show_builtins_) continue;
        out.push_back(def);
    }
    return out;
}

std::vector<RelationshipTypeDef> RelationshipTypeRegistry::ListByCategory(
    RelationshipCategory category) const {
    auto all = ListTypes();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [category](const RelationshipTypeDef& d) {
                                 return d.category != category;
                             }),
              all.end());
    return all;
}

const RelationshipTypeDef* RelationshipTypeRegistry::Find(std::string_view id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &types_[it->second];
}

std::optional<RelationshipTypeDef> RelationshipTypeRegistry::Get(std::string_view id) const {
    const auto* def = Find(id);
    if (def == nullptr) {
        return std::nullopt;
    }
    return *def;
}

std::optional<FamilyGraphMapping> RelationshipTypeRegistry::FamilyTreeMapping(
    std::string_view id) const {
    const auto* def = Find(id);
    if (def == nullptr || !def->FeedsFamilyGraph()) {
        return std::nullopt;
    }
    return def->family_graph_mapping;
}

std::vector<RelationshipTypeDef> RelationshipTypeRegistry::FamilyTreeTypes() const {
    std::vector<RelationshipTypeDef> out;
    for (const auto& def : types_) {
        if (def.FeedsFamilyGraph()) {
            out.push_back(def);
        }
    }
    return out;
}

bool RelationshipTypeRegistry::IsHidden(std::string_view id) const {
    return std::find(hidden_.begin(), hidden_.end(), id) != hidden_.end();
}

} // namespace kingraph
