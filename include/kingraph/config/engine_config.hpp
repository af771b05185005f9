#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kingraph {

// User field name -> canonical field name. Kept in file order; when several
// user fields map to one canonical field the first present one wins.
struct FieldAlias {
    std::string user_field;
    std::string canonical;
};

// A user-defined relationship type. Category, line style and mapping stay as
// written in the file; the registry interprets them.
struct RelationshipTypeConfig {
    std::string id;
    std::string name;
    std::string description;
    std::string category = "social";
    std::string color = "#6b7280";
    std::string line_style = "solid";
    std::optional<std::string> inverse;
    bool symmetric = false;
    bool include_on_family_tree = false;
    std::optional<std::string> family_graph_mapping;
};

// Customisation of a built-in relationship type. Unset fields keep the
// built-in value.
struct RelationshipTypeOverride {
    std::string id;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> color;
    std::optional<std::string> line_style;
    std::optional<bool> include_on_family_tree;
    std::optional<std::string> family_graph_mapping;
};

struct EngineConfig {
    std::string log_level = "info";

    std::vector<FieldAlias> field_aliases;

    // Domain ("sex", "gender_identity", "event_type", "place_category",
    // "note_type") -> user value -> canonical value.
    std::map<std::string, std::map<std::string, std::string>> value_aliases;

    std::vector<RelationshipTypeConfig> relationship_types;
    std::vector<RelationshipTypeOverride> relationship_type_overrides;
    std::vector<std::string> hidden_relationship_types;
    bool show_builtin_relationship_types = true;

    // Distribute gender-neutral step/adoptive parents into the gendered
    // slots by the target's sex during reconciliation.
    bool enable_gendered_parent_slots = true;
};

} // namespace kingraph
