#include <kingraph/config/config_loader.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/core/text.hpp>

#include <yaml-cpp/yaml.h>

#include <set>
#include <string>

namespace kingraph {

namespace {

constexpr const char* kComponent = "ConfigLoader";

const std::set<std::string>& KnownValueDomains() {
    static const std::set<std::string> domains = {
        "sex", "gender_identity", "event_type", "place_category", "note_type",
    };
    return domains;
}

std::optional<std::string> OptionalString(const YAML::Node& node, const char* key) {
    if (!node[key] || node[key].IsNull()) {
        return std::nullopt;
    }
    return node[key].as<std::string>();
}

Result<RelationshipTypeConfig, Error> ParseRelationshipType(const YAML::Node& node) {
    if (!node.IsMap() || !node["id"]) {
        return Result<RelationshipTypeConfig, Error>::Err(Error::InvalidConfig(
            "relationship_types", "Relationship type entry missing 'id' field"));
    }

    RelationshipTypeConfig def;
    def.id = node["id"].as<std::string>();
    if (node["name"]) def.name = node["name"].as<std::string>();
    if (node["description"]) def.description = node["description"].as<std::string>();
    if (node["category"]) def.category = node["category"].as<std::string>();
    if (node["color"]) def.color = node["color"].as<std::string>();
    if (node["line_style"]) def.line_style = node["line_style"].as<std::string>();
    def.inverse = OptionalString(node, "inverse");
    if (node["symmetric"]) def.symmetric = node["symmetric"].as<bool>();
    if (node["include_on_family_tree"]) {
        def.include_on_family_tree = node["include_on_family_tree"].as<bool>();
    }
    def.family_graph_mapping = OptionalString(node, "family_graph_mapping");
    return Result<RelationshipTypeConfig, Error>::Ok(std::move(def));
}

RelationshipTypeOverride ParseOverride(const std::string& id, const YAML::Node& node) {
    RelationshipTypeOverride override_def;
    override_def.id = id;
    override_def.name = OptionalString(node, "name");
    override_def.description = OptionalString(node, "description");
    override_def.color = OptionalString(node, "color");
    override_def.line_style = OptionalString(node, "line_style");
    if (node["include_on_family_tree"]) {
        override_def.include_on_family_tree = node["include_on_family_tree"].as<bool>();
    }
    override_def.family_graph_mapping = OptionalString(node, "family_graph_mapping");
    return override_def;
}

Result<EngineConfig, Error> ParseRoot(const YAML::Node& root) {
    EngineConfig config;
    if (!root || root.IsNull()) {
        return Result<EngineConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<EngineConfig, Error>::Err(
            Error::InvalidConfig("", "Top-level YAML node must be a mapping"));
    }

    if (root["log_level"]) {
        config.log_level = root["log_level"].as<std::string>();
    }

    // -- Field aliases (user field -> canonical field, file order) --
    if (const auto& aliases = root["field_aliases"]) {
        if (!aliases.IsMap()) {
            return Result<EngineConfig, Error>::Err(Error::InvalidConfig(
                "field_aliases", "field_aliases must be a mapping of user field to canonical field"));
        }
        for (const auto& entry : aliases) {
            config.field_aliases.push_back(FieldAlias{
                entry.first.as<std::string>(),
                entry.second.as<std::string>(),
            });
        }
    }

    // -- Value aliases (per domain) --
    if (const auto& domains = root["value_aliases"]) {
        if (!domains.IsMap()) {
            return Result<EngineConfig, Error>::Err(Error::InvalidConfig(
                "value_aliases", "value_aliases must be a mapping of domain to synonyms"));
        }
        for (const auto& domain : domains) {
            auto& table = config.value_aliases[domain.first.as<std::string>()];
            if (domain.second.IsNull()) {
                continue;
            }
            for (const auto& entry : domain.second) {
                table[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }
    }

    // -- Relationship types --
    if (const auto& types = root["relationship_types"]) {
        for (const auto& node : types) {
            auto def = ParseRelationshipType(node);
            if (def.IsErr()) {
                return Result<EngineConfig, Error>::Err(std::move(def).Error());
            }
            config.relationship_types.push_back(std::move(def).Value());
        }
    }

    if (const auto& overrides = root["relationship_type_overrides"]) {
        for (const auto& entry : overrides) {
            config.relationship_type_overrides.push_back(
                ParseOverride(entry.first.as<std::string>(), entry.second));
        }
    }

    if (const auto& hidden = root["hidden_relationship_types"]) {
        for (const auto& id : hidden) {
            config.hidden_relationship_types.push_back(id.as<std::string>());
        }
    }

    // -- Options --
    if (root["show_builtin_relationship_types"]) {
        config.show_builtin_relationship_types =
            root["show_builtin_relationship_types"].as<bool>();
    }
    if (root["enable_gendered_parent_slots"]) {
        config.enable_gendered_parent_slots =
            root["enable_gendered_parent_slots"].as<bool>();
    }

    return Result<EngineConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<EngineConfig, Error> LoadFromYaml(std::string_view file_path) {
    try {
        auto root = YAML::LoadFile(std::string(file_path));
        auto result = ParseRoot(root);
        if (result.IsErr()) {
            auto error = std::move(result).Error();
            if (error.subject.empty()) {
                error.subject = std::string(file_path);
            }
            return Result<EngineConfig, Error>::Err(std::move(error));
        }
        LogDebug(kComponent, "Loaded engine config from " + std::string(file_path));
        return result;
    } catch (const YAML::Exception& e) {
        return Result<EngineConfig, Error>::Err(Error::InvalidConfig(
            std::string(file_path), "Failed to parse YAML file: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromYamlString
// ---------------------------------------------------------------------------
Result<EngineConfig, Error> LoadFromYamlString(std::string_view yaml_text) {
    try {
        return ParseRoot(YAML::Load(std::string(yaml_text)));
    } catch (const YAML::Exception& e) {
        return Result<EngineConfig, Error>::Err(Error::InvalidConfig(
            "", "Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const EngineConfig& config) {
    if (!ParseLogLevel(config.log_level)) {
        return Result<void, Error>::Err(Error::InvalidConfig(
            "log_level", "Unknown log level: '" + config.log_level + "'"));
    }

    for (const auto& alias : config.field_aliases) {
        if (Trim(alias.user_field).empty() || Trim(alias.canonical).empty()) {
            return Result<void, Error>::Err(Error::InvalidConfig(
                "field_aliases", "Field alias entries need both a user field and a canonical field"));
        }
        if (alias.user_field == alias.canonical) {
            return Result<void, Error>::Err(Error::InvalidConfig(
                "field_aliases", "Field '" + alias.user_field + "' is aliased to itself"));
        }
    }

    for (const auto& [domain, table] : config.value_aliases) {
        if (KnownValueDomains().count(domain) == 0) {
            return Result<void, Error>::Err(Error::InvalidConfig(
                "value_aliases", "Unknown value alias domain: '" + domain + "'"));
        }
    }

    std::set<std::string> seen;
    for (const auto& def : config.relationship_types) {
        if (Trim(def.id).empty()) {
            return Result<void, Error>::Err(Error::InvalidConfig(
                "relationship_types", "Relationship type with empty id"));
        }
        if (!seen.insert(def.id).second) {
            return Result<void, Error>::Err(Error::InvalidConfig(
                "relationship_types", "Duplicate relationship type id: '" + def.id + "'"));
        }
    }

    return Result<void, Error>::Ok();
}

} // namespace kingraph
