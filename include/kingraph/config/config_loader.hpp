#pragma once

#include <kingraph/config/engine_config.hpp>
#include <kingraph/core/result.hpp>

#include <string_view>

namespace kingraph {

// Parse a YAML config file into an EngineConfig.
Result<EngineConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text into an EngineConfig. Used by hosts that keep their
// settings elsewhere and by tests.
Result<EngineConfig, Error> LoadFromYamlString(std::string_view yaml_text);

// Validate that values are sane. Relationship-type mappings are not checked
// here: an invalid mapping degrades to "no mapping" when the registry loads.
Result<void, Error> ValidateConfig(const EngineConfig& config);

} // namespace kingraph
