#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace runbox::config {

// Defaults, then $RUNBOX_CONFIG (or ~/.runbox/config.json), then environment.
Config LoadConfig();

// Reads the given file (if present) and applies environment overrides.
Config LoadConfigFrom(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

}  // namespace runbox::config
