#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace anabox::config {

std::filesystem::path GetHomePath();
std::filesystem::path GetConfigPath();

// Defaults, then ~/.anabox/config.json, then ANABOX_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

// Fills paths left empty by the user with locations under ~/.anabox.
void ResolveDefaultPaths(Config& config);

}  // namespace anabox::config
