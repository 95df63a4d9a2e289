#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace sandbar::config {

// $SANDBAR_CONFIG, else ~/.sandbar/config.json.
std::filesystem::path GetConfigPath();

// Reads the config file (if any), then applies SANDBAR_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironmentOverrides(Config& config);

}  // namespace sandbar::config
