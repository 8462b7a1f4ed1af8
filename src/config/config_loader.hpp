#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace filecron::config {

std::filesystem::path GetConfigPath();

// Defaults, then ~/.filecron/config.json, then FILECRON_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

}  // namespace filecron::config
