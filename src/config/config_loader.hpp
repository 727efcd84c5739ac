#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codebox::config {

// Defaults, then the JSON file, then CODEBOX_* environment variables.
Config LoadConfig();

Config LoadConfigFromFile(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

}  // namespace codebox::config
