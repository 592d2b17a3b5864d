#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace klatsch::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Defaults, then the JSON config file (if any), then the environment.
// Does not validate; call ValidateConfig before using the result.
Config LoadConfig();

// $KLATSCH_CONFIG, or ~/.klatsch/config.json.
std::filesystem::path GetConfigPath();

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

// Sets variables from a KEY=VALUE file without overriding ones already set.
// Returns false if the file does not exist.
bool LoadDotEnv(const std::filesystem::path& path);

// Throws ConfigError for settings the server cannot start with.
void ValidateConfig(const Config& config);

}  // namespace klatsch::config
