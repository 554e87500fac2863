#pragma once

#include <aion_mcp/config/app_config.hpp>
#include <aion_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace aion_mcp {

constexpr const char* kEnvApiUrl = "AION_R_API_URL";
constexpr const char* kEnvApiKey = "AION_R_API_KEY";
constexpr const char* kEnvLogLevel = "AION_MCP_LOG_LEVEL";
constexpr const char* kDefaultEnvFile = ".env";

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. --help and --version print and exit.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Read AION_R_API_URL, AION_R_API_KEY and AION_MCP_LOG_LEVEL.
Result<AppConfig, Error> LoadFromEnv();

// Load KEY=VALUE lines from a dotenv file into the process environment.
// Variables that are already set are left alone. A missing file is not an
// error. Returns the number of assignments read.
Result<int, Error> LoadDotEnv(std::string_view file_path);

// Merge two configs: fields set in overrides replace those in base.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides);

// Resolve api_key_env: if no key is set and api_key_env names a variable,
// read it and populate api_key.
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Full startup sequence: CLI, dotenv, YAML, environment, merge, resolve,
// validate. Precedence (highest first): CLI, environment, YAML.
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv);

} // namespace aion_mcp
