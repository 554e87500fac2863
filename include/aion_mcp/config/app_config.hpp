#pragma once

#include <aion_mcp/core/log.hpp>
#include <aion_mcp/core/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace aion_mcp {

constexpr int kDefaultTimeoutSeconds = 60;
constexpr int kDefaultConnectTimeoutSeconds = 10;

// Unset optionals mean "not given by this source"; MergeConfigs relies on it.
struct BackendConfig {
    std::optional<BackendUrl> url;
    std::optional<ApiKey> api_key;
    std::optional<std::string> api_key_env;  // env var name to read the key from
    std::optional<int> timeout_seconds;
    std::optional<int> connect_timeout_seconds;
    std::optional<bool> tls_verify;

    [[nodiscard]] int TimeoutSeconds() const {
        return timeout_seconds.value_or(kDefaultTimeoutSeconds);
    }
    [[nodiscard]] int ConnectTimeoutSeconds() const {
        return connect_timeout_seconds.value_or(kDefaultConnectTimeoutSeconds);
    }
    [[nodiscard]] bool TlsVerify() const { return tls_verify.value_or(true); }
};

// A statically configured resource entry.
struct ResourceConfig {
    std::string name;
    std::string kind;
    std::string uri;
    std::string description;
};

struct AppConfig {
    BackendConfig backend;
    std::vector<ResourceConfig> resources;
    std::optional<bool> discover_resources;
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
    std::optional<std::string> config_file;
    std::optional<std::string> env_file;

    [[nodiscard]] bool DiscoverResources() const {
        return discover_resources.value_or(true);
    }
    [[nodiscard]] LogLevel EffectiveLogLevel() const {
        return log_level.value_or(LogLevel::Warn);
    }
};

} // namespace aion_mcp
