#include <aion_mcp/config/config_loader.hpp>

#include <aion_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace aion_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

void SetEnvIfUnset(const std::string& name, const std::string& value) {
#ifdef _WIN32
    if (std::getenv(name.c_str()) == nullptr) {
        _putenv_s(name.c_str(), value.c_str());
    }
#else
    setenv(name.c_str(), value.c_str(), 0);
#endif
}

Result<BackendUrl, Error> ParseUrl(const std::string& value,
                                   const std::string& source) {
    auto url = BackendUrl::Create(value);
    if (url.IsErr()) {
        return Result<BackendUrl, Error>::Err(
            MakeConfigError("Invalid backend URL from " + source + ": " +
                            url.Error()));
    }
    return Result<BackendUrl, Error>::Ok(std::move(url).Value());
}

Result<ApiKey, Error> ParseKey(const std::string& value,
                               const std::string& source) {
    auto key = ApiKey::Create(value);
    if (key.IsErr()) {
        return Result<ApiKey, Error>::Err(
            MakeConfigError("Invalid API key from " + source + ": " + key.Error()));
    }
    return Result<ApiKey, Error>::Ok(std::move(key).Value());
}

Result<LogLevel, Error> ParseLevel(const std::string& value,
                                   const std::string& source) {
    auto level = ParseLogLevel(value);
    if (level.IsErr()) {
        return Result<LogLevel, Error>::Err(
            MakeConfigError("Invalid log level from " + source + ": " +
                            level.Error()));
    }
    return Result<LogLevel, Error>::Ok(level.Value());
}

// Build a ResourceConfig from a parsed YAML node.
Result<ResourceConfig, Error> ParseYamlResource(const YAML::Node& node) {
    if (!node["uri"]) {
        return Result<ResourceConfig, Error>::Err(
            MakeConfigError("Resource entry missing 'uri' field"));
    }
    ResourceConfig resource;
    resource.uri = node["uri"].as<std::string>();
    resource.name = node["name"] ? node["name"].as<std::string>() : resource.uri;
    resource.kind = node["kind"] ? node["kind"].as<std::string>() : "resource";
    if (node["description"]) {
        resource.description = node["description"].as<std::string>();
    }
    if (resource.uri.empty()) {
        return Result<ResourceConfig, Error>::Err(
            MakeConfigError("Resource entry has an empty 'uri'"));
    }
    return Result<ResourceConfig, Error>::Ok(std::move(resource));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    AppConfig config;
    config.config_file = path;

    try {
        const YAML::Node root = YAML::LoadFile(path);

        // -- Backend --
        if (const auto backend = root["backend"]) {
            if (backend["url"]) {
                auto url = ParseUrl(backend["url"].as<std::string>(), path);
                if (url.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(url).Error());
                }
                config.backend.url = std::move(url).Value();
            }
            if (backend["api_key"]) {
                auto key = ParseKey(backend["api_key"].as<std::string>(), path);
                if (key.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(key).Error());
                }
                config.backend.api_key = std::move(key).Value();
            }
            if (backend["api_key_env"]) {
                config.backend.api_key_env = backend["api_key_env"].as<std::string>();
            }
            if (backend["timeout"]) {
                config.backend.timeout_seconds = backend["timeout"].as<int>();
            }
            if (backend["connect_timeout"]) {
                config.backend.connect_timeout_seconds =
                    backend["connect_timeout"].as<int>();
            }
            if (backend["tls_verify"]) {
                config.backend.tls_verify = backend["tls_verify"].as<bool>();
            }
        }

        // -- Resources --
        if (const auto resources = root["resources"]) {
            for (const auto& node : resources) {
                auto resource = ParseYamlResource(node);
                if (resource.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(resource).Error());
                }
                config.resources.push_back(std::move(resource).Value());
            }
        }
        if (root["discover_resources"]) {
            config.discover_resources = root["discover_resources"].as<bool>();
        }

        // -- Logging --
        if (root["log_level"]) {
            auto level = ParseLevel(root["log_level"].as<std::string>(), path);
            if (level.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(level).Error());
            }
            config.log_level = level.Value();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("aion-mcp", kVersion);
    program.add_description(
        "MCP server on stdin/stdout that forwards tool calls to the AION-R API.");

    // Backend flags
    program.add_argument("--api-url")
        .help("Backend base URL (env: AION_R_API_URL)");
    program.add_argument("--api-key")
        .help("Bearer credential for the backend (env: AION_R_API_KEY)");
    program.add_argument("--api-key-env")
        .help("Environment variable containing the bearer credential");
    program.add_argument("--timeout")
        .help("Backend request timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--connect-timeout")
        .help("Backend connect timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-discover")
        .help("Do not query the backend model catalog at startup")
        .default_value(false)
        .implicit_value(true);

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--env-file")
        .help("Path to a dotenv file (default: ./.env)");
    program.add_argument("--log-level")
        .help("debug, info, warn or error (env: AION_MCP_LOG_LEVEL)");
    program.add_argument("--log-file")
        .help("Write JSON log lines to this file instead of stderr");
    program.add_argument("-v", "--verbose")
        .help("Shorthand for --log-level info")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--api-url")) {
        auto url = ParseUrl(*val, "--api-url");
        if (url.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(url).Error());
        }
        config.backend.url = std::move(url).Value();
    }
    if (auto val = program.present("--api-key")) {
        auto key = ParseKey(*val, "--api-key");
        if (key.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(key).Error());
        }
        config.backend.api_key = std::move(key).Value();
    }
    if (auto val = program.present("--api-key-env")) {
        config.backend.api_key_env = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.backend.timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--connect-timeout")) {
        config.backend.connect_timeout_seconds = *val;
    }
    if (program.get<bool>("--insecure")) {
        config.backend.tls_verify = false;
    }
    if (program.get<bool>("--no-discover")) {
        config.discover_resources = false;
    }

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--env-file")) {
        config.env_file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.log_level = LogLevel::Info;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLevel(*val, "--log-level");
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(level).Error());
        }
        config.log_level = level.Value();
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromEnv() {
    AppConfig config;

    if (const char* url = std::getenv(kEnvApiUrl); url != nullptr && *url != '\0') {
        auto parsed = ParseUrl(url, kEnvApiUrl);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(parsed).Error());
        }
        config.backend.url = std::move(parsed).Value();
    }
    if (const char* key = std::getenv(kEnvApiKey); key != nullptr && *key != '\0') {
        auto parsed = ParseKey(key, kEnvApiKey);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(parsed).Error());
        }
        config.backend.api_key = std::move(parsed).Value();
    }
    if (const char* level = std::getenv(kEnvLogLevel); level != nullptr && *level != '\0') {
        auto parsed = ParseLevel(level, kEnvLogLevel);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(parsed).Error());
        }
        config.log_level = parsed.Value();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadDotEnv
// ---------------------------------------------------------------------------
Result<int, Error> LoadDotEnv(std::string_view file_path) {
    std::ifstream in{std::string(file_path)};
    if (!in) {
        return Result<int, Error>::Ok(0);
    }

    int loaded = 0;
    int line_no = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        auto text = Trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }
        if (text.substr(0, 7) == "export ") {
            text = Trim(text.substr(7));
        }
        const auto eq = text.find('=');
        if (eq == std::string_view::npos) {
            return Result<int, Error>::Err(MakeConfigError(
                std::string(file_path) + ":" + std::to_string(line_no) +
                ": expected KEY=VALUE"));
        }
        const auto key = std::string(Trim(text.substr(0, eq)));
        auto value = Trim(text.substr(eq + 1));
        if (key.empty()) {
            return Result<int, Error>::Err(MakeConfigError(
                std::string(file_path) + ":" + std::to_string(line_no) +
                ": empty variable name"));
        }
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        SetEnvIfUnset(key, std::string(value));
        ++loaded;
    }
    return Result<int, Error>::Ok(loaded);
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides) {
    AppConfig merged = base;

    const auto& b = overrides.backend;
    if (b.url.has_value()) {
        merged.backend.url = b.url;
    }
    if (b.api_key.has_value()) {
        merged.backend.api_key = b.api_key;
    }
    if (b.api_key_env.has_value()) {
        merged.backend.api_key_env = b.api_key_env;
    }
    if (b.timeout_seconds.has_value()) {
        merged.backend.timeout_seconds = b.timeout_seconds;
    }
    if (b.connect_timeout_seconds.has_value()) {
        merged.backend.connect_timeout_seconds = b.connect_timeout_seconds;
    }
    if (b.tls_verify.has_value()) {
        merged.backend.tls_verify = b.tls_verify;
    }

    // Resource lists are not merged entry by entry: a non-empty list wins.
    if (!overrides.resources.empty()) {
        merged.resources = overrides.resources;
    }
    if (overrides.discover_resources.has_value()) {
        merged.discover_resources = overrides.discover_resources;
    }
    if (overrides.log_level.has_value()) {
        merged.log_level = overrides.log_level;
    }
    if (overrides.log_file.has_value()) {
        merged.log_file = overrides.log_file;
    }
    if (overrides.config_file.has_value()) {
        merged.config_file = overrides.config_file;
    }
    if (overrides.env_file.has_value()) {
        merged.env_file = overrides.env_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveApiKeyEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config) {
    if (config.backend.api_key.has_value() ||
        !config.backend.api_key_env.has_value()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }

    const auto& env_var = *config.backend.api_key_env;
    const char* env_val = std::getenv(env_var.c_str());
    if (env_val == nullptr || *env_val == '\0') {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Environment variable '" + env_var +
                            "' not set (specified by api_key_env)"));
    }
    auto key = ParseKey(env_val, env_var);
    if (key.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(key).Error());
    }
    config.backend.api_key = std::move(key).Value();
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (!config.backend.url.has_value()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Missing required backend URL (set --api-url or AION_R_API_URL)"));
    }
    if (config.backend.TimeoutSeconds() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.backend.TimeoutSeconds())));
    }
    if (config.backend.ConnectTimeoutSeconds() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Connect timeout must be positive, got " +
                            std::to_string(config.backend.ConnectTimeoutSeconds())));
    }
    for (const auto& resource : config.resources) {
        if (resource.uri.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Resource '" + resource.name + "' has no uri"));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }
    const auto cli_config = std::move(cli).Value();

    auto dotenv = LoadDotEnv(cli_config.env_file.value_or(kDefaultEnvFile));
    if (dotenv.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(dotenv).Error());
    }

    AppConfig config;
    if (cli_config.config_file.has_value()) {
        auto yaml = LoadFromYaml(*cli_config.config_file);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = std::move(yaml).Value();
    }

    auto env = LoadFromEnv();
    if (env.IsErr()) {
        return env;
    }
    config = MergeConfigs(config, env.Value());
    config = MergeConfigs(config, cli_config);

    auto resolved = ResolveApiKeyEnv(std::move(config));
    if (resolved.IsErr()) {
        return resolved;
    }
    config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // namespace aion_mcp
