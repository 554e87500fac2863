#include <aion_mcp/backend/backend_bridge.hpp>
#include <aion_mcp/backend/backend_session.hpp>
#include <aion_mcp/config/config_loader.hpp>
#include <aion_mcp/core/log.hpp>
#include <aion_mcp/core/terminal.hpp>
#include <aion_mcp/core/version.hpp>
#include <aion_mcp/mcp/capability_registry.hpp>
#include <aion_mcp/mcp/dispatcher.hpp>
#include <aion_mcp/mcp/mcp_server.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

// Install the global logger. Logs go to stderr or to a JSON file; stdout is
// reserved for protocol frames.
aion_mcp::Result<void, aion_mcp::Error> SetupLogging(
    const aion_mcp::AppConfig& config) {
    using namespace aion_mcp;

    if (config.log_file.has_value()) {
        auto sink = JsonFileSink::Open(*config.log_file);
        if (sink.IsErr()) {
            return Result<void, Error>::Err(std::move(sink).Error());
        }
        InitGlobalLogger(std::move(sink).Value(), config.EffectiveLogLevel());
    } else {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(UseColorForLogs()),
                         config.EffectiveLogLevel());
    }
    return Result<void, Error>::Ok();
}

aion_mcp::BackendSessionOptions MakeSessionOptions(
    const aion_mcp::AppConfig& config) {
    aion_mcp::BackendSessionOptions opts;
    opts.connect_timeout = std::chrono::seconds(config.backend.ConnectTimeoutSeconds());
    opts.read_timeout = std::chrono::seconds(config.backend.TimeoutSeconds());
    opts.write_timeout = std::chrono::seconds(config.backend.TimeoutSeconds());
    opts.tls_verify = config.backend.TlsVerify();
    opts.api_key = config.backend.api_key;
    opts.user_agent = std::string(aion_mcp::kServerName) + "/" + aion_mcp::kVersion;
    return opts;
}

// Resources in listing order: the catalog, configured entries, then models
// discovered from the backend. Later entries that repeat a locator are dropped.
std::vector<aion_mcp::ResourceDescriptor> CollectResources(
    const aion_mcp::AppConfig& config, aion_mcp::BackendBridge& bridge) {
    using namespace aion_mcp;

    std::vector<ResourceDescriptor> resources;
    std::set<std::string> seen;
    auto add = [&](ResourceDescriptor resource) {
        if (seen.insert(resource.locator).second) {
            resources.push_back(std::move(resource));
        } else {
            LogDebug("startup", "skipping duplicate resource " + resource.locator);
        }
    };

    add(ModelCatalogResource());
    for (const auto& entry : config.resources) {
        add(ResourceDescriptor{entry.name, entry.kind, entry.uri, entry.description});
    }

    if (!config.DiscoverResources()) {
        return resources;
    }
    auto catalog = bridge.FetchModelCatalog();
    if (catalog.IsErr()) {
        LogWarn("startup", "Model discovery failed: " + catalog.Error().message +
                               "; continuing with static resources");
        return resources;
    }
    auto models = ModelResourcesFromCatalog(catalog.Value());
    LogInfo("startup", "Discovered " + std::to_string(models.size()) + " model(s)");
    for (auto& model : models) {
        add(std::move(model));
    }
    return resources;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace aion_mcp;

    auto config_result = LoadConfig(argc, argv);
    if (config_result.IsErr()) {
        const auto& error = config_result.Error();
        std::cerr << "Error: " << error.message << "\n";
        return error.ExitCode();
    }
    const auto config = std::move(config_result).Value();

    auto logging = SetupLogging(config);
    if (logging.IsErr()) {
        std::cerr << "Error: " << logging.Error().ToString() << "\n";
        return logging.Error().ExitCode();
    }

    const auto& url = *config.backend.url;
    LogInfo("startup", std::string(kServerName) + " " + kVersion +
                           " forwarding to " + url.Value());
    if (config.backend.api_key.has_value()) {
        LogDebug("startup", "Using API key " + config.backend.api_key->Redacted());
    } else {
        LogWarn("startup", "No API key configured; backend calls are unauthenticated");
    }
    if (!config.backend.TlsVerify()) {
        LogWarn("startup", "TLS certificate verification is disabled");
    }

    BackendSession session(url, MakeSessionOptions(config));
    BackendBridge bridge(session);

    CapabilityRegistry::Builder builder;
    builder.AddTools(DefaultTools()).AddResources(CollectResources(config, bridge));
    auto registry_result = std::move(builder).Build();
    if (registry_result.IsErr()) {
        LogError("startup", registry_result.Error().ToString());
        std::cerr << "Error: " << registry_result.Error().message << "\n";
        return registry_result.Error().ExitCode();
    }
    const auto registry = std::move(registry_result).Value();

    Dispatcher dispatcher(registry, bridge);
    McpServer server(dispatcher);

    // Blocks until EOF on stdin.
    auto run = server.Run();
    if (run.IsErr()) {
        LogError("server", run.Error().CategoryName() + " error: " +
                               run.Error().ToString());
        return run.Error().ExitCode();
    }
    return kExitSuccess;
}
