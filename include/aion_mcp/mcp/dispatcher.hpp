#pragma once

#include <aion_mcp/backend/backend_bridge.hpp>
#include <aion_mcp/core/json.hpp>
#include <aion_mcp/core/result.hpp>
#include <aion_mcp/mcp/capability_registry.hpp>
#include <aion_mcp/rpc/message.hpp>

#include <optional>
#include <string>

namespace aion_mcp {

constexpr const char* kProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// Dispatcher: maps one Request to exactly one Response or ErrorResponse.
//
// Methods:
//   - initialize        fixed server/version descriptor (repeatable)
//   - tools/list        the registry's tool catalog
//   - resources/list    the registry's resource catalog
//   - tools/call        validate against the registry, then call the backend
//
// Notifications run the same handlers but never produce a reply. Nothing is
// kept between calls except the registry and the backend bridge.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(const CapabilityRegistry& registry, BackendBridge& bridge);

    // Returns nullopt for notifications and for inbound responses.
    [[nodiscard]] std::optional<Json> Dispatch(const Message& message);

private:
    using HandlerResult = Result<Json, RpcError>;

    HandlerResult Route(const Message& message);
    HandlerResult HandleInitialize(const Json& params);
    HandlerResult HandleToolsList();
    HandlerResult HandleResourcesList();
    HandlerResult HandleToolsCall(const Json& params);

    const CapabilityRegistry& registry_;
    BackendBridge& bridge_;
};

} // namespace aion_mcp
