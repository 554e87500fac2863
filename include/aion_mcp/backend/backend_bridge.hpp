#pragma once

#include <aion_mcp/backend/i_backend_session.hpp>
#include <aion_mcp/core/json.hpp>
#include <aion_mcp/core/result.hpp>
#include <aion_mcp/rpc/message.hpp>

#include <optional>
#include <string>
#include <vector>

namespace aion_mcp {

// ---------------------------------------------------------------------------
// BackendFailure: classified outcome of a failed backend call.
//
//   Unreachable  connection refused, DNS or TLS failure
//   Timeout      connect/read/write timeout
//   Application  the backend answered with a non-2xx status
//   Internal     the backend answered 2xx with a body we cannot decode, or
//                no route exists for the tool
// ---------------------------------------------------------------------------
enum class BackendFailureKind {
    Unreachable,
    Timeout,
    Application,
    Internal,
};

struct BackendFailure {
    BackendFailureKind kind = BackendFailureKind::Internal;
    std::string message;
    std::optional<Json> data;
    std::optional<int> http_status;

    // Transport failures become -32603 with a generic message and a
    // "reason"; application failures become -32000 carrying the backend's
    // own message and detail.
    [[nodiscard]] RpcError ToRpcError() const;
};

// ---------------------------------------------------------------------------
// BackendRoute: where a tool call is sent.
// ---------------------------------------------------------------------------
struct BackendRoute {
    std::string tool;
    std::string path;
};

/// run_inference -> /api/v1/infer, data_analysis -> /api/v1/analyze.
std::vector<BackendRoute> DefaultRoutes();

constexpr const char* kModelCatalogPath = "/api/v1/models";

// ---------------------------------------------------------------------------
// BackendBridge: translates tool invocations into backend calls.
//
// Tool calls are POSTed as JSON with the validated inputs as the body; the
// backend's JSON response is returned untouched. Every call is a single
// attempt; there is no retry.
// ---------------------------------------------------------------------------
class BackendBridge {
public:
    explicit BackendBridge(IBackendSession& session,
                           std::vector<BackendRoute> routes = DefaultRoutes());

    [[nodiscard]] bool HasRoute(const std::string& tool) const;

    [[nodiscard]] Result<Json, BackendFailure> Invoke(const std::string& tool,
                                                      const Json& inputs);

    // GET the backend model catalog (used for resource discovery).
    [[nodiscard]] Result<Json, BackendFailure> FetchModelCatalog();

private:
    Result<Json, BackendFailure> Complete(const std::string& what,
                                          Result<HttpResponse, Error> response);

    IBackendSession& session_;
    std::vector<BackendRoute> routes_;
};

} // namespace aion_mcp
