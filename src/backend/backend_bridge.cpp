#include <aion_mcp/backend/backend_bridge.hpp>

#include <aion_mcp/core/log.hpp>

namespace aion_mcp {

namespace {

constexpr size_t kMaxErrorBodyEcho = 1024;

const char* ReasonName(BackendFailureKind kind) {
    switch (kind) {
        case BackendFailureKind::Unreachable: return "backend_unreachable";
        case BackendFailureKind::Timeout:     return "backend_timeout";
        case BackendFailureKind::Application: return "backend_error";
        case BackendFailureKind::Internal:    return "internal_error";
    }
    return "backend_error";
}

BackendFailure FromTransportError(const Error& error) {
    BackendFailure failure;
    switch (error.category) {
        case ErrorCategory::Timeout:
            failure.kind = BackendFailureKind::Timeout;
            failure.message = "Backend timeout";
            break;
        case ErrorCategory::Connection:
        case ErrorCategory::Tls:
            failure.kind = BackendFailureKind::Unreachable;
            failure.message = "Backend unreachable";
            break;
        default:
            failure.kind = BackendFailureKind::Internal;
            failure.message = "Backend request failed";
            break;
    }
    return failure;
}

// Pull a human-readable message and structured detail out of an error body.
// Recognised shapes:
//   {"error": "text"}                      {"message": "text"}
//   {"error": {"message": "text", ...}}    {"detail": "text" | [...]}
BackendFailure FromApplicationError(int status, const std::string& body) {
    BackendFailure failure;
    failure.kind = BackendFailureKind::Application;
    failure.http_status = status;
    failure.message = "Backend request failed with HTTP " + std::to_string(status);

    Json data = Json::object();
    data["status"] = status;

    bool too_deep = false;
    auto parsed = Json::parse(body, DepthLimit(too_deep), false);
    if (too_deep) {
        parsed = Json(Json::value_t::discarded);
    }
    if (!parsed.is_discarded() && parsed.is_object()) {
        bool have_message = false;
        if (parsed.contains("error")) {
            const auto& error = parsed["error"];
            if (error.is_string()) {
                failure.message = error.get<std::string>();
                have_message = true;
            } else if (error.is_object()) {
                if (error.contains("message") && error["message"].is_string()) {
                    failure.message = error["message"].get<std::string>();
                    have_message = true;
                }
                data["detail"] = error;
            }
        }
        if (!have_message && parsed.contains("message") &&
            parsed["message"].is_string()) {
            failure.message = parsed["message"].get<std::string>();
            have_message = true;
        }

        if (parsed.contains("detail")) {
            const auto& detail = parsed["detail"];
            if (detail.is_string() && !have_message) {
                failure.message = detail.get<std::string>();
            } else {
                data["detail"] = detail;
            }
        }
        if (parsed.contains("data") && !data.contains("detail")) {
            data["detail"] = parsed["data"];
        }
    } else if (!parsed.is_discarded()) {
        data["detail"] = parsed;
    } else if (!body.empty()) {
        data["body"] = body.size() <= kMaxErrorBodyEcho
            ? body
            : body.substr(0, kMaxErrorBodyEcho) + "...";
    }

    failure.data = std::move(data);
    return failure;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BackendFailure
// ---------------------------------------------------------------------------
RpcError BackendFailure::ToRpcError() const {
    if (kind == BackendFailureKind::Application) {
        return RpcError{error_code::kBackendError, message, data};
    }
    return RpcError::InternalError(message, Json{{"reason", ReasonName(kind)}});
}

std::vector<BackendRoute> DefaultRoutes() {
    return {
        {"run_inference", "/api/v1/infer"},
        {"data_analysis", "/api/v1/analyze"},
    };
}

// ---------------------------------------------------------------------------
// BackendBridge
// ---------------------------------------------------------------------------
BackendBridge::BackendBridge(IBackendSession& session,
                             std::vector<BackendRoute> routes)
    : session_(session), routes_(std::move(routes)) {}

bool BackendBridge::HasRoute(const std::string& tool) const {
    for (const auto& route : routes_) {
        if (route.tool == tool) {
            return true;
        }
    }
    return false;
}

Result<Json, BackendFailure> BackendBridge::Invoke(const std::string& tool,
                                                   const Json& inputs) {
    const BackendRoute* route = nullptr;
    for (const auto& candidate : routes_) {
        if (candidate.tool == tool) {
            route = &candidate;
            break;
        }
    }
    if (route == nullptr) {
        LogError("bridge", "no backend route for tool " + tool);
        return Result<Json, BackendFailure>::Err(BackendFailure{
            BackendFailureKind::Internal, "No backend route for tool",
            Json{{"tool", tool}}, std::nullopt});
    }

    LogInfo("bridge", "invoking " + tool + " via " + route->path);
    const auto body = inputs.dump(-1, ' ', false, Json::error_handler_t::replace);
    return Complete(tool, session_.Post(route->path, body, "application/json"));
}

Result<Json, BackendFailure> BackendBridge::FetchModelCatalog() {
    return Complete("model catalog", session_.Get(kModelCatalogPath));
}

Result<Json, BackendFailure> BackendBridge::Complete(
    const std::string& what, Result<HttpResponse, Error> response) {
    if (response.IsErr()) {
        const auto& error = response.Error();
        LogWarn("bridge", what + " failed: " + error.ToString());
        return Result<Json, BackendFailure>::Err(FromTransportError(error));
    }

    const auto& http = response.Value();
    if (http.status_code < 200 || http.status_code >= 300) {
        auto failure = FromApplicationError(http.status_code, http.body);
        LogWarn("bridge", what + " rejected by backend (HTTP " +
                              std::to_string(http.status_code) + "): " +
                              failure.message);
        return Result<Json, BackendFailure>::Err(std::move(failure));
    }

    if (http.body.empty()) {
        return Result<Json, BackendFailure>::Ok(Json(nullptr));
    }

    bool too_deep = false;
    auto parsed = Json::parse(http.body, DepthLimit(too_deep), false);
    if (parsed.is_discarded() || too_deep) {
        LogWarn("bridge", what + " returned a body that is not JSON or is nested too deeply");
        return Result<Json, BackendFailure>::Err(BackendFailure{
            BackendFailureKind::Internal,
            "Backend returned a malformed payload", std::nullopt,
            http.status_code});
    }
    return Result<Json, BackendFailure>::Ok(std::move(parsed));
}

} // namespace aion_mcp
