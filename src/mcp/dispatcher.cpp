#include <aion_mcp/mcp/dispatcher.hpp>

#include <aion_mcp/core/log.hpp>
#include <aion_mcp/core/version.hpp>

#include <exception>

namespace aion_mcp {

namespace {

std::string IdText(const Json& id) {
    return id.is_null() ? "-" : id.dump();
}

bool IsNotificationMethod(const std::string& method) {
    return method.rfind("notifications/", 0) == 0;
}

Result<Json, RpcError> Ok(Json value) {
    return Result<Json, RpcError>::Ok(std::move(value));
}

Result<Json, RpcError> Err(RpcError error) {
    return Result<Json, RpcError>::Err(std::move(error));
}

} // anonymous namespace

Dispatcher::Dispatcher(const CapabilityRegistry& registry,
                       BackendBridge& bridge)
    : registry_(registry), bridge_(bridge) {}

std::optional<Json> Dispatcher::Dispatch(const Message& message) {
    if (message.kind == MessageKind::Response ||
        message.kind == MessageKind::ErrorResponse) {
        LogWarn("dispatch", "ignoring unsolicited response with id " +
                                IdText(message.id));
        return std::nullopt;
    }

    LogDebug("dispatch", message.method + " id=" + IdText(message.id));

    Result<Json, RpcError> outcome = Err(RpcError::InternalError("Internal error"));
    try {
        outcome = Route(message);
    } catch (const std::exception& e) {
        LogError("dispatch", message.method + " failed unexpectedly: " + e.what());
        outcome = Err(RpcError::InternalError("Internal error"));
    }

    if (!message.ExpectsReply()) {
        if (outcome.IsErr() && !IsNotificationMethod(message.method)) {
            LogWarn("dispatch", "notification " + message.method +
                                    " failed: " + outcome.Error().message);
        }
        return std::nullopt;
    }

    if (outcome.IsErr()) {
        LogInfo("dispatch", message.method + " id=" + IdText(message.id) +
                                " -> error " +
                                std::to_string(outcome.Error().code));
        return MakeErrorResponse(message.id, outcome.Error());
    }
    return MakeResultResponse(message.id, std::move(outcome).Value());
}

Dispatcher::HandlerResult Dispatcher::Route(const Message& message) {
    const auto& method = message.method;
    const Json params = message.params.value_or(Json::object());

    if (method == "initialize") {
        return HandleInitialize(params);
    }
    if (method == "tools/list") {
        return HandleToolsList();
    }
    if (method == "resources/list") {
        return HandleResourcesList();
    }
    if (method == "tools/call") {
        return HandleToolsCall(params);
    }
    if (!message.ExpectsReply() && IsNotificationMethod(method)) {
        // notifications/initialized, notifications/cancelled, ...
        LogDebug("dispatch", "acknowledged " + method);
        return Ok(nullptr);
    }
    return Err(RpcError::MethodNotFound(method));
}

Dispatcher::HandlerResult Dispatcher::HandleInitialize(const Json& params) {
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        LogDebug("dispatch", "client protocol version " +
                                 params["protocolVersion"].get<std::string>());
    }

    Json result;
    result["protocolVersion"] = kProtocolVersion;
    result["server"] = {{"name", kServerName}, {"version", kVersion}};
    result["capabilities"] = {{"tools", Json::object()},
                              {"resources", Json::object()}};
    return Ok(std::move(result));
}

Dispatcher::HandlerResult Dispatcher::HandleToolsList() {
    Json tools = Json::array();
    for (const auto& tool : registry_.ListTools()) {
        tools.push_back(tool.ToJson());
    }
    return Ok(Json{{"tools", std::move(tools)}});
}

Dispatcher::HandlerResult Dispatcher::HandleResourcesList() {
    Json resources = Json::array();
    for (const auto& resource : registry_.ListResources()) {
        resources.push_back(resource.ToJson());
    }
    return Ok(Json{{"resources", std::move(resources)}});
}

Dispatcher::HandlerResult Dispatcher::HandleToolsCall(const Json& params) {
    if (!params.is_object()) {
        return Err(RpcError::InvalidParams(Json{
            {"mismatched", Json::array({Json{{"field", "params"},
                                             {"expected", "object"},
                                             {"actual", params.type_name()}}})}}));
    }

    // MCP clients send "arguments"; accept it when "inputs" is absent.
    const char* inputs_key = "inputs";
    if (!params.contains("inputs") && params.contains("arguments")) {
        inputs_key = "arguments";
    }

    Json missing = Json::array();
    Json mismatched = Json::array();
    if (!params.contains("name")) {
        missing.push_back("name");
    } else if (!params["name"].is_string()) {
        mismatched.push_back(Json{{"field", "name"},
                                  {"expected", "string"},
                                  {"actual", params["name"].type_name()}});
    }
    if (!params.contains(inputs_key)) {
        missing.push_back("inputs");
    } else if (!params[inputs_key].is_object()) {
        mismatched.push_back(Json{{"field", inputs_key},
                                  {"expected", "object"},
                                  {"actual", params[inputs_key].type_name()}});
    }
    if (!missing.empty() || !mismatched.empty()) {
        Json data = Json::object();
        if (!missing.empty()) {
            data["missing"] = std::move(missing);
        }
        if (!mismatched.empty()) {
            data["mismatched"] = std::move(mismatched);
        }
        return Err(RpcError::InvalidParams(std::move(data)));
    }

    const auto tool_name = params["name"].get<std::string>();
    auto validated = registry_.Validate(tool_name, params[inputs_key]);
    if (validated.IsErr()) {
        const auto& failure = validated.Error();
        LogInfo("dispatch", "tools/call rejected: " + failure.Summary());
        if (failure.kind == ValidationFailureKind::UnknownTool) {
            return Err(RpcError{error_code::kUnknownTool,
                                "Unknown tool: " + tool_name,
                                failure.ToData()});
        }
        return Err(RpcError::InvalidParams(failure.ToData()));
    }

    auto result = bridge_.Invoke(tool_name, validated.Value());
    if (result.IsErr()) {
        return Err(result.Error().ToRpcError());
    }
    return Ok(std::move(result).Value());
}

} // namespace aion_mcp
