#include <aion_mcp/rpc/message.hpp>

namespace aion_mcp {

namespace {

bool IsValidId(const Json& id) {
    return id.is_string() || id.is_number_integer();
}

Result<Message, ParseFailure> Fail(RpcError error, Json id, bool reply) {
    return Result<Message, ParseFailure>::Err(
        ParseFailure{std::move(error), std::move(id), reply});
}

Result<RpcError, std::string> DecodeErrorObject(const Json& error) {
    if (!error.is_object() || !error.contains("code") ||
        !error["code"].is_number_integer() || !error.contains("message") ||
        !error["message"].is_string()) {
        return Result<RpcError, std::string>::Err(
            "'error' must be an object with integer 'code' and string 'message'");
    }
    RpcError decoded;
    decoded.code = error["code"].get<int>();
    decoded.message = error["message"].get<std::string>();
    if (error.contains("data")) {
        decoded.data = error["data"];
    }
    return Result<RpcError, std::string>::Ok(std::move(decoded));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RpcError
// ---------------------------------------------------------------------------
RpcError RpcError::ParseError(const std::string& detail) {
    return RpcError{error_code::kParseError, "Parse error",
                    Json{{"detail", detail}}};
}

RpcError RpcError::InvalidRequest(const std::string& reason) {
    return RpcError{error_code::kInvalidRequest, "Invalid request",
                    Json{{"reason", reason}}};
}

RpcError RpcError::MethodNotFound(const std::string& method) {
    return RpcError{error_code::kMethodNotFound, "Method not found",
                    Json{{"method", method}}};
}

RpcError RpcError::InvalidParams(Json data) {
    return RpcError{error_code::kInvalidParams, "Invalid params",
                    std::move(data)};
}

RpcError RpcError::InternalError(const std::string& message,
                                 std::optional<Json> data) {
    return RpcError{error_code::kInternalError, message, std::move(data)};
}

Json RpcError::ToJson() const {
    Json j;
    j["code"] = code;
    j["message"] = message;
    if (data.has_value()) {
        j["data"] = *data;
    }
    return j;
}

// ---------------------------------------------------------------------------
// ParseMessage
// ---------------------------------------------------------------------------
Result<Message, ParseFailure> ParseMessage(std::string_view payload) {
    Json j;
    bool too_deep = false;
    try {
        j = Json::parse(payload.begin(), payload.end(), DepthLimit(too_deep));
    } catch (const Json::parse_error& e) {
        return Fail(RpcError::ParseError(e.what()), nullptr, true);
    }
    if (too_deep) {
        return Fail(RpcError::ParseError("nesting deeper than " +
                                         std::to_string(kMaxJsonDepth) +
                                         " levels"),
                    nullptr, true);
    }

    if (!j.is_object()) {
        const auto reason = j.is_array()
            ? "batch requests are not supported"
            : "message must be a JSON object";
        return Fail(RpcError::InvalidRequest(reason), nullptr, true);
    }

    const bool has_id = j.contains("id");
    Json id = nullptr;
    if (has_id && IsValidId(j["id"])) {
        id = j["id"];
    }

    if (!j.contains("jsonrpc") || j["jsonrpc"] != kJsonRpcVersion) {
        return Fail(RpcError::InvalidRequest("'jsonrpc' must be \"2.0\""),
                    id, has_id);
    }

    // Responses (we never issue requests, but decode them faithfully).
    if (!j.contains("method") && (j.contains("result") || j.contains("error"))) {
        if (!has_id) {
            return Fail(RpcError::InvalidRequest("response without 'id'"),
                        nullptr, false);
        }
        Message message;
        message.id = j["id"];
        if (j.contains("error")) {
            auto decoded = DecodeErrorObject(j["error"]);
            if (decoded.IsErr()) {
                return Fail(RpcError::InvalidRequest(decoded.Error()), id, true);
            }
            message.kind = MessageKind::ErrorResponse;
            message.error = std::move(decoded).Value();
        } else {
            message.kind = MessageKind::Response;
            message.result = j["result"];
        }
        return Result<Message, ParseFailure>::Ok(std::move(message));
    }

    if (has_id && !IsValidId(j["id"])) {
        return Fail(RpcError::InvalidRequest(
                        "'id' must be a string or an integer"),
                    nullptr, true);
    }

    if (!j.contains("method") || !j["method"].is_string()) {
        return Fail(RpcError::InvalidRequest("'method' must be a string"),
                    id, has_id);
    }

    Message message;
    message.kind = has_id ? MessageKind::Request : MessageKind::Notification;
    message.method = j["method"].get<std::string>();
    message.id = id;

    if (j.contains("params")) {
        const auto& params = j["params"];
        if (!params.is_object() && !params.is_array()) {
            return Fail(RpcError::InvalidRequest(
                            "'params' must be an object or an array"),
                        id, has_id);
        }
        message.params = params;
    }

    return Result<Message, ParseFailure>::Ok(std::move(message));
}

// ---------------------------------------------------------------------------
// Response builders
// ---------------------------------------------------------------------------
Json MakeResultResponse(const Json& id, Json result) {
    Json j;
    j["jsonrpc"] = kJsonRpcVersion;
    j["result"] = std::move(result);
    j["id"] = id;
    return j;
}

Json MakeErrorResponse(const Json& id, const RpcError& error) {
    Json j;
    j["jsonrpc"] = kJsonRpcVersion;
    j["error"] = error.ToJson();
    j["id"] = id;
    return j;
}

std::string SerializeMessage(const Json& message) {
    return message.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace aion_mcp
