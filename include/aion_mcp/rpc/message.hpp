#pragma once

#include <aion_mcp/core/json.hpp>
#include <aion_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace aion_mcp {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 error codes.
//
// -32700..-32600 are the codes defined by JSON-RPC itself. The server range
// is split: -32000 is reserved for failures reported by the backend, -32001
// marks a tools/call naming a tool this server does not expose.
// ---------------------------------------------------------------------------
namespace error_code {

constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;
constexpr int kBackendError   = -32000;
constexpr int kUnknownTool    = -32001;

} // namespace error_code

constexpr const char* kJsonRpcVersion = "2.0";

// ---------------------------------------------------------------------------
// RpcError: the "error" member of an ErrorResponse.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = error_code::kInternalError;
    std::string message;
    std::optional<Json> data;

    static RpcError ParseError(const std::string& detail);
    static RpcError InvalidRequest(const std::string& reason);
    static RpcError MethodNotFound(const std::string& method);
    static RpcError InvalidParams(Json data);
    static RpcError InternalError(const std::string& message,
                                  std::optional<Json> data = std::nullopt);

    [[nodiscard]] Json ToJson() const;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message &&
               data == other.data;
    }
};

// ---------------------------------------------------------------------------
// Message: one decoded JSON-RPC message.
//
//   Request        method + id (+ params)
//   Notification   method, no id (+ params); never answered
//   Response       result + id
//   ErrorResponse  error + id (id may be null)
//
// The id is kept as the JSON value it arrived as so responses echo it with
// the same type.
// ---------------------------------------------------------------------------
enum class MessageKind {
    Request,
    Notification,
    Response,
    ErrorResponse,
};

struct Message {
    MessageKind kind = MessageKind::Request;
    std::string method;
    std::optional<Json> params;
    Json id;
    std::optional<Json> result;
    std::optional<RpcError> error;

    [[nodiscard]] bool ExpectsReply() const noexcept {
        return kind == MessageKind::Request;
    }
};

// ---------------------------------------------------------------------------
// ParseFailure: why a payload could not be turned into a Message.
//
// `reply` is false when the offending message carried no "id" member: such
// a message is notification-shaped and must not be answered.
// ---------------------------------------------------------------------------
struct ParseFailure {
    RpcError error;
    Json id;
    bool reply = true;
};

/// Decode one framed payload.
[[nodiscard]] Result<Message, ParseFailure> ParseMessage(std::string_view payload);

/// {"jsonrpc":"2.0","result":<result>,"id":<id>}
[[nodiscard]] Json MakeResultResponse(const Json& id, Json result);

/// {"jsonrpc":"2.0","error":{code,message[,data]},"id":<id>}
[[nodiscard]] Json MakeErrorResponse(const Json& id, const RpcError& error);

/// Compact serialization; invalid UTF-8 in strings is replaced, never thrown.
[[nodiscard]] std::string SerializeMessage(const Json& message);

} // namespace aion_mcp
