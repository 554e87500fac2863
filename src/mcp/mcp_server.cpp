#include <aion_mcp/mcp/mcp_server.hpp>

#include <aion_mcp/core/log.hpp>
#include <aion_mcp/rpc/message.hpp>

#include <string>

namespace aion_mcp {

McpServer::McpServer(Dispatcher& dispatcher,
                     std::istream& in,
                     std::ostream& out)
    : dispatcher_(dispatcher), reader_(in), writer_(out) {}

Result<void, Error> McpServer::Run() {
    LogInfo("server", "waiting for requests on stdin");
    while (true) {
        auto frame = reader_.ReadFrame();
        if (frame.IsErr()) {
            const auto& error = frame.Error();
            if (reader_.Finished()) {
                LogError("server", error.ToString());
                return Result<void, Error>::Err(error);
            }
            // The header block was consumed; answer and resynchronise.
            LogWarn("server", error.ToString());
            auto sent = Send(MakeErrorResponse(
                nullptr, RpcError::ParseError(error.message)));
            if (sent.IsErr()) {
                return sent;
            }
            continue;
        }

        auto outcome = std::move(frame).Value();
        if (outcome.status == FrameReader::Status::EndOfStream) {
            LogInfo("server", "input closed, shutting down");
            return Result<void, Error>::Ok();
        }

        auto response = HandlePayload(outcome.payload);
        if (response) {
            auto sent = Send(*response);
            if (sent.IsErr()) {
                return sent;
            }
        }
    }
}

std::optional<Json> McpServer::HandlePayload(std::string_view payload) {
    auto parsed = ParseMessage(payload);
    if (parsed.IsErr()) {
        const auto& failure = parsed.Error();
        LogWarn("server", "rejected message: " + failure.error.message +
                              (failure.error.data ? " " + SerializeMessage(*failure.error.data) : ""));
        if (!failure.reply) {
            return std::nullopt;
        }
        return MakeErrorResponse(failure.id, failure.error);
    }
    return dispatcher_.Dispatch(parsed.Value());
}

Result<void, Error> McpServer::Send(const Json& message) {
    const auto text = SerializeMessage(message);
    LogDebug("server", "-> " + std::to_string(text.size()) + " bytes");
    auto written = writer_.WriteFrame(text);
    if (written.IsErr()) {
        LogError("server", written.Error().ToString());
    }
    return written;
}

} // namespace aion_mcp
