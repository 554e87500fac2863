#pragma once

#include <aion_mcp/core/json.hpp>
#include <aion_mcp/core/result.hpp>
#include <aion_mcp/mcp/dispatcher.hpp>
#include <aion_mcp/rpc/framing.hpp>

#include <iostream>
#include <optional>
#include <string_view>

namespace aion_mcp {

// ---------------------------------------------------------------------------
// McpServer: MCP server over Content-Length framed stdin/stdout.
//
// One frame is read, dispatched to completion (including the backend round
// trip) and answered before the next frame is read. Output is written only
// from here, one whole frame at a time.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(Dispatcher& dispatcher,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop until end of input.
    //   Ok   input ended cleanly between frames
    //   Err  input ended inside a frame, or output could not be written
    [[nodiscard]] Result<void, Error> Run();

    // Decode and dispatch one payload. Returns the reply, if any.
    [[nodiscard]] std::optional<Json> HandlePayload(std::string_view payload);

private:
    Result<void, Error> Send(const Json& message);

    Dispatcher& dispatcher_;
    FrameReader reader_;
    FrameWriter writer_;
};

} // namespace aion_mcp
