#pragma once

#include <nlohmann/json.hpp>

namespace aion_mcp {

// All protocol and backend payloads use insertion-ordered objects so that
// backend results are echoed with their member order intact.
using Json = nlohmann::ordered_json;

// Deepest container nesting accepted from the client or the backend.
// Copying and dumping a Json value recurse once per level.
constexpr int kMaxJsonDepth = 512;

// Parser callback that discards every container opened at depth
// kMaxJsonDepth or deeper and sets `exceeded`. The discarded subtree is
// never materialized, so callers must reject the result when `exceeded`.
inline Json::parser_callback_t DepthLimit(bool& exceeded) {
    return [&exceeded](int depth, Json::parse_event_t event, Json& /*parsed*/) {
        if ((event == Json::parse_event_t::object_start ||
             event == Json::parse_event_t::array_start) &&
            depth >= kMaxJsonDepth) {
            exceeded = true;
            return false;
        }
        return true;
    };
}

} // namespace aion_mcp
