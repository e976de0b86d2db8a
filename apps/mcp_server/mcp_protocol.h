#pragma once

#include "xdmcp/protocol/messages.h"

#include <nlohmann/json.hpp>

#include "server_context.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xdmcp::mcp {

// NoResponse: the line held only notifications.
struct NoResponse {};

// LineOutcome is what one input line produces: nothing, one response, or the responses
// of a batch in element order. A batch made only of notifications yields an empty vector.
using LineOutcome =
    std::variant<NoResponse, protocol::JsonRpcResponse, std::vector<protocol::JsonRpcResponse>>;

// Arrays and objects nested more than this many levels deep (the outermost value is
// level 1) are refused before any decoding.
constexpr int kMaxNestingDepth = 512;

// process_line handles one line of the stdio stream.
//
// - not JSON                         -> -32700, id null
// - nested deeper than kMaxNestingDepth -> -32700, id null
// - empty array                      -> -32600, id null
// - non-empty array                  -> batch; each element handled independently
// - anything else that is not a valid request object -> -32600, id null
[[nodiscard]] LineOutcome process_line(const std::string& line, ServerContext& ctx);

// process_message handles one decoded JSON value (a batch element or a whole line).
// Returns nullopt for notifications.
[[nodiscard]] std::optional<protocol::JsonRpcResponse> process_message(const nlohmann::json& message,
                                                                       ServerContext& ctx);

// render_outcome serializes an outcome as one line of JSON, or nullopt when nothing must be
// written. Invalid UTF-8 in tool output is replaced rather than rejected.
[[nodiscard]] std::optional<std::string> render_outcome(const LineOutcome& outcome);

}  // namespace xdmcp::mcp
