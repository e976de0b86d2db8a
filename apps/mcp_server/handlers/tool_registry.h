#pragma once

#include "xdmcp/core/result.h"
#include "xdmcp/protocol/dynamic_value.h"
#include "xdmcp/protocol/messages.h"

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xdmcp::mcp::handlers {

// A tool body returns the text for the result envelope, or an invocation error
// (-32602) detected before any collaborator was called.
using ToolResult = core::Result<std::string, protocol::JsonRpcError>;

using ToolHandler =
    std::function<ToolResult(const protocol::DynamicValue& arguments, ServerContext& ctx)>;

// ToolDescriptor is one entry of tools/list.
struct ToolDescriptor {
  std::string name;             // NOLINT(readability-identifier-naming)
  std::string description;      // NOLINT(readability-identifier-naming)
  nlohmann::json input_schema;  // NOLINT(readability-identifier-naming)
};

// The four tools, in the order tools/list reports them.
[[nodiscard]] std::vector<ToolDescriptor> tool_descriptors();

std::unordered_map<std::string, ToolHandler> build_tool_registry();

// ────────────────────────────────────────────────────────────────
// Argument helpers
// ────────────────────────────────────────────────────────────────

// missing_parameter builds the -32602 "Missing required parameter: <name>" error.
[[nodiscard]] protocol::JsonRpcError missing_parameter(const std::string& name);

// non_empty_string returns arguments[name] when it is a non-empty string.
[[nodiscard]] std::optional<std::string> non_empty_string(const protocol::DynamicValue& arguments,
                                                          const std::string& name);

// optional_string returns arguments[name] when it is a string (empty allowed).
[[nodiscard]] std::optional<std::string> optional_string(const protocol::DynamicValue& arguments,
                                                         const std::string& name);

}  // namespace xdmcp::mcp::handlers
