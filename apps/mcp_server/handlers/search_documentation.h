#pragma once

#include "tool_registry.h"

#include <cstddef>

namespace xdmcp::mcp::handlers {

// search_limit returns arguments.limit when it is a positive integer (a float with no
// fractional part counts), otherwise the default of 20.
[[nodiscard]] std::size_t search_limit(const protocol::DynamicValue& arguments);

ToolResult handle_search_documentation(const protocol::DynamicValue& arguments,
                                       ServerContext& ctx);

}  // namespace xdmcp::mcp::handlers
