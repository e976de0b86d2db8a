#pragma once

#include "tool_registry.h"

namespace xdmcp::mcp::handlers {

ToolResult handle_get_symbol_info(const protocol::DynamicValue& arguments, ServerContext& ctx);

}  // namespace xdmcp::mcp::handlers
