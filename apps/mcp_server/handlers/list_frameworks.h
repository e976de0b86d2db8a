#pragma once

#include "tool_registry.h"

namespace xdmcp::mcp::handlers {

ToolResult handle_list_frameworks(const protocol::DynamicValue& arguments, ServerContext& ctx);

}  // namespace xdmcp::mcp::handlers
