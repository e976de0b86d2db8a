#pragma once

#include "tool_registry.h"

namespace xdmcp::mcp::handlers {

ToolResult handle_extract_module_symbols(const protocol::DynamicValue& arguments, ServerContext& ctx);

}  // namespace xdmcp::mcp::handlers
