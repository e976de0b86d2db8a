#include "list_frameworks.h"

#include "xdmcp/frameworks/framework_catalog.h"

namespace xdmcp::mcp::handlers {

// filter is optional and never rejected; a non-string filter is treated as absent.
ToolResult handle_list_frameworks(const protocol::DynamicValue& arguments, ServerContext& ctx) {
  const auto filter = optional_string(arguments, "filter");
  return ToolResult::ok(frameworks::list_frameworks(ctx.services, filter.value_or("")));
}

}  // namespace xdmcp::mcp::handlers
