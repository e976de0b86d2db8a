#include "extract_module_symbols.h"

#include "xdmcp/symbols/module_symbols.h"

namespace xdmcp::mcp::handlers {

ToolResult handle_extract_module_symbols(const protocol::DynamicValue& arguments,
                                         ServerContext& ctx) {
  const auto module = non_empty_string(arguments, "module");
  if (!module.has_value()) {
    return ToolResult::err(missing_parameter("module"));
  }
  const auto kind = optional_string(arguments, "kind").value_or(symbols::kAllKinds);

  return ToolResult::ok(symbols::extract_module_symbols(ctx.services, module.value(), kind));
}

}  // namespace xdmcp::mcp::handlers
