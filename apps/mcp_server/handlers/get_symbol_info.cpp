#include "get_symbol_info.h"

#include "xdmcp/symbols/symbol_resolver.h"

namespace xdmcp::mcp::handlers {

ToolResult handle_get_symbol_info(const protocol::DynamicValue& arguments, ServerContext& ctx) {
  const auto module = non_empty_string(arguments, "module");
  if (!module.has_value()) {
    return ToolResult::err(missing_parameter("module"));
  }
  const auto symbol = non_empty_string(arguments, "symbol");
  if (!symbol.has_value()) {
    return ToolResult::err(missing_parameter("symbol"));
  }

  const symbols::SymbolResolver resolver(ctx.services);
  return ToolResult::ok(resolver.get_symbol_info(module.value(), symbol.value()));
}

}  // namespace xdmcp::mcp::handlers
