#include "search_documentation.h"

#include "xdmcp/search/documentation_search.h"

#include <cmath>
#include <string>

namespace xdmcp::mcp::handlers {

std::size_t search_limit(const protocol::DynamicValue& arguments) {
  const protocol::DynamicValue* limit = arguments.find("limit");
  if (limit == nullptr) {
    return search::kDefaultSearchLimit;
  }
  if (const auto* integer = limit->as_integer(); integer != nullptr && *integer > 0) {
    return static_cast<std::size_t>(*integer);
  }
  // 5.0 counts as 5; 2.5 does not.
  if (const auto* number = limit->as_float();
      number != nullptr && *number >= 1.0 && *number < 9.0e18 && std::floor(*number) == *number) {
    return static_cast<std::size_t>(*number);
  }
  return search::kDefaultSearchLimit;
}

ToolResult handle_search_documentation(const protocol::DynamicValue& arguments,
                                       ServerContext& ctx) {
  const auto query = non_empty_string(arguments, "query");
  if (!query.has_value()) {
    return ToolResult::err(missing_parameter("query"));
  }

  const search::DocumentationSearch searcher(
      ctx.services,
      search::documentation_roots(ctx.config.host.home_dir, ctx.config.host.developer_dir));
  return ToolResult::ok(searcher.search(query.value(), search_limit(arguments)));
}

}  // namespace xdmcp::mcp::handlers
