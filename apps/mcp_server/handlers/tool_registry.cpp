#include "tool_registry.h"

#include "extract_module_symbols.h"
#include "get_symbol_info.h"
#include "list_frameworks.h"
#include "search_documentation.h"

namespace xdmcp::mcp::handlers {

using json = nlohmann::json;

std::vector<ToolDescriptor> tool_descriptors() {
  std::vector<ToolDescriptor> tools;

  tools.push_back({
      "search_documentation",
      "Search Apple's developer documentation using Spotlight. Returns matching documentation "
      "entries for frameworks, classes, methods, and other symbols.",
      {
          {"type", "object"},
          {"properties",
           {
               {"query",
                {{"type", "string"},
                 {"description", "Search query (e.g., 'NSWindow', 'SwiftUI View', 'URLSession')"}}},
               {"limit",
                {{"type", "integer"},
                 {"description", "Maximum number of results to return (default: 20)"},
                 {"default", 20}}},
           }},
          {"required", json::array({"query"})},
      },
  });

  tools.push_back({
      "get_symbol_info",
      "Get detailed information about a specific symbol from the SDK using "
      "swift-symbolgraph-extract. Returns the symbol's declaration, documentation, and "
      "relationships.",
      {
          {"type", "object"},
          {"properties",
           {
               {"module",
                {{"type", "string"},
                 {"description",
                  "The module/framework name (e.g., 'Foundation', 'SwiftUI', 'AppKit')"}}},
               {"symbol",
                {{"type", "string"},
                 {"description", "The symbol name to look up (e.g., 'URL', 'View', 'NSWindow')"}}},
           }},
          {"required", json::array({"module", "symbol"})},
      },
  });

  tools.push_back({
      "list_frameworks",
      "List available Apple frameworks/modules in the macOS SDK.",
      {
          {"type", "object"},
          {"properties",
           {
               {"filter",
                {{"type", "string"},
                 {"description", "Optional filter to match framework names (case-insensitive)"}}},
           }},
      },
  });

  tools.push_back({
      "extract_module_symbols",
      "Extract all public symbols from a module/framework. Useful for discovering available "
      "types, functions, and properties.",
      {
          {"type", "object"},
          {"properties",
           {
               {"module",
                {{"type", "string"},
                 {"description", "The module/framework name (e.g., 'Foundation', 'SwiftUI')"}}},
               {"kind",
                {{"type", "string"},
                 {"description",
                  "Filter by symbol kind: 'struct', 'class', 'enum', 'protocol', 'func', 'var', "
                  "or 'all' (default: 'all')"},
                 {"default", "all"}}},
           }},
          {"required", json::array({"module"})},
      },
  });

  return tools;
}

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"search_documentation", handle_search_documentation},
      {"get_symbol_info", handle_get_symbol_info},
      {"list_frameworks", handle_list_frameworks},
      {"extract_module_symbols", handle_extract_module_symbols},
  };
}

protocol::JsonRpcError missing_parameter(const std::string& name) {
  return protocol::JsonRpcError{protocol::kInvalidParams, "Missing required parameter: " + name,
                                std::nullopt};
}

std::optional<std::string> non_empty_string(const protocol::DynamicValue& arguments,
                                            const std::string& name) {
  auto value = optional_string(arguments, name);
  if (!value.has_value() || value->empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> optional_string(const protocol::DynamicValue& arguments,
                                           const std::string& name) {
  const protocol::DynamicValue* member = arguments.find(name);
  if (member == nullptr || !member->is_string()) {
    return std::nullopt;
  }
  return *member->as_string();
}

}  // namespace xdmcp::mcp::handlers
