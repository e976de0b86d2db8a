#include "tool_commands_logic.h"

#include "xdmcp/frameworks/framework_catalog.h"
#include "xdmcp/search/documentation_search.h"
#include "xdmcp/symbols/module_symbols.h"
#include "xdmcp/symbols/symbol_resolver.h"

int execute_search(const std::string& query, std::size_t limit,
                   const std::vector<std::string>& documentation_roots,
                   const xdmcp::core::Services& services, std::ostream& out) {
  const xdmcp::search::DocumentationSearch searcher(services, documentation_roots);
  out << searcher.search(query, limit) << "\n";
  return 0;
}

int execute_symbol(const std::string& module, const std::string& symbol,
                   const xdmcp::core::Services& services, std::ostream& out) {
  const xdmcp::symbols::SymbolResolver resolver(services);
  out << resolver.get_symbol_info(module, symbol) << "\n";
  return 0;
}

int execute_frameworks(const std::string& filter, const xdmcp::core::Services& services,
                       std::ostream& out) {
  out << xdmcp::frameworks::list_frameworks(services, filter) << "\n";
  return 0;
}

int execute_symbols(const std::string& module, const std::string& kind,
                    const xdmcp::core::Services& services, std::ostream& out) {
  out << xdmcp::symbols::extract_module_symbols(services, module, kind) << "\n";
  return 0;
}
