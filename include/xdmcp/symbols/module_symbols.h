#pragma once

#include "xdmcp/core/services.h"
#include "xdmcp/providers/symbol_graph_provider.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace xdmcp::symbols {

constexpr const char* kAllKinds = "all";
constexpr std::size_t kMaxSymbolsPerKind = 50;

// classify_symbol_kind maps a symbol-graph kind identifier (e.g. "swift.struct",
// "swift.type.method") onto one of: struct, class, enum, protocol, func, var, typealias,
// other. The substring tests run in that order, so "swift.class.property" is a class.
[[nodiscard]] std::string classify_symbol_kind(std::string_view kind_identifier);

// Kind groups in display order.
[[nodiscard]] const std::vector<std::string>& symbol_kind_order();

// format_module_symbols groups records by classified kind (records without a kind
// identifier are skipped), keeps only kind unless it is "all", and renders each group's
// sorted titles, at most kMaxSymbolsPerKind per group.
[[nodiscard]] std::string format_module_symbols(const std::vector<providers::SymbolRecord>& records,
                                                const std::string& module,
                                                const std::string& kind);

// extract_module_symbols runs the symbol-graph provider for module and formats the result.
[[nodiscard]] std::string extract_module_symbols(const core::Services& services,
                                                 const std::string& module,
                                                 const std::string& kind);

}  // namespace xdmcp::symbols
