#pragma once

#include "xdmcp/core/services.h"
#include "xdmcp/providers/symbol_graph_provider.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace xdmcp::symbols {

constexpr std::size_t kMaxSuggestions = 10;
constexpr std::size_t kSuggestionPrefixLength = 3;
constexpr std::size_t kHeaderContextLimit = 3000;

// ─────────────────────────────────────────────────────────────────────────────
// Swift symbol-graph lookup (pure)
// ─────────────────────────────────────────────────────────────────────────────

enum class SwiftMatch {
  kExact,        // title equals the symbol, ignoring ASCII case
  kPartial,      // first title containing the symbol, ignoring ASCII case
  kSuggestions,  // no match; titles sharing the symbol's first characters
  kNone,
};

struct SwiftLookup {
  SwiftMatch match{SwiftMatch::kNone};  // NOLINT(readability-identifier-naming)
  std::string text;                     // NOLINT(readability-identifier-naming)
};

// lookup_swift_symbol selects the record for symbol from an extracted graph and renders it.
// An exact match stops the scan. Without any match, up to kMaxSuggestions titles containing
// the first kSuggestionPrefixLength characters of symbol are offered instead.
[[nodiscard]] SwiftLookup lookup_swift_symbol(const std::vector<providers::SymbolRecord>& records,
                                              const std::string& module,
                                              const std::string& symbol);

// format_symbol renders a record as markdown: title heading, kind line, fenced swift
// declaration and documentation, omitting the parts the record lacks.
[[nodiscard]] std::string format_symbol(const providers::SymbolRecord& record);

// format_header_hit wraps grep context in a fenced objc block, truncated to
// kHeaderContextLimit bytes.
[[nodiscard]] std::string format_header_hit(const std::string& symbol, const std::string& module,
                                            const std::string& context);

// ─────────────────────────────────────────────────────────────────────────────
// SymbolResolver
// ─────────────────────────────────────────────────────────────────────────────

// SymbolResolver answers get_symbol_info. An exact Swift match is returned without
// consulting headers. Any other Swift answer is provisional: an Objective-C header hit
// replaces it.
class SymbolResolver {
 public:
  explicit SymbolResolver(const core::Services& services) : services_(services) {}

  [[nodiscard]] std::string get_symbol_info(const std::string& module,
                                            const std::string& symbol) const;

 private:
  [[nodiscard]] std::optional<std::string> search_headers(const std::string& symbol,
                                                          const std::string& module,
                                                          const std::string& dir) const;

  const core::Services& services_;
};

// swift_module_dir returns <sdk>/System/Library/Frameworks/<M>.framework/Modules/<M>.swiftmodule.
[[nodiscard]] std::string swift_module_dir(const std::string& sdk_root, const std::string& module);

// header_dir returns <sdk>/System/Library/Frameworks/<M>.framework/Headers.
[[nodiscard]] std::string header_dir(const std::string& sdk_root, const std::string& module);

}  // namespace xdmcp::symbols
