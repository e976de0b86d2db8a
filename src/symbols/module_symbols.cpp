#include "xdmcp/symbols/module_symbols.h"

#include <algorithm>
#include <iostream>
#include <map>

namespace xdmcp::symbols {

namespace {

bool contains(std::string_view text, std::string_view needle) {
  return text.find(needle) != std::string_view::npos;
}

std::string group_heading(const std::string& kind) {
  static const std::map<std::string, std::string> kHeadings{
      {"protocol", "Protocols"}, {"class", "Classes"},   {"struct", "Structs"},
      {"enum", "Enums"},         {"typealias", "Typealiases"}, {"func", "Funcs"},
      {"var", "Vars"},           {"other", "Others"},
  };
  auto it = kHeadings.find(kind);
  return it == kHeadings.end() ? kind : it->second;
}

}  // namespace

std::string classify_symbol_kind(std::string_view kind_identifier) {
  if (contains(kind_identifier, "struct")) {
    return "struct";
  }
  if (contains(kind_identifier, "class")) {
    return "class";
  }
  if (contains(kind_identifier, "enum")) {
    return "enum";
  }
  if (contains(kind_identifier, "protocol")) {
    return "protocol";
  }
  if (contains(kind_identifier, "func") || contains(kind_identifier, "method")) {
    return "func";
  }
  if (contains(kind_identifier, "var") || contains(kind_identifier, "property")) {
    return "var";
  }
  if (contains(kind_identifier, "typealias")) {
    return "typealias";
  }
  return "other";
}

const std::vector<std::string>& symbol_kind_order() {
  static const std::vector<std::string> kOrder{
      "protocol", "class", "struct", "enum", "typealias", "func", "var", "other",
  };
  return kOrder;
}

std::string format_module_symbols(const std::vector<providers::SymbolRecord>& records,
                                  const std::string& module, const std::string& kind) {
  std::map<std::string, std::vector<std::string>> grouped;
  for (const auto& record : records) {
    if (record.kind_identifier.empty()) {
      continue;
    }
    std::string simple_kind = classify_symbol_kind(record.kind_identifier);
    if (kind != kAllKinds && simple_kind != kind) {
      continue;
    }
    grouped[simple_kind].push_back(record.title);
  }

  if (grouped.empty()) {
    return "No symbols found in '" + module + "' matching kind '" + kind + "'.";
  }

  std::string out = "# Symbols in " + module;
  for (const auto& group : symbol_kind_order()) {
    auto it = grouped.find(group);
    if (it == grouped.end()) {
      continue;
    }
    auto& titles = it->second;
    std::sort(titles.begin(), titles.end());

    out += "\n\n## " + group_heading(group) + " (" + std::to_string(titles.size()) + ")";
    const std::size_t shown = std::min(titles.size(), kMaxSymbolsPerKind);
    for (std::size_t i = 0; i < shown; ++i) {
      out += "\n  - " + titles[i];
    }
    if (titles.size() > kMaxSymbolsPerKind) {
      out += "\n  ... and " + std::to_string(titles.size() - kMaxSymbolsPerKind) + " more";
    }
  }
  return out;
}

std::string extract_module_symbols(const core::Services& services, const std::string& module,
                                   const std::string& kind) {
  const auto graph = services.symbol_graphs.extract(module, services.sdk_locator.sdk_root());
  if (!graph.has_value()) {
    std::cerr << "Symbol graph extraction failed: " << graph.error().message << "\n";
    return "Could not extract symbols from '" + module +
           "'. It may be an Objective-C only framework. Use get_symbol_info to search headers "
           "directly.";
  }
  return format_module_symbols(graph.value(), module, kind);
}

}  // namespace xdmcp::symbols
