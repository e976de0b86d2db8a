#include "xdmcp/symbols/symbol_resolver.h"

#include "xdmcp/core/normalization.h"
#include "xdmcp/providers/sdk_locator.h"

#include <iostream>
#include <utility>

namespace xdmcp::symbols {

std::string swift_module_dir(const std::string& sdk_root, const std::string& module) {
  return providers::framework_dir(sdk_root, module) + "/Modules/" + module + ".swiftmodule";
}

std::string header_dir(const std::string& sdk_root, const std::string& module) {
  return providers::framework_dir(sdk_root, module) + "/Headers";
}

std::string format_symbol(const providers::SymbolRecord& record) {
  std::string out = "# " + record.title;
  if (!record.kind_display_name.empty()) {
    out += "\n**Kind:** " + record.kind_display_name;
  }
  if (record.declaration_text.has_value()) {
    out += "\n\n**Declaration:**\n```swift\n" + *record.declaration_text + "\n```";
  }
  if (record.documentation_text.has_value()) {
    out += "\n\n**Documentation:**\n" + *record.documentation_text;
  }
  return out;
}

std::string format_header_hit(const std::string& symbol, const std::string& module,
                              const std::string& context) {
  std::string body = context.substr(0, kHeaderContextLimit);
  if (context.size() > kHeaderContextLimit) {
    body += "\n... (truncated)";
  }
  return "Found '" + symbol + "' in " + module + " headers:\n\n```objc\n" + body + "\n```";
}

SwiftLookup lookup_swift_symbol(const std::vector<providers::SymbolRecord>& records,
                                const std::string& module, const std::string& symbol) {
  const providers::SymbolRecord* partial = nullptr;
  for (const auto& record : records) {
    if (core::equals_ascii_ci(record.title, symbol)) {
      return {SwiftMatch::kExact, format_symbol(record)};
    }
    if (partial == nullptr && core::contains_ascii_ci(record.title, symbol)) {
      partial = &record;
    }
  }
  if (partial != nullptr) {
    return {SwiftMatch::kPartial, format_symbol(*partial)};
  }

  const std::string prefix = symbol.substr(0, kSuggestionPrefixLength);
  std::string suggestions;
  std::size_t count = 0;
  for (const auto& record : records) {
    if (count >= kMaxSuggestions) {
      break;
    }
    if (core::contains_ascii_ci(record.title, prefix)) {
      suggestions += "\n  - " + record.title;
      ++count;
    }
  }
  if (count > 0) {
    return {SwiftMatch::kSuggestions, "Symbol '" + symbol + "' not found in " + module +
                                          ". Did you mean one of these?" + suggestions};
  }

  return {SwiftMatch::kNone, "Symbol '" + symbol + "' not found in module '" + module + "'."};
}

std::optional<std::string> SymbolResolver::search_headers(const std::string& symbol,
                                                          const std::string& module,
                                                          const std::string& dir) const {
  const auto context = services_.header_search.search_context(symbol, dir);
  if (!context.has_value()) {
    std::cerr << "Header search failed: " << context.error().message << "\n";
    return std::nullopt;
  }
  if (context.value().empty()) {
    return std::nullopt;
  }
  return format_header_hit(symbol, module, context.value());
}

std::string SymbolResolver::get_symbol_info(const std::string& module,
                                            const std::string& symbol) const {
  const std::string sdk_root = services_.sdk_locator.sdk_root();

  std::optional<std::string> swift_answer;
  if (services_.file_system.exists(swift_module_dir(sdk_root, module))) {
    const auto graph = services_.symbol_graphs.extract(module, sdk_root);
    if (graph.has_value()) {
      auto lookup = lookup_swift_symbol(graph.value(), module, symbol);
      if (lookup.match == SwiftMatch::kExact) {
        return lookup.text;
      }
      swift_answer = std::move(lookup.text);
    } else {
      // Extraction failed: the answer comes from the headers below, or reports their miss.
      std::cerr << "Symbol graph extraction failed: " << graph.error().message << "\n";
      swift_answer = "Symbol '" + symbol + "' not found in " + module + " headers.";
    }
  }

  const std::string headers = header_dir(sdk_root, module);
  if (services_.file_system.exists(headers)) {
    if (auto hit = search_headers(symbol, module, headers)) {
      return *hit;
    }
  }

  if (swift_answer.has_value()) {
    return *swift_answer;
  }

  return "Module '" + module + "' not found in SDK. Use list_frameworks to see available modules.";
}

}  // namespace xdmcp::symbols
