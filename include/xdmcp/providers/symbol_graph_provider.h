#pragma once

#include "xdmcp/core/result.h"
#include "xdmcp/process/process_runner.h"
#include "xdmcp/providers/provider_error.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace xdmcp::providers {

// SymbolRecord is one public symbol from a module's symbol graph.
struct SymbolRecord {
  std::string title;                             // NOLINT(readability-identifier-naming)
  std::string kind_identifier;                   // e.g. "swift.struct"
  std::string kind_display_name;                 // e.g. "Structure"
  std::optional<std::string> declaration_text;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> documentation_text;  // NOLINT(readability-identifier-naming)
};

using SymbolGraph = core::Result<std::vector<SymbolRecord>, ProviderError>;

// ISymbolGraphProvider introspects a module of the SDK at sdk_root.
// Records are returned in graph order. An error means the module could not be introspected.
class ISymbolGraphProvider {
 public:
  virtual ~ISymbolGraphProvider() = default;

  [[nodiscard]] virtual SymbolGraph extract(const std::string& module,
                                            const std::string& sdk_root) const = 0;

 protected:
  ISymbolGraphProvider() = default;
  ISymbolGraphProvider(const ISymbolGraphProvider&) = default;
  ISymbolGraphProvider& operator=(const ISymbolGraphProvider&) = default;
  ISymbolGraphProvider(ISymbolGraphProvider&&) = default;
  ISymbolGraphProvider& operator=(ISymbolGraphProvider&&) = default;
};

constexpr const char* kDefaultTargetTriple = "arm64-apple-macos15.0";

// SymbolGraphExtractProvider runs `xcrun swift-symbolgraph-extract` into a scratch
// directory and reads <module>.symbols.json from it. The scratch directory is removed
// before extract() returns. A graph file that exists and parses is used even when the
// tool exited nonzero.
class SymbolGraphExtractProvider final : public ISymbolGraphProvider {
 public:
  SymbolGraphExtractProvider(const process::IProcessRunner& runner, std::string target_triple);

  [[nodiscard]] SymbolGraph extract(const std::string& module,
                                    const std::string& sdk_root) const override;

 private:
  const process::IProcessRunner& runner_;
  std::string target_triple_;
};

// parse_symbol_graph reads the "symbols" array of a symbol-graph document.
// Symbols without names.title are skipped; missing kind fields become empty strings.
// Declaration text is the concatenation of declarationFragments[].spelling; documentation
// text is docComment.lines[].text joined with '\n'.
[[nodiscard]] std::vector<SymbolRecord> parse_symbol_graph(const nlohmann::json& document);

}  // namespace xdmcp::providers
