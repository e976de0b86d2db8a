#pragma once

#include "xdmcp/core/services.h"
#include "xdmcp/search/relevance.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xdmcp::search {

constexpr std::size_t kDefaultSearchLimit = 20;
// The symbol-graph step runs only while content search has fewer results than this.
constexpr std::size_t kSymbolSearchThreshold = 5;
// Symbol matches win over content results when there are fewer content results than this.
constexpr std::size_t kSymbolPreferenceThreshold = 3;
constexpr std::size_t kSymbolMatchCap = 10;

// Frameworks scanned by the symbol-graph step, in scan order.
[[nodiscard]] const std::vector<std::string>& common_frameworks();

struct SymbolMatch {
  std::string framework;  // NOLINT(readability-identifier-naming)
  std::string symbol;     // NOLINT(readability-identifier-naming)
  std::string kind;       // NOLINT(readability-identifier-naming)
};

// DiscoveryResults accumulates what each discovery step found.
struct DiscoveryResults {
  std::vector<RankedPath> primary;          // NOLINT(readability-identifier-naming)
  std::optional<std::string> header_text;   // NOLINT(readability-identifier-naming)
  std::vector<SymbolMatch> symbol_matches;  // NOLINT(readability-identifier-naming)
};

// DiscoveryStep is one stage of the search funnel. gate decides, from the results
// gathered so far, whether the stage is needed; run adds the stage's findings.
struct DiscoveryStep {
  std::string name;                                         // NOLINT(readability-identifier-naming)
  std::function<bool(const DiscoveryResults&)> gate;        // NOLINT(readability-identifier-naming)
  std::function<void(DiscoveryResults& results)> run;       // NOLINT(readability-identifier-naming)
};

// run_discovery_chain evaluates steps in order, skipping any step whose gate is false.
// A step with an empty gate always runs.
[[nodiscard]] DiscoveryResults run_discovery_chain(const std::vector<DiscoveryStep>& steps);

// merge_discovery_results applies the merge policy:
//  1. nothing found anywhere          -> "No documentation found" with suggestions
//  2. symbol matches, < 3 primary, no header text -> symbol listing only
//  3. header text present             -> primary (ranked, limited) + header sections
//  4. otherwise                       -> primary results only (ranked, limited)
[[nodiscard]] std::string merge_discovery_results(const DiscoveryResults& results,
                                                  const std::string& query, std::size_t limit);

// build_spotlight_query builds the content query: display name equal to / containing the
// query, .h/.swift file names containing it, or text content containing it, restricted to
// source, header, and documentation content types. Single quotes are escaped.
[[nodiscard]] std::string build_spotlight_query(std::string_view query);

// documentation_roots lists the candidate roots for content search, existing or not.
[[nodiscard]] std::vector<std::string> documentation_roots(const std::string& home_dir,
                                                           const std::string& developer_dir);

[[nodiscard]] std::string format_symbol_matches(const std::vector<SymbolMatch>& matches,
                                                const std::string& query);

// format_header_files renders header-file hits, trimming each path to the part after
// "/Frameworks/".
[[nodiscard]] std::string format_header_files(const std::vector<std::string>& files,
                                              const std::string& query);

// DocumentationSearch runs the three discovery strategies against the injected
// collaborators and merges their results.
class DocumentationSearch {
 public:
  DocumentationSearch(const core::Services& services, std::vector<std::string> candidate_roots);

  [[nodiscard]] std::string search(const std::string& query, std::size_t limit) const;

  // The gated steps for one query, in evaluation order.
  [[nodiscard]] std::vector<DiscoveryStep> discovery_steps(const std::string& query,
                                                           std::size_t limit) const;

 private:
  [[nodiscard]] std::vector<RankedPath> discover_primary(const std::string& query) const;
  [[nodiscard]] std::optional<std::string> discover_header_text(const std::string& query,
                                                                std::size_t limit) const;
  [[nodiscard]] std::vector<SymbolMatch> discover_symbols(const std::string& query) const;

  const core::Services& services_;
  std::vector<std::string> candidate_roots_;
};

}  // namespace xdmcp::search
