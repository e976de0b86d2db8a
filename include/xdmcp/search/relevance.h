#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xdmcp::search {

struct RankedPath {
  std::string path;  // NOLINT(readability-identifier-naming)
  int score{0};      // NOLINT(readability-identifier-naming)
};

// Additive relevance bonuses. A path collects every bonus whose condition holds.
constexpr int kExactFileNameBonus = 100;   // file name == query, or contains query + "."
constexpr int kInterfaceFileBonus = 50;    // .h, .swift, .swiftinterface
constexpr int kFrameworkHeadersBonus = 30;  // under both /frameworks/ and /headers/
constexpr int kFileNamePrefixBonus = 25;   // file name starts with query
constexpr int kDocumentationBonus = 20;    // /documentation/ or .docarchive
constexpr int kFileNameContainsBonus = 15;  // file name contains query
constexpr int kFrameworkNameBonus = 40;    // segment after /frameworks/ starts with query

// relevance_score rates a candidate path for a query. Name and directory comparisons
// ignore ASCII case; the extension checks are case-sensitive.
[[nodiscard]] int relevance_score(std::string_view path, std::string_view query);

// rank_paths orders by score descending, keeping discovery order among equal scores, and
// keeps at most limit entries.
[[nodiscard]] std::vector<RankedPath> rank_paths(std::vector<RankedPath> paths,
                                                 std::size_t limit);

// framework_name_from_path returns the segment after "/Frameworks/" with a ".framework"
// suffix removed, or nullopt when the path has no such segment.
[[nodiscard]] std::optional<std::string> framework_name_from_path(std::string_view path);

// file_type_label names the kind of file for display: "Objective-C Header",
// "Swift Interface", "Documentation", or nullopt.
[[nodiscard]] std::optional<std::string> file_type_label(std::string_view path);

// format_ranked_entries renders 1-indexed entries:
//   N. [Framework] - <type> - <file name>
//      Path: <path>
// followed by a blank line each. Paths must already be ranked.
[[nodiscard]] std::string format_ranked_entries(const std::vector<RankedPath>& ranked);

}  // namespace xdmcp::search
