#include "xdmcp/search/documentation_search.h"

#include "xdmcp/core/normalization.h"
#include "xdmcp/providers/sdk_locator.h"

#include <iostream>
#include <utility>

namespace xdmcp::search {

const std::vector<std::string>& common_frameworks() {
  static const std::vector<std::string> kFrameworks{
      "Foundation", "SwiftUI", "AppKit", "UIKit", "Combine", "CoreGraphics", "CoreFoundation",
  };
  return kFrameworks;
}

DiscoveryResults run_discovery_chain(const std::vector<DiscoveryStep>& steps) {
  DiscoveryResults results;
  for (const auto& step : steps) {
    if (step.gate && !step.gate(results)) {
      continue;
    }
    step.run(results);
  }
  return results;
}

std::string format_symbol_matches(const std::vector<SymbolMatch>& matches,
                                  const std::string& query) {
  std::string out = "Found " + std::to_string(matches.size()) + " symbol(s) matching '" + query +
                    "' across frameworks:\n\n";
  std::size_t index = 0;
  for (const auto& match : matches) {
    out += std::to_string(++index) + ". " + match.symbol + "\n";
    out += "   Framework: " + match.framework + " - Kind: " + match.kind + "\n";
    out += "\n";
  }
  out += "Tip: Use get_symbol_info with the module and symbol name for detailed information.";
  return out;
}

std::string format_header_files(const std::vector<std::string>& files, const std::string& query) {
  constexpr std::string_view kMarker = "/Frameworks/";
  std::string out = "SDK header files containing '" + query + "':";
  for (const auto& file : files) {
    const auto marker = file.find(kMarker);
    out += "\n  - ";
    out += marker == std::string::npos ? file : file.substr(marker + kMarker.size());
  }
  return out;
}

std::string merge_discovery_results(const DiscoveryResults& results, const std::string& query,
                                    std::size_t limit) {
  if (results.primary.empty() && !results.header_text.has_value() &&
      results.symbol_matches.empty()) {
    return "No documentation found for '" + query +
           "'.\n\n"
           "Suggestions:\n"
           "- Try searching for a more specific symbol name\n"
           "- Use get_symbol_info if you know the framework (e.g., Foundation, SwiftUI)\n"
           "- Use list_frameworks to see available frameworks";
  }

  if (!results.symbol_matches.empty() && results.primary.size() < kSymbolPreferenceThreshold &&
      !results.header_text.has_value()) {
    return format_symbol_matches(results.symbol_matches, query);
  }

  const std::string heading = "Documentation search results for '" + query + "':\n\n";

  if (results.header_text.has_value()) {
    std::string out = heading;
    if (!results.primary.empty()) {
      out += "## Spotlight Results\n\n";
      out += format_ranked_entries(rank_paths(results.primary, limit));
    }
    out += "\n## SDK Header Results\n\n";
    out += results.header_text.value();
    return out;
  }

  return heading + format_ranked_entries(rank_paths(results.primary, limit));
}

std::string build_spotlight_query(std::string_view query) {
  std::string escaped;
  escaped.reserve(query.size());
  for (const char ch : query) {
    if (ch == '\'') {
      escaped += "\\'";
    } else {
      escaped.push_back(ch);
    }
  }

  return "(kMDItemDisplayName == '" + escaped + "'wc || kMDItemDisplayName == '*" + escaped +
         "*'wcd || kMDItemFSName == '*" + escaped + "*.h' || kMDItemFSName == '*" + escaped +
         "*.swift' || kMDItemTextContent == '*" + escaped +
         "*'wcd) && (kMDItemContentType == 'public.source-code' || kMDItemContentType == "
         "'public.header' || kMDItemContentType == 'public.documentation')";
}

std::vector<std::string> documentation_roots(const std::string& home_dir,
                                             const std::string& developer_dir) {
  std::vector<std::string> roots;
  if (!home_dir.empty()) {
    roots.push_back(home_dir + "/Library/Developer/Xcode/DocumentationCache");
  }
  roots.push_back(developer_dir + "/Documentation");
  roots.emplace_back("/Library/Developer/CommandLineTools/SDKs");
  return roots;
}

DocumentationSearch::DocumentationSearch(const core::Services& services,
                                         std::vector<std::string> candidate_roots)
    : services_(services), candidate_roots_(std::move(candidate_roots)) {}

std::vector<DiscoveryStep> DocumentationSearch::discovery_steps(const std::string& query,
                                                                std::size_t limit) const {
  return {
      {"content", nullptr,
       [this, query](DiscoveryResults& results) { results.primary = discover_primary(query); }},
      {"headers",
       [limit](const DiscoveryResults& results) { return results.primary.size() < limit; },
       [this, query, limit](DiscoveryResults& results) {
         results.header_text = discover_header_text(query, limit);
       }},
      {"symbols",
       [](const DiscoveryResults& results) {
         return results.primary.size() < kSymbolSearchThreshold;
       },
       [this, query](DiscoveryResults& results) {
         results.symbol_matches = discover_symbols(query);
       }},
  };
}

std::string DocumentationSearch::search(const std::string& query, std::size_t limit) const {
  const auto results = run_discovery_chain(discovery_steps(query, limit));
  return merge_discovery_results(results, query, limit);
}

std::vector<RankedPath> DocumentationSearch::discover_primary(const std::string& query) const {
  std::vector<std::string> roots;
  for (const auto& root : candidate_roots_) {
    if (services_.file_system.exists(root)) {
      roots.push_back(root);
    }
  }

  const auto found = services_.content_search.discover_paths(build_spotlight_query(query), roots);
  if (!found.has_value()) {
    std::cerr << "Content search failed: " << found.error().message << "\n";
    return {};
  }

  std::vector<RankedPath> ranked;
  ranked.reserve(found.value().size());
  for (const auto& path : found.value()) {
    ranked.push_back({path, relevance_score(path, query)});
  }
  return ranked;
}

std::optional<std::string> DocumentationSearch::discover_header_text(const std::string& query,
                                                                     std::size_t limit) const {
  const std::string root = providers::frameworks_dir(services_.sdk_locator.sdk_root());
  const auto files = services_.header_search.list_matching_files(query, root, limit);
  if (!files.has_value()) {
    std::cerr << "Header search failed: " << files.error().message << "\n";
    return std::nullopt;
  }
  if (files.value().empty()) {
    return std::nullopt;
  }
  return format_header_files(files.value(), query);
}

std::vector<SymbolMatch> DocumentationSearch::discover_symbols(const std::string& query) const {
  const std::string sdk_root = services_.sdk_locator.sdk_root();
  std::vector<SymbolMatch> matches;

  for (const auto& framework : common_frameworks()) {
    if (matches.size() >= kSymbolMatchCap) {
      break;
    }
    if (!services_.file_system.exists(providers::framework_dir(sdk_root, framework))) {
      continue;
    }

    const auto graph = services_.symbol_graphs.extract(framework, sdk_root);
    if (!graph.has_value()) {
      continue;
    }

    for (const auto& record : graph.value()) {
      if (!core::contains_ascii_ci(record.title, query)) {
        continue;
      }
      matches.push_back({framework, record.title, record.kind_display_name});
      if (matches.size() >= kSymbolMatchCap) {
        break;
      }
    }
  }

  return matches;
}

}  // namespace xdmcp::search
