#include "xdmcp/search/relevance.h"

#include "xdmcp/core/normalization.h"

#include <algorithm>
#include <utility>

namespace xdmcp::search {

namespace {

bool ends_with(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

bool contains(std::string_view text, std::string_view needle) {
  return text.find(needle) != std::string_view::npos;
}

}  // namespace

int relevance_score(std::string_view path, std::string_view query) {
  const std::string lower_path = core::normalize_ascii_lower(path);
  const std::string lower_query = core::normalize_ascii_lower(query);
  const std::string file_name = core::normalize_ascii_lower(core::last_path_component(path));

  int score = 0;

  if (file_name == lower_query || contains(file_name, lower_query + ".")) {
    score += kExactFileNameBonus;
  }

  if (ends_with(path, ".h") || ends_with(path, ".swift") || ends_with(path, ".swiftinterface")) {
    score += kInterfaceFileBonus;
  }

  if (contains(lower_path, "/frameworks/") && contains(lower_path, "/headers/")) {
    score += kFrameworkHeadersBonus;
  }

  if (starts_with(file_name, lower_query)) {
    score += kFileNamePrefixBonus;
  }

  if (contains(lower_path, "/documentation/") || contains(lower_path, ".docarchive")) {
    score += kDocumentationBonus;
  }

  if (contains(file_name, lower_query)) {
    score += kFileNameContainsBonus;
  }

  constexpr std::string_view kFrameworksMarker = "/frameworks/";
  if (const auto marker = lower_path.find(kFrameworksMarker); marker != std::string::npos) {
    const std::string_view after =
        std::string_view{lower_path}.substr(marker + kFrameworksMarker.size());
    if (starts_with(after, lower_query)) {
      score += kFrameworkNameBonus;
    }
  }

  return score;
}

std::vector<RankedPath> rank_paths(std::vector<RankedPath> paths, std::size_t limit) {
  std::stable_sort(paths.begin(), paths.end(),
                   [](const RankedPath& a, const RankedPath& b) { return a.score > b.score; });
  if (paths.size() > limit) {
    paths.resize(limit);
  }
  return paths;
}

std::optional<std::string> framework_name_from_path(std::string_view path) {
  constexpr std::string_view kMarker = "/Frameworks/";
  const auto marker = path.find(kMarker);
  if (marker == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view after = path.substr(marker + kMarker.size());
  const auto slash = after.find('/');
  if (slash == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view name = after.substr(0, slash);
  constexpr std::string_view kSuffix = ".framework";
  if (ends_with(name, kSuffix)) {
    name.remove_suffix(kSuffix.size());
  }
  return std::string{name};
}

std::optional<std::string> file_type_label(std::string_view path) {
  if (ends_with(path, ".h")) {
    return "Objective-C Header";
  }
  if (ends_with(path, ".swift") || ends_with(path, ".swiftinterface")) {
    return "Swift Interface";
  }
  if (contains(path, ".docarchive")) {
    return "Documentation";
  }
  return std::nullopt;
}

std::string format_ranked_entries(const std::vector<RankedPath>& ranked) {
  std::string out;
  std::size_t index = 0;
  for (const auto& entry : ranked) {
    std::vector<std::string> parts;
    if (auto framework = framework_name_from_path(entry.path)) {
      parts.push_back("[" + *framework + "]");
    }
    if (auto label = file_type_label(entry.path)) {
      parts.push_back(*label);
    }
    parts.emplace_back(core::last_path_component(entry.path));

    std::string line = std::to_string(++index) + ". ";
    for (std::size_t i = 0; i < parts.size(); ++i) {
      if (i > 0) {
        line += " - ";
      }
      line += parts[i];
    }

    out += line + "\n";
    out += "   Path: " + entry.path + "\n";
    out += "\n";
  }
  return out;
}

}  // namespace xdmcp::search
