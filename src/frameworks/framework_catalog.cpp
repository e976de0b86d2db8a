#include "xdmcp/frameworks/framework_catalog.h"

#include "xdmcp/core/normalization.h"
#include "xdmcp/providers/sdk_locator.h"

#include <algorithm>
#include <string_view>
#include <utility>

namespace xdmcp::frameworks {

std::vector<std::string> framework_names(const std::vector<std::string>& entries,
                                         const std::string& filter) {
  constexpr std::string_view kSuffix = ".framework";

  std::vector<std::string> names;
  for (const auto& entry : entries) {
    if (entry.size() <= kSuffix.size() ||
        std::string_view{entry}.substr(entry.size() - kSuffix.size()) != kSuffix) {
      continue;
    }
    std::string name = entry.substr(0, entry.size() - kSuffix.size());
    if (!filter.empty() && !core::contains_ascii_ci(name, filter)) {
      continue;
    }
    names.push_back(std::move(name));
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::string list_frameworks(const core::Services& services, const std::string& filter) {
  const auto listing =
      services.file_system.list_directory(providers::frameworks_dir(services.sdk_locator.sdk_root()));
  if (!listing.has_value()) {
    return "Error listing frameworks: " + listing.error().message;
  }

  const auto names = framework_names(listing.value(), filter);
  if (names.empty()) {
    return "No frameworks found matching '" + filter + "'.";
  }

  std::string out = "Available frameworks (" + std::to_string(names.size()) + "):\n";
  for (const auto& name : names) {
    out += "\n  - " + name;
  }
  return out;
}

}  // namespace xdmcp::frameworks
