#include "xdmcp/providers/content_search_provider.h"

#include "xdmcp/core/normalization.h"

#include <string>
#include <utility>
#include <vector>

namespace xdmcp::providers {

PathList SpotlightContentSearchProvider::discover_paths(
    const std::string& query_expression, const std::vector<std::string>& roots) const {
  process::ProcessSpec spec{"/usr/bin/mdfind", {}};
  for (const auto& root : roots) {
    spec.arguments.push_back("-onlyin");
    spec.arguments.push_back(root);
  }
  spec.arguments.push_back(query_expression);

  const auto result = runner_.run(spec);
  if (!result.has_value()) {
    return PathList::err(ProviderError{result.error().message});
  }

  const auto& output = result.value();
  if (output.exit_status != 0 && output.stdout_text.empty()) {
    return PathList::err(
        ProviderError{"mdfind exited with status " + std::to_string(output.exit_status)});
  }

  return PathList::ok(core::split_nonempty_lines(output.stdout_text));
}

}  // namespace xdmcp::providers
