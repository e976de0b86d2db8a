#include "xdmcp/providers/header_search_provider.h"

#include "xdmcp/core/normalization.h"

#include <string>
#include <utility>
#include <vector>

namespace xdmcp::providers {

namespace {

constexpr const char* kGrep = "/usr/bin/grep";

// grep: 0 = matches, 1 = no match, 2 = trouble. Trouble with partial output (an unreadable
// file somewhere in the tree) still yields the matches that were found.
core::Result<std::string, ProviderError> run_grep(const process::IProcessRunner& runner,
                                                  std::vector<std::string> arguments) {
  const auto result = runner.run({kGrep, std::move(arguments)});
  if (!result.has_value()) {
    return core::Result<std::string, ProviderError>::err(ProviderError{result.error().message});
  }

  const auto& output = result.value();
  if (output.exit_status > 1 && output.stdout_text.empty()) {
    return core::Result<std::string, ProviderError>::err(
        ProviderError{"grep exited with status " + std::to_string(output.exit_status)});
  }
  return core::Result<std::string, ProviderError>::ok(output.stdout_text);
}

}  // namespace

HeaderFileList GrepHeaderSearchProvider::list_matching_files(const std::string& query,
                                                             const std::string& root_dir,
                                                             std::size_t max_results) const {
  auto output = run_grep(runner_, {"-r", "-l", "-i", "--include=*.h", "-e", query, root_dir});
  if (!output.has_value()) {
    return HeaderFileList::err(output.error());
  }

  auto lines = core::split_nonempty_lines(output.value());
  if (lines.size() > max_results) {
    lines.resize(max_results);
  }
  return HeaderFileList::ok(std::move(lines));
}

HeaderContext GrepHeaderSearchProvider::search_context(const std::string& query,
                                                       const std::string& root_dir) const {
  return run_grep(runner_,
                  {"-r", "-n", "-A", "5", "-B", "2", "--include=*.h", "-e", query, root_dir});
}

}  // namespace xdmcp::providers
