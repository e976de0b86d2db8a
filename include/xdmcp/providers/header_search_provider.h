#pragma once

#include "xdmcp/core/result.h"
#include "xdmcp/process/process_runner.h"
#include "xdmcp/providers/provider_error.h"

#include <cstddef>
#include <string>
#include <vector>

namespace xdmcp::providers {

using HeaderFileList = core::Result<std::vector<std::string>, ProviderError>;
using HeaderContext = core::Result<std::string, ProviderError>;

// IHeaderSearchProvider greps header (*.h) files below a directory.
// "No match" is a successful, empty answer; only a search that could not run is an error.
class IHeaderSearchProvider {
 public:
  virtual ~IHeaderSearchProvider() = default;

  // list_matching_files returns at most max_results paths of headers containing query,
  // compared case-insensitively.
  [[nodiscard]] virtual HeaderFileList list_matching_files(const std::string& query,
                                                           const std::string& root_dir,
                                                           std::size_t max_results) const = 0;

  // search_context returns raw grep-style blocks (file:line:text, with surrounding lines)
  // for case-sensitive matches of query.
  [[nodiscard]] virtual HeaderContext search_context(const std::string& query,
                                                     const std::string& root_dir) const = 0;

 protected:
  IHeaderSearchProvider() = default;
  IHeaderSearchProvider(const IHeaderSearchProvider&) = default;
  IHeaderSearchProvider& operator=(const IHeaderSearchProvider&) = default;
  IHeaderSearchProvider(IHeaderSearchProvider&&) = default;
  IHeaderSearchProvider& operator=(IHeaderSearchProvider&&) = default;
};

// GrepHeaderSearchProvider runs /usr/bin/grep. grep exits 1 for "no match", which is
// reported as an empty answer.
class GrepHeaderSearchProvider final : public IHeaderSearchProvider {
 public:
  explicit GrepHeaderSearchProvider(const process::IProcessRunner& runner) : runner_(runner) {}

  [[nodiscard]] HeaderFileList list_matching_files(const std::string& query,
                                                   const std::string& root_dir,
                                                   std::size_t max_results) const override;

  [[nodiscard]] HeaderContext search_context(const std::string& query,
                                             const std::string& root_dir) const override;

 private:
  const process::IProcessRunner& runner_;
};

}  // namespace xdmcp::providers
