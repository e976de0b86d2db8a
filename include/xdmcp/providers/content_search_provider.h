#pragma once

#include "xdmcp/core/result.h"
#include "xdmcp/process/process_runner.h"
#include "xdmcp/providers/provider_error.h"

#include <string>
#include <vector>

namespace xdmcp::providers {

using PathList = core::Result<std::vector<std::string>, ProviderError>;

// IContentSearchProvider finds files whose name or content matches a query expression.
// The expression syntax belongs to the implementation (Spotlight for the host provider).
// An empty roots list searches everywhere the provider can see.
class IContentSearchProvider {
 public:
  virtual ~IContentSearchProvider() = default;

  [[nodiscard]] virtual PathList discover_paths(const std::string& query_expression,
                                                const std::vector<std::string>& roots) const = 0;

 protected:
  IContentSearchProvider() = default;
  IContentSearchProvider(const IContentSearchProvider&) = default;
  IContentSearchProvider& operator=(const IContentSearchProvider&) = default;
  IContentSearchProvider(IContentSearchProvider&&) = default;
  IContentSearchProvider& operator=(IContentSearchProvider&&) = default;
};

// SpotlightContentSearchProvider runs /usr/bin/mdfind with one -onlyin per root.
class SpotlightContentSearchProvider final : public IContentSearchProvider {
 public:
  explicit SpotlightContentSearchProvider(const process::IProcessRunner& runner)
      : runner_(runner) {}

  [[nodiscard]] PathList discover_paths(const std::string& query_expression,
                                        const std::vector<std::string>& roots) const override;

 private:
  const process::IProcessRunner& runner_;
};

}  // namespace xdmcp::providers
