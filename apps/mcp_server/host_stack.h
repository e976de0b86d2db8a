#pragma once

#include "xdmcp/core/services.h"
#include "xdmcp/process/process_runner.h"
#include "xdmcp/providers/content_search_provider.h"
#include "xdmcp/providers/file_system.h"
#include "xdmcp/providers/header_search_provider.h"
#include "xdmcp/providers/sdk_locator.h"
#include "xdmcp/providers/symbol_graph_provider.h"

#include "config.h"
#include <memory>

namespace xdmcp::mcp {

// HostStack owns the macOS-backed collaborators and the Services that refer to them.
// Not copyable or movable: services() hands out references into this object.
class HostStack {
 public:
  explicit HostStack(const HostSettings& host);

  HostStack(const HostStack&) = delete;
  HostStack& operator=(const HostStack&) = delete;
  HostStack(HostStack&&) = delete;
  HostStack& operator=(HostStack&&) = delete;
  ~HostStack() = default;

  [[nodiscard]] const core::Services& services() const { return services_; }

 private:
  process::PosixProcessRunner runner_;
  std::unique_ptr<providers::ISdkLocator> sdk_locator_;
  providers::SpotlightContentSearchProvider content_search_;
  providers::GrepHeaderSearchProvider header_search_;
  providers::SymbolGraphExtractProvider symbol_graphs_;
  providers::LocalFileSystem file_system_;
  core::Services services_;
};

}  // namespace xdmcp::mcp
