#pragma once

#include "xdmcp/providers/content_search_provider.h"
#include "xdmcp/providers/file_system.h"
#include "xdmcp/providers/header_search_provider.h"
#include "xdmcp/providers/sdk_locator.h"
#include "xdmcp/providers/symbol_graph_provider.h"

namespace xdmcp::core {

// Services is a composition root that bundles every external collaborator.
// It holds references (not ownership). main() and the tests create the concrete
// instances and keep them alive for as long as the Services object is used.
struct Services {
  const providers::IContentSearchProvider& content_search;  // NOLINT(readability-identifier-naming)
  const providers::IHeaderSearchProvider& header_search;    // NOLINT(readability-identifier-naming)
  const providers::ISymbolGraphProvider& symbol_graphs;     // NOLINT(readability-identifier-naming)
  const providers::ISdkLocator& sdk_locator;                // NOLINT(readability-identifier-naming)
  const providers::IFileSystem& file_system;                // NOLINT(readability-identifier-naming)

  Services(const providers::IContentSearchProvider& content_search,
           const providers::IHeaderSearchProvider& header_search,
           const providers::ISymbolGraphProvider& symbol_graphs,
           const providers::ISdkLocator& sdk_locator, const providers::IFileSystem& file_system)
      : content_search(content_search),
        header_search(header_search),
        symbol_graphs(symbol_graphs),
        sdk_locator(sdk_locator),
        file_system(file_system) {}

  ~Services() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace xdmcp::core
