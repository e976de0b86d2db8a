#pragma once

#include "xdmcp/core/services.h"

#include <string>
#include <vector>

namespace xdmcp::frameworks {

// framework_names keeps the "*.framework" entries of a directory listing, strips the
// suffix and sorts them. A non-empty filter keeps names containing it, ignoring ASCII case.
[[nodiscard]] std::vector<std::string> framework_names(const std::vector<std::string>& entries,
                                                       const std::string& filter);

// list_frameworks renders the frameworks of the active SDK:
//   Available frameworks (N):
//
//     - AppKit
//     - ...
[[nodiscard]] std::string list_frameworks(const core::Services& services,
                                          const std::string& filter);

}  // namespace xdmcp::frameworks
