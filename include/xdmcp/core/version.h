#pragma once

namespace xdmcp::core {

// kServerName is the name reported in serverInfo and on the startup banner.
constexpr const char* kServerName = "xcode-docs-mcp";

// kBuildVersion is the current software version string.
// Updated once per release.
constexpr const char* kBuildVersion = "1.0.0";

}  // namespace xdmcp::core
