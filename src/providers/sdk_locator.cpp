#include "xdmcp/providers/sdk_locator.h"

#include "xdmcp/core/normalization.h"

namespace xdmcp::providers {

std::string XcrunSdkLocator::sdk_root() const {
  const auto result = runner_.run({"/usr/bin/xcrun", {"--show-sdk-path"}});
  if (result.has_value() && result.value().exit_status == 0) {
    auto path = core::trim(result.value().stdout_text);
    if (!path.empty()) {
      return path;
    }
  }
  return kDefaultSdkPath;
}

std::string frameworks_dir(const std::string& sdk_root) {
  return sdk_root + "/System/Library/Frameworks";
}

std::string framework_dir(const std::string& sdk_root, const std::string& module) {
  return frameworks_dir(sdk_root) + "/" + module + ".framework";
}

}  // namespace xdmcp::providers
