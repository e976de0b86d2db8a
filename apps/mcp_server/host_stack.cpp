#include "host_stack.h"

namespace xdmcp::mcp {

namespace {

std::unique_ptr<providers::ISdkLocator> make_sdk_locator(const HostSettings& host,
                                                         const process::IProcessRunner& runner) {
  if (host.sdk_path.has_value()) {
    return std::make_unique<providers::FixedSdkLocator>(host.sdk_path.value());
  }
  return std::make_unique<providers::XcrunSdkLocator>(runner);
}

}  // namespace

HostStack::HostStack(const HostSettings& host)
    : sdk_locator_(make_sdk_locator(host, runner_)),
      content_search_(runner_),
      header_search_(runner_),
      symbol_graphs_(runner_, host.target),
      services_(content_search_, header_search_, symbol_graphs_, *sdk_locator_, file_system_) {}

}  // namespace xdmcp::mcp
