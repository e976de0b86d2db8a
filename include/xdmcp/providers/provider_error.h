#pragma once

#include <string>

namespace xdmcp::providers {

// ProviderError describes why an external collaborator produced no usable answer
// (launch failure, nonzero exit with no output, unreadable output).
struct ProviderError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

}  // namespace xdmcp::providers
