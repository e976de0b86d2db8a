#pragma once

#include "xdmcp/core/result.h"
#include "xdmcp/providers/provider_error.h"

#include <string>
#include <vector>

namespace xdmcp::providers {

using DirectoryListing = core::Result<std::vector<std::string>, ProviderError>;

// IFileSystem is the read-only view of the host filesystem used by the tool bodies.
class IFileSystem {
 public:
  virtual ~IFileSystem() = default;

  [[nodiscard]] virtual bool exists(const std::string& path) const = 0;

  // list_directory returns the entry names (not full paths) of a directory, in no
  // particular order.
  [[nodiscard]] virtual DirectoryListing list_directory(const std::string& path) const = 0;

 protected:
  IFileSystem() = default;
  IFileSystem(const IFileSystem&) = default;
  IFileSystem& operator=(const IFileSystem&) = default;
  IFileSystem(IFileSystem&&) = default;
  IFileSystem& operator=(IFileSystem&&) = default;
};

// LocalFileSystem: std::filesystem-backed implementation. Never throws.
class LocalFileSystem final : public IFileSystem {
 public:
  [[nodiscard]] bool exists(const std::string& path) const override;
  [[nodiscard]] DirectoryListing list_directory(const std::string& path) const override;
};

}  // namespace xdmcp::providers
