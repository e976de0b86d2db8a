#include "xdmcp/providers/file_system.h"

#include <filesystem>
#include <system_error>
#include <utility>

namespace xdmcp::providers {

bool LocalFileSystem::exists(const std::string& path) const {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

DirectoryListing LocalFileSystem::list_directory(const std::string& path) const {
  std::error_code ec;
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return DirectoryListing::err(ProviderError{"cannot read " + path + ": " + ec.message()});
  }

  std::vector<std::string> names;
  for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
    if (ec) {
      return DirectoryListing::err(ProviderError{"cannot read " + path + ": " + ec.message()});
    }
    names.push_back(it->path().filename().string());
  }
  if (ec) {
    return DirectoryListing::err(ProviderError{"cannot read " + path + ": " + ec.message()});
  }

  return DirectoryListing::ok(std::move(names));
}

}  // namespace xdmcp::providers
