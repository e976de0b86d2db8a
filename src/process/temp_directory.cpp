#include "xdmcp/process/temp_directory.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace xdmcp::process {

core::Result<TempDirectory, TempDirectoryError> TempDirectory::create(const std::string& prefix) {
  std::error_code ec;
  const auto base = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return core::Result<TempDirectory, TempDirectoryError>::err(
        TempDirectoryError{"no temp directory: " + ec.message()});
  }

  std::string templ = (base / (prefix + "XXXXXX")).string();
  std::vector<char> buffer(templ.begin(), templ.end());
  buffer.push_back('\0');

  if (::mkdtemp(buffer.data()) == nullptr) {
    return core::Result<TempDirectory, TempDirectoryError>::err(
        TempDirectoryError{std::string{"mkdtemp: "} + std::strerror(errno)});
  }

  return core::Result<TempDirectory, TempDirectoryError>::ok(TempDirectory{buffer.data()});
}

TempDirectory::~TempDirectory() {
  remove();
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void TempDirectory::remove() noexcept {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace xdmcp::process
