#pragma once

#include "xdmcp/core/result.h"

#include <string>
#include <utility>

namespace xdmcp::process {

struct TempDirectoryError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

// TempDirectory owns a freshly created directory under the system temp location and
// removes it (recursively) when destroyed. Move-only.
class TempDirectory {
 public:
  // create makes a unique directory named <prefix>XXXXXX.
  [[nodiscard]] static core::Result<TempDirectory, TempDirectoryError> create(
      const std::string& prefix);

  ~TempDirectory();

  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;
  TempDirectory(TempDirectory&& other) noexcept;
  TempDirectory& operator=(TempDirectory&& other) noexcept;

  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  explicit TempDirectory(std::string path) : path_(std::move(path)) {}

  void remove() noexcept;

  std::string path_;
};

}  // namespace xdmcp::process
