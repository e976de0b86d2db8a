#pragma once

#include "xdmcp/process/process_runner.h"

#include <string>
#include <utility>

namespace xdmcp::providers {

// Default SDK used when xcrun is unavailable or prints nothing.
constexpr const char* kDefaultSdkPath =
    "/Applications/Xcode.app/Contents/Developer/Platforms/MacOSX.platform/Developer/SDKs/"
    "MacOSX.sdk";

// ISdkLocator resolves the filesystem root of the active SDK.
// Contract: always returns a non-empty path (it may not exist).
class ISdkLocator {
 public:
  virtual ~ISdkLocator() = default;

  [[nodiscard]] virtual std::string sdk_root() const = 0;

 protected:
  ISdkLocator() = default;
  ISdkLocator(const ISdkLocator&) = default;
  ISdkLocator& operator=(const ISdkLocator&) = default;
  ISdkLocator(ISdkLocator&&) = default;
  ISdkLocator& operator=(ISdkLocator&&) = default;
};

// XcrunSdkLocator asks `xcrun --show-sdk-path` on every call and falls back to
// kDefaultSdkPath. Nothing is cached, so switching Xcode takes effect immediately.
class XcrunSdkLocator final : public ISdkLocator {
 public:
  explicit XcrunSdkLocator(const process::IProcessRunner& runner) : runner_(runner) {}

  [[nodiscard]] std::string sdk_root() const override;

 private:
  const process::IProcessRunner& runner_;
};

// FixedSdkLocator returns a configured path (the --sdk override).
class FixedSdkLocator final : public ISdkLocator {
 public:
  explicit FixedSdkLocator(std::string path) : path_(std::move(path)) {}

  [[nodiscard]] std::string sdk_root() const override { return path_; }

 private:
  std::string path_;
};

// frameworks_dir returns <sdk>/System/Library/Frameworks.
[[nodiscard]] std::string frameworks_dir(const std::string& sdk_root);

// framework_dir returns <sdk>/System/Library/Frameworks/<module>.framework.
[[nodiscard]] std::string framework_dir(const std::string& sdk_root, const std::string& module);

}  // namespace xdmcp::providers
