#pragma once

#include "xdmcp/core/result.h"

#include <string>
#include <vector>

namespace xdmcp::process {

// OutputMode selects what happens to the child's stdout. stderr always goes to /dev/null
// and stdin always reads from /dev/null, so a child can never consume the server's own
// request stream.
enum class OutputMode {
  kCapture,  // NOLINT(readability-identifier-naming)
  kDiscard,  // NOLINT(readability-identifier-naming)
};

struct ProcessSpec {
  std::string executable;              // NOLINT(readability-identifier-naming)
  std::vector<std::string> arguments;  // NOLINT(readability-identifier-naming)
  OutputMode stdout_mode{OutputMode::kCapture};  // NOLINT(readability-identifier-naming)
};

struct ProcessOutput {
  int exit_status{0};       // NOLINT(readability-identifier-naming)
  std::string stdout_text;  // NOLINT(readability-identifier-naming)
};

// ProcessError means the process could not be started or awaited. A process that ran and
// exited nonzero is not an error; its status is reported in ProcessOutput.
struct ProcessError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

using ProcessResult = core::Result<ProcessOutput, ProcessError>;

// IProcessRunner runs one external command to completion.
// Contract: run() blocks until the child exits. Captured output is read to EOF before the
// child is awaited, so a child writing more than a pipe buffer never stalls.
// There is no timeout: a child that never exits blocks the caller.
class IProcessRunner {
 public:
  virtual ~IProcessRunner() = default;

  [[nodiscard]] virtual ProcessResult run(const ProcessSpec& spec) const = 0;

 protected:
  IProcessRunner() = default;
  IProcessRunner(const IProcessRunner&) = default;
  IProcessRunner& operator=(const IProcessRunner&) = default;
  IProcessRunner(IProcessRunner&&) = default;
  IProcessRunner& operator=(IProcessRunner&&) = default;
};

// PosixProcessRunner: fork/execv with a stdout pipe.
// Exit status is WEXITSTATUS for a normal exit and 128 + signal number for a killed child.
class PosixProcessRunner final : public IProcessRunner {
 public:
  [[nodiscard]] ProcessResult run(const ProcessSpec& spec) const override;
};

}  // namespace xdmcp::process
