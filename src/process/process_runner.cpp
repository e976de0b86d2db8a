#include "xdmcp/process/process_runner.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace xdmcp::process {

namespace {

// ScopedFd closes its descriptor on every exit path.
class ScopedFd {
 public:
  explicit ScopedFd(int fd = -1) : fd_(fd) {}
  ~ScopedFd() { reset(); }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  ScopedFd(ScopedFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  ScopedFd& operator=(ScopedFd&& other) noexcept {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  [[nodiscard]] int get() const { return fd_; }

  void reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
};

std::string errno_message(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

// Wait for pid, retrying on EINTR. Returns false when waitpid fails for another reason.
bool wait_for_child(pid_t pid, int& status) {
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return false;
    }
  }
  return true;
}

int decode_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace

ProcessResult PosixProcessRunner::run(const ProcessSpec& spec) const {
  if (::access(spec.executable.c_str(), X_OK) != 0) {
    return ProcessResult::err(ProcessError{errno_message("cannot execute " + spec.executable)});
  }

  int fds[2];  // NOLINT(modernize-avoid-c-arrays)
  if (::pipe(fds) != 0) {
    return ProcessResult::err(ProcessError{errno_message("pipe")});
  }
  ScopedFd read_end(fds[0]);
  ScopedFd write_end(fds[1]);

  ScopedFd dev_null(::open("/dev/null", O_RDWR));
  if (dev_null.get() < 0) {
    return ProcessResult::err(ProcessError{errno_message("open /dev/null")});
  }

  // argv must be built before fork: only async-signal-safe calls are allowed in the child.
  std::vector<std::string> args;
  args.reserve(spec.arguments.size() + 1);
  args.push_back(spec.executable);
  args.insert(args.end(), spec.arguments.begin(), spec.arguments.end());

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    return ProcessResult::err(ProcessError{errno_message("fork")});
  }

  if (pid == 0) {
    ::dup2(dev_null.get(), STDIN_FILENO);
    if (spec.stdout_mode == OutputMode::kCapture) {
      ::dup2(write_end.get(), STDOUT_FILENO);
    } else {
      ::dup2(dev_null.get(), STDOUT_FILENO);
    }
    ::dup2(dev_null.get(), STDERR_FILENO);
    ::close(read_end.get());
    ::close(write_end.get());
    ::close(dev_null.get());
    ::execv(argv[0], argv.data());
    ::_exit(127);
  }

  // Parent: drop the write end so EOF arrives when the child exits.
  write_end.reset();
  dev_null.reset();

  ProcessOutput output;
  std::string read_error;
  char buffer[4096];  // NOLINT(modernize-avoid-c-arrays)
  while (true) {
    const ssize_t n = ::read(read_end.get(), buffer, sizeof(buffer));
    if (n > 0) {
      if (spec.stdout_mode == OutputMode::kCapture) {
        output.stdout_text.append(buffer, static_cast<std::size_t>(n));
      }
      continue;
    }
    if (n == 0) {
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    read_error = errno_message("read");
    break;
  }
  read_end.reset();

  int status = 0;
  if (!wait_for_child(pid, status)) {
    return ProcessResult::err(ProcessError{errno_message("waitpid")});
  }
  if (!read_error.empty()) {
    return ProcessResult::err(ProcessError{read_error});
  }

  output.exit_status = decode_status(status);
  return ProcessResult::ok(std::move(output));
}

}  // namespace xdmcp::process
