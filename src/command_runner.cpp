/**
 * @file command_runner.cpp
 * @brief External command execution implementation
 */

#include "clipforge/command_runner.hpp"

#include <cstdlib>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "clipforge/logging.hpp"
#include "clipforge/system.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace clipforge {

namespace {

/// Exit codes of coreutils timeout: 124 = TERM sent, 137 = KILL after grace
constexpr int TIMEOUT_EXIT = 124;
constexpr int TIMEOUT_KILLED_EXIT = 137;
constexpr int KILL_GRACE_SECONDS = 10;

} // anonymous namespace

// **----- COMMANDS -----**

CommandResult run_command(const std::string &cmd, int timeout_seconds,
                          const std::string &log_path) {
  std::string full;
  if (timeout_seconds > 0) {
    full = fmt::format("timeout --kill-after={} {} {}", KILL_GRACE_SECONDS,
                       timeout_seconds, cmd);
  } else {
    full = cmd;
  }

  if (!log_path.empty()) {
    full += fmt::format(" </dev/null >>{} 2>&1", shell_quote(log_path));
  } else {
    full += " </dev/null";
  }

  LOG_DEBUG("[cmd] {}", full);

  CommandResult result;
  int status = std::system(full.c_str());
  if (status == -1) {
    LOG_ERROR("[cmd] Failed to start shell");
    return result;
  }
  result.launched = true;

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }

  result.timed_out =
      timeout_seconds > 0 && (result.exit_code == TIMEOUT_EXIT ||
                              result.exit_code == TIMEOUT_KILLED_EXIT);
  return result;
}

StageOutcome command_outcome(const CommandResult &result,
                             const std::string &what) {
  if (!result.launched)
    return StageOutcome::transient(fmt::format("{}: could not be started", what));
  if (result.timed_out)
    return StageOutcome::transient(fmt::format("{}: timed out", what));
  if (result.exit_code != 0)
    return StageOutcome::transient(
        fmt::format("{}: exited with code {}", what, result.exit_code));
  return StageOutcome::success();
}

// **----- MemFile Implementation -----**

MemFile::~MemFile() { reset(); }

MemFile::MemFile(MemFile &&other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

MemFile &MemFile::operator=(MemFile &&other) noexcept {
  if (this != &other) {
    reset();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void MemFile::reset() {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
}

bool MemFile::create(const char *name, const std::string &content) {
  reset();

  /// Children open it through /proc/<pid>/fd, no inheritance needed
  int fd = static_cast<int>(syscall(SYS_memfd_create, name, MFD_CLOEXEC));
  if (fd == -1) {
    LOG_ERROR("Failed to create memory file! (kernel >= 3.17 required)");
    return false;
  }

  std::size_t written = 0;
  while (written < content.size()) {
    ssize_t n = write(fd, content.data() + written, content.size() - written);
    if (n <= 0) {
      LOG_ERROR("Failed to write to memory file");
      close(fd);
      return false;
    }
    written += static_cast<std::size_t>(n);
  }

  fd_ = fd;
  return true;
}

std::string MemFile::path() const {
  return fmt::format("/proc/{}/fd/{}", getpid(), fd_);
}

} // namespace clipforge
