/**
 * @file command_runner.hpp
 * @brief External command execution with bounded runtime
 *
 * @details Provides:
 *          - run_command(): /bin/sh execution under coreutils `timeout`
 *
 *          - MemFile: RAII in-memory file (memfd) reachable by child
 *            processes through /proc/<pid>/fd/<fd>, used for ffmpeg concat
 *            lists so nothing lands on disk
 */

#ifndef CLIPFORGE_COMMAND_RUNNER_HPP
#define CLIPFORGE_COMMAND_RUNNER_HPP

#include <string>

#include "retry.hpp"

namespace clipforge {

/**
 * @struct CommandResult
 * @brief How a child command ended.
 */
struct CommandResult {
  bool launched = false;  //< false when the shell could not be started
  bool timed_out = false; //< Killed by the timeout wrapper
  int exit_code = -1;     //< Child exit status (128+N for signal N)
};

/**
 * @brief Run a shell command line, killing it after timeout_seconds.
 *
 * @param cmd Fully quoted command line
 * @param timeout_seconds <= 0 disables the bound
 * @param log_path When set, stdout and stderr are appended there
 */
CommandResult run_command(const std::string &cmd, int timeout_seconds,
                          const std::string &log_path = {});

/**
 * @brief Map a command result to a stage outcome.
 * @note Timeouts and non-zero exits are transient; a shell that cannot be
 *       started is transient too (fork pressure).
 */
StageOutcome command_outcome(const CommandResult &result,
                             const std::string &what);

/**
 * @class MemFile
 * @brief RAII wrapper for an anonymous memory file.
 * @note Supports move semantics but not copy.
 */
class MemFile {
public:
  MemFile() = default;
  ~MemFile();

  MemFile(const MemFile &) = delete;
  MemFile &operator=(const MemFile &) = delete;

  MemFile(MemFile &&other) noexcept;
  MemFile &operator=(MemFile &&other) noexcept;

  /**
   * @brief Create a memory file holding content.
   * @return false on memfd_create or write failure (kernel >= 3.17)
   */
  bool create(const char *name, const std::string &content);

  bool is_valid() const { return fd_ >= 0; }

  /// Path a child process can open ("/proc/<pid>/fd/<fd>")
  std::string path() const;

private:
  void reset();
  int fd_ = -1;
};

} // namespace clipforge

#endif // CLIPFORGE_COMMAND_RUNNER_HPP
