/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <posix/argslist.h>

// stdlib
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace bidpop::posix {

struct ProcessOutput
{
  std::string mStandardOutput;
  // Set when the child exited normally.
  std::optional<int> mExitStatus;
  // Set when the child was terminated by a signal.
  std::optional<int> mTerminatingSignal;

  bool
  Succeeded() const noexcept
  {
    return mExitStatus.has_value() && *mExitStatus == 0;
  }
};

struct ProcessError
{
  // The operation that failed: pipe, fork, exec, read or waitpid.
  std::string_view mOperation;
  int mErrno;
};

/**
 * Forks & execs `args` (looked up in PATH), captures everything the child writes to stdout and waits for it to
 * exit. stdin and stderr are inherited. A program that could not be executed at all is reported as a
 * `ProcessError` with mOperation == "exec".
 */
std::expected<ProcessOutput, ProcessError> CaptureStandardOutput(const PosixArgsList &args) noexcept;

} // namespace bidpop::posix
