/** LICENSE TEMPLATE */
#include "subprocess.h"

// bidpop
#include <common.h>
#include <utils/logger.h>
#include <utils/scope_defer.h>
#include <utils/scoped_fd.h>

// stdlib
#include <array>
#include <cerrno>
#include <cstring>

// system
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace bidpop::posix {

static constexpr auto kExecFailedExitCode = 127;

// Reads until EOF. Returns errno on failure, 0 on success.
static int
ReadAll(int fd, std::string &out) noexcept
{
  std::array<char, 4096> buffer;
  for (;;) {
    const auto bytesRead = ::read(fd, buffer.data(), buffer.size());
    if (bytesRead == 0) {
      return 0;
    }
    if (bytesRead == -1) {
      if (errno == EINTR) {
        continue;
      }
      return errno;
    }
    out.append(buffer.data(), static_cast<size_t>(bytesRead));
  }
}

static int
WaitForChild(Pid pid, int &status) noexcept
{
  for (;;) {
    if (::waitpid(pid, &status, 0) != -1) {
      return 0;
    }
    if (errno != EINTR) {
      return errno;
    }
  }
}

[[noreturn]] static void
ExecChild(const Command &command, int stdoutFd, int execErrorFd) noexcept
{
  if (::dup2(stdoutFd, STDOUT_FILENO) == -1) {
    const int err = errno;
    [[maybe_unused]] auto _ = ::write(execErrorFd, &err, sizeof(err));
    _exit(kExecFailedExitCode);
  }
  ::execvp(command.command, command.args);
  // Only reached if exec failed. Tell the parent why; the error pipe is O_CLOEXEC so a successful exec closes it
  // without anything having been written.
  const int err = errno;
  [[maybe_unused]] auto _ = ::write(execErrorFd, &err, sizeof(err));
  _exit(kExecFailedExitCode);
}

std::expected<ProcessOutput, ProcessError>
CaptureStandardOutput(const PosixArgsList &args) noexcept
{
  auto outputPipe = Pipe::Create();
  if (!outputPipe) {
    return std::unexpected(ProcessError{ .mOperation = "pipe", .mErrno = errno });
  }
  auto execErrorPipe = Pipe::Create();
  if (!execErrorPipe) {
    return std::unexpected(ProcessError{ .mOperation = "pipe", .mErrno = errno });
  }

  const auto command = args.GetCommand();
  DBGLOG(reader, "spawning {} with {} argument(s)", command.command, args.Args().size() - 1);

  const Pid childPid = ::fork();
  if (childPid == -1) {
    return std::unexpected(ProcessError{ .mOperation = "fork", .mErrno = errno });
  }

  if (childPid == 0) {
    ExecChild(command, outputPipe->mWrite.Get(), execErrorPipe->mWrite.Get());
  }

  // Parent. Drop our copies of the write ends, or we never see EOF.
  outputPipe->mWrite.Close();
  execErrorPipe->mWrite.Close();

  int status = 0;
  // Early returns below must not leave a zombie behind.
  ScopedDefer reapChild{ [&]() noexcept {
    if (const auto err = WaitForChild(childPid, status); err != 0) {
      DBGLOG(warning, "could not reap child {}: {}", childPid, std::strerror(err));
    }
  } };

  std::string execError;
  if (const auto err = ReadAll(execErrorPipe->mRead.Get(), execError); err != 0) {
    return std::unexpected(ProcessError{ .mOperation = "read", .mErrno = err });
  }
  if (execError.size() >= sizeof(int)) {
    int childErrno = 0;
    std::memcpy(&childErrno, execError.data(), sizeof(childErrno));
    return std::unexpected(ProcessError{ .mOperation = "exec", .mErrno = childErrno });
  }

  ProcessOutput result{};
  if (const auto err = ReadAll(outputPipe->mRead.Get(), result.mStandardOutput); err != 0) {
    return std::unexpected(ProcessError{ .mOperation = "read", .mErrno = err });
  }

  reapChild.Cancel();
  if (const auto err = WaitForChild(childPid, status); err != 0) {
    return std::unexpected(ProcessError{ .mOperation = "waitpid", .mErrno = err });
  }

  if (WIFEXITED(status)) {
    result.mExitStatus = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.mTerminatingSignal = WTERMSIG(status);
  }
  DBGLOG(reader,
    "{} finished: exit status={}, signal={}, {} bytes of output",
    command.command,
    result.mExitStatus.value_or(-1),
    result.mTerminatingSignal.value_or(0),
    result.mStandardOutput.size());
  return result;
}

} // namespace bidpop::posix
