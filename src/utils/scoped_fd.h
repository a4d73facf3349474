/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <common/typedefs.h>

// stdlib
#include <optional>

namespace bidpop {

class ScopedFd
{
public:
  ScopedFd() noexcept;
  explicit ScopedFd(int fd) noexcept;
  ScopedFd &operator=(ScopedFd &&other) noexcept;
  ScopedFd(ScopedFd &&) noexcept;
  ~ScopedFd() noexcept;

  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;

  int Get() const noexcept;
  bool IsOpen() const noexcept;
  void Close() noexcept;

  static ScopedFd TakeFileDescriptorOwnership(int fd) noexcept;

private:
  int mFd;
};

// Read end & write end of a pipe(2). Both ends are opened with O_CLOEXEC; a child that should inherit an end must
// dup2 it onto the intended descriptor.
struct Pipe
{
  ScopedFd mRead;
  ScopedFd mWrite;

  // Returns nullopt and leaves errno set when the pipe couldn't be created.
  static std::optional<Pipe> Create() noexcept;
};
} // namespace bidpop
