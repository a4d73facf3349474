/** LICENSE TEMPLATE */
#include "scoped_fd.h"

// bidpop
#include <common.h>

// system
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace bidpop {

ScopedFd::ScopedFd() noexcept : mFd(-1) {}

ScopedFd::ScopedFd(int fd) noexcept : mFd(fd) {}

ScopedFd::ScopedFd(ScopedFd &&other) noexcept : mFd(other.mFd) { other.mFd = -1; }

ScopedFd &
ScopedFd::operator=(ScopedFd &&other) noexcept
{
  if (this == &other) {
    return *this;
  }
  Close();
  mFd = other.mFd;
  other.mFd = -1;
  return *this;
}

ScopedFd::~ScopedFd() noexcept { Close(); }

int
ScopedFd::Get() const noexcept
{
  return mFd;
}

bool
ScopedFd::IsOpen() const noexcept
{
  return mFd != -1;
}

void
ScopedFd::Close() noexcept
{
  if (IsOpen()) {
    // EINTR on close leaves the descriptor closed on Linux, retrying could close someone else's descriptor.
    const auto err = ::close(mFd);
    VERIFY(err == 0 || errno == EINTR || errno == EIO, "Failed to close file descriptor {}", mFd);
  }
  mFd = -1;
}

/* static */
ScopedFd
ScopedFd::TakeFileDescriptorOwnership(int fd) noexcept
{
  return ScopedFd{ fd };
}

/* static */
std::optional<Pipe>
Pipe::Create() noexcept
{
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    return std::nullopt;
  }
  return Pipe{ .mRead = ScopedFd::TakeFileDescriptorOwnership(fds[0]),
    .mWrite = ScopedFd::TakeFileDescriptorOwnership(fds[1]) };
}
} // namespace bidpop
