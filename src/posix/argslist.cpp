/** LICENSE TEMPLATE */
#include "argslist.h"
#include <common.h>

namespace bidpop::posix {

PosixArgsList::PosixArgsList(std::vector<std::string> &&args) noexcept : mArgs(std::move(args)) { Init(); }

Command
PosixArgsList::GetCommand() const noexcept
{
  VERIFY(mCStringArgs.back() == nullptr, "Malformed posix arguments list - must be terminated by nullptr");
  return Command{ .command = mCStringArgs.front(), .args = const_cast<char *const *>(mCStringArgs.data()) };
}

std::span<const std::string>
PosixArgsList::Args() const noexcept
{
  return std::span{ mArgs };
}

void
PosixArgsList::Init() noexcept
{
  VERIFY(!mArgs.empty(), "An argument list needs at least the program to execute");
  mCStringArgs.reserve(mArgs.size() + 1);
  for (const auto &str : mArgs) {
    mCStringArgs.push_back(str.c_str());
  }
  mCStringArgs.push_back(nullptr);
}
} // namespace bidpop::posix
