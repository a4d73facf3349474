/** LICENSE TEMPLATE */
#pragma once
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bidpop::posix {

/**
 * Posix command; a command string with a nullptr terminated list of strings
 */
struct Command
{
  const char *const command;
  char *const *args;
};

/**
 * Utility class to be able to be passed to POSIX syscalls and utilities. args[0] is the program, by convention also
 * the first element of the argument vector handed to exec.
 */
class PosixArgsList
{
public:
  explicit PosixArgsList(std::vector<std::string> &&args) noexcept;

  PosixArgsList(const PosixArgsList &) = delete;
  PosixArgsList &operator=(const PosixArgsList &) = delete;

  Command GetCommand() const noexcept;
  std::span<const std::string> Args() const noexcept;

private:
  void Init() noexcept;
  std::vector<std::string> mArgs;
  std::vector<const char *> mCStringArgs;
};
} // namespace bidpop::posix
