/** LICENSE TEMPLATE */
#include "panic.h"

// bidpop
#include <utils/logger.h>

// fmt
#include <fmt/format.h>

// stdlib
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

// system
#include <cxxabi.h>
#include <execinfo.h>

namespace bidpop {

[[noreturn]] void
panic(std::string_view err_msg, const char *functionName, const char *file, int line, int strip_levels)
{
  const auto logIf = [](std::string_view msg) { logging::Logger::LogIf(Channel::core, msg); };
  // Capture errno before backtrace() & friends get the chance to clobber it.
  const auto savedErrno = errno;
  constexpr auto BT_BUF_SIZE = 100;
  void *buffer[BT_BUF_SIZE];
  const int nptrs = backtrace(buffer, BT_BUF_SIZE);
  logIf(fmt::format("backtrace() returned {} addresses", nptrs));
  fmt::print(stderr, "backtrace() returned {} addresses\n", nptrs);

  if (char **strings = backtrace_symbols(buffer, nptrs); strings != nullptr) {
    for (int j = strip_levels; j < nptrs; j++) {
      std::string_view view{ strings[j] };
      const auto mangledStart = view.find("_Z");
      const auto mangledEnd = view.find_first_of('+');
      if (mangledStart != std::string_view::npos && mangledEnd != std::string_view::npos &&
          mangledStart < mangledEnd) {
        std::string mangled{ view.substr(mangledStart, mangledEnd - mangledStart) };
        int status = 0;
        if (char *demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status); status == 0) {
          logIf(demangled);
          fmt::print(stderr, "{}\n", demangled);
          std::free(demangled);
          continue;
        }
      }
      logIf(strings[j]);
      fmt::print(stderr, "{}\n", strings[j]);
    }
    std::free(strings);
  } else {
    perror("backtrace_symbols");
  }

  const auto message =
    fmt::format("--- [PANIC] ---\n[FILE]: {}:{}\n[FUNCTION]: {}\n[REASON]: {}\nErrno: {}: {}\n--- [PANIC] ---",
      file,
      line,
      functionName,
      err_msg,
      savedErrno,
      std::strerror(savedErrno));
  logIf(message);
  fmt::print(stderr, "{}\n", message);
  logging::Logger::GetLogger()->OnAbort();
  std::abort();
}

[[noreturn]] void
panic(std::string_view err_msg, const std::source_location &loc, int strip_levels)
{
  panic(err_msg, loc.function_name(), loc.file_name(), loc.line(), strip_levels);
}
} // namespace bidpop
