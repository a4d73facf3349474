/** LICENSE TEMPLATE */
#pragma once

#include <source_location>
#include <string_view>

// defines PANIC macro. Responsibility on caller to include required headers.

#define PANIC(err_msg)                                                                                            \
  {                                                                                                               \
    auto loc = std::source_location::current();                                                                   \
    bidpop::panic(err_msg, loc, 1);                                                                               \
  }

namespace bidpop {

[[noreturn]] void panic(std::string_view err_msg, const char *functionName, const char *file, int line,
                        int strip_levels);

[[noreturn]] void panic(std::string_view err_msg, const std::source_location &loc, int strip_levels);

} // namespace bidpop
