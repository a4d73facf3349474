/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <common/macros.h>
#include <common/panic.h>
#include <common/typedefs.h>

// fmt
#include <fmt/format.h>

// stdlib
#include <source_location>

// clang-format off
// Identical to ASSERT, but doesn't care about build type
#define VERIFY(cond, msg, ...) if (!(cond)) [[unlikely]] { std::source_location loc = std::source_location::current(); \
    bidpop::panic(fmt::format("{} FAILED {}", #cond, fmt::format(msg __VA_OPT__(, ) __VA_ARGS__)), loc, 1);       \
  }
// clang-format on
#if defined(BIDPOP_DEBUG) and BIDPOP_DEBUG == 1
#define ASSERT(cond, msg, ...) VERIFY(cond, msg, __VA_ARGS__)
#else
#define ASSERT(cond, msg, ...)
#endif
