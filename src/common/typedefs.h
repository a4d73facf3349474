/** LICENSE TEMPLATE */
#pragma once

// stdlib
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <type_traits>

// system
#include <sys/types.h>

using u64 = std::uint64_t;
using u32 = std::uint32_t;
using u16 = std::uint16_t;
using u8 = std::uint8_t;

using i64 = std::int64_t;
using i32 = std::int32_t;
using i16 = std::int16_t;
using i8 = std::int8_t;

using Pid = pid_t;

namespace fs = std::filesystem;
using Path = fs::path;

template <typename ContainerType>
concept PushBackContainer = requires(ContainerType container) { container.push_back({}); };

