/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <common/typedefs.h>

// stdlib
#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

// fmt
#include <fmt/format.h>

#if defined(__clang__)
#define BIDPOP_UNREACHABLE std::unreachable();
#elif defined(__GNUC__) || defined(__GNUG__)
#define BIDPOP_UNREACHABLE __builtin_unreachable();
#endif

#ifndef NO_COPY
#define NO_COPY(CLASS)                                                                                            \
  CLASS(const CLASS &) = delete;                                                                                  \
  CLASS(CLASS &) = delete;                                                                                        \
  CLASS &operator=(CLASS &) = delete;                                                                             \
  CLASS &operator=(const CLASS &) = delete;
#endif

#define DEFAULT_ENUM(Value, ...) Value,

#define STRINGIFY_VAL(x, ...) #x,

template <typename T> struct Enum;

#define ENUM_FMT(ENUM_TYPE, FOR_EACH_FN, CASE_FN)                                                                 \
  template <> struct fmt::formatter<ENUM_TYPE> : fmt::formatter<std::string_view>                                 \
  {                                                                                                               \
    template <typename FormatContext>                                                                             \
    auto                                                                                                          \
    format(const ENUM_TYPE &value, FormatContext &ctx) const                                                      \
    {                                                                                                             \
      return fmt::formatter<std::string_view>::format(Enum<ENUM_TYPE>::ToString(value), ctx);                     \
    }                                                                                                             \
  }

// Defines the enum class and an `Enum<ENUM_TYPE>` specialization that can iterate, stringify and parse its
// values. Must be used at global scope, as it specializes `Enum` and `fmt::formatter`.
#define ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH, EACH_FN, UNDERLYING_TYPE)                                         \
  enum class ENUM_TYPE : UNDERLYING_TYPE                                                                          \
  {                                                                                                               \
    FOR_EACH(EACH_FN)                                                                                             \
  };                                                                                                              \
  namespace detail {                                                                                              \
  using enum ENUM_TYPE;                                                                                           \
  static constexpr auto ENUM_TYPE##Ids = std::to_array<ENUM_TYPE>({ FOR_EACH(DEFAULT_ENUM) });                    \
  static constexpr auto ENUM_TYPE##Names = std::to_array<std::string_view>({ FOR_EACH(STRINGIFY_VAL) });          \
  }                                                                                                               \
  template <> struct Enum<ENUM_TYPE>                                                                              \
  {                                                                                                               \
    static constexpr u32                                                                                          \
    Count() noexcept                                                                                              \
    {                                                                                                             \
      return detail::ENUM_TYPE##Ids.size();                                                                       \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::span<const ENUM_TYPE>                                                                   \
    Variants() noexcept                                                                                           \
    {                                                                                                             \
      return std::span{ detail::ENUM_TYPE##Ids };                                                                 \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::string_view                                                                             \
    ToString(ENUM_TYPE value) noexcept                                                                            \
    {                                                                                                             \
      return detail::ENUM_TYPE##Names[std::to_underlying(value)];                                                 \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::optional<ENUM_TYPE>                                                                     \
    FromString(std::string_view str) noexcept                                                                     \
    {                                                                                                             \
      auto index = 0;                                                                                             \
      for (const auto &n : detail::ENUM_TYPE##Names) {                                                            \
        if (n == str)                                                                                             \
          return detail::ENUM_TYPE##Ids[index];                                                                   \
        ++index;                                                                                                  \
      }                                                                                                           \
      return {};                                                                                                  \
    }                                                                                                             \
  };                                                                                                              \
  ENUM_FMT(ENUM_TYPE, FOR_EACH, EACH_FN);
