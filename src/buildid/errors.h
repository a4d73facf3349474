/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <common/macros.h>
#include <common/typedefs.h>

// fmt
#include <fmt/format.h>

// stdlib
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#define FOR_EACH_POPULATE_ERROR(MAKE_ERR)                                                                         \
  MAKE_ERR(ArgumentError, "invalid arguments")                                                                    \
  MAKE_ERR(NotFoundError, "no such file or directory")                                                            \
  MAKE_ERR(ReadError, "could not read build-id")                                                                  \
  MAKE_ERR(MissingBuildIdError, "no build-id found")                                                              \
  MAKE_ERR(InvalidBuildIdError, "invalid build-id")                                                               \
  MAKE_ERR(FilesystemError, "filesystem operation failed")

namespace bidpop {

enum class PopulateErrorType : u8
{
  FOR_EACH_POPULATE_ERROR(DEFAULT_ENUM)
};

constexpr std::string_view
ErrorTypeName(PopulateErrorType type) noexcept
{
#define ERROR_NAME(EnumValue, ...)                                                                                \
  case PopulateErrorType::EnumValue:                                                                              \
    return #EnumValue;

  switch (type) {
    FOR_EACH_POPULATE_ERROR(ERROR_NAME)
  }
#undef ERROR_NAME
  BIDPOP_UNREACHABLE
}

constexpr std::string_view
ErrorDescription(PopulateErrorType type) noexcept
{
#define ERROR_MSG(EnumValue, Message, ...)                                                                        \
  case PopulateErrorType::EnumValue:                                                                              \
    return Message;

  switch (type) {
    FOR_EACH_POPULATE_ERROR(ERROR_MSG)
  }
#undef ERROR_MSG
  BIDPOP_UNREACHABLE
}

// An error is always about one path (the debug file directory, or one of the debug files), except for argument
// errors, where mPath is empty.
struct PopulateError
{
  PopulateErrorType mType;
  Path mPath;
  std::string mDetail;

  static PopulateError Argument(std::string detail) noexcept;
  static PopulateError NotFound(Path path) noexcept;
  static PopulateError Read(Path path, std::string detail) noexcept;
  static PopulateError MissingBuildId(Path path) noexcept;
  static PopulateError InvalidBuildId(Path path, std::string_view buildId) noexcept;
  static PopulateError Filesystem(Path path, std::string_view operation, const std::error_code &ec) noexcept;
};

template <typename T> using PopulateResult = std::expected<T, PopulateError>;

} // namespace bidpop

template <> struct fmt::formatter<bidpop::PopulateErrorType> : fmt::formatter<std::string_view>
{
  template <typename FormatContext>
  auto
  format(const bidpop::PopulateErrorType &type, FormatContext &ctx) const
  {
    return fmt::formatter<std::string_view>::format(bidpop::ErrorTypeName(type), ctx);
  }
};

// Renders the one line diagnostic, "<path>: <description>[: <detail>]".
template <> struct fmt::formatter<bidpop::PopulateError>
{
  constexpr auto
  parse(fmt::format_parse_context &ctx)
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto
  format(const bidpop::PopulateError &error, FormatContext &ctx) const
  {
    auto it = ctx.out();
    if (!error.mPath.empty()) {
      it = fmt::format_to(it, "{}: ", error.mPath.native());
    }
    if (error.mType == bidpop::PopulateErrorType::ArgumentError && !error.mDetail.empty()) {
      return fmt::format_to(it, "{}", error.mDetail);
    }
    it = fmt::format_to(it, "{}", bidpop::ErrorDescription(error.mType));
    if (!error.mDetail.empty()) {
      it = fmt::format_to(it, ": {}", error.mDetail);
    }
    return it;
  }
};
