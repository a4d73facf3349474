/** LICENSE TEMPLATE */
#include "errors.h"

// bidpop
#include <buildid/build_id.h>

namespace bidpop {

/* static */
PopulateError
PopulateError::Argument(std::string detail) noexcept
{
  return PopulateError{ .mType = PopulateErrorType::ArgumentError, .mPath = {}, .mDetail = std::move(detail) };
}

/* static */
PopulateError
PopulateError::NotFound(Path path) noexcept
{
  return PopulateError{ .mType = PopulateErrorType::NotFoundError, .mPath = std::move(path), .mDetail = {} };
}

/* static */
PopulateError
PopulateError::Read(Path path, std::string detail) noexcept
{
  return PopulateError{ .mType = PopulateErrorType::ReadError, .mPath = std::move(path), .mDetail = std::move(detail) };
}

/* static */
PopulateError
PopulateError::MissingBuildId(Path path) noexcept
{
  return PopulateError{ .mType = PopulateErrorType::MissingBuildIdError, .mPath = std::move(path), .mDetail = {} };
}

/* static */
PopulateError
PopulateError::InvalidBuildId(Path path, std::string_view buildId) noexcept
{
  return PopulateError{ .mType = PopulateErrorType::InvalidBuildIdError,
    .mPath = std::move(path),
    .mDetail = fmt::format("'{}' is shorter than {} characters", buildId, BuildId::kMinimumLength) };
}

/* static */
PopulateError
PopulateError::Filesystem(Path path, std::string_view operation, const std::error_code &ec) noexcept
{
  return PopulateError{ .mType = PopulateErrorType::FilesystemError,
    .mPath = std::move(path),
    .mDetail = fmt::format("{}: {}", operation, ec.message()) };
}

} // namespace bidpop
