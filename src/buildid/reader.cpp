/** LICENSE TEMPLATE */
#include "reader.h"

// bidpop
#include <common.h>
#include <posix/argslist.h>
#include <posix/subprocess.h>
#include <utils/logger.h>
#include <utils/util.h>

// stdlib
#include <cstring>
#include <vector>

namespace bidpop {

std::optional<std::string_view>
FindBuildIdToken(std::string_view output) noexcept
{
  for (const auto line : SplitString(output, '\n')) {
    const auto markerPosition = line.find(kBuildIdMarker);
    if (markerPosition == std::string_view::npos) {
      continue;
    }
    const auto afterMarker = TrimLeadingWhitespace(line.substr(markerPosition + kBuildIdMarker.size()));
    size_t tokenLength = 0;
    while (tokenLength < afterMarker.size() && IsHexDigit(afterMarker[tokenLength])) {
      ++tokenLength;
    }
    if (tokenLength > 0) {
      return afterMarker.substr(0, tokenLength);
    }
    DBGLOG(warning, "ignoring build-id line without a hexadecimal token: '{}'", line);
  }
  return std::nullopt;
}

ReadElfBuildIdReader::ReadElfBuildIdReader(std::string program) noexcept : mProgram(std::move(program)) {}

std::string_view
ReadElfBuildIdReader::Program() const noexcept
{
  return mProgram;
}

PopulateResult<BuildId>
ReadElfBuildIdReader::ReadBuildId(const Path &file) noexcept
{
  posix::PosixArgsList args{ std::vector<std::string>{ mProgram, "-n", file.native() } };
  auto process = posix::CaptureStandardOutput(args);
  if (!process) {
    const auto &error = process.error();
    return std::unexpected(PopulateError::Read(
      file, fmt::format("{} ({}): {}", mProgram, error.mOperation, std::strerror(error.mErrno))));
  }

  if (process->mTerminatingSignal) {
    return std::unexpected(PopulateError::Read(
      file, fmt::format("{} terminated by signal {}", mProgram, *process->mTerminatingSignal)));
  }

  if (!process->Succeeded()) {
    return std::unexpected(PopulateError::Read(
      file, fmt::format("{} exited with status {}", mProgram, process->mExitStatus.value_or(-1))));
  }

  const auto token = FindBuildIdToken(process->mStandardOutput);
  if (!token) {
    DBGLOG(reader,
      "{}: no '{}' line in {} bytes of output",
      file.c_str(),
      kBuildIdMarker,
      process->mStandardOutput.size());
    return std::unexpected(PopulateError::MissingBuildId(file));
  }

  auto buildId = BuildId::Create(*token);
  if (!buildId) {
    return std::unexpected(PopulateError::InvalidBuildId(file, *token));
  }
  DBGLOG(reader, "{}: build-id {}", file.c_str(), buildId->Value());
  return std::move(*buildId);
}

} // namespace bidpop
