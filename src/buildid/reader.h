/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <buildid/build_id.h>
#include <buildid/errors.h>
#include <common/typedefs.h>

// stdlib
#include <optional>
#include <string>
#include <string_view>

namespace bidpop {

// Marker preceding the build-id in the note dump of `readelf -n` (and `eu-readelf -n`).
static constexpr std::string_view kBuildIdMarker = "Build ID:";
static constexpr std::string_view kDefaultReadElfProgram = "readelf";

/**
 * Source of build-ids for debug files. The populator only talks to this interface, so the external process can be
 * swapped for a native ELF note parser, or a test double.
 */
class BuildIdReader
{
public:
  virtual ~BuildIdReader() noexcept = default;

  // Errors: ReadError when the file could not be inspected, MissingBuildIdError when it has no build-id,
  // InvalidBuildIdError when the build-id is shorter than BuildId::kMinimumLength.
  virtual PopulateResult<BuildId> ReadBuildId(const Path &file) noexcept = 0;
};

/**
 * Finds the first line of `output` containing "Build ID:" and returns the hex token following it (after optional
 * blanks). Returns nullopt if no such line exists or no line has a hex token after its marker.
 */
std::optional<std::string_view> FindBuildIdToken(std::string_view output) noexcept;

// Runs `<program> -n <file>` and parses its stdout.
class ReadElfBuildIdReader final : public BuildIdReader
{
  std::string mProgram;

public:
  explicit ReadElfBuildIdReader(std::string program) noexcept;
  ~ReadElfBuildIdReader() noexcept final = default;

  PopulateResult<BuildId> ReadBuildId(const Path &file) noexcept final;

  std::string_view Program() const noexcept;
};

} // namespace bidpop
