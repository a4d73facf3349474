/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <buildid/build_id.h>
#include <buildid/errors.h>
#include <buildid/materialize_mode.h>
#include <buildid/reader.h>
#include <common/macros.h>
#include <common/typedefs.h>

// stdlib
#include <span>

namespace bidpop {

namespace cfg {
class PopulateConfiguration;
}

// A debug file that has been inspected and is ready to be placed.
struct DebugFile
{
  // As given on the command line
  Path mInputPath;
  // fs::absolute of the input path. Symbolic links in it are kept, the file is not canonicalized.
  Path mAbsolutePath;
  BuildId mBuildId;
};

/**
 * Lays out debug files under `<root>/.build-id/<prefix>/<suffix>.debug`.
 *
 * Every debug file is resolved before the first filesystem write, so a missing file or an unreadable build-id
 * leaves the tree untouched. Once writing has started the first failure ends the run, and what was written until
 * then stays.
 */
class BuildIdPopulator
{
  BuildIdReader &mReader;

  PopulateResult<void> Materialize(const DebugFile &file, const Path &root, MaterializeMode mode) noexcept;

public:
  explicit BuildIdPopulator(BuildIdReader &reader) noexcept;
  NO_COPY(BuildIdPopulator);

  PopulateResult<DebugFile> ResolveBuildId(const Path &file) noexcept;

  PopulateResult<void> Populate(
    const Path &root, std::span<const Path> files, MaterializeMode mode, bool clean) noexcept;
  PopulateResult<void> Populate(const cfg::PopulateConfiguration &config) noexcept;
};

} // namespace bidpop
