/** LICENSE TEMPLATE */
#include "populator.h"

// bidpop
#include <common.h>
#include <configuration/config.h>
#include <utils/logger.h>

// stdlib
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace bidpop {

// Contents, permission bits and modification time.
static PopulateResult<void>
CopyDebugFile(const Path &source, const Path &target) noexcept
{
  std::error_code ec;
  fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(target, "copy", ec));
  }

  const auto sourceStatus = fs::status(source, ec);
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(source, "stat", ec));
  }
  fs::permissions(target, sourceStatus.permissions(), fs::perm_options::replace, ec);
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(target, "set permissions", ec));
  }

  const auto modified = fs::last_write_time(source, ec);
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(source, "stat", ec));
  }
  fs::last_write_time(target, modified, ec);
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(target, "set modification time", ec));
  }
  return {};
}

BuildIdPopulator::BuildIdPopulator(BuildIdReader &reader) noexcept : mReader(reader) {}

PopulateResult<DebugFile>
BuildIdPopulator::ResolveBuildId(const Path &file) noexcept
{
  std::error_code ec;
  const bool exists = fs::exists(file, ec);
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(file, "stat", ec));
  }
  if (!exists) {
    return std::unexpected(PopulateError::NotFound(file));
  }

  auto buildId = mReader.ReadBuildId(file);
  if (!buildId) {
    return std::unexpected(std::move(buildId.error()));
  }

  auto absolutePath = fs::absolute(file, ec);
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(file, "resolve absolute path", ec));
  }
  return DebugFile{ .mInputPath = file, .mAbsolutePath = std::move(absolutePath), .mBuildId = std::move(*buildId) };
}

PopulateResult<void>
BuildIdPopulator::Materialize(const DebugFile &file, const Path &root, MaterializeMode mode) noexcept
{
  const auto prefixDirectory = file.mBuildId.PrefixDirectory(root);
  const auto target = file.mBuildId.DebugFilePath(root);

  std::error_code ec;
  if (fs::create_directory(prefixDirectory, ec)) {
    DBGLOG(files, "mkdir {}", prefixDirectory.c_str());
  }
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(prefixDirectory, "create directory", ec));
  }

  // The input may have gone since it was resolved, e.g. moved into place already by the same file given twice.
  // Replacing the target now would leave nothing.
  const auto sourceStatus = fs::status(file.mAbsolutePath, ec);
  if (sourceStatus.type() == fs::file_type::not_found) {
    return std::unexpected(PopulateError::NotFound(file.mInputPath));
  }
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(file.mInputPath, "stat", ec));
  }

  // symlink_status, so that a dangling link counts as an existing target. A target that isn't there yet is the
  // common case, not an error.
  const auto targetStatus = fs::symlink_status(target, ec);
  if (ec && targetStatus.type() != fs::file_type::not_found) {
    return std::unexpected(PopulateError::Filesystem(target, "stat", ec));
  }
  ec.clear();

  if (fs::exists(targetStatus)) {
    // Removing the target would destroy the input (e.g. `bidpop -c dir dir/.build-id/ab/cdef.debug`).
    if (!fs::is_symlink(targetStatus) && fs::equivalent(file.mAbsolutePath, target, ec)) {
      DBGLOG(warning, "{} already is {}, leaving it as is", file.mInputPath.c_str(), target.c_str());
      return {};
    }
    fs::remove(target, ec);
    if (ec) {
      return std::unexpected(PopulateError::Filesystem(target, "remove", ec));
    }
    DBGLOG(files, "rm {}", target.c_str());
  }

  switch (mode) {
  case MaterializeMode::Link:
    fs::create_symlink(file.mAbsolutePath, target, ec);
    if (ec) {
      return std::unexpected(PopulateError::Filesystem(target, "create symbolic link", ec));
    }
    DBGLOG(files, "ln -s {} {}", file.mAbsolutePath.c_str(), target.c_str());
    return {};
  case MaterializeMode::Copy:
    if (auto res = CopyDebugFile(file.mAbsolutePath, target); !res) {
      return res;
    }
    DBGLOG(files, "cp {} {}", file.mAbsolutePath.c_str(), target.c_str());
    return {};
  case MaterializeMode::Move:
    fs::rename(file.mAbsolutePath, target, ec);
    if (ec == std::errc::cross_device_link) {
      DBGLOG(files, "{} and {} are on different filesystems, copying", file.mAbsolutePath.c_str(), target.c_str());
      if (auto res = CopyDebugFile(file.mAbsolutePath, target); !res) {
        return res;
      }
      fs::remove(file.mAbsolutePath, ec);
      if (ec) {
        return std::unexpected(PopulateError::Filesystem(file.mAbsolutePath, "remove", ec));
      }
    } else if (ec) {
      return std::unexpected(PopulateError::Filesystem(target, "move", ec));
    }
    DBGLOG(files, "mv {} {}", file.mAbsolutePath.c_str(), target.c_str());
    return {};
  }
  PANIC(fmt::format("Unknown materialize mode {}", std::to_underlying(mode)));
}

PopulateResult<void>
BuildIdPopulator::Populate(const Path &root, std::span<const Path> files, MaterializeMode mode, bool clean) noexcept
{
  std::error_code ec;
  const auto rootStatus = fs::status(root, ec);
  if (rootStatus.type() == fs::file_type::not_found) {
    return std::unexpected(PopulateError::NotFound(root));
  }
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(root, "stat", ec));
  }
  if (!fs::is_directory(rootStatus)) {
    return std::unexpected(
      PopulateError::Filesystem(root, "open directory", std::make_error_code(std::errc::not_a_directory)));
  }

  std::vector<DebugFile> debugFiles;
  debugFiles.reserve(files.size());
  for (const auto &file : files) {
    auto resolved = ResolveBuildId(file);
    if (!resolved) {
      return std::unexpected(std::move(resolved.error()));
    }
    debugFiles.push_back(std::move(*resolved));
  }

  const auto buildIdDirectory = BuildIdDirectory(root);
  if (clean) {
    const auto removed = fs::remove_all(buildIdDirectory, ec);
    if (ec) {
      return std::unexpected(PopulateError::Filesystem(buildIdDirectory, "remove", ec));
    }
    if (removed > 0) {
      DBGLOG(files, "rm -r {} ({} entries)", buildIdDirectory.c_str(), removed);
    }
  }

  if (fs::create_directories(buildIdDirectory, ec)) {
    DBGLOG(files, "mkdir -p {}", buildIdDirectory.c_str());
  }
  if (ec) {
    return std::unexpected(PopulateError::Filesystem(buildIdDirectory, "create directory", ec));
  }

  for (const auto &debugFile : debugFiles) {
    if (auto res = Materialize(debugFile, root, mode); !res) {
      return res;
    }
  }
  DBGLOG(core, "populated {} with {} debug file(s), mode={}, clean={}", root.c_str(), debugFiles.size(), mode, clean);
  return {};
}

PopulateResult<void>
BuildIdPopulator::Populate(const cfg::PopulateConfiguration &config) noexcept
{
  return Populate(config.DebugFileDirectory(), config.DebugFiles(), config.Mode(), config.Clean());
}

} // namespace bidpop
