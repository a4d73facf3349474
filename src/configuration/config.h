/** LICENSE TEMPLATE */
#pragma once

// bidpop
#include <buildid/errors.h>
#include <buildid/materialize_mode.h>
#include <common.h>
#include <configuration/command_line.h>
#include <utils/log_channel.h>
// std
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bidpop::cfg {

static constexpr std::string_view kPositionalSynopsis = "<debug-file-directory> <debug-files...>";

// The variables the option parsers write into. Only meaningful after CommandLineRegistry::Parse.
struct CommandLineOptions
{
  bool mClean;
  MaterializeMode mMode;
  bool mVerbose;
  bool mShowHelp;
  // --readelf, empty when not given
  std::string mReadElfOption;
  // READELF
  std::string mReadElfEnvironment;
  std::vector<Channel> mLogChannels;
  Path mLogDirectory;
};

void RegisterOptions(CommandLineRegistry &registry, CommandLineOptions &options) noexcept;

/**
 * Everything a run needs, built once from the parsed command line and environment and never changed after that.
 * Construction only allowed via `Create`, which is also where the positional arguments are checked.
 */
class PopulateConfiguration
{
  PopulateConfiguration() noexcept = default;

  Path mDebugFileDirectory;
  std::vector<Path> mDebugFiles;
  MaterializeMode mMode{ MaterializeMode::Link };
  bool mClean{ true };
  bool mVerbose{ false };
  std::string mReadElfProgram;
  std::vector<Channel> mLogChannels;
  Path mLogDirectory;

public:
  static PopulateResult<PopulateConfiguration> Create(
    const CommandLineOptions &options, std::span<const std::string_view> positional) noexcept;

  const Path &DebugFileDirectory() const noexcept;
  std::span<const Path> DebugFiles() const noexcept;
  MaterializeMode Mode() const noexcept;
  bool Clean() const noexcept;
  bool Verbose() const noexcept;
  std::string_view ReadElfProgram() const noexcept;
  std::span<const Channel> LogChannels() const noexcept;
  const Path &LogDirectory() const noexcept;
};
} // namespace bidpop::cfg
