/** LICENSE TEMPLATE */
#include "config.h"

// bidpop
#include <buildid/reader.h>
#include <configuration/command_line.h>
#include <utils/logger.h>
#include <utils/util.h>

// std
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace bidpop::cfg {

template <MaterializeMode Mode>
static ParseResult<MaterializeMode>
SelectMode(ArgIterator &) noexcept
{
  return Mode;
}

template <bool Value>
static ParseResult<bool>
SetFlag(ArgIterator &) noexcept
{
  return Value;
}

void
RegisterOptions(CommandLineRegistry &registry, CommandLineOptions &options) noexcept
{
  registry.AddFlag("-k",
    "--keep",
    "Keep the existing .build-id directory, only replacing the entries of the given debug files.",
    options.mClean,
    &SetFlag<false>,
    true);

  registry.AddFlag("-C",
    "--clean",
    "Remove the .build-id directory before populating it. This is the default.",
    options.mClean,
    &SetFlag<true>,
    true);

  registry.AddFlag("-c",
    "--copy",
    "Copy the debug files into place, preserving permissions and modification time.",
    options.mMode,
    &SelectMode<MaterializeMode::Copy>,
    MaterializeMode::Link);

  registry.AddFlag("-m",
    "--move",
    "Move the debug files into place. Falls back to copy and remove across filesystems.",
    options.mMode,
    &SelectMode<MaterializeMode::Move>,
    MaterializeMode::Link);

  registry.AddFlag("-l",
    "--link",
    "Symbolically link the debug files into place. This is the default. Of --copy, --move and --link the last one "
    "given wins.",
    options.mMode,
    &SelectMode<MaterializeMode::Link>,
    MaterializeMode::Link);

  registry.AddFlag("-v",
    "--verbose",
    "Print every directory creation, removal, link, copy and move to standard error.",
    options.mVerbose,
    &SetFlag<true>,
    false);

  registry.AddFlag("-h", "--help", "Print this help and exit.", options.mShowHelp, &SetFlag<true>, false);

  registry.AddOption("",
    "--readelf",
    "The ELF reader to run as `<program> -n <debug-file>`. Overrides READELF.",
    options.mReadElfOption,
    [](ArgIterator &it) noexcept -> ParseResult<std::string> {
      auto arg = TryExpected(it);
      if (arg.empty()) {
        return it.Error(ParseErrorType::InvalidFormat);
      }
      return std::string{ arg };
    },
    "");

  registry.AddEnvironmentVariable<std::string>("READELF",
    "The ELF reader program, `readelf` by default. Anything printing a `Build ID: <hex>` line for `-n` will do, "
    "e.g. eu-readelf.",
    options.mReadElfEnvironment,
    [](std::string_view value) noexcept -> ParseResult<std::string> {
      if (value.empty()) {
        return std::unexpected(ParserError{ ParseErrorType::InvalidFormat, { std::string{ value } } });
      }
      return std::string{ value };
    },
    std::string{ kDefaultReadElfProgram });

#define LOG_HELP(channel, name, help) "\n - " #channel ": " help

  registry.AddEnvironmentVariable<std::vector<Channel>>("LOG",
    "Comma separated list of log channels to write to files, or `all`:" FOR_EACH_LOG(LOG_HELP),
    options.mLogChannels,
    [](std::string_view value) noexcept -> ParseResult<std::vector<Channel>> {
      std::vector<Channel> result{};
      auto splits = SplitString(value, ',');
      if (std::ranges::any_of(splits, [](std::string_view cfg) { return cfg == "all"; })) {
        auto channels = Enum<Channel>::Variants();
        CopyTo(channels, result);
        return result;
      }

      result.reserve(splits.size());
      for (const auto &el : splits) {
        if (const auto chan = Enum<Channel>::FromString(el); chan) {
          result.push_back(*chan);
        }
      }
      return result;
    });

#undef LOG_HELP

  registry.AddEnvironmentVariable<Path>("LOG_DIR",
    "Directory the log files are written to, the current directory by default. It is not created for you.",
    options.mLogDirectory,
    [](std::string_view value) noexcept -> ParseResult<Path> {
      std::error_code ec;
      if (!value.empty() && fs::is_directory(Path{ value }, ec)) {
        return Path{ value };
      }
      return std::unexpected(ParserError{ ParseErrorType::DirectoryDoesNotExist, { std::string{ value } } });
    },
    ".");
}

/* static */
PopulateResult<PopulateConfiguration>
PopulateConfiguration::Create(const CommandLineOptions &options, std::span<const std::string_view> positional) noexcept
{
  if (positional.empty()) {
    return std::unexpected(PopulateError::Argument("missing debug-file-directory"));
  }
  if (positional.size() < 2) {
    return std::unexpected(PopulateError::Argument("no debug files given"));
  }

  PopulateConfiguration config{};
  config.mDebugFileDirectory = positional.front();
  config.mDebugFiles.reserve(positional.size() - 1);
  for (const auto file : positional.subspan(1)) {
    config.mDebugFiles.emplace_back(file);
  }
  config.mMode = options.mMode;
  config.mClean = options.mClean;
  config.mVerbose = options.mVerbose;
  config.mReadElfProgram = options.mReadElfOption.empty() ? options.mReadElfEnvironment : options.mReadElfOption;
  config.mLogChannels = options.mLogChannels;
  config.mLogDirectory = options.mLogDirectory;
  return config;
}

const Path &
PopulateConfiguration::DebugFileDirectory() const noexcept
{
  return mDebugFileDirectory;
}

std::span<const Path>
PopulateConfiguration::DebugFiles() const noexcept
{
  return mDebugFiles;
}

MaterializeMode
PopulateConfiguration::Mode() const noexcept
{
  return mMode;
}

bool
PopulateConfiguration::Clean() const noexcept
{
  return mClean;
}

bool
PopulateConfiguration::Verbose() const noexcept
{
  return mVerbose;
}

std::string_view
PopulateConfiguration::ReadElfProgram() const noexcept
{
  return mReadElfProgram;
}

std::span<const Channel>
PopulateConfiguration::LogChannels() const noexcept
{
  return mLogChannels;
}

const Path &
PopulateConfiguration::LogDirectory() const noexcept
{
  return mLogDirectory;
}

} // namespace bidpop::cfg
