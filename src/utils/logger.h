/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <common/macros.h>
#include <common/typedefs.h>
#include <utils/log_channel.h>

// fmt
#include <fmt/format.h>

// stdlib
#include <array>
#include <atomic>
#include <fstream>
#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

namespace bidpop::cfg {
class PopulateConfiguration;
}

namespace bidpop::logging {

struct LogChannel
{
  std::mutex mChannelMutex;
  std::fstream mFileStream;
  // When set, every message is also written to stderr, prefixed with the program name. This is what `--verbose`
  // turns on for the `files` channel.
  bool mEchoToStandardError{ false };

  void LogMessage(const char *file, u32 line, std::string_view message) noexcept;
  void Log(std::string_view msg) noexcept;

private:
  void Echo(std::string_view message) noexcept;
};

class Logger
{
  static Logger *sLoggerInstance;
  std::atomic<u64> mSequenceId{ 0 };
  std::string mProgramName{ "bidpop" };

public:
  Logger() noexcept = default;
  ~Logger() noexcept;

  NO_COPY(Logger);

  // Opens (truncating) `<logDirectory>/<channel>.log`. A file that can't be opened is skipped, logging never
  // terminates the program.
  void SetupChannel(const Path &logDirectory, Channel id) noexcept;
  void EchoChannel(Channel id) noexcept;
  void SetProgramName(std::string_view programName) noexcept;
  std::string_view ProgramName() const noexcept;

  static Logger *GetLogger() noexcept;
  static u64 GetLogMessageId() noexcept;

  void OnAbort() noexcept;
  LogChannel *GetLogChannel(Channel id) noexcept;

  static void
  LogIf(Channel id, std::string_view message) noexcept
  {
    if (auto *channel = GetLogger()->GetLogChannel(id); channel) {
      channel->Log(message);
    }
  }

  static void ConfigureLogging(const bidpop::cfg::PopulateConfiguration &config) noexcept;

private:
  LogChannel *GetOrCreateChannel(Channel id) noexcept;
  std::array<LogChannel *, Enum<Channel>::Count()> LogChannels{};
};

Logger *GetLogger() noexcept;
LogChannel *GetLogChannel(Channel id) noexcept;

#define DBGLOG(channel, ...)                                                                                      \
  if (auto channel = bidpop::logging::GetLogChannel(Channel::channel); channel) {                                 \
    std::source_location srcLoc = std::source_location::current();                                                \
    channel->LogMessage(srcLoc.file_name(), srcLoc.line(), ::fmt::format(__VA_ARGS__));                           \
  }

} // namespace bidpop::logging
