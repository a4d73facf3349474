/** LICENSE TEMPLATE */
#include "logger.h"

// bidpop
#include <configuration/config.h>

// fmt
#include <fmt/format.h>

// stdlib
#include <cstdio>
#include <utility>

namespace bidpop::logging {

Logger *Logger::sLoggerInstance = new Logger{};

/* static */
void
Logger::ConfigureLogging(const cfg::PopulateConfiguration &config) noexcept
{
  for (const auto channel : config.LogChannels()) {
    sLoggerInstance->SetupChannel(config.LogDirectory(), channel);
  }

  if (config.Verbose()) {
    sLoggerInstance->EchoChannel(Channel::files);
    sLoggerInstance->EchoChannel(Channel::warning);
  }
  DBGLOG(core, "logging configured: {} file channel(s), verbose={}", config.LogChannels().size(), config.Verbose());
}

Logger::~Logger() noexcept
{
  for (auto ptr : LogChannels) {
    if (ptr) {
      if (ptr->mFileStream.is_open()) {
        ptr->mFileStream.flush();
        ptr->mFileStream.close();
      }
      delete ptr;
    }
  }
}

LogChannel *
Logger::GetOrCreateChannel(Channel id) noexcept
{
  auto &slot = LogChannels[std::to_underlying(id)];
  if (slot == nullptr) {
    slot = new LogChannel{};
  }
  return slot;
}

void
Logger::SetupChannel(const Path &logDirectory, Channel id) noexcept
{
  auto *channel = GetOrCreateChannel(id);
  if (channel->mFileStream.is_open()) {
    return;
  }
  const Path p = logDirectory / fmt::format("{}.log", id);
  channel->mFileStream.open(p, std::ios_base::out | std::ios_base::trunc);
  if (!channel->mFileStream.is_open()) {
    fmt::print(stderr, "{}: warning: could not open log file {}\n", mProgramName, p.c_str());
  }
}

void
Logger::EchoChannel(Channel id) noexcept
{
  GetOrCreateChannel(id)->mEchoToStandardError = true;
}

void
Logger::SetProgramName(std::string_view programName) noexcept
{
  mProgramName = programName;
}

std::string_view
Logger::ProgramName() const noexcept
{
  return mProgramName;
}

/* static */
Logger *
Logger::GetLogger() noexcept
{
  return Logger::sLoggerInstance;
}

/* static */
u64
Logger::GetLogMessageId() noexcept
{
  return GetLogger()->mSequenceId++;
}

void
Logger::OnAbort() noexcept
{
  for (auto chan : LogChannels) {
    if (chan && chan->mFileStream.is_open()) {
      chan->mFileStream.flush();
      chan->mFileStream.close();
    }
  }
}

LogChannel *
Logger::GetLogChannel(Channel id) noexcept
{
  return LogChannels[std::to_underlying(id)];
}

void
LogChannel::Echo(std::string_view message) noexcept
{
  if (mEchoToStandardError) {
    fmt::print(stderr, "{}: {}\n", Logger::GetLogger()->ProgramName(), message);
  }
}

void
LogChannel::LogMessage(const char *file, u32 line, std::string_view message) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  Echo(message);
  if (!mFileStream.is_open()) {
    return;
  }
  const auto id = Logger::GetLogMessageId();
  mFileStream << '[' << id << "] " << message << fmt::format(" [{}:{}]", file, line) << std::endl;
}

void
LogChannel::Log(std::string_view msg) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  Echo(msg);
  if (mFileStream.is_open()) {
    mFileStream << msg << std::endl;
  }
}

Logger *
GetLogger() noexcept
{
  return Logger::GetLogger();
}

LogChannel *
GetLogChannel(Channel id) noexcept
{
  return GetLogger()->GetLogChannel(id);
}

} // namespace bidpop::logging
