/** LICENSE TEMPLATE */
#include "command_line.h"

// bidpop
#include <common.h>

// fmt
#include <fmt/format.h>

// std
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iterator>

// system
#include <sys/ioctl.h>
#include <unistd.h>

namespace bidpop::cfg {

bool
CommandLineRegistry::ParseFlagCluster(std::string_view argument, ArgIterator &it, CommandLineResult &result) noexcept
{
  if (argument.size() < 3 || argument.starts_with("--")) {
    return false;
  }

  // Every character must name a flag before any of them is applied, so "-kx" is reported as a whole.
  std::vector<std::shared_ptr<ArgOption>> flags;
  flags.reserve(argument.size() - 1);
  for (const char c : argument.substr(1)) {
    const char name[2] = { '-', c };
    const auto optionIter = mOptions.find(std::string_view{ name, 2 });
    if (optionIter == std::end(mOptions) || !optionIter->second->mIsFlag) {
      return false;
    }
    flags.push_back(optionIter->second);
  }

  for (auto &flag : flags) {
    if (auto res = flag->Parse(it); !res) {
      result.mErrors.push_back(std::move(res.error()));
    }
  }
  return true;
}

CommandLineResult
CommandLineRegistry::Parse(int argc, const char **argv) noexcept
{
  CommandLineResult result{};

  for (auto &opt : GetOptions()) {
    opt->ApplyDefault();
  }
  ArgIterator it(argc, argv);
  bool endOfOptions = false;
  while (it.HasNext()) {
    auto current = it.BeginNext();

    // A lone "-" conventionally means stdin/stdout, here it's just a (strangely named) file.
    if (endOfOptions || current == "-" || !current.starts_with('-')) {
      result.mPositional.push_back(current);
      continue;
    }

    if (current == "--") {
      endOfOptions = true;
      continue;
    }

    if (auto optionIter = mOptions.find(current); optionIter != std::end(mOptions)) {
      const auto &option = optionIter->second;
      if (auto res = option->Parse(it); !res) {
        result.mErrors.push_back(std::move(res.error()));
      }
      if (it.HasPendingInlineValue()) {
        // --keep=yes; flags don't take values.
        result.mErrors.push_back(it.Error(ParseErrorType::InvalidFormat).error());
        it.SkipPendingInlineValue();
      }
      continue;
    }

    if (ParseFlagCluster(current, it, result)) {
      continue;
    }

    result.mErrors.push_back(it.Error(ParseErrorType::UnrecognizedArgument).error());
    it.SkipPendingInlineValue();
  }
  mParseCompleted = true;

  result.mEnvironmentErrors = ParseEnvironmentVariableOptions();
  return result;
}

std::vector<ParserError>
CommandLineRegistry::ParseEnvironmentVariableOptions() noexcept
{
  std::vector<ParserError> errors;
  for (auto &opt : GetEnvironmentVariableOptions()) {
    opt->ApplyDefault();
  }

  for (const auto &opt : GetEnvironmentVariableOptions()) {
    if (const auto *value = std::getenv(opt->mLongName.c_str()); value) {
      if (auto res = opt->Parse(std::string_view{ value }); !res) {
        auto error = std::move(res.error());
        error.mInputs.insert(error.mInputs.begin(), opt->mLongName);
        errors.push_back(std::move(error));
        // Whatever the failed parse did, the variable must end up with its default.
        opt->ApplyDefault();
      }
    }
  }
  return errors;
}

std::pair<u16, u16>
CommandLineRegistry::GetTerminalSize() const noexcept
{
  struct winsize terminalSize;
  const auto leftColumnMinimum = static_cast<u16>(mLeftColumnDisplayWidth + 2);

  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &terminalSize) == 0 && terminalSize.ws_col > leftColumnMinimum + 20) {
    auto leftColumnWidth = static_cast<u16>(terminalSize.ws_col * 0.25);
    if (leftColumnWidth <= mLeftColumnDisplayWidth) {
      leftColumnWidth = leftColumnMinimum;
    } else {
      // Don't waste space, give the left column at most 4 characters of trailing white space after it.
      leftColumnWidth = std::min<u16>(leftColumnWidth, mLeftColumnDisplayWidth + 4);
    }
    const auto rightColumnWidth = static_cast<u16>(terminalSize.ws_col - leftColumnWidth);
    return std::pair<u16, u16>{ leftColumnWidth, rightColumnWidth };
  }
  // Not a terminal (piped, redirected), or a silly narrow one.
  return std::pair<u16, u16>{ leftColumnMinimum, static_cast<u16>(std::max<int>(80 - leftColumnMinimum, 40)) };
}

std::string
CommandLineRegistry::Usage() const noexcept
{
  return fmt::format("Usage: {} [options] {}", mProgramName, mPositionalSynopsis);
}

std::string
CommandLineRegistry::HelpText(u16 leftColumn, u16 rightColumn) const noexcept
{
  std::string text;
  auto out = std::back_inserter(text);
  fmt::format_to(out, "{}\n\nOptions:\n", Usage());
  for (const auto &option : GetOptions()) {
    fmt::format_to(out, "{}", UsagePrintFormatting<OptionMetadata>{ *option, leftColumn, rightColumn });
  }

  if (!mEnvironmentVariableOrder.empty()) {
    fmt::format_to(out, "\nEnvironment variables:\n");
    for (const auto &envVar : GetEnvironmentVariableOptions()) {
      fmt::format_to(out, "{}", UsagePrintFormatting<OptionMetadata>{ *envVar, leftColumn, rightColumn });
    }
  }
  return text;
}

void
CommandLineRegistry::PrintHelp() const noexcept
{
  const auto [leftColumn, rightColumn] = GetTerminalSize();
  fmt::print("{}", HelpText(leftColumn, rightColumn));
}

} // namespace bidpop::cfg
