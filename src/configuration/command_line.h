/** LICENSE TEMPLATE */
#pragma once

// bidpop
#include <common.h>
#include <common/typedefs.h>
#include <utils/help_message.h>
// fmt
#include <fmt/format.h>
#include <fmt/ranges.h>
// std
#include <charconv>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

using namespace std::string_view_literals;

namespace bidpop::cfg {

#define FOR_CLI_EACH_PARSE_ERROR(MAKE_ERR)                                                                        \
  MAKE_ERR(MissingArgValue, "Command line option is missing its value.")                                          \
  MAKE_ERR(InvalidFormat, "Invalid format of argument.")                                                          \
  MAKE_ERR(UnrecognizedArgument, "Argument is not a recognized option.")                                          \
  MAKE_ERR(DirectoryDoesNotExist, "Directory does not exist.")

enum class ParseErrorType : u8
{
  FOR_CLI_EACH_PARSE_ERROR(DEFAULT_ENUM)
};

struct ParseOk
{
};

struct ParserError
{
  ParseErrorType mError;
  std::vector<std::string> mInputs;
};

template <typename T> using ParseResult = std::expected<T, ParserError>;

class ArgIterator
{
public:
  constexpr ArgIterator(int argc, const char **argv) : mArgCount(argc), mArgs(argv) {}

  bool
  HasNext() const noexcept
  {
    return mIndex < mArgCount || mInsideInlineArgument.has_value();
  }

  // Called at the start of each parse pass of CommandLineRegistry::Parse, which may consume 0 or N arguments from
  // the argument vector. Prior to it, it should always be checked HasNext()
  std::string_view
  BeginNext() noexcept
  {
    RememberPosition();
    return *GetNext();
  }

  // Long options may carry their value inline, "--foo=bar". Only arguments starting with "--" are split, so that
  // file names containing '=' pass through untouched.
  std::optional<std::string_view>
  GetNext() noexcept
  {
    if (mInsideInlineArgument) {
      std::string_view value = mArgs[mIndex];
      value.remove_prefix(mInsideInlineArgument.value());
      mInsideInlineArgument = {};
      ++mIndex;
      return value;
    }

    if (mIndex >= mArgCount) {
      return std::nullopt;
    }
    std::string_view value = mArgs[mIndex];
    if (const auto inlineValuePos = value.find_first_of('=');
        value.starts_with("--") && inlineValuePos != value.npos) {
      mInsideInlineArgument = inlineValuePos + 1;
      return value.substr(0, inlineValuePos);
    }
    ++mIndex;
    return value;
  }

  // True while an inline "--foo=bar" value is pending. A flag that leaves one unconsumed is a format error.
  bool
  HasPendingInlineValue() const noexcept
  {
    return mInsideInlineArgument.has_value();
  }

  void
  SkipPendingInlineValue() noexcept
  {
    if (mInsideInlineArgument) {
      mInsideInlineArgument = {};
      ++mIndex;
    }
  }

  std::span<const char *>
  Args() const noexcept
  {
    return std::span{ mArgs, mArgs + mArgCount };
  }

  std::unexpected<ParserError>
  Error(ParseErrorType type) noexcept
  {
    return std::unexpected(ParserError{ type, GetArgsCurrentlyBeingParsed() });
  }

private:
  std::vector<std::string>
  GetArgsCurrentlyBeingParsed()
  {
    // always take the "current one" too, which may only have been partially parsed (due to inline values via
    // --foo=bar)
    const auto end = std::min(mArgCount, mIndex + (mInsideInlineArgument ? 1 : 0));
    std::vector<std::string> result;
    for (const auto *arg : Args().subspan(mRememberedIndex, std::max(end - mRememberedIndex, 0))) {
      result.emplace_back(arg);
    }
    return result;
  }

  // Set before being passed to a parser function, so that the particular parser function does not have to
  // remember how many arguments it has consumed.
  void
  RememberPosition() noexcept
  {
    mRememberedIndex = mIndex;
  }

  int mArgCount;
  const char **mArgs;
  int mIndex{ 1 };
  std::optional<size_t> mInsideInlineArgument{};
  int mRememberedIndex{ 0 };
};

#ifndef TryExpected
#define TryExpected(iterator)                                                                                     \
  ({                                                                                                              \
    auto ___MAYBE_VALUE___ = iterator.GetNext();                                                                  \
    if (!___MAYBE_VALUE___) {                                                                                     \
      return iterator.Error(ParseErrorType::MissingArgValue);                                                     \
    }                                                                                                             \
    *___MAYBE_VALUE___;                                                                                           \
  })
#endif

struct OptionMetadata
{
  std::string mShortName;
  std::string mLongName;
  HelpMessage mInfo;
  // Flags don't take a value; they are the only options that can be combined, as in "-kv".
  bool mIsFlag;
};

template <typename ParseInput> struct IOption : OptionMetadata
{
  using Input = ParseInput;
  virtual ParseResult<ParseOk> Parse(ParseInput it) noexcept = 0;
  virtual void ApplyDefault() noexcept = 0;
  virtual ~IOption() noexcept = default;
};

// An option that writes its parsed value into a variable owned by the caller of CommandLineRegistry::Add*. Several
// options may write the same variable (e.g. --copy and --move), the last one parsed wins.
template <typename T, typename ParseInput> class DirectOption final : public IOption<ParseInput>
{
  using Data = OptionMetadata;
  using IBase = IOption<ParseInput>;

public:
  using ParserFn = ParseResult<T> (*)(typename IBase::Input);

  DirectOption(std::string_view shortName,
    std::string_view longName,
    HelpMessage helpMessage,
    bool isFlag,
    T &reference,
    ParserFn parser,
    T defaultValue)
      : mReference(&reference), mParseFn(parser), mDefault(std::move(defaultValue))
  {
    Data::mShortName = shortName;
    Data::mLongName = longName;
    Data::mInfo = helpMessage;
    Data::mIsFlag = isFlag;
  }

  ParseResult<ParseOk>
  Parse(ParseInput it) noexcept final
  {
    auto result = mParseFn(it);
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }
    *mReference = std::move(result.value());
    return ParseOk{};
  }

  void
  ApplyDefault() noexcept final
  {
    *mReference = mDefault;
  }

private:
  T *mReference;
  ParserFn mParseFn;
  T mDefault;
};

struct CommandLineResult
{
  std::vector<ParserError> mErrors;
  // Arguments that are not options, in the order given. Everything after "--" is positional.
  std::vector<std::string_view> mPositional;
  // Environment variables whose value did not parse. They keep their default, and are only worth a warning.
  std::vector<ParserError> mEnvironmentErrors;
};

class CommandLineRegistry
{
  static constexpr auto UNIFORM_LINE_INDENT = 2;
  using ArgOption = IOption<ArgIterator &>;
  using EnvOption = IOption<std::string_view>;

  std::string mProgramName;
  std::string mPositionalSynopsis;
  std::unordered_map<std::string_view, std::shared_ptr<ArgOption>> mOptions;
  std::unordered_map<std::string_view, std::shared_ptr<EnvOption>> mEnvironmentVariables;
  // Registration order, which is also the order help is printed in.
  std::vector<std::shared_ptr<ArgOption>> mOptionOrder;
  std::vector<std::shared_ptr<EnvOption>> mEnvironmentVariableOrder;
  // Holds the length of the largest left-column when displaying using PrintHelp
  // so the left column contains "-c, --com <value>" for an option that has both long and short form and is not a
  // flag. By calculating max width, we can format "properly", when we can't access a terminal size.
  size_t mLeftColumnDisplayWidth{ 0 };
  bool mParseCompleted{ false };

  void
  AssertUnique(std::string_view shortName, std::string_view longName) noexcept
  {
    VERIFY(!shortName.empty() || !longName.empty(), "You've not given this option a name!");
    if (!longName.empty()) {
      VERIFY(mOptions.count(longName) == 0, "Already added option {}", longName);
    }

    if (!shortName.empty()) {
      VERIFY(mOptions.count(shortName) == 0, "Already added option {}", shortName);
    }
  }

  void
  UpdateLeftColumnWidth(bool isFlag, std::string_view shortName, std::string_view longName) noexcept
  {
    const auto leftColumnWidth = shortName.size() + (shortName.empty() ? 0 : ", "sv.size()) + longName.size() +
                                 (isFlag ? 0 : kValuePlaceHolder.size()) + UNIFORM_LINE_INDENT;

    mLeftColumnDisplayWidth = std::max(mLeftColumnDisplayWidth, leftColumnWidth);
  }

  void
  AddArgOption(std::string_view shortName, std::string_view longName, std::shared_ptr<ArgOption> &&item) noexcept
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    AssertUnique(shortName, longName);
    // Key by the option's own strings, they live as long as the option does.
    if (!item->mShortName.empty()) {
      mOptions.emplace(item->mShortName, item);
    }

    if (!item->mLongName.empty()) {
      mOptions.emplace(item->mLongName, item);
    }
    mOptionOrder.push_back(std::move(item));
  }

  // Parses a run of single character flags, "-kCv". Returns false if this isn't such a run.
  bool ParseFlagCluster(std::string_view argument, ArgIterator &it, CommandLineResult &result) noexcept;

public:
  static constexpr auto kValuePlaceHolder = " <value> "sv;

  CommandLineRegistry(std::string_view programName, std::string_view positionalSynopsis) noexcept
      : mProgramName(programName), mPositionalSynopsis(positionalSynopsis)
  {
  }

  std::span<const std::shared_ptr<ArgOption>>
  GetOptions() const noexcept
  {
    return mOptionOrder;
  }

  std::span<const std::shared_ptr<EnvOption>>
  GetEnvironmentVariableOptions() const noexcept
  {
    return mEnvironmentVariableOrder;
  }

  template <typename T, typename ConvertibleToT>
  void
  AddFlag(std::string_view shortName,
    std::string_view longName,
    HelpMessage message,
    T &variable,
    typename DirectOption<T, ArgIterator &>::ParserFn parser,
    ConvertibleToT defaultVal) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    UpdateLeftColumnWidth(/* isFlag */ true, shortName, longName);
    AddArgOption(shortName,
      longName,
      std::make_shared<DirectOption<T, ArgIterator &>>(
        shortName, longName, message, true, variable, parser, T{ std::move(defaultVal) }));
  }

  template <typename T, typename ConvertibleToT>
  void
  AddOption(std::string_view shortName,
    std::string_view longName,
    HelpMessage message,
    T &variable,
    typename DirectOption<T, ArgIterator &>::ParserFn parser,
    ConvertibleToT defaultVal) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    UpdateLeftColumnWidth(/* isFlag */ false, shortName, longName);
    AddArgOption(shortName,
      longName,
      std::make_shared<DirectOption<T, ArgIterator &>>(
        shortName, longName, message, false, variable, parser, T{ std::move(defaultVal) }));
  }

  template <typename T, typename ConvertibleToT = T>
  void
  AddEnvironmentVariable(std::string_view name,
    HelpMessage message,
    T &variable,
    typename DirectOption<T, std::string_view>::ParserFn parser,
    ConvertibleToT defaultVal = T{}) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    VERIFY(mEnvironmentVariables.count(name) == 0, "Environment variable option already configured.");
    UpdateLeftColumnWidth(/* isFlag */ false, "", name);

    auto opt = std::make_shared<DirectOption<T, std::string_view>>(
      "", name, message, false, variable, parser, T{ std::move(defaultVal) });
    mEnvironmentVariables.emplace(opt->mLongName, opt);
    mEnvironmentVariableOrder.push_back(std::move(opt));
  }

  CommandLineResult Parse(int argc, const char **argv) noexcept;
  // A variable whose value doesn't parse keeps its default. The failures are returned, first input being the name.
  std::vector<ParserError> ParseEnvironmentVariableOptions() noexcept;

  std::string Usage() const noexcept;
  std::string HelpText(u16 leftColumn, u16 rightColumn) const noexcept;
  void PrintHelp() const noexcept;
  std::pair<u16, u16> GetTerminalSize() const noexcept;
};

} // namespace bidpop::cfg

template <> struct fmt::formatter<bidpop::cfg::ParseErrorType> : fmt::formatter<std::string_view>
{
  template <typename FormatContext>
  auto
  format(const bidpop::cfg::ParseErrorType &option, FormatContext &context) const
  {
#define PARSE_ERROR_MSG(EnumValue, Message, ...)                                                                  \
  case bidpop::cfg::ParseErrorType::EnumValue:                                                                    \
    return fmt::formatter<std::string_view>::format(Message, context);

    switch (option) {
      FOR_CLI_EACH_PARSE_ERROR(PARSE_ERROR_MSG)
    }
#undef PARSE_ERROR_MSG
    BIDPOP_UNREACHABLE
  }
};

template <typename T> struct UsagePrintFormatting
{
  using Type = T;
  const T &mValue;
  const std::uint16_t mLeftColumnWidth{ 20 };
  const std::uint16_t mRightColumnWidth{ 80 };
};

template <> struct fmt::formatter<UsagePrintFormatting<bidpop::cfg::OptionMetadata>>
{
  constexpr auto
  parse(fmt::format_parse_context &ctx)
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto
  format(const UsagePrintFormatting<bidpop::cfg::OptionMetadata> &option, FormatContext &context) const
  {
    i64 columnSpaceLeft = option.mLeftColumnWidth;
    auto it = fmt::format_to(context.out(), "  ");
    columnSpaceLeft -= 2;
    const auto &opt = option.mValue;

    if (!opt.mShortName.empty()) {
      it = fmt::format_to(it, "{}, ", opt.mShortName);
      columnSpaceLeft -= static_cast<i64>(opt.mShortName.size() + 2);
    }

    if (!opt.mLongName.empty()) {
      columnSpaceLeft -= static_cast<i64>(opt.mLongName.size());
      it = fmt::format_to(it, "{}", opt.mLongName);
    }

    if (!opt.mIsFlag) {
      columnSpaceLeft -= static_cast<i64>(bidpop::cfg::CommandLineRegistry::kValuePlaceHolder.size());
      it = fmt::format_to(it, "{}", bidpop::cfg::CommandLineRegistry::kValuePlaceHolder);
    }
    it = fmt::format_to(it, "{:<{}}", "", std::max<i64>(columnSpaceLeft, 1));

    const auto lines = opt.mInfo.CreateLinesOfWidth(option.mRightColumnWidth);
    const auto span = std::span{ lines };
    for (const auto &line : span.subspan(0, std::min<size_t>(1, span.size()))) {
      it = fmt::format_to(it, "{}\n", line);
    }

    for (const auto &line : span.subspan(std::min<size_t>(1, span.size()))) {
      it = fmt::format_to(it, "{:<{}}{}\n", "", option.mLeftColumnWidth, line);
    }
    return it;
  }
};

template <> struct fmt::formatter<bidpop::cfg::ParserError>
{
  constexpr auto
  parse(fmt::format_parse_context &ctx)
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto
  format(const bidpop::cfg::ParserError &error, FormatContext &ctx) const
  {
    auto it = fmt::format_to(ctx.out(), "{}", error.mError);
    if (!error.mInputs.empty()) {
      it = fmt::format_to(it, " '{}'", fmt::join(error.mInputs, " "));
    }
    return it;
  }
};

#undef FOR_CLI_EACH_PARSE_ERROR
