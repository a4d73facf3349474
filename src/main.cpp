/** LICENSE TEMPLATE */
// bidpop
#include <buildid/populator.h>
#include <buildid/reader.h>
#include <configuration/command_line.h>
#include <configuration/config.h>
#include <utils/logger.h>

// fmt
#include <fmt/format.h>

// std
#include <cstdio>
#include <cstdlib>
#include <span>
#include <string>

int
main(int argc, const char **argv)
{
  using bidpop::logging::Logger;
  namespace cfg = bidpop::cfg;

  const std::string programName =
    argc > 0 ? Path{ argv[0] }.filename().string() : std::string{ "bidpop" };
  Logger::GetLogger()->SetProgramName(programName);

  cfg::CommandLineRegistry registry{ programName, cfg::kPositionalSynopsis };
  cfg::CommandLineOptions options{};
  cfg::RegisterOptions(registry, options);

  const auto parsed = registry.Parse(argc, argv);
  if (options.mShowHelp) {
    registry.PrintHelp();
    return EXIT_SUCCESS;
  }

  for (const auto &error : parsed.mEnvironmentErrors) {
    fmt::print(stderr, "{}: warning: ignoring environment variable: {}\n", programName, error);
  }

  if (!parsed.mErrors.empty()) {
    for (const auto &error : parsed.mErrors) {
      fmt::print(stderr, "{}: error: {}\n", programName, error);
    }
    fmt::print(stderr, "{}\n", registry.Usage());
    return EXIT_FAILURE;
  }

  auto config = cfg::PopulateConfiguration::Create(options, parsed.mPositional);
  if (!config) {
    fmt::print(stderr, "{}: error: {}\n{}\n", programName, config.error(), registry.Usage());
    return EXIT_FAILURE;
  }

  Logger::ConfigureLogging(*config);
  std::span<const char *> args(argv, argc);
  DBGLOG(core, "{} CLI Arguments", programName);
  for (const auto arg : args.subspan(1)) {
    DBGLOG(core, "{}", arg);
  }

  bidpop::ReadElfBuildIdReader reader{ std::string{ config->ReadElfProgram() } };
  bidpop::BuildIdPopulator populator{ reader };
  if (auto res = populator.Populate(*config); !res) {
    DBGLOG(core, "failed: {}", res.error());
    fmt::print(stderr, "{}: error: {}\n", programName, res.error());
    return EXIT_FAILURE;
  }

  DBGLOG(core, "Exited...");
  return EXIT_SUCCESS;
}
