#include <algorithm>
#include <buildid/populator.h>
#include <chrono>
#include <configuration/config.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using bidpop::BuildId;
using bidpop::BuildIdPopulator;
using bidpop::PopulateError;
using bidpop::PopulateErrorType;
using bidpop::PopulateResult;

// Answers with whatever build-id was scripted for the file name, and remembers what it was asked.
class ScriptedBuildIdReader final : public bidpop::BuildIdReader
{
public:
  std::map<std::string, std::string, std::less<>> mBuildIds;
  std::map<std::string, std::string, std::less<>> mReadErrors;
  std::vector<Path> mReadFiles;

  PopulateResult<BuildId>
  ReadBuildId(const Path &file) noexcept final
  {
    mReadFiles.push_back(file);
    const auto name = file.filename().string();
    if (auto it = mReadErrors.find(name); it != mReadErrors.end()) {
      return std::unexpected(PopulateError::Read(file, it->second));
    }
    auto it = mBuildIds.find(name);
    if (it == mBuildIds.end()) {
      return std::unexpected(PopulateError::MissingBuildId(file));
    }
    auto id = BuildId::Create(it->second);
    if (!id) {
      return std::unexpected(PopulateError::InvalidBuildId(file, it->second));
    }
    return std::move(*id);
  }
};

class PopulatorTest : public ::testing::Test
{
protected:
  void
  SetUp() override
  {
    std::string directoryTemplate = (fs::temp_directory_path() / "bidpop-test-XXXXXX").string();
    ASSERT_NE(::mkdtemp(directoryTemplate.data()), nullptr);
    mWorkDirectory = directoryTemplate;
    mRoot = mWorkDirectory / "root";
    mInputs = mWorkDirectory / "inputs";
    fs::create_directory(mRoot);
    fs::create_directory(mInputs);
  }

  void
  TearDown() override
  {
    std::error_code ec;
    fs::remove_all(mWorkDirectory, ec);
  }

  Path
  CreateDebugFile(std::string_view name, std::string_view contents, std::string_view buildId)
  {
    const auto path = mInputs / name;
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    out << contents;
    mReader.mBuildIds.insert_or_assign(std::string{ name }, std::string{ buildId });
    return path;
  }

  static std::string
  ReadFile(const Path &path)
  {
    std::ifstream in{ path, std::ios::binary };
    return std::string{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
  }

  // Every entry under root, relative to root and sorted.
  static std::vector<std::string>
  ListTree(const Path &root)
  {
    std::vector<std::string> entries;
    for (const auto &entry : fs::recursive_directory_iterator{ root }) {
      // lexically, fs::relative would resolve the links we are looking at
      entries.push_back(entry.path().lexically_relative(root).string());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
  }

  Path
  Target(std::string_view buildId) const
  {
    return BuildId::Create(buildId)->DebugFilePath(mRoot);
  }

  Path mWorkDirectory;
  Path mRoot;
  Path mInputs;
  ScriptedBuildIdReader mReader;
};

TEST_F(PopulatorTest, LinkCreatesSymbolicLinkToAbsolutePath)
{
  const auto file = CreateDebugFile("libfoo.so.debug", "debug info", "abcdef1234");
  BuildIdPopulator populator{ mReader };

  const std::vector<Path> files{ file };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Link, true);
  ASSERT_TRUE(res.has_value()) << fmt::format("{}", res.error());

  const auto target = mRoot / ".build-id" / "ab" / "cdef1234.debug";
  ASSERT_TRUE(fs::is_symlink(fs::symlink_status(target)));
  EXPECT_EQ(fs::read_symlink(target), fs::absolute(file));
  EXPECT_TRUE(fs::read_symlink(target).is_absolute());
  EXPECT_EQ(ReadFile(target), "debug info");
  EXPECT_TRUE(fs::exists(file));
}

TEST_F(PopulatorTest, CopyPreservesContentsPermissionsAndModificationTime)
{
  const auto file = CreateDebugFile("libfoo.so.debug", "debug info", "abcdef1234");
  fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);
  const auto modified = fs::file_time_type::clock::now() - std::chrono::hours{ 48 };
  fs::last_write_time(file, modified);

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Copy, true);
  ASSERT_TRUE(res.has_value()) << fmt::format("{}", res.error());

  const auto target = Target("abcdef1234");
  ASSERT_TRUE(fs::is_regular_file(fs::symlink_status(target)));
  EXPECT_EQ(ReadFile(target), "debug info");
  EXPECT_EQ(fs::status(target).permissions(), fs::status(file).permissions());
  EXPECT_EQ(fs::last_write_time(target), fs::last_write_time(file));
  EXPECT_TRUE(fs::exists(file));
}

TEST_F(PopulatorTest, MoveRelocatesTheFile)
{
  const auto file = CreateDebugFile("libfoo.so.debug", "debug info", "abcdef1234");
  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Move, true);
  ASSERT_TRUE(res.has_value()) << fmt::format("{}", res.error());

  const auto target = Target("abcdef1234");
  ASSERT_TRUE(fs::is_regular_file(fs::symlink_status(target)));
  EXPECT_EQ(ReadFile(target), "debug info");
  EXPECT_FALSE(fs::exists(file));
}

TEST_F(PopulatorTest, SameLayoutInEveryMode)
{
  for (const auto mode : Enum<MaterializeMode>::Variants()) {
    const auto file = CreateDebugFile("libfoo.so.debug", "debug info", "abcdef1234");
    BuildIdPopulator populator{ mReader };
    const std::vector<Path> files{ file };
    const auto res = populator.Populate(mRoot, files, mode, true);
    ASSERT_TRUE(res.has_value()) << fmt::format("{}: {}", mode, res.error());
    const std::vector<std::string> expected{ ".build-id", ".build-id/ab", ".build-id/ab/cdef1234.debug" };
    EXPECT_EQ(ListTree(mRoot), expected) << fmt::format("{}", mode);
  }
}

TEST_F(PopulatorTest, CleanRemovesStaleEntries)
{
  fs::create_directories(mRoot / ".build-id" / "zz");
  std::ofstream{ mRoot / ".build-id" / "zz" / "stale.debug" } << "stale";
  const auto file = CreateDebugFile("a.debug", "a", "abcdef1234");

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  ASSERT_TRUE(populator.Populate(mRoot, files, MaterializeMode::Link, true).has_value());

  EXPECT_FALSE(fs::exists(mRoot / ".build-id" / "zz"));
  EXPECT_TRUE(fs::exists(Target("abcdef1234")));
}

TEST_F(PopulatorTest, KeepPreservesUnrelatedEntries)
{
  fs::create_directories(mRoot / ".build-id" / "zz");
  std::ofstream{ mRoot / ".build-id" / "zz" / "other.debug" } << "other";
  const auto file = CreateDebugFile("a.debug", "a", "abcdef1234");

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  ASSERT_TRUE(populator.Populate(mRoot, files, MaterializeMode::Link, false).has_value());

  EXPECT_EQ(ReadFile(mRoot / ".build-id" / "zz" / "other.debug"), "other");
  EXPECT_TRUE(fs::exists(Target("abcdef1234")));
}

TEST_F(PopulatorTest, CleanPopulateIsIdempotent)
{
  const std::vector<Path> files{ CreateDebugFile("a.debug", "a", "abcdef1234"),
    CreateDebugFile("b.debug", "b", "0123456789"),
    CreateDebugFile("c.debug", "c", "ab99") };

  BuildIdPopulator populator{ mReader };
  ASSERT_TRUE(populator.Populate(mRoot, files, MaterializeMode::Link, true).has_value());
  const auto first = ListTree(mRoot);
  ASSERT_TRUE(populator.Populate(mRoot, files, MaterializeMode::Link, true).has_value());
  EXPECT_EQ(ListTree(mRoot), first);

  const std::vector<std::string> expected{ ".build-id",
    ".build-id/01",
    ".build-id/01/23456789.debug",
    ".build-id/ab",
    ".build-id/ab/99.debug",
    ".build-id/ab/cdef1234.debug" };
  EXPECT_EQ(first, expected);
  EXPECT_EQ(fs::read_symlink(Target("0123456789")), fs::absolute(files[1]));
}

TEST_F(PopulatorTest, CollidingTargetIsOverwrittenWhenKeeping)
{
  fs::create_directories(mRoot / ".build-id" / "ab");
  std::ofstream{ Target("abcdef1234") } << "old";
  const auto file = CreateDebugFile("a.debug", "new", "abcdef1234");

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  ASSERT_TRUE(populator.Populate(mRoot, files, MaterializeMode::Copy, false).has_value());
  EXPECT_EQ(ReadFile(Target("abcdef1234")), "new");
}

TEST_F(PopulatorTest, DanglingSymbolicLinkAtTargetIsReplaced)
{
  fs::create_directories(mRoot / ".build-id" / "ab");
  fs::create_symlink(mWorkDirectory / "gone.debug", Target("abcdef1234"));
  const auto file = CreateDebugFile("a.debug", "a", "abcdef1234");

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Link, false);
  ASSERT_TRUE(res.has_value()) << fmt::format("{}", res.error());
  EXPECT_EQ(fs::read_symlink(Target("abcdef1234")), fs::absolute(file));
}

TEST_F(PopulatorTest, DuplicateBuildIdLastOneWins)
{
  const std::vector<Path> files{ CreateDebugFile("first.debug", "first", "abcdef1234"),
    CreateDebugFile("second.debug", "second", "abcdef1234") };

  BuildIdPopulator populator{ mReader };
  ASSERT_TRUE(populator.Populate(mRoot, files, MaterializeMode::Link, true).has_value());
  EXPECT_EQ(fs::read_symlink(Target("abcdef1234")), fs::absolute(files[1]));
  EXPECT_EQ(ReadFile(Target("abcdef1234")), "second");
}

TEST_F(PopulatorTest, MissingRootIsNotFoundAndWritesNothing)
{
  const auto file = CreateDebugFile("a.debug", "a", "abcdef1234");
  const auto root = mWorkDirectory / "does-not-exist";

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  const auto res = populator.Populate(root, files, MaterializeMode::Link, true);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mType, PopulateErrorType::NotFoundError);
  EXPECT_EQ(res.error().mPath, root);
  EXPECT_FALSE(fs::exists(root));
  EXPECT_TRUE(mReader.mReadFiles.empty());
}

TEST_F(PopulatorTest, RootThatCannotBeInspectedIsFilesystemError)
{
  const auto file = CreateDebugFile("a.debug", "a", "abcdef1234");
  // Resolving a link to itself fails with ELOOP, not ENOENT.
  const auto root = mWorkDirectory / "loop";
  fs::create_symlink(root, root);

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  const auto res = populator.Populate(root, files, MaterializeMode::Link, true);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mType, PopulateErrorType::FilesystemError);
  EXPECT_EQ(res.error().mPath, root);
  EXPECT_TRUE(mReader.mReadFiles.empty());
}

TEST_F(PopulatorTest, SameFileMovedTwiceKeepsTheMovedFile)
{
  const auto file = CreateDebugFile("only.debug", "the only copy", "abcdef1234");

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file, file };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Move, true);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mType, PopulateErrorType::NotFoundError);
  EXPECT_EQ(res.error().mPath, file);

  EXPECT_FALSE(fs::exists(file));
  ASSERT_TRUE(fs::is_regular_file(fs::symlink_status(Target("abcdef1234"))));
  EXPECT_EQ(ReadFile(Target("abcdef1234")), "the only copy");
}

TEST_F(PopulatorTest, SameFileLinkedTwiceIsFine)
{
  const auto file = CreateDebugFile("only.debug", "the only copy", "abcdef1234");

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file, file };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Link, true);
  ASSERT_TRUE(res.has_value()) << fmt::format("{}", res.error());
  EXPECT_EQ(fs::read_symlink(Target("abcdef1234")), fs::absolute(file));
}

TEST_F(PopulatorTest, RootThatIsAFileIsRejected)
{
  const auto file = CreateDebugFile("a.debug", "a", "abcdef1234");

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  const auto res = populator.Populate(file, files, MaterializeMode::Link, true);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mType, PopulateErrorType::FilesystemError);
  EXPECT_EQ(ReadFile(file), "a");
}

TEST_F(PopulatorTest, MissingDebugFileAbortsBeforeAnyWrite)
{
  fs::create_directories(mRoot / ".build-id" / "zz");
  std::ofstream{ mRoot / ".build-id" / "zz" / "stale.debug" } << "stale";
  const std::vector<Path> files{ CreateDebugFile("a.debug", "a", "abcdef1234"), mInputs / "missing.debug" };

  BuildIdPopulator populator{ mReader };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Move, true);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mType, PopulateErrorType::NotFoundError);
  EXPECT_EQ(res.error().mPath, files[1]);

  // Not even the clean happened.
  EXPECT_TRUE(fs::exists(mRoot / ".build-id" / "zz" / "stale.debug"));
  EXPECT_FALSE(fs::exists(mRoot / ".build-id" / "ab"));
  EXPECT_TRUE(fs::exists(files[0]));
}

TEST_F(PopulatorTest, ReaderFailureAbortsBeforeAnyWrite)
{
  const auto broken = CreateDebugFile("broken.debug", "b", "abcdef1234");
  mReader.mReadErrors.insert_or_assign("broken.debug", "readelf exited with status 1");
  const std::vector<Path> files{ CreateDebugFile("a.debug", "a", "0123456789"), broken };

  BuildIdPopulator populator{ mReader };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Link, true);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mType, PopulateErrorType::ReadError);
  EXPECT_EQ(res.error().mPath, broken);
  EXPECT_FALSE(fs::exists(mRoot / ".build-id"));
}

TEST_F(PopulatorTest, MissingBuildIdIsReported)
{
  const auto file = mInputs / "stripped.debug";
  std::ofstream{ file } << "no notes";

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Link, true);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mType, PopulateErrorType::MissingBuildIdError);
  EXPECT_FALSE(fs::exists(mRoot / ".build-id"));
}

TEST_F(PopulatorTest, InvalidBuildIdIsReported)
{
  const auto file = CreateDebugFile("short.debug", "s", "ab");

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ file };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Link, true);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mType, PopulateErrorType::InvalidBuildIdError);
  EXPECT_EQ(res.error().mPath, file);
  EXPECT_FALSE(fs::exists(mRoot / ".build-id"));
}

TEST_F(PopulatorTest, TargetThatIsTheInputIsLeftInPlace)
{
  fs::create_directories(mRoot / ".build-id" / "ab");
  const auto target = Target("abcdef1234");
  std::ofstream{ target } << "already here";
  mReader.mBuildIds.insert_or_assign(target.filename().string(), "abcdef1234");

  BuildIdPopulator populator{ mReader };
  const std::vector<Path> files{ target };
  const auto res = populator.Populate(mRoot, files, MaterializeMode::Copy, false);
  ASSERT_TRUE(res.has_value()) << fmt::format("{}", res.error());
  EXPECT_EQ(ReadFile(target), "already here");
}

TEST_F(PopulatorTest, ResolveBuildIdKeepsInputPath)
{
  const auto file = CreateDebugFile("a.debug", "a", "abcdef1234");
  BuildIdPopulator populator{ mReader };
  const auto resolved = populator.ResolveBuildId(file);
  ASSERT_TRUE(resolved.has_value()) << fmt::format("{}", resolved.error());
  EXPECT_EQ(resolved->mInputPath, file);
  EXPECT_EQ(resolved->mAbsolutePath, fs::absolute(file));
  EXPECT_EQ(resolved->mBuildId.Value(), "abcdef1234");
}

TEST_F(PopulatorTest, ResolveBuildIdDoesNotFollowSymbolicLinks)
{
  const auto file = CreateDebugFile("a.debug", "a", "abcdef1234");
  const auto link = mWorkDirectory / "link-to-inputs";
  fs::create_directory_symlink(mInputs, link);

  BuildIdPopulator populator{ mReader };
  const auto resolved = populator.ResolveBuildId(link / "a.debug");
  ASSERT_TRUE(resolved.has_value()) << fmt::format("{}", resolved.error());
  EXPECT_EQ(resolved->mAbsolutePath, link / "a.debug");
}

TEST_F(PopulatorTest, PopulateFromConfiguration)
{
  const auto file = CreateDebugFile("a.debug", "a", "abcdef1234");
  bidpop::cfg::CommandLineOptions options{};
  options.mClean = true;
  options.mMode = MaterializeMode::Copy;
  const std::string root = mRoot.string();
  const std::string input = file.string();
  const std::vector<std::string_view> positional{ root, input };
  const auto config = bidpop::cfg::PopulateConfiguration::Create(options, positional);
  ASSERT_TRUE(config.has_value());

  BuildIdPopulator populator{ mReader };
  ASSERT_TRUE(populator.Populate(*config).has_value());
  EXPECT_TRUE(fs::is_regular_file(fs::symlink_status(Target("abcdef1234"))));
}
