//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <expected>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <Mosaic/Base/FileIo.h>
#include <Mosaic/Testing/GTest.h>
#include <Mosaic/Testing/TemporaryDirectory.h>

using mosaic::ReadTextFile;
using mosaic::StagedFileSet;
using mosaic::WriteFileAtomically;
using mosaic::testing::TemporaryDirectory;

namespace {

//=== ReadTextFile / WriteFileAtomically ===----------------------------------//

NOLINT_TEST(FileIoTest, ReadTextFile_ReturnsWholeContents)
{
  // Arrange
  TemporaryDirectory dir;
  const auto path = dir.WriteFile("a.usda", "#usda 1.0\n\ndef \"A\" {}\n");

  // Act
  const auto text = ReadTextFile(path);

  // Assert
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "#usda 1.0\n\ndef \"A\" {}\n");
}

NOLINT_TEST(FileIoTest, ReadTextFile_MissingFile_ReturnsError)
{
  TemporaryDirectory dir;

  const auto text = ReadTextFile(dir.Path() / "missing.usda");

  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error(), std::errc::no_such_file_or_directory);
}

NOLINT_TEST(FileIoTest, WriteFileAtomically_ReplacesContentsAndLeavesNoTemp)
{
  // Arrange
  TemporaryDirectory dir;
  const auto path = dir.WriteFile("stage.usda", "old");

  // Act
  const auto result = WriteFileAtomically(path, "new contents");

  // Assert
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(dir.ReadFile("stage.usda"), "new contents");
  EXPECT_FALSE(
    std::filesystem::exists(StagedFileSet::TemporaryPathFor(path)));
}

NOLINT_TEST(FileIoTest, WriteFileAtomically_CreatesParentDirectories)
{
  TemporaryDirectory dir;

  const auto result
    = WriteFileAtomically(dir.Path() / "out" / "nested" / "r.json", "{}");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(dir.ReadFile("out/nested/r.json"), "{}");
}

//=== StagedFileSet ===-------------------------------------------------------//

class StagedFileSetTest : public testing::Test {
protected:
  TemporaryDirectory dir_;
};

//! Scenario: all staged files appear together after a successful commit.
NOLINT_TEST_F(StagedFileSetTest, Commit_WritesEveryTarget)
{
  // Arrange
  StagedFileSet staged;
  staged.Stage(dir_.Path() / "Chair.usda", "chair");
  staged.Stage(dir_.Path() / "Table.usda", "table");
  staged.Stage(dir_.Path() / "Set_stage.usda", "stage");

  // Act
  const auto result = staged.Commit();

  // Assert
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(dir_.ReadFile("Chair.usda"), "chair");
  EXPECT_EQ(dir_.ReadFile("Table.usda"), "table");
  EXPECT_EQ(dir_.ReadFile("Set_stage.usda"), "stage");
  EXPECT_TRUE(staged.Empty());
}

NOLINT_TEST_F(StagedFileSetTest, Stage_SameTargetTwice_KeepsLatestContents)
{
  StagedFileSet staged;
  staged.Stage(dir_.Path() / "Chair.usda", "first");
  staged.Stage(dir_.Path() / "Chair.usda", "second");

  EXPECT_EQ(staged.Size(), 1U);
  ASSERT_TRUE(staged.Commit().has_value());
  EXPECT_EQ(dir_.ReadFile("Chair.usda"), "second");
}

NOLINT_TEST_F(StagedFileSetTest, Targets_AreInStagingOrder)
{
  StagedFileSet staged;
  staged.Stage(dir_.Path() / "b.usda", "");
  staged.Stage(dir_.Path() / "a.usda", "");

  const auto targets = staged.Targets();

  ASSERT_EQ(targets.size(), 2U);
  EXPECT_EQ(targets[0].filename().string(), "b.usda");
  EXPECT_EQ(targets[1].filename().string(), "a.usda");
}

//! Scenario: a temporary that cannot be written leaves every target intact
//! and removes the temporaries already written.
NOLINT_TEST_F(StagedFileSetTest, Commit_WhenOneWriteFails_ThenNothingChanges)
{
  // Arrange
  const auto chair = dir_.WriteFile("Chair.usda", "original");
  // A regular file where a directory is needed makes the second write fail.
  dir_.WriteFile("blocker", "not a directory");
  StagedFileSet staged;
  staged.Stage(chair, "rewritten");
  staged.Stage(dir_.Path() / "blocker" / "Set_stage.usda", "stage");

  // Act
  const auto result = staged.Commit();

  // Assert
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(dir_.ReadFile("Chair.usda"), "original");
  EXPECT_FALSE(
    std::filesystem::exists(StagedFileSet::TemporaryPathFor(chair)));
  EXPECT_TRUE(staged.Empty());
}

//! Scenario: the second target cannot be replaced after the first one was
//! already published; the first target is restored.
NOLINT_TEST_F(StagedFileSetTest, Commit_WhenPublishFails_ThenEarlierTargetsRestored)
{
  // Arrange
  const auto chair = dir_.WriteFile("Chair.usda", "original");
  // A non-empty directory cannot be replaced by a rename.
  dir_.WriteFile("Set_stage.usda/keep.txt", "occupied");
  const auto stage = dir_.Path() / "Set_stage.usda";
  StagedFileSet staged;
  staged.Stage(chair, "rewritten");
  staged.Stage(stage, "stage");

  // Act
  const auto result = staged.Commit();

  // Assert
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(dir_.ReadFile("Chair.usda"), "original");
  EXPECT_EQ(dir_.ReadFile("Set_stage.usda/keep.txt"), "occupied");
  EXPECT_FALSE(
    std::filesystem::exists(StagedFileSet::TemporaryPathFor(chair)));
  EXPECT_FALSE(std::filesystem::exists(StagedFileSet::BackupPathFor(chair)));
  EXPECT_FALSE(
    std::filesystem::exists(StagedFileSet::TemporaryPathFor(stage)));
}

//! Scenario: a new target that did not exist before is removed again when a
//! later target fails.
NOLINT_TEST_F(StagedFileSetTest, Commit_WhenPublishFails_ThenNewTargetsRemoved)
{
  // Arrange
  dir_.WriteFile("Set_stage.usda/keep.txt", "occupied");
  StagedFileSet staged;
  staged.Stage(dir_.Path() / "Lamp.usda", "lamp");
  staged.Stage(dir_.Path() / "Set_stage.usda", "stage");

  // Act
  const auto result = staged.Commit();

  // Assert
  EXPECT_FALSE(result.has_value());
  EXPECT_FALSE(std::filesystem::exists(dir_.Path() / "Lamp.usda"));
}

NOLINT_TEST_F(StagedFileSetTest, Commit_ReplacedTarget_LeavesNoBackup)
{
  const auto chair = dir_.WriteFile("Chair.usda", "original");
  StagedFileSet staged;
  staged.Stage(chair, "rewritten");

  ASSERT_TRUE(staged.Commit().has_value());

  EXPECT_EQ(dir_.ReadFile("Chair.usda"), "rewritten");
  EXPECT_FALSE(std::filesystem::exists(StagedFileSet::BackupPathFor(chair)));
}

//! Scenario: a writer entry receives the temporary path, which keeps the
//! target's extension.
NOLINT_TEST_F(StagedFileSetTest, Stage_Writer_WritesThroughTemporaryPath)
{
  // Arrange
  const auto target = dir_.Path() / "Rock.usdc";
  std::filesystem::path seen;
  StagedFileSet staged;
  staged.Stage(target,
    [&seen](const std::filesystem::path& temp)
      -> std::expected<void, std::error_code> {
      seen = temp;
      std::ofstream out(temp, std::ios::binary);
      out << "crate";
      return {};
    });

  // Act
  const auto result = staged.Commit();

  // Assert
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(seen.extension().string(), ".usdc");
  EXPECT_EQ(dir_.ReadFile("Rock.usdc"), "crate");
}

NOLINT_TEST_F(StagedFileSetTest, Stage_WriterFails_ThenNothingChanges)
{
  const auto chair = dir_.WriteFile("Chair.usda", "original");
  StagedFileSet staged;
  staged.Stage(chair, "rewritten");
  staged.Stage(dir_.Path() / "Rock.usdc",
    [](const std::filesystem::path&) -> std::expected<void, std::error_code> {
      return std::unexpected(std::make_error_code(std::errc::io_error));
    });

  const auto result = staged.Commit();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), std::errc::io_error);
  EXPECT_EQ(dir_.ReadFile("Chair.usda"), "original");
  EXPECT_FALSE(std::filesystem::exists(dir_.Path() / "Rock.usdc"));
}

NOLINT_TEST_F(StagedFileSetTest, Commit_Empty_Succeeds)
{
  StagedFileSet staged;

  EXPECT_TRUE(staged.Commit().has_value());
}

NOLINT_TEST(StagedFileSetPathTest, TemporaryPath_IsSiblingOfTarget)
{
  const std::filesystem::path target = "/exports/Set/Chair.usda";

  const auto temp = StagedFileSet::TemporaryPathFor(target);

  EXPECT_EQ(temp.parent_path().string(), target.parent_path().string());
  EXPECT_EQ(temp.filename().string(), "Chair.mosaic-tmp.usda");
  EXPECT_EQ(StagedFileSet::BackupPathFor(target).filename().string(),
    "Chair.mosaic-bak.usda");
}

} // namespace
