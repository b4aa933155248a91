#include <gtest/gtest.h>

#include <filesystem>
#include <vector>

#include "TestSupport.h"
#include "core/SaveData.h"

namespace {

using testsupport::TempDir;

TEST(SaveData, WrittenProgressReadsBack) {
  TempDir dir;
  const std::string path = dir.file("save.toml");

  SaveData data{};
  data.currentLevel = 4;
  data.totalGems = 57;
  data.score = 12345678901LL;
  data.unlockedLevels = {2, 3, 4};
  ASSERT_TRUE(saveSaveData(path, data));
  EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

  SaveData loaded{};
  ASSERT_TRUE(loadSaveData(path, loaded));
  EXPECT_EQ(loaded.currentLevel, 4);
  EXPECT_EQ(loaded.totalGems, 57);
  EXPECT_EQ(loaded.score, 12345678901LL);
  EXPECT_EQ(loaded.unlockedLevels, (std::vector<int>{2, 3, 4}));
}

TEST(SaveData, MissingFileGivesDefaults) {
  TempDir dir;
  SaveData loaded{};
  loaded.totalGems = 9;
  EXPECT_FALSE(loadSaveData(dir.file("nope.toml"), loaded));
  EXPECT_EQ(loaded.currentLevel, 1);
  EXPECT_EQ(loaded.totalGems, 0);
  EXPECT_EQ(loaded.score, 0);
  EXPECT_TRUE(loaded.unlockedLevels.empty());
}

TEST(SaveData, CorruptFileGivesDefaults) {
  TempDir dir;
  const std::string path = dir.write("save.toml", "current_level = = 3\n");
  SaveData loaded{};
  loaded.score = 99;
  EXPECT_FALSE(loadSaveData(path, loaded));
  EXPECT_EQ(loaded.score, 0);
  EXPECT_EQ(loaded.currentLevel, 1);
}

TEST(SaveData, InvalidValuesAreSanitized) {
  TempDir dir;
  const std::string path = dir.write("save.toml", R"(
version = 1
current_level = -3
total_gems = -10
score = -5
unlocked_levels = [5, 0, 3, 3, "x", 1]
)");
  SaveData loaded{};
  ASSERT_TRUE(loadSaveData(path, loaded));
  EXPECT_EQ(loaded.currentLevel, 1);
  EXPECT_EQ(loaded.totalGems, 0);
  EXPECT_EQ(loaded.score, 0);
  EXPECT_EQ(loaded.unlockedLevels, (std::vector<int>{3, 5}));
}

TEST(SaveData, DeleteRemovesFile) {
  TempDir dir;
  const std::string path = dir.file("save.toml");
  ASSERT_TRUE(saveSaveData(path, SaveData{}));
  EXPECT_TRUE(deleteSaveData(path));
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_TRUE(deleteSaveData(path));
  EXPECT_FALSE(saveSaveData("", SaveData{}));
}

}  // namespace
