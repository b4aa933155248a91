#include "core/SaveData.h"

#include <toml++/toml.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "util/Log.h"
#include "util/TomlUtil.h"

bool loadSaveData(const std::string& path, SaveData& out) {
  out = SaveData{};
  if (path.empty())
    return false;

  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    Log::infof("save", "no save file at {}; starting fresh", path);
    return false;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    Log::warnf("save", "{} is corrupt ({}); using defaults", path, err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path.c_str(), "save",
                            {"version", "current_level", "total_gems", "score", "unlocked_levels"});

  SaveData next{};
  if (auto v = tbl.get("current_level"))
    next.currentLevel = v->value_or(next.currentLevel);
  if (auto v = tbl.get("total_gems"))
    next.totalGems = v->value_or(next.totalGems);
  if (auto v = tbl.get("score"))
    next.score = v->value_or(next.score);
  TomlUtil::readIntArray(tbl, "unlocked_levels", path.c_str(), "save", next.unlockedLevels);

  next.currentLevel = std::max(1, next.currentLevel);
  next.totalGems = std::max(0, next.totalGems);
  next.score = std::max<std::int64_t>(0, next.score);
  std::erase_if(next.unlockedLevels, [](int level) { return level < 2; });
  std::ranges::sort(next.unlockedLevels);
  const auto dup = std::ranges::unique(next.unlockedLevels);
  next.unlockedLevels.erase(dup.begin(), dup.end());

  out = std::move(next);
  return true;
}

bool saveSaveData(const std::string& path, const SaveData& data) {
  if (path.empty())
    return false;

  toml::array unlocked;
  for (int level : data.unlockedLevels) {
    unlocked.push_back(level);
  }

  toml::table tbl;
  tbl.insert("version", 1);
  tbl.insert("current_level", data.currentLevel);
  tbl.insert("total_gems", data.totalGems);
  tbl.insert("score", data.score);
  tbl.insert("unlocked_levels", std::move(unlocked));

  namespace fs = std::filesystem;
  const fs::path outPath(path);
  const fs::path tmpPath = outPath.string() + ".tmp";

  std::ofstream tmp(tmpPath, std::ios::binary | std::ios::trunc);
  if (!tmp.is_open()) {
    Log::warnf("save", "cannot open {} for writing", tmpPath.string());
    return false;
  }
  tmp << tbl;
  tmp.close();
  if (!tmp) {
    Log::warnf("save", "write to {} failed", tmpPath.string());
    return false;
  }

  std::error_code ec;
  fs::rename(tmpPath, outPath, ec);
  if (ec) {
    Log::warnf("save", "rename to {} failed: {}", path, ec.message());
    fs::remove(tmpPath, ec);
    return false;
  }

  return true;
}

bool deleteSaveData(const std::string& path) {
  if (path.empty())
    return false;

  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(path, ec))
    return true;
  (void)fs::remove(path, ec);
  return !ec;
}
