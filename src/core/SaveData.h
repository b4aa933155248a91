#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct SaveData {
  int currentLevel = 1;
  int totalGems = 0;  // gem bank
  std::int64_t score = 0;
  std::vector<int> unlockedLevels;  // beyond level 1, sorted
};

// Missing, unreadable or corrupt files leave `out` at defaults and return false.
bool loadSaveData(const std::string& path, SaveData& out);
// Atomic write (tmp file + rename).
bool saveSaveData(const std::string& path, const SaveData& data);
bool deleteSaveData(const std::string& path);
