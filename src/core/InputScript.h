#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "ecs/Components.h"

// Deterministic input replay for headless runs and tests. A keyframe only changes the
// controls it names; the rest keep the value set by an earlier keyframe.
class InputScript {
 public:
  bool loadFromToml(const char* path);
  void reset();
  InputState sample(uint64_t frame);

  [[nodiscard]] bool loaded() const { return loaded_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] std::size_t keyframeCount() const { return keyframes_.size(); }
  // A headless run with no --frames stops shortly after this frame.
  [[nodiscard]] uint64_t lastKeyframe() const;

 private:
  struct Controls {
    bool left = false;
    bool right = false;
    bool jump = false;
    float axis = 0.0F;
  };

  struct Keyframe {
    uint64_t frame = 0;
    std::optional<bool> left;
    std::optional<bool> right;
    std::optional<bool> jump;
    std::optional<float> axis;
  };

  bool appendFile(const std::filesystem::path& path, std::unordered_set<std::string>& visited);

  std::vector<Keyframe> keyframes_;
  Controls current_{};
  Controls previous_{};
  InputState history_{};
  std::size_t cursor_ = 0;
  std::optional<uint64_t> lastSampled_;
  bool loaded_ = false;
  std::string path_;
};
