#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "core/Analytics.h"
#include "ecs/Components.h"
#include "ecs/World.h"
#include "player/PlayerController.h"

namespace testsupport {

// Per-test scratch directory, removed on destruction.
class TempDir {
 public:
  TempDir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "jumper_";
    if (info) {
      name += info->test_suite_name();
      name += "_";
      name += info->name();
    }
    path_ = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] std::string file(std::string_view name) const { return (path_ / name).string(); }

  std::string write(std::string_view name, std::string_view contents) const {
    const std::string p = file(name);
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << contents;
    return p;
  }

 private:
  std::filesystem::path path_;
};

struct RecordedEvent {
  std::string name;
  AnalyticsParams params;
};

class RecordingSink : public AnalyticsSink {
 public:
  void logEvent(std::string_view name, const AnalyticsParams& params) override {
    events.push_back(RecordedEvent{std::string(name), params});
  }

  [[nodiscard]] int count(std::string_view name) const {
    return static_cast<int>(std::ranges::count_if(
        events, [name](const RecordedEvent& e) { return e.name == name; }));
  }

  // Last event with this name; fails the test when there is none.
  [[nodiscard]] const AnalyticsParams& last(std::string_view name) const {
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
      if (it->name == name)
        return it->params;
    }
    ADD_FAILURE() << "no '" << name << "' event";
    static const AnalyticsParams kEmpty{};
    return kEmpty;
  }

  std::vector<RecordedEvent> events;
};

class ThrowingSink : public AnalyticsSink {
 public:
  void logEvent(std::string_view name, const AnalyticsParams& params) override {
    (void)params;
    ++calls;
    throw std::runtime_error("sink offline: " + std::string(name));
  }

  int calls = 0;
};

inline EntityId addBody(World& w, const Rect& r, Collider c) {
  const EntityId e = w.create();
  w.registry.emplace<Transform>(e, Transform{Vec2{r.x, r.y}});
  w.registry.emplace<AABB>(e, AABB{r.w, r.h});
  w.registry.emplace<Collider>(e, std::move(c));
  return e;
}

// Player standing on `support` with its feet exactly on the platform top.
inline EntityId spawnGrounded(World& w, const PlayerTuning& tuning, float x, EntityId support) {
  const Rect top = rectOf(w.registry.get<Transform>(support), w.registry.get<AABB>(support));
  const EntityId p = PlayerController::spawn(w, tuning, Vec2{x, top.top() - tuning.height});
  auto& g = w.registry.get<Grounded>(p);
  g.onGround = true;
  g.support = support;
  return p;
}

}  // namespace testsupport
