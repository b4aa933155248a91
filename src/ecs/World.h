#pragma once

#include <cstdint>
#include <functional>
#include <entt/entt.hpp>

#include "core/Time.h"       // IWYU pragma: keep
#include "ecs/Components.h"  // IWYU pragma: keep
#include "ecs/Entity.h"

enum class DeathCause : std::uint8_t {
  Hazard,
  TimeUp,
  Fell,
};

const char* deathCauseName(DeathCause cause);

// Injected by whoever owns the world; any of these may be left empty.
struct GameplayEvents {
  std::function<void(DeathCause)> onDeath;
  std::function<void(int value)> onGemCollected;
  std::function<void(Vec2 pos)> onCheckpoint;
  std::function<void()> onExitReached;
};

class World {
 public:
  EntityId create();
  void destroy(EntityId);

  void update(TimeStep ts);

  entt::registry registry;
  GameplayEvents events;

  Rect bounds{};
  float killPlaneMargin = 100.0F;

  // debug/test-friendly counters
  int hurtEvents = 0;
  int deaths = 0;

  // external handle: "currently controlled player"
  EntityId player = kInvalidEntity;
};
