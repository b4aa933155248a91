#pragma once

#include <cstdint>
#include <limits>
#include <variant>

#include "config/GameConfig.h"  // IWYU pragma: keep
#include "ecs/Entity.h"
#include "util/Math.h"

struct Transform {
  Vec2 pos{};  // top-left, y-down
};

// Position at the start of the frame, before integration.
struct PrevTransform {
  Vec2 pos{};
};

struct Velocity {
  Vec2 v{};
};

struct AABB {
  float w = 24.0F;
  float h = 32.0F;
};

inline Rect rectOf(const Transform& t, const AABB& box) {
  return Rect{t.pos.x, t.pos.y, box.w, box.h};
}

struct InputState {
  static constexpr int kUnpressedFrames = std::numeric_limits<int>::max();

  bool left = false;
  bool right = false;
  float axis = 0.0F;  // analog stick, [-1, 1]
  bool jumpPressed = false;
  bool jumpHeld = false;
  bool jumpReleased = false;

  int jumpHeldFrames = 0;
  int jumpPressedFrames = kUnpressedFrames;  // frames since press (0 = this frame)

  // Digital keys win over the stick when both are active.
  [[nodiscard]] float horizontal() const {
    if (left != right)
      return left ? -1.0F : 1.0F;
    return util::clampf(axis, -1.0F, 1.0F);
  }

  // Advances the frame counters from the previous sample; call once per sampled frame.
  void carryHistory(const InputState& prev) {
    if (!jumpHeld) {
      jumpHeldFrames = 0;
    } else if (jumpPressed) {
      jumpHeldFrames = 1;
    } else {
      jumpHeldFrames = (prev.jumpHeldFrames < kUnpressedFrames) ? prev.jumpHeldFrames + 1
                                                                : prev.jumpHeldFrames;
    }

    if (jumpPressed) {
      jumpPressedFrames = 0;
    } else {
      jumpPressedFrames = (prev.jumpPressedFrames < kUnpressedFrames) ? prev.jumpPressedFrames + 1
                                                                      : prev.jumpPressedFrames;
    }
  }
};

struct PlayerTag {};

// Everything spawned for the current level (player included); destroyed in bulk on reload.
struct LevelEntityTag {};

struct Grounded {
  bool onGround = false;
  EntityId support = kInvalidEntity;  // platform under the feet
};

struct Facing {
  int x = 1;
};

struct Health {
  int current = 3;
  int max = 3;
};

struct Invulnerability {
  bool active = false;
  float remaining = 0.0F;  // seconds
};

struct JumpState {
  bool canDoubleJump = true;
  bool doubleJumpUsed = false;
};

enum class AnimStateId : std::uint8_t {
  Idle,
  Running,
  Jumping,
  Falling,
  Hurt,
};

const char* animStateName(AnimStateId id);

struct AnimState {
  AnimStateId id = AnimStateId::Idle;
  float timer = 0.0F;  // seconds spent in the current state
};

// Horizontal back-and-forth motion (moving platforms, patrolling enemies).
struct Patrol {
  float minX = 0.0F;
  float maxX = 0.0F;
  float speed = 0.0F;
  int dirX = 1;
};

enum class HazardKind : std::uint8_t {
  Spike,
  Enemy,
};

struct PlatformBody {
  bool moving = false;
};

struct HazardBody {
  HazardKind kind = HazardKind::Spike;
  int damage = 1;
};

struct CollectibleBody {
  int value = 10;
  bool collected = false;
  float despawnTimer = 0.0F;  // counts down after pickup
};

struct CheckpointBody {
  bool reached = false;
};

struct ExitBody {};

using Collider = std::variant<PlatformBody, HazardBody, CollectibleBody, CheckpointBody, ExitBody>;
