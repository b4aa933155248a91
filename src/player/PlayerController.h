#pragma once

#include <cstdint>

#include "config/GameConfig.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"

class World;

class PlayerController {
 public:
  enum class DamageResult : std::uint8_t {
    Ignored,  // invulnerable
    Hurt,
    Killed,
  };

  // Creates the player entity with every component it needs; tuning is stored on the entity.
  static EntityId spawn(World& w, const PlayerTuning& tuning, Vec2 pos);

  // Full reset at `pos`: zero velocity, full health, vulnerable, airborne, double jump restored.
  static void respawn(World& w, EntityId e, Vec2 pos);

  // Grounded jump, else the once-per-airtime double jump. Returns false when nothing happened.
  static bool requestJump(Velocity& v, Grounded& g, JumpState& js, const PlayerTuning& tuning);

  static void land(Transform& t,
                   Velocity& v,
                   Grounded& g,
                   JumpState& js,
                   const AABB& box,
                   float platformTop,
                   EntityId support);

  // awayX is -1/+1: the side of the hazard the player is on.
  static DamageResult applyDamage(Health& hp,
                                  Invulnerability& inv,
                                  Velocity& v,
                                  Grounded& g,
                                  int damage,
                                  int awayX,
                                  const PlayerTuning& tuning);

  static void tickInvulnerability(Invulnerability& inv, float dt);

  static AnimStateId animStateFor(const Velocity& v, const Invulnerability& inv);
};
