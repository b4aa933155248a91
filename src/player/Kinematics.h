#pragma once

#include "config/GameConfig.h"
#include "ecs/Components.h"

namespace Kinematics {

// Adds gravity for one step and clamps to [-jumpSpeed, maxFallSpeed].
float fallVelocity(float vy, float dt, const PlayerTuning& tuning);

// One integration step: gravity (airborne only), horizontal speed from the input axis,
// position update and facing.
void step(Transform& t,
          Velocity& v,
          Facing& facing,
          bool onGround,
          float axis,
          float dt,
          const PlayerTuning& tuning);

}  // namespace Kinematics
