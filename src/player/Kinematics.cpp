#include "player/Kinematics.h"

#include "util/Math.h"

float Kinematics::fallVelocity(float vy, float dt, const PlayerTuning& tuning) {
  return util::clampf(vy + tuning.gravity * dt, -tuning.jumpSpeed, tuning.maxFallSpeed);
}

void Kinematics::step(Transform& t,
                      Velocity& v,
                      Facing& facing,
                      bool onGround,
                      float axis,
                      float dt,
                      const PlayerTuning& tuning) {
  if (!onGround)
    v.v.y = fallVelocity(v.v.y, dt, tuning);

  v.v.x = util::clampf(axis, -1.0F, 1.0F) * tuning.moveSpeed;

  t.pos = t.pos + v.v * dt;

  if (v.v.x > 0.0F) {
    facing.x = 1;
  } else if (v.v.x < 0.0F) {
    facing.x = -1;
  }
}
