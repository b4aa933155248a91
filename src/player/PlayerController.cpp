#include "player/PlayerController.h"

#include <algorithm>
#include <cmath>

#include "ecs/World.h"

EntityId PlayerController::spawn(World& w, const PlayerTuning& tuning, Vec2 pos) {
  const EntityId e = w.create();
  auto& reg = w.registry;
  reg.emplace<LevelEntityTag>(e);
  reg.emplace<PlayerTag>(e);
  reg.emplace<Transform>(e, Transform{pos});
  reg.emplace<PrevTransform>(e, PrevTransform{pos});
  reg.emplace<Velocity>(e);
  reg.emplace<AABB>(e, AABB{tuning.width, tuning.height});
  reg.emplace<Grounded>(e);
  reg.emplace<Facing>(e);
  reg.emplace<Health>(e, Health{tuning.maxHealth, tuning.maxHealth});
  reg.emplace<Invulnerability>(e);
  reg.emplace<JumpState>(e, JumpState{tuning.canDoubleJump, false});
  reg.emplace<AnimState>(e);
  reg.emplace<InputState>(e);
  reg.emplace<PlayerTuning>(e, tuning);
  w.player = e;
  return e;
}

void PlayerController::respawn(World& w, EntityId e, Vec2 pos) {
  auto& reg = w.registry;
  if (!isAlive(reg, e) || !reg.all_of<PlayerTag>(e))
    return;

  const auto& tuning = reg.get<PlayerTuning>(e);
  reg.get<Transform>(e).pos = pos;
  reg.get<PrevTransform>(e).pos = pos;
  reg.get<Velocity>(e).v = Vec2{};
  reg.get<Grounded>(e) = Grounded{};
  reg.get<Health>(e) = Health{tuning.maxHealth, tuning.maxHealth};
  reg.get<Invulnerability>(e) = Invulnerability{};
  reg.get<JumpState>(e) = JumpState{tuning.canDoubleJump, false};
  reg.get<AnimState>(e) = AnimState{};
}

bool PlayerController::requestJump(Velocity& v,
                                   Grounded& g,
                                   JumpState& js,
                                   const PlayerTuning& tuning) {
  if (g.onGround) {
    v.v.y = -tuning.jumpSpeed;
    g.onGround = false;
    g.support = kInvalidEntity;
    return true;
  }

  if (!js.canDoubleJump || js.doubleJumpUsed)
    return false;

  v.v.y = -tuning.jumpSpeed;
  js.doubleJumpUsed = true;
  return true;
}

void PlayerController::land(Transform& t,
                            Velocity& v,
                            Grounded& g,
                            JumpState& js,
                            const AABB& box,
                            float platformTop,
                            EntityId support) {
  t.pos.y = platformTop - box.h;
  v.v.y = 0.0F;
  g.onGround = true;
  g.support = support;
  js.doubleJumpUsed = false;
}

PlayerController::DamageResult PlayerController::applyDamage(Health& hp,
                                                             Invulnerability& inv,
                                                             Velocity& v,
                                                             Grounded& g,
                                                             int damage,
                                                             int awayX,
                                                             const PlayerTuning& tuning) {
  if (inv.active)
    return DamageResult::Ignored;

  hp.current = std::max(0, hp.current - std::max(0, damage));
  if (hp.current <= 0)
    return DamageResult::Killed;

  inv.active = true;
  inv.remaining = tuning.invulnerabilitySeconds;

  // Knockback wins over any jump in progress; the double-jump charge is not restored.
  v.v.x = (awayX < 0 ? -1.0F : 1.0F) * tuning.knockbackX;
  v.v.y = -tuning.jumpSpeed * 0.5F;
  g.onGround = false;
  g.support = kInvalidEntity;
  return DamageResult::Hurt;
}

void PlayerController::tickInvulnerability(Invulnerability& inv, float dt) {
  if (!inv.active)
    return;
  inv.remaining -= dt;
  if (inv.remaining <= 0.0F) {
    inv.remaining = 0.0F;
    inv.active = false;
  }
}

AnimStateId PlayerController::animStateFor(const Velocity& v, const Invulnerability& inv) {
  if (inv.active)
    return AnimStateId::Hurt;
  if (v.v.y < 0.0F)
    return AnimStateId::Jumping;
  if (v.v.y > 0.0F)
    return AnimStateId::Falling;
  if (std::fabs(v.v.x) > 0.0F)
    return AnimStateId::Running;
  return AnimStateId::Idle;
}

const char* animStateName(AnimStateId id) {
  switch (id) {
    case AnimStateId::Idle:
      return "idle";
    case AnimStateId::Running:
      return "running";
    case AnimStateId::Jumping:
      return "jumping";
    case AnimStateId::Falling:
      return "falling";
    case AnimStateId::Hurt:
      return "hurt";
  }
  return "idle";
}
