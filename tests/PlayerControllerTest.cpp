#include <gtest/gtest.h>

#include "config/GameConfig.h"
#include "ecs/Components.h"
#include "ecs/World.h"
#include "player/PlayerController.h"

namespace {

using DamageResult = PlayerController::DamageResult;

TEST(Jump, GroundedJumpLeavesTheGround) {
  const PlayerTuning tuning{};
  Velocity v{};
  Grounded g{true, kInvalidEntity};
  JumpState js{};
  EXPECT_TRUE(PlayerController::requestJump(v, g, js, tuning));
  EXPECT_FLOAT_EQ(v.v.y, -tuning.jumpSpeed);
  EXPECT_FALSE(g.onGround);
  EXPECT_FALSE(js.doubleJumpUsed);
}

TEST(Jump, DoubleJumpOncePerAirtime) {
  const PlayerTuning tuning{};
  Velocity v{};
  Grounded g{true, kInvalidEntity};
  JumpState js{};
  ASSERT_TRUE(PlayerController::requestJump(v, g, js, tuning));

  v.v.y = 50.0F;
  EXPECT_TRUE(PlayerController::requestJump(v, g, js, tuning));
  EXPECT_FLOAT_EQ(v.v.y, -tuning.jumpSpeed);
  EXPECT_TRUE(js.doubleJumpUsed);

  v.v.y = 50.0F;
  EXPECT_FALSE(PlayerController::requestJump(v, g, js, tuning));
  EXPECT_FLOAT_EQ(v.v.y, 50.0F);
}

TEST(Jump, LandingRestoresDoubleJump) {
  const PlayerTuning tuning{};
  Transform t{Vec2{0.0F, 10.0F}};
  Velocity v{Vec2{0.0F, 200.0F}};
  Grounded g{};
  JumpState js{true, true};
  const AABB box{tuning.width, tuning.height};

  PlayerController::land(t, v, g, js, box, 100.0F, kInvalidEntity);
  EXPECT_FLOAT_EQ(t.pos.y, 100.0F - tuning.height);
  EXPECT_FLOAT_EQ(v.v.y, 0.0F);
  EXPECT_TRUE(g.onGround);
  EXPECT_FALSE(js.doubleJumpUsed);
}

TEST(Jump, NoDoubleJumpWhenDisabled) {
  PlayerTuning tuning{};
  tuning.canDoubleJump = false;
  Velocity v{};
  Grounded g{};
  JumpState js{tuning.canDoubleJump, false};
  EXPECT_FALSE(PlayerController::requestJump(v, g, js, tuning));
  EXPECT_FLOAT_EQ(v.v.y, 0.0F);
}

TEST(Damage, HurtStartsInvulnerabilityAndKnocksBackAway) {
  const PlayerTuning tuning{};
  Health hp{3, 3};
  Invulnerability inv{};
  Velocity v{};
  Grounded g{true, kInvalidEntity};

  EXPECT_EQ(PlayerController::applyDamage(hp, inv, v, g, 1, -1, tuning), DamageResult::Hurt);
  EXPECT_EQ(hp.current, 2);
  EXPECT_TRUE(inv.active);
  EXPECT_FLOAT_EQ(inv.remaining, tuning.invulnerabilitySeconds);
  EXPECT_FLOAT_EQ(v.v.x, -tuning.knockbackX);
  EXPECT_FLOAT_EQ(v.v.y, -tuning.jumpSpeed * 0.5F);
  EXPECT_FALSE(g.onGround);
}

TEST(Damage, IgnoredWhileInvulnerable) {
  const PlayerTuning tuning{};
  Health hp{3, 3};
  Invulnerability inv{true, 1.0F};
  Velocity v{};
  Grounded g{};
  EXPECT_EQ(PlayerController::applyDamage(hp, inv, v, g, 1, 1, tuning), DamageResult::Ignored);
  EXPECT_EQ(hp.current, 3);
  EXPECT_FLOAT_EQ(v.v.x, 0.0F);
}

TEST(Damage, LethalHitClampsHealthAndSkipsKnockback) {
  const PlayerTuning tuning{};
  Health hp{1, 3};
  Invulnerability inv{};
  Velocity v{};
  Grounded g{true, kInvalidEntity};
  EXPECT_EQ(PlayerController::applyDamage(hp, inv, v, g, 5, 1, tuning), DamageResult::Killed);
  EXPECT_EQ(hp.current, 0);
  EXPECT_FALSE(inv.active);
  EXPECT_FLOAT_EQ(v.v.x, 0.0F);
}

TEST(Invulnerability, ExpiresAfterDuration) {
  Invulnerability inv{true, 2.0F};
  PlayerController::tickInvulnerability(inv, 1.5F);
  EXPECT_TRUE(inv.active);
  EXPECT_FLOAT_EQ(inv.remaining, 0.5F);
  PlayerController::tickInvulnerability(inv, 0.75F);
  EXPECT_FALSE(inv.active);
  EXPECT_FLOAT_EQ(inv.remaining, 0.0F);
}

TEST(Invulnerability, InactiveTimerStaysAtZero) {
  Invulnerability inv{};
  PlayerController::tickInvulnerability(inv, 1.0F);
  EXPECT_FALSE(inv.active);
  EXPECT_FLOAT_EQ(inv.remaining, 0.0F);
}

TEST(AnimState, DerivedFromVelocityAndInvulnerability) {
  const Invulnerability vulnerable{};
  EXPECT_EQ(PlayerController::animStateFor(Velocity{}, vulnerable), AnimStateId::Idle);
  EXPECT_EQ(PlayerController::animStateFor(Velocity{Vec2{-150.0F, 0.0F}}, vulnerable),
            AnimStateId::Running);
  EXPECT_EQ(PlayerController::animStateFor(Velocity{Vec2{150.0F, -10.0F}}, vulnerable),
            AnimStateId::Jumping);
  EXPECT_EQ(PlayerController::animStateFor(Velocity{Vec2{0.0F, 10.0F}}, vulnerable),
            AnimStateId::Falling);
  EXPECT_EQ(PlayerController::animStateFor(Velocity{Vec2{0.0F, 10.0F}}, Invulnerability{true, 1.0F}),
            AnimStateId::Hurt);
  EXPECT_STREQ(animStateName(AnimStateId::Falling), "falling");
}

TEST(PlayerSpawn, RespawnRestoresFullState) {
  World w;
  const PlayerTuning tuning{};
  const EntityId p = PlayerController::spawn(w, tuning, Vec2{5.0F, 5.0F});
  ASSERT_EQ(w.player, p);

  auto& reg = w.registry;
  reg.get<Health>(p).current = 1;
  reg.get<Invulnerability>(p) = Invulnerability{true, 1.0F};
  reg.get<Velocity>(p).v = Vec2{20.0F, 30.0F};
  reg.get<JumpState>(p).doubleJumpUsed = true;

  PlayerController::respawn(w, p, Vec2{100.0F, 50.0F});
  EXPECT_EQ(reg.get<Transform>(p).pos, (Vec2{100.0F, 50.0F}));
  EXPECT_EQ(reg.get<PrevTransform>(p).pos, (Vec2{100.0F, 50.0F}));
  EXPECT_EQ(reg.get<Velocity>(p).v, Vec2{});
  EXPECT_EQ(reg.get<Health>(p).current, tuning.maxHealth);
  EXPECT_FALSE(reg.get<Invulnerability>(p).active);
  EXPECT_FALSE(reg.get<JumpState>(p).doubleJumpUsed);
  EXPECT_FALSE(reg.get<Grounded>(p).onGround);
}

}  // namespace
