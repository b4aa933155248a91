#include <gtest/gtest.h>

#include <vector>

#include "TestSupport.h"
#include "config/GameConfig.h"
#include "core/Time.h"
#include "ecs/Components.h"
#include "ecs/Systems.h"
#include "ecs/World.h"
#include "player/PlayerController.h"

namespace {

using testsupport::addBody;
using testsupport::spawnGrounded;

constexpr float kDt = 1.0F / 60.0F;

class CollisionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    w.bounds = Rect{0.0F, 0.0F, 2000.0F, 720.0F};
    w.events.onDeath = [this](DeathCause c) { deaths.push_back(c); };
    w.events.onGemCollected = [this](int value) { gemValues.push_back(value); };
    w.events.onCheckpoint = [this](Vec2 pos) { checkpoints.push_back(pos); };
    w.events.onExitReached = [this]() { ++exits; };
  }

  void step(int frames = 1) {
    for (int i = 0; i < frames; ++i) {
      w.update(TimeStep{kDt, frame++});
    }
  }

  void setInput(const InputState& in) { w.registry.get<InputState>(w.player) = in; }

  template <typename T>
  T& player() {
    return w.registry.get<T>(w.player);
  }

  World w;
  PlayerTuning tuning{};
  uint64_t frame = 0;
  std::vector<DeathCause> deaths;
  std::vector<int> gemValues;
  std::vector<Vec2> checkpoints;
  int exits = 0;
};

TEST_F(CollisionTest, FallingPlayerLandsOnPlatformTop) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 200.0F, 20.0F}, PlatformBody{});
  PlayerController::spawn(w, tuning, Vec2{10.0F, 40.0F});

  for (int i = 0; i < 120 && !player<Grounded>().onGround; ++i) {
    step();
  }

  ASSERT_TRUE(player<Grounded>().onGround);
  EXPECT_EQ(player<Grounded>().support, platform);
  EXPECT_FLOAT_EQ(player<Transform>().pos.y, 100.0F - tuning.height);
  EXPECT_FLOAT_EQ(player<Velocity>().v.y, 0.0F);

  step(30);
  EXPECT_TRUE(player<Grounded>().onGround);
  EXPECT_FLOAT_EQ(player<Transform>().pos.y, 100.0F - tuning.height);
  EXPECT_EQ(player<AnimState>().id, AnimStateId::Idle);
}

TEST_F(CollisionTest, LargeStepDoesNotTunnelThroughPlatform) {
  addBody(w, Rect{0.0F, 100.0F, 200.0F, 20.0F}, PlatformBody{});
  PlayerController::spawn(w, tuning, Vec2{10.0F, 40.0F});
  player<Velocity>().v.y = tuning.maxFallSpeed;

  w.update(TimeStep{0.25F, 0});
  EXPECT_TRUE(player<Grounded>().onGround);
  EXPECT_FLOAT_EQ(player<Transform>().pos.y, 100.0F - tuning.height);
}

TEST_F(CollisionTest, JumpingUpThroughPlatformDoesNotLand) {
  addBody(w, Rect{0.0F, 100.0F, 200.0F, 20.0F}, PlatformBody{});
  PlayerController::spawn(w, tuning, Vec2{10.0F, 110.0F});
  player<Velocity>().v.y = -tuning.jumpSpeed;

  step();
  EXPECT_FALSE(player<Grounded>().onGround);
  EXPECT_LT(player<Velocity>().v.y, 0.0F);
}

TEST_F(CollisionTest, WalkingOffTheEdgeStartsFalling) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 100.0F, 20.0F}, PlatformBody{});
  spawnGrounded(w, tuning, 60.0F, platform);

  InputState in{};
  in.right = true;
  setInput(in);
  step(60);

  EXPECT_FALSE(player<Grounded>().onGround);
  EXPECT_GT(player<Transform>().pos.y, 100.0F - tuning.height);
  EXPECT_EQ(player<AnimState>().id, AnimStateId::Falling);
}

TEST_F(CollisionTest, JumpInputLeavesGroundThenDoubleJumps) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 200.0F, 20.0F}, PlatformBody{});
  spawnGrounded(w, tuning, 60.0F, platform);

  InputState press{};
  press.jumpPressed = true;
  press.jumpHeld = true;
  setInput(press);
  step();
  EXPECT_FALSE(player<Grounded>().onGround);
  EXPECT_FALSE(player<JumpState>().doubleJumpUsed);

  InputState hold{};
  hold.jumpHeld = true;
  setInput(hold);
  step(10);

  setInput(press);
  step();
  EXPECT_TRUE(player<JumpState>().doubleJumpUsed);

  const float vyAfterDouble = player<Velocity>().v.y;
  setInput(press);
  step();
  // Third press in the air does nothing; gravity keeps acting.
  EXPECT_GT(player<Velocity>().v.y, vyAfterDouble);
}

TEST_F(CollisionTest, MovingPlatformCarriesStandingPlayer) {
  const EntityId platform = addBody(w, Rect{10.0F, 100.0F, 120.0F, 20.0F}, PlatformBody{true});
  w.registry.emplace<Patrol>(platform, Patrol{0.0F, 300.0F, 60.0F, 1});
  spawnGrounded(w, tuning, 40.0F, platform);

  w.update(TimeStep{0.1F, 0});
  EXPECT_FLOAT_EQ(w.registry.get<Transform>(platform).pos.x, 16.0F);
  EXPECT_FLOAT_EQ(player<Transform>().pos.x, 46.0F);
  EXPECT_TRUE(player<Grounded>().onGround);
}

TEST_F(CollisionTest, PatrolTurnsAroundAtBounds) {
  const EntityId enemy =
      addBody(w, Rect{95.0F, 0.0F, 32.0F, 32.0F}, HazardBody{HazardKind::Enemy, 1});
  w.registry.emplace<Patrol>(enemy, Patrol{0.0F, 100.0F, 100.0F, 1});

  w.update(TimeStep{0.1F, 0});
  EXPECT_FLOAT_EQ(w.registry.get<Transform>(enemy).pos.x, 100.0F);
  EXPECT_EQ(w.registry.get<Patrol>(enemy).dirX, -1);

  w.update(TimeStep{0.1F, 1});
  EXPECT_FLOAT_EQ(w.registry.get<Transform>(enemy).pos.x, 90.0F);
}

TEST_F(CollisionTest, HazardHurtsAndKnocksPlayerAway) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 300.0F, 20.0F}, PlatformBody{});
  // Spike to the right of the player's centre.
  addBody(w, Rect{120.0F, 80.0F, 40.0F, 20.0F}, HazardBody{HazardKind::Spike, 1});
  spawnGrounded(w, tuning, 100.0F, platform);

  step();
  EXPECT_EQ(player<Health>().current, tuning.maxHealth - 1);
  EXPECT_TRUE(player<Invulnerability>().active);
  EXPECT_FLOAT_EQ(player<Velocity>().v.x, -tuning.knockbackX);
  EXPECT_FLOAT_EQ(player<Velocity>().v.y, -tuning.jumpSpeed * 0.5F);
  EXPECT_FALSE(player<Grounded>().onGround);
  EXPECT_EQ(player<AnimState>().id, AnimStateId::Hurt);
  EXPECT_EQ(w.hurtEvents, 1);
  EXPECT_TRUE(deaths.empty());

  // Still overlapping next frame, but invulnerable.
  step();
  EXPECT_EQ(player<Health>().current, tuning.maxHealth - 1);
  EXPECT_EQ(w.hurtEvents, 1);
}

TEST_F(CollisionTest, KnockbackPointsRightWhenHazardIsOnTheLeft) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 300.0F, 20.0F}, PlatformBody{});
  addBody(w, Rect{90.0F, 80.0F, 40.0F, 20.0F}, HazardBody{HazardKind::Spike, 1});
  spawnGrounded(w, tuning, 110.0F, platform);

  step();
  EXPECT_FLOAT_EQ(player<Velocity>().v.x, tuning.knockbackX);
}

TEST_F(CollisionTest, LethalHitReportsDeathOnce) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 300.0F, 20.0F}, PlatformBody{});
  addBody(w, Rect{100.0F, 80.0F, 40.0F, 20.0F}, HazardBody{HazardKind::Enemy, 1});
  spawnGrounded(w, tuning, 100.0F, platform);
  player<Health>().current = 1;

  step();
  ASSERT_EQ(deaths.size(), 1U);
  EXPECT_EQ(deaths.front(), DeathCause::Hazard);
  EXPECT_EQ(w.deaths, 1);
  EXPECT_EQ(player<Health>().current, 0);
  EXPECT_FALSE(player<Invulnerability>().active);
  EXPECT_FLOAT_EQ(player<Velocity>().v.x, 0.0F);
}

TEST_F(CollisionTest, LethalHitStillCollectsOverlappingGem) {
  for (const bool hazardFirst : {false, true}) {
    SCOPED_TRACE(hazardFirst ? "hazard created first" : "gem created first");
    w.registry.clear();
    w.player = kInvalidEntity;
    deaths.clear();
    gemValues.clear();

    const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 300.0F, 20.0F}, PlatformBody{});
    const Rect gemRect{100.0F, 60.0F, 24.0F, 24.0F};
    const Rect spikeRect{100.0F, 80.0F, 40.0F, 20.0F};
    EntityId gem = kInvalidEntity;
    if (hazardFirst) {
      addBody(w, spikeRect, HazardBody{HazardKind::Spike, 1});
      gem = addBody(w, gemRect, CollectibleBody{10});
    } else {
      gem = addBody(w, gemRect, CollectibleBody{10});
      addBody(w, spikeRect, HazardBody{HazardKind::Spike, 1});
    }
    spawnGrounded(w, tuning, 100.0F, platform);
    player<Health>().current = 1;

    step();
    EXPECT_EQ(deaths.size(), 1U);
    ASSERT_EQ(gemValues.size(), 1U);
    EXPECT_EQ(gemValues.front(), 10);
    EXPECT_TRUE(std::get<CollectibleBody>(w.registry.get<Collider>(gem)).collected);
  }
}

TEST_F(CollisionTest, LethalHitEndsFrameBeforeExit) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 300.0F, 20.0F}, PlatformBody{});
  addBody(w, Rect{110.0F, 36.0F, 32.0F, 64.0F}, ExitBody{});
  addBody(w, Rect{100.0F, 80.0F, 40.0F, 20.0F}, HazardBody{HazardKind::Spike, 1});
  spawnGrounded(w, tuning, 100.0F, platform);
  player<Health>().current = 1;

  step();
  EXPECT_EQ(deaths.size(), 1U);
  EXPECT_EQ(exits, 0);
}

TEST_F(CollisionTest, GemIsCollectedOnceThenDespawns) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 300.0F, 20.0F}, PlatformBody{});
  const EntityId gem = addBody(w, Rect{100.0F, 60.0F, 24.0F, 24.0F}, CollectibleBody{25});
  spawnGrounded(w, tuning, 100.0F, platform);

  step();
  ASSERT_EQ(gemValues.size(), 1U);
  EXPECT_EQ(gemValues.front(), 25);
  ASSERT_TRUE(w.registry.valid(gem));
  EXPECT_TRUE(std::get<CollectibleBody>(w.registry.get<Collider>(gem)).collected);

  step(5);
  EXPECT_EQ(gemValues.size(), 1U);

  step(30);
  EXPECT_FALSE(w.registry.valid(gem));
  EXPECT_EQ(gemValues.size(), 1U);
}

TEST_F(CollisionTest, CheckpointFiresOnFirstContactOnly) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 300.0F, 20.0F}, PlatformBody{});
  addBody(w, Rect{110.0F, 52.0F, 24.0F, 48.0F}, CheckpointBody{});
  spawnGrounded(w, tuning, 100.0F, platform);

  step(10);
  ASSERT_EQ(checkpoints.size(), 1U);
  EXPECT_EQ(checkpoints.front(), (Vec2{100.0F, 100.0F - tuning.height}));
}

TEST_F(CollisionTest, ExitReportsContact) {
  const EntityId platform = addBody(w, Rect{0.0F, 100.0F, 300.0F, 20.0F}, PlatformBody{});
  addBody(w, Rect{110.0F, 36.0F, 32.0F, 64.0F}, ExitBody{});
  spawnGrounded(w, tuning, 100.0F, platform);

  step();
  EXPECT_EQ(exits, 1);
}

TEST_F(CollisionTest, FallingBelowKillPlaneIsDeath) {
  w.bounds = Rect{0.0F, 0.0F, 500.0F, 300.0F};
  w.killPlaneMargin = 100.0F;
  PlayerController::spawn(w, tuning, Vec2{10.0F, 390.0F});

  step();
  EXPECT_TRUE(deaths.empty());

  player<Transform>().pos.y = 401.0F;
  step();
  ASSERT_EQ(deaths.size(), 1U);
  EXPECT_EQ(deaths.front(), DeathCause::Fell);
}

TEST_F(CollisionTest, NoPlayerNoWork) {
  addBody(w, Rect{0.0F, 100.0F, 300.0F, 20.0F}, PlatformBody{});
  step(3);
  EXPECT_EQ(w.deaths, 0);
  EXPECT_EQ(w.hurtEvents, 0);
}

TEST_F(CollisionTest, DestroyingPlayerClearsHandle) {
  const EntityId p = PlayerController::spawn(w, tuning, Vec2{});
  w.destroy(p);
  EXPECT_EQ(w.player, kInvalidEntity);
  step();
}

}  // namespace
