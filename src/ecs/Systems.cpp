#include "ecs/Systems.h"

#include <algorithm>
#include <cmath>
#include <variant>
#include <vector>

#include "config/GameConfig.h"
#include "core/Time.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"
#include "ecs/World.h"
#include "player/Kinematics.h"
#include "player/PlayerController.h"
#include "util/Math.h"

namespace Systems {

namespace {

bool hasPlayer(const World& w) {
  return isAlive(w.registry, w.player) &&
         w.registry.all_of<PlayerTag, Transform, PrevTransform, Velocity, AABB, Grounded,
                           JumpState, Health, Invulnerability, PlayerTuning>(w.player);
}

bool isPlatform(const Collider& c) {
  return std::holds_alternative<PlatformBody>(c);
}

// Resolution order for overlapping contacts: pickups and checkpoints, then hazards, then the
// exit. A lethal hit stops the frame but never cancels a pickup it shares.
int contactRank(const Collider& c) {
  if (std::holds_alternative<HazardBody>(c))
    return 1;
  if (std::holds_alternative<ExitBody>(c))
    return 2;
  return 0;
}

// Platform directly under the feet (within the probe distance), or kInvalidEntity.
EntityId findSupport(World& w, const Rect& playerRect, EntityId preferred) {
  const Rect probe{playerRect.x, playerRect.bottom(), playerRect.w, kSupportProbe};
  auto supports = [&](EntityId e) {
    const Rect r = rectOf(w.registry.get<Transform>(e), w.registry.get<AABB>(e));
    return util::aabbOverlap(probe, r) &&
           std::fabs(r.top() - playerRect.bottom()) <= kSupportProbe;
  };

  if (isAlive(w.registry, preferred) && w.registry.all_of<Collider, Transform, AABB>(preferred) &&
      isPlatform(w.registry.get<Collider>(preferred)) && supports(preferred)) {
    return preferred;
  }

  auto view = w.registry.view<Collider, Transform, AABB>();
  for (auto entity : view) {
    if (isPlatform(view.get<Collider>(entity)) && supports(entity))
      return entity;
  }
  return kInvalidEntity;
}

void notifyDeath(World& w, DeathCause cause) {
  ++w.deaths;
  if (w.events.onDeath)
    w.events.onDeath(cause);
}

// Applies one non-platform contact. `died` tells the caller to stop resolving this frame.
struct ContactVisitor {
  World& w;
  EntityId player;
  const Rect& playerRect;
  const Rect& otherRect;
  bool died = false;

  void operator()(PlatformBody&) {}

  void operator()(HazardBody& hazard) {
    auto& reg = w.registry;
    const auto result = PlayerController::applyDamage(
        reg.get<Health>(player), reg.get<Invulnerability>(player), reg.get<Velocity>(player),
        reg.get<Grounded>(player), hazard.damage, util::awayFrom(playerRect, otherRect),
        reg.get<PlayerTuning>(player));
    if (result == PlayerController::DamageResult::Ignored)
      return;
    ++w.hurtEvents;
    if (result == PlayerController::DamageResult::Killed) {
      died = true;
      notifyDeath(w, DeathCause::Hazard);
    }
  }

  void operator()(CollectibleBody& gem) {
    if (gem.collected)
      return;
    gem.collected = true;
    gem.despawnTimer = kCollectFadeSeconds;
    if (w.events.onGemCollected)
      w.events.onGemCollected(gem.value);
  }

  void operator()(CheckpointBody& cp) {
    if (cp.reached)
      return;
    cp.reached = true;
    if (w.events.onCheckpoint)
      w.events.onCheckpoint(w.registry.get<Transform>(player).pos);
  }

  void operator()(ExitBody&) {
    if (w.events.onExitReached)
      w.events.onExitReached();
  }
};

}  // namespace

void patrols(World& w, TimeStep ts) {
  const bool carry = hasPlayer(w);
  auto view = w.registry.view<Patrol, Transform>();
  for (auto entity : view) {
    auto& p = view.get<Patrol>(entity);
    auto& t = view.get<Transform>(entity);

    const float prevX = t.pos.x;
    t.pos.x += static_cast<float>(p.dirX) * p.speed * ts.dt;
    if (t.pos.x <= p.minX) {
      t.pos.x = p.minX;
      p.dirX = 1;
    } else if (t.pos.x >= p.maxX) {
      t.pos.x = p.maxX;
      p.dirX = -1;
    }

    if (!carry)
      continue;
    const auto& g = w.registry.get<Grounded>(w.player);
    if (g.onGround && g.support == entity)
      w.registry.get<Transform>(w.player).pos.x += t.pos.x - prevX;
  }
}

void playerControl(World& w, TimeStep ts) {
  (void)ts;
  if (!hasPlayer(w) || !w.registry.all_of<InputState>(w.player))
    return;

  auto& reg = w.registry;
  const EntityId e = w.player;
  auto& t = reg.get<Transform>(e);
  auto& g = reg.get<Grounded>(e);
  reg.get<PrevTransform>(e).pos = t.pos;

  // Walking off an edge (or a platform sliding away) drops the player.
  if (g.onGround) {
    const EntityId support = findSupport(w, rectOf(t, reg.get<AABB>(e)), g.support);
    if (support == kInvalidEntity) {
      g.onGround = false;
      g.support = kInvalidEntity;
    } else {
      g.support = support;
    }
  }

  const auto& in = reg.get<InputState>(e);
  if (in.jumpPressed) {
    (void)PlayerController::requestJump(reg.get<Velocity>(e), g, reg.get<JumpState>(e),
                                        reg.get<PlayerTuning>(e));
  }
}

void integrate(World& w, TimeStep ts) {
  auto view =
      w.registry.view<PlayerTag, Transform, Velocity, Grounded, Facing, InputState, PlayerTuning>();
  for (auto entity : view) {
    const auto& in = view.get<InputState>(entity);
    Kinematics::step(view.get<Transform>(entity), view.get<Velocity>(entity),
                     view.get<Facing>(entity), view.get<Grounded>(entity).onGround,
                     in.horizontal(), ts.dt, view.get<PlayerTuning>(entity));
  }
}

void invulnerability(World& w, TimeStep ts) {
  auto view = w.registry.view<Invulnerability>();
  for (auto entity : view) {
    PlayerController::tickInvulnerability(view.get<Invulnerability>(entity), ts.dt);
  }
}

void resolveCollisions(World& w, TimeStep ts) {
  (void)ts;
  if (!hasPlayer(w))
    return;

  auto& reg = w.registry;
  const EntityId player = w.player;
  auto& t = reg.get<Transform>(player);
  auto& v = reg.get<Velocity>(player);
  auto& g = reg.get<Grounded>(player);
  const auto& box = reg.get<AABB>(player);
  const Vec2 prevPos = reg.get<PrevTransform>(player).pos;

  auto colliders = reg.view<Collider, Transform, AABB>();

  // Platforms first: landing decides onGround for everything else this frame.
  if (v.v.y > 0.0F) {
    const float prevBottom = prevPos.y + box.h;
    const Rect swept = util::unionRect(Rect{prevPos.x, prevPos.y, box.w, box.h}, rectOf(t, box));
    EntityId landOn = kInvalidEntity;
    float landTop = 0.0F;
    for (auto entity : colliders) {
      if (!isPlatform(colliders.get<Collider>(entity)))
        continue;
      const Rect r = rectOf(colliders.get<Transform>(entity), colliders.get<AABB>(entity));
      if (prevBottom > r.top() + kSupportProbe || !util::aabbOverlap(swept, r))
        continue;
      // Highest surface wins when the sweep crosses several.
      if (landOn == kInvalidEntity || r.top() < landTop) {
        landOn = entity;
        landTop = r.top();
      }
    }
    if (landOn != kInvalidEntity) {
      PlayerController::land(t, v, g, reg.get<JumpState>(player), box, landTop, landOn);
    }
  }

  const Rect playerRect = rectOf(t, box);
  std::vector<EntityId> contacts;
  for (auto entity : colliders) {
    if (isPlatform(colliders.get<Collider>(entity)))
      continue;
    const Rect r = rectOf(colliders.get<Transform>(entity), colliders.get<AABB>(entity));
    if (util::aabbOverlap(playerRect, r))
      contacts.push_back(entity);
  }
  std::stable_sort(contacts.begin(), contacts.end(), [&reg](EntityId lhs, EntityId rhs) {
    return contactRank(reg.get<Collider>(lhs)) < contactRank(reg.get<Collider>(rhs));
  });

  for (EntityId other : contacts) {
    if (!reg.valid(other))
      continue;
    const Rect otherRect = rectOf(reg.get<Transform>(other), reg.get<AABB>(other));
    ContactVisitor visitor{w, player, playerRect, otherRect};
    std::visit(visitor, reg.get<Collider>(other));
    if (visitor.died)
      return;
  }

  if (t.pos.y > w.bounds.bottom() + w.killPlaneMargin)
    notifyDeath(w, DeathCause::Fell);
}

void collectibleEffects(World& w, TimeStep ts) {
  std::vector<EntityId> finished;
  auto view = w.registry.view<Collider>();
  for (auto entity : view) {
    auto* gem = std::get_if<CollectibleBody>(&view.get<Collider>(entity));
    if (gem == nullptr || !gem->collected)
      continue;
    gem->despawnTimer -= ts.dt;
    if (gem->despawnTimer <= 0.0F)
      finished.push_back(entity);
  }

  for (EntityId id : finished) {
    w.destroy(id);
  }
}

void deriveAnimState(World& w, TimeStep ts) {
  auto view = w.registry.view<PlayerTag, Velocity, Invulnerability, AnimState>();
  for (auto entity : view) {
    auto& anim = view.get<AnimState>(entity);
    const AnimStateId next = PlayerController::animStateFor(view.get<Velocity>(entity),
                                                            view.get<Invulnerability>(entity));
    if (next != anim.id) {
      anim.id = next;
      anim.timer = 0.0F;
    } else {
      anim.timer += ts.dt;
    }
  }
}

}  // namespace Systems
