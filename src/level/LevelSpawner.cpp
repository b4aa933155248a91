#include "level/LevelSpawner.h"

#include <utility>
#include <vector>

#include "ecs/Components.h"
#include "ecs/World.h"
#include "player/PlayerController.h"

namespace {

EntityId spawnBody(World& w, const Rect& rect, Collider collider) {
  const EntityId e = w.create();
  w.registry.emplace<LevelEntityTag>(e);
  w.registry.emplace<Transform>(e, Transform{Vec2{rect.x, rect.y}});
  w.registry.emplace<AABB>(e, AABB{rect.w, rect.h});
  w.registry.emplace<Collider>(e, std::move(collider));
  return e;
}

}  // namespace

void LevelSpawner::clear(World& w) {
  auto view = w.registry.view<LevelEntityTag>();
  const std::vector<EntityId> doomed(view.begin(), view.end());
  for (EntityId e : doomed) {
    w.destroy(e);
  }
  w.player = kInvalidEntity;
}

EntityId LevelSpawner::spawn(World& w,
                             const LevelLayout& layout,
                             const PlayerTuning& player,
                             Vec2 playerPos) {
  w.bounds = layout.bounds;

  for (const PlatformPlacement& p : layout.platforms) {
    const EntityId e = spawnBody(w, p.rect, PlatformBody{p.moving});
    if (p.moving)
      w.registry.emplace<Patrol>(e, Patrol{p.minX, p.maxX, p.speed, 1});
  }

  for (const HazardPlacement& h : layout.hazards) {
    const EntityId e = spawnBody(w, h.rect, HazardBody{h.kind, h.damage});
    if (h.kind == HazardKind::Enemy)
      w.registry.emplace<Patrol>(e, Patrol{h.minX, h.maxX, h.speed, 1});
  }

  for (const GemPlacement& g : layout.gems) {
    (void)spawnBody(w, g.rect, CollectibleBody{g.value, false, 0.0F});
  }

  (void)spawnBody(w, layout.checkpoint, CheckpointBody{});
  (void)spawnBody(w, layout.exit, ExitBody{});

  return PlayerController::spawn(w, player, playerPos);
}
