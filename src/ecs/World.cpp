#include "ecs/World.h"

#include "ecs/Systems.h"

const char* deathCauseName(DeathCause cause) {
  switch (cause) {
    case DeathCause::Hazard:
      return "hazard";
    case DeathCause::TimeUp:
      return "time up";
    case DeathCause::Fell:
      return "fell";
  }
  return "unknown";
}

EntityId World::create() {
  return registry.create();
}

void World::destroy(EntityId id) {
  if (id == player)
    player = kInvalidEntity;
  registry.destroy(id);
}

void World::update(TimeStep ts) {
  Systems::patrols(*this, ts);
  Systems::playerControl(*this, ts);
  Systems::integrate(*this, ts);
  Systems::invulnerability(*this, ts);
  Systems::resolveCollisions(*this, ts);
  Systems::collectibleEffects(*this, ts);
  Systems::deriveAnimState(*this, ts);
}
