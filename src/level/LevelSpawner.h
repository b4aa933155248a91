#pragma once

#include "config/GameConfig.h"
#include "ecs/Entity.h"
#include "level/LevelLayout.h"

class World;

namespace LevelSpawner {

// Destroys every level entity (player included). Safe to call on an empty world.
void clear(World& w);

// Spawns the layout's entities plus the player at `playerPos`; returns the player.
EntityId spawn(World& w, const LevelLayout& layout, const PlayerTuning& player, Vec2 playerPos);

}  // namespace LevelSpawner
