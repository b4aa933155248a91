#pragma once

#include "core/Time.h"

class World;

namespace Systems {

inline constexpr float kCollectFadeSeconds = 0.3F;
inline constexpr float kSupportProbe = 1.0F;  // px below the feet

// Moving platforms and patrolling enemies; carries a player standing on a moving platform.
void patrols(World& w, TimeStep ts);
// Reads the player's InputState: support probe, jump requests.
void playerControl(World& w, TimeStep ts);
void integrate(World& w, TimeStep ts);
void invulnerability(World& w, TimeStep ts);
void resolveCollisions(World& w, TimeStep ts);
// Fades out and detaches picked-up collectibles.
void collectibleEffects(World& w, TimeStep ts);
void deriveAnimState(World& w, TimeStep ts);

}  // namespace Systems
