#pragma once

#include <entt/entt.hpp>

using EntityId = entt::entity;
inline constexpr EntityId kInvalidEntity = entt::null;

inline bool isAlive(const entt::registry& reg, EntityId id) {
  return id != kInvalidEntity && reg.valid(id);
}
