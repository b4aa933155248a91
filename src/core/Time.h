#pragma once

#include <cstdint>

struct TimeStep {
  float dt = 0.0F;  // seconds
  uint64_t frame = 0;
};

inline constexpr float kMaxFrameDt = 0.25F;        // long stalls don't tunnel the simulation
inline constexpr float kHeadlessDt = 1.0F / 60.0F;
