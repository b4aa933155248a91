#include "config/GameConfig.h"

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace {

template <typename T>
void read(const toml::table& t, std::string_view key, T& out) {
  if (auto v = t.get(key))
    out = v->value_or(out);
}

float clampPositive(float v, float fallback) {
  return (v > 0.0F) ? v : fallback;
}

float clampNonNegative(float v) {
  return std::max(0.0F, v);
}

int clampNonNegative(int v) {
  return std::max(0, v);
}

void loadPlayer(const toml::table& t, const char* path, PlayerTuning& p) {
  TomlUtil::warnUnknownKeys(t, path, "player",
                            {"move_speed", "jump_speed", "gravity", "max_fall_speed", "max_health",
                             "invulnerability_seconds", "knockback_x", "can_double_jump", "width",
                             "height"});
  read(t, "move_speed", p.moveSpeed);
  read(t, "jump_speed", p.jumpSpeed);
  read(t, "gravity", p.gravity);
  read(t, "max_fall_speed", p.maxFallSpeed);
  read(t, "max_health", p.maxHealth);
  read(t, "invulnerability_seconds", p.invulnerabilitySeconds);
  read(t, "knockback_x", p.knockbackX);
  read(t, "can_double_jump", p.canDoubleJump);
  read(t, "width", p.width);
  read(t, "height", p.height);
}

void loadLevel(const toml::table& t, const char* path, LevelTuning& l) {
  TomlUtil::warnUnknownKeys(
      t, path, "level",
      {"level_count",         "gap_base",           "gap_per_level",
       "platform_speed_base", "platform_speed_per_level", "hazard_base",
       "hazard_per_level",    "enemy_per_level",    "gem_base",
       "gem_per_level",       "platform_base",      "time_limit_base",
       "time_limit_per_level", "platform_width",    "platform_height",
       "platform_base_y",     "platform_band",      "world_height",
       "spawn_inset_x",       "spawn_clearance",    "kill_plane_margin",
       "gem_size",            "gem_hover_min",      "gem_hover_range",
       "spike_width",         "spike_height",       "enemy_width",
       "enemy_height",        "enemy_speed_base",   "enemy_speed_per_level",
       "hazard_damage"});
  read(t, "level_count", l.levelCount);
  read(t, "gap_base", l.gapBase);
  read(t, "gap_per_level", l.gapPerLevel);
  read(t, "platform_speed_base", l.platformSpeedBase);
  read(t, "platform_speed_per_level", l.platformSpeedPerLevel);
  read(t, "hazard_base", l.hazardBase);
  read(t, "hazard_per_level", l.hazardPerLevel);
  read(t, "enemy_per_level", l.enemyPerLevel);
  read(t, "gem_base", l.gemBase);
  read(t, "gem_per_level", l.gemPerLevel);
  read(t, "platform_base", l.platformBase);
  read(t, "time_limit_base", l.timeLimitBase);
  read(t, "time_limit_per_level", l.timeLimitPerLevel);
  read(t, "platform_width", l.platformWidth);
  read(t, "platform_height", l.platformHeight);
  read(t, "platform_base_y", l.platformBaseY);
  read(t, "platform_band", l.platformBand);
  read(t, "world_height", l.worldHeight);
  read(t, "spawn_inset_x", l.spawnInsetX);
  read(t, "spawn_clearance", l.spawnClearance);
  read(t, "kill_plane_margin", l.killPlaneMargin);
  read(t, "gem_size", l.gemSize);
  read(t, "gem_hover_min", l.gemHoverMin);
  read(t, "gem_hover_range", l.gemHoverRange);
  read(t, "spike_width", l.spikeWidth);
  read(t, "spike_height", l.spikeHeight);
  read(t, "enemy_width", l.enemyWidth);
  read(t, "enemy_height", l.enemyHeight);
  read(t, "enemy_speed_base", l.enemySpeedBase);
  read(t, "enemy_speed_per_level", l.enemySpeedPerLevel);
  read(t, "hazard_damage", l.hazardDamage);
}

void loadSession(const toml::table& t, const char* path, SessionTuning& s) {
  TomlUtil::warnUnknownKeys(t, path, "session",
                            {"max_lives", "rescue_bonus_seconds", "completion_gem_bonus",
                             "time_bonus_per_second", "gem_value", "seed", "ad_gated_levels"});
  read(t, "max_lives", s.maxLives);
  read(t, "rescue_bonus_seconds", s.rescueBonusSeconds);
  read(t, "completion_gem_bonus", s.completionGemBonus);
  read(t, "time_bonus_per_second", s.timeBonusPerSecond);
  read(t, "gem_value", s.gemValue);
  if (auto v = t.get("seed")) {
    if (auto seed = v->value<std::int64_t>()) {
      s.seed = static_cast<std::uint64_t>(*seed);
    } else {
      TomlUtil::warnf(path, "session.seed must be an integer");
    }
  }
  TomlUtil::readIntArray(t, "ad_gated_levels", path, "session", s.adGatedLevels);
}

void loadRender(const toml::table& t, const char* path, RenderTuning& r) {
  TomlUtil::warnUnknownKeys(t, path, "render",
                            {"player_sprite", "gem_sprite", "background", "rewarded_ad_seconds"});
  read(t, "player_sprite", r.playerSprite);
  read(t, "gem_sprite", r.gemSprite);
  read(t, "background", r.background);
  read(t, "rewarded_ad_seconds", r.rewardedAdSeconds);
}

void clampValues(GameConfig& c, const char* path) {
  const PlayerTuning defaults{};
  PlayerTuning& p = c.player;
  p.moveSpeed = clampNonNegative(p.moveSpeed);
  p.jumpSpeed = clampNonNegative(p.jumpSpeed);
  p.gravity = clampNonNegative(p.gravity);
  p.maxFallSpeed = clampPositive(p.maxFallSpeed, defaults.maxFallSpeed);
  p.maxHealth = std::max(1, p.maxHealth);
  p.invulnerabilitySeconds = clampNonNegative(p.invulnerabilitySeconds);
  p.knockbackX = clampNonNegative(p.knockbackX);
  p.width = clampPositive(p.width, defaults.width);
  p.height = clampPositive(p.height, defaults.height);

  const LevelTuning ld{};
  LevelTuning& l = c.level;
  l.levelCount = std::max(1, l.levelCount);
  l.gapBase = clampNonNegative(l.gapBase);
  l.gapPerLevel = clampNonNegative(l.gapPerLevel);
  l.platformSpeedBase = clampNonNegative(l.platformSpeedBase);
  l.platformSpeedPerLevel = clampNonNegative(l.platformSpeedPerLevel);
  l.hazardBase = clampNonNegative(l.hazardBase);
  l.hazardPerLevel = clampNonNegative(l.hazardPerLevel);
  l.enemyPerLevel = clampNonNegative(l.enemyPerLevel);
  l.gemBase = clampNonNegative(l.gemBase);
  l.gemPerLevel = clampNonNegative(l.gemPerLevel);
  l.platformBase = std::max(2, l.platformBase);
  l.timeLimitBase = clampPositive(l.timeLimitBase, ld.timeLimitBase);
  l.timeLimitPerLevel = clampNonNegative(l.timeLimitPerLevel);
  l.platformWidth = clampPositive(l.platformWidth, ld.platformWidth);
  l.platformHeight = clampPositive(l.platformHeight, ld.platformHeight);
  l.platformBand = clampNonNegative(l.platformBand);
  l.worldHeight = clampPositive(l.worldHeight, ld.worldHeight);
  l.killPlaneMargin = clampNonNegative(l.killPlaneMargin);
  l.gemSize = clampPositive(l.gemSize, ld.gemSize);
  l.gemHoverRange = clampNonNegative(l.gemHoverRange);
  l.spikeWidth = clampPositive(l.spikeWidth, ld.spikeWidth);
  l.spikeHeight = clampPositive(l.spikeHeight, ld.spikeHeight);
  l.enemyWidth = clampPositive(l.enemyWidth, ld.enemyWidth);
  l.enemyHeight = clampPositive(l.enemyHeight, ld.enemyHeight);
  l.enemySpeedBase = clampNonNegative(l.enemySpeedBase);
  l.enemySpeedPerLevel = clampNonNegative(l.enemySpeedPerLevel);
  l.hazardDamage = std::max(1, l.hazardDamage);

  SessionTuning& s = c.session;
  s.maxLives = std::max(1, s.maxLives);
  s.rescueBonusSeconds = clampNonNegative(s.rescueBonusSeconds);
  s.completionGemBonus = clampNonNegative(s.completionGemBonus);
  s.timeBonusPerSecond = clampNonNegative(s.timeBonusPerSecond);
  s.gemValue = clampNonNegative(s.gemValue);

  std::vector<int> gated;
  for (int level : s.adGatedLevels) {
    // Level 1 is always playable.
    if (level < 2 || level > l.levelCount) {
      TomlUtil::warnf(path, "session.ad_gated_levels: level {} out of range 2..{}; ignoring",
                      level, l.levelCount);
      continue;
    }
    gated.push_back(level);
  }
  std::ranges::sort(gated);
  const auto dup = std::ranges::unique(gated);
  gated.erase(dup.begin(), dup.end());
  s.adGatedLevels = std::move(gated);

  c.render.rewardedAdSeconds = clampNonNegative(c.render.rewardedAdSeconds);
}

}  // namespace

bool GameConfig::loadFromToml(const char* path) {
  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    TomlUtil::warnf(path, "parse failed: {}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root", {"version", "player", "level", "session", "render"});

  GameConfig next{};
  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  if (auto t = tbl["player"].as_table())
    loadPlayer(*t, path, next.player);
  if (auto t = tbl["level"].as_table())
    loadLevel(*t, path, next.level);
  if (auto t = tbl["session"].as_table())
    loadSession(*t, path, next.session);
  if (auto t = tbl["render"].as_table())
    loadRender(*t, path, next.render);

  clampValues(next, path);

  *this = std::move(next);
  return true;
}

bool parseHexColor(const std::string& text, std::uint32_t& out) {
  std::string_view s = text;
  if (!s.empty() && s.front() == '#')
    s.remove_prefix(1);
  if (s.size() != 6)
    return false;
  std::uint32_t value = 0;
  for (char ch : s) {
    value <<= 4U;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  out = value;
  return true;
}
