#include "game/Session.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <string>
#include <utility>

#include "core/SaveData.h"
#include "level/LevelSpawner.h"
#include "player/PlayerController.h"
#include "util/Log.h"

const char* gameStateName(GameState state) {
  switch (state) {
    case GameState::Loading:
      return "loading";
    case GameState::Playing:
      return "playing";
    case GameState::Paused:
      return "paused";
    case GameState::LevelComplete:
      return "level complete";
    case GameState::GameOver:
      return "game over";
    case GameState::Menu:
      return "menu";
  }
  return "unknown";
}

Session::Session(GameConfig cfg, AnalyticsSink& analytics, Options opts)
    : cfg_(std::move(cfg)),
      analytics_(analytics),
      opts_(std::move(opts)),
      generator_(cfg_.level, cfg_.session.gemValue) {
  world_.killPlaneMargin = cfg_.level.killPlaneMargin;
  world_.events.onDeath = [this](DeathCause cause) { onPlayerDeath(cause); };
  world_.events.onGemCollected = [this](int value) { onGemCollected(value); };
  world_.events.onCheckpoint = [this](Vec2 pos) { onCheckpointReached(pos); };
  world_.events.onExitReached = [this]() { onExitReached(); };

  state_.lives = cfg_.session.maxLives;

  SaveData save{};
  if (!opts_.savePath.empty())
    (void)loadSaveData(opts_.savePath, save);  // failures already logged; `save` holds defaults
  state_.level = generator_.isValidLevel(save.currentLevel) ? save.currentLevel : 1;
  state_.gemBank = save.totalGems;
  state_.score = save.score;
  for (int level : save.unlockedLevels) {
    if (generator_.isValidLevel(level))
      state_.unlockedLevels.push_back(level);
  }
}

bool Session::loadLevel(int levelIndex, bool resumeAtCheckpoint) {
  LevelLayout next{};
  if (!generator_.generate(levelIndex, cfg_.session.seed, next)) {
    Log::errorf("session", "cannot load level {}; staying in {}", levelIndex,
                gameStateName(state_.state));
    return false;
  }

  state_.state = GameState::Loading;
  levelReady_ = false;

  if (!resumeAtCheckpoint)
    state_.lastCheckpoint.reset();
  const Vec2 spawnAt = state_.lastCheckpoint.value_or(next.spawn);

  LevelSpawner::clear(world_);
  (void)LevelSpawner::spawn(world_, next, cfg_.player, spawnAt);

  layout_ = std::move(next);
  state_.level = levelIndex;
  state_.gemsCollected = 0;
  state_.totalGems = static_cast<int>(layout_.gems.size());
  state_.timeLimit = layout_.difficulty.timeLimit;
  state_.timeRemaining = state_.timeLimit;
  state_.gameComplete = false;
  state_.unlockPromptLevel = 0;
  state_.lastTimeBonus = 0;
  levelCompleted_ = false;
  timeUpLatched_ = false;
  scoreAtLevelStart_ = state_.score;

  Log::infof("session", "level {} ready: {} platforms, {} hazards, {} gems, {:.0f}s", levelIndex,
             layout_.platforms.size(), layout_.hazards.size(), layout_.gems.size(),
             state_.timeLimit);

  if (!runStarted_) {
    runStarted_ = true;
    emit("game_start", {{"level", std::to_string(levelIndex)}});
  }
  emit("level_start", {{"level", std::to_string(levelIndex)}});

  levelReady_ = true;
  state_.state = GameState::Playing;
  return true;
}

void Session::tick(TimeStep ts, const InputState& input) {
  if (!levelReady_ || state_.state != GameState::Playing)
    return;

  if (isAlive(world_.registry, world_.player)) {
    if (auto* in = world_.registry.try_get<InputState>(world_.player))
      *in = input;
  }

  world_.update(ts);

  // A death or completion during the update may have left `playing`.
  if (state_.state != GameState::Playing)
    return;

  state_.timeRemaining = std::max(0.0F, state_.timeRemaining - ts.dt);
  if (state_.timeRemaining <= 0.0F && !timeUpLatched_) {
    timeUpLatched_ = true;
    onPlayerDeath(DeathCause::TimeUp);
  }
}

void Session::pause() {
  if (state_.state != GameState::Playing)
    return;
  state_.state = GameState::Paused;
}

void Session::resume() {
  if (state_.state != GameState::Paused)
    return;
  state_.state = GameState::Playing;
}

void Session::togglePause() {
  if (state_.state == GameState::Playing) {
    pause();
  } else if (state_.state == GameState::Paused) {
    resume();
  }
}

bool Session::restartLevel() {
  if (!levelReady_)
    return false;
  state_.lives = cfg_.session.maxLives;
  state_.score = scoreAtLevelStart_;
  state_.lastCheckpoint.reset();
  return loadLevel(state_.level);
}

bool Session::continueFromCheckpoint() {
  if (state_.state != GameState::GameOver)
    return false;
  state_.lives = cfg_.session.maxLives;
  state_.score = scoreAtLevelStart_;
  return loadLevel(state_.level, true);
}

bool Session::nextLevel() {
  if (state_.state != GameState::LevelComplete) {
    Log::warnf("session", "next level ignored while {}", gameStateName(state_.state));
    return false;
  }

  const int next = state_.level + 1;
  if (!generator_.isValidLevel(next)) {
    if (!state_.gameComplete) {
      state_.gameComplete = true;
      Log::infof("session", "all {} levels complete, final score {}", levelCount(), state_.score);
      emit("game_complete",
           {{"score", std::to_string(state_.score)}, {"gems", std::to_string(state_.gemBank)}});
    }
    return false;
  }

  if (!isLevelUnlocked(next)) {
    state_.unlockPromptLevel = next;
    Log::infof("session", "level {} is locked", next);
    return false;
  }
  return loadLevel(next);
}

bool Session::startNewGame() {
  state_.score = 0;
  state_.lives = cfg_.session.maxLives;
  state_.lastCheckpoint.reset();
  state_.gameComplete = false;
  runStarted_ = false;
  return loadLevel(1);
}

bool Session::loadSpecificLevel(int levelIndex) {
  if (generator_.isValidLevel(levelIndex) && !isLevelUnlocked(levelIndex)) {
    Log::warnf("session", "level {} is locked", levelIndex);
    return false;
  }

  const SessionState before = state_;
  state_.lives = cfg_.session.maxLives;
  state_.lastCheckpoint.reset();
  if (!loadLevel(levelIndex)) {
    state_ = before;
    return false;
  }
  return true;
}

void Session::goToMenu() {
  state_.state = GameState::Menu;
}

bool Session::resetProgress() {
  if (state_.state != GameState::Menu || pendingAdLevel_ != 0)
    return false;
  if (!opts_.savePath.empty() && !deleteSaveData(opts_.savePath)) {
    Log::warnf("session", "could not delete save {}", opts_.savePath);
    return false;
  }

  LevelSpawner::clear(world_);
  levelReady_ = false;
  levelCompleted_ = false;
  runStarted_ = false;

  SessionState fresh{};
  fresh.lives = cfg_.session.maxLives;
  state_ = std::move(fresh);
  scoreAtLevelStart_ = 0;
  emit("progress_reset");
  Log::infof("session", "progress reset");
  return true;
}

bool Session::requestRewardedAd(int levelIndex) {
  if (pendingAdLevel_ != 0 || !generator_.isValidLevel(levelIndex) ||
      isLevelUnlocked(levelIndex)) {
    return false;
  }
  pendingAdLevel_ = levelIndex;
  emit("rewarded_ad_started", {{"level_to_unlock", std::to_string(levelIndex)}});
  return true;
}

void Session::finishRewardedAd(bool completed) {
  if (pendingAdLevel_ == 0)
    return;
  const int level = pendingAdLevel_;
  pendingAdLevel_ = 0;

  if (!completed) {
    emit("rewarded_ad_failed", {{"level_to_unlock", std::to_string(level)}});
    return;
  }

  emit("rewarded_ad_completed", {{"level_unlocked", std::to_string(level)}});
  unlockLevel(level, "rewarded_ad");
  if (state_.unlockPromptLevel == level)
    state_.unlockPromptLevel = 0;
  persist();
}

bool Session::isLevelUnlocked(int levelIndex) const {
  if (!generator_.isValidLevel(levelIndex))
    return false;
  return levelIndex == 1 || std::ranges::binary_search(state_.unlockedLevels, levelIndex);
}

bool Session::isAdGated(int levelIndex) const {
  return std::ranges::find(cfg_.session.adGatedLevels, levelIndex) !=
         cfg_.session.adGatedLevels.end();
}

void Session::onPlayerDeath(DeathCause cause) {
  if (state_.state != GameState::Playing)
    return;

  ++deathCount_;
  state_.lives = std::max(0, state_.lives - 1);
  emit("level_fail", {{"level", std::to_string(state_.level)},
                      {"cause", deathCauseName(cause)},
                      {"score", std::to_string(state_.score)},
                      {"gems", std::to_string(state_.gemsCollected)},
                      {"lives_remaining", std::to_string(state_.lives)}});

  if (state_.lives <= 0) {
    state_.state = GameState::GameOver;
    Log::infof("session", "game over on level {} ({})", state_.level, deathCauseName(cause));
    return;
  }

  const Vec2 at = state_.lastCheckpoint.value_or(layout_.spawn);
  PlayerController::respawn(world_, world_.player, at);
  state_.timeRemaining =
      std::min(state_.timeRemaining + cfg_.session.rescueBonusSeconds, state_.timeLimit);
  // Each respawn is a fresh attempt; with no time left it runs out again on the next tick.
  timeUpLatched_ = false;
  Log::infof("session", "died ({}), {} lives left", deathCauseName(cause), state_.lives);
}

void Session::onGemCollected(int value) {
  if (state_.state != GameState::Playing)
    return;

  state_.score += std::max(0, value);
  state_.gemsCollected = std::min(state_.gemsCollected + 1, state_.totalGems);
  emit("gem_collected", {{"level", std::to_string(state_.level)},
                         {"value", std::to_string(value)},
                         {"gems", std::to_string(state_.gemsCollected)}});

  if (state_.totalGems > 0 && state_.gemsCollected >= state_.totalGems)
    completeLevel();
}

void Session::onCheckpointReached(Vec2 pos) {
  if (state_.state != GameState::Playing)
    return;
  state_.lastCheckpoint = pos;
  Log::infof("session", "checkpoint at ({:.0f}, {:.0f})", pos.x, pos.y);
}

void Session::onExitReached() {
  completeLevel();
}

void Session::completeLevel() {
  if (levelCompleted_ || state_.state != GameState::Playing)
    return;
  levelCompleted_ = true;

  const int timeBonus =
      static_cast<int>(std::lround(state_.timeRemaining * cfg_.session.timeBonusPerSecond));
  state_.lastTimeBonus = timeBonus;
  state_.score += timeBonus;
  state_.gemBank += state_.gemsCollected + cfg_.session.completionGemBonus;
  state_.state = GameState::LevelComplete;

  const int next = state_.level + 1;
  if (generator_.isValidLevel(next) && !isLevelUnlocked(next)) {
    if (isAdGated(next)) {
      state_.unlockPromptLevel = next;
      emit("unlock_prompt_shown", {{"level", std::to_string(next)}});
    } else {
      unlockLevel(next, "level_complete");
    }
  }

  persist();
  emit("level_complete", {{"level", std::to_string(state_.level)},
                          {"score", std::to_string(state_.score)},
                          {"gems", std::to_string(state_.gemsCollected)},
                          {"time_bonus", std::to_string(timeBonus)},
                          {"time_remaining", std::format("{:.1f}", state_.timeRemaining)}});
}

void Session::unlockLevel(int levelIndex, std::string_view method) {
  auto& unlocked = state_.unlockedLevels;
  if (levelIndex <= 1 || std::ranges::binary_search(unlocked, levelIndex))
    return;
  unlocked.insert(std::ranges::upper_bound(unlocked, levelIndex), levelIndex);
  emit("level_unlocked", {{"level", std::to_string(levelIndex)}, {"method", std::string(method)}});
}

void Session::persist() {
  if (opts_.savePath.empty())
    return;
  SaveData data{};
  data.currentLevel = state_.level;
  data.totalGems = state_.gemBank;
  data.score = state_.score;
  data.unlockedLevels = state_.unlockedLevels;
  if (!saveSaveData(opts_.savePath, data))
    Log::warnf("session", "progress not saved to {}", opts_.savePath);
}

void Session::emit(std::string_view name, AnalyticsParams params) {
  try {
    analytics_.logEvent(name, params);
  } catch (const std::exception& e) {
    Log::warnf("analytics", "sink failed on '{}': {}", name, e.what());
  }
}
