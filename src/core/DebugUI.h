#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// HUD, menus and debug panels. ImGui integration is optional: builds without it provide a
// no-op implementation and the game is driven by keyboard commands alone.

struct DebugUIHudModel {
  int level = 1;
  int levelCount = 1;
  std::int64_t score = 0;
  int gemsCollected = 0;
  int totalGems = 0;
  int gemBank = 0;
  int lives = 0;
  int maxLives = 0;
  int health = 0;
  int maxHealth = 0;
  float timeRemaining = 0.0F;
  bool invulnerable = false;
};

enum class DebugUIScreen : std::uint8_t {
  None,
  Menu,
  Paused,
  LevelComplete,
  GameOver,
};

struct DebugUIScreenModel {
  DebugUIScreen screen = DebugUIScreen::None;
  int level = 1;
  int levelCount = 1;
  std::int64_t score = 0;
  int gemBank = 0;
  int timeBonus = 0;
  bool gameComplete = false;
  bool hasCheckpoint = false;
  bool hasLevel = false;  // a level is loaded (menu can offer "resume")
  std::vector<bool> unlocked;  // index 0 = level 1
  std::vector<bool> adGated;
  int unlockPromptLevel = 0;
  int adPendingLevel = 0;
  float adSecondsLeft = 0.0F;
};

struct DebugUIScreenActions {
  bool play = false;  // new game from level 1
  int selectLevel = 0;
  bool resume = false;
  bool restart = false;
  bool nextLevel = false;
  bool continueFromCheckpoint = false;
  bool menu = false;
  bool quit = false;
  int watchAdForLevel = 0;
  bool resetProgress = false;
};

struct DebugUIOverlayModel {
  uint64_t frame = 0;
  float dt = 0.0F;
  bool debugCollision = false;
  float camX = 0.0F;
  float camY = 0.0F;
  std::uint64_t seed = 0;
  std::string state;

  bool hasPlayer = false;
  float posX = 0.0F;
  float posY = 0.0F;
  float velX = 0.0F;
  float velY = 0.0F;
  bool grounded = false;
  bool doubleJumpUsed = false;
  std::string animState;
  float invulnerableSeconds = 0.0F;

  std::size_t entityCount = 0;
  int hurtEvents = 0;
  int deaths = 0;
  std::vector<std::string> legend;
};

class DebugUI {
 public:
  bool init(SDL_Window* window, SDL_Renderer* renderer);
  void shutdown();

  void processEvent(const SDL_Event& e);
  void beginFrame();
  void endFrame(SDL_Renderer* renderer);

  static bool available();
  bool initialized() const { return initialized_; }

  bool wantCaptureKeyboard() const;
  bool wantCaptureMouse() const;

  void drawHud(const DebugUIHudModel& model);
  void drawOverlay(const DebugUIOverlayModel& model);
  DebugUIScreenActions drawScreen(const DebugUIScreenModel& model);

 private:
  bool initialized_ = false;
  std::string iniPath_;
};
