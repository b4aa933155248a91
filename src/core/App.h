#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstdint>
#include <memory>
#include <string>

#include "config/GameConfig.h"
#include "core/Analytics.h"
#include "core/DebugUI.h"
#include "core/Input.h"
#include "core/InputScript.h"
#include "core/SpriteCache.h"
#include "core/Time.h"
#include "game/Session.h"

struct AppConfig {
  const char* title = "Mystic Jumper";
  const char* configTomlPath = "data/game.toml";
  const char* inputScriptTomlPath = nullptr;
  const char* argv0 = nullptr;
  int width = 1280;
  int height = 720;
  int startLevel = 0;  // 0 = main menu (or level 1 when headless)
  bool hasSeed = false;
  std::uint64_t seed = 0;
  int maxFrames = -1;
  bool headless = false;
  bool noSave = false;
};

class App {
 public:
  bool init(const AppConfig& cfg);
  void run();
  void shutdown();

  [[nodiscard]] const Session* session() const { return session_.get(); }

 private:
  void handleEvent(const SDL_Event& e);
  void handleCommands(const AppCommands& cmds);
  void handleScreenActions(const DebugUIScreenActions& actions);
  void confirm();
  void tick(TimeStep ts);
  void tickRewardedAd(float dt);
  void startRewardedAd(int level);
  void render();
  void renderWorld(int viewW, int viewH);
  void renderTextHud();
  void updateCamera(int viewW, int viewH);

  DebugUIHudModel hudModel() const;
  DebugUIScreenModel screenModel() const;
  DebugUIOverlayModel overlayModel() const;

  AppConfig cfg_{};
  GameConfig gameCfg_{};
  SDL_Window* window_ = nullptr;
  SDL_Renderer* renderer_ = nullptr;
  bool running_ = true;
  bool sdlInitialized_ = false;

  bool debugOverlay_ = false;
  bool debugCollision_ = false;
  bool panelsOpen_ = true;
  bool uiCaptureKeyboard_ = false;
  bool uiCaptureMouse_ = false;

  TimeStep lastTs_{};
  uint64_t simFrame_ = 0;
  float camX_ = 0.0F;
  float camY_ = 0.0F;
  float adSecondsLeft_ = 0.0F;
  std::uint32_t background_ = 0x1a1530;

  Input input_;
  DebugUI debugUi_;
  SpriteCache sprites_;
  InputScript inputScript_;
  bool inputScriptEnabled_ = false;
  LogAnalyticsSink analytics_;
  std::unique_ptr<Session> session_;
};
