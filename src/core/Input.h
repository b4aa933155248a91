#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_scancode.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "ecs/Components.h"

struct AppCommands {
  bool quit = false;
  bool togglePause = false;
  bool restart = false;
  bool confirm = false;  // start / next level / continue, depending on the screen
  bool menu = false;
  bool toggleDebugOverlay = false;
  bool toggleDebugCollision = false;
  bool togglePanels = false;
};

class Input {
 public:
  void init();
  void shutdown();

  void handleEvent(const SDL_Event& e);

  [[nodiscard]] bool hasGamepad() const { return gamepad_ != nullptr; }
  [[nodiscard]] const char* gamepadName() const;
  [[nodiscard]] int gamepadDeadzone() const { return axisDeadzone_; }
  void setGamepadDeadzone(int deadzone);
  void appendLegend(std::vector<std::string>& out) const;

  // Set while ImGui owns the pointer so menu clicks don't jump.
  void setPointerCaptured(bool captured) { pointerCaptured_ = captured; }

  // Consume edge-triggered flags (pressed/released). Held state is preserved.
  InputState consume();

  // Consume non-gameplay commands (pause/menu/debug toggles).
  AppCommands consumeCommands();

 private:
  void updateDerivedActions();
  void clearGamepadState();
  void tryOpenFirstGamepad();

  std::array<bool, SDL_SCANCODE_COUNT> scancodeDown_{};
  InputState state_{};
  InputState history_{};
  AppCommands commands_{};

  SDL_Gamepad* gamepad_ = nullptr;
  uint32_t gamepadId_ = 0;
  int axisLeftX_ = 0;
  int axisDeadzone_ = 8000;
  bool dpadLeft_ = false;
  bool dpadRight_ = false;
  bool btnSouth_ = false;  // jump
  bool btnStart_ = false;  // pause
  bool btnBack_ = false;   // menu
  bool tapPending_ = false;
  bool pointerCaptured_ = false;

  // Previous-frame latches for command keys.
  bool pauseLatch_ = false;
  bool restartLatch_ = false;
  bool confirmLatch_ = false;
  bool menuLatch_ = false;
  bool quitLatch_ = false;
  bool panelsLatch_ = false;
  bool overlayLatch_ = false;
  bool collisionLatch_ = false;
};
