#include "core/Input.h"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_joystick.h>
#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_mouse.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_stdinc.h>

#include <algorithm>
#include <memory>

namespace {

// SDL key mappings live here and are consumed by both input processing and UI legends.
constexpr SDL_Scancode kMoveLeftPrimary = SDL_SCANCODE_LEFT;
constexpr SDL_Scancode kMoveLeftAlt = SDL_SCANCODE_A;
constexpr SDL_Scancode kMoveRightPrimary = SDL_SCANCODE_RIGHT;
constexpr SDL_Scancode kMoveRightAlt = SDL_SCANCODE_D;

constexpr SDL_Scancode kJumpPrimary = SDL_SCANCODE_SPACE;
constexpr SDL_Scancode kJumpUp = SDL_SCANCODE_UP;
constexpr SDL_Scancode kJumpW = SDL_SCANCODE_W;
constexpr SDL_Scancode kJumpJ = SDL_SCANCODE_J;

constexpr SDL_Scancode kPauseKey = SDL_SCANCODE_ESCAPE;
constexpr SDL_Scancode kPauseAlt = SDL_SCANCODE_P;
constexpr SDL_Scancode kRestartKey = SDL_SCANCODE_R;
constexpr SDL_Scancode kConfirmKey = SDL_SCANCODE_RETURN;
constexpr SDL_Scancode kMenuKey = SDL_SCANCODE_M;

constexpr SDL_Scancode kCtrlLeft = SDL_SCANCODE_LCTRL;
constexpr SDL_Scancode kCtrlRight = SDL_SCANCODE_RCTRL;
constexpr SDL_Scancode kQuitKey = SDL_SCANCODE_C;
constexpr SDL_Scancode kTogglePanelsKey = SDL_SCANCODE_H;
constexpr SDL_Scancode kToggleOverlayKey = SDL_SCANCODE_F1;
constexpr SDL_Scancode kToggleCollisionKey = SDL_SCANCODE_F2;

constexpr SDL_GamepadAxis kMoveAxisX = SDL_GAMEPAD_AXIS_LEFTX;
constexpr SDL_GamepadButton kDpadLeftButton = SDL_GAMEPAD_BUTTON_DPAD_LEFT;
constexpr SDL_GamepadButton kDpadRightButton = SDL_GAMEPAD_BUTTON_DPAD_RIGHT;
constexpr SDL_GamepadButton kJumpButton = SDL_GAMEPAD_BUTTON_SOUTH;
constexpr SDL_GamepadButton kPauseButton = SDL_GAMEPAD_BUTTON_START;
constexpr SDL_GamepadButton kMenuButton = SDL_GAMEPAD_BUTTON_BACK;

constexpr float kAxisMax = 32767.0F;

const char* prettyScancode(SDL_Scancode sc) {
  switch (sc) {
    case SDL_SCANCODE_LEFT:
      return "←";
    case SDL_SCANCODE_RIGHT:
      return "→";
    case SDL_SCANCODE_UP:
      return "↑";
    default:
      break;
  }

  const char* name = SDL_GetScancodeName(sc);
  if (!name || !*name)
    return "?";
  return name;
}

// True on the frame `now` goes high.
bool risingEdge(bool now, bool& latch) {
  const bool fired = now && !latch;
  latch = now;
  return fired;
}

}  // namespace

void Input::clearGamepadState() {
  axisLeftX_ = 0;
  dpadLeft_ = false;
  dpadRight_ = false;
  btnSouth_ = false;
  btnStart_ = false;
  btnBack_ = false;
}

void Input::tryOpenFirstGamepad() {
  if (gamepad_)
    return;

  int count = 0;
  using GamepadListPtr = std::unique_ptr<SDL_JoystickID, decltype(&SDL_free)>;
  GamepadListPtr ids(SDL_GetGamepads(&count), SDL_free);
  if (!ids || count <= 0) {
    return;
  }

  for (int i = 0; i < count; ++i) {
    SDL_Gamepad* gp = SDL_OpenGamepad(ids.get()[i]);
    if (!gp)
      continue;
    gamepad_ = gp;
    gamepadId_ = ids.get()[i];
    break;
  }
}

void Input::init() {
  SDL_SetGamepadEventsEnabled(true);
  tryOpenFirstGamepad();
}

void Input::shutdown() {
  if (gamepad_) {
    SDL_CloseGamepad(gamepad_);
    gamepad_ = nullptr;
  }
  gamepadId_ = 0;
  clearGamepadState();
}

void Input::handleEvent(const SDL_Event& e) {
  switch (e.type) {
    case SDL_EVENT_GAMEPAD_ADDED:
      if (!gamepad_) {
        if (SDL_Gamepad* gp = SDL_OpenGamepad(e.gdevice.which)) {
          gamepad_ = gp;
          gamepadId_ = e.gdevice.which;
        }
      }
      return;

    case SDL_EVENT_GAMEPAD_REMOVED:
      if (gamepad_ && e.gdevice.which == gamepadId_) {
        SDL_CloseGamepad(gamepad_);
        gamepad_ = nullptr;
        gamepadId_ = 0;
        clearGamepadState();
        tryOpenFirstGamepad();
        updateDerivedActions();
      }
      return;

    case SDL_EVENT_GAMEPAD_AXIS_MOTION:
      if (gamepad_ && e.gaxis.which == gamepadId_ && e.gaxis.axis == kMoveAxisX) {
        axisLeftX_ = static_cast<int>(e.gaxis.value);
        updateDerivedActions();
      }
      return;

    case SDL_EVENT_GAMEPAD_BUTTON_DOWN:
    case SDL_EVENT_GAMEPAD_BUTTON_UP:
      if (gamepad_ && e.gbutton.which == gamepadId_) {
        const bool down = e.gbutton.down;
        switch (e.gbutton.button) {
          case kDpadLeftButton:
            dpadLeft_ = down;
            break;
          case kDpadRightButton:
            dpadRight_ = down;
            break;
          case kJumpButton:
            btnSouth_ = down;
            break;
          case kPauseButton:
            btnStart_ = down;
            break;
          case kMenuButton:
            btnBack_ = down;
            break;
          default:
            break;
        }
        updateDerivedActions();
      }
      return;

    // Tap to jump: mouse click or touch.
    case SDL_EVENT_MOUSE_BUTTON_DOWN:
      if (e.button.button == SDL_BUTTON_LEFT && !pointerCaptured_)
        tapPending_ = true;
      return;
    case SDL_EVENT_FINGER_DOWN:
      if (!pointerCaptured_)
        tapPending_ = true;
      return;

    case SDL_EVENT_KEY_DOWN:
    case SDL_EVENT_KEY_UP: {
      const int sc = static_cast<int>(e.key.scancode);
      if (sc < 0 || sc >= static_cast<int>(scancodeDown_.size()))
        return;
      scancodeDown_[sc] = e.key.down;
      updateDerivedActions();
      return;
    }

    default:
      return;
  }
}

void Input::setGamepadDeadzone(int deadzone) {
  axisDeadzone_ = std::clamp(deadzone, 0, 32767);
  updateDerivedActions();
}

const char* Input::gamepadName() const {
  if (!gamepad_)
    return nullptr;
  const char* name = SDL_GetGamepadName(gamepad_);
  if (!name || !*name)
    return nullptr;
  return name;
}

void Input::appendLegend(std::vector<std::string>& out) const {
  out.push_back(std::string("Move: ") + prettyScancode(kMoveLeftPrimary) + "/" +
                prettyScancode(kMoveRightPrimary) + " or " + prettyScancode(kMoveLeftAlt) + "/" +
                prettyScancode(kMoveRightAlt) + "  (pad: D-pad / left stick)");
  out.push_back(std::string("Jump: ") + prettyScancode(kJumpPrimary) + ", " +
                prettyScancode(kJumpUp) + ", " + prettyScancode(kJumpW) + " or tap" +
                "  (press again in the air to double jump)");
  out.push_back(std::string("Pause: ") + prettyScancode(kPauseKey) + "/" +
                prettyScancode(kPauseAlt) + "  Restart: " + prettyScancode(kRestartKey) +
                "  Menu: " + prettyScancode(kMenuKey) + "  Continue: " +
                prettyScancode(kConfirmKey));
  if (const char* gpName = gamepadName())
    out.push_back(std::string("Gamepad: ") + gpName);
  out.push_back(std::string("UI: Ctrl-") + prettyScancode(kTogglePanelsKey) +
                " hide/show  Quit: Ctrl-" + prettyScancode(kQuitKey));
  out.push_back(std::string("Debug: ") + prettyScancode(kToggleOverlayKey) + " overlay  " +
                prettyScancode(kToggleCollisionKey) + " hitboxes");
}

InputState Input::consume() {
  InputState out = state_;
  if (tapPending_) {
    out.jumpPressed = true;
    tapPending_ = false;
  }
  out.carryHistory(history_);
  history_ = out;

  state_.jumpPressed = false;
  state_.jumpReleased = false;
  return out;
}

AppCommands Input::consumeCommands() {
  AppCommands out = commands_;
  commands_ = AppCommands{};
  return out;
}

void Input::updateDerivedActions() {
  const bool leftKey = scancodeDown_[kMoveLeftPrimary] || scancodeDown_[kMoveLeftAlt];
  const bool rightKey = scancodeDown_[kMoveRightPrimary] || scancodeDown_[kMoveRightAlt];
  state_.left = leftKey || dpadLeft_;
  state_.right = rightKey || dpadRight_;

  // Analog stick: rescale past the deadzone to [-1, 1].
  const int mag = (axisLeftX_ < 0) ? -axisLeftX_ : axisLeftX_;
  if (mag <= axisDeadzone_ || axisDeadzone_ >= 32767) {
    state_.axis = 0.0F;
  } else {
    const float t = static_cast<float>(mag - axisDeadzone_) /
                    (kAxisMax - static_cast<float>(axisDeadzone_));
    state_.axis = std::min(1.0F, t) * ((axisLeftX_ < 0) ? -1.0F : 1.0F);
  }

  const bool jumpNow = scancodeDown_[kJumpPrimary] || scancodeDown_[kJumpUp] ||
                       scancodeDown_[kJumpW] || scancodeDown_[kJumpJ] || btnSouth_;
  if (jumpNow && !state_.jumpHeld)
    state_.jumpPressed = true;
  if (!jumpNow && state_.jumpHeld)
    state_.jumpReleased = true;
  state_.jumpHeld = jumpNow;

  const bool ctrlHeld = scancodeDown_[kCtrlLeft] || scancodeDown_[kCtrlRight];

  if (risingEdge(scancodeDown_[kPauseKey] || scancodeDown_[kPauseAlt] || btnStart_, pauseLatch_))
    commands_.togglePause = true;
  if (risingEdge(scancodeDown_[kRestartKey], restartLatch_))
    commands_.restart = true;
  if (risingEdge(scancodeDown_[kConfirmKey], confirmLatch_))
    commands_.confirm = true;
  if (risingEdge(scancodeDown_[kMenuKey] || btnBack_, menuLatch_))
    commands_.menu = true;
  if (risingEdge(scancodeDown_[kQuitKey] && ctrlHeld, quitLatch_))
    commands_.quit = true;  // Ctrl-C
  if (risingEdge(scancodeDown_[kTogglePanelsKey] && ctrlHeld, panelsLatch_))
    commands_.togglePanels = true;  // Ctrl-H
  if (risingEdge(scancodeDown_[kToggleOverlayKey], overlayLatch_))
    commands_.toggleDebugOverlay = true;
  if (risingEdge(scancodeDown_[kToggleCollisionKey], collisionLatch_))
    commands_.toggleDebugCollision = true;
}
