#include "core/App.h"

#include <SDL3/SDL.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <string>
#include <variant>

#include "core/SaveData.h"
#include "ecs/Systems.h"
#include "util/Log.h"
#include "util/Math.h"
#include "util/Paths.h"

namespace {

// Headless runs without --frames stop this long after the last scripted keyframe.
constexpr uint64_t kScriptTailFrames = 120;
constexpr uint64_t kDefaultHeadlessFrames = 600;

struct Rgba {
  Uint8 r = 255;
  Uint8 g = 255;
  Uint8 b = 255;
  Uint8 a = 255;
};

Rgba colorFor(const Collider& c) {
  struct Visitor {
    Rgba operator()(const PlatformBody& p) const {
      return p.moving ? Rgba{150, 110, 220, 255} : Rgba{70, 120, 200, 255};
    }
    Rgba operator()(const HazardBody& h) const {
      return (h.kind == HazardKind::Enemy) ? Rgba{200, 60, 60, 255} : Rgba{230, 90, 40, 255};
    }
    Rgba operator()(const CollectibleBody& g) const {
      const float t = g.collected ? std::clamp(g.despawnTimer / Systems::kCollectFadeSeconds,
                                               0.0F, 1.0F)
                                  : 1.0F;
      return Rgba{255, 215, 60, static_cast<Uint8>(255.0F * t)};
    }
    Rgba operator()(const CheckpointBody& cp) const {
      return cp.reached ? Rgba{90, 240, 120, 255} : Rgba{60, 140, 80, 255};
    }
    Rgba operator()(const ExitBody&) const { return Rgba{240, 240, 255, 255}; }
  };
  return std::visit(Visitor{}, c);
}

void fillRect(SDL_Renderer* r, const Rect& rect, float camX, float camY, Rgba c) {
  SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);
  const SDL_FRect dst{rect.x - camX, rect.y - camY, rect.w, rect.h};
  SDL_RenderFillRect(r, &dst);
}

void outlineRect(SDL_Renderer* r, const Rect& rect, float camX, float camY, Rgba c) {
  SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);
  const SDL_FRect dst{rect.x - camX, rect.y - camY, rect.w, rect.h};
  SDL_RenderRect(r, &dst);
}

DebugUIScreen screenFor(GameState state) {
  switch (state) {
    case GameState::Menu:
      return DebugUIScreen::Menu;
    case GameState::Paused:
      return DebugUIScreen::Paused;
    case GameState::LevelComplete:
      return DebugUIScreen::LevelComplete;
    case GameState::GameOver:
      return DebugUIScreen::GameOver;
    case GameState::Loading:
    case GameState::Playing:
      break;
  }
  return DebugUIScreen::None;
}

}  // namespace

bool App::init(const AppConfig& cfg) {
  cfg_ = cfg;

  const std::string configPath = Paths::resolveAssetPath(cfg_.configTomlPath, cfg_.argv0);
  if (!gameCfg_.loadFromToml(configPath.c_str())) {
    Log::warnf("app", "config {} not loaded; using built-in defaults", configPath);
  }
  if (cfg_.hasSeed)
    gameCfg_.session.seed = cfg_.seed;
  if (!parseHexColor(gameCfg_.render.background, background_))
    Log::warnf("app", "render.background '{}' is not #rrggbb", gameCfg_.render.background);

  if (cfg_.inputScriptTomlPath) {
    const std::string scriptPath = Paths::resolveAssetPath(cfg_.inputScriptTomlPath, cfg_.argv0);
    if (!inputScript_.loadFromToml(scriptPath.c_str())) {
      Log::errorf("app", "input script {} failed to load", scriptPath);
      return false;
    }
    inputScriptEnabled_ = true;
    Log::infof("app", "replaying {} ({} keyframes)", scriptPath, inputScript_.keyframeCount());
  }

  if (!cfg_.headless) {
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMEPAD)) {
      Log::errorf("app", "SDL_Init failed: {}", SDL_GetError());
      return false;
    }
    sdlInitialized_ = true;

    window_ = SDL_CreateWindow(cfg_.title, cfg_.width, cfg_.height, SDL_WINDOW_RESIZABLE);
    if (!window_) {
      Log::errorf("app", "SDL_CreateWindow failed: {}", SDL_GetError());
      return false;
    }

    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (!renderer_) {
      Log::errorf("app", "SDL_CreateRenderer failed: {}", SDL_GetError());
      return false;
    }
    (void)SDL_SetRenderVSync(renderer_, 1);
    (void)SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);

    input_.init();
    sprites_.init(renderer_);
    if (DebugUI::available() && !debugUi_.init(window_, renderer_))
      Log::warnf("app", "ImGui init failed; keyboard-only menus");
  }

  Session::Options opts{};
  if (!cfg_.noSave)
    opts.savePath = Paths::prefFilePath("mystic-jumper", "jumper", "save.toml");
  session_ = std::make_unique<Session>(gameCfg_, analytics_, opts);

  if (cfg_.startLevel > 0) {
    if (!session_->loadLevel(cfg_.startLevel))
      return false;
  } else if (cfg_.headless) {
    if (!session_->startNewGame())
      return false;
  }

  return true;
}

void App::run() {
  uint64_t lastTicks = SDL_GetTicks();
  uint64_t frameLimit = 0;
  if (cfg_.maxFrames > 0) {
    frameLimit = static_cast<uint64_t>(cfg_.maxFrames);
  } else if (cfg_.headless) {
    frameLimit = inputScriptEnabled_ ? inputScript_.lastKeyframe() + kScriptTailFrames
                                     : kDefaultHeadlessFrames;
  }

  while (running_) {
    if (!cfg_.headless) {
      SDL_Event e;
      while (SDL_PollEvent(&e)) {
        handleEvent(e);
      }
      handleCommands(input_.consumeCommands());
    }

    float dt = kHeadlessDt;
    if (!cfg_.headless && !inputScriptEnabled_) {
      const uint64_t now = SDL_GetTicks();
      dt = std::min(static_cast<float>(now - lastTicks) / 1000.0F, kMaxFrameDt);
      lastTicks = now;
    }

    lastTs_ = TimeStep{dt, simFrame_};
    tick(lastTs_);
    ++simFrame_;

    if (!cfg_.headless)
      render();

    if (frameLimit > 0 && simFrame_ >= frameLimit)
      running_ = false;
  }
}

void App::shutdown() {
  if (session_) {
    const SessionState& s = session_->state();
    Log::infof("app", "exit after {} frames: level {} {} score={} gems={}/{} lives={} deaths={}",
               simFrame_, s.level, gameStateName(s.state), s.score, s.gemsCollected, s.totalGems,
               s.lives, session_->deathCount());
  }

  debugUi_.shutdown();
  sprites_.shutdown();
  input_.shutdown();

  if (renderer_) {
    SDL_DestroyRenderer(renderer_);
    renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(window_);
    window_ = nullptr;
  }

  if (sdlInitialized_) {
    SDL_Quit();
    sdlInitialized_ = false;
  }
}

void App::handleEvent(const SDL_Event& e) {
  if (e.type == SDL_EVENT_QUIT) {
    running_ = false;
    return;
  }

  debugUi_.processEvent(e);
  uiCaptureKeyboard_ = debugUi_.wantCaptureKeyboard();
  uiCaptureMouse_ = debugUi_.wantCaptureMouse();
  input_.setPointerCaptured(uiCaptureMouse_);

  // Keyboard goes to ImGui while a text field has focus; key-up events always reach Input so
  // nothing stays stuck down.
  if (uiCaptureKeyboard_ && e.type == SDL_EVENT_KEY_DOWN)
    return;

  // Pause when the app loses focus (mobile backgrounding, alt-tab).
  if (e.type == SDL_EVENT_WINDOW_FOCUS_LOST || e.type == SDL_EVENT_WILL_ENTER_BACKGROUND) {
    session_->pause();
    return;
  }

  input_.handleEvent(e);
}

void App::handleCommands(const AppCommands& cmds) {
  if (cmds.quit)
    running_ = false;
  if (cmds.togglePanels)
    panelsOpen_ = !panelsOpen_;
  if (cmds.toggleDebugOverlay)
    debugOverlay_ = !debugOverlay_;
  if (cmds.toggleDebugCollision)
    debugCollision_ = !debugCollision_;

  if (cmds.togglePause)
    session_->togglePause();
  if (cmds.restart) {
    const GameState state = session_->state().state;
    if (state != GameState::Menu)
      (void)session_->restartLevel();
  }
  if (cmds.menu)
    session_->goToMenu();
  if (cmds.confirm)
    confirm();
}

// Enter key: the default button of whatever screen is up.
void App::confirm() {
  const SessionState& s = session_->state();
  switch (s.state) {
    case GameState::Menu:
      (void)session_->startNewGame();
      break;
    case GameState::Paused:
      session_->resume();
      break;
    case GameState::LevelComplete:
      if (s.gameComplete) {
        session_->goToMenu();
      } else if (s.unlockPromptLevel != 0) {
        startRewardedAd(s.unlockPromptLevel);
      } else {
        (void)session_->nextLevel();
      }
      break;
    case GameState::GameOver:
      if (s.lastCheckpoint) {
        (void)session_->continueFromCheckpoint();
      } else {
        (void)session_->restartLevel();
      }
      break;
    case GameState::Loading:
    case GameState::Playing:
      break;
  }
}

void App::handleScreenActions(const DebugUIScreenActions& a) {
  if (a.quit)
    running_ = false;
  if (a.play)
    (void)session_->startNewGame();
  if (a.selectLevel > 0)
    (void)session_->loadSpecificLevel(a.selectLevel);
  if (a.resume)
    session_->resume();
  if (a.restart)
    (void)session_->restartLevel();
  if (a.nextLevel)
    (void)session_->nextLevel();
  if (a.continueFromCheckpoint)
    (void)session_->continueFromCheckpoint();
  if (a.menu)
    session_->goToMenu();
  if (a.watchAdForLevel > 0)
    startRewardedAd(a.watchAdForLevel);
  if (a.resetProgress)
    (void)session_->resetProgress();
}

void App::startRewardedAd(int level) {
  if (!session_->requestRewardedAd(level))
    return;
  adSecondsLeft_ = gameCfg_.render.rewardedAdSeconds;
}

// No ad network here: the "ad" is a countdown that always completes.
void App::tickRewardedAd(float dt) {
  if (session_->pendingAdLevel() == 0)
    return;
  adSecondsLeft_ -= dt;
  if (adSecondsLeft_ > 0.0F)
    return;
  adSecondsLeft_ = 0.0F;
  const int level = session_->pendingAdLevel();
  session_->finishRewardedAd(true);
  const SessionState& s = session_->state();
  if (s.state == GameState::LevelComplete && s.level + 1 == level)
    (void)session_->nextLevel();
}

void App::tick(TimeStep ts) {
  InputState in{};
  if (inputScriptEnabled_) {
    in = inputScript_.sample(ts.frame);
  } else if (!cfg_.headless) {
    in = input_.consume();
  }

  // Headless runs have no menus to click through.
  if (cfg_.headless && session_->state().state == GameState::LevelComplete) {
    if (session_->state().unlockPromptLevel != 0) {
      startRewardedAd(session_->state().unlockPromptLevel);
    } else if (!session_->state().gameComplete) {
      (void)session_->nextLevel();
    }
  }

  session_->tick(ts, in);
  tickRewardedAd(ts.dt);
}

void App::updateCamera(int viewW, int viewH) {
  const World& w = session_->world();
  if (!isAlive(w.registry, w.player) || !w.registry.all_of<Transform, AABB>(w.player))
    return;

  const Rect player = rectOf(w.registry.get<Transform>(w.player), w.registry.get<AABB>(w.player));
  const float vw = static_cast<float>(viewW);
  const float vh = static_cast<float>(viewH);
  const Rect& b = w.bounds;

  camX_ = player.centerX() - vw * 0.5F;
  camX_ = util::clampf(camX_, b.x, std::max(b.x, b.right() - vw));
  camY_ = player.y + player.h * 0.5F - vh * 0.5F;
  camY_ = util::clampf(camY_, std::min(b.y, b.bottom() - vh), b.bottom() - vh);
}

void App::renderWorld(int viewW, int viewH) {
  updateCamera(viewW, viewH);

  const World& w = session_->world();
  const auto& reg = w.registry;

  SDL_Texture* gemTex = gameCfg_.render.gemSprite.empty()
                            ? nullptr
                            : sprites_.get(Paths::resolveAssetPath(gameCfg_.render.gemSprite,
                                                                   cfg_.argv0));

  auto bodies = reg.view<Collider, Transform, AABB>();
  for (auto entity : bodies) {
    const Collider& collider = bodies.get<Collider>(entity);
    Rect r = rectOf(bodies.get<Transform>(entity), bodies.get<AABB>(entity));
    const Rgba color = colorFor(collider);

    if (const auto* gem = std::get_if<CollectibleBody>(&collider)) {
      // Collected gems float up while fading out.
      if (gem->collected)
        r.y -= (Systems::kCollectFadeSeconds - gem->despawnTimer) * 60.0F;
      if (gemTex) {
        const SDL_FRect dst{r.x - camX_, r.y - camY_, r.w, r.h};
        (void)SDL_SetTextureAlphaMod(gemTex, color.a);
        SDL_RenderTexture(renderer_, gemTex, nullptr, &dst);
        continue;
      }
    }
    fillRect(renderer_, r, camX_, camY_, color);
    if (debugCollision_)
      outlineRect(renderer_, r, camX_, camY_, Rgba{255, 255, 255, 160});
  }

  if (!isAlive(reg, w.player) || !reg.all_of<Transform, AABB, Invulnerability, Facing>(w.player))
    return;

  const Rect pr = rectOf(reg.get<Transform>(w.player), reg.get<AABB>(w.player));
  const auto& inv = reg.get<Invulnerability>(w.player);
  // Flicker at 10 Hz while invulnerable.
  const bool hidden = inv.active && (static_cast<int>(inv.remaining * 10.0F) % 2) == 0;
  const Uint8 alpha = hidden ? 70 : 255;

  SDL_Texture* playerTex = gameCfg_.render.playerSprite.empty()
                               ? nullptr
                               : sprites_.get(Paths::resolveAssetPath(
                                     gameCfg_.render.playerSprite, cfg_.argv0));
  if (playerTex) {
    const SDL_FRect dst{pr.x - camX_, pr.y - camY_, pr.w, pr.h};
    const SDL_FlipMode flip =
        (reg.get<Facing>(w.player).x < 0) ? SDL_FLIP_HORIZONTAL : SDL_FLIP_NONE;
    (void)SDL_SetTextureAlphaMod(playerTex, alpha);
    SDL_RenderTextureRotated(renderer_, playerTex, nullptr, &dst, 0.0, nullptr, flip);
  } else {
    fillRect(renderer_, pr, camX_, camY_, Rgba{70, 210, 190, alpha});
    // Eye on the facing side so direction reads without a sprite.
    const float eyeX = (reg.get<Facing>(w.player).x < 0) ? pr.x + 4.0F : pr.right() - 10.0F;
    fillRect(renderer_, Rect{eyeX, pr.y + 10.0F, 6.0F, 6.0F}, camX_, camY_,
             Rgba{20, 20, 30, alpha});
  }
  if (debugCollision_)
    outlineRect(renderer_, pr, camX_, camY_, Rgba{255, 255, 0, 200});
}

// Fallback HUD and prompts when ImGui isn't built in.
void App::renderTextHud() {
  const SessionState& s = session_->state();
  SDL_SetRenderDrawColor(renderer_, 255, 255, 255, 255);
  const std::string line1 =
      std::format("LEVEL {}/{}  SCORE {}  GEMS {}/{}  LIVES {}  TIME {}", s.level,
                  session_->levelCount(), s.score, s.gemsCollected, s.totalGems, s.lives,
                  static_cast<int>(std::ceil(s.timeRemaining)));
  SDL_RenderDebugText(renderer_, 12.0F, 12.0F, line1.c_str());

  const char* prompt = nullptr;
  switch (s.state) {
    case GameState::Menu:
      prompt = "MYSTIC JUMPER - ENTER to play";
      break;
    case GameState::Paused:
      prompt = "PAUSED - ESC resume, R restart, M menu";
      break;
    case GameState::LevelComplete:
      prompt = s.gameComplete            ? "ALL LEVELS COMPLETE - ENTER for menu"
               : s.unlockPromptLevel != 0 ? "LEVEL LOCKED - ENTER to watch an ad"
                                          : "LEVEL COMPLETE - ENTER for next level";
      break;
    case GameState::GameOver:
      prompt = "GAME OVER - ENTER to continue, R restart";
      break;
    case GameState::Loading:
    case GameState::Playing:
      break;
  }
  if (prompt)
    SDL_RenderDebugText(renderer_, 12.0F, 28.0F, prompt);
}

DebugUIHudModel App::hudModel() const {
  const SessionState& s = session_->state();
  DebugUIHudModel m{};
  m.level = s.level;
  m.levelCount = session_->levelCount();
  m.score = s.score;
  m.gemsCollected = s.gemsCollected;
  m.totalGems = s.totalGems;
  m.gemBank = s.gemBank;
  m.lives = s.lives;
  m.maxLives = gameCfg_.session.maxLives;
  m.timeRemaining = s.timeRemaining;

  const World& w = session_->world();
  if (isAlive(w.registry, w.player) && w.registry.all_of<Health, Invulnerability>(w.player)) {
    m.health = w.registry.get<Health>(w.player).current;
    m.maxHealth = w.registry.get<Health>(w.player).max;
    m.invulnerable = w.registry.get<Invulnerability>(w.player).active;
  }
  return m;
}

DebugUIScreenModel App::screenModel() const {
  const SessionState& s = session_->state();
  DebugUIScreenModel m{};
  m.screen = screenFor(s.state);
  m.level = s.level;
  m.levelCount = session_->levelCount();
  m.score = s.score;
  m.gemBank = s.gemBank;
  m.timeBonus = s.lastTimeBonus;
  m.gameComplete = s.gameComplete;
  m.hasCheckpoint = s.lastCheckpoint.has_value();
  m.hasLevel = session_->levelReady();
  for (int level = 1; level <= m.levelCount; ++level) {
    m.unlocked.push_back(session_->isLevelUnlocked(level));
    m.adGated.push_back(session_->isAdGated(level));
  }
  m.unlockPromptLevel = s.unlockPromptLevel;
  m.adPendingLevel = session_->pendingAdLevel();
  m.adSecondsLeft = adSecondsLeft_;
  return m;
}

DebugUIOverlayModel App::overlayModel() const {
  DebugUIOverlayModel m{};
  m.frame = lastTs_.frame;
  m.dt = lastTs_.dt;
  m.debugCollision = debugCollision_;
  m.camX = camX_;
  m.camY = camY_;
  m.seed = session_->config().session.seed;
  m.state = gameStateName(session_->state().state);

  const World& w = session_->world();
  const auto& reg = w.registry;
  m.entityCount = reg.view<LevelEntityTag>().size();
  m.hurtEvents = w.hurtEvents;
  m.deaths = w.deaths;

  if (isAlive(reg, w.player) &&
      reg.all_of<Transform, Velocity, Grounded, JumpState, AnimState, Invulnerability>(w.player)) {
    m.hasPlayer = true;
    const auto& t = reg.get<Transform>(w.player);
    const auto& v = reg.get<Velocity>(w.player);
    m.posX = t.pos.x;
    m.posY = t.pos.y;
    m.velX = v.v.x;
    m.velY = v.v.y;
    m.grounded = reg.get<Grounded>(w.player).onGround;
    m.doubleJumpUsed = reg.get<JumpState>(w.player).doubleJumpUsed;
    m.animState = animStateName(reg.get<AnimState>(w.player).id);
    m.invulnerableSeconds = reg.get<Invulnerability>(w.player).remaining;
  }

  input_.appendLegend(m.legend);
  return m;
}

void App::render() {
  if (!renderer_)
    return;

  int viewW = cfg_.width;
  int viewH = cfg_.height;
  (void)SDL_GetRenderOutputSize(renderer_, &viewW, &viewH);

  SDL_SetRenderDrawColor(renderer_, static_cast<Uint8>((background_ >> 16U) & 0xFFU),
                         static_cast<Uint8>((background_ >> 8U) & 0xFFU),
                         static_cast<Uint8>(background_ & 0xFFU), 255);
  SDL_RenderClear(renderer_);

  if (session_->levelReady())
    renderWorld(viewW, viewH);

  if (debugUi_.initialized()) {
    debugUi_.beginFrame();
    if (session_->levelReady() && session_->state().state != GameState::Menu)
      debugUi_.drawHud(hudModel());
    if (panelsOpen_ && debugOverlay_)
      debugUi_.drawOverlay(overlayModel());
    handleScreenActions(debugUi_.drawScreen(screenModel()));
    debugUi_.endFrame(renderer_);
  } else {
    renderTextHud();
  }

  SDL_RenderPresent(renderer_);
}
