#include "core/DebugUI.h"

#ifndef JUMPER_WITH_IMGUI
#define JUMPER_WITH_IMGUI 0
#endif

#if JUMPER_WITH_IMGUI
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>
#endif

#include <algorithm>
#include <cstddef>
#include <string>

#include "util/Paths.h"

bool DebugUI::available() {
  return JUMPER_WITH_IMGUI != 0;
}

#if JUMPER_WITH_IMGUI
namespace {

const ImVec4 kGold(1.0F, 0.84F, 0.2F, 1.0F);
const ImVec4 kRed(0.95F, 0.3F, 0.3F, 1.0F);
const ImVec4 kDim(0.6F, 0.6F, 0.6F, 1.0F);

bool flag(const std::vector<bool>& v, int level) {
  const auto idx = static_cast<std::size_t>(level - 1);
  return level >= 1 && idx < v.size() && v[idx];
}

void beginCenteredWindow(const char* title) {
  const ImGuiViewport* vp = ImGui::GetMainViewport();
  ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + vp->WorkSize.x * 0.5F,
                                 vp->WorkPos.y + vp->WorkSize.y * 0.5F),
                          ImGuiCond_Always, ImVec2(0.5F, 0.5F));
  ImGui::SetNextWindowBgAlpha(0.92F);
  const ImGuiWindowFlags flags = ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoCollapse |
                                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings;
  ImGui::Begin(title, nullptr, flags);
}

void drawLevelSelect(const DebugUIScreenModel& model, DebugUIScreenActions& out) {
  ImGui::TextUnformatted("Level select");
  for (int level = 1; level <= model.levelCount; ++level) {
    const std::string label = "Level " + std::to_string(level);
    if (flag(model.unlocked, level)) {
      if (ImGui::Button(label.c_str(), ImVec2(96.0F, 0.0F)))
        out.selectLevel = level;
    } else {
      ImGui::BeginDisabled();
      ImGui::Button(label.c_str(), ImVec2(96.0F, 0.0F));
      ImGui::EndDisabled();
      if (flag(model.adGated, level)) {
        ImGui::SameLine();
        const std::string adLabel = "Watch ad##unlock" + std::to_string(level);
        ImGui::BeginDisabled(model.adPendingLevel != 0);
        if (ImGui::SmallButton(adLabel.c_str()))
          out.watchAdForLevel = level;
        ImGui::EndDisabled();
      }
    }
    if ((level % 5) != 0 && level != model.levelCount)
      ImGui::SameLine();
  }
}

void drawAdProgress(const DebugUIScreenModel& model) {
  if (model.adPendingLevel == 0)
    return;
  ImGui::TextColored(kGold, "Ad playing (level %d unlock)... %.1fs", model.adPendingLevel,
                     model.adSecondsLeft);
}

void drawMenu(const DebugUIScreenModel& model, DebugUIScreenActions& out) {
  beginCenteredWindow("Mystic Jumper");
  ImGui::Text("Gems: %d", model.gemBank);
  ImGui::Separator();
  if (ImGui::Button("Play", ImVec2(200.0F, 0.0F)))
    out.play = true;
  if (model.hasLevel && !model.gameComplete) {
    const std::string resume = "Resume level " + std::to_string(model.level);
    if (ImGui::Button(resume.c_str(), ImVec2(200.0F, 0.0F)))
      out.selectLevel = model.level;
  }
  ImGui::Separator();
  drawLevelSelect(model, out);
  drawAdProgress(model);
  ImGui::Separator();
  if (ImGui::Button("Reset progress"))
    out.resetProgress = true;
  ImGui::SameLine();
  if (ImGui::Button("Quit"))
    out.quit = true;
  ImGui::End();
}

void drawPaused(DebugUIScreenActions& out) {
  beginCenteredWindow("Paused");
  if (ImGui::Button("Resume", ImVec2(160.0F, 0.0F)))
    out.resume = true;
  if (ImGui::Button("Restart level", ImVec2(160.0F, 0.0F)))
    out.restart = true;
  if (ImGui::Button("Main menu", ImVec2(160.0F, 0.0F)))
    out.menu = true;
  ImGui::End();
}

void drawLevelComplete(const DebugUIScreenModel& model, DebugUIScreenActions& out) {
  beginCenteredWindow(model.gameComplete ? "All levels complete!" : "Level complete!");
  ImGui::Text("Level %d cleared", model.level);
  ImGui::Text("Time bonus: %d", model.timeBonus);
  ImGui::TextColored(kGold, "Score: %lld", static_cast<long long>(model.score));
  ImGui::Text("Gem bank: %d", model.gemBank);
  ImGui::Separator();

  if (model.unlockPromptLevel != 0) {
    ImGui::TextColored(kGold, "Level %d is locked.", model.unlockPromptLevel);
    ImGui::BeginDisabled(model.adPendingLevel != 0);
    if (ImGui::Button("Watch an ad to unlock"))
      out.watchAdForLevel = model.unlockPromptLevel;
    ImGui::EndDisabled();
    drawAdProgress(model);
  } else if (!model.gameComplete) {
    if (ImGui::Button("Next level", ImVec2(160.0F, 0.0F)))
      out.nextLevel = true;
  }

  if (model.level >= model.levelCount && !model.gameComplete) {
    ImGui::TextColored(kDim, "That was the last level.");
  }
  if (ImGui::Button("Replay level", ImVec2(160.0F, 0.0F)))
    out.restart = true;
  if (ImGui::Button("Main menu", ImVec2(160.0F, 0.0F)))
    out.menu = true;
  ImGui::End();
}

void drawGameOver(const DebugUIScreenModel& model, DebugUIScreenActions& out) {
  beginCenteredWindow("Game over");
  ImGui::TextColored(kRed, "Out of lives on level %d", model.level);
  ImGui::Text("Score: %lld", static_cast<long long>(model.score));
  ImGui::Separator();
  if (model.hasCheckpoint) {
    if (ImGui::Button("Continue from checkpoint", ImVec2(200.0F, 0.0F)))
      out.continueFromCheckpoint = true;
  }
  if (ImGui::Button("Restart level", ImVec2(200.0F, 0.0F)))
    out.restart = true;
  if (ImGui::Button("Main menu", ImVec2(200.0F, 0.0F)))
    out.menu = true;
  ImGui::End();
}

}  // namespace
#endif

bool DebugUI::init(SDL_Window* window, SDL_Renderer* renderer) {
#if JUMPER_WITH_IMGUI
  if (initialized_)
    return true;

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui::StyleColorsDark();

  ImGuiIO& io = ImGui::GetIO();
  // Persist layout outside the repo.
  iniPath_ = Paths::prefFilePath("mystic-jumper", "jumper", "imgui.ini");
  io.IniFilename = iniPath_.empty() ? nullptr : iniPath_.c_str();
  io.LogFilename = nullptr;

  if (!ImGui_ImplSDL3_InitForSDLRenderer(window, renderer)) {
    ImGui::DestroyContext();
    return false;
  }

  if (!ImGui_ImplSDLRenderer3_Init(renderer)) {
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    return false;
  }

  initialized_ = true;
  return true;
#else
  (void)window;
  (void)renderer;
  return false;
#endif
}

void DebugUI::shutdown() {
#if JUMPER_WITH_IMGUI
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_Shutdown();
  ImGui_ImplSDL3_Shutdown();
  ImGui::DestroyContext();
  initialized_ = false;
#endif
}

void DebugUI::processEvent(const SDL_Event& e) {
#if JUMPER_WITH_IMGUI
  if (!initialized_)
    return;
  (void)ImGui_ImplSDL3_ProcessEvent(&e);
#else
  (void)e;
#endif
}

void DebugUI::beginFrame() {
#if JUMPER_WITH_IMGUI
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_NewFrame();
  ImGui_ImplSDL3_NewFrame();
  ImGui::NewFrame();
#endif
}

void DebugUI::endFrame(SDL_Renderer* renderer) {
#if JUMPER_WITH_IMGUI
  if (!initialized_)
    return;
  ImGui::Render();
  ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
#else
  (void)renderer;
#endif
}

bool DebugUI::wantCaptureKeyboard() const {
#if JUMPER_WITH_IMGUI
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureKeyboard;
#else
  return false;
#endif
}

bool DebugUI::wantCaptureMouse() const {
#if JUMPER_WITH_IMGUI
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureMouse;
#else
  return false;
#endif
}

void DebugUI::drawHud(const DebugUIHudModel& model) {
#if JUMPER_WITH_IMGUI
  if (!initialized_)
    return;

  ImGui::SetNextWindowPos(ImVec2(12.0F, 12.0F), ImGuiCond_Always);
  ImGui::SetNextWindowBgAlpha(0.55F);
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                 ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav |
                                 ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoInputs;
  if (ImGui::Begin("HUD", nullptr, flags)) {
    ImGui::Text("Level %d/%d", model.level, model.levelCount);
    ImGui::SameLine(0.0F, 24.0F);
    ImGui::TextColored(kGold, "Score %lld", static_cast<long long>(model.score));
    ImGui::SameLine(0.0F, 24.0F);
    ImGui::Text("Gems %d/%d", model.gemsCollected, model.totalGems);

    const ImVec4 timeColor = (model.timeRemaining < 10.0F) ? kRed : ImVec4(1, 1, 1, 1);
    ImGui::TextColored(timeColor, "Time %d", static_cast<int>(model.timeRemaining + 0.999F));
    ImGui::SameLine(0.0F, 24.0F);
    ImGui::Text("Lives %d/%d", model.lives, model.maxLives);
    ImGui::SameLine(0.0F, 24.0F);
    std::string hearts;
    for (int i = 0; i < model.maxHealth; ++i) {
      hearts += (i < model.health) ? "<3 " : ".. ";
    }
    ImGui::TextColored(model.invulnerable ? kDim : kRed, "%s", hearts.c_str());
  }
  ImGui::End();
#else
  (void)model;
#endif
}

void DebugUI::drawOverlay(const DebugUIOverlayModel& model) {
#if JUMPER_WITH_IMGUI
  if (!initialized_)
    return;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 120.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.75F);

  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                 ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav;

  if (ImGui::Begin("Overlay", nullptr, flags)) {
    ImGui::Text("frame: %llu  dt: %.5f  state: %s",
                static_cast<unsigned long long>(model.frame), model.dt, model.state.c_str());
    ImGui::Text("seed: %llu  entities: %zu", static_cast<unsigned long long>(model.seed),
                model.entityCount);
    ImGui::Text("camera: (%.1f, %.1f)  hitboxes: %d (F2)", model.camX, model.camY,
                model.debugCollision ? 1 : 0);
    ImGui::Text("hurt events: %d  deaths: %d", model.hurtEvents, model.deaths);

    if (model.hasPlayer) {
      ImGui::Separator();
      ImGui::Text("pos: (%.1f, %.1f)", model.posX, model.posY);
      ImGui::Text("vel: (%.1f, %.1f)", model.velX, model.velY);
      ImGui::Text("grounded: %d  double jump used: %d", model.grounded ? 1 : 0,
                  model.doubleJumpUsed ? 1 : 0);
      ImGui::Text("anim: %s  invulnerable: %.2fs", model.animState.c_str(),
                  model.invulnerableSeconds);
    }

    if (!model.legend.empty()) {
      ImGui::Separator();
      for (const std::string& line : model.legend) {
        ImGui::TextUnformatted(line.c_str());
      }
    }
  }
  ImGui::End();
#else
  (void)model;
#endif
}

DebugUIScreenActions DebugUI::drawScreen(const DebugUIScreenModel& model) {
  DebugUIScreenActions out{};
#if JUMPER_WITH_IMGUI
  if (!initialized_)
    return out;

  switch (model.screen) {
    case DebugUIScreen::Menu:
      drawMenu(model, out);
      break;
    case DebugUIScreen::Paused:
      drawPaused(out);
      break;
    case DebugUIScreen::LevelComplete:
      drawLevelComplete(model, out);
      break;
    case DebugUIScreen::GameOver:
      drawGameOver(model, out);
      break;
    case DebugUIScreen::None:
      break;
  }
#else
  (void)model;
#endif
  return out;
}
