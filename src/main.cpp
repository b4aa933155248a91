#include "core/App.h"

#include <SDL3/SDL_hints.h>

#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace {

void usage(const char* argv0) {
  std::printf(
      "usage: %s [--config PATH] [--level N] [--seed N] [--frames N] [--headless] "
      "[--input-script PATH] [--no-save] [--video-driver NAME] [--width W] [--height H]\n",
      argv0);
  std::printf("  --config PATH        Game tuning TOML (default: data/game.toml)\n");
  std::printf("  --level N            Start directly in level N instead of the menu\n");
  std::printf("  --seed N             Override session.seed for level generation\n");
  std::printf("  --frames N           Run N frames then exit (smoke test)\n");
  std::printf("  --headless           No window; fixed 60 Hz simulation only\n");
  std::printf("  --input-script PATH  Replay keyframed input from a TOML file\n");
  std::printf("  --no-save            Don't read or write save data\n");
  std::printf("  --video-driver NAME  Force SDL video backend (e.g. x11, wayland, offscreen)\n");
  std::printf("  --width W            Window width (default: 1280)\n");
  std::printf("  --height H           Window height (default: 720)\n");
  std::printf("  -h, --help           Show this help\n");
}

bool parseInt(const char* s, int& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (!end || *end != '\0')
    return false;
  if (v < 1 || v > 100000)
    return false;
  out = static_cast<int>(v);
  return true;
}

bool parseSeed(const char* s, std::uint64_t& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 0);
  if (!end || *end != '\0')
    return false;
  out = static_cast<std::uint64_t>(v);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  AppConfig cfg{};
  cfg.argv0 = argv[0];
  const char* videoDriver = nullptr;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--frames") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.maxFrames)) {
        std::printf("invalid --frames value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--level") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.startLevel)) {
        std::printf("invalid --level value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--seed") {
      if (i + 1 >= argc || !parseSeed(argv[i + 1], cfg.seed)) {
        std::printf("invalid --seed value\n");
        usage(argv[0]);
        return 1;
      }
      cfg.hasSeed = true;
      ++i;
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        std::printf("missing --config value\n");
        usage(argv[0]);
        return 1;
      }
      cfg.configTomlPath = argv[++i];
    } else if (arg == "--input-script") {
      if (i + 1 >= argc) {
        std::printf("missing --input-script value\n");
        usage(argv[0]);
        return 1;
      }
      cfg.inputScriptTomlPath = argv[++i];
    } else if (arg == "--headless") {
      cfg.headless = true;
    } else if (arg == "--no-save") {
      cfg.noSave = true;
    } else if (arg == "--video-driver") {
      if (i + 1 >= argc) {
        std::printf("missing --video-driver value\n");
        usage(argv[0]);
        return 1;
      }
      videoDriver = argv[++i];
    } else if (arg == "--width") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.width)) {
        std::printf("invalid --width value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--height") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.height)) {
        std::printf("invalid --height value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::printf("unknown option: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  if (videoDriver) {
    SDL_SetHint(SDL_HINT_VIDEO_DRIVER, videoDriver);
  }

  App app;
  if (!app.init(cfg)) {
    app.shutdown();
    return 1;
  }

  app.run();
  app.shutdown();
  return 0;
}
