#include "core/SpriteCache.h"

#include <memory>
#include <string_view>

#include <SDL3/SDL_blendmode.h>
#include <SDL3/SDL_error.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_stdinc.h>
#include <SDL3/SDL_surface.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "util/Log.h"

namespace {

using SurfacePtr = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>;
using PixelsPtr = std::unique_ptr<unsigned char, decltype(&stbi_image_free)>;

bool isPngFile(std::string_view path) {
  return path.ends_with(".png") || path.ends_with(".PNG");
}

SurfacePtr loadPngWithStb(const std::string& path) {
  int width = 0;
  int height = 0;
  int channels = 0;

  PixelsPtr pixels(stbi_load(path.c_str(), &width, &height, &channels, 4), stbi_image_free);
  if (!pixels) {
    Log::warnf("sprites", "stbi_load failed: {} ({})", path, stbi_failure_reason());
    return SurfacePtr(nullptr, SDL_DestroySurface);
  }

  // SDL_CreateSurfaceFrom borrows the pixels; duplicate so the surface owns its copy.
  SurfacePtr borrowed(
      SDL_CreateSurfaceFrom(width, height, SDL_PIXELFORMAT_RGBA32, pixels.get(), width * 4),
      SDL_DestroySurface);
  if (!borrowed) {
    Log::warnf("sprites", "SDL_CreateSurfaceFrom failed: {} ({})", path, SDL_GetError());
    return SurfacePtr(nullptr, SDL_DestroySurface);
  }
  return SurfacePtr(SDL_DuplicateSurface(borrowed.get()), SDL_DestroySurface);
}

SurfacePtr loadBmpWithColorKey(const std::string& path) {
  SurfacePtr surface(SDL_LoadBMP(path.c_str()), SDL_DestroySurface);
  if (!surface) {
    Log::warnf("sprites", "SDL_LoadBMP failed: {} ({})", path, SDL_GetError());
    return surface;
  }
  // Magenta is transparent in BMP art.
  const Uint32 key = SDL_MapSurfaceRGB(surface.get(), 255, 0, 255);
  (void)SDL_SetSurfaceColorKey(surface.get(), true, key);
  return surface;
}

}  // namespace

void SpriteCache::init(SDL_Renderer* renderer) {
  renderer_ = renderer;
}

void SpriteCache::shutdown() {
  for (auto& [path, tex] : textures_) {
    (void)path;
    if (tex)
      SDL_DestroyTexture(tex);
  }
  textures_.clear();
  failed_.clear();
  renderer_ = nullptr;
}

SDL_Texture* SpriteCache::get(const std::string& path) {
  if (path.empty() || failed_.contains(path))
    return nullptr;

  auto it = textures_.find(path);
  if (it != textures_.end())
    return it->second;

  SDL_Texture* tex = loadTexture(path);
  if (!tex) {
    failed_.insert(path);
    Log::warnf("sprites", "using placeholder for {}", path);
    return nullptr;
  }

  textures_.emplace(path, tex);
  return tex;
}

SDL_Texture* SpriteCache::loadTexture(const std::string& path) {
  if (!renderer_)
    return nullptr;

  SurfacePtr surface = isPngFile(path) ? loadPngWithStb(path) : loadBmpWithColorKey(path);
  if (!surface)
    return nullptr;

  SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer_, surface.get());
  if (!tex) {
    Log::warnf("sprites", "SDL_CreateTextureFromSurface failed: {} ({})", path, SDL_GetError());
    return nullptr;
  }

  (void)SDL_SetTextureScaleMode(tex, SDL_SCALEMODE_NEAREST);
  (void)SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
  return tex;
}
