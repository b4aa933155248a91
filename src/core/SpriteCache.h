#pragma once

#include <SDL3/SDL_render.h>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>

// Path-keyed texture cache. A path that fails to load is remembered and reported once;
// callers draw a placeholder when get() returns nullptr.
class SpriteCache {
 public:
  void init(SDL_Renderer* renderer);
  void shutdown();

  SDL_Texture* get(const std::string& path);

  [[nodiscard]] std::size_t failureCount() const { return failed_.size(); }

 private:
  SDL_Texture* loadTexture(const std::string& path);

  SDL_Renderer* renderer_ = nullptr;
  std::unordered_map<std::string, SDL_Texture*> textures_;
  std::unordered_set<std::string> failed_;
};
