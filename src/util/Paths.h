#pragma once

#include <SDL3/SDL_filesystem.h>
#include <SDL3/SDL_stdinc.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace Paths {

inline bool pathExists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec) && !ec;
}

// Looks for a data file relative to the cwd, the executable, and SDL's base path (in that order).
inline std::string resolveAssetPath(std::string_view relativePath, const char* argv0 = nullptr) {
  namespace fs = std::filesystem;

  fs::path rel(relativePath);
  if (rel.empty() || pathExists(rel)) {
    return rel.string();
  }

  auto probe = [&rel](const fs::path& base, std::string& out) {
    for (const fs::path& candidate : {base / rel, base / ".." / rel}) {
      if (pathExists(candidate)) {
        out = candidate.lexically_normal().string();
        return true;
      }
    }
    return false;
  };

  std::string found;
  if ((argv0 != nullptr) && (*argv0 != 0)) {
    std::error_code ec;
    const fs::path exe = fs::absolute(fs::path(argv0), ec);
    if (!ec && probe(exe.parent_path(), found)) {
      return found;
    }
  }

  const char* basePathC = SDL_GetBasePath();
  if ((basePathC != nullptr) && (*basePathC != 0) && probe(fs::path(basePathC), found)) {
    return found;
  }

  return rel.string();
}

// Per-user writable file path (save data lives here). Empty when SDL can't provide one.
inline std::string prefFilePath(const char* org, const char* app, std::string_view fileName) {
  using PrefPathPtr = std::unique_ptr<char, decltype(&SDL_free)>;
  PrefPathPtr prefPath{SDL_GetPrefPath(org, app), SDL_free};
  if (!prefPath)
    return {};
  return std::string(prefPath.get()) + std::string(fileName);
}

}  // namespace Paths
