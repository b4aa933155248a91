#pragma once

#include <algorithm>
#include <format>
#include <initializer_list>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <toml++/toml.h>

#include "util/Log.h"

namespace TomlUtil {

// Config diagnostics go through Log with the file path as the tag so editors can jump to it.
template <typename... Args>
inline void warnf(const char* path, std::format_string<Args...> fmt, Args&&... args) {
  const std::string_view tag = (path != nullptr) ? std::string_view{path} : std::string_view{"<toml>"};
  Log::warnf(tag, fmt, std::forward<Args>(args)...);
}

inline bool allowedKey(std::string_view key, std::initializer_list<std::string_view> allowed) {
  return std::ranges::any_of(allowed, [key](std::string_view a) { return key == a; });
}

inline void warnUnknownKeys(const toml::table& tbl,
                            const char* path,
                            std::string_view scope,
                            std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, node] : tbl) {
    (void)node;
    std::string_view k = key.str();
    if (allowedKey(k, allowed)) {
      continue;
    }
    warnf(path, "unknown key '{}' in {}", k, scope);
  }
}

// Reads an integer array, skipping (and warning about) non-integer entries.
inline void readIntArray(const toml::table& tbl,
                         std::string_view key,
                         const char* path,
                         std::string_view scope,
                         std::vector<int>& out) {
  const toml::node* node = tbl.get(key);
  if (!node)
    return;
  const toml::array* arr = node->as_array();
  if (!arr) {
    warnf(path, "{}.{} must be an array of integers", scope, key);
    return;
  }
  std::vector<int> next;
  std::size_t idx = 0;
  for (const auto& item : *arr) {
    if (auto v = item.value<int>()) {
      next.push_back(*v);
    } else {
      warnf(path, "{}.{}[{}] is not an integer; skipping", scope, key, idx);
    }
    ++idx;
  }
  out = std::move(next);
}

}  // namespace TomlUtil
