#pragma once

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace Log {

enum class Level { Info, Warning, Error };

struct Counters {
  int info = 0;
  int warnings = 0;
  int errors = 0;
};

inline Counters& counters() {
  static Counters c{};
  return c;
}

inline void resetCounters() {
  counters() = Counters{};
}

inline bool& quietInfo() {
  static bool quiet = false;
  return quiet;
}

inline std::string_view levelTag(Level level) {
  switch (level) {
    case Level::Info:
      return ": info: ";
    case Level::Warning:
      return ": warning: ";
    case Level::Error:
      return ": error: ";
  }
  return ": ";
}

inline void writeLine(std::string_view tag, Level level, std::string_view message) {
  const std::string_view sep = levelTag(level);
  (void)std::fwrite(tag.data(), 1, tag.size(), stderr);
  (void)std::fwrite(sep.data(), 1, sep.size(), stderr);
  (void)std::fwrite(message.data(), 1, message.size(), stderr);
  (void)std::fwrite("\n", 1, 1, stderr);
}

template <typename... Args>
inline void infof(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
  ++counters().info;
  if (quietInfo())
    return;
  writeLine(tag, Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void warnf(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
  ++counters().warnings;
  writeLine(tag, Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void errorf(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
  ++counters().errors;
  writeLine(tag, Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace Log
