#include "core/InputScript.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <toml++/toml.h>

#include "util/Math.h"
#include "util/TomlUtil.h"

namespace {

std::optional<uint64_t> keyframeFrame(const toml::table& t) {
  for (std::string_view key : {"frame", "at"}) {
    if (auto v = t.get(key)) {
      const int f = v->value_or(-1);
      if (f >= 0)
        return static_cast<uint64_t>(f);
    }
  }
  return std::nullopt;
}

}  // namespace

bool InputScript::appendFile(const std::filesystem::path& path,
                             std::unordered_set<std::string>& visited) {
  const std::filesystem::path normalized = path.lexically_normal();
  const std::string pathStr = normalized.string();
  if (pathStr.empty()) {
    return false;
  }

  if (!visited.insert(pathStr).second) {
    TomlUtil::warnf(pathStr.c_str(), "input script include cycle detected; skipping");
    return true;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(pathStr);
  } catch (const toml::parse_error& err) {
    TomlUtil::warnf(pathStr.c_str(), "parse failed: {}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, pathStr.c_str(), "root", {"version", "keyframes", "include"});

  int version = 1;
  if (auto v = tbl["version"].value<int>())
    version = *v;
  if (version != 1) {
    TomlUtil::warnf(pathStr.c_str(), "input script version {} (expected 1)", version);
  }

  if (auto include = tbl["include"].value<std::string>()) {
    if (!appendFile(normalized.parent_path() / *include, visited)) {
      return false;
    }
  } else if (tbl.contains("include")) {
    TomlUtil::warnf(pathStr.c_str(), "include must be a string path");
  }

  const toml::array* framesArr = tbl["keyframes"].as_array();
  if (!framesArr)
    return true;

  std::size_t idx = 0;
  for (const auto& node : *framesArr) {
    const std::string scope = "keyframes[" + std::to_string(idx++) + "]";
    const toml::table* t = node.as_table();
    if (!t) {
      TomlUtil::warnf(pathStr.c_str(), "{} is not a table", scope);
      continue;
    }

    TomlUtil::warnUnknownKeys(*t, pathStr.c_str(), scope,
                              {"frame", "at", "left", "right", "jump", "tap", "axis"});

    const auto frame = keyframeFrame(*t);
    if (!frame) {
      TomlUtil::warnf(pathStr.c_str(), "{} missing frame (use frame = N)", scope);
      continue;
    }

    Keyframe kf{};
    kf.frame = *frame;
    if (auto v = t->get("left"))
      kf.left = v->value_or(false);
    if (auto v = t->get("right"))
      kf.right = v->value_or(false);
    // "tap" is the touch-screen spelling of jump.
    for (std::string_view key : {"jump", "tap"}) {
      if (auto v = t->get(key))
        kf.jump = v->value_or(false);
    }
    if (auto v = t->get("axis"))
      kf.axis = util::clampf(v->value_or(0.0F), -1.0F, 1.0F);

    keyframes_.push_back(kf);
  }

  return true;
}

bool InputScript::loadFromToml(const char* path) {
  keyframes_.clear();
  reset();
  loaded_ = false;
  path_ = path ? path : "";

  std::unordered_set<std::string> visited;
  if (!appendFile(path_, visited))
    return false;

  std::ranges::stable_sort(keyframes_, {}, &Keyframe::frame);
  loaded_ = true;
  return true;
}

void InputScript::reset() {
  current_ = Controls{};
  previous_ = Controls{};
  history_ = InputState{};
  cursor_ = 0;
  lastSampled_.reset();
}

uint64_t InputScript::lastKeyframe() const {
  return keyframes_.empty() ? 0 : keyframes_.back().frame;
}

InputState InputScript::sample(uint64_t frame) {
  if (!loaded_)
    return InputState{};

  // Sampling an earlier frame replays from the start.
  if (!lastSampled_ || frame < *lastSampled_)
    reset();

  for (; cursor_ < keyframes_.size() && keyframes_[cursor_].frame <= frame; ++cursor_) {
    const Keyframe& kf = keyframes_[cursor_];
    current_.left = kf.left.value_or(current_.left);
    current_.right = kf.right.value_or(current_.right);
    current_.jump = kf.jump.value_or(current_.jump);
    current_.axis = kf.axis.value_or(current_.axis);
  }

  InputState out{};
  out.left = current_.left;
  out.right = current_.right;
  out.axis = current_.axis;
  out.jumpHeld = current_.jump;
  out.jumpPressed = current_.jump && !previous_.jump;
  out.jumpReleased = !current_.jump && previous_.jump;
  out.carryHistory(history_);

  history_ = out;
  previous_ = current_;
  lastSampled_ = frame;
  return out;
}
