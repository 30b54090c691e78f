#pragma once

#include "KeyCode.hpp"
#include <functional>
#include <map>
#include <optional>
#include <utility>

using KeyHook = std::function<void()>;

// Press and release callbacks per key code. Keys without a callback are
// simply ignored when fired.
class HookRegistry {
public:
  void on_press(const KeyCode &code, KeyHook hook) {
    _press_hooks[code] = std::move(hook);
  }

  void on_release(const KeyCode &code, KeyHook hook) {
    _release_hooks[code] = std::move(hook);
  }

  std::optional<std::reference_wrapper<const KeyHook>>
  find_press(const KeyCode &code) const {
    return _find(_press_hooks, code);
  }

  std::optional<std::reference_wrapper<const KeyHook>>
  find_release(const KeyCode &code) const {
    return _find(_release_hooks, code);
  }

  void fire_press(const KeyCode &code) const { _fire(find_press(code)); }
  void fire_release(const KeyCode &code) const { _fire(find_release(code)); }

private:
  using HookMap = std::map<KeyCode, KeyHook>;

  static std::optional<std::reference_wrapper<const KeyHook>>
  _find(const HookMap &hooks, const KeyCode &code) {
    auto it = hooks.find(code);
    if (it == hooks.end() || !it->second) {
      return std::nullopt;
    }
    return std::cref(it->second);
  }

  static void
  _fire(const std::optional<std::reference_wrapper<const KeyHook>> &hook) {
    if (hook) {
      hook->get()();
    }
  }

  HookMap _press_hooks;
  HookMap _release_hooks;
};
