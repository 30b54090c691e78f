#include "KeyStateTracker.hpp"

void KeyStateTracker::on_event_observed(const KeyCode &code) {
  KeyState &key = _keys[code];

  if (!key.pressed) {
    key.pressed = true;
    key.is_first_repeat = true;
    if (_observer) {
      _observer(code, true);
    }
    _hooks.fire_press(code);
  } else {
    key.is_first_repeat = false;
  }

  key.elapsed_since_last_event_ms = 0;
}

void KeyStateTracker::on_tick(long delta_ms) {
  for (auto &[code, key] : _keys) {
    if (!key.pressed) {
      continue;
    }

    key.elapsed_since_last_event_ms += delta_ms;

    const long threshold_ms = key.is_first_repeat
                                  ? _delays.initial_delay_ms
                                  : _delays.repeat_interval_ms;

    if (key.elapsed_since_last_event_ms > threshold_ms) {
      key.pressed = false;
      key.is_first_repeat = true;
      if (_observer) {
        _observer(code, false);
      }
      _hooks.fire_release(code);
    }
  }
}

bool KeyStateTracker::is_pressed(const KeyCode &code) const {
  auto it = _keys.find(code);
  return it != _keys.end() && it->second.pressed;
}

std::optional<KeyState> KeyStateTracker::state(const KeyCode &code) const {
  auto it = _keys.find(code);
  if (it == _keys.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<KeyCode> KeyStateTracker::pressed_keys() const {
  std::vector<KeyCode> ret;
  for (const auto &[code, key] : _keys) {
    if (key.pressed) {
      ret.push_back(code);
    }
  }
  return ret;
}
