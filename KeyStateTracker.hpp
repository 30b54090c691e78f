#pragma once

#include "Calibration.hpp"
#include "HookRegistry.hpp"
#include "KeyCode.hpp"
#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <vector>

struct KeyState {
  bool pressed = false;
  // No repeat seen yet since the press began, so the (longer) initial delay
  // applies instead of the repeat interval
  bool is_first_repeat = true;
  long elapsed_since_last_event_ms = 0;
};

// Infers key releases from the absence of key repeats.
//
// Every key starts out released. The first event presses it; later events
// are repeats. Once no event arrived for longer than the delay the keyboard
// is known to repeat at, the key is considered released. This is a guess:
// a keyboard that repeats slower than calibrated will see early releases.
class KeyStateTracker {
public:
  KeyStateTracker(const HookRegistry &hooks, const CalibrationResult &delays)
      : _hooks(hooks), _delays(delays) {}

  void on_event_observed(const KeyCode &code);
  void on_tick(long delta_ms);

  bool is_pressed(const KeyCode &code) const;
  std::optional<KeyState> state(const KeyCode &code) const;
  std::vector<KeyCode> pressed_keys() const;

  const CalibrationResult &delays() const { return _delays; }

  // Told about every inferred transition, registered hook or not
  using TransitionObserver =
      std::function<void(const KeyCode &code, bool pressed)>;
  void set_observer(TransitionObserver observer) {
    _observer = std::move(observer);
  }

private:
  const HookRegistry &_hooks;
  CalibrationResult _delays;
  TransitionObserver _observer;
  std::map<KeyCode, KeyState> _keys;
};
