#pragma once

#include "Calibration.hpp"
#include "HookRegistry.hpp"
#include "KeyCode.hpp"
#include "KeyholdError.hpp"
#include "TerminalInput.hpp"
#include <expected>
#include <optional>

struct EventLoopOptions {
  // std::nullopt derives it from the repeat interval
  std::optional<int> poll_timeout_ms;
  KeyCode sentinel = KeyCode(1, end_of_transmission);
  bool verbose = false;
};

// The poll timeout is also the granularity of release detection, so it has to
// stay well below the repeat interval. The default is a quarter of it.
std::expected<int, KeyholdError>
resolve_poll_timeout(const CalibrationResult &delays,
                     std::optional<int> requested);

// Runs until the sentinel key arrives or the input ends. Press hooks fire on
// the first event of a key, release hooks once its repeats stop.
std::expected<void, KeyholdError>
run_key_event_loop(TerminalInput &input, const HookRegistry &hooks,
                   const CalibrationResult &delays,
                   const EventLoopOptions &options = {});
