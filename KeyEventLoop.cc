#include "KeyEventLoop.hpp"
#include "KeyStateTracker.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <format>
#include <print>

std::expected<int, KeyholdError>
resolve_poll_timeout(const CalibrationResult &delays,
                     std::optional<int> requested) {
  if (delays.initial_delay_ms <= 0 || delays.repeat_interval_ms <= 0) {
    return std::unexpected(KeyholdError{
        .code = e_keyhold_error::configuration_error,
        .message = std::format(
            "Keyboard delays must be positive (initial {} ms, repeat {} ms).",
            delays.initial_delay_ms, delays.repeat_interval_ms)});
  }

  if (!requested.has_value()) {
    return std::max(1, delays.repeat_interval_ms / 4);
  }

  if (*requested <= 0) {
    return std::unexpected(KeyholdError{
        .code = e_keyhold_error::configuration_error,
        .message = std::format("Poll timeout must be positive, got {} ms.",
                               *requested)});
  }

  if (*requested > delays.repeat_interval_ms / 2) {
    return std::unexpected(KeyholdError{
        .code = e_keyhold_error::configuration_error,
        .message = std::format(
            "Poll timeout of {} ms is too coarse for a repeat interval of {} "
            "ms, use at most {} ms.",
            *requested, delays.repeat_interval_ms,
            delays.repeat_interval_ms / 2)});
  }

  return *requested;
}

std::expected<void, KeyholdError>
run_key_event_loop(TerminalInput &input, const HookRegistry &hooks,
                   const CalibrationResult &delays,
                   const EventLoopOptions &options) {
  auto poll_timeout_ms = resolve_poll_timeout(delays, options.poll_timeout_ms);
  if (!poll_timeout_ms) {
    return std::unexpected(poll_timeout_ms.error());
  }

  KeyStateTracker tracker(hooks, delays);

  if (options.verbose) {
    tracker.set_observer([](const KeyCode &code, bool pressed) {
      std::println(stderr, "{} {}", pressed ? "press" : "release",
                   describe_key_code(code));
    });
    std::println(stderr,
                 "Watching keys: initial delay {} ms, repeat interval {} ms, "
                 "poll timeout {} ms",
                 delays.initial_delay_ms, delays.repeat_interval_ms,
                 *poll_timeout_ms);
  }

  const std::chrono::milliseconds timeout{*poll_timeout_ms};

  while (true) {
    auto ready = input.wait_for_key(timeout);
    if (!ready) {
      return std::unexpected(ready.error());
    }

    if (!*ready) {
      // Nothing arrived for a whole timeout, let held keys age
      tracker.on_tick(*poll_timeout_ms);
      continue;
    }

    auto key = input.read_key();
    if (!key) {
      if (key.error().code == e_keyhold_error::end_of_input) {
        return {};
      }
      return std::unexpected(key.error());
    }

    if (!key->has_value()) {
      continue;
    }

    if (**key == options.sentinel) {
      return {};
    }

    tracker.on_event_observed(**key);
  }
}
