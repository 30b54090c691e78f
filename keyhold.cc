#include "Calibration.hpp"
#include "HookRegistry.hpp"
#include "InterruptGuard.hpp"
#include "KeyEventLoop.hpp"
#include "Options.hpp"
#include "TerminalInput.hpp"
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <expected>
#include <print>
#include <unistd.h>
#include <utility>

static const KeyCode up_arrow = "\x1b[A";
static const KeyCode down_arrow = "\x1b[B";

static void register_demo_hooks(HookRegistry &hooks) {
  hooks.on_press(up_arrow, [] { std::println("Up pressed"); });
  hooks.on_release(up_arrow, [] { std::println("Up released"); });

  hooks.on_press(down_arrow, [] { std::println("Down pressed"); });
  hooks.on_release(down_arrow, [] { std::println("Down released"); });
}

static std::expected<CalibrationResult, KeyholdError>
resolve_delays(const KeyholdOptions &options) {
  if (!options.needs_calibration()) {
    return CalibrationResult{
        .initial_delay_ms = *options.initial_delay_ms,
        .repeat_interval_ms = *options.repeat_interval_ms};
  }

  return calibrate_keyboard_delays(
      STDIN_FILENO, CalibrationOptions{.sample_count = options.sample_count,
                                       .margin_percent = options.margin_percent});
}

// Everything that holds the terminal lives in here, so it is restored by the
// time main() reports the outcome
static std::expected<void, KeyholdError>
run_keyhold(const KeyholdOptions &options) {
  auto delays = resolve_delays(options);
  if (!delays) {
    return std::unexpected(delays.error());
  }

  HookRegistry hooks;
  register_demo_hooks(hooks);

  auto input = create_terminal_input(
      STDIN_FILENO,
      TerminalInputOptions{
          .mode = e_read_mode::non_blocking,
          .escape_timeout =
              std::chrono::milliseconds(options.escape_timeout_ms)});
  if (!input) {
    return std::unexpected(input.error());
  }

  return run_key_event_loop(
      **input, hooks, *delays,
      EventLoopOptions{.poll_timeout_ms = options.poll_timeout_ms,
                       .verbose = options.verbose});
}

int main(int argc, char *argv[]) {
  auto parse_result = parse_options(argc, argv);

  if (!parse_result) {
    std::println(stderr, "{}", parse_result.error().message);
    print_usage(argv[0]);
    return 1;
  }

  const KeyholdOptions options = std::move(parse_result.value());

  if (options.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  auto guard = InterruptGuard::install();
  if (!guard) {
    std::println(stderr, "{}", guard.error().message);
    return 1;
  }

  std::expected<void, KeyholdError> result;
  try {
    result = run_keyhold(options);
  } catch (const std::exception &e) {
    result = std::unexpected(
        KeyholdError{.code = e_keyhold_error::unknown, .message = e.what()});
  }

  if (!result) {
    if (result.error().code == e_keyhold_error::interrupted) {
      const int signo = InterruptGuard::received_signal();
      // die from the signal the way the shell expects
      guard->release();
      if (signo != 0) {
        std::raise(signo);
      }
      std::println(stderr, "{}", result.error().message);
      return 128 + signo;
    }

    std::println(stderr, "{}", result.error().message);
    return 1;
  }

  std::println("Program ended");
  return 0;
}
