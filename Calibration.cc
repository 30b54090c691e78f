#include "Calibration.hpp"
#include "InterruptGuard.hpp"
#include "KeyCode.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <format>
#include <print>
#include <string>
#include <unistd.h>

static constexpr int min_sample_count = 3;

static KeyholdError configuration_error(std::string message) {
  return KeyholdError{.code = e_keyhold_error::configuration_error,
                      .message = std::move(message)};
}

static std::expected<void, KeyholdError>
validate_options(int sample_count, int margin_percent) {
  if (sample_count < min_sample_count) {
    return std::unexpected(configuration_error(std::format(
        "Calibration needs at least {} samples to tell the initial delay "
        "from the repeat interval, got {}.",
        min_sample_count, sample_count)));
  }

  if (margin_percent < 0) {
    return std::unexpected(configuration_error(std::format(
        "Calibration margin must not be negative, got {}%.", margin_percent)));
  }

  return {};
}

std::expected<CalibrationResult, KeyholdError>
compute_calibration(const std::vector<Timestamp> &timestamps,
                    int margin_percent) {
  if (auto valid =
          validate_options(static_cast<int>(timestamps.size()), margin_percent);
      !valid) {
    return std::unexpected(valid.error());
  }

  using ms = std::chrono::duration<double, std::milli>;
  const double scale = 1.0 + margin_percent / 100.0;

  const double initial_ms = ms(timestamps[1] - timestamps[0]).count();

  // the steady-state gaps are everything after the first repeat
  double sum_ms = 0.0;
  for (size_t i = 1; i + 1 < timestamps.size(); i++) {
    sum_ms += ms(timestamps[i + 1] - timestamps[i]).count();
  }
  const double mean_ms = sum_ms / static_cast<double>(timestamps.size() - 2);

  CalibrationResult result{
      .initial_delay_ms = static_cast<int>(std::lround(initial_ms * scale)),
      .repeat_interval_ms = static_cast<int>(std::lround(mean_ms * scale))};

  if (result.initial_delay_ms <= 0 || result.repeat_interval_ms <= 0) {
    return std::unexpected(configuration_error(std::format(
        "Calibration produced unusable delays (initial {} ms, repeat {} ms).",
        result.initial_delay_ms, result.repeat_interval_ms)));
  }

  return result;
}

std::expected<std::vector<Timestamp>, KeyholdError>
sample_key_timestamps(TerminalInput &input, int sample_count,
                      const std::function<void(int)> &progress) {
  std::vector<Timestamp> timestamps;
  timestamps.reserve(sample_count);

  if (progress) {
    progress(0);
  }

  while (static_cast<int>(timestamps.size()) < sample_count) {
    auto key = input.read_key();
    if (!key) {
      return std::unexpected(key.error());
    }

    if (!key->has_value()) {
      continue;
    }

    const auto now = std::chrono::steady_clock::now();

    if (**key == KeyCode(1, end_of_transmission)) {
      return std::unexpected(KeyholdError{
          .code = e_keyhold_error::cancelled,
          .message = "Calibration cancelled."});
    }

    timestamps.push_back(now);

    if (progress) {
      progress(static_cast<int>(timestamps.size()));
    }
  }

  return timestamps;
}

// Reads fd in its restored, line-buffered mode up to the end of the line.
// End of input counts as an answer.
static std::expected<void, KeyholdError> wait_for_enter(int fd) {
  while (true) {
    if (const int signo = InterruptGuard::received_signal(); signo != 0) {
      return std::unexpected(KeyholdError{
          .code = e_keyhold_error::interrupted,
          .message = std::format("Interrupted by {}.", strsignal(signo))});
    }

    char c = 0;
    ssize_t n = read(fd, &c, 1);

    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }

      return std::unexpected(KeyholdError{
          .code = e_keyhold_error::read_error,
          .message = std::format("read() failed on fd {}: {}", fd,
                                 strerror(errno))});
    }

    if (n == 0 || c == '\n') {
      return {};
    }
  }
}

std::expected<CalibrationResult, KeyholdError>
calibrate_keyboard_delays(int fd, const CalibrationOptions &options) {
  if (auto valid =
          validate_options(options.sample_count, options.margin_percent);
      !valid) {
    return std::unexpected(valid.error());
  }

  std::println("Please press and hold the spacebar until it says STOP:");
  std::fflush(stdout);

  std::expected<std::vector<Timestamp>, KeyholdError> timestamps;
  {
    // Blocking reads, the operator is holding a key down
    auto input = create_terminal_input(
        fd, TerminalInputOptions{.mode = e_read_mode::blocking});
    if (!input) {
      return std::unexpected(input.error());
    }

    timestamps = sample_key_timestamps(
        **input, options.sample_count, [&](int taken) {
          std::print("\r{:>3}/{}", taken, options.sample_count);
          std::fflush(stdout);
        });
    // leaving the scope flushes whatever repeats are still queued up
  }

  if (!timestamps) {
    std::println("");
    return std::unexpected(timestamps.error());
  }

  auto result = compute_calibration(*timestamps, options.margin_percent);
  if (!result) {
    std::println("");
    return result;
  }

  std::println("\nSTOP, your initial keyboard repeat delay is {} milliseconds, "
               "while your average keyboard repeat delay is {} milliseconds. "
               "Press enter to continue",
               result->initial_delay_ms, result->repeat_interval_ms);

  if (auto acknowledged = wait_for_enter(fd); !acknowledged) {
    return std::unexpected(acknowledged.error());
  }

  return result;
}
