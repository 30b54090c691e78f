#pragma once

#include "KeyholdError.hpp"
#include "TerminalInput.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <vector>

struct CalibrationResult {
  int initial_delay_ms = 0;
  int repeat_interval_ms = 0;
};

struct CalibrationOptions {
  int sample_count = 10;
  // Inflates both delays to guard against releases fired by timing jitter
  int margin_percent = 4;
};

using Timestamp = std::chrono::steady_clock::time_point;

// Derives the delays from the arrival times of a held key's events. The first
// gap is the keyboard's initial delay, the mean of the remaining gaps its
// repeat interval.
std::expected<CalibrationResult, KeyholdError>
compute_calibration(const std::vector<Timestamp> &timestamps,
                    int margin_percent);

// Reads sample_count key events and returns their arrival times. progress is
// called with the number of samples taken so far.
std::expected<std::vector<Timestamp>, KeyholdError>
sample_key_timestamps(TerminalInput &input, int sample_count,
                      const std::function<void(int)> &progress = {});

// Interactive calibration on fd: asks the operator to hold the spacebar,
// prints the measured delays and waits for Enter on fd.
std::expected<CalibrationResult, KeyholdError>
calibrate_keyboard_delays(int fd, const CalibrationOptions &options = {});
