#pragma once

#include "KeyholdError.hpp"
#include <expected>
#include <optional>
#include <string_view>

struct KeyholdOptions {
  bool show_help = false;
  bool verbose = false;
  // Both given means calibration is skipped
  std::optional<int> initial_delay_ms;
  std::optional<int> repeat_interval_ms;
  std::optional<int> poll_timeout_ms;
  int sample_count = 10;
  int margin_percent = 4;
  int escape_timeout_ms = 10;

  bool needs_calibration() const {
    return !initial_delay_ms.has_value() || !repeat_interval_ms.has_value();
  }
};

using ParseOptionsResult = std::expected<KeyholdOptions, KeyholdError>;

ParseOptionsResult parse_options(int argc, const char *const argv[]);

void print_usage(std::string_view program_name);
