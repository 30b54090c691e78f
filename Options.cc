#include "Options.hpp"
#include <print>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

void print_usage(const std::string_view program_name) {
  std::println("Usage: {} [OPTIONS]\n", program_name);
  std::println("Reports key presses and infers key releases from the "
               "keyboard's repeat timing.\n");
  std::println("Keyboard delays (calibrated interactively unless both are "
               "given):");
  std::println("  --initial-delay <ms>    Delay before the first key repeat.");
  std::println("  --repeat-interval <ms>  Delay between subsequent repeats.\n");
  std::println("Calibration Options:");
  std::println("  --samples <n>           Key events to sample, at least 3 "
               "(default 10).");
  std::println("  --margin <percent>      Added to both measured delays "
               "(default 4).\n");
  std::println("General Options:");
  std::println("  --poll-timeout <ms>     Release detection granularity, at "
               "most half the");
  std::println("                          repeat interval (default: a quarter "
               "of it).");
  std::println("  --escape-timeout <ms>   Wait for the rest of an escape "
               "sequence (default 10).");
  std::println("  -v, --verbose           Log every press and release to "
               "stderr.");
  std::println("  -h, --help              Displays this help message and "
               "exits.\n");
  std::println("Press Ctrl-D to quit.\n");
  std::println("Examples:");
  std::println("  # Calibrate, then watch the arrow keys");
  std::println("  {}\n", program_name);
  std::println("  # Skip calibration");
  std::println("  {} --initial-delay 270 --repeat-interval 40", program_name);
}

static KeyholdError parse_error(std::string message) {
  return KeyholdError{.code = e_keyhold_error::parse_error,
                      .message = std::move(message)};
}

static std::expected<int, KeyholdError>
parse_number_argument(std::vector<std::string_view>::const_iterator &it,
                      std::vector<std::string_view>::const_iterator end) {
  const std::string_view option = *it;

  if (it + 1 == end) {
    return std::unexpected(
        parse_error("Error: The " + std::string(option) +
                    " option requires a non-negative number argument."));
  }

  std::stringstream convertor;
  int number = 0;

  convertor << *(++it);
  convertor >> number;

  if (convertor.fail() || !convertor.eof() || number < 0) {
    return std::unexpected(parse_error(
        "Error: The " + std::string(option) +
        " option requires a non-negative number argument, got '" +
        std::string(*it) + "'."));
  }

  return number;
}

ParseOptionsResult parse_options(int argc, const char *const argv[]) {
  KeyholdOptions options;
  const std::vector<std::string_view> args(argv, argv + argc);

  for (auto it = args.cbegin() + 1; it != args.cend(); ++it) {
    const std::string_view arg = *it;

    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
      return options;
    }

    if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
      continue;
    }

    std::optional<int> *optional_target = nullptr;
    int *target = nullptr;

    if (arg == "--initial-delay") {
      optional_target = &options.initial_delay_ms;
    } else if (arg == "--repeat-interval") {
      optional_target = &options.repeat_interval_ms;
    } else if (arg == "--poll-timeout") {
      optional_target = &options.poll_timeout_ms;
    } else if (arg == "--samples") {
      target = &options.sample_count;
    } else if (arg == "--margin") {
      target = &options.margin_percent;
    } else if (arg == "--escape-timeout") {
      target = &options.escape_timeout_ms;
    } else {
      return std::unexpected(
          parse_error("Error: Unknown argument '" + std::string(arg) + "'."));
    }

    auto number = parse_number_argument(it, args.cend());
    if (!number) {
      return std::unexpected(number.error());
    }

    if (optional_target) {
      *optional_target = *number;
    } else {
      *target = *number;
    }
  }

  if (options.initial_delay_ms.has_value() !=
      options.repeat_interval_ms.has_value()) {
    return std::unexpected(
        parse_error("Error: --initial-delay and --repeat-interval must be "
                    "given together."));
  }

  return options;
}
