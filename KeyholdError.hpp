#pragma once

#include <string>

enum class e_keyhold_error {
  unknown,
  configuration_error,
  terminal_mode_error,
  read_error,
  parse_error,
  cancelled,
  end_of_input,
  interrupted
};

struct KeyholdError {
  e_keyhold_error code = e_keyhold_error::unknown;
  std::string message;
};
