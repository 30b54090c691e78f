#pragma once

#include <string>
#include <string_view>

// Raw byte sequence a terminal emits for one key, e.g. "\x1b[A" for Up.
using KeyCode = std::string;

// End of transmission (Ctrl-D)
inline constexpr char end_of_transmission = '\x04';

// Printable rendering for logs: "\x1b[A" becomes "^[[A", "\x04" becomes "^D".
std::string describe_key_code(std::string_view code);
