#pragma once

#include "KeyCode.hpp"
#include "KeyholdError.hpp"
#include "RawTerminalSession.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <optional>

class TerminalInput {
public:
  virtual ~TerminalInput() = default;

  // true when input is ready, false when the timeout elapsed first
  virtual std::expected<bool, KeyholdError>
  wait_for_key(std::chrono::milliseconds timeout) = 0;

  // Reads one complete key code. std::nullopt when nothing was available
  // after all (spurious wake-up in non-blocking mode). End of input is
  // reported as e_keyhold_error::end_of_input.
  virtual std::expected<std::optional<KeyCode>, KeyholdError> read_key() = 0;
};

struct TerminalInputOptions {
  e_read_mode mode = e_read_mode::non_blocking;
  // How long to wait for the rest of a multi-byte sequence after ESC
  std::chrono::milliseconds escape_timeout{10};
};

// Puts fd into raw mode for the lifetime of the returned object.
std::expected<std::unique_ptr<TerminalInput>, KeyholdError>
create_terminal_input(int fd, const TerminalInputOptions &options = {});
