#pragma once

#include "KeyholdError.hpp"
#include <expected>
#include <termios.h>

enum class e_read_mode { blocking, non_blocking };

// Holds a terminal in cbreak mode (no line buffering, no echo) for as long as
// the session lives. The original attributes and file status flags are put
// back on release(), or by the destructor if nobody released explicitly.
class RawTerminalSession {
public:
  static std::expected<RawTerminalSession, KeyholdError>
  acquire(int fd, e_read_mode mode);

  ~RawTerminalSession();

  RawTerminalSession(const RawTerminalSession &) = delete;
  RawTerminalSession &operator=(const RawTerminalSession &) = delete;
  RawTerminalSession(RawTerminalSession &&other) noexcept;
  RawTerminalSession &operator=(RawTerminalSession &&other) noexcept;

  std::expected<void, KeyholdError> release();

  int fd() const { return _fd; }
  bool is_active() const { return _active; }
  e_read_mode read_mode() const { return _mode; }

private:
  RawTerminalSession(int fd, e_read_mode mode, const termios &original_tio,
                     int original_flags)
      : _fd(fd), _mode(mode), _original_tio(original_tio),
        _original_flags(original_flags), _active(true) {}

  int _fd = -1;
  e_read_mode _mode = e_read_mode::blocking;
  termios _original_tio{};
  int _original_flags = 0;
  bool _active = false;
};
