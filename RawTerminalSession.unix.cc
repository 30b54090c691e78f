#include "RawTerminalSession.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <optional>
#include <string_view>
#include <unistd.h>
#include <utility>

static KeyholdError terminal_error(std::string_view what, int fd) {
  return KeyholdError{
      .code = e_keyhold_error::terminal_mode_error,
      .message = std::format("{} failed on fd {}: {}", what, fd,
                             strerror(errno))};
}

std::expected<RawTerminalSession, KeyholdError>
RawTerminalSession::acquire(int fd, e_read_mode mode) {
  if (!isatty(fd)) {
    return std::unexpected(KeyholdError{
        .code = e_keyhold_error::terminal_mode_error,
        .message = std::format("fd {} is not a terminal", fd)});
  }

  termios original_tio{};
  if (tcgetattr(fd, &original_tio) == -1) {
    return std::unexpected(terminal_error("tcgetattr()", fd));
  }

  int original_flags = fcntl(fd, F_GETFL);
  if (original_flags == -1) {
    return std::unexpected(terminal_error("fcntl(F_GETFL)", fd));
  }

  // Disable canonical mode and echo, keep ISIG so Ctrl-C still interrupts
  termios raw_tio = original_tio;
  raw_tio.c_lflag &= ~(ICANON | ECHO);
  raw_tio.c_cc[VMIN] = 1;
  raw_tio.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &raw_tio) == -1) {
    return std::unexpected(terminal_error("tcsetattr()", fd));
  }

  if (mode == e_read_mode::non_blocking &&
      fcntl(fd, F_SETFL, original_flags | O_NONBLOCK) == -1) {
    auto error = terminal_error("fcntl(F_SETFL)", fd);
    // put the attributes back before reporting, we own nothing yet
    tcsetattr(fd, TCSANOW, &original_tio);
    return std::unexpected(error);
  }

  return RawTerminalSession(fd, mode, original_tio, original_flags);
}

// Called from noexcept paths, must not throw
static void report_release_failure(const KeyholdError &error) noexcept {
  std::fprintf(stderr, "Failed to restore terminal: %s\n",
               error.message.c_str());
}

RawTerminalSession::~RawTerminalSession() {
  if (auto result = release(); !result) {
    report_release_failure(result.error());
  }
}

RawTerminalSession::RawTerminalSession(RawTerminalSession &&other) noexcept
    : _fd(other._fd), _mode(other._mode), _original_tio(other._original_tio),
      _original_flags(other._original_flags),
      _active(std::exchange(other._active, false)) {
  other._fd = -1;
}

RawTerminalSession &
RawTerminalSession::operator=(RawTerminalSession &&other) noexcept {
  if (this != &other) {
    if (auto result = release(); !result) {
      report_release_failure(result.error());
    }

    _fd = std::exchange(other._fd, -1);
    _mode = other._mode;
    _original_tio = other._original_tio;
    _original_flags = other._original_flags;
    _active = std::exchange(other._active, false);
  }

  return *this;
}

std::expected<void, KeyholdError> RawTerminalSession::release() {
  if (!_active) {
    return {};
  }

  _active = false;

  // Attempt both restorations even if the first one fails
  std::optional<KeyholdError> error;

  if (tcsetattr(_fd, TCSAFLUSH, &_original_tio) == -1) {
    error = terminal_error("tcsetattr()", _fd);
  }

  if (fcntl(_fd, F_SETFL, _original_flags) == -1 && !error) {
    error = terminal_error("fcntl(F_SETFL)", _fd);
  }

  if (error) {
    return std::unexpected(*error);
  }

  return {};
}
