#include "InterruptGuard.hpp"
#include "KeySequenceDecoder.hpp"
#include "TerminalInput.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <format>
#include <memory>
#include <optional>
#include <sys/select.h>
#include <unistd.h>
#include <utility>

class TerminalInputUnix : public TerminalInput {
public:
  TerminalInputUnix(RawTerminalSession session,
                    std::chrono::milliseconds escape_timeout)
      : m_session(std::move(session)), m_escape_timeout(escape_timeout) {}

  std::expected<bool, KeyholdError>
  wait_for_key(std::chrono::milliseconds timeout) override {
    // ESC ESC leaves the second ESC buffered for the next read_key()
    if (m_decoder.pending()) {
      return true;
    }
    return _wait_readable(timeout);
  }

  std::expected<std::optional<KeyCode>, KeyholdError> read_key() override {
    while (true) {
      // Something like ESC [ is buffered, give the terminal a moment to
      // deliver the rest before deciding it was a lone ESC
      if (m_decoder.pending()) {
        auto ready = _wait_readable(m_escape_timeout);
        if (!ready) {
          m_decoder.reset();
          return std::unexpected(ready.error());
        }
        if (!*ready) {
          return m_decoder.flush();
        }
      }

      if (auto interrupted = _interruption()) {
        m_decoder.reset();
        return std::unexpected(*interrupted);
      }

      uint8_t byte = 0;
      ssize_t n = read(m_session.fd(), &byte, 1);

      if (n == -1) {
        if (errno == EINTR) {
          continue;
        }

        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          if (m_decoder.pending()) {
            continue;
          }
          return std::optional<KeyCode>{};
        }

        m_decoder.reset();
        return std::unexpected(KeyholdError{
            .code = e_keyhold_error::read_error,
            .message = std::format("read() failed on fd {}: {}",
                                   m_session.fd(), strerror(errno))});
      }

      if (n == 0) {
        if (m_decoder.pending()) {
          return m_decoder.flush();
        }

        return std::unexpected(
            KeyholdError{.code = e_keyhold_error::end_of_input,
                         .message = "Input stream closed."});
      }

      if (auto code = m_decoder.feed(byte)) {
        return code;
      }
    }
  }

private:
  std::expected<bool, KeyholdError>
  _wait_readable(std::chrono::milliseconds timeout) {
    const int fd = m_session.fd();

    while (true) {
      // a signal that landed between two waits never interrupts select()
      if (auto interrupted = _interruption()) {
        return std::unexpected(*interrupted);
      }

      fd_set fds;
      FD_ZERO(&fds);
      FD_SET(fd, &fds);

      timeval tv{};
      tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
      tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

      int r = select(fd + 1, &fds, nullptr, nullptr, &tv);

      if (r == -1) {
        if (errno == EINTR) {
          continue; // checked at the top
        }

        return std::unexpected(KeyholdError{
            .code = e_keyhold_error::read_error,
            .message = std::format("select() failed on fd {}: {}", fd,
                                   strerror(errno))});
      }

      return r > 0 && FD_ISSET(fd, &fds);
    }
  }

  static std::optional<KeyholdError> _interruption() {
    const int signo = InterruptGuard::received_signal();
    if (signo == 0) {
      return std::nullopt;
    }

    return KeyholdError{.code = e_keyhold_error::interrupted,
                        .message = std::format("Interrupted by {}.",
                                               strsignal(signo))};
  }

  RawTerminalSession m_session;
  KeySequenceDecoder m_decoder;
  std::chrono::milliseconds m_escape_timeout;
};

std::expected<std::unique_ptr<TerminalInput>, KeyholdError>
create_terminal_input(int fd, const TerminalInputOptions &options) {
  auto session = RawTerminalSession::acquire(fd, options.mode);
  if (!session) {
    return std::unexpected(session.error());
  }

  return std::make_unique<TerminalInputUnix>(std::move(*session),
                                             options.escape_timeout);
}
