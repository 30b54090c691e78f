#include "InterruptGuard.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <utility>

static constexpr std::array<int, 3> handled_signals{SIGINT, SIGTERM, SIGHUP};

static volatile std::sig_atomic_t received = 0;

static void record_signal(int signo) { received = signo; }

std::expected<InterruptGuard, KeyholdError> InterruptGuard::install() {
  std::array<struct sigaction, signal_count> previous{};

  struct sigaction action{};
  action.sa_handler = record_signal;
  sigemptyset(&action.sa_mask);
  // no SA_RESTART, select() and read() have to come back with EINTR
  action.sa_flags = 0;

  received = 0;

  for (size_t i = 0; i < signal_count; i++) {
    if (sigaction(handled_signals[i], &action, &previous[i]) == -1) {
      const int saved_errno = errno;
      for (size_t j = 0; j < i; j++) {
        sigaction(handled_signals[j], &previous[j], nullptr);
      }
      return std::unexpected(KeyholdError{
          .code = e_keyhold_error::unknown,
          .message = std::format("sigaction({}) failed: {}",
                                 strsignal(handled_signals[i]),
                                 strerror(saved_errno))});
    }
  }

  return InterruptGuard(previous);
}

InterruptGuard::~InterruptGuard() { release(); }

InterruptGuard::InterruptGuard(InterruptGuard &&other) noexcept
    : _previous(other._previous),
      _active(std::exchange(other._active, false)) {}

void InterruptGuard::release() noexcept {
  if (!_active) {
    return;
  }

  _active = false;

  for (size_t i = 0; i < signal_count; i++) {
    sigaction(handled_signals[i], &_previous[i], nullptr);
  }

  received = 0;
}

int InterruptGuard::received_signal() noexcept { return received; }
