#pragma once

#include "KeyholdError.hpp"
#include <array>
#include <signal.h>
#include <cstddef>
#include <expected>

// Catches SIGINT, SIGTERM and SIGHUP for as long as it is installed. The
// handler only records the signal; blocking calls return EINTR and
// TerminalInput turns that into e_keyhold_error::interrupted, so raw mode is
// undone by ordinary unwinding. release() puts the previous dispositions back
// and forgets the recorded signal.
class InterruptGuard {
public:
  static std::expected<InterruptGuard, KeyholdError> install();

  ~InterruptGuard();

  InterruptGuard(const InterruptGuard &) = delete;
  InterruptGuard &operator=(const InterruptGuard &) = delete;
  InterruptGuard(InterruptGuard &&other) noexcept;
  InterruptGuard &operator=(InterruptGuard &&other) = delete;

  void release() noexcept;

  // The last signal caught while installed, 0 if none
  static int received_signal() noexcept;

private:
  static constexpr size_t signal_count = 3;

  explicit InterruptGuard(
      const std::array<struct sigaction, signal_count> &previous)
      : _previous(previous), _active(true) {}

  std::array<struct sigaction, signal_count> _previous{};
  bool _active = false;
};
