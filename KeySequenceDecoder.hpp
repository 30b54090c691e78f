#pragma once

#include "KeyCode.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

// Splits a raw terminal byte stream into key codes, one byte at a time.
//
// Recognised shapes:
//   plain byte                 'a', '\n', 0x04
//   CSI  ESC [ params final    ESC [ A, ESC [ 1 ; 5 C, ESC [ 3 ~
//   linux console F-keys       ESC [ [ A
//   SS3  ESC O x               ESC O P
//   Alt  ESC x                 ESC a
//   UTF-8 multi-byte character
//
// C0 control bytes (Ctrl-D among them) that arrive in the middle of an escape
// sequence are returned immediately as keys of their own.
//
// A lone ESC cannot be told apart from the start of a sequence, so the caller
// is expected to flush() once no further byte arrived within a short timeout.
class KeySequenceDecoder {
public:
  static constexpr size_t max_sequence_length = 32;

  std::optional<KeyCode> feed(uint8_t byte);

  // Emits whatever partial sequence is buffered.
  std::optional<KeyCode> flush();

  bool pending() const { return !_buffer.empty(); }

  void reset();

private:
  enum class e_state { ground, escape, csi, ss3, utf8 };

  std::optional<KeyCode> _emit();
  std::optional<KeyCode> _feed_ground(uint8_t byte);

  static int _utf8_continuation_count(uint8_t lead);

  KeyCode _buffer;
  e_state _state = e_state::ground;
  int _utf8_remaining = 0;
};
