#include "KeySequenceDecoder.hpp"

static constexpr uint8_t escape_byte = 0x1b;

static bool is_csi_final(uint8_t byte) { return byte >= 0x40 && byte <= 0x7e; }

static bool is_csi_intermediate(uint8_t byte) {
  // parameter bytes 0x30-0x3f and intermediate bytes 0x20-0x2f
  return byte >= 0x20 && byte <= 0x3f;
}

static bool is_utf8_continuation(uint8_t byte) { return (byte & 0xc0) == 0x80; }

static bool is_c0_control(uint8_t byte) {
  return byte < 0x20 && byte != escape_byte;
}

int KeySequenceDecoder::_utf8_continuation_count(uint8_t lead) {
  if ((lead & 0xe0) == 0xc0)
    return 1;
  if ((lead & 0xf0) == 0xe0)
    return 2;
  if ((lead & 0xf8) == 0xf0)
    return 3;
  return 0;
}

std::optional<KeyCode> KeySequenceDecoder::feed(uint8_t byte) {
  // A C0 control inside ESC, CSI or SS3 is executed on its own, the partial
  // sequence stays buffered around it
  if (is_c0_control(byte) && (_state == e_state::escape ||
                              _state == e_state::csi ||
                              _state == e_state::ss3)) {
    return KeyCode(1, static_cast<char>(byte));
  }

  switch (_state) {
  case e_state::ground:
    return _feed_ground(byte);

  case e_state::escape:
    if (byte == escape_byte) {
      // ESC ESC: the first one stands alone, the second starts over
      KeyCode lone(1, static_cast<char>(escape_byte));
      return lone;
    }

    _buffer += static_cast<char>(byte);

    if (byte == '[') {
      _state = e_state::csi;
      return std::nullopt;
    }

    if (byte == 'O') {
      _state = e_state::ss3;
      return std::nullopt;
    }

    if (int remaining = _utf8_continuation_count(byte); remaining > 0) {
      _utf8_remaining = remaining;
      _state = e_state::utf8;
      return std::nullopt;
    }

    return _emit(); // Alt + key

  case e_state::csi:
    _buffer += static_cast<char>(byte);

    // ESC [ [ x is how the linux console reports F1-F5
    if (_buffer.size() == 3 && byte == '[') {
      return std::nullopt;
    }

    if (is_csi_intermediate(byte) && _buffer.size() < max_sequence_length) {
      return std::nullopt;
    }

    // final byte, or a malformed/overlong sequence we give up on
    return _emit();

  case e_state::ss3:
    _buffer += static_cast<char>(byte);
    return _emit();

  case e_state::utf8:
    if (!is_utf8_continuation(byte)) {
      // truncated character, drop it and start over with this byte
      reset();
      return _feed_ground(byte);
    }

    _buffer += static_cast<char>(byte);

    if (--_utf8_remaining == 0) {
      return _emit();
    }

    return std::nullopt;
  }

  return std::nullopt;
}

std::optional<KeyCode> KeySequenceDecoder::flush() {
  if (_buffer.empty()) {
    return std::nullopt;
  }

  return _emit();
}

void KeySequenceDecoder::reset() {
  _buffer.clear();
  _state = e_state::ground;
  _utf8_remaining = 0;
}

std::optional<KeyCode> KeySequenceDecoder::_emit() {
  KeyCode code = std::move(_buffer);
  reset();
  return code;
}

std::optional<KeyCode> KeySequenceDecoder::_feed_ground(uint8_t byte) {
  _buffer += static_cast<char>(byte);

  if (byte == escape_byte) {
    _state = e_state::escape;
    return std::nullopt;
  }

  if (int remaining = _utf8_continuation_count(byte); remaining > 0) {
    _utf8_remaining = remaining;
    _state = e_state::utf8;
    return std::nullopt;
  }

  return _emit();
}
