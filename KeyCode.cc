#include "KeyCode.hpp"

std::string describe_key_code(std::string_view code) {
  std::string ret;
  ret.reserve(code.size() * 2);

  for (const char c : code) {
    const auto byte = static_cast<unsigned char>(c);

    if (byte < 0x20) {
      ret += '^';
      ret += static_cast<char>(byte + '@');
    } else if (byte == 0x7f) {
      ret += "^?";
    } else if (byte == ' ') {
      ret += "SPACE";
    } else {
      // printable ASCII and UTF-8 bytes are left for the terminal to render
      ret += c;
    }
  }

  if (ret.empty()) {
    return "<empty>";
  }

  return ret;
}
