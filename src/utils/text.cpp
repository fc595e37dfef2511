#include "utils/text.hpp"
#include <cstdint>

namespace vault {
namespace utils {

namespace {

const char REPLACEMENT[] = "\xEF\xBF\xBD";

bool is_continuation(uint8_t byte) {
  return (byte & 0xC0) == 0x80;
}

// Length of the valid sequence starting at pos, 0 if invalid
std::size_t sequence_length(const std::string& input, std::size_t pos) {
  const auto lead = static_cast<uint8_t>(input[pos]);
  std::size_t length = 0;
  uint32_t code_point = 0;

  if (lead < 0x80) {
    return 1;
  } else if ((lead & 0xE0) == 0xC0) {
    length = 2;
    code_point = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    code_point = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    code_point = lead & 0x07;
  } else {
    return 0;
  }

  if (pos + length > input.size()) {
    return 0;
  }

  for (std::size_t i = 1; i < length; ++i) {
    const auto byte = static_cast<uint8_t>(input[pos + i]);
    if (!is_continuation(byte)) {
      return 0;
    }
    code_point = (code_point << 6) | (byte & 0x3F);
  }

  // Reject overlong forms, surrogates and out of range values
  if ((length == 2 && code_point < 0x80) ||
      (length == 3 && code_point < 0x800) ||
      (length == 4 && code_point < 0x10000) ||
      (code_point >= 0xD800 && code_point <= 0xDFFF) ||
      code_point > 0x10FFFF) {
    return 0;
  }
  return length;
}

} // namespace

std::string sanitize_utf8(const std::string& input) {
  std::string output;
  output.reserve(input.size());

  std::size_t pos = 0;
  while (pos < input.size()) {
    std::size_t length = sequence_length(input, pos);
    if (length == 0) {
      output += REPLACEMENT;
      ++pos;
      continue;
    }
    output.append(input, pos, length);
    pos += length;
  }
  return output;
}

} // namespace utils
} // namespace vault
