
#ifndef _CC_LIB_UTF8_H
#define _CC_LIB_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

struct UTF8 {
  // True if the bytes are well-formed UTF-8. Rejects overlong
  // encodings, surrogates (U+D800 to U+DFFF), codepoints above
  // U+10FFFF, and truncated sequences.
  static bool IsValid(std::string_view s);

  // Number of codepoints in a valid UTF-8 string. On invalid input this
  // just counts the bytes that are not continuation bytes.
  static size_t Length(std::string_view s);

  // Decodes the codepoint starting at s[pos], setting *len to the
  // number of bytes it uses. Input should be valid UTF-8; a bad or
  // truncated sequence decodes as its single lead byte.
  static uint32_t DecodeAt(std::string_view s, size_t pos, size_t *len);

  // Unicode White_Space: U+0009-U+000D, U+0020, U+0085, U+00A0,
  // U+1680, U+2000-U+200A, U+2028, U+2029, U+202F, U+205F, U+3000.
  static bool IsWhitespace(uint32_t codepoint);

  // Strips leading and trailing White_Space codepoints from valid
  // UTF-8, so "cab" followed by U+00A0 becomes "cab".
  static std::string Trim(std::string_view s);

  // Continuation bytes look like 10xxxxxx.
  static constexpr bool IsContinuation(unsigned char c) {
    return (c & 0b11000000) == 0b10000000;
  }

 private:
  UTF8() = delete;
};

#endif
