
#include "utf8.h"

#include <cstdint>
#include <string>
#include <string_view>

using namespace std;

bool UTF8::IsValid(string_view s) {
  const size_t n = s.size();
  size_t i = 0;
  while (i < n) {
    const uint8_t c = s[i];
    if (c < 0x80) {
      i++;
      continue;
    }

    // Number of continuation bytes, and the smallest allowed value
    // for the second byte (to reject overlongs and surrogates).
    int extra = 0;
    uint8_t lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      extra = 1;
    } else if (c == 0xE0) {
      extra = 2;
      lo = 0xA0;
    } else if (c >= 0xE1 && c <= 0xEC) {
      extra = 2;
    } else if (c == 0xED) {
      extra = 2;
      // Would encode U+D800-U+DFFF.
      hi = 0x9F;
    } else if (c >= 0xEE && c <= 0xEF) {
      extra = 2;
    } else if (c == 0xF0) {
      extra = 3;
      lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
      extra = 3;
    } else if (c == 0xF4) {
      extra = 3;
      // Above U+10FFFF otherwise.
      hi = 0x8F;
    } else {
      // Bare continuation byte, C0/C1 overlong lead, or F5-FF.
      return false;
    }

    // Truncated.
    if (i + extra >= n) return false;

    const uint8_t c1 = s[i + 1];
    if (c1 < lo || c1 > hi) return false;
    for (int j = 2; j <= extra; j++) {
      if (!IsContinuation(s[i + j])) return false;
    }
    i += extra + 1;
  }
  return true;
}

size_t UTF8::Length(string_view s) {
  size_t len = 0;
  for (char c : s) {
    if (!IsContinuation(c)) len++;
  }
  return len;
}

uint32_t UTF8::DecodeAt(string_view s, size_t pos, size_t *len) {
  const uint8_t c = s[pos];
  int extra = 0;
  uint32_t cp = c;
  if (c >= 0xC0 && c < 0xE0) {
    extra = 1;
    cp = c & 0x1F;
  } else if (c >= 0xE0 && c < 0xF0) {
    extra = 2;
    cp = c & 0x0F;
  } else if (c >= 0xF0 && c < 0xF8) {
    extra = 3;
    cp = c & 0x07;
  }

  if (extra == 0 || pos + extra >= s.size()) {
    *len = 1;
    return c;
  }
  for (int j = 1; j <= extra; j++) {
    const uint8_t cc = s[pos + j];
    if (!IsContinuation(cc)) {
      *len = 1;
      return c;
    }
    cp = (cp << 6) | (cc & 0x3F);
  }
  *len = extra + 1;
  return cp;
}

bool UTF8::IsWhitespace(uint32_t cp) {
  if (cp >= 0x09 && cp <= 0x0D) return true;
  if (cp >= 0x2000 && cp <= 0x200A) return true;
  switch (cp) {
  case 0x20:
  case 0x85:
  case 0xA0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return true;
  default:
    return false;
  }
}

string UTF8::Trim(string_view s) {
  // Leading.
  while (!s.empty()) {
    size_t len = 0;
    if (!IsWhitespace(DecodeAt(s, 0, &len))) break;
    s.remove_prefix(len);
  }

  // Trailing. Back up to the start of the last codepoint.
  while (!s.empty()) {
    size_t start = s.size() - 1;
    while (start > 0 && IsContinuation(s[start])) start--;
    size_t len = 0;
    const uint32_t cp = DecodeAt(s, start, &len);
    if (start + len != s.size() || !IsWhitespace(cp)) break;
    s.remove_suffix(len);
  }
  return string(s);
}
