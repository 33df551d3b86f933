#include "Utf8.h"

namespace {
constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

int sequenceLength(const unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 0;
}
}  // namespace

uint32_t utf8NextCodepoint(const unsigned char** string) {
  const unsigned char* s = *string;
  if (*s == 0) {
    return 0;
  }

  const int len = sequenceLength(*s);
  if (len == 0) {
    *string = s + 1;
    return REPLACEMENT_CHAR;
  }
  if (len == 1) {
    *string = s + 1;
    return *s;
  }

  uint32_t cp = *s & (0xFF >> (len + 1));
  for (int i = 1; i < len; i++) {
    if ((s[i] & 0xC0) != 0x80) {
      // Truncated sequence (also catches the NUL terminator)
      *string = s + 1;
      return REPLACEMENT_CHAR;
    }
    cp = (cp << 6) | (s[i] & 0x3F);
  }

  *string = s + len;
  return cp;
}

bool utf8IsWide(const uint32_t cp) {
  // Hangul Jamo
  if (cp >= 0x1100 && cp <= 0x115F) return true;
  // CJK Radicals, Kangxi, CJK Symbols and Punctuation, Hiragana, Katakana, Bopomofo, ...
  if (cp >= 0x2E80 && cp <= 0x303E) return true;
  if (cp >= 0x3041 && cp <= 0x33FF) return true;
  // CJK Extension A
  if (cp >= 0x3400 && cp <= 0x4DBF) return true;
  // CJK Unified Ideographs
  if (cp >= 0x4E00 && cp <= 0x9FFF) return true;
  // Yi
  if (cp >= 0xA000 && cp <= 0xA4CF) return true;
  // Hangul Syllables
  if (cp >= 0xAC00 && cp <= 0xD7A3) return true;
  // CJK Compatibility Ideographs
  if (cp >= 0xF900 && cp <= 0xFAFF) return true;
  // Vertical forms, CJK Compatibility Forms
  if (cp >= 0xFE10 && cp <= 0xFE19) return true;
  if (cp >= 0xFE30 && cp <= 0xFE6F) return true;
  // Fullwidth ASCII variants and signs (halfwidth Katakana at FF61+ is narrow)
  if (cp >= 0xFF00 && cp <= 0xFF60) return true;
  if (cp >= 0xFFE0 && cp <= 0xFFE6) return true;
  // Emoji and pictographs
  if (cp >= 0x1F300 && cp <= 0x1F64F) return true;
  if (cp >= 0x1F900 && cp <= 0x1F9FF) return true;
  // CJK Extension B and beyond (Planes 2 and 3)
  if (cp >= 0x20000 && cp <= 0x3FFFD) return true;
  return false;
}

size_t utf8DisplayWidth(const char* s, const size_t len) {
  const auto* ptr = reinterpret_cast<const unsigned char*>(s);
  const auto* const end = ptr + len;
  size_t width = 0;

  while (ptr < end && *ptr) {
    const uint32_t cp = utf8NextCodepoint(&ptr);
    if (utf8IsCombiningMark(cp) || utf8IsZeroWidth(cp)) {
      continue;
    }
    width += utf8IsWide(cp) ? 2 : 1;
  }
  return width;
}

size_t utf8SafePrefix(const char* s, const size_t maxLen) {
  if (maxLen == 0) return 0;

  size_t pos = maxLen;
  while (pos > 0) {
    const unsigned char c = static_cast<unsigned char>(s[pos - 1]);
    if (c < 0x80) {
      return pos;
    }
    if (c >= 0xC0) {
      // Lead byte: keep the character only if all of it fits
      const int charLen = sequenceLength(c);
      if (charLen > 0 && pos - 1 + charLen <= maxLen) {
        return pos - 1 + charLen;
      }
      return pos - 1;
    }
    // Continuation byte, keep walking back to the lead byte
    pos--;
  }
  return 0;
}
