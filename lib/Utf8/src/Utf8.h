#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Decode one code point and advance the pointer. Returns 0 at the terminating NUL.
// Malformed sequences decode as U+FFFD and consume a single byte.
uint32_t utf8NextCodepoint(const unsigned char** string);

inline bool utf8IsCombiningMark(const uint32_t cp) {
  return (cp >= 0x0300 && cp <= 0x036F) ||  // Combining Diacritical Marks
         (cp >= 0x1DC0 && cp <= 0x1DFF) ||  // Supplement
         (cp >= 0x20D0 && cp <= 0x20FF) ||  // For Symbols
         (cp >= 0xFE20 && cp <= 0xFE2F);    // Half Marks
}

// Zero-width format characters that never occupy a terminal cell
inline bool utf8IsZeroWidth(const uint32_t cp) {
  return cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0x2060 || cp == 0xFEFF || cp == 0x00AD;
}

// East Asian wide / fullwidth ranges rendered in two terminal columns
bool utf8IsWide(uint32_t cp);

/**
 * Number of terminal columns the string occupies.
 * Wide code points count 2, combining marks and zero-width characters 0, everything else 1.
 */
size_t utf8DisplayWidth(const char* s, size_t len);
inline size_t utf8DisplayWidth(const std::string& s) { return utf8DisplayWidth(s.c_str(), s.size()); }

/**
 * Longest byte prefix of s that fits into maxLen bytes without splitting a character.
 */
size_t utf8SafePrefix(const char* s, size_t maxLen);
