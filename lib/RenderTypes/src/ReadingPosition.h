#pragma once
#include <cstdint>

// The only durable coordinate: survives any change of width, height or style.
struct ReadingPosition {
  uint16_t chapter = 0;
  uint32_t paragraph = 0;
  uint32_t word = 0;

  ReadingPosition() = default;
  ReadingPosition(uint16_t chapter, uint32_t paragraph, uint32_t word)
      : chapter(chapter), paragraph(paragraph), word(word) {}

  bool operator==(const ReadingPosition& o) const {
    return chapter == o.chapter && paragraph == o.paragraph && word == o.word;
  }
  bool operator!=(const ReadingPosition& o) const { return !(*this == o); }
  bool operator<(const ReadingPosition& o) const {
    if (chapter != o.chapter) return chapter < o.chapter;
    if (paragraph != o.paragraph) return paragraph < o.paragraph;
    return word < o.word;
  }
  bool operator<=(const ReadingPosition& o) const { return !(o < *this); }
  bool operator>(const ReadingPosition& o) const { return o < *this; }
};
