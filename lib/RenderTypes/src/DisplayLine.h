#pragma once

#include <Epub/Book.h>

#include <cstdint>
#include <string>
#include <vector>

#include "ReadingPosition.h"

// Styled column range [startColumn, endColumn) of a rendered line
struct LineSpan {
  SpanStyle style;
  uint16_t startColumn;
  uint16_t endColumn;

  bool operator==(const LineSpan& o) const {
    return style == o.style && startColumn == o.startColumn && endColumn == o.endColumn;
  }
};

struct DisplayLine {
  enum class Kind : uint8_t { Heading, Body, Blank };

  Kind kind = Kind::Blank;
  std::string text;
  std::vector<LineSpan> spans;
  uint16_t columns = 0;    // display width of text
  uint16_t wordCount = 0;  // words that start on this line
  bool padding = false;    // filler added by the paginator

  // Back-reference: where in the chapter's logical text this line begins
  uint32_t paragraph = 0;
  uint32_t word = 0;

  bool isBlank() const { return kind == Kind::Blank; }
  ReadingPosition positionIn(uint16_t chapter) const { return ReadingPosition(chapter, paragraph, word); }

  // Compare back-references within one chapter
  bool startsAtOrBefore(uint32_t p, uint32_t w) const { return paragraph < p || (paragraph == p && word <= w); }

  bool operator==(const DisplayLine& o) const {
    return kind == o.kind && text == o.text && spans == o.spans && columns == o.columns && wordCount == o.wordCount &&
           padding == o.padding && paragraph == o.paragraph && word == o.word;
  }
  bool operator!=(const DisplayLine& o) const { return !(*this == o); }
};

// Contiguous slice of one chapter's lines. Never spans two chapters.
struct Page {
  uint16_t chapter = 0;
  uint32_t firstLine = 0;  // index of lines[0] within the chapter
  std::vector<DisplayLine> lines;

  // First line carrying text, or the first line when the page is all blank
  const DisplayLine* anchorLine() const {
    for (const auto& line : lines) {
      if (!line.isBlank()) return &line;
    }
    return lines.empty() ? nullptr : &lines.front();
  }
};
