#pragma once

#include <Epub/Book.h>

#include <cstdint>
#include <string>
#include <vector>

#include "DisplayLine.h"
#include "RenderConfig.h"

/**
 * Greedy word wrapper for terminal columns.
 *
 * Turns a chapter's paragraphs into display lines for one StyleConfig. The result depends on nothing
 * but its arguments, so callers may cache it per (chapter, style).
 */
class LineWrapper {
 public:
  static std::vector<DisplayLine> wrap(const Chapter& chapter, const StyleConfig& style);

  // Blank lines emitted between paragraphs prev and next
  static uint8_t spacingBetween(const Paragraph& prev, const Paragraph& next, const StyleConfig& style);

 private:
  static void wrapParagraph(const Paragraph& paragraph, uint32_t paragraphIndex, const StyleConfig& style,
                            std::vector<DisplayLine>& out);
  static DisplayLine buildLine(const Paragraph& paragraph, uint32_t paragraphIndex, size_t firstWord, size_t endWord,
                               const std::vector<uint16_t>& wordWidths, uint16_t indent);
  static DisplayLine blankLine(uint32_t paragraphIndex);
};
