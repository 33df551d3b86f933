#include "LineWrapper.h"

#include <Logging.h>
#include <Utf8.h>

#include <algorithm>
#include <cstdint>

#define TAG "WRAP"

namespace {
constexpr SpanStyle SPAN_STYLES[] = {SpanStyle::Emphasis, SpanStyle::Strong};

uint16_t clampWidth(const size_t width) { return static_cast<uint16_t>(std::min<size_t>(width, UINT16_MAX)); }
}  // namespace

uint8_t LineWrapper::spacingBetween(const Paragraph& prev, const Paragraph& next, const StyleConfig& style) {
  if (prev.isBlank() || next.isBlank()) {
    return 0;
  }
  if (prev.kind == Paragraph::Kind::Heading || next.kind == Paragraph::Kind::Heading) {
    return style.headingSpacing;
  }
  return style.paragraphSpacing;
}

DisplayLine LineWrapper::blankLine(const uint32_t paragraphIndex) {
  DisplayLine line;
  line.kind = DisplayLine::Kind::Blank;
  line.paragraph = paragraphIndex;
  line.word = 0;
  return line;
}

DisplayLine LineWrapper::buildLine(const Paragraph& paragraph, const uint32_t paragraphIndex, const size_t firstWord,
                                   const size_t endWord, const std::vector<uint16_t>& wordWidths,
                                   const uint16_t indent) {
  DisplayLine line;
  line.kind = paragraph.kind == Paragraph::Kind::Heading ? DisplayLine::Kind::Heading : DisplayLine::Kind::Body;
  line.paragraph = paragraphIndex;
  line.word = static_cast<uint32_t>(firstWord);
  line.wordCount = static_cast<uint16_t>(endWord - firstWord);
  line.text.assign(indent, ' ');

  size_t column = indent;
  std::vector<size_t> startColumns;
  startColumns.reserve(endWord - firstWord);
  for (size_t i = firstWord; i < endWord; i++) {
    if (i > firstWord) {
      line.text += ' ';
      column++;
    }
    startColumns.push_back(column);
    line.text += paragraph.words[i];
    column += wordWidths[i];
  }
  line.columns = clampWidth(column);

  if (paragraph.spans.empty()) {
    return line;
  }

  // Adjacent styled words merge into one column range that covers the space between them
  for (const auto style : SPAN_STYLES) {
    bool open = false;
    for (size_t i = firstWord; i < endWord; i++) {
      if (!paragraph.hasStyle(style, static_cast<uint32_t>(i))) {
        open = false;
        continue;
      }
      const size_t start = startColumns[i - firstWord];
      const size_t end = start + wordWidths[i];
      if (open) {
        line.spans.back().endColumn = clampWidth(end);
      } else {
        line.spans.push_back({style, clampWidth(start), clampWidth(end)});
        open = true;
      }
    }
  }
  return line;
}

void LineWrapper::wrapParagraph(const Paragraph& paragraph, const uint32_t paragraphIndex, const StyleConfig& style,
                                std::vector<DisplayLine>& out) {
  if (paragraph.isBlank()) {
    out.push_back(blankLine(paragraphIndex));
    return;
  }
  if (paragraph.words.empty()) {
    return;
  }

  std::vector<uint16_t> wordWidths;
  wordWidths.reserve(paragraph.words.size());
  for (const auto& word : paragraph.words) {
    wordWidths.push_back(clampWidth(utf8DisplayWidth(word)));
  }

  // The indent is dropped when it would push the first word past the width
  const size_t width = std::max<uint16_t>(style.width, 1);
  const bool indented = paragraph.kind == Paragraph::Kind::Body && style.indent > 0 &&
                        static_cast<size_t>(style.indent) + wordWidths[0] <= width;
  const uint16_t indent = indented ? style.indent : 0;

  size_t lineStart = 0;
  size_t lineWidth = indent + wordWidths[0];
  bool firstLine = true;
  for (size_t i = 1; i < paragraph.words.size(); i++) {
    if (lineWidth + 1 + wordWidths[i] <= width) {
      lineWidth += 1 + wordWidths[i];
      continue;
    }
    out.push_back(buildLine(paragraph, paragraphIndex, lineStart, i, wordWidths, firstLine ? indent : 0));
    firstLine = false;
    lineStart = i;
    lineWidth = wordWidths[i];
  }
  out.push_back(buildLine(paragraph, paragraphIndex, lineStart, paragraph.words.size(), wordWidths,
                          firstLine ? indent : 0));
}

std::vector<DisplayLine> LineWrapper::wrap(const Chapter& chapter, const StyleConfig& style) {
  std::vector<DisplayLine> lines;
  const auto& paragraphs = chapter.paragraphs;

  for (size_t i = 0; i < paragraphs.size(); i++) {
    const auto paragraphIndex = static_cast<uint32_t>(i);
    if (i > 0) {
      const uint8_t spacing = spacingBetween(paragraphs[i - 1], paragraphs[i], style);
      for (uint8_t s = 0; s < spacing; s++) {
        lines.push_back(blankLine(paragraphIndex));
      }
    }
    wrapParagraph(paragraphs[i], paragraphIndex, style, lines);
  }

  LOG_DBG(TAG, "Chapter %u: %zu paragraphs -> %zu lines at width %u", chapter.index, paragraphs.size(), lines.size(),
          style.width);
  return lines;
}
