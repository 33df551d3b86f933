#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class SpanStyle : uint8_t { Emphasis, Strong };

// Inline style over the half-open word range [firstWord, endWord) of one paragraph
struct StyleSpan {
  SpanStyle style;
  uint32_t firstWord;
  uint32_t endWord;

  bool operator==(const StyleSpan& o) const {
    return style == o.style && firstWord == o.firstWord && endWord == o.endWord;
  }
};

struct Paragraph {
  enum class Kind : uint8_t { Heading, Body, BlankSeparator };

  Kind kind = Kind::Body;
  std::vector<std::string> words;
  std::vector<StyleSpan> spans;

  bool isBlank() const { return kind == Kind::BlankSeparator; }
  bool hasStyle(SpanStyle style, uint32_t word) const {
    for (const auto& span : spans) {
      if (span.style == style && word >= span.firstWord && word < span.endWord) return true;
    }
    return false;
  }

  bool operator==(const Paragraph& o) const { return kind == o.kind && words == o.words && spans == o.spans; }
  bool operator!=(const Paragraph& o) const { return !(*this == o); }
};

struct Chapter {
  uint16_t index = 0;  // spine position
  std::string href;    // archive path of the chapter document
  std::string title;
  std::vector<Paragraph> paragraphs;
  bool placeholder = false;  // markup could not be extracted

  bool operator==(const Chapter& o) const {
    return index == o.index && href == o.href && title == o.title && paragraphs == o.paragraphs &&
           placeholder == o.placeholder;
  }
  bool operator!=(const Chapter& o) const { return !(*this == o); }
};

struct Book {
  std::string path;
  std::string id;  // FNV-1a 64 of the archive bytes, 16 hex digits
  std::string title;
  std::string author;
  std::string language;
  std::vector<Chapter> chapters;

  bool operator==(const Book& o) const {
    return path == o.path && id == o.id && title == o.title && author == o.author && language == o.language &&
           chapters == o.chapters;
  }
  bool operator!=(const Book& o) const { return !(*this == o); }
};
