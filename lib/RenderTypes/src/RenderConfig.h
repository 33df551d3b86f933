#pragma once
#include <cstdint>

// Everything the line wrapper depends on. A change to any field invalidates wrapped lines.
struct StyleConfig {
  uint16_t width = 80;           // columns available for text
  uint16_t indent = 0;           // spaces before the first line of a body paragraph
  uint8_t paragraphSpacing = 1;  // blank lines between two body paragraphs
  uint8_t headingSpacing = 1;    // blank lines between a heading and its neighbours

  StyleConfig() = default;
  StyleConfig(uint16_t width, uint16_t indent, uint8_t paragraphSpacing, uint8_t headingSpacing)
      : width(width), indent(indent), paragraphSpacing(paragraphSpacing), headingSpacing(headingSpacing) {}

  bool operator==(const StyleConfig& o) const {
    return width == o.width && indent == o.indent && paragraphSpacing == o.paragraphSpacing &&
           headingSpacing == o.headingSpacing;
  }
  bool operator!=(const StyleConfig& o) const { return !(*this == o); }
};

// Everything the paginator depends on.
struct ViewportConfig {
  uint16_t height = 24;             // text rows per page
  bool fillToNextChapter = false;   // pad a chapter's final page up to the full height

  ViewportConfig() = default;
  ViewportConfig(uint16_t height, bool fillToNextChapter) : height(height), fillToNextChapter(fillToNextChapter) {}

  bool operator==(const ViewportConfig& o) const {
    return height == o.height && fillToNextChapter == o.fillToNextChapter;
  }
  bool operator!=(const ViewportConfig& o) const { return !(*this == o); }
};
