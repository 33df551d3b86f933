#pragma once

#include <Epub/EpubTypes.h>
#include <RenderConfig.h>

#include <cstdint>
#include <string>

#include "Result.h"

namespace folio {

struct ReaderSettings {
  // Text column never narrower than this unless the terminal itself is
  static constexpr uint16_t MIN_TEXT_WIDTH = 20;
  // Rows kept free for the status line
  static constexpr uint16_t STATUS_ROWS = 1;

  // [formatting]
  uint8_t paragraphSpacing = 1;
  uint8_t headingSpacing = 1;
  uint8_t paragraphIndent = 0;
  bool preserveLineBreaks = true;
  uint16_t maxWidth = 0;  // 0 = no cap

  // [display]
  bool responsivePadding = true;
  uint16_t fallbackPadding = 30;
  bool fillToNextChapter = false;
  // Two pages side by side, chosen per width breakpoint (<=80, <=120, <=160, wider)
  bool doublePage[4] = {false, false, false, false};
  std::string doublePageSeparator = "\xe2\x94\x82";  // U+2502, drawn with a space on each side

  // [reading]
  uint16_t historySize = 32;
  std::string stateDir = "~/.local/share/folio";
  uint32_t parseTimeoutMs = 0;

  // Missing file keeps the defaults and reports NotFound
  Result<void> loadFromFile(const char* path);
  Result<void> loadFromString(const char* content);

  // Horizontal padding per side for a terminal of the given width, before the minimum-width rule
  uint16_t paddingFor(uint16_t columns) const;

  // Text column width after padding, max_width cap and the minimum-width rule
  uint16_t textWidthFor(uint16_t columns) const;

  // Columns to the left of the text column when it is centred
  uint16_t leftMarginFor(uint16_t columns) const {
    const uint16_t width = textWidthFor(columns);
    return width < columns ? static_cast<uint16_t>((columns - width) / 2) : 0;
  }

  // Index into doublePage for a terminal of the given width
  static uint8_t breakpointFor(uint16_t columns);
  bool doublePageFor(uint16_t columns) const { return doublePage[breakpointFor(columns)]; }

  // Display columns between the two pages of a spread
  uint16_t gutterWidth() const;
  // A spread needs room for two minimum-width pages and the gutter
  bool fitsDoublePage(uint16_t columns) const;
  // Width of one page; the full text column unless a fitting spread splits it
  uint16_t pageWidthFor(uint16_t columns, bool twoUp) const;

  StyleConfig styleFor(uint16_t columns, bool twoUp = false) const;
  ViewportConfig viewportFor(uint16_t rows) const;
  EpubOptions epubOptions() const;

 private:
  bool apply(const char* section, const char* key, const char* value);
};

}  // namespace folio
