#include "ReaderSettings.h"

#include <FsHelpers.h>
#include <Logging.h>
#include <Utf8.h>

#include <algorithm>
#include <climits>
#include <cstring>

#include "../IniParser.h"

#define TAG "SETTINGS"

namespace folio {

namespace {
// Terminal width breakpoints; anything wider falls in the last slot
constexpr uint16_t BREAKPOINT_COLUMNS[] = {80, 120, 160};
constexpr uint16_t BREAKPOINT_PADDING[] = {2, 8, 20, 35};
constexpr const char* DOUBLE_PAGE_KEYS[] = {"double_page_small", "double_page_medium", "double_page_large",
                                            "double_page_xlarge"};

// Parses an integer in [minValue, maxValue]; anything else keeps current
template <typename T>
void readRanged(const char* key, const char* value, const int minValue, const int maxValue, T& current) {
  const int parsed = IniParser::parseInt(value, INT_MIN);
  if (parsed == INT_MIN || parsed < minValue || parsed > maxValue) {
    LOG_WRN(TAG, "Invalid value for %s: '%s' (expected %d..%d), keeping %d", key, value, minValue, maxValue,
            static_cast<int>(current));
    return;
  }
  current = static_cast<T>(parsed);
}

void readBool(const char* key, const char* value, bool& current) {
  // Parse twice with opposite defaults to tell "unrecognised" apart from a real value
  const bool asTrue = IniParser::parseBool(value, true);
  const bool asFalse = IniParser::parseBool(value, false);
  if (asTrue != asFalse) {
    LOG_WRN(TAG, "Invalid boolean for %s: '%s', keeping %s", key, value, current ? "true" : "false");
    return;
  }
  current = asTrue;
}
}  // namespace

bool ReaderSettings::apply(const char* section, const char* key, const char* value) {
  if (strcmp(section, "formatting") == 0) {
    if (strcmp(key, "paragraph_spacing") == 0) {
      readRanged(key, value, 0, 10, paragraphSpacing);
    } else if (strcmp(key, "heading_spacing") == 0) {
      readRanged(key, value, 0, 10, headingSpacing);
    } else if (strcmp(key, "paragraph_indent") == 0) {
      readRanged(key, value, 0, 40, paragraphIndent);
    } else if (strcmp(key, "preserve_line_breaks") == 0) {
      readBool(key, value, preserveLineBreaks);
    } else if (strcmp(key, "max_width") == 0) {
      readRanged(key, value, 0, 10000, maxWidth);
    }
  } else if (strcmp(section, "display") == 0) {
    if (strcmp(key, "responsive_padding") == 0) {
      readBool(key, value, responsivePadding);
    } else if (strcmp(key, "fallback_padding") == 0) {
      readRanged(key, value, 0, 1000, fallbackPadding);
    } else if (strcmp(key, "fill_to_next_chapter") == 0) {
      readBool(key, value, fillToNextChapter);
    } else if (strcmp(key, "double_page_separator") == 0) {
      if (*value) {
        doublePageSeparator = value;
      } else {
        LOG_WRN(TAG, "Empty double_page_separator, keeping '%s'", doublePageSeparator.c_str());
      }
    } else {
      for (uint8_t i = 0; i < 4; i++) {
        if (strcmp(key, DOUBLE_PAGE_KEYS[i]) == 0) {
          readBool(key, value, doublePage[i]);
          break;
        }
      }
    }
  } else if (strcmp(section, "reading") == 0) {
    if (strcmp(key, "history_size") == 0) {
      readRanged(key, value, 1, 1000, historySize);
    } else if (strcmp(key, "state_dir") == 0) {
      if (*value) {
        stateDir = value;
      }
    } else if (strcmp(key, "parse_timeout_ms") == 0) {
      readRanged(key, value, 0, 3600000, parseTimeoutMs);
    }
  }

  return true;  // Continue parsing
}

Result<void> ReaderSettings::loadFromFile(const char* path) {
  const std::string expanded = FsHelpers::expandHome(path);
  if (!FsHelpers::exists(expanded)) {
    LOG_INF(TAG, "No config at %s, using defaults", expanded.c_str());
    return ErrVoid(Error::NotFound);
  }

  const bool parsed = IniParser::parseFile(expanded.c_str(), [this](const char* section, const char* key,
                                                                     const char* value) {
    return apply(section, key, value);
  });
  if (!parsed) {
    LOG_ERR(TAG, "Failed to read %s", expanded.c_str());
    return ErrVoid(Error::IOError);
  }

  LOG_INF(TAG, "Loaded settings from %s", expanded.c_str());
  return Ok();
}

Result<void> ReaderSettings::loadFromString(const char* content) {
  const bool parsed = IniParser::parseString(content, [this](const char* section, const char* key,
                                                             const char* value) {
    return apply(section, key, value);
  });
  if (!parsed) {
    return ErrVoid(Error::InvalidArgument);
  }
  return Ok();
}

uint8_t ReaderSettings::breakpointFor(const uint16_t columns) {
  uint8_t index = 0;
  for (const uint16_t limit : BREAKPOINT_COLUMNS) {
    if (columns <= limit) {
      return index;
    }
    index++;
  }
  return index;
}

uint16_t ReaderSettings::paddingFor(const uint16_t columns) const {
  if (!responsivePadding) {
    return fallbackPadding;
  }
  return BREAKPOINT_PADDING[breakpointFor(columns)];
}

uint16_t ReaderSettings::textWidthFor(const uint16_t columns) const {
  if (columns <= MIN_TEXT_WIDTH) {
    return std::max<uint16_t>(columns, 1);
  }

  int width = static_cast<int>(columns) - 2 * static_cast<int>(paddingFor(columns));
  if (width < MIN_TEXT_WIDTH) {
    // Padding gives way before the text column does
    width = MIN_TEXT_WIDTH;
  }
  if (maxWidth > 0) {
    width = std::min(width, std::max<int>(maxWidth, MIN_TEXT_WIDTH));
  }
  return static_cast<uint16_t>(width);
}

uint16_t ReaderSettings::gutterWidth() const {
  return static_cast<uint16_t>(utf8DisplayWidth(doublePageSeparator) + 2);
}

bool ReaderSettings::fitsDoublePage(const uint16_t columns) const {
  return textWidthFor(columns) >= 2 * MIN_TEXT_WIDTH + gutterWidth();
}

uint16_t ReaderSettings::pageWidthFor(const uint16_t columns, const bool twoUp) const {
  const uint16_t width = textWidthFor(columns);
  if (!twoUp || !fitsDoublePage(columns)) {
    return width;
  }
  return static_cast<uint16_t>((width - gutterWidth()) / 2);
}

StyleConfig ReaderSettings::styleFor(const uint16_t columns, const bool twoUp) const {
  return StyleConfig(pageWidthFor(columns, twoUp), paragraphIndent, paragraphSpacing, headingSpacing);
}

ViewportConfig ReaderSettings::viewportFor(const uint16_t rows) const {
  const uint16_t height = rows > STATUS_ROWS ? static_cast<uint16_t>(rows - STATUS_ROWS) : 1;
  return ViewportConfig(height, fillToNextChapter);
}

EpubOptions ReaderSettings::epubOptions() const {
  EpubOptions options;
  options.parseTimeoutMs = parseTimeoutMs;
  options.preserveLineBreaks = preserveLineBreaks;
  return options;
}

}  // namespace folio
