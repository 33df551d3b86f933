#pragma once

#include <cstdint>
#include <functional>

/**
 * Line-at-a-time reader for folio's config.ini.
 *
 * ReaderSettings feeds every [formatting], [display] and [reading] entry
 * through a Callback and validates the value itself; this class only splits
 * the text:
 *   [display]
 *   double_page_large = true   ; inline comment after whitespace
 *   # full-line comment
 *
 * Keys and values arrive trimmed. Unknown sections and keys are passed on
 * untouched so the caller decides what to ignore. Lines longer than
 * MAX_LINE_LENGTH are cut at that length.
 */
class IniParser {
 public:
  /**
   * Callback for each key-value pair found.
   * @param section Current section name (empty if before first section)
   * @param key The key name
   * @param value The value (trimmed of whitespace)
   * @return true to continue parsing, false to stop
   */
  using Callback = std::function<bool(const char* section, const char* key, const char* value)>;

  /**
   * Parse an INI file.
   * @param path Path to the INI file
   * @param callback Function called for each key-value pair
   * @return true if file was parsed successfully, false on error
   */
  static bool parseFile(const char* path, Callback callback);

  /**
   * Parse an INI string in memory.
   * @param content The INI content string
   * @param callback Function called for each key-value pair
   * @return true if parsed successfully
   */
  static bool parseString(const char* content, Callback callback);

  /**
   * Helper to parse boolean values.
   * Accepts: true/false, yes/no, 1/0, on/off
   */
  static bool parseBool(const char* value, bool defaultValue = false);

  /**
   * Helper to parse integer values. Anything but a complete decimal number yields defaultValue.
   */
  static int parseInt(const char* value, int defaultValue = 0);

 private:
  static constexpr int MAX_LINE_LENGTH = 512;
  static constexpr int MAX_SECTION_LENGTH = 64;

  static void trimWhitespace(char* str);
  static bool parseLine(char* line, char* currentSection, const Callback& callback);
};
