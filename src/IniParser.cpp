#include "IniParser.h"

#include <Logging.h>

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>

#define TAG "INI"

void IniParser::trimWhitespace(char* str) {
  if (!str) return;

  char* start = str;
  while (*start && isspace(static_cast<unsigned char>(*start))) start++;

  size_t len = strlen(start);
  while (len > 0 && isspace(static_cast<unsigned char>(start[len - 1]))) len--;

  if (start != str) memmove(str, start, len);
  str[len] = '\0';
}

// Returns false when the callback asks to stop
bool IniParser::parseLine(char* line, char* currentSection, const Callback& callback) {
  trimWhitespace(line);

  if (line[0] == '\0' || line[0] == '#' || line[0] == ';') {
    return true;
  }

  if (line[0] == '[') {
    char* end = strchr(line, ']');
    if (!end) {
      LOG_WRN(TAG, "Unterminated section header: %s", line);
      return true;
    }
    *end = '\0';
    strncpy(currentSection, line + 1, MAX_SECTION_LENGTH - 1);
    currentSection[MAX_SECTION_LENGTH - 1] = '\0';
    trimWhitespace(currentSection);
    return true;
  }

  char* eq = strchr(line, '=');
  if (!eq) {
    LOG_DBG(TAG, "Ignoring line without '=': %s", line);
    return true;
  }
  *eq = '\0';
  char* key = line;
  char* value = eq + 1;
  trimWhitespace(value);

  // Inline comments need whitespace before the marker so values like "#fff" survive
  for (char* p = value; *p; p++) {
    if ((*p == '#' || *p == ';') && p > value && isspace(static_cast<unsigned char>(p[-1]))) {
      *p = '\0';
      break;
    }
  }

  trimWhitespace(key);
  trimWhitespace(value);
  if (key[0] == '\0') {
    return true;
  }

  return callback(currentSection, key, value);
}

bool IniParser::parseFile(const char* path, Callback callback) {
  FILE* file = fopen(path, "r");
  if (!file) {
    LOG_DBG(TAG, "Cannot open %s", path);
    return false;
  }

  char line[MAX_LINE_LENGTH];
  char section[MAX_SECTION_LENGTH] = "";
  while (fgets(line, sizeof(line), file)) {
    // Drop the remainder of overlong lines
    if (!strchr(line, '\n') && !feof(file)) {
      int c;
      while ((c = fgetc(file)) != EOF && c != '\n') {
      }
      LOG_WRN(TAG, "%s: line longer than %d bytes truncated", path, MAX_LINE_LENGTH - 1);
    }
    if (!parseLine(line, section, callback)) {
      break;
    }
  }

  const bool failed = ferror(file) != 0;
  fclose(file);
  if (failed) {
    LOG_ERR(TAG, "Read error on %s", path);
    return false;
  }
  return true;
}

bool IniParser::parseString(const char* content, Callback callback) {
  if (!content) return false;

  char line[MAX_LINE_LENGTH];
  char section[MAX_SECTION_LENGTH] = "";
  const char* p = content;
  while (*p) {
    const char* eol = strchr(p, '\n');
    const size_t len = eol ? static_cast<size_t>(eol - p) : strlen(p);
    const size_t copyLen = len < sizeof(line) - 1 ? len : sizeof(line) - 1;
    memcpy(line, p, copyLen);
    line[copyLen] = '\0';

    if (!parseLine(line, section, callback)) {
      break;
    }
    if (!eol) break;
    p = eol + 1;
  }
  return true;
}

bool IniParser::parseBool(const char* value, const bool defaultValue) {
  if (!value || !*value) return defaultValue;

  if (strcasecmp(value, "true") == 0 || strcasecmp(value, "yes") == 0 || strcmp(value, "1") == 0 ||
      strcasecmp(value, "on") == 0) {
    return true;
  }
  if (strcasecmp(value, "false") == 0 || strcasecmp(value, "no") == 0 || strcmp(value, "0") == 0 ||
      strcasecmp(value, "off") == 0) {
    return false;
  }
  return defaultValue;
}

int IniParser::parseInt(const char* value, const int defaultValue) {
  if (!value || !*value) return defaultValue;

  errno = 0;
  char* end = nullptr;
  const long parsed = strtol(value, &end, 10);
  if (end == value || *end != '\0' || errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) {
    return defaultValue;
  }
  return static_cast<int>(parsed);
}
