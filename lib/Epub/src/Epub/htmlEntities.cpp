#include "htmlEntities.h"

#include <cstring>

namespace {
struct HtmlEntity {
  const char* name;
  const char* utf8;
};

// Sorted by strcmp order for binary search. Prose-oriented subset of the HTML named entities;
// expat itself resolves the five XML built-ins.
const HtmlEntity entities[] = {
    {"AElig", "\xC3\x86"},      {"Eacute", "\xC3\x89"},     {"OElig", "\xC5\x92"},      {"Prime", "\xE2\x80\xB3"},
    {"aacute", "\xC3\xA1"},     {"acirc", "\xC3\xA2"},      {"aelig", "\xC3\xA6"},      {"agrave", "\xC3\xA0"},
    {"auml", "\xC3\xA4"},       {"bdquo", "\xE2\x80\x9E"},  {"bull", "\xE2\x80\xA2"},   {"ccedil", "\xC3\xA7"},
    {"copy", "\xC2\xA9"},       {"dagger", "\xE2\x80\xA0"}, {"deg", "\xC2\xB0"},        {"eacute", "\xC3\xA9"},
    {"ecirc", "\xC3\xAA"},      {"egrave", "\xC3\xA8"},     {"emsp", "\xE2\x80\x83"},   {"ensp", "\xE2\x80\x82"},
    {"euml", "\xC3\xAB"},       {"euro", "\xE2\x82\xAC"},   {"frac12", "\xC2\xBD"},     {"hellip", "\xE2\x80\xA6"},
    {"iacute", "\xC3\xAD"},     {"iexcl", "\xC2\xA1"},      {"iquest", "\xC2\xBF"},     {"iuml", "\xC3\xAF"},
    {"laquo", "\xC2\xAB"},      {"ldquo", "\xE2\x80\x9C"},  {"lsaquo", "\xE2\x80\xB9"}, {"lsquo", "\xE2\x80\x98"},
    {"mdash", "\xE2\x80\x94"},  {"middot", "\xC2\xB7"},     {"nbsp", "\xC2\xA0"},       {"ndash", "\xE2\x80\x93"},
    {"ntilde", "\xC3\xB1"},     {"oacute", "\xC3\xB3"},     {"ocirc", "\xC3\xB4"},      {"oelig", "\xC5\x93"},
    {"ouml", "\xC3\xB6"},       {"para", "\xC2\xB6"},       {"pound", "\xC2\xA3"},      {"prime", "\xE2\x80\xB2"},
    {"raquo", "\xC2\xBB"},      {"rdquo", "\xE2\x80\x9D"},  {"reg", "\xC2\xAE"},        {"rsaquo", "\xE2\x80\xBA"},
    {"rsquo", "\xE2\x80\x99"},  {"sbquo", "\xE2\x80\x9A"},  {"sect", "\xC2\xA7"},       {"shy", "\xC2\xAD"},
    {"szlig", "\xC3\x9F"},      {"thinsp", "\xE2\x80\x89"}, {"times", "\xC3\x97"},      {"trade", "\xE2\x84\xA2"},
    {"uacute", "\xC3\xBA"},     {"uuml", "\xC3\xBC"},       {"yen", "\xC2\xA5"},        {"zwj", "\xE2\x80\x8D"},
    {"zwnj", "\xE2\x80\x8C"},
};

constexpr int NUM_ENTITIES = sizeof(entities) / sizeof(entities[0]);

// strcmp semantics for a length-bounded key against a NUL-terminated table name
int compareName(const char* key, const int keyLen, const char* tableName) {
  const int cmp = strncmp(key, tableName, keyLen);
  if (cmp != 0) return cmp;
  return tableName[keyLen] == '\0' ? 0 : -1;
}
}  // namespace

const char* lookupHtmlEntity(const char* name, const int nameLen) {
  if (!name || nameLen <= 0) return nullptr;

  int lo = 0;
  int hi = NUM_ENTITIES - 1;
  while (lo <= hi) {
    const int mid = (lo + hi) / 2;
    const int cmp = compareName(name, nameLen, entities[mid].name);
    if (cmp == 0) {
      return entities[mid].utf8;
    }
    if (cmp < 0) {
      hi = mid - 1;
    } else {
      lo = mid + 1;
    }
  }
  return nullptr;
}
