#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "expat.h"

constexpr size_t MAX_TITLE_LENGTH = 256;
constexpr size_t MAX_AUTHOR_LENGTH = 128;
constexpr size_t MAX_LANGUAGE_LENGTH = 32;

struct ManifestItem {
  std::string href;  // resolved against the package document directory
  std::string mediaType;
  std::string properties;
};

struct SpineRef {
  std::string idref;
  bool linear = true;
};

class ContentOpfParser final {
  enum ParserState {
    START,
    IN_PACKAGE,
    IN_METADATA,
    IN_BOOK_TITLE,
    IN_BOOK_AUTHOR,
    IN_BOOK_LANGUAGE,
    IN_MANIFEST,
    IN_SPINE,
    IN_GUIDE,
  };

  const std::string& baseContentPath;
  size_t remainingSize;
  XML_Parser parser = nullptr;
  ParserState state = START;
  bool seenTitle = false;
  size_t authorMark = 0;  // author length before the current dc:creator

  static void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts);
  static void XMLCALL characterData(void* userData, const XML_Char* s, int len);
  static void XMLCALL endElement(void* userData, const XML_Char* name);

  void cleanup();

 public:
  std::string title;
  std::string author;
  std::string language;
  std::unordered_map<std::string, ManifestItem> manifest;  // itemId -> item
  std::vector<SpineRef> spine;                             // in document order, duplicates kept
  bool hasManifest = false;
  bool hasSpine = false;

  explicit ContentOpfParser(const std::string& baseContentPath, const size_t xmlSize)
      : baseContentPath(baseContentPath), remainingSize(xmlSize) {}
  ~ContentOpfParser();

  ContentOpfParser(const ContentOpfParser&) = delete;
  ContentOpfParser& operator=(const ContentOpfParser&) = delete;

  bool setup();

  // Returns the number of bytes consumed, 0 on a parse error
  size_t write(const uint8_t* buffer, size_t size);
};
