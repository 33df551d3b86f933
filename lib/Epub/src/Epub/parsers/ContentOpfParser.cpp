#include "ContentOpfParser.h"

#include <FsHelpers.h>
#include <Logging.h>
#include <Utf8.h>

#include <cctype>
#include <cstring>
#include <utility>

#define TAG "OPF"

namespace {
constexpr char MEDIA_TYPE_NCX[] = "application/x-dtbncx+xml";

bool isElement(const XML_Char* name, const char* local) {
  if (strcmp(name, local) == 0) return true;
  return strncmp(name, "opf:", 4) == 0 && strcmp(name + 4, local) == 0;
}

// Append at most (limit - target.size()) bytes without splitting a UTF-8 sequence
void appendLimited(std::string& target, const XML_Char* s, const int len, const size_t limit) {
  if (target.size() + static_cast<size_t>(len) <= limit) {
    target.append(s, len);
  } else if (target.size() < limit) {
    const size_t safeLen = utf8SafePrefix(s, limit - target.size());
    if (safeLen > 0) {
      target.append(s, safeLen);
    }
    LOG_DBG(TAG, "Metadata truncated at %zu bytes", target.size());
  }
}

void trimInPlace(std::string& s, const size_t from = 0) {
  if (from >= s.size()) return;
  size_t end = s.size();
  while (end > from && isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  size_t start = from;
  while (start < end && isspace(static_cast<unsigned char>(s[start]))) start++;
  s = s.substr(0, from) + s.substr(start, end - start);
}
}  // namespace

bool ContentOpfParser::setup() {
  parser = XML_ParserCreate(nullptr);
  if (!parser) {
    LOG_ERR(TAG, "Couldn't allocate memory for parser");
    return false;
  }

  XML_SetUserData(parser, this);
  XML_SetElementHandler(parser, startElement, endElement);
  XML_SetCharacterDataHandler(parser, characterData);
  return true;
}

void ContentOpfParser::cleanup() {
  if (parser) {
    XML_StopParser(parser, XML_FALSE);                // Stop any pending processing
    XML_SetElementHandler(parser, nullptr, nullptr);  // Clear callbacks
    XML_SetCharacterDataHandler(parser, nullptr);
    XML_ParserFree(parser);
    parser = nullptr;
  }
}

ContentOpfParser::~ContentOpfParser() { cleanup(); }

size_t ContentOpfParser::write(const uint8_t* buffer, const size_t size) {
  if (!parser) return 0;

  const uint8_t* currentBufferPos = buffer;
  auto remainingInBuffer = size;

  do {
    void* const buf = XML_GetBuffer(parser, 1024);
    if (!buf) {
      LOG_ERR(TAG, "Couldn't allocate memory for buffer");
      cleanup();
      return 0;
    }

    const auto toRead = remainingInBuffer < 1024 ? remainingInBuffer : 1024;
    memcpy(buf, currentBufferPos, toRead);

    if (XML_ParseBuffer(parser, static_cast<int>(toRead), remainingSize == toRead) == XML_STATUS_ERROR) {
      LOG_ERR(TAG, "Parse error at line %lu: %s", XML_GetCurrentLineNumber(parser),
              XML_ErrorString(XML_GetErrorCode(parser)));
      cleanup();
      return 0;
    }

    currentBufferPos += toRead;
    remainingInBuffer -= toRead;
    remainingSize -= toRead;
  } while (remainingInBuffer > 0);

  return size;
}

void XMLCALL ContentOpfParser::startElement(void* userData, const XML_Char* name, const XML_Char** atts) {
  auto* self = static_cast<ContentOpfParser*>(userData);

  if (self->state == START && isElement(name, "package")) {
    self->state = IN_PACKAGE;
    return;
  }

  if (self->state == IN_PACKAGE && isElement(name, "metadata")) {
    self->state = IN_METADATA;
    return;
  }

  if (self->state == IN_METADATA && strcmp(name, "dc:title") == 0) {
    // Only the first title is the book title; later ones are subtitles or alternates
    if (!self->seenTitle) {
      self->state = IN_BOOK_TITLE;
    }
    return;
  }

  if (self->state == IN_METADATA && strcmp(name, "dc:creator") == 0) {
    self->authorMark = self->author.size();
    if (!self->author.empty()) {
      self->author.append(", ");
    }
    self->state = IN_BOOK_AUTHOR;
    return;
  }

  if (self->state == IN_METADATA && strcmp(name, "dc:language") == 0) {
    if (self->language.empty()) {
      self->state = IN_BOOK_LANGUAGE;
    }
    return;
  }

  if (self->state == IN_PACKAGE && isElement(name, "manifest")) {
    self->state = IN_MANIFEST;
    self->hasManifest = true;
    return;
  }

  if (self->state == IN_PACKAGE && isElement(name, "spine")) {
    self->state = IN_SPINE;
    self->hasSpine = true;
    return;
  }

  if (self->state == IN_PACKAGE && isElement(name, "guide")) {
    self->state = IN_GUIDE;
    return;
  }

  if (self->state == IN_MANIFEST && isElement(name, "item")) {
    std::string itemId;
    ManifestItem item;

    for (int i = 0; atts[i]; i += 2) {
      if (strcmp(atts[i], "id") == 0) {
        itemId = atts[i + 1];
      } else if (strcmp(atts[i], "href") == 0) {
        item.href = FsHelpers::normalisePath(self->baseContentPath + atts[i + 1]);
      } else if (strcmp(atts[i], "media-type") == 0) {
        item.mediaType = atts[i + 1];
      } else if (strcmp(atts[i], "properties") == 0) {
        item.properties = atts[i + 1];
      }
    }

    if (itemId.empty() || item.href.empty()) {
      LOG_WRN(TAG, "Skipping manifest item without id or href");
      return;
    }

    if (item.mediaType == MEDIA_TYPE_NCX) {
      LOG_DBG(TAG, "NCX table of contents: %s", item.href.c_str());
    }

    if (!self->manifest.emplace(itemId, std::move(item)).second) {
      LOG_WRN(TAG, "Duplicate manifest id %s, keeping the first", itemId.c_str());
    }
    return;
  }

  // Membership is resolved later against the full manifest, so the spine may precede it
  if (self->state == IN_SPINE && isElement(name, "itemref")) {
    SpineRef ref;
    for (int i = 0; atts[i]; i += 2) {
      if (strcmp(atts[i], "idref") == 0) {
        ref.idref = atts[i + 1];
      } else if (strcmp(atts[i], "linear") == 0) {
        ref.linear = strcmp(atts[i + 1], "no") != 0;
      }
    }
    self->spine.push_back(std::move(ref));
    return;
  }
}

void XMLCALL ContentOpfParser::characterData(void* userData, const XML_Char* s, const int len) {
  auto* self = static_cast<ContentOpfParser*>(userData);

  switch (self->state) {
    case IN_BOOK_TITLE:
      appendLimited(self->title, s, len, MAX_TITLE_LENGTH);
      break;
    case IN_BOOK_AUTHOR:
      appendLimited(self->author, s, len, MAX_AUTHOR_LENGTH);
      break;
    case IN_BOOK_LANGUAGE:
      appendLimited(self->language, s, len, MAX_LANGUAGE_LENGTH);
      break;
    default:
      break;
  }
}

void XMLCALL ContentOpfParser::endElement(void* userData, const XML_Char* name) {
  auto* self = static_cast<ContentOpfParser*>(userData);

  if (self->state == IN_BOOK_TITLE && strcmp(name, "dc:title") == 0) {
    trimInPlace(self->title);
    self->seenTitle = !self->title.empty();
    self->state = IN_METADATA;
    return;
  }

  if (self->state == IN_BOOK_AUTHOR && strcmp(name, "dc:creator") == 0) {
    // Drop the separator again if this creator turned out to be empty
    const size_t from = self->authorMark == 0 ? 0 : self->authorMark + 2;
    trimInPlace(self->author, from);
    if (self->author.size() <= from) {
      self->author.resize(self->authorMark);
    }
    self->state = IN_METADATA;
    return;
  }

  if (self->state == IN_BOOK_LANGUAGE && strcmp(name, "dc:language") == 0) {
    trimInPlace(self->language);
    self->state = IN_METADATA;
    return;
  }

  if (self->state == IN_METADATA && isElement(name, "metadata")) {
    self->state = IN_PACKAGE;
    return;
  }

  if (self->state == IN_MANIFEST && isElement(name, "manifest")) {
    self->state = IN_PACKAGE;
    return;
  }

  if (self->state == IN_SPINE && isElement(name, "spine")) {
    self->state = IN_PACKAGE;
    return;
  }

  if (self->state == IN_GUIDE && isElement(name, "guide")) {
    self->state = IN_PACKAGE;
    return;
  }

  if (self->state == IN_PACKAGE && isElement(name, "package")) {
    self->state = START;
  }
}
