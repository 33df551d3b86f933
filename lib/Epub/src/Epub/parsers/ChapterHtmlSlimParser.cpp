#include "ChapterHtmlSlimParser.h"

#include <Logging.h>

#include <algorithm>
#include <cstring>

#include "../htmlEntities.h"

#define TAG "EHP"

namespace {
const char* HEADER_TAGS[] = {"h1", "h2", "h3", "h4", "h5", "h6"};
constexpr int NUM_HEADER_TAGS = sizeof(HEADER_TAGS) / sizeof(HEADER_TAGS[0]);

const char* BLOCK_TAGS[] = {"p",       "div",   "li",     "blockquote", "dd",      "dt",     "pre",
                            "section", "article", "aside", "header",     "footer",  "figure", "figcaption",
                            "caption", "td",    "th",     "tr",         "address", "nav",    "main"};
constexpr int NUM_BLOCK_TAGS = sizeof(BLOCK_TAGS) / sizeof(BLOCK_TAGS[0]);

const char* BOLD_TAGS[] = {"b", "strong"};
constexpr int NUM_BOLD_TAGS = sizeof(BOLD_TAGS) / sizeof(BOLD_TAGS[0]);

const char* ITALIC_TAGS[] = {"i", "em", "cite"};
constexpr int NUM_ITALIC_TAGS = sizeof(ITALIC_TAGS) / sizeof(ITALIC_TAGS[0]);

const char* SKIP_TAGS[] = {"script", "style", "svg", "template", "noscript"};
constexpr int NUM_SKIP_TAGS = sizeof(SKIP_TAGS) / sizeof(SKIP_TAGS[0]);

constexpr size_t PARSE_CHUNK_SIZE = 64 * 1024;

bool isWhitespace(const char c) { return c == ' ' || c == '\r' || c == '\n' || c == '\t' || c == '\f'; }

bool matches(const char* tag_name, const char* possible_tags[], const int possible_tag_count) {
  for (int i = 0; i < possible_tag_count; i++) {
    if (strcmp(tag_name, possible_tags[i]) == 0) {
      return true;
    }
  }
  return false;
}

// Drop a namespace prefix such as "html:" or "xhtml:"
const char* localName(const XML_Char* name) {
  const char* colon = strchr(name, ':');
  return colon ? colon + 1 : name;
}

std::string collapseWhitespace(const std::string& text) {
  std::string out;
  bool pendingSpace = false;
  for (const char c : text) {
    if (isWhitespace(c)) {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) {
      out += ' ';
      pendingSpace = false;
    }
    out += c;
  }
  return out;
}

std::vector<std::string> splitWords(const std::string& text) {
  std::vector<std::string> words;
  std::string word;
  for (const char c : text) {
    if (isWhitespace(c)) {
      if (!word.empty()) {
        words.push_back(word);
        word.clear();
      }
    } else {
      word += c;
    }
  }
  if (!word.empty()) {
    words.push_back(word);
  }
  return words;
}

std::string joinWords(const std::vector<std::string>& words) {
  std::string out;
  for (const auto& w : words) {
    if (!out.empty()) out += ' ';
    out += w;
  }
  return out;
}

// Grow the latest span of this style when the word directly follows it, else open a new one
void extendSpan(Paragraph& paragraph, const SpanStyle style, const uint32_t wordIndex) {
  for (auto it = paragraph.spans.rbegin(); it != paragraph.spans.rend(); ++it) {
    if (it->style != style) continue;
    if (it->endWord == wordIndex) {
      it->endWord = wordIndex + 1;
      return;
    }
    break;
  }
  paragraph.spans.push_back({style, wordIndex, wordIndex + 1});
}
}  // namespace

NodeKind ChapterHtmlSlimParser::classify(const XML_Char* name, const XML_Char** atts) {
  if (atts != nullptr) {
    for (int i = 0; atts[i]; i += 2) {
      // Print page-number markers carry no reading text
      if ((strcmp(atts[i], "role") == 0 && strcmp(atts[i + 1], "doc-pagebreak") == 0) ||
          (strcmp(atts[i], "epub:type") == 0 && strcmp(atts[i + 1], "pagebreak") == 0)) {
        return NodeKind::Skipped;
      }
      // Empty anchors with aria-hidden (Pandoc line number anchors)
      if (strcmp(name, "a") == 0 && strcmp(atts[i], "aria-hidden") == 0 && strcmp(atts[i + 1], "true") == 0) {
        return NodeKind::Skipped;
      }
    }
  }

  const char* tag = localName(name);
  if (matches(tag, HEADER_TAGS, NUM_HEADER_TAGS)) return NodeKind::Heading;
  if (matches(tag, BLOCK_TAGS, NUM_BLOCK_TAGS)) return NodeKind::Block;
  if (strcmp(tag, "br") == 0) return NodeKind::Break;
  if (strcmp(tag, "hr") == 0) return NodeKind::Rule;
  if (matches(tag, ITALIC_TAGS, NUM_ITALIC_TAGS)) return NodeKind::Emphasis;
  if (matches(tag, BOLD_TAGS, NUM_BOLD_TAGS)) return NodeKind::Strong;
  if (strcmp(tag, "img") == 0) return NodeKind::Image;
  if (matches(tag, SKIP_TAGS, NUM_SKIP_TAGS)) return NodeKind::Skipped;
  if (strcmp(tag, "head") == 0) return NodeKind::Head;
  if (strcmp(tag, "title") == 0) return NodeKind::Title;
  return NodeKind::Inline;
}

ChapterHtmlSlimParser::~ChapterHtmlSlimParser() { cleanupParser(); }

void ChapterHtmlSlimParser::cleanupParser() {
  if (xmlParser_) {
    XML_StopParser(xmlParser_, XML_FALSE);
    XML_SetElementHandler(xmlParser_, nullptr, nullptr);
    XML_SetCharacterDataHandler(xmlParser_, nullptr);
    XML_SetDefaultHandlerExpand(xmlParser_, nullptr);
    XML_ParserFree(xmlParser_);
    xmlParser_ = nullptr;
  }
}

// Zero Width No-Break Space / BOM (U+FEFF) = 0xEF 0xBB 0xBF
void ChapterHtmlSlimParser::dropTrailingBom() {
  static constexpr char FEFF[] = "\xEF\xBB\xBF";
  const size_t size = partWordBuffer.size();
  if (size < 3 || partWordBuffer.compare(size - 3, 3, FEFF) != 0) {
    return;
  }

  partWordBuffer.resize(size - 3);
  if (partWordBuffer.empty()) {
    partWordBold = false;
    partWordItalic = false;
  }
}

void ChapterHtmlSlimParser::flushPartWordBuffer() {
  if (partWordBuffer.empty()) {
    return;
  }

  const auto wordIndex = static_cast<uint32_t>(current_.words.size());
  current_.words.push_back(partWordBuffer);
  if (partWordItalic) {
    extendSpan(current_, SpanStyle::Emphasis, wordIndex);
  }
  if (partWordBold) {
    extendSpan(current_, SpanStyle::Strong, wordIndex);
  }

  partWordBuffer.clear();
  partWordBold = false;
  partWordItalic = false;
}

void ChapterHtmlSlimParser::finishParagraph() {
  flushPartWordBuffer();

  if (!current_.words.empty()) {
    if (current_.kind == Paragraph::Kind::Heading && !headingTitleDone_) {
      headingTitle_ = joinWords(current_.words);
      headingTitleDone_ = true;
    }
    paragraphs_.push_back(std::move(current_));
  }
  current_ = Paragraph();
}

void ChapterHtmlSlimParser::startNewParagraph(const Paragraph::Kind kind) {
  finishParagraph();
  current_.kind = kind;
}

void ChapterHtmlSlimParser::addBlankSeparator() {
  // Never leading, never doubled
  if (paragraphs_.empty() || paragraphs_.back().isBlank()) {
    return;
  }
  Paragraph separator;
  separator.kind = Paragraph::Kind::BlankSeparator;
  paragraphs_.push_back(std::move(separator));
}

void ChapterHtmlSlimParser::addImagePlaceholder(const std::string& altText) {
  const auto kind = current_.kind;
  finishParagraph();

  Paragraph placeholder;
  placeholder.kind = Paragraph::Kind::Body;
  placeholder.words = splitWords("[Image: " + altText + "]");
  if (!placeholder.words.empty()) {
    placeholder.spans.push_back({SpanStyle::Emphasis, 0, static_cast<uint32_t>(placeholder.words.size())});
  }
  paragraphs_.push_back(std::move(placeholder));
  current_.kind = kind;
}

void XMLCALL ChapterHtmlSlimParser::startElement(void* userData, const XML_Char* name, const XML_Char** atts) {
  auto* self = static_cast<ChapterHtmlSlimParser*>(userData);

  // Prevent stack overflow from deeply nested XML
  if (self->depth >= MAX_XML_DEPTH) {
    LOG_ERR(TAG, "Nesting deeper than %d levels", MAX_XML_DEPTH);
    XML_StopParser(self->xmlParser_, XML_FALSE);
    return;
  }

  // Middle of skip
  if (self->skipUntilDepth < self->depth) {
    self->depth += 1;
    return;
  }

  const NodeKind kind = classify(name, atts);

  if (self->headUntilDepth < self->depth) {
    if (kind == NodeKind::Title) {
      self->titleUntilDepth = std::min(self->titleUntilDepth, self->depth);
    }
    self->depth += 1;
    return;
  }

  switch (kind) {
    case NodeKind::Heading:
      self->startNewParagraph(Paragraph::Kind::Heading);
      self->headingUntilDepth = std::min(self->headingUntilDepth, self->depth);
      break;
    case NodeKind::Block:
      self->startNewParagraph(self->headingUntilDepth < self->depth ? Paragraph::Kind::Heading
                                                                     : Paragraph::Kind::Body);
      break;
    case NodeKind::Break:
      self->flushPartWordBuffer();
      if (!self->current_.words.empty()) {
        // Continue in a new paragraph of the same kind
        const auto currentKind = self->current_.kind;
        self->finishParagraph();
        self->current_.kind = currentKind;
      } else if (self->options_.preserveLineBreaks) {
        self->addBlankSeparator();
      }
      break;
    case NodeKind::Rule:
      self->finishParagraph();
      self->addBlankSeparator();
      break;
    case NodeKind::Emphasis:
      self->italicUntilDepth = std::min(self->italicUntilDepth, self->depth);
      break;
    case NodeKind::Strong:
      self->boldUntilDepth = std::min(self->boldUntilDepth, self->depth);
      break;
    case NodeKind::Image: {
      std::string altText;
      for (int i = 0; atts[i]; i += 2) {
        if (strcmp(atts[i], "alt") == 0) {
          altText = collapseWhitespace(atts[i + 1]);
        }
      }
      if (!altText.empty()) {
        self->addImagePlaceholder(altText);
      } else {
        LOG_DBG(TAG, "Dropping image without alt text");
      }
      break;
    }
    case NodeKind::Skipped:
      self->skipUntilDepth = self->depth;
      break;
    case NodeKind::Head:
      self->headUntilDepth = self->depth;
      break;
    case NodeKind::Title:
    case NodeKind::Inline:
      break;
  }

  self->depth += 1;
}

void XMLCALL ChapterHtmlSlimParser::characterData(void* userData, const XML_Char* s, const int len) {
  auto* self = static_cast<ChapterHtmlSlimParser*>(userData);

  // Middle of skip
  if (self->skipUntilDepth < self->depth) {
    return;
  }

  if (self->headUntilDepth < self->depth) {
    if (self->titleUntilDepth < self->depth) {
      self->documentTitle_.append(s, len);
    }
    return;
  }

  const bool bold = self->boldUntilDepth < self->depth;
  const bool italic = self->italicUntilDepth < self->depth;

  for (int i = 0; i < len; i++) {
    if (isWhitespace(s[i])) {
      self->flushPartWordBuffer();
      continue;
    }

    // Cut runaway words, but only on a character boundary
    const auto byte = static_cast<unsigned char>(s[i]);
    if (self->partWordBuffer.size() >= MAX_WORD_SIZE && (byte & 0xC0) != 0x80) {
      self->flushPartWordBuffer();
    }

    self->partWordBuffer += s[i];
    self->partWordBold = self->partWordBold || bold;
    self->partWordItalic = self->partWordItalic || italic;

    // U+FEFF can arrive split across calls; the word buffer holds the partial bytes until the last one
    self->dropTrailingBom();
  }
}

void XMLCALL ChapterHtmlSlimParser::endElement(void* userData, const XML_Char* name) {
  auto* self = static_cast<ChapterHtmlSlimParser*>(userData);

  self->depth -= 1;

  const bool inSkippedSubtree = self->skipUntilDepth < self->depth || self->headUntilDepth < self->depth;
  if (!inSkippedSubtree && self->skipUntilDepth != self->depth && self->headUntilDepth != self->depth) {
    switch (classify(name, nullptr)) {
      case NodeKind::Heading:
      case NodeKind::Block:
        self->finishParagraph();
        break;
      default:
        break;
    }
  }

  if (self->skipUntilDepth == self->depth) {
    self->skipUntilDepth = INT_MAX;
  }
  if (self->headUntilDepth == self->depth) {
    self->headUntilDepth = INT_MAX;
  }
  if (self->titleUntilDepth == self->depth) {
    self->titleUntilDepth = INT_MAX;
  }
  if (self->headingUntilDepth == self->depth) {
    self->headingUntilDepth = INT_MAX;
  }
  if (self->boldUntilDepth == self->depth) {
    self->boldUntilDepth = INT_MAX;
  }
  if (self->italicUntilDepth == self->depth) {
    self->italicUntilDepth = INT_MAX;
  }
}

void XMLCALL ChapterHtmlSlimParser::defaultHandler(void* userData, const XML_Char* s, const int len) {
  // Undeclared entities arrive here because of XML_UseForeignDTD. Declarations, comments and
  // processing instructions also land here and must not become text.
  if (len >= 3 && s[0] == '&' && s[len - 1] == ';') {
    const char* utf8 = lookupHtmlEntity(s + 1, len - 2);
    if (utf8) {
      characterData(userData, utf8, static_cast<int>(strlen(utf8)));
    }
  }
}

bool ChapterHtmlSlimParser::parseAndBuildParagraphs(const char* data, const size_t size) {
  cleanupParser();
  depth = 0;
  skipUntilDepth = headUntilDepth = titleUntilDepth = headingUntilDepth = INT_MAX;
  boldUntilDepth = italicUntilDepth = INT_MAX;
  partWordBuffer.clear();
  partWordBold = partWordItalic = false;
  current_ = Paragraph();
  paragraphs_.clear();
  headingTitle_.clear();
  documentTitle_.clear();
  headingTitleDone_ = false;

  xmlParser_ = XML_ParserCreate(nullptr);
  if (!xmlParser_) {
    LOG_ERR(TAG, "Couldn't allocate memory for parser");
    return false;
  }

  // Without a foreign DTD expat rejects &nbsp; and friends as undefined entities
  XML_UseForeignDTD(xmlParser_, XML_TRUE);

  XML_SetUserData(xmlParser_, this);
  XML_SetElementHandler(xmlParser_, startElement, endElement);
  XML_SetCharacterDataHandler(xmlParser_, characterData);
  XML_SetDefaultHandlerExpand(xmlParser_, defaultHandler);

  size_t offset = 0;
  do {
    const size_t chunk = std::min(PARSE_CHUNK_SIZE, size - offset);
    const bool isFinal = offset + chunk == size;
    if (XML_Parse(xmlParser_, data + offset, static_cast<int>(chunk), isFinal) == XML_STATUS_ERROR) {
      LOG_ERR(TAG, "Parse error at line %lu: %s", XML_GetCurrentLineNumber(xmlParser_),
              XML_ErrorString(XML_GetErrorCode(xmlParser_)));
      cleanupParser();
      paragraphs_.clear();
      current_ = Paragraph();
      return false;
    }
    offset += chunk;
  } while (offset < size);

  cleanupParser();

  finishParagraph();
  while (paragraphs_.size() > 1 && paragraphs_.back().isBlank()) {
    paragraphs_.pop_back();
  }
  if (paragraphs_.empty()) {
    Paragraph blank;
    blank.kind = Paragraph::Kind::BlankSeparator;
    paragraphs_.push_back(std::move(blank));
  }

  documentTitle_ = collapseWhitespace(documentTitle_);
  return true;
}
