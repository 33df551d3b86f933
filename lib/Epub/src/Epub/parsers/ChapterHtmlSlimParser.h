#pragma once

#include <expat.h>

#include <climits>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../Book.h"

/**
 * Closed set of markup node kinds. Every element name maps to exactly one.
 */
enum class NodeKind : uint8_t {
  Heading,   // h1-h6
  Block,     // paragraph-level container
  Break,     // br
  Rule,      // hr
  Emphasis,  // em, i, cite
  Strong,    // strong, b
  Image,     // img
  Skipped,   // script, style, svg, page-break markers
  Head,      // document head: only <title> is read from it
  Title,     // <title>, only meaningful inside <head>
  Inline,    // everything else: text passes through
};

/**
 * Converts one chapter's XHTML into structured paragraphs.
 *
 * Usage:
 *   ChapterHtmlSlimParser parser(options);
 *   if (parser.parseAndBuildParagraphs(data, size)) { use parser.paragraphs(); }
 */
class ChapterHtmlSlimParser {
 public:
  struct Options {
    bool preserveLineBreaks = true;
  };

  explicit ChapterHtmlSlimParser(const Options& options) : options_(options) {}
  ~ChapterHtmlSlimParser();

  ChapterHtmlSlimParser(const ChapterHtmlSlimParser&) = delete;
  ChapterHtmlSlimParser& operator=(const ChapterHtmlSlimParser&) = delete;

  // False on malformed markup; paragraphs() is then left empty
  bool parseAndBuildParagraphs(const char* data, size_t size);

  const std::vector<Paragraph>& paragraphs() const { return paragraphs_; }
  std::vector<Paragraph> takeParagraphs() { return std::move(paragraphs_); }

  // First heading's text, else the document <title>, else empty
  std::string title() const { return !headingTitle_.empty() ? headingTitle_ : documentTitle_; }

  static NodeKind classify(const XML_Char* name, const XML_Char** atts);

 private:
  static constexpr int MAX_XML_DEPTH = 100;
  static constexpr size_t MAX_WORD_SIZE = 200;

  Options options_;
  XML_Parser xmlParser_ = nullptr;

  int depth = 0;
  int skipUntilDepth = INT_MAX;
  int headUntilDepth = INT_MAX;
  int titleUntilDepth = INT_MAX;
  int headingUntilDepth = INT_MAX;
  int boldUntilDepth = INT_MAX;
  int italicUntilDepth = INT_MAX;

  std::string partWordBuffer;
  bool partWordBold = false;
  bool partWordItalic = false;

  Paragraph current_;
  std::vector<Paragraph> paragraphs_;
  std::string headingTitle_;
  std::string documentTitle_;
  bool headingTitleDone_ = false;

  static void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts);
  static void XMLCALL characterData(void* userData, const XML_Char* s, int len);
  static void XMLCALL endElement(void* userData, const XML_Char* name);
  static void XMLCALL defaultHandler(void* userData, const XML_Char* s, int len);

  void flushPartWordBuffer();
  void dropTrailingBom();
  void finishParagraph();
  void startNewParagraph(Paragraph::Kind kind);
  void addBlankSeparator();
  void addImagePlaceholder(const std::string& altText);
  void cleanupParser();
};
