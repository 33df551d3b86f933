// ChapterHtmlSlimParser unit tests
// Chapter markup -> paragraphs: block structure, separators, inline styles, entities and skipped content.

#include "test_utils.h"

#include <Epub/parsers/ChapterHtmlSlimParser.h>

#include <string>
#include <vector>

#include "../EpubFixture.h"

namespace {
bool parse(ChapterHtmlSlimParser& parser, const std::string& markup) {
  return parser.parseAndBuildParagraphs(markup.data(), markup.size());
}

bool parseBody(ChapterHtmlSlimParser& parser, const std::string& body, const std::string& title = "Doc") {
  return parse(parser, EpubFixture::chapterXhtml(title, body));
}

std::string joined(const Paragraph& p) {
  std::string out;
  for (const auto& w : p.words) {
    if (!out.empty()) out += ' ';
    out += w;
  }
  return out;
}

// "H:text", "B:text" or "-" per paragraph, joined with '|'
std::string shape(const std::vector<Paragraph>& paragraphs) {
  std::string out;
  for (const auto& p : paragraphs) {
    if (!out.empty()) out += '|';
    switch (p.kind) {
      case Paragraph::Kind::Heading:
        out += "H:" + joined(p);
        break;
      case Paragraph::Kind::Body:
        out += "B:" + joined(p);
        break;
      case Paragraph::Kind::BlankSeparator:
        out += "-";
        break;
    }
  }
  return out;
}

ChapterHtmlSlimParser::Options withBreaks(const bool preserve) {
  ChapterHtmlSlimParser::Options options;
  options.preserveLineBreaks = preserve;
  return options;
}
}  // namespace

int main() {
  TestUtils::TestRunner runner("ChapterHtmlSlimParser");

  // Test 1: Headings and paragraphs with inline styles
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser,
                                "<h1>Chapter One</h1>"
                                "<p>Hello <em>big</em> world.</p>"
                                "<p>Second <strong>bold words</strong></p>"),
                      "basic: parse succeeds");
    runner.expectEqual("H:Chapter One|B:Hello big world.|B:Second bold words", shape(parser.paragraphs()),
                       "basic: paragraph structure");
    runner.expectEqual("Chapter One", parser.title(), "basic: first heading is the title");
    if (parser.paragraphs().size() == 3) {
      const auto& p1 = parser.paragraphs()[1];
      runner.expectEq(size_t(1), p1.spans.size(), "basic: one emphasis span");
      runner.expectTrue(p1.hasStyle(SpanStyle::Emphasis, 1), "basic: 'big' emphasised");
      runner.expectFalse(p1.hasStyle(SpanStyle::Emphasis, 0), "basic: 'Hello' plain");
      const auto& p2 = parser.paragraphs()[2];
      runner.expectEq(size_t(1), p2.spans.size(), "basic: adjacent bold words share one span");
      if (!p2.spans.empty()) {
        runner.expectTrue(p2.spans[0] == StyleSpan{SpanStyle::Strong, 1, 3}, "basic: strong span covers both words");
      }
    }
  }

  // Test 2: Style applied inside a word marks the whole word
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, "<p>un<em>believ</em>able <b><i>both</i></b></p>"), "inner style: parse");
    runner.expectEqual("B:unbelievable both", shape(parser.paragraphs()), "inner style: one word");
    if (parser.paragraphs().size() == 1) {
      const auto& p = parser.paragraphs()[0];
      runner.expectTrue(p.hasStyle(SpanStyle::Emphasis, 0), "inner style: word emphasised");
      runner.expectTrue(p.hasStyle(SpanStyle::Emphasis, 1) && p.hasStyle(SpanStyle::Strong, 1),
                        "inner style: nested styles combine");
      runner.expectFalse(p.hasStyle(SpanStyle::Strong, 0), "inner style: no stray bold");
    }
  }

  // Test 3: <br> inside text splits into same-kind paragraphs
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, "<p>line one<br/>line two</p><h2>Head<br/>Line</h2>"), "br split: parse");
    runner.expectEqual("B:line one|B:line two|H:Head|H:Line", shape(parser.paragraphs()), "br split: kinds kept");
  }

  // Test 4: <br> between blocks becomes a single separator when line breaks are preserved
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, "<br/><p>a</p><br/><br/><p>b</p><br/>"), "separator: parse");
    runner.expectEqual("B:a|-|B:b", shape(parser.paragraphs()),
                       "separator: never leading, never doubled, never trailing");
  }

  // Test 5: Without preserved line breaks the separator is dropped
  {
    ChapterHtmlSlimParser parser(withBreaks(false));
    runner.expectTrue(parseBody(parser, "<p>a</p><br/><p>b</p>"), "no separator: parse");
    runner.expectEqual("B:a|B:b", shape(parser.paragraphs()), "no separator: blocks only");
  }

  // Test 6: <hr> always separates
  {
    ChapterHtmlSlimParser parser(withBreaks(false));
    runner.expectTrue(parseBody(parser, "<hr/><p>a</p><hr/><hr/><p>b</p>"), "rule: parse");
    runner.expectEqual("B:a|-|B:b", shape(parser.paragraphs()), "rule: one separator between blocks");
  }

  // Test 7: Entities
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, "<p>caf&eacute; &amp; tea&nbsp;time &hellip; &#8212; x&unknownthing;y</p>"),
                      "entities: parse");
    runner.expectEqual("B:caf\xC3\xA9 & tea\xC2\xA0time \xE2\x80\xA6 \xE2\x80\x94 xy", shape(parser.paragraphs()),
                       "entities: resolved, nbsp binds, unknown dropped");
  }

  // Test 8: Skipped content
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser,
                                "<style>p { color: red; }</style>"
                                "<p>Visible<script>var x = 1;</script> text</p>"
                                "<p>after<span epub:type=\"pagebreak\" title=\"12\">12</span> more</p>"
                                "<p><a aria-hidden=\"true\" href=\"#l1\">1</a>numbered <a href=\"#n\">link</a></p>"
                                "<svg><text>vector</text></svg>"),
                      "skip: parse");
    runner.expectEqual("B:Visible text|B:after more|B:numbered link", shape(parser.paragraphs()),
                       "skip: scripts, styles, page markers and hidden anchors dropped");
  }

  // Test 9: Images become alt text placeholders
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser,
                                "<p>Before</p><img src=\"a.png\" alt=\"A  map\"/>"
                                "<p>see <img src=\"b.png\" alt=\"x\"/> here</p><img src=\"c.png\"/>"),
                      "image: parse");
    runner.expectEqual("B:Before|B:[Image: A map]|B:see|B:[Image: x]|B:here", shape(parser.paragraphs()),
                       "image: placeholders in reading order, no alt dropped");
    if (parser.paragraphs().size() == 5) {
      const auto& img = parser.paragraphs()[1];
      runner.expectEq(size_t(1), img.spans.size(), "image: one span");
      if (!img.spans.empty()) {
        runner.expectTrue(img.spans[0] == StyleSpan{SpanStyle::Emphasis, 0, 3}, "image: placeholder italic");
      }
    }
  }

  // Test 10: Title falls back to <title> when there is no heading
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, "<p>Just text</p>", "  Doc \n  Title  "), "title fallback: parse");
    runner.expectEqual("Doc Title", parser.title(), "title fallback: whitespace collapsed");
    runner.expectEqual("B:Just text", shape(parser.paragraphs()), "title fallback: head text not in body");
  }

  // Test 11: Heading title keeps inline markup text
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, "<header><h2>The <em>Real</em> Title</h2></header><h3>Later</h3>"),
                      "heading title: parse");
    runner.expectEqual("The Real Title", parser.title(), "heading title: first heading only");
    runner.expectEqual("H:The Real Title|H:Later", shape(parser.paragraphs()), "heading title: structure");
  }

  // Test 12: Empty chapter yields one blank separator
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, "<div>  </div><br/>"), "empty: parse");
    runner.expectEq(size_t(1), parser.paragraphs().size(), "empty: one paragraph");
    runner.expectTrue(!parser.paragraphs().empty() && parser.paragraphs()[0].isBlank(), "empty: blank separator");
    runner.expectEqual("Doc", parser.title(), "empty: document title");
  }

  // Test 13: Malformed markup fails and leaves nothing behind
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectFalse(parse(parser, "<html><body><p>unclosed</body></html>"), "malformed: parse fails");
    runner.expectTrue(parser.paragraphs().empty(), "malformed: no paragraphs");
    runner.expectFalse(parse(parser, ""), "empty input fails");
  }

  // Test 14: Runaway nesting is rejected
  {
    std::string deep;
    for (int i = 0; i < 150; i++) deep += "<div>";
    deep += "x";
    for (int i = 0; i < 150; i++) deep += "</div>";
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectFalse(parseBody(parser, deep), "deep nesting: parse fails");
  }

  // Test 15: Long words are cut, BOM is dropped
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, "<p>" + std::string(450, 'a') + " a\xEF\xBB\xBF" "b</p>"), "long word: parse");
    if (parser.paragraphs().size() == 1) {
      const auto& words = parser.paragraphs()[0].words;
      runner.expectEq(size_t(4), words.size(), "long word: split into pieces");
      if (words.size() == 4) {
        runner.expectEq(size_t(200), words[0].size(), "long word: first piece capped");
        runner.expectEq(size_t(50), words[2].size(), "long word: remainder");
        runner.expectEqual("ab", words[3], "BOM removed");
      }
    } else {
      runner.expectTrue(false, "long word: single paragraph");
    }
  }

  // Test 16: Documents larger than one parse chunk
  {
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, EpubFixture::paragraphs(3000, 5)), "large: parse");
    runner.expectEq(size_t(3000), parser.paragraphs().size(), "large: all paragraphs");
    if (parser.paragraphs().size() == 3000) {
      runner.expectEqual("B:w2999x0 w2999x1 w2999x2 w2999x3 w2999x4",
                         shape({parser.paragraphs().back()}), "large: last paragraph intact");
    }
  }

  // Test 17: Re-parsing with the same parser gives identical output
  {
    const std::string markup = EpubFixture::chapterXhtml("T", "<h1>A</h1><p>b <em>c</em></p><hr/><p>d</p>");
    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parse(parser, markup), "deterministic: first parse");
    const auto first = parser.paragraphs();
    runner.expectTrue(parse(parser, markup), "deterministic: second parse");
    runner.expectTrue(first == parser.paragraphs(), "deterministic: same paragraphs");
  }

  // Test 18: Node classification
  {
    const char* pagebreak[] = {"role", "doc-pagebreak", nullptr};
    const char* hidden[] = {"aria-hidden", "true", nullptr};
    const char* plain[] = {"class", "x", nullptr};
    runner.expectTrue(ChapterHtmlSlimParser::classify("h3", nullptr) == NodeKind::Heading, "classify: h3");
    runner.expectTrue(ChapterHtmlSlimParser::classify("html:p", nullptr) == NodeKind::Block, "classify: prefixed p");
    runner.expectTrue(ChapterHtmlSlimParser::classify("li", plain) == NodeKind::Block, "classify: li");
    runner.expectTrue(ChapterHtmlSlimParser::classify("br", nullptr) == NodeKind::Break, "classify: br");
    runner.expectTrue(ChapterHtmlSlimParser::classify("hr", nullptr) == NodeKind::Rule, "classify: hr");
    runner.expectTrue(ChapterHtmlSlimParser::classify("cite", nullptr) == NodeKind::Emphasis, "classify: cite");
    runner.expectTrue(ChapterHtmlSlimParser::classify("b", nullptr) == NodeKind::Strong, "classify: b");
    runner.expectTrue(ChapterHtmlSlimParser::classify("img", plain) == NodeKind::Image, "classify: img");
    runner.expectTrue(ChapterHtmlSlimParser::classify("span", pagebreak) == NodeKind::Skipped,
                      "classify: page break marker");
    runner.expectTrue(ChapterHtmlSlimParser::classify("a", hidden) == NodeKind::Skipped, "classify: hidden anchor");
    runner.expectTrue(ChapterHtmlSlimParser::classify("span", hidden) == NodeKind::Inline,
                      "classify: aria-hidden only matters on anchors");
    runner.expectTrue(ChapterHtmlSlimParser::classify("table", nullptr) == NodeKind::Inline, "classify: table");
  }

  // Test 19: BOM dropped wherever the feed splits it
  {
    const std::string doc = EpubFixture::chapterXhtml("T", "<p>@</p>");
    const size_t at = doc.find('@');
    const size_t chunk = 64 * 1024;
    for (size_t before = 1; before <= 3; before++) {
      // Filler words put the BOM's first byte `before` bytes ahead of the chunk boundary
      std::string filler;
      while (filler.size() < chunk - before - at - 1) filler += "ab ";
      filler.resize(chunk - before - at - 1);
      filler.back() = ' ';
      std::string markup = doc;
      markup.replace(at, 1, filler + "x\xEF\xBB\xBFy");
      runner.expectEq(size_t(chunk - before), markup.find("\xEF\xBB\xBF"), "split BOM: placed at the boundary");

      ChapterHtmlSlimParser parser(withBreaks(true));
      runner.expectTrue(parse(parser, markup), "split BOM: parse");
      const bool one = parser.paragraphs().size() == 1;
      runner.expectTrue(one && parser.paragraphs()[0].words.back() == "xy", "split BOM: removed across chunks");
    }

    ChapterHtmlSlimParser parser(withBreaks(true));
    runner.expectTrue(parseBody(parser, "<p>p&#xFEFF;q <b>\xEF\xBB\xBF</b> c</p>"), "BOM reference: parse");
    runner.expectEqual("B:pq c", shape(parser.paragraphs()), "BOM reference: removed between text runs");
    if (parser.paragraphs().size() == 1) {
      runner.expectFalse(parser.paragraphs()[0].hasStyle(SpanStyle::Strong, 1), "BOM: dropped bold BOM styles nothing");
    }
  }

  return runner.allPassed() ? 0 : 1;
}
