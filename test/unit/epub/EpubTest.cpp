// Epub unit tests
// Whole-archive loading: metadata, spine-ordered chapters, placeholders and fatal error classes.

#include "test_utils.h"

#include <Epub.h>
#include <Logging.h>

#include <cstdint>
#include <string>
#include <vector>

#include "../EpubFixture.h"

using EpubFixture::ChapterSpec;
using EpubFixture::ZipBuilder;

namespace {
bool isClass(const epub::EpubError err, const epub::EpubErrorClass cls) { return epub::errorClass(err) == cls; }

// Builds a book with a custom package document
bool writeCustomBook(const std::string& path, const std::string& opf, const std::vector<ChapterSpec>& chapters) {
  ZipBuilder zip;
  zip.add("mimetype", "application/epub+zip");
  zip.add("META-INF/container.xml", EpubFixture::containerXml());
  zip.add("OEBPS/content.opf", opf);
  for (const auto& ch : chapters) {
    zip.add("OEBPS/" + ch.href, EpubFixture::chapterXhtml(ch.title, ch.body));
  }
  return zip.writeTo(path);
}
}  // namespace

int main() {
  TestUtils::TestRunner runner("Epub");

  std::vector<std::string> warnings;
  logSetWriter([&warnings](const char* line) {
    if (std::string(line).find("[WRN]") != std::string::npos) warnings.emplace_back(line);
  });

  const std::string dir = EpubFixture::makeTempDir("folio-epub");
  runner.expectFalse(dir.empty(), "temp dir created");

  const auto chapters = EpubFixture::numberedChapters({
      "<h1>First Light</h1><p>It was <em>dawn</em>.</p>",
      "<h1>Second Wind</h1><p>Noon.</p><br/><p>Still noon.</p>",
      "<p>No heading here.</p>",
  });

  // Test 1: Well-formed book
  {
    const std::string path = dir + "/good.epub";
    runner.expectTrue(EpubFixture::writeBook(path, "The Day", "A. Writer", chapters), "good: written");

    Epub epub(path);
    const auto err = epub.load();
    runner.expectTrue(err == epub::EpubError::OK, "good: loads");
    const Book& book = epub.book();
    runner.expectEqual("The Day", book.title, "good: title");
    runner.expectEqual("A. Writer", book.author, "good: author");
    runner.expectEqual("en", book.language, "good: language");
    runner.expectEqual(path, book.path, "good: path kept");
    runner.expectEq(size_t(16), book.id.size(), "good: id is 16 hex digits");
    runner.expectEq(size_t(3), book.chapters.size(), "good: one chapter per spine item");
    if (book.chapters.size() == 3) {
      runner.expectEqual("First Light", book.chapters[0].title, "good: heading title");
      runner.expectEqual("Chapter 3", book.chapters[2].title, "good: document title used without heading");
      runner.expectEqual("OEBPS/text/ch2.xhtml", book.chapters[1].href, "good: href resolved");
      runner.expectEq(uint16_t(1), book.chapters[1].index, "good: chapter index");
      runner.expectEq(size_t(4), book.chapters[1].paragraphs.size(), "good: separator paragraph kept");
      runner.expectFalse(book.chapters[0].placeholder, "good: no placeholders");
    }
  }

  // Test 2: Loading twice gives an identical book, same id
  {
    const std::string path = dir + "/good.epub";
    Epub a(path);
    Epub b(path);
    runner.expectTrue(a.load() == epub::EpubError::OK && b.load() == epub::EpubError::OK, "repeat: both load");
    runner.expectTrue(a.book() == b.book(), "repeat: identical books");
  }

  // Test 3: Different bytes give a different id
  {
    const std::string other = dir + "/other.epub";
    EpubFixture::writeBook(other, "The Day", "A. Writer", chapters, true);
    Epub a(dir + "/good.epub");
    Epub b(other);
    a.load();
    const auto err = b.load();
    runner.expectTrue(err == epub::EpubError::OK, "deflated: loads");
    runner.expectTrue(a.book().id != b.book().id, "deflated: different archive bytes, different id");
    runner.expectTrue(a.book().chapters == b.book().chapters, "deflated: same content as stored");
  }

  // Test 4: Navigation documents do not add chapters
  {
    const std::string extra =
        "<item id=\"ncx\" href=\"toc.ncx\" media-type=\"application/x-dtbncx+xml\"/>"
        "<item id=\"nav\" href=\"nav.xhtml\" media-type=\"application/xhtml+xml\" properties=\"nav\"/>";
    const std::string opf = EpubFixture::packageOpf("Nav", "N", chapters, EpubFixture::spineOf(chapters), extra,
                                                    " toc=\"ncx\"");
    const std::string path = dir + "/nav.epub";
    ZipBuilder zip;
    zip.add("META-INF/container.xml", EpubFixture::containerXml());
    zip.add("OEBPS/content.opf", opf);
    zip.add("OEBPS/toc.ncx", "<ncx><navMap><navPoint><content src=\"text/ch1.xhtml\"/></navPoint></navMap></ncx>");
    zip.add("OEBPS/nav.xhtml", EpubFixture::chapterXhtml("Contents", "<nav><ol><li>One</li></ol></nav>"));
    for (const auto& ch : chapters) zip.add("OEBPS/" + ch.href, EpubFixture::chapterXhtml(ch.title, ch.body));
    zip.writeTo(path);

    Epub epub(path);
    runner.expectTrue(epub.load() == epub::EpubError::OK, "nav: loads");
    runner.expectEq(size_t(3), epub.book().chapters.size(), "nav: spine alone decides chapters");
  }

  // Test 5: Duplicate spine entries are kept with a warning
  {
    auto spine = EpubFixture::spineOf(chapters);
    spine.push_back("ch1");
    const std::string path = dir + "/dup.epub";
    writeCustomBook(path, EpubFixture::packageOpf("Dup", "D", chapters, spine), chapters);
    warnings.clear();
    Epub epub(path);
    runner.expectTrue(epub.load() == epub::EpubError::OK, "duplicate: loads");
    runner.expectEq(size_t(4), epub.book().chapters.size(), "duplicate: reading order as declared");
    runner.expectFalse(warnings.empty(), "duplicate: warning logged");
    if (epub.book().chapters.size() == 4) {
      runner.expectEq(uint16_t(3), epub.book().chapters[3].index, "duplicate: own index");
      runner.expectTrue(epub.book().chapters[3].paragraphs == epub.book().chapters[0].paragraphs,
                        "duplicate: same content");
    }
  }

  // Test 6: Missing and malformed chapters become placeholders
  {
    auto broken = chapters;
    broken[1].body = "<p>unclosed";
    const std::string path = dir + "/broken.epub";
    ZipBuilder zip;
    zip.add("META-INF/container.xml", EpubFixture::containerXml());
    zip.add("OEBPS/content.opf", EpubFixture::packageOpf("Broken", "B", broken, EpubFixture::spineOf(broken)));
    zip.add("OEBPS/" + broken[0].href, EpubFixture::chapterXhtml(broken[0].title, broken[0].body));
    zip.add("OEBPS/" + broken[1].href, "<html><body><p>unclosed</body></html>");
    // chapter 3 is missing from the archive
    zip.writeTo(path);

    Epub epub(path);
    runner.expectTrue(epub.load() == epub::EpubError::OK, "placeholder: book still loads");
    const auto& chs = epub.book().chapters;
    runner.expectEq(size_t(3), chs.size(), "placeholder: chapter count unchanged");
    if (chs.size() == 3) {
      runner.expectFalse(chs[0].placeholder, "placeholder: good chapter intact");
      runner.expectTrue(chs[1].placeholder, "placeholder: malformed chapter");
      runner.expectTrue(chs[2].placeholder, "placeholder: missing chapter");
      runner.expectEqual("Chapter 3", chs[2].title, "placeholder: numbered title");
      runner.expectEq(size_t(1), chs[2].paragraphs.size(), "placeholder: one paragraph");
      if (!chs[2].paragraphs.empty()) {
        const auto& p = chs[2].paragraphs[0];
        std::string text;
        for (const auto& w : p.words) text += (text.empty() ? "" : " ") + w;
        runner.expectEqual("[Chapter 3 could not be displayed]", text, "placeholder: text");
        runner.expectTrue(p.hasStyle(SpanStyle::Emphasis, 0) &&
                              p.hasStyle(SpanStyle::Emphasis, static_cast<uint32_t>(p.words.size() - 1)),
                          "placeholder: italic");
      }
    }
  }

  // Test 7: Missing metadata falls back to defaults
  {
    const std::string path = dir + "/anon.epub";
    EpubFixture::writeBook(path, "", "", chapters);
    Epub epub(path);
    runner.expectTrue(epub.load() == epub::EpubError::OK, "anonymous: loads");
    runner.expectEqual("Unknown Title", epub.book().title, "anonymous: default title");
    runner.expectEqual("Unknown Author", epub.book().author, "anonymous: default author");
  }

  // Test 8: Archive class errors
  {
    Epub missing(dir + "/nope.epub");
    const auto err = missing.load();
    runner.expectTrue(err == epub::EpubError::FILE_NOT_FOUND, "archive: missing file");
    runner.expectTrue(isClass(err, epub::EpubErrorClass::Archive), "archive: missing file class");
    runner.expectFalse(missing.errorDetail().empty(), "archive: detail recorded");

    const std::string text = dir + "/text.epub";
    ZipBuilder::writeBytes(text, "Call me Ishmael. Some years ago, never mind how long precisely.");
    Epub notZip(text);
    const auto zipErr = notZip.load();
    runner.expectTrue(zipErr == epub::EpubError::NOT_A_ZIP, "archive: not a zip");
    runner.expectTrue(isClass(zipErr, epub::EpubErrorClass::Archive), "archive: not a zip class");
    runner.expectTrue(notZip.book().chapters.empty(), "archive: no partial book");
  }

  // Test 9: Manifest class errors
  {
    const std::string noContainer = dir + "/no-container.epub";
    ZipBuilder().add("mimetype", "application/epub+zip").writeTo(noContainer);
    Epub a(noContainer);
    const auto errA = a.load();
    runner.expectTrue(errA == epub::EpubError::CONTAINER_MISSING, "manifest: container missing");
    runner.expectTrue(isClass(errA, epub::EpubErrorClass::Manifest), "manifest: container missing class");

    const std::string noPackage = dir + "/no-package.epub";
    ZipBuilder().add("META-INF/container.xml", EpubFixture::containerXml("OEBPS/missing.opf")).writeTo(noPackage);
    Epub b(noPackage);
    const auto errB = b.load();
    runner.expectTrue(errB == epub::EpubError::PACKAGE_MISSING, "manifest: package missing");
    runner.expectTrue(isClass(errB, epub::EpubErrorClass::Manifest), "manifest: package missing class");

    const std::string badPackage = dir + "/bad-package.epub";
    ZipBuilder()
        .add("META-INF/container.xml", EpubFixture::containerXml())
        .add("OEBPS/content.opf", "<package><manifest>")
        .writeTo(badPackage);
    Epub c(badPackage);
    const auto errC = c.load();
    runner.expectTrue(errC == epub::EpubError::PACKAGE_INVALID, "manifest: malformed package");
    runner.expectTrue(isClass(errC, epub::EpubErrorClass::Manifest), "manifest: malformed package class");

    const std::string badContainer = dir + "/bad-container.epub";
    ZipBuilder().add("META-INF/container.xml", "<container><rootfiles/></container>").writeTo(badContainer);
    Epub d(badContainer);
    const auto errD = d.load();
    runner.expectTrue(errD == epub::EpubError::CONTAINER_INVALID, "manifest: no rootfile");
    runner.expectTrue(isClass(errD, epub::EpubErrorClass::Manifest), "manifest: no rootfile class");
  }

  // Test 10: Spine class errors
  {
    auto spine = EpubFixture::spineOf(chapters);
    spine.push_back("ghost");
    const std::string unresolved = dir + "/ghost.epub";
    writeCustomBook(unresolved, EpubFixture::packageOpf("Ghost", "G", chapters, spine), chapters);
    Epub a(unresolved);
    const auto errA = a.load();
    runner.expectTrue(errA == epub::EpubError::SPINE_UNRESOLVED, "spine: unresolved idref");
    runner.expectTrue(isClass(errA, epub::EpubErrorClass::Spine), "spine: unresolved class");
    runner.expectTrue(a.book().chapters.empty(), "spine: no partial chapters");
    runner.expectTrue(a.errorDetail().find("ghost") != std::string::npos, "spine: detail names the idref");

    const std::string empty = dir + "/empty-spine.epub";
    writeCustomBook(empty, EpubFixture::packageOpf("Empty", "E", chapters, {}), chapters);
    Epub b(empty);
    const auto errB = b.load();
    runner.expectTrue(errB == epub::EpubError::SPINE_EMPTY, "spine: empty");
    runner.expectTrue(isClass(errB, epub::EpubErrorClass::Spine), "spine: empty class");

    // One more itemref than a 16-bit chapter index can address
    const std::vector<std::string> huge(static_cast<size_t>(UINT16_MAX) + 1, EpubFixture::spineOf(chapters)[0]);
    const std::string oversized = dir + "/huge-spine.epub";
    writeCustomBook(oversized, EpubFixture::packageOpf("Huge", "H", chapters, huge), chapters);
    Epub c(oversized);
    const auto errC = c.load();
    runner.expectTrue(errC == epub::EpubError::SPINE_TOO_LARGE, "spine: more than 65535 itemrefs refused");
    runner.expectTrue(isClass(errC, epub::EpubErrorClass::Spine), "spine: oversized class");
    runner.expectTrue(c.book().chapters.empty(), "spine: oversized yields no chapters");
    runner.expectTrue(c.errorDetail().find("65536") != std::string::npos, "spine: detail gives the count");
  }

  // Test 11: Error strings
  {
    runner.expectEqual("Spine is empty", epub::errorToString(epub::EpubError::SPINE_EMPTY), "strings: spine empty");
    runner.expectTrue(epub::errorClass(epub::EpubError::OK) == epub::EpubErrorClass::None, "strings: OK class");
  }

  // Test 12: Line break preservation option reaches the chapter parser
  {
    EpubOptions options;
    options.preserveLineBreaks = false;
    Epub epub(dir + "/good.epub");
    runner.expectTrue(epub.load(options) == epub::EpubError::OK, "options: loads");
    if (epub.book().chapters.size() == 3) {
      runner.expectEq(size_t(3), epub.book().chapters[1].paragraphs.size(), "options: separator dropped");
    }
  }

  EpubFixture::removeTree(dir);
  logSetWriter(nullptr);
  return runner.allPassed() ? 0 : 1;
}
