#include "Epub.h"

#include <FsHelpers.h>
#include <Logging.h>
#include <ZipFile.h>

#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <unordered_set>

#include "Epub/parsers/ChapterHtmlSlimParser.h"
#include "Epub/parsers/ContainerParser.h"
#include "Epub/parsers/ContentOpfParser.h"

#define TAG "EBP"

namespace {
constexpr char CONTAINER_PATH[] = "META-INF/container.xml";
constexpr char DEFAULT_TITLE[] = "Unknown Title";
constexpr char DEFAULT_AUTHOR[] = "Unknown Author";

Paragraph placeholderParagraph(const uint16_t chapterIndex) {
  Paragraph p;
  p.kind = Paragraph::Kind::Body;
  p.words = {"[Chapter", std::to_string(chapterIndex + 1), "could", "not", "be", "displayed]"};
  p.spans.push_back({SpanStyle::Emphasis, 0, static_cast<uint32_t>(p.words.size())});
  return p;
}
}  // namespace

epub::EpubError Epub::fail(const epub::EpubError err, const std::string& detail) {
  errorDetail_ = detail;
  LOG_ERR(TAG, "%s: %s (%s)", filepath.c_str(), epub::errorToString(err), detail.c_str());
  return err;
}

epub::EpubError Epub::computeBookId() {
  FILE* file = fopen(filepath.c_str(), "rb");
  if (!file) {
    return fail(epub::EpubError::FILE_NOT_FOUND, filepath);
  }

  uint8_t buf[8192];
  uint64_t hash = FNV_OFFSET_BASIS_64;
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), file)) > 0) {
    hash = fnvHash64(buf, n, hash);
  }
  const bool failed = ferror(file) != 0;
  fclose(file);
  if (failed) {
    return fail(epub::EpubError::READ_ERROR, "error while hashing archive");
  }

  char id[17];
  snprintf(id, sizeof(id), "%016" PRIx64, hash);
  book_.id = id;
  return epub::EpubError::OK;
}

epub::EpubError Epub::findContentOpfFile(ZipFile& zip, std::string* contentOpfFile) {
  std::string containerXml;
  if (!zip.readFileToString(CONTAINER_PATH, containerXml)) {
    return fail(epub::EpubError::CONTAINER_MISSING, CONTAINER_PATH);
  }

  ContainerParser containerParser(containerXml.size());
  if (!containerParser.setup()) {
    return fail(epub::EpubError::CONTAINER_INVALID, "parser setup failed");
  }

  if (containerXml.empty() ||
      containerParser.write(reinterpret_cast<const uint8_t*>(containerXml.data()), containerXml.size()) !=
          containerXml.size()) {
    return fail(epub::EpubError::CONTAINER_INVALID, "container.xml is not well-formed");
  }

  if (containerParser.fullPath.empty()) {
    return fail(epub::EpubError::CONTAINER_INVALID, "no rootfile in container.xml");
  }

  *contentOpfFile = std::move(containerParser.fullPath);
  return epub::EpubError::OK;
}

epub::EpubError Epub::parseContentOpf(ZipFile& zip, const std::string& contentOpfFilePath,
                                      const EpubOptions& options) {
  contentBasePath = FsHelpers::parentDir(contentOpfFilePath);

  LOG_DBG(TAG, "Parsing content.opf: %s", contentOpfFilePath.c_str());

  std::string opfXml;
  if (!zip.readFileToString(contentOpfFilePath.c_str(), opfXml)) {
    return fail(epub::EpubError::PACKAGE_MISSING, contentOpfFilePath);
  }

  ContentOpfParser opfParser(contentBasePath, opfXml.size());
  if (!opfParser.setup()) {
    return fail(epub::EpubError::PACKAGE_INVALID, "parser setup failed");
  }

  if (opfXml.empty() ||
      opfParser.write(reinterpret_cast<const uint8_t*>(opfXml.data()), opfXml.size()) != opfXml.size()) {
    return fail(epub::EpubError::PACKAGE_INVALID, contentOpfFilePath + " is not well-formed");
  }

  if (!opfParser.hasManifest || opfParser.manifest.empty()) {
    return fail(epub::EpubError::MANIFEST_MISSING, contentOpfFilePath);
  }

  if (!opfParser.hasSpine || opfParser.spine.empty()) {
    return fail(epub::EpubError::SPINE_EMPTY, contentOpfFilePath);
  }

  // Chapter indices are 16-bit
  if (opfParser.spine.size() > UINT16_MAX) {
    return fail(epub::EpubError::SPINE_TOO_LARGE,
                std::to_string(opfParser.spine.size()) + " itemrefs, at most " + std::to_string(UINT16_MAX));
  }

  book_.title = opfParser.title.empty() ? DEFAULT_TITLE : opfParser.title;
  book_.author = opfParser.author.empty() ? DEFAULT_AUTHOR : opfParser.author;
  book_.language = opfParser.language;

  // Resolve every item reference exactly once, in spine order
  std::unordered_set<std::string> seen;
  book_.chapters.reserve(opfParser.spine.size());
  for (const auto& ref : opfParser.spine) {
    const auto it = opfParser.manifest.find(ref.idref);
    if (it == opfParser.manifest.end()) {
      return fail(epub::EpubError::SPINE_UNRESOLVED, "itemref idref=\"" + ref.idref + "\"");
    }

    if (!seen.insert(ref.idref).second) {
      // Ambiguous intent: keep the reading order as declared
      LOG_WRN(TAG, "Spine lists item %s more than once", ref.idref.c_str());
    }
    if (!ref.linear) {
      LOG_DBG(TAG, "Non-linear spine item %s kept in reading order", ref.idref.c_str());
    }

    Chapter chapter;
    chapter.index = static_cast<uint16_t>(book_.chapters.size());
    chapter.href = it->second.href;
    book_.chapters.push_back(std::move(chapter));
  }

  const auto start = std::chrono::steady_clock::now();
  for (auto& chapter : book_.chapters) {
    if (options.parseTimeoutMs > 0) {
      const auto elapsed = std::chrono::steady_clock::now() - start;
      if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >
          static_cast<long long>(options.parseTimeoutMs)) {
        book_.chapters.clear();
        return fail(epub::EpubError::TIMEOUT, "gave up at chapter " + std::to_string(chapter.index) + " after " +
                                                  std::to_string(options.parseTimeoutMs) + " ms");
      }
    }
    loadChapter(zip, chapter, options);
  }

  return epub::EpubError::OK;
}

void Epub::loadChapter(ZipFile& zip, Chapter& chapter, const EpubOptions& options) const {
  std::string markup;
  bool extracted = false;
  std::string title;

  if (!zip.readFileToString(chapter.href.c_str(), markup)) {
    LOG_WRN(TAG, "Chapter %u: %s missing from archive", chapter.index, chapter.href.c_str());
  } else {
    ChapterHtmlSlimParser::Options parserOptions;
    parserOptions.preserveLineBreaks = options.preserveLineBreaks;
    ChapterHtmlSlimParser parser(parserOptions);
    if (parser.parseAndBuildParagraphs(markup.data(), markup.size())) {
      chapter.paragraphs = parser.takeParagraphs();
      title = parser.title();
      extracted = true;
    } else {
      LOG_WRN(TAG, "Chapter %u: %s could not be extracted", chapter.index, chapter.href.c_str());
    }
  }

  if (!extracted) {
    chapter.placeholder = true;
    chapter.paragraphs.clear();
    chapter.paragraphs.push_back(placeholderParagraph(chapter.index));
  }

  chapter.title = title.empty() ? "Chapter " + std::to_string(chapter.index + 1) : title;
}

epub::EpubError Epub::load(const EpubOptions& options) {
  book_ = Book();
  book_.path = filepath;
  errorDetail_.clear();

  if (!FsHelpers::exists(filepath)) {
    return fail(epub::EpubError::FILE_NOT_FOUND, filepath);
  }

  const auto idErr = computeBookId();
  if (idErr != epub::EpubError::OK) {
    return idErr;
  }

  ZipFile zip(filepath);
  if (!zip.open()) {
    return fail(epub::EpubError::FILE_NOT_FOUND, filepath);
  }
  if (!zip.loadAllFileStatSlims()) {
    return fail(epub::EpubError::NOT_A_ZIP, "no readable central directory");
  }

  std::string contentOpfFilePath;
  auto err = findContentOpfFile(zip, &contentOpfFilePath);
  if (err != epub::EpubError::OK) {
    return err;
  }

  err = parseContentOpf(zip, contentOpfFilePath, options);
  if (err != epub::EpubError::OK) {
    book_.chapters.clear();
    return err;
  }

  LOG_INF(TAG, "Loaded \"%s\" by %s: %zu chapters", book_.title.c_str(), book_.author.c_str(), book_.chapters.size());
  return epub::EpubError::OK;
}
