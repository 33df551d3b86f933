#pragma once

#include <string>
#include <utility>

#include "Epub/Book.h"
#include "Epub/EpubTypes.h"

class ZipFile;

/**
 * Archive parser: container -> package document -> spine -> chapters.
 *
 * Chapters come from the spine alone, one per item reference, in spine order.
 * Navigation documents (NCX, nav) are never consulted for membership.
 */
class Epub {
  std::string filepath;
  std::string contentBasePath;
  std::string errorDetail_;
  Book book_;

  epub::EpubError fail(epub::EpubError err, const std::string& detail);
  epub::EpubError computeBookId();
  epub::EpubError findContentOpfFile(ZipFile& zip, std::string* contentOpfFile);
  epub::EpubError parseContentOpf(ZipFile& zip, const std::string& contentOpfFilePath, const EpubOptions& options);
  void loadChapter(ZipFile& zip, Chapter& chapter, const EpubOptions& options) const;

 public:
  explicit Epub(std::string filepath) : filepath(std::move(filepath)) {}

  // Parse the whole book. On failure errorDetail() names the underlying cause.
  epub::EpubError load(const EpubOptions& options = EpubOptions());

  const std::string& getPath() const { return filepath; }
  const std::string& errorDetail() const { return errorDetail_; }

  const Book& book() const { return book_; }
  Book takeBook() { return std::move(book_); }
};
