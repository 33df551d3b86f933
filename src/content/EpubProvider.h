#pragma once

#include <Epub.h>

#include <string>

#include "../core/Result.h"

namespace folio {

// EpubProvider wraps the Epub parser and owns the resulting Book
struct EpubProvider {
  Book book;
  std::string errorDetail;  // underlying cause of the last failed open
  bool loaded = false;

  EpubProvider() = default;
  ~EpubProvider() = default;

  // Non-copyable
  EpubProvider(const EpubProvider&) = delete;
  EpubProvider& operator=(const EpubProvider&) = delete;

  // Archive, Manifest or Spine error on failure; nothing is kept from a failed open
  Result<void> open(const char* path, const EpubOptions& options);
  void close();

  uint16_t chapterCount() const { return static_cast<uint16_t>(book.chapters.size()); }
  Result<const Chapter*> chapter(uint16_t index) const;

  static Error mapError(epub::EpubError err);
};

}  // namespace folio
