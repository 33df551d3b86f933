#pragma once

#include <Epub/Book.h>
#include <ReadingPosition.h>

#include <cstdint>
#include <string>
#include <vector>

#include "../core/Result.h"

namespace folio {

struct ReaderState {
  std::string bookId;
  std::string title;
  ReadingPosition position;
  std::vector<ReadingPosition> history;  // oldest first
  uint64_t lastOpened = 0;               // unix seconds
};

/**
 * Reading state for every book, kept in one JSON document at <stateDir>/progress.json.
 *
 * Saving rewrites only the fields it owns, so entries and fields written by other
 * versions survive. The file is replaced atomically.
 */
class ProgressManager {
 public:
  static constexpr const char* FILE_NAME = "progress.json";
  static constexpr int FORMAT_VERSION = 1;

  explicit ProgressManager(std::string stateDir);

  const std::string& stateDir() const { return stateDir_; }
  std::string filePath() const;

  /**
   * NotFound when the book has no entry. A corrupt file or an entry with invalid
   * fields yields a default state (position 0/0/0) and a warning. State when the
   * file exists but cannot be read.
   */
  Result<ReaderState> load(const std::string& bookId) const;

  Result<void> save(const ReaderState& state) const;

  // Clamp position and history into the book's bounds
  static ReaderState validate(const Book& book, const ReaderState& state);

 private:
  std::string stateDir_;
};

}  // namespace folio
