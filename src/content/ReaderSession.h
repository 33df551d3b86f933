#pragma once

#include <DisplayLine.h>
#include <ReadingPosition.h>

#include <cstdint>
#include <memory>
#include <string>

#include "../core/ReaderSettings.h"
#include "../core/Result.h"
#include "EpubProvider.h"
#include "ProgressManager.h"
#include "ReaderNavigation.h"

namespace folio {

struct ReadingProgress {
  uint16_t chapter = 0;
  uint16_t chapterCount = 0;
  uint32_t page = 0;
  uint32_t pageCount = 0;
  uint8_t chapterPercent = 0;
  uint8_t overallPercent = 0;
  uint8_t pagesPerView = 1;  // page is the left one of the view
};

/**
 * One open book: parsed content, current layout, current page and the reading state.
 *
 * The ReadingPosition in state() is the durable coordinate. Every successful
 * navigation sets it to the landing line's back-reference; resize() and
 * setSettings() only re-locate it. Nothing is written to disk until save().
 */
class ReaderSession {
 public:
  ReaderSession(ReaderSettings settings, uint16_t columns, uint16_t rows);
  ~ReaderSession() = default;

  // Non-copyable
  ReaderSession(const ReaderSession&) = delete;
  ReaderSession& operator=(const ReaderSession&) = delete;

  // Parse the book, restore its saved state and land on the saved position
  Result<void> open(const std::string& path);
  bool isOpen() const { return nav_ != nullptr; }

  Result<void> resize(uint16_t columns, uint16_t rows);
  Result<void> setSettings(const ReaderSettings& settings);

  // Pages side by side: the configured choice for the current width unless toggled.
  // A spread that does not fit the terminal falls back to one page.
  bool doublePage() const;
  // Flips doublePage() for the rest of the session and re-lays out around the position
  Result<void> toggleDoublePage();

  Result<Location> nextPage();
  Result<Location> prevPage();
  Result<Location> nextChapter();
  Result<Location> prevChapter();
  Result<Location> jumpTo(const ReadingPosition& position);
  Result<Location> goToStart();
  Result<Location> goToEnd();
  // Return to the position before the most recent jump. NotFound when the history is empty.
  Result<Location> back();

  Result<const Page*> currentPage();
  Result<Spread> currentSpread();
  const Location& location() const { return location_; }
  const ReadingPosition& position() const { return state_.position; }
  const ReaderState& state() const { return state_; }
  ReadingProgress progress();

  // Persist the reading state stamped with the current time
  Result<void> save();

  const Book& book() const { return provider_.book; }
  const ReaderSettings& settings() const { return settings_; }
  const StyleConfig& style() const { return style_; }
  uint16_t columns() const { return columns_; }
  uint16_t rows() const { return rows_; }

 private:
  ReaderSettings settings_;
  ProgressManager store_;
  EpubProvider provider_;
  std::unique_ptr<ReaderNavigation> nav_;
  uint16_t columns_;
  uint16_t rows_;
  StyleConfig style_;
  ReaderState state_;
  Location location_;
  bool doublePageToggled_ = false;
  bool doublePageOverride_ = false;

  bool wantsDoublePage() const;
  void applyLayout();
  void pushHistory(const ReadingPosition& position);
  Result<Location> turnTo(const Result<Location>& target, bool isJump);
};

}  // namespace folio
