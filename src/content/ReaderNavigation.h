#pragma once

#include <DisplayLine.h>
#include <Epub/Book.h>
#include <Paginator.h>
#include <ReadingPosition.h>
#include <RenderConfig.h>

#include <cstdint>
#include <vector>

#include "../core/Result.h"

namespace folio {

// A page address for the current layout. Only meaningful until the next config change.
struct Location {
  uint16_t chapter = 0;
  uint32_t page = 0;

  bool operator==(const Location& o) const { return chapter == o.chapter && page == o.page; }
  bool operator!=(const Location& o) const { return !(*this == o); }
};

/**
 * Page-level navigation over a parsed book.
 *
 * Chapters are wrapped and paginated lazily, the first time a page of theirs is
 * needed, and kept until setLayout() changes either config. Moving past the first
 * or last page fails with Error::Boundary and leaves the caller's location as is.
 *
 * With two pages per view every location the navigator hands out is the left
 * page of a spread (an even page index) and page turns move by a whole spread.
 * Spreads never pair pages of two chapters.
 */
class ReaderNavigation {
 public:
  // book must outlive the navigator and hold at least one chapter
  explicit ReaderNavigation(const Book& book);

  // Drops every cached chapter when style or viewport differ from the current ones
  void setLayout(const StyleConfig& style, const ViewportConfig& viewport, uint8_t pagesPerView = 1);
  uint8_t pagesPerView() const { return pagesPerView_; }
  const StyleConfig& style() const { return style_; }
  const ViewportConfig& viewport() const { return viewport_; }

  uint16_t chapterCount() const { return static_cast<uint16_t>(book_.chapters.size()); }
  uint32_t pageCount(uint16_t chapter);
  const std::vector<DisplayLine>& lines(uint16_t chapter);
  const std::vector<Page>& pages(uint16_t chapter);

  // Out-of-range indices are clamped to the nearest existing page
  const Page& page(const Location& location);
  // Pages shown together at location; right stays null in single-page mode
  Spread spread(const Location& location);

  Result<Location> nextPage(const Location& from);
  Result<Location> prevPage(const Location& from);
  Result<Location> nextChapter(const Location& from);
  Result<Location> prevChapter(const Location& from);
  // landed, when given, receives the back-reference of the line containing position
  Result<Location> jumpTo(const ReadingPosition& position, ReadingPosition* landed = nullptr);
  Result<Location> first();
  Result<Location> last();

  // Back-reference of the page's first text line
  ReadingPosition positionAt(const Location& location);

  bool isLaidOut(uint16_t chapter) const;
  size_t laidOutCount() const;

 private:
  struct ChapterLayout {
    bool ready = false;
    std::vector<DisplayLine> lines;
    std::vector<Page> pages;
  };

  const Book& book_;
  StyleConfig style_;
  ViewportConfig viewport_;
  uint8_t pagesPerView_ = 1;
  std::vector<ChapterLayout> cache_;

  ChapterLayout& layout(uint16_t chapter);
  bool validLocation(const Location& location);
  uint32_t viewStart(uint32_t page) const { return Paginator::spreadStart(page, pagesPerView_); }
};

}  // namespace folio
