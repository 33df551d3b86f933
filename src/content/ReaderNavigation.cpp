#include "ReaderNavigation.h"

#include <LineWrapper.h>
#include <Logging.h>

#include <algorithm>

#define TAG "NAV"

namespace folio {

ReaderNavigation::ReaderNavigation(const Book& book) : book_(book), cache_(book.chapters.size()) {}

void ReaderNavigation::setLayout(const StyleConfig& style, const ViewportConfig& viewport,
                                 const uint8_t pagesPerView) {
  pagesPerView_ = pagesPerView > 1 ? 2 : 1;
  if (style == style_ && viewport == viewport_) {
    return;
  }

  style_ = style;
  viewport_ = viewport;
  for (auto& entry : cache_) {
    entry = ChapterLayout();
  }
  LOG_DBG(TAG, "Layout changed: width %u, height %u, fill %d, %u per view", style_.width, viewport_.height,
          viewport_.fillToNextChapter ? 1 : 0, pagesPerView_);
}

ReaderNavigation::ChapterLayout& ReaderNavigation::layout(const uint16_t chapter) {
  auto& entry = cache_[chapter];
  if (!entry.ready) {
    entry.lines = LineWrapper::wrap(book_.chapters[chapter], style_);
    entry.pages = Paginator::paginate(chapter, entry.lines, viewport_);
    entry.ready = true;
  }
  return entry;
}

bool ReaderNavigation::isLaidOut(const uint16_t chapter) const {
  return chapter < cache_.size() && cache_[chapter].ready;
}

size_t ReaderNavigation::laidOutCount() const {
  return static_cast<size_t>(
      std::count_if(cache_.begin(), cache_.end(), [](const ChapterLayout& entry) { return entry.ready; }));
}

uint32_t ReaderNavigation::pageCount(const uint16_t chapter) {
  if (chapter >= chapterCount()) return 0;
  return static_cast<uint32_t>(layout(chapter).pages.size());
}

const std::vector<DisplayLine>& ReaderNavigation::lines(const uint16_t chapter) {
  return layout(std::min<uint16_t>(chapter, chapterCount() - 1)).lines;
}

const std::vector<Page>& ReaderNavigation::pages(const uint16_t chapter) {
  return layout(std::min<uint16_t>(chapter, chapterCount() - 1)).pages;
}

const Page& ReaderNavigation::page(const Location& location) {
  const auto& chapterPages = pages(location.chapter);
  const size_t index = std::min<size_t>(location.page, chapterPages.size() - 1);
  return chapterPages[index];
}

Spread ReaderNavigation::spread(const Location& location) {
  if (pagesPerView_ > 1) {
    return Paginator::spreadAt(pages(location.chapter), location.page);
  }
  Spread single;
  single.left = &page(location);
  return single;
}

bool ReaderNavigation::validLocation(const Location& location) {
  return location.chapter < chapterCount() && location.page < pageCount(location.chapter);
}

Result<Location> ReaderNavigation::nextPage(const Location& from) {
  if (!validLocation(from)) {
    return Err<Location>(Error::InvalidArgument);
  }

  const uint32_t next = viewStart(from.page) + pagesPerView_;
  if (next < pageCount(from.chapter)) {
    return Ok(Location{from.chapter, next});
  }
  if (from.chapter + 1 < chapterCount()) {
    return Ok(Location{static_cast<uint16_t>(from.chapter + 1), 0});
  }
  return Err<Location>(Error::Boundary);
}

Result<Location> ReaderNavigation::prevPage(const Location& from) {
  if (!validLocation(from)) {
    return Err<Location>(Error::InvalidArgument);
  }

  const uint32_t start = viewStart(from.page);
  if (start > 0) {
    return Ok(Location{from.chapter, viewStart(start - 1)});
  }
  if (from.chapter > 0) {
    const auto chapter = static_cast<uint16_t>(from.chapter - 1);
    return Ok(Location{chapter, viewStart(pageCount(chapter) - 1)});
  }
  return Err<Location>(Error::Boundary);
}

Result<Location> ReaderNavigation::nextChapter(const Location& from) {
  if (from.chapter >= chapterCount()) {
    return Err<Location>(Error::InvalidArgument);
  }
  if (from.chapter + 1 >= chapterCount()) {
    return Err<Location>(Error::Boundary);
  }
  return Ok(Location{static_cast<uint16_t>(from.chapter + 1), 0});
}

Result<Location> ReaderNavigation::prevChapter(const Location& from) {
  if (from.chapter >= chapterCount()) {
    return Err<Location>(Error::InvalidArgument);
  }
  if (from.chapter == 0) {
    return Err<Location>(Error::Boundary);
  }
  return Ok(Location{static_cast<uint16_t>(from.chapter - 1), 0});
}

Result<Location> ReaderNavigation::jumpTo(const ReadingPosition& position, ReadingPosition* landed) {
  if (position.chapter >= chapterCount()) {
    LOG_WRN(TAG, "Jump to chapter %u of %u rejected", position.chapter, chapterCount());
    return Err<Location>(Error::InvalidArgument);
  }

  const auto& chapterPages = layout(position.chapter).pages;
  const PageLocation found = Paginator::locate(position, chapterPages);
  if (landed) {
    const auto& lines = chapterPages[found.page].lines;
    *landed = lines.empty() ? ReadingPosition(position.chapter, 0, 0)
                            : lines[found.lineOffset].positionIn(position.chapter);
  }
  return Ok(Location{position.chapter, viewStart(found.page)});
}

Result<Location> ReaderNavigation::first() {
  if (chapterCount() == 0) {
    return Err<Location>(Error::InvalidArgument);
  }
  return Ok(Location{0, 0});
}

Result<Location> ReaderNavigation::last() {
  if (chapterCount() == 0) {
    return Err<Location>(Error::InvalidArgument);
  }
  const auto chapter = static_cast<uint16_t>(chapterCount() - 1);
  return Ok(Location{chapter, viewStart(pageCount(chapter) - 1)});
}

ReadingPosition ReaderNavigation::positionAt(const Location& location) {
  const Page& p = page(location);
  const DisplayLine* anchor = p.anchorLine();
  if (!anchor) {
    return ReadingPosition(p.chapter, 0, 0);
  }
  return anchor->positionIn(p.chapter);
}

}  // namespace folio
