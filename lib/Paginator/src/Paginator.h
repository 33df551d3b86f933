#pragma once

#include <DisplayLine.h>
#include <ReadingPosition.h>
#include <RenderConfig.h>

#include <cstdint>
#include <vector>

// Where a ReadingPosition lands within a chapter's pages
struct PageLocation {
  uint32_t page = 0;
  uint32_t lineOffset = 0;  // index within Page::lines

  bool operator==(const PageLocation& o) const { return page == o.page && lineOffset == o.lineOffset; }
};

// Facing pages of one chapter. right is null when left is the chapter's last page.
struct Spread {
  const Page* left = nullptr;
  const Page* right = nullptr;
};

/**
 * Slices one chapter's display lines into viewport-height pages and maps
 * reading positions back onto them.
 */
class Paginator {
 public:
  static std::vector<Page> paginate(uint16_t chapter, const std::vector<DisplayLine>& lines,
                                    const ViewportConfig& viewport);

  /**
   * Index of the line containing (paragraph, word): the last non-blank line starting at or before it.
   * Falls back to line 0 when the target precedes every text line.
   */
  static uint32_t locateLine(const std::vector<DisplayLine>& lines, uint32_t paragraph, uint32_t word);

  // Only the paragraph and word of position are consulted; pages belong to a single chapter.
  static PageLocation locate(const ReadingPosition& position, const std::vector<Page>& pages);

  // First page of the view holding page when pagesPerView pages are shown side by side
  static uint32_t spreadStart(uint32_t page, uint8_t pagesPerView) {
    return pagesPerView > 1 ? page - page % pagesPerView : page;
  }

  // Pairs page k with k+1 where k is page rounded down to an even index; pages must not be empty
  static Spread spreadAt(const std::vector<Page>& pages, uint32_t page);
};
