#include "Paginator.h"

#include <Logging.h>

#include <algorithm>
#include <cstddef>

#define TAG "PAGE"

std::vector<Page> Paginator::paginate(const uint16_t chapter, const std::vector<DisplayLine>& lines,
                                      const ViewportConfig& viewport) {
  const size_t height = std::max<uint16_t>(viewport.height, 1);
  std::vector<Page> pages;

  if (lines.empty()) {
    Page page;
    page.chapter = chapter;
    pages.push_back(std::move(page));
    return pages;
  }

  pages.reserve((lines.size() + height - 1) / height);
  for (size_t start = 0; start < lines.size(); start += height) {
    const size_t end = std::min(start + height, lines.size());
    Page page;
    page.chapter = chapter;
    page.firstLine = static_cast<uint32_t>(start);
    page.lines.assign(lines.begin() + static_cast<std::ptrdiff_t>(start),
                      lines.begin() + static_cast<std::ptrdiff_t>(end));
    pages.push_back(std::move(page));
  }

  if (viewport.fillToNextChapter) {
    auto& last = pages.back();
    const DisplayLine& tail = lines.back();
    while (last.lines.size() < height) {
      DisplayLine filler;
      filler.kind = DisplayLine::Kind::Blank;
      filler.padding = true;
      filler.paragraph = tail.paragraph;
      filler.word = tail.word;
      last.lines.push_back(std::move(filler));
    }
  }

  LOG_DBG(TAG, "Chapter %u: %zu lines -> %zu pages of %zu", chapter, lines.size(), pages.size(), height);
  return pages;
}

uint32_t Paginator::locateLine(const std::vector<DisplayLine>& lines, const uint32_t paragraph, const uint32_t word) {
  // Back-references never decrease, so the candidates form a prefix of the list
  uint32_t found = 0;
  for (size_t i = 0; i < lines.size(); i++) {
    const auto& line = lines[i];
    if (!line.startsAtOrBefore(paragraph, word)) {
      break;
    }
    if (!line.isBlank()) {
      found = static_cast<uint32_t>(i);
    }
  }
  return found;
}

PageLocation Paginator::locate(const ReadingPosition& position, const std::vector<Page>& pages) {
  PageLocation location;

  for (size_t p = 0; p < pages.size(); p++) {
    const auto& lines = pages[p].lines;
    for (size_t i = 0; i < lines.size(); i++) {
      const auto& line = lines[i];
      if (line.padding) {
        continue;
      }
      if (!line.startsAtOrBefore(position.paragraph, position.word)) {
        return location;
      }
      if (!line.isBlank()) {
        location.page = static_cast<uint32_t>(p);
        location.lineOffset = static_cast<uint32_t>(i);
      }
    }
  }
  return location;
}

Spread Paginator::spreadAt(const std::vector<Page>& pages, const uint32_t page) {
  Spread spread;
  if (pages.empty()) {
    return spread;
  }

  const uint32_t last = static_cast<uint32_t>(pages.size() - 1);
  const uint32_t start = std::min(spreadStart(page, 2), last - last % 2);
  spread.left = &pages[start];
  if (start + 1 <= last) {
    spread.right = &pages[start + 1];
  }
  return spread;
}
