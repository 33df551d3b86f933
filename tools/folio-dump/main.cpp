#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <DisplayLine.h>
#include <Logging.h>
#include <Utf8.h>

#include "content/ReaderSession.h"
#include "core/ReaderSettings.h"

#define TAG "DUMP"

using folio::Error;
using folio::Location;
using folio::ReaderSession;
using folio::ReaderSettings;
using folio::Result;

static void usage() {
  fprintf(stderr,
          "Usage: folio-dump [--config file] [--width N] [--height N] [--state-dir dir] [--page-ops ops] [--no-save] "
          "<book.epub>\n");
  fprintf(stderr, "  --config file    Settings INI (default: ~/.config/folio/config.ini)\n");
  fprintf(stderr, "  --width N        Terminal columns (default: 80)\n");
  fprintf(stderr, "  --height N       Terminal rows including the status line (default: 24)\n");
  fprintf(stderr, "  --state-dir dir  Where progress.json lives (overrides the config)\n");
  fprintf(stderr, "  --page-ops ops   Navigation to apply before printing:\n");
  fprintf(stderr, "                   n/p next/previous page, N/P next/previous chapter,\n");
  fprintf(stderr, "                   s start, e end, b back, d toggle double page\n");
  fprintf(stderr, "  --no-save        Leave the reading state untouched\n");
}

static std::string renderLine(const DisplayLine& line, const bool ansi) {
  if (!ansi || line.spans.empty()) {
    return line.kind == DisplayLine::Kind::Heading && ansi ? "\x1b[1m" + line.text + "\x1b[0m" : line.text;
  }

  // Spans may overlap across styles; emit each character run with the styles covering it
  std::string out;
  size_t column = 0;
  const auto* p = reinterpret_cast<const unsigned char*>(line.text.c_str());
  bool italic = false;
  bool bold = line.kind == DisplayLine::Kind::Heading;
  if (bold) out += "\x1b[1m";
  while (*p) {
    bool wantItalic = false;
    bool wantBold = line.kind == DisplayLine::Kind::Heading;
    for (const auto& span : line.spans) {
      if (column >= span.startColumn && column < span.endColumn) {
        if (span.style == SpanStyle::Emphasis) wantItalic = true;
        if (span.style == SpanStyle::Strong) wantBold = true;
      }
    }
    if (wantItalic != italic || wantBold != bold) {
      out += "\x1b[0m";
      if (wantBold) out += "\x1b[1m";
      if (wantItalic) out += "\x1b[3m";
      italic = wantItalic;
      bold = wantBold;
    }
    const unsigned char* before = p;
    utf8NextCodepoint(&p);
    out.append(reinterpret_cast<const char*>(before), static_cast<size_t>(p - before));
    column += utf8DisplayWidth(reinterpret_cast<const char*>(before), static_cast<size_t>(p - before));
  }
  if (italic || bold) out += "\x1b[0m";
  return out;
}

static Result<Location> applyOp(ReaderSession& session, const char op) {
  if (op == 'd') {
    const auto toggled = session.toggleDoublePage();
    if (!toggled.ok()) return folio::Err<Location>(toggled.err);
    return folio::Ok(session.location());
  }

  switch (op) {
    case 'n':
      return session.nextPage();
    case 'p':
      return session.prevPage();
    case 'N':
      return session.nextChapter();
    case 'P':
      return session.prevChapter();
    case 's':
      return session.goToStart();
    case 'e':
      return session.goToEnd();
    case 'b':
      return session.back();
    default:
      return folio::Err<Location>(Error::InvalidArgument);
  }
}

// Row of a spread: the left page padded to the page width, the separator, then the right page
static std::string spreadRow(const Spread& spread, const size_t row, const uint16_t pageWidth,
                             const std::string& separator, const bool ansi) {
  std::string out;
  uint16_t used = 0;
  if (row < spread.left->lines.size() && !spread.left->lines[row].isBlank()) {
    out = renderLine(spread.left->lines[row], ansi);
    used = spread.left->lines[row].columns;
  }
  if (!spread.right) {
    return out;
  }

  out.append(used < pageWidth ? static_cast<size_t>(pageWidth - used) : 0, ' ');
  out += " " + separator + " ";
  if (row < spread.right->lines.size() && !spread.right->lines[row].isBlank()) {
    out += renderLine(spread.right->lines[row], ansi);
  }
  return out;
}

static void printPage(ReaderSession& session, const bool ansi) {
  const auto spread = session.currentSpread();
  if (!spread.ok()) {
    fprintf(stderr, "No page to show: %s\n", folio::errorToString(spread.err));
    return;
  }

  const auto& settings = session.settings();
  const std::string margin(settings.leftMarginFor(session.columns()), ' ');
  const uint16_t height = settings.viewportFor(session.rows()).height;
  for (size_t row = 0; row < height; row++) {
    const std::string text = spreadRow(spread.value, row, session.style().width, settings.doublePageSeparator, ansi);
    printf("%s%s\n", text.empty() ? "" : margin.c_str(), text.c_str());
  }

  const auto& book = session.book();
  const auto progress = session.progress();
  const auto& pos = session.position();
  const auto& chapter = book.chapters[progress.chapter];
  char status[512];
  char pages[32];
  if (spread.value.right) {
    snprintf(pages, sizeof(pages), "pages %u-%u/%u", progress.page + 1, progress.page + 2, progress.pageCount);
  } else {
    snprintf(pages, sizeof(pages), "page %u/%u", progress.page + 1, progress.pageCount);
  }
  snprintf(status, sizeof(status), "%s | %s (%u/%u) | %s | %u:%u:%u | %u%% chapter, %u%% book", book.title.c_str(),
           chapter.title.c_str(), progress.chapter + 1, progress.chapterCount, pages, pos.chapter, pos.paragraph,
           pos.word, progress.chapterPercent, progress.overallPercent);
  const size_t safe = utf8SafePrefix(status, strlen(status));
  status[safe] = '\0';
  printf("%s%s%s\n", ansi ? "\x1b[7m" : "", status, ansi ? "\x1b[0m" : "");
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    usage();
    return 1;
  }

  std::string configPath = "~/.config/folio/config.ini";
  std::string stateDir;
  std::string ops;
  int width = 80;
  int height = 24;
  bool save = true;

  int argIdx = 1;
  while (argIdx < argc && argv[argIdx][0] == '-') {
    if (strcmp(argv[argIdx], "--config") == 0 && argIdx + 1 < argc) {
      configPath = argv[argIdx + 1];
      argIdx += 2;
    } else if (strcmp(argv[argIdx], "--width") == 0 && argIdx + 1 < argc) {
      width = atoi(argv[argIdx + 1]);
      argIdx += 2;
    } else if (strcmp(argv[argIdx], "--height") == 0 && argIdx + 1 < argc) {
      height = atoi(argv[argIdx + 1]);
      argIdx += 2;
    } else if (strcmp(argv[argIdx], "--state-dir") == 0 && argIdx + 1 < argc) {
      stateDir = argv[argIdx + 1];
      argIdx += 2;
    } else if (strcmp(argv[argIdx], "--page-ops") == 0 && argIdx + 1 < argc) {
      ops = argv[argIdx + 1];
      argIdx += 2;
    } else if (strcmp(argv[argIdx], "--no-save") == 0) {
      save = false;
      argIdx++;
    } else {
      fprintf(stderr, "Unknown option: %s\n", argv[argIdx]);
      usage();
      return 1;
    }
  }

  if (argIdx >= argc) {
    usage();
    return 1;
  }
  if (width < 1 || width > UINT16_MAX || height < 1 || height > UINT16_MAX) {
    fprintf(stderr, "Width and height must be between 1 and %u\n", UINT16_MAX);
    return 1;
  }

  const std::string filepath = argv[argIdx];

  ReaderSettings settings;
  const auto loaded = settings.loadFromFile(configPath.c_str());
  if (!loaded.ok() && loaded.err != Error::NotFound) {
    fprintf(stderr, "Cannot read config %s: %s\n", configPath.c_str(), folio::errorToString(loaded.err));
    return 1;
  }
  if (!stateDir.empty()) {
    settings.stateDir = stateDir;
  }

  ReaderSession session(settings, static_cast<uint16_t>(width), static_cast<uint16_t>(height));
  const auto opened = session.open(filepath);
  if (!opened.ok()) {
    fprintf(stderr, "Failed to open %s: %s\n", filepath.c_str(), folio::errorToString(opened.err));
    return 1;
  }

  const auto& book = session.book();
  LOG_INF(TAG, "\"%s\" by %s, %zu chapters, id %s", book.title.c_str(), book.author.c_str(), book.chapters.size(),
          book.id.c_str());

  for (const char op : ops) {
    const auto moved = applyOp(session, op);
    if (moved.ok()) continue;
    if (moved.err == Error::Boundary) {
      fprintf(stderr, "'%c': already at the %s of the book\n", op, op == 'p' || op == 'P' ? "start" : "end");
    } else if (moved.err == Error::NotFound && op == 'b') {
      fprintf(stderr, "'b': no earlier position to return to\n");
    } else {
      fprintf(stderr, "'%c': %s\n", op, folio::errorToString(moved.err));
    }
  }

  printPage(session, isatty(STDOUT_FILENO) != 0);

  if (save) {
    const auto saved = session.save();
    if (!saved.ok()) {
      fprintf(stderr, "Could not save reading state: %s\n", folio::errorToString(saved.err));
      return 1;
    }
  }
  return 0;
}
