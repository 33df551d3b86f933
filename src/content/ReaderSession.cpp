#include "ReaderSession.h"

#include <Logging.h>

#include <ctime>
#include <utility>

#define TAG "SESSION"

namespace folio {

ReaderSession::ReaderSession(ReaderSettings settings, const uint16_t columns, const uint16_t rows)
    : settings_(std::move(settings)), store_(settings_.stateDir), columns_(columns), rows_(rows) {
  style_ = settings_.styleFor(columns_, doublePage());
}

bool ReaderSession::wantsDoublePage() const {
  return doublePageToggled_ ? doublePageOverride_ : settings_.doublePageFor(columns_);
}

bool ReaderSession::doublePage() const {
  return wantsDoublePage() && settings_.fitsDoublePage(columns_);
}

void ReaderSession::applyLayout() {
  const bool twoUp = doublePage();
  style_ = settings_.styleFor(columns_, twoUp);
  if (nav_) {
    nav_->setLayout(style_, settings_.viewportFor(rows_), twoUp ? 2 : 1);
  }
}

void ReaderSession::pushHistory(const ReadingPosition& position) {
  const size_t limit = settings_.historySize > 0 ? settings_.historySize : 1;
  while (state_.history.size() >= limit) {
    state_.history.erase(state_.history.begin());
  }
  state_.history.push_back(position);
}

Result<void> ReaderSession::open(const std::string& path) {
  nav_.reset();
  state_ = ReaderState();
  location_ = Location();

  auto result = provider_.open(path.c_str(), settings_.epubOptions());
  if (!result.ok()) {
    LOG_ERR(TAG, "Cannot open %s: %s", path.c_str(), provider_.errorDetail.c_str());
    return result;
  }

  const Book& book = provider_.book;
  nav_ = std::make_unique<ReaderNavigation>(book);
  applyLayout();

  auto saved = store_.load(book.id);
  if (saved.ok()) {
    state_ = ProgressManager::validate(book, saved.value);
  } else if (saved.err == Error::NotFound) {
    LOG_INF(TAG, "No saved position for %s, starting at the beginning", book.id.c_str());
  } else {
    LOG_WRN(TAG, "Reading state unavailable (%s), starting at the beginning", errorToString(saved.err));
  }
  state_.bookId = book.id;
  state_.title = book.title;

  auto landed = nav_->jumpTo(state_.position);
  if (!landed.ok()) {
    nav_.reset();
    return ErrVoid(landed.err);
  }
  location_ = landed.value;

  LOG_INF(TAG, "Opened \"%s\" at %u/%u/%u (page %u of chapter %u)", book.title.c_str(), state_.position.chapter,
          state_.position.paragraph, state_.position.word, location_.page + 1, location_.chapter + 1);
  return Ok();
}

Result<void> ReaderSession::resize(const uint16_t columns, const uint16_t rows) {
  columns_ = columns;
  rows_ = rows;
  applyLayout();
  if (!nav_) {
    return Ok();
  }

  auto landed = nav_->jumpTo(state_.position);
  if (!landed.ok()) {
    return ErrVoid(landed.err);
  }
  location_ = landed.value;
  LOG_DBG(TAG, "Resized to %ux%u, text width %u", columns_, rows_, style_.width);
  return Ok();
}

Result<void> ReaderSession::setSettings(const ReaderSettings& settings) {
  if (settings.stateDir != settings_.stateDir) {
    store_ = ProgressManager(settings.stateDir);
  }
  settings_ = settings;
  while (state_.history.size() > settings_.historySize) {
    state_.history.erase(state_.history.begin());
  }
  return resize(columns_, rows_);
}

Result<void> ReaderSession::toggleDoublePage() {
  doublePageOverride_ = !doublePage();
  doublePageToggled_ = true;
  if (doublePageOverride_ && !settings_.fitsDoublePage(columns_)) {
    LOG_INF(TAG, "Double page on, but %u columns only fit one page", columns_);
  }
  return resize(columns_, rows_);
}

Result<Location> ReaderSession::turnTo(const Result<Location>& target, const bool isJump) {
  if (!target.ok()) {
    if (target.err == Error::Boundary) {
      LOG_DBG(TAG, "Already at the %s of the book", location_.chapter == 0 && location_.page == 0 ? "start" : "end");
    }
    return target;
  }

  const ReadingPosition previous = state_.position;
  location_ = target.value;
  state_.position = nav_->positionAt(location_);
  if (isJump) {
    pushHistory(previous);
  }
  return target;
}

Result<Location> ReaderSession::nextPage() {
  if (!nav_) return Err<Location>(Error::InvalidArgument);
  return turnTo(nav_->nextPage(location_), false);
}

Result<Location> ReaderSession::prevPage() {
  if (!nav_) return Err<Location>(Error::InvalidArgument);
  return turnTo(nav_->prevPage(location_), false);
}

Result<Location> ReaderSession::nextChapter() {
  if (!nav_) return Err<Location>(Error::InvalidArgument);
  return turnTo(nav_->nextChapter(location_), true);
}

Result<Location> ReaderSession::prevChapter() {
  if (!nav_) return Err<Location>(Error::InvalidArgument);
  return turnTo(nav_->prevChapter(location_), true);
}

Result<Location> ReaderSession::goToStart() {
  if (!nav_) return Err<Location>(Error::InvalidArgument);
  return turnTo(nav_->first(), true);
}

Result<Location> ReaderSession::goToEnd() {
  if (!nav_) return Err<Location>(Error::InvalidArgument);
  return turnTo(nav_->last(), true);
}

Result<Location> ReaderSession::jumpTo(const ReadingPosition& position) {
  if (!nav_) return Err<Location>(Error::InvalidArgument);

  ReadingPosition landed;
  auto target = nav_->jumpTo(position, &landed);
  if (!target.ok()) {
    return target;
  }

  pushHistory(state_.position);
  location_ = target.value;
  state_.position = landed;
  return target;
}

Result<Location> ReaderSession::back() {
  if (!nav_) return Err<Location>(Error::InvalidArgument);
  if (state_.history.empty()) {
    return Err<Location>(Error::NotFound);
  }

  const ReadingPosition previous = state_.history.back();
  ReadingPosition landed;
  auto target = nav_->jumpTo(previous, &landed);
  if (!target.ok()) {
    return target;
  }

  state_.history.pop_back();
  location_ = target.value;
  state_.position = landed;
  return target;
}

Result<const Page*> ReaderSession::currentPage() {
  if (!nav_) return Err<const Page*>(Error::InvalidArgument);
  return Ok(&nav_->page(location_));
}

Result<Spread> ReaderSession::currentSpread() {
  if (!nav_) return Err<Spread>(Error::InvalidArgument);
  return Ok(nav_->spread(location_));
}

ReadingProgress ReaderSession::progress() {
  ReadingProgress p;
  if (!nav_) {
    return p;
  }

  p.chapter = location_.chapter;
  p.chapterCount = nav_->chapterCount();
  p.page = location_.page;
  p.pageCount = nav_->pageCount(location_.chapter);
  p.pagesPerView = nav_->pagesPerView();
  if (p.pageCount > 0) {
    p.chapterPercent = static_cast<uint8_t>(p.page * 100 / p.pageCount);
  }
  if (p.chapterCount > 0) {
    p.overallPercent = static_cast<uint8_t>((p.chapter * 100u + p.chapterPercent) / p.chapterCount);
  }
  return p;
}

Result<void> ReaderSession::save() {
  if (!nav_) return ErrVoid(Error::InvalidArgument);

  state_.lastOpened = static_cast<uint64_t>(time(nullptr));
  auto result = store_.save(state_);
  if (!result.ok()) {
    LOG_ERR(TAG, "Failed to save reading state: %s", errorToString(result.err));
  }
  return result;
}

}  // namespace folio
