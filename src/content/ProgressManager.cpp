#include "ProgressManager.h"

#include <ArduinoJson.h>
#include <FsHelpers.h>
#include <Logging.h>

#include <cstdint>
#include <utility>

#define TAG "PROGRESS"

namespace folio {

namespace {

// Missing counts as 0; anything but a non-negative integer up to maxValue is invalid
bool readIndex(const JsonVariantConst value, const uint32_t maxValue, uint32_t& out) {
  if (value.isNull()) {
    out = 0;
    return true;
  }
  if (!value.is<uint32_t>()) {
    return false;
  }
  out = value.as<uint32_t>();
  return out <= maxValue;
}

bool readPosition(const JsonVariantConst chapter, const JsonVariantConst paragraph, const JsonVariantConst word,
                  ReadingPosition& out) {
  uint32_t c = 0;
  uint32_t p = 0;
  uint32_t w = 0;
  if (!readIndex(chapter, UINT16_MAX, c) || !readIndex(paragraph, UINT32_MAX, p) || !readIndex(word, UINT32_MAX, w)) {
    return false;
  }
  out = ReadingPosition(static_cast<uint16_t>(c), p, w);
  return true;
}

ReadingPosition clampPosition(const Book& book, const ReadingPosition& position, bool& changed) {
  ReadingPosition clamped = position;
  if (book.chapters.empty()) {
    changed = changed || position != ReadingPosition();
    return ReadingPosition();
  }

  if (clamped.chapter >= book.chapters.size()) {
    clamped = ReadingPosition(static_cast<uint16_t>(book.chapters.size() - 1), 0, 0);
  }

  const auto& paragraphs = book.chapters[clamped.chapter].paragraphs;
  if (paragraphs.empty()) {
    clamped.paragraph = 0;
    clamped.word = 0;
  } else {
    if (clamped.paragraph >= paragraphs.size()) {
      clamped.paragraph = static_cast<uint32_t>(paragraphs.size() - 1);
      clamped.word = 0;
    }
    const auto& words = paragraphs[clamped.paragraph].words;
    if (clamped.word >= words.size() && clamped.word > 0) {
      clamped.word = words.empty() ? 0 : static_cast<uint32_t>(words.size() - 1);
    }
  }

  changed = changed || clamped != position;
  return clamped;
}

}  // namespace

ProgressManager::ProgressManager(std::string stateDir) : stateDir_(FsHelpers::expandHome(stateDir)) {}

std::string ProgressManager::filePath() const {
  if (stateDir_.empty() || stateDir_.back() == '/') {
    return stateDir_ + FILE_NAME;
  }
  return stateDir_ + "/" + FILE_NAME;
}

Result<ReaderState> ProgressManager::load(const std::string& bookId) const {
  const std::string path = filePath();
  if (!FsHelpers::exists(path)) {
    LOG_DBG(TAG, "No saved progress at %s", path.c_str());
    return Err<ReaderState>(Error::NotFound);
  }

  std::string content;
  if (!FsHelpers::readFile(path, content)) {
    LOG_ERR(TAG, "Cannot read %s", path.c_str());
    return Err<ReaderState>(Error::State);
  }

  ReaderState state;
  state.bookId = bookId;

  JsonDocument doc;
  const DeserializationError err = deserializeJson(doc, content);
  if (err) {
    LOG_WRN(TAG, "%s is corrupt (%s), starting from the beginning", path.c_str(), err.c_str());
    return Ok(std::move(state));
  }

  const JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    LOG_WRN(TAG, "%s is not a JSON object, starting from the beginning", path.c_str());
    return Ok(std::move(state));
  }

  const JsonVariantConst books = root["books"];
  if (books.isNull()) {
    return Err<ReaderState>(Error::NotFound);
  }
  if (!books.is<JsonObjectConst>()) {
    LOG_WRN(TAG, "%s: \"books\" is not an object, starting from the beginning", path.c_str());
    return Ok(std::move(state));
  }

  const JsonVariantConst entry = books[bookId];
  if (entry.isNull()) {
    LOG_DBG(TAG, "No entry for %s", bookId.c_str());
    return Err<ReaderState>(Error::NotFound);
  }
  if (!entry.is<JsonObjectConst>()) {
    LOG_WRN(TAG, "Entry for %s is not an object, starting from the beginning", bookId.c_str());
    return Ok(std::move(state));
  }

  if (!readPosition(entry["chapter"], entry["paragraph"], entry["word"], state.position)) {
    LOG_WRN(TAG, "Entry for %s has an invalid position, starting from the beginning", bookId.c_str());
    state.position = ReadingPosition();
    return Ok(std::move(state));
  }

  if (entry["title"].is<const char*>()) {
    state.title = entry["title"].as<const char*>();
  }
  if (entry["last_opened"].is<uint64_t>()) {
    state.lastOpened = entry["last_opened"].as<uint64_t>();
  }

  const JsonVariantConst history = entry["history"];
  if (history.is<JsonArrayConst>()) {
    for (const JsonVariantConst item : history.as<JsonArrayConst>()) {
      ReadingPosition pos;
      if (!item.is<JsonArrayConst>() || item.size() != 3 || !readPosition(item[0], item[1], item[2], pos)) {
        LOG_WRN(TAG, "Dropping invalid history item for %s", bookId.c_str());
        continue;
      }
      state.history.push_back(pos);
    }
  }

  LOG_DBG(TAG, "Loaded %s: %u/%u/%u, %zu history entries", bookId.c_str(), state.position.chapter,
          state.position.paragraph, state.position.word, state.history.size());
  return Ok(std::move(state));
}

Result<void> ProgressManager::save(const ReaderState& state) const {
  if (state.bookId.empty()) {
    return ErrVoid(Error::InvalidArgument);
  }
  if (!FsHelpers::ensureDirectory(stateDir_)) {
    LOG_ERR(TAG, "Cannot create %s", stateDir_.c_str());
    return ErrVoid(Error::State);
  }

  const std::string path = filePath();
  JsonDocument doc;

  // Read-modify-write so other books and unknown fields are kept
  if (FsHelpers::exists(path)) {
    std::string existing;
    if (!FsHelpers::readFile(path, existing)) {
      LOG_ERR(TAG, "Cannot read %s", path.c_str());
      return ErrVoid(Error::State);
    }
    const DeserializationError err = deserializeJson(doc, existing);
    if (err || !doc.is<JsonObject>()) {
      LOG_WRN(TAG, "Replacing corrupt %s", path.c_str());
      doc.clear();
    }
  }

  doc["version"] = FORMAT_VERSION;
  JsonObject books = doc["books"].is<JsonObject>() ? doc["books"].as<JsonObject>() : doc["books"].to<JsonObject>();
  JsonObject entry = books[state.bookId].is<JsonObject>() ? books[state.bookId].as<JsonObject>()
                                                          : books[state.bookId].to<JsonObject>();

  entry["chapter"] = state.position.chapter;
  entry["paragraph"] = state.position.paragraph;
  entry["word"] = state.position.word;
  entry["last_opened"] = state.lastOpened;
  entry["title"] = state.title;

  JsonArray history = entry["history"].to<JsonArray>();
  for (const auto& pos : state.history) {
    JsonArray item = history.add<JsonArray>();
    item.add(pos.chapter);
    item.add(pos.paragraph);
    item.add(pos.word);
  }

  if (doc.overflowed()) {
    LOG_ERR(TAG, "Out of memory building %s", path.c_str());
    return ErrVoid(Error::State);
  }

  std::string output;
  serializeJson(doc, output);
  if (!FsHelpers::writeFileAtomic(path, output)) {
    LOG_ERR(TAG, "Failed to write %s", path.c_str());
    return ErrVoid(Error::State);
  }

  LOG_DBG(TAG, "Saved %s: %u/%u/%u", state.bookId.c_str(), state.position.chapter, state.position.paragraph,
          state.position.word);
  return Ok();
}

ReaderState ProgressManager::validate(const Book& book, const ReaderState& state) {
  ReaderState validated = state;
  bool changed = false;

  validated.position = clampPosition(book, state.position, changed);
  if (changed) {
    LOG_WRN(TAG, "Saved position %u/%u/%u out of range, using %u/%u/%u", state.position.chapter,
            state.position.paragraph, state.position.word, validated.position.chapter, validated.position.paragraph,
            validated.position.word);
  }

  bool historyChanged = false;
  for (auto& pos : validated.history) {
    pos = clampPosition(book, pos, historyChanged);
  }
  if (historyChanged) {
    LOG_WRN(TAG, "History entries out of range were clamped");
  }

  return validated;
}

}  // namespace folio
