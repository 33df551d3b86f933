#include "EpubProvider.h"

#include <Logging.h>

#define TAG "EPUB"

namespace folio {

Error EpubProvider::mapError(const epub::EpubError err) {
  switch (epub::errorClass(err)) {
    case epub::EpubErrorClass::None:
      return Error::Ok;
    case epub::EpubErrorClass::Archive:
      return Error::Archive;
    case epub::EpubErrorClass::Manifest:
      return Error::Manifest;
    case epub::EpubErrorClass::Spine:
      return Error::Spine;
  }
  return Error::Archive;
}

Result<void> EpubProvider::open(const char* path, const EpubOptions& options) {
  close();

  Epub epub(path);
  const epub::EpubError err = epub.load(options);
  if (err != epub::EpubError::OK) {
    errorDetail = std::string(epub::errorToString(err)) + ": " + epub.errorDetail();
    return ErrVoid(mapError(err));
  }

  book = epub.takeBook();
  loaded = true;

  size_t placeholders = 0;
  for (const auto& ch : book.chapters) {
    if (ch.placeholder) placeholders++;
  }
  if (placeholders > 0) {
    LOG_WRN(TAG, "%zu of %zu chapters could not be displayed", placeholders, book.chapters.size());
  }
  return Ok();
}

void EpubProvider::close() {
  book = Book();
  errorDetail.clear();
  loaded = false;
}

Result<const Chapter*> EpubProvider::chapter(const uint16_t index) const {
  if (!loaded || index >= book.chapters.size()) {
    return Err<const Chapter*>(Error::InvalidArgument);
  }
  return Ok(&book.chapters[index]);
}

}  // namespace folio
