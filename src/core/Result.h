#pragma once

#include <cstdint>
#include <utility>

namespace folio {

enum class Error : uint8_t {
  Ok = 0,
  Archive,          // container unreadable, not a zip, or parse timed out
  Manifest,         // container.xml / package document missing or malformed
  Spine,            // reading order empty or referencing unknown items
  Content,          // one chapter's markup could not be extracted
  Boundary,         // navigation past the first or last page
  State,            // reading state storage failure
  NotFound,
  InvalidArgument,
  Timeout,
  IOError,
};

inline const char* errorToString(Error err) {
  switch (err) {
    case Error::Ok:
      return "OK";
    case Error::Archive:
      return "Archive error";
    case Error::Manifest:
      return "Manifest error";
    case Error::Spine:
      return "Spine error";
    case Error::Content:
      return "Content error";
    case Error::Boundary:
      return "At book boundary";
    case Error::State:
      return "State storage error";
    case Error::NotFound:
      return "Not found";
    case Error::InvalidArgument:
      return "Invalid argument";
    case Error::Timeout:
      return "Timeout";
    case Error::IOError:
      return "I/O error";
  }
  return "Unknown error";
}

template <typename T>
struct Result {
  T value{};
  Error err = Error::Ok;

  bool ok() const { return err == Error::Ok; }
  explicit operator bool() const { return ok(); }
};

template <>
struct Result<void> {
  Error err = Error::Ok;

  bool ok() const { return err == Error::Ok; }
  explicit operator bool() const { return ok(); }
};

inline Result<void> Ok() { return Result<void>{}; }

template <typename T>
Result<T> Ok(T value) {
  Result<T> r;
  r.value = std::move(value);
  return r;
}

template <typename T>
Result<T> Err(Error err) {
  Result<T> r;
  r.err = err;
  return r;
}

inline Result<void> ErrVoid(Error err) {
  Result<void> r;
  r.err = err;
  return r;
}

}  // namespace folio
