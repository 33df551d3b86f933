#pragma once

#include <cstdint>

namespace epub {

enum class EpubError {
  OK = 0,
  FILE_NOT_FOUND,
  NOT_A_ZIP,
  READ_ERROR,
  TIMEOUT,
  CONTAINER_MISSING,
  CONTAINER_INVALID,
  PACKAGE_MISSING,
  PACKAGE_INVALID,
  MANIFEST_MISSING,
  SPINE_EMPTY,
  SPINE_UNRESOLVED,
  SPINE_TOO_LARGE,
};

// Which of the three fatal classes an error belongs to
enum class EpubErrorClass { None, Archive, Manifest, Spine };

inline EpubErrorClass errorClass(EpubError err) {
  switch (err) {
    case EpubError::OK:
      return EpubErrorClass::None;
    case EpubError::FILE_NOT_FOUND:
    case EpubError::NOT_A_ZIP:
    case EpubError::READ_ERROR:
    case EpubError::TIMEOUT:
      return EpubErrorClass::Archive;
    case EpubError::CONTAINER_MISSING:
    case EpubError::CONTAINER_INVALID:
    case EpubError::PACKAGE_MISSING:
    case EpubError::PACKAGE_INVALID:
    case EpubError::MANIFEST_MISSING:
      return EpubErrorClass::Manifest;
    case EpubError::SPINE_EMPTY:
    case EpubError::SPINE_UNRESOLVED:
    case EpubError::SPINE_TOO_LARGE:
      return EpubErrorClass::Spine;
  }
  return EpubErrorClass::Archive;
}

inline const char* errorToString(EpubError err) {
  switch (err) {
    case EpubError::OK:
      return "OK";
    case EpubError::FILE_NOT_FOUND:
      return "File not found";
    case EpubError::NOT_A_ZIP:
      return "Not a zip container";
    case EpubError::READ_ERROR:
      return "Read error";
    case EpubError::TIMEOUT:
      return "Parse timeout";
    case EpubError::CONTAINER_MISSING:
      return "META-INF/container.xml missing";
    case EpubError::CONTAINER_INVALID:
      return "Invalid container.xml";
    case EpubError::PACKAGE_MISSING:
      return "Package document missing";
    case EpubError::PACKAGE_INVALID:
      return "Invalid package document";
    case EpubError::MANIFEST_MISSING:
      return "Package has no manifest";
    case EpubError::SPINE_EMPTY:
      return "Spine is empty";
    case EpubError::SPINE_UNRESOLVED:
      return "Spine references unknown item";
    case EpubError::SPINE_TOO_LARGE:
      return "Spine has too many items";
    default:
      return "Unknown error";
  }
}

}  // namespace epub

struct EpubOptions {
  uint32_t parseTimeoutMs = 0;     // 0 = unbounded
  bool preserveLineBreaks = true;  // <br> between blocks becomes a blank separator
};
