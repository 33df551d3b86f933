#pragma once
#include <strings.h>

#include <cstring>
#include <string>

class FsHelpers {
 public:
  // Collapse "//", "." and ".." components. Leading slash is dropped, as in archive entry names.
  static std::string normalisePath(const std::string& path);

  // Directory part of a path including the trailing slash, or "" when there is none
  static std::string parentDir(const std::string& path);

  // Replace a leading "~" with $HOME
  static std::string expandHome(const std::string& path);

  // Case-insensitive extension check. Extension must include dot (e.g., ".epub").
  static inline bool hasExtension(const char* path, const char* ext) {
    if (!path || !ext) return false;
    const char* pathExt = strrchr(path, '.');
    if (!pathExt) return false;
    return strcasecmp(pathExt, ext) == 0;
  }

  static inline bool hasExtension(const std::string& path, const char* ext) { return hasExtension(path.c_str(), ext); }

  static inline bool isEpubFile(const char* path) { return hasExtension(path, ".epub"); }
  static inline bool isEpubFile(const std::string& path) { return isEpubFile(path.c_str()); }

  static bool exists(const std::string& path);

  // mkdir -p
  static bool ensureDirectory(const std::string& path);

  static bool readFile(const std::string& path, std::string& out);

  // Write to "<path>.tmp" then rename over path, so readers never see a half-written file
  static bool writeFileAtomic(const std::string& path, const std::string& content);
};
