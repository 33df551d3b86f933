#include "FsHelpers.h"

#include <Logging.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <vector>

#define TAG "FS"

std::string FsHelpers::normalisePath(const std::string& path) {
  std::vector<std::string> components;
  std::string component;

  const auto pushComponent = [&components](const std::string& c) {
    if (c == ".") return;
    if (c == "..") {
      if (!components.empty()) {
        components.pop_back();
      }
      return;
    }
    components.push_back(c);
  };

  for (const auto c : path) {
    if (c == '/') {
      if (!component.empty()) {
        pushComponent(component);
        component.clear();
      }
    } else {
      component += c;
    }
  }

  if (!component.empty()) {
    pushComponent(component);
  }

  std::string result;
  for (const auto& c : components) {
    if (!result.empty()) {
      result += "/";
    }
    result += c;
  }

  return result;
}

std::string FsHelpers::parentDir(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) {
    return "";
  }
  return path.substr(0, slash + 1);
}

std::string FsHelpers::expandHome(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  const char* home = getenv("HOME");
  if (!home || !*home) {
    return path;
  }
  return std::string(home) + path.substr(1);
}

bool FsHelpers::exists(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0;
}

bool FsHelpers::ensureDirectory(const std::string& path) {
  if (path.empty()) {
    return false;
  }

  std::string partial;
  partial.reserve(path.size());
  for (size_t i = 0; i < path.size(); i++) {
    partial += path[i];
    if (path[i] != '/' && i + 1 != path.size()) {
      continue;
    }
    if (partial == "/") {
      continue;
    }
    if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      LOG_ERR(TAG, "Couldn't create directory %s: %s", partial.c_str(), strerror(errno));
      return false;
    }
  }

  struct stat st {};
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool FsHelpers::readFile(const std::string& path, std::string& out) {
  FILE* file = fopen(path.c_str(), "rb");
  if (!file) {
    return false;
  }

  out.clear();
  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), file)) > 0) {
    out.append(buf, n);
  }
  const bool failed = ferror(file) != 0;
  fclose(file);

  if (failed) {
    LOG_ERR(TAG, "Read error on %s", path.c_str());
    return false;
  }
  return true;
}

bool FsHelpers::writeFileAtomic(const std::string& path, const std::string& content) {
  const std::string tmpPath = path + ".tmp";

  FILE* file = fopen(tmpPath.c_str(), "wb");
  if (!file) {
    LOG_ERR(TAG, "Couldn't open %s for writing: %s", tmpPath.c_str(), strerror(errno));
    return false;
  }

  const size_t written = fwrite(content.data(), 1, content.size(), file);
  const bool flushed = fflush(file) == 0;
  const bool closed = fclose(file) == 0;
  if (written != content.size() || !flushed || !closed) {
    LOG_ERR(TAG, "Short write to %s", tmpPath.c_str());
    remove(tmpPath.c_str());
    return false;
  }

  if (rename(tmpPath.c_str(), path.c_str()) != 0) {
    LOG_ERR(TAG, "Couldn't rename %s: %s", tmpPath.c_str(), strerror(errno));
    remove(tmpPath.c_str());
    return false;
  }
  return true;
}
