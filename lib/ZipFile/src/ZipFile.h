#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <unordered_map>
#include <utility>

constexpr uint64_t FNV_OFFSET_BASIS_64 = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME_64 = 1099511628211ULL;

// FNV-1a, chainable: feed the previous result back in as `hash` to hash a stream in chunks
inline uint64_t fnvHash64(const void* data, const size_t len, uint64_t hash = FNV_OFFSET_BASIS_64) {
  const auto* bytes = static_cast<const uint8_t*>(data);
  for (size_t i = 0; i < len; i++) {
    hash ^= bytes[i];
    hash *= FNV_PRIME_64;
  }
  return hash;
}

class ZipFile {
 public:
  struct FileStatSlim {
    uint16_t method;             // Compression method
    uint32_t compressedSize;     // Compressed size
    uint32_t uncompressedSize;   // Uncompressed size
    uint32_t localHeaderOffset;  // Offset of local file header
  };

  struct ZipDetails {
    uint32_t centralDirOffset;
    uint32_t fileSize;
    uint16_t totalEntries;
    bool isSet;
  };

  // Largest entry readFileToString will inflate into memory
  static constexpr uint32_t MAX_ENTRY_SIZE = 64 * 1024 * 1024;

 private:
  std::string filePath;
  FILE* file = nullptr;
  ZipDetails zipDetails = {0, 0, 0, false};
  std::unordered_map<std::string, FileStatSlim> fileStatSlimCache;

  bool loadFileStatSlim(const char* filename, FileStatSlim* fileStat);
  long getDataOffset(const FileStatSlim& fileStat);
  bool checkEntryBounds(const char* filename, const FileStatSlim& fileStat, long dataOffset) const;
  bool loadZipDetails();

 public:
  explicit ZipFile(std::string filePath) : filePath(std::move(filePath)) {}
  ~ZipFile() { close(); }

  ZipFile(const ZipFile&) = delete;
  ZipFile& operator=(const ZipFile&) = delete;

  const std::string& path() const { return filePath; }

  bool isOpen() const { return file != nullptr; }
  bool open();
  bool close();

  // True when the end-of-central-directory record can be located
  bool isValid() { return loadZipDetails(); }

  // Index the whole central directory so later lookups skip the scan
  bool loadAllFileStatSlims();
  uint16_t getTotalEntries();
  bool exists(const char* filename);
  bool getInflatedFileSize(const char* filename, size_t* size);

  // Reads (and inflates) an entry. Opens and closes the archive if it was not already open.
  // Entries whose data runs past the end of the file or that exceed MAX_ENTRY_SIZE are refused.
  bool readFileToString(const char* filename, std::string& out);
};
