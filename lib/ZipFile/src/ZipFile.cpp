#include "ZipFile.h"

#include <Logging.h>
#include <miniz.h>

#include <cstdlib>
#include <cstring>
#include <vector>

#define TAG "ZIP"

namespace {
constexpr uint32_t CENTRAL_DIR_HEADER_SIG = 0x02014b50;
constexpr uint32_t LOCAL_DIR_HEADER_SIG = 0x04034b50;
constexpr size_t CENTRAL_DIR_HEADER_SIZE = 46;
constexpr size_t LOCAL_DIR_HEADER_SIZE = 30;
constexpr size_t EOCD_SIZE = 22;

uint16_t readLE16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }

uint32_t readLE32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

bool inflateOneShot(const uint8_t* inputBuf, const size_t deflatedSize, uint8_t* outputBuf, const size_t inflatedSize) {
  const auto inflator = static_cast<tinfl_decompressor*>(malloc(sizeof(tinfl_decompressor)));
  if (!inflator) {
    LOG_ERR(TAG, "Failed to allocate memory for inflator");
    return false;
  }
  memset(inflator, 0, sizeof(tinfl_decompressor));
  tinfl_init(inflator);

  size_t inBytes = deflatedSize;
  size_t outBytes = inflatedSize;
  const tinfl_status status = tinfl_decompress(inflator, inputBuf, &inBytes, outputBuf, outputBuf, &outBytes,
                                               TINFL_FLAG_USING_NON_WRAPPING_OUTPUT_BUF);
  free(inflator);

  if (status != TINFL_STATUS_DONE) {
    LOG_ERR(TAG, "tinfl_decompress() failed with status %d", static_cast<int>(status));
    return false;
  }
  if (outBytes != inflatedSize) {
    LOG_ERR(TAG, "Inflated size mismatch, expected %zu got %zu", inflatedSize, outBytes);
    return false;
  }

  return true;
}
}  // namespace

bool ZipFile::open() {
  if (file) {
    return true;
  }
  file = fopen(filePath.c_str(), "rb");
  if (!file) {
    LOG_ERR(TAG, "Couldn't open %s", filePath.c_str());
    return false;
  }
  return true;
}

bool ZipFile::close() {
  if (file) {
    fclose(file);
    file = nullptr;
  }
  return true;
}

bool ZipFile::loadZipDetails() {
  if (zipDetails.isSet) {
    return true;
  }

  const bool wasOpen = isOpen();
  if (!wasOpen && !open()) {
    return false;
  }

  fseek(file, 0, SEEK_END);
  const long fileSize = ftell(file);
  if (fileSize < static_cast<long>(EOCD_SIZE)) {
    LOG_ERR(TAG, "File too small to be a valid zip");
    if (!wasOpen) {
      close();
    }
    return false;
  }

  // Scan the tail for the EOCD signature. The record is followed by a comment of up to 64KB.
  const long scanRange = fileSize > 65557 ? 65557 : fileSize;
  std::vector<uint8_t> buffer(static_cast<size_t>(scanRange));

  fseek(file, fileSize - scanRange, SEEK_SET);
  if (fread(buffer.data(), 1, buffer.size(), file) != buffer.size()) {
    LOG_ERR(TAG, "Couldn't read EOCD scan range");
    if (!wasOpen) {
      close();
    }
    return false;
  }

  long foundOffset = -1;
  for (long i = scanRange - static_cast<long>(EOCD_SIZE); i >= 0; i--) {
    constexpr uint8_t signature[4] = {0x50, 0x4b, 0x05, 0x06};  // Little-endian EOCD signature
    if (memcmp(&buffer[i], signature, 4) == 0) {
      foundOffset = i;
      break;
    }
  }

  if (!wasOpen) {
    close();
  }

  if (foundOffset == -1) {
    LOG_ERR(TAG, "EOCD signature not found in %s", filePath.c_str());
    return false;
  }

  // Offset 10: total number of entries, offset 16: start of central directory
  zipDetails.totalEntries = readLE16(&buffer[foundOffset + 10]);
  zipDetails.centralDirOffset = readLE32(&buffer[foundOffset + 16]);
  zipDetails.fileSize = static_cast<uint32_t>(fileSize);
  if (zipDetails.centralDirOffset >= static_cast<uint32_t>(fileSize)) {
    LOG_ERR(TAG, "Central directory offset out of range");
    return false;
  }
  zipDetails.isSet = true;
  return true;
}

uint16_t ZipFile::getTotalEntries() {
  if (!loadZipDetails()) {
    return 0;
  }
  return zipDetails.totalEntries;
}

bool ZipFile::loadAllFileStatSlims() {
  const bool wasOpen = isOpen();
  if (!wasOpen && !open()) {
    return false;
  }

  if (!loadZipDetails()) {
    if (!wasOpen) {
      close();
    }
    return false;
  }

  fseek(file, zipDetails.centralDirOffset, SEEK_SET);

  uint8_t header[CENTRAL_DIR_HEADER_SIZE];
  std::string itemName;
  fileStatSlimCache.clear();
  fileStatSlimCache.reserve(zipDetails.totalEntries);

  bool ok = true;
  while (fread(header, 1, sizeof(header), file) == sizeof(header)) {
    if (readLE32(header) != CENTRAL_DIR_HEADER_SIG) break;  // End of list

    FileStatSlim fileStat = {};
    fileStat.method = readLE16(header + 10);
    fileStat.compressedSize = readLE32(header + 20);
    fileStat.uncompressedSize = readLE32(header + 24);
    const uint16_t nameLen = readLE16(header + 28);
    const uint16_t extraLen = readLE16(header + 30);
    const uint16_t commentLen = readLE16(header + 32);
    fileStat.localHeaderOffset = readLE32(header + 42);

    itemName.resize(nameLen);
    if (nameLen > 0 && fread(&itemName[0], 1, nameLen, file) != nameLen) {
      LOG_ERR(TAG, "Truncated central directory entry");
      ok = false;
      break;
    }

    fileStatSlimCache.emplace(itemName, fileStat);

    // Skip the rest of this entry (extra field + comment)
    fseek(file, extraLen + commentLen, SEEK_CUR);
  }

  if (!wasOpen) {
    close();
  }

  if (ok && fileStatSlimCache.empty() && zipDetails.totalEntries > 0) {
    LOG_ERR(TAG, "Central directory is unreadable");
    return false;
  }
  return ok;
}

bool ZipFile::loadFileStatSlim(const char* filename, FileStatSlim* fileStat) {
  if (fileStatSlimCache.empty() && !loadAllFileStatSlims()) {
    return false;
  }

  const auto it = fileStatSlimCache.find(filename);
  if (it == fileStatSlimCache.end()) {
    return false;
  }
  *fileStat = it->second;
  return true;
}

bool ZipFile::exists(const char* filename) {
  FileStatSlim fileStat = {};
  return loadFileStatSlim(filename, &fileStat);
}

long ZipFile::getDataOffset(const FileStatSlim& fileStat) {
  const bool wasOpen = isOpen();
  if (!wasOpen && !open()) {
    return -1;
  }

  uint8_t pLocalHeader[LOCAL_DIR_HEADER_SIZE];
  fseek(file, fileStat.localHeaderOffset, SEEK_SET);
  const size_t read = fread(pLocalHeader, 1, LOCAL_DIR_HEADER_SIZE, file);
  if (!wasOpen) {
    close();
  }

  if (read != LOCAL_DIR_HEADER_SIZE) {
    LOG_ERR(TAG, "Something went wrong reading the local header");
    return -1;
  }

  if (readLE32(pLocalHeader) != LOCAL_DIR_HEADER_SIG) {
    LOG_ERR(TAG, "Not a valid zip file header");
    return -1;
  }

  const uint16_t filenameLength = readLE16(pLocalHeader + 26);
  const uint16_t extraOffset = readLE16(pLocalHeader + 28);
  return static_cast<long>(fileStat.localHeaderOffset) + LOCAL_DIR_HEADER_SIZE + filenameLength + extraOffset;
}

bool ZipFile::checkEntryBounds(const char* filename, const FileStatSlim& fileStat, const long dataOffset) const {
  const uint64_t dataEnd = static_cast<uint64_t>(dataOffset) + fileStat.compressedSize;
  if (dataEnd > zipDetails.fileSize) {
    LOG_ERR(TAG, "Entry %s runs past the end of the archive (%llu > %u)", filename,
            static_cast<unsigned long long>(dataEnd), zipDetails.fileSize);
    return false;
  }
  if (fileStat.uncompressedSize > MAX_ENTRY_SIZE) {
    LOG_ERR(TAG, "Entry %s declares %u bytes, limit is %u", filename, fileStat.uncompressedSize, MAX_ENTRY_SIZE);
    return false;
  }
  if (fileStat.method == 0 && fileStat.compressedSize != fileStat.uncompressedSize) {
    LOG_ERR(TAG, "Stored entry %s has mismatched sizes %u/%u", filename, fileStat.compressedSize,
            fileStat.uncompressedSize);
    return false;
  }
  return true;
}

bool ZipFile::getInflatedFileSize(const char* filename, size_t* size) {
  FileStatSlim fileStat = {};
  if (!loadFileStatSlim(filename, &fileStat)) {
    return false;
  }

  *size = static_cast<size_t>(fileStat.uncompressedSize);
  return true;
}

bool ZipFile::readFileToString(const char* filename, std::string& out) {
  FileStatSlim fileStat = {};
  if (!loadFileStatSlim(filename, &fileStat)) {
    LOG_DBG(TAG, "Entry not found: %s", filename);
    return false;
  }

  const bool wasOpen = isOpen();
  if (!wasOpen && !open()) {
    return false;
  }

  const long fileOffset = getDataOffset(fileStat);
  if (fileOffset < 0 || !checkEntryBounds(filename, fileStat, fileOffset)) {
    if (!wasOpen) {
      close();
    }
    return false;
  }

  fseek(file, fileOffset, SEEK_SET);

  const auto deflatedDataSize = fileStat.compressedSize;
  const auto inflatedDataSize = fileStat.uncompressedSize;
  out.assign(inflatedDataSize, '\0');

  if (fileStat.method == 0) {  // MZ_NO_COMPRESSION = 0
    const size_t dataRead = inflatedDataSize > 0 ? fread(&out[0], 1, inflatedDataSize, file) : 0;
    if (!wasOpen) {
      close();
    }

    if (dataRead != inflatedDataSize) {
      LOG_ERR(TAG, "Failed to read data for %s", filename);
      out.clear();
      return false;
    }
    return true;
  }

  if (fileStat.method == MZ_DEFLATED) {
    std::vector<uint8_t> deflatedData(deflatedDataSize);
    const size_t dataRead = fread(deflatedData.data(), 1, deflatedDataSize, file);
    if (!wasOpen) {
      close();
    }

    if (dataRead != deflatedDataSize) {
      LOG_ERR(TAG, "Failed to read data, expected %u got %zu", deflatedDataSize, dataRead);
      out.clear();
      return false;
    }

    if (inflatedDataSize == 0) {
      return true;
    }

    if (!inflateOneShot(deflatedData.data(), deflatedDataSize, reinterpret_cast<uint8_t*>(&out[0]),
                        inflatedDataSize)) {
      LOG_ERR(TAG, "Failed to inflate %s", filename);
      out.clear();
      return false;
    }
    return true;
  }

  LOG_ERR(TAG, "Unsupported compression method %u for %s", fileStat.method, filename);
  if (!wasOpen) {
    close();
  }
  out.clear();
  return false;
}
