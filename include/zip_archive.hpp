#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace xfer {

struct ZipEntryInfo {
  std::string name;
  uint16_t method = 0; // 0 stored, 8 deflated
  uint32_t crc32 = 0;
  uint64_t compressedSize = 0;
  uint64_t uncompressedSize = 0;
  uint64_t localHeaderOffset = 0;
};

/**
 * Streaming ZIP writer (deflate via zlib, sizes in trailing data
 * descriptors). Entries are written one at a time; the central directory is
 * emitted by close(). A writer destroyed before close() leaves an unreadable
 * file behind, which the caller is expected to remove.
 *
 * Zip64 records are written only where a size, offset or the entry count
 * overflows the classic fields, so small archives stay plain zip.
 *
 * All failures throw SystemException(ARCHIVE_ERROR or FILE_ERROR).
 */
class ZipWriter {
public:
  explicit ZipWriter(const std::string &path, int compressionLevel = 6);
  ~ZipWriter();

  ZipWriter(const ZipWriter &) = delete;
  ZipWriter &operator=(const ZipWriter &) = delete;

  void beginEntry(const std::string &name);
  void write(std::string_view data);
  void endEntry();

  // beginEntry + write + endEntry
  void addEntry(const std::string &name, std::string_view content);

  void close();

  bool isOpen() const { return !closed_; }
  bool inEntry() const { return stream_ != nullptr; }
  size_t entryCount() const { return entries_.size(); }
  const std::string &path() const { return path_; }

private:
  struct DeflateStream;

  std::string path_;
  int compressionLevel_;
  std::ofstream out_;
  uint64_t offset_ = 0;
  bool closed_ = false;
  uint16_t dosTime_ = 0;
  uint16_t dosDate_ = 0;

  std::vector<ZipEntryInfo> entries_;
  ZipEntryInfo current_;
  std::unique_ptr<DeflateStream> stream_;

  void writeBytes(const void *data, size_t size);
  void writeU16(uint16_t value);
  void writeU32(uint32_t value);
  void writeU64(uint64_t value);
  void drainDeflate(int flush);
};

using ZipChunkHandler = std::function<void(std::string_view chunk)>;

// Random-access reader for archives produced by ZipWriter, Zip64 included
class ZipReader {
public:
  explicit ZipReader(const std::string &path);

  const std::vector<ZipEntryInfo> &entries() const { return entries_; }
  bool contains(const std::string &name) const;

  // Inflated content; throws SystemException(ARCHIVE_ERROR) when missing or
  // corrupt
  std::string read(const std::string &name) const;

  // Inflates the entry chunk by chunk. Size and checksum are verified after
  // the last chunk, so a corrupt entry throws after partial delivery.
  void stream(const std::string &name, const ZipChunkHandler &onChunk) const;

private:
  std::string path_;
  std::vector<ZipEntryInfo> entries_;

  const ZipEntryInfo &entry(const std::string &name) const;
};

} // namespace xfer
