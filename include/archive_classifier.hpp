#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace xfer {

enum class ImportSourceKind {
  ARCHIVE,           // single archive file
  ARCHIVE_DIRECTORY, // directory of single-file archives, restored one by one
  DUMP_DIRECTORY     // raw tool-dump directory
};

std::string importSourceKindToString(ImportSourceKind kind);

struct ImportSource {
  ImportSourceKind kind = ImportSourceKind::ARCHIVE;
  std::filesystem::path path;
  bool gzip = false; // only meaningful for DUMP_DIRECTORY
};

struct ImportDirEntry {
  std::string name;
  std::uintmax_t size = 0;
};

class ArchiveClassifier {
public:
  explicit ArchiveClassifier(std::string archiveExtension = ".archive",
                             int gzipScanDepth = 5);

  // Throws ValidationException when the path does not exist
  ImportSource classify(const std::filesystem::path &path) const;

  // Direct children carrying the archive extension, sorted by name
  std::vector<std::filesystem::path>
  listArchives(const std::filesystem::path &dir) const;

  bool containsArchives(const std::filesystem::path &dir) const;

  // Bounded recursive search for ".gz" payloads; symlinked directories are
  // never entered
  bool containsGzipPayload(const std::filesystem::path &dir) const;

private:
  std::string archiveExtension_;
  int gzipScanDepth_;

  bool containsGzipPayload(const std::filesystem::path &dir,
                           int remainingDepth) const;
};

// Regular files directly inside dir with their sizes, sorted by name
std::vector<ImportDirEntry> scanImportDirectory(const std::filesystem::path &dir);

} // namespace xfer
