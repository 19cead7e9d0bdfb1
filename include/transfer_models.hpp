#pragma once

#include "job_planner.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace xfer {

enum class TransferPhase {
  EXPORTING,
  IMPORTING,
  ANALYZING,
  DOWNLOADING,
  WRITING,
  FINALIZING,
  DROPPING
};

std::string transferPhaseToString(TransferPhase phase);

// total == -1 means indeterminate
struct ProgressEvent {
  std::string jobId;
  TransferPhase phase = TransferPhase::EXPORTING;
  std::string database;
  std::string collection;
  int64_t current = 0;
  int64_t total = -1;
  int batchIndex = 0; // 1-based, 0 when not part of a batch
  int batchTotal = 0;
  int64_t processedRecords = 0;
  int64_t totalRecords = 0;
};

struct CollectionImportResult {
  std::string name;
  int64_t recordsInserted = 0;
  int64_t recordsFailed = 0;
  // Native import only
  int64_t recordsSkipped = 0; // duplicate _id, left untouched
  int64_t parseErrors = 0;
  int64_t currentCount = 0; // dry run: documents already on the server
  std::vector<std::string> indexErrors;
};

struct DatabaseImportResult {
  std::string name;
  std::vector<CollectionImportResult> collections;
  int64_t currentCount = 0; // dry run override: documents that would be dropped
};

struct ImportResult {
  static constexpr size_t MAX_ERRORS = 100;

  std::vector<DatabaseImportResult> databases;
  int64_t recordsInserted = 0;
  int64_t recordsFailed = 0;
  int64_t recordsSkipped = 0;
  int64_t parseErrors = 0;
  int64_t documentsDropped = 0; // dry run override
  // Deduplicated, masked, at most MAX_ERRORS
  std::vector<std::string> errors;
  // Errors reported after the list was full
  int64_t omittedErrors = 0;

  // Adds counters and breakdown of another result, keeping errors unique
  void merge(const ImportResult &other);
  void addError(const std::string &error);

private:
  std::unordered_set<std::string> knownErrors_;
};

struct ArchivePreviewCollection {
  std::string name;
};

struct ArchivePreviewDatabase {
  std::string name;
  std::vector<ArchivePreviewCollection> collections;
};

struct ArchivePreview {
  std::vector<ArchivePreviewDatabase> databases;

  size_t namespaceCount() const;
};

struct ManifestCollection {
  std::string name;
  int64_t recordCount = 0;
  int indexCount = 0;
};

struct ManifestDatabase {
  std::string name;
  std::vector<ManifestCollection> collections;
};

struct ExportManifest {
  static constexpr const char *CURRENT_VERSION = "1.0";

  std::string version = CURRENT_VERSION;
  std::string exportedAt; // RFC 3339, UTC
  std::vector<ManifestDatabase> databases;

  const ManifestCollection *findCollection(const std::string &database,
                                           const std::string &collection) const;
};

struct ToolStatus {
  bool available = false;
  std::string path;
  std::string version;
};

struct ToolAvailability {
  ToolStatus mongodump;
  ToolStatus mongorestore;
  std::string installUrl;
};

// External dump tool request
struct DumpOptions {
  DumpSelection selection;
  std::string outputPath; // empty = dismissed save dialog
};

// External restore tool request
struct RestoreOptions {
  std::string inputPath;
  std::string database;
  std::string collection;
  bool drop = false;
  bool dryRun = false;
  std::vector<std::string> nsInclude;
  // Restricts an archive directory restore to these file names
  std::vector<std::string> files;
};

// Native exporter request. collections empty = every collection of each db
struct NativeExportOptions {
  std::vector<std::string> databases;
  std::map<std::string, std::vector<std::string>> databaseCollections;
  std::string outputPath; // empty = dismissed save dialog
};

// What happens to documents whose _id already exists on the server
enum class ImportMode {
  SKIP,    // keep the stored document, count the incoming one as skipped
  OVERRIDE // drop each selected database before loading it
};

std::string importModeToString(ImportMode mode);
// Throws ValidationException for anything but "skip" or "override"
ImportMode parseImportMode(const std::string &value);

// Native importer request. databases empty = every database in the manifest
struct NativeImportOptions {
  std::string inputPath;
  std::vector<std::string> databases;
  ImportMode mode = ImportMode::SKIP;
};

struct NativeImportPreviewDatabase {
  std::string name;
  size_t collectionCount = 0;
  int64_t documentCount = 0;
};

// Manifest summary shown before a native import
struct NativeImportPreview {
  std::string filePath;
  std::string exportedAt;
  std::vector<NativeImportPreviewDatabase> databases;
};

std::string formatTimestampUtc(std::chrono::system_clock::time_point tp);

void to_json(nlohmann::json &j, const ProgressEvent &event);
void to_json(nlohmann::json &j, const CollectionImportResult &result);
void to_json(nlohmann::json &j, const DatabaseImportResult &result);
void to_json(nlohmann::json &j, const ImportResult &result);
void to_json(nlohmann::json &j, const ArchivePreviewCollection &collection);
void to_json(nlohmann::json &j, const ArchivePreviewDatabase &database);
void to_json(nlohmann::json &j, const ArchivePreview &preview);
void to_json(nlohmann::json &j, const ManifestCollection &collection);
void to_json(nlohmann::json &j, const ManifestDatabase &database);
void to_json(nlohmann::json &j, const ExportManifest &manifest);
void to_json(nlohmann::json &j, const NativeImportPreviewDatabase &database);
void to_json(nlohmann::json &j, const NativeImportPreview &preview);
void to_json(nlohmann::json &j, const ToolStatus &status);
void to_json(nlohmann::json &j, const ToolAvailability &availability);

void from_json(const nlohmann::json &j, ManifestCollection &collection);
void from_json(const nlohmann::json &j, ManifestDatabase &database);
void from_json(const nlohmann::json &j, ExportManifest &manifest);

} // namespace xfer
