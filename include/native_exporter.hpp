#pragma once

#include "cancellation.hpp"
#include "config_manager.hpp"
#include "document_database.hpp"
#include "progress_emitter.hpp"
#include "transfer_models.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace xfer {

class ZipWriter;

inline constexpr const char *MANIFEST_ENTRY = "manifest.json";
inline constexpr const char *DOCUMENTS_ENTRY = "documents.ndjson";
inline constexpr const char *INDEXES_ENTRY = "indexes.json";

// "<db>/<coll>/<file>"
std::string nativeEntryPath(const std::string &database,
                            const std::string &collection, const char *file);

struct NativeExportResult {
  std::string jobId;
  std::string filePath;
  ExportManifest manifest;
  int64_t recordsExported = 0;
  int64_t recordsSkipped = 0;
};

// Which collections of which database, resolved before any data moves
struct NativeExportPlan {
  struct Database {
    std::string name;
    std::vector<std::string> collections;
  };

  std::vector<Database> databases;
};

/**
 * Writes a self-describing zip without external tools:
 *
 *   <db>/<coll>/documents.ndjson   one canonical extended-JSON doc per line
 *   <db>/<coll>/indexes.json       secondary indexes, "[]" when none
 *   manifest.json                  last entry, lists completed collections
 *
 * Undecodable documents are skipped and reported in one warning per
 * collection. A collection whose query fails is reported and left out of
 * the manifest. On cancellation the partial file is removed, then
 * export:cancelled is emitted, then CancelledException is thrown.
 */
class NativeExporter {
public:
  NativeExporter(DocumentDatabase &database, ProgressEmitter &emitter,
                 const TransferConfig &config);

  NativeExportResult exportDatabases(const std::string &jobId,
                                     const NativeExportOptions &options,
                                     const CancellationToken &token,
                                     PauseGate &gate);

  // Appends the native extension unless present (case-insensitive)
  std::string resolveOutputPath(const std::string &requested) const;

  // A database in the collection map exports those collections, any other
  // database every non-view collection
  NativeExportPlan resolvePlan(const std::string &jobId,
                               const NativeExportOptions &options);

private:
  struct CollectionOutcome {
    bool completed = false;
    bool cancelled = false;
    int64_t records = 0;
    int64_t skipped = 0;
    int indexCount = 0;
  };

  DocumentDatabase &database_;
  ProgressEmitter &emitter_;
  TransferConfig config_;

  int64_t estimate(const std::string &database, const std::string &collection);

  CollectionOutcome exportCollection(ZipWriter &writer, const std::string &jobId,
                                     const std::string &database,
                                     const std::string &collection,
                                     ProgressEvent progress,
                                     RecordPoller &poller);

  int writeIndexes(ZipWriter &writer, const std::string &jobId,
                   const std::string &database, const std::string &collection);

  void warn(const std::string &jobId, const std::string &database,
            const std::string &collection, const std::string &message,
            std::optional<int64_t> skipped = std::nullopt);
};

// Reads manifest.json back out of a native export
ExportManifest readManifest(const std::string &archivePath);

} // namespace xfer
