#pragma once

#include "cancellation.hpp"
#include "config_manager.hpp"
#include "document_database.hpp"
#include "progress_emitter.hpp"
#include "transfer_models.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xfer {

class ZipReader;

/**
 * Loads a native export (see NativeExporter) back into the server.
 *
 * The manifest decides which databases and collections exist; the options
 * may narrow that to some databases. Documents are inserted unordered in
 * batches of INSERT_BATCH_SIZE. In skip mode a document whose _id is already
 * stored is counted as skipped; override mode drops each database before
 * loading it. Indexes from indexes.json are created after the documents.
 *
 * Unparseable lines, rejected documents and failed index builds end up in
 * the result. A batch the server refuses as a whole aborts the job with
 * SystemException(DATABASE_ERROR). On cancellation import:cancelled is
 * emitted and CancelledException thrown; inserted documents stay.
 */
class NativeImporter {
public:
  static constexpr size_t INSERT_BATCH_SIZE = 100;
  static constexpr size_t ID_LOOKUP_BATCH_SIZE = 500;

  NativeImporter(DocumentDatabase &database, ProgressEmitter &emitter,
                 const TransferConfig &config);

  ImportResult importDatabases(const std::string &jobId,
                               const NativeImportOptions &options,
                               const CancellationToken &token,
                               PauseGate &gate);

  // Counts what importDatabases would insert, skip or drop. Writes nothing.
  ImportResult dryRun(const std::string &jobId,
                      const NativeImportOptions &options,
                      const CancellationToken &token, PauseGate &gate);

private:
  using LineHandler = std::function<void(std::string_view line)>;

  DocumentDatabase &database_;
  ProgressEmitter &emitter_;
  TransferConfig config_;

  std::vector<ManifestDatabase>
  selectDatabases(const ExportManifest &manifest,
                  const NativeImportOptions &options) const;

  // Returns the number of lines read
  int64_t importCollection(const ZipReader &reader, const std::string &jobId,
                           const std::string &database,
                           const ManifestCollection &collection,
                           ProgressEvent progress, RecordPoller &poller,
                           CollectionImportResult &collResult,
                           ImportResult &result);

  void createIndexes(const ZipReader &reader, const std::string &database,
                     const std::string &collection,
                     CollectionImportResult &collResult, ImportResult &result);

  DatabaseImportResult analyzeOverride(const std::string &jobId,
                                       const ManifestDatabase &database,
                                       ImportResult &result);

  int64_t analyzeSkip(const ZipReader &reader, const std::string &jobId,
                      const std::string &database,
                      const ManifestCollection &collection,
                      ProgressEvent progress, RecordPoller &poller,
                      CollectionImportResult &collResult, ImportResult &result);

  // False when the entry is missing or corrupt; the reason is recorded
  bool forEachLine(const ZipReader &reader, const std::string &database,
                   const std::string &collection, ImportResult &result,
                   const LineHandler &onLine);

  void warn(const std::string &jobId, const std::string &database,
            const std::string &collection, const std::string &message,
            std::optional<int64_t> skipped = std::nullopt);
};

// Manifest summary of a native export; needs no server
NativeImportPreview previewNativeImport(const std::string &archivePath);

} // namespace xfer
