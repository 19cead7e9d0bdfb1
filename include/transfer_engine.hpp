#pragma once

#include "archive_classifier.hpp"
#include "cancellation.hpp"
#include "config_manager.hpp"
#include "document_database.hpp"
#include "native_exporter.hpp"
#include "native_importer.hpp"
#include "progress_emitter.hpp"
#include "tool_runner.hpp"
#include "tool_transfer.hpp"
#include "transfer_models.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xfer {

/**
 * Orchestration facade for one database connection.
 *
 * Owns the export and import cancellation registries (each with its own
 * shared pause gate), the progress emitter and the tool locator. Every
 * transfer registers its job id for its whole duration, so cancel/pause
 * calls from other threads reach it. An empty job id argument means a
 * fresh one is generated.
 *
 * The document database is optional: without it native export and import
 * are unavailable and the tool URI is used without auth negotiation.
 */
class TransferEngine {
public:
  TransferEngine(const TransferConfig &config, std::string connectionString,
                 std::shared_ptr<DocumentDatabase> database = nullptr);
  ~TransferEngine();

  TransferEngine(const TransferEngine &) = delete;
  TransferEngine &operator=(const TransferEngine &) = delete;

  ProgressEmitter &emitter() { return emitter_; }

  // nullopt when the output path is empty (dismissed save dialog)
  std::optional<std::string> exportWithTool(const DumpOptions &options,
                                            const std::string &jobId = "");
  ImportResult importWithTool(const RestoreOptions &options,
                              const std::string &jobId = "");
  ArchivePreview previewArchive(const std::string &archivePath);
  std::optional<NativeExportResult>
  exportNative(const NativeExportOptions &options,
               const std::string &jobId = "");
  // Import jobs: registered with the import registry, paused by pauseImport
  ImportResult importNative(const NativeImportOptions &options,
                            const std::string &jobId = "");
  ImportResult dryRunNativeImport(const NativeImportOptions &options,
                                  const std::string &jobId = "");
  NativeImportPreview previewNativeImport(const std::string &archivePath) const;

  // Without an id every running job of that direction is cancelled.
  // Returns the number of jobs reached.
  size_t cancelExport(const std::optional<std::string> &jobId = std::nullopt);
  void pauseExport();
  void resumeExport();
  bool isExportPaused() const;

  size_t cancelImport(const std::optional<std::string> &jobId = std::nullopt);
  void pauseImport();
  void resumeImport();
  bool isImportPaused() const;

  size_t cancelAll();
  std::vector<std::string> activeJobs() const;

  ToolAvailability checkTools() const;
  std::vector<ImportDirEntry> scanImportDirectory(const std::string &dir) const;

  // Connection string handed to the external tools
  std::string toolUri() const;

  static std::string generateJobId(const std::string &prefix);

private:
  TransferConfig config_;
  std::string connectionString_;
  std::shared_ptr<DocumentDatabase> database_;

  CancellationRegistry exportRegistry_;
  CancellationRegistry importRegistry_;
  ProgressEmitter emitter_;
  ToolLocator locator_;
  ToolUriBuilder uriBuilder_;
  ToolTransfer toolTransfer_;
  std::unique_ptr<NativeExporter> nativeExporter_;
  std::unique_ptr<NativeImporter> nativeImporter_;

  ImportResult runNativeImport(const NativeImportOptions &options,
                               const std::string &jobId, bool dryRun);
};

} // namespace xfer
