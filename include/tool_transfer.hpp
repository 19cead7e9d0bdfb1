#pragma once

#include "archive_classifier.hpp"
#include "cancellation.hpp"
#include "config_manager.hpp"
#include "job_planner.hpp"
#include "progress_emitter.hpp"
#include "tool_runner.hpp"
#include "transfer_models.hpp"
#include <string>
#include <vector>

namespace xfer {

/**
 * Export and import through the external mongodump/mongorestore tools.
 *
 * The connection string handed in is the tool URI (auth mechanism already
 * negotiated); its database segment is stripped per invocation whenever a
 * database is targeted. Jobs of one batch run strictly one after another.
 *
 * Terminal outcomes: *:complete on success; on cancellation partial output
 * is removed, *:cancelled is emitted and CancelledException thrown; a
 * non-zero exit throws ToolException with the masked diagnostics tail.
 */
class ToolTransfer {
public:
  ToolTransfer(const ToolLocator &locator, ProgressEmitter &emitter,
               const TransferConfig &config);

  // Returns the written file, or the directory for a multi-file batch
  std::string dump(const std::string &jobId, const std::string &toolUri,
                   const DumpOptions &options, const CancellationToken &token);

  // An archive directory keeps going past a failed archive and reports it
  // as "<file>: <error>" in the result
  ImportResult restore(const std::string &jobId, const std::string &toolUri,
                       const RestoreOptions &options,
                       const CancellationToken &token);

  // Dry-run listing of the namespaces inside an archive. Fails only when the
  // tool fails before naming any namespace.
  ArchivePreview preview(const std::string &toolUri,
                         const std::string &archivePath);

  std::vector<std::string> dumpArguments(const std::string &toolUri,
                                         const TransferJob &job,
                                         const std::string &archivePath) const;
  std::vector<std::string>
  archiveRestoreArguments(const std::string &toolUri,
                          const std::string &archivePath,
                          const RestoreOptions &options) const;
  std::vector<std::string>
  directoryRestoreArguments(const std::string &toolUri,
                            const ImportSource &source,
                            const RestoreOptions &options) const;
  std::vector<std::string>
  previewArguments(const std::string &toolUri,
                   const std::string &archivePath) const;

private:
  struct RestoreRun {
    ImportResult result;
    ProcessOutcome outcome;
  };

  const ToolLocator &locator_;
  ProgressEmitter &emitter_;
  TransferConfig config_;
  JobPlanner planner_;
  ArchiveClassifier classifier_;

  RestoreRun runRestore(const std::string &jobId, const std::string &toolPath,
                        const std::vector<std::string> &args,
                        const CancellationToken &token, int batchIndex,
                        int batchTotal, int64_t processedBefore);

  ImportResult restoreArchiveDirectory(const std::string &jobId,
                                       const std::string &toolPath,
                                       const std::string &toolUri,
                                       const ImportSource &source,
                                       const RestoreOptions &options,
                                       const CancellationToken &token);

  [[noreturn]] void abortCancelled(TransferDirection direction,
                                   const std::string &jobId);
};

// "<tool> failed: <masked diagnostics>" or the exit status when there are none
std::string toolFailureMessage(const std::string &tool,
                               const ProcessOutcome &outcome);

} // namespace xfer
