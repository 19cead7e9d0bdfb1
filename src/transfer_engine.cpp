#include "transfer_engine.hpp"
#include "credential_masker.hpp"
#include "logger.hpp"
#include "transfer_exceptions.hpp"
#include <random>

namespace xfer {

namespace {

std::string resolveJobId(const std::string& requested, const std::string& prefix) {
    return requested.empty() ? TransferEngine::generateJobId(prefix) : requested;
}

} // namespace

TransferEngine::TransferEngine(const TransferConfig& config, std::string connectionString,
                               std::shared_ptr<DocumentDatabase> database)
    : config_(config), connectionString_(std::move(connectionString)),
      database_(std::move(database)), emitter_(config.eventQueueSize),
      locator_(config.mongodumpPath, config.mongorestorePath),
      uriBuilder_(database_.get(), config.authLookupTimeout),
      toolTransfer_(locator_, emitter_, config_) {
    if (database_) {
        nativeExporter_ = std::make_unique<NativeExporter>(*database_, emitter_, config_);
        nativeImporter_ = std::make_unique<NativeImporter>(*database_, emitter_, config_);
    }
    ENGINE_LOG_INFO("Transfer engine ready for {}", maskCredentials(connectionString_));
}

TransferEngine::~TransferEngine() {
    // Anything still running must not outlive the emitter it reports to
    cancelAll();
    emitter_.stop();
}

std::string TransferEngine::generateJobId(const std::string& prefix) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    return prefix + "_" + std::to_string(millis) + "_" + std::to_string(dis(gen));
}

std::string TransferEngine::toolUri() const {
    return uriBuilder_.build(connectionString_, std::nullopt);
}

std::optional<std::string> TransferEngine::exportWithTool(const DumpOptions& options,
                                                          const std::string& jobId) {
    if (options.outputPath.empty()) {
        ENGINE_LOG_INFO("Export dismissed, no output path chosen");
        emitter_.emitCancelled(TransferDirection::EXPORT, "");
        return std::nullopt;
    }

    JobScope scope(exportRegistry_, resolveJobId(jobId, "export"));
    ENGINE_LOG_INFO_JOB("Tool export to {}", scope.jobId(), options.outputPath);
    try {
        auto path = toolTransfer_.dump(scope.jobId(), toolUri(), options, scope.token());
        emitter_.forgetJob(scope.jobId());
        return path;
    } catch (const CancelledException&) {
        emitter_.forgetJob(scope.jobId());
        throw;
    } catch (const TransferException& e) {
        ENGINE_LOG_ERROR_JOB("Tool export failed: {}", scope.jobId(), e.getMessage());
        emitter_.forgetJob(scope.jobId());
        throw;
    }
}

ImportResult TransferEngine::importWithTool(const RestoreOptions& options,
                                            const std::string& jobId) {
    JobScope scope(importRegistry_, resolveJobId(jobId, "import"));
    ENGINE_LOG_INFO_JOB("Tool import from {}", scope.jobId(), options.inputPath);
    try {
        auto result = toolTransfer_.restore(scope.jobId(), toolUri(), options, scope.token());
        emitter_.forgetJob(scope.jobId());
        return result;
    } catch (const CancelledException&) {
        emitter_.forgetJob(scope.jobId());
        throw;
    } catch (const TransferException& e) {
        ENGINE_LOG_ERROR_JOB("Tool import failed: {}", scope.jobId(), e.getMessage());
        emitter_.forgetJob(scope.jobId());
        throw;
    }
}

ArchivePreview TransferEngine::previewArchive(const std::string& archivePath) {
    return toolTransfer_.preview(toolUri(), archivePath);
}

std::optional<NativeExportResult>
TransferEngine::exportNative(const NativeExportOptions& options, const std::string& jobId) {
    if (options.outputPath.empty()) {
        ENGINE_LOG_INFO("Native export dismissed, no output path chosen");
        emitter_.emitCancelled(TransferDirection::EXPORT, "");
        return std::nullopt;
    }
    if (!nativeExporter_) {
        throw createSystemError(ErrorCode::DATABASE_ERROR, "TransferEngine",
                                "native export needs a database connection");
    }

    JobScope scope(exportRegistry_, resolveJobId(jobId, "export"));
    ENGINE_LOG_INFO_JOB("Native export to {}", scope.jobId(), options.outputPath);
    try {
        auto result =
            nativeExporter_->exportDatabases(scope.jobId(), options, scope.token(), scope.gate());
        emitter_.forgetJob(scope.jobId());
        return result;
    } catch (const CancelledException&) {
        emitter_.forgetJob(scope.jobId());
        throw;
    } catch (const TransferException& e) {
        ENGINE_LOG_ERROR_JOB("Native export failed: {}", scope.jobId(), e.getMessage());
        emitter_.forgetJob(scope.jobId());
        throw;
    }
}

ImportResult TransferEngine::importNative(const NativeImportOptions& options,
                                          const std::string& jobId) {
    return runNativeImport(options, jobId, false);
}

ImportResult TransferEngine::dryRunNativeImport(const NativeImportOptions& options,
                                                const std::string& jobId) {
    return runNativeImport(options, jobId, true);
}

ImportResult TransferEngine::runNativeImport(const NativeImportOptions& options,
                                             const std::string& jobId, bool dryRun) {
    if (!nativeImporter_) {
        throw createSystemError(ErrorCode::DATABASE_ERROR, "TransferEngine",
                                "native import needs a database connection");
    }

    JobScope scope(importRegistry_, resolveJobId(jobId, "import"));
    ENGINE_LOG_INFO_JOB("Native import{} from {}", scope.jobId(), dryRun ? " dry run" : "",
                        options.inputPath);
    try {
        auto result =
            dryRun ? nativeImporter_->dryRun(scope.jobId(), options, scope.token(), scope.gate())
                   : nativeImporter_->importDatabases(scope.jobId(), options, scope.token(),
                                                      scope.gate());
        emitter_.forgetJob(scope.jobId());
        return result;
    } catch (const CancelledException&) {
        emitter_.forgetJob(scope.jobId());
        throw;
    } catch (const TransferException& e) {
        ENGINE_LOG_ERROR_JOB("Native import failed: {}", scope.jobId(), e.getMessage());
        emitter_.forgetJob(scope.jobId());
        throw;
    }
}

NativeImportPreview TransferEngine::previewNativeImport(const std::string& archivePath) const {
    return xfer::previewNativeImport(archivePath);
}

size_t TransferEngine::cancelExport(const std::optional<std::string>& jobId) {
    size_t cancelled = exportRegistry_.cancel(jobId);
    ENGINE_LOG_INFO("Cancel export {}: {} job(s) signalled", jobId.value_or("(all)"), cancelled);
    return cancelled;
}

void TransferEngine::pauseExport() {
    exportRegistry_.gate().pause();
    emitter_.emitPaused(TransferDirection::EXPORT);
}

void TransferEngine::resumeExport() {
    exportRegistry_.gate().resume();
    emitter_.emitResumed(TransferDirection::EXPORT);
}

bool TransferEngine::isExportPaused() const { return exportRegistry_.gate().isPaused(); }

size_t TransferEngine::cancelImport(const std::optional<std::string>& jobId) {
    size_t cancelled = importRegistry_.cancel(jobId);
    ENGINE_LOG_INFO("Cancel import {}: {} job(s) signalled", jobId.value_or("(all)"), cancelled);
    return cancelled;
}

void TransferEngine::pauseImport() {
    importRegistry_.gate().pause();
    emitter_.emitPaused(TransferDirection::IMPORT);
}

void TransferEngine::resumeImport() {
    importRegistry_.gate().resume();
    emitter_.emitResumed(TransferDirection::IMPORT);
}

bool TransferEngine::isImportPaused() const { return importRegistry_.gate().isPaused(); }

size_t TransferEngine::cancelAll() {
    return exportRegistry_.cancel() + importRegistry_.cancel();
}

std::vector<std::string> TransferEngine::activeJobs() const {
    auto jobs = exportRegistry_.activeJobIds();
    auto imports = importRegistry_.activeJobIds();
    jobs.insert(jobs.end(), imports.begin(), imports.end());
    return jobs;
}

ToolAvailability TransferEngine::checkTools() const {
    return checkToolAvailability(locator_, config_.toolVersionTimeout);
}

std::vector<ImportDirEntry> TransferEngine::scanImportDirectory(const std::string& dir) const {
    return xfer::scanImportDirectory(dir);
}

} // namespace xfer
