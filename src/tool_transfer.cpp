#include "tool_transfer.hpp"
#include "credential_masker.hpp"
#include "logger.hpp"
#include "transfer_exceptions.hpp"
#include "uri_builder.hpp"
#include <algorithm>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace xfer {

std::string toolFailureMessage(const std::string& tool, const ProcessOutcome& outcome) {
    if (outcome.timedOut) {
        return tool + " timed out";
    }
    if (!outcome.tail.empty()) {
        return tool + " failed: " + outcome.tail.maskedText();
    }
    return tool + " failed: exit status " + std::to_string(outcome.exitCode);
}

ToolTransfer::ToolTransfer(const ToolLocator& locator, ProgressEmitter& emitter,
                           const TransferConfig& config)
    : locator_(locator), emitter_(emitter), config_(config), planner_(config.archiveExtension),
      classifier_(config.archiveExtension, config.gzipScanDepth) {}

void ToolTransfer::abortCancelled(TransferDirection direction, const std::string& jobId) {
    TOOL_LOG_INFO_JOB("{} cancelled", jobId, directionPrefix(direction));
    emitter_.emitCancelled(direction, jobId);
    throw CancelledException(jobId);
}

std::vector<std::string> ToolTransfer::dumpArguments(const std::string& toolUri,
                                                     const TransferJob& job,
                                                     const std::string& archivePath) const {
    std::vector<std::string> args = {
        "--uri=" + (job.database ? uri::stripDatabase(toolUri) : toolUri),
        "--archive=" + archivePath,
        "--gzip",
        "--numParallelCollections=1",
    };
    if (job.database) {
        args.push_back("--db=" + *job.database);
    }
    if (job.collection) {
        args.push_back("--collection=" + *job.collection);
    }
    for (const auto& excluded : job.excludedCollections) {
        args.push_back("--excludeCollection=" + excluded);
    }
    return args;
}

std::vector<std::string>
ToolTransfer::archiveRestoreArguments(const std::string& toolUri, const std::string& archivePath,
                                      const RestoreOptions& options) const {
    std::vector<std::string> args = {
        "--uri=" + (options.database.empty() ? toolUri : uri::stripDatabase(toolUri)),
        "--archive=" + archivePath,
        "--gzip",
    };
    if (!options.database.empty()) {
        args.push_back("--db=" + options.database);
    }
    if (!options.collection.empty()) {
        args.push_back("--collection=" + options.collection);
    }
    if (options.drop) {
        args.push_back("--drop");
    }
    if (options.dryRun) {
        args.push_back("--dryRun");
    }
    for (const auto& ns : options.nsInclude) {
        args.push_back("--nsInclude=" + ns);
    }
    return args;
}

std::vector<std::string>
ToolTransfer::directoryRestoreArguments(const std::string& toolUri, const ImportSource& source,
                                        const RestoreOptions& options) const {
    std::vector<std::string> args = {
        "--uri=" + (options.database.empty() ? toolUri : uri::stripDatabase(toolUri)),
        "--dir=" + source.path.string(),
    };
    if (!options.database.empty()) {
        args.push_back("--db=" + options.database);
    }
    if (!options.collection.empty()) {
        args.push_back("--collection=" + options.collection);
    }
    if (options.drop) {
        args.push_back("--drop");
    }
    if (source.gzip) {
        args.push_back("--gzip");
    }
    if (options.dryRun) {
        args.push_back("--dryRun");
    }
    return args;
}

std::vector<std::string> ToolTransfer::previewArguments(const std::string& toolUri,
                                                        const std::string& archivePath) const {
    return {"--uri=" + toolUri, "--archive=" + archivePath, "--gzip", "--dryRun", "--verbose"};
}

std::string ToolTransfer::dump(const std::string& jobId, const std::string& toolUri,
                               const DumpOptions& options, const CancellationToken& token) {
    auto toolPath = locator_.mongodump();
    auto batch = planner_.planBatch(options.selection, options.outputPath);
    const auto outputPath = batch.outputPath.string();

    bool createdDirectory = false;
    if (batch.multiFile) {
        std::error_code ec;
        createdDirectory = fs::create_directories(batch.outputPath, ec);
        if (ec) {
            throw SystemException(ErrorCode::FILE_ERROR,
                                  "failed to create output directory " + outputPath + ": " +
                                      ec.message(),
                                  "ToolTransfer", {{"path", outputPath}});
        }
    }

    // Only what this run wrote goes; a directory that already existed stays
    std::vector<fs::path> written;
    auto cleanup = [&] {
        for (const auto& artifact : written) {
            std::error_code ec;
            fs::remove(artifact, ec);
            if (ec) {
                TOOL_LOG_WARN_JOB("Could not remove partial output {}: {}", jobId,
                                  artifact.string(), ec.message());
            }
        }
        if (createdDirectory) {
            std::error_code ec;
            fs::remove_all(batch.outputPath, ec);
            if (ec) {
                TOOL_LOG_WARN_JOB("Could not remove output directory {}: {}", jobId, outputPath,
                                  ec.message());
            }
        }
    };

    TOOL_LOG_INFO_JOB("Dumping {} job(s) to {}", jobId, batch.size(), outputPath);

    ProcessRunner runner(config_.diagnosticTailLines);
    const int batchTotal = static_cast<int>(batch.size());
    int64_t dumped = 0;

    for (size_t i = 0; i < batch.size(); ++i) {
        if (token.isCancelled()) {
            cleanup();
            abortCancelled(TransferDirection::EXPORT, jobId);
        }

        const auto& job = batch.jobs[i];
        const int batchIndex = static_cast<int>(i) + 1;

        ProgressEvent start;
        start.jobId = jobId;
        start.phase = TransferPhase::EXPORTING;
        start.database = job.database.value_or("");
        start.collection = job.collection.value_or("");
        start.batchIndex = batchIndex;
        start.batchTotal = batchTotal;
        start.processedRecords = dumped;
        start.totalRecords = -1;
        emitter_.emitProgress(TransferDirection::EXPORT, start);

        const auto artifact = batch.artifactPathFor(i);
        written.push_back(artifact);

        DumpAccumulator accumulator;
        auto outcome = runner.run(
            toolPath, dumpArguments(toolUri, job, artifact.string()), &token,
            [&](const std::string& line) {
                TOOL_LOG_DEBUG("mongodump: {}", maskCredentials(line));
                if (auto done = accumulator.consume(line)) {
                    ProgressEvent event = start;
                    event.database = done->database;
                    event.collection = done->collection;
                    event.current = accumulator.namespacesDone();
                    event.processedRecords = dumped + accumulator.recordsDumped();
                    emitter_.emitProgress(TransferDirection::EXPORT, event);
                }
            });
        dumped += accumulator.recordsDumped();

        if (outcome.cancelled) {
            cleanup();
            abortCancelled(TransferDirection::EXPORT, jobId);
        }
        if (!outcome.succeeded()) {
            cleanup();
            throw ToolException(toolFailureMessage(MONGODUMP_TOOL, outcome), MONGODUMP_TOOL,
                                outcome.exitCode, {{"jobId", jobId}, {"job", job.describe()}});
        }
    }

    emitter_.emitComplete(TransferDirection::EXPORT,
                          {{"jobId", jobId}, {"filePath", outputPath}, {"recordsExported", dumped}});
    TOOL_LOG_INFO_JOB("Dump complete: {} documents", jobId, dumped);
    return outputPath;
}

ToolTransfer::RestoreRun ToolTransfer::runRestore(const std::string& jobId,
                                                  const std::string& toolPath,
                                                  const std::vector<std::string>& args,
                                                  const CancellationToken& token, int batchIndex,
                                                  int batchTotal, int64_t processedBefore) {
    ProgressEvent start;
    start.jobId = jobId;
    start.phase = TransferPhase::IMPORTING;
    start.batchIndex = batchIndex;
    start.batchTotal = batchTotal;
    start.processedRecords = processedBefore;
    start.totalRecords = -1;
    emitter_.emitProgress(TransferDirection::IMPORT, start);

    ProcessRunner runner(config_.diagnosticTailLines);
    RestoreAccumulator accumulator;
    auto outcome = runner.run(toolPath, args, &token, [&](const std::string& line) {
        TOOL_LOG_DEBUG("mongorestore: {}", maskCredentials(line));
        if (auto done = accumulator.consume(line)) {
            ProgressEvent event = start;
            event.database = done->database;
            event.collection = done->collection;
            event.current = done->count;
            event.processedRecords = processedBefore + accumulator.result().recordsInserted;
            emitter_.emitProgress(TransferDirection::IMPORT, event);
        }
    });
    return {accumulator.takeResult(), std::move(outcome)};
}

ImportResult ToolTransfer::restore(const std::string& jobId, const std::string& toolUri,
                                   const RestoreOptions& options,
                                   const CancellationToken& token) {
    if (options.inputPath.empty()) {
        throw ValidationException(ErrorCode::MISSING_FIELD, "input path is required",
                                  "inputPath");
    }
    auto toolPath = locator_.mongorestore();
    auto source = classifier_.classify(options.inputPath);
    TOOL_LOG_INFO_JOB("Restoring {} ({})", jobId, source.path.string(),
                      importSourceKindToString(source.kind));

    ImportResult result;
    if (source.kind == ImportSourceKind::ARCHIVE_DIRECTORY) {
        result = restoreArchiveDirectory(jobId, toolPath, toolUri, source, options, token);
    } else {
        auto args = source.kind == ImportSourceKind::ARCHIVE
                        ? archiveRestoreArguments(toolUri, source.path.string(), options)
                        : directoryRestoreArguments(toolUri, source, options);
        auto run = runRestore(jobId, toolPath, args, token, 1, 1, 0);
        if (run.outcome.cancelled) {
            abortCancelled(TransferDirection::IMPORT, jobId);
        }
        if (!run.outcome.succeeded()) {
            TOOL_LOG_WARN_JOB("Restore failed after {} inserted, {} failed", jobId,
                              run.result.recordsInserted, run.result.recordsFailed);
            throw ToolException(toolFailureMessage(MONGORESTORE_TOOL, run.outcome),
                                MONGORESTORE_TOOL, run.outcome.exitCode, {{"jobId", jobId}});
        }
        result = std::move(run.result);
    }

    emitter_.emitComplete(TransferDirection::IMPORT, {{"jobId", jobId},
                                                      {"recordsInserted", result.recordsInserted},
                                                      {"recordsFailed", result.recordsFailed},
                                                      {"errors", result.errors},
                                                      {"omittedErrors", result.omittedErrors}});
    TOOL_LOG_INFO_JOB("Restore complete: {} inserted, {} failed, {} error(s)", jobId,
                      result.recordsInserted, result.recordsFailed, result.errors.size());
    return result;
}

ImportResult ToolTransfer::restoreArchiveDirectory(const std::string& jobId,
                                                   const std::string& toolPath,
                                                   const std::string& toolUri,
                                                   const ImportSource& source,
                                                   const RestoreOptions& options,
                                                   const CancellationToken& token) {
    std::set<std::string> selected(options.files.begin(), options.files.end());
    std::vector<fs::path> archives;
    for (auto& archive : classifier_.listArchives(source.path)) {
        if (selected.empty() || selected.count(archive.filename().string()) > 0) {
            archives.push_back(std::move(archive));
        }
    }

    ImportResult combined;
    const int batchTotal = static_cast<int>(archives.size());
    for (size_t i = 0; i < archives.size(); ++i) {
        if (token.isCancelled()) {
            abortCancelled(TransferDirection::IMPORT, jobId);
        }

        const auto name = archives[i].filename().string();
        auto run = runRestore(jobId, toolPath,
                              archiveRestoreArguments(toolUri, archives[i].string(), options),
                              token, static_cast<int>(i) + 1, batchTotal,
                              combined.recordsInserted);
        if (run.outcome.cancelled) {
            abortCancelled(TransferDirection::IMPORT, jobId);
        }
        if (!run.outcome.succeeded()) {
            auto error = name + ": " + toolFailureMessage(MONGORESTORE_TOOL, run.outcome);
            TOOL_LOG_WARN_JOB("Continuing after failed archive {}", jobId, error);
            combined.addError(error);
        }
        combined.merge(run.result);
    }
    return combined;
}

ArchivePreview ToolTransfer::preview(const std::string& toolUri, const std::string& archivePath) {
    if (archivePath.empty()) {
        throw ValidationException(ErrorCode::MISSING_FIELD, "archive path is required",
                                  "archivePath");
    }
    auto toolPath = locator_.mongorestore();

    ProcessRunner runner(config_.previewTailLines);
    PreviewAccumulator accumulator;
    auto outcome = runner.run(
        toolPath, previewArguments(toolUri, archivePath), nullptr,
        [&accumulator](const std::string& line) { accumulator.consume(line); },
        config_.previewTimeout);

    if (!outcome.succeeded()) {
        if (accumulator.empty()) {
            throw ToolException("mongorestore preview failed: " +
                                    (outcome.tail.empty() ? toolFailureMessage(MONGORESTORE_TOOL,
                                                                               outcome)
                                                          : outcome.tail.maskedText()),
                                MONGORESTORE_TOOL, outcome.exitCode, {{"path", archivePath}});
        }
        TOOL_LOG_WARN("Preview of {} ended abnormally, keeping {} namespace(s)", archivePath,
                      accumulator.preview().namespaceCount());
    }
    return accumulator.preview();
}

} // namespace xfer
