#include "native_exporter.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include "transfer_exceptions.hpp"
#include "zip_archive.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

namespace xfer {

namespace {

bool isDriverError(const TransferException& e) {
    return e.getCode() == ErrorCode::DATABASE_ERROR;
}

} // namespace

std::string nativeEntryPath(const std::string& database, const std::string& collection,
                            const char* file) {
    return database + "/" + collection + "/" + file;
}

NativeExporter::NativeExporter(DocumentDatabase& database, ProgressEmitter& emitter,
                               const TransferConfig& config)
    : database_(database), emitter_(emitter), config_(config) {}

std::string NativeExporter::resolveOutputPath(const std::string& requested) const {
    if (string_utils::iends_with(requested, config_.nativeExtension)) {
        return requested;
    }
    return requested + config_.nativeExtension;
}

void NativeExporter::warn(const std::string& jobId, const std::string& database,
                          const std::string& collection, const std::string& message,
                          std::optional<int64_t> skipped) {
    EXPORT_LOG_WARN_JOB("{}{}{}: {}", jobId, database, collection.empty() ? "" : ".", collection,
                        message);
    emitter_.emitWarning(TransferDirection::EXPORT,
                         TransferWarning{jobId, database, collection, message, skipped});
}

NativeExportPlan NativeExporter::resolvePlan(const std::string& jobId,
                                             const NativeExportOptions& options) {
    std::vector<std::string> names = options.databases;
    if (names.empty()) {
        for (const auto& [name, collections] : options.databaseCollections) {
            names.push_back(name);
        }
    }
    if (names.empty()) {
        throw ValidationException(ErrorCode::MISSING_FIELD, "no database selected for export",
                                  "databases");
    }

    NativeExportPlan plan;
    for (const auto& name : names) {
        NativeExportPlan::Database entry{name, {}};

        if (auto it = options.databaseCollections.find(name);
            it != options.databaseCollections.end()) {
            entry.collections = it->second;
        } else {
            try {
                for (const auto& info : database_.listCollections(name)) {
                    if (!info.isView()) {
                        entry.collections.push_back(info.name);
                    }
                }
            } catch (const TransferException& e) {
                if (!isDriverError(e)) {
                    throw;
                }
                warn(jobId, name, "", "failed to list collections: " + e.getMessage());
            }
        }
        plan.databases.push_back(std::move(entry));
    }
    return plan;
}

int64_t NativeExporter::estimate(const std::string& database, const std::string& collection) {
    try {
        return database_.estimatedDocumentCount(database, collection);
    } catch (const TransferException& e) {
        if (!isDriverError(e)) {
            throw;
        }
        EXPORT_LOG_WARN("No count estimate for {}.{}: {}", database, collection, e.getMessage());
        return 0;
    }
}

NativeExportResult NativeExporter::exportDatabases(const std::string& jobId,
                                                   const NativeExportOptions& options,
                                                   const CancellationToken& token,
                                                   PauseGate& gate) {
    if (options.outputPath.empty()) {
        throw ValidationException(ErrorCode::MISSING_FIELD, "output path is required",
                                  "outputPath");
    }

    NativeExportResult result;
    result.jobId = jobId;
    result.filePath = resolveOutputPath(options.outputPath);
    result.manifest.exportedAt = formatTimestampUtc(std::chrono::system_clock::now());

    auto plan = resolvePlan(jobId, options);
    int batchTotal = static_cast<int>(plan.databases.size());

    ProgressEvent analyzing;
    analyzing.jobId = jobId;
    analyzing.phase = TransferPhase::ANALYZING;
    analyzing.batchTotal = batchTotal;
    emitter_.emitProgress(TransferDirection::EXPORT, analyzing);

    std::map<std::pair<std::string, std::string>, int64_t> estimates;
    int64_t totalRecords = 0;
    for (const auto& db : plan.databases) {
        for (const auto& collection : db.collections) {
            int64_t count = estimate(db.name, collection);
            estimates[{db.name, collection}] = count;
            totalRecords += count;
        }
    }

    EXPORT_LOG_INFO_JOB("Exporting {} database(s), ~{} documents to {}", jobId, batchTotal,
                        totalRecords, result.filePath);

    auto writer = std::make_unique<ZipWriter>(result.filePath);
    auto abandon = [&] {
        writer.reset();
        std::error_code ec;
        std::filesystem::remove(result.filePath, ec);
        if (ec) {
            EXPORT_LOG_WARN_JOB("Could not remove partial export {}: {}", jobId, result.filePath,
                                ec.message());
        }
    };

    RecordPoller poller(gate, token, config_.pollIntervalRecords);
    int64_t processed = 0;

    try {
        for (size_t dbIndex = 0; dbIndex < plan.databases.size(); ++dbIndex) {
            const auto& db = plan.databases[dbIndex];
            if (!poller.checkNow()) {
                throw CancelledException(jobId);
            }

            ManifestDatabase manifestDb{db.name, {}};
            for (const auto& collection : db.collections) {
                ProgressEvent progress;
                progress.jobId = jobId;
                progress.phase = TransferPhase::EXPORTING;
                progress.database = db.name;
                progress.collection = collection;
                progress.total = estimates[{db.name, collection}];
                progress.batchIndex = static_cast<int>(dbIndex) + 1;
                progress.batchTotal = batchTotal;
                progress.processedRecords = processed;
                progress.totalRecords = totalRecords;
                emitter_.emitProgress(TransferDirection::EXPORT, progress);

                auto outcome =
                    exportCollection(*writer, jobId, db.name, collection, progress, poller);
                processed += outcome.records;
                result.recordsSkipped += outcome.skipped;

                if (outcome.cancelled) {
                    throw CancelledException(jobId);
                }
                if (outcome.completed) {
                    manifestDb.collections.push_back(
                        {collection, outcome.records, outcome.indexCount});
                }
            }
            result.manifest.databases.push_back(std::move(manifestDb));
        }

        writer->addEntry(MANIFEST_ENTRY, nlohmann::json(result.manifest).dump(2));
        writer->close();
    } catch (const CancelledException&) {
        abandon();
        EXPORT_LOG_INFO_JOB("Export cancelled, removed {}", jobId, result.filePath);
        emitter_.emitCancelled(TransferDirection::EXPORT, jobId);
        throw;
    } catch (const std::exception& e) {
        abandon();
        EXPORT_LOG_ERROR("Export {} failed: {}", jobId, e.what());
        throw;
    }

    result.recordsExported = processed;

    ProgressEvent finalizing;
    finalizing.jobId = jobId;
    finalizing.phase = TransferPhase::FINALIZING;
    finalizing.current = processed;
    finalizing.total = totalRecords;
    finalizing.batchIndex = batchTotal;
    finalizing.batchTotal = batchTotal;
    finalizing.processedRecords = processed;
    finalizing.totalRecords = totalRecords;
    emitter_.emitProgress(TransferDirection::EXPORT, finalizing);

    emitter_.emitComplete(TransferDirection::EXPORT,
                          {{"jobId", jobId},
                           {"filePath", result.filePath},
                           {"recordsExported", result.recordsExported},
                           {"recordsSkipped", result.recordsSkipped}});

    EXPORT_LOG_INFO_JOB("Export complete: {} documents, {} skipped", jobId,
                        result.recordsExported, result.recordsSkipped);
    return result;
}

NativeExporter::CollectionOutcome
NativeExporter::exportCollection(ZipWriter& writer, const std::string& jobId,
                                 const std::string& database, const std::string& collection,
                                 ProgressEvent progress, RecordPoller& poller) {
    CollectionOutcome outcome;
    if (!poller.checkNow()) {
        outcome.cancelled = true;
        return outcome;
    }

    std::unique_ptr<DocumentCursor> cursor;
    try {
        cursor = database_.find(database, collection);
    } catch (const TransferException& e) {
        if (!isDriverError(e)) {
            throw;
        }
        warn(jobId, database, collection, "failed to query documents: " + e.getMessage());
        return outcome;
    }

    const int64_t processedBefore = progress.processedRecords;
    const auto progressInterval =
        static_cast<int64_t>(std::max<size_t>(config_.progressIntervalRecords, 1));
    bool readFailed = false;

    writer.beginEntry(nativeEntryPath(database, collection, DOCUMENTS_ENTRY));
    try {
        while (true) {
            if (!poller.tick()) {
                outcome.cancelled = true;
                break;
            }
            if (!cursor->next()) {
                break;
            }

            auto json = cursor->currentJson();
            if (!json) {
                ++outcome.skipped;
                continue;
            }
            writer.write(*json);
            writer.write("\n");
            ++outcome.records;

            if (outcome.records % progressInterval == 0) {
                progress.current = outcome.records;
                progress.processedRecords = processedBefore + outcome.records;
                emitter_.emitProgress(TransferDirection::EXPORT, progress);
            }
        }
    } catch (const TransferException& e) {
        if (!isDriverError(e)) {
            throw;
        }
        readFailed = true;
        warn(jobId, database, collection, "failed to read documents: " + e.getMessage());
    }
    writer.endEntry();

    progress.current = outcome.records;
    progress.processedRecords = processedBefore + outcome.records;
    emitter_.emitProgress(TransferDirection::EXPORT, progress);

    if (outcome.skipped > 0) {
        warn(jobId, database, collection,
             std::to_string(outcome.skipped) + " document(s) could not be exported",
             outcome.skipped);
    }
    if (outcome.cancelled || readFailed) {
        return outcome;
    }

    outcome.indexCount = writeIndexes(writer, jobId, database, collection);
    outcome.completed = true;
    EXPORT_LOG_DEBUG("Exported {}.{}: {} documents, {} indexes", database, collection,
                     outcome.records, outcome.indexCount);
    return outcome;
}

int NativeExporter::writeIndexes(ZipWriter& writer, const std::string& jobId,
                                 const std::string& database, const std::string& collection) {
    auto indexes = nlohmann::json::array();
    try {
        for (const auto& spec : database_.listIndexes(database, collection)) {
            auto parsed = nlohmann::json::parse(spec, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                EXPORT_LOG_WARN("Skipping unparseable index spec on {}.{}", database, collection);
                continue;
            }
            // The primary key index is recreated by the server
            if (parsed.contains("name") && parsed["name"] == "_id_") {
                continue;
            }
            indexes.push_back(std::move(parsed));
        }
    } catch (const TransferException& e) {
        if (!isDriverError(e)) {
            throw;
        }
        indexes = nlohmann::json::array();
        warn(jobId, database, collection, "failed to list indexes: " + e.getMessage());
    }

    writer.addEntry(nativeEntryPath(database, collection, INDEXES_ENTRY), indexes.dump(2));
    return static_cast<int>(indexes.size());
}

ExportManifest readManifest(const std::string& archivePath) {
    ZipReader reader(archivePath);
    if (!reader.contains(MANIFEST_ENTRY)) {
        throw SystemException(ErrorCode::ARCHIVE_ERROR, "no manifest in " + archivePath,
                              "NativeExporter", {{"path", archivePath}});
    }
    try {
        return nlohmann::json::parse(reader.read(MANIFEST_ENTRY)).get<ExportManifest>();
    } catch (const nlohmann::json::exception& e) {
        throw SystemException(ErrorCode::ARCHIVE_ERROR,
                              "invalid manifest in " + archivePath + ": " + e.what(),
                              "NativeExporter", {{"path", archivePath}});
    }
}

} // namespace xfer
