#include "native_importer.hpp"
#include "logger.hpp"
#include "native_exporter.hpp"
#include "transfer_exceptions.hpp"
#include "zip_archive.hpp"
#include <algorithm>
#include <map>
#include <nlohmann/json.hpp>

namespace xfer {

namespace {

bool isDriverError(const TransferException& e) {
    return e.getCode() == ErrorCode::DATABASE_ERROR;
}

std::string bracketed(const std::string& database, const std::string& collection) {
    return "[" + database + "." + collection + "] ";
}

nlohmann::json parseDocument(std::string_view line) {
    return nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
}

bool isDocument(const nlohmann::json& doc) {
    return !doc.is_discarded() && doc.is_object();
}

} // namespace

NativeImporter::NativeImporter(DocumentDatabase& database, ProgressEmitter& emitter,
                               const TransferConfig& config)
    : database_(database), emitter_(emitter), config_(config) {}

void NativeImporter::warn(const std::string& jobId, const std::string& database,
                          const std::string& collection, const std::string& message,
                          std::optional<int64_t> skipped) {
    IMPORT_LOG_WARN_JOB("{}{}{}: {}", jobId, database, collection.empty() ? "" : ".", collection,
                        message);
    emitter_.emitWarning(TransferDirection::IMPORT,
                         TransferWarning{jobId, database, collection, message, skipped});
}

std::vector<ManifestDatabase>
NativeImporter::selectDatabases(const ExportManifest& manifest,
                                const NativeImportOptions& options) const {
    std::vector<ManifestDatabase> selected;
    for (const auto& db : manifest.databases) {
        if (options.databases.empty() ||
            std::find(options.databases.begin(), options.databases.end(), db.name) !=
                options.databases.end()) {
            selected.push_back(db);
        }
    }
    for (const auto& requested : options.databases) {
        bool present = std::any_of(selected.begin(), selected.end(),
                                   [&requested](const auto& db) { return db.name == requested; });
        if (!present) {
            IMPORT_LOG_WARN("Database {} is not in {}", requested, options.inputPath);
        }
    }
    if (selected.empty()) {
        throw ValidationException(ErrorCode::INVALID_INPUT, "no databases selected for import",
                                  "databases");
    }
    return selected;
}

bool NativeImporter::forEachLine(const ZipReader& reader, const std::string& database,
                                 const std::string& collection, ImportResult& result,
                                 const LineHandler& onLine) {
    const auto entry = nativeEntryPath(database, collection, DOCUMENTS_ENTRY);
    if (!reader.contains(entry)) {
        result.addError("missing documents file for " + database + "." + collection);
        return false;
    }

    auto deliver = [&onLine](std::string_view line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            onLine(line);
        }
    };

    // A line may straddle chunk boundaries
    std::string pending;
    try {
        reader.stream(entry, [&](std::string_view chunk) {
            size_t start = 0;
            size_t newline = 0;
            while ((newline = chunk.find('\n', start)) != std::string_view::npos) {
                auto piece = chunk.substr(start, newline - start);
                if (pending.empty()) {
                    deliver(piece);
                } else {
                    pending.append(piece);
                    deliver(pending);
                    pending.clear();
                }
                start = newline + 1;
            }
            pending.append(chunk.substr(start));
        });
    } catch (const SystemException& e) {
        if (e.getCode() != ErrorCode::ARCHIVE_ERROR) {
            throw;
        }
        result.addError("failed to read documents for " + database + "." + collection + ": " +
                        e.getMessage());
        return false;
    }
    deliver(pending);
    return true;
}

ImportResult NativeImporter::importDatabases(const std::string& jobId,
                                             const NativeImportOptions& options,
                                             const CancellationToken& token, PauseGate& gate) {
    if (options.inputPath.empty()) {
        throw ValidationException(ErrorCode::MISSING_FIELD, "input path is required",
                                  "inputPath");
    }

    auto selected = selectDatabases(readManifest(options.inputPath), options);
    ZipReader reader(options.inputPath);
    const int batchTotal = static_cast<int>(selected.size());

    int64_t totalRecords = 0;
    for (const auto& db : selected) {
        for (const auto& coll : db.collections) {
            totalRecords += coll.recordCount;
        }
    }

    IMPORT_LOG_INFO_JOB("Importing {} database(s), {} documents from {} in {} mode", jobId,
                        batchTotal, totalRecords, options.inputPath,
                        importModeToString(options.mode));

    RecordPoller poller(gate, token, config_.pollIntervalRecords);
    ImportResult result;
    int64_t processed = 0;

    try {
        for (size_t dbIndex = 0; dbIndex < selected.size(); ++dbIndex) {
            const auto& db = selected[dbIndex];
            if (!poller.checkNow()) {
                throw CancelledException(jobId);
            }

            ProgressEvent progress;
            progress.jobId = jobId;
            progress.database = db.name;
            progress.batchIndex = static_cast<int>(dbIndex) + 1;
            progress.batchTotal = batchTotal;
            progress.processedRecords = processed;
            progress.totalRecords = totalRecords;

            if (options.mode == ImportMode::OVERRIDE) {
                progress.phase = TransferPhase::DROPPING;
                emitter_.emitProgress(TransferDirection::IMPORT, progress);
                try {
                    database_.dropDatabase(db.name);
                } catch (const TransferException& e) {
                    if (!isDriverError(e)) {
                        throw;
                    }
                    result.addError("failed to drop database " + db.name + ": " +
                                    e.getMessage());
                    warn(jobId, db.name, "", "failed to drop database: " + e.getMessage());
                }
            }

            DatabaseImportResult dbResult;
            dbResult.name = db.name;
            for (const auto& coll : db.collections) {
                progress.phase = TransferPhase::IMPORTING;
                progress.collection = coll.name;
                progress.current = 0;
                progress.total = coll.recordCount;
                progress.processedRecords = processed;
                emitter_.emitProgress(TransferDirection::IMPORT, progress);

                CollectionImportResult collResult;
                collResult.name = coll.name;
                processed += importCollection(reader, jobId, db.name, coll, progress, poller,
                                              collResult, result);

                result.recordsInserted += collResult.recordsInserted;
                result.recordsSkipped += collResult.recordsSkipped;
                result.recordsFailed += collResult.recordsFailed;
                result.parseErrors += collResult.parseErrors;
                dbResult.collections.push_back(std::move(collResult));
            }
            result.databases.push_back(std::move(dbResult));
        }
    } catch (const CancelledException&) {
        IMPORT_LOG_INFO_JOB("Import cancelled, {} documents were already inserted", jobId,
                            result.recordsInserted);
        emitter_.emitCancelled(TransferDirection::IMPORT, jobId);
        throw;
    } catch (const std::exception& e) {
        IMPORT_LOG_ERROR_JOB("Import failed after {} inserted documents: {}", jobId,
                             result.recordsInserted, e.what());
        throw;
    }

    if (result.parseErrors > 0) {
        result.addError(std::to_string(result.parseErrors) +
                        " document(s) failed to parse and were skipped");
    }

    ProgressEvent finalizing;
    finalizing.jobId = jobId;
    finalizing.phase = TransferPhase::FINALIZING;
    finalizing.current = processed;
    finalizing.total = totalRecords;
    finalizing.batchIndex = batchTotal;
    finalizing.batchTotal = batchTotal;
    finalizing.processedRecords = processed;
    finalizing.totalRecords = totalRecords;
    emitter_.emitProgress(TransferDirection::IMPORT, finalizing);

    nlohmann::json payload = result;
    payload["jobId"] = jobId;
    payload["dryRun"] = false;
    emitter_.emitComplete(TransferDirection::IMPORT, std::move(payload));

    IMPORT_LOG_INFO_JOB("Import complete: {} inserted, {} skipped, {} failed, {} unparseable",
                        jobId, result.recordsInserted, result.recordsSkipped,
                        result.recordsFailed, result.parseErrors);
    return result;
}

int64_t NativeImporter::importCollection(const ZipReader& reader, const std::string& jobId,
                                         const std::string& database,
                                         const ManifestCollection& collection,
                                         ProgressEvent progress, RecordPoller& poller,
                                         CollectionImportResult& collResult,
                                         ImportResult& result) {
    const auto& name = collection.name;
    const int64_t processedBefore = progress.processedRecords;
    const auto progressInterval =
        static_cast<int64_t>(std::max<size_t>(config_.progressIntervalRecords, 1));

    std::vector<std::string> batch;
    batch.reserve(INSERT_BATCH_SIZE);
    int64_t lines = 0;

    auto flush = [&] {
        if (batch.empty()) {
            return;
        }
        auto outcome = database_.insertMany(database, name, batch);
        batch.clear();
        collResult.recordsInserted += outcome.inserted;
        collResult.recordsSkipped += outcome.duplicates;
        collResult.recordsFailed += outcome.failed;
        collResult.parseErrors += outcome.undecodable;
        for (const auto& error : outcome.errors) {
            result.addError(bracketed(database, name) + error);
        }
    };

    bool readAll = forEachLine(reader, database, name, result, [&](std::string_view line) {
        if (!poller.tick()) {
            throw CancelledException(jobId);
        }
        ++lines;
        if (isDocument(parseDocument(line))) {
            batch.emplace_back(line);
            if (batch.size() >= INSERT_BATCH_SIZE) {
                flush();
            }
        } else {
            ++collResult.parseErrors;
        }
        if (lines % progressInterval == 0) {
            progress.current = lines;
            progress.processedRecords = processedBefore + lines;
            emitter_.emitProgress(TransferDirection::IMPORT, progress);
        }
    });
    flush();

    progress.current = lines;
    progress.processedRecords = processedBefore + lines;
    emitter_.emitProgress(TransferDirection::IMPORT, progress);

    if (collResult.parseErrors > 0) {
        warn(jobId, database, name,
             std::to_string(collResult.parseErrors) +
                 " document(s) failed to parse and were skipped",
             collResult.parseErrors);
    }
    if (readAll) {
        createIndexes(reader, database, name, collResult, result);
    }

    IMPORT_LOG_DEBUG("Imported {}.{}: {} inserted, {} skipped, {} failed", database, name,
                     collResult.recordsInserted, collResult.recordsSkipped,
                     collResult.recordsFailed);
    return lines;
}

void NativeImporter::createIndexes(const ZipReader& reader, const std::string& database,
                                   const std::string& collection,
                                   CollectionImportResult& collResult, ImportResult& result) {
    const auto entry = nativeEntryPath(database, collection, INDEXES_ENTRY);
    if (!reader.contains(entry)) {
        return;
    }

    nlohmann::json specs;
    try {
        specs = nlohmann::json::parse(reader.read(entry), nullptr, false);
    } catch (const SystemException& e) {
        if (e.getCode() != ErrorCode::ARCHIVE_ERROR) {
            throw;
        }
        result.addError(bracketed(database, collection) + "failed to read indexes: " +
                        e.getMessage());
        return;
    }
    if (!specs.is_array()) {
        result.addError(bracketed(database, collection) + "unreadable index list");
        return;
    }

    for (auto& spec : specs) {
        if (!spec.is_object() || !spec.contains("key") || !spec["key"].is_object()) {
            IMPORT_LOG_WARN("Skipping index without key on {}.{}", database, collection);
            continue;
        }
        const std::string indexName =
            spec.contains("name") && spec["name"].is_string() ? spec["name"].get<std::string>()
                                                              : "";
        if (indexName == "_id_") {
            continue;
        }
        // Server-assigned fields the createIndexes command rejects
        spec.erase("v");
        spec.erase("ns");

        try {
            database_.createIndex(database, collection, spec.dump());
        } catch (const TransferException& e) {
            if (!isDriverError(e)) {
                throw;
            }
            auto message = "Failed to create index '" + indexName + "': " + e.getMessage();
            collResult.indexErrors.push_back(message);
            result.addError(bracketed(database, collection) + message);
        }
    }
}

ImportResult NativeImporter::dryRun(const std::string& jobId, const NativeImportOptions& options,
                                    const CancellationToken& token, PauseGate& gate) {
    if (options.inputPath.empty()) {
        throw ValidationException(ErrorCode::MISSING_FIELD, "input path is required",
                                  "inputPath");
    }

    auto selected = selectDatabases(readManifest(options.inputPath), options);
    ZipReader reader(options.inputPath);
    const int batchTotal = static_cast<int>(selected.size());

    IMPORT_LOG_INFO_JOB("Dry run over {} database(s) from {} in {} mode", jobId, batchTotal,
                        options.inputPath, importModeToString(options.mode));

    RecordPoller poller(gate, token, config_.pollIntervalRecords);
    ImportResult result;

    try {
        for (size_t dbIndex = 0; dbIndex < selected.size(); ++dbIndex) {
            const auto& db = selected[dbIndex];
            if (!poller.checkNow()) {
                throw CancelledException(jobId);
            }

            ProgressEvent progress;
            progress.jobId = jobId;
            progress.phase = TransferPhase::ANALYZING;
            progress.database = db.name;
            progress.batchIndex = static_cast<int>(dbIndex) + 1;
            progress.batchTotal = batchTotal;
            emitter_.emitProgress(TransferDirection::IMPORT, progress);

            if (options.mode == ImportMode::OVERRIDE) {
                result.databases.push_back(analyzeOverride(jobId, db, result));
                continue;
            }

            DatabaseImportResult dbResult;
            dbResult.name = db.name;
            for (const auto& coll : db.collections) {
                progress.collection = coll.name;
                progress.current = 0;
                progress.total = coll.recordCount;
                emitter_.emitProgress(TransferDirection::IMPORT, progress);

                CollectionImportResult collResult;
                collResult.name = coll.name;
                analyzeSkip(reader, jobId, db.name, coll, progress, poller, collResult, result);

                result.recordsInserted += collResult.recordsInserted;
                result.recordsSkipped += collResult.recordsSkipped;
                result.parseErrors += collResult.parseErrors;
                dbResult.collections.push_back(std::move(collResult));
            }
            result.databases.push_back(std::move(dbResult));
        }
    } catch (const CancelledException&) {
        IMPORT_LOG_INFO_JOB("Dry run cancelled", jobId);
        emitter_.emitCancelled(TransferDirection::IMPORT, jobId);
        throw;
    }

    if (result.parseErrors > 0) {
        result.addError(std::to_string(result.parseErrors) +
                        " document(s) failed to parse and were skipped");
    }

    nlohmann::json payload = result;
    payload["jobId"] = jobId;
    payload["dryRun"] = true;
    emitter_.emitComplete(TransferDirection::IMPORT, std::move(payload));

    IMPORT_LOG_INFO_JOB("Dry run complete: {} would be inserted, {} skipped, {} dropped", jobId,
                        result.recordsInserted, result.recordsSkipped, result.documentsDropped);
    return result;
}

DatabaseImportResult NativeImporter::analyzeOverride(const std::string& jobId,
                                                     const ManifestDatabase& database,
                                                     ImportResult& result) {
    DatabaseImportResult dbResult;
    dbResult.name = database.name;

    std::map<std::string, int64_t> stored;
    try {
        for (const auto& info : database_.listCollections(database.name)) {
            if (info.isView() || info.name.rfind("system.", 0) == 0) {
                continue;
            }
            int64_t count = 0;
            try {
                count = database_.estimatedDocumentCount(database.name, info.name);
            } catch (const TransferException& e) {
                if (!isDriverError(e)) {
                    throw;
                }
                IMPORT_LOG_WARN("No count for {}.{}: {}", database.name, info.name,
                                e.getMessage());
            }
            stored[info.name] = count;
            dbResult.currentCount += count;
        }
    } catch (const TransferException& e) {
        if (!isDriverError(e)) {
            throw;
        }
        warn(jobId, database.name, "", "failed to list collections: " + e.getMessage());
    }
    result.documentsDropped += dbResult.currentCount;

    // Everything in the archive lands in an empty database
    for (const auto& coll : database.collections) {
        CollectionImportResult collResult;
        collResult.name = coll.name;
        collResult.recordsInserted = coll.recordCount;
        if (auto it = stored.find(coll.name); it != stored.end()) {
            collResult.currentCount = it->second;
        }
        result.recordsInserted += coll.recordCount;
        dbResult.collections.push_back(std::move(collResult));
    }
    return dbResult;
}

int64_t NativeImporter::analyzeSkip(const ZipReader& reader, const std::string& jobId,
                                    const std::string& database,
                                    const ManifestCollection& collection, ProgressEvent progress,
                                    RecordPoller& poller, CollectionImportResult& collResult,
                                    ImportResult& result) {
    const auto& name = collection.name;
    const auto progressInterval =
        static_cast<int64_t>(std::max<size_t>(config_.progressIntervalRecords, 1));

    std::vector<std::string> ids;
    int64_t lines = 0;

    auto lookup = [&] {
        if (ids.empty()) {
            return;
        }
        int64_t existing = 0;
        try {
            existing = database_.countExisting(database, name, ids);
        } catch (const TransferException& e) {
            if (!isDriverError(e)) {
                throw;
            }
            result.addError(bracketed(database, name) +
                            "failed to look up existing documents: " + e.getMessage());
        }
        collResult.recordsSkipped += existing;
        collResult.recordsInserted += static_cast<int64_t>(ids.size()) - existing;
        ids.clear();
    };

    forEachLine(reader, database, name, result, [&](std::string_view line) {
        if (!poller.tick()) {
            throw CancelledException(jobId);
        }
        ++lines;
        auto doc = parseDocument(line);
        if (!isDocument(doc)) {
            ++collResult.parseErrors;
        } else if (!doc.contains("_id")) {
            // The server assigns a fresh _id, so it always inserts
            ++collResult.recordsInserted;
        } else {
            ids.push_back(doc.at("_id").dump());
            if (ids.size() >= ID_LOOKUP_BATCH_SIZE) {
                lookup();
            }
        }
        if (lines % progressInterval == 0) {
            progress.current = lines;
            emitter_.emitProgress(TransferDirection::IMPORT, progress);
        }
    });
    lookup();

    progress.current = lines;
    emitter_.emitProgress(TransferDirection::IMPORT, progress);
    return lines;
}

NativeImportPreview previewNativeImport(const std::string& archivePath) {
    auto manifest = readManifest(archivePath);
    if (manifest.databases.empty()) {
        throw SystemException(ErrorCode::ARCHIVE_ERROR, "no databases found in " + archivePath,
                              "NativeImporter", {{"path", archivePath}});
    }

    NativeImportPreview preview;
    preview.filePath = archivePath;
    preview.exportedAt = manifest.exportedAt;
    for (const auto& db : manifest.databases) {
        NativeImportPreviewDatabase entry;
        entry.name = db.name;
        entry.collectionCount = db.collections.size();
        for (const auto& coll : db.collections) {
            entry.documentCount += coll.recordCount;
        }
        preview.databases.push_back(std::move(entry));
    }
    return preview;
}

} // namespace xfer
