#include "transfer_models.hpp"
#include "transfer_exceptions.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace xfer {

std::string transferPhaseToString(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::EXPORTING: return "exporting";
        case TransferPhase::IMPORTING: return "importing";
        case TransferPhase::ANALYZING: return "analyzing";
        case TransferPhase::DOWNLOADING: return "downloading";
        case TransferPhase::WRITING: return "writing";
        case TransferPhase::FINALIZING: return "finalizing";
        case TransferPhase::DROPPING: return "dropping";
    }
    return "exporting";
}

void ImportResult::addError(const std::string& error) {
    if (knownErrors_.count(error) > 0) {
        return;
    }
    if (errors.size() >= MAX_ERRORS) {
        ++omittedErrors;
        return;
    }
    knownErrors_.insert(error);
    errors.push_back(error);
}

void ImportResult::merge(const ImportResult& other) {
    recordsInserted += other.recordsInserted;
    recordsFailed += other.recordsFailed;
    recordsSkipped += other.recordsSkipped;
    parseErrors += other.parseErrors;
    documentsDropped += other.documentsDropped;
    databases.insert(databases.end(), other.databases.begin(), other.databases.end());
    for (const auto& error : other.errors) {
        addError(error);
    }
    omittedErrors += other.omittedErrors;
}

std::string importModeToString(ImportMode mode) {
    return mode == ImportMode::OVERRIDE ? "override" : "skip";
}

ImportMode parseImportMode(const std::string& value) {
    if (value == "skip") {
        return ImportMode::SKIP;
    }
    if (value == "override") {
        return ImportMode::OVERRIDE;
    }
    throw createValidationError("mode", value, "expected skip or override");
}

size_t ArchivePreview::namespaceCount() const {
    size_t count = 0;
    for (const auto& db : databases) {
        count += db.collections.size();
    }
    return count;
}

const ManifestCollection* ExportManifest::findCollection(const std::string& database,
                                                         const std::string& collection) const {
    for (const auto& db : databases) {
        if (db.name != database) {
            continue;
        }
        for (const auto& coll : db.collections) {
            if (coll.name == collection) {
                return &coll;
            }
        }
    }
    return nullptr;
}

std::string formatTimestampUtc(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void to_json(nlohmann::json& j, const ProgressEvent& event) {
    j = nlohmann::json{
        {"jobId", event.jobId},
        {"phase", transferPhaseToString(event.phase)},
        {"database", event.database},
        {"collection", event.collection},
        {"current", event.current},
        {"total", event.total},
        {"batchIndex", event.batchIndex},
        {"batchTotal", event.batchTotal},
        {"processedRecords", event.processedRecords},
        {"totalRecords", event.totalRecords}
    };
}

void to_json(nlohmann::json& j, const CollectionImportResult& result) {
    j = nlohmann::json{
        {"name", result.name},
        {"recordsInserted", result.recordsInserted},
        {"recordsFailed", result.recordsFailed},
        {"recordsSkipped", result.recordsSkipped},
        {"parseErrors", result.parseErrors},
        {"currentCount", result.currentCount},
        {"indexErrors", result.indexErrors}
    };
}

void to_json(nlohmann::json& j, const DatabaseImportResult& result) {
    j = nlohmann::json{
        {"name", result.name},
        {"collections", result.collections},
        {"currentCount", result.currentCount}
    };
}

void to_json(nlohmann::json& j, const ImportResult& result) {
    j = nlohmann::json{
        {"databases", result.databases},
        {"recordsInserted", result.recordsInserted},
        {"recordsFailed", result.recordsFailed},
        {"recordsSkipped", result.recordsSkipped},
        {"parseErrors", result.parseErrors},
        {"documentsDropped", result.documentsDropped},
        {"errors", result.errors},
        {"omittedErrors", result.omittedErrors}
    };
}

void to_json(nlohmann::json& j, const ArchivePreviewCollection& collection) {
    j = nlohmann::json{{"name", collection.name}};
}

void to_json(nlohmann::json& j, const ArchivePreviewDatabase& database) {
    j = nlohmann::json{{"name", database.name}, {"collections", database.collections}};
}

void to_json(nlohmann::json& j, const ArchivePreview& preview) {
    j = nlohmann::json{{"databases", preview.databases}};
}

void to_json(nlohmann::json& j, const ManifestCollection& collection) {
    j = nlohmann::json{
        {"name", collection.name},
        {"recordCount", collection.recordCount},
        {"indexCount", collection.indexCount}
    };
}

void to_json(nlohmann::json& j, const ManifestDatabase& database) {
    j = nlohmann::json{{"name", database.name}, {"collections", database.collections}};
}

void to_json(nlohmann::json& j, const ExportManifest& manifest) {
    j = nlohmann::json{
        {"version", manifest.version},
        {"exportedAt", manifest.exportedAt},
        {"databases", manifest.databases}
    };
}

void to_json(nlohmann::json& j, const NativeImportPreviewDatabase& database) {
    j = nlohmann::json{
        {"name", database.name},
        {"collectionCount", database.collectionCount},
        {"documentCount", database.documentCount}
    };
}

void to_json(nlohmann::json& j, const NativeImportPreview& preview) {
    j = nlohmann::json{
        {"filePath", preview.filePath},
        {"exportedAt", preview.exportedAt},
        {"databases", preview.databases}
    };
}

void to_json(nlohmann::json& j, const ToolStatus& status) {
    j = nlohmann::json{
        {"available", status.available},
        {"path", status.path},
        {"version", status.version}
    };
}

void to_json(nlohmann::json& j, const ToolAvailability& availability) {
    j = nlohmann::json{
        {"mongodump", availability.mongodump},
        {"mongorestore", availability.mongorestore},
        {"installUrl", availability.installUrl}
    };
}

void from_json(const nlohmann::json& j, ManifestCollection& collection) {
    j.at("name").get_to(collection.name);
    collection.recordCount = j.value("recordCount", int64_t{0});
    collection.indexCount = j.value("indexCount", 0);
}

void from_json(const nlohmann::json& j, ManifestDatabase& database) {
    j.at("name").get_to(database.name);
    database.collections = j.value("collections", std::vector<ManifestCollection>{});
}

void from_json(const nlohmann::json& j, ExportManifest& manifest) {
    j.at("version").get_to(manifest.version);
    manifest.exportedAt = j.value("exportedAt", std::string());
    manifest.databases = j.value("databases", std::vector<ManifestDatabase>{});
}

} // namespace xfer
