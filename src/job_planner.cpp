#include "job_planner.hpp"
#include "string_utils.hpp"
#include "transfer_exceptions.hpp"

namespace xfer {

std::string TransferJob::describe() const {
    std::string result = database.value_or("");
    if (collection) {
        result += "." + *collection;
    }
    return result;
}

std::filesystem::path JobBatch::artifactPathFor(size_t index) const {
    if (index >= jobs.size()) {
        throw ValidationException(ErrorCode::INVALID_RANGE,
                                  "job index out of range: " + std::to_string(index),
                                  "index", std::to_string(index));
    }
    if (!multiFile) {
        return outputPath;
    }

    const auto& job = jobs[index];
    std::string name = job.database.value_or("all");
    if (job.collection) {
        name += "." + *job.collection;
    }
    return outputPath / (name + extension);
}

JobPlanner::JobPlanner(std::string archiveExtension)
    : archiveExtension_(std::move(archiveExtension)) {}

std::vector<TransferJob> JobPlanner::planJobs(const DumpSelection& selection) const {
    std::vector<TransferJob> jobs;

    if (!selection.databaseExclusions.empty()) {
        for (const auto& [db, excluded] : selection.databaseExclusions) {
            jobs.push_back({db, std::nullopt, excluded});
        }
    } else if (!selection.database.empty() && !selection.excludeCollections.empty()) {
        jobs.push_back({selection.database, std::nullopt, selection.excludeCollections});
    } else if (!selection.database.empty() && !selection.collections.empty()) {
        for (const auto& coll : selection.collections) {
            jobs.push_back({selection.database, coll, {}});
        }
    } else if (!selection.database.empty()) {
        jobs.push_back({selection.database, std::nullopt, {}});
    } else if (!selection.databases.empty()) {
        for (const auto& db : selection.databases) {
            jobs.push_back({db, std::nullopt, {}});
        }
    } else {
        jobs.push_back({});
    }

    return jobs;
}

JobBatch JobPlanner::planBatch(const DumpSelection& selection,
                               const std::filesystem::path& requestedOutput) const {
    return layoutBatch(planJobs(selection), requestedOutput);
}

JobBatch JobPlanner::layoutBatch(std::vector<TransferJob> jobs,
                                 const std::filesystem::path& requestedOutput) const {
    if (requestedOutput.empty()) {
        throw ValidationException(ErrorCode::MISSING_FIELD, "output path is required",
                                  "outputPath");
    }

    JobBatch batch;
    batch.jobs = std::move(jobs);
    batch.multiFile = batch.jobs.size() > 1;
    batch.extension = archiveExtension_;

    std::string path = requestedOutput.string();
    if (batch.multiFile) {
        for (const std::string ext : {archiveExtension_, std::string(".gz")}) {
            if (string_utils::iends_with(path, ext)) {
                path.resize(path.size() - ext.size());
                break;
            }
        }
    } else if (!string_utils::iends_with(path, archiveExtension_)) {
        path += archiveExtension_;
    }
    batch.outputPath = path;

    return batch;
}

} // namespace xfer
