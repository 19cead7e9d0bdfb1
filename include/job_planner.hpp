#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace xfer {

// A user selection of what to transfer
struct DumpSelection {
  std::string database;
  std::vector<std::string> collections;
  std::vector<std::string> excludeCollections;
  std::vector<std::string> databases;
  // database -> collections to exclude
  std::map<std::string, std::vector<std::string>> databaseExclusions;
};

// One atomic unit of work
struct TransferJob {
  std::optional<std::string> database;
  std::optional<std::string> collection;
  std::vector<std::string> excludedCollections;

  // "db", "db.coll" or "" for a whole-server job
  std::string describe() const;
  bool operator==(const TransferJob &other) const = default;
};

// Jobs sharing one output target
struct JobBatch {
  std::vector<TransferJob> jobs;
  // Directory when multiFile, otherwise the single output file
  std::filesystem::path outputPath;
  bool multiFile = false;
  std::string extension = ".archive";

  size_t size() const { return jobs.size(); }
  std::filesystem::path artifactPathFor(size_t index) const;
};

class JobPlanner {
public:
  explicit JobPlanner(std::string archiveExtension = ".archive");

  /**
   * Expands a selection into ordered jobs. First matching rule wins:
   *  1. per-database exclusion map: one job per database with its exclusions
   *  2. one database with exclusions: one job
   *  3. one database with collections: one job per collection, in order
   *  4. one database: one job
   *  5. several databases: one job per database
   *  6. nothing: a single whole-server job
   */
  std::vector<TransferJob> planJobs(const DumpSelection &selection) const;

  /**
   * More than one job: outputPath loses a trailing ".archive" or ".gz" and
   * becomes a directory holding one file per job. Exactly one job: the
   * archive extension is appended unless already present.
   */
  JobBatch planBatch(const DumpSelection &selection,
                     const std::filesystem::path &requestedOutput) const;

  JobBatch layoutBatch(std::vector<TransferJob> jobs,
                       const std::filesystem::path &requestedOutput) const;

private:
  std::string archiveExtension_;
};

} // namespace xfer
