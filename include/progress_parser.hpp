#pragma once

#include "transfer_models.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace xfer {

// Line shapes recognized on the dump/restore tools' diagnostic stream
enum class ToolLineKind {
  DUMP_DONE,         // done dumping db.coll (N documents)
  RESTORE_FINISHED,  // finished restoring db.coll (N documents, M failures)
  RESTORE_SUCCEEDED, // N document(s) restored successfully
  RESTORE_FAILED,    // N document(s) failed to restore
  CONTINUING_ERROR,  // continuing through error: ...
  ARCHIVE_PRELUDE,   // archive prelude db.coll
};

struct ToolLineMatch {
  ToolLineKind kind;
  std::string database;
  std::string collection;
  int64_t count = 0;
  int64_t failures = 0;
};

/**
 * Matches one diagnostic line against the line-shape table. A line can carry
 * several shapes (the restore summary reports successes and failures on one
 * line), so every match is returned in table order. Unmatched lines yield an
 * empty vector and are opaque context only.
 */
std::vector<ToolLineMatch> matchToolLine(const std::string &line);

// Tool lines that carry an error message worth surfacing
bool isToolErrorLine(const std::string &line);

// Fixed-capacity ring of the most recent diagnostic lines
class DiagnosticTail {
public:
  explicit DiagnosticTail(size_t capacity = 10);

  void push(const std::string &line);
  void clear();

  bool empty() const { return lines_.empty(); }
  size_t size() const { return lines_.size(); }
  size_t capacity() const { return capacity_; }

  std::vector<std::string> lines() const;
  // Newline-joined with credentials masked
  std::string maskedText() const;

private:
  size_t capacity_;
  std::deque<std::string> lines_;
};

// Namespaces completed by the dump tool during one job
class DumpAccumulator {
public:
  // Returns the completed namespace when the line reports one
  std::optional<ToolLineMatch> consume(const std::string &line);

  int64_t namespacesDone() const { return namespacesDone_; }
  int64_t recordsDumped() const { return recordsDumped_; }

private:
  int64_t namespacesDone_ = 0;
  int64_t recordsDumped_ = 0;
};

/**
 * Builds an ImportResult from restore output. Per-collection lines add to the
 * running counters; the tool's closing summary lines replace them. Error
 * lines are masked and kept once per exact text.
 */
class RestoreAccumulator {
public:
  // Returns the finished collection when the line reports one
  std::optional<ToolLineMatch> consume(const std::string &line);

  const ImportResult &result() const { return result_; }
  ImportResult takeResult() { return std::move(result_); }

private:
  ImportResult result_;

  DatabaseImportResult &databaseEntry(const std::string &name);
};

// Namespaces listed by a verbose dry-run restore, deduplicated in first-seen
// order
class PreviewAccumulator {
public:
  // True when the line introduced a namespace not seen before
  bool consume(const std::string &line);

  const ArchivePreview &preview() const { return preview_; }
  bool empty() const { return preview_.databases.empty(); }

private:
  ArchivePreview preview_;
  std::set<std::string> seen_;
};

} // namespace xfer
