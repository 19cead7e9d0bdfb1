#pragma once

#include "uri_builder.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xfer {

struct CollectionInfo {
  std::string name;
  std::string type; // "collection", "view", "timeseries"

  bool isView() const { return type == "view"; }
};

// Forward-only cursor over a collection
class DocumentCursor {
public:
  virtual ~DocumentCursor() = default;

  // Advances to the next document. Throws SystemException(DATABASE_ERROR) on
  // a server or network failure.
  virtual bool next() = 0;

  // Canonical extended JSON of the current document, nullopt when it cannot
  // be decoded or serialized
  virtual std::optional<std::string> currentJson() = 0;
};

// Per-batch outcome of an unordered insert
struct InsertOutcome {
  int64_t inserted = 0;
  int64_t duplicates = 0;  // rejected for an _id that already exists
  int64_t failed = 0;      // rejected by the server for any other reason
  int64_t undecodable = 0; // not valid extended JSON, never sent
  std::vector<std::string> errors;
};

/**
 * Database driver seam used by the native exporter and importer and by the
 * tool URI builder (as its SASL mechanism lookup). Every call may throw
 * SystemException(DATABASE_ERROR).
 */
class DocumentDatabase : public AuthMechanismProbe {
public:
  virtual std::vector<CollectionInfo>
  listCollections(const std::string &database) = 0;

  virtual int64_t estimatedDocumentCount(const std::string &database,
                                         const std::string &collection) = 0;

  // Every document of the collection, no limit
  virtual std::unique_ptr<DocumentCursor>
  find(const std::string &database, const std::string &collection) = 0;

  // Index specifications as relaxed JSON objects, including _id_
  virtual std::vector<std::string>
  listIndexes(const std::string &database, const std::string &collection) = 0;

  // Unordered insert of canonical extended-JSON documents. Per-document
  // rejections are counted in the outcome; only a failure of the whole
  // command throws.
  virtual InsertOutcome insertMany(const std::string &database,
                                   const std::string &collection,
                                   const std::vector<std::string> &documents) = 0;

  virtual void dropDatabase(const std::string &database) = 0;

  // How many of the given _id values (extended JSON) are already stored
  virtual int64_t countExisting(const std::string &database,
                                const std::string &collection,
                                const std::vector<std::string> &ids) = 0;

  // Spec as listIndexes reports it, without "v" and "ns"
  virtual void createIndex(const std::string &database,
                           const std::string &collection,
                           const std::string &spec) = 0;
};

} // namespace xfer
