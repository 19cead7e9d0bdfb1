#pragma once

#include "document_database.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace xfer {

/**
 * libmongoc-backed DocumentDatabase. Operations borrow a client from a
 * thread-safe pool, so one instance can serve the exporter and the auth
 * mechanism lookup concurrently. Cursors keep their client until destroyed.
 */
class MongoDatabase : public DocumentDatabase {
public:
  // Throws SystemException(DATABASE_ERROR) for an unparseable connection
  // string. Connecting is lazy.
  explicit MongoDatabase(const std::string &connectionString);
  ~MongoDatabase() override;

  MongoDatabase(const MongoDatabase &) = delete;
  MongoDatabase &operator=(const MongoDatabase &) = delete;

  void ping();

  std::vector<CollectionInfo>
  listCollections(const std::string &database) override;
  int64_t estimatedDocumentCount(const std::string &database,
                                 const std::string &collection) override;
  std::unique_ptr<DocumentCursor> find(const std::string &database,
                                       const std::string &collection) override;
  std::vector<std::string> listIndexes(const std::string &database,
                                       const std::string &collection) override;
  InsertOutcome insertMany(const std::string &database,
                           const std::string &collection,
                           const std::vector<std::string> &documents) override;
  void dropDatabase(const std::string &database) override;
  int64_t countExisting(const std::string &database,
                        const std::string &collection,
                        const std::vector<std::string> &ids) override;
  void createIndex(const std::string &database, const std::string &collection,
                   const std::string &spec) override;

  std::vector<std::string>
  saslSupportedMechanisms(const std::string &userNamespace,
                          std::chrono::milliseconds timeout) override;

private:
  struct Impl;
  std::shared_ptr<Impl> pImpl;
};

} // namespace xfer
