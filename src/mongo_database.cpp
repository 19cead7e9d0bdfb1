#include "mongo_database.hpp"
#include "credential_masker.hpp"
#include "logger.hpp"
#include "transfer_exceptions.hpp"
#include <mongoc/mongoc.h>

namespace xfer {

namespace {

// mongoc_init/mongoc_cleanup exactly once per process
struct DriverLifetime {
    DriverLifetime() { mongoc_init(); }
    ~DriverLifetime() { mongoc_cleanup(); }
};

void ensureDriver() {
    static DriverLifetime lifetime;
}

struct UriDeleter {
    void operator()(mongoc_uri_t* uri) const { mongoc_uri_destroy(uri); }
};
struct PoolDeleter {
    void operator()(mongoc_client_pool_t* pool) const { mongoc_client_pool_destroy(pool); }
};
struct ClientDeleter {
    void operator()(mongoc_client_t* client) const { mongoc_client_destroy(client); }
};
struct DatabaseDeleter {
    void operator()(mongoc_database_t* db) const { mongoc_database_destroy(db); }
};
struct CollectionDeleter {
    void operator()(mongoc_collection_t* coll) const { mongoc_collection_destroy(coll); }
};
struct CursorDeleter {
    void operator()(mongoc_cursor_t* cursor) const { mongoc_cursor_destroy(cursor); }
};
struct BsonDeleter {
    void operator()(bson_t* doc) const { bson_destroy(doc); }
};

using UriPtr = std::unique_ptr<mongoc_uri_t, UriDeleter>;
using PoolPtr = std::unique_ptr<mongoc_client_pool_t, PoolDeleter>;
using ClientPtr = std::unique_ptr<mongoc_client_t, ClientDeleter>;
using DatabasePtr = std::unique_ptr<mongoc_database_t, DatabaseDeleter>;
using CollectionPtr = std::unique_ptr<mongoc_collection_t, CollectionDeleter>;
using CursorPtr = std::unique_ptr<mongoc_cursor_t, CursorDeleter>;
using BsonPtr = std::unique_ptr<bson_t, BsonDeleter>;

constexpr int64_t DUPLICATE_KEY_CODE = 11000;

SystemException driverError(const std::string& operation, const bson_error_t& error) {
    return createSystemError(ErrorCode::DATABASE_ERROR, "MongoDatabase",
                             operation + ": " + maskCredentials(error.message));
}

std::string utf8Field(const bson_t* doc, const char* key) {
    bson_iter_t iter;
    if (bson_iter_init_find(&iter, doc, key) && BSON_ITER_HOLDS_UTF8(&iter)) {
        return bson_iter_utf8(&iter, nullptr);
    }
    return "";
}

std::optional<std::string> toJson(const bson_t* doc, bool canonical) {
    size_t length = 0;
    char* json = canonical ? bson_as_canonical_extended_json(doc, &length)
                           : bson_as_relaxed_extended_json(doc, &length);
    if (!json) {
        return std::nullopt;
    }
    std::string result(json, length);
    bson_free(json);
    return result;
}

BsonPtr fromJson(const std::string& json, bson_error_t& error) {
    return BsonPtr(bson_new_from_json(reinterpret_cast<const uint8_t*>(json.data()),
                                      static_cast<ssize_t>(json.size()), &error));
}

struct DriverHandles {
    UriPtr uri;
    PoolPtr pool;
};

// Borrowed pool client, returned on destruction
class ClientLease {
public:
    explicit ClientLease(mongoc_client_pool_t* pool)
        : pool_(pool), client_(mongoc_client_pool_pop(pool)) {}
    ~ClientLease() {
        if (client_) {
            mongoc_client_pool_push(pool_, client_);
        }
    }
    ClientLease(const ClientLease&) = delete;
    ClientLease& operator=(const ClientLease&) = delete;

    mongoc_client_t* get() const { return client_; }

private:
    mongoc_client_pool_t* pool_;
    mongoc_client_t* client_;
};

} // namespace

struct MongoDatabase::Impl : DriverHandles {};

namespace {

class MongoCursor : public DocumentCursor {
public:
    MongoCursor(std::shared_ptr<DriverHandles> owner, std::string ns)
        : owner_(std::move(owner)), lease_(owner_->pool.get()), namespace_(std::move(ns)) {}

    void open(const std::string& database, const std::string& collection) {
        collection_.reset(
            mongoc_client_get_collection(lease_.get(), database.c_str(), collection.c_str()));
        filter_.reset(bson_new());
        cursor_.reset(mongoc_collection_find_with_opts(collection_.get(), filter_.get(),
                                                       nullptr, nullptr));
    }

    bool next() override {
        if (mongoc_cursor_next(cursor_.get(), &current_)) {
            return true;
        }
        current_ = nullptr;
        bson_error_t error;
        if (mongoc_cursor_error(cursor_.get(), &error)) {
            throw driverError("find on " + namespace_ + " failed", error);
        }
        return false;
    }

    std::optional<std::string> currentJson() override {
        if (!current_) {
            return std::nullopt;
        }
        return toJson(current_, true);
    }

private:
    // Declaration order matters: the lease must outlive the handles below
    std::shared_ptr<DriverHandles> owner_;
    ClientLease lease_;
    std::string namespace_;
    CollectionPtr collection_;
    BsonPtr filter_;
    CursorPtr cursor_;
    const bson_t* current_ = nullptr;
};

} // namespace

MongoDatabase::MongoDatabase(const std::string& connectionString)
    : pImpl(std::make_shared<Impl>()) {
    ensureDriver();

    bson_error_t error;
    pImpl->uri.reset(mongoc_uri_new_with_error(connectionString.c_str(), &error));
    if (!pImpl->uri) {
        throw driverError("invalid connection string", error);
    }
    pImpl->pool.reset(mongoc_client_pool_new(pImpl->uri.get()));
    if (!pImpl->pool) {
        throw createSystemError(ErrorCode::DATABASE_ERROR, "MongoDatabase",
                                "cannot create client pool for " +
                                    maskCredentials(connectionString));
    }
    mongoc_client_pool_set_error_api(pImpl->pool.get(), MONGOC_ERROR_API_VERSION_2);
    mongoc_client_pool_set_appname(pImpl->pool.get(), "mongoxfer");
    DRIVER_LOG_DEBUG("Client pool created for {}", maskCredentials(connectionString));
}

MongoDatabase::~MongoDatabase() = default;

void MongoDatabase::ping() {
    ClientLease lease(pImpl->pool.get());
    BsonPtr command(BCON_NEW("ping", BCON_INT32(1)));
    bson_t reply;
    bson_error_t error;
    bool ok = mongoc_client_command_simple(lease.get(), "admin", command.get(), nullptr, &reply,
                                           &error);
    bson_destroy(&reply);
    if (!ok) {
        throw driverError("ping failed", error);
    }
}

std::vector<CollectionInfo> MongoDatabase::listCollections(const std::string& database) {
    ClientLease lease(pImpl->pool.get());
    DatabasePtr db(mongoc_client_get_database(lease.get(), database.c_str()));
    CursorPtr cursor(mongoc_database_find_collections_with_opts(db.get(), nullptr));

    std::vector<CollectionInfo> collections;
    const bson_t* doc = nullptr;
    while (mongoc_cursor_next(cursor.get(), &doc)) {
        CollectionInfo info{utf8Field(doc, "name"), utf8Field(doc, "type")};
        if (info.type.empty()) {
            info.type = "collection";
        }
        collections.push_back(std::move(info));
    }

    bson_error_t error;
    if (mongoc_cursor_error(cursor.get(), &error)) {
        throw driverError("listCollections on " + database + " failed", error);
    }
    return collections;
}

int64_t MongoDatabase::estimatedDocumentCount(const std::string& database,
                                              const std::string& collection) {
    ClientLease lease(pImpl->pool.get());
    CollectionPtr coll(
        mongoc_client_get_collection(lease.get(), database.c_str(), collection.c_str()));

    bson_error_t error;
    int64_t count =
        mongoc_collection_estimated_document_count(coll.get(), nullptr, nullptr, nullptr, &error);
    if (count < 0) {
        throw driverError("count on " + database + "." + collection + " failed", error);
    }
    return count;
}

std::unique_ptr<DocumentCursor> MongoDatabase::find(const std::string& database,
                                                    const std::string& collection) {
    auto cursor = std::make_unique<MongoCursor>(pImpl, database + "." + collection);
    cursor->open(database, collection);
    return cursor;
}

std::vector<std::string> MongoDatabase::listIndexes(const std::string& database,
                                                    const std::string& collection) {
    ClientLease lease(pImpl->pool.get());
    CollectionPtr coll(
        mongoc_client_get_collection(lease.get(), database.c_str(), collection.c_str()));
    CursorPtr cursor(mongoc_collection_find_indexes_with_opts(coll.get(), nullptr));

    std::vector<std::string> indexes;
    const bson_t* doc = nullptr;
    while (mongoc_cursor_next(cursor.get(), &doc)) {
        if (auto json = toJson(doc, false)) {
            indexes.push_back(std::move(*json));
        } else {
            DRIVER_LOG_WARN("Skipping undecodable index spec on {}.{}", database, collection);
        }
    }

    bson_error_t error;
    if (mongoc_cursor_error(cursor.get(), &error)) {
        throw driverError("listIndexes on " + database + "." + collection + " failed", error);
    }
    return indexes;
}

InsertOutcome MongoDatabase::insertMany(const std::string& database,
                                        const std::string& collection,
                                        const std::vector<std::string>& documents) {
    InsertOutcome outcome;
    std::vector<BsonPtr> owned;
    std::vector<const bson_t*> batch;
    owned.reserve(documents.size());
    batch.reserve(documents.size());
    for (const auto& json : documents) {
        bson_error_t error;
        auto doc = fromJson(json, error);
        if (!doc) {
            ++outcome.undecodable;
            continue;
        }
        batch.push_back(doc.get());
        owned.push_back(std::move(doc));
    }
    if (batch.empty()) {
        return outcome;
    }

    ClientLease lease(pImpl->pool.get());
    CollectionPtr coll(
        mongoc_client_get_collection(lease.get(), database.c_str(), collection.c_str()));
    BsonPtr opts(BCON_NEW("ordered", BCON_BOOL(false)));
    bson_t reply;
    bson_error_t error;
    bool ok = mongoc_collection_insert_many(coll.get(), batch.data(), batch.size(), opts.get(),
                                            &reply, &error);

    bson_iter_t iter;
    if (bson_iter_init_find(&iter, &reply, "insertedCount")) {
        outcome.inserted = bson_iter_as_int64(&iter);
    }

    bool sawWriteErrors = false;
    bson_iter_t writeErrors;
    if (bson_iter_init_find(&iter, &reply, "writeErrors") && BSON_ITER_HOLDS_ARRAY(&iter) &&
        bson_iter_recurse(&iter, &writeErrors)) {
        while (bson_iter_next(&writeErrors)) {
            sawWriteErrors = true;
            int64_t code = 0;
            std::string message;
            bson_iter_t field;
            if (BSON_ITER_HOLDS_DOCUMENT(&writeErrors) && bson_iter_recurse(&writeErrors, &field)) {
                while (bson_iter_next(&field)) {
                    const std::string key = bson_iter_key(&field);
                    if (key == "code") {
                        code = bson_iter_as_int64(&field);
                    } else if (key == "errmsg" && BSON_ITER_HOLDS_UTF8(&field)) {
                        message = bson_iter_utf8(&field, nullptr);
                    }
                }
            }
            if (code == DUPLICATE_KEY_CODE) {
                ++outcome.duplicates;
            } else {
                ++outcome.failed;
                outcome.errors.push_back(maskCredentials(message));
            }
        }
    }
    bson_destroy(&reply);

    // Write errors are per document; anything else failed the whole batch
    if (!ok && !sawWriteErrors) {
        throw driverError("insert into " + database + "." + collection + " failed", error);
    }
    return outcome;
}

void MongoDatabase::dropDatabase(const std::string& database) {
    ClientLease lease(pImpl->pool.get());
    DatabasePtr db(mongoc_client_get_database(lease.get(), database.c_str()));
    bson_error_t error;
    if (!mongoc_database_drop_with_opts(db.get(), nullptr, &error)) {
        throw driverError("drop of " + database + " failed", error);
    }
    DRIVER_LOG_DEBUG("Dropped database {}", database);
}

int64_t MongoDatabase::countExisting(const std::string& database, const std::string& collection,
                                     const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return 0;
    }
    std::string filterJson = "{\"_id\":{\"$in\":[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            filterJson += ',';
        }
        filterJson += ids[i];
    }
    filterJson += "]}}";

    bson_error_t error;
    auto filter = fromJson(filterJson, error);
    if (!filter) {
        throw driverError("invalid _id list for " + database + "." + collection, error);
    }

    ClientLease lease(pImpl->pool.get());
    CollectionPtr coll(
        mongoc_client_get_collection(lease.get(), database.c_str(), collection.c_str()));
    int64_t count = mongoc_collection_count_documents(coll.get(), filter.get(), nullptr, nullptr,
                                                      nullptr, &error);
    if (count < 0) {
        throw driverError("count on " + database + "." + collection + " failed", error);
    }
    return count;
}

void MongoDatabase::createIndex(const std::string& database, const std::string& collection,
                                const std::string& spec) {
    bson_error_t error;
    auto index = fromJson(spec, error);
    if (!index) {
        throw driverError("invalid index spec for " + database + "." + collection, error);
    }

    ClientLease lease(pImpl->pool.get());
    DatabasePtr db(mongoc_client_get_database(lease.get(), database.c_str()));
    BsonPtr command(BCON_NEW("createIndexes", BCON_UTF8(collection.c_str()), "indexes", "[",
                             BCON_DOCUMENT(index.get()), "]"));
    bson_t reply;
    bool ok =
        mongoc_database_write_command_with_opts(db.get(), command.get(), nullptr, &reply, &error);
    bson_destroy(&reply);
    if (!ok) {
        throw driverError("createIndexes on " + database + "." + collection + " failed", error);
    }
}

std::vector<std::string> MongoDatabase::saslSupportedMechanisms(
    const std::string& userNamespace, std::chrono::milliseconds timeout) {
    // Dedicated client so the lookup gets its own, short timeouts
    UriPtr lookupUri(mongoc_uri_copy(pImpl->uri.get()));
    auto timeoutMs = static_cast<int32_t>(timeout.count());
    mongoc_uri_set_option_as_int32(lookupUri.get(), MONGOC_URI_SERVERSELECTIONTIMEOUTMS, timeoutMs);
    mongoc_uri_set_option_as_int32(lookupUri.get(), MONGOC_URI_CONNECTTIMEOUTMS, timeoutMs);
    mongoc_uri_set_option_as_int32(lookupUri.get(), MONGOC_URI_SOCKETTIMEOUTMS, timeoutMs);

    ClientPtr client(mongoc_client_new_from_uri(lookupUri.get()));
    if (!client) {
        throw createSystemError(ErrorCode::DATABASE_ERROR, "MongoDatabase",
                                "cannot create mechanism lookup client");
    }
    mongoc_client_set_error_api(client.get(), MONGOC_ERROR_API_VERSION_2);

    BsonPtr command(
        BCON_NEW("hello", BCON_INT32(1), "saslSupportedMechs", BCON_UTF8(userNamespace.c_str())));
    bson_t reply;
    bson_error_t error;
    bool ok = mongoc_client_command_simple(client.get(), "admin", command.get(), nullptr, &reply,
                                           &error);
    if (!ok) {
        bson_destroy(&reply);
        throw driverError("saslSupportedMechs lookup failed", error);
    }

    std::vector<std::string> mechanisms;
    bson_iter_t iter;
    bson_iter_t child;
    if (bson_iter_init_find(&iter, &reply, "saslSupportedMechs") &&
        BSON_ITER_HOLDS_ARRAY(&iter) && bson_iter_recurse(&iter, &child)) {
        while (bson_iter_next(&child)) {
            if (BSON_ITER_HOLDS_UTF8(&child)) {
                mechanisms.emplace_back(bson_iter_utf8(&child, nullptr));
            }
        }
    }
    bson_destroy(&reply);
    DRIVER_LOG_DEBUG("Server offers {} SASL mechanism(s) for {}", mechanisms.size(),
                     userNamespace);
    return mechanisms;
}

} // namespace xfer
