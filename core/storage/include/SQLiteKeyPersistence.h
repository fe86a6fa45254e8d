#pragma once

#include "IKeyPersistence.h"

#include <sqlite3.h>
#include <mutex>
#include <string>

namespace SkipKP {

/**
 * @brief SQLite-backed key records (authoritative backend)
 *
 * Consumed material is set to NULL with secure_delete enabled so freed
 * pages are overwritten. A path of ":memory:" gives a private database
 * that disappears with the object.
 */
class SQLiteKeyPersistence : public IKeyPersistence {
public:
    explicit SQLiteKeyPersistence(std::string dbPath);
    ~SQLiteKeyPersistence() override;

    SQLiteKeyPersistence(const SQLiteKeyPersistence&) = delete;
    SQLiteKeyPersistence& operator=(const SQLiteKeyPersistence&) = delete;

    /**
     * @brief Open the database and migrate the schema
     */
    skp::Result<void> open();

    void close();

    skp::Result<void> insert(KeyRecord&& record) override;
    skp::Result<KeyMetadata> findMetadata(const std::string& keyId) override;
    skp::Result<skp::SecureBuffer> consume(const std::string& keyId) override;
    skp::Result<bool> retire(const std::string& keyId) override;
    skp::Result<std::vector<KeyRecord>> pendingFor(const std::string& peerId, std::size_t limit) override;
    skp::Result<std::set<std::string>> markSynced(const std::string& keyId, const std::string& peerId) override;
    skp::Result<std::size_t> sweep(int64_t cutoff) override;
    skp::Result<KeyCounts> counts() override;
    skp::Result<void> ping() override;

private:
    std::string dbPath_;
    sqlite3* db_ = nullptr;
    // One connection is shared; multi-statement operations must not interleave.
    std::mutex mutex_;

    bool createTables();
    bool exec(const char* sql);
    sqlite3_stmt* prepare(const char* sql);
    skp::Error storageError(const std::string& what);
    std::set<std::string> loadSyncedPeers(const std::string& keyId);
};

} // namespace SkipKP
