#include "SQLiteKeyPersistence.h"
#include "Logger.h"
#include "MetricsCollector.h"

#include <filesystem>

namespace SkipKP {

namespace {

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

skp::SecureBuffer columnBlob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int len = sqlite3_column_bytes(stmt, col);
    if (!blob || len <= 0) {
        return skp::SecureBuffer();
    }
    return skp::SecureBuffer(static_cast<const uint8_t*>(blob), static_cast<std::size_t>(len));
}

} // namespace

SQLiteKeyPersistence::SQLiteKeyPersistence(std::string dbPath)
    : dbPath_(std::move(dbPath)) {}

SQLiteKeyPersistence::~SQLiteKeyPersistence() {
    close();
}

skp::Result<void> SQLiteKeyPersistence::open() {
    auto& logger = Logger::instance();
    std::lock_guard<std::mutex> lock(mutex_);

    if (dbPath_ != ":memory:") {
        auto dir = std::filesystem::path(dbPath_).parent_path();
        if (!dir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                logger.log(LogLevel::ERROR, "Failed to create database directory: " + dir.string() + " (" + ec.message() + ")", "SQLiteKeyPersistence");
            }
        }
    }

    logger.log(LogLevel::INFO, "Opening key database: " + dbPath_, "SQLiteKeyPersistence");

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(dbPath_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        logger.log(LogLevel::ERROR, "Cannot open database: " + msg, "SQLiteKeyPersistence");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return skp::Err(skp::ErrorCode::StorageUnavailable, "Cannot open database: " + msg);
    }

    if (!exec("PRAGMA journal_mode=WAL;")) {
        logger.log(LogLevel::WARN, "Failed to enable WAL mode", "SQLiteKeyPersistence");
    }
    sqlite3_busy_timeout(db_, 5000);

    if (!exec("PRAGMA foreign_keys=ON;") || !exec("PRAGMA secure_delete=ON;")) {
        return storageError("Failed to configure database");
    }

    int userVersion = 0;
    sqlite3_stmt* stmt = prepare("PRAGMA user_version;");
    if (stmt) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            userVersion = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    const int targetVersion = 1;
    if (userVersion > targetVersion) {
        return skp::Err(skp::ErrorCode::StorageUnavailable,
            "Database schema version " + std::to_string(userVersion) + " is newer than supported");
    }

    if (!createTables()) {
        return storageError("Failed to create tables");
    }

    if (userVersion < targetVersion && !exec("PRAGMA user_version = 1;")) {
        return storageError("Failed to set user_version");
    }

    return skp::Ok();
}

void SQLiteKeyPersistence::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        Logger::instance().log(LogLevel::INFO, "Closing key database", "SQLiteKeyPersistence");
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SQLiteKeyPersistence::createTables() {
    const char* sql =
        "CREATE TABLE IF NOT EXISTS key_records ("
        "key_id TEXT PRIMARY KEY,"
        "key_material BLOB,"
        "remote_system_id TEXT NOT NULL,"
        "origin_system_id TEXT NOT NULL,"
        "size_bits INTEGER NOT NULL,"
        "created_at INTEGER NOT NULL,"
        "consumed INTEGER NOT NULL DEFAULT 0);"

        "CREATE TABLE IF NOT EXISTS key_sync_peers ("
        "key_id TEXT NOT NULL,"
        "peer_id TEXT NOT NULL,"
        "PRIMARY KEY (key_id, peer_id),"
        "FOREIGN KEY(key_id) REFERENCES key_records(key_id) ON DELETE CASCADE);"

        "CREATE INDEX IF NOT EXISTS idx_key_records_created ON key_records(created_at);";

    return exec(sql);
}

bool SQLiteKeyPersistence::exec(const char* sql) {
    if (!db_) {
        return false;
    }
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        Logger::instance().log(LogLevel::ERROR, "SQL error: " + std::string(errMsg ? errMsg : "unknown"), "SQLiteKeyPersistence");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

sqlite3_stmt* SQLiteKeyPersistence::prepare(const char* sql) {
    if (!db_) {
        return nullptr;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::instance().log(LogLevel::ERROR, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), "SQLiteKeyPersistence");
        return nullptr;
    }
    return stmt;
}

skp::Error SQLiteKeyPersistence::storageError(const std::string& what) {
    std::string detail = db_ ? sqlite3_errmsg(db_) : "database not open";
    Logger::instance().log(LogLevel::ERROR, what + ": " + detail, "SQLiteKeyPersistence");
    MetricsCollector::instance().incrementStorageErrors();
    return skp::Error(skp::ErrorCode::StorageUnavailable, what);
}

std::set<std::string> SQLiteKeyPersistence::loadSyncedPeers(const std::string& keyId) {
    std::set<std::string> peers;
    sqlite3_stmt* stmt = prepare("SELECT peer_id FROM key_sync_peers WHERE key_id = ?;");
    if (!stmt) {
        return peers;
    }
    sqlite3_bind_text(stmt, 1, keyId.c_str(), -1, SQLITE_STATIC);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        peers.insert(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return peers;
}

skp::Result<void> SQLiteKeyPersistence::insert(KeyRecord&& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!exec("BEGIN IMMEDIATE;")) {
        return storageError("Failed to begin transaction");
    }

    sqlite3_stmt* stmt = prepare(
        "INSERT INTO key_records (key_id, key_material, remote_system_id, origin_system_id, size_bits, created_at, consumed) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);");
    if (!stmt) {
        exec("ROLLBACK;");
        return storageError("Failed to prepare insert");
    }

    sqlite3_bind_text(stmt, 1, record.keyId.c_str(), -1, SQLITE_STATIC);
    if (record.keyMaterial.empty()) {
        sqlite3_bind_null(stmt, 2);
    } else {
        sqlite3_bind_blob(stmt, 2, record.keyMaterial.data(), static_cast<int>(record.keyMaterial.size()), SQLITE_STATIC);
    }
    sqlite3_bind_text(stmt, 3, record.remoteSystemId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, record.originSystemId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 5, record.sizeBits);
    sqlite3_bind_int64(stmt, 6, record.createdAt);
    sqlite3_bind_int(stmt, 7, record.consumed ? 1 : 0);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    record.keyMaterial.wipe();

    if (rc == SQLITE_CONSTRAINT) {
        exec("ROLLBACK;");
        return skp::Err(skp::ErrorCode::DuplicateKey, "Key " + shortId(record.keyId) + " already stored");
    }
    if (rc != SQLITE_DONE) {
        auto err = storageError("Failed to insert key");
        exec("ROLLBACK;");
        return err;
    }

    for (const auto& peer : record.syncedPeers) {
        sqlite3_stmt* peerStmt = prepare("INSERT OR IGNORE INTO key_sync_peers (key_id, peer_id) VALUES (?, ?);");
        if (!peerStmt) {
            exec("ROLLBACK;");
            return storageError("Failed to prepare sync peer insert");
        }
        sqlite3_bind_text(peerStmt, 1, record.keyId.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(peerStmt, 2, peer.c_str(), -1, SQLITE_STATIC);
        rc = sqlite3_step(peerStmt);
        sqlite3_finalize(peerStmt);
        if (rc != SQLITE_DONE) {
            auto err = storageError("Failed to record sync peer");
            exec("ROLLBACK;");
            return err;
        }
    }

    if (!exec("COMMIT;")) {
        auto err = storageError("Failed to commit key insert");
        exec("ROLLBACK;");
        return err;
    }
    return skp::Ok();
}

skp::Result<KeyMetadata> SQLiteKeyPersistence::findMetadata(const std::string& keyId) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare(
        "SELECT remote_system_id, origin_system_id, size_bits, created_at, consumed "
        "FROM key_records WHERE key_id = ?;");
    if (!stmt) {
        return storageError("Failed to prepare lookup");
    }
    sqlite3_bind_text(stmt, 1, keyId.c_str(), -1, SQLITE_STATIC);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return skp::Err<KeyMetadata>(skp::ErrorCode::NotFound);
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return storageError("Failed to look up key");
    }

    KeyMetadata meta;
    meta.keyId = keyId;
    meta.remoteSystemId = columnText(stmt, 0);
    meta.originSystemId = columnText(stmt, 1);
    meta.sizeBits = sqlite3_column_int(stmt, 2);
    meta.createdAt = sqlite3_column_int64(stmt, 3);
    meta.consumed = sqlite3_column_int(stmt, 4) != 0;
    sqlite3_finalize(stmt);

    meta.syncedPeers = loadSyncedPeers(keyId);
    return meta;
}

skp::Result<skp::SecureBuffer> SQLiteKeyPersistence::consume(const std::string& keyId) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!exec("BEGIN IMMEDIATE;")) {
        return storageError("Failed to begin transaction");
    }

    // The conditional update is the compare-and-set: only one caller can
    // move consumed from 0 to 1.
    sqlite3_stmt* stmt = prepare(
        "UPDATE key_records SET consumed = 1 WHERE key_id = ? AND consumed = 0 RETURNING key_material;");
    if (!stmt) {
        exec("ROLLBACK;");
        return storageError("Failed to prepare consume");
    }
    sqlite3_bind_text(stmt, 1, keyId.c_str(), -1, SQLITE_STATIC);

    skp::SecureBuffer material;
    bool won = false;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        won = true;
        material = columnBlob(stmt, 0);
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto err = storageError("Failed to consume key");
        exec("ROLLBACK;");
        return err;
    }

    if (!won) {
        exec("ROLLBACK;");
        sqlite3_stmt* check = prepare("SELECT 1 FROM key_records WHERE key_id = ?;");
        if (!check) {
            return storageError("Failed to prepare lookup");
        }
        sqlite3_bind_text(check, 1, keyId.c_str(), -1, SQLITE_STATIC);
        bool exists = sqlite3_step(check) == SQLITE_ROW;
        sqlite3_finalize(check);
        return skp::Err<skp::SecureBuffer>(exists ? skp::ErrorCode::AlreadyConsumed : skp::ErrorCode::NotFound);
    }

    sqlite3_stmt* wipe = prepare("UPDATE key_records SET key_material = NULL WHERE key_id = ?;");
    if (!wipe) {
        exec("ROLLBACK;");
        return storageError("Failed to prepare wipe");
    }
    sqlite3_bind_text(wipe, 1, keyId.c_str(), -1, SQLITE_STATIC);
    rc = sqlite3_step(wipe);
    sqlite3_finalize(wipe);

    if (rc != SQLITE_DONE || !exec("COMMIT;")) {
        auto err = storageError("Failed to wipe consumed key");
        exec("ROLLBACK;");
        return err;
    }

    if (material.empty()) {
        return skp::Err<skp::SecureBuffer>(skp::ErrorCode::InternalError, "Stored key has no material");
    }
    return std::move(material);
}

skp::Result<bool> SQLiteKeyPersistence::retire(const std::string& keyId) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare(
        "UPDATE key_records SET consumed = 1, key_material = NULL WHERE key_id = ? AND consumed = 0;");
    if (!stmt) {
        return storageError("Failed to prepare retire");
    }
    sqlite3_bind_text(stmt, 1, keyId.c_str(), -1, SQLITE_STATIC);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return storageError("Failed to retire key");
    }
    return sqlite3_changes(db_) == 1;
}

skp::Result<std::vector<KeyRecord>> SQLiteKeyPersistence::pendingFor(const std::string& peerId, std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare(
        "SELECT r.key_id, r.key_material, r.remote_system_id, r.origin_system_id, r.size_bits, r.created_at "
        "FROM key_records r "
        "WHERE r.consumed = 0 AND NOT EXISTS "
        "(SELECT 1 FROM key_sync_peers s WHERE s.key_id = r.key_id AND s.peer_id = ?) "
        "ORDER BY r.created_at, r.rowid LIMIT ?;");
    if (!stmt) {
        return storageError("Failed to prepare pending query");
    }
    sqlite3_bind_text(stmt, 1, peerId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));

    std::vector<KeyRecord> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        KeyRecord record;
        record.keyId = columnText(stmt, 0);
        record.keyMaterial = columnBlob(stmt, 1);
        record.remoteSystemId = columnText(stmt, 2);
        record.originSystemId = columnText(stmt, 3);
        record.sizeBits = sqlite3_column_int(stmt, 4);
        record.createdAt = sqlite3_column_int64(stmt, 5);
        records.push_back(std::move(record));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return storageError("Failed to read pending keys");
    }

    for (auto& record : records) {
        record.syncedPeers = loadSyncedPeers(record.keyId);
    }
    return std::move(records);
}

skp::Result<std::set<std::string>> SQLiteKeyPersistence::markSynced(const std::string& keyId, const std::string& peerId) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare("INSERT OR IGNORE INTO key_sync_peers (key_id, peer_id) VALUES (?, ?);");
    if (!stmt) {
        return storageError("Failed to prepare sync marker");
    }
    sqlite3_bind_text(stmt, 1, keyId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, peerId.c_str(), -1, SQLITE_STATIC);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    // Foreign key failure: the record was swept in the meantime.
    if (rc == SQLITE_CONSTRAINT) {
        return skp::Err<std::set<std::string>>(skp::ErrorCode::NotFound);
    }
    if (rc != SQLITE_DONE) {
        return storageError("Failed to mark key synced");
    }
    return loadSyncedPeers(keyId);
}

skp::Result<std::size_t> SQLiteKeyPersistence::sweep(int64_t cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare("DELETE FROM key_records WHERE created_at < ?;");
    if (!stmt) {
        return storageError("Failed to prepare sweep");
    }
    sqlite3_bind_int64(stmt, 1, cutoff);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return storageError("Failed to sweep expired keys");
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

skp::Result<KeyCounts> SQLiteKeyPersistence::counts() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare("SELECT consumed, COUNT(*) FROM key_records GROUP BY consumed;");
    if (!stmt) {
        return storageError("Failed to prepare count");
    }

    KeyCounts result;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto n = static_cast<std::size_t>(sqlite3_column_int64(stmt, 1));
        if (sqlite3_column_int(stmt, 0) != 0) {
            result.consumed = n;
        } else {
            result.live = n;
        }
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return storageError("Failed to count keys");
    }
    return result;
}

skp::Result<void> SQLiteKeyPersistence::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return skp::Err(skp::ErrorCode::StorageUnavailable, "Database not open");
    }
    sqlite3_stmt* stmt = prepare("SELECT COUNT(*) FROM key_records;");
    if (!stmt) {
        return skp::Err(skp::ErrorCode::StorageUnavailable, "Database not usable");
    }
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        return skp::Err(skp::ErrorCode::StorageUnavailable, "Database not usable");
    }
    return skp::Ok();
}

} // namespace SkipKP
