#include "capturepush/state_store.hpp"
#include "capturepush/state_store_transaction.hpp"
#include "capturepush/capture_utils.hpp"
#include "capturepush/constants.hpp"
#include "capturepush/generic_exception.hpp"

#pragma mark SnapshotDatabase

SnapshotDatabase::SnapshotDatabase(std::string path) :
    _db(path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
    _stmtBeginTransaction(_db, "BEGIN IMMEDIATE TRANSACTION"),
    _stmtRollbackTransaction(_db, "ROLLBACK"),
    _stmtCommitTransaction(_db, "COMMIT")
{
    _db.setBusyTimeout(10 * 1000);
    SQLite::Statement(_db, "PRAGMA journal_mode = WAL").executeStep();
    SQLite::Statement(_db, "PRAGMA main.synchronous = FULL").exec();
}

void SnapshotDatabase::migrate() {
    SQLite::Statement uv(_db, "PRAGMA user_version");
    uv.executeStep();
    int version = uv.getColumn(0).getInt();

    if (version == 0) {
        for (std::string sql : STATE_SETUP_QUERIES) {
            SQLite::Statement(_db, sql).exec();
        }
    }

    SQLite::Statement(_db, "PRAGMA user_version = 1").exec();
}

SQLite::Database & SnapshotDatabase::db() {
    return _db;
}

void SnapshotDatabase::beginTransaction() {
    _stmtBeginTransaction.exec();
    _stmtBeginTransaction.reset();
}

void SnapshotDatabase::rollbackTransaction() {
    _stmtRollbackTransaction.exec();
    _stmtRollbackTransaction.reset();
}

void SnapshotDatabase::commitTransaction() {
    _stmtCommitTransaction.exec();
    _stmtCommitTransaction.reset();
}

#pragma mark StateStore

StateStore::StateStore(std::string root, std::shared_ptr<spdlog::logger> logger) :
    _root(root), _logger(logger)
{
    CaptureUtils::makeDirectories(_root);
}

std::string StateStore::pathFor(std::string accountKey, std::string kind) {
    return _root + FS_PATH_SEP + CaptureUtils::escapePathComponent(accountKey) + "-" + kind + ".db";
}

std::shared_ptr<SnapshotDatabase> StateStore::databaseFor(std::string accountKey, std::string kind, bool create) {
    if (kind != RECORD_KIND_GRADES && kind != RECORD_KIND_SCHEDULE) {
        throw GenericException("Unknown snapshot kind: " + kind);
    }
    std::string path = pathFor(accountKey, kind);

    std::lock_guard<std::mutex> lock(_databasesMtx);
    auto it = _databases.find(path);
    if (it != _databases.end()) {
        return it->second;
    }
    if (!create && !CaptureUtils::fileExists(path)) {
        return nullptr;
    }
    auto database = std::make_shared<SnapshotDatabase>(path);
    database->migrate();
    _databases[path] = database;
    return database;
}

std::shared_ptr<Snapshot> StateStore::load(std::string accountKey, std::string kind) {
    std::shared_ptr<SnapshotDatabase> database;
    try {
        database = databaseFor(accountKey, kind, false);
    } catch (SQLite::Exception & ex) {
        _logger->error("Unable to open snapshot database for {} / {}: {}", accountKey, kind, ex.what());
        throw;
    }
    if (!database) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(database->mtx);
    std::string data;
    time_t capturedAt = 0;
    try {
        SQLite::Statement query(database->db(), "SELECT capturedAt, data FROM Snapshot WHERE kind = ?");
        query.bind(1, kind);
        if (!query.executeStep()) {
            return nullptr;
        }
        capturedAt = (time_t)query.getColumn("capturedAt").getInt64();
        data = query.getColumn("data").getString();
    } catch (SQLite::Exception & ex) {
        _logger->error("Unable to read snapshot for {} / {}: {}", accountKey, kind, ex.what());
        throw;
    }

    try {
        return Snapshot::FromJSON(kind, accountKey, nlohmann::json::parse(data), capturedAt, _logger);
    } catch (nlohmann::json::exception & ex) {
        _logger->warn("Stored snapshot for {} / {} is not valid JSON, ignoring it: {}", accountKey, kind, ex.what());
    } catch (GenericException & ex) {
        _logger->warn("Stored snapshot for {} / {} is corrupt, ignoring it: {}", accountKey, kind, ex.what());
    }
    return nullptr;
}

void StateStore::save(const Snapshot & snapshot) {
    auto database = databaseFor(snapshot.accountKey(), snapshot.kind(), true);

    std::lock_guard<std::mutex> lock(database->mtx);
    StateStoreTransaction transaction(database.get(), _logger, "save " + snapshot.kind());

    SQLite::Statement query(database->db(), "REPLACE INTO Snapshot (kind, accountKey, capturedAt, recordCount, data) VALUES (?, ?, ?, ?, ?)");
    query.bind(1, snapshot.kind());
    query.bind(2, snapshot.accountKey());
    query.bind(3, (long long)snapshot.capturedAt());
    query.bind(4, (long long)snapshot.size());
    query.bind(5, snapshot.recordsJSON().dump());
    query.exec();

    transaction.commit();
    _logger->debug("Saved {} {} record(s) for {}", snapshot.size(), snapshot.kind(), snapshot.accountKey());
}
