// File: src/storage/recommendation_store.cpp
#include "storage/recommendation_store.hpp"
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace itemrec {

// ============================================================================
// Constructor and Destructor
// ============================================================================

RecommendationStore::RecommendationStore(const Config& config)
    : config_(config) {

    if (!IsValidIdentifier(config_.table_name)) {
        throw std::invalid_argument("Invalid table name: '" + config_.table_name + "'");
    }
    if (config_.max_write_attempts == 0) {
        throw std::invalid_argument("max_write_attempts must be > 0");
    }

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    // Pragmas are tuning only; a database that rejects them is still usable
    std::string error;
    if (config_.enable_wal && !ExecuteSQL("PRAGMA journal_mode=WAL;", &error)) {
        LogDebug("WAL not enabled: " + error);
    }
    if (!ExecuteSQL("PRAGMA synchronous=NORMAL;", &error)) {
        LogDebug("synchronous pragma rejected: " + error);
    }
}

RecommendationStore::~RecommendationStore() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Writes
// ============================================================================

void RecommendationStore::ReplaceAll(const std::vector<RecommendationRecord>& records) {
    std::string error;
    for (size_t attempt = 1; attempt <= config_.max_write_attempts; ++attempt) {
        if (TryReplace(records, error)) {
            LogDebug("Wrote " + std::to_string(records.size()) + " rows to " +
                     config_.table_name + " (attempt " + std::to_string(attempt) + ")");
            return;
        }
        LogDebug("Write attempt " + std::to_string(attempt) + " failed: " + error);
    }

    throw std::runtime_error("Failed to write recommendations to '" + config_.table_name +
                             "' after " + std::to_string(config_.max_write_attempts) +
                             " attempts: " + error);
}

bool RecommendationStore::TryReplace(const std::vector<RecommendationRecord>& records,
                                     std::string& error) {
    if (!ExecuteSQL("BEGIN IMMEDIATE TRANSACTION;", &error)) {
        return false;
    }

    const std::string& table = config_.table_name;
    const std::string create_table =
        "CREATE TABLE " + table + " ("
        "entity_id INTEGER NOT NULL, "
        "recommended_item_id INTEGER NOT NULL, "
        "score REAL, "
        "model_type TEXT NOT NULL, "
        "updated_at TEXT NOT NULL, "
        "is_current INTEGER NOT NULL);";

    if (!ExecuteSQL("DROP TABLE IF EXISTS " + table + ";", &error) ||
        !ExecuteSQL(create_table, &error)) {
        ExecuteSQL("ROLLBACK;");
        return false;
    }

    const std::string insert_sql =
        "INSERT INTO " + table + " (entity_id, recommended_item_id, score, model_type, "
        "updated_at, is_current) VALUES (?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, insert_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        error = sqlite3_errmsg(db_);
        ExecuteSQL("ROLLBACK;");
        return false;
    }

    for (const auto& record : records) {
        sqlite3_bind_int64(stmt, 1, record.entity_id.value());
        sqlite3_bind_int64(stmt, 2, record.recommended_item_id.value());
        if (record.score) {
            sqlite3_bind_double(stmt, 3, *record.score);
        } else {
            sqlite3_bind_null(stmt, 3);
        }
        sqlite3_bind_text(stmt, 4, ToString(record.model_type), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 5, record.updated_at.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 6, record.is_current ? 1 : 0);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            ExecuteSQL("ROLLBACK;");
            return false;
        }
        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);

    if (!ExecuteSQL("COMMIT;", &error)) {
        ExecuteSQL("ROLLBACK;");
        return false;
    }
    return true;
}

// ============================================================================
// Reads
// ============================================================================

bool RecommendationStore::TableExists() const {
    const char* sql = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to query schema: ") + sqlite3_errmsg(db_));
    }

    sqlite3_bind_text(stmt, 1, config_.table_name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);
    return exists;
}

std::vector<RecommendationRecord> RecommendationStore::LoadAll() const {
    std::vector<RecommendationRecord> records;
    if (!TableExists()) {
        return records;
    }

    const std::string sql =
        "SELECT entity_id, recommended_item_id, score, model_type, updated_at, is_current "
        "FROM " + config_.table_name + " ORDER BY rowid;";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to read recommendations: ") +
                                 sqlite3_errmsg(db_));
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        RecommendationRecord record;
        record.entity_id = EntityID(sqlite3_column_int64(stmt, 0));
        record.recommended_item_id = ItemID(sqlite3_column_int64(stmt, 1));
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
            record.score = sqlite3_column_double(stmt, 2);
        }
        const auto* model = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
        record.model_type = ParseModelType(model ? model : "");
        const auto* updated = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4));
        record.updated_at = updated ? updated : "";
        record.is_current = sqlite3_column_int(stmt, 5) != 0;
        records.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return records;
}

size_t RecommendationStore::Count() const {
    if (!TableExists()) {
        return 0;
    }

    const std::string sql = "SELECT COUNT(*) FROM " + config_.table_name + ";";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to count recommendations: ") +
                                 sqlite3_errmsg(db_));
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

// ============================================================================
// Helpers
// ============================================================================

bool RecommendationStore::IsValidIdentifier(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_') {
            return false;
        }
    }
    return true;
}

bool RecommendationStore::ExecuteSQL(const std::string& sql, std::string* error) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error) {
            *error = error_msg ? error_msg : sqlite3_errstr(rc);
        }
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

void RecommendationStore::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[RecommendationStore] " << message << std::endl;
    }
}

} // namespace itemrec
