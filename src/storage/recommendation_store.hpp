// File: src/storage/recommendation_store.hpp
#pragma once

#include "output/output_assembler.hpp"
#include <string>
#include <vector>
#include <sqlite3.h>

namespace itemrec {

/// SQLite sink for assembled recommendation records
///
/// Each write replaces the target table wholesale: the table is dropped,
/// recreated and filled inside a single transaction, so readers see either
/// the previous batch or the new one. A failed attempt is rolled back and
/// retried up to the configured number of attempts.
class RecommendationStore {
public:
    /// Configuration for RecommendationStore
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private database)
        std::string db_path;

        /// Target table, must be a plain SQL identifier
        std::string table_name{"recommendations"};

        /// Total attempts for one ReplaceAll call
        size_t max_write_attempts{3};

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// How long a statement waits on a locked database
        int busy_timeout_ms{5000};

        bool debug_logging{false};
    };

    /// Open (or create) the database
    /// @throws std::invalid_argument if table_name or max_write_attempts is invalid
    /// @throws std::runtime_error if the database cannot be opened
    explicit RecommendationStore(const Config& config);

    /// Destructor - closes database connection
    ~RecommendationStore();

    RecommendationStore(const RecommendationStore&) = delete;
    RecommendationStore& operator=(const RecommendationStore&) = delete;

    /// Replace the table contents with the given records
    /// @throws std::runtime_error once every attempt has failed
    void ReplaceAll(const std::vector<RecommendationRecord>& records);

    /// All rows in the order they were written; empty if the table is absent
    std::vector<RecommendationRecord> LoadAll() const;

    /// Number of rows; 0 if the table is absent
    size_t Count() const;

    bool TableExists() const;

    const Config& GetConfig() const { return config_; }

    /// True for [A-Za-z_][A-Za-z0-9_]*
    static bool IsValidIdentifier(const std::string& name);

private:
    Config config_;

    // SQLite database handle
    sqlite3* db_{nullptr};

    /// Single replace attempt; on failure rolls back and fills error
    bool TryReplace(const std::vector<RecommendationRecord>& records, std::string& error);

    /// Execute a SQL statement
    /// @return true if successful; error receives the SQLite message otherwise
    bool ExecuteSQL(const std::string& sql, std::string* error = nullptr) const;

    void LogDebug(const std::string& message) const;
};

} // namespace itemrec
