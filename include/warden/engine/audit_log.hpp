#pragma once

#include "../types.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace warden {
namespace engine {

/**
 * @brief Persisted pair of a terminal Outcome and its optional Observation.
 */
struct AuditRecord {
    std::string call_id;
    std::string session_id;
    std::string tool_name;
    Outcome outcome;
    std::optional<Observation> observation;    ///< Absent when scoring failed or was skipped
    int64_t recorded_at_ms = 0;                ///< Wall-clock time, ms since epoch

    static int64_t now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    nlohmann::json to_json() const {
        nlohmann::json j{
            {"call_id", call_id},
            {"session_id", session_id},
            {"tool_name", tool_name},
            {"outcome", outcome.to_json()},
            {"recorded_at_ms", recorded_at_ms}
        };
        j["observation"] = observation.has_value() ? observation->to_json() : nlohmann::json(nullptr);
        return j;
    }
};

/**
 * @brief Destination for audit records. Implementations must be thread-safe.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    virtual Expected<void> append(const AuditRecord& record) = 0;
};

/**
 * @brief In-memory audit trail, used when no database path is configured and in tests.
 */
class MemoryAuditLog : public IAuditSink {
public:
    Expected<void> append(const AuditRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
        return {};
    }

    std::vector<AuditRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    std::vector<AuditRecord> find(const std::string& call_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<AuditRecord> matches;
        for (const auto& record : records_) {
            if (record.call_id == call_id) {
                matches.push_back(record);
            }
        }
        return matches;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    std::vector<AuditRecord> records_;
    mutable std::mutex mutex_;
};

/**
 * @brief Durable SQLite-backed audit trail.
 *
 * One row per terminal outcome. Status, error kind, timeout layer and score
 * get their own columns for querying; the full outcome and observation are
 * kept as JSON text.
 */
class SqliteAuditLog : public IAuditSink {
public:
    ~SqliteAuditLog() override {
        // Finalize cached statements before closing the database.
        if (stmt_insert_ != nullptr) {
            sqlite3_finalize(stmt_insert_);
            stmt_insert_ = nullptr;
        }
        if (stmt_by_call_ != nullptr) {
            sqlite3_finalize(stmt_by_call_);
            stmt_by_call_ = nullptr;
        }
        if (stmt_size_ != nullptr) {
            sqlite3_finalize(stmt_size_);
            stmt_size_ = nullptr;
        }

        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    SqliteAuditLog(const SqliteAuditLog&) = delete;
    SqliteAuditLog& operator=(const SqliteAuditLog&) = delete;

    static Expected<std::shared_ptr<SqliteAuditLog>> open(const std::string& path) {
        if (path.empty()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Audit database path cannot be empty"
            });
        }

        sqlite3* db = nullptr;
        if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
            std::string message = "Failed to open audit database";
            if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
                message += std::string(": ") + sqlite3_errmsg(db);
            }
            if (db != nullptr) {
                sqlite3_close(db);
            }
            return tl::unexpected(Error{ErrorCode::AuditWriteFailed, std::move(message), path});
        }

        auto instance = std::shared_ptr<SqliteAuditLog>(new SqliteAuditLog(db, path));
        auto init_result = instance->initialize_schema();
        if (!init_result) {
            return tl::unexpected(init_result.error());
        }
        return instance;
    }

    Expected<void> append(const AuditRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto& outcome = record.outcome;
        const std::string outcome_json = outcome.to_json().dump();

        sqlite3_bind_text(stmt_insert_, 1, record.call_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 2, record.session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 3, record.tool_name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 4, outcome_status_to_string(outcome.status), -1, SQLITE_STATIC);
        if (outcome.error_kind.has_value()) {
            sqlite3_bind_text(stmt_insert_, 5, error_code_to_string(*outcome.error_kind), -1, SQLITE_STATIC);
        } else {
            sqlite3_bind_null(stmt_insert_, 5);
        }
        if (outcome.timeout_layer.has_value()) {
            sqlite3_bind_text(stmt_insert_, 6, timeout_layer_to_string(*outcome.timeout_layer), -1, SQLITE_STATIC);
        } else {
            sqlite3_bind_null(stmt_insert_, 6);
        }
        sqlite3_bind_int64(stmt_insert_, 7, static_cast<sqlite3_int64>(outcome.elapsed.count()));
        sqlite3_bind_text(stmt_insert_, 8, outcome_json.c_str(), -1, SQLITE_TRANSIENT);

        std::string observation_json;
        if (record.observation.has_value()) {
            observation_json = record.observation->to_json().dump();
            sqlite3_bind_text(stmt_insert_, 9, observation_json.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt_insert_, 10, record.observation->score);
        } else {
            sqlite3_bind_null(stmt_insert_, 9);
            sqlite3_bind_null(stmt_insert_, 10);
        }
        sqlite3_bind_int64(stmt_insert_, 11, static_cast<sqlite3_int64>(record.recorded_at_ms));

        if (sqlite3_step(stmt_insert_) != SQLITE_DONE) {
            sqlite3_reset(stmt_insert_);
            sqlite3_clear_bindings(stmt_insert_);
            return tl::unexpected(make_sql_error("Failed to insert audit record"));
        }
        sqlite3_reset(stmt_insert_);
        sqlite3_clear_bindings(stmt_insert_);
        return {};
    }

    /**
     * @brief Stored records for one call id, oldest first, as AuditRecord::to_json() objects.
     */
    Expected<std::vector<nlohmann::json>> find_by_call(const std::string& call_id) const {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite3_bind_text(stmt_by_call_, 1, call_id.c_str(), -1, SQLITE_TRANSIENT);

        std::vector<nlohmann::json> rows;
        int rc;
        while ((rc = sqlite3_step(stmt_by_call_)) == SQLITE_ROW) {
            nlohmann::json row{
                {"call_id", column_text(stmt_by_call_, 0)},
                {"session_id", column_text(stmt_by_call_, 1)},
                {"tool_name", column_text(stmt_by_call_, 2)},
                {"recorded_at_ms", sqlite3_column_int64(stmt_by_call_, 5)}
            };
            row["outcome"] = nlohmann::json::parse(column_text(stmt_by_call_, 3), nullptr, false);
            if (sqlite3_column_type(stmt_by_call_, 4) == SQLITE_NULL) {
                row["observation"] = nullptr;
            } else {
                row["observation"] = nlohmann::json::parse(column_text(stmt_by_call_, 4), nullptr, false);
            }
            rows.push_back(std::move(row));
        }
        sqlite3_reset(stmt_by_call_);
        sqlite3_clear_bindings(stmt_by_call_);

        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error("Failed to read audit records"));
        }
        return rows;
    }

    Expected<size_t> size() const {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t count = 0;
        if (sqlite3_step(stmt_size_) == SQLITE_ROW) {
            count = static_cast<size_t>(sqlite3_column_int64(stmt_size_, 0));
        }
        sqlite3_reset(stmt_size_);
        return count;
    }

    const std::string& path() const { return db_path_; }

private:
    SqliteAuditLog(sqlite3* db, std::string db_path)
        : db_(db)
        , db_path_(std::move(db_path))
    {}

    Expected<void> initialize_schema() {
        char* err_msg = nullptr;
        constexpr const char* table_sql =
            "CREATE TABLE IF NOT EXISTS audit_records("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "call_id TEXT NOT NULL,"
            "session_id TEXT NOT NULL,"
            "tool_name TEXT NOT NULL,"
            "status TEXT NOT NULL,"
            "error_kind TEXT,"
            "timeout_layer TEXT,"
            "elapsed_ms INTEGER NOT NULL,"
            "outcome_json TEXT NOT NULL,"
            "observation_json TEXT,"
            "score REAL,"
            "recorded_at INTEGER NOT NULL"
            ");"
            "CREATE INDEX IF NOT EXISTS audit_records_call ON audit_records(call_id)";
        if (sqlite3_exec(db_, table_sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
            sqlite3_free(err_msg);
            return tl::unexpected(Error{ErrorCode::AuditWriteFailed, std::move(message), db_path_});
        }

        constexpr const char* insert_sql =
            "INSERT INTO audit_records(call_id, session_id, tool_name, status, error_kind, "
            "timeout_layer, elapsed_ms, outcome_json, observation_json, score, recorded_at) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)";
        if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt_insert_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error("Failed to prepare cached insert statement"));
        }

        constexpr const char* by_call_sql =
            "SELECT call_id, session_id, tool_name, outcome_json, observation_json, recorded_at "
            "FROM audit_records WHERE call_id = ?1 ORDER BY id";
        if (sqlite3_prepare_v2(db_, by_call_sql, -1, &stmt_by_call_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error("Failed to prepare cached lookup statement"));
        }

        constexpr const char* size_sql = "SELECT COUNT(*) FROM audit_records";
        if (sqlite3_prepare_v2(db_, size_sql, -1, &stmt_size_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error("Failed to prepare cached size statement"));
        }

        return {};
    }

    static std::string column_text(sqlite3_stmt* stmt, int column) {
        const unsigned char* raw = sqlite3_column_text(stmt, column);
        return raw != nullptr ? std::string(reinterpret_cast<const char*>(raw)) : std::string();
    }

    Error make_sql_error(const std::string& prefix) const {
        return Error{
            ErrorCode::AuditWriteFailed,
            prefix + ": " + sqlite3_errmsg(db_),
            db_path_
        };
    }

    sqlite3* db_ = nullptr;
    std::string db_path_;
    mutable std::mutex mutex_;

    sqlite3_stmt* stmt_insert_ = nullptr;
    mutable sqlite3_stmt* stmt_by_call_ = nullptr;
    mutable sqlite3_stmt* stmt_size_ = nullptr;
};

} // namespace engine
} // namespace warden
