#include "storq/db.hpp"
#include "storq/log.hpp"
#include <memory>
#include <sstream>
#include <type_traits>

namespace storq {

namespace {

// Holds the connection's recursive mutex for a multi-call statement sequence.
// sqlite3_db_mutex() is null outside serialized mode, where enter/leave are no-ops.
class connection_lock {
public:
    explicit connection_lock(sqlite3* db) : mutex_(sqlite3_db_mutex(db)) {
        sqlite3_mutex_enter(mutex_);
    }
    ~connection_lock() {
        sqlite3_mutex_leave(mutex_);
    }

    connection_lock(const connection_lock&) = delete;
    connection_lock& operator=(const connection_lock&) = delete;

private:
    sqlite3_mutex* mutex_;
};

using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

std::string where_suffix(const std::string& where) {
    return where.empty() ? std::string() : " WHERE " + where;
}

} // namespace

database::database(const std::string& path, open_mode mode) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw db_error("Failed to open database: " + error);
    }

    execute("PRAGMA foreign_keys = ON");

    // WAL only makes sense for a writable file database
    if (mode == open_mode::read_write && !is_in_memory()) {
        execute("PRAGMA journal_mode = WAL");
    }

    execute("PRAGMA cache_size = 50000");
    execute("PRAGMA temp_store = MEMORY");

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    LOG_DEBUG("db", "Opened %s (%s)", path_.c_str(), mode == open_mode::read_only ? "read_only" : "read_write");
}

database::~database() {
    if (db_) {
        if (mode_ == open_mode::read_write && !is_in_memory()) {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        }
        sqlite3_close(db_);
    }
}

sqlite3_stmt* database::prepare(const std::string& sql, const char* what) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
        throw db_error(std::string("Failed to prepare ") + what + ": " + error + " (SQL: " + sql + ")");
    }
    return stmt;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return;
    }

    connection_lock lock(db_);
    stmt_ptr stmt(prepare(sql, "statement"), &sqlite3_finalize);
    bind_all(stmt.get(), params);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw db_error("Execution failed: " + std::string(sqlite3_errmsg(db_)) + " (SQL: " + sql + ")");
    }
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    connection_lock lock(db_);
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to prepare statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

void database::bind_all(sqlite3_stmt* stmt, const std::vector<column_value_t>& params) {
    int expected = sqlite3_bind_parameter_count(stmt);
    if (expected != static_cast<int>(params.size())) {
        throw db_error("Statement expects " + std::to_string(expected) + " arguments, got " +
                       std::to_string(params.size()));
    }
    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

primary_key_t database::insert(const std::string& table, const column_values& values) {
    std::ostringstream sql;
    std::vector<column_value_t> params;
    params.reserve(values.size());

    if (values.empty()) {
        sql << "INSERT INTO " << table << " DEFAULT VALUES";
    } else {
        sql << "INSERT INTO " << table << " (";
        bool first = true;
        for (const auto& [col, val] : values) {
            if (!first) sql << ", ";
            sql << col;
            params.push_back(val);
            first = false;
        }

        sql << ") VALUES (";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << "?";
        }
        sql << ")";
    }

    connection_lock lock(db_);
    stmt_ptr stmt(prepare(sql.str(), "insert"), &sqlite3_finalize);
    bind_all(stmt.get(), params);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        auto err = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Insert failed: %s", err.c_str());
        throw db_error("Insert failed: " + err);
    }

    return sqlite3_last_insert_rowid(db_);
}

int database::update(const std::string& table,
                     const column_values& values,
                     const std::string& where,
                     const std::vector<column_value_t>& where_args) {
    if (values.empty()) return 0;

    std::ostringstream sql;
    sql << "UPDATE " << table << " SET ";

    std::vector<column_value_t> params;
    params.reserve(values.size() + where_args.size());

    bool first = true;
    for (const auto& [col, val] : values) {
        if (!first) sql << ", ";
        sql << col << " = ?";
        params.push_back(val);
        first = false;
    }
    sql << where_suffix(where);
    params.insert(params.end(), where_args.begin(), where_args.end());

    connection_lock lock(db_);
    stmt_ptr stmt(prepare(sql.str(), "update"), &sqlite3_finalize);
    bind_all(stmt.get(), params);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        throw db_error("Update failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return sqlite3_changes(db_);
}

int database::remove(const std::string& table,
                     const std::string& where,
                     const std::vector<column_value_t>& where_args) {
    std::string sql = "DELETE FROM " + table + where_suffix(where);

    connection_lock lock(db_);
    stmt_ptr stmt(prepare(sql, "delete"), &sqlite3_finalize);
    bind_all(stmt.get(), where_args);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        throw db_error("Delete failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return sqlite3_changes(db_);
}

std::vector<row_t> database::query(const std::string& sql,
                                   const std::vector<column_value_t>& params) {
    connection_lock lock(db_);
    stmt_ptr stmt(prepare(sql, "query"), &sqlite3_finalize);
    bind_all(stmt.get(), params);

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt.get());

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt.get(), i);
            row[name] = extract_column(stmt.get(), i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        throw db_error("Query failed: " + std::string(sqlite3_errmsg(db_)));
    }

    return results;
}

row_cursor database::open_cursor(const std::string& sql, const std::vector<column_value_t>& params) {
    connection_lock lock(db_);
    stmt_ptr stmt(prepare(sql, "query"), &sqlite3_finalize);
    bind_all(stmt.get(), params);

    int col_count = sqlite3_column_count(stmt.get());
    std::vector<std::string> columns;
    columns.reserve(static_cast<size_t>(col_count));
    for (int i = 0; i < col_count; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        columns.emplace_back(name ? name : "");
    }

    std::vector<row_cursor::row_values> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        row_cursor::row_values row;
        row.reserve(static_cast<size_t>(col_count));
        for (int i = 0; i < col_count; ++i) {
            row.push_back(extract_column(stmt.get(), i));
        }
        rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        throw db_error("Query failed: " + std::string(sqlite3_errmsg(db_)) + " (SQL: " + sql + ")");
    }

    LOG_DEBUG("db", "Cursor opened: %zu rows for %s", rows.size(), sql.c_str());
    return row_cursor(std::move(columns), std::move(rows));
}

void database::begin_transaction() {
    // BEGIN IMMEDIATE takes the write lock up front so two connections never
    // deadlock upgrading from read to write. Contention is waited out by the
    // busy timeout, so one attempt is enough.
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to begin transaction: " + std::string(sqlite3_errmsg(db_)));
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

} // namespace storq
