#pragma once

#include "types.hpp"
#include "cursor.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <vector>
#include <string>

namespace storq {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// database - RAII SQLite connection
// ============================================================================
//
// Opened in serialized threading mode. Multi-call sequences (prepare, bind,
// step*, finalize) run under the connection mutex, so a reader on one thread
// never observes a half-applied statement from another thread.

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name) const;

    // CRUD operations
    primary_key_t insert(const std::string& table, const column_values& values);

    /// Returns the number of rows changed.
    int update(const std::string& table,
               const column_values& values,
               const std::string& where,
               const std::vector<column_value_t>& where_args = {});

    /// Returns the number of rows deleted.
    int remove(const std::string& table,
               const std::string& where,
               const std::vector<column_value_t>& where_args = {});

    // Query - returns rows as vector of column maps
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// Run a SELECT and materialise it into a cursor. The whole read happens
    /// under the connection mutex.
    row_cursor open_cursor(const std::string& sql,
                           const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    const std::string& path() const noexcept { return path_; }
    bool is_in_memory() const noexcept { return path_.empty() || path_ == ":memory:"; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3_stmt* prepare(const std::string& sql, const char* what);
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    void bind_all(sqlite3_stmt* stmt, const std::vector<column_value_t>& params);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);

    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_ = open_mode::read_write;
};

} // namespace storq
