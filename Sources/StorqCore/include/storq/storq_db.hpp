#pragma once

#include "types.hpp"
#include "db.hpp"
#include "cursor.hpp"
#include "query.hpp"
#include "changes.hpp"
#include "resolver.hpp"
#include "scheduler.hpp"
#include "observation.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace storq {

class get_builder;

// ============================================================================
// Configuration for opening a storq_db
// ============================================================================

struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    /// Open the connection read-only. Writes then fail with db_error.
    bool read_only = false;

    /// Background context for live-query executions. nullptr = a
    /// thread_pool_scheduler sized to the machine.
    std::shared_ptr<scheduler> io_scheduler = nullptr;

    /// Default get resolvers per result type. Frozen once the store is built.
    resolver_registry registry;

    // Default constructor - in-memory
    configuration() = default;

    // Path only - file-based, default IO scheduler
    explicit configuration(const std::string& p) : path(p) {}

    // Path + IO scheduler
    configuration(const std::string& p, std::shared_ptr<storq::scheduler> s)
        : path(p), io_scheduler(std::move(s)) {}

    /// Register the default resolver used when an operation has no explicit one.
    template<typename T>
    configuration& add_type_mapping(get_resolver<T> resolver) {
        registry.add<T>(std::move(resolver));
        return *this;
    }
};

// ============================================================================
// storq_db - the row store: one SQLite connection plus change notifications
// ============================================================================
//
// Every committed write made through this object produces one change_event
// with the tables it touched: right after the statement in autocommit mode,
// at commit() inside a transaction, never after a rollback.
//
// The store must outlive every prepared operation and live subscription
// created from it.

class storq_db {
public:
    storq_db() : storq_db(configuration()) {}
    explicit storq_db(configuration config);
    ~storq_db();

    storq_db(const storq_db&) = delete;
    storq_db& operator=(const storq_db&) = delete;
    storq_db(storq_db&&) = delete;
    storq_db& operator=(storq_db&&) = delete;

    /// Entry point for Get operations: db.get().object<T>().with_query(q).prepare()
    /// (definition in prepared_get.hpp).
    get_builder get();

    // ========================================================================
    // Reads
    // ========================================================================

    row_cursor query_cursor(const query& q);
    row_cursor raw_query_cursor(const raw_query& q);

    /// Dispatch on the descriptor variant. Throws configuration_error when unset.
    row_cursor cursor_for(const get_descriptor& descriptor);

    // ========================================================================
    // Writes
    // ========================================================================

    primary_key_t insert(const std::string& table, const column_values& values);

    int update(const std::string& table,
               const column_values& values,
               const std::string& where = {},
               const std::vector<column_value_t>& where_args = {});

    int remove(const std::string& table,
               const std::string& where = {},
               const std::vector<column_value_t>& where_args = {});

    /// Execute a raw statement. Its affects_tables are added to the change set
    /// on top of whatever SQLite reports (DDL and truncating deletes report nothing).
    void execute_sql(const raw_query& q);

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // ========================================================================
    // Changes
    // ========================================================================

    /// Low-level change stream filtered by tables.
    [[nodiscard]] notification_token observe_changes_in_tables(table_set tables,
                                                               change_notifier::callback_t callback);

    /// Broadcast a change manually (e.g. after writing through another connection).
    void notify_about_changes(const change_event& event);

    change_notifier& changes() { return *notifier_; }

    // ========================================================================
    // Configuration
    // ========================================================================

    const resolver_registry& type_mappings() const noexcept { return config_.registry; }
    shared_scheduler io_scheduler() const noexcept { return io_scheduler_; }
    const configuration& config() const noexcept { return config_; }

    /// The underlying connection. Writes made here bypass change batching.
    database& connection() { return *db_; }

private:
    void setup_change_hooks();
    void record_change(const char* table_name);
    void discard_pending_changes();
    void flush_if_autocommit();
    void flush_changes();

    const configuration config_;
    std::unique_ptr<database> db_;
    std::shared_ptr<change_notifier> notifier_;
    shared_scheduler io_scheduler_;

    std::mutex pending_mutex_;
    table_set pending_tables_;
};

// RAII transaction guard; rolls back unless commit() was called
class transaction {
public:
    explicit transaction(storq_db& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    storq_db& db_;
    bool completed_ = false;
};

} // namespace storq
