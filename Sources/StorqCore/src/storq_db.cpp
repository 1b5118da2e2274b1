#include "storq/storq_db.hpp"
#include "storq/log.hpp"
#include <string>
#include <utility>

namespace storq {

storq_db::storq_db(configuration config)
    : config_(std::move(config))
    , notifier_(std::make_shared<change_notifier>())
{
    db_ = std::make_unique<database>(config_.path,
        config_.read_only ? database::open_mode::read_only : database::open_mode::read_write);

    io_scheduler_ = config_.io_scheduler;
    if (!io_scheduler_) {
        io_scheduler_ = std::make_shared<thread_pool_scheduler>();
    }

    setup_change_hooks();

    LOG_INFO("storq_db", "Opened %s with %zu type mapping(s)", config_.path.c_str(), config_.registry.size());
}

storq_db::~storq_db() {
    if (db_) {
        sqlite3_update_hook(db_->handle(), nullptr, nullptr);
        sqlite3_rollback_hook(db_->handle(), nullptr, nullptr);
    }
    if (auto live = notifier_->observer_count(); live > 0) {
        LOG_WARN("storq_db", "Closing %s with %zu live change observer(s)", config_.path.c_str(), live);
    }
}

void storq_db::setup_change_hooks() {
    LOG_DEBUG("setup_change_hooks", "Setting up hooks for path: %s", config_.path.c_str());

    // Update hook - records the touched table (called for each row change)
    sqlite3_update_hook(db_->handle(),
        [](void* user_data, int operation, const char* db_name, const char* table_name, sqlite3_int64 rowid) {
            auto* self = static_cast<storq_db*>(user_data);
            LOG_DEBUG("update_hook", "db=%s table=%s op=%d rowid=%lld",
                      db_name, table_name, operation, static_cast<long long>(rowid));
            self->record_change(table_name);
        },
        this
    );

    // Rollback hook - nothing recorded since the last flush was committed
    sqlite3_rollback_hook(db_->handle(),
        [](void* user_data) {
            auto* self = static_cast<storq_db*>(user_data);
            LOG_DEBUG("rollback_hook", "Discarding pending changes");
            self->discard_pending_changes();
        },
        this
    );
}

void storq_db::record_change(const char* table_name) {
    std::string table(table_name ? table_name : "");

    // Skip SQLite internal tables (ANALYZE, VACUUM, ...)
    if (table.empty() || table.rfind("sqlite_", 0) == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_tables_.insert(std::move(table));
}

void storq_db::discard_pending_changes() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_tables_.clear();
}

void storq_db::flush_if_autocommit() {
    if (!db_->is_in_transaction()) {
        flush_changes();
    }
}

void storq_db::flush_changes() {
    change_event event;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_tables_.empty()) return;
        event.affected_tables = std::move(pending_tables_);
        pending_tables_.clear();
    }

    LOG_DEBUG("flush_changes", "Notifying change in %zu table(s)", event.affected_tables.size());
    notifier_->notify(event);
}

// ============================================================================
// Reads
// ============================================================================

row_cursor storq_db::query_cursor(const query& q) {
    return db_->open_cursor(q.to_sql(), q.where_args());
}

row_cursor storq_db::raw_query_cursor(const raw_query& q) {
    return db_->open_cursor(q.statement(), q.args());
}

row_cursor storq_db::cursor_for(const get_descriptor& descriptor) {
    if (auto* q = std::get_if<query>(&descriptor)) {
        return query_cursor(*q);
    }
    if (auto* rq = std::get_if<raw_query>(&descriptor)) {
        return raw_query_cursor(*rq);
    }
    throw configuration_error("Please specify query");
}

// ============================================================================
// Writes
// ============================================================================

primary_key_t storq_db::insert(const std::string& table, const column_values& values) {
    primary_key_t id = 0;
    try {
        id = db_->insert(table, values);
    } catch (const db_error&) {
        if (!db_->is_in_transaction()) discard_pending_changes();
        throw;
    }
    flush_if_autocommit();
    return id;
}

int storq_db::update(const std::string& table,
                     const column_values& values,
                     const std::string& where,
                     const std::vector<column_value_t>& where_args) {
    int changed = 0;
    try {
        changed = db_->update(table, values, where, where_args);
    } catch (const db_error&) {
        if (!db_->is_in_transaction()) discard_pending_changes();
        throw;
    }
    flush_if_autocommit();
    return changed;
}

int storq_db::remove(const std::string& table,
                     const std::string& where,
                     const std::vector<column_value_t>& where_args) {
    int deleted = 0;
    try {
        deleted = db_->remove(table, where, where_args);
    } catch (const db_error&) {
        if (!db_->is_in_transaction()) discard_pending_changes();
        throw;
    }
    flush_if_autocommit();
    return deleted;
}

void storq_db::execute_sql(const raw_query& q) {
    try {
        db_->execute(q.statement(), q.args());
    } catch (const db_error&) {
        if (!db_->is_in_transaction()) discard_pending_changes();
        throw;
    }

    if (!q.affects_tables().empty()) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_tables_.insert(q.affects_tables().begin(), q.affects_tables().end());
    }
    flush_if_autocommit();
}

void storq_db::begin_transaction() {
    db_->begin_transaction();
}

void storq_db::commit() {
    db_->commit();
    flush_changes();
}

void storq_db::rollback() {
    db_->rollback();
    discard_pending_changes();
}

bool storq_db::is_in_transaction() const {
    return db_->is_in_transaction();
}

// ============================================================================
// Changes
// ============================================================================

notification_token storq_db::observe_changes_in_tables(table_set tables,
                                                       change_notifier::callback_t callback) {
    return notifier_->subscribe(std::move(tables), std::move(callback));
}

void storq_db::notify_about_changes(const change_event& event) {
    notifier_->notify(event);
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(storq_db& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_) {
        try {
            db_.rollback();
        } catch (const std::exception& e) {
            LOG_ERROR("transaction", "Rollback in destructor failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace storq
