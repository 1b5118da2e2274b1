#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace storq {

// ============================================================================
// query - structured SELECT against a single table
// ============================================================================
//
// Immutable once built. Usage:
//   auto q = storq::query::builder()
//                .table("users")
//                .where("email = ?")
//                .where_args({std::string("a@b.c")})
//                .order_by("id DESC")
//                .build();

class query {
public:
    class builder;

    [[nodiscard]] const std::string& table() const noexcept { return table_; }
    [[nodiscard]] bool distinct() const noexcept { return distinct_; }
    [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return columns_; }
    [[nodiscard]] const std::string& where() const noexcept { return where_; }
    [[nodiscard]] const std::vector<column_value_t>& where_args() const noexcept { return where_args_; }
    [[nodiscard]] const std::string& group_by() const noexcept { return group_by_; }
    [[nodiscard]] const std::string& having() const noexcept { return having_; }
    [[nodiscard]] const std::string& order_by() const noexcept { return order_by_; }
    [[nodiscard]] const std::string& limit() const noexcept { return limit_; }

    /// Render as a SELECT statement; parameters stay as '?' placeholders.
    [[nodiscard]] std::string to_sql() const;

    bool operator==(const query& other) const;
    bool operator!=(const query& other) const { return !(*this == other); }

private:
    query() = default;

    std::string table_;
    bool distinct_ = false;
    std::vector<std::string> columns_;
    std::string where_;
    std::vector<column_value_t> where_args_;
    std::string group_by_;
    std::string having_;
    std::string order_by_;
    std::string limit_;
};

class query::builder {
public:
    builder& table(std::string table) { q_.table_ = std::move(table); return *this; }
    builder& distinct(bool distinct) { q_.distinct_ = distinct; return *this; }
    builder& columns(std::vector<std::string> columns) { q_.columns_ = std::move(columns); return *this; }
    builder& where(std::string where) { q_.where_ = std::move(where); return *this; }
    builder& where_args(std::vector<column_value_t> args) { q_.where_args_ = std::move(args); return *this; }
    builder& group_by(std::string group_by) { q_.group_by_ = std::move(group_by); return *this; }
    builder& having(std::string having) { q_.having_ = std::move(having); return *this; }
    builder& order_by(std::string order_by) { q_.order_by_ = std::move(order_by); return *this; }
    builder& limit(size_t count);
    builder& limit(size_t offset, size_t count);

    /// Throws configuration_error if the table is empty, or if where_args are
    /// given without a where clause, or having without group_by.
    [[nodiscard]] query build() const;

private:
    query q_;
};

// ============================================================================
// raw_query - arbitrary statement plus the tables it observes/affects
// ============================================================================
//
// observes_tables is only used to filter change notifications for Get
// operations; affects_tables is what a raw write statement notifies about.
// Neither is ever parsed out of the statement.

class raw_query {
public:
    class builder;

    [[nodiscard]] const std::string& statement() const noexcept { return statement_; }
    [[nodiscard]] const std::vector<column_value_t>& args() const noexcept { return args_; }
    [[nodiscard]] const table_set& observes_tables() const noexcept { return observes_tables_; }
    [[nodiscard]] const table_set& affects_tables() const noexcept { return affects_tables_; }

    bool operator==(const raw_query& other) const;
    bool operator!=(const raw_query& other) const { return !(*this == other); }

private:
    raw_query() = default;

    std::string statement_;
    std::vector<column_value_t> args_;
    table_set observes_tables_;
    table_set affects_tables_;
};

class raw_query::builder {
public:
    builder& statement(std::string statement) { q_.statement_ = std::move(statement); return *this; }
    builder& args(std::vector<column_value_t> args) { q_.args_ = std::move(args); return *this; }
    builder& observes_tables(table_set tables) { q_.observes_tables_ = std::move(tables); return *this; }
    builder& affects_tables(table_set tables) { q_.affects_tables_ = std::move(tables); return *this; }

    /// Throws configuration_error if the statement is empty or a table name is empty.
    [[nodiscard]] raw_query build() const;

private:
    raw_query q_;
};

// ============================================================================
// get_descriptor - exactly one of {query, raw_query}; monostate = not set
// ============================================================================

using get_descriptor = std::variant<std::monostate, query, raw_query>;

[[nodiscard]] inline bool has_descriptor(const get_descriptor& d) noexcept {
    return !std::holds_alternative<std::monostate>(d);
}

/// Tables whose changes should re-run the descriptor:
/// {table} for a query, observes_tables for a raw_query.
/// Throws configuration_error for an unset descriptor.
[[nodiscard]] table_set observed_tables(const get_descriptor& descriptor);

/// Short human-readable form for logs and error messages.
[[nodiscard]] std::string describe(const get_descriptor& descriptor);

} // namespace storq
