#include "storq/query.hpp"
#include "storq/errors.hpp"
#include <sstream>

namespace storq {

// ============================================================================
// query
// ============================================================================

std::string query::to_sql() const {
    std::ostringstream sql;
    sql << "SELECT ";
    if (distinct_) sql << "DISTINCT ";

    if (columns_.empty()) {
        sql << "*";
    } else {
        bool first = true;
        for (const auto& col : columns_) {
            if (!first) sql << ", ";
            sql << col;
            first = false;
        }
    }

    sql << " FROM " << table_;

    if (!where_.empty()) sql << " WHERE " << where_;
    if (!group_by_.empty()) sql << " GROUP BY " << group_by_;
    if (!having_.empty()) sql << " HAVING " << having_;
    if (!order_by_.empty()) sql << " ORDER BY " << order_by_;
    if (!limit_.empty()) sql << " LIMIT " << limit_;

    return sql.str();
}

bool query::operator==(const query& other) const {
    return table_ == other.table_
        && distinct_ == other.distinct_
        && columns_ == other.columns_
        && where_ == other.where_
        && where_args_ == other.where_args_
        && group_by_ == other.group_by_
        && having_ == other.having_
        && order_by_ == other.order_by_
        && limit_ == other.limit_;
}

query::builder& query::builder::limit(size_t count) {
    q_.limit_ = std::to_string(count);
    return *this;
}

query::builder& query::builder::limit(size_t offset, size_t count) {
    // SQLite's "LIMIT offset, count" form
    q_.limit_ = std::to_string(offset) + ", " + std::to_string(count);
    return *this;
}

query query::builder::build() const {
    if (q_.table_.empty()) {
        throw configuration_error("Please specify table name");
    }
    if (!q_.where_args_.empty() && q_.where_.empty()) {
        throw configuration_error("where_args are set but where clause is empty: table = " + q_.table_);
    }
    if (!q_.having_.empty() && q_.group_by_.empty()) {
        throw configuration_error("having requires group_by: table = " + q_.table_);
    }
    return q_;
}

// ============================================================================
// raw_query
// ============================================================================

bool raw_query::operator==(const raw_query& other) const {
    return statement_ == other.statement_
        && args_ == other.args_
        && observes_tables_ == other.observes_tables_
        && affects_tables_ == other.affects_tables_;
}

raw_query raw_query::builder::build() const {
    if (q_.statement_.empty()) {
        throw configuration_error("Please specify query statement");
    }
    for (const auto& t : q_.observes_tables_) {
        if (t.empty()) throw configuration_error("observes_tables contains an empty table name");
    }
    for (const auto& t : q_.affects_tables_) {
        if (t.empty()) throw configuration_error("affects_tables contains an empty table name");
    }
    return q_;
}

// ============================================================================
// get_descriptor helpers
// ============================================================================

table_set observed_tables(const get_descriptor& descriptor) {
    if (auto* q = std::get_if<query>(&descriptor)) {
        return {q->table()};
    }
    if (auto* rq = std::get_if<raw_query>(&descriptor)) {
        return rq->observes_tables();
    }
    throw configuration_error("Please specify query");
}

std::string describe(const get_descriptor& descriptor) {
    if (auto* q = std::get_if<query>(&descriptor)) {
        return "query{" + q->to_sql() + "}";
    }
    if (auto* rq = std::get_if<raw_query>(&descriptor)) {
        return "raw_query{" + rq->statement() + "}";
    }
    return "<no query>";
}

} // namespace storq
