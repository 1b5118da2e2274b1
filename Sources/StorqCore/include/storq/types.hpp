#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <variant>
#include <set>
#include <unordered_map>

namespace storq {

// Primary key type (SQLite rowid)
using primary_key_t = int64_t;

// A single SQLite column value. Order matches the SQLite storage classes:
// NULL, INTEGER, REAL, TEXT, BLOB.
using column_value_t = std::variant<std::nullptr_t, int64_t, double, std::string, std::vector<uint8_t>>;

// Row as a map of column name -> value
using row_t = std::unordered_map<std::string, column_value_t>;

// Set of table names (observed or affected). Ordered so that logs and
// equality checks are deterministic.
using table_set = std::set<std::string>;

// Column/value pairs for writes, in statement order
using column_values = std::vector<std::pair<std::string, column_value_t>>;

} // namespace storq
