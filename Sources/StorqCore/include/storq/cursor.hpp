#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace storq {

// ============================================================================
// row_cursor - forward-only, position-based view over a result set
// ============================================================================
//
// Rows are materialised when the cursor is created (one prepared statement,
// read start to finish), so a cursor is a consistent snapshot and never holds
// a live sqlite3_stmt. The position starts before the first row; call
// move_to_next() before reading.
//
// Move-only. close() is idempotent and also runs from the destructor.

class row_cursor {
public:
    using row_values = std::vector<column_value_t>;

    row_cursor() = default;

    row_cursor(std::vector<std::string> columns,
               std::vector<row_values> rows,
               std::function<void()> on_close = nullptr);

    ~row_cursor();

    row_cursor(const row_cursor&) = delete;
    row_cursor& operator=(const row_cursor&) = delete;

    row_cursor(row_cursor&& other) noexcept;
    row_cursor& operator=(row_cursor&& other) noexcept;

    /// Number of rows in the result set.
    [[nodiscard]] size_t count() const noexcept { return rows_.size(); }

    [[nodiscard]] size_t column_count() const noexcept { return columns_.size(); }
    [[nodiscard]] const std::vector<std::string>& column_names() const noexcept { return columns_; }

    /// Index of the named column. Throws cursor_error if absent.
    [[nodiscard]] size_t column_index(const std::string& name) const;

    /// Current position, -1 before the first row.
    [[nodiscard]] int64_t position() const noexcept { return position_; }

    /// Advance one row. Returns false (and parks after the last row) when
    /// there are no more rows.
    bool move_to_next();

    /// Reset to the first row. Returns false for an empty cursor.
    bool move_to_first();

    [[nodiscard]] bool is_before_first() const noexcept { return position_ < 0; }
    [[nodiscard]] bool is_after_last() const noexcept {
        return position_ >= static_cast<int64_t>(rows_.size());
    }

    void close();
    [[nodiscard]] bool is_closed() const noexcept { return closed_; }

    // Raw access
    [[nodiscard]] const column_value_t& value(size_t column) const;
    [[nodiscard]] const column_value_t& value(const std::string& column) const {
        return value(column_index(column));
    }

    [[nodiscard]] bool is_null(const std::string& column) const {
        return std::holds_alternative<std::nullptr_t>(value(column));
    }

    // Typed access. Throws cursor_error on NULL or on a storage class mismatch
    // (INTEGER is accepted where REAL is asked for).
    [[nodiscard]] int64_t get_int64(const std::string& column) const;
    [[nodiscard]] int get_int(const std::string& column) const;
    [[nodiscard]] double get_double(const std::string& column) const;
    [[nodiscard]] bool get_bool(const std::string& column) const { return get_int64(column) != 0; }
    [[nodiscard]] std::string get_string(const std::string& column) const;
    [[nodiscard]] std::vector<uint8_t> get_blob(const std::string& column) const;

    // NULL-tolerant variants
    [[nodiscard]] std::optional<int64_t> get_optional_int64(const std::string& column) const;
    [[nodiscard]] std::optional<std::string> get_optional_string(const std::string& column) const;

private:
    const row_values& current_row() const;
    void release() noexcept;

    std::vector<std::string> columns_;
    std::vector<row_values> rows_;
    std::function<void()> on_close_;
    int64_t position_ = -1;
    bool closed_ = false;
};

} // namespace storq
