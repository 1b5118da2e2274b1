#include "storq/cursor.hpp"
#include "storq/log.hpp"
#include <limits>
#include <utility>

namespace storq {

namespace {

const char* storage_class_name(const column_value_t& v) {
    switch (v.index()) {
        case 0: return "NULL";
        case 1: return "INTEGER";
        case 2: return "REAL";
        case 3: return "TEXT";
        case 4: return "BLOB";
    }
    return "UNKNOWN";
}

[[noreturn]] void throw_mismatch(const std::string& column, const char* wanted, const column_value_t& v) {
    throw cursor_error("Column '" + column + "' is " + storage_class_name(v) + ", expected " + wanted);
}

} // namespace

row_cursor::row_cursor(std::vector<std::string> columns,
                       std::vector<row_values> rows,
                       std::function<void()> on_close)
    : columns_(std::move(columns))
    , rows_(std::move(rows))
    , on_close_(std::move(on_close))
{}

row_cursor::~row_cursor() {
    release();
}

row_cursor::row_cursor(row_cursor&& other) noexcept
    : columns_(std::move(other.columns_))
    , rows_(std::move(other.rows_))
    , on_close_(std::move(other.on_close_))
    , position_(other.position_)
    , closed_(other.closed_) {
    other.on_close_ = nullptr;
    other.closed_ = true;
}

row_cursor& row_cursor::operator=(row_cursor&& other) noexcept {
    if (this != &other) {
        release();
        columns_ = std::move(other.columns_);
        rows_ = std::move(other.rows_);
        on_close_ = std::move(other.on_close_);
        position_ = other.position_;
        closed_ = other.closed_;
        other.on_close_ = nullptr;
        other.closed_ = true;
    }
    return *this;
}

void row_cursor::close() {
    if (closed_) return;
    closed_ = true;
    rows_.clear();
    position_ = -1;
    if (on_close_) {
        auto fn = std::move(on_close_);
        on_close_ = nullptr;
        fn();
    }
}

void row_cursor::release() noexcept {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_WARN("cursor", "close() failed in destructor: %s", e.what());
    }
}

size_t row_cursor::column_index(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i] == name) return i;
    }
    throw cursor_error("No such column: " + name);
}

bool row_cursor::move_to_next() {
    if (closed_) return false;
    if (position_ < static_cast<int64_t>(rows_.size())) {
        ++position_;
    }
    return position_ < static_cast<int64_t>(rows_.size());
}

bool row_cursor::move_to_first() {
    if (closed_ || rows_.empty()) return false;
    position_ = 0;
    return true;
}

const row_cursor::row_values& row_cursor::current_row() const {
    if (closed_) {
        throw cursor_error("Cursor is closed");
    }
    if (position_ < 0 || position_ >= static_cast<int64_t>(rows_.size())) {
        throw cursor_error("Cursor is not positioned on a row (position " + std::to_string(position_) + ")");
    }
    return rows_[static_cast<size_t>(position_)];
}

const column_value_t& row_cursor::value(size_t column) const {
    const auto& row = current_row();
    if (column >= row.size()) {
        throw cursor_error("Column index out of range: " + std::to_string(column));
    }
    return row[column];
}

int64_t row_cursor::get_int64(const std::string& column) const {
    const auto& v = value(column);
    if (auto* i = std::get_if<int64_t>(&v)) return *i;
    throw_mismatch(column, "INTEGER", v);
}

int row_cursor::get_int(const std::string& column) const {
    auto v = get_int64(column);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw cursor_error("Column '" + column + "' does not fit in int: " + std::to_string(v));
    }
    return static_cast<int>(v);
}

double row_cursor::get_double(const std::string& column) const {
    const auto& v = value(column);
    if (auto* d = std::get_if<double>(&v)) return *d;
    if (auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    throw_mismatch(column, "REAL", v);
}

std::string row_cursor::get_string(const std::string& column) const {
    const auto& v = value(column);
    if (auto* s = std::get_if<std::string>(&v)) return *s;
    throw_mismatch(column, "TEXT", v);
}

std::vector<uint8_t> row_cursor::get_blob(const std::string& column) const {
    const auto& v = value(column);
    if (auto* b = std::get_if<std::vector<uint8_t>>(&v)) return *b;
    throw_mismatch(column, "BLOB", v);
}

std::optional<int64_t> row_cursor::get_optional_int64(const std::string& column) const {
    if (is_null(column)) return std::nullopt;
    return get_int64(column);
}

std::optional<std::string> row_cursor::get_optional_string(const std::string& column) const {
    if (is_null(column)) return std::nullopt;
    return get_string(column);
}

} // namespace storq
