#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace storq {

/// Misconfigured operation: no descriptor, invalid descriptor, or no resolver
/// for the requested type. Always raised before the store is touched.
class configuration_error : public std::logic_error {
public:
    explicit configuration_error(const std::string& msg) : std::logic_error(msg) {}
};

/// Reading a column that does not exist, or reading before the first row.
class cursor_error : public std::out_of_range {
public:
    explicit cursor_error(const std::string& msg) : std::out_of_range(msg) {}
};

/// Uniform failure of one operation attempt. Wraps whatever was thrown during
/// dispatch, execution or mapping; the original is kept as the nested exception.
///
/// Must be constructed inside the handler of the exception it wraps
/// (std::nested_exception captures std::current_exception()).
class operation_error : public std::runtime_error, public std::nested_exception {
public:
    explicit operation_error(const std::string& msg) : std::runtime_error(msg) {}

    /// The original failure.
    [[nodiscard]] std::exception_ptr cause() const noexcept { return nested_ptr(); }
};

/// what() of an exception_ptr, for messages and logs.
inline std::string describe_exception(const std::exception_ptr& error) {
    if (!error) return "no exception";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace storq
