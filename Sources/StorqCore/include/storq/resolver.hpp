#pragma once

#include "cursor.hpp"
#include "errors.hpp"
#include "query.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

namespace storq {

class storq_db;

// ============================================================================
// get_resolver<T> - how a Get operation runs its descriptor and maps a row
// ============================================================================
//
// A plain value: copy it, share it between operations. Both functions must be
// reentrant; they can be called from several background threads at once.
//
// Usage:
//   storq::get_resolver<User> by_hand{
//       storq::perform_default_get,
//       [](const storq::row_cursor& c) { return User{c.get_int64("id"), c.get_string("name")}; }
//   };

template<typename T>
struct get_resolver {
    using perform_get_fn = std::function<row_cursor(storq_db&, const get_descriptor&)>;
    using map_from_cursor_fn = std::function<T(const row_cursor&)>;

    /// Execute the descriptor, returning a cursor positioned before the first row.
    perform_get_fn perform_get;

    /// Map the row the cursor is currently positioned on.
    map_from_cursor_fn map_from_cursor;

    [[nodiscard]] bool is_complete() const noexcept {
        return perform_get != nullptr && map_from_cursor != nullptr;
    }
};

/// Runs a query or raw_query through the store. Throws configuration_error for
/// an unset descriptor.
row_cursor perform_default_get(storq_db& db, const get_descriptor& descriptor);

/// Resolver that executes through the store and maps rows with `mapper`.
template<typename T>
get_resolver<T> default_get_resolver(typename get_resolver<T>::map_from_cursor_fn mapper) {
    return get_resolver<T>{perform_default_get, std::move(mapper)};
}

// ============================================================================
// resolver_registry - default resolver per result type
// ============================================================================
//
// Filled in while building the store configuration and read-only once the
// store is constructed; concurrent find() calls need no locking after that.

class resolver_registry {
public:
    /// Register (or replace) the default resolver for T.
    /// Throws configuration_error if either function is missing.
    template<typename T>
    void add(get_resolver<T> resolver) {
        if (!resolver.is_complete()) {
            throw configuration_error(std::string("Incomplete get_resolver for type ") + typeid(T).name());
        }
        entries_[std::type_index(typeid(T))] =
            std::make_shared<const get_resolver<T>>(std::move(resolver));
    }

    /// Default resolver for T, or nullptr.
    template<typename T>
    [[nodiscard]] const get_resolver<T>* find() const {
        auto it = entries_.find(std::type_index(typeid(T)));
        if (it == entries_.end()) {
            return nullptr;
        }
        return static_cast<const get_resolver<T>*>(it->second.get());
    }

    [[nodiscard]] bool contains(const std::type_info& type) const {
        return entries_.count(std::type_index(type)) != 0;
    }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::unordered_map<std::type_index, std::shared_ptr<const void>> entries_;
};

// ============================================================================
// resolve - explicit resolver wins, otherwise the registry's default
// ============================================================================
//
// Pure lookup. Throws configuration_error when neither exists; nothing has
// touched the store at that point.

template<typename T>
get_resolver<T> resolve(const std::optional<get_resolver<T>>& explicit_resolver,
                        const resolver_registry& registry) {
    if (explicit_resolver) {
        return *explicit_resolver;
    }

    const auto* registered = registry.find<T>();
    if (!registered) {
        throw configuration_error(std::string("This type does not have type mapping: type = ") +
                                  typeid(T).name() +
                                  ", db was not touched by this operation, please add type mapping for this type");
    }
    return *registered;
}

} // namespace storq
