#pragma once

#include "storq_db.hpp"
#include "changes.hpp"
#include "cursor.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "observation.hpp"
#include "query.hpp"
#include "resolver.hpp"
#include "scheduler.hpp"
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace storq {

template<typename T> class prepared_get_object;

namespace detail {

// Close a cursor while another exception is in flight; a failure here is
// logged and must not replace the original error.
inline void close_after_failure(row_cursor& cursor) noexcept {
    try {
        cursor.close();
    } catch (const std::exception& e) {
        LOG_WARN("get", "Cursor close failed after an earlier error: %s", e.what());
    }
}

template<typename T> class live_get_object;

} // namespace detail

// ============================================================================
// prepared_get_object<T> - Get operation yielding at most one object
// ============================================================================
//
// Immutable. Built in two stages so a descriptor is always set before the
// optional overrides:
//
//   auto op = db.get()
//                 .object<User>()
//                 .with_query(storq::query::builder().table("users").build())
//                 .with_get_resolver(custom)   // optional
//                 .prepare();
//
//   std::optional<User> u = op.execute_as_blocking();
//   auto sub = op.observe([](std::optional<User> u) { ... });

template<typename T>
class prepared_get_object {
public:
    class builder;
    class complete_builder;

    using value_callback = std::function<void(std::optional<T>)>;
    using error_callback = std::function<void(std::exception_ptr)>;

    /// Run the query now, on the calling thread, and map the first row.
    ///
    /// Blocking I/O: never call this from a UI or otherwise latency-sensitive
    /// thread. Returns std::nullopt when nothing matches; rows after the first
    /// are ignored. Every failure is rethrown as operation_error whose nested
    /// exception is the original one.
    std::optional<T> execute_as_blocking() const;

    /// Hot, endless stream of results.
    ///
    /// The first result is delivered right after subscribing; after that one
    /// result per change_event touching the observed tables ({table} for a
    /// query, observes_tables for a raw_query), in notification order. All
    /// executions run one at a time on the store's IO scheduler.
    ///
    /// A failed execution is reported once through on_error (logged when
    /// on_error is empty) and ends the stream. Keep the returned subscription
    /// alive for as long as values are wanted.
    [[nodiscard]] subscription observe(value_callback on_next, error_callback on_error = nullptr) const;

    [[nodiscard]] const get_descriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] bool has_explicit_resolver() const noexcept { return explicit_resolver_.has_value(); }

private:
    prepared_get_object(storq_db& db, get_descriptor descriptor, std::optional<get_resolver<T>> explicit_resolver)
        : db_(&db)
        , descriptor_(std::move(descriptor))
        , explicit_resolver_(std::move(explicit_resolver))
    {}

    storq_db* db_;
    get_descriptor descriptor_;
    std::optional<get_resolver<T>> explicit_resolver_;
};

// Stage one: no descriptor yet, only with_query() is available
template<typename T>
class prepared_get_object<T>::builder {
public:
    explicit builder(storq_db& db) : db_(db) {}

    /// Required: structured query.
    complete_builder with_query(query q) const {
        return complete_builder(db_, get_descriptor(std::move(q)));
    }

    /// Required: raw query, for joins and other statements a query can't express.
    complete_builder with_query(raw_query q) const {
        return complete_builder(db_, get_descriptor(std::move(q)));
    }

    /// Required: either variant. An unset descriptor fails at prepare().
    complete_builder with_query(get_descriptor descriptor) const {
        return complete_builder(db_, std::move(descriptor));
    }

private:
    storq_db& db_;
};

// Stage two: descriptor set, overrides optional
template<typename T>
class prepared_get_object<T>::complete_builder {
public:
    complete_builder(storq_db& db, get_descriptor descriptor)
        : db_(db), descriptor_(std::move(descriptor)) {}

    /// Optional: resolver used instead of the type mapping registered for T.
    /// Throws configuration_error if the resolver is missing a function.
    complete_builder& with_get_resolver(get_resolver<T> resolver) {
        if (!resolver.is_complete()) {
            throw configuration_error("get_resolver needs both perform_get and map_from_cursor");
        }
        resolver_ = std::move(resolver);
        return *this;
    }

    /// Throws configuration_error if no query or raw_query was given.
    [[nodiscard]] prepared_get_object<T> prepare() const {
        if (!has_descriptor(descriptor_)) {
            throw configuration_error("Please specify Query or RawQuery");
        }
        return prepared_get_object<T>(db_, descriptor_, resolver_);
    }

private:
    storq_db& db_;
    get_descriptor descriptor_;
    std::optional<get_resolver<T>> resolver_;
};

// ============================================================================
// get_builder - db.get()
// ============================================================================

class get_builder {
public:
    explicit get_builder(storq_db& db) : db_(db) {}

    /// Get operation for a single object of type T.
    template<typename T>
    typename prepared_get_object<T>::builder object() const {
        return typename prepared_get_object<T>::builder(db_);
    }

private:
    storq_db& db_;
};

inline get_builder storq_db::get() {
    return get_builder(*this);
}

/// One-call form: prepare(descriptor, type, resolver?).
template<typename T>
prepared_get_object<T> prepare_get_object(storq_db& db,
                                          get_descriptor descriptor,
                                          std::optional<get_resolver<T>> resolver = std::nullopt) {
    auto complete = db.get().object<T>().with_query(std::move(descriptor));
    if (resolver) {
        complete.with_get_resolver(std::move(*resolver));
    }
    return complete.prepare();
}

// ============================================================================
// execute_as_blocking
// ============================================================================

template<typename T>
std::optional<T> prepared_get_object<T>::execute_as_blocking() const {
    try {
        const auto resolver = resolve<T>(explicit_resolver_, db_->type_mappings());

        row_cursor cursor = resolver.perform_get(*db_, descriptor_);

        std::optional<T> result;
        try {
            if (cursor.count() != 0) {
                cursor.move_to_next();
                result.emplace(resolver.map_from_cursor(cursor));
            }
        } catch (...) {
            detail::close_after_failure(cursor);
            throw;
        }
        cursor.close();

        return result;
    } catch (const std::exception& e) {
        throw operation_error("Error has occurred during Get operation. " + describe(descriptor_) + ": " + e.what());
    } catch (...) {
        throw operation_error("Error has occurred during Get operation. " + describe(descriptor_) + ": unknown exception");
    }
}

// ============================================================================
// observe - live subscription wiring
// ============================================================================

namespace detail {

template<typename T>
class live_get_object : public subscription::control,
                        public std::enable_shared_from_this<live_get_object<T>> {
public:
    live_get_object(prepared_get_object<T> operation,
                    typename prepared_get_object<T>::value_callback on_next,
                    typename prepared_get_object<T>::error_callback on_error,
                    std::shared_ptr<serial_scheduler> strand)
        : operation_(std::move(operation))
        , on_next_(std::move(on_next))
        , on_error_(std::move(on_error))
        , strand_(std::move(strand))
    {}

    /// The strand is still suspended here, so the initial execution is queued
    /// ahead of anything the change registration can enqueue.
    void start(change_notifier& notifier, const table_set& tables) {
        auto self = this->shared_from_this();
        strand_->invoke([self] { self->run_once(); });

        if (!tables.empty()) {
            std::weak_ptr<live_get_object> weak = self;
            auto token = notifier.subscribe(tables, [weak](const change_event&) {
                auto live = weak.lock();
                if (!live || live->is_cancelled()) return;
                live->strand_->invoke([live] { live->run_once(); });
            });

            std::lock_guard<std::mutex> lock(token_mutex_);
            if (cancelled_.load(std::memory_order_acquire)) {
                token.unregister();
            } else {
                token_ = std::move(token);
            }
        } else {
            LOG_DEBUG("get", "No observed tables, single result for %s", describe(operation_.descriptor()).c_str());
        }

        strand_->resume();
    }

    void cancel() override {
        {
            std::lock_guard<std::recursive_mutex> lock(emit_mutex_);
            if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
        }
        release_token();
    }

    [[nodiscard]] bool is_cancelled() const noexcept override {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    /// Held across the whole attempt: cancel() on another thread waits for
    /// an execution in flight, so the store is unused once it returns.
    void run_once() {
        std::lock_guard<std::recursive_mutex> lock(emit_mutex_);
        if (is_cancelled()) return;

        std::optional<T> value;
        try {
            value = operation_.execute_as_blocking();
        } catch (const operation_error&) {
            fail(std::current_exception());
            return;
        }

        if (is_cancelled()) return;
        try {
            on_next_(std::move(value));
        } catch (...) {
            // Any type: the exception must not escape onto the worker thread
            fail(std::current_exception());
        }
    }

    void fail(std::exception_ptr error) {
        {
            std::lock_guard<std::recursive_mutex> lock(emit_mutex_);
            if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;

            if (on_error_) {
                on_error_(error);
            } else {
                LOG_ERROR("get", "Live query terminated without an error handler: %s",
                          describe_exception(error).c_str());
            }
        }
        release_token();
    }

    // Exactly once: the token is moved out under the lock
    void release_token() {
        notification_token token;
        {
            std::lock_guard<std::mutex> lock(token_mutex_);
            token = std::move(token_);
        }
        token.unregister();
    }

    prepared_get_object<T> operation_;
    typename prepared_get_object<T>::value_callback on_next_;
    typename prepared_get_object<T>::error_callback on_error_;
    std::shared_ptr<serial_scheduler> strand_;

    std::atomic<bool> cancelled_{false};
    std::recursive_mutex emit_mutex_;
    std::mutex token_mutex_;
    notification_token token_;
};

} // namespace detail

template<typename T>
subscription prepared_get_object<T>::observe(value_callback on_next, error_callback on_error) const {
    if (!on_next) {
        throw configuration_error("observe() needs a value callback");
    }

    const table_set tables = observed_tables(descriptor_);

    auto strand = make_serial_scheduler(db_->io_scheduler(), /*start_suspended=*/true);
    auto live = std::make_shared<detail::live_get_object<T>>(*this, std::move(on_next), std::move(on_error),
                                                             std::move(strand));
    live->start(db_->changes(), tables);

    return subscription(std::move(live));
}

} // namespace storq
