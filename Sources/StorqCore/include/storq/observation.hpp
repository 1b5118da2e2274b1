#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>

namespace storq {

// ============================================================================
// notification_token - keeps a change registration alive until released
// ============================================================================
//
// Move-only. The release function runs exactly once: on unregister() or on
// destruction, whichever comes first.

class notification_token {
public:
    notification_token() = default;

    explicit notification_token(std::function<void()> unregister_fn)
        : unregister_(std::move(unregister_fn)) {}

    ~notification_token() {
        unregister();
    }

    notification_token(const notification_token&) = delete;
    notification_token& operator=(const notification_token&) = delete;

    notification_token(notification_token&& other) noexcept
        : unregister_(std::move(other.unregister_)) {
        other.unregister_ = nullptr;
    }

    notification_token& operator=(notification_token&& other) noexcept {
        if (this != &other) {
            unregister();
            unregister_ = std::move(other.unregister_);
            other.unregister_ = nullptr;
        }
        return *this;
    }

    /// Release the registration. Idempotent.
    void unregister() {
        if (unregister_) {
            auto fn = std::move(unregister_);
            unregister_ = nullptr;
            fn();
        }
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return unregister_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return is_valid();
    }

private:
    std::function<void()> unregister_;
};

// ============================================================================
// subscription - handle to a live (hot) query stream
// ============================================================================
//
// The stream never completes on its own. unsubscribe() (or destroying the
// handle) stops further executions and releases the change registration;
// once it returns, no execution is running and no more values are delivered.
// Calling unsubscribe() from inside a value callback is allowed.

class subscription {
public:
    /// Shared between the handle and the background work it controls.
    class control {
    public:
        virtual ~control() = default;
        virtual void cancel() = 0;
        [[nodiscard]] virtual bool is_cancelled() const noexcept = 0;
    };

    subscription() = default;

    explicit subscription(std::shared_ptr<control> control)
        : control_(std::move(control)) {}

    ~subscription() {
        unsubscribe();
    }

    subscription(const subscription&) = delete;
    subscription& operator=(const subscription&) = delete;

    subscription(subscription&& other) noexcept = default;

    subscription& operator=(subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            control_ = std::move(other.control_);
        }
        return *this;
    }

    void unsubscribe() {
        if (control_) {
            control_->cancel();
        }
    }

    /// True after unsubscribe(), or after the stream terminated with an error.
    [[nodiscard]] bool is_unsubscribed() const noexcept {
        return !control_ || control_->is_cancelled();
    }

private:
    std::shared_ptr<control> control_;
};

} // namespace storq
