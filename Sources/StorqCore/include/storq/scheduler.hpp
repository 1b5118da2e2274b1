#pragma once

#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <queue>
#include <deque>
#include <vector>
#include <condition_variable>
#include <atomic>

namespace storq {

// ============================================================================
// Scheduler interface - abstract base for background execution contexts
// ============================================================================
//
// Blocking store work (query execution and row mapping for live queries) is
// never run on the subscriber's thread; it is handed to a scheduler:
// - thread_pool_scheduler: the store's default IO context
// - serial_scheduler: a strand over another scheduler, one task at a time
// - std_thread_scheduler: a single dedicated worker
// - immediate_scheduler: runs inline, for tests only

struct scheduler {
    virtual ~scheduler() = default;

    // Invoke the given function on this scheduler's execution context.
    // Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Check if the caller is currently on this scheduler's thread/context.
    // Can be called from any thread.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // Check if this scheduler wraps the same underlying context as another.
    [[nodiscard]] virtual bool is_same_as(const scheduler* other) const noexcept = 0;

    // Check if invoke() is currently possible.
    // May return false once the scheduler has been shut down.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// std_thread_scheduler - runs callbacks on one dedicated worker thread
// ============================================================================

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler() : running_(true) {
        // run_loop() takes mutex_ first, so the worker sees thread_id_
        std::lock_guard<std::mutex> lock(mutex_);
        worker_ = std::thread([this] { run_loop(); });
        thread_id_ = worker_.get_id();
    }

    ~std_thread_scheduler() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void invoke(std::function<void()>&& fn) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            queue_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == thread_id_;
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        auto* g = dynamic_cast<const std_thread_scheduler*>(other);
        return g && g->thread_id_ == thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return running_;
    }

private:
    void run_loop() {
        while (true) {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

                if (!running_ && queue_.empty()) {
                    return;
                }

                fn = std::move(queue_.front());
                queue_.pop();
            }

            if (fn) {
                fn();
            }
        }
    }

    std::thread worker_;
    std::thread::id thread_id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_;
};

// ============================================================================
// thread_pool_scheduler - fixed pool of workers sharing one FIFO queue
// ============================================================================
//
// Tasks may run concurrently and complete out of order. Queued tasks still
// run when the pool is destroyed; invoke() after shutdown is dropped.
//
// The pool may be destroyed from one of its own workers (a strand's last
// reference released by its drain task). That worker is detached instead of
// joined and keeps the shared queue state alive until it exits.
class thread_pool_scheduler : public scheduler {
public:
    /// worker_count == 0 picks std::thread::hardware_concurrency() (at least 2).
    explicit thread_pool_scheduler(size_t worker_count = 0);
    ~thread_pool_scheduler() override;

    thread_pool_scheduler(const thread_pool_scheduler&) = delete;
    thread_pool_scheduler& operator=(const thread_pool_scheduler&) = delete;

    void invoke(std::function<void()>&& fn) override;

    [[nodiscard]] bool is_on_thread() const noexcept override;

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        return other == this;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return state_->running;
    }

    [[nodiscard]] size_t worker_count() const noexcept { return workers_.size(); }

private:
    struct shared_state {
        std::mutex mutex;
        std::condition_variable cv;
        std::queue<std::function<void()>> queue;
        std::atomic<bool> running{true};
    };

    static void run_loop(std::shared_ptr<shared_state> state);

    std::shared_ptr<shared_state> state_;
    std::vector<std::thread> workers_;
    std::vector<std::thread::id> worker_ids_;
};

// ============================================================================
// serial_scheduler - strand: tasks run one at a time, in invoke() order,
// on the target scheduler's threads
// ============================================================================
//
// Must be owned by a shared_ptr (use make_serial_scheduler). A strand created
// suspended queues work until resume() is called.

class serial_scheduler : public scheduler,
                         public std::enable_shared_from_this<serial_scheduler> {
public:
    serial_scheduler(shared_scheduler target, bool start_suspended);

    void invoke(std::function<void()>&& fn) override;

    /// Start draining work queued while suspended. No-op if already running.
    void resume();

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return running_on_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        return other == this;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return target_->can_invoke();
    }

    /// Tasks queued and not yet started.
    [[nodiscard]] size_t pending() const;

private:
    bool claim_drain_locked();
    void schedule_drain();
    void drain();

    shared_scheduler target_;
    mutable std::mutex mutex_;
    std::deque<std::function<void()>> queue_;
    bool draining_ = false;
    bool suspended_;
    std::atomic<std::thread::id> running_on_{};
};

inline std::shared_ptr<serial_scheduler> make_serial_scheduler(shared_scheduler target,
                                                               bool start_suspended = false) {
    return std::make_shared<serial_scheduler>(std::move(target), start_suspended);
}

// ============================================================================
// immediate_scheduler - runs callbacks synchronously on calling thread
// ============================================================================
//
// Useful for testing or single-threaded applications. Using it as the store's
// IO scheduler makes live queries execute on the writer's thread.

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;  // Always "on thread" since we execute immediately
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        return dynamic_cast<const immediate_scheduler*>(other) != nullptr;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

} // namespace storq
