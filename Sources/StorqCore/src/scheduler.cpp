#include "storq/scheduler.hpp"
#include "storq/log.hpp"
#include <algorithm>
#include <exception>

namespace storq {

// ============================================================================
// thread_pool_scheduler
// ============================================================================

thread_pool_scheduler::thread_pool_scheduler(size_t worker_count)
    : state_(std::make_shared<shared_state>())
{
    if (worker_count == 0) {
        worker_count = std::max<size_t>(2, std::thread::hardware_concurrency());
    }
    // Ids are recorded under the lock so is_on_thread() never sees a partial list
    std::lock_guard<std::mutex> lock(state_->mutex);
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&thread_pool_scheduler::run_loop, state_);
        worker_ids_.push_back(workers_.back().get_id());
    }
}

thread_pool_scheduler::~thread_pool_scheduler() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->running = false;
    }
    state_->cv.notify_all();

    const auto self = std::this_thread::get_id();
    for (auto& worker : workers_) {
        if (!worker.joinable()) continue;
        if (worker.get_id() == self) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

void thread_pool_scheduler::invoke(std::function<void()>&& fn) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->running) {
            LOG_WARN("scheduler", "invoke() after shutdown, task dropped");
            return;
        }
        state_->queue.push(std::move(fn));
    }
    state_->cv.notify_one();
}

bool thread_pool_scheduler::is_on_thread() const noexcept {
    auto id = std::this_thread::get_id();
    return std::find(worker_ids_.begin(), worker_ids_.end(), id) != worker_ids_.end();
}

void thread_pool_scheduler::run_loop(std::shared_ptr<shared_state> state) {
    while (true) {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&state] { return !state->queue.empty() || !state->running; });

            if (!state->running && state->queue.empty()) {
                return;
            }

            fn = std::move(state->queue.front());
            state->queue.pop();
        }

        if (!fn) continue;
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR("scheduler", "Task on thread pool threw: %s", e.what());
        } catch (...) {
            LOG_ERROR("scheduler", "Task on thread pool threw a non-standard exception");
        }
    }
}

// ============================================================================
// serial_scheduler
// ============================================================================

serial_scheduler::serial_scheduler(shared_scheduler target, bool start_suspended)
    : target_(std::move(target))
    , suspended_(start_suspended)
{}

void serial_scheduler::invoke(std::function<void()>&& fn) {
    bool start = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(fn));
        start = claim_drain_locked();
    }
    if (start) schedule_drain();
}

void serial_scheduler::resume() {
    bool start = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!suspended_) return;
        suspended_ = false;
        start = claim_drain_locked();
    }
    if (start) schedule_drain();
}

size_t serial_scheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool serial_scheduler::claim_drain_locked() {
    if (suspended_ || draining_ || queue_.empty()) return false;
    draining_ = true;
    return true;
}

void serial_scheduler::schedule_drain() {
    // Called without mutex_ held: an inline target runs drain() right here.
    // The drain task keeps the strand alive until the queue is empty.
    target_->invoke([self = shared_from_this()] { self->drain(); });
}

void serial_scheduler::drain() {
    running_on_.store(std::this_thread::get_id(), std::memory_order_release);
    while (true) {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                draining_ = false;
                running_on_.store(std::thread::id(), std::memory_order_release);
                return;
            }
            fn = std::move(queue_.front());
            queue_.pop_front();
        }

        if (!fn) continue;
        try {
            fn();
        } catch (const std::exception& e) {
            // A throwing task must not stall the tasks queued behind it
            LOG_ERROR("scheduler", "Task on serial scheduler threw: %s", e.what());
        } catch (...) {
            LOG_ERROR("scheduler", "Task on serial scheduler threw a non-standard exception");
        }
    }
}

} // namespace storq
