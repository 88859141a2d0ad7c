#pragma once

#ifdef __cplusplus

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <deque>
#include <thread>

namespace strata {

// ============================================================================
// Scheduler interface - where pre-change snapshot work runs
// ============================================================================
//
// The snapshot queue captures on the caller's thread and hands the blob writes
// and the metadata row to a scheduler, without waiting on it. Embedders can
// plug in their own executor (a thread pool, an event loop) by implementing
// invoke().

struct scheduler {
    virtual ~scheduler() = default;

    // Run fn on this scheduler's execution context. Callable from any thread.
    // Implementations must run tasks in submission order.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // True when the caller is already on this scheduler's thread.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // False once the scheduler has been shut down; invoke() then drops work.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// worker_scheduler - persists queued snapshots on one background thread
// ============================================================================
//
// Tasks run in submission order, so snapshot versions follow the order of the
// schema changes that requested them. Shutdown stops intake and finishes the
// backlog before the thread is joined.

class worker_scheduler : public scheduler {
public:
    worker_scheduler() : accepting_(true) {
        worker_ = std::thread([this] { drain(); });
        worker_id_ = worker_.get_id();
    }

    ~worker_scheduler() override {
        shutdown();
    }

    worker_scheduler(const worker_scheduler&) = delete;
    worker_scheduler& operator=(const worker_scheduler&) = delete;

    void invoke(std::function<void()>&& fn) override {
        if (!fn) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!accepting_) return;
            backlog_.push_back(std::move(fn));
        }
        wake_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == worker_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return accepting_;
    }

    /// Refuse new work, run what is queued, join. Safe to call twice.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            accepting_ = false;
        }
        wake_.notify_one();
        if (!worker_.joinable()) return;
        if (is_on_thread()) {
            // Last owner released from inside a task: the loop exits on its own
            worker_.detach();
        } else {
            worker_.join();
        }
    }

    /// Tasks submitted but not yet started.
    size_t backlog() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return backlog_.size();
    }

private:
    void drain() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            wake_.wait(lock, [this] { return !backlog_.empty() || !accepting_; });
            if (backlog_.empty()) return;

            auto task = std::move(backlog_.front());
            backlog_.pop_front();
            lock.unlock();
            task();
            lock.lock();
        }
    }

    std::thread worker_;
    std::thread::id worker_id_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> backlog_;
    std::atomic<bool> accepting_;
};

// ============================================================================
// immediate_scheduler - runs work synchronously on the calling thread
// ============================================================================
//
// Default when neither a scheduler nor a blob store is configured: persisting
// is then a single metadata insert. Errors are still isolated by the queue.

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

} // namespace strata

#endif // __cplusplus
