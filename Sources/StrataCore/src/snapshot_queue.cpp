#include "strata/snapshot_queue.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include "strata/snapshot_manager.hpp"

namespace strata {

snapshot_queue::snapshot_queue(snapshot_manager& snapshots, shared_scheduler sched)
    : snapshots_(snapshots)
    , sched_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>()) {
}

snapshot_queue::~snapshot_queue() {
    wait_idle();
}

void snapshot_queue::request(snapshot_options options) {
    if (!sched_->can_invoke()) {
        LOG_WARN("snapshot_queue", "Scheduler is not accepting work, pre-change snapshot skipped");
        std::lock_guard<std::mutex> lock(mutex_);
        ++failed_;
        return;
    }

    std::shared_ptr<const snapshot_capture> state;
    try {
        state = std::make_shared<const snapshot_capture>(snapshots_.capture());
    } catch (const std::exception& e) {
        LOG_ERROR("snapshot_queue", "Pre-change capture failed (%s): %s",
                  options.description ? options.description->c_str() : "no description", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        ++failed_;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pending_;
    }
    LOG_DEBUG("snapshot_queue", "Requested snapshot: %s",
              options.description ? options.description->c_str() : "(no description)");
    sched_->invoke([this, state = std::move(state), options = std::move(options)] { run(*state, options); });
}

void snapshot_queue::run(const snapshot_capture& state, const snapshot_options& options) {
    bool ok = false;
    try {
        auto id = snapshots_.persist(state, options);
        LOG_DEBUG("snapshot_queue", "Pre-change snapshot %s created", id.c_str());
        ok = true;
    } catch (const std::exception& e) {
        LOG_ERROR("snapshot_queue", "Pre-change snapshot failed (%s): %s",
                  options.description ? options.description->c_str() : "no description", e.what());
    }
    finish(ok);
}

void snapshot_queue::finish(bool ok) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_;
        if (ok) ++completed_; else ++failed_;
    }
    idle_cv_.notify_all();
}

void snapshot_queue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

int64_t snapshot_queue::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

int64_t snapshot_queue::completed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

int64_t snapshot_queue::failed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

} // namespace strata
