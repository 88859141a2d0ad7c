#pragma once

#ifdef __cplusplus

#include "scheduler.hpp"
#include "types.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace strata {

class snapshot_manager;
struct snapshot_capture;

/// Fire-and-forget pre-change snapshot requests.
///
/// request() reads the schema and data on the caller's thread, before the
/// caller goes on to its DDL, and hands the blob writes and the metadata row
/// to the scheduler. Failures at either stage are logged under the
/// "snapshot_queue" tag and counted, never rethrown to the requester.
class snapshot_queue {
public:
    snapshot_queue(snapshot_manager& snapshots, shared_scheduler sched);

    /// Waits for outstanding requests so none outlives the snapshot manager.
    ~snapshot_queue();

    snapshot_queue(const snapshot_queue&) = delete;
    snapshot_queue& operator=(const snapshot_queue&) = delete;

    void request(snapshot_options options);

    /// Block until every dispatched request has finished.
    void wait_idle();

    int64_t pending_count() const;
    int64_t completed_count() const;
    int64_t failed_count() const;

    const shared_scheduler& sched() const { return sched_; }

private:
    snapshot_manager& snapshots_;
    shared_scheduler sched_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    int64_t pending_ = 0;
    int64_t completed_ = 0;
    int64_t failed_ = 0;

    void run(const snapshot_capture& state, const snapshot_options& options);
    void finish(bool ok);
};

} // namespace strata

#endif // __cplusplus
