#pragma once

#ifdef __cplusplus

#include "blob_store.hpp"
#include "catalog.hpp"
#include "db.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "identifier.hpp"
#include "index_manager.hpp"
#include "log.hpp"
#include "s3_blob_store.hpp"
#include "scheduler.hpp"
#include "schema_manager.hpp"
#include "snapshot_manager.hpp"
#include "snapshot_queue.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    /// Scheduler that persists pre-change snapshots. nullptr = a worker_scheduler
    /// when a blob store is configured, otherwise immediate_scheduler.
    std::shared_ptr<scheduler> sched = nullptr;

    /// Blob store for snapshot payloads. nullptr = schema-only snapshots,
    /// unless `s3` is set.
    std::shared_ptr<blob_store> blobs = nullptr;

    /// S3-compatible store to create when `blobs` is not given.
    std::optional<s3_config> s3;

    /// Request a pre_change snapshot before every mutating schema/index call.
    bool pre_change_snapshots = true;

    /// Tables the engine refuses to mutate.
    std::vector<std::string> system_tables = default_system_tables();

    /// SQLite busy timeout for lock contention between connections.
    int busy_timeout_ms = 5000;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}

    configuration(const std::string& p, std::shared_ptr<strata::scheduler> s)
        : path(p), sched(std::move(s)) {}
};

/// Owns one connection and the managers that share it.
class engine {
public:
    explicit engine(configuration config = {});
    ~engine();

    engine(const engine&) = delete;
    engine& operator=(const engine&) = delete;

    schema_manager& schemas() { return *schemas_; }
    index_manager& indexes() { return *indexes_; }
    snapshot_manager& snapshots() { return *snapshots_; }
    snapshot_queue& queue() { return *queue_; }
    database& db() { return *db_; }

    const configuration& config() const { return config_; }

private:
    configuration config_;
    std::unique_ptr<database> db_;
    std::unique_ptr<snapshot_manager> snapshots_;
    std::unique_ptr<snapshot_queue> queue_;
    std::unique_ptr<schema_manager> schemas_;
    std::unique_ptr<index_manager> indexes_;
};

} // namespace strata

#endif // __cplusplus
