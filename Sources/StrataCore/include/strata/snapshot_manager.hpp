#pragma once

#ifdef __cplusplus

#include "blob_store.hpp"
#include "db.hpp"
#include "serialization.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

/// Everything a snapshot records about the live database, read at one instant.
struct snapshot_capture {
    std::vector<table_schema> schemas;
    std::optional<table_data> data;  // Only when a blob store is configured
    std::string full_schema;
    std::string tables_json;
    std::string schema_hash;
};

/// Captures, lists, restores and prunes versioned schema snapshots.
///
/// The metadata row in schema_snapshots is authoritative. Blob payloads
/// (per-table data and schema JSON) are an optional enrichment: when the
/// blob store is missing or failing, snapshots degrade to schema-only and
/// carry has_data_payload == false.
class snapshot_manager {
public:
    snapshot_manager(database& db,
                     std::shared_ptr<blob_store> blobs,
                     std::vector<std::string> system_tables);

    /// Bookkeeping tables owned by this manager. Never captured or restored.
    static const std::vector<std::string>& bookkeeping_tables();
    static bool is_bookkeeping_table(const std::string& name);

    /// Create schema_snapshots / schema_snapshot_counter if absent.
    void ensure_tables();

    /// Every table except SQLite internals and the bookkeeping tables, ordered by
    /// name, each with the DDL of its indexes and triggers.
    std::vector<table_schema> get_all_table_schemas() const;

    /// Rows of every non-system table, in catalog column order. A table that
    /// cannot be read is dumped as empty.
    table_data get_all_table_data() const;

    /// SHA-256 over the DDL texts sorted and joined with '|', lowercase hex.
    static std::string calculate_schema_hash(const std::vector<table_schema>& schemas);

    /// Live hash differs from the newest snapshot's hash (true with no snapshots).
    bool has_schema_changed() const;

    /// Atomically advance the version counter and return the new value.
    int64_t get_next_version();

    /// Read schemas (and data, when a blob store is set) under the connection lock.
    snapshot_capture capture() const;

    /// Write the payloads and the metadata row for an earlier capture. Always
    /// allocates a new version. Returns the snapshot id.
    std::string persist(const snapshot_capture& state, const snapshot_options& options);

    /// capture() followed by persist().
    std::string create_snapshot(const snapshot_options& options = {});

    snapshot_page get_snapshots(int64_t limit = 20, int64_t offset = 0) const;
    std::optional<schema_snapshot> get_snapshot(const std::string& id) const;
    std::optional<schema_snapshot> get_latest_snapshot() const;

    /// Drop every user table, recreate the captured ones, reinsert the captured
    /// rows, then replay the captured index and trigger DDL. Throws not_found
    /// for an unknown id. Per-table insert failures and dependents that no
    /// longer apply are reported in the result, not thrown.
    restore_report restore_snapshot(const std::string& id);

    /// Delete all but the keep_count newest snapshot rows. Payloads are kept.
    prune_result prune_snapshots(int64_t keep_count);

    /// Remove a snapshot's blob payloads. Returns false when there is no blob
    /// store or the store failed.
    bool delete_snapshot_payloads(const std::string& id);

    const std::shared_ptr<blob_store>& blobs() const { return blobs_; }

private:
    database& db_;
    std::shared_ptr<blob_store> blobs_;
    std::vector<std::string> system_tables_;

    std::vector<std::string> excluded_tables() const;
    bool write_payloads(const std::string& id, const std::string& tables_json, const table_data& data);
    std::optional<table_data> read_data_payload(const std::string& id);
    int64_t insert_rows(const std::string& table, const table_rows& rows);
};

} // namespace strata

#endif // __cplusplus
