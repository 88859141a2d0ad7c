#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace strata {

class snapshot_queue;

/// DDL on user tables. Alterations SQLite cannot apply in place (type change,
/// NOT NULL toggle, foreign-key add or removal) are done by rebuilding the
/// table from the structured catalog model in one atomic batch.
///
/// Every mutating call rejects system tables before touching the store, then
/// validates its input, then requests a pre-change snapshot, then runs the DDL.
class schema_manager {
public:
    schema_manager(database& db,
                   snapshot_queue* queue,
                   std::vector<std::string> system_tables,
                   bool pre_change_snapshots = true);

    /// Creates `name` with the implicit id, created_at and updated_at columns
    /// around the declared ones. A declared `id` replaces the implicit one only
    /// when it is the table's sole primary key.
    void create_table(const std::string& name, const std::vector<column_definition>& columns);

    void drop_table(const std::string& name);

    /// Native ADD COLUMN. A column with a foreign key is then materialized
    /// through a rebuild, inside the same transaction.
    void add_column(const std::string& table, const column_definition& column);

    void rename_column(const std::string& table, const std::string& from, const std::string& to);
    void drop_column(const std::string& table, const std::string& column);

    /// Read-only check of existing rows against `changes`.
    validation_result validate_column_changes(const std::string& table,
                                              const std::string& column,
                                              const column_changes& changes) const;

    /// Throws validation_failed without side effects when validation fails.
    void modify_column(const std::string& table,
                       const std::string& column,
                       const column_changes& changes);

    std::vector<column_info> get_table_columns(const std::string& table) const;
    std::vector<foreign_key> get_foreign_keys(const std::string& table) const;

    bool is_protected(const std::string& table) const;

private:
    database& db_;
    snapshot_queue* queue_;
    std::vector<std::string> system_tables_;
    bool pre_change_snapshots_;

    void check_not_protected(const std::string& table) const;
    void request_snapshot(const std::string& description);
    table_schema require_table(const std::string& table) const;

    using schema_edit = std::function<void(std::vector<column_info>&, std::vector<foreign_key>&)>;

    /// Rebuild `table` with `edit` applied to its column and foreign-key model.
    /// Must run inside a transaction with foreign-key enforcement suspended.
    void rebuild_table(const std::string& table, const schema_edit& edit);
};

} // namespace strata

#endif // __cplusplus
