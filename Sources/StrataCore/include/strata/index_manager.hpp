#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace strata {

class snapshot_queue;

/// Index lifecycle on user tables. Indexes SQLite creates for UNIQUE and
/// PRIMARY KEY constraints (sqlite_autoindex_*) are never listed or dropped.
class index_manager {
public:
    index_manager(database& db,
                  snapshot_queue* queue,
                  std::vector<std::string> system_tables,
                  bool pre_change_snapshots = true);

    /// Throws invalid_identifier for a malformed table name.
    std::vector<index_info> get_table_indexes(const std::string& table) const;

    /// Every user index, ordered by table then name.
    std::vector<index_info> get_all_user_indexes() const;

    void create_index(const std::string& name,
                      const std::string& table,
                      const std::vector<std::string>& columns,
                      const index_options& options = {});

    /// Throws not_found when no user index has this name.
    void drop_index(const std::string& name);

private:
    database& db_;
    snapshot_queue* queue_;
    std::vector<std::string> system_tables_;
    bool pre_change_snapshots_;

    bool is_protected(const std::string& table) const;
    index_info describe(const std::string& name, const std::string& table, bool unique) const;
    void request_snapshot(std::string name, std::string description);
};

} // namespace strata

#endif // __cplusplus
