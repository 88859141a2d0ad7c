#include "strata/index_manager.hpp"
#include "strata/catalog.hpp"
#include "strata/identifier.hpp"
#include "strata/log.hpp"
#include "strata/snapshot_manager.hpp"
#include "strata/snapshot_queue.hpp"

#include <algorithm>

namespace strata {

namespace {

bool is_auto_index(const std::string& name) {
    const std::string prefix = auto_index_prefix;
    return name.size() >= prefix.size() && same_identifier(name.substr(0, prefix.size()), prefix);
}

} // namespace

index_manager::index_manager(database& db,
                             snapshot_queue* queue,
                             std::vector<std::string> system_tables,
                             bool pre_change_snapshots)
    : db_(db)
    , queue_(queue)
    , system_tables_(std::move(system_tables))
    , pre_change_snapshots_(pre_change_snapshots) {
}

bool index_manager::is_protected(const std::string& table) const {
    return is_system_table(table, system_tables_) || snapshot_manager::is_bookkeeping_table(table);
}

void index_manager::request_snapshot(std::string name, std::string description) {
    if (!pre_change_snapshots_ || !queue_) return;
    snapshot_options options;
    options.name = std::move(name);
    options.description = std::move(description);
    options.type = snapshot_type::pre_change;
    queue_->request(std::move(options));
}

index_info index_manager::describe(const std::string& name, const std::string& table, bool unique) const {
    index_info info;
    info.name = name;
    info.table_name = table;
    info.unique = unique;
    info.columns = catalog(db_).index_columns(name);
    auto sql = db_.query_scalar("SELECT sql FROM sqlite_master WHERE type = 'index' AND name = ?", {name});
    info.create_sql = detail::as_string(sql);
    return info;
}

std::vector<index_info> index_manager::get_table_indexes(const std::string& table) const {
    validate_and_escape_identifier(identifier_kind::table, table);

    std::vector<index_info> indexes;
    for (const auto& entry : catalog(db_).index_list(table)) {
        if (is_auto_index(entry.name)) continue;
        indexes.push_back(describe(entry.name, table, entry.unique));
    }
    return indexes;
}

std::vector<index_info> index_manager::get_all_user_indexes() const {
    auto rows = db_.query("SELECT name, tbl_name FROM sqlite_master "
                          "WHERE type = 'index' AND name NOT LIKE 'sqlite_autoindex_%' AND sql IS NOT NULL "
                          "ORDER BY tbl_name, name");
    catalog cat(db_);
    std::vector<index_info> indexes;
    indexes.reserve(rows.size());
    for (const auto& row : rows) {
        const std::string name = detail::as_string(detail::field(row, "name"));
        const std::string table = detail::as_string(detail::field(row, "tbl_name"));
        auto entries = cat.index_list(table);
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const catalog::index_entry& e) { return e.name == name; });
        indexes.push_back(describe(name, table, it != entries.end() && it->unique));
    }
    return indexes;
}

void index_manager::create_index(const std::string& name,
                                 const std::string& table,
                                 const std::vector<std::string>& columns,
                                 const index_options& options) {
    if (name.empty() || table.empty() || columns.empty()) {
        throw strata_error("Index name, table name, and columns are required");
    }
    if (is_protected(table)) {
        LOG_WARN("index", "Rejected index on system table %s", table.c_str());
        throw system_table_protected(table);
    }

    const std::string index_sql = validate_and_escape_identifier(identifier_kind::index, name);
    const std::string table_sql = validate_and_escape_identifier(identifier_kind::table, table);
    std::string column_list;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) column_list += ", ";
        column_list += validate_and_escape_identifier(identifier_kind::column, columns[i]);
    }

    if (!db_.table_exists(table)) {
        throw not_found("Table " + table + " not found");
    }
    auto existing = get_table_indexes(table);
    if (std::any_of(existing.begin(), existing.end(),
                    [&](const index_info& i) { return same_identifier(i.name, name); })) {
        throw strata_error("Index \"" + name + "\" already exists");
    }

    request_snapshot("Before creating index " + name,
                     "Auto-snapshot before creating index " + name + " on table " + table);

    LOG_INFO("index", "Creating %sindex %s on %s", options.unique ? "unique " : "", name.c_str(), table.c_str());
    db_.execute(std::string("CREATE ") + (options.unique ? "UNIQUE " : "") + "INDEX " + index_sql +
                " ON " + table_sql + " (" + column_list + ")");
}

void index_manager::drop_index(const std::string& name) {
    if (name.empty()) {
        throw strata_error("Index name is required");
    }
    if (is_auto_index(name)) {
        throw strata_error("Cannot drop system-generated index " + name);
    }
    const std::string index_sql = validate_and_escape_identifier(identifier_kind::index, name);

    auto all = get_all_user_indexes();
    auto it = std::find_if(all.begin(), all.end(),
                           [&](const index_info& i) { return same_identifier(i.name, name); });
    if (it == all.end()) {
        throw not_found("Index \"" + name + "\" not found");
    }
    if (is_protected(it->table_name)) {
        throw system_table_protected(it->table_name);
    }

    request_snapshot("Before dropping index " + name,
                     "Auto-snapshot before dropping index " + name + " from table " + it->table_name);

    LOG_INFO("index", "Dropping index %s", name.c_str());
    db_.execute("DROP INDEX " + index_sql);
}

} // namespace strata
