#include "strata/snapshot_manager.hpp"
#include "strata/catalog.hpp"
#include "strata/digest.hpp"
#include "strata/identifier.hpp"
#include "strata/log.hpp"

#include <algorithm>
#include <ctime>

namespace strata {

namespace {

constexpr const char* snapshots_table = "schema_snapshots";
constexpr const char* counter_table = "schema_snapshot_counter";

constexpr const char* snapshot_columns =
    "id, version, name, description, full_schema, tables_json, schema_hash, "
    "created_at, created_by, snapshot_type, external_checkpoint, has_data_payload";

std::string iso_timestamp() {
    time_t t = time(nullptr);
    struct tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

column_value_t optional_param(const std::optional<std::string>& value) {
    if (!value) return nullptr;
    return *value;
}

schema_snapshot snapshot_from_row(const row_t& row) {
    using namespace detail;
    schema_snapshot s;
    s.id = as_string(field(row, "id"));
    s.version = as_int(field(row, "version"));
    s.name = as_string(field(row, "name"));
    s.description = as_optional_string(field(row, "description"));
    s.full_schema = as_string(field(row, "full_schema"));
    s.tables_json = as_string(field(row, "tables_json"));
    s.schema_hash = as_string(field(row, "schema_hash"));
    s.created_at = as_string(field(row, "created_at"));
    s.created_by = as_optional_string(field(row, "created_by"));
    s.type = snapshot_type_from_string(as_string(field(row, "snapshot_type")));
    s.external_checkpoint = as_optional_string(field(row, "external_checkpoint"));
    s.has_data_payload = as_int(field(row, "has_data_payload")) != 0;
    return s;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::any_of(names.begin(), names.end(),
                       [&](const std::string& n) { return same_identifier(n, name); });
}

} // namespace

snapshot_manager::snapshot_manager(database& db,
                                   std::shared_ptr<blob_store> blobs,
                                   std::vector<std::string> system_tables)
    : db_(db), blobs_(std::move(blobs)), system_tables_(std::move(system_tables)) {
}

const std::vector<std::string>& snapshot_manager::bookkeeping_tables() {
    static const std::vector<std::string> tables = {snapshots_table, counter_table};
    return tables;
}

bool snapshot_manager::is_bookkeeping_table(const std::string& name) {
    return contains(bookkeeping_tables(), name);
}

void snapshot_manager::ensure_tables() {
    db_.execute_batch({
        "CREATE TABLE IF NOT EXISTS schema_snapshots ("
        "id TEXT PRIMARY KEY, "
        "version INTEGER NOT NULL UNIQUE, "
        "name TEXT, "
        "description TEXT, "
        "full_schema TEXT NOT NULL, "
        "tables_json TEXT NOT NULL, "
        "schema_hash TEXT NOT NULL, "
        "created_at TEXT NOT NULL, "
        "updated_at TEXT NOT NULL, "
        "created_by TEXT, "
        "snapshot_type TEXT NOT NULL DEFAULT 'manual', "
        "external_checkpoint TEXT, "
        "has_data_payload INTEGER NOT NULL DEFAULT 0)",
        "CREATE INDEX IF NOT EXISTS idx_schema_snapshots_version ON schema_snapshots(version DESC)",
        "CREATE TABLE IF NOT EXISTS schema_snapshot_counter ("
        "id INTEGER PRIMARY KEY CHECK (id = 1), "
        "current_version INTEGER NOT NULL DEFAULT 0)"
    });
}

std::vector<std::string> snapshot_manager::excluded_tables() const {
    std::vector<std::string> excluded = system_tables_;
    for (const auto& t : bookkeeping_tables()) {
        if (!contains(excluded, t)) excluded.push_back(t);
    }
    return excluded;
}

std::vector<table_schema> snapshot_manager::get_all_table_schemas() const {
    catalog cat(db_);
    std::vector<table_schema> schemas;
    for (const auto& name : cat.tables(bookkeeping_tables())) {
        schemas.push_back(cat.describe(name));
    }
    return schemas;
}

table_data snapshot_manager::get_all_table_data() const {
    catalog cat(db_);
    table_data data;
    for (const auto& table : cat.tables(excluded_tables())) {
        auto& rows = data[table];
        try {
            auto columns = cat.columns(table);
            if (columns.empty()) continue;

            std::string select = "SELECT ";
            for (size_t i = 0; i < columns.size(); ++i) {
                if (i > 0) select += ", ";
                select += quote_identifier(columns[i].name);
            }
            select += " FROM " + quote_identifier(table);

            for (const auto& row : db_.query(select)) {
                std::vector<std::pair<std::string, column_value_t>> values;
                values.reserve(columns.size());
                for (const auto& col : columns) {
                    values.emplace_back(col.name, detail::field(row, col.name));
                }
                rows.push_back(std::move(values));
            }
        } catch (const db_error& e) {
            LOG_WARN("snapshot", "Failed to read data for table %s: %s", table.c_str(), e.what());
            rows.clear();
        }
    }
    return data;
}

std::string snapshot_manager::calculate_schema_hash(const std::vector<table_schema>& schemas) {
    std::vector<std::string> ddl;
    ddl.reserve(schemas.size());
    for (const auto& s : schemas) {
        ddl.push_back(s.create_sql);
    }
    std::sort(ddl.begin(), ddl.end());

    std::string canonical;
    for (size_t i = 0; i < ddl.size(); ++i) {
        if (i > 0) canonical += '|';
        canonical += ddl[i];
    }
    return sha256_hex(canonical);
}

bool snapshot_manager::has_schema_changed() const {
    auto latest = db_.query_scalar("SELECT schema_hash FROM schema_snapshots ORDER BY version DESC LIMIT 1");
    if (detail::is_null(latest)) {
        return true;
    }
    return calculate_schema_hash(get_all_table_schemas()) != detail::as_string(latest);
}

int64_t snapshot_manager::get_next_version() {
    // Single-statement increment: the counter row is created at 1 on first use
    auto rows = db_.query(
        "INSERT INTO schema_snapshot_counter (id, current_version) VALUES (1, 1) "
        "ON CONFLICT(id) DO UPDATE SET current_version = current_version + 1 "
        "RETURNING current_version");
    if (rows.empty()) {
        throw db_error("Version counter update returned no row");
    }
    return detail::as_int(detail::field(rows[0], "current_version"));
}

snapshot_capture snapshot_manager::capture() const {
    snapshot_capture state;
    {
        // Schema and data are read under one lock so they describe the same state
        std::lock_guard<std::recursive_mutex> lock(db_.mutex());
        state.schemas = get_all_table_schemas();
        if (blobs_) {
            state.data = get_all_table_data();
        }
    }

    for (size_t i = 0; i < state.schemas.size(); ++i) {
        if (i > 0) state.full_schema += ";\n";
        state.full_schema += state.schemas[i].create_sql;
    }
    state.schema_hash = calculate_schema_hash(state.schemas);
    state.tables_json = schemas_to_json(state.schemas);
    return state;
}

std::string snapshot_manager::persist(const snapshot_capture& state, const snapshot_options& options) {
    const std::string id = uuid_t::generate().to_string();

    // Blob payloads first; the metadata row is written whatever happens here
    bool has_payload = false;
    if (blobs_ && state.data) {
        has_payload = write_payloads(id, state.tables_json, *state.data);
    }

    transaction txn(db_);
    const int64_t version = get_next_version();
    const std::string name = options.name && !options.name->empty()
        ? *options.name
        : "Snapshot v" + std::to_string(version);
    const std::string now = iso_timestamp();

    db_.execute("INSERT INTO schema_snapshots ("
                "id, version, name, description, full_schema, tables_json, schema_hash, "
                "created_by, snapshot_type, external_checkpoint, has_data_payload, created_at, updated_at"
                ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                {id, version, name, optional_param(options.description), state.full_schema,
                 state.tables_json, state.schema_hash, optional_param(options.created_by),
                 std::string(to_string(options.type)), optional_param(options.external_checkpoint),
                 static_cast<int64_t>(has_payload ? 1 : 0), now, now});
    txn.commit();

    LOG_INFO("snapshot", "Created %s snapshot %s (v%lld, %zu tables%s)",
             to_string(options.type), id.c_str(), static_cast<long long>(version), state.schemas.size(),
             has_payload ? ", with data" : ", schema only");
    return id;
}

std::string snapshot_manager::create_snapshot(const snapshot_options& options) {
    return persist(capture(), options);
}

bool snapshot_manager::write_payloads(const std::string& id,
                                      const std::string& tables_json,
                                      const table_data& data) {
    try {
        blobs_->put(snapshot_data_key(id), table_data_to_json(data));
        blobs_->put(snapshot_schema_key(id), tables_json);
        return true;
    } catch (const storage_degraded& e) {
        LOG_WARN("snapshot", "Blob store %s failed, continuing with schema-only snapshot: %s",
                 blobs_->name(), e.what());
        return false;
    }
}

std::optional<table_data> snapshot_manager::read_data_payload(const std::string& id) {
    if (!blobs_) return std::nullopt;
    try {
        auto text = blobs_->get(snapshot_data_key(id));
        if (!text) {
            LOG_WARN("snapshot", "No data payload for snapshot %s, restoring schema only", id.c_str());
            return std::nullopt;
        }
        return table_data_from_json(*text);
    } catch (const storage_degraded& e) {
        LOG_WARN("snapshot", "Failed to read data payload, restoring schema only: %s", e.what());
    } catch (const strata_error& e) {
        LOG_WARN("snapshot", "Unreadable data payload, restoring schema only: %s", e.what());
    }
    return std::nullopt;
}

snapshot_page snapshot_manager::get_snapshots(int64_t limit, int64_t offset) const {
    snapshot_page page;
    page.total = detail::as_int(db_.query_scalar("SELECT COUNT(*) FROM schema_snapshots"));
    auto rows = db_.query(std::string("SELECT ") + snapshot_columns +
                          " FROM schema_snapshots ORDER BY version DESC LIMIT ? OFFSET ?",
                          {limit, offset});
    page.snapshots.reserve(rows.size());
    for (const auto& row : rows) {
        page.snapshots.push_back(snapshot_from_row(row));
    }
    return page;
}

std::optional<schema_snapshot> snapshot_manager::get_snapshot(const std::string& id) const {
    auto rows = db_.query(std::string("SELECT ") + snapshot_columns +
                          " FROM schema_snapshots WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return snapshot_from_row(rows[0]);
}

std::optional<schema_snapshot> snapshot_manager::get_latest_snapshot() const {
    auto rows = db_.query(std::string("SELECT ") + snapshot_columns +
                          " FROM schema_snapshots ORDER BY version DESC LIMIT 1");
    if (rows.empty()) return std::nullopt;
    return snapshot_from_row(rows[0]);
}

int64_t snapshot_manager::insert_rows(const std::string& table, const table_rows& rows) {
    // Column set comes from the first row of the dump
    std::vector<std::string> columns;
    for (const auto& [column, value] : rows.front()) {
        columns.push_back(column);
    }

    std::string sql = "INSERT INTO " + quote_identifier(table) + " (";
    std::string placeholders;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            sql += ", ";
            placeholders += ", ";
        }
        sql += quote_identifier(columns[i]);
        placeholders += "?";
    }
    sql += ") VALUES (" + placeholders + ")";

    transaction txn(db_);
    for (const auto& row : rows) {
        std::vector<column_value_t> params;
        params.reserve(columns.size());
        for (const auto& column : columns) {
            auto it = std::find_if(row.begin(), row.end(),
                                   [&](const auto& entry) { return entry.first == column; });
            params.push_back(it == row.end() ? column_value_t(nullptr) : it->second);
        }
        db_.execute(sql, params);
    }
    txn.commit();
    return static_cast<int64_t>(rows.size());
}

restore_report snapshot_manager::restore_snapshot(const std::string& id) {
    auto snapshot = get_snapshot(id);
    if (!snapshot) {
        throw not_found("Snapshot not found: " + id);
    }

    auto schemas = schemas_from_json(snapshot->tables_json);

    restore_report report;
    report.restored_from = id;
    auto data = read_data_payload(id);
    report.data_available = data.has_value();

    const auto excluded = excluded_tables();
    {
        // Tables are dropped in catalog order, so references between them
        // must not be enforced until the data is back
        foreign_keys_suspended fk_guard(db_);

        transaction txn(db_);
        catalog cat(db_);
        for (const auto& table : cat.tables(excluded)) {
            db_.execute("DROP TABLE IF EXISTS " + quote_identifier(table));
        }
        for (const auto& schema : schemas) {
            if (contains(excluded, schema.name)) continue;
            if (schema.create_sql.empty()) {
                throw strata_error("Snapshot " + id + " has no DDL for table " + schema.name);
            }
            db_.execute(schema.create_sql);
            report.tables_recreated.push_back(schema.name);
        }
        txn.commit();

        if (data) {
            for (const auto& [table, rows] : *data) {
                if (!contains(report.tables_recreated, table)) {
                    LOG_WARN("snapshot", "Skipping data for table %s: not part of the restored schema",
                             table.c_str());
                    continue;
                }
                if (rows.empty()) {
                    report.rows_restored[table] = 0;
                    continue;
                }
                try {
                    report.rows_restored[table] = insert_rows(table, rows);
                } catch (const db_error& e) {
                    LOG_WARN("snapshot", "Failed to restore data for table %s: %s", table.c_str(), e.what());
                    report.failed_tables.push_back(table);
                }
            }
        }

        // Indexes and triggers go back after the rows so reinsertion fires no triggers
        for (const auto& schema : schemas) {
            if (!contains(report.tables_recreated, schema.name)) continue;
            for (const auto& sql : schema.dependent_sql) {
                try {
                    db_.execute(sql);
                    ++report.dependents_restored;
                } catch (const db_error& e) {
                    LOG_WARN("snapshot", "Failed to restore index or trigger on %s: %s",
                             schema.name.c_str(), e.what());
                    report.failed_dependents.push_back(sql);
                }
            }
        }
    }

    snapshot_options post;
    post.name = "Restored from v" + std::to_string(snapshot->version);
    post.description = "Restored from snapshot: " + snapshot->name;
    post.type = snapshot_type::automatic;
    report.post_restore_snapshot_id = create_snapshot(post);

    LOG_INFO("snapshot", "Restored snapshot %s (v%lld): %zu tables, %zu failed, %lld indexes and triggers",
             id.c_str(), static_cast<long long>(snapshot->version),
             report.tables_recreated.size(), report.failed_tables.size(),
             static_cast<long long>(report.dependents_restored));
    return report;
}

prune_result snapshot_manager::prune_snapshots(int64_t keep_count) {
    if (keep_count < 0) {
        throw strata_error("keep_count must not be negative");
    }

    prune_result result;
    transaction txn(db_);
    auto rows = db_.query("SELECT id FROM schema_snapshots "
                          "WHERE id NOT IN (SELECT id FROM schema_snapshots ORDER BY version DESC LIMIT ?) "
                          "ORDER BY version", {keep_count});
    for (const auto& row : rows) {
        result.deleted_ids.push_back(detail::as_string(detail::field(row, "id")));
    }
    db_.execute("DELETE FROM schema_snapshots "
                "WHERE id NOT IN (SELECT id FROM schema_snapshots ORDER BY version DESC LIMIT ?)",
                {keep_count});
    result.deleted = db_.changes();
    txn.commit();

    LOG_INFO("snapshot", "Pruned %lld snapshots, kept %lld",
             static_cast<long long>(result.deleted), static_cast<long long>(keep_count));
    return result;
}

bool snapshot_manager::delete_snapshot_payloads(const std::string& id) {
    if (!blobs_) return false;
    try {
        blobs_->remove(snapshot_data_key(id));
        blobs_->remove(snapshot_schema_key(id));
        return true;
    } catch (const storage_degraded& e) {
        LOG_WARN("snapshot", "Failed to delete payloads for snapshot %s: %s", id.c_str(), e.what());
        return false;
    }
}

} // namespace strata
