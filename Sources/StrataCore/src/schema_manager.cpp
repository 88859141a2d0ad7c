#include "strata/schema_manager.hpp"
#include "strata/catalog.hpp"
#include "strata/identifier.hpp"
#include "strata/log.hpp"
#include "strata/snapshot_manager.hpp"
#include "strata/snapshot_queue.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace strata {

namespace {

constexpr const char* implicit_id_column = "\"id\" TEXT PRIMARY KEY DEFAULT (lower(hex(randomblob(16))))";
constexpr const char* implicit_created_at_column = "\"created_at\" DATETIME DEFAULT CURRENT_TIMESTAMP";
constexpr const char* implicit_updated_at_column = "\"updated_at\" DATETIME DEFAULT CURRENT_TIMESTAMP";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool declares_primary_key(const std::optional<std::string>& constraints) {
    return constraints && upper(*constraints).find("PRIMARY KEY") != std::string::npos;
}

// Constraint clauses are passed through verbatim, so refuse anything that
// could end the statement or hide the rest of it.
void check_constraints(const column_definition& column) {
    if (!column.constraints) return;
    const std::string& c = *column.constraints;
    if (c.find(';') != std::string::npos || c.find("--") != std::string::npos ||
        c.find("/*") != std::string::npos) {
        throw strata_error("Invalid constraints for column " + column.name + ": " + c);
    }
}

std::string references_clause(const foreign_key_ref& ref) {
    return "REFERENCES " + validate_and_escape_identifier(identifier_kind::table, ref.table) + "(" +
           validate_and_escape_identifier(identifier_kind::column, ref.column) + ")";
}

int64_t count(const database& db, const std::string& sql) {
    return detail::as_int(db.query_scalar(sql));
}

} // namespace

schema_manager::schema_manager(database& db,
                               snapshot_queue* queue,
                               std::vector<std::string> system_tables,
                               bool pre_change_snapshots)
    : db_(db)
    , queue_(queue)
    , system_tables_(std::move(system_tables))
    , pre_change_snapshots_(pre_change_snapshots) {
}

bool schema_manager::is_protected(const std::string& table) const {
    return is_system_table(table, system_tables_) || snapshot_manager::is_bookkeeping_table(table);
}

void schema_manager::check_not_protected(const std::string& table) const {
    if (is_protected(table)) {
        LOG_WARN("schema", "Rejected change to system table %s", table.c_str());
        throw system_table_protected(table);
    }
}

void schema_manager::request_snapshot(const std::string& description) {
    if (!pre_change_snapshots_ || !queue_) return;
    snapshot_options options;
    options.description = description;
    options.type = snapshot_type::pre_change;
    queue_->request(std::move(options));
}

table_schema schema_manager::require_table(const std::string& table) const {
    return catalog(db_).describe(table);
}

// ============================================================================
// Table lifecycle
// ============================================================================

void schema_manager::create_table(const std::string& name, const std::vector<column_definition>& columns) {
    check_not_protected(name);
    const std::string table_sql = validate_and_escape_identifier(identifier_kind::table, name);

    if (columns.empty()) {
        throw strata_error("Table " + name + " needs at least one column");
    }

    std::vector<std::string> definitions;
    std::vector<std::string> foreign_keys;
    std::vector<std::string> seen;
    bool declared_id = false;
    bool declared_id_is_key = false;
    int declared_keys = 0;

    for (const auto& col : columns) {
        const std::string col_sql = validate_and_escape_identifier(identifier_kind::column, col.name);
        const std::string type = validate_and_normalize_type(col.type);
        check_constraints(col);

        const std::string key = lower(col.name);
        if (std::find(seen.begin(), seen.end(), key) != seen.end()) {
            throw strata_error("Duplicate column name: " + col.name);
        }
        seen.push_back(key);
        if (key == "created_at" || key == "updated_at") {
            throw strata_error("Column " + col.name + " is added to every table automatically");
        }

        const bool is_key = declares_primary_key(col.constraints);
        if (is_key) ++declared_keys;
        if (key == "id") {
            declared_id = true;
            declared_id_is_key = is_key;
        }

        std::string def = col_sql + " " + type;
        if (col.constraints && !col.constraints->empty()) def += " " + *col.constraints;
        definitions.push_back(std::move(def));

        if (col.foreign_key) {
            foreign_keys.push_back("FOREIGN KEY (" + col_sql + ") " + references_clause(*col.foreign_key));
        }
    }

    // The implicit id is the primary key unless a declared id takes its place
    if (declared_id && !(declared_id_is_key && declared_keys == 1)) {
        throw strata_error("Column id duplicates the implicit primary key of " + name);
    }
    if (!declared_id && declared_keys > 0) {
        throw strata_error("Table " + name + " already has the implicit primary key id");
    }

    if (db_.table_exists(name)) {
        throw strata_error("Table " + name + " already exists");
    }

    request_snapshot("Before creating table: " + name);

    std::string sql = "CREATE TABLE " + table_sql + " (";
    if (!declared_id) {
        sql += std::string(implicit_id_column) + ", ";
    }
    for (const auto& def : definitions) {
        sql += def + ", ";
    }
    sql += std::string(implicit_created_at_column) + ", " + implicit_updated_at_column;
    for (const auto& fk : foreign_keys) {
        sql += ", " + fk;
    }
    sql += ")";

    LOG_INFO("schema", "Creating table %s", name.c_str());
    LOG_DEBUG("schema", "%s", sql.c_str());
    db_.execute(sql);
}

void schema_manager::drop_table(const std::string& name) {
    check_not_protected(name);
    const std::string table_sql = validate_and_escape_identifier(identifier_kind::table, name);

    request_snapshot("Before dropping table: " + name);

    LOG_INFO("schema", "Dropping table %s", name.c_str());
    db_.execute("DROP TABLE IF EXISTS " + table_sql);
}

// ============================================================================
// Column operations
// ============================================================================

void schema_manager::add_column(const std::string& table, const column_definition& column) {
    check_not_protected(table);
    const std::string table_sql = validate_and_escape_identifier(identifier_kind::table, table);
    const std::string col_sql = validate_and_escape_identifier(identifier_kind::column, column.name);
    const std::string type = validate_and_normalize_type(column.type);
    check_constraints(column);
    if (column.foreign_key) {
        references_clause(*column.foreign_key);  // validates the referenced names
    }
    require_table(table);

    std::string sql = "ALTER TABLE " + table_sql + " ADD COLUMN " + col_sql + " " + type;
    if (column.constraints && !column.constraints->empty()) sql += " " + *column.constraints;

    request_snapshot("Before adding column " + column.name + " to " + table);

    LOG_INFO("schema", "Adding column %s to %s", column.name.c_str(), table.c_str());
    if (!column.foreign_key) {
        db_.execute(sql);
        return;
    }

    // ALTER TABLE cannot add a constraint, so the foreign key is materialized
    // by a rebuild in the same transaction as the ADD COLUMN
    foreign_keys_suspended fk_guard(db_);
    transaction txn(db_);
    db_.execute(sql);
    const foreign_key_ref ref = *column.foreign_key;
    rebuild_table(table, [&](std::vector<column_info>&, std::vector<foreign_key>& fks) {
        foreign_key fk;
        fk.from = column.name;
        fk.table = ref.table;
        fk.to = ref.column;
        fks.push_back(std::move(fk));
    });
    txn.commit();
}

void schema_manager::rename_column(const std::string& table, const std::string& from, const std::string& to) {
    check_not_protected(table);
    const std::string table_sql = validate_and_escape_identifier(identifier_kind::table, table);
    const std::string from_sql = validate_and_escape_identifier(identifier_kind::column, from);
    const std::string to_sql = validate_and_escape_identifier(identifier_kind::column, to);
    if (!require_table(table).find_column(from)) {
        throw not_found("Column " + from + " not found in table " + table);
    }

    request_snapshot("Before renaming column " + from + " to " + to + " in " + table);

    LOG_INFO("schema", "Renaming column %s.%s to %s", table.c_str(), from.c_str(), to.c_str());
    db_.execute("ALTER TABLE " + table_sql + " RENAME COLUMN " + from_sql + " TO " + to_sql);
}

void schema_manager::drop_column(const std::string& table, const std::string& column) {
    check_not_protected(table);
    const std::string table_sql = validate_and_escape_identifier(identifier_kind::table, table);
    const std::string col_sql = validate_and_escape_identifier(identifier_kind::column, column);
    if (!require_table(table).find_column(column)) {
        throw not_found("Column " + column + " not found in table " + table);
    }

    request_snapshot("Before dropping column " + column + " from " + table);

    LOG_INFO("schema", "Dropping column %s.%s", table.c_str(), column.c_str());
    db_.execute("ALTER TABLE " + table_sql + " DROP COLUMN " + col_sql);
}

validation_result schema_manager::validate_column_changes(const std::string& table,
                                                          const std::string& column,
                                                          const column_changes& changes) const {
    const std::string table_sql = validate_and_escape_identifier(identifier_kind::table, table);
    const std::string col_sql = validate_and_escape_identifier(identifier_kind::column, column);
    const table_schema schema = require_table(table);
    const column_info* current = schema.find_column(column);
    if (!current) {
        throw not_found("Column " + column + " not found in table " + table);
    }

    validation_result result;

    if (changes.not_null && *changes.not_null) {
        int64_t nulls = count(db_, "SELECT COUNT(*) FROM " + table_sql + " WHERE " + col_sql + " IS NULL");
        if (nulls > 0) {
            result.errors.push_back("Cannot add NOT NULL constraint: " + std::to_string(nulls) +
                                    " rows have NULL values in column '" + column + "'");
            result.conflicting_rows += nulls;
        }
    }

    if (changes.fk_change == foreign_key_change::set) {
        const auto& ref = changes.foreign_key;
        const std::string ref_table_sql = validate_and_escape_identifier(identifier_kind::table, ref.table);
        const std::string ref_col_sql = validate_and_escape_identifier(identifier_kind::column, ref.column);
        if (!db_.table_exists(ref.table)) {
            throw not_found("Referenced table " + ref.table + " not found");
        }
        int64_t orphans = count(db_,
            "SELECT COUNT(*) FROM " + table_sql + " t1 WHERE t1." + col_sql + " IS NOT NULL "
            "AND NOT EXISTS (SELECT 1 FROM " + ref_table_sql + " t2 WHERE t2." + ref_col_sql +
            " = t1." + col_sql + ")");
        if (orphans > 0) {
            result.errors.push_back("Cannot add foreign key constraint: " + std::to_string(orphans) +
                                    " rows reference non-existent values in '" + ref.table + "." +
                                    ref.column + "'");
            result.conflicting_rows += orphans;
        }
    }

    if (changes.type) {
        const std::string target = validate_and_normalize_type(*changes.type);
        if (target != upper(current->declared_type) && is_numeric_type(target)) {
            const bool want_integer = is_integer_type(target);
            int64_t bad = count(db_,
                "SELECT COUNT(*) FROM " + table_sql + " WHERE " + col_sql + " IS NOT NULL "
                "AND strata_is_numeric(" + col_sql + ", " + (want_integer ? "1" : "0") + ") = 0");
            if (bad > 0) {
                result.errors.push_back("Cannot convert to " + target + ": " + std::to_string(bad) +
                                        " rows contain non-numeric values in column '" + column + "'");
                result.conflicting_rows += bad;
            }
        }
    }

    result.valid = result.errors.empty();
    return result;
}

void schema_manager::modify_column(const std::string& table,
                                   const std::string& column,
                                   const column_changes& changes) {
    check_not_protected(table);

    auto validation = validate_column_changes(table, column, changes);
    if (!validation.valid) {
        LOG_WARN("schema", "Refusing to modify %s.%s: %lld conflicting rows",
                 table.c_str(), column.c_str(), static_cast<long long>(validation.conflicting_rows));
        throw validation_failed(validation.errors, validation.conflicting_rows);
    }
    std::optional<std::string> new_type;
    if (changes.type) new_type = validate_and_normalize_type(*changes.type);

    request_snapshot("Before modifying column " + column + " in " + table);

    LOG_INFO("schema", "Modifying column %s.%s", table.c_str(), column.c_str());
    foreign_keys_suspended fk_guard(db_);
    transaction txn(db_);
    rebuild_table(table, [&](std::vector<column_info>& columns, std::vector<foreign_key>& fks) {
        for (auto& col : columns) {
            if (col.name != column) continue;
            if (new_type) col.declared_type = *new_type;
            if (changes.not_null) col.not_null = *changes.not_null;
        }
        if (changes.fk_change == foreign_key_change::keep) return;
        fks.erase(std::remove_if(fks.begin(), fks.end(),
                                 [&](const foreign_key& fk) { return fk.from == column; }),
                  fks.end());
        if (changes.fk_change == foreign_key_change::set) {
            foreign_key fk;
            fk.from = column;
            fk.table = changes.foreign_key.table;
            fk.to = changes.foreign_key.column;
            fks.push_back(std::move(fk));
        }
    });
    txn.commit();
}

void schema_manager::rebuild_table(const std::string& table, const schema_edit& edit) {
    catalog cat(db_);
    table_schema schema = cat.describe(table);
    const auto unique_sets = cat.unique_constraints(table);

    std::vector<column_info> columns = schema.columns;
    std::vector<foreign_key> fks = schema.foreign_keys;
    edit(columns, fks);

    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string tmp = table + "_rebuild_" + std::to_string(stamp);

    std::string column_list;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) column_list += ", ";
        column_list += quote_identifier(columns[i].name);
    }

    // 1. Create the new shape under a temporary name
    // 2. Copy every row
    // 3. Drop the original (its indexes and triggers go with it)
    // 4. Move the new table into place and restore indexes and triggers
    std::vector<std::string> statements;
    statements.push_back(render_create_table(tmp, columns, fks, unique_sets));
    statements.push_back("INSERT INTO " + quote_identifier(tmp) + " (" + column_list + ") SELECT " +
                         column_list + " FROM " + quote_identifier(table));
    statements.push_back("DROP TABLE " + quote_identifier(table));
    statements.push_back("ALTER TABLE " + quote_identifier(tmp) + " RENAME TO " + quote_identifier(table));
    statements.insert(statements.end(), schema.dependent_sql.begin(), schema.dependent_sql.end());

    for (const auto& sql : statements) {
        LOG_DEBUG("schema", "rebuild %s: %s", table.c_str(), sql.c_str());
        db_.execute(sql);
    }

    // Enforcement is suspended during the rebuild, so check the result explicitly
    auto violations = db_.query("PRAGMA foreign_key_check(" + quote_identifier(table) + ")");
    if (!violations.empty()) {
        throw validation_failed({"Rebuilt table " + table + " has " + std::to_string(violations.size()) +
                                 " rows violating foreign keys"},
                                static_cast<int64_t>(violations.size()));
    }
}

std::vector<column_info> schema_manager::get_table_columns(const std::string& table) const {
    validate_and_escape_identifier(identifier_kind::table, table);
    return catalog(db_).columns(table);
}

std::vector<foreign_key> schema_manager::get_foreign_keys(const std::string& table) const {
    validate_and_escape_identifier(identifier_kind::table, table);
    return catalog(db_).foreign_keys(table);
}

} // namespace strata
