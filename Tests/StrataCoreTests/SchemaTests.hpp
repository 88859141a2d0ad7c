#pragma once

#include "TestSupport.hpp"
#include <algorithm>
#include <iostream>

namespace schema_tests {

using namespace strata;
using test_support::col;
using test_support::throws;

namespace {

bool has_column(schema_manager& schemas, const std::string& table, const std::string& column) {
    auto names = test_support::column_names(schemas.get_table_columns(table));
    return std::find(names.begin(), names.end(), column) != names.end();
}

int64_t snapshot_total(engine& e) {
    return e.snapshots().get_snapshots().total;
}

// Runs one SQL statement on the connection right before the next queued
// snapshot is persisted, i.e. between validation and the rebuild.
struct injecting_scheduler : scheduler {
    database* db = nullptr;
    std::string sql;

    void invoke(std::function<void()>&& fn) override {
        if (db && !sql.empty()) {
            db->execute(sql);
            sql.clear();
        }
        fn();
    }

    bool is_on_thread() const noexcept override { return true; }
    bool can_invoke() const noexcept override { return true; }
};

} // namespace

// ============================================================================
// test_notes_round_trip - drop a column, restore it with its rows
// ============================================================================

void test_notes_round_trip() {
    std::cout << "  test_notes_round_trip..." << std::flush;

    auto config = test_support::quiet_config();
    config.blobs = std::make_shared<memory_blob_store>();
    engine e(config);

    e.schemas().create_table("notes", {col("title", "TEXT"), col("body", "TEXT")});
    auto names = test_support::column_names(e.schemas().get_table_columns("notes"));
    assert((names == std::vector<std::string>{"id", "title", "body", "created_at", "updated_at"}));

    e.db().execute("INSERT INTO notes (title, body) VALUES (?, ?)", {std::string("first"), std::string("hello")});
    e.db().execute("INSERT INTO notes (title, body) VALUES (?, ?)", {std::string("second"), std::string("world")});

    snapshot_options options;
    options.name = "v1";
    auto v1 = e.snapshots().create_snapshot(options);

    e.schemas().drop_column("notes", "title");
    assert(!has_column(e.schemas(), "notes", "title"));

    auto report = e.snapshots().restore_snapshot(v1);
    assert(report.data_available);
    assert(report.failed_tables.empty());
    assert(report.rows_restored["notes"] == 2);

    assert(has_column(e.schemas(), "notes", "title"));
    assert(test_support::count_rows(e.db(), "notes") == 2);
    auto title = e.db().query_scalar("SELECT title FROM notes WHERE body = ?", {std::string("hello")});
    assert(detail::as_string(title) == "first");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_create_table_errors - every rejected definition leaves no table behind
// ============================================================================

void test_create_table_errors() {
    std::cout << "  test_create_table_errors..." << std::flush;

    engine e(test_support::quiet_config());
    auto& schemas = e.schemas();

    assert(throws<strata_error>([&] { schemas.create_table("empty", {}); }));
    assert(throws<invalid_identifier>([&] { schemas.create_table("1abc", {col("a", "TEXT")}); }));
    assert(throws<invalid_identifier>([&] { schemas.create_table("ok", {col("select", "TEXT")}); }));
    assert(throws<invalid_type>([&] { schemas.create_table("ok", {col("a", "INT")}); }));
    assert(throws<strata_error>([&] { schemas.create_table("ok", {col("Title", "TEXT"), col("title", "TEXT")}); }));
    assert(throws<strata_error>([&] { schemas.create_table("ok", {col("created_at", "DATETIME")}); }));
    assert(throws<strata_error>([&] { schemas.create_table("ok", {col("a", "TEXT", "NOT NULL; DROP TABLE x")}); }));
    assert(throws<strata_error>([&] { schemas.create_table("ok", {col("a", "TEXT", "DEFAULT 1 -- hidden")}); }));
    assert(throws<strata_error>([&] { schemas.create_table("ok", {col("email", "TEXT", "PRIMARY KEY")}); }));
    assert(throws<strata_error>([&] { schemas.create_table("ok", {col("id", "TEXT")}); }));
    assert(!e.db().table_exists("ok"));

    schemas.create_table("ok", {col("a", "TEXT")});
    assert(throws<strata_error>([&] { schemas.create_table("ok", {col("b", "TEXT")}); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_declared_id_primary_key - a declared id replaces the implicit one
// ============================================================================

void test_declared_id_primary_key() {
    std::cout << "  test_declared_id_primary_key..." << std::flush;

    engine e(test_support::quiet_config());
    e.schemas().create_table("tags", {col("id", "integer", "PRIMARY KEY"), col("label", "TEXT", "NOT NULL")});

    auto columns = e.schemas().get_table_columns("tags");
    assert(columns.size() == 4);
    auto* id = test_support::find_column(columns, "id");
    assert(id && id->is_primary_key);
    assert(id->declared_type == "INTEGER");
    auto* label = test_support::find_column(columns, "label");
    assert(label && label->not_null);

    auto* created = test_support::find_column(columns, "created_at");
    assert(created && created->default_val.kind == default_kind::keyword);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_create_table_foreign_key
// ============================================================================

void test_create_table_foreign_key() {
    std::cout << "  test_create_table_foreign_key..." << std::flush;

    engine e(test_support::quiet_config());
    e.schemas().create_table("people", {col("name", "TEXT")});

    column_definition owner = col("owner_id", "TEXT");
    owner.foreign_key = foreign_key_ref{"people", "id"};
    e.schemas().create_table("pets", {col("name", "TEXT"), owner});

    auto fks = e.schemas().get_foreign_keys("pets");
    assert(fks.size() == 1);
    assert(fks[0].from == "owner_id");
    assert(fks[0].table == "people");
    assert(fks[0].to == "id");

    assert(throws<db_error>([&] {
        e.db().execute("INSERT INTO pets (name, owner_id) VALUES ('rex', 'nobody')");
    }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_system_table_protection - rejected before any snapshot or DDL
// ============================================================================

void test_system_table_protection() {
    std::cout << "  test_system_table_protection..." << std::flush;

    engine e;
    e.db().execute("CREATE TABLE admins (id TEXT PRIMARY KEY, email TEXT)");
    e.db().execute("CREATE INDEX idx_admins_email ON admins (email)");

    auto& schemas = e.schemas();
    assert(schemas.is_protected("admins"));
    assert(schemas.is_protected("sessions"));
    assert(schemas.is_protected("schema_snapshot_counter"));
    assert(!schemas.is_protected("notes"));

    assert(throws<system_table_protected>([&] { schemas.create_table("admins", {col("a", "TEXT")}); }));
    assert(throws<system_table_protected>([&] { schemas.drop_table("admins"); }));
    assert(throws<system_table_protected>([&] { schemas.add_column("admins", col("name", "TEXT")); }));
    assert(throws<system_table_protected>([&] { schemas.rename_column("admins", "email", "mail"); }));
    assert(throws<system_table_protected>([&] { schemas.drop_column("admins", "email"); }));
    assert(throws<system_table_protected>([&] {
        schemas.modify_column("admins", "email", column_changes::with_not_null(true));
    }));
    assert(throws<system_table_protected>([&] { e.indexes().create_index("idx_x", "admins", {"email"}); }));
    assert(throws<system_table_protected>([&] { e.indexes().drop_index("idx_admins_email"); }));
    assert(throws<system_table_protected>([&] { schemas.drop_table("schema_snapshots"); }));

    // SQLite resolves names without regard to case, so neither does protection
    assert(schemas.is_protected("ADMINS"));
    assert(throws<system_table_protected>([&] { schemas.drop_table("ADMINS"); }));
    assert(throws<system_table_protected>([&] { schemas.drop_table("SCHEMA_SNAPSHOTS"); }));
    assert(throws<system_table_protected>([&] { schemas.drop_table("Schema_Snapshot_Counter"); }));
    assert(throws<system_table_protected>([&] { schemas.add_column("Admins", col("name", "TEXT")); }));
    assert(throws<system_table_protected>([&] {
        schemas.modify_column("aDmInS", "email", column_changes::with_not_null(true));
    }));
    assert(throws<system_table_protected>([&] { e.indexes().create_index("idx_y", "ADMINS", {"email"}); }));
    assert(throws<system_table_protected>([&] { e.indexes().drop_index("IDX_ADMINS_EMAIL"); }));
    assert(e.db().table_exists("schema_snapshot_counter"));
    assert(e.indexes().get_table_indexes("admins").size() == 1);

    try {
        schemas.drop_table("admins");
        assert(false);
    } catch (const system_table_protected& err) {
        assert(err.table() == "admins");
        assert(std::string(err.what()) == "Cannot modify system table: admins");
    }

    assert(e.db().table_exists("admins"));
    assert(e.db().table_exists("schema_snapshots"));
    assert(has_column(schemas, "admins", "email"));
    assert(snapshot_total(e) == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_validation_blocks_modify - no snapshot, no DDL
// ============================================================================

void test_validation_blocks_modify() {
    std::cout << "  test_validation_blocks_modify..." << std::flush;

    engine e;
    e.schemas().create_table("t", {col("a", "INTEGER")});
    e.db().execute("INSERT INTO t (a) VALUES (1)");
    e.db().execute("INSERT INTO t (a) VALUES (NULL)");
    const int64_t snapshots_before = snapshot_total(e);
    assert(snapshots_before == 1);

    auto result = e.schemas().validate_column_changes("t", "a", column_changes::with_not_null(true));
    assert(!result.valid);
    assert(result.conflicting_rows == 1);
    assert(result.errors.size() == 1);
    assert(result.errors[0] == "Cannot add NOT NULL constraint: 1 rows have NULL values in column 'a'");

    try {
        e.schemas().modify_column("t", "a", column_changes::with_not_null(true));
        assert(false);
    } catch (const validation_failed& err) {
        assert(err.conflicting_rows() == 1);
        assert(err.errors() == result.errors);
    }

    auto* a = test_support::find_column(e.schemas().get_table_columns("t"), "a");
    assert(a && !a->not_null);
    assert(snapshot_total(e) == snapshots_before);

    assert(throws<not_found>([&] {
        e.schemas().validate_column_changes("t", "missing", column_changes::with_not_null(true));
    }));
    assert(throws<not_found>([&] {
        e.schemas().validate_column_changes("nope", "a", column_changes::with_not_null(true));
    }));
    assert(throws<not_found>([&] {
        e.schemas().validate_column_changes("t", "a", column_changes::with_foreign_key({"nope", "id"}));
    }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_rebuild_atomicity - a row slipping in after validation aborts the
// rebuild and leaves the table exactly as it was
// ============================================================================

void test_rebuild_atomicity() {
    std::cout << "  test_rebuild_atomicity..." << std::flush;

    auto sched = std::make_shared<injecting_scheduler>();
    configuration config;
    config.sched = sched;
    engine e(config);
    sched->db = &e.db();

    e.schemas().create_table("t", {col("a", "INTEGER")});
    e.db().execute("INSERT INTO t (a) VALUES (1)");
    const int64_t snapshots_before = snapshot_total(e);

    sched->sql = "INSERT INTO t (a) VALUES (NULL)";
    assert(throws<db_error>([&] {
        e.schemas().modify_column("t", "a", column_changes::with_not_null(true));
    }));

    assert(test_support::count_rows(e.db(), "t") == 2);
    auto* a = test_support::find_column(e.schemas().get_table_columns("t"), "a");
    assert(a && !a->not_null);
    assert(detail::as_int(e.db().query_scalar(
        "SELECT COUNT(*) FROM sqlite_master WHERE name LIKE 't\\_rebuild\\_%' ESCAPE '\\'")) == 0);
    assert(snapshot_total(e) == snapshots_before + 1);
    assert(e.db().foreign_keys_enabled());
    assert(!e.db().is_in_transaction());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_type_cast_validation
// ============================================================================

void test_type_cast_validation() {
    std::cout << "  test_type_cast_validation..." << std::flush;

    engine e(test_support::quiet_config());
    e.schemas().create_table("m", {col("v", "TEXT")});
    for (const char* v : {"12", " 7 ", "3.5", "abc", "0"}) {
        e.db().execute("INSERT INTO m (v) VALUES (?)", {std::string(v)});
    }
    e.db().execute("INSERT INTO m (v) VALUES (NULL)");

    auto to_integer = e.schemas().validate_column_changes("m", "v", column_changes::with_type("INTEGER"));
    assert(!to_integer.valid);
    assert(to_integer.conflicting_rows == 2);
    assert(to_integer.errors[0] == "Cannot convert to INTEGER: 2 rows contain non-numeric values in column 'v'");

    auto to_real = e.schemas().validate_column_changes("m", "v", column_changes::with_type("real"));
    assert(!to_real.valid);
    assert(to_real.conflicting_rows == 1);

    // Same type: nothing to convert
    assert(e.schemas().validate_column_changes("m", "v", column_changes::with_type("TEXT")).valid);

    assert(throws<invalid_type>([&] {
        e.schemas().validate_column_changes("m", "v", column_changes::with_type("INT"));
    }));

    e.db().execute("DELETE FROM m WHERE v = 'abc'");
    e.schemas().modify_column("m", "v", column_changes::with_type("REAL"));
    auto* v = test_support::find_column(e.schemas().get_table_columns("m"), "v");
    assert(v && v->declared_type == "REAL");
    assert(test_support::count_rows(e.db(), "m") == 5);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_modify_foreign_key - set, keep, remove
// ============================================================================

void test_modify_foreign_key() {
    std::cout << "  test_modify_foreign_key..." << std::flush;

    engine e(test_support::quiet_config());
    e.schemas().create_table("people", {col("name", "TEXT")});
    e.schemas().create_table("pets", {col("name", "TEXT"), col("owner", "TEXT")});
    e.db().execute("INSERT INTO people (id, name) VALUES ('p1', 'ada')");
    e.db().execute("INSERT INTO pets (name, owner) VALUES ('rex', 'p1')");
    e.db().execute("INSERT INTO pets (name, owner) VALUES ('tom', 'ghost')");
    e.db().execute("INSERT INTO pets (name, owner) VALUES ('kit', NULL)");

    const auto set_fk = column_changes::with_foreign_key({"people", "id"});
    auto result = e.schemas().validate_column_changes("pets", "owner", set_fk);
    assert(!result.valid);
    assert(result.conflicting_rows == 1);
    assert(result.errors[0] ==
           "Cannot add foreign key constraint: 1 rows reference non-existent values in 'people.id'");
    assert(throws<validation_failed>([&] { e.schemas().modify_column("pets", "owner", set_fk); }));
    assert(e.schemas().get_foreign_keys("pets").empty());

    e.db().execute("DELETE FROM pets WHERE owner = 'ghost'");
    e.schemas().modify_column("pets", "owner", set_fk);
    auto fks = e.schemas().get_foreign_keys("pets");
    assert(fks.size() == 1);
    assert(fks[0].from == "owner" && fks[0].table == "people" && fks[0].to == "id");
    assert(throws<db_error>([&] { e.db().execute("INSERT INTO pets (name, owner) VALUES ('bob', 'ghost')"); }));

    // keep: a type change leaves the constraint alone
    e.schemas().modify_column("pets", "name", column_changes::with_not_null(true));
    e.schemas().modify_column("pets", "owner", column_changes::with_type("VARCHAR(36)"));
    fks = e.schemas().get_foreign_keys("pets");
    assert(fks.size() == 1);
    auto* owner = test_support::find_column(e.schemas().get_table_columns("pets"), "owner");
    assert(owner && owner->declared_type == "VARCHAR(36)");
    auto* name = test_support::find_column(e.schemas().get_table_columns("pets"), "name");
    assert(name && name->not_null);

    e.schemas().modify_column("pets", "owner", column_changes::without_foreign_key());
    assert(e.schemas().get_foreign_keys("pets").empty());
    e.db().execute("INSERT INTO pets (name, owner) VALUES ('bob', 'ghost')");
    assert(test_support::count_rows(e.db(), "pets") == 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_add_column
// ============================================================================

void test_add_column() {
    std::cout << "  test_add_column..." << std::flush;

    engine e(test_support::quiet_config());
    e.schemas().create_table("people", {col("name", "TEXT")});
    e.schemas().create_table("pets", {col("name", "TEXT")});
    e.db().execute("INSERT INTO pets (name) VALUES ('rex')");

    e.schemas().add_column("pets", col("age", "INTEGER", "DEFAULT 0"));
    auto* age = test_support::find_column(e.schemas().get_table_columns("pets"), "age");
    assert(age && age->default_val.text == "0");
    assert(detail::as_int(e.db().query_scalar("SELECT age FROM pets")) == 0);

    column_definition owner = col("owner", "TEXT");
    owner.foreign_key = foreign_key_ref{"people", "id"};
    e.schemas().add_column("pets", owner);
    assert(has_column(e.schemas(), "pets", "owner"));
    auto fks = e.schemas().get_foreign_keys("pets");
    assert(fks.size() == 1 && fks[0].from == "owner");
    assert(test_support::count_rows(e.db(), "pets") == 1);

    assert(throws<not_found>([&] { e.schemas().add_column("nope", col("x", "TEXT")); }));
    assert(throws<invalid_type>([&] { e.schemas().add_column("pets", col("x", "STRING")); }));
    assert(throws<db_error>([&] { e.schemas().add_column("pets", col("age", "INTEGER")); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_rename_and_drop_column
// ============================================================================

void test_rename_and_drop_column() {
    std::cout << "  test_rename_and_drop_column..." << std::flush;

    engine e;
    e.schemas().create_table("docs", {col("title", "TEXT"), col("body", "TEXT")});
    e.db().execute("INSERT INTO docs (title, body) VALUES ('a', 'b')");

    e.schemas().rename_column("docs", "title", "heading");
    assert(has_column(e.schemas(), "docs", "heading"));
    assert(!has_column(e.schemas(), "docs", "title"));

    e.schemas().drop_column("docs", "body");
    assert(!has_column(e.schemas(), "docs", "body"));
    assert(detail::as_string(e.db().query_scalar("SELECT heading FROM docs")) == "a");

    const int64_t snapshots = snapshot_total(e);
    assert(throws<not_found>([&] { e.schemas().rename_column("docs", "missing", "other"); }));
    assert(throws<not_found>([&] { e.schemas().drop_column("docs", "missing"); }));
    assert(throws<not_found>([&] { e.schemas().drop_column("nope", "body"); }));
    assert(throws<invalid_identifier>([&] { e.schemas().rename_column("docs", "heading", "from"); }));
    assert(snapshot_total(e) == snapshots);

    // SQLite refuses to drop a primary key column
    assert(throws<db_error>([&] { e.schemas().drop_column("docs", "id"); }));

    auto latest = e.snapshots().get_latest_snapshot();
    assert(latest && latest->type == snapshot_type::pre_change);
    assert(latest->description == std::optional<std::string>("Before dropping column id from docs"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_rebuild_preserves_dependents - UNIQUE constraints, defaults, indexes
// and triggers survive a rebuild
// ============================================================================

void test_rebuild_preserves_dependents() {
    std::cout << "  test_rebuild_preserves_dependents..." << std::flush;

    engine e(test_support::quiet_config());
    auto& db = e.db();
    db.execute("CREATE TABLE stock (id TEXT PRIMARY KEY, sku TEXT, bin TEXT, qty INTEGER DEFAULT 0, "
               "UNIQUE (sku, bin))");
    db.execute("CREATE INDEX idx_stock_bin ON stock (bin)");
    db.execute("CREATE TABLE stock_log (sku TEXT)");
    db.execute("CREATE TRIGGER trg_stock_log AFTER INSERT ON stock "
               "BEGIN INSERT INTO stock_log (sku) VALUES (NEW.sku); END");
    db.execute("INSERT INTO stock (id, sku, bin, qty) VALUES ('1', 'a', 'b', 5)");

    e.schemas().modify_column("stock", "qty", column_changes::with_not_null(true));

    auto* qty = test_support::find_column(e.schemas().get_table_columns("stock"), "qty");
    assert(qty && qty->not_null);
    assert(qty->default_val.text == "0");

    catalog cat(db);
    auto uniques = cat.unique_constraints("stock");
    assert(uniques.size() == 1);
    assert((uniques[0] == std::vector<std::string>{"sku", "bin"}));

    auto indexes = e.indexes().get_table_indexes("stock");
    assert(indexes.size() == 1);
    assert(indexes[0].name == "idx_stock_bin");

    assert(throws<db_error>([&] { db.execute("INSERT INTO stock (id, sku, bin) VALUES ('2', 'a', 'b')"); }));
    db.execute("INSERT INTO stock (id, sku, bin) VALUES ('3', 'c', 'b')");
    assert(test_support::count_rows(db, "stock_log") == 2);
    assert(detail::as_int(db.query_scalar("SELECT qty FROM stock WHERE id = '3'")) == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_rebuild_expression_defaults - operator defaults are rebuilt parenthesized
// ============================================================================

void test_rebuild_expression_defaults() {
    std::cout << "  test_rebuild_expression_defaults..." << std::flush;

    engine e(test_support::quiet_config());
    e.schemas().create_table("calc", {col("total", "INTEGER", "DEFAULT (1+2)"),
                                      col("label", "TEXT", "DEFAULT ('a' || 'b')"),
                                      col("note", "TEXT")});

    e.schemas().create_table("teams", {col("name", "TEXT")});

    e.schemas().modify_column("calc", "note", column_changes::with_not_null(true));
    column_definition team = col("team_id", "TEXT");
    team.foreign_key = foreign_key_ref{"teams", "id"};
    e.schemas().add_column("calc", team);
    assert(e.schemas().get_foreign_keys("calc").size() == 1);

    auto columns = e.schemas().get_table_columns("calc");
    auto* total = test_support::find_column(columns, "total");
    auto* label = test_support::find_column(columns, "label");
    assert(total && total->default_val.kind == default_kind::expression);
    assert(label && label->default_val.kind == default_kind::expression);
    assert(test_support::find_column(columns, "note")->not_null);

    e.db().execute("INSERT INTO calc (note) VALUES ('x')");
    assert(detail::as_int(e.db().query_scalar("SELECT total FROM calc")) == 3);
    assert(detail::as_string(e.db().query_scalar("SELECT label FROM calc")) == "ab");

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Schema Tests ---" << std::endl;

    test_notes_round_trip();
    test_create_table_errors();
    test_declared_id_primary_key();
    test_create_table_foreign_key();
    test_system_table_protection();
    test_validation_blocks_modify();
    test_rebuild_atomicity();
    test_type_cast_validation();
    test_modify_foreign_key();
    test_add_column();
    test_rename_and_drop_column();
    test_rebuild_preserves_dependents();
    test_rebuild_expression_defaults();

    std::cout << "--- Schema Tests: All passed ---" << std::endl;
}

} // namespace schema_tests
