#pragma once

#include "TestSupport.hpp"
#include <iostream>

namespace catalog_tests {

using namespace strata;

// ============================================================================
// test_default_classification
// ============================================================================

void test_default_classification() {
    std::cout << "  test_default_classification..." << std::flush;

    auto ts = classify_default(std::string("CURRENT_TIMESTAMP"));
    assert(ts.kind == default_kind::keyword);
    assert(render_default(ts) == "CURRENT_TIMESTAMP");

    auto expr = classify_default(std::string("lower(hex(randomblob(16)))"));
    assert(expr.kind == default_kind::expression);
    assert(render_default(expr) == "(lower(hex(randomblob(16))))");

    auto quoted = classify_default(std::string("'draft'"));
    assert(quoted.kind == default_kind::literal);
    assert(render_default(quoted) == "'draft'");

    auto bare = classify_default(std::string("draft"));
    assert(render_default(bare) == "'draft'");

    auto number = classify_default(std::string("-1.5"));
    assert(render_default(number) == "-1.5");

    auto blob = classify_default(std::string("X'0A0b'"));
    assert(blob.kind == default_kind::literal);
    assert(render_default(blob) == "X'0A0b'");

    auto escaped = classify_default(std::string("'it''s'"));
    assert(render_default(escaped) == "'it''s'");

    // Operator expressions without a call are still expressions
    auto sum = classify_default(std::string("1+2"));
    assert(sum.kind == default_kind::expression);
    assert(render_default(sum) == "(1+2)");

    auto concat = classify_default(std::string("'a'||'b'"));
    assert(concat.kind == default_kind::expression);
    assert(render_default(concat) == "('a'||'b')");

    auto negated = classify_default(std::string("-x"));
    assert(negated.kind == default_kind::expression);

    auto none = classify_default(nullptr);
    assert(none.kind == default_kind::none);
    assert(render_default(none).empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_render_create_table
// ============================================================================

void test_render_create_table() {
    std::cout << "  test_render_create_table..." << std::flush;

    std::vector<column_info> columns(3);
    columns[0].name = "id";
    columns[0].declared_type = "TEXT";
    columns[0].is_primary_key = true;
    columns[1].name = "status";
    columns[1].declared_type = "TEXT";
    columns[1].not_null = true;
    columns[1].default_val = {default_kind::literal, "'draft'"};
    columns[2].name = "owner";
    columns[2].declared_type = "TEXT";

    foreign_key fk;
    fk.from = "owner";
    fk.table = "people";
    fk.to = "id";
    fk.on_delete = "CASCADE";

    auto sql = render_create_table("docs", columns, {fk}, {{"status", "owner"}});
    assert(sql == "CREATE TABLE \"docs\" (\"id\" TEXT PRIMARY KEY, "
                  "\"status\" TEXT DEFAULT 'draft' NOT NULL, \"owner\" TEXT, "
                  "UNIQUE (\"status\", \"owner\"), "
                  "FOREIGN KEY (\"owner\") REFERENCES \"people\"(\"id\") ON DELETE CASCADE)");

    // The rendered DDL is accepted by SQLite and reads back the same model
    database db(":memory:");
    db.execute("CREATE TABLE people (id TEXT PRIMARY KEY)");
    db.execute(sql);
    catalog cat(db);
    auto back = cat.columns("docs");
    assert(back.size() == 3);
    assert(back[1].not_null);
    assert(back[1].default_val.text == "'draft'");
    auto fks = cat.foreign_keys("docs");
    assert(fks.size() == 1);
    assert(fks[0].on_delete == "CASCADE");
    assert(cat.unique_constraints("docs").size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_catalog_listing
// ============================================================================

void test_catalog_listing() {
    std::cout << "  test_catalog_listing..." << std::flush;

    database db(":memory:");
    db.execute("CREATE TABLE b (x INTEGER)");
    db.execute("CREATE TABLE a (y TEXT)");
    db.execute("CREATE TABLE c (z TEXT)");
    db.execute("CREATE INDEX idx_a_y ON a (y)");
    db.execute("CREATE TRIGGER trg_a AFTER INSERT ON a BEGIN SELECT 1; END");

    catalog cat(db);
    auto all = cat.tables();
    assert((all == std::vector<std::string>{"a", "b", "c"}));
    auto some = cat.tables({"c"});
    assert((some == std::vector<std::string>{"a", "b"}));

    auto dependents = cat.dependent_sql("a");
    assert(dependents.size() == 2);
    assert(dependents[0].find("CREATE INDEX") == 0);
    assert(dependents[1].find("CREATE TRIGGER") == 0);

    assert(!cat.table_sql("missing").has_value());
    bool threw = false;
    try {
        cat.describe("missing");
    } catch (const not_found&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_numeric_predicate
// ============================================================================

void test_numeric_predicate() {
    std::cout << "  test_numeric_predicate..." << std::flush;

    database db(":memory:");
    auto check = [&](const std::string& expr, int want_integer) {
        return db.query_scalar("SELECT strata_is_numeric(" + expr + ", " + std::to_string(want_integer) + ")");
    };
    auto is = [&](const std::string& expr, int want_integer) {
        return detail::as_int(check(expr, want_integer)) == 1;
    };

    assert(is("42", 1));
    assert(is("'42'", 1));
    assert(is("'  -12 '", 1));
    assert(is("'0'", 1));
    assert(is("2.0", 1));
    assert(!is("2.5", 1));
    assert(!is("'2.5'", 1));
    assert(!is("'1e5'", 1));
    assert(!is("'abc'", 1));
    assert(!is("''", 1));

    assert(is("'2.5'", 0));
    assert(is("'1e5'", 0));
    assert(is("'.5'", 0));
    assert(is("'5.'", 0));
    assert(is("'0.0'", 0));
    assert(!is("'+'", 0));
    assert(!is("'1e'", 0));
    assert(!is("'12abc'", 0));
    assert(!is("X'00'", 0));

    assert(detail::is_null(check("NULL", 0)));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_transaction_guard
// ============================================================================

void test_transaction_guard() {
    std::cout << "  test_transaction_guard..." << std::flush;

    database db(":memory:");
    db.execute("CREATE TABLE t (x INTEGER NOT NULL)");
    {
        transaction txn(db);
        db.execute("INSERT INTO t (x) VALUES (1)");
        // No commit: destructor rolls back
    }
    assert(test_support::count_rows(db, "t") == 0);
    assert(!db.is_in_transaction());

    bool threw = false;
    try {
        db.execute_batch({"INSERT INTO t (x) VALUES (1)", "INSERT INTO t (x) VALUES (NULL)"});
    } catch (const db_error&) {
        threw = true;
    }
    assert(threw);
    assert(test_support::count_rows(db, "t") == 0);

    db.execute_batch({"INSERT INTO t (x) VALUES (1)", "INSERT INTO t (x) VALUES (2)"});
    assert(test_support::count_rows(db, "t") == 2);

    {
        foreign_keys_suspended guard(db);
        assert(!db.foreign_keys_enabled());
    }
    assert(db.foreign_keys_enabled());

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Catalog Tests ---" << std::endl;

    test_default_classification();
    test_render_create_table();
    test_catalog_listing();
    test_numeric_predicate();
    test_transaction_guard();

    std::cout << "--- Catalog Tests: All passed ---" << std::endl;
}

} // namespace catalog_tests
