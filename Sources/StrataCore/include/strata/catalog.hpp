#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace strata {

/// Index prefix SQLite uses for indexes backing UNIQUE/PRIMARY KEY constraints.
constexpr const char* auto_index_prefix = "sqlite_autoindex_";

/// Read-only projections of the SQLite catalog (sqlite_master and the
/// table-valued pragma functions). Every read is live; nothing is cached.
class catalog {
public:
    struct index_entry {
        std::string name;
        bool unique = false;
        std::string origin;  // "c" = CREATE INDEX, "u" = UNIQUE constraint, "pk" = PRIMARY KEY
        bool partial = false;
    };

    explicit catalog(const database& db) : db_(db) {}

    /// Original CREATE TABLE text, nullopt if the table does not exist.
    std::optional<std::string> table_sql(const std::string& table) const;

    std::vector<column_info> columns(const std::string& table) const;
    std::vector<foreign_key> foreign_keys(const std::string& table) const;

    /// Tables ordered by name, skipping sqlite_* internals, _cf_KV and `excluded`.
    std::vector<std::string> tables(const std::vector<std::string>& excluded = {}) const;

    /// Full description of one table. Throws not_found if absent.
    table_schema describe(const std::string& table) const;

    std::vector<index_entry> index_list(const std::string& table) const;

    /// Column names of an index ordered by seqno.
    std::vector<std::string> index_columns(const std::string& index) const;

    /// Column sets of UNIQUE table constraints (origin "u").
    std::vector<std::vector<std::string>> unique_constraints(const std::string& table) const;

    /// CREATE INDEX / CREATE TRIGGER statements attached to a table.
    std::vector<std::string> dependent_sql(const std::string& table) const;

private:
    const database& db_;
};

/// Classify a dflt_value reported by PRAGMA table_info.
default_value classify_default(const column_value_t& dflt);

/// Render a default clause body: keywords verbatim, expressions
/// parenthesized, string literals quoted. Empty for default_kind::none.
std::string render_default(const default_value& value);

/// Render one column definition ("name" TYPE [PRIMARY KEY] [DEFAULT ..] [NOT NULL]).
/// `inline_primary_key` is false when the table has a composite key.
std::string render_column(const column_info& column, bool inline_primary_key = true);

std::string render_foreign_key(const foreign_key& fk);

/// Render a complete CREATE TABLE from the structured model.
std::string render_create_table(const std::string& name,
                                const std::vector<column_info>& columns,
                                const std::vector<foreign_key>& foreign_keys,
                                const std::vector<std::vector<std::string>>& unique_constraints = {});

} // namespace strata

#endif // __cplusplus
