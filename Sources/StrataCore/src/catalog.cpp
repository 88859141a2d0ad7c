#include "strata/catalog.hpp"
#include "strata/identifier.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace strata {

namespace {

// One signed decimal or hex number: -1, 2.5, 1e10, .5, 0x1F
bool is_number_token(const std::string& s) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    if (s.compare(i, 2, "0x") == 0 || s.compare(i, 2, "0X") == 0) {
        i += 2;
        if (i == s.size()) return false;
        for (; i < s.size(); ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
        }
        return true;
    }
    bool digits = false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; digits = true; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; digits = true; }
    }
    if (!digits) return false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        bool exponent = false;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; exponent = true; }
        if (!exponent) return false;
    }
    return i == s.size();
}

// A single quoted string whose closing quote is the last character
bool is_string_token(const std::string& s, size_t start = 0) {
    if (s.size() < start + 2 || s[start] != '\'' || s.back() != '\'') return false;
    for (size_t i = start + 1; i + 1 < s.size(); ++i) {
        if (s[i] != '\'') continue;
        if (i + 2 >= s.size() || s[i + 1] != '\'') return false;
        ++i;
    }
    return true;
}

bool is_blob_token(const std::string& s) {
    if (s.size() < 3 || (s[0] != 'X' && s[0] != 'x') || !is_string_token(s, 1)) return false;
    return std::all_of(s.begin() + 2, s.end() - 1,
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool is_literal_token(const std::string& s) {
    return is_number_token(s) || is_string_token(s) || is_blob_token(s);
}

// Bare word such as `DEFAULT draft`, which SQLite stores as text
bool is_bare_word(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

std::optional<std::string> catalog::table_sql(const std::string& table) const {
    auto rows = db_.query("SELECT sql FROM sqlite_master WHERE type='table' AND name=?", {table});
    if (rows.empty()) return std::nullopt;
    return detail::as_string(detail::field(rows[0], "sql"));
}

std::vector<column_info> catalog::columns(const std::string& table) const {
    // pragma_table_info: cid, name, type, notnull, dflt_value, pk
    auto rows = db_.query("SELECT cid, name, type, \"notnull\", dflt_value, pk "
                          "FROM pragma_table_info(?) ORDER BY cid", {table});
    std::vector<column_info> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        column_info col;
        col.ordinal = static_cast<int>(detail::as_int(detail::field(row, "cid")));
        col.name = detail::as_string(detail::field(row, "name"));
        col.declared_type = detail::as_string(detail::field(row, "type"));
        col.not_null = detail::as_int(detail::field(row, "notnull")) != 0;
        col.default_val = classify_default(detail::field(row, "dflt_value"));
        col.is_primary_key = detail::as_int(detail::field(row, "pk")) > 0;
        result.push_back(std::move(col));
    }
    return result;
}

std::vector<foreign_key> catalog::foreign_keys(const std::string& table) const {
    // pragma_foreign_key_list: id, seq, table, from, to, on_update, on_delete, match
    auto rows = db_.query("SELECT id, seq, \"table\", \"from\", \"to\", on_update, on_delete "
                          "FROM pragma_foreign_key_list(?) ORDER BY id, seq", {table});
    std::vector<foreign_key> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        foreign_key fk;
        fk.from = detail::as_string(detail::field(row, "from"));
        fk.table = detail::as_string(detail::field(row, "table"));
        fk.to = detail::as_string(detail::field(row, "to"));
        fk.on_update = detail::as_string(detail::field(row, "on_update"));
        fk.on_delete = detail::as_string(detail::field(row, "on_delete"));
        result.push_back(std::move(fk));
    }
    return result;
}

std::vector<std::string> catalog::tables(const std::vector<std::string>& excluded) const {
    auto rows = db_.query("SELECT name FROM sqlite_master "
                          "WHERE type='table' AND name NOT LIKE 'sqlite_%' AND name != '_cf_KV' "
                          "ORDER BY name");
    std::vector<std::string> result;
    for (const auto& row : rows) {
        auto name = detail::as_string(detail::field(row, "name"));
        if (is_system_table(name, excluded)) continue;
        result.push_back(std::move(name));
    }
    return result;
}

table_schema catalog::describe(const std::string& table) const {
    auto sql = table_sql(table);
    if (!sql) {
        throw not_found("Table " + table + " not found");
    }
    table_schema schema;
    schema.name = table;
    schema.create_sql = *sql;
    schema.columns = columns(table);
    schema.foreign_keys = foreign_keys(table);
    schema.dependent_sql = dependent_sql(table);
    return schema;
}

std::vector<catalog::index_entry> catalog::index_list(const std::string& table) const {
    // pragma_index_list: seq, name, unique, origin, partial
    auto rows = db_.query("SELECT name, \"unique\", origin, partial FROM pragma_index_list(?) "
                          "ORDER BY name", {table});
    std::vector<index_entry> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        index_entry e;
        e.name = detail::as_string(detail::field(row, "name"));
        e.unique = detail::as_int(detail::field(row, "unique")) != 0;
        e.origin = detail::as_string(detail::field(row, "origin"));
        e.partial = detail::as_int(detail::field(row, "partial")) != 0;
        result.push_back(std::move(e));
    }
    return result;
}

std::vector<std::string> catalog::index_columns(const std::string& index) const {
    auto rows = db_.query("SELECT seqno, name FROM pragma_index_info(?) ORDER BY seqno", {index});
    std::vector<std::string> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        result.push_back(detail::as_string(detail::field(row, "name")));
    }
    return result;
}

std::vector<std::vector<std::string>> catalog::unique_constraints(const std::string& table) const {
    std::vector<std::vector<std::string>> result;
    for (const auto& idx : index_list(table)) {
        if (idx.origin == "u") {
            result.push_back(index_columns(idx.name));
        }
    }
    return result;
}

std::vector<std::string> catalog::dependent_sql(const std::string& table) const {
    auto rows = db_.query("SELECT sql FROM sqlite_master "
                          "WHERE type IN ('index', 'trigger') AND tbl_name=? AND sql IS NOT NULL "
                          "ORDER BY CASE type WHEN 'index' THEN 0 ELSE 1 END, name", {table});
    std::vector<std::string> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        result.push_back(detail::as_string(detail::field(row, "sql")));
    }
    return result;
}

default_value classify_default(const column_value_t& dflt) {
    default_value value;
    if (detail::is_null(dflt)) {
        return value;
    }
    value.text = detail::as_string(dflt);
    const std::string keyword = upper(value.text);
    if (keyword == "CURRENT_TIMESTAMP" || keyword == "CURRENT_DATE" || keyword == "CURRENT_TIME" ||
        keyword == "NULL" || keyword == "TRUE" || keyword == "FALSE") {
        value.kind = default_kind::keyword;
    } else if (is_literal_token(value.text) || is_bare_word(value.text)) {
        value.kind = default_kind::literal;
    } else {
        value.kind = default_kind::expression;
    }
    return value;
}

std::string render_default(const default_value& value) {
    switch (value.kind) {
        case default_kind::none:
            return {};
        case default_kind::keyword:
            return value.text;
        case default_kind::expression:
            return "(" + value.text + ")";
        case default_kind::literal: {
            const std::string& t = value.text;
            if (is_literal_token(t)) return t;
            std::string quoted = "'";
            for (char c : t) {
                if (c == '\'') quoted += '\'';
                quoted += c;
            }
            quoted += '\'';
            return quoted;
        }
    }
    return {};
}

std::string render_column(const column_info& column, bool inline_primary_key) {
    std::string def = quote_identifier(column.name);
    if (!column.declared_type.empty()) def += " " + column.declared_type;
    if (column.is_primary_key && inline_primary_key) def += " PRIMARY KEY";
    if (column.default_val.kind != default_kind::none) {
        def += " DEFAULT " + render_default(column.default_val);
    }
    if (column.not_null) def += " NOT NULL";
    return def;
}

std::string render_foreign_key(const foreign_key& fk) {
    std::string clause = "FOREIGN KEY (" + quote_identifier(fk.from) + ") REFERENCES " +
                         quote_identifier(fk.table);
    if (!fk.to.empty()) clause += "(" + quote_identifier(fk.to) + ")";
    if (!fk.on_update.empty() && fk.on_update != "NO ACTION") clause += " ON UPDATE " + fk.on_update;
    if (!fk.on_delete.empty() && fk.on_delete != "NO ACTION") clause += " ON DELETE " + fk.on_delete;
    return clause;
}

std::string render_create_table(const std::string& name,
                                const std::vector<column_info>& columns,
                                const std::vector<foreign_key>& foreign_keys,
                                const std::vector<std::vector<std::string>>& unique_constraints) {
    size_t pk_count = std::count_if(columns.begin(), columns.end(),
                                    [](const column_info& c) { return c.is_primary_key; });
    bool inline_pk = pk_count <= 1;

    std::ostringstream sql;
    sql << "CREATE TABLE " << quote_identifier(name) << " (";
    bool first = true;
    for (const auto& col : columns) {
        if (!first) sql << ", ";
        sql << render_column(col, inline_pk);
        first = false;
    }
    if (!inline_pk) {
        sql << ", PRIMARY KEY (";
        bool first_pk = true;
        for (const auto& col : columns) {
            if (!col.is_primary_key) continue;
            if (!first_pk) sql << ", ";
            sql << quote_identifier(col.name);
            first_pk = false;
        }
        sql << ")";
    }
    for (const auto& cols : unique_constraints) {
        sql << ", UNIQUE (";
        for (size_t i = 0; i < cols.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << quote_identifier(cols[i]);
        }
        sql << ")";
    }
    for (const auto& fk : foreign_keys) {
        sql << ", " << render_foreign_key(fk);
    }
    sql << ")";
    return sql.str();
}

} // namespace strata
