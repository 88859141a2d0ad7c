#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace strata {

// ordered_json keeps key order stable in payloads (row column order matters on restore)
using json = nlohmann::ordered_json;

// table_schema <-> JSON. Column and foreign-key objects use the field names
// reported by SQLite's table_info / foreign_key_list pragmas, so payloads stay
// readable by tools that only know the catalog.
void to_json(json& j, const column_info& c);
void from_json(const json& j, column_info& c);
void to_json(json& j, const foreign_key& fk);
void from_json(const json& j, foreign_key& fk);
void to_json(json& j, const table_schema& s);
void from_json(const json& j, table_schema& s);

std::string schemas_to_json(const std::vector<table_schema>& schemas);

/// Throws strata_error if the text is not a JSON array of table schemas.
std::vector<table_schema> schemas_from_json(const std::string& text);

/// Per-table row dump: table name -> rows. Column order inside a row is
/// preserved so that restore can derive its column list from the first row.
using table_rows = std::vector<std::vector<std::pair<std::string, column_value_t>>>;
using table_data = std::map<std::string, table_rows>;

json column_value_to_json(const column_value_t& value);
column_value_t json_to_column_value(const json& j);

std::string table_data_to_json(const table_data& data);

/// Throws strata_error if the text is not a JSON object of row arrays.
table_data table_data_from_json(const std::string& text);

} // namespace strata

#endif // __cplusplus
