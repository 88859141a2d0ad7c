#pragma once

#ifdef __cplusplus

#include <string>
#include <vector>

namespace strata {

enum class identifier_kind {
    table,
    column,
    index
};

const char* to_string(identifier_kind kind);

/// Maximum identifier length accepted by the validator.
constexpr size_t max_identifier_length = 64;

/// True if name matches ^[A-Za-z_][A-Za-z0-9_]*$, is at most
/// max_identifier_length characters and is not a reserved word.
bool is_valid_identifier(const std::string& name);

/// Validate and wrap in double quotes. Throws invalid_identifier.
std::string validate_and_escape_identifier(identifier_kind kind, const std::string& name);

/// Double-quote a name read back from the catalog (doubles embedded quotes).
/// Never use this on user input; validate_and_escape_identifier is for that.
std::string quote_identifier(const std::string& name);

/// Check a declared column type against the allow-list and upper-case it.
/// Accepts an optional size suffix: VARCHAR(255), DECIMAL(10,2). Throws invalid_type.
std::string validate_and_normalize_type(const std::string& type);

/// True if the (normalized) type has INTEGER conversion semantics.
bool is_integer_type(const std::string& normalized_type);

/// True if the (normalized) type is any numeric kind (integer or real family).
bool is_numeric_type(const std::string& normalized_type);

/// Reserved platform tables that this engine never mutates.
const std::vector<std::string>& default_system_tables();

/// SQLite resolves table, column and index names without regard to ASCII case.
bool same_identifier(const std::string& a, const std::string& b);

bool is_system_table(const std::string& name, const std::vector<std::string>& system_tables);

} // namespace strata

#endif // __cplusplus
