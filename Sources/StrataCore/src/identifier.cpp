#include "strata/identifier.hpp"
#include "strata/errors.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace strata {

namespace {

const std::unordered_set<std::string>& reserved_words() {
    static const std::unordered_set<std::string> words = {
        "SELECT", "INSERT", "UPDATE", "DELETE", "CREATE", "DROP", "ALTER",
        "TABLE", "INDEX", "VIEW", "TRIGGER", "PROCEDURE", "FUNCTION",
        "DATABASE", "SCHEMA", "FROM", "WHERE", "JOIN", "INNER", "LEFT",
        "RIGHT", "OUTER", "ON", "UNION", "GROUP", "ORDER", "BY", "HAVING",
        "LIMIT", "OFFSET", "INTO", "VALUES", "SET", "AND", "OR", "NOT",
        "NULL", "TRUE", "FALSE", "CASE", "WHEN", "THEN", "ELSE", "END",
        "IF", "EXISTS", "DISTINCT", "AS", "IS", "IN", "BETWEEN", "LIKE",
        "GLOB", "REGEXP", "MATCH", "ESCAPE", "ISNULL", "NOTNULL", "COLLATE",
        "ASC", "DESC", "PRIMARY", "FOREIGN", "KEY", "REFERENCES",
        "CONSTRAINT", "UNIQUE", "CHECK", "DEFAULT", "AUTOINCREMENT",
        "ROWID", "OID", "_ROWID_",
    };
    return words;
}

const std::unordered_set<std::string>& allowed_types() {
    static const std::unordered_set<std::string> types = {
        "TEXT", "INTEGER", "REAL", "BLOB", "NUMERIC", "VARCHAR", "CHAR",
        "BOOLEAN", "DATE", "DATETIME", "TIMESTAMP", "DECIMAL", "FLOAT", "DOUBLE",
    };
    return types;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// "(255)" or "(10,2)" with optional inner spaces
bool is_size_suffix(const std::string& s) {
    if (s.size() < 3 || s.front() != '(' || s.back() != ')') return false;
    int numbers = 0;
    bool in_number = false;
    for (size_t i = 1; i + 1 < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (!in_number) ++numbers;
            in_number = true;
        } else if (c == ',') {
            if (numbers == 0 || !in_number) return false;
            in_number = false;
        } else if (c == ' ') {
            continue;
        } else {
            return false;
        }
    }
    return in_number && numbers >= 1 && numbers <= 2;
}

std::string base_type(const std::string& normalized) {
    auto paren = normalized.find('(');
    return trim(paren == std::string::npos ? normalized : normalized.substr(0, paren));
}

} // namespace

const char* to_string(identifier_kind kind) {
    switch (kind) {
        case identifier_kind::table: return "table";
        case identifier_kind::column: return "column";
        case identifier_kind::index: return "index";
    }
    return "identifier";
}

bool is_valid_identifier(const std::string& name) {
    if (name.empty() || name.size() > max_identifier_length) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || u == '_') || u > 0x7F) {
            return false;
        }
    }
    return reserved_words().count(to_upper(name)) == 0;
}

std::string validate_and_escape_identifier(identifier_kind kind, const std::string& name) {
    if (!is_valid_identifier(name)) {
        std::string k = to_string(kind);
        k[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(k[0])));
        throw invalid_identifier(
            "Invalid " + std::string(to_string(kind)) + " name: \"" + name + "\". " + k +
            " names must start with a letter or underscore, contain only letters, numbers, "
            "and underscores, and not be SQL reserved words.");
    }
    return quote_identifier(name);
}

std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string validate_and_normalize_type(const std::string& type) {
    std::string normalized = to_upper(trim(type));
    auto paren = normalized.find('(');
    std::string base = base_type(normalized);
    bool ok = allowed_types().count(base) > 0;
    if (ok && paren != std::string::npos) {
        ok = is_size_suffix(trim(normalized.substr(paren)));
    }
    if (!ok) {
        throw invalid_type("Invalid SQL data type: \"" + type + "\"");
    }
    return normalized;
}

bool is_integer_type(const std::string& normalized_type) {
    auto base = base_type(to_upper(normalized_type));
    return base == "INTEGER" || base == "BOOLEAN";
}

bool is_numeric_type(const std::string& normalized_type) {
    auto base = base_type(to_upper(normalized_type));
    return is_integer_type(base) || base == "REAL" || base == "NUMERIC" ||
           base == "DECIMAL" || base == "FLOAT" || base == "DOUBLE";
}

const std::vector<std::string>& default_system_tables() {
    static const std::vector<std::string> tables = {
        "admins",
        "sessions",
        "schema_snapshots",
        "schema_snapshot_counter",
        "d1_migrations",
        "api_keys",
        "user_sessions",
        "oauth_providers",
        "app_settings",
        "table_policies",
        "hooks",
        "event_queue",
        "realtime_subscriptions",
        "custom_queries",
        "custom_query_logs",
        "push_subscriptions",
        "notification_rules",
        "notification_templates",
        "notification_logs",
        "vapid_config",
    };
    return tables;
}

bool same_identifier(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool is_system_table(const std::string& name, const std::vector<std::string>& system_tables) {
    return std::any_of(system_tables.begin(), system_tables.end(),
                       [&](const std::string& t) { return same_identifier(t, name); });
}

} // namespace strata
