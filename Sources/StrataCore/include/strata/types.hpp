#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>
#include <unordered_map>

namespace strata {

// UUID type (stored as TEXT). Snapshot ids are random v4 UUIDs.
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    // Lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);

        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }

        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;  // Version 4
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;  // Variant 1

        return result;
    }

    bool operator==(const uuid_t& other) const { return bytes == other.bytes; }
    bool operator!=(const uuid_t& other) const { return bytes != other.bytes; }
};

// Values as they come out of (and go into) SQLite
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// One result row: column name -> value
using row_t = std::unordered_map<std::string, column_value_t>;

// ============================================================================
// Catalog model
// ============================================================================

enum class default_kind {
    none,
    literal,     // 'text', 42, -1.5, X'00'
    keyword,     // CURRENT_TIMESTAMP, NULL, TRUE ...
    expression   // lower(hex(randomblob(16)))
};

struct default_value {
    default_kind kind = default_kind::none;
    std::string text;  // As reported by PRAGMA table_info (dflt_value)

    bool operator==(const default_value&) const = default;
};

// A column as discovered from the catalog
struct column_info {
    int ordinal = 0;
    std::string name;
    std::string declared_type;
    bool not_null = false;
    default_value default_val;
    bool is_primary_key = false;

    bool operator==(const column_info&) const = default;
};

// A foreign key constraint as discovered from the catalog
struct foreign_key {
    std::string from;    // Column in the owning table
    std::string table;   // Referenced table
    std::string to;      // Referenced column
    std::string on_update = "NO ACTION";
    std::string on_delete = "NO ACTION";

    bool operator==(const foreign_key&) const = default;
};

struct table_schema {
    std::string name;
    std::string create_sql;  // Verbatim DDL from sqlite_master
    std::vector<column_info> columns;
    std::vector<foreign_key> foreign_keys;
    std::vector<std::string> dependent_sql;  // CREATE INDEX / CREATE TRIGGER, indexes first

    const column_info* find_column(const std::string& column) const {
        for (const auto& c : columns) {
            if (c.name == column) return &c;
        }
        return nullptr;
    }
};

// ============================================================================
// Schema Manager inputs
// ============================================================================

struct foreign_key_ref {
    std::string table;
    std::string column;
};

struct column_definition {
    std::string name;
    std::string type;
    std::optional<std::string> constraints;  // Raw clause appended after the type
    std::optional<foreign_key_ref> foreign_key;
};

enum class foreign_key_change {
    keep,    // Leave whatever FK the column has
    set,     // Replace with column_changes::foreign_key
    remove   // Drop the column's FK
};

struct column_changes {
    std::optional<std::string> type;
    std::optional<bool> not_null;
    foreign_key_change fk_change = foreign_key_change::keep;
    foreign_key_ref foreign_key;  // Used when fk_change == set

    static column_changes with_type(std::string t) {
        column_changes c;
        c.type = std::move(t);
        return c;
    }
    static column_changes with_not_null(bool v) {
        column_changes c;
        c.not_null = v;
        return c;
    }
    static column_changes with_foreign_key(foreign_key_ref ref) {
        column_changes c;
        c.fk_change = foreign_key_change::set;
        c.foreign_key = std::move(ref);
        return c;
    }
    static column_changes without_foreign_key() {
        column_changes c;
        c.fk_change = foreign_key_change::remove;
        return c;
    }
};

struct validation_result {
    bool valid = true;
    std::vector<std::string> errors;
    int64_t conflicting_rows = 0;
};

// ============================================================================
// Index Manager
// ============================================================================

struct index_info {
    std::string name;
    std::string table_name;
    std::vector<std::string> columns;
    bool unique = false;
    std::string create_sql;
};

struct index_options {
    bool unique = false;
};

// ============================================================================
// Snapshot Manager
// ============================================================================

enum class snapshot_type {
    manual,
    automatic,   // stored as "auto"
    pre_change
};

inline const char* to_string(snapshot_type type) {
    switch (type) {
        case snapshot_type::manual: return "manual";
        case snapshot_type::automatic: return "auto";
        case snapshot_type::pre_change: return "pre_change";
    }
    return "manual";
}

inline snapshot_type snapshot_type_from_string(const std::string& s) {
    if (s == "auto") return snapshot_type::automatic;
    if (s == "pre_change") return snapshot_type::pre_change;
    return snapshot_type::manual;
}

struct snapshot_options {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> created_by;
    snapshot_type type = snapshot_type::manual;
    std::optional<std::string> external_checkpoint;
};

struct schema_snapshot {
    std::string id;
    int64_t version = 0;
    std::string name;
    std::optional<std::string> description;
    std::string full_schema;
    std::string tables_json;
    std::string schema_hash;
    std::string created_at;
    std::optional<std::string> created_by;
    snapshot_type type = snapshot_type::manual;
    std::optional<std::string> external_checkpoint;
    bool has_data_payload = false;  // false = schema-only (blob write skipped or failed)
};

struct snapshot_page {
    std::vector<schema_snapshot> snapshots;
    int64_t total = 0;
};

struct restore_report {
    std::string restored_from;
    std::string post_restore_snapshot_id;
    bool data_available = false;
    std::vector<std::string> tables_recreated;
    std::unordered_map<std::string, int64_t> rows_restored;
    std::vector<std::string> failed_tables;
    int64_t dependents_restored = 0;
    std::vector<std::string> failed_dependents;  // DDL that could not be replayed
};

struct prune_result {
    int64_t deleted = 0;
    std::vector<std::string> deleted_ids;
};

} // namespace strata

#endif // __cplusplus
