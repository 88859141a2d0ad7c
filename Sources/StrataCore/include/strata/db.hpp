#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <mutex>
#include <string>
#include <vector>

namespace strata {

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access
    };

    explicit database(const std::string& path,
                      open_mode mode = open_mode::read_write,
                      int busy_timeout_ms = 5000);
    ~database();

    // Non-copyable, non-moveable (the statement mutex is shared with transaction guards)
    database(const database&) = delete;
    database& operator=(const database&) = delete;
    database(database&&) = delete;
    database& operator=(database&&) = delete;

    bool table_exists(const std::string& name) const;

    // Query - returns rows as vector of column maps
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {}) const;

    // First column of the first row, or nullptr when the query returns no rows
    column_value_t query_scalar(const std::string& sql,
                                const std::vector<column_value_t>& params = {}) const;

    // Execute SQL with optional params (for DDL and INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    // Run every statement inside one transaction. Any failure rolls back all of them.
    void execute_batch(const std::vector<std::string>& statements);

    // Rows modified by the most recent INSERT/UPDATE/DELETE on this connection
    int64_t changes() const;

    // Foreign-key enforcement. Has no effect inside an open transaction.
    void set_foreign_keys(bool enabled);
    bool foreign_keys_enabled() const;

    // Transaction support
    // exclusive=false issues BEGIN IMMEDIATE, exclusive=true BEGIN EXCLUSIVE.
    void begin_transaction(bool exclusive = false);
    void commit();
    void rollback();
    bool is_in_transaction() const;

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

    // Serializes statements and transactions across threads sharing this connection.
    std::recursive_mutex& mutex() const { return mutex_; }

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) const;

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    mutable std::recursive_mutex mutex_;

    column_value_t extract_column(sqlite3_stmt* stmt, int index) const;
    void install_functions();
};

// RAII transaction guard. Holds the connection's statement mutex for its lifetime;
// rolls back on destruction unless commit() was called.
class transaction {
public:
    explicit transaction(database& db, bool exclusive = false);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool completed_ = false;
};

// Disables foreign-key enforcement for its lifetime and restores the previous
// setting on destruction. Holds the statement mutex so no other thread can open
// a transaction on the connection meanwhile. Must be created outside a transaction.
class foreign_keys_suspended {
public:
    explicit foreign_keys_suspended(database& db);
    ~foreign_keys_suspended();

    foreign_keys_suspended(const foreign_keys_suspended&) = delete;
    foreign_keys_suspended& operator=(const foreign_keys_suspended&) = delete;

private:
    database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool was_enabled_ = false;
};

// Helpers for reading typed values out of rows
namespace detail {
    inline bool is_null(const column_value_t& v) {
        return std::holds_alternative<std::nullptr_t>(v);
    }

    inline int64_t as_int(const column_value_t& v, int64_t fallback = 0) {
        if (auto* i = std::get_if<int64_t>(&v)) return *i;
        if (auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
        if (auto* s = std::get_if<std::string>(&v)) {
            try { return std::stoll(*s); } catch (const std::exception&) { return fallback; }
        }
        return fallback;
    }

    inline std::string as_string(const column_value_t& v) {
        if (auto* s = std::get_if<std::string>(&v)) return *s;
        if (auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
        if (auto* d = std::get_if<double>(&v)) {
            std::ostringstream os;
            os << *d;
            return os.str();
        }
        return {};
    }

    inline std::optional<std::string> as_optional_string(const column_value_t& v) {
        if (is_null(v)) return std::nullopt;
        return as_string(v);
    }

    inline const column_value_t& field(const row_t& row, const std::string& name) {
        static const column_value_t null_value = nullptr;
        auto it = row.find(name);
        return it == row.end() ? null_value : it->second;
    }
} // namespace detail

} // namespace strata

#endif // __cplusplus
