#include "strata/db.hpp"
#include "strata/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstring>
#include <thread>

namespace strata {

namespace {

// Whole-string numeric literal check used by strata_is_numeric().
// Leading/trailing whitespace is allowed; everything else must be consumed.
bool is_numeric_literal(const char* text, int len, bool want_integer) {
    int i = 0;
    while (i < len && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    while (len > i && std::isspace(static_cast<unsigned char>(text[len - 1]))) --len;
    if (i >= len) return false;

    if (text[i] == '+' || text[i] == '-') ++i;

    int int_digits = 0;
    while (i < len && std::isdigit(static_cast<unsigned char>(text[i]))) { ++i; ++int_digits; }
    if (want_integer) {
        return int_digits > 0 && i == len;
    }

    int frac_digits = 0;
    if (i < len && text[i] == '.') {
        ++i;
        while (i < len && std::isdigit(static_cast<unsigned char>(text[i]))) { ++i; ++frac_digits; }
    }
    if (int_digits + frac_digits == 0) return false;

    if (i < len && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < len && (text[i] == '+' || text[i] == '-')) ++i;
        int exp_digits = 0;
        while (i < len && std::isdigit(static_cast<unsigned char>(text[i]))) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return i == len;
}

// strata_is_numeric(value, want_integer) -> 1 when value converts to the numeric
// kind without loss, 0 otherwise, NULL for NULL input.
void sql_is_numeric(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 2) {
        sqlite3_result_error(ctx, "strata_is_numeric expects 2 arguments", -1);
        return;
    }
    bool want_integer = sqlite3_value_int(argv[1]) != 0;
    switch (sqlite3_value_type(argv[0])) {
        case SQLITE_NULL:
            sqlite3_result_null(ctx);
            return;
        case SQLITE_INTEGER:
            sqlite3_result_int(ctx, 1);
            return;
        case SQLITE_FLOAT: {
            double d = sqlite3_value_double(argv[0]);
            bool ok = std::isfinite(d) && (!want_integer || std::floor(d) == d);
            sqlite3_result_int(ctx, ok ? 1 : 0);
            return;
        }
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
            int len = sqlite3_value_bytes(argv[0]);
            sqlite3_result_int(ctx, (text && is_numeric_literal(text, len, want_integer)) ? 1 : 0);
            return;
        }
        case SQLITE_BLOB:
        default:
            sqlite3_result_int(ctx, 0);
            return;
    }
}

} // namespace

database::database(const std::string& path, open_mode mode, int busy_timeout_ms)
    : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    // Set before any statement that might contend with other connections
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    execute("PRAGMA foreign_keys = ON");

    if (mode == open_mode::read_write && path != ":memory:" && !path.empty()) {
        execute("PRAGMA journal_mode = WAL");
    }

    install_functions();
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void database::install_functions() {
    int rc = sqlite3_create_function(db_, "strata_is_numeric", 2,
                                     SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                     nullptr, &sql_is_numeric, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to register strata_is_numeric: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to register strata_is_numeric: " + std::string(sqlite3_errmsg(db_)));
    }
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (params.empty()) {
        // Fast path for parameterless statements (may contain several)
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")");
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Execution failed: " + error + " (SQL: " + sql + ")");
    }
}

void database::execute_batch(const std::vector<std::string>& statements) {
    transaction txn(*this);
    for (const auto& sql : statements) {
        LOG_DEBUG("db", "batch: %s", sql.c_str());
        execute(sql);
    }
    txn.commit();
}

bool database::table_exists(const std::string& name) const {
    auto rows = query("SELECT name FROM sqlite_master WHERE type='table' AND name=?", {name});
    return !rows.empty();
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) const {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) const {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

std::vector<row_t> database::query(const std::string& sql,
                                   const std::vector<column_value_t>& params) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare query: " + error + " (SQL: " + sql + ")");
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Query failed: %s", error.c_str());
        throw db_error("Query failed: " + error + " (SQL: " + sql + ")");
    }

    return results;
}

column_value_t database::query_scalar(const std::string& sql,
                                      const std::vector<column_value_t>& params) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare query: " + error + " (SQL: " + sql + ")");
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    column_value_t result = nullptr;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        result = extract_column(stmt, 0);
        rc = SQLITE_DONE;
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Query failed: %s", error.c_str());
        throw db_error("Query failed: " + error + " (SQL: " + sql + ")");
    }
    return result;
}

int64_t database::changes() const {
    return sqlite3_changes64(db_);
}

void database::set_foreign_keys(bool enabled) {
    execute(enabled ? "PRAGMA foreign_keys = ON" : "PRAGMA foreign_keys = OFF");
}

bool database::foreign_keys_enabled() const {
    return detail::as_int(query_scalar("PRAGMA foreign_keys")) != 0;
}

void database::begin_transaction(bool exclusive) {
    // IMMEDIATE: acquires the write lock up front so two writers never
    // deadlock upgrading from a read lock. EXCLUSIVE also blocks readers.
    const char* sql = exclusive ? "BEGIN EXCLUSIVE" : "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // Another connection holds the write lock: retry with exponential backoff
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;
    int total_waited_ms = 0;

    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && total_waited_ms < max_total_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to begin transaction: %s", error.c_str());
        throw db_error("Failed to begin transaction: " + error);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 while a transaction is active
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction RAII guard
transaction::transaction(database& db, bool exclusive)
    : db_(db), lock_(db.mutex()) {
    db_.begin_transaction(exclusive);
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

foreign_keys_suspended::foreign_keys_suspended(database& db)
    : db_(db), lock_(db.mutex()) {
    if (db_.is_in_transaction()) {
        throw db_error("Foreign-key enforcement cannot change inside a transaction");
    }
    was_enabled_ = db_.foreign_keys_enabled();
    if (was_enabled_) {
        db_.set_foreign_keys(false);
    }
}

foreign_keys_suspended::~foreign_keys_suspended() {
    if (!was_enabled_) return;
    try {
        db_.set_foreign_keys(true);
    } catch (const db_error& e) {
        LOG_ERROR("db", "Failed to re-enable foreign keys: %s", e.what());
    }
}

} // namespace strata
