#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

class strata_error : public std::runtime_error {
public:
    explicit strata_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// SQLite reported a failure. The message carries the SQLite error text.
class db_error : public strata_error {
public:
    explicit db_error(const std::string& msg) : strata_error(msg) {}
};

/// A table, column or index name failed the allow-list, length or reserved-word rule.
class invalid_identifier : public strata_error {
public:
    explicit invalid_identifier(const std::string& msg) : strata_error(msg) {}
};

/// A declared column type is not in the type allow-list.
class invalid_type : public strata_error {
public:
    explicit invalid_type(const std::string& msg) : strata_error(msg) {}
};

/// Attempted mutation of a reserved system table.
class system_table_protected : public strata_error {
public:
    explicit system_table_protected(const std::string& table)
        : strata_error("Cannot modify system table: " + table), table_(table) {}

    const std::string& table() const { return table_; }

private:
    std::string table_;
};

/// Column-change validation found rows that would violate the change.
class validation_failed : public strata_error {
public:
    validation_failed(std::vector<std::string> errors, int64_t conflicting_rows)
        : strata_error(join(errors))
        , errors_(std::move(errors))
        , conflicting_rows_(conflicting_rows) {}

    const std::vector<std::string>& errors() const { return errors_; }
    int64_t conflicting_rows() const { return conflicting_rows_; }

private:
    static std::string join(const std::vector<std::string>& errors) {
        std::string msg = "Validation failed: ";
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) msg += "; ";
            msg += errors[i];
        }
        return msg;
    }

    std::vector<std::string> errors_;
    int64_t conflicting_rows_;
};

/// Table, column, index or snapshot does not exist.
class not_found : public strata_error {
public:
    explicit not_found(const std::string& msg) : strata_error(msg) {}
};

/// A blob-store call failed. Never escapes the snapshot manager.
class storage_degraded : public strata_error {
public:
    explicit storage_degraded(const std::string& msg) : strata_error(msg) {}
};

} // namespace strata

#endif // __cplusplus
