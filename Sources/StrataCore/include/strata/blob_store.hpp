#pragma once

#ifdef __cplusplus

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace strata {

/// Key/value object storage used for snapshot payloads. Optional: the engine
/// degrades to schema-only snapshots when none is configured.
///
/// Implementations raise storage_degraded on any failure. `get` returns
/// nullopt only when the key does not exist.
class blob_store {
public:
    virtual ~blob_store() = default;

    virtual void put(const std::string& key, const std::string& text) = 0;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void remove(const std::string& key) = 0;

    /// Short backend name for log lines.
    virtual const char* name() const = 0;
};

// Payload keys
std::string snapshot_data_key(const std::string& snapshot_id);
std::string snapshot_schema_key(const std::string& snapshot_id);

/// In-process store. Fault injection switches make every call fail with
/// storage_degraded, which is how the degraded snapshot paths are exercised.
class memory_blob_store : public blob_store {
public:
    void put(const std::string& key, const std::string& text) override;
    std::optional<std::string> get(const std::string& key) override;
    void remove(const std::string& key) override;
    const char* name() const override { return "memory"; }

    bool contains(const std::string& key) const;
    size_t size() const;

    std::atomic<bool> fail_writes{false};
    std::atomic<bool> fail_reads{false};

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> objects_;
};

/// One file per key below a root directory ("snapshots/<id>/data.json" maps
/// to "<root>/snapshots/<id>/data.json").
class directory_blob_store : public blob_store {
public:
    explicit directory_blob_store(std::string root);

    void put(const std::string& key, const std::string& text) override;
    std::optional<std::string> get(const std::string& key) override;
    void remove(const std::string& key) override;
    const char* name() const override { return "directory"; }

    const std::string& root() const { return root_; }

private:
    std::string root_;
    std::string resolve(const std::string& key) const;
};

} // namespace strata

#endif // __cplusplus
