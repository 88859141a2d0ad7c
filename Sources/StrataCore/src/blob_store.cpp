#include "strata/blob_store.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace strata {

namespace fs = std::filesystem;

std::string snapshot_data_key(const std::string& snapshot_id) {
    return "snapshots/" + snapshot_id + "/data.json";
}

std::string snapshot_schema_key(const std::string& snapshot_id) {
    return "snapshots/" + snapshot_id + "/schema.json";
}

// ============================================================================
// memory_blob_store
// ============================================================================

void memory_blob_store::put(const std::string& key, const std::string& text) {
    if (fail_writes.load()) {
        throw storage_degraded("memory blob store: write rejected for " + key);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = text;
}

std::optional<std::string> memory_blob_store::get(const std::string& key) {
    if (fail_reads.load()) {
        throw storage_degraded("memory blob store: read rejected for " + key);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

void memory_blob_store::remove(const std::string& key) {
    if (fail_writes.load()) {
        throw storage_degraded("memory blob store: delete rejected for " + key);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(key);
}

bool memory_blob_store::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(key) > 0;
}

size_t memory_blob_store::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

// ============================================================================
// directory_blob_store
// ============================================================================

directory_blob_store::directory_blob_store(std::string root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        LOG_ERROR("blob", "Failed to create blob root %s: %s", root_.c_str(), ec.message().c_str());
        throw storage_degraded("Failed to create blob root " + root_ + ": " + ec.message());
    }
}

std::string directory_blob_store::resolve(const std::string& key) const {
    // Keys are engine-generated, but refuse anything that could escape the root
    if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
        throw storage_degraded("Invalid blob key: " + key);
    }
    return (fs::path(root_) / key).string();
}

void directory_blob_store::put(const std::string& key, const std::string& text) {
    fs::path target(resolve(key));
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw storage_degraded("Failed to create " + target.parent_path().string() + ": " + ec.message());
    }

    // Write to a sibling file and rename so readers never see a partial payload
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw storage_degraded("Failed to open " + tmp.string() + " for writing");
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!out) {
            throw storage_degraded("Failed to write " + tmp.string());
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw storage_degraded("Failed to move payload into " + target.string());
    }
    LOG_DEBUG("blob", "put %s (%zu bytes)", key.c_str(), text.size());
}

std::optional<std::string> directory_blob_store::get(const std::string& key) {
    fs::path target(resolve(key));
    std::error_code ec;
    if (!fs::exists(target, ec)) {
        if (ec) throw storage_degraded("Failed to stat " + target.string() + ": " + ec.message());
        return std::nullopt;
    }
    std::ifstream in(target, std::ios::binary);
    if (!in) {
        throw storage_degraded("Failed to open " + target.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void directory_blob_store::remove(const std::string& key) {
    fs::path target(resolve(key));
    std::error_code ec;
    fs::remove(target, ec);
    if (ec) {
        throw storage_degraded("Failed to remove " + target.string() + ": " + ec.message());
    }
    // Drop the per-snapshot directory once it is empty
    fs::path parent = target.parent_path();
    if (parent != fs::path(root_) && fs::is_empty(parent, ec) && !ec) {
        fs::remove(parent, ec);
    }
}

} // namespace strata
