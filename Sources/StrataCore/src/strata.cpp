#include "strata/strata.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace strata {

std::atomic<log_level> g_log_level{log_level::off};

namespace {

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

log_sink& current_sink() {
    static log_sink sink;
    return sink;
}

} // namespace

void set_log_sink(log_sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    current_sink() = std::move(sink);
}

void log_write(log_level level, const char* tag, const char* fmt, ...) {
    char buf[1024];
    va_list args;
    va_start(args, fmt);
    int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::string message;
    if (n < 0) {
        message = fmt;
    } else if (static_cast<size_t>(n) < sizeof(buf)) {
        message.assign(buf, static_cast<size_t>(n));
    } else {
        // Too long for the stack buffer: format again at full size
        message.resize(static_cast<size_t>(n) + 1);
        va_start(args, fmt);
        std::vsnprintf(message.data(), message.size(), fmt, args);
        va_end(args);
        message.resize(static_cast<size_t>(n));
    }

    std::lock_guard<std::mutex> lock(sink_mutex());
    if (current_sink()) {
        current_sink()(level, tag, message);
    } else {
        std::fprintf(stderr, "[%s] %s\n", tag, message.c_str());
    }
}

engine::engine(configuration config) : config_(std::move(config)) {
    db_ = std::make_unique<database>(config_.path, database::open_mode::read_write, config_.busy_timeout_ms);

    auto blobs = config_.blobs;
    if (!blobs && config_.s3) {
        blobs = std::make_shared<s3_blob_store>(*config_.s3);
    }

    snapshots_ = std::make_unique<snapshot_manager>(*db_, blobs, config_.system_tables);
    snapshots_->ensure_tables();

    auto sched = config_.sched;
    if (!sched && blobs && config_.pre_change_snapshots) {
        // Payload uploads must not hold up the DDL that requested them
        sched = std::make_shared<worker_scheduler>();
    }
    queue_ = std::make_unique<snapshot_queue>(*snapshots_, std::move(sched));
    schemas_ = std::make_unique<schema_manager>(*db_, queue_.get(), config_.system_tables,
                                                config_.pre_change_snapshots);
    indexes_ = std::make_unique<index_manager>(*db_, queue_.get(), config_.system_tables,
                                               config_.pre_change_snapshots);

    LOG_INFO("db", "Opened %s (%s)", config_.path.c_str(),
             blobs ? blobs->name() : "schema-only snapshots");
}

engine::~engine() {
    // Outstanding pre-change snapshots still reference the managers
    queue_->wait_idle();
}

} // namespace strata
