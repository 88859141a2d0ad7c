#pragma once

#ifdef __cplusplus

#include "blob_store.hpp"

#include <string>

namespace strata {

struct s3_config {
    std::string endpoint;               // e.g. "http://127.0.0.1:9000"
    std::string host;                   // Host header value, e.g. "127.0.0.1:9000"
    std::string bucket;
    std::string region = "us-east-1";
    std::string access_key;
    std::string secret_key;
    long timeout_seconds = 30;
};

/// S3-compatible object store (AWS, MinIO) using path-style requests signed
/// with AWS Signature V4. Every request is bounded by timeout_seconds.
class s3_blob_store : public blob_store {
public:
    explicit s3_blob_store(s3_config config);

    void put(const std::string& key, const std::string& text) override;
    std::optional<std::string> get(const std::string& key) override;
    void remove(const std::string& key) override;
    const char* name() const override { return "s3"; }

    const s3_config& config() const { return config_; }

    struct response {
        long status = 0;
        std::string body;
    };

    /// Authorization header value for one request. Exposed for tests.
    static std::string sign_request(const s3_config& config,
                                    const std::string& method,
                                    const std::string& path,
                                    const std::string& payload_hash,
                                    const std::string& amz_datetime);

private:
    s3_config config_;

    std::string object_path(const std::string& key) const;
    response perform(const std::string& method, const std::string& key, const std::string* payload);
};

} // namespace strata

#endif // __cplusplus
