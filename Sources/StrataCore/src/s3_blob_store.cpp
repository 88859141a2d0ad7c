#include "strata/s3_blob_store.hpp"
#include "strata/digest.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"

#include <curl/curl.h>
#include <ctime>
#include <memory>
#include <mutex>

namespace strata {

namespace {

size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string utc_now(const char* format) {
    time_t t = time(nullptr);
    struct tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), format, &tm_buf);
    return buf;
}

// Path segments are percent-encoded per SigV4 (unreserved characters and '/' kept).
std::string uri_encode_path(const std::string& path) {
    static const char digits[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : path) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += digits[c >> 4];
            out += digits[c & 0x0F];
        }
    }
    return out;
}

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct curl_deleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct slist_deleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

} // namespace

s3_blob_store::s3_blob_store(s3_config config) : config_(std::move(config)) {
    if (config_.endpoint.empty() || config_.bucket.empty()) {
        throw strata_error("s3 blob store requires an endpoint and a bucket");
    }
    if (config_.host.empty()) {
        // Derive the Host header from the endpoint when it is not given
        auto scheme = config_.endpoint.find("://");
        config_.host = scheme == std::string::npos ? config_.endpoint : config_.endpoint.substr(scheme + 3);
        while (!config_.host.empty() && config_.host.back() == '/') config_.host.pop_back();
    }
    ensure_curl_initialized();
    LOG_INFO("s3", "Using bucket %s at %s", config_.bucket.c_str(), config_.endpoint.c_str());
}

std::string s3_blob_store::sign_request(const s3_config& config,
                                        const std::string& method,
                                        const std::string& path,
                                        const std::string& payload_hash,
                                        const std::string& amz_datetime) {
    const std::string date = amz_datetime.substr(0, 8);
    const std::string service = "s3";
    const std::string scope = date + "/" + config.region + "/" + service + "/aws4_request";

    std::string canonical = method + "\n"
        + uri_encode_path(path) + "\n"
        + "\n"
        + "host:" + config.host + "\n"
        + "x-amz-content-sha256:" + payload_hash + "\n"
        + "x-amz-date:" + amz_datetime + "\n"
        + "\n"
        + "host;x-amz-content-sha256;x-amz-date\n"
        + payload_hash;

    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + amz_datetime + "\n" + scope + "\n" + sha256_hex(canonical);

    std::string key = "AWS4" + config.secret_key;
    auto k_date = hmac_sha256(key.data(), key.size(), date);
    auto k_region = hmac_sha256(k_date.data(), k_date.size(), config.region);
    auto k_service = hmac_sha256(k_region.data(), k_region.size(), service);
    auto k_signing = hmac_sha256(k_service.data(), k_service.size(), "aws4_request");
    auto signature = hmac_sha256(k_signing.data(), k_signing.size(), string_to_sign);

    return "AWS4-HMAC-SHA256 Credential=" + config.access_key + "/" + scope
         + ", SignedHeaders=host;x-amz-content-sha256;x-amz-date"
         + ", Signature=" + to_hex(signature);
}

std::string s3_blob_store::object_path(const std::string& key) const {
    return "/" + config_.bucket + "/" + key;
}

s3_blob_store::response s3_blob_store::perform(const std::string& method,
                                               const std::string& key,
                                               const std::string* payload) {
    std::unique_ptr<CURL, curl_deleter> curl(curl_easy_init());
    if (!curl) {
        throw storage_degraded("curl_easy_init failed");
    }

    const std::string path = object_path(key);
    const std::string url = config_.endpoint + uri_encode_path(path);
    const std::string payload_hash = payload ? sha256_hex(*payload) : sha256_hex("");
    const std::string datetime = utc_now("%Y%m%dT%H%M%SZ");
    const std::string auth = sign_request(config_, method, path, payload_hash, datetime);

    curl_slist* raw = nullptr;
    raw = curl_slist_append(raw, ("Authorization: " + auth).c_str());
    raw = curl_slist_append(raw, ("x-amz-date: " + datetime).c_str());
    raw = curl_slist_append(raw, ("x-amz-content-sha256: " + payload_hash).c_str());
    raw = curl_slist_append(raw, ("Host: " + config_.host).c_str());
    if (payload) {
        raw = curl_slist_append(raw, "Content-Type: application/json");
    }
    std::unique_ptr<curl_slist, slist_deleter> headers(raw);

    response resp;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    if (payload) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload->data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload->size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        LOG_WARN("s3", "%s %s failed: %s", method.c_str(), path.c_str(), curl_easy_strerror(res));
        throw storage_degraded("s3 " + method + " " + key + " failed: " + curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    LOG_DEBUG("s3", "%s %s -> %ld", method.c_str(), path.c_str(), resp.status);
    return resp;
}

void s3_blob_store::put(const std::string& key, const std::string& text) {
    auto resp = perform("PUT", key, &text);
    if (resp.status != 200) {
        throw storage_degraded("s3 PUT " + key + " returned HTTP " + std::to_string(resp.status));
    }
}

std::optional<std::string> s3_blob_store::get(const std::string& key) {
    auto resp = perform("GET", key, nullptr);
    if (resp.status == 404) return std::nullopt;
    if (resp.status != 200) {
        throw storage_degraded("s3 GET " + key + " returned HTTP " + std::to_string(resp.status));
    }
    return std::move(resp.body);
}

void s3_blob_store::remove(const std::string& key) {
    auto resp = perform("DELETE", key, nullptr);
    if (resp.status != 200 && resp.status != 204 && resp.status != 404) {
        throw storage_degraded("s3 DELETE " + key + " returned HTTP " + std::to_string(resp.status));
    }
}

} // namespace strata
