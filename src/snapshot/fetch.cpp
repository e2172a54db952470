#include "devshell/fetch.hpp"
#include "devshell/platform.hpp"

#include <openssl/evp.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace devshell {

// ============================================================================
// Content Hashing (OpenSSL EVP)
// ============================================================================

namespace {

class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

} // namespace

HashResult compute_sha256(const std::string& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP digest update failed";
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

std::string content_hash(const std::string& data) {
    auto hash = compute_sha256(data);
    if (!hash.ok) return "";
    return "sha256-" + hash.hex_digest;
}

// ============================================================================
// Index Fetching with libcurl
// ============================================================================

namespace {

// Package-set indexes are large but bounded; anything past this is not an index
constexpr size_t MAX_INDEX_BYTES = 256u * 1024u * 1024u;

struct Download {
    std::string body;
    bool truncated = false;
};

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* download = static_cast<Download*>(userdata);
    size_t total = size * nmemb;
    if (download->body.size() + total > MAX_INDEX_BYTES) {
        download->truncated = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    download->body.append(ptr, total);
    return total;
}

class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// curl_global_init is not thread-safe; the function-local static runs it once
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensure_curl_global() {
    static CurlGlobal global;
}

// Failures worth retrying: the mirror may answer on the next attempt
bool is_transient(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}

bool is_transient_status(long status) {
    return status >= 500 || status == 408 || status == 429;
}

} // namespace

FetchResult fetch_https(const std::string& url, int timeout_seconds) {
    FetchResult result;
    ensure_curl_global();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize curl";
        return result;
    }

    Download download;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    long timeout = timeout_seconds > 0 ? static_cast<long>(timeout_seconds) : 60L;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &download);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "https");
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "https");
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout < 30L ? timeout : 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "devshell");

    CURLcode res = curl_easy_perform(curl.get());
    if (download.truncated) {
        result.error = "index at " + url + " exceeds " +
                       std::to_string(MAX_INDEX_BYTES / (1024 * 1024)) + " MiB";
        return result;
    }
    if (res != CURLE_OK) {
        result.error = std::string(error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        result.transient = is_transient(res);
        spdlog::debug("curl error {} for {}: {}", static_cast<int>(res), url, result.error);
        return result;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);
    if (result.http_status < 200 || result.http_status >= 300) {
        result.error = "HTTP " + std::to_string(result.http_status) + " from " + url;
        result.transient = is_transient_status(result.http_status);
        return result;
    }

    spdlog::debug("Fetched {} bytes from {}", download.body.size(), url);
    result.body = std::move(download.body);
    result.ok = true;
    return result;
}

FetchResult fetch_location(const std::string& location, int timeout_seconds) {
    FetchResult result;

    if (location.rfind("file:", 0) == 0) {
        std::string path = location.substr(5);
        if (path.empty()) {
            result.error = "empty file path in " + location;
            return result;
        }
        auto content = read_file(path);
        if (!content) {
            result.error = "not found: " + path;
            return result;
        }
        result.body = std::move(*content);
        result.ok = true;
        return result;
    }

    if (location.rfind("https://", 0) == 0) {
        return fetch_https(location, timeout_seconds);
    }

    if (location.rfind("http://", 0) == 0) {
        result.error = "plain http mirrors are not allowed: " + location;
        return result;
    }

    result.error = "unsupported mirror location '" + location + "', expected file: or https://";
    return result;
}

} // namespace devshell
