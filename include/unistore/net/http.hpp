#pragma once

#include "unistore/core/cancellation.hpp"
#include "unistore/core/errors.hpp"
#include "unistore/storage/progress.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <ostream>
#include <string>

namespace unistore::net {

enum class HttpMethod {
    GET,
    PUT,
    DELETE
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(long status);

// Percent-encode everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& str);

// Map a libcurl result code (CURLcode) to an error kind
ErrorKind classify_curl_code(int curl_code);

struct HttpClientConfig {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds total_timeout{300};
    bool verify_ssl = true;
    std::string user_agent;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;

    // PUT body, streamed. body_length is sent as Content-Length.
    std::istream* body = nullptr;
    uint64_t body_length = 0;

    // Response body destination. When null the body is buffered into
    // HttpResponse::body.
    std::ostream* response_sink = nullptr;
    size_t max_response_size = 0;  // Buffered responses only, 0 = unlimited

    // Fed from libcurl's transfer-info callback (may be null)
    ProgressTranslator* upload_progress = nullptr;
    ProgressTranslator* download_progress = nullptr;

    // Checked from the transfer-info callback; stop aborts the transfer
    CancellationToken cancel;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;
    int curl_code = 0;             // CURLE_OK on a completed exchange
    bool is_network_error = false;
    bool aborted = false;          // Stopped by the cancellation token
    ErrorKind error_kind = ErrorKind::Internal;  // Meaningful when is_network_error

    bool ok() const { return !is_network_error && is_success_status(status_code); }
};

/// Blocking HTTP client over a libcurl easy handle.
///
/// One request runs at a time per client; concurrent callers serialize on
/// the handle.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    const HttpClientConfig& config() const { return config_; }

private:
    class Impl;
    HttpClientConfig config_;
    std::unique_ptr<Impl> impl_;
};

} // namespace unistore::net
