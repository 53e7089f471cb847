#include "unistore/net/http.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace unistore::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

namespace {

struct CurlCodeRule {
    CURLcode code;
    ErrorKind kind;
};

constexpr std::array<CurlCodeRule, 11> kCurlCodeTable = {{
    {CURLE_OPERATION_TIMEDOUT, ErrorKind::Timeout},
    {CURLE_COULDNT_RESOLVE_PROXY, ErrorKind::TemporaryFailure},
    {CURLE_COULDNT_RESOLVE_HOST, ErrorKind::TemporaryFailure},
    {CURLE_COULDNT_CONNECT, ErrorKind::TemporaryFailure},
    {CURLE_SEND_ERROR, ErrorKind::TemporaryFailure},
    {CURLE_RECV_ERROR, ErrorKind::TemporaryFailure},
    {CURLE_GOT_NOTHING, ErrorKind::TemporaryFailure},
    {CURLE_PARTIAL_FILE, ErrorKind::TemporaryFailure},
    {CURLE_ABORTED_BY_CALLBACK, ErrorKind::Cancelled},
    {CURLE_LOGIN_DENIED, ErrorKind::Unauthorized},
    {CURLE_URL_MALFORMAT, ErrorKind::InvalidArgument},
}};

} // namespace

ErrorKind classify_curl_code(int curl_code) {
    auto it = std::find_if(kCurlCodeTable.begin(), kCurlCodeTable.end(),
                           [curl_code](const CurlCodeRule& rule) {
                               return static_cast<int>(rule.code) == curl_code;
                           });
    return it != kCurlCodeTable.end() ? it->kind : ErrorKind::Internal;
}

// ============================================================================
// CURL callback functions
// ============================================================================

struct WriteContext {
    std::ostream* sink;        // Streamed response, or
    std::string* buffer;       // buffered response
    size_t max_size;
    bool size_exceeded = false;
    bool sink_failed = false;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->sink) {
        ctx->sink->write(ptr, static_cast<std::streamsize>(bytes));
        if (!*ctx->sink) {
            ctx->sink_failed = true;
            return 0;
        }
        return bytes;
    }

    if (ctx->max_size > 0 && ctx->buffer->size() + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }
    ctx->buffer->append(ptr, bytes);
    return bytes;
}

struct ReadContext {
    std::istream* source;
    bool source_failed = false;
};

static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<ReadContext*>(userdata);
    size_t max_bytes = size * nitems;

    ctx->source->read(buffer, static_cast<std::streamsize>(max_bytes));
    auto got = ctx->source->gcount();
    if (got == 0 && ctx->source->fail() && !ctx->source->eof()) {
        ctx->source_failed = true;
        return CURL_READFUNC_ABORT;
    }
    return static_cast<size_t>(got);
}

struct ProgressContext {
    const HttpRequest* request;
    bool aborted = false;
};

static int progress_callback(void* clientp, curl_off_t /*dltotal*/, curl_off_t dlnow,
                             curl_off_t /*ultotal*/, curl_off_t ulnow) {
    auto* ctx = static_cast<ProgressContext*>(clientp);
    const auto& request = *ctx->request;

    if (request.cancel.stop_requested()) {
        ctx->aborted = true;
        return 1;  // Non-zero aborts the transfer
    }

    if (request.upload_progress && ulnow > 0) {
        request.upload_progress->report_cumulative(static_cast<uint64_t>(ulnow));
    }
    if (request.download_progress && dlnow > 0) {
        request.download_progress->report_cumulative(static_cast<uint64_t>(dlnow));
    }
    return 0;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        curl_ = curl_easy_init();
        if (!curl_) {
            throw StorageError(ErrorKind::Internal, "failed to initialize libcurl handle");
        }

        if (!config_.verify_ssl) {
            std::cerr << "[http] SSL verification disabled via configuration\n";
        }
    }

    ~Impl() {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        HttpResponse response;

        // Handle is reused between requests so connections stay warm
        curl_easy_reset(curl_);
        CURL* curl = curl_;

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
        }

        // Headers
        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        // Request body
        ReadContext read_ctx{request.body};
        if (request.method == HttpMethod::PUT) {
            if (request.body) {
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &read_ctx);
            }
            // Explicit Content-Length, including for empty bodies (avoids 411)
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body ? request.body_length : 0));
        }

        // Response body
        WriteContext write_ctx{request.response_sink, &response.body, request.max_response_size};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        // Progress and cancellation
        ProgressContext progress_ctx{&request};
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress_ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        // Timeouts
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                         static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                         static_cast<long>(config_.total_timeout.count()));

        if (config_.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        response.curl_code = static_cast<int>(res);

        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        } else if (progress_ctx.aborted) {
            response.aborted = true;
            response.is_network_error = true;
            response.error = "transfer aborted";
            response.error_kind = request.cancel.is_cancelled() ? ErrorKind::Cancelled
                                                                : ErrorKind::Timeout;
        } else if (write_ctx.size_exceeded) {
            response.error = "response body exceeded maximum size limit of " +
                             std::to_string(request.max_response_size) + " bytes";
            response.is_network_error = true;
        } else if (write_ctx.sink_failed) {
            response.error = "failed to write response body to sink";
            response.is_network_error = true;
        } else if (read_ctx.source_failed) {
            response.error = "failed to read request body from source";
            response.is_network_error = true;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
            response.error_kind = classify_curl_code(response.curl_code);
        }

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }

        return response;
    }

private:
    HttpClientConfig config_;
    CURL* curl_ = nullptr;
    std::mutex mutex_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : config_(config), impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

} // namespace unistore::net
