#include "unistore/storage/backend.hpp"
#include "unistore/core/constants.hpp"
#include "unistore/net/http.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>

namespace unistore {

// ============================================================================
// BunnyStorageBackend - BunnyCDN storage zone over HTTP
//
//   GET    {endpoint}/{zone}/          JSON listing
//   GET    {endpoint}/{zone}/{name}    download
//   PUT    {endpoint}/{zone}/{name}    upload
//   DELETE {endpoint}/{zone}/{name}    delete
//
// Every request carries the zone password in the AccessKey header.
// ============================================================================

class BunnyStorageBackend : public StorageBackend {
public:
    BunnyStorageBackend(const std::string& storage_zone,
                        const std::string& access_key,
                        const std::string& endpoint,
                        const net::HttpClientConfig& http_config)
        : storage_zone_(storage_zone)
        , access_key_(access_key)
        , endpoint_(endpoint.empty() ? constants::DEFAULT_BUNNY_ENDPOINT : endpoint)
        , client_(http_config) {
        if (storage_zone_.empty()) {
            throw StorageError(ErrorKind::InvalidArgument, "bunny backend requires a storage zone");
        }
        while (!endpoint_.empty() && endpoint_.back() == '/') {
            endpoint_.pop_back();
        }
        std::cerr << "[bunny] storage backend initialized for zone " << storage_zone_
                  << " at " << endpoint_ << "\n";
    }

    using StorageBackend::upload;

    std::string type_name() const override { return "bunny"; }

    std::string describe() const override { return "BunnyCDN " + storage_zone_; }

    BackendIdentity identity() const override { return {endpoint_, storage_zone_}; }

    std::vector<std::string> list(const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("list");

        auto request = make_request(net::HttpMethod::GET, zone_url() + "/", cancel);
        request.max_response_size = constants::DEFAULT_MAX_LISTING_SIZE;
        auto response = client_.execute(request);
        check(response, "list " + storage_zone_, cancel);

        std::vector<std::string> names;
        try {
            auto listing = nlohmann::json::parse(response.body);
            if (!listing.is_array()) {
                throw StorageError(ErrorKind::Internal,
                                   "list " + storage_zone_ + ": listing is not a JSON array");
            }
            for (const auto& entry : listing) {
                if (entry.value("IsDirectory", false)) continue;
                names.push_back(entry.at("ObjectName").get<std::string>());
            }
        } catch (const nlohmann::json::exception& e) {
            throw StorageError(ErrorKind::Internal,
                               "list " + storage_zone_ + ": malformed listing: " + e.what());
        }
        return names;
    }

    std::unique_ptr<std::istream> download(const std::string& name,
                                           const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("download '" + name + "'");

        // Body is buffered, so a failed request never hands out a partial stream
        auto request = make_request(net::HttpMethod::GET, object_url(name), cancel);
        auto response = client_.execute(request);
        check(response, "download '" + name + "'", cancel);

        return std::make_unique<std::istringstream>(std::move(response.body), std::ios::binary);
    }

    void download(const std::string& name, std::ostream& sink,
                  const ProgressObserver& progress,
                  const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("download '" + name + "'");

        // Length is unknown until the response arrives
        ProgressTranslator translator(progress, 0);
        auto request = make_request(net::HttpMethod::GET, object_url(name), cancel);
        if (progress) {
            request.download_progress = &translator;
        }
        auto response = client_.execute(request);
        check(response, "download '" + name + "'", cancel);

        sink.write(response.body.data(), static_cast<std::streamsize>(response.body.size()));
        sink.flush();
        if (!sink) {
            throw StorageError(ErrorKind::Internal, "download '" + name + "': failed to write to sink");
        }
        if (progress) {
            translator.report_cumulative(response.body.size());
        }
    }

    void upload(const std::string& name, std::istream& source,
                const ProgressObserver& progress,
                const CancellationToken& cancel,
                uint64_t expected_length) override {
        cancel.throw_if_stopped("upload '" + name + "'");

        // Content-Length must be known up front; buffer streams that cannot seek
        std::istream* body = &source;
        std::istringstream buffered;
        uint64_t length = expected_length;
        if (length == 0) {
            if (auto remaining = remaining_stream_length(source)) {
                length = *remaining;
            } else {
                std::ostringstream collect(std::ios::binary);
                length = copy_stream(source, collect, nullptr, cancel);
                buffered.str(std::move(collect).str());
                body = &buffered;
            }
        }

        ProgressTranslator translator(progress, length);
        auto request = make_request(net::HttpMethod::PUT, object_url(name), cancel);
        request.headers["Content-Type"] = "application/octet-stream";
        request.body = body;
        request.body_length = length;
        if (progress) {
            request.upload_progress = &translator;
        }

        auto response = client_.execute(request);
        check(response, "upload '" + name + "'", cancel);
    }

    void remove(const std::string& name, const CancellationToken& cancel) override {
        cancel.throw_if_stopped("delete '" + name + "'");

        auto request = make_request(net::HttpMethod::DELETE, object_url(name), cancel);
        auto response = client_.execute(request);
        check(response, "delete '" + name + "'", cancel);
    }

private:
    std::string storage_zone_;
    std::string access_key_;
    std::string endpoint_;
    mutable net::HttpClient client_;

    std::string zone_url() const {
        return endpoint_ + "/" + net::url_encode(storage_zone_);
    }

    std::string object_url(const std::string& name) const {
        if (name.empty()) {
            throw StorageError(ErrorKind::InvalidArgument, "invalid object name: ''");
        }
        return zone_url() + "/" + net::url_encode(name);
    }

    net::HttpRequest make_request(net::HttpMethod method, const std::string& url,
                                  const CancellationToken& cancel) const {
        net::HttpRequest request;
        request.method = method;
        request.url = url;
        request.headers["AccessKey"] = access_key_;
        request.headers["Accept"] = "application/json";
        request.cancel = cancel;
        return request;
    }

    // Translate a transport failure or non-success status into StorageError
    static void check(const net::HttpResponse& response, const std::string& context,
                      const CancellationToken& cancel) {
        if (response.aborted) {
            cancel.throw_if_stopped(context);
        }
        if (response.is_network_error) {
            throw StorageError(response.error_kind, context + ": " + response.error);
        }
        throw_for_http_status(static_cast<int>(response.status_code), context);
    }
};

// ============================================================================
// StorageBackendFactory - bunny
// ============================================================================

std::unique_ptr<StorageBackend> StorageBackendFactory::create_bunny(
    const std::string& storage_zone,
    const std::string& access_key,
    const std::string& endpoint,
    int connect_timeout_secs,
    int request_timeout_secs,
    bool verify_ssl) {

    net::HttpClientConfig http_config;
    http_config.connect_timeout = std::chrono::seconds(
        connect_timeout_secs > 0 ? connect_timeout_secs
                                 : constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS);
    http_config.total_timeout = std::chrono::seconds(
        request_timeout_secs > 0 ? request_timeout_secs
                                 : constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS);
    http_config.verify_ssl = verify_ssl;
    http_config.user_agent = constants::DEFAULT_USER_AGENT;

    return std::make_unique<BunnyStorageBackend>(storage_zone, access_key, endpoint, http_config);
}

} // namespace unistore
