#pragma once

#include <cstddef>
#include <cstdint>

namespace unistore::constants {

// Stream copy defaults
constexpr size_t DEFAULT_COPY_BUFFER_SIZE = 80 * 1024;                 // 80KB

// Filesystem backend
constexpr const char* FILESYSTEM_STAGING_DIR = ".unistore-staging";

// HTTP backend defaults
constexpr const char* DEFAULT_BUNNY_ENDPOINT = "https://storage.bunnycdn.com";
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 300;
constexpr size_t DEFAULT_MAX_LISTING_SIZE = 64 * 1024 * 1024;          // 64MB
constexpr const char* DEFAULT_USER_AGENT = "unistore/1.0";

// Metrics defaults
constexpr int DEFAULT_METRICS_INTERVAL_SECONDS = 15;

// Default identities
constexpr const char* DEFAULT_MEMORY_PRINCIPAL = "memory";
constexpr const char* FILESYSTEM_PRINCIPAL = "file";
constexpr const char* NULL_PRINCIPAL = "null";

} // namespace unistore::constants
