#pragma once

#include "unistore/core/constants.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace unistore {

/// Configuration for a single storage backend (filesystem, memory, null, bunny).
struct BackendConfig {
    std::string type;  // "filesystem", "memory", "null", "bunny"
    std::map<std::string, std::string> params;  // Passed to StorageBackendFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// What a migration run does.
enum class MigrationMode {
    Transfer,  // Copy every object from source to destination
    Purge      // Delete every object from source
};

/// Configuration for a migration run: move the contents of one store into
/// another, or empty a store.
struct MigrationConfig {
    BackendConfig source;
    BackendConfig destination;  // Unused in purge mode

    MigrationMode mode = MigrationMode::Transfer;
    bool delete_source = false;  // Prune each source object after its copy succeeded

    // Abort the run after this long; 0 = no deadline
    size_t timeout_secs = 0;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace unistore
