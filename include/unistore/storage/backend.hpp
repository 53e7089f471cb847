#pragma once

#include "unistore/core/cancellation.hpp"
#include "unistore/core/errors.hpp"
#include "unistore/storage/progress.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace unistore {

struct BackendConfig;

// Identifies a logical store: (principal/user, bucket/container).
// Two backends with equal identities address the same data.
struct BackendIdentity {
    std::string principal;
    std::string container;

    bool operator==(const BackendIdentity& other) const {
        return principal == other.principal && container == other.container;
    }
    bool operator!=(const BackendIdentity& other) const { return !(*this == other); }
};

// Which step of a bulk operation an item failed in
enum class ItemStage {
    Copy,          // Download from source or upload to destination
    DeleteSource,  // Copy succeeded, pruning the source failed (object now in both stores)
    Delete         // delete_all
};

const char* item_stage_name(ItemStage stage);

// Failure record for one item of a bulk operation
struct ItemOutcome {
    std::string name;
    ItemStage stage = ItemStage::Copy;
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

// Aggregate result of a bulk operation
struct BulkSummary {
    uint64_t listed = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    bool cancelled = false;           // Stopped early; remaining items untouched
    bool skipped_same_store = false;  // Transfer target was the source itself

    // True when no item was modified.
    bool nothing_happened() const { return succeeded == 0 && failed == 0; }
};

using SuccessObserver = std::function<void(const std::string& name)>;
using ErrorObserver = std::function<void(const ItemOutcome& outcome)>;
using CountObserver = std::function<void(uint64_t count)>;
// Upload progress of one item within a bulk transfer; restarts at each item
using ItemProgressObserver =
    std::function<void(const std::string& name, const TransferProgress& progress)>;

/// Capability contract implemented by every storage backend.
///
/// Object names form a flat namespace. Single-object operations throw
/// StorageError on failure; bulk operations (delete_all, transfer) never
/// abort on a single item and report per-item outcomes instead.
/// Every operation checks the cancellation token before touching storage.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Human-readable description, e.g. "Filesystem /srv/objects"
    virtual std::string describe() const = 0;

    // Logical store this instance addresses
    virtual BackendIdentity identity() const = 0;

    // Full flat listing of object names. No ordering guarantee.
    virtual std::vector<std::string> list(const CancellationToken& cancel = {}) const = 0;

    // Open an object for reading. Throws NotFound if absent.
    virtual std::unique_ptr<std::istream> download(const std::string& name,
                                                   const CancellationToken& cancel = {}) const = 0;

    // Copy an object into a caller-owned sink. Throws NotFound if absent.
    virtual void download(const std::string& name, std::ostream& sink,
                          const ProgressObserver& progress = {},
                          const CancellationToken& cancel = {}) const = 0;

    // Create or overwrite an object from the remaining bytes of `source`.
    // No partially written object is ever visible. The caller keeps
    // ownership of `source`. `expected_length` of 0 means "use the stream's
    // length if it can seek".
    virtual void upload(const std::string& name, std::istream& source,
                        const ProgressObserver& progress = {},
                        const CancellationToken& cancel = {},
                        uint64_t expected_length = 0) = 0;

    // Delete an object. Throws NotFound if absent.
    virtual void remove(const std::string& name, const CancellationToken& cancel = {}) = 0;

    // Upload variant that takes ownership of the stream and releases it
    // after it has been consumed, on success and on failure.
    void upload(const std::string& name, std::unique_ptr<std::istream> source,
                const ProgressObserver& progress = {},
                const CancellationToken& cancel = {},
                uint64_t expected_length = 0);

    // Upload a local file, optionally deleting it once stored.
    virtual void upload_file(const std::string& name, const std::filesystem::path& path,
                             bool delete_source,
                             const ProgressObserver& progress = {},
                             const CancellationToken& cancel = {});

    // True if `other` addresses the same logical store.
    bool same_store(const StorageBackend& other) const {
        return identity() == other.identity();
    }

    // Delete every object, one at a time. `progress` receives the running
    // count after each successful delete.
    virtual BulkSummary delete_all(const CountObserver& progress = {},
                                   const ErrorObserver& on_error = {},
                                   const CancellationToken& cancel = {});

    // Copy every object to `destination`, optionally pruning each source
    // object once its copy succeeded. No-op when destination is this store.
    // A copied item whose source delete did not happen is reported with
    // stage DeleteSource, including when the stop arrived between the two.
    virtual BulkSummary transfer(StorageBackend& destination, bool delete_source,
                                 const SuccessObserver& on_success = {},
                                 const ErrorObserver& on_error = {},
                                 const CancellationToken& cancel = {},
                                 const ItemProgressObserver& on_progress = {});
};

// Factory for creating storage backends from configuration
class StorageBackendFactory {
public:
    // Create a backend from a type name and a configuration map
    static std::unique_ptr<StorageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& params);

    static std::unique_ptr<StorageBackend> create(const BackendConfig& config);

    // Objects stored as regular files directly under root_path
    static std::unique_ptr<StorageBackend> create_filesystem(
        const std::filesystem::path& root_path);

    // Objects held in process memory. An empty container yields a store
    // distinct from every other instance.
    static std::unique_ptr<StorageBackend> create_memory(
        const std::string& principal = "",
        const std::string& container = "");

    // Records object names and lengths only; downloads return zero bytes
    static std::unique_ptr<StorageBackend> create_null();

    // BunnyCDN-style storage zone over HTTP
    static std::unique_ptr<StorageBackend> create_bunny(
        const std::string& storage_zone,
        const std::string& access_key,
        const std::string& endpoint = "",
        int connect_timeout_secs = 0,
        int request_timeout_secs = 0,
        bool verify_ssl = true);
};

} // namespace unistore
