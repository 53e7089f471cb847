#include "unistore/storage/backend.hpp"
#include "unistore/core/constants.hpp"
#include "unistore/storage_config.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <streambuf>
#include <unordered_map>

namespace unistore {

const char* item_stage_name(ItemStage stage) {
    switch (stage) {
        case ItemStage::Copy: return "copy";
        case ItemStage::DeleteSource: return "delete-source";
        case ItemStage::Delete: return "delete";
    }
    return "copy";
}

namespace {

// Unique suffix for a store that was not given an explicit container name
std::string instance_tag(const void* instance) {
    std::ostringstream oss;
    oss << "instance-" << instance;
    return oss.str();
}

// Deliver a failure to the observer. Must be called from inside a catch block.
void report_item_failure(const std::string& name, ItemStage stage,
                         BulkSummary& summary, const ErrorObserver& on_error) {
    auto classified = classify_current_exception();
    ++summary.failed;

    std::cerr << "[transfer] " << item_stage_name(stage) << " failed for '" << name
              << "': " << error_kind_name(classified.kind) << ": "
              << classified.message << "\n";

    if (on_error) {
        ItemOutcome outcome;
        outcome.name = name;
        outcome.stage = stage;
        outcome.kind = classified.kind;
        outcome.message = classified.message;
        on_error(outcome);
    }
}

} // namespace

// ============================================================================
// StorageBackend - provider-independent defaults
// ============================================================================

void StorageBackend::upload(const std::string& name, std::unique_ptr<std::istream> source,
                            const ProgressObserver& progress,
                            const CancellationToken& cancel,
                            uint64_t expected_length) {
    if (!source) {
        throw StorageError(ErrorKind::InvalidArgument, "upload '" + name + "': null source stream");
    }
    // Released when this frame unwinds, whether the upload succeeded or not
    auto owned = std::move(source);
    upload(name, *owned, progress, cancel, expected_length);
}

void StorageBackend::upload_file(const std::string& name, const std::filesystem::path& path,
                                 bool delete_source,
                                 const ProgressObserver& progress,
                                 const CancellationToken& cancel) {
    cancel.throw_if_stopped("upload_file '" + name + "'");

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw StorageError(ErrorKind::InvalidArgument,
                           "upload_file: no file exists at the given path " + path.string());
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw_for_error_code(ec, "upload_file: cannot stat " + path.string());
    }

    {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw StorageError(ErrorKind::Unauthorized,
                               "upload_file: cannot open " + path.string());
        }
        upload(name, file, progress, cancel, size);
    }

    if (delete_source) {
        std::filesystem::remove(path, ec);
        if (ec) {
            throw_for_error_code(ec, "upload_file: stored but failed to delete " + path.string());
        }
    }
}

BulkSummary StorageBackend::delete_all(const CountObserver& progress,
                                       const ErrorObserver& on_error,
                                       const CancellationToken& cancel) {
    BulkSummary summary;
    auto names = list(cancel);
    summary.listed = names.size();

    uint64_t count = 0;
    for (const auto& name : names) {
        if (cancel.stop_requested()) {
            summary.cancelled = true;
            break;
        }

        try {
            remove(name, cancel);
        } catch (const std::exception&) {
            report_item_failure(name, ItemStage::Delete, summary, on_error);
            continue;
        }

        ++count;
        ++summary.succeeded;
        if (progress) {
            progress(count);
        }
    }

    if (summary.failed > 0 || summary.cancelled) {
        std::cerr << "[unistore] delete_all on " << describe() << ": "
                  << summary.succeeded << "/" << summary.listed << " deleted, "
                  << summary.failed << " failed"
                  << (summary.cancelled ? ", cancelled" : "") << "\n";
    }
    return summary;
}

BulkSummary StorageBackend::transfer(StorageBackend& destination, bool delete_source,
                                     const SuccessObserver& on_success,
                                     const ErrorObserver& on_error,
                                     const CancellationToken& cancel,
                                     const ItemProgressObserver& on_progress) {
    BulkSummary summary;

    if (same_store(destination)) {
        // Target is the source itself; copying would be pointless and
        // delete_source would destroy the data.
        summary.skipped_same_store = true;
        return summary;
    }

    // Snapshot: objects added after this point may be missed
    auto names = list(cancel);
    summary.listed = names.size();

    for (const auto& name : names) {
        if (cancel.stop_requested()) {
            summary.cancelled = true;
            break;
        }

        ProgressObserver item_progress;
        if (on_progress) {
            item_progress = [&on_progress, &name](const TransferProgress& progress) {
                on_progress(name, progress);
            };
        }

        try {
            auto stream = download(name, cancel);
            destination.upload(name, *stream, item_progress, cancel);
        } catch (const std::exception&) {
            report_item_failure(name, ItemStage::Copy, summary, on_error);
            if (cancel.stop_requested()) {
                summary.cancelled = true;
                break;
            }
            continue;
        }

        if (delete_source) {
            // A stop that lands after the copy surfaces here as a
            // Cancelled/Timeout failure; the copy stays in both stores
            try {
                remove(name, cancel);
            } catch (const std::exception&) {
                report_item_failure(name, ItemStage::DeleteSource, summary, on_error);
                if (cancel.stop_requested()) {
                    summary.cancelled = true;
                    break;
                }
                continue;
            }
        }

        ++summary.succeeded;
        if (on_success) {
            on_success(name);
        }
    }

    std::cerr << "[transfer] " << describe() << " -> " << destination.describe() << ": "
              << summary.succeeded << "/" << summary.listed << " transferred, "
              << summary.failed << " failed"
              << (summary.cancelled ? ", cancelled" : "") << "\n";
    return summary;
}

// ============================================================================
// FilesystemStorageBackend - one regular file per object under a root directory
// ============================================================================

class FilesystemStorageBackend : public StorageBackend {
public:
    explicit FilesystemStorageBackend(const std::filesystem::path& root) {
        std::error_code ec;
        root_ = std::filesystem::weakly_canonical(std::filesystem::absolute(root, ec), ec);
        if (ec) {
            throw_for_error_code(ec, "filesystem backend: invalid root " + root.string());
        }
        std::filesystem::create_directories(staging_dir(), ec);
        if (ec) {
            throw_for_error_code(ec, "filesystem backend: cannot create " + staging_dir().string());
        }
    }

    using StorageBackend::upload;

    std::string type_name() const override { return "filesystem"; }

    std::string describe() const override { return "Filesystem " + root_.string(); }

    BackendIdentity identity() const override {
        return {constants::FILESYSTEM_PRINCIPAL, root_.string()};
    }

    std::vector<std::string> list(const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("list");

        std::vector<std::string> names;
        std::error_code ec;
        std::filesystem::directory_iterator it(
            root_, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw_for_error_code(ec, "list " + root_.string());
        }

        // Subdirectories (including the staging area) are not objects
        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::error_code type_ec;
            if (it->is_regular_file(type_ec)) {
                names.push_back(it->path().filename().string());
            }
        }
        if (ec) {
            throw_for_error_code(ec, "list " + root_.string());
        }
        return names;
    }

    std::unique_ptr<std::istream> download(const std::string& name,
                                           const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("download '" + name + "'");
        return open_object(name);
    }

    void download(const std::string& name, std::ostream& sink,
                  const ProgressObserver& progress,
                  const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("download '" + name + "'");
        auto file = open_object(name);

        std::error_code ec;
        auto size = std::filesystem::file_size(object_path(name), ec);
        ProgressTranslator translator(progress, ec ? 0 : size);
        copy_stream(*file, sink, progress ? &translator : nullptr, cancel);
    }

    void upload(const std::string& name, std::istream& source,
                const ProgressObserver& progress,
                const CancellationToken& cancel,
                uint64_t expected_length) override {
        cancel.throw_if_stopped("upload '" + name + "'");
        auto path = object_path(name);
        uint64_t expected = resolve_expected_length(source, expected_length);

        // Write to a staging file then rename, so readers never see a partial object
        auto temp_path = staging_dir() / staging_name();
        try {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw StorageError(ErrorKind::Internal,
                                   "upload '" + name + "': failed to create staging file");
            }
            ProgressTranslator translator(progress, expected);
            copy_stream(source, file, progress ? &translator : nullptr, cancel);
        } catch (...) {
            std::error_code cleanup_ec;
            std::filesystem::remove(temp_path, cleanup_ec);
            throw;
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            std::error_code cleanup_ec;
            std::filesystem::remove(temp_path, cleanup_ec);
            throw_for_error_code(ec, "upload '" + name + "': failed to rename staging file");
        }
    }

    void remove(const std::string& name, const CancellationToken& cancel) override {
        cancel.throw_if_stopped("delete '" + name + "'");
        auto path = object_path(name);

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw StorageError(ErrorKind::NotFound, "delete: object not found: " + name);
        }
        if (!std::filesystem::remove(path, ec)) {
            if (ec) {
                throw_for_error_code(ec, "delete '" + name + "'");
            }
            throw StorageError(ErrorKind::NotFound, "delete: object not found: " + name);
        }
    }

    void upload_file(const std::string& name, const std::filesystem::path& path,
                     bool delete_source,
                     const ProgressObserver& progress,
                     const CancellationToken& cancel) override {
        cancel.throw_if_stopped("upload_file '" + name + "'");

        // Uploading an object's own file onto itself is a no-op; deleting
        // it afterwards would lose the object.
        std::error_code ec;
        auto source = std::filesystem::weakly_canonical(path, ec);
        if (!ec && source == object_path(name)) {
            return;
        }
        StorageBackend::upload_file(name, path, delete_source, progress, cancel);
    }

private:
    std::filesystem::path root_;

    std::filesystem::path staging_dir() const {
        return root_ / constants::FILESYSTEM_STAGING_DIR;
    }

    // Names map onto exactly one path segment directly under root_
    std::filesystem::path object_path(const std::string& name) const {
        if (name.empty() || name == "." || name == ".." ||
            name == constants::FILESYSTEM_STAGING_DIR ||
            name.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
            throw StorageError(ErrorKind::InvalidArgument, "invalid object name: '" + name + "'");
        }
        return root_ / name;
    }

    std::unique_ptr<std::istream> open_object(const std::string& name) const {
        auto path = object_path(name);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw StorageError(ErrorKind::NotFound, "download: object not found: " + name);
        }
        auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!*file) {
            throw StorageError(ErrorKind::Unauthorized, "download '" + name + "': cannot open file");
        }
        return file;
    }

    // Fixed-length staging names, independent of the object name length
    static std::string staging_name() {
        static std::atomic<uint64_t> counter{0};
        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        return "upload." + std::to_string(counter.fetch_add(1, std::memory_order_relaxed)) +
               "." + std::to_string(ticks) + ".tmp";
    }
};

// ============================================================================
// MemoryStorageBackend - objects held in process memory
// ============================================================================

class MemoryStorageBackend : public StorageBackend {
public:
    MemoryStorageBackend(const std::string& principal, const std::string& container)
        : identity_{principal.empty() ? constants::DEFAULT_MEMORY_PRINCIPAL : principal,
                    container.empty() ? instance_tag(this) : container} {}

    using StorageBackend::upload;

    std::string type_name() const override { return "memory"; }

    std::string describe() const override {
        return "Memory " + identity_.principal + "/" + identity_.container;
    }

    BackendIdentity identity() const override { return identity_; }

    std::vector<std::string> list(const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("list");
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(objects_.size());
        for (const auto& [name, data] : objects_) {
            names.push_back(name);
        }
        return names;
    }

    std::unique_ptr<std::istream> download(const std::string& name,
                                           const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("download '" + name + "'");
        return std::make_unique<std::istringstream>(*find(name), std::ios::binary);
    }

    void download(const std::string& name, std::ostream& sink,
                  const ProgressObserver& progress,
                  const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("download '" + name + "'");
        auto data = find(name);
        std::istringstream source(*data, std::ios::binary);
        ProgressTranslator translator(progress, data->size());
        copy_stream(source, sink, progress ? &translator : nullptr, cancel);
    }

    void upload(const std::string& name, std::istream& source,
                const ProgressObserver& progress,
                const CancellationToken& cancel,
                uint64_t expected_length) override {
        cancel.throw_if_stopped("upload '" + name + "'");
        if (name.empty()) {
            throw StorageError(ErrorKind::InvalidArgument, "invalid object name: ''");
        }

        // Buffer fully before publishing so a failed upload leaves no trace
        std::ostringstream buffer(std::ios::binary);
        ProgressTranslator translator(progress, resolve_expected_length(source, expected_length));
        copy_stream(source, buffer, progress ? &translator : nullptr, cancel);

        auto data = std::make_shared<const std::string>(std::move(buffer).str());
        std::unique_lock lock(mutex_);
        objects_[name] = std::move(data);
    }

    void remove(const std::string& name, const CancellationToken& cancel) override {
        cancel.throw_if_stopped("delete '" + name + "'");
        std::unique_lock lock(mutex_);
        if (objects_.erase(name) == 0) {
            throw StorageError(ErrorKind::NotFound, "delete: object not found: " + name);
        }
    }

private:
    BackendIdentity identity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const std::string>> objects_;

    std::shared_ptr<const std::string> find(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            throw StorageError(ErrorKind::NotFound, "download: object not found: " + name);
        }
        return it->second;
    }
};

// ============================================================================
// NullStorageBackend - tracks names and lengths without keeping any data
// ============================================================================

// Output buffer that accepts and drops everything
class DiscardBuf : public std::streambuf {
protected:
    int_type overflow(int_type ch) override { return traits_type::not_eof(ch); }
    std::streamsize xsputn(const char*, std::streamsize count) override { return count; }
};

// Input buffer producing `length` zero bytes
class ZeroBuf : public std::streambuf {
public:
    explicit ZeroBuf(uint64_t length) : remaining_(length), chunk_(4096, '\0') {}

protected:
    int_type underflow() override {
        if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
        if (remaining_ == 0) return traits_type::eof();
        auto n = static_cast<size_t>(std::min<uint64_t>(remaining_, chunk_.size()));
        remaining_ -= n;
        setg(chunk_.data(), chunk_.data(), chunk_.data() + n);
        return traits_type::to_int_type(*gptr());
    }

private:
    uint64_t remaining_;
    std::string chunk_;
};

class ZeroStream : public std::istream {
public:
    explicit ZeroStream(uint64_t length) : std::istream(nullptr), buf_(length) {
        rdbuf(&buf_);
    }

private:
    ZeroBuf buf_;
};

class NullStorageBackend : public StorageBackend {
public:
    NullStorageBackend() : identity_{constants::NULL_PRINCIPAL, instance_tag(this)} {}

    using StorageBackend::upload;

    std::string type_name() const override { return "null"; }

    std::string describe() const override { return "Null"; }

    BackendIdentity identity() const override { return identity_; }

    std::vector<std::string> list(const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("list");
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(lengths_.size());
        for (const auto& [name, length] : lengths_) {
            names.push_back(name);
        }
        return names;
    }

    std::unique_ptr<std::istream> download(const std::string& name,
                                           const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("download '" + name + "'");
        return std::make_unique<ZeroStream>(length_of(name));
    }

    void download(const std::string& name, std::ostream& sink,
                  const ProgressObserver& progress,
                  const CancellationToken& cancel) const override {
        cancel.throw_if_stopped("download '" + name + "'");
        auto length = length_of(name);
        ZeroStream source(length);
        ProgressTranslator translator(progress, length);
        copy_stream(source, sink, progress ? &translator : nullptr, cancel);
    }

    void upload(const std::string& name, std::istream& source,
                const ProgressObserver& progress,
                const CancellationToken& cancel,
                uint64_t expected_length) override {
        cancel.throw_if_stopped("upload '" + name + "'");
        if (name.empty()) {
            throw StorageError(ErrorKind::InvalidArgument, "invalid object name: ''");
        }

        DiscardBuf discard;
        std::ostream sink(&discard);
        ProgressTranslator translator(progress, resolve_expected_length(source, expected_length));
        auto length = copy_stream(source, sink, progress ? &translator : nullptr, cancel);

        std::unique_lock lock(mutex_);
        lengths_[name] = length;
    }

    void remove(const std::string& name, const CancellationToken& cancel) override {
        cancel.throw_if_stopped("delete '" + name + "'");
        std::unique_lock lock(mutex_);
        if (lengths_.erase(name) == 0) {
            throw StorageError(ErrorKind::NotFound, "delete: object not found: " + name);
        }
    }

private:
    BackendIdentity identity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, uint64_t> lengths_;

    uint64_t length_of(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = lengths_.find(name);
        if (it == lengths_.end()) {
            throw StorageError(ErrorKind::NotFound, "download: object not found: " + name);
        }
        return it->second;
    }
};

// ============================================================================
// StorageBackendFactory implementation
// ============================================================================

namespace {

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

int parse_seconds(const std::map<std::string, std::string>& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) return 0;
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        throw StorageError(ErrorKind::InvalidArgument,
                           "invalid value for '" + key + "': " + it->second);
    }
}

std::string param_or(const std::map<std::string, std::string>& params,
                     const std::string& key, const std::string& fallback = "") {
    auto it = params.find(key);
    return it == params.end() ? fallback : it->second;
}

} // namespace

std::unique_ptr<StorageBackend> StorageBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {

    if (type == "filesystem" || type == "local") {
        auto it = params.find("path");
        if (it == params.end() || it->second.empty()) {
            throw StorageError(ErrorKind::InvalidArgument, "filesystem backend requires 'path' config");
        }
        return create_filesystem(it->second);
    }

    if (type == "memory") {
        return create_memory(param_or(params, "principal"), param_or(params, "container"));
    }

    if (type == "null") {
        return create_null();
    }

    if (type == "bunny") {
        auto zone = param_or(params, "storage_zone");
        if (zone.empty()) {
            throw StorageError(ErrorKind::InvalidArgument, "bunny backend requires 'storage_zone' config");
        }
        return create_bunny(zone,
                            param_or(params, "access_key"),
                            param_or(params, "endpoint"),
                            parse_seconds(params, "connect_timeout_secs"),
                            parse_seconds(params, "request_timeout_secs"),
                            parse_bool(param_or(params, "verify_ssl", "true")));
    }

    throw StorageError(ErrorKind::InvalidArgument, "unknown storage backend type: " + type);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create(const BackendConfig& config) {
    auto err = config.validate();
    if (!err.empty()) {
        throw StorageError(ErrorKind::InvalidArgument, err);
    }
    return create(config.type, config.params);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_filesystem(
    const std::filesystem::path& root_path) {
    return std::make_unique<FilesystemStorageBackend>(root_path);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_memory(
    const std::string& principal,
    const std::string& container) {
    return std::make_unique<MemoryStorageBackend>(principal, container);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_null() {
    return std::make_unique<NullStorageBackend>();
}

} // namespace unistore
