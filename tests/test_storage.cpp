// Test suite for the storage backends and bulk operations.
//
// Tests:
//   1. Single-object contract on filesystem, memory and null backends
//   2. Filesystem specifics (names, staging, upload_file)
//   3. Transfer engine: round trips, same-store no-op, per-item failures,
//      cancellation
//   4. delete_all
//   5. BackendConfig / MigrationConfig parsing and the factory
//   6. Metrics textfile export
//   7. HTTP adapter against an unreachable endpoint
//   8. Config-driven migration runs

#include "test_harness.hpp"

#include "unistore/metrics.hpp"
#include "unistore/migration.hpp"
#include "unistore/storage/backend.hpp"
#include "unistore/storage_config.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace unistore;

namespace {

std::string read_all(std::istream& in) {
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

std::string download_string(const StorageBackend& backend, const std::string& name) {
    auto stream = backend.download(name);
    return read_all(*stream);
}

void upload_string(StorageBackend& backend, const std::string& name, const std::string& data) {
    std::istringstream in(data);
    backend.upload(name, in);
}

std::set<std::string> listed(const StorageBackend& backend) {
    auto names = backend.list();
    return std::set<std::string>(names.begin(), names.end());
}

/// Wraps another backend and lets tests count calls or inject failures.
class InstrumentedBackend : public StorageBackend {
public:
    explicit InstrumentedBackend(StorageBackend& inner) : inner_(inner) {}

    using StorageBackend::upload;

    mutable int list_calls = 0;
    int upload_calls = 0;
    int remove_calls = 0;
    std::function<void(const std::string&)> before_upload;
    std::function<void(const std::string&)> after_upload;
    std::function<void(const std::string&)> before_remove;

    std::string type_name() const override { return inner_.type_name(); }
    std::string describe() const override { return "Instrumented " + inner_.describe(); }
    BackendIdentity identity() const override { return inner_.identity(); }

    std::vector<std::string> list(const CancellationToken& cancel) const override {
        ++list_calls;
        return inner_.list(cancel);
    }

    std::unique_ptr<std::istream> download(const std::string& name,
                                           const CancellationToken& cancel) const override {
        return inner_.download(name, cancel);
    }

    void download(const std::string& name, std::ostream& sink,
                  const ProgressObserver& progress,
                  const CancellationToken& cancel) const override {
        inner_.download(name, sink, progress, cancel);
    }

    void upload(const std::string& name, std::istream& source,
                const ProgressObserver& progress,
                const CancellationToken& cancel,
                uint64_t expected_length) override {
        ++upload_calls;
        if (before_upload) before_upload(name);
        inner_.upload(name, source, progress, cancel, expected_length);
        if (after_upload) after_upload(name);
    }

    void remove(const std::string& name, const CancellationToken& cancel) override {
        ++remove_calls;
        if (before_remove) before_remove(name);
        inner_.remove(name, cancel);
    }

private:
    StorageBackend& inner_;
};

}  // namespace

// ---------------------------------------------------------------------------
// 1. Single-object contract
// ---------------------------------------------------------------------------

static void run_contract_checks(StorageBackend& backend, bool keeps_content) {
    std::cout << "  [" << backend.describe() << "]" << std::endl;

    {
        TEST(upload_then_list_and_download);
        upload_string(backend, "alpha", "hello world");
        auto names = listed(backend);
        ASSERT_TRUE(names.count("alpha") == 1, "alpha listed");
        auto data = download_string(backend, "alpha");
        if (keeps_content) {
            ASSERT_EQ(data, "hello world", "content");
        } else {
            ASSERT_EQ(data, std::string(11, '\0'), "zero-filled content of the same length");
        }
        PASS();
    }

    {
        TEST(upload_overwrites);
        upload_string(backend, "alpha", "second version");
        auto data = download_string(backend, "alpha");
        ASSERT_EQ(data.size(), 14u, "new length");
        if (keeps_content) {
            ASSERT_EQ(data, "second version", "new content");
        }
        ASSERT_EQ(listed(backend).size(), 1u, "still one object");
        PASS();
    }

    {
        TEST(download_to_sink_reports_progress);
        std::string payload(300 * 1024, 'p');
        upload_string(backend, "big", payload);
        std::ostringstream sink;
        std::vector<TransferProgress> events;
        backend.download("big", sink, [&](const TransferProgress& p) { events.push_back(p); });
        ASSERT_EQ(sink.str().size(), payload.size(), "sink length");
        ASSERT_TRUE(!events.empty(), "progress delivered");
        ASSERT_EQ(events.back().bytes_transferred, payload.size(), "final byte count");
        ASSERT_TRUE(events.back().percentage().has_value(), "size known");
        ASSERT_EQ(*events.back().percentage(), 1.0, "ends at 100%");
        for (const auto& e : events) {
            ASSERT_TRUE(e.bytes_per_second > 0, "positive rate");
        }
        PASS();
    }

    {
        TEST(upload_reports_progress);
        std::string payload(200 * 1024, 'u');
        std::istringstream in(payload);
        std::vector<TransferProgress> events;
        backend.upload("up", in, [&](const TransferProgress& p) { events.push_back(p); });
        ASSERT_EQ(events.size(), 3u, "one event per chunk");
        ASSERT_EQ(*events.back().percentage(), 1.0, "length taken from the seekable stream");
        PASS();
    }

    {
        TEST(owned_stream_upload);
        backend.upload("owned", std::make_unique<std::istringstream>("abc"));
        ASSERT_EQ(download_string(backend, "owned").size(), 3u, "stored");
        ASSERT_EQ(thrown_kind([&] { backend.upload("null", std::unique_ptr<std::istream>()); }),
                  "InvalidArgument", "null stream");
        PASS();
    }

    {
        TEST(missing_objects_are_not_found);
        ASSERT_EQ(thrown_kind([&] { backend.download("missing"); }), "NotFound", "download");
        std::ostringstream sink;
        ASSERT_EQ(thrown_kind([&] { backend.download("missing", sink); }), "NotFound", "download to sink");
        ASSERT_TRUE(sink.str().empty(), "sink untouched");
        ASSERT_EQ(thrown_kind([&] { backend.remove("missing"); }), "NotFound", "remove");
        PASS();
    }

    {
        TEST(remove_deletes);
        backend.remove("alpha");
        ASSERT_TRUE(listed(backend).count("alpha") == 0, "alpha gone");
        ASSERT_EQ(thrown_kind([&] { backend.download("alpha"); }), "NotFound", "download after remove");
        PASS();
    }

    {
        TEST(cancelled_token_has_no_side_effects);
        CancellationSource source;
        source.cancel();
        auto token = source.token();
        auto before = listed(backend);
        std::istringstream in("never stored");
        ASSERT_EQ(thrown_kind([&] { backend.upload("cancelled", in, {}, token); }), "Cancelled", "upload");
        ASSERT_EQ(thrown_kind([&] { backend.remove("big", token); }), "Cancelled", "remove");
        ASSERT_EQ(thrown_kind([&] { backend.list(token); }), "Cancelled", "list");
        ASSERT_EQ(thrown_kind([&] { backend.download("big", token); }), "Cancelled", "download");
        ASSERT_TRUE(listed(backend) == before, "store unchanged");
        PASS();
    }

    {
        TEST(expired_deadline_is_timeout);
        CancellationSource source(std::chrono::nanoseconds(0));
        ASSERT_EQ(thrown_kind([&] { backend.list(source.token()); }), "Timeout", "list");
        PASS();
    }

    {
        TEST(cleanup);
        for (const auto& name : backend.list()) {
            backend.remove(name);
        }
        ASSERT_TRUE(backend.list().empty(), "empty");
        PASS();
    }
}

static void test_backend_contract() {
    std::cout << "\n=== Backend Contract ===" << std::endl;

    auto dir = make_temp_dir("unistore-contract");
    auto fs_backend = StorageBackendFactory::create_filesystem(dir);
    run_contract_checks(*fs_backend, true);

    auto memory = StorageBackendFactory::create_memory();
    run_contract_checks(*memory, true);

    auto null_backend = StorageBackendFactory::create_null();
    run_contract_checks(*null_backend, false);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// 2. Filesystem specifics
// ---------------------------------------------------------------------------

static void test_filesystem_backend() {
    std::cout << "\n=== Filesystem Backend ===" << std::endl;

    auto dir = make_temp_dir("unistore-fs");
    auto backend = StorageBackendFactory::create_filesystem(dir);

    {
        TEST(objects_are_plain_files);
        upload_string(*backend, "report.txt", "contents");
        ASSERT_EQ(read_file(dir / "report.txt"), "contents", "file on disk");
        PASS();
    }

    {
        TEST(staging_directory_is_not_listed);
        ASSERT_TRUE(fs::is_directory(dir / ".unistore-staging"), "staging dir exists");
        auto names = listed(*backend);
        ASSERT_EQ(names.size(), 1u, "only the object");
        ASSERT_TRUE(fs::is_empty(dir / ".unistore-staging"), "no leftover staging files");
        PASS();
    }

    {
        TEST(invalid_names_rejected);
        ASSERT_EQ(thrown_kind([&] { upload_string(*backend, "", "x"); }), "InvalidArgument", "empty");
        ASSERT_EQ(thrown_kind([&] { upload_string(*backend, "..", "x"); }), "InvalidArgument", "dot-dot");
        ASSERT_EQ(thrown_kind([&] { upload_string(*backend, "../escape", "x"); }), "InvalidArgument", "traversal");
        ASSERT_EQ(thrown_kind([&] { upload_string(*backend, "a/b", "x"); }), "InvalidArgument", "separator");
        ASSERT_EQ(thrown_kind([&] { upload_string(*backend, ".unistore-staging", "x"); }),
                  "InvalidArgument", "staging name");
        ASSERT_TRUE(!fs::exists(dir.parent_path() / "escape"), "nothing escaped the root");
        PASS();
    }

    {
        TEST(long_names_fit_staging);
        std::string name(250, 'n');
        upload_string(*backend, name, "long");
        ASSERT_EQ(download_string(*backend, name), "long", "round trip");
        backend->remove(name);
        ASSERT_TRUE(fs::is_empty(dir / ".unistore-staging"), "no leftover staging files");
        PASS();
    }

    {
        TEST(identity_and_describe);
        auto again = StorageBackendFactory::create_filesystem(dir / "." );
        ASSERT_TRUE(backend->same_store(*again), "same root is same store");
        auto other_dir = make_temp_dir("unistore-fs-other");
        auto other = StorageBackendFactory::create_filesystem(other_dir);
        ASSERT_TRUE(!backend->same_store(*other), "different root");
        ASSERT_EQ(backend->describe().rfind("Filesystem ", 0), 0u, "describe prefix");
        ASSERT_EQ(backend->type_name(), "filesystem", "type name");
        fs::remove_all(other_dir);
        PASS();
    }

    {
        TEST(upload_file_keeps_or_deletes_source);
        auto src_dir = make_temp_dir("unistore-src");
        write_file(src_dir / "keep.bin", "keep me");
        write_file(src_dir / "move.bin", "move me");

        backend->upload_file("keep.bin", src_dir / "keep.bin", false);
        backend->upload_file("move.bin", src_dir / "move.bin", true);

        ASSERT_TRUE(fs::exists(src_dir / "keep.bin"), "kept");
        ASSERT_TRUE(!fs::exists(src_dir / "move.bin"), "deleted after upload");
        ASSERT_EQ(download_string(*backend, "keep.bin"), "keep me", "kept content");
        ASSERT_EQ(download_string(*backend, "move.bin"), "move me", "moved content");

        ASSERT_EQ(thrown_kind([&] { backend->upload_file("x", src_dir / "absent", false); }),
                  "InvalidArgument", "missing local file");
        fs::remove_all(src_dir);
        PASS();
    }

    {
        TEST(upload_file_onto_itself_is_noop);
        backend->upload_file("report.txt", dir / "report.txt", true);
        ASSERT_EQ(download_string(*backend, "report.txt"), "contents", "object survives");
        PASS();
    }

    {
        TEST(upload_file_progress_knows_length);
        auto src_dir = make_temp_dir("unistore-src");
        write_file(src_dir / "data.bin", std::string(1000, 'd'));
        std::vector<TransferProgress> events;
        backend->upload_file("data.bin", src_dir / "data.bin", false,
                             [&](const TransferProgress& p) { events.push_back(p); });
        ASSERT_TRUE(!events.empty(), "progress delivered");
        ASSERT_EQ(events.back().expected_bytes, 1000u, "expected length");
        fs::remove_all(src_dir);
        PASS();
    }

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// 3. Transfer engine
// ---------------------------------------------------------------------------

static void seed(StorageBackend& backend, int count) {
    for (int i = 0; i < count; ++i) {
        upload_string(backend, "object-" + std::to_string(i), "payload-" + std::to_string(i));
    }
}

static void test_transfer() {
    std::cout << "\n=== Transfer ===" << std::endl;

    {
        TEST(move_there_and_back);
        auto dir = make_temp_dir("unistore-transfer");
        auto a = StorageBackendFactory::create_memory("alice", "bucket-a");
        auto b = StorageBackendFactory::create_filesystem(dir);
        seed(*a, 3);

        std::vector<std::string> moved;
        auto summary = a->transfer(*b, true, [&](const std::string& n) { moved.push_back(n); });
        ASSERT_EQ(summary.listed, 3u, "listed");
        ASSERT_EQ(summary.succeeded, 3u, "succeeded");
        ASSERT_EQ(summary.failed, 0u, "failed");
        ASSERT_EQ(moved.size(), 3u, "success callbacks");
        ASSERT_TRUE(a->list().empty(), "source emptied");
        ASSERT_EQ(listed(*b).size(), 3u, "destination filled");

        summary = b->transfer(*a, false);
        ASSERT_EQ(summary.succeeded, 3u, "copied back");
        ASSERT_EQ(listed(*b).size(), 3u, "filesystem unchanged");
        ASSERT_TRUE(listed(*a) == listed(*b), "same names in both stores");
        for (int i = 0; i < 3; ++i) {
            auto name = "object-" + std::to_string(i);
            auto expected = "payload-" + std::to_string(i);
            ASSERT_EQ(download_string(*a, name), expected, "content survived");
            ASSERT_EQ(download_string(*b, name), expected, "destination content");
        }
        fs::remove_all(dir);
        PASS();
    }

    {
        TEST(copy_keeps_source);
        auto a = StorageBackendFactory::create_memory();
        auto b = StorageBackendFactory::create_memory();
        seed(*a, 2);
        auto summary = a->transfer(*b, false);
        ASSERT_EQ(summary.succeeded, 2u, "copied");
        ASSERT_EQ(listed(*a).size(), 2u, "source intact");
        ASSERT_EQ(listed(*b).size(), 2u, "destination filled");
        PASS();
    }

    {
        TEST(same_store_makes_no_calls);
        auto inner = StorageBackendFactory::create_memory("p", "c");
        seed(*inner, 2);
        InstrumentedBackend source(*inner);
        auto alias = StorageBackendFactory::create_memory("p", "c");
        InstrumentedBackend destination(*alias);

        auto summary = source.transfer(destination, true);
        ASSERT_TRUE(summary.skipped_same_store, "skipped");
        ASSERT_TRUE(summary.nothing_happened(), "nothing happened");
        ASSERT_EQ(source.list_calls, 0, "no list");
        ASSERT_EQ(source.remove_calls, 0, "no remove");
        ASSERT_EQ(destination.upload_calls, 0, "no upload");
        ASSERT_EQ(listed(*inner).size(), 2u, "data intact");
        PASS();
    }

    {
        TEST(transfer_to_itself_is_noop);
        auto a = StorageBackendFactory::create_memory();
        seed(*a, 2);
        auto summary = a->transfer(*a, true);
        ASSERT_TRUE(summary.skipped_same_store, "skipped");
        ASSERT_EQ(listed(*a).size(), 2u, "data intact");
        PASS();
    }

    {
        TEST(copy_failure_keeps_source_and_continues);
        auto a = StorageBackendFactory::create_memory();
        auto inner = StorageBackendFactory::create_memory();
        InstrumentedBackend destination(*inner);
        destination.before_upload = [](const std::string& name) {
            if (name == "object-1") throw StorageError(ErrorKind::TemporaryFailure, "throttled");
        };
        seed(*a, 3);

        std::vector<ItemOutcome> errors;
        auto summary = a->transfer(destination, true, {},
                                   [&](const ItemOutcome& o) { errors.push_back(o); });
        ASSERT_EQ(summary.succeeded, 2u, "others moved");
        ASSERT_EQ(summary.failed, 1u, "one failed");
        ASSERT_EQ(errors.size(), 1u, "one error reported");
        ASSERT_EQ(errors[0].name, "object-1", "failed name");
        ASSERT_EQ(std::string(item_stage_name(errors[0].stage)), "copy", "stage");
        ASSERT_EQ(std::string(error_kind_name(errors[0].kind)), "TemporaryFailure", "kind");
        ASSERT_TRUE(listed(*a) == std::set<std::string>{"object-1"}, "failed object stays at source");
        PASS();
    }

    {
        TEST(delete_source_failure_is_reported_separately);
        auto inner = StorageBackendFactory::create_memory();
        InstrumentedBackend source(*inner);
        source.before_remove = [](const std::string&) {
            throw StorageError(ErrorKind::Unauthorized, "read-only credentials");
        };
        seed(*inner, 3);
        auto destination = StorageBackendFactory::create_memory();

        std::vector<ItemOutcome> errors;
        int successes = 0;
        auto summary = source.transfer(*destination, true,
                                       [&](const std::string&) { ++successes; },
                                       [&](const ItemOutcome& o) { errors.push_back(o); });
        ASSERT_EQ(successes, 0, "not reported as success");
        ASSERT_EQ(summary.succeeded, 0u, "summary succeeded");
        ASSERT_EQ(summary.failed, 3u, "summary failed");
        ASSERT_EQ(errors.size(), 3u, "errors reported");
        for (const auto& e : errors) {
            ASSERT_EQ(std::string(item_stage_name(e.stage)), "delete-source", "stage");
            ASSERT_EQ(std::string(error_kind_name(e.kind)), "Unauthorized", "kind");
        }
        ASSERT_EQ(listed(*destination).size(), 3u, "copies exist");
        ASSERT_EQ(listed(*inner).size(), 3u, "sources remain");
        PASS();
    }

    {
        TEST(cancellation_stops_between_items);
        auto a = StorageBackendFactory::create_memory();
        auto b = StorageBackendFactory::create_memory();
        seed(*a, 5);
        CancellationSource cancel;
        auto summary = a->transfer(*b, true,
                                   [&](const std::string&) { cancel.cancel(); },
                                   {}, cancel.token());
        ASSERT_TRUE(summary.cancelled, "cancelled");
        ASSERT_EQ(summary.succeeded, 1u, "one item done");
        ASSERT_EQ(listed(*b).size(), 1u, "one copy");
        ASSERT_EQ(listed(*a).size(), 4u, "rest untouched");
        PASS();
    }

    {
        TEST(stop_between_copy_and_prune_is_reported);
        auto a = StorageBackendFactory::create_memory();
        seed(*a, 1);
        auto inner = StorageBackendFactory::create_memory();
        CancellationSource cancel;
        InstrumentedBackend destination(*inner);
        destination.after_upload = [&](const std::string&) { cancel.cancel(); };

        std::vector<ItemOutcome> errors;
        int successes = 0;
        auto summary = a->transfer(destination, true,
                                   [&](const std::string&) { ++successes; },
                                   [&](const ItemOutcome& o) { errors.push_back(o); },
                                   cancel.token());
        ASSERT_EQ(listed(*inner).size(), 1u, "copy written");
        ASSERT_EQ(listed(*a).size(), 1u, "source not pruned");
        ASSERT_EQ(successes, 0, "not a success");
        ASSERT_EQ(errors.size(), 1u, "reported");
        ASSERT_EQ(std::string(item_stage_name(errors[0].stage)), "delete-source", "stage");
        ASSERT_EQ(std::string(error_kind_name(errors[0].kind)), "Cancelled", "kind");
        ASSERT_EQ(summary.failed, 1u, "counted");
        ASSERT_TRUE(summary.cancelled, "cancelled");
        ASSERT_TRUE(!summary.nothing_happened(), "partial work visible");
        PASS();
    }

    {
        TEST(item_progress_names_each_item);
        auto a = StorageBackendFactory::create_memory();
        auto b = StorageBackendFactory::create_memory();
        seed(*a, 3);
        std::map<std::string, uint64_t> bytes;
        a->transfer(*b, false, {}, {}, {},
                    [&](const std::string& name, const TransferProgress& p) {
                        bytes[name] = p.bytes_transferred;
                    });
        ASSERT_EQ(bytes.size(), 3u, "every item");
        ASSERT_EQ(bytes["object-2"], std::string("payload-2").size(), "item length");
        PASS();
    }

    {
        TEST(cancelled_before_listing_throws);
        auto a = StorageBackendFactory::create_memory();
        auto b = StorageBackendFactory::create_memory();
        seed(*a, 2);
        CancellationSource cancel;
        cancel.cancel();
        ASSERT_EQ(thrown_kind([&] { a->transfer(*b, true, {}, {}, cancel.token()); }),
                  "Cancelled", "kind");
        ASSERT_TRUE(b->list().empty(), "nothing copied");
        PASS();
    }

    {
        TEST(null_backend_as_destination);
        auto a = StorageBackendFactory::create_memory();
        auto sink = StorageBackendFactory::create_null();
        seed(*a, 3);
        auto summary = a->transfer(*sink, false);
        ASSERT_EQ(summary.succeeded, 3u, "transferred");
        ASSERT_EQ(download_string(*sink, "object-0").size(), std::string("payload-0").size(),
                  "length tracked");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. delete_all
// ---------------------------------------------------------------------------

static void test_delete_all() {
    std::cout << "\n=== Delete All ===" << std::endl;

    {
        TEST(counts_every_delete);
        auto dir = make_temp_dir("unistore-delete");
        auto backend = StorageBackendFactory::create_filesystem(dir);
        seed(*backend, 5);
        std::vector<uint64_t> counts;
        auto summary = backend->delete_all([&](uint64_t n) { counts.push_back(n); });
        ASSERT_EQ(summary.succeeded, 5u, "deleted");
        ASSERT_TRUE((counts == std::vector<uint64_t>{1, 2, 3, 4, 5}), "running count");
        ASSERT_TRUE(backend->list().empty(), "empty");
        fs::remove_all(dir);
        PASS();
    }

    {
        TEST(empty_store);
        auto backend = StorageBackendFactory::create_memory();
        int calls = 0;
        auto summary = backend->delete_all([&](uint64_t) { ++calls; });
        ASSERT_TRUE(summary.nothing_happened(), "nothing happened");
        ASSERT_EQ(calls, 0, "no progress");
        PASS();
    }

    {
        TEST(failures_are_reported_and_skipped);
        auto inner = StorageBackendFactory::create_memory();
        InstrumentedBackend backend(*inner);
        backend.before_remove = [](const std::string& name) {
            if (name == "object-2") throw StorageError(ErrorKind::Unauthorized, "locked");
        };
        seed(*inner, 4);
        std::vector<ItemOutcome> errors;
        uint64_t last = 0;
        auto summary = backend.delete_all([&](uint64_t n) { last = n; },
                                          [&](const ItemOutcome& o) { errors.push_back(o); });
        ASSERT_EQ(summary.succeeded, 3u, "others deleted");
        ASSERT_EQ(summary.failed, 1u, "one failed");
        ASSERT_EQ(last, 3u, "count only covers successes");
        ASSERT_EQ(errors.size(), 1u, "error reported");
        ASSERT_EQ(std::string(item_stage_name(errors[0].stage)), "delete", "stage");
        ASSERT_TRUE(listed(*inner) == std::set<std::string>{"object-2"}, "locked object remains");
        PASS();
    }

    {
        TEST(cancellation_stops_deleting);
        auto backend = StorageBackendFactory::create_memory();
        seed(*backend, 4);
        CancellationSource cancel;
        auto summary = backend->delete_all([&](uint64_t n) { if (n == 2) cancel.cancel(); },
                                           {}, cancel.token());
        ASSERT_TRUE(summary.cancelled, "cancelled");
        ASSERT_EQ(summary.succeeded, 2u, "two deleted");
        ASSERT_EQ(listed(*backend).size(), 2u, "two remain");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Configuration and factory
// ---------------------------------------------------------------------------

static void test_config() {
    std::cout << "\n=== Configuration ===" << std::endl;

    {
        TEST(backend_config_validation);
        BackendConfig c;
        ASSERT_NOT_EMPTY(c.validate(), "type required");
        c.type = "filesystem";
        ASSERT_NOT_EMPTY(c.validate(), "path required");
        c.params["path"] = "/tmp";
        ASSERT_EMPTY(c.validate(), "filesystem ok");

        BackendConfig m{"memory", {}};
        ASSERT_EMPTY(m.validate(), "memory needs nothing");
        BackendConfig n{"null", {}};
        ASSERT_EMPTY(n.validate(), "null needs nothing");

        BackendConfig b{"bunny", {{"storage_zone", "zone"}}};
        ASSERT_NOT_EMPTY(b.validate(), "access key required");
        b.params["access_key"] = "secret";
        ASSERT_EMPTY(b.validate(), "bunny ok");
        b.params["connect_timeout_secs"] = "soon";
        ASSERT_NOT_EMPTY(b.validate(), "timeout must be numeric");

        BackendConfig u{"tape", {}};
        ASSERT_NOT_EMPTY(u.validate(), "unknown type");
        PASS();
    }

    {
        TEST(json_loading);
        auto dir = make_temp_dir("unistore-config");
        write_file(dir / "migrate.json", R"({
            "mode": "transfer",
            "delete_source": true,
            "metrics_interval": 5,
            "source": {"type": "memory", "principal": "p", "container": "c"},
            "destination": {"type": "bunny", "storage_zone": "z", "access_key": "k",
                            "verify_ssl": false, "request_timeout_secs": 30}
        })");
        MigrationConfig config;
        ASSERT_TRUE(config.load_json(dir / "migrate.json"), "loaded");
        ASSERT_TRUE(config.delete_source, "delete_source");
        ASSERT_EQ(config.metrics_interval_secs, 5u, "interval");
        ASSERT_EQ(config.source.params["container"], "c", "source container");
        ASSERT_EQ(config.destination.params["verify_ssl"], "false", "bool kept as text");
        ASSERT_EQ(config.destination.params["request_timeout_secs"], "30", "number kept as text");
        ASSERT_EMPTY(config.validate(), "valid");

        write_file(dir / "broken.json", "{ not json");
        MigrationConfig broken;
        ASSERT_TRUE(!broken.load_json(dir / "broken.json"), "parse error reported");
        ASSERT_TRUE(!broken.load_json(dir / "absent.json"), "missing file reported");
        fs::remove_all(dir);
        PASS();
    }

    {
        TEST(purge_mode_validation);
        MigrationConfig config;
        config.mode = MigrationMode::Purge;
        config.source = {"memory", {}};
        ASSERT_EMPTY(config.validate(), "no destination needed");
        config.delete_source = true;
        ASSERT_NOT_EMPTY(config.validate(), "delete_source conflicts with purge");
        PASS();
    }

    {
        TEST(factory);
        ASSERT_EQ(thrown_kind([] { StorageBackendFactory::create("tape", {}); }),
                  "InvalidArgument", "unknown type");
        ASSERT_EQ(thrown_kind([] { StorageBackendFactory::create("filesystem", {}); }),
                  "InvalidArgument", "missing path");
        ASSERT_EQ(thrown_kind([] { StorageBackendFactory::create(BackendConfig{"bunny", {}}); }),
                  "InvalidArgument", "validated before creation");

        auto a = StorageBackendFactory::create("memory", {{"principal", "p"}, {"container", "c"}});
        auto b = StorageBackendFactory::create(BackendConfig{"memory", {{"principal", "p"}, {"container", "c"}}});
        ASSERT_TRUE(a->same_store(*b), "same identity");
        ASSERT_EQ(a->describe(), "Memory p/c", "describe");

        auto x = StorageBackendFactory::create_memory();
        auto y = StorageBackendFactory::create_memory();
        ASSERT_TRUE(!x->same_store(*y), "anonymous stores are distinct");
        ASSERT_TRUE(!StorageBackendFactory::create_null()->same_store(*StorageBackendFactory::create_null()),
                    "null stores are distinct");
        ASSERT_EQ(StorageBackendFactory::create_null()->describe(), "Null", "null describe");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    {
        TEST(observers_feed_counters_and_textfile);
        auto dir = make_temp_dir("unistore-metrics");
        auto prom = dir / "unistore.prom";
        TransferMetrics metrics(prom, std::chrono::seconds(60), {{"job", "test"}});

        auto a = StorageBackendFactory::create_memory();
        auto inner = StorageBackendFactory::create_memory();
        InstrumentedBackend b(*inner);
        b.before_upload = [](const std::string& name) {
            if (name == "object-0") throw StorageError(ErrorKind::Internal, "disk full");
        };
        seed(*a, 3);

        auto summary = a->transfer(b, false, metrics.on_transferred(), metrics.on_error(), {},
                                   metrics.transfer_byte_counter());
        metrics.record_summary(summary);
        ASSERT_EQ(metrics.bytes_total().Value(),
                  static_cast<double>(std::string("payload-1payload-2").size()),
                  "bytes of the two copied items");

        auto purge = a->delete_all(metrics.on_deleted(), metrics.on_error());
        ASSERT_EQ(purge.succeeded, 3u, "purged");

        std::istringstream in(std::string(4096, 'b'));
        a->upload("counted", in, metrics.byte_counter());

        ASSERT_EQ(metrics.items_transferred().Value(), 2.0, "transferred counter");
        ASSERT_EQ(metrics.items_failed().Value(), 1.0, "failure counter");
        ASSERT_EQ(metrics.items_deleted().Value(), 3.0, "deleted counter");
        ASSERT_EQ(metrics.bytes_total().Value(), 4096.0 + 18.0, "bytes counter");

        ASSERT_TRUE(metrics.write_file(), "written");
        auto text = read_file(prom);
        ASSERT_TRUE(text.find("unistore_transfer_items_total") != std::string::npos, "transfer family");
        ASSERT_TRUE(text.find("unistore_deleted_items_total") != std::string::npos, "delete family");
        ASSERT_TRUE(text.find("unistore_item_duration_seconds") != std::string::npos, "histogram");
        ASSERT_TRUE(text.find("job=\"test\"") != std::string::npos, "constant label");
        ASSERT_TRUE(!fs::exists(dir / "unistore.prom.tmp"), "temp file renamed");
        fs::remove_all(dir);
        PASS();
    }

    {
        TEST(stop_writes_final_snapshot);
        auto dir = make_temp_dir("unistore-metrics");
        auto prom = dir / "final.prom";
        {
            TransferMetrics metrics(prom, std::chrono::seconds(60), {});
            metrics.start();
            metrics.items_transferred().Increment();
            metrics.stop();
        }
        ASSERT_TRUE(fs::exists(prom), "file written on stop");
        fs::remove_all(dir);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. HTTP adapter
// ---------------------------------------------------------------------------

static void test_bunny_backend() {
    std::cout << "\n=== HTTP Adapter ===" << std::endl;

    {
        TEST(identity_and_describe);
        auto a = StorageBackendFactory::create_bunny("zone-a", "key", "http://127.0.0.1:1/");
        auto b = StorageBackendFactory::create_bunny("zone-a", "other-key", "http://127.0.0.1:1");
        auto c = StorageBackendFactory::create_bunny("zone-b", "key", "http://127.0.0.1:1");
        ASSERT_EQ(a->describe(), "BunnyCDN zone-a", "describe");
        ASSERT_EQ(a->type_name(), "bunny", "type");
        ASSERT_TRUE(a->same_store(*b), "same zone, same endpoint");
        ASSERT_TRUE(!a->same_store(*c), "different zone");
        PASS();
    }

    {
        TEST(unreachable_endpoint_is_temporary_failure);
        auto backend = StorageBackendFactory::create_bunny("zone", "key", "http://127.0.0.1:1", 2, 5);
        ASSERT_EQ(thrown_kind([&] { backend->list(); }), "TemporaryFailure", "list");
        ASSERT_EQ(thrown_kind([&] { backend->download("x"); }), "TemporaryFailure", "download");
        ASSERT_EQ(thrown_kind([&] { upload_string(*backend, "x", "data"); }), "TemporaryFailure", "upload");
        ASSERT_EQ(thrown_kind([&] { backend->remove("x"); }), "TemporaryFailure", "remove");
        PASS();
    }

    {
        TEST(cancelled_before_request);
        auto backend = StorageBackendFactory::create_bunny("zone", "key", "http://127.0.0.1:1", 2, 5);
        CancellationSource cancel;
        cancel.cancel();
        ASSERT_EQ(thrown_kind([&] { backend->list(cancel.token()); }), "Cancelled", "list");
        PASS();
    }

    {
        TEST(transfer_from_unreachable_source_propagates_listing_failure);
        auto source = StorageBackendFactory::create_bunny("zone", "key", "http://127.0.0.1:1", 2, 5);
        auto destination = StorageBackendFactory::create_memory();
        ASSERT_EQ(thrown_kind([&] { source->transfer(*destination, true); }), "TemporaryFailure", "kind");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Migration runs
// ---------------------------------------------------------------------------

// Value of the first sample of `family` in a textfile, or -1 when absent
static double metric_value(const std::string& text, const std::string& family) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind(family, 0) != 0 || line.size() <= family.size()) continue;
        char next = line[family.size()];
        if (next != '{' && next != ' ') continue;
        return std::stod(line.substr(line.rfind(' ') + 1));
    }
    return -1.0;
}

static void test_migration() {
    std::cout << "\n=== Migration ===" << std::endl;

    {
        TEST(transfer_between_directories_with_metrics);
        auto src = make_temp_dir("unistore-mig-src");
        auto dst = make_temp_dir("unistore-mig-dst");
        auto out = make_temp_dir("unistore-mig-out");
        write_file(src / "one", "1");
        write_file(src / "two", "22");

        MigrationConfig config;
        config.source = {"filesystem", {{"path", src.string()}}};
        config.destination = {"filesystem", {{"path", dst.string()}}};
        config.delete_source = true;
        config.metrics_file = out / "migrate.prom";

        auto summary = run_migration(config);
        ASSERT_EQ(summary.succeeded, 2u, "moved");
        ASSERT_EQ(read_file(dst / "two"), "22", "content");
        ASSERT_TRUE(!fs::exists(src / "one") && !fs::exists(src / "two"), "source pruned");
        ASSERT_TRUE(fs::exists(config.metrics_file), "metrics written");
        auto text = read_file(config.metrics_file);
        ASSERT_EQ(metric_value(text, "unistore_last_run_succeeded"), 2.0, "summary gauge");
        ASSERT_EQ(metric_value(text, "unistore_transfer_bytes_total"), 3.0, "bytes counted");

        fs::remove_all(src);
        fs::remove_all(dst);
        fs::remove_all(out);
        PASS();
    }

    {
        TEST(purge_mode_empties_source);
        auto src = make_temp_dir("unistore-mig-purge");
        write_file(src / "a", "a");
        write_file(src / "b", "b");
        MigrationConfig config;
        config.mode = MigrationMode::Purge;
        config.source = {"filesystem", {{"path", src.string()}}};
        auto summary = run_migration(config);
        ASSERT_EQ(summary.succeeded, 2u, "deleted");
        ASSERT_TRUE(!fs::exists(src / "a") && !fs::exists(src / "b"), "files gone");
        fs::remove_all(src);
        PASS();
    }

    {
        TEST(invalid_config_rejected);
        MigrationConfig config;
        ASSERT_EQ(thrown_kind([&] { run_migration(config); }), "InvalidArgument", "no source");
        config.source = {"memory", {}};
        ASSERT_EQ(thrown_kind([&] { run_migration(config); }), "InvalidArgument", "no destination");
        PASS();
    }

    {
        TEST(caller_cancellation_reaches_listing);
        auto src = make_temp_dir("unistore-mig-cancel");
        write_file(src / "a", "a");
        MigrationConfig config;
        config.source = {"filesystem", {{"path", src.string()}}};
        config.destination = {"null", {}};
        config.timeout_secs = 3600;
        CancellationSource cancel;
        cancel.cancel();
        ASSERT_EQ(thrown_kind([&] { run_migration(config, cancel.token()); }), "Cancelled", "kind");
        ASSERT_TRUE(fs::exists(src / "a"), "source untouched");
        fs::remove_all(src);
        PASS();
    }
}

int main() {
    std::cout << "unistore storage test suite" << std::endl;
    std::cout << "===========================" << std::endl;

    test_backend_contract();
    test_filesystem_backend();
    test_transfer();
    test_delete_all();
    test_config();
    test_metrics();
    test_bunny_backend();
    test_migration();

    return report_results();
}
