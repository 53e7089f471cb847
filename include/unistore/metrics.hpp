#pragma once

#include "unistore/storage/backend.hpp"
#include "unistore/storage/progress.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace unistore {

/// Exports transfer metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families and hands out
/// observers that plug straight into StorageBackend::transfer and
/// delete_all. A background writer thread periodically serializes the
/// registry to a .prom file using atomic temp+rename.
class TransferMetrics {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    TransferMetrics(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~TransferMetrics();

    TransferMetrics(const TransferMetrics&) = delete;
    TransferMetrics& operator=(const TransferMetrics&) = delete;

    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize the registry to the .prom file now.
    /// Returns false if the file could not be written.
    bool write_file();

    // --- Observers ---

    // Item duration is measured from the previous item event (or creation)
    SuccessObserver on_transferred();
    ErrorObserver on_error();
    CountObserver on_deleted();

    // Counts bytes reported by one single-object transfer
    ProgressObserver byte_counter();

    // Counts bytes uploaded by a bulk transfer, item by item
    ItemProgressObserver transfer_byte_counter();

    /// Snapshot a finished bulk operation into the last-run gauges.
    void record_summary(const BulkSummary& summary);

    // --- Accessors ---
    prometheus::Counter& items_transferred() { return *items_transferred_; }
    prometheus::Counter& items_failed() { return *items_failed_; }
    prometheus::Counter& source_delete_failures() { return *source_delete_failures_; }
    prometheus::Counter& items_deleted() { return *items_deleted_; }
    prometheus::Counter& delete_failures() { return *delete_failures_; }
    prometheus::Counter& bytes_total() { return *bytes_total_; }
    prometheus::Histogram& item_duration() { return *item_duration_; }

private:
    void writer_loop();
    void observe_item();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* items_transferred_;
    prometheus::Counter* items_failed_;
    prometheus::Counter* source_delete_failures_;
    prometheus::Counter* items_deleted_;
    prometheus::Counter* delete_failures_;
    prometheus::Counter* bytes_total_;

    // --- Gauges ---
    prometheus::Gauge* last_run_listed_;
    prometheus::Gauge* last_run_succeeded_;
    prometheus::Gauge* last_run_failed_;
    prometheus::Gauge* last_run_cancelled_;
    prometheus::Gauge* last_run_timestamp_;

    // --- Histograms ---
    prometheus::Histogram* item_duration_;

    std::mutex item_mutex_;
    std::chrono::steady_clock::time_point last_item_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace unistore
