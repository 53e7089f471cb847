#include "unistore/migration.hpp"
#include "unistore/metrics.hpp"

#include <chrono>
#include <iostream>
#include <memory>

namespace unistore {

namespace {

bool is_secret_param(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("password") != std::string::npos;
}

void log_backend(const char* role, const BackendConfig& config) {
    std::cerr << "[unistore]   " << role << "-type: " << config.type << "\n";
    for (const auto& [k, v] : config.params) {
        // Mask secrets in log output
        std::cerr << "[unistore]   " << role << "-" << k << ": "
                  << (is_secret_param(k) ? "****" : v) << "\n";
    }
}

}  // namespace

BulkSummary run_migration(const MigrationConfig& config,
                          const CancellationToken& cancel,
                          const ErrorObserver& on_error) {
    auto err = config.validate();
    if (!err.empty()) {
        throw StorageError(ErrorKind::InvalidArgument, "migration config: " + err);
    }

    bool purge = config.mode == MigrationMode::Purge;

    std::cerr << "[unistore] migration starting (" << (purge ? "purge" : "transfer") << ")\n";
    log_backend("source", config.source);
    if (!purge) {
        log_backend("destination", config.destination);
    }

    auto source = StorageBackendFactory::create(config.source);
    std::unique_ptr<StorageBackend> destination;
    if (!purge) {
        destination = StorageBackendFactory::create(config.destination);
    }

    std::unique_ptr<TransferMetrics> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<TransferMetrics>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{
                {"source", source->type_name()},
                {"destination", destination ? destination->type_name() : "none"}});
        metrics->start();
    }

    auto token = config.timeout_secs > 0
        ? cancel.with_timeout(std::chrono::seconds(config.timeout_secs))
        : cancel;

    SuccessObserver on_success;
    CountObserver on_deleted;
    ItemProgressObserver on_progress;
    ErrorObserver report_error = on_error;
    if (metrics) {
        on_success = metrics->on_transferred();
        on_deleted = metrics->on_deleted();
        on_progress = metrics->transfer_byte_counter();
        report_error = [count = metrics->on_error(), on_error](const ItemOutcome& outcome) {
            count(outcome);
            if (on_error) on_error(outcome);
        };
    }

    BulkSummary summary;
    try {
        summary = purge
            ? source->delete_all(on_deleted, report_error, token)
            : source->transfer(*destination, config.delete_source, on_success, report_error, token,
                               on_progress);
    } catch (const StorageError& e) {
        std::cerr << "[unistore] migration failed: " << error_kind_name(e.kind())
                  << ": " << e.what() << "\n";
        if (metrics) metrics->stop();
        throw;
    }

    if (metrics) {
        metrics->record_summary(summary);
        metrics->stop();
    }

    if (summary.skipped_same_store) {
        std::cerr << "[unistore] source and destination are the same store; nothing to do\n";
    } else {
        std::cerr << "[unistore] migration finished: " << summary.succeeded << "/" << summary.listed
                  << (purge ? " deleted, " : " transferred, ") << summary.failed << " failed"
                  << (summary.cancelled ? " (stopped early)" : "") << "\n";
    }
    return summary;
}

}  // namespace unistore
