#include "unistore/metrics.hpp"

#include <fstream>
#include <iostream>
#include <prometheus/text_serializer.h>

namespace unistore {

TransferMetrics::TransferMetrics(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>())
    , last_item_(std::chrono::steady_clock::now()) {

    // --- Counters ---

    auto& transfer_family = prometheus::BuildCounter()
        .Name("unistore_transfer_items_total")
        .Help("Objects processed by transfer")
        .Labels(labels)
        .Register(*registry_);
    items_transferred_ = &transfer_family.Add({{"result", "success"}});
    items_failed_ = &transfer_family.Add({{"result", "failure"}});

    source_delete_failures_ = &prometheus::BuildCounter()
        .Name("unistore_source_delete_failures_total")
        .Help("Objects copied to the destination whose source could not be deleted")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& delete_family = prometheus::BuildCounter()
        .Name("unistore_deleted_items_total")
        .Help("Objects processed by delete_all")
        .Labels(labels)
        .Register(*registry_);
    items_deleted_ = &delete_family.Add({{"result", "success"}});
    delete_failures_ = &delete_family.Add({{"result", "failure"}});

    bytes_total_ = &prometheus::BuildCounter()
        .Name("unistore_transfer_bytes_total")
        .Help("Bytes moved by single-object uploads and downloads")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    last_run_listed_ = &gauge_reg("unistore_last_run_listed", "Objects listed by the last bulk operation");
    last_run_succeeded_ = &gauge_reg("unistore_last_run_succeeded", "Objects completed by the last bulk operation");
    last_run_failed_ = &gauge_reg("unistore_last_run_failed", "Objects failed in the last bulk operation");
    last_run_cancelled_ = &gauge_reg("unistore_last_run_cancelled", "1 if the last bulk operation stopped early");
    last_run_timestamp_ = &gauge_reg("unistore_last_run_timestamp_seconds", "Completion time of the last bulk operation");

    // --- Histograms ---

    item_duration_ = &prometheus::BuildHistogram()
        .Name("unistore_item_duration_seconds")
        .Help("Time spent per object in bulk operations")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 300});
}

TransferMetrics::~TransferMetrics() {
    stop();
}

void TransferMetrics::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&TransferMetrics::writer_loop, this);
}

void TransferMetrics::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        // Final snapshot
        write_file();
    }
}

void TransferMetrics::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

bool TransferMetrics::write_file() {
    if (prom_file_path_.empty()) return false;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        std::cerr << "[metrics] cannot write " << tmp_path << "\n";
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        std::cerr << "[metrics] short write to " << tmp_path << "\n";
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        std::cerr << "[metrics] rename to " << prom_file_path_ << " failed: " << ec.message() << "\n";
        return false;
    }
    return true;
}

void TransferMetrics::observe_item() {
    std::lock_guard lock(item_mutex_);
    auto now = std::chrono::steady_clock::now();
    item_duration_->Observe(std::chrono::duration<double>(now - last_item_).count());
    last_item_ = now;
}

SuccessObserver TransferMetrics::on_transferred() {
    return [this](const std::string&) {
        items_transferred_->Increment();
        observe_item();
    };
}

ErrorObserver TransferMetrics::on_error() {
    return [this](const ItemOutcome& outcome) {
        switch (outcome.stage) {
            case ItemStage::Copy:
                items_failed_->Increment();
                break;
            case ItemStage::DeleteSource:
                source_delete_failures_->Increment();
                break;
            case ItemStage::Delete:
                delete_failures_->Increment();
                break;
        }
        observe_item();
    };
}

CountObserver TransferMetrics::on_deleted() {
    return [this](uint64_t) {
        items_deleted_->Increment();
        observe_item();
    };
}

ProgressObserver TransferMetrics::byte_counter() {
    auto seen = std::make_shared<uint64_t>(0);
    return [this, seen](const TransferProgress& progress) {
        if (progress.bytes_transferred > *seen) {
            bytes_total_->Increment(static_cast<double>(progress.bytes_transferred - *seen));
            *seen = progress.bytes_transferred;
        }
    };
}

ItemProgressObserver TransferMetrics::transfer_byte_counter() {
    struct Position {
        std::string name;
        uint64_t seen = 0;
    };
    auto position = std::make_shared<Position>();
    return [this, position](const std::string& name, const TransferProgress& progress) {
        if (name != position->name) {
            position->name = name;
            position->seen = 0;
        }
        if (progress.bytes_transferred > position->seen) {
            bytes_total_->Increment(static_cast<double>(progress.bytes_transferred - position->seen));
            position->seen = progress.bytes_transferred;
        }
    };
}

void TransferMetrics::record_summary(const BulkSummary& summary) {
    last_run_listed_->Set(static_cast<double>(summary.listed));
    last_run_succeeded_->Set(static_cast<double>(summary.succeeded));
    last_run_failed_->Set(static_cast<double>(summary.failed));
    last_run_cancelled_->Set(summary.cancelled ? 1.0 : 0.0);
    last_run_timestamp_->SetToCurrentTime();
}

}  // namespace unistore
