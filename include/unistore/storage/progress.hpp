#pragma once

#include "unistore/core/cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>

namespace unistore {

// Backend-agnostic progress snapshot for one transfer.
struct TransferProgress {
    std::chrono::nanoseconds elapsed{0};  // Since the transfer started
    double bytes_per_second = 0;          // Over the last reporting interval
    uint64_t bytes_transferred = 0;       // Cumulative
    uint64_t expected_bytes = 0;          // 0 when unknown

    // Fraction in [0, 1]; only defined when the expected size is known.
    std::optional<double> percentage() const {
        if (expected_bytes == 0) return std::nullopt;
        return static_cast<double>(bytes_transferred) /
               static_cast<double>(expected_bytes);
    }
};

using ProgressObserver = std::function<void(const TransferProgress&)>;

// Time source for progress computation.
class ProgressClock {
public:
    virtual ~ProgressClock() = default;
    virtual std::chrono::nanoseconds now() const = 0;
};

// Monotonic clock used outside of tests.
class SteadyProgressClock : public ProgressClock {
public:
    std::chrono::nanoseconds now() const override {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch());
    }

    static std::shared_ptr<const ProgressClock> instance();
};

/// Converts a provider's native progress callbacks into TransferProgress
/// snapshots.
///
/// Two time points are kept: the start of the operation and the start of the
/// current reporting interval, which is reset after every report. Reports
/// are suppressed once the cumulative byte count reaches a known expected
/// total, so providers that fire a redundant final callback do not produce a
/// second 100% event.
class ProgressTranslator {
public:
    ProgressTranslator(ProgressObserver observer, uint64_t expected_bytes,
                       std::shared_ptr<const ProgressClock> clock =
                           SteadyProgressClock::instance());

    // Provider reported `delta` new bytes since its previous callback.
    void report_delta(uint64_t delta);

    // Provider reported a running total. Totals lower than what has
    // already been seen are ignored.
    void report_cumulative(uint64_t total);

    uint64_t bytes_transferred() const { return transferred_; }
    uint64_t expected_bytes() const { return expected_; }
    bool complete() const { return complete_; }

private:
    ProgressObserver observer_;
    uint64_t expected_;
    std::shared_ptr<const ProgressClock> clock_;
    std::chrono::nanoseconds started_;
    std::chrono::nanoseconds interval_started_;
    uint64_t transferred_ = 0;
    bool complete_ = false;
};

// Instantaneous rate in bytes/second; elapsed ticks of zero count as one.
double compute_instant_rate(uint64_t delta, std::chrono::nanoseconds elapsed);

// Remaining bytes of a seekable stream from its current position,
// or nullopt when the stream cannot seek.
std::optional<uint64_t> remaining_stream_length(std::istream& stream);

// Expected length for progress reporting: an explicit non-zero value wins,
// then the remaining length of a seekable stream, otherwise 0 (unknown).
uint64_t resolve_expected_length(std::istream& stream, uint64_t explicit_length);

// Chunked copy from source to sink. Checks the token between chunks and
// feeds the translator (may be null). Returns the number of bytes copied.
// Throws StorageError on read/write failure, cancellation or deadline.
uint64_t copy_stream(std::istream& source, std::ostream& sink,
                     ProgressTranslator* translator,
                     const CancellationToken& cancel);

} // namespace unistore
