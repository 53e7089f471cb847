#include "unistore/storage/progress.hpp"
#include "unistore/core/constants.hpp"

#include <vector>

namespace unistore {

std::shared_ptr<const ProgressClock> SteadyProgressClock::instance() {
    static const auto clock = std::make_shared<const SteadyProgressClock>();
    return clock;
}

ProgressTranslator::ProgressTranslator(ProgressObserver observer,
                                       uint64_t expected_bytes,
                                       std::shared_ptr<const ProgressClock> clock)
    : observer_(std::move(observer))
    , expected_(expected_bytes)
    , clock_(std::move(clock))
    , started_(clock_->now())
    , interval_started_(started_) {}

void ProgressTranslator::report_delta(uint64_t delta) {
    if (complete_ || delta == 0) return;

    auto now = clock_->now();
    transferred_ += delta;

    TransferProgress snapshot;
    snapshot.elapsed = now - started_;
    snapshot.bytes_per_second = compute_instant_rate(delta, now - interval_started_);
    snapshot.bytes_transferred = transferred_;
    snapshot.expected_bytes = expected_;

    interval_started_ = now;
    if (expected_ > 0 && transferred_ >= expected_) {
        complete_ = true;
    }

    if (observer_) {
        observer_(snapshot);
    }
}

void ProgressTranslator::report_cumulative(uint64_t total) {
    if (total <= transferred_) return;
    report_delta(total - transferred_);
}

double compute_instant_rate(uint64_t delta, std::chrono::nanoseconds elapsed) {
    constexpr double ticks_per_second =
        static_cast<double>(std::chrono::nanoseconds::period::den);
    auto ticks = elapsed.count() > 0 ? elapsed.count() : 1;
    return static_cast<double>(delta) * ticks_per_second / static_cast<double>(ticks);
}

std::optional<uint64_t> remaining_stream_length(std::istream& stream) {
    auto current = stream.tellg();
    if (current < 0) {
        stream.clear();
        return std::nullopt;
    }

    stream.seekg(0, std::ios::end);
    auto end = stream.tellg();
    stream.seekg(current);
    if (end < 0 || !stream) {
        stream.clear();
        stream.seekg(current);
        return std::nullopt;
    }
    return static_cast<uint64_t>(end - current);
}

uint64_t resolve_expected_length(std::istream& stream, uint64_t explicit_length) {
    if (explicit_length != 0) return explicit_length;
    return remaining_stream_length(stream).value_or(0);
}

uint64_t copy_stream(std::istream& source, std::ostream& sink,
                     ProgressTranslator* translator,
                     const CancellationToken& cancel) {
    std::vector<char> buffer(constants::DEFAULT_COPY_BUFFER_SIZE);
    uint64_t copied = 0;

    while (true) {
        cancel.throw_if_stopped("copy");

        source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = source.gcount();
        if (got > 0) {
            sink.write(buffer.data(), got);
            if (!sink) {
                throw StorageError(ErrorKind::Internal, "copy: failed to write to sink");
            }
            copied += static_cast<uint64_t>(got);
            if (translator) {
                translator->report_delta(static_cast<uint64_t>(got));
            }
        }

        if (source.eof()) break;
        if (source.fail()) {
            throw StorageError(ErrorKind::Internal, "copy: failed to read from source");
        }
    }

    sink.flush();
    if (!sink) {
        throw StorageError(ErrorKind::Internal, "copy: failed to flush sink");
    }
    return copied;
}

} // namespace unistore
