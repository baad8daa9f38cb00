/**
 * @file ParallelExecutor.hpp
 * @brief Per-tile parallel loops with progress and cooperative cancellation
 */

#pragma once

#include "hexmosaic.hpp"
#include "HexMosaicError.hpp"

#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace hexmosaic {

/**
 * @brief Serialised, monotonic progress reporting for one phase
 *
 * Emits an event whenever the processed count crosses a 1% step and once at
 * completion. Safe to call from worker threads.
 */
class ProgressReporter {
public:
    ProgressReporter(ProgressCallback callback, Phase phase, size_t total)
        : callback_(std::move(callback)), phase_(phase), total_(total),
          step_(std::max<size_t>(1, total / 100)), processed_(0), last_reported_(0) {}

    void advance(size_t count = 1) {
        const size_t now = processed_.fetch_add(count) + count;
        const size_t before = now - count;
        if (now / step_ != before / step_ || now == total_) {
            report(now);
        }
    }

    void finish() { report(processed_.load()); }

    size_t processed() const { return processed_.load(); }
    size_t total() const { return total_; }
    Phase phase() const { return phase_; }

private:
    void report(size_t count) {
        if (!callback_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        if (count <= last_reported_ && !(count == 0 && total_ == 0)) return;
        last_reported_ = count;
        callback_(ProgressEvent{count, total_, phase_});
    }

    ProgressCallback callback_;
    Phase phase_;
    size_t total_;
    size_t step_;
    std::atomic<size_t> processed_;
    size_t last_reported_;
    std::mutex mutex_;
};

/**
 * @brief oneTBB loop runner shared by sampling, scoring and cleanup
 *
 * Results are written by the loop body into id-indexed storage, so the order
 * in which chunks complete never shows in the output.
 */
class ParallelExecutor {
public:
    /**
     * @param num_threads Upper bound on worker threads; 0 lets TBB decide
     */
    explicit ParallelExecutor(int num_threads = 0) : num_threads_(num_threads) {}

    int num_threads() const { return num_threads_; }

    /**
     * @brief Run body(i) for i in [0, count)
     *
     * The token is checked before every unit; once cancelled, remaining
     * units are skipped and CANCELLED is raised for the given phase.
     */
    template <typename Body>
    void for_each(size_t count, Phase phase, const CancellationToken* cancel,
                  ProgressReporter* progress, Body&& body) const {
        std::unique_ptr<tbb::global_control> limit;
        if (num_threads_ > 0) {
            limit = std::make_unique<tbb::global_control>(
                tbb::global_control::max_allowed_parallelism, static_cast<size_t>(num_threads_));
        }

        std::atomic<bool> stopped(false);
        tbb::parallel_for(tbb::blocked_range<size_t>(0, count),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i < range.end(); ++i) {
                    if (stopped.load(std::memory_order_relaxed)) {
                        return;
                    }
                    if (cancel && cancel->is_cancelled()) {
                        stopped.store(true, std::memory_order_relaxed);
                        return;
                    }
                    body(i);
                    if (progress) {
                        progress->advance();
                    }
                }
            });

        if (stopped.load() || (cancel && cancel->is_cancelled())) {
            throw HexMosaicError(ErrorKind::CANCELLED, phase,
                                 std::string("cancelled during ") + to_string(phase),
                                 std::to_string(progress ? progress->processed() : 0) + " of " +
                                 std::to_string(count) + " tiles processed");
        }
    }

private:
    int num_threads_;
};

} // namespace hexmosaic
