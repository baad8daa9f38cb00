/**
 * @file HexMosaicEngine.cpp
 * @brief Run orchestration: validation, tessellation, sampling, scoring,
 *        cleanup and persistence
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "HexMosaicEngine.hpp"
#include "CleanupPass.hpp"
#include "EvidenceSampler.hpp"
#include "HexMosaicError.hpp"
#include "InputValidator.hpp"
#include "Logger.hpp"
#include "ParallelExecutor.hpp"

#include <mutex>
#include <sstream>

namespace hexmosaic {

namespace {

/**
 * @brief Collects warnings emitted anywhere in the process while alive
 *
 * Messages are forwarded to the sink that was installed before, which is
 * restored on destruction.
 */
class WarningCollector {
public:
    WarningCollector() : previous_(Logger::getSink()) {
        Logger::setSink([this](LogLevel level, const std::string& facility, const std::string& message) {
            if (level == LogLevel::WARNING) {
                std::lock_guard<std::mutex> lock(mutex_);
                warnings_.push_back(facility + ": " + message);
            }
            if (previous_) {
                previous_(level, facility, message);
            }
        });
    }

    ~WarningCollector() { Logger::setSink(previous_); }

    WarningCollector(const WarningCollector&) = delete;
    WarningCollector& operator=(const WarningCollector&) = delete;

    std::vector<std::string> warnings() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return warnings_;
    }

private:
    LogSink previous_;
    mutable std::mutex mutex_;
    std::vector<std::string> warnings_;
};

} // namespace

// ============================================================================
// HexMosaicEngine::Impl - Private implementation
// ============================================================================

class HexMosaicEngine::Impl {
public:
    Impl(const HexMosaicConfig& config, const ClassProfile& profile)
        : config_(config),
          profile_(profile),
          logger_("HexMosaicEngine"),
          executor_(config.num_threads) {

        // Wire logger to config log level
        logger_.setLogLevel(static_cast<LogLevel>(config_.log_level));
        if (config_.log_file) {
            logger_.setLogFile(config_.log_file);
        }
    }

    RunOutcome run(RunInputs& inputs, const CancellationToken* cancel, const ProgressCallback& progress) {
        tracker_.clear();
        WarningCollector collector;
        Phase phase = Phase::VALIDATION;

        try {
            RunOutcome outcome;

            // Fail fast on configuration before any work
            tracker_.start_phase(Phase::VALIDATION);
            InputValidator validator;
            validator.require_valid(config_, inputs.store != nullptr);
            tracker_.complete_phase(Phase::VALIDATION);

            phase = Phase::TESSELLATION;
            tracker_.start_phase(phase);
            HexTessellator tessellator(config_.tessellation);
            outcome.tessellation = std::make_unique<Tessellation>(
                tessellator.build(inputs.boundary, inputs.crs, cancel, progress));
            const Tessellation& tessellation = *outcome.tessellation;
            tracker_.add_phase_data(phase, "tiles", std::to_string(tessellation.size()));
            tracker_.complete_phase(phase);

            phase = Phase::SAMPLING;
            tracker_.start_phase(phase);
            EvidenceSampler sampler(profile_, executor_, config_.source_timeout);
            SamplingResult sampling = sampler.sample(tessellation, inputs.sources,
                                                     inputs.raster ? &*inputs.raster : nullptr,
                                                     cancel, progress);
            LineTracer tracer(profile_, executor_);
            outcome.line_paths = tracer.trace_all(tessellation, sampling.lines, cancel);
            tracker_.add_phase_data(phase, "features", std::to_string(sampling.features_used));
            tracker_.add_phase_data(phase, "line_paths", std::to_string(outcome.line_paths.size()));
            tracker_.complete_phase(phase);

            phase = Phase::SCORING;
            tracker_.start_phase(phase);
            ScoringEngine scoring(profile_, executor_);
            outcome.results = scoring.classify_all(sampling.tiles, cancel, progress);
            tracker_.complete_phase(phase);

            phase = Phase::CLEANUP;
            tracker_.start_phase(phase);
            CleanupPass cleanup(profile_, executor_);
            CleanupReport cleanup_report = cleanup.run(outcome.results, tessellation.adjacency(),
                                                       cancel, progress);
            tracker_.add_phase_data(phase, "passes", std::to_string(cleanup_report.passes));
            tracker_.complete_phase(phase);

            phase = Phase::PERSISTENCE;
            tracker_.start_phase(phase);
            InMemoryAttributeStore empty_store;
            PersistenceManager persistence(inputs.store ? *inputs.store : empty_store);
            if (config_.mode == PersistenceMode::APPLY) {
                outcome.artifact = persistence.apply(tessellation, outcome.results, cancel, progress);
            } else {
                outcome.artifact = persistence.preview(tessellation, outcome.results, cancel, progress);
            }
            tracker_.complete_phase(phase);

            outcome.summary = PersistenceManager::summarize(outcome.results, cleanup_report,
                                                            sampling.ignored_sources);
            outcome.summary.mode = config_.mode;
            outcome.summary.line_paths = outcome.line_paths.size();
            outcome.summary.warnings = collector.warnings();
            outcome.summary.phase_timings = tracker_.timings();
            outcome.summary.elapsed_seconds = tracker_.elapsed_seconds();

            logger_.info(tracker_.timing_report());
            logger_.info("Run finished in " + std::string(to_string(config_.mode)) + " mode: " +
                         std::to_string(outcome.summary.tile_count) + " tiles, " +
                         std::to_string(outcome.summary.mixed_tiles) + " mixed, " +
                         std::to_string(outcome.summary.unknown_tiles) + " unknown, " +
                         std::to_string(outcome.summary.reassignments.size()) + " reassigned");
            return outcome;

        } catch (const HexMosaicError& e) {
            tracker_.complete_phase(phase, false, e.message());
            std::ostringstream msg;
            msg << to_string(e.kind()) << " during " << to_string(e.phase()) << ": " << e.message();
            if (!e.context().empty()) {
                msg << " [" << e.context() << "]";
            }
            if (e.kind() == ErrorKind::CANCELLED) {
                logger_.warning(msg.str());
            } else {
                logger_.error(msg.str());
            }
            logger_.detailed(tracker_.pipeline_status());
            throw;
        }
    }

    const HexMosaicConfig& config() const { return config_; }
    const ClassProfile& profile() const { return profile_; }
    const PhaseTracker& tracker() const { return tracker_; }

private:
    HexMosaicConfig config_;
    ClassProfile profile_;
    Logger logger_;
    ParallelExecutor executor_;
    PhaseTracker tracker_;
};

// ============================================================================
// HexMosaicEngine - Public interface
// ============================================================================

HexMosaicEngine::HexMosaicEngine(const HexMosaicConfig& config, const ClassProfile& profile)
    : impl_(std::make_unique<Impl>(config, profile)) {
}

HexMosaicEngine::~HexMosaicEngine() = default;

RunOutcome HexMosaicEngine::run(RunInputs& inputs, const CancellationToken* cancel,
                                const ProgressCallback& progress) {
    return impl_->run(inputs, cancel, progress);
}

const HexMosaicConfig& HexMosaicEngine::config() const {
    return impl_->config();
}

const ClassProfile& HexMosaicEngine::profile() const {
    return impl_->profile();
}

const PhaseTracker& HexMosaicEngine::tracker() const {
    return impl_->tracker();
}

} // namespace hexmosaic
