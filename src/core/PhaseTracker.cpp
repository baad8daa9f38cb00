/**
 * @file PhaseTracker.cpp
 * @brief Implementation of per-phase timing and status tracking
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PhaseTracker.hpp"

#include <iomanip>
#include <sstream>

namespace hexmosaic {

PhaseTracker::PhaseTracker()
    : start_time_(std::chrono::steady_clock::now()), logger_("PhaseTracker") {
}

void PhaseTracker::start_phase(Phase phase) {
    phases_.emplace_back(phase);
    logger_.debug(std::string("[PHASE START] ") + to_string(phase));
}

void PhaseTracker::complete_phase(Phase phase, bool successful, const std::string& error) {
    PhaseRecord* record = find(phase);
    if (!record) {
        return;
    }
    record->complete(successful, error);

    std::string message = std::string("[PHASE COMPLETE] ") + to_string(phase) +
                          " (" + format_duration(record->duration()) + ")";
    if (!successful) {
        message += " [FAILED: " + error + "]";
    }
    logger_.debug(message);
}

void PhaseTracker::add_phase_data(Phase phase, const std::string& key, const std::string& value) {
    PhaseRecord* record = find(phase);
    if (record) {
        record->phase_data[key] = value;
        logger_.trace(std::string("[PHASE DATA] ") + to_string(phase) + ": " + key + " = " + value);
    }
}

const PhaseRecord* PhaseTracker::current() const {
    if (phases_.empty() || phases_.back().completed) {
        return nullptr;
    }
    return &phases_.back();
}

std::string PhaseTracker::pipeline_status() const {
    std::ostringstream oss;
    oss << "Pipeline: " << completed_count() << "/" << phases_.size() << " phases completed";

    if (const PhaseRecord* running = current()) {
        oss << " (current: " << to_string(running->phase) << ")";
    }
    return oss.str();
}

std::string PhaseTracker::timing_report() const {
    std::ostringstream oss;
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);

    oss << "Total time: " << format_duration(total_time);
    for (const auto& record : phases_) {
        if (record.completed) {
            oss << ", " << to_string(record.phase) << ": " << format_duration(record.duration());
        }
    }
    return oss.str();
}

double PhaseTracker::elapsed_seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
}

nlohmann::json PhaseTracker::timings() const {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& record : phases_) {
        if (record.completed) {
            result[to_string(record.phase)] = std::chrono::duration<double>(record.end_time - record.start_time).count();
        }
    }
    return result;
}

size_t PhaseTracker::completed_count() const {
    size_t count = 0;
    for (const auto& record : phases_) {
        if (record.completed) count++;
    }
    return count;
}

void PhaseTracker::clear() {
    phases_.clear();
    start_time_ = std::chrono::steady_clock::now();
}

std::string PhaseTracker::format_duration(std::chrono::milliseconds duration) const {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << (ms / 1000.0) << "s";
        return oss.str();
    } else {
        auto minutes = ms / 60000;
        auto seconds = (ms % 60000) / 1000;
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }
}

PhaseRecord* PhaseTracker::find(Phase phase) {
    // Latest record wins if a phase was started more than once
    for (auto it = phases_.rbegin(); it != phases_.rend(); ++it) {
        if (it->phase == phase) {
            return &*it;
        }
    }
    return nullptr;
}

} // namespace hexmosaic
