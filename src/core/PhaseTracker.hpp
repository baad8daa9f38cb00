/**
 * @file PhaseTracker.hpp
 * @brief Per-phase timing and status tracking for a classification run
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "Logger.hpp"

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace hexmosaic {

/**
 * @brief One pipeline phase as it ran
 */
struct PhaseRecord {
    Phase phase;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::string error_message;
    std::unordered_map<std::string, std::string> phase_data;  // Key-value pairs for phase-specific info

    explicit PhaseRecord(Phase p)
        : phase(p), start_time(std::chrono::steady_clock::now()) {}

    void complete(bool success = true, const std::string& error = "") {
        end_time = std::chrono::steady_clock::now();
        completed = true;
        successful = success;
        error_message = error;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

class PhaseTracker {
public:
    PhaseTracker();

    void start_phase(Phase phase);
    void complete_phase(Phase phase, bool successful = true, const std::string& error = "");
    void add_phase_data(Phase phase, const std::string& key, const std::string& value);

    /**
     * @brief Phase that was started last and has not completed, if any
     */
    const PhaseRecord* current() const;

    std::string pipeline_status() const;
    std::string timing_report() const;

    /**
     * @brief Seconds since the tracker was created or cleared
     */
    double elapsed_seconds() const;

    /**
     * @brief {phase name: seconds} for completed phases
     */
    nlohmann::json timings() const;

    const std::vector<PhaseRecord>& phases() const { return phases_; }
    size_t completed_count() const;

    void clear();

private:
    std::vector<PhaseRecord> phases_;
    std::chrono::steady_clock::time_point start_time_;
    Logger logger_;

    std::string format_duration(std::chrono::milliseconds duration) const;
    PhaseRecord* find(Phase phase);
};

} // namespace hexmosaic
