/**
 * @file Logger.hpp
 * @brief Facility-based logging with verbosity control
 *
 * Every component owns a Logger named after itself ("HexTessellator",
 * "EvidenceSampler", ...). Output goes to stdout and, optionally, a log file.
 * A process-wide sink can observe messages as well, which is how the engine
 * collects warnings for the run summary and how tests capture them.
 */

#pragma once

#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace hexmosaic {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run aborted)
 * Level 2: Warnings (input ignored, result degraded)
 * Level 3: Information (phase boundaries, counts)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (per-source, per-pass values)
 * Level 6: Detailed debugging (per-tile values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

const char* to_string(LogLevel level);

/**
 * @brief Observer for log messages
 *
 * Called with (level, facility, message) before duplicate folding, so every
 * occurrence is seen. Receives warnings and errors regardless of verbosity,
 * other levels only when they pass the verbosity check.
 */
using LogSink = std::function<void(LogLevel, const std::string&, const std::string&)>;

/**
 * @brief Logger with a single point of output control
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with facility name
     * @param component_name Facility used for per-facility levels and output prefix
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Constructor with specified log level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Identical consecutive messages are folded into one "occurred N times"
     * line, emitted when a different message arrives or on flush.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or change the log file
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending duplicate summary and all output buffers
     */
    void flush() const;

    const std::string& facility() const { return component_name_; }

    // ========================================================================
    // Process-wide control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Formats:
     * - "5" sets the default level to DEBUG
     * - "EvidenceSampler=6,CleanupPass=3" sets facility levels
     * - "4,EvidenceSampler=6" mixes both; "default=4" is the same as "4"
     *
     * Level values may be numbers (1-6, clamped) or names ("warning", "trace").
     */
    static void parseLogConfig(const std::string& config);

    /**
     * @brief Parse a single level value
     * @return Level, or nullopt if the text is neither a number nor a level name
     */
    static std::optional<LogLevel> parseLevel(const std::string& text);

    static void clearFacilityLevels();

    /**
     * @brief Install (or clear with nullptr) the process-wide sink
     */
    static void setSink(LogSink sink);
    static LogSink getSink();

    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Duplicate folding state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static LogSink sink_;
    static std::mutex sink_mutex_;

    void initializeFileStream();
    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace hexmosaic
