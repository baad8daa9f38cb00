/**
 * @file Logger.cpp
 * @brief Implementation of facility-based logging
 */

#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace hexmosaic {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
LogSink Logger::sink_;
std::mutex Logger::sink_mutex_;

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) return "";
    const auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(begin, end - begin + 1);
}

} // anonymous namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAILED";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKNOWN";
}

Logger::Logger() : current_level_(LogLevel::WARNING), component_name_(""),
                   last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::WARNING), component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), component_name_(""), log_file_path_(log_file),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        initializeFileStream();
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    const bool visible = shouldOutput(level);

    // Warnings and errors reach the sink even when silenced on the console
    if (visible || level <= LogLevel::WARNING) {
        // Called unlocked so a sink may log or chain to another sink
        LogSink sink = getSink();
        if (sink) {
            sink(level, component_name_, message);
        }
    }

    if (!visible) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    emitRepeatSummary();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    log_file_path_ = log_file;

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }

    if (log_file.has_value()) {
        initializeFileStream();
    }
}

void Logger::initializeFileStream() {
    if (!log_file_path_.has_value()) {
        return;
    }

    try {
        std::filesystem::path log_path(log_file_path_.value());
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        file_stream_ = std::make_shared<std::ofstream>(log_file_path_.value(), std::ios::app);

        if (!file_stream_->is_open()) {
            // Not through outputMessage: the file is the thing that failed
            std::cerr << "Warning: Failed to open log file: " << log_file_path_.value() << std::endl;
            file_stream_.reset();
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Warning: Cannot create log directory: " << e.what() << std::endl;
        file_stream_.reset();
    }
}

void Logger::emitRepeatSummary() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " +
                 std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] ";
    if (level <= LogLevel::WARNING) {
        line << to_string(level) << ": ";
    }
    if (!component_name_.empty()) {
        line << component_name_ << ": ";
    }
    line << message;

    std::cout << line.str() << std::endl;

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Process-wide control
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }
    return default_level_;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    if (std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        if (value.size() > 3) {
            return LogLevel::TRACE;
        }
        return static_cast<LogLevel>(std::clamp(std::stoi(value), 1, 6));
    }

    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (int i = 1; i <= 6; ++i) {
        LogLevel level = static_cast<LogLevel>(i);
        if (value == to_string(level)) {
            return level;
        }
    }
    if (value == "WARN") return LogLevel::WARNING;
    return std::nullopt;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        std::string facility = "default";
        std::string level_str = token;

        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            facility = trim(token.substr(0, equals_pos));
            level_str = trim(token.substr(equals_pos + 1));
        }

        auto level = parseLevel(level_str);
        if (!level) {
            std::cerr << "Warning: Invalid log level '" << level_str
                      << "' for facility '" << facility << "'" << std::endl;
            continue;
        }

        if (facility == "default") {
            default_level_ = *level;
        } else {
            facility_levels_[facility] = *level;
        }
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::setSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

LogSink Logger::getSink() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    // A level set explicitly on the instance beats the global default
    if (current_level_ != LogLevel::WARNING) {
        return current_level_;
    }
    return default_level_;
}

} // namespace hexmosaic
