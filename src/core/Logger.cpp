/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging system
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace geoenrich {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
bool Logger::silent_ = false;
std::mutex Logger::registry_mutex_;
std::mutex Logger::sink_mutex_;
std::shared_ptr<std::ofstream> Logger::shared_stream_;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

} // namespace

Logger::Logger() = default;

Logger::Logger(const std::string& component_name)
    : component_name_(component_name) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), log_file_path_(log_file) {
    if (log_file.has_value()) {
        initializeFileStream();
    }
}

// Copies share the file sink but not the deduplication state
Logger::Logger(const Logger& other)
    : current_level_(other.current_level_),
      component_name_(other.component_name_),
      log_file_path_(other.log_file_path_),
      file_stream_(other.file_stream_) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cerr.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (!shouldOutput(level)) {
        return;
    }

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

void Logger::emitRepeatSummary() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " +
                 std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
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
    try {
        if (log_file_path_.has_value()) {
            std::filesystem::path log_path(log_file_path_.value());
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            file_stream_ = std::make_shared<std::ofstream>(log_file_path_.value(), std::ios::app);
            if (!file_stream_->is_open()) {
                // Not through outputMessage: would recurse
                std::cerr << "Warning: Failed to open log file: " << log_file_path_.value() << std::endl;
                file_stream_.reset();
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        file_stream_.reset();
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
    line << "[" << timestamp << "] " << levelName(level);
    if (!component_name_.empty()) {
        line << " [" << component_name_ << "]";
    }
    line << " " << message;

    // Loggers live on many threads; one line at a time on the shared sinks
    std::lock_guard<std::mutex> sink_lock(sink_mutex_);
    std::cerr << line.str() << std::endl;

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }
    if (shared_stream_ && shared_stream_ != file_stream_) {
        *shared_stream_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cerr.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Facility-based logging
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

        int level_int = 0;
        try {
            level_int = std::stoi(level_str);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str
                      << "' for facility '" << facility << "'" << std::endl;
            continue;
        }

        if (facility == "default") {
            silent_ = (level_int <= 0);
            default_level_ = static_cast<LogLevel>(std::clamp(level_int, 1, 6));
        } else {
            facility_levels_[facility] = static_cast<LogLevel>(std::clamp(level_int, 1, 6));
        }
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::setSilent(bool silent) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    silent_ = silent;
}

bool Logger::setSharedLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (shared_stream_) {
        shared_stream_->flush();
        shared_stream_.reset();
    }
    if (!log_file.has_value()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::path log_path(log_file.value());
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }
    auto stream = std::make_shared<std::ofstream>(log_file.value(), std::ios::app);
    if (!stream->is_open()) {
        return false;
    }
    shared_stream_ = std::move(stream);
    return true;
}

bool Logger::shouldOutput(LogLevel level) const {
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (silent_) {
            return false;
        }
    }
    return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }
    if (current_level_.has_value()) {
        return *current_level_;
    }
    return default_level_;
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN ";
        case LogLevel::INFO:     return "INFO ";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "?????";
}

} // namespace geoenrich
