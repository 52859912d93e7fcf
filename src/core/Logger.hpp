/**
 * @file Logger.hpp
 * @brief Centralized logging system with per-facility verbosity control
 *
 * Every component logs through a Logger named after itself. All output goes
 * through one outputMessage() with one verbosity check, written to stderr so
 * that result JSON on stdout stays machine readable.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace geoenrich {

/**
 * @brief Log levels
 *
 * Level 1: Errors (a source or request failed)
 * Level 2: Warnings (degraded result, dropped feature, clamped input)
 * Level 3: Information (high-level progress)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (requests, pages, objects)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Centralized logger with single point of output control
 *
 * Instances are cheap; components usually hold one named after themselves
 * so that facility levels ("ResilientFetcher=6") apply to them.
 */
class Logger {
public:
    /**
     * @brief Default constructor, logs at the global default level
     */
    Logger();

    /**
     * @brief Constructor with component name
     * @param component_name Facility name used for level lookup and output tag
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Constructor with explicit level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    Logger(const Logger& other);
    Logger& operator=(const Logger& other) = delete;

    ~Logger();

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Consecutive identical messages are collapsed into a repeat summary.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    std::optional<LogLevel> getLogLevel() const { return current_level_; }

    /**
     * @brief Set or change the log file
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Check if a message level would be output
     */
    bool shouldOutput(LogLevel level) const;

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
     * @brief Flush pending repeat summaries and all output buffers
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for a specific facility (component)
     *
     * @example
     * Logger::setFacilityLevel("ResilientFetcher", LogLevel::TRACE);
     * Logger::setFacilityLevel("EnrichmentOrchestrator", LogLevel::INFO);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Supports:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "ResilientFetcher=6,SpatialQueryPaginator=3"
     * - Mixed: "4,ProximityEngine=6"
     * - "default=N" is equivalent to a bare "N"
     * A default level of 0 silences all output.
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Silence all output (used by --silent and by the test runner)
     */
    static void setSilent(bool silent);

    /**
     * @brief Mirror every logger's output into one file (--log-file)
     * @param log_file Path to append to, or nullopt to close the shared sink
     * @return false if the file could not be opened
     */
    static bool setSharedLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Effective level: facility level, then instance level, then global default
     */
    LogLevel getEffectiveLevel() const;

    static std::string levelName(LogLevel level);

private:
    std::optional<LogLevel> current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_ = LogLevel::INFO;
    mutable int repeat_count_ = 0;
    mutable bool has_last_message_ = false;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static bool silent_;
    static std::mutex registry_mutex_;
    static std::mutex sink_mutex_;
    static std::shared_ptr<std::ofstream> shared_stream_;

    void initializeFileStream();
    void doOutput(LogLevel level, const std::string& message) const;
    void emitRepeatSummary() const;
};

} // namespace geoenrich
