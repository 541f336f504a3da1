/**
 * @file Logger.hpp
 * @brief Leveled, facility-aware logging shared by every component
 *
 * All console and file output of the pipeline goes through
 * Logger::outputMessage(), which owns the single verbosity check.
 */

#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace shade {

/**
 * @brief Verbosity levels
 *
 * Level 0: Silent
 * Level 1: Errors (run cannot continue)
 * Level 2: Warnings (terrace excluded, slot left unadjusted)
 * Level 3: Information (pipeline stages)
 * Level 4: Detailed information (codepaths, per-stage counts)
 * Level 5: Debugging (per-terrace results)
 * Level 6: Tracing (per-ray values)
 */
enum class LogLevel {
    SILENT = 0,
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Short tag for a level, e.g. "WARN"
 */
const char* level_tag(LogLevel level);

/**
 * @brief Logger bound to one facility (component) name
 *
 * Instances are cheap; components create one per class or per call.
 * The effective level is the facility level if one was configured,
 * otherwise the instance level if it was set explicitly, otherwise the
 * global default.
 */
class Logger {
public:
    Logger();
    explicit Logger(const std::string& component_name);
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);
    ~Logger();

    /**
     * @brief Emit a message if its level passes the effective threshold
     *
     * Consecutive identical messages are folded into one line followed by
     * a repeat count.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; has_instance_level_ = true; }
    LogLevel getLogLevel() const { return current_level_; }

    bool shouldOutput(LogLevel level) const {
        return level != LogLevel::SILENT &&
               static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
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
     * @brief Flush console and file output, emitting any pending repeat count
     */
    void flush() const;

    // ========================================================================
    // Global configuration
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);
    static void clearFacilityLevels();

    /**
     * @brief Apply a level string
     *
     * "4" sets the default level, "ShadowRaytracer=6" sets one facility,
     * "3,WeatherService=5" does both. "default=N" is accepted as well.
     *
     * @return false if any token could not be parsed (valid tokens still apply)
     */
    static bool parseLogConfig(const std::string& config);

    /**
     * @brief Send every logger's output to a file as well (append mode)
     * @return false if the file cannot be opened
     */
    static bool setGlobalLogFile(const std::optional<std::string>& log_file);

    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    bool has_instance_level_;
    std::string component_name_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> global_file_stream_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<std::ofstream> openLogFile(const std::string& path);

    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace shade
