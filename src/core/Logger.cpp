/**
 * @file Logger.cpp
 * @brief Implementation of the leveled logger
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <sstream>

namespace shade {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::global_file_stream_;
std::mutex Logger::registry_mutex_;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

bool parse_level(const std::string& text, LogLevel& level) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        level = static_cast<LogLevel>(std::clamp(value, 0, 6));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::SILENT:   return "";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "";
}

Logger::Logger()
    : current_level_(LogLevel::INFO), has_instance_level_(false),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::INFO), has_instance_level_(false), component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), has_instance_level_(true),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        file_stream_ = openLogFile(log_file.value());
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();
    if (file_stream_) {
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
    has_last_message_ = true;
}

void Logger::emitRepeatSummary() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "(previous message repeated " + std::to_string(repeat_count_) + " more times)");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto now_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&now_t, &local_tm);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  local_tm.tm_hour, local_tm.tm_min, local_tm.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] ";
    if (level == LogLevel::ERROR || level == LogLevel::WARNING) {
        line << level_tag(level) << ": ";
    }
    if (!component_name_.empty() && level >= LogLevel::DEBUG) {
        line << component_name_ << ": ";
    }
    line << message;

    std::ostream& console = (level == LogLevel::ERROR || level == LogLevel::WARNING) ? std::cerr : std::cout;
    console << line.str() << std::endl;

    std::shared_ptr<std::ofstream> global_file;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        global_file = global_file_stream_;
    }
    for (const auto& stream : {file_stream_, global_file}) {
        if (stream && stream->is_open()) {
            *stream << line.str() << "\n";
            stream->flush();
        }
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

std::shared_ptr<std::ofstream> Logger::openLogFile(const std::string& path) {
    std::error_code ec;
    std::filesystem::path log_path(path);
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    auto stream = std::make_shared<std::ofstream>(path, std::ios::app);
    if (!stream->is_open()) {
        // Logging is not available yet, report directly
        std::cerr << "Warning: cannot open log file: " << path << std::endl;
        return nullptr;
    }
    return stream;
}

// ============================================================================
// Global configuration
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
    return it != facility_levels_.end() ? it->second : default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::parseLogConfig(const std::string& config) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    bool all_valid = true;
    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        LogLevel level;
        size_t equals_pos = token.find('=');
        if (equals_pos == std::string::npos) {
            if (parse_level(token, level)) {
                default_level_ = level;
            } else {
                std::cerr << "Warning: invalid log level '" << token << "'" << std::endl;
                all_valid = false;
            }
            continue;
        }

        std::string facility = trim(token.substr(0, equals_pos));
        std::string level_str = trim(token.substr(equals_pos + 1));
        if (facility.empty() || !parse_level(level_str, level)) {
            std::cerr << "Warning: invalid log level '" << token << "'" << std::endl;
            all_valid = false;
            continue;
        }

        if (facility == "default") {
            default_level_ = level;
        } else {
            facility_levels_[facility] = level;
        }
    }

    return all_valid;
}

bool Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    std::shared_ptr<std::ofstream> stream;
    if (log_file.has_value()) {
        stream = openLogFile(log_file.value());
        if (!stream) {
            return false;
        }
    }
    std::lock_guard<std::mutex> lock(registry_mutex_);
    global_file_stream_ = stream;
    return true;
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    if (has_instance_level_) {
        return current_level_;
    }

    return default_level_;
}

} // namespace shade
