/**
 * @file OutputTracker.hpp
 * @brief Pipeline stage and output file tracking
 *
 * The engine and the exporters record what they did here; the CLI
 * prints the summary and the run report serializes it.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "terrace_shade.hpp"
#include "Logger.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace shade {

/**
 * @brief Information about a written output file
 */
struct OutputFileInfo {
    std::string filename;
    std::string format;   // "geojson", "csv", "json"
    size_t file_size_bytes = 0;
    bool generation_successful = false;
    std::string error_message;

    OutputFileInfo(const std::string& fname, const std::string& fmt)
        : filename(fname), format(fmt) {}
};

/**
 * @brief One timed pipeline stage
 */
struct PipelineStage {
    std::string stage_name;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::string error_message;
    std::map<std::string, std::string> stage_data;  // Key-value pairs for stage-specific info

    explicit PipelineStage(const std::string& name)
        : stage_name(name), start_time(std::chrono::steady_clock::now()) {}

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

/**
 * @brief Records stage timings and generated files for one run
 */
class OutputTracker {
public:
    OutputTracker();
    explicit OutputTracker(bool verbose);

    // File tracking
    void trackGeneratedFile(const OutputFileInfo& file_info);
    void trackGeneratedFile(const std::string& filename, const std::string& format);

    // Stage tracking
    void startStage(const std::string& stage_name);
    void completeStage(const std::string& stage_name, bool successful = true, const std::string& error = "");
    void addStageData(const std::string& stage_name, const std::string& key, const std::string& value);

    /// Stage by name, nullptr if it was never started
    const PipelineStage* getStage(const std::string& stage_name) const;
    std::chrono::milliseconds getStageDuration(const std::string& stage_name) const;

    // State queries for logging
    std::string getFileTrackingSummary() const;
    std::string getPipelineStatus() const;
    std::string getTimingReport() const;

    void printSummary() const;
    void printDetailedReport() const;

    void setVerbose(bool verbose) { verbose_ = verbose; }
    bool isVerbose() const { return verbose_; }

    size_t getCompletedStageCount() const;
    const std::vector<PipelineStage>& getStages() const { return stages_; }
    const std::vector<OutputFileInfo>& getTrackedFiles() const { return tracked_files_; }

    void clear();

private:
    bool verbose_;
    std::vector<OutputFileInfo> tracked_files_;
    std::vector<PipelineStage> stages_;
    std::chrono::steady_clock::time_point tracking_start_time_;
    mutable Logger logger_;  // mutable for const methods

    std::string formatDuration(std::chrono::milliseconds duration) const;
    std::string formatFileSize(size_t bytes) const;

    PipelineStage* findStage(const std::string& stage_name);
};

} // namespace shade
