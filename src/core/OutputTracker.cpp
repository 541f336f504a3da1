/**
 * @file OutputTracker.cpp
 * @brief Implementation of pipeline stage and output file tracking
 */

#include "OutputTracker.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace shade {

OutputTracker::OutputTracker()
    : verbose_(false), tracking_start_time_(std::chrono::steady_clock::now()), logger_("OutputTracker") {
}

OutputTracker::OutputTracker(bool verbose)
    : verbose_(verbose), tracking_start_time_(std::chrono::steady_clock::now()), logger_("OutputTracker") {
}

void OutputTracker::trackGeneratedFile(const OutputFileInfo& file_info) {
    tracked_files_.push_back(file_info);

    if (verbose_) {
        logger_.detailed("[FILE TRACKED] " + file_info.filename + " (format: " + file_info.format + ")");
    }
}

void OutputTracker::trackGeneratedFile(const std::string& filename, const std::string& format) {
    OutputFileInfo info(filename, format);

    std::error_code ec;
    if (std::filesystem::exists(filename, ec)) {
        info.file_size_bytes = static_cast<size_t>(std::filesystem::file_size(filename, ec));
        if (ec) {
            info.error_message = "Could not get file size: " + ec.message();
        } else {
            info.generation_successful = true;
        }
    } else {
        info.error_message = "File does not exist";
    }

    trackGeneratedFile(info);
}

void OutputTracker::startStage(const std::string& stage_name) {
    stages_.emplace_back(stage_name);

    if (verbose_) {
        logger_.detailed("[STAGE START] " + stage_name);
    }
}

void OutputTracker::completeStage(const std::string& stage_name, bool successful, const std::string& error) {
    PipelineStage* stage = findStage(stage_name);
    if (!stage) {
        return;
    }
    stage->complete(successful, error);

    if (verbose_) {
        std::string message = "[STAGE COMPLETE] " + stage_name + " (" + formatDuration(stage->duration()) + ")";
        if (!successful) {
            message += " [FAILED: " + error + "]";
        }
        logger_.detailed(message);
    }
}

void OutputTracker::addStageData(const std::string& stage_name, const std::string& key, const std::string& value) {
    PipelineStage* stage = findStage(stage_name);
    if (stage) {
        stage->stage_data[key] = value;
        if (verbose_) {
            logger_.debug("[STAGE DATA] " + stage_name + ": " + key + " = " + value);
        }
    }
}

const PipelineStage* OutputTracker::getStage(const std::string& stage_name) const {
    auto it = std::find_if(stages_.rbegin(), stages_.rend(),
                           [&stage_name](const PipelineStage& stage) { return stage.stage_name == stage_name; });
    return (it != stages_.rend()) ? &(*it) : nullptr;
}

std::chrono::milliseconds OutputTracker::getStageDuration(const std::string& stage_name) const {
    const PipelineStage* stage = getStage(stage_name);
    return stage ? stage->duration() : std::chrono::milliseconds(0);
}

std::string OutputTracker::getFileTrackingSummary() const {
    std::ostringstream oss;
    size_t successful = 0;
    size_t total_size = 0;

    for (const auto& file : tracked_files_) {
        if (file.generation_successful) {
            successful++;
            total_size += file.file_size_bytes;
        }
    }

    oss << "Files: " << successful << "/" << tracked_files_.size()
        << " written, " << formatFileSize(total_size) << " total";
    return oss.str();
}

std::string OutputTracker::getPipelineStatus() const {
    std::ostringstream oss;
    oss << "Pipeline: " << getCompletedStageCount() << "/" << stages_.size() << " stages completed";

    if (!stages_.empty() && !stages_.back().completed) {
        oss << " (current: " << stages_.back().stage_name << ")";
    }
    return oss.str();
}

std::string OutputTracker::getTimingReport() const {
    std::ostringstream oss;
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracking_start_time_);

    oss << "Total time: " << formatDuration(total_time);
    for (const auto& stage : stages_) {
        if (stage.completed) {
            oss << ", " << stage.stage_name << ": " << formatDuration(stage.duration());
        }
    }
    return oss.str();
}

void OutputTracker::printSummary() const {
    std::ostringstream summary;
    summary << "\n=== Run Summary ===\n";
    summary << getFileTrackingSummary() << "\n";
    summary << getPipelineStatus() << "\n";
    summary << getTimingReport() << "\n";
    summary << "===================";
    logger_.info(summary.str());
}

void OutputTracker::printDetailedReport() const {
    std::ostringstream report;
    report << "\n=== Detailed Run Report ===\n";

    report << "\nPipeline Stages:\n";
    for (const auto& stage : stages_) {
        report << "  " << stage.stage_name;
        if (stage.completed) {
            report << " [" << formatDuration(stage.duration()) << "]";
            if (!stage.successful) {
                report << " FAILED: " << stage.error_message;
            }
        } else {
            report << " [IN PROGRESS]";
        }
        report << "\n";

        for (const auto& [key, value] : stage.stage_data) {
            report << "    " << key << ": " << value << "\n";
        }
    }

    report << "\nWritten Files:\n";
    for (const auto& file : tracked_files_) {
        report << "  " << file.filename << " (" << file.format << ")";
        if (file.generation_successful) {
            report << " [" << formatFileSize(file.file_size_bytes) << "]";
        } else {
            report << " [FAILED: " << file.error_message << "]";
        }
        report << "\n";
    }

    report << "===========================";
    logger_.detailed(report.str());
}

size_t OutputTracker::getCompletedStageCount() const {
    return std::count_if(stages_.begin(), stages_.end(),
                         [](const PipelineStage& stage) { return stage.completed; });
}

void OutputTracker::clear() {
    tracked_files_.clear();
    stages_.clear();
    tracking_start_time_ = std::chrono::steady_clock::now();
}

std::string OutputTracker::formatDuration(std::chrono::milliseconds duration) const {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
        return oss.str();
    } else {
        auto minutes = ms / 60000;
        auto seconds = (ms % 60000) / 1000;
        return std::to_string(minutes) + "m" + std::to_string(seconds) + "s";
    }
}

std::string OutputTracker::formatFileSize(size_t bytes) const {
    const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    int unit = 0;

    while (size >= 1024 && unit < 3) {
        size /= 1024;
        unit++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return oss.str();
}

PipelineStage* OutputTracker::findStage(const std::string& stage_name) {
    auto it = std::find_if(stages_.rbegin(), stages_.rend(),
                           [&stage_name](const PipelineStage& stage) { return stage.stage_name == stage_name; });
    return (it != stages_.rend()) ? &(*it) : nullptr;
}

} // namespace shade
