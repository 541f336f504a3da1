/**
 * @file ShadeEngine.cpp
 * @brief Sunlight pipeline: inputs, slot table, parallel classification, reduce
 */

#include "terrace_shade.hpp"
#include "DsmRaster.hpp"
#include "HeightResolver.hpp"
#include "InputValidator.hpp"
#include "Logger.hpp"
#include "OutputTracker.hpp"
#include "ShadeErrors.hpp"
#include "ShadowRaytracer.hpp"
#include "SlotTable.hpp"
#include "SolarGeometry.hpp"
#include "TerraceRegistry.hpp"
#include "TimeSlots.hpp"
#include "WeatherService.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <chrono>
#include <sstream>

namespace shade {

namespace {

/// What one worker produced for one terrace
struct TerraceOutcome {
    std::optional<TerraceResult> result;
    std::optional<TerraceExclusion> exclusion;
    size_t rays_cast = 0;
    size_t ray_steps = 0;
};

} // namespace

// ============================================================================
// ShadeEngine::Impl - Private implementation
// ============================================================================

class ShadeEngine::Impl {
public:
    explicit Impl(const ShadeConfig& config)
        : config_(config),
          logger_("ShadeEngine"),
          output_tracker_(config.log_level >= 4) {
        logger_.setLogLevel(static_cast<LogLevel>(config_.log_level));
    }

    bool compute() {
        auto start_time = std::chrono::steady_clock::now();

        results_.clear();
        slots_.clear();
        summary_ = RunSummary();
        metrics_ = PerformanceMetrics();
        output_tracker_.clear();

        InputValidator validator;
        auto validation_result = validator.validate(config_);
        if (validation_result.has_errors()) {
            logger_.error(validation_result.format_error_message());
            return false;
        }

        const CivilDate date = config_.date.empty() ? CivilDate::today() : *CivilDate::parse(config_.date);
        date_ = date.to_string();
        logger_.info("Computing sunlight for " + date_ + " (" + config_.timezone + ")");

        output_tracker_.startStage("input_loading");
        load_inputs();
        output_tracker_.completeStage("input_loading");

        output_tracker_.startStage("slot_table");
        build_slot_table(date);
        output_tracker_.completeStage("slot_table");

        output_tracker_.startStage("terrace_processing");
        process_terraces();
        output_tracker_.completeStage("terrace_processing");

        metrics_.input_loading_time = output_tracker_.getStageDuration("input_loading");
        metrics_.slot_table_time = output_tracker_.getStageDuration("slot_table");
        metrics_.processing_time = output_tracker_.getStageDuration("terrace_processing");
        metrics_.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        log_summary();
        return true;
    }

    const std::vector<TerraceResult>& get_results() const { return results_; }
    const std::vector<SlotConditions>& get_slots() const { return slots_; }
    const RunSummary& get_summary() const { return summary_; }
    const PerformanceMetrics& get_metrics() const { return metrics_; }
    const std::string& get_date() const { return date_; }
    OutputTracker& get_output_tracker() { return output_tracker_; }
    const OutputTracker& get_output_tracker() const { return output_tracker_; }
    const ShadeConfig& get_config() const { return config_; }

private:
    void load_inputs() {
        TerraceRegistry::Options registry_options;
        registry_options.id_field = config_.registry_id_field;
        TerraceRegistry registry(registry_options);
        terraces_ = registry.load(config_.registry_path);

        summary_.terraces_read = registry.report().features_read;
        summary_.duplicate_ids = registry.report().duplicate_ids;
        summary_.invalid_geometries = registry.report().invalid_geometries;

        // Only the part of the DSM the rays can reach is read
        std::optional<BoundingBox> area_of_interest;
        if (!terraces_.empty()) {
            area_of_interest = TerraceRegistry::bounds(terraces_);
        } else {
            logger_.warning("Terrace registry is empty");
        }
        const double margin = config_.max_ray_distance_m + config_.height_buffer_radius_m + config_.ray_step_m;
        dsm_ = DsmRaster::open(config_.dsm_path, area_of_interest, margin);

        output_tracker_.addStageData("input_loading", "terraces", std::to_string(terraces_.size()));
        output_tracker_.addStageData("input_loading", "dsm_size",
                                     std::to_string(dsm_->width()) + "x" + std::to_string(dsm_->height()));
    }

    void build_slot_table(const CivilDate& date) {
        const UtcOffsetRule zone = UtcOffsetRule::parse(config_.timezone);
        const auto slots = build_time_slots(config_.slot_start, config_.slot_end, config_.slot_interval_minutes);

        std::optional<CloudCoverTable> clouds;
        try {
            switch (config_.weather_source) {
            case ShadeConfig::WeatherSource::OPEN_METEO: {
                WeatherService::Options weather_options;
                weather_options.api_url = config_.weather_url;
                weather_options.timeout_seconds = config_.weather_timeout_seconds;
                WeatherService service(weather_options);
                clouds = service.fetch(config_.reference_location, date);
                break;
            }
            case ShadeConfig::WeatherSource::FILE:
                clouds = WeatherService::load_file(config_.weather_file);
                break;
            case ShadeConfig::WeatherSource::NONE:
                logger_.info("Weather adjustment disabled");
                break;
            }
        } catch (const WeatherLookupError& e) {
            logger_.warning(std::string(e.what()) + ", results are not weather-adjusted");
        }

        SolarGeometry::Options solar_options;
        solar_options.apply_refraction = config_.apply_refraction;
        SolarGeometry solar(solar_options);

        slots_ = SlotTable::build(date, zone, slots, solar, config_.reference_location,
                                  clouds ? &*clouds : nullptr);
        summary_.weather_unadjusted_slots = SlotTable::weather_unadjusted_keys(slots_);

        output_tracker_.addStageData("slot_table", "slots", std::to_string(slots_.size()));
        output_tracker_.addStageData("slot_table", "weather_unadjusted",
                                     std::to_string(summary_.weather_unadjusted_slots.size()));
    }

    // Runs on TBB workers
    TerraceOutcome process_terrace(const Terrace& source, const std::optional<RasterPoint>& position,
                                   const HeightResolver& resolver, const ShadowRaytracer& raytracer) const {
        TerraceOutcome outcome;

        try {
            if (!position) {
                throw OutOfCoverageError("terrace " + source.id + " cannot be mapped into the DSM");
            }

            const WeatherFilter filter(config_.cloud_cover_threshold_pct);

            TerraceResult result;
            result.terrace = source;
            resolver.resolve(result.terrace, *position);
            result.records.reserve(slots_.size());

            for (size_t s = 0; s < slots_.size(); ++s) {
                const SlotConditions& conditions = slots_[s];
                ClassificationRecord record;
                record.slot_index = s;

                // Night: shaded, no ray
                if (conditions.sun.is_up()) {
                    RayTraceResult trace = raytracer.trace(result.terrace, conditions.sun);
                    outcome.rays_cast++;
                    outcome.ray_steps += trace.steps;
                    record.geometric_sunlit = trace.sunlit;
                    record.coverage_limited = trace.coverage_limited;
                    record.obstruction = trace.obstruction;
                }
                record.is_sunlit = filter.apply(record.geometric_sunlit, conditions.cloud_cover_pct);
                result.records.push_back(record);
            }

            outcome.result = std::move(result);
        } catch (const OutOfCoverageError& e) {
            Logger logger("ShadeEngine");
            logger.warning("Terrace " + source.id + " excluded: " + e.what());
            outcome.exclusion = TerraceExclusion{source.id, "out_of_coverage", e.what()};
        } catch (const std::exception& e) {
            Logger logger("ShadeEngine");
            logger.error("Terrace " + source.id + " failed: " + e.what());
            outcome.exclusion = TerraceExclusion{source.id, "processing_error", e.what()};
        }

        return outcome;
    }

    void process_terraces() {
        // Coordinate transformations are not thread-safe: map every terrace up front
        std::vector<std::optional<RasterPoint>> positions;
        positions.reserve(terraces_.size());
        for (const auto& terrace : terraces_) {
            positions.push_back(dsm_->to_raster(terrace.location));
        }

        HeightResolver::Options height_options;
        height_options.buffer_radius_m = config_.height_buffer_radius_m;
        const HeightResolver resolver(*dsm_, height_options);

        ShadowRaytracer::Options ray_options;
        ray_options.step_m = config_.ray_step_m;
        ray_options.max_distance_m = config_.max_ray_distance_m;
        ray_options.locate_obstructions = false;
        const ShadowRaytracer raytracer(*dsm_, ray_options);

        std::vector<TerraceOutcome> outcomes(terraces_.size());

        auto run_range = [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i < range.end(); ++i) {
                outcomes[i] = process_terrace(terraces_[i], positions[i], resolver, raytracer);
            }
        };

        if (config_.parallel_processing && terraces_.size() > 1) {
            const int concurrency = config_.num_threads > 0 ? config_.num_threads : tbb::task_arena::automatic;
            tbb::task_arena arena(concurrency);
            logger_.detailed("Classifying " + std::to_string(terraces_.size()) + " terraces on " +
                             std::to_string(arena.max_concurrency()) + " threads");
            arena.execute([&] {
                tbb::parallel_for(tbb::blocked_range<size_t>(0, terraces_.size()), run_range);
            });
        } else {
            logger_.detailed("Classifying " + std::to_string(terraces_.size()) + " terraces sequentially");
            run_range(tbb::blocked_range<size_t>(0, terraces_.size()));
        }

        // Reduce in registry order
        summary_.sunlit_per_slot.assign(slots_.size(), 0);
        for (auto& outcome : outcomes) {
            metrics_.rays_cast += outcome.rays_cast;
            metrics_.ray_steps += outcome.ray_steps;

            if (outcome.exclusion) {
                if (outcome.exclusion->reason == "out_of_coverage") {
                    summary_.out_of_coverage++;
                } else {
                    summary_.processing_errors++;
                }
                summary_.exclusions.push_back(*outcome.exclusion);
                continue;
            }
            if (!outcome.result) {
                continue;
            }
            for (auto& record : outcome.result->records) {
                if (record.is_sunlit) {
                    summary_.sunlit_per_slot[record.slot_index]++;
                }
                if (record.obstruction) {
                    record.obstruction->location = dsm_->to_geo(record.obstruction->position);
                }
            }
            results_.push_back(std::move(*outcome.result));
        }
        summary_.terraces_classified = results_.size();

        output_tracker_.addStageData("terrace_processing", "classified", std::to_string(results_.size()));
        output_tracker_.addStageData("terrace_processing", "rays_cast", std::to_string(metrics_.rays_cast));
    }

    void log_summary() const {
        std::ostringstream msg;
        msg << "Classified " << summary_.terraces_classified << " of " << summary_.terraces_read
            << " terraces over " << slots_.size() << " slots";
        logger_.info(msg.str());

        if (summary_.out_of_coverage || summary_.processing_errors || summary_.duplicate_ids ||
            summary_.invalid_geometries) {
            std::ostringstream issues;
            issues << "Excluded: " << summary_.out_of_coverage << " out_of_coverage, "
                   << summary_.processing_errors << " processing_error, "
                   << summary_.duplicate_ids << " duplicate_id, "
                   << summary_.invalid_geometries << " invalid_geometry";
            logger_.warning(issues.str());
        }
        if (!summary_.weather_unadjusted_slots.empty()) {
            logger_.warning(std::to_string(summary_.weather_unadjusted_slots.size()) +
                            " slots are not weather-adjusted");
        }

        std::ostringstream perf;
        perf << "Rays cast: " << metrics_.rays_cast << ", samples: " << metrics_.ray_steps
             << ", processing time: " << metrics_.processing_time.count() << " ms";
        logger_.detailed(perf.str());
    }

    ShadeConfig config_;
    Logger logger_;
    OutputTracker output_tracker_;

    std::string date_;
    std::vector<Terrace> terraces_;
    std::unique_ptr<DsmRaster> dsm_;
    std::vector<SlotConditions> slots_;
    std::vector<TerraceResult> results_;
    RunSummary summary_;
    PerformanceMetrics metrics_;
};

// ============================================================================
// ShadeEngine - Public interface
// ============================================================================

ShadeEngine::ShadeEngine(const ShadeConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

ShadeEngine::~ShadeEngine() = default;

bool ShadeEngine::compute() {
    return impl_->compute();
}

const std::vector<TerraceResult>& ShadeEngine::get_results() const {
    return impl_->get_results();
}

const std::vector<SlotConditions>& ShadeEngine::get_slots() const {
    return impl_->get_slots();
}

const RunSummary& ShadeEngine::get_summary() const {
    return impl_->get_summary();
}

const PerformanceMetrics& ShadeEngine::get_metrics() const {
    return impl_->get_metrics();
}

const std::string& ShadeEngine::get_date() const {
    return impl_->get_date();
}

OutputTracker& ShadeEngine::get_output_tracker() {
    return impl_->get_output_tracker();
}

const OutputTracker& ShadeEngine::get_output_tracker() const {
    return impl_->get_output_tracker();
}

const ShadeConfig& ShadeEngine::get_config() const {
    return impl_->get_config();
}

} // namespace shade
