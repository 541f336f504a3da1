/**
 * @file InputValidator.hpp
 * @brief Up-front validation of a sunlight run configuration
 *
 * Collects every invalid or contradictory option before any input is
 * loaded and reports them together with suggested fixes.
 */

#pragma once

#include "terrace_shade.hpp"
#include <string>
#include <vector>
#include <optional>

namespace shade {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Validates a ShadeConfig
 */
class InputValidator {
public:
    InputValidator() = default;

    ValidationResult validate(const ShadeConfig& config) const;

private:
    std::optional<ParameterConflict> check_input_paths(const ShadeConfig& config) const;

    /**
     * @brief Ray step must be positive and no longer than the march
     */
    std::optional<ParameterConflict> check_ray_parameters(const ShadeConfig& config) const;

    std::optional<ParameterConflict> check_height_buffer(const ShadeConfig& config) const;

    /**
     * @brief Date, timezone and slot window must describe a non-empty schedule
     */
    std::optional<ParameterConflict> check_schedule(const ShadeConfig& config) const;

    std::optional<ParameterConflict> check_weather(const ShadeConfig& config) const;

    std::optional<ParameterConflict> check_reference_location(const ShadeConfig& config) const;

    std::optional<ParameterConflict> check_output(const ShadeConfig& config) const;
};

} // namespace shade
