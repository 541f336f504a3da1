#pragma once

/**
 * @file ShadeErrors.hpp
 * @brief Exception types reported by the sunlight pipeline
 */

#include <stdexcept>
#include <string>

namespace shade {

/**
 * @brief Base class for all pipeline errors
 */
class ShadeError : public std::runtime_error {
public:
    explicit ShadeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief DSM or terrace registry missing or unreadable. Fatal.
 */
class InputNotFoundError : public ShadeError {
public:
    explicit InputNotFoundError(const std::string& message)
        : ShadeError("Input not found: " + message) {}
};

/**
 * @brief Terrace lies outside DSM coverage. The terrace is excluded.
 */
class OutOfCoverageError : public ShadeError {
public:
    explicit OutOfCoverageError(const std::string& message)
        : ShadeError("Out of coverage: " + message) {}
};

/**
 * @brief Cloud cover unavailable. The affected slots keep their geometric result.
 */
class WeatherLookupError : public ShadeError {
public:
    explicit WeatherLookupError(const std::string& message)
        : ShadeError("Weather lookup failed: " + message) {}
};

/**
 * @brief Output could not be written. Fatal, raised after computation.
 */
class SerializationError : public ShadeError {
public:
    explicit SerializationError(const std::string& message)
        : ShadeError("Serialization failed: " + message) {}
};

/**
 * @brief Invalid option value (date, time slot, timezone...)
 */
class ConfigurationError : public ShadeError {
public:
    explicit ConfigurationError(const std::string& message)
        : ShadeError("Configuration error: " + message) {}
};

} // namespace shade
