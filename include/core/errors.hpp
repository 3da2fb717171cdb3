/**
 * @file errors.hpp
 * @brief Exception types raised by the Black-Litterman engine
 *
 * Value errors derive from std::invalid_argument, numerical failures
 * from std::runtime_error, so callers that only know the standard
 * hierarchy still catch them.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace black_litterman
{

    /**
     * @class ConfigurationError
     * @brief Missing or malformed configuration key
     *
     * Raised while building CalculationSettings or CalibrationConfig.
     * No partially-configured object is ever returned.
     */
    class ConfigurationError : public std::invalid_argument
    {
    public:
        explicit ConfigurationError(const std::string &message)
            : std::invalid_argument("Configuration error: " + message)
        {
        }
    };

    /**
     * @class DimensionMismatch
     * @brief Labels of market data, view matrix or view vectors do not line up
     */
    class DimensionMismatch : public std::invalid_argument
    {
    public:
        explicit DimensionMismatch(const std::string &message)
            : std::invalid_argument("Dimension mismatch: " + message)
        {
        }
    };

    /**
     * @class SingularMatrix
     * @brief The view precision matrix M could not be inverted
     */
    class SingularMatrix : public std::runtime_error
    {
    public:
        explicit SingularMatrix(const std::string &message)
            : std::runtime_error("Singular matrix: " + message)
        {
        }
    };

    /**
     * @class CalibrationNonConvergence
     * @brief Variance search for a view failed to produce a usable value
     */
    class CalibrationNonConvergence : public std::runtime_error
    {
    public:
        CalibrationNonConvergence(const std::string &view_id, const std::string &message)
            : std::runtime_error("Calibration failed for view '" + view_id + "': " + message),
              view_id_(view_id)
        {
        }

        const std::string &view_id() const { return view_id_; }

    private:
        std::string view_id_;
    };

} // namespace black_litterman
