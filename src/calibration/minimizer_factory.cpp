/**
 * @file minimizer_factory.cpp
 * @brief Implementation of minimizer factory
 */

#include "calibration/minimizer_factory.hpp"
#include "calibration/golden_section_minimizer.hpp"
#include "calibration/quasi_newton_minimizer.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace black_litterman
{
    namespace calibration
    {

        // CalibrationConfig implementation
        CalibrationConfig CalibrationConfig::from_json(const ConfigJson &j)
        {
            CalibrationConfig config;

            if (!j.is_object())
            {
                throw ConfigurationError("'calibration' must be an object");
            }

            if (j.contains("method"))
            {
                if (!j["method"].is_string())
                {
                    throw ConfigurationError("'calibration.method' must be a string");
                }
                config.method = j["method"].get<std::string>();
            }

            if (j.contains("max_iterations"))
            {
                if (!j["max_iterations"].is_number_integer())
                {
                    throw ConfigurationError("'calibration.max_iterations' must be an integer");
                }
                config.max_iterations = j["max_iterations"].get<int>();
            }

            if (j.contains("tolerance"))
            {
                if (!j["tolerance"].is_number())
                {
                    throw ConfigurationError("'calibration.tolerance' must be a number");
                }
                config.tolerance = j["tolerance"].get<double>();
            }

            if (j.contains("initial_guess"))
            {
                if (!j["initial_guess"].is_number())
                {
                    throw ConfigurationError("'calibration.initial_guess' must be a number");
                }
                config.initial_guess = j["initial_guess"].get<double>();
            }

            if (j.contains("upper_bound"))
            {
                if (!j["upper_bound"].is_number())
                {
                    throw ConfigurationError("'calibration.upper_bound' must be a number");
                }
                config.upper_bound = j["upper_bound"].get<double>();
            }

            if (j.contains("parallel"))
            {
                if (!j["parallel"].is_boolean())
                {
                    throw ConfigurationError("'calibration.parallel' must be a boolean");
                }
                config.parallel = j["parallel"].get<bool>();
            }

            if (j.contains("verbose"))
            {
                if (!j["verbose"].is_boolean())
                {
                    throw ConfigurationError("'calibration.verbose' must be a boolean");
                }
                config.verbose = j["verbose"].get<bool>();
            }

            config.validate();
            return config;
        }

        CalibrationConfig CalibrationConfig::from_root_config(const ConfigJson &root)
        {
            if (root.is_object() && root.contains("calibration"))
            {
                return from_json(root["calibration"]);
            }
            return CalibrationConfig();
        }

        nlohmann::json CalibrationConfig::to_json() const
        {
            return nlohmann::json{
                {"method", method},
                {"max_iterations", max_iterations},
                {"tolerance", tolerance},
                {"initial_guess", initial_guess},
                {"upper_bound", upper_bound},
                {"parallel", parallel},
                {"verbose", verbose}};
        }

        void CalibrationConfig::validate() const
        {
            if (max_iterations <= 0)
            {
                throw ConfigurationError("'calibration.max_iterations' must be positive, got: " +
                                         std::to_string(max_iterations));
            }
            if (!std::isfinite(tolerance) || tolerance <= 0.0)
            {
                throw ConfigurationError("'calibration.tolerance' must be positive");
            }
            if (!std::isfinite(initial_guess) || initial_guess < 0.0)
            {
                throw ConfigurationError("'calibration.initial_guess' must be non-negative");
            }
            if (!std::isfinite(upper_bound) || upper_bound <= 0.0)
            {
                throw ConfigurationError("'calibration.upper_bound' must be positive and finite");
            }
        }

        // MinimizerFactory implementation
        std::string MinimizerFactory::normalize_method(const std::string &method)
        {
            std::string normalized = method;

            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            return normalized;
        }

        std::unique_ptr<ScalarMinimizer> MinimizerFactory::create(const CalibrationConfig &config)
        {
            std::string method = normalize_method(config.method);

            MinimizerOptions options;
            options.max_iterations = config.max_iterations;
            options.lower_bound = 0.0;
            options.verbose = config.verbose;

            if (method == "bfgs" || method == "quasi_newton")
            {
                options.gradient_tolerance = config.tolerance;
                return std::make_unique<QuasiNewtonMinimizer>(options);
            }
            else if (method == "golden_section")
            {
                options.step_tolerance = config.tolerance;
                options.upper_bound = config.upper_bound;
                return std::make_unique<GoldenSectionMinimizer>(options);
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown calibration method: '" + config.method + "'. "
                                                                      "Valid options: bfgs, quasi_newton, golden_section");
            }
        }

        std::unique_ptr<ScalarMinimizer> MinimizerFactory::create(const std::string &method)
        {
            CalibrationConfig config;
            config.method = method;
            return create(config);
        }

        std::vector<std::string> MinimizerFactory::get_supported_methods()
        {
            return {
                "bfgs",
                "quasi_newton",
                "golden_section"};
        }

    } // namespace calibration
} // namespace black_litterman
