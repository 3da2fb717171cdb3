/**
 * @file minimizer_factory.hpp
 * @brief Factory for creating calibration minimizers from configuration
 *
 * Reads the optional "calibration" section of the configuration file:
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "calibration": {
 *     "method": "bfgs",
 *     "max_iterations": 200,
 *     "tolerance": 1e-10,
 *     "initial_guess": 0.1,
 *     "parallel": false
 *   }
 * }
 * @endcode
 */

#pragma once

#include "calibration/scalar_minimizer.hpp"
#include "settings/calculation_settings.hpp"
#include <memory>
#include <string>
#include <vector>

namespace black_litterman
{
    namespace calibration
    {

        /**
         * @struct CalibrationConfig
         * @brief Parameters of the per-view variance search
         */
        struct CalibrationConfig
        {
            /**
             * @brief Search method
             *
             * Supported values (case-insensitive):
             * - "bfgs" or "quasi_newton": QuasiNewtonMinimizer
             * - "golden_section": GoldenSectionMinimizer
             */
            std::string method = "bfgs";

            int max_iterations = 200;

            /**
             * @brief Gradient tolerance for "bfgs", bracket tolerance for "golden_section"
             */
            double tolerance = 1e-10;

            /**
             * @brief Starting variance, in units of the view's prior variance tau * p Sigma p^T
             */
            double initial_guess = 0.1;

            /**
             * @brief Search ceiling for "golden_section", same units as initial_guess
             */
            double upper_bound = 1e6;

            bool parallel = false; ///< Calibrate views concurrently
            bool verbose = false;  ///< Trace minimizer iterations

            /**
             * @brief Create configuration from the "calibration" section
             * @param j Section object; missing keys keep their defaults
             * @return Validated configuration
             * @throws ConfigurationError if a key has the wrong type or an invalid value
             */
            static CalibrationConfig from_json(const ConfigJson &j);

            /**
             * @brief Read the optional "calibration" section of a root configuration
             * @return Defaults when the section is absent
             */
            static CalibrationConfig from_root_config(const ConfigJson &root);

            nlohmann::json to_json() const;

            /**
             * @brief Check value ranges
             * @throws ConfigurationError on an invalid value
             */
            void validate() const;
        };

        /**
         * @class MinimizerFactory
         * @brief Creates ScalarMinimizer strategies
         *
         * Usage Pattern:
         * @code
         * auto config = CalibrationConfig::from_root_config(root);
         * auto minimizer = MinimizerFactory::create(config);
         * auto result = minimizer->minimize(objective, config.initial_guess);
         * @endcode
         */
        class MinimizerFactory
        {
        public:
            /**
             * @brief Create minimizer from configuration
             * @throws std::invalid_argument if the method is unknown
             */
            static std::unique_ptr<ScalarMinimizer> create(const CalibrationConfig &config);

            /**
             * @brief Create minimizer from a method name with default settings
             */
            static std::unique_ptr<ScalarMinimizer> create(const std::string &method);

            static std::vector<std::string> get_supported_methods();

        private:
            static std::string normalize_method(const std::string &method);
        };

    } // namespace calibration
} // namespace black_litterman
