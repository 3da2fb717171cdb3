/**
 * @file scalar_minimizer.cpp
 * @brief Shared pieces of the scalar minimizer interface
 */

#include "calibration/scalar_minimizer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace black_litterman
{
    namespace calibration
    {

        void MinimizerOptions::validate() const
        {
            if (max_iterations <= 0)
            {
                throw std::invalid_argument("max_iterations must be positive, got: " + std::to_string(max_iterations));
            }
            if (!(gradient_tolerance > 0.0) || !std::isfinite(gradient_tolerance))
            {
                throw std::invalid_argument("gradient_tolerance must be positive");
            }
            if (!(step_tolerance > 0.0) || !std::isfinite(step_tolerance))
            {
                throw std::invalid_argument("step_tolerance must be positive");
            }
            if (!std::isfinite(lower_bound))
            {
                throw std::invalid_argument("lower_bound must be finite");
            }
            if (std::isnan(upper_bound) || upper_bound <= lower_bound)
            {
                throw std::invalid_argument("upper_bound must be greater than lower_bound");
            }
        }

        MinimizationResult::MinimizationResult()
            : x(0.0),
              objective_value(0.0),
              success(false),
              iterations(0),
              function_evaluations(0)
        {
        }

        ScalarMinimizer::ScalarMinimizer(const MinimizerOptions &options)
            : options_(options)
        {
            options_.validate();
        }

        void ScalarMinimizer::set_options(const MinimizerOptions &options)
        {
            options.validate();
            options_ = options;
        }

        double ScalarMinimizer::project(double x) const
        {
            return std::min(std::max(x, options_.lower_bound), options_.upper_bound);
        }

    } // namespace calibration
} // namespace black_litterman
