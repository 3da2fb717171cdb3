/**
 * @file golden_section_minimizer.cpp
 * @brief Implementation of golden-section search
 */

#include "calibration/golden_section_minimizer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace black_litterman
{
    namespace calibration
    {

        namespace
        {
            // 1 / phi
            const double kInvGolden = (std::sqrt(5.0) - 1.0) / 2.0;
        }

        GoldenSectionMinimizer::GoldenSectionMinimizer(const MinimizerOptions &options)
            : ScalarMinimizer(options)
        {
            if (!std::isfinite(options_.upper_bound))
            {
                throw std::invalid_argument("Golden-section search requires a finite upper_bound");
            }
        }

        std::string GoldenSectionMinimizer::get_name() const
        {
            return "GoldenSectionMinimizer";
        }

        nlohmann::json GoldenSectionMinimizer::get_parameters() const
        {
            nlohmann::json params;
            params["method"] = "golden_section";
            params["max_iterations"] = options_.max_iterations;
            params["step_tolerance"] = options_.step_tolerance;
            params["lower_bound"] = options_.lower_bound;
            params["upper_bound"] = options_.upper_bound;
            return params;
        }

        MinimizationResult GoldenSectionMinimizer::minimize(const ScalarObjective &objective,
                                                            double initial_guess) const
        {
            MinimizationResult result;

            double a = options_.lower_bound;
            double b = options_.upper_bound;

            double x1 = b - kInvGolden * (b - a);
            double x2 = a + kInvGolden * (b - a);
            double f1 = objective(x1);
            double f2 = objective(x2);
            int evaluations = 2;

            int iter = 0;
            for (; iter < options_.max_iterations; ++iter)
            {
                double mid = 0.5 * (a + b);
                if (b - a <= options_.step_tolerance * (1.0 + std::abs(mid)))
                {
                    result.success = true;
                    result.message = "Converged";
                    break;
                }

                if (f1 <= f2)
                {
                    b = x2;
                    x2 = x1;
                    f2 = f1;
                    x1 = b - kInvGolden * (b - a);
                    f1 = objective(x1);
                }
                else
                {
                    a = x1;
                    x1 = x2;
                    f1 = f2;
                    x2 = a + kInvGolden * (b - a);
                    f2 = objective(x2);
                }
                ++evaluations;

                if (options_.verbose)
                {
                    std::cout << "Iter " << iter << ": [" << a << ", " << b << "]\n";
                }
            }

            // Interior points never touch the ends of the interval
            double best_x = 0.5 * (a + b);
            double best_f = objective(best_x);
            double f_upper = objective(options_.upper_bound);
            evaluations += 2;

            if (f_upper < best_f)
            {
                best_x = options_.upper_bound;
                best_f = f_upper;
            }

            double edges[] = {options_.lower_bound, project(initial_guess)};
            for (double candidate : edges)
            {
                if (!std::isfinite(candidate))
                {
                    continue;
                }
                double f_candidate = objective(candidate);
                ++evaluations;
                if (f_candidate < best_f)
                {
                    best_x = candidate;
                    best_f = f_candidate;
                }
            }

            result.x = best_x;
            result.objective_value = best_f;
            result.iterations = iter;

            if (!result.success)
            {
                result.message = "Maximum iterations reached";
            }
            else
            {
                // Still decreasing at the ceiling: the minimum is outside the region
                const double ub = options_.upper_bound;
                const double h = std::max(options_.step_tolerance,
                                          std::sqrt(std::numeric_limits<double>::epsilon())) *
                                 std::max(1.0, std::abs(ub));
                if (ub - best_x <= h && ub - h >= options_.lower_bound)
                {
                    double f_inside = objective(ub - h);
                    ++evaluations;
                    if (f_inside > f_upper)
                    {
                        result.success = false;
                        result.message = "Minimum lies beyond the upper bound";
                    }
                }
            }

            result.function_evaluations = evaluations;

            return result;
        }

    } // namespace calibration
} // namespace black_litterman
