/**
 * @file quasi_newton_minimizer.cpp
 * @brief Implementation of the projected 1-D BFGS minimizer
 */

#include "calibration/quasi_newton_minimizer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace black_litterman
{
    namespace calibration
    {

        QuasiNewtonMinimizer::QuasiNewtonMinimizer(const MinimizerOptions &options)
            : ScalarMinimizer(options)
        {
        }

        std::string QuasiNewtonMinimizer::get_name() const
        {
            return "QuasiNewtonMinimizer";
        }

        nlohmann::json QuasiNewtonMinimizer::get_parameters() const
        {
            nlohmann::json params;
            params["method"] = "bfgs";
            params["max_iterations"] = options_.max_iterations;
            params["gradient_tolerance"] = options_.gradient_tolerance;
            params["step_tolerance"] = options_.step_tolerance;
            params["lower_bound"] = options_.lower_bound;
            if (std::isfinite(options_.upper_bound))
            {
                params["upper_bound"] = options_.upper_bound;
            }
            return params;
        }

        double QuasiNewtonMinimizer::compute_gradient(const ScalarObjective &objective,
                                                      double x,
                                                      double fx,
                                                      int &evaluations) const
        {
            const double h = std::sqrt(std::numeric_limits<double>::epsilon()) * std::max(1.0, std::abs(x));

            const bool can_step_down = x - h >= options_.lower_bound;
            const bool can_step_up = x + h <= options_.upper_bound;

            if (can_step_down && can_step_up)
            {
                double f_up = objective(x + h);
                double f_down = objective(x - h);
                evaluations += 2;
                return (f_up - f_down) / (2.0 * h);
            }

            if (can_step_up)
            {
                double f_up = objective(x + h);
                ++evaluations;
                return (f_up - fx) / h;
            }

            double f_down = objective(x - h);
            ++evaluations;
            return (fx - f_down) / h;
        }

        double QuasiNewtonMinimizer::projected_gradient(double x, double gradient) const
        {
            if (x <= options_.lower_bound && gradient > 0.0)
            {
                return 0.0;
            }
            if (x >= options_.upper_bound && gradient < 0.0)
            {
                return 0.0;
            }
            return gradient;
        }

        MinimizationResult QuasiNewtonMinimizer::minimize(const ScalarObjective &objective,
                                                          double initial_guess) const
        {
            MinimizationResult result;

            if (!std::isfinite(initial_guess))
            {
                result.x = initial_guess;
                result.objective_value = std::numeric_limits<double>::quiet_NaN();
                result.message = "Initial guess is not finite";
                return result;
            }

            double x = project(initial_guess);
            double fx = objective(x);
            int evaluations = 1;

            if (!std::isfinite(fx))
            {
                result.x = x;
                result.objective_value = fx;
                result.function_evaluations = evaluations;
                result.message = "Objective is not finite at the initial guess";
                return result;
            }

            double gradient = compute_gradient(objective, x, fx, evaluations);
            double inverse_curvature = 1.0;

            // Backtracking line search parameters
            const double rho = 0.5;
            const double c = 1e-4;
            const int max_backtracks = 40;

            for (int iter = 0; iter < options_.max_iterations; ++iter)
            {
                double pg = projected_gradient(x, gradient);

                // Converged when both the projected gradient and the
                // estimated distance to the minimum are negligible
                double newton_step = std::abs(inverse_curvature * pg);
                if (pg == 0.0 ||
                    (std::abs(pg) <= options_.gradient_tolerance &&
                     newton_step <= options_.step_tolerance * (1.0 + std::abs(x))))
                {
                    result.success = true;
                    result.message = "Converged";
                    result.iterations = iter;
                    break;
                }

                double direction = -inverse_curvature * gradient;

                bool accepted = false;
                double step = 1.0;
                double x_new = x;
                double f_new = fx;

                for (int i = 0; i < max_backtracks; ++i)
                {
                    double candidate = project(x + step * direction);
                    double f_candidate = objective(candidate);
                    ++evaluations;

                    // Armijo condition on the projected step
                    if (std::isfinite(f_candidate) &&
                        candidate != x &&
                        f_candidate <= fx + c * gradient * (candidate - x))
                    {
                        x_new = candidate;
                        f_new = f_candidate;
                        accepted = true;
                        break;
                    }

                    step *= rho;
                }

                if (!accepted)
                {
                    result.iterations = iter;
                    if (std::abs(pg) <= std::sqrt(options_.gradient_tolerance))
                    {
                        result.success = true;
                        result.message = "Converged (no further decrease possible)";
                    }
                    else
                    {
                        result.message = "Line search failed to decrease the objective";
                    }
                    break;
                }

                double s = x_new - x;
                double gradient_new = compute_gradient(objective, x_new, f_new, evaluations);
                double y = gradient_new - gradient;

                // Secant curvature update
                if (s * y > 0.0)
                {
                    inverse_curvature = s / y;
                }

                x = x_new;
                fx = f_new;
                gradient = gradient_new;

                if (options_.verbose)
                {
                    std::cout << "Iter " << iter << ": x = " << x << ", f = " << fx
                              << ", g = " << gradient << "\n";
                }

                if (std::abs(s) <= options_.step_tolerance * (1.0 + std::abs(x)))
                {
                    result.success = true;
                    result.message = "Converged (step below tolerance)";
                    result.iterations = iter + 1;
                    break;
                }
            }

            result.x = x;
            result.objective_value = fx;
            result.function_evaluations = evaluations;

            if (!result.success && result.message.empty())
            {
                result.message = "Maximum iterations reached";
                result.iterations = options_.max_iterations;
            }

            return result;
        }

    } // namespace calibration
} // namespace black_litterman
