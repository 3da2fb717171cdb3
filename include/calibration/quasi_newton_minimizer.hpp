/**
 * @file quasi_newton_minimizer.hpp
 * @brief Projected one-dimensional BFGS minimizer
 *
 * Minimises a smooth scalar objective over [lower_bound, upper_bound]:
 *
 * Algorithm Steps:
 * 1. Clamp the initial guess into the bounds
 * 2. Finite-difference gradient (central inside the region, one-sided at a bound)
 * 3. Quasi-Newton step d = -H * g, H the inverse curvature estimate (H0 = 1)
 * 4. Backtracking Armijo line search along the projected step
 * 5. Secant update H = s / y when the curvature condition s * y > 0 holds
 * 6. Repeat until the step is within tolerance, or the projected gradient
 *    is within gradient_tolerance and the Newton step H * g within
 *    step_tolerance * (1 + |x|)
 *
 * A line search that cannot decrease the objective ends the search;
 * the result counts as converged only if the projected gradient is
 * within sqrt(gradient_tolerance).
 */

#pragma once

#include "calibration/scalar_minimizer.hpp"

namespace black_litterman
{
    namespace calibration
    {

        /**
         * @class QuasiNewtonMinimizer
         * @brief Bounded 1-D BFGS with numerical derivatives
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class QuasiNewtonMinimizer : public ScalarMinimizer
        {
        public:
            /**
             * @brief Constructor
             * @param options Minimizer options
             * @throws std::invalid_argument if options are invalid
             */
            explicit QuasiNewtonMinimizer(const MinimizerOptions &options = MinimizerOptions());

            ~QuasiNewtonMinimizer() override = default;

            MinimizationResult minimize(const ScalarObjective &objective,
                                        double initial_guess) const override;

            /**
             * @brief Get minimizer name
             * @return "QuasiNewtonMinimizer"
             */
            std::string get_name() const override;

            nlohmann::json get_parameters() const override;

        private:
            /**
             * @brief Finite-difference derivative at x
             * @param fx Objective value at x (already evaluated)
             * @param evaluations Incremented per objective call
             */
            double compute_gradient(const ScalarObjective &objective,
                                    double x,
                                    double fx,
                                    int &evaluations) const;

            /**
             * @brief Gradient with components pushing out of the bounds zeroed
             */
            double projected_gradient(double x, double gradient) const;
        };

    } // namespace calibration
} // namespace black_litterman
