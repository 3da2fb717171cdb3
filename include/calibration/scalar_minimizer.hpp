/**
 * @file scalar_minimizer.hpp
 * @brief Abstract interface for bounded one-dimensional minimization
 *
 * Strategies minimise a scalar objective over [lower_bound, upper_bound]
 * from an initial guess. The calibration engine only depends on this
 * interface, so the search method can be swapped without touching the
 * weight solver.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include <functional>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

namespace black_litterman
{
    namespace calibration
    {

        /**
         * @brief Scalar objective function
         */
        using ScalarObjective = std::function<double(double)>;

        /**
         * @struct MinimizerOptions
         * @brief Options shared by scalar minimizers
         */
        struct MinimizerOptions
        {
            int max_iterations = 200;                                        ///< Maximum iterations
            double gradient_tolerance = 1e-10;                               ///< Projected gradient tolerance
            double step_tolerance = 1e-12;                                   ///< Relative step / bracket tolerance
            double lower_bound = 0.0;                                        ///< Feasible region lower bound
            double upper_bound = std::numeric_limits<double>::infinity();    ///< Feasible region upper bound
            bool verbose = false;                                            ///< Print progress

            /**
             * @brief Validate options
             * @throws std::invalid_argument if options are inconsistent
             */
            void validate() const;
        };

        /**
         * @struct MinimizationResult
         * @brief Result from a scalar minimizer
         */
        struct MinimizationResult
        {
            double x;                 ///< Best point found
            double objective_value;   ///< Objective at x
            bool success;             ///< Convergence achieved
            int iterations;           ///< Number of iterations
            int function_evaluations; ///< Objective evaluations
            std::string message;      ///< Status message

            /**
             * @brief Default constructor
             */
            MinimizationResult();
        };

        /**
         * @class ScalarMinimizer
         * @brief Abstract base class for 1-D minimization strategies
         *
         * Usage Example:
         * @code
         * QuasiNewtonMinimizer minimizer;
         * auto result = minimizer.minimize([](double x) { return (x - 2.0) * (x - 2.0); }, 0.1);
         * @endcode
         */
        class ScalarMinimizer
        {
        public:
            virtual ~ScalarMinimizer() = default;

            /**
             * @brief Minimise objective from an initial guess
             * @param objective Function to minimise
             * @param initial_guess Starting point (clamped into the bounds)
             * @return Result; success is false when the search did not converge
             *
             * @note Exceptions raised by the objective propagate unchanged.
             */
            virtual MinimizationResult minimize(const ScalarObjective &objective,
                                                double initial_guess) const = 0;

            /**
             * @brief Get minimizer name
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Get minimizer parameters as JSON
             */
            virtual nlohmann::json get_parameters() const = 0;

            const MinimizerOptions &get_options() const { return options_; }

            /**
             * @brief Replace options
             * @throws std::invalid_argument if options are invalid
             */
            void set_options(const MinimizerOptions &options);

        protected:
            explicit ScalarMinimizer(const MinimizerOptions &options);

            /**
             * @brief Clamp x into [lower_bound, upper_bound]
             */
            double project(double x) const;

            MinimizerOptions options_; ///< Minimizer configuration
        };

    } // namespace calibration
} // namespace black_litterman
