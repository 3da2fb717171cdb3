/**
 * @file golden_section_minimizer.hpp
 * @brief Derivative-free golden-section search on a finite interval
 *
 * Shrinks [lower_bound, upper_bound] by the inverse golden ratio on
 * each iteration, keeping the sub-interval that holds the smaller of
 * the two interior points. Assumes the objective is unimodal on the
 * interval.
 *
 * A result pressed against upper_bound while the objective is still
 * decreasing there is reported as a failure.
 */

#pragma once

#include "calibration/scalar_minimizer.hpp"

namespace black_litterman
{
    namespace calibration
    {

        /**
         * @class GoldenSectionMinimizer
         * @brief Bracketing 1-D minimizer
         *
         * Requires a finite upper bound.
         */
        class GoldenSectionMinimizer : public ScalarMinimizer
        {
        public:
            /**
             * @brief Constructor
             * @param options Minimizer options (upper_bound must be finite)
             * @throws std::invalid_argument if options are invalid
             */
            explicit GoldenSectionMinimizer(const MinimizerOptions &options);

            ~GoldenSectionMinimizer() override = default;

            MinimizationResult minimize(const ScalarObjective &objective,
                                        double initial_guess) const override;

            std::string get_name() const override;
            nlohmann::json get_parameters() const override;
        };

    } // namespace calibration
} // namespace black_litterman
