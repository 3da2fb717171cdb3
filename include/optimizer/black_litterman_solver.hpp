/**
 * @file black_litterman_solver.hpp
 * @brief Closed-form Black-Litterman posterior weights
 *
 * Blends market equilibrium weights with investor views:
 *
 *     M      = Omega / tau + P * Sigma * P^T          (k x k)
 *     adj    = Q / delta - P * Sigma * w_mkt
 *     w_post = w_mkt + P^T * M^-1 * adj
 *
 * where:
 * - w_mkt: market equilibrium weights (N x 1)
 * - Sigma: annualised asset covariance (N x N)
 * - P:     view pick matrix (k x N)
 * - Omega: diagonal view uncertainty (k x k)
 * - Q:     asserted view out-performance (k x 1)
 * - tau:   prior uncertainty scaling
 * - delta: risk aversion
 *
 * M is factorised with a full-pivot LU; a rank-deficient M raises
 * SingularMatrix. No pseudo-inverse fallback is attempted.
 */

#pragma once

#include "core/labelled_data.hpp"
#include "settings/calculation_settings.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>

namespace black_litterman
{
    namespace optimizer
    {

        /**
         * @class BlackLittermanSolver
         * @brief Pure Black-Litterman weight computation
         *
         * Omega diagonal entries must be >= 0. An entry of +infinity
         * means complete uncertainty: the view carries no information
         * and its row is left out of M, which is the exact limit of the
         * formula.
         *
         * Usage Example:
         * @code
         * BlackLittermanSolver solver(0.05, 2.5);
         * LabelledVector w = solver.solve(market_weights, market_cov, P, omega, Q);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class BlackLittermanSolver
        {
        public:
            /**
             * @brief Construct solver
             * @param tau Prior uncertainty scaling (> 0)
             * @param risk_aversion Risk aversion (> 0)
             * @throws std::invalid_argument if either parameter is not positive
             */
            BlackLittermanSolver(double tau, double risk_aversion);

            /**
             * @brief Build from session settings
             */
            static BlackLittermanSolver from_settings(const CalculationSettings &settings);

            /**
             * @brief Posterior weights from labelled inputs
             * @param market_weights Equilibrium weights, labelled by asset
             * @param market_cov Covariance, assets on both axes in the same order
             * @param view_matrix P, rows = view ids, columns = assets
             * @param view_cov Omega, view ids on both axes
             * @param view_out_performance Q, labelled by view id
             * @return Weights named "black_litterman", aligned to market_weights
             * @throws DimensionMismatch if any labels disagree
             * @throws std::invalid_argument if Omega has a negative, NaN or off-diagonal entry
             * @throws SingularMatrix if M is not invertible
             */
            LabelledVector solve(const LabelledVector &market_weights,
                                 const LabelledMatrix &market_cov,
                                 const LabelledMatrix &view_matrix,
                                 const LabelledMatrix &view_cov,
                                 const LabelledVector &view_out_performance) const;

            /**
             * @brief Posterior weights from unlabelled inputs
             *
             * Same contract as solve(), with size-based dimension checks.
             * Used in the calibration inner loop.
             */
            Eigen::VectorXd solve_raw(const Eigen::VectorXd &market_weights,
                                      const Eigen::MatrixXd &market_cov,
                                      const Eigen::MatrixXd &view_matrix,
                                      const Eigen::MatrixXd &view_cov,
                                      const Eigen::VectorXd &view_out_performance) const;

            double tau() const { return tau_; }
            double risk_aversion() const { return risk_aversion_; }

            std::string get_name() const;
            nlohmann::json get_parameters() const;

        private:
            double tau_;           ///< Prior uncertainty scaling
            double risk_aversion_; ///< Risk aversion

            static void validate_dimensions(const Eigen::VectorXd &market_weights,
                                            const Eigen::MatrixXd &market_cov,
                                            const Eigen::MatrixXd &view_matrix,
                                            const Eigen::MatrixXd &view_cov,
                                            const Eigen::VectorXd &view_out_performance);

            static void validate_view_covariance(const Eigen::MatrixXd &view_cov);
        };

    } // namespace optimizer
} // namespace black_litterman
