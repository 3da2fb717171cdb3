/**
 * @file confidence_calibrator.hpp
 * @brief Turns view confidences into view variances
 *
 * For a single view with confidence c:
 *
 *     w_full   = posterior with Omega = 0          (view held with certainty)
 *     w_target = w_mkt + c * (w_full - w_mkt)
 *     omega*   = argmin_{omega >= 0} || w_post(omega) - w_target ||^2
 *
 * Each view is calibrated on its own: the solver only ever sees that
 * view's row of P and its entry of Q.
 *
 * The search runs in units of the view's prior variance tau * p Sigma p^T,
 * and on the objective divided by ||w_full - w_mkt||^2. Neither change
 * moves the minimiser; the reported variance is in plain units.
 */

#pragma once

#include "calibration/scalar_minimizer.hpp"
#include "core/labelled_data.hpp"
#include "optimizer/black_litterman_solver.hpp"
#include "views/view_collection.hpp"
#include <memory>
#include <string>
#include <vector>

namespace black_litterman
{
    namespace calibration
    {

        /**
         * @struct CalibrationResult
         * @brief Outcome of calibrating one view
         */
        struct CalibrationResult
        {
            std::string view_id;
            double variance = 0.0;        ///< Calibrated Omega entry (+inf for zero confidence)
            double confidence = 0.0;      ///< Confidence the variance was calibrated against
            int iterations = 0;           ///< Minimizer iterations
            double objective_value = 0.0; ///< Normalised squared distance to target
            LabelledVector target_weights;
            LabelledVector full_confidence_weights;
            std::string message;

            nlohmann::json to_json() const;

            /**
             * @brief One-line report: id, confidence and variance
             * @param detailed Append a second line with iterations, objective and status
             */
            std::string summary(bool detailed = false) const;
        };

        /**
         * @class ConfidenceCalibrator
         * @brief Per-view variance search around the weight solver
         *
         * Usage Example:
         * @code
         * auto minimizer = MinimizerFactory::create(config);
         * ConfidenceCalibrator calibrator(solver, std::move(minimizer));
         * LabelledMatrix omega = calibrator.calibrate(views, w_mkt, sigma, universe);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class ConfidenceCalibrator
        {
        public:
            /**
             * @brief Constructor
             * @param solver Weight solver used inside the objective
             * @param minimizer Search strategy
             * @param initial_guess Starting variance in prior-variance units (>= 0)
             * @param parallel Calibrate views concurrently
             * @throws std::invalid_argument if minimizer is null or initial_guess is invalid
             */
            ConfidenceCalibrator(optimizer::BlackLittermanSolver solver,
                                 std::shared_ptr<const ScalarMinimizer> minimizer,
                                 double initial_guess = 0.1,
                                 bool parallel = false);

            /**
             * @brief Calibrate a single view
             * @param view View to calibrate
             * @param market_weights Market weights (any order of the universe)
             * @param market_cov Annualised covariance (any order of the universe)
             * @param asset_universe Asset ordering used for every computation
             * @return Calibration details, weights aligned to asset_universe
             * @throws DimensionMismatch if labels disagree with the universe
             * @throws SingularMatrix if the view has no prior variance
             * @throws CalibrationNonConvergence if the search fails
             */
            CalibrationResult calibrate_view(const views::View &view,
                                             const LabelledVector &market_weights,
                                             const LabelledMatrix &market_cov,
                                             const std::vector<std::string> &asset_universe) const;

            /**
             * @brief Weights the calibrated posterior should reproduce
             *
             * w_mkt + confidence * (w_full - w_mkt), named "target".
             */
            LabelledVector get_view_target_weights(const views::View &view,
                                                   const LabelledVector &market_weights,
                                                   const LabelledMatrix &market_cov,
                                                   const std::vector<std::string> &asset_universe) const;

            /**
             * @brief Calibrate every view of a collection
             * @return Results in collection order
             */
            std::vector<CalibrationResult> calibrate_views(const views::ViewCollection &views,
                                                           const LabelledVector &market_weights,
                                                           const LabelledMatrix &market_cov,
                                                           const std::vector<std::string> &asset_universe) const;

            /**
             * @brief Diagonal view covariance for a collection
             * @return Omega labelled by view id, off-diagonals zero
             */
            LabelledMatrix calibrate(const views::ViewCollection &views,
                                     const LabelledVector &market_weights,
                                     const LabelledMatrix &market_cov,
                                     const std::vector<std::string> &asset_universe) const;

            /**
             * @brief Build Omega from per-view results
             */
            static LabelledMatrix to_view_covariance(const std::vector<CalibrationResult> &results);

            const optimizer::BlackLittermanSolver &get_solver() const { return solver_; }
            const ScalarMinimizer &get_minimizer() const { return *minimizer_; }
            double get_initial_guess() const { return initial_guess_; }
            bool is_parallel() const { return parallel_; }

        private:
            /**
             * @brief Single-view inputs aligned to the universe
             */
            struct ViewProblem
            {
                Eigen::VectorXd market_weights;
                Eigen::MatrixXd market_cov;
                Eigen::MatrixXd pick;        ///< 1 x N
                Eigen::VectorXd q;           ///< size 1
                double prior_variance = 0.0; ///< tau * p Sigma p^T
                Eigen::VectorXd full_weights;
                Eigen::VectorXd target_weights;
            };

            ViewProblem build_problem(const views::View &view,
                                      const LabelledVector &market_weights,
                                      const LabelledMatrix &market_cov,
                                      const std::vector<std::string> &asset_universe) const;

            optimizer::BlackLittermanSolver solver_;
            std::shared_ptr<const ScalarMinimizer> minimizer_;
            double initial_guess_;
            bool parallel_;
        };

    } // namespace calibration
} // namespace black_litterman
