/**
 * @file confidence_calibrator.cpp
 * @brief Implementation of per-view confidence calibration
 */

#include "calibration/confidence_calibrator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace black_litterman
{
    namespace calibration
    {

        nlohmann::json CalibrationResult::to_json() const
        {
            nlohmann::json j;
            j["view_id"] = view_id;
            if (std::isfinite(variance))
            {
                j["variance"] = variance;
            }
            else
            {
                j["variance"] = "inf";
            }
            j["confidence"] = confidence;
            j["iterations"] = iterations;
            j["objective_value"] = objective_value;
            j["message"] = message;
            return j;
        }

        std::string CalibrationResult::summary(bool detailed) const
        {
            std::ostringstream oss;
            oss << std::setw(16) << std::left << view_id
                << " confidence " << std::fixed << std::setprecision(2) << confidence
                << "  variance ";
            if (std::isfinite(variance))
            {
                oss << std::scientific << std::setprecision(4) << variance;
            }
            else
            {
                oss << "inf";
            }

            if (detailed)
            {
                oss << "\n    iterations: " << iterations
                    << ", objective: " << std::scientific << std::setprecision(3) << objective_value
                    << ", status: " << message;
            }
            return oss.str();
        }

        ConfidenceCalibrator::ConfidenceCalibrator(optimizer::BlackLittermanSolver solver,
                                                   std::shared_ptr<const ScalarMinimizer> minimizer,
                                                   double initial_guess,
                                                   bool parallel)
            : solver_(std::move(solver)),
              minimizer_(std::move(minimizer)),
              initial_guess_(initial_guess),
              parallel_(parallel)
        {
            if (!minimizer_)
            {
                throw std::invalid_argument("ConfidenceCalibrator requires a minimizer");
            }
            if (!std::isfinite(initial_guess_) || initial_guess_ < 0.0)
            {
                throw std::invalid_argument("Initial guess must be finite and non-negative, got: " +
                                            std::to_string(initial_guess_));
            }
        }

        ConfidenceCalibrator::ViewProblem ConfidenceCalibrator::build_problem(
            const views::View &view,
            const LabelledVector &market_weights,
            const LabelledMatrix &market_cov,
            const std::vector<std::string> &asset_universe) const
        {
            ViewProblem problem;
            problem.market_weights = market_weights.align_to(asset_universe).values;
            problem.market_cov = market_cov.align_to(asset_universe, asset_universe).values;
            problem.pick = view.get_view_data_frame(asset_universe);
            problem.q = Eigen::VectorXd::Constant(1, view.out_performance());

            double pick_variance = (problem.pick * problem.market_cov * problem.pick.transpose()).value();
            problem.prior_variance = solver_.tau() * pick_variance;

            if (!(problem.prior_variance > 0.0))
            {
                throw SingularMatrix("view '" + view.id() + "' has prior variance tau * p Sigma p^T = " +
                                     std::to_string(problem.prior_variance));
            }

            // Omega = 0: the view is held with certainty
            Eigen::MatrixXd zero_cov = Eigen::MatrixXd::Zero(1, 1);
            problem.full_weights = solver_.solve_raw(problem.market_weights,
                                                     problem.market_cov,
                                                     problem.pick,
                                                     zero_cov,
                                                     problem.q);

            problem.target_weights = problem.market_weights +
                                     view.confidence() * (problem.full_weights - problem.market_weights);
            return problem;
        }

        LabelledVector ConfidenceCalibrator::get_view_target_weights(
            const views::View &view,
            const LabelledVector &market_weights,
            const LabelledMatrix &market_cov,
            const std::vector<std::string> &asset_universe) const
        {
            ViewProblem problem = build_problem(view, market_weights, market_cov, asset_universe);
            return LabelledVector("target", asset_universe, problem.target_weights);
        }

        CalibrationResult ConfidenceCalibrator::calibrate_view(
            const views::View &view,
            const LabelledVector &market_weights,
            const LabelledMatrix &market_cov,
            const std::vector<std::string> &asset_universe) const
        {
            ViewProblem problem = build_problem(view, market_weights, market_cov, asset_universe);

            CalibrationResult result;
            result.view_id = view.id();
            result.confidence = view.confidence();
            result.target_weights = LabelledVector("target", asset_universe, problem.target_weights);
            result.full_confidence_weights = LabelledVector("full_confidence", asset_universe, problem.full_weights);

            if (view.confidence() == 0.0)
            {
                result.variance = std::numeric_limits<double>::infinity();
                result.message = "Zero confidence: view carries no information";
                return result;
            }

            Eigen::VectorXd shift = problem.full_weights - problem.market_weights;
            double shift_norm_sq = shift.squaredNorm();
            double scale = std::max(1.0, problem.market_weights.squaredNorm());

            if (shift_norm_sq <= std::numeric_limits<double>::epsilon() *
                                     std::numeric_limits<double>::epsilon() * scale)
            {
                result.variance = initial_guess_ * problem.prior_variance;
                result.message = "View does not move the weights; initial guess kept";
                return result;
            }

            ScalarObjective objective = [this, &problem, shift_norm_sq](double scaled_variance)
            {
                Eigen::MatrixXd omega = Eigen::MatrixXd::Constant(1, 1, scaled_variance * problem.prior_variance);
                Eigen::VectorXd posterior = solver_.solve_raw(problem.market_weights,
                                                              problem.market_cov,
                                                              problem.pick,
                                                              omega,
                                                              problem.q);
                return (posterior - problem.target_weights).squaredNorm() / shift_norm_sq;
            };

            MinimizationResult search = minimizer_->minimize(objective, initial_guess_);

            if (!search.success)
            {
                throw CalibrationNonConvergence(view.id(), search.message + " after " +
                                                               std::to_string(search.iterations) + " iterations");
            }
            if (!std::isfinite(search.x) || search.x < 0.0)
            {
                throw CalibrationNonConvergence(view.id(), "search returned variance " + std::to_string(search.x));
            }

            result.variance = search.x * problem.prior_variance;
            result.iterations = search.iterations;
            result.objective_value = search.objective_value;
            result.message = search.message;
            return result;
        }

        std::vector<CalibrationResult> ConfidenceCalibrator::calibrate_views(
            const views::ViewCollection &views,
            const LabelledVector &market_weights,
            const LabelledMatrix &market_cov,
            const std::vector<std::string> &asset_universe) const
        {
            const auto &all_views = views.get_all_views();

            std::vector<CalibrationResult> results;
            results.reserve(all_views.size());

            if (!parallel_ || all_views.size() < 2)
            {
                for (const auto &view : all_views)
                {
                    results.push_back(calibrate_view(view, market_weights, market_cov, asset_universe));
                }
                return results;
            }

            std::vector<std::future<CalibrationResult>> tasks;
            tasks.reserve(all_views.size());
            for (const auto &view : all_views)
            {
                tasks.push_back(std::async(std::launch::async,
                                           [this, view, market_weights, market_cov, asset_universe]()
                                           {
                                               return calibrate_view(view, market_weights, market_cov, asset_universe);
                                           }));
            }

            // get() rethrows; remaining tasks are joined by their futures
            for (auto &task : tasks)
            {
                results.push_back(task.get());
            }
            return results;
        }

        LabelledMatrix ConfidenceCalibrator::to_view_covariance(const std::vector<CalibrationResult> &results)
        {
            std::vector<std::string> ids;
            Eigen::VectorXd variances(static_cast<Eigen::Index>(results.size()));
            for (size_t i = 0; i < results.size(); ++i)
            {
                ids.push_back(results[i].view_id);
                variances(static_cast<Eigen::Index>(i)) = results[i].variance;
            }
            return LabelledMatrix::diagonal(LabelledVector("view_variance", ids, variances));
        }

        LabelledMatrix ConfidenceCalibrator::calibrate(const views::ViewCollection &views,
                                                       const LabelledVector &market_weights,
                                                       const LabelledMatrix &market_cov,
                                                       const std::vector<std::string> &asset_universe) const
        {
            return to_view_covariance(calibrate_views(views, market_weights, market_cov, asset_universe));
        }

    } // namespace calibration
} // namespace black_litterman
