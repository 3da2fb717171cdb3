/**
 * @file black_litterman_solver.cpp
 * @brief Implementation of the Black-Litterman weight solver
 */

#include "optimizer/black_litterman_solver.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <vector>

namespace black_litterman
{
    namespace optimizer
    {

        BlackLittermanSolver::BlackLittermanSolver(double tau, double risk_aversion)
            : tau_(tau), risk_aversion_(risk_aversion)
        {
            if (!std::isfinite(tau) || tau <= 0.0)
            {
                throw std::invalid_argument("Tau must be positive, got: " + std::to_string(tau));
            }
            if (!std::isfinite(risk_aversion) || risk_aversion <= 0.0)
            {
                throw std::invalid_argument(
                    "Risk aversion must be positive, got: " + std::to_string(risk_aversion));
            }
        }

        BlackLittermanSolver BlackLittermanSolver::from_settings(const CalculationSettings &settings)
        {
            return BlackLittermanSolver(settings.tau(), settings.risk_aversion());
        }

        std::string BlackLittermanSolver::get_name() const
        {
            return "BlackLittermanSolver";
        }

        nlohmann::json BlackLittermanSolver::get_parameters() const
        {
            nlohmann::json params;
            params["solver_type"] = "BlackLitterman";
            params["tau"] = tau_;
            params["risk_aversion"] = risk_aversion_;
            return params;
        }

        // ============================================================================
        // Validation
        // ============================================================================

        void BlackLittermanSolver::validate_dimensions(const Eigen::VectorXd &market_weights,
                                                       const Eigen::MatrixXd &market_cov,
                                                       const Eigen::MatrixXd &view_matrix,
                                                       const Eigen::MatrixXd &view_cov,
                                                       const Eigen::VectorXd &view_out_performance)
        {
            const Eigen::Index n = market_weights.size();
            const Eigen::Index k = view_matrix.rows();

            if (market_cov.rows() != n || market_cov.cols() != n)
            {
                throw DimensionMismatch("covariance is " + std::to_string(market_cov.rows()) + "x" +
                                        std::to_string(market_cov.cols()) + " but there are " +
                                        std::to_string(n) + " market weights");
            }
            if (view_matrix.cols() != n)
            {
                throw DimensionMismatch("view matrix has " + std::to_string(view_matrix.cols()) +
                                        " columns but there are " + std::to_string(n) + " assets");
            }
            if (view_cov.rows() != k || view_cov.cols() != k)
            {
                throw DimensionMismatch("view covariance is " + std::to_string(view_cov.rows()) + "x" +
                                        std::to_string(view_cov.cols()) + " but there are " +
                                        std::to_string(k) + " views");
            }
            if (view_out_performance.size() != k)
            {
                throw DimensionMismatch("out-performance vector has " + std::to_string(view_out_performance.size()) +
                                        " entries but there are " + std::to_string(k) + " views");
            }
        }

        void BlackLittermanSolver::validate_view_covariance(const Eigen::MatrixXd &view_cov)
        {
            for (Eigen::Index i = 0; i < view_cov.rows(); ++i)
            {
                for (Eigen::Index j = 0; j < view_cov.cols(); ++j)
                {
                    double value = view_cov(i, j);
                    if (i == j)
                    {
                        if (std::isnan(value) || value < 0.0)
                        {
                            throw std::invalid_argument("View variance at index " + std::to_string(i) +
                                                        " must be non-negative, got: " + std::to_string(value));
                        }
                    }
                    else if (value != 0.0)
                    {
                        throw std::invalid_argument("View covariance must be diagonal; entry (" +
                                                    std::to_string(i) + ", " + std::to_string(j) + ") is " +
                                                    std::to_string(value));
                    }
                }
            }
        }

        // ============================================================================
        // Solve
        // ============================================================================

        LabelledVector BlackLittermanSolver::solve(const LabelledVector &market_weights,
                                                   const LabelledMatrix &market_cov,
                                                   const LabelledMatrix &view_matrix,
                                                   const LabelledMatrix &view_cov,
                                                   const LabelledVector &view_out_performance) const
        {
            require_same_labels(market_weights.labels, market_cov.row_labels, "covariance rows vs market weights");
            require_same_labels(market_weights.labels, market_cov.col_labels, "covariance columns vs market weights");
            require_same_labels(market_weights.labels, view_matrix.col_labels, "view matrix columns vs market weights");
            require_same_labels(view_matrix.row_labels, view_cov.row_labels, "view covariance rows vs view matrix");
            require_same_labels(view_matrix.row_labels, view_cov.col_labels, "view covariance columns vs view matrix");
            require_same_labels(view_matrix.row_labels, view_out_performance.labels, "out-performance vs view matrix");

            Eigen::VectorXd posterior = solve_raw(market_weights.values,
                                                  market_cov.values,
                                                  view_matrix.values,
                                                  view_cov.values,
                                                  view_out_performance.values);

            return LabelledVector("black_litterman", market_weights.labels, posterior);
        }

        Eigen::VectorXd BlackLittermanSolver::solve_raw(const Eigen::VectorXd &market_weights,
                                                        const Eigen::MatrixXd &market_cov,
                                                        const Eigen::MatrixXd &view_matrix,
                                                        const Eigen::MatrixXd &view_cov,
                                                        const Eigen::VectorXd &view_out_performance) const
        {
            validate_dimensions(market_weights, market_cov, view_matrix, view_cov, view_out_performance);
            validate_view_covariance(view_cov);

            // Views with infinite variance contribute nothing
            std::vector<Eigen::Index> informative;
            for (Eigen::Index i = 0; i < view_cov.rows(); ++i)
            {
                if (std::isfinite(view_cov(i, i)))
                {
                    informative.push_back(i);
                }
            }

            if (informative.empty())
            {
                return market_weights;
            }

            const auto k = static_cast<Eigen::Index>(informative.size());
            const Eigen::Index n = market_weights.size();

            Eigen::MatrixXd P(k, n);
            Eigen::VectorXd Q(k);
            Eigen::VectorXd omega(k);
            for (Eigen::Index r = 0; r < k; ++r)
            {
                const Eigen::Index src = informative[static_cast<size_t>(r)];
                P.row(r) = view_matrix.row(src);
                Q(r) = view_out_performance(src);
                omega(r) = view_cov(src, src);
            }

            Eigen::MatrixXd P_sigma = P * market_cov;

            Eigen::MatrixXd M = P_sigma * P.transpose();
            M.diagonal() += omega / tau_;

            if (!M.allFinite())
            {
                throw SingularMatrix("view precision matrix contains NaN or Inf values");
            }

            Eigen::FullPivLU<Eigen::MatrixXd> lu(M);
            if (!lu.isInvertible())
            {
                throw SingularMatrix("view precision matrix M (" + std::to_string(k) + "x" + std::to_string(k) +
                                     ") has rank " + std::to_string(lu.rank()));
            }

            Eigen::VectorXd adjustment = Q / risk_aversion_ - P_sigma * market_weights;
            Eigen::VectorXd posterior = market_weights + P.transpose() * lu.solve(adjustment);

            if (!posterior.allFinite())
            {
                throw SingularMatrix("posterior weights are not finite; M is numerically singular");
            }

            return posterior;
        }

    } // namespace optimizer
} // namespace black_litterman
