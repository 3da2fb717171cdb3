/**
 * @file test_black_litterman_solver.cpp
 * @brief Unit tests for the closed-form Black-Litterman solver
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "core/errors.hpp"
#include "optimizer/black_litterman_solver.hpp"
#include <cmath>
#include <limits>

using namespace black_litterman;
using namespace black_litterman::optimizer;
using Catch::Matchers::WithinAbs;

/**
 * @class SolverTestFixture
 * @brief Two-asset market with a single relative view
 *
 * w = {A: 0.6, B: 0.4}, Sigma = [[0.04, 0.01], [0.01, 0.09]],
 * tau = 0.05, delta = 2.5, view A - B = 3%.
 *
 * p Sigma p^T = 0.11 and Q / delta - p Sigma w = 0.026, so a view held
 * with certainty moves A up and B down by 0.026 / 0.11.
 */
class SolverTestFixture
{
protected:
    std::vector<std::string> assets_ = {"A", "B"};
    LabelledVector market_weights_;
    LabelledMatrix market_cov_;
    LabelledMatrix view_matrix_;
    LabelledVector out_performance_;
    BlackLittermanSolver solver_{0.05, 2.5};

    const double full_shift_ = 0.026 / 0.11;

    SolverTestFixture()
    {
        Eigen::VectorXd w(2);
        w << 0.6, 0.4;
        market_weights_ = LabelledVector("market", assets_, w);

        Eigen::MatrixXd sigma(2, 2);
        sigma << 0.04, 0.01,
            0.01, 0.09;
        market_cov_ = LabelledMatrix::square(assets_, sigma);

        Eigen::MatrixXd P(1, 2);
        P << 1.0, -1.0;
        view_matrix_ = LabelledMatrix({"a_over_b"}, assets_, P);

        Eigen::VectorXd Q(1);
        Q << 0.03;
        out_performance_ = LabelledVector("out_performance", {"a_over_b"}, Q);
    }

    LabelledMatrix omega(double variance) const
    {
        Eigen::MatrixXd values(1, 1);
        values << variance;
        return LabelledMatrix::square({"a_over_b"}, values);
    }
};

TEST_CASE("BlackLittermanSolver construction", "[BlackLittermanSolver]")
{
    SECTION("Valid parameters")
    {
        BlackLittermanSolver solver(0.05, 2.5);
        REQUIRE(solver.get_name() == "BlackLittermanSolver");
        REQUIRE_THAT(solver.tau(), WithinAbs(0.05, 1e-15));
        REQUIRE_THAT(solver.get_parameters()["risk_aversion"].get<double>(), WithinAbs(2.5, 1e-15));
    }

    SECTION("Invalid parameters")
    {
        REQUIRE_THROWS_AS(BlackLittermanSolver(0.0, 2.5), std::invalid_argument);
        REQUIRE_THROWS_AS(BlackLittermanSolver(0.05, -1.0), std::invalid_argument);
        REQUIRE_THROWS_AS(BlackLittermanSolver(std::nan(""), 2.5), std::invalid_argument);
    }

    SECTION("From settings")
    {
        CalculationSettings settings(0.025, 3.0, "2020-01-01", "2020-12-31", {{"A", "Asset A"}});
        auto solver = BlackLittermanSolver::from_settings(settings);
        REQUIRE_THAT(solver.tau(), WithinAbs(0.025, 1e-15));
        REQUIRE_THAT(solver.risk_aversion(), WithinAbs(3.0, 1e-15));
    }
}

TEST_CASE_METHOD(SolverTestFixture, "Posterior weights for a single view", "[BlackLittermanSolver]")
{
    SECTION("View held with certainty")
    {
        auto posterior = solver_.solve(market_weights_, market_cov_, view_matrix_, omega(0.0), out_performance_);

        REQUIRE(posterior.name == "black_litterman");
        REQUIRE(posterior.labels == assets_);
        REQUIRE_THAT(posterior.at("A"), WithinAbs(0.6 + full_shift_, 1e-12));
        REQUIRE_THAT(posterior.at("B"), WithinAbs(0.4 - full_shift_, 1e-12));
    }

    SECTION("Variance equal to the prior variance halves the shift")
    {
        // tau * p Sigma p^T = 0.0055
        auto posterior = solver_.solve(market_weights_, market_cov_, view_matrix_, omega(0.0055), out_performance_);

        REQUIRE_THAT(posterior.at("A"), WithinAbs(0.6 + 0.5 * full_shift_, 1e-12));
        REQUIRE_THAT(posterior.at("B"), WithinAbs(0.4 - 0.5 * full_shift_, 1e-12));
        REQUIRE_THAT(posterior.sum(), WithinAbs(1.0, 1e-12));
    }

    SECTION("Shift shrinks as the variance grows")
    {
        double previous = std::numeric_limits<double>::infinity();
        for (double variance : {0.0, 0.001, 0.01, 0.1, 1.0})
        {
            auto posterior = solver_.solve(market_weights_, market_cov_, view_matrix_, omega(variance), out_performance_);
            double shift = posterior.at("A") - 0.6;
            REQUIRE(shift > 0.0);
            REQUIRE(shift < previous);
            previous = shift;
        }
    }

    SECTION("Infinite variance leaves the market weights")
    {
        auto posterior = solver_.solve(market_weights_, market_cov_, view_matrix_,
                                       omega(std::numeric_limits<double>::infinity()), out_performance_);

        REQUIRE(posterior.values == market_weights_.values);
    }
}

TEST_CASE_METHOD(SolverTestFixture, "Zero views return the market weights", "[BlackLittermanSolver]")
{
    LabelledMatrix no_views({}, assets_, Eigen::MatrixXd(0, 2));
    LabelledMatrix no_cov({}, {}, Eigen::MatrixXd(0, 0));
    LabelledVector no_q("out_performance", {}, Eigen::VectorXd(0));

    auto posterior = solver_.solve(market_weights_, market_cov_, no_views, no_cov, no_q);

    REQUIRE(posterior.values == market_weights_.values);
    REQUIRE(posterior.labels == assets_);
}

TEST_CASE_METHOD(SolverTestFixture, "Relabelling permutes the output", "[BlackLittermanSolver]")
{
    auto posterior = solver_.solve(market_weights_, market_cov_, view_matrix_, omega(0.002), out_performance_);

    std::vector<std::string> swapped = {"B", "A"};
    auto swapped_posterior = solver_.solve(market_weights_.align_to(swapped),
                                           market_cov_.align_to(swapped, swapped),
                                           view_matrix_.align_to({"a_over_b"}, swapped),
                                           omega(0.002),
                                           out_performance_);

    REQUIRE(swapped_posterior.labels == swapped);
    REQUIRE_THAT(swapped_posterior.at("A"), WithinAbs(posterior.at("A"), 1e-14));
    REQUIRE_THAT(swapped_posterior.at("B"), WithinAbs(posterior.at("B"), 1e-14));
}

TEST_CASE_METHOD(SolverTestFixture, "Solver input validation", "[BlackLittermanSolver]")
{
    SECTION("Covariance labelled in a different order")
    {
        auto reordered = market_cov_.align_to({"B", "A"}, {"B", "A"});
        REQUIRE_THROWS_AS(solver_.solve(market_weights_, reordered, view_matrix_, omega(0.01), out_performance_),
                          DimensionMismatch);
    }

    SECTION("View on an asset missing from the covariance")
    {
        Eigen::MatrixXd P(1, 3);
        P << 1.0, 0.0, -1.0;
        LabelledMatrix wide({"a_over_b"}, {"A", "B", "C"}, P);
        REQUIRE_THROWS_AS(solver_.solve(market_weights_, market_cov_, wide, omega(0.01), out_performance_),
                          DimensionMismatch);
    }

    SECTION("Out-performance labelled by a different view")
    {
        Eigen::VectorXd Q(1);
        Q << 0.03;
        LabelledVector other("out_performance", {"other"}, Q);
        REQUIRE_THROWS_AS(solver_.solve(market_weights_, market_cov_, view_matrix_, omega(0.01), other),
                          DimensionMismatch);
    }

    SECTION("Raw size mismatch")
    {
        Eigen::VectorXd w(3);
        w << 0.2, 0.3, 0.5;
        REQUIRE_THROWS_AS(solver_.solve_raw(w, market_cov_.values, view_matrix_.values,
                                            omega(0.01).values, out_performance_.values),
                          DimensionMismatch);
    }

    SECTION("Negative view variance")
    {
        REQUIRE_THROWS_AS(solver_.solve(market_weights_, market_cov_, view_matrix_, omega(-0.01), out_performance_),
                          std::invalid_argument);
    }

    SECTION("NaN view variance")
    {
        REQUIRE_THROWS_AS(solver_.solve(market_weights_, market_cov_, view_matrix_, omega(std::nan("")), out_performance_),
                          std::invalid_argument);
    }
}

TEST_CASE_METHOD(SolverTestFixture, "Singular view precision matrix", "[BlackLittermanSolver]")
{
    SECTION("Duplicate views held with certainty")
    {
        Eigen::MatrixXd P(2, 2);
        P << 1.0, -1.0,
            1.0, -1.0;
        LabelledMatrix duplicated({"v1", "v2"}, assets_, P);

        Eigen::VectorXd Q(2);
        Q << 0.03, 0.03;
        LabelledVector q("out_performance", {"v1", "v2"}, Q);

        LabelledMatrix zero_omega = LabelledMatrix::square({"v1", "v2"}, Eigen::MatrixXd::Zero(2, 2));

        REQUIRE_THROWS_AS(solver_.solve(market_weights_, market_cov_, duplicated, zero_omega, q), SingularMatrix);
    }

    SECTION("View with no prior variance")
    {
        Eigen::MatrixXd P = Eigen::MatrixXd::Zero(1, 2);
        LabelledMatrix empty_view({"a_over_b"}, assets_, P);

        REQUIRE_THROWS_AS(solver_.solve(market_weights_, market_cov_, empty_view, omega(0.0), out_performance_),
                          SingularMatrix);
    }

    SECTION("Off-diagonal view covariance")
    {
        Eigen::MatrixXd values(2, 2);
        values << 0.01, 0.001,
            0.001, 0.01;
        Eigen::MatrixXd P(2, 2);
        P << 1.0, -1.0,
            1.0, 0.0;
        Eigen::VectorXd Q(2);
        Q << 0.03, 0.05;

        REQUIRE_THROWS_AS(solver_.solve_raw(market_weights_.values, market_cov_.values, P, values, Q),
                          std::invalid_argument);
    }
}

TEST_CASE("Several views with one excluded", "[BlackLittermanSolver]")
{
    BlackLittermanSolver solver(0.05, 2.5);
    std::vector<std::string> assets = {"A", "B", "C"};
    std::vector<std::string> view_ids = {"a_over_b", "c_outright", "b_over_c"};

    Eigen::VectorXd w(3);
    w << 0.5, 0.2, 0.3;
    Eigen::MatrixXd sigma(3, 3);
    sigma << 0.04, 0.006, 0.01,
        0.006, 0.09, 0.02,
        0.01, 0.02, 0.0625;

    Eigen::MatrixXd P(3, 3);
    P << 1.0, -1.0, 0.0,
        0.0, 0.0, 1.0,
        0.0, 1.0, -1.0;
    Eigen::VectorXd Q(3);
    Q << 0.03, 0.06, -0.01;

    auto solve_with = [&](double excluded_variance)
    {
        Eigen::VectorXd variances(3);
        variances << 0.002, excluded_variance, 0.004;
        return solver.solve(LabelledVector("market", assets, w),
                            LabelledMatrix::square(assets, sigma),
                            LabelledMatrix(view_ids, assets, P),
                            LabelledMatrix::diagonal(LabelledVector("view_variance", view_ids, variances)),
                            LabelledVector("out_performance", view_ids, Q));
    };

    // Closed form over the two remaining views
    Eigen::MatrixXd P_kept(2, 3);
    P_kept << P.row(0), P.row(2);
    Eigen::VectorXd Q_kept(2);
    Q_kept << Q(0), Q(2);
    Eigen::MatrixXd M = P_kept * sigma * P_kept.transpose();
    M(0, 0) += 0.002 / 0.05;
    M(1, 1) += 0.004 / 0.05;
    Eigen::VectorXd expected = w + P_kept.transpose() * M.inverse() * (Q_kept / 2.5 - P_kept * sigma * w);

    auto posterior = solve_with(std::numeric_limits<double>::infinity());

    SECTION("Infinite variance drops the view exactly")
    {
        for (Eigen::Index i = 0; i < 3; ++i)
        {
            REQUIRE_THAT(posterior.values(i), WithinAbs(expected(i), 1e-12));
        }
    }

    SECTION("Matches the large-variance limit")
    {
        auto limit = solve_with(1e12);
        for (Eigen::Index i = 0; i < 3; ++i)
        {
            REQUIRE_THAT(posterior.values(i), WithinAbs(limit.values(i), 1e-10));
        }
    }

    SECTION("Relative views keep the budget")
    {
        REQUIRE_THAT(posterior.sum(), WithinAbs(1.0, 1e-12));
        REQUIRE(posterior.at("A") > 0.5);
    }
}
