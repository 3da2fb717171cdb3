/**
 * @file test_scalar_minimizers.cpp
 * @brief Unit tests for scalar minimizers and the minimizer factory
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "calibration/golden_section_minimizer.hpp"
#include "calibration/minimizer_factory.hpp"
#include "calibration/quasi_newton_minimizer.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace black_litterman::calibration;
using Catch::Matchers::WithinAbs;

namespace
{
    // Same shape as the normalised calibration objective: minimum at (1 - c) / c
    double shrinkage_objective(double x, double c)
    {
        double d = 1.0 / (1.0 + x) - c;
        return d * d;
    }
}

TEST_CASE("MinimizerOptions validation", "[ScalarMinimizer]")
{
    MinimizerOptions options;

    SECTION("Defaults are valid")
    {
        REQUIRE_NOTHROW(options.validate());
        REQUIRE(std::isinf(options.upper_bound));
    }

    SECTION("Non-positive iteration budget")
    {
        options.max_iterations = 0;
        REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
    }

    SECTION("Non-positive tolerance")
    {
        options.gradient_tolerance = 0.0;
        REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
    }

    SECTION("Replacing options")
    {
        QuasiNewtonMinimizer minimizer;

        MinimizerOptions tighter;
        tighter.max_iterations = 50;
        tighter.upper_bound = 10.0;
        minimizer.set_options(tighter);

        REQUIRE(minimizer.get_options().max_iterations == 50);
        REQUIRE_THAT(minimizer.get_options().upper_bound, WithinAbs(10.0, 1e-15));

        // Bounded above at 10: the minimum at 20 is clamped
        auto result = minimizer.minimize([](double x)
                                         { return (x - 20.0) * (x - 20.0); },
                                         0.1);
        REQUIRE(result.success);
        REQUIRE(result.x == 10.0);

        MinimizerOptions invalid;
        invalid.max_iterations = 0;
        REQUIRE_THROWS_AS(minimizer.set_options(invalid), std::invalid_argument);
        REQUIRE(minimizer.get_options().max_iterations == 50);
    }

    SECTION("Inverted bounds")
    {
        options.lower_bound = 1.0;
        options.upper_bound = 0.5;
        REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
        REQUIRE_THROWS_AS(QuasiNewtonMinimizer(options), std::invalid_argument);
    }
}

TEST_CASE("QuasiNewtonMinimizer on smooth objectives", "[ScalarMinimizer][QuasiNewton]")
{
    QuasiNewtonMinimizer minimizer;

    SECTION("Name and parameters")
    {
        REQUIRE(minimizer.get_name() == "QuasiNewtonMinimizer");
        REQUIRE(minimizer.get_parameters()["method"] == "bfgs");
    }

    SECTION("Interior quadratic minimum")
    {
        auto result = minimizer.minimize([](double x)
                                         { return (x - 2.0) * (x - 2.0); },
                                         0.1);

        REQUIRE(result.success);
        REQUIRE_THAT(result.x, WithinAbs(2.0, 1e-6));
        REQUIRE(result.iterations <= 200);
        REQUIRE(result.function_evaluations > 0);
    }

    SECTION("Minimum at the lower bound")
    {
        auto result = minimizer.minimize([](double x)
                                         { return (x + 1.0) * (x + 1.0); },
                                         0.5);

        REQUIRE(result.success);
        REQUIRE(result.x == 0.0);
    }

    SECTION("Initial guess outside the bounds is clamped")
    {
        auto result = minimizer.minimize([](double x)
                                         { return (x - 0.5) * (x - 0.5); },
                                         -3.0);

        REQUIRE(result.success);
        REQUIRE_THAT(result.x, WithinAbs(0.5, 1e-6));
    }

    SECTION("Calibration-shaped objective")
    {
        for (double c : {0.25, 0.5, 0.75, 0.9})
        {
            auto result = minimizer.minimize([c](double x)
                                             { return shrinkage_objective(x, c); },
                                             0.1);

            REQUIRE(result.success);
            REQUIRE_THAT(result.x, WithinAbs((1.0 - c) / c, 1e-6 * (1.0 + (1.0 - c) / c)));
        }
    }

    SECTION("Flat objective with a distant minimum")
    {
        // Curvature at the minimum is 2 c^4, so the gradient is tiny long before x*
        for (double c : {0.01, 0.001})
        {
            double expected = (1.0 - c) / c;
            auto result = minimizer.minimize([c](double x)
                                             { return shrinkage_objective(x, c); },
                                             0.1);

            REQUIRE(result.success);
            REQUIRE_THAT(result.x, WithinAbs(expected, 1e-8 * expected));
        }
    }

    SECTION("Full confidence converges to the bound")
    {
        auto result = minimizer.minimize([](double x)
                                         { return shrinkage_objective(x, 1.0); },
                                         0.1);

        REQUIRE(result.success);
        REQUIRE(result.x == 0.0);
    }
}

TEST_CASE("QuasiNewtonMinimizer failure reporting", "[ScalarMinimizer][QuasiNewton]")
{
    SECTION("Iteration budget exhausted")
    {
        MinimizerOptions options;
        options.max_iterations = 1;
        QuasiNewtonMinimizer minimizer(options);

        // Minimum far from the start: one iteration cannot reach it
        auto result = minimizer.minimize([](double x)
                                         { return std::log(1.0 + (x - 1000.0) * (x - 1000.0)); },
                                         0.1);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "Maximum iterations reached");
    }

    SECTION("Objective not finite at the start")
    {
        QuasiNewtonMinimizer minimizer;
        auto result = minimizer.minimize([](double)
                                         { return std::numeric_limits<double>::quiet_NaN(); },
                                         0.1);

        REQUIRE_FALSE(result.success);
    }

    SECTION("Objective exceptions propagate")
    {
        QuasiNewtonMinimizer minimizer;
        REQUIRE_THROWS_AS(minimizer.minimize([](double) -> double
                                             { throw std::runtime_error("boom"); },
                                             0.1),
                          std::runtime_error);
    }
}

TEST_CASE("GoldenSectionMinimizer", "[ScalarMinimizer][GoldenSection]")
{
    MinimizerOptions options;
    options.upper_bound = 100.0;
    options.step_tolerance = 1e-10;

    SECTION("Requires a finite upper bound")
    {
        REQUIRE_THROWS_AS(GoldenSectionMinimizer(MinimizerOptions()), std::invalid_argument);
    }

    SECTION("Interior minimum")
    {
        GoldenSectionMinimizer minimizer(options);
        auto result = minimizer.minimize([](double x)
                                         { return shrinkage_objective(x, 0.5); },
                                         0.1);

        REQUIRE(result.success);
        REQUIRE_THAT(result.x, WithinAbs(1.0, 1e-6));
        REQUIRE(minimizer.get_name() == "GoldenSectionMinimizer");
    }

    SECTION("Minimum at the lower bound")
    {
        GoldenSectionMinimizer minimizer(options);
        auto result = minimizer.minimize([](double x)
                                         { return shrinkage_objective(x, 1.0); },
                                         0.1);

        REQUIRE(result.success);
        REQUIRE(result.x == 0.0);
    }

    SECTION("Minimum beyond the upper bound")
    {
        GoldenSectionMinimizer minimizer(options);
        auto result = minimizer.minimize([](double x)
                                         { return shrinkage_objective(x, 0.001); },
                                         0.1);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.x == 100.0);
        REQUIRE(result.message == "Minimum lies beyond the upper bound");
    }

    SECTION("Minimum just inside the upper bound")
    {
        GoldenSectionMinimizer minimizer(options);
        auto result = minimizer.minimize([](double x)
                                         { return (x - 99.0) * (x - 99.0); },
                                         0.1);

        REQUIRE(result.success);
        REQUIRE_THAT(result.x, WithinAbs(99.0, 1e-6));
    }

    SECTION("Iteration budget exhausted")
    {
        options.max_iterations = 3;
        GoldenSectionMinimizer minimizer(options);
        auto result = minimizer.minimize([](double x)
                                         { return (x - 40.0) * (x - 40.0); },
                                         0.1);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "Maximum iterations reached");
    }
}

TEST_CASE("MinimizerFactory", "[ScalarMinimizer][Factory]")
{
    SECTION("BFGS aliases")
    {
        REQUIRE(MinimizerFactory::create("bfgs")->get_name() == "QuasiNewtonMinimizer");
        REQUIRE(MinimizerFactory::create("Quasi_Newton")->get_name() == "QuasiNewtonMinimizer");
    }

    SECTION("Golden section uses the configured ceiling")
    {
        CalibrationConfig config;
        config.method = "GOLDEN_SECTION";
        config.upper_bound = 50.0;

        auto minimizer = MinimizerFactory::create(config);
        REQUIRE(minimizer->get_name() == "GoldenSectionMinimizer");
        REQUIRE_THAT(minimizer->get_options().upper_bound, WithinAbs(50.0, 1e-15));
    }

    SECTION("Configuration reaches the options")
    {
        CalibrationConfig config;
        config.max_iterations = 42;
        config.tolerance = 1e-7;

        auto minimizer = MinimizerFactory::create(config);
        REQUIRE(minimizer->get_options().max_iterations == 42);
        REQUIRE_THAT(minimizer->get_options().gradient_tolerance, WithinAbs(1e-7, 1e-20));
        REQUIRE(minimizer->get_options().lower_bound == 0.0);
    }

    SECTION("Unknown method")
    {
        REQUIRE_THROWS_AS(MinimizerFactory::create("nelder_mead"), std::invalid_argument);
    }

    SECTION("Supported methods")
    {
        auto methods = MinimizerFactory::get_supported_methods();
        REQUIRE(methods.size() == 3);
    }
}
