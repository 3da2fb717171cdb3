/**
 * @file test_snapshot_market_data.cpp
 * @brief Unit tests for the in-memory market data snapshot
 */

#include <catch2/catch.hpp>
#include "core/errors.hpp"
#include "market/snapshot_market_data.hpp"
#include <cstdio>
#include <fstream>

using namespace black_litterman;
using namespace black_litterman::market;
using Catch::Matchers::WithinAbs;

namespace {

SnapshotMarketDataEngine two_asset_snapshot()
{
    SnapshotMarketDataEngine snapshot({"A", "B"});

    Eigen::VectorXd early(2);
    early << 0.5, 0.5;
    snapshot.add_market_weights("2020-06-30", early);

    Eigen::VectorXd late(2);
    late << 0.6, 0.4;
    snapshot.add_market_weights("2020-12-31", late);

    Eigen::MatrixXd sigma(2, 2);
    sigma << 0.04, 0.01,
             0.01, 0.09;
    snapshot.add_covariance("2015-01-01", "2020-12-31", sigma);
    return snapshot;
}

} // namespace

TEST_CASE("Snapshot construction", "[SnapshotMarketData]") {
    SECTION("Valid universe") {
        SnapshotMarketDataEngine snapshot({"A", "B"});
        REQUIRE(snapshot.get_assets().size() == 2);
        REQUIRE(snapshot.get_name() == "SnapshotMarketDataEngine");
    }

    SECTION("Empty or duplicate universe") {
        REQUIRE_THROWS_AS(SnapshotMarketDataEngine(std::vector<std::string>{}), std::invalid_argument);
        REQUIRE_THROWS_AS(SnapshotMarketDataEngine({"A", "A"}), std::invalid_argument);
    }
}

TEST_CASE("Snapshot insertion validation", "[SnapshotMarketData]") {
    SnapshotMarketDataEngine snapshot({"A", "B"});

    SECTION("Negative weight") {
        Eigen::VectorXd w(2);
        w << 1.2, -0.2;
        REQUIRE_THROWS_AS(snapshot.add_market_weights("2020-12-31", w), std::invalid_argument);
    }

    SECTION("Wrong weight count") {
        Eigen::VectorXd w(3);
        w << 0.2, 0.3, 0.5;
        REQUIRE_THROWS_AS(snapshot.add_market_weights("2020-12-31", w), std::invalid_argument);
    }

    SECTION("Bad date") {
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        REQUIRE_THROWS_AS(snapshot.add_market_weights("31/12/2020", w), std::invalid_argument);
    }

    SECTION("Asymmetric covariance") {
        Eigen::MatrixXd sigma(2, 2);
        sigma << 0.04, 0.02,
                 0.01, 0.09;
        REQUIRE_THROWS_AS(snapshot.add_covariance("2015-01-01", "2020-12-31", sigma), std::invalid_argument);
    }

    SECTION("Non-square covariance") {
        Eigen::MatrixXd sigma(2, 3);
        sigma.setZero();
        REQUIRE_THROWS_AS(snapshot.add_covariance("2015-01-01", "2020-12-31", sigma), std::invalid_argument);
    }
}

TEST_CASE("Snapshot lookups", "[SnapshotMarketData]") {
    auto snapshot = two_asset_snapshot();

    SECTION("Weights as of a date") {
        REQUIRE_THAT(snapshot.get_market_weights("2020-12-31").at("A"), WithinAbs(0.6, 1e-15));
        REQUIRE_THAT(snapshot.get_market_weights("2020-09-15").at("A"), WithinAbs(0.5, 1e-15));
        REQUIRE_THAT(snapshot.get_market_weights("2021-03-01").at("B"), WithinAbs(0.4, 1e-15));
    }

    SECTION("No weights on or before the date") {
        REQUIRE_THROWS_AS(snapshot.get_market_weights("2020-01-01"), std::out_of_range);
    }

    SECTION("Covariance by exact window") {
        auto cov = snapshot.get_annualised_cov_matrix("2015-01-01", "2020-12-31");
        REQUIRE(cov.row_labels == snapshot.get_assets());
        REQUIRE_THAT(cov.at("B", "B"), WithinAbs(0.09, 1e-15));
        REQUIRE(snapshot.has_covariance("2015-01-01", "2020-12-31"));
        REQUIRE_FALSE(snapshot.has_covariance("2016-01-01", "2020-12-31"));
    }

    SECTION("Missing window") {
        REQUIRE_THROWS_AS(snapshot.get_annualised_cov_matrix("2016-01-01", "2020-12-31"), std::out_of_range);
    }

    SECTION("Implied equilibrium returns") {
        auto implied = snapshot.get_implied_returns("2015-01-01", "2020-12-31", 2.5);

        // 2.5 * Sigma * w
        REQUIRE(implied.name == "implied_returns");
        REQUIRE_THAT(implied.at("A"), WithinAbs(2.5 * (0.04 * 0.6 + 0.01 * 0.4), 1e-14));
        REQUIRE_THAT(implied.at("B"), WithinAbs(2.5 * (0.01 * 0.6 + 0.09 * 0.4), 1e-14));
        REQUIRE_THROWS_AS(snapshot.get_implied_returns("2015-01-01", "2020-12-31", 0.0),
                          std::invalid_argument);
    }
}

TEST_CASE("Snapshot JSON loading", "[SnapshotMarketData][IO]") {
    const std::string document = R"({
        "assets": ["A", "B"],
        "market_weights": {"2020-12-31": {"A": 0.6, "B": 0.4}},
        "covariances": [
            {"start_date": "2015-01-01", "end_date": "2020-12-31",
             "matrix": [[0.04, 0.01], [0.01, 0.09]]}
        ]
    })";

    SECTION("From JSON") {
        auto snapshot = SnapshotMarketDataEngine::from_json(nlohmann::json::parse(document));
        REQUIRE(snapshot.get_weight_dates().size() == 1);
        REQUIRE_THAT(snapshot.get_annualised_cov_matrix("2015-01-01", "2020-12-31").at("A", "B"),
                     WithinAbs(0.01, 1e-15));
    }

    SECTION("From file") {
        const std::string path = "test_snapshot_tmp.json";
        {
            std::ofstream out(path);
            out << document;
        }

        auto snapshot = SnapshotMarketDataEngine::load_from_file(path);
        std::remove(path.c_str());

        REQUIRE_THAT(snapshot.get_market_weights("2020-12-31").at("B"), WithinAbs(0.4, 1e-15));
    }

    SECTION("Weights missing an asset") {
        auto j = nlohmann::json::parse(document);
        j["market_weights"]["2020-12-31"].erase("B");
        REQUIRE_THROWS_AS(SnapshotMarketDataEngine::from_json(j), std::invalid_argument);
    }

    SECTION("Ragged covariance") {
        auto j = nlohmann::json::parse(document);
        j["covariances"][0]["matrix"] = nlohmann::json::parse("[[0.04, 0.01], [0.01]]");
        REQUIRE_THROWS_AS(SnapshotMarketDataEngine::from_json(j), std::invalid_argument);
    }

    SECTION("Missing assets") {
        REQUIRE_THROWS_AS(SnapshotMarketDataEngine::from_json(nlohmann::json::object()), std::invalid_argument);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(SnapshotMarketDataEngine::load_from_file("nonexistent_snapshot.json"),
                          std::runtime_error);
    }
}
