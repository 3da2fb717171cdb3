/**
 * @file black_litterman_engine.hpp
 * @brief Session-level facade over market data, calibration and the solver
 *
 * Each call to get_black_litterman_weights():
 * 1. Fetches market weights at end_date and covariance over [start, end]
 * 2. Aligns both to the configured asset universe
 * 3. Builds P and Q from the views
 * 4. Calibrates a diagonal Omega, one search per view
 * 5. Solves for the posterior weights
 *
 * Nothing is cached between calls.
 */

#pragma once

#include "calibration/confidence_calibrator.hpp"
#include "calibration/minimizer_factory.hpp"
#include "core/labelled_data.hpp"
#include "market/market_data_engine.hpp"
#include "optimizer/black_litterman_solver.hpp"
#include "settings/calculation_settings.hpp"
#include "views/view_collection.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace black_litterman
{

    /**
     * @struct BlackLittermanResult
     * @brief Posterior weights together with the calibration that produced them
     */
    struct BlackLittermanResult
    {
        LabelledVector market_weights;
        LabelledVector weights;          ///< Named "black_litterman"
        LabelledMatrix view_covariance;  ///< Calibrated Omega
        std::vector<calibration::CalibrationResult> calibrations;

        /**
         * @brief Posterior minus market weight, per asset
         */
        LabelledVector weight_changes() const;

        nlohmann::json to_json() const;
    };

    /**
     * @class BlackLittermanEngine
     * @brief Entry point for Black-Litterman target weights
     *
     * Usage Example:
     * @code
     * auto settings = CalculationSettings::load_from_file("config.json");
     * auto market = std::make_shared<market::SnapshotMarketDataEngine>(
     *     market::SnapshotMarketDataEngine::load_from_file("market.json"));
     * BlackLittermanEngine engine(market, settings);
     * LabelledVector weights = engine.get_black_litterman_weights(views);
     * @endcode
     *
     * Thread Safety: Safe for concurrent read-only operations if the
     * market data collaborator is.
     */
    class BlackLittermanEngine
    {
    public:
        /**
         * @brief Constructor
         * @param market_data Market data collaborator
         * @param settings Session settings
         * @param calibration Variance search configuration
         * @throws std::invalid_argument if market_data is null or the method is unknown
         */
        BlackLittermanEngine(std::shared_ptr<const market::MarketDataEngine> market_data,
                             CalculationSettings settings,
                             calibration::CalibrationConfig calibration = calibration::CalibrationConfig());

        /**
         * @brief Market weights aligned to the universe, named "market"
         * @param end_date Observation date; the calculation date when empty
         */
        LabelledVector get_market_weights(const std::string &end_date = "") const;

        /**
         * @brief Annualised covariance aligned to the universe on both axes
         */
        LabelledMatrix get_market_covariance(const std::string &start_date,
                                             const std::string &end_date) const;

        /**
         * @brief Implied equilibrium returns over a window, aligned to the universe
         */
        LabelledVector get_market_returns(const std::string &start_date,
                                          const std::string &end_date) const;

        std::vector<std::string> get_asset_universe() const;

        /**
         * @brief (start_date, calculation_date)
         */
        std::pair<std::string, std::string> get_dates() const;

        const CalculationSettings &get_settings() const { return settings_; }
        const calibration::CalibrationConfig &get_calibration_config() const { return calibration_config_; }
        const optimizer::BlackLittermanSolver &get_solver() const { return solver_; }

        /**
         * @brief Calibrated Omega for a collection
         * @param market_weights Weights labelled by asset
         * @param market_cov Covariance labelled by asset
         * @param views View collection
         * @return Diagonal matrix over view ids, in collection order
         */
        LabelledMatrix get_view_covariances_from_confidences(const LabelledVector &market_weights,
                                                             const LabelledMatrix &market_cov,
                                                             const views::ViewCollection &views) const;

        /**
         * @brief Posterior weights over an explicit window
         * @throws DimensionMismatch if market data and universe disagree
         * @throws SingularMatrix if the view precision matrix is singular
         * @throws CalibrationNonConvergence if a view cannot be calibrated
         */
        LabelledVector get_black_litterman_weights(const views::ViewCollection &views,
                                                   const std::string &start_date,
                                                   const std::string &end_date) const;

        /**
         * @brief Posterior weights over the settings' window
         */
        LabelledVector get_black_litterman_weights(const views::ViewCollection &views) const;

        /**
         * @brief Full computation with calibration details
         */
        BlackLittermanResult run(const views::ViewCollection &views,
                                 const std::string &start_date,
                                 const std::string &end_date) const;

    private:
        std::shared_ptr<const market::MarketDataEngine> market_data_;
        CalculationSettings settings_;
        calibration::CalibrationConfig calibration_config_;
        optimizer::BlackLittermanSolver solver_;
        calibration::ConfidenceCalibrator calibrator_;
    };

} // namespace black_litterman
