/**
 * @file black_litterman_engine.cpp
 * @brief Implementation of the Black-Litterman engine facade
 */

#include "engine/black_litterman_engine.hpp"
#include <stdexcept>

namespace black_litterman
{

    LabelledVector BlackLittermanResult::weight_changes() const
    {
        LabelledVector market = market_weights.align_to(weights.labels);
        return LabelledVector("difference", weights.labels, weights.values - market.values);
    }

    nlohmann::json BlackLittermanResult::to_json() const
    {
        nlohmann::json j;
        j["market_weights"] = market_weights.to_json();
        j["black_litterman_weights"] = weights.to_json();
        j["difference"] = weight_changes().to_json();

        nlohmann::json calibration_json = nlohmann::json::array();
        for (const auto &calibration : calibrations)
        {
            calibration_json.push_back(calibration.to_json());
        }
        j["calibration"] = calibration_json;
        return j;
    }

    namespace
    {
        std::shared_ptr<const market::MarketDataEngine> require_market_data(
            std::shared_ptr<const market::MarketDataEngine> market_data)
        {
            if (!market_data)
            {
                throw std::invalid_argument("BlackLittermanEngine requires a market data engine");
            }
            return market_data;
        }
    }

    BlackLittermanEngine::BlackLittermanEngine(std::shared_ptr<const market::MarketDataEngine> market_data,
                                               CalculationSettings settings,
                                               calibration::CalibrationConfig calibration)
        : market_data_(require_market_data(std::move(market_data))),
          settings_(std::move(settings)),
          calibration_config_(std::move(calibration)),
          solver_(optimizer::BlackLittermanSolver::from_settings(settings_)),
          calibrator_(solver_,
                      calibration::MinimizerFactory::create(calibration_config_),
                      calibration_config_.initial_guess,
                      calibration_config_.parallel)
    {
    }

    LabelledVector BlackLittermanEngine::get_market_weights(const std::string &end_date) const
    {
        const std::string &date = end_date.empty() ? settings_.calculation_date() : end_date;
        return market_data_->get_market_weights(date)
            .align_to(settings_.asset_ids())
            .renamed("market");
    }

    LabelledMatrix BlackLittermanEngine::get_market_covariance(const std::string &start_date,
                                                               const std::string &end_date) const
    {
        std::vector<std::string> universe = settings_.asset_ids();
        return market_data_->get_annualised_cov_matrix(start_date, end_date).align_to(universe, universe);
    }

    LabelledVector BlackLittermanEngine::get_market_returns(const std::string &start_date,
                                                            const std::string &end_date) const
    {
        return market_data_->get_implied_returns(start_date, end_date, settings_.risk_aversion())
            .align_to(settings_.asset_ids());
    }

    std::vector<std::string> BlackLittermanEngine::get_asset_universe() const
    {
        return settings_.asset_ids();
    }

    std::pair<std::string, std::string> BlackLittermanEngine::get_dates() const
    {
        return {settings_.start_date(), settings_.calculation_date()};
    }

    LabelledMatrix BlackLittermanEngine::get_view_covariances_from_confidences(
        const LabelledVector &market_weights,
        const LabelledMatrix &market_cov,
        const views::ViewCollection &views) const
    {
        return calibrator_.calibrate(views, market_weights, market_cov, settings_.asset_ids());
    }

    BlackLittermanResult BlackLittermanEngine::run(const views::ViewCollection &views,
                                                   const std::string &start_date,
                                                   const std::string &end_date) const
    {
        std::vector<std::string> universe = settings_.asset_ids();

        BlackLittermanResult result;
        result.market_weights = get_market_weights(end_date);
        LabelledMatrix market_cov = get_market_covariance(start_date, end_date);

        LabelledMatrix view_matrix = views.get_view_matrix(universe);
        LabelledVector out_performances = views.get_view_out_performances();

        result.calibrations = calibrator_.calibrate_views(views, result.market_weights, market_cov, universe);
        result.view_covariance = calibration::ConfidenceCalibrator::to_view_covariance(result.calibrations);

        result.weights = solver_.solve(result.market_weights,
                                       market_cov,
                                       view_matrix,
                                       result.view_covariance,
                                       out_performances);
        return result;
    }

    LabelledVector BlackLittermanEngine::get_black_litterman_weights(const views::ViewCollection &views,
                                                                     const std::string &start_date,
                                                                     const std::string &end_date) const
    {
        return run(views, start_date, end_date).weights;
    }

    LabelledVector BlackLittermanEngine::get_black_litterman_weights(const views::ViewCollection &views) const
    {
        return get_black_litterman_weights(views, settings_.start_date(), settings_.calculation_date());
    }

} // namespace black_litterman
