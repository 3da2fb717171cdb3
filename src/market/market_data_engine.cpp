/**
 * @file market_data_engine.cpp
 * @brief Default implied-returns computation for market data engines
 */

#include "market/market_data_engine.hpp"
#include <cmath>
#include <stdexcept>

namespace black_litterman
{
    namespace market
    {

        LabelledVector MarketDataEngine::get_implied_returns(const std::string &start_date,
                                                             const std::string &end_date,
                                                             double risk_aversion) const
        {
            if (!std::isfinite(risk_aversion) || risk_aversion <= 0.0)
            {
                throw std::invalid_argument(
                    "Risk aversion must be positive, got: " + std::to_string(risk_aversion));
            }

            LabelledVector weights = get_market_weights(end_date);
            LabelledMatrix covariance = get_annualised_cov_matrix(start_date, end_date)
                                            .align_to(weights.labels, weights.labels);

            Eigen::VectorXd implied = risk_aversion * covariance.values * weights.values;
            return LabelledVector("implied_returns", weights.labels, implied);
        }

    } // namespace market
} // namespace black_litterman
