/**
 * @file market_data_engine.hpp
 * @brief Abstract interface for the market data collaborator
 *
 * The Black-Litterman engine never fetches or estimates market data
 * itself. It asks a MarketDataEngine, injected at construction, for
 * equilibrium weights and annualised covariance on every call.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include "core/labelled_data.hpp"
#include <string>

namespace black_litterman
{
    namespace market
    {

        /**
         * @class MarketDataEngine
         * @brief Source of market weights and covariance
         *
         * Usage Example:
         * @code
         * std::shared_ptr<const MarketDataEngine> market =
         *     std::make_shared<SnapshotMarketDataEngine>(snapshot);
         * LabelledVector w = market->get_market_weights("2020-12-31");
         * LabelledMatrix cov = market->get_annualised_cov_matrix("2015-01-01", "2020-12-31");
         * @endcode
         */
        class MarketDataEngine
        {
        public:
            virtual ~MarketDataEngine() = default;

            /**
             * @brief Market-capitalisation equilibrium weights
             * @param end_date Date the weights are observed at (YYYY-MM-DD)
             * @return Non-negative weights labelled by asset id
             */
            virtual LabelledVector get_market_weights(const std::string &end_date) const = 0;

            /**
             * @brief Annualised covariance of asset returns
             * @param start_date First date of the estimation window
             * @param end_date Last date of the estimation window
             * @return Square, symmetric matrix labelled by asset id on both axes
             */
            virtual LabelledMatrix get_annualised_cov_matrix(const std::string &start_date,
                                                             const std::string &end_date) const = 0;

            /**
             * @brief Implied equilibrium returns
             *
             * Default implementation: pi = risk_aversion * Sigma * w_mkt,
             * with weights taken at end_date.
             *
             * @throws std::invalid_argument if risk_aversion <= 0
             * @throws DimensionMismatch if weights and covariance disagree on assets
             */
            virtual LabelledVector get_implied_returns(const std::string &start_date,
                                                       const std::string &end_date,
                                                       double risk_aversion) const;

            /**
             * @brief Get the name of the data source
             */
            virtual std::string get_name() const = 0;
        };

    } // namespace market
} // namespace black_litterman
