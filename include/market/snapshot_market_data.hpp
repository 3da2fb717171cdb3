/**
 * @file snapshot_market_data.hpp
 * @brief In-memory market data snapshot
 *
 * Holds market weights per observation date and annualised covariance
 * matrices per estimation window, as produced by an upstream market
 * data process. Weights are looked up as of a date; covariances by
 * exact window.
 *
 * Snapshot file layout:
 * @code{.json}
 * {
 *   "assets": ["GOVT", "EQ"],
 *   "market_weights": { "2020-12-31": { "GOVT": 0.4, "EQ": 0.6 } },
 *   "covariances": [
 *     { "start_date": "2015-01-01", "end_date": "2020-12-31",
 *       "matrix": [[0.0016, 0.0002], [0.0002, 0.0225]] }
 *   ]
 * }
 * @endcode
 */

#ifndef BLACK_LITTERMAN_SNAPSHOT_MARKET_DATA_HPP
#define BLACK_LITTERMAN_SNAPSHOT_MARKET_DATA_HPP

#include "market/market_data_engine.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace black_litterman
{
    namespace market
    {

        /**
         * @class SnapshotMarketDataEngine
         * @brief MarketDataEngine backed by fixed in-memory data
         *
         * @note Asset order of every returned vector and matrix is the
         *       order given at construction.
         */
        class SnapshotMarketDataEngine : public MarketDataEngine
        {
        public:
            /**
             * @brief Constructor with asset universe
             * @param assets Ordered, unique asset ids
             * @throws std::invalid_argument if empty or not unique
             */
            explicit SnapshotMarketDataEngine(const std::vector<std::string> &assets);

            ~SnapshotMarketDataEngine() override = default;

            /** ===========================================
             *  Data Modification Methods
             *  ===========================================
             */

            /**
             * @brief Store market weights observed at a date
             * @param date Observation date (YYYY-MM-DD)
             * @param weights Weights in asset order
             * @throws std::invalid_argument on bad date, size, or negative/non-finite weights
             */
            void add_market_weights(const std::string &date, const Eigen::VectorXd &weights);

            /**
             * @brief Store an annualised covariance for a window
             * @param start_date First date of the window
             * @param end_date Last date of the window
             * @param covariance Matrix in asset order
             * @throws std::invalid_argument on bad dates, shape, asymmetry or non-finite values
             */
            void add_covariance(const std::string &start_date,
                                const std::string &end_date,
                                const Eigen::MatrixXd &covariance);

            /** ===========================================
             *  MarketDataEngine Interface
             *  ===========================================
             */

            /**
             * @brief Weights at the latest stored date on or before end_date
             * @throws std::out_of_range if no such date exists
             */
            LabelledVector get_market_weights(const std::string &end_date) const override;

            /**
             * @brief Covariance stored for exactly [start_date, end_date]
             * @throws std::out_of_range if the window is not stored
             */
            LabelledMatrix get_annualised_cov_matrix(const std::string &start_date,
                                                     const std::string &end_date) const override;

            std::string get_name() const override;

            /** ===========================================
             *  Data Access Methods
             *  ===========================================
             */

            const std::vector<std::string> &get_assets() const { return assets_; }

            /**
             * @brief Observation dates with stored weights, ascending
             */
            std::vector<std::string> get_weight_dates() const;

            bool has_covariance(const std::string &start_date, const std::string &end_date) const;

            /** ===========================================
             *  Loading
             *  ===========================================
             */

            /**
             * @brief Build from a snapshot JSON document
             * @throws std::invalid_argument if the document is malformed
             */
            static SnapshotMarketDataEngine from_json(const nlohmann::json &j);

            /**
             * @brief Load a snapshot JSON file
             * @throws std::runtime_error if the file cannot be read or parsed
             */
            static SnapshotMarketDataEngine load_from_file(const std::string &filepath);

        private:
            std::vector<std::string> assets_;                                        ///< Asset order
            std::map<std::string, Eigen::VectorXd> weights_by_date_;                 ///< Date to weights
            std::map<std::pair<std::string, std::string>, Eigen::MatrixXd> covariances_; ///< Window to covariance

            static void validate_date(const std::string &date);
        };

    } // namespace market
} // namespace black_litterman

#endif // BLACK_LITTERMAN_SNAPSHOT_MARKET_DATA_HPP
