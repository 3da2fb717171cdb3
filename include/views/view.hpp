/**
 * @file view.hpp
 * @brief Investor view on asset returns
 *
 * A view asserts that a linear combination of assets (its allocation)
 * earns a given excess return, held with a confidence in [0, 1].
 *
 * Relative view:  A outperforms B by 3%   -> allocation {A: 1, B: -1}
 * Absolute view:  A returns 5%            -> allocation {A: 1}
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace black_litterman
{
    namespace views
    {

        /**
         * @class ViewAllocation
         * @brief Named, ordered mapping of assets to view weights
         *
         * Assets keep insertion order. Unreferenced assets have weight 0.
         */
        class ViewAllocation
        {
        public:
            explicit ViewAllocation(std::string name = "");

            /**
             * @brief Set (or add) the weight of an asset
             * @throws std::invalid_argument if weight is not finite or asset id is empty
             */
            void set_weight(const std::string &asset, double weight);

            /**
             * @brief Remove an asset from the allocation
             * @return true if the asset was present
             */
            bool remove_asset(const std::string &asset);

            /**
             * @brief Weight of an asset, 0 if unreferenced
             */
            double get_weight(const std::string &asset) const;

            bool contains(const std::string &asset) const;

            /**
             * @brief Referenced assets in insertion order
             */
            std::vector<std::string> get_assets() const;

            const std::vector<std::pair<std::string, double>> &get_weights() const { return weights_; }

            /**
             * @brief True when weights sum to zero (a relative view)
             */
            bool is_relative(double tolerance = 1e-12) const;

            bool empty() const { return weights_.empty(); }
            size_t size() const { return weights_.size(); }

            const std::string &get_name() const { return name_; }

            nlohmann::json to_json() const;

            /**
             * @brief Parse {"name": ..., "weights": {asset: weight}}
             *
             * A bare {asset: weight} object is accepted as well.
             *
             * @throws std::invalid_argument if malformed
             */
            static ViewAllocation from_json(const nlohmann::json &j);

        private:
            std::string name_;
            std::vector<std::pair<std::string, double>> weights_;
        };

        /**
         * @class View
         * @brief Immutable investor view
         *
         * Edits produce a new View; the original is never modified.
         *
         * Usage Example:
         * @code
         * ViewAllocation alloc("equity over bonds");
         * alloc.set_weight("EQ", 1.0);
         * alloc.set_weight("GOVT", -1.0);
         * View view("v1", "Equity outperforms bonds", 0.5, 0.03, alloc);
         * Eigen::RowVectorXd row = view.get_view_data_frame({"GOVT", "EQ"});
         * @endcode
         */
        class View
        {
        public:
            /**
             * @brief Construct and validate
             * @param id Unique identifier
             * @param name Display name
             * @param confidence Conviction in [0, 1]
             * @param out_performance Asserted excess return
             * @param allocation Linear combination of assets
             * @throws std::invalid_argument if id is empty, confidence is outside
             *         [0, 1] or out_performance is not finite
             */
            View(std::string id,
                 std::string name,
                 double confidence,
                 double out_performance,
                 ViewAllocation allocation);

            const std::string &id() const { return id_; }
            const std::string &name() const { return name_; }
            double confidence() const { return confidence_; }
            double out_performance() const { return out_performance_; }
            const ViewAllocation &allocation() const { return allocation_; }

            /**
             * @brief Allocation as a row aligned to the asset universe
             * @param asset_universe Ordered asset ids
             * @return 1 x N row, zero for unreferenced assets
             * @throws DimensionMismatch if the allocation references an asset
             *         outside the universe
             */
            Eigen::RowVectorXd get_view_data_frame(const std::vector<std::string> &asset_universe) const;

            View with_name(const std::string &name) const;
            View with_confidence(double confidence) const;
            View with_out_performance(double out_performance) const;
            View with_allocation(const ViewAllocation &allocation) const;

            nlohmann::json to_json() const;

            /**
             * @brief Parse {"id", "name", "confidence", "out_performance", "allocation"}
             *
             * Numeric ids are accepted and converted to strings.
             *
             * @throws std::invalid_argument if malformed
             */
            static View from_json(const nlohmann::json &j);

        private:
            std::string id_;
            std::string name_;
            double confidence_;
            double out_performance_;
            ViewAllocation allocation_;
        };

    } // namespace views
} // namespace black_litterman
