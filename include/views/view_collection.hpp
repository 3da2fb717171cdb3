/**
 * @file view_collection.hpp
 * @brief Ordered set of investor views and their matrix forms
 *
 * Produces the Black-Litterman pick matrix P (views x assets) and the
 * out-performance vector Q (views). Row i of P and entry i of Q always
 * belong to the i-th view in insertion order.
 */

#pragma once

#include "core/labelled_data.hpp"
#include "views/view.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace black_litterman
{
    namespace views
    {

        /**
         * @class ViewCollection
         * @brief Views with unique ids, kept in insertion order
         *
         * Usage Example:
         * @code
         * ViewCollection views;
         * views.add_view(view);
         * LabelledMatrix P = views.get_view_matrix(settings.asset_ids());
         * LabelledVector Q = views.get_view_out_performances();
         * @endcode
         */
        class ViewCollection
        {
        public:
            ViewCollection() = default;

            /**
             * @brief Construct from a list of views
             * @throws std::invalid_argument on duplicate ids
             */
            explicit ViewCollection(const std::vector<View> &views);

            /**
             * @brief Append a view
             * @throws std::invalid_argument if a view with the same id exists
             */
            void add_view(const View &view);

            /**
             * @brief Replace the view with the same id, keeping its position
             * @throws std::out_of_range if no view has that id
             */
            void replace_view(const View &view);

            /**
             * @brief Remove a view
             * @return true if a view was removed
             */
            bool remove_view(const std::string &view_id);

            /**
             * @brief Look up a view by id
             * @throws std::out_of_range if no view has that id
             */
            const View &get_view(const std::string &view_id) const;

            bool contains(const std::string &view_id) const;

            const std::vector<View> &get_all_views() const { return views_; }

            std::vector<std::string> get_view_ids() const;

            size_t size() const { return views_.size(); }
            bool empty() const { return views_.empty(); }

            /**
             * @brief Pick matrix P aligned to the asset universe
             * @param asset_universe Ordered asset ids
             * @return (views x assets), rows labelled by view id
             * @throws DimensionMismatch if a view references an unknown asset
             */
            LabelledMatrix get_view_matrix(const std::vector<std::string> &asset_universe) const;

            /**
             * @brief Out-performance vector Q labelled by view id
             */
            LabelledVector get_view_out_performances() const;

            nlohmann::json to_json() const;

            /**
             * @brief Parse {"views": [ ... ]} or a bare array of views
             * @throws std::invalid_argument if malformed or ids repeat
             */
            static ViewCollection from_json(const nlohmann::json &j);

            /**
             * @brief Load a views JSON document
             * @throws std::runtime_error if the file cannot be read or parsed
             */
            static ViewCollection load_from_file(const std::string &filepath);

        private:
            std::vector<View> views_;

            int find_view_index(const std::string &view_id) const;
        };

    } // namespace views
} // namespace black_litterman
