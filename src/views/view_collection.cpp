/**
 * @file view_collection.cpp
 * @brief Implementation of ViewCollection
 */

#include "views/view_collection.hpp"
#include <fstream>
#include <stdexcept>

namespace black_litterman
{
    namespace views
    {

        ViewCollection::ViewCollection(const std::vector<View> &views)
        {
            for (const auto &view : views)
            {
                add_view(view);
            }
        }

        // ============================================================================
        // Editing
        // ============================================================================

        void ViewCollection::add_view(const View &view)
        {
            if (find_view_index(view.id()) >= 0)
            {
                throw std::invalid_argument("Duplicate view id: " + view.id());
            }
            views_.push_back(view);
        }

        void ViewCollection::replace_view(const View &view)
        {
            int idx = find_view_index(view.id());
            if (idx < 0)
            {
                throw std::out_of_range("View not found: " + view.id());
            }
            views_[static_cast<size_t>(idx)] = view;
        }

        bool ViewCollection::remove_view(const std::string &view_id)
        {
            int idx = find_view_index(view_id);
            if (idx < 0)
            {
                return false;
            }
            views_.erase(views_.begin() + idx);
            return true;
        }

        // ============================================================================
        // Access
        // ============================================================================

        const View &ViewCollection::get_view(const std::string &view_id) const
        {
            int idx = find_view_index(view_id);
            if (idx < 0)
            {
                throw std::out_of_range("View not found: " + view_id);
            }
            return views_[static_cast<size_t>(idx)];
        }

        bool ViewCollection::contains(const std::string &view_id) const
        {
            return find_view_index(view_id) >= 0;
        }

        std::vector<std::string> ViewCollection::get_view_ids() const
        {
            std::vector<std::string> ids;
            ids.reserve(views_.size());
            for (const auto &view : views_)
            {
                ids.push_back(view.id());
            }
            return ids;
        }

        int ViewCollection::find_view_index(const std::string &view_id) const
        {
            for (size_t i = 0; i < views_.size(); ++i)
            {
                if (views_[i].id() == view_id)
                {
                    return static_cast<int>(i);
                }
            }
            return -1;
        }

        // ============================================================================
        // Matrix forms
        // ============================================================================

        LabelledMatrix ViewCollection::get_view_matrix(const std::vector<std::string> &asset_universe) const
        {
            const auto n_views = static_cast<Eigen::Index>(views_.size());
            const auto n_assets = static_cast<Eigen::Index>(asset_universe.size());

            Eigen::MatrixXd P = Eigen::MatrixXd::Zero(n_views, n_assets);
            for (Eigen::Index i = 0; i < n_views; ++i)
            {
                P.row(i) = views_[static_cast<size_t>(i)].get_view_data_frame(asset_universe);
            }
            return LabelledMatrix(get_view_ids(), asset_universe, P);
        }

        LabelledVector ViewCollection::get_view_out_performances() const
        {
            Eigen::VectorXd Q(static_cast<Eigen::Index>(views_.size()));
            for (size_t i = 0; i < views_.size(); ++i)
            {
                Q(static_cast<Eigen::Index>(i)) = views_[i].out_performance();
            }
            return LabelledVector("out_performance", get_view_ids(), Q);
        }

        // ============================================================================
        // Serialisation
        // ============================================================================

        nlohmann::json ViewCollection::to_json() const
        {
            nlohmann::json list = nlohmann::json::array();
            for (const auto &view : views_)
            {
                list.push_back(view.to_json());
            }
            return nlohmann::json{{"views", list}};
        }

        ViewCollection ViewCollection::from_json(const nlohmann::json &j)
        {
            const nlohmann::json &list = (j.is_object() && j.contains("views")) ? j["views"] : j;
            if (!list.is_array())
            {
                throw std::invalid_argument("Views document must contain a 'views' array");
            }

            ViewCollection collection;
            for (const auto &entry : list)
            {
                collection.add_view(View::from_json(entry));
            }
            return collection;
        }

        ViewCollection ViewCollection::load_from_file(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open views file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
            }

            return from_json(j);
        }

    } // namespace views
} // namespace black_litterman
