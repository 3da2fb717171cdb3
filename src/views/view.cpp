/**
 * @file view.cpp
 * @brief Implementation of View and ViewAllocation
 */

#include "views/view.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <set>
#include <utility>

namespace black_litterman
{
    namespace views
    {

        // ============================================================================
        // ViewAllocation
        // ============================================================================

        ViewAllocation::ViewAllocation(std::string name) : name_(std::move(name))
        {
        }

        void ViewAllocation::set_weight(const std::string &asset, double weight)
        {
            if (asset.empty())
            {
                throw std::invalid_argument("Allocation asset id cannot be empty");
            }
            if (!std::isfinite(weight))
            {
                throw std::invalid_argument("Allocation weight for '" + asset + "' must be finite");
            }

            for (auto &entry : weights_)
            {
                if (entry.first == asset)
                {
                    entry.second = weight;
                    return;
                }
            }
            weights_.emplace_back(asset, weight);
        }

        bool ViewAllocation::remove_asset(const std::string &asset)
        {
            for (auto it = weights_.begin(); it != weights_.end(); ++it)
            {
                if (it->first == asset)
                {
                    weights_.erase(it);
                    return true;
                }
            }
            return false;
        }

        double ViewAllocation::get_weight(const std::string &asset) const
        {
            for (const auto &entry : weights_)
            {
                if (entry.first == asset)
                {
                    return entry.second;
                }
            }
            return 0.0;
        }

        bool ViewAllocation::contains(const std::string &asset) const
        {
            for (const auto &entry : weights_)
            {
                if (entry.first == asset)
                {
                    return true;
                }
            }
            return false;
        }

        std::vector<std::string> ViewAllocation::get_assets() const
        {
            std::vector<std::string> assets;
            assets.reserve(weights_.size());
            for (const auto &entry : weights_)
            {
                assets.push_back(entry.first);
            }
            return assets;
        }

        bool ViewAllocation::is_relative(double tolerance) const
        {
            if (weights_.empty())
            {
                return false;
            }

            double total = 0.0;
            for (const auto &entry : weights_)
            {
                total += entry.second;
            }
            return std::abs(total) <= tolerance;
        }

        nlohmann::json ViewAllocation::to_json() const
        {
            nlohmann::json weights = nlohmann::json::object();
            for (const auto &entry : weights_)
            {
                weights[entry.first] = entry.second;
            }
            return nlohmann::json{{"name", name_}, {"weights", weights}};
        }

        ViewAllocation ViewAllocation::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("View allocation must be a JSON object");
            }

            // Either {"name": ..., "weights": {...}} or a bare weights object
            const bool nested = j.contains("weights");
            ViewAllocation allocation(nested ? j.value("name", "") : "");
            const nlohmann::json &weights = nested ? j["weights"] : j;

            if (!weights.is_object())
            {
                throw std::invalid_argument("View allocation 'weights' must be an object");
            }

            for (auto it = weights.begin(); it != weights.end(); ++it)
            {
                if (!it.value().is_number())
                {
                    throw std::invalid_argument("Allocation weight for '" + it.key() + "' must be a number");
                }
                allocation.set_weight(it.key(), it.value().get<double>());
            }
            return allocation;
        }

        // ============================================================================
        // View
        // ============================================================================

        View::View(std::string id,
                   std::string name,
                   double confidence,
                   double out_performance,
                   ViewAllocation allocation)
            : id_(std::move(id)),
              name_(std::move(name)),
              confidence_(confidence),
              out_performance_(out_performance),
              allocation_(std::move(allocation))
        {
            if (id_.empty())
            {
                throw std::invalid_argument("View id cannot be empty");
            }
            if (!(confidence_ >= 0.0 && confidence_ <= 1.0))
            {
                throw std::invalid_argument(
                    "View confidence must be in [0, 1], got: " + std::to_string(confidence_));
            }
            if (!std::isfinite(out_performance_))
            {
                throw std::invalid_argument("View out_performance must be finite");
            }
        }

        Eigen::RowVectorXd View::get_view_data_frame(const std::vector<std::string> &asset_universe) const
        {
            std::set<std::string> universe(asset_universe.begin(), asset_universe.end());
            for (const auto &asset : allocation_.get_assets())
            {
                if (universe.count(asset) == 0)
                {
                    throw DimensionMismatch("view '" + id_ + "' references asset '" + asset +
                                            "' which is not in the asset universe");
                }
            }

            Eigen::RowVectorXd row = Eigen::RowVectorXd::Zero(static_cast<Eigen::Index>(asset_universe.size()));
            for (size_t i = 0; i < asset_universe.size(); ++i)
            {
                row(static_cast<Eigen::Index>(i)) = allocation_.get_weight(asset_universe[i]);
            }
            return row;
        }

        View View::with_name(const std::string &name) const
        {
            return View(id_, name, confidence_, out_performance_, allocation_);
        }

        View View::with_confidence(double confidence) const
        {
            return View(id_, name_, confidence, out_performance_, allocation_);
        }

        View View::with_out_performance(double out_performance) const
        {
            return View(id_, name_, confidence_, out_performance, allocation_);
        }

        View View::with_allocation(const ViewAllocation &allocation) const
        {
            return View(id_, name_, confidence_, out_performance_, allocation);
        }

        nlohmann::json View::to_json() const
        {
            return nlohmann::json{
                {"id", id_},
                {"name", name_},
                {"confidence", confidence_},
                {"out_performance", out_performance_},
                {"allocation", allocation_.to_json()}};
        }

        View View::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("View must be a JSON object");
            }

            for (const char *key : {"id", "confidence", "out_performance", "allocation"})
            {
                if (!j.contains(key))
                {
                    throw std::invalid_argument(std::string("View is missing '") + key + "'");
                }
            }

            std::string id;
            if (j["id"].is_string())
            {
                id = j["id"].get<std::string>();
            }
            else if (j["id"].is_number_integer())
            {
                id = std::to_string(j["id"].get<long long>());
            }
            else
            {
                throw std::invalid_argument("View 'id' must be a string or integer");
            }

            if (!j["confidence"].is_number() || !j["out_performance"].is_number())
            {
                throw std::invalid_argument("View '" + id + "': confidence and out_performance must be numbers");
            }

            return View(id,
                        j.value("name", id),
                        j["confidence"].get<double>(),
                        j["out_performance"].get<double>(),
                        ViewAllocation::from_json(j["allocation"]));
        }

    } // namespace views
} // namespace black_litterman
