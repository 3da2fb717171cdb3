/**
 * @file snapshot_market_data.cpp
 * @brief Implementation of SnapshotMarketDataEngine
 */

#include "market/snapshot_market_data.hpp"
#include "settings/calculation_settings.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>

namespace black_litterman
{
    namespace market
    {

        // ============================================================================
        // Constructor
        // ============================================================================

        SnapshotMarketDataEngine::SnapshotMarketDataEngine(const std::vector<std::string> &assets)
            : assets_(assets)
        {
            if (assets_.empty())
            {
                throw std::invalid_argument("Snapshot must contain at least one asset");
            }

            std::set<std::string> seen;
            for (const auto &asset : assets_)
            {
                if (!seen.insert(asset).second)
                {
                    throw std::invalid_argument("Duplicate asset in snapshot: " + asset);
                }
            }
        }

        void SnapshotMarketDataEngine::validate_date(const std::string &date)
        {
            if (!CalculationSettings::is_valid_date_format(date))
            {
                throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): '" + date + "'");
            }
        }

        // ==========================
        // Data Modification Methods
        // ==========================

        void SnapshotMarketDataEngine::add_market_weights(const std::string &date, const Eigen::VectorXd &weights)
        {
            validate_date(date);

            if (weights.size() != static_cast<Eigen::Index>(assets_.size()))
            {
                throw std::invalid_argument("Weights for " + date + " have " + std::to_string(weights.size()) +
                                            " entries, expected " + std::to_string(assets_.size()));
            }
            if (!weights.allFinite())
            {
                throw std::invalid_argument("Weights for " + date + " contain NaN or Inf values");
            }
            if ((weights.array() < 0.0).any())
            {
                throw std::invalid_argument("Market weights for " + date + " must be non-negative");
            }

            weights_by_date_[date] = weights;
        }

        void SnapshotMarketDataEngine::add_covariance(const std::string &start_date,
                                                      const std::string &end_date,
                                                      const Eigen::MatrixXd &covariance)
        {
            validate_date(start_date);
            validate_date(end_date);

            const auto n = static_cast<Eigen::Index>(assets_.size());
            if (covariance.rows() != n || covariance.cols() != n)
            {
                throw std::invalid_argument("Covariance matrix must be " + std::to_string(n) + "x" +
                                            std::to_string(n));
            }
            if (!covariance.allFinite())
            {
                throw std::invalid_argument("Covariance matrix contains NaN or Inf values");
            }

            double asymmetry = (covariance - covariance.transpose()).cwiseAbs().maxCoeff();
            double scale = std::max(1.0, covariance.cwiseAbs().maxCoeff());
            if (asymmetry > 1e-10 * scale)
            {
                throw std::invalid_argument("Covariance matrix for " + start_date + " to " + end_date +
                                            " is not symmetric");
            }

            covariances_[std::make_pair(start_date, end_date)] = covariance;
        }

        // ============================================================================
        // MarketDataEngine Interface
        // ============================================================================

        LabelledVector SnapshotMarketDataEngine::get_market_weights(const std::string &end_date) const
        {
            // Latest observation on or before end_date
            auto it = weights_by_date_.upper_bound(end_date);
            if (it == weights_by_date_.begin())
            {
                throw std::out_of_range("No market weights on or before " + end_date);
            }
            --it;
            return LabelledVector("market", assets_, it->second);
        }

        LabelledMatrix SnapshotMarketDataEngine::get_annualised_cov_matrix(const std::string &start_date,
                                                                           const std::string &end_date) const
        {
            auto it = covariances_.find(std::make_pair(start_date, end_date));
            if (it == covariances_.end())
            {
                throw std::out_of_range("No covariance stored for window " + start_date + " to " + end_date);
            }
            return LabelledMatrix::square(assets_, it->second);
        }

        std::string SnapshotMarketDataEngine::get_name() const
        {
            return "SnapshotMarketDataEngine";
        }

        std::vector<std::string> SnapshotMarketDataEngine::get_weight_dates() const
        {
            std::vector<std::string> dates;
            for (const auto &entry : weights_by_date_)
            {
                dates.push_back(entry.first);
            }
            return dates;
        }

        bool SnapshotMarketDataEngine::has_covariance(const std::string &start_date, const std::string &end_date) const
        {
            return covariances_.count(std::make_pair(start_date, end_date)) > 0;
        }

        // ================
        // JSON Loading
        // ================

        SnapshotMarketDataEngine SnapshotMarketDataEngine::from_json(const nlohmann::json &j)
        {
            if (!j.is_object() || !j.contains("assets") || !j["assets"].is_array())
            {
                throw std::invalid_argument("Snapshot must contain an 'assets' array");
            }

            std::vector<std::string> assets;
            for (const auto &asset : j["assets"])
            {
                if (!asset.is_string())
                {
                    throw std::invalid_argument("Snapshot asset ids must be strings");
                }
                assets.push_back(asset.get<std::string>());
            }

            SnapshotMarketDataEngine engine(assets);
            const auto n = static_cast<Eigen::Index>(assets.size());

            if (j.contains("market_weights"))
            {
                const auto &by_date = j["market_weights"];
                if (!by_date.is_object())
                {
                    throw std::invalid_argument("'market_weights' must be an object keyed by date");
                }

                for (auto it = by_date.begin(); it != by_date.end(); ++it)
                {
                    if (!it.value().is_object())
                    {
                        throw std::invalid_argument("Market weights for " + it.key() + " must be an object");
                    }

                    Eigen::VectorXd weights(n);
                    for (Eigen::Index i = 0; i < n; ++i)
                    {
                        const auto &asset = assets[static_cast<size_t>(i)];
                        if (!it.value().contains(asset) || !it.value()[asset].is_number())
                        {
                            throw std::invalid_argument("Market weights for " + it.key() +
                                                        " are missing asset '" + asset + "'");
                        }
                        weights(i) = it.value()[asset].get<double>();
                    }
                    if (it.value().size() != assets.size())
                    {
                        throw std::invalid_argument("Market weights for " + it.key() +
                                                    " reference assets outside the snapshot");
                    }
                    engine.add_market_weights(it.key(), weights);
                }
            }

            if (j.contains("covariances"))
            {
                const auto &windows = j["covariances"];
                if (!windows.is_array())
                {
                    throw std::invalid_argument("'covariances' must be an array");
                }

                for (const auto &window : windows)
                {
                    if (!window.is_object() || !window.contains("matrix") ||
                        !window.contains("start_date") || !window.contains("end_date") ||
                        !window["start_date"].is_string() || !window["end_date"].is_string())
                    {
                        throw std::invalid_argument(
                            "Each covariance entry needs 'start_date', 'end_date' and 'matrix'");
                    }

                    const auto &rows = window["matrix"];
                    if (!rows.is_array() || static_cast<Eigen::Index>(rows.size()) != n)
                    {
                        throw std::invalid_argument("Covariance matrix must have " + std::to_string(n) + " rows");
                    }

                    Eigen::MatrixXd covariance(n, n);
                    for (Eigen::Index r = 0; r < n; ++r)
                    {
                        const auto &row = rows[static_cast<size_t>(r)];
                        if (!row.is_array() || static_cast<Eigen::Index>(row.size()) != n)
                        {
                            throw std::invalid_argument("Covariance matrix must have " + std::to_string(n) + " columns");
                        }
                        for (Eigen::Index c = 0; c < n; ++c)
                        {
                            const auto &value = row[static_cast<size_t>(c)];
                            if (!value.is_number())
                            {
                                throw std::invalid_argument("Covariance entries must be numbers");
                            }
                            covariance(r, c) = value.get<double>();
                        }
                    }

                    engine.add_covariance(window["start_date"].get<std::string>(),
                                          window["end_date"].get<std::string>(),
                                          covariance);
                }
            }

            return engine;
        }

        SnapshotMarketDataEngine SnapshotMarketDataEngine::load_from_file(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open market data file: " + filepath);
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

    } // namespace market
} // namespace black_litterman
