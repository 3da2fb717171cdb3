/**
 * @file calculation_settings.cpp
 * @brief Parsing and validation of CalculationSettings
 */

#include "settings/calculation_settings.hpp"
#include "core/errors.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
#include <set>

namespace black_litterman {

namespace {

const ConfigJson& require_object(const ConfigJson& parent, const std::string& key, const std::string& path)
{
    if (!parent.contains(key)) {
        throw ConfigurationError("missing key '" + path + key + "'");
    }
    const auto& child = parent[key];
    if (!child.is_object()) {
        throw ConfigurationError("'" + path + key + "' must be an object");
    }
    return child;
}

double require_number(const ConfigJson& parent, const std::string& key, const std::string& path)
{
    if (!parent.contains(key)) {
        throw ConfigurationError("missing key '" + path + key + "'");
    }
    if (!parent[key].is_number()) {
        throw ConfigurationError("'" + path + key + "' must be a number");
    }
    return parent[key].get<double>();
}

std::string require_string(const ConfigJson& parent, const std::string& key, const std::string& path)
{
    if (!parent.contains(key)) {
        throw ConfigurationError("missing key '" + path + key + "'");
    }
    if (!parent[key].is_string()) {
        throw ConfigurationError("'" + path + key + "' must be a string");
    }
    return parent[key].get<std::string>();
}

} // namespace

// ============================================================================
// Construction and validation
// ============================================================================

CalculationSettings::CalculationSettings(double tau,
                                         double risk_aversion,
                                         std::string start_date,
                                         std::string calculation_date,
                                         std::vector<AssetDescriptor> asset_universe)
    : tau_(tau),
      risk_aversion_(risk_aversion),
      start_date_(std::move(start_date)),
      calculation_date_(std::move(calculation_date)),
      asset_universe_(std::move(asset_universe))
{
    validate();
}

void CalculationSettings::validate() const
{
    if (!std::isfinite(tau_) || tau_ <= 0.0) {
        throw ConfigurationError("tau must be positive, got: " + std::to_string(tau_));
    }
    if (!std::isfinite(risk_aversion_) || risk_aversion_ <= 0.0) {
        throw ConfigurationError("risk_aversion must be positive, got: " + std::to_string(risk_aversion_));
    }
    if (!is_valid_date_format(start_date_)) {
        throw ConfigurationError("first_date is not a YYYY-MM-DD date: '" + start_date_ + "'");
    }
    if (!is_valid_date_format(calculation_date_)) {
        throw ConfigurationError("last_date is not a YYYY-MM-DD date: '" + calculation_date_ + "'");
    }
    // ISO dates order lexicographically
    if (start_date_ > calculation_date_) {
        throw ConfigurationError("first_date " + start_date_ + " is after last_date " + calculation_date_);
    }
    if (asset_universe_.empty()) {
        throw ConfigurationError("asset_universe must contain at least one asset");
    }

    std::set<std::string> seen;
    for (const auto& asset : asset_universe_) {
        if (asset.id.empty()) {
            throw ConfigurationError("asset_universe contains an empty asset id");
        }
        if (!seen.insert(asset.id).second) {
            throw ConfigurationError("duplicate asset in asset_universe: " + asset.id);
        }
    }
}

// ============================================================================
// Configuration parsing
// ============================================================================

CalculationSettings CalculationSettings::parse_from_config(const ConfigJson& j)
{
    if (!j.is_object()) {
        throw ConfigurationError("configuration root must be an object");
    }

    const auto& params = require_object(j, "parameters", "");
    const auto& market_data = require_object(j, "market_data", "");

    double tau = require_number(params, "tau", "parameters.");
    double risk_aversion = require_number(params, "risk_aversion", "parameters.");
    std::string first_date = require_string(market_data, "first_date", "market_data.");
    std::string last_date = require_string(market_data, "last_date", "market_data.");

    const auto& universe_json = require_object(market_data, "asset_universe", "market_data.");

    std::vector<AssetDescriptor> universe;
    for (auto it = universe_json.begin(); it != universe_json.end(); ++it) {
        if (!it.value().is_string()) {
            throw ConfigurationError("label of asset '" + it.key() + "' must be a string");
        }
        universe.push_back({it.key(), it.value().get<std::string>()});
    }

    return CalculationSettings(tau, risk_aversion, first_date, last_date, universe);
}

ConfigJson CalculationSettings::load_json(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open JSON file: " + filepath);
    }

    ConfigJson j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
    }
    return j;
}

CalculationSettings CalculationSettings::load_from_file(const std::string& config_path)
{
    return parse_from_config(load_json(config_path));
}

ConfigJson CalculationSettings::to_json() const
{
    ConfigJson universe = ConfigJson::object();
    for (const auto& asset : asset_universe_) {
        universe[asset.id] = asset.label;
    }

    ConfigJson j;
    j["parameters"] = {{"tau", tau_}, {"risk_aversion", risk_aversion_}};
    j["market_data"] = {{"first_date", start_date_},
                        {"last_date", calculation_date_},
                        {"asset_universe", universe}};
    return j;
}

// ============================================================================
// Accessors
// ============================================================================

std::vector<std::string> CalculationSettings::asset_ids() const
{
    std::vector<std::string> ids;
    ids.reserve(asset_universe_.size());
    for (const auto& asset : asset_universe_) {
        ids.push_back(asset.id);
    }
    return ids;
}

const std::string& CalculationSettings::asset_label(const std::string& asset_id) const
{
    for (const auto& asset : asset_universe_) {
        if (asset.id == asset_id) {
            return asset.label;
        }
    }
    throw std::out_of_range("Asset not in universe: " + asset_id);
}

bool CalculationSettings::is_valid_date_format(const std::string& date)
{
    // Simple check for YYYY-MM-DD format
    if (date.length() != 10)
        return false;
    if (date[4] != '-' || date[7] != '-')
        return false;

    for (size_t i = 0; i < date.length(); ++i) {
        if (i == 4 || i == 7)
            continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i])))
            return false;
    }

    int month = std::stoi(date.substr(5, 2));
    int day = std::stoi(date.substr(8, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

} // namespace black_litterman
