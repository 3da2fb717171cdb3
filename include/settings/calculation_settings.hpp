/**
 * @file calculation_settings.hpp
 * @brief Model hyperparameters and analysis window
 *
 * Built once per analysis session from the JSON configuration and
 * read-only afterwards.
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "parameters":  { "tau": 0.05, "risk_aversion": 2.5 },
 *   "market_data": {
 *     "first_date": "2015-01-01",
 *     "last_date":  "2020-12-31",
 *     "asset_universe": { "GOVT": "Government Bonds", "EQ": "World Equity" }
 *   }
 * }
 * @endcode
 */

#ifndef BLACK_LITTERMAN_CALCULATION_SETTINGS_HPP
#define BLACK_LITTERMAN_CALCULATION_SETTINGS_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace black_litterman {

/**
 * @brief JSON type used for configuration documents
 *
 * Ordered so that the asset universe keeps the order of the file.
 */
using ConfigJson = nlohmann::ordered_json;

/**
 * @struct AssetDescriptor
 * @brief Asset identifier and its descriptive label
 */
struct AssetDescriptor {
    std::string id;    ///< Unique asset identifier
    std::string label; ///< Human-readable description
};

/**
 * @class CalculationSettings
 * @brief Immutable Black-Litterman session settings
 *
 * Usage Example:
 * @code
 * auto settings = CalculationSettings::load_from_file("data/config/black_litterman_config.json");
 * double tau = settings.tau();
 * @endcode
 */
class CalculationSettings {
public:
    /**
     * @brief Construct and validate
     * @param tau Prior uncertainty scaling (> 0)
     * @param risk_aversion Market risk aversion (> 0)
     * @param start_date First date of the analysis window (YYYY-MM-DD)
     * @param calculation_date Last date of the window (YYYY-MM-DD, >= start_date)
     * @param asset_universe Ordered, non-empty, unique assets
     * @throws ConfigurationError if any value is invalid
     */
    CalculationSettings(double tau,
                        double risk_aversion,
                        std::string start_date,
                        std::string calculation_date,
                        std::vector<AssetDescriptor> asset_universe);

    /**
     * @brief Parse from a configuration document
     * @param j Root configuration object
     * @return Validated settings
     * @throws ConfigurationError on missing or malformed keys
     */
    static CalculationSettings parse_from_config(const ConfigJson& j);

    /**
     * @brief Load and parse a configuration file
     * @param config_path Path to JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws ConfigurationError on missing or malformed keys
     */
    static CalculationSettings load_from_file(const std::string& config_path);

    /**
     * @brief Read a JSON configuration file preserving key order
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static ConfigJson load_json(const std::string& filepath);

    /**
     * @brief Serialise back to the configuration layout
     */
    ConfigJson to_json() const;

    double tau() const { return tau_; }
    double risk_aversion() const { return risk_aversion_; }
    const std::string& start_date() const { return start_date_; }
    const std::string& calculation_date() const { return calculation_date_; }
    const std::vector<AssetDescriptor>& asset_universe() const { return asset_universe_; }

    /**
     * @brief Asset identifiers in universe order
     */
    std::vector<std::string> asset_ids() const;

    /**
     * @brief Descriptive label of an asset
     * @throws std::out_of_range if the asset is not in the universe
     */
    const std::string& asset_label(const std::string& asset_id) const;

    /**
     * @brief Check YYYY-MM-DD format with a valid month and day
     */
    static bool is_valid_date_format(const std::string& date);

private:
    double tau_;
    double risk_aversion_;
    std::string start_date_;
    std::string calculation_date_;
    std::vector<AssetDescriptor> asset_universe_;

    void validate() const;
};

} // namespace black_litterman

#endif // BLACK_LITTERMAN_CALCULATION_SETTINGS_HPP
