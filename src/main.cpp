/**
 * @file main.cpp
 * @brief Main entry point for the Black-Litterman weight engine
 *
 * Command-line application that loads settings, views and a market data
 * snapshot, calibrates view variances and prints the posterior weights.
 */

#include "calibration/minimizer_factory.hpp"
#include "engine/black_litterman_engine.hpp"
#include "market/snapshot_market_data.hpp"
#include "settings/calculation_settings.hpp"
#include "views/view_collection.hpp"
#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace black_litterman;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Black-Litterman Weight Engine v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --market-data PATH    Path to market data snapshot JSON file (required)\n"
              << "  --views PATH          Path to views JSON file (default: no views)\n"
              << "  --start DATE          Override analysis start date (YYYY-MM-DD)\n"
              << "  --end DATE            Override calculation date (YYYY-MM-DD)\n"
              << "  --output PATH         Write a JSON report to PATH\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/black_litterman_config.json \\\n"
              << "      --market-data data/market/market_snapshot.json \\\n"
              << "      --views data/views/example_views.json --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Black-Litterman Weight Engine v1.0.0                    \n"
              << "       Views blended into market equilibrium weights           \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string market_data_path;
    std::string views_path;
    std::string start_date;
    std::string end_date;
    std::string output_path;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--market-data" && i + 1 < argc)
            {
                args.market_data_path = argv[++i];
            }
            else if (arg == "--views" && i + 1 < argc)
            {
                args.views_path = argv[++i];
            }
            else if (arg == "--start" && i + 1 < argc)
            {
                args.start_date = argv[++i];
            }
            else if (arg == "--end" && i + 1 < argc)
            {
                args.end_date = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() && !market_data_path.empty();
    }
};

/**
 * @brief Print market weights, posterior weights and their difference
 */
void print_weights(const BlackLittermanResult &result, const CalculationSettings &settings)
{
    LabelledVector difference = result.weight_changes();

    std::cout << "\nTARGET WEIGHTS\n";
    std::cout << std::string(72, '-') << "\n";
    std::cout << "  " << std::setw(12) << std::left << "Asset"
              << std::setw(24) << "Label"
              << std::setw(12) << std::right << "Market"
              << std::setw(12) << "B-L"
              << std::setw(10) << "Diff" << "\n";
    std::cout << std::string(72, '-') << "\n";

    for (const auto &asset : result.weights.labels)
    {
        std::cout << "  " << std::setw(12) << std::left << asset
                  << std::setw(24) << settings.asset_label(asset).substr(0, 22)
                  << std::right << std::fixed << std::setprecision(2)
                  << std::setw(11) << result.market_weights.at(asset) * 100 << "%"
                  << std::setw(11) << result.weights.at(asset) * 100 << "%"
                  << std::setw(9) << difference.at(asset) * 100 << "%\n";
    }

    std::cout << std::string(72, '-') << "\n";
    std::cout << "  " << std::setw(36) << std::left << "Total"
              << std::right << std::setw(11) << result.market_weights.sum() * 100 << "%"
              << std::setw(11) << result.weights.sum() * 100 << "%\n";
}

/**
 * @brief Print calibrated variance per view
 */
void print_calibration(const BlackLittermanResult &result, bool verbose)
{
    std::cout << "\nVIEW CALIBRATION\n";
    std::cout << std::string(72, '-') << "\n";

    if (result.calibrations.empty())
    {
        std::cout << "  No views supplied: posterior equals market weights\n";
        std::cout << std::string(72, '-') << "\n";
        return;
    }

    for (const auto &calibration : result.calibrations)
    {
        std::cout << "  " << calibration.summary(verbose) << "\n";
    }

    std::cout << std::string(72, '-') << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        ConfigJson config_json = CalculationSettings::load_json(args.config_path);
        CalculationSettings settings = CalculationSettings::parse_from_config(config_json);
        calibration::CalibrationConfig calibration_config =
            calibration::CalibrationConfig::from_root_config(config_json);

        std::string start_date = args.start_date.empty() ? settings.start_date() : args.start_date;
        std::string end_date = args.end_date.empty() ? settings.calculation_date() : args.end_date;

        if (args.verbose)
        {
            std::cout << "  - Assets: ";
            for (const auto &asset : settings.asset_ids())
            {
                std::cout << asset << " ";
            }
            std::cout << "\n  - Window: " << start_date << " to " << end_date << "\n";
            std::cout << "  - tau: " << settings.tau()
                      << ", risk aversion: " << settings.risk_aversion() << "\n";
            std::cout << "  - Calibration: " << calibration_config.method
                      << (calibration_config.parallel ? " (parallel)" : "") << "\n";
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/4] Loading market data..." << std::endl;

        auto market_data = std::make_shared<market::SnapshotMarketDataEngine>(
            market::SnapshotMarketDataEngine::load_from_file(args.market_data_path));

        if (args.verbose)
        {
            std::cout << "  - Source: " << market_data->get_name() << "\n";
            std::cout << "  - Weight dates: " << market_data->get_weight_dates().size() << "\n";
        }

        // ====================================================================
        // 3. Load Views
        // ====================================================================
        std::cout << "[3/4] Loading views..." << std::endl;

        views::ViewCollection views;
        if (!args.views_path.empty())
        {
            views = views::ViewCollection::load_from_file(args.views_path);
        }

        std::cout << "  - Loaded " << views.size() << " views" << std::endl;

        if (args.verbose)
        {
            for (const auto &view : views.get_all_views())
            {
                std::cout << "  - " << view.id() << ": " << view.name()
                          << (view.allocation().is_relative() ? " (relative)" : " (absolute)")
                          << ", q = " << view.out_performance() << "\n";
            }
        }

        // ====================================================================
        // 4. Calibrate and Solve
        // ====================================================================
        std::cout << "[4/4] Calibrating views and solving..." << std::endl;

        BlackLittermanEngine engine(market_data, settings, calibration_config);
        BlackLittermanResult result = engine.run(views, start_date, end_date);

        print_weights(result, settings);
        print_calibration(result, args.verbose);

        if (!args.output_path.empty())
        {
            std::ofstream out(args.output_path);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot open output file: " + args.output_path);
            }

            nlohmann::json report = result.to_json();
            report["settings"] = settings.to_json();
            report["calibration_config"] = calibration_config.to_json();
            report["start_date"] = start_date;
            report["end_date"] = end_date;
            out << report.dump(2) << std::endl;

            std::cout << "\n  Report written to: " << args.output_path << "\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Calculation completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
