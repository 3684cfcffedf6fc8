/**
 * @file main.cpp
 * @brief Command-line entry point for the PerfRisk analytics engine
 *
 * Loads an equity curve (and optionally fills, a benchmark curve and a
 * configuration file), computes the full metrics report and prints it.
 */

#include "analytics/performance_metrics.hpp"
#include "core/logging.hpp"
#include "core/time_utils.hpp"
#include "data/data_loader.hpp"
#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

using namespace perfrisk;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "PerfRisk Analytics Engine v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --equity PATH         Equity curve CSV (timestamp,value) (required)\n"
              << "  --fills PATH          Fills CSV (timestamp,symbol,direction,quantity,price,commission)\n"
              << "  --benchmark PATH      Benchmark curve CSV sampled at the same timestamps\n"
              << "  --config PATH         Analytics configuration JSON\n"
              << "  --capital VALUE       Initial capital (default: first equity value)\n"
              << "  --json PATH           Write the report as JSON\n"
              << "  --rolling PATH        Write the rolling metrics table as CSV\n"
              << "  --verbose             Enable debug logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --equity results/equity.csv --fills results/fills.csv --json results/metrics.json\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string equity_path;
    std::string fills_path;
    std::string benchmark_path;
    std::string config_path;
    std::string json_path;
    std::string rolling_path;
    double initial_capital = 0.0;
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
            else if (arg == "--equity" && i + 1 < argc)
            {
                args.equity_path = argv[++i];
            }
            else if (arg == "--fills" && i + 1 < argc)
            {
                args.fills_path = argv[++i];
            }
            else if (arg == "--benchmark" && i + 1 < argc)
            {
                args.benchmark_path = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--capital" && i + 1 < argc)
            {
                args.initial_capital = std::stod(argv[++i]);
            }
            else if (arg == "--json" && i + 1 < argc)
            {
                args.json_path = argv[++i];
            }
            else if (arg == "--rolling" && i + 1 < argc)
            {
                args.rolling_path = argv[++i];
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
        return !show_help && !equity_path.empty();
    }
};

namespace
{

    std::string optional_cell(const std::optional<double> &value)
    {
        return value ? std::to_string(*value) : std::string();
    }

    void write_rolling_csv(const analytics::RollingTable &table, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "timestamp,sharpe,volatility,max_drawdown,value_at_risk";
        if (table.has_benchmark())
        {
            file << ",correlation,beta";
        }
        file << "\n";

        for (int i = 0; i < table.size(); ++i)
        {
            file << format_timestamp(table.timestamps[i]) << ","
                 << optional_cell(table.sharpe[i]) << ","
                 << optional_cell(table.volatility[i]) << ","
                 << optional_cell(table.max_drawdown[i]) << ","
                 << optional_cell(table.value_at_risk[i]);
            if (table.has_benchmark())
            {
                file << "," << optional_cell(table.correlation[i])
                     << "," << optional_cell(table.beta[i]);
            }
            file << "\n";
        }
    }

} // namespace

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();
    auto logger = default_logger();
    logger->set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);

    try
    {
        AnalyticsConfig config;
        if (!args.config_path.empty())
        {
            config = DataLoader::load_config(args.config_path);
            logger->info("Loaded configuration from {}", args.config_path);
        }

        auto curve = DataLoader::load_equity_curve_csv(args.equity_path);
        logger->info("Loaded {} equity points from {}", curve.size(), args.equity_path);

        std::vector<Fill> fills;
        if (!args.fills_path.empty())
        {
            fills = DataLoader::load_fills_csv(args.fills_path);
            logger->info("Loaded {} fills from {}", fills.size(), args.fills_path);
        }

        double capital = args.initial_capital > 0.0 ? args.initial_capital : curve.front().value;

        analytics::MetricsCalculator calculator(config.metrics, config.rolling, logger);

        analytics::MetricsReport report;
        analytics::RollingTable rolling;
        if (!args.benchmark_path.empty())
        {
            auto benchmark = DataLoader::load_equity_curve_csv(args.benchmark_path);
            report = calculator.calculate_metrics(fills, curve, capital, benchmark);
            if (!args.rolling_path.empty())
            {
                rolling = calculator.calculate_rolling(curve, benchmark);
            }
        }
        else
        {
            report = calculator.calculate_metrics(fills, curve, capital);
            if (!args.rolling_path.empty())
            {
                rolling = calculator.calculate_rolling(curve);
            }
        }

        std::cout << report.summary() << std::endl;

        if (!args.json_path.empty())
        {
            std::ofstream out(args.json_path);
            if (!out.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + args.json_path);
            }
            out << report.to_json().dump(2) << "\n";
            logger->info("Report written to {}", args.json_path);
        }

        if (!args.rolling_path.empty())
        {
            write_rolling_csv(rolling, args.rolling_path);
            logger->info("Rolling metrics written to {}", args.rolling_path);
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();
        logger->info("Analysis completed in {} ms", duration);

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
    CommandLineArgs args;
    try
    {
        args = CommandLineArgs::parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 1;
    }

    if (args.show_help || !args.is_valid())
    {
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    return run(args);
}
