/**
 * @file data_loader.hpp
 * @brief Configuration and input file loading
 *
 * Loads the analytics configuration from JSON and the simulator outputs
 * (equity curve, fills) from CSV files.
 */

#ifndef PERFRISK_DATA_DATA_LOADER_HPP
#define PERFRISK_DATA_DATA_LOADER_HPP

#include "analytics/performance_metrics.hpp"
#include "analytics/rolling_statistics.hpp"
#include "backtest/trade_logger.hpp"
#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>


namespace perfrisk {

/**
 * @struct AnalyticsConfig
 * @brief Complete engine configuration
 *
 * JSON layout:
 * {
 *   "metrics": { "risk_free_rate": 0.02, "periods_per_year": 252, ... },
 *   "rolling": { "window": 252 },
 *   "audit":   { "match_tolerance_seconds": 60, "context_expiry_bars": 50 }
 * }
 */
struct AnalyticsConfig {
    analytics::MetricsConfig metrics;          ///< Ratio, VaR and CAGR parameters
    analytics::RollingConfig rolling;          ///< Rolling window settings
    backtest::TradeLoggerConfig audit;         ///< Trade audit log settings

    /**
     * @brief Load from JSON object; absent sections keep their defaults
     */
    static AnalyticsConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load and validate configuration from a JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument if a value is out of range
     */
    static AnalyticsConfig load_from_file(const std::string& config_path);

    /**
     * @brief Check every section
     * @throws std::invalid_argument naming the offending value
     */
    void validate() const;
};

/**
 * @class DataLoader
 * @brief Loads engine inputs from files
 *
 * Supported CSV layouts (header row required):
 * - Equity curve: timestamp,value
 * - Fills: timestamp,symbol,direction,quantity,price,commission
 *
 * Timestamps are "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS".
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load an equity curve
     *
     * Expected format:
     * timestamp,value
     * 2024-01-02,100000.0
     *
     * @param filepath Path to CSV file
     * @return Validated equity curve
     * @throws std::runtime_error if the file cannot be opened or a row is malformed
     * @throws ValidationError if the resulting curve is invalid
     */
    static EquityCurve load_equity_curve_csv(const std::string& filepath);

    /**
     * @brief Load executed fills
     *
     * Expected format:
     * timestamp,symbol,direction,quantity,price,commission
     * 2024-01-02 10:00:00,AAA,BUY,100,50.25,1.0
     *
     * @param filepath Path to CSV file
     * @return Fills in file order, each validated
     * @throws std::runtime_error if the file cannot be opened or a row is malformed
     * @throws ValidationError if a fill is invalid
     */
    static std::vector<Fill> load_fills_csv(const std::string& filepath);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @param filepath Path to JSON file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete analytics configuration
     * @param config_path Path to config JSON file
     * @return Validated AnalyticsConfig
     */
    static AnalyticsConfig load_config(const std::string& config_path);

private:
    /**
     * @brief Parse CSV line into tokens (double quotes group commas)
     */
    static std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Trim whitespace from string
     */
    static std::string trim(const std::string& str);

    /**
     * @brief Parse a number, naming file and line on failure
     * @throws std::runtime_error if the text is not a number
     */
    static double parse_number(const std::string& str, const std::string& context);
};

} // namespace perfrisk

#endif // PERFRISK_DATA_DATA_LOADER_HPP
