/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and AnalyticsConfig
 */

#include "data/data_loader.hpp"
#include "core/time_utils.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace perfrisk
{

    // =============================================
    // AnalyticsConfig
    // =============================================

    AnalyticsConfig AnalyticsConfig::from_json(const nlohmann::json &j)
    {
        AnalyticsConfig config;

        if (j.contains("metrics"))
        {
            config.metrics = analytics::MetricsConfig::from_json(j["metrics"]);
        }

        if (j.contains("rolling"))
        {
            config.rolling = analytics::RollingConfig::from_json(j["rolling"]);
        }

        // The rolling engine shares the annualization parameters.
        config.rolling.periods_per_year = config.metrics.periods_per_year;
        config.rolling.risk_free_rate = config.metrics.risk_free_rate;

        if (j.contains("audit"))
        {
            config.audit = backtest::TradeLoggerConfig::from_json(j["audit"]);
        }

        return config;
    }

    AnalyticsConfig AnalyticsConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    void AnalyticsConfig::validate() const
    {
        metrics.validate();
        rolling.validate();
        audit.validate();
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    AnalyticsConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        AnalyticsConfig config;
        try
        {
            config = AnalyticsConfig::from_json(j);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Invalid configuration in " + config_path + ": " + std::string(e.what()));
        }

        config.validate();
        return config;
    }

    // ===========================
    // CSV Loading - Equity Curve
    // ===========================

    EquityCurve DataLoader::load_equity_curve_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.size() < 2 || trim(header[0]) != "timestamp")
        {
            throw std::runtime_error("Equity curve CSV must start with 'timestamp,value' header");
        }

        EquityCurve curve;
        int line_number = 1;
        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string context = filepath + ":" + std::to_string(line_number);
            if (fields.size() < 2)
            {
                throw std::runtime_error("Expected 2 fields at " + context);
            }

            EquityPoint point;
            try
            {
                point.timestamp = parse_timestamp(trim(fields[0]));
            }
            catch (const std::invalid_argument &e)
            {
                throw std::runtime_error(std::string(e.what()) + " at " + context);
            }
            point.value = parse_number(fields[1], context);
            curve.push_back(point);
        }

        validate_equity_curve(curve);
        return curve;
    }

    // ===========================
    // CSV Loading - Fills
    // ===========================

    std::vector<Fill> DataLoader::load_fills_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.size() < 6 || trim(header[0]) != "timestamp")
        {
            throw std::runtime_error(
                "Fills CSV must start with 'timestamp,symbol,direction,quantity,price,commission' header");
        }

        std::vector<Fill> fills;
        int line_number = 1;
        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string context = filepath + ":" + std::to_string(line_number);
            if (fields.size() < 6)
            {
                throw std::runtime_error("Expected 6 fields at " + context);
            }

            Fill fill;
            try
            {
                fill.timestamp = parse_timestamp(trim(fields[0]));
                fill.direction = parse_direction(trim(fields[2]));
            }
            catch (const std::invalid_argument &e)
            {
                throw std::runtime_error(std::string(e.what()) + " at " + context);
            }
            fill.symbol = trim(fields[1]);

            double quantity = parse_number(fields[3], context);
            if (quantity != std::floor(quantity))
            {
                throw std::runtime_error("Quantity must be a whole number at " + context);
            }
            // 2^63 is exact as a double; anything at or beyond it does not fit.
            if (quantity >= static_cast<double>(std::numeric_limits<long long>::max()) ||
                quantity < static_cast<double>(std::numeric_limits<long long>::min()))
            {
                throw std::runtime_error("Quantity out of range at " + context);
            }
            fill.quantity = static_cast<long long>(quantity);
            fill.fill_price = parse_number(fields[4], context);
            fill.commission = parse_number(fields[5], context);

            validate_fill(fill);
            fills.push_back(fill);
        }

        return fills;
    }

    // ===========================
    // Private Helpers
    // ===========================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::parse_number(const std::string &str, const std::string &context)
    {
        std::string trimmed = trim(str);
        size_t consumed = 0;
        double value = 0.0;
        try
        {
            value = std::stod(trimmed, &consumed);
        }
        catch (const std::logic_error &)
        {
            throw std::runtime_error("Invalid number '" + trimmed + "' at " + context);
        }
        if (consumed != trimmed.size() || !std::isfinite(value))
        {
            throw std::runtime_error("Invalid number '" + trimmed + "' at " + context);
        }
        return value;
    }

} // namespace perfrisk
