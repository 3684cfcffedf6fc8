/**
 * @file types.cpp
 * @brief Validation and conversion helpers for the shared input records.
 */

#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/ratio_value.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace perfrisk
{

    std::string to_string(Direction direction)
    {
        return direction == Direction::BUY ? "BUY" : "SELL";
    }

    Direction parse_direction(const std::string &text)
    {
        std::string upper(text);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });

        if (upper == "BUY")
        {
            return Direction::BUY;
        }
        if (upper == "SELL")
        {
            return Direction::SELL;
        }
        throw std::invalid_argument("Unknown fill direction: '" + text + "'");
    }

    void validate_fill(const Fill &fill)
    {
        if (fill.symbol.empty())
        {
            throw ValidationError("Fill has an empty symbol");
        }
        if (fill.quantity <= 0)
        {
            throw ValidationError(
                "Fill quantity must be positive for " + fill.symbol + ", got: " + std::to_string(fill.quantity));
        }
        if (!(fill.fill_price > 0.0) || !std::isfinite(fill.fill_price))
        {
            throw ValidationError(
                "Fill price must be positive for " + fill.symbol + ", got: " + std::to_string(fill.fill_price));
        }
        if (!(fill.commission >= 0.0) || !std::isfinite(fill.commission))
        {
            throw ValidationError(
                "Fill commission must be non-negative for " + fill.symbol + ", got: " + std::to_string(fill.commission));
        }
    }

    void validate_equity_curve(const EquityCurve &curve, const std::string &name)
    {
        if (curve.empty())
        {
            throw ValidationError(name + " is empty");
        }

        for (size_t i = 0; i < curve.size(); ++i)
        {
            if (!(curve[i].value > 0.0) || !std::isfinite(curve[i].value))
            {
                throw ValidationError(
                    name + " contains non-positive values (value " + std::to_string(curve[i].value) + " at index " + std::to_string(i) + ", " + format_timestamp(curve[i].timestamp) + ")");
            }
            if (i > 0 && !(curve[i - 1].timestamp < curve[i].timestamp))
            {
                throw ValidationError(
                    name + " timestamps must be strictly increasing (index " + std::to_string(i) + ", " + format_timestamp(curve[i].timestamp) + ")");
            }
        }
    }

    std::string RatioValue::to_string() const
    {
        if (infinite_)
        {
            return "Infinity";
        }
        std::ostringstream oss;
        oss << value_;
        return oss.str();
    }

} // namespace perfrisk
