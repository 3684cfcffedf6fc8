/**
 * @file ratio_value.hpp
 * @brief Tagged result for ratios that may be unbounded.
 *
 * Ratios such as Sortino, Omega, Tail, Calmar and profit factor have a
 * zero denominator when no risk (or no loss) was measured. Instead of
 * propagating floating-point infinity, they return a RatioValue that is
 * either a finite number or the PositiveInfinity tag.
 */

#ifndef PERFRISK_CORE_RATIO_VALUE_HPP
#define PERFRISK_CORE_RATIO_VALUE_HPP

#include <limits>
#include <string>

namespace perfrisk
{

    class RatioValue
    {
    public:
        /** @brief Default is Finite(0). */
        RatioValue() : value_(0.0), infinite_(false) {}

        static RatioValue finite(double value) { return RatioValue(value, false); }
        static RatioValue positive_infinity() { return RatioValue(0.0, true); }

        bool is_finite() const { return !infinite_; }
        bool is_infinite() const { return infinite_; }

        /**
         * @brief Numeric value; +inf for the PositiveInfinity tag.
         */
        double value() const
        {
            return infinite_ ? std::numeric_limits<double>::infinity() : value_;
        }

        /**
         * @brief Value with the infinite case replaced by a caller-chosen number.
         */
        double value_or(double fallback) const { return infinite_ ? fallback : value_; }

        /** @brief "Infinity" or the number in default stream formatting. */
        std::string to_string() const;

        bool operator==(const RatioValue &other) const
        {
            return infinite_ == other.infinite_ && (infinite_ || value_ == other.value_);
        }
        bool operator!=(const RatioValue &other) const { return !(*this == other); }

    private:
        RatioValue(double value, bool infinite) : value_(value), infinite_(infinite) {}

        double value_;
        bool infinite_;
    };

} // namespace perfrisk

#endif // PERFRISK_CORE_RATIO_VALUE_HPP
