/**
 * @file types.hpp
 * @brief Input records shared by every analytics component.
 *
 * Equity curves and fills arrive from the portfolio simulator and are
 * treated as read-only for the duration of a single call.
 */

#ifndef PERFRISK_CORE_TYPES_HPP
#define PERFRISK_CORE_TYPES_HPP

#include <chrono>
#include <string>
#include <vector>

namespace perfrisk
{

    /// UTC wall-clock timestamp used throughout the engine.
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * @struct EquityPoint
     * @brief One total-portfolio-value observation.
     */
    struct EquityPoint
    {
        Timestamp timestamp; ///< Observation time (strictly increasing along a curve)
        double value;        ///< Total portfolio value (must be > 0)
    };

    /// Time-ordered series of portfolio values.
    using EquityCurve = std::vector<EquityPoint>;

    /**
     * @enum Direction
     * @brief Side of an executed fill.
     */
    enum class Direction
    {
        BUY,
        SELL
    };

    /**
     * @struct Fill
     * @brief An executed order as reported by the portfolio simulator.
     */
    struct Fill
    {
        std::string symbol;    ///< Instrument identifier
        Direction direction;   ///< BUY or SELL
        long long quantity;    ///< Positive share count
        double fill_price;     ///< Positive execution price
        double commission;     ///< Non-negative commission paid
        Timestamp timestamp;   ///< Execution time
    };

    /** @brief "BUY" or "SELL". */
    std::string to_string(Direction direction);

    /**
     * @brief Parse "BUY"/"SELL" (case-insensitive).
     * @throws std::invalid_argument On any other text.
     */
    Direction parse_direction(const std::string &text);

    /**
     * @brief Check the invariants of a single fill.
     * @throws ValidationError Naming the offending field.
     */
    void validate_fill(const Fill &fill);

    /**
     * @brief Check the invariants of an equity curve.
     * @param curve Curve to check.
     * @param name Name used in error messages (e.g. "equity curve").
     * @throws ValidationError If the curve is empty, has a non-positive
     *         value or timestamps that are not strictly increasing.
     */
    void validate_equity_curve(const EquityCurve &curve,
                               const std::string &name = "equity curve");

} // namespace perfrisk

#endif // PERFRISK_CORE_TYPES_HPP
