/**
 * @file time_utils.hpp
 * @brief Calendar helpers for UTC timestamps.
 *
 * Conversions between Timestamp and civil (year, month, day) dates use
 * the days-from-civil algorithm on the proleptic Gregorian calendar, so
 * no time zone database or locale is involved.
 */

#ifndef PERFRISK_CORE_TIME_UTILS_HPP
#define PERFRISK_CORE_TIME_UTILS_HPP

#include "core/types.hpp"

#include <string>

namespace perfrisk
{

    /**
     * @struct CivilDate
     * @brief Broken-down UTC date and time of day.
     */
    struct CivilDate
    {
        int year;
        int month;  ///< 1-12
        int day;    ///< 1-31
        int hour;   ///< 0-23
        int minute; ///< 0-59
        int second; ///< 0-59
    };

    /**
     * @brief Build a timestamp from calendar fields (UTC).
     * @throws std::invalid_argument If any field is out of range.
     */
    Timestamp make_timestamp(int year, int month, int day,
                             int hour = 0, int minute = 0, int second = 0);

    /**
     * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS[Z]".
     * @throws std::invalid_argument If the string does not match.
     */
    Timestamp parse_timestamp(const std::string &text);

    /** @brief Format as "YYYY-MM-DD HH:MM:SS". */
    std::string format_timestamp(Timestamp ts);

    /** @brief Format as "YYYY-MM-DD". */
    std::string format_date(Timestamp ts);

    /** @brief Break a timestamp into calendar fields. */
    CivilDate civil_date(Timestamp ts);

    /**
     * @brief Whole days elapsed from @p from to @p to (floored).
     *
     * Negative when @p to precedes @p from.
     */
    int days_between(Timestamp from, Timestamp to);

    /** @brief Elapsed days from @p from to @p to, including the fraction. */
    double fractional_days(Timestamp from, Timestamp to);

    /** @brief Elapsed seconds from @p from to @p to. */
    long long seconds_between(Timestamp from, Timestamp to);

} // namespace perfrisk

#endif // PERFRISK_CORE_TIME_UTILS_HPP
