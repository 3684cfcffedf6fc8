/**
 * @file time_utils.cpp
 * @brief Implementation of the UTC calendar helpers.
 */

#include "core/time_utils.hpp"

#include <cstdio>
#include <stdexcept>

namespace perfrisk
{

    namespace
    {

        constexpr long long SECONDS_PER_DAY = 86400;

        // Days since 1970-01-01 for a proleptic Gregorian date.
        long long days_from_civil(long long y, unsigned m, unsigned d)
        {
            y -= m <= 2 ? 1 : 0;
            const long long era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<long long>(doe) - 719468;
        }

        void civil_from_days(long long z, int &year, int &month, int &day)
        {
            z += 719468;
            const long long era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const long long y = static_cast<long long>(yoe) + era * 400;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            const unsigned d = doy - (153 * mp + 2) / 5 + 1;
            const unsigned m = mp < 10 ? mp + 3 : mp - 9;
            year = static_cast<int>(y + (m <= 2 ? 1 : 0));
            month = static_cast<int>(m);
            day = static_cast<int>(d);
        }

        bool is_leap(int year)
        {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }

        int days_in_month(int year, int month)
        {
            static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month == 2 && is_leap(year))
            {
                return 29;
            }
            return DAYS[month - 1];
        }

        long long floor_div(long long a, long long b)
        {
            long long q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0)))
            {
                --q;
            }
            return q;
        }

        long long to_epoch_seconds(Timestamp ts)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
        }

    } // anonymous namespace

    Timestamp make_timestamp(int year, int month, int day, int hour, int minute, int second)
    {
        if (month < 1 || month > 12)
        {
            throw std::invalid_argument("Month out of range: " + std::to_string(month));
        }
        if (day < 1 || day > days_in_month(year, month))
        {
            throw std::invalid_argument("Day out of range: " + std::to_string(day));
        }
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59)
        {
            throw std::invalid_argument(
                "Time of day out of range: " + std::to_string(hour) + ":" + std::to_string(minute) + ":" + std::to_string(second));
        }

        long long days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        long long secs = days * SECONDS_PER_DAY + hour * 3600LL + minute * 60LL + second;
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(secs)));
    }

    Timestamp parse_timestamp(const std::string &text)
    {
        int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
        char sep = ' ';
        int consumed = 0;

        if (text.size() == 10 &&
            std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) == 3 &&
            consumed == 10)
        {
            return make_timestamp(y, mo, d);
        }

        if (text.size() >= 19 &&
            std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &y, &mo, &d, &sep, &h, &mi, &s, &consumed) == 7 &&
            (sep == ' ' || sep == 'T'))
        {
            std::string rest = text.substr(static_cast<size_t>(consumed));
            if (rest.empty() || rest == "Z")
            {
                return make_timestamp(y, mo, d, h, mi, s);
            }
        }

        throw std::invalid_argument("Cannot parse timestamp: '" + text + "'");
    }

    CivilDate civil_date(Timestamp ts)
    {
        long long secs = to_epoch_seconds(ts);
        long long days = floor_div(secs, SECONDS_PER_DAY);
        long long rem = secs - days * SECONDS_PER_DAY;

        CivilDate out{};
        civil_from_days(days, out.year, out.month, out.day);
        out.hour = static_cast<int>(rem / 3600);
        out.minute = static_cast<int>((rem % 3600) / 60);
        out.second = static_cast<int>(rem % 60);
        return out;
    }

    std::string format_timestamp(Timestamp ts)
    {
        CivilDate c = civil_date(ts);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                      c.year, c.month, c.day, c.hour, c.minute, c.second);
        return buf;
    }

    std::string format_date(Timestamp ts)
    {
        CivilDate c = civil_date(ts);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
        return buf;
    }

    int days_between(Timestamp from, Timestamp to)
    {
        return static_cast<int>(floor_div(seconds_between(from, to), SECONDS_PER_DAY));
    }

    double fractional_days(Timestamp from, Timestamp to)
    {
        return static_cast<double>(seconds_between(from, to)) / static_cast<double>(SECONDS_PER_DAY);
    }

    long long seconds_between(Timestamp from, Timestamp to)
    {
        return to_epoch_seconds(to) - to_epoch_seconds(from);
    }

} // namespace perfrisk
