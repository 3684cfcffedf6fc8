/**
 * @file return_series.hpp
 * @brief Periodic simple returns derived from an equity curve.
 */

#ifndef PERFRISK_ANALYTICS_RETURN_SERIES_HPP
#define PERFRISK_ANALYTICS_RETURN_SERIES_HPP

#include "core/types.hpp"

#include <Eigen/Dense>

#include <vector>

namespace perfrisk
{
    namespace analytics
    {

        /**
         * @struct ReturnSeries
         * @brief Simple returns r_t = V_t / V_{t-1} - 1 with their period-end timestamps.
         *
         * timestamps[i] is the timestamp of equity point i + 1, so both members
         * have length len(curve) - 1.
         */
        struct ReturnSeries
        {
            std::vector<Timestamp> timestamps;
            Eigen::VectorXd values;

            int size() const { return static_cast<int>(values.size()); }
            bool empty() const { return values.size() == 0; }
        };

        /**
         * @brief Derive the return series of an equity curve.
         * @param curve Equity curve with at least one point.
         * @return Series of length curve.size() - 1 (empty for a single point).
         * @throws ValidationError If the curve is empty, contains a non-positive
         *         value or timestamps that do not strictly increase.
         */
        ReturnSeries derive_returns(const EquityCurve &curve);

        /**
         * @brief Equity values of a curve as an Eigen vector.
         */
        Eigen::VectorXd equity_values(const EquityCurve &curve);

    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_RETURN_SERIES_HPP
