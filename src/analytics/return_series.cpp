/**
 * @file return_series.cpp
 * @brief Implementation of the return series deriver.
 */

#include "analytics/return_series.hpp"

namespace perfrisk
{
    namespace analytics
    {

        Eigen::VectorXd equity_values(const EquityCurve &curve)
        {
            Eigen::VectorXd values(static_cast<Eigen::Index>(curve.size()));
            for (size_t i = 0; i < curve.size(); ++i)
            {
                values(static_cast<Eigen::Index>(i)) = curve[i].value;
            }
            return values;
        }

        ReturnSeries derive_returns(const EquityCurve &curve)
        {
            validate_equity_curve(curve);

            ReturnSeries series;
            const Eigen::Index n = static_cast<Eigen::Index>(curve.size());
            if (n < 2)
            {
                return series;
            }

            Eigen::VectorXd values = equity_values(curve);
            series.values = (values.tail(n - 1).array() / values.head(n - 1).array()) - 1.0;

            series.timestamps.reserve(static_cast<size_t>(n - 1));
            for (Eigen::Index i = 1; i < n; ++i)
            {
                series.timestamps.push_back(curve[static_cast<size_t>(i)].timestamp);
            }
            return series;
        }

    } // namespace analytics
} // namespace perfrisk
