/**
 * @file rolling_statistics.hpp
 * @brief Rolling window metrics over a return series.
 *
 * Produces a table aligned with the return series timestamps: every
 * column has one entry per return, and the first (window - 1) entries are
 * empty because the window is not yet full. Columns are Sharpe ratio,
 * volatility, maximum drawdown and historical VaR, plus correlation and
 * beta when a benchmark is supplied.
 *
 * All columns are computed in a single pass: running shifted sums for the
 * moments, monotonic deques for the window extrema and drawdown, and an
 * ordered window for the VaR quantile (O(log window) per step).
 */

#ifndef PERFRISK_ANALYTICS_ROLLING_STATISTICS_HPP
#define PERFRISK_ANALYTICS_ROLLING_STATISTICS_HPP

#include "analytics/return_series.hpp"
#include "core/logging.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace perfrisk
{
    namespace analytics
    {

        /**
         * @struct RollingConfig
         * @brief Configuration for rolling window calculations.
         */
        struct RollingConfig
        {
            int window;            ///< Observations per window (>= 2, default 252)
            int periods_per_year;  ///< Periods per year for annualization (default 252)
            double risk_free_rate; ///< Annualized risk-free rate (default 0.02)
            double var_confidence; ///< Confidence of the rolling historical VaR (default 0.95)

            explicit RollingConfig(int window_size = 252)
                : window(window_size), periods_per_year(252), risk_free_rate(0.02), var_confidence(0.95) {}

            /**
             * @brief Read "window" and "var_confidence" from a JSON object;
             * absent keys keep defaults.
             */
            static RollingConfig from_json(const nlohmann::json &j);

            /**
             * @throws std::invalid_argument If window < 2, periods_per_year < 1
             *         or var_confidence is outside (0, 1).
             */
            void validate() const;
        };

        /// Column of a rolling table; empty until the window is full.
        using RollingColumn = std::vector<std::optional<double>>;

        /**
         * @struct RollingTable
         * @brief Rolling metrics aligned with the return series.
         *
         * correlation and beta are empty vectors when no benchmark was given.
         */
        struct RollingTable
        {
            int window = 0;
            std::vector<Timestamp> timestamps;
            RollingColumn sharpe;       ///< Annualized Sharpe ratio
            RollingColumn volatility;   ///< Annualized sample volatility
            RollingColumn max_drawdown; ///< Worst drawdown in the window (<= 0)
            RollingColumn value_at_risk; ///< Historical VaR of the window (>= 0)
            RollingColumn correlation;  ///< Correlation with the benchmark
            RollingColumn beta;         ///< Beta against the benchmark

            int size() const { return static_cast<int>(timestamps.size()); }
            bool has_benchmark() const { return !beta.empty(); }
        };

        /**
         * @class RollingStatistics
         * @brief Computes rolling metrics in one incremental pass.
         *
         * Usage:
         * @code
         *   RollingStatistics rolling(RollingConfig(63));
         *   RollingTable table = rolling.compute(returns);
         * @endcode
         */
        class RollingStatistics
        {
        public:
            /**
             * @throws std::invalid_argument If the configuration is invalid.
             */
            explicit RollingStatistics(const RollingConfig &config = RollingConfig(),
                                       LoggerPtr logger = nullptr);

            /**
             * @brief Rolling Sharpe, volatility, max drawdown and VaR.
             *
             * A series shorter than the window yields a table whose entries
             * are all empty, with a warning.
             */
            RollingTable compute(const ReturnSeries &returns) const;

            /**
             * @brief Rolling metrics including correlation and beta.
             * @throws std::invalid_argument If the benchmark length differs.
             */
            RollingTable compute(const ReturnSeries &returns,
                                 const ReturnSeries &benchmark) const;

            const RollingConfig &config() const { return config_; }

        private:
            RollingTable compute_impl(const ReturnSeries &returns,
                                      const ReturnSeries *benchmark) const;

            RollingConfig config_;
            LoggerPtr logger_;
        };

    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_ROLLING_STATISTICS_HPP
