/**
 * @file performance_metrics.hpp
 * @brief Metrics orchestrator for a completed simulation run.
 *
 * MetricsCalculator derives the return series of an equity curve once and
 * feeds it to the ratio, VaR, drawdown, trade statistics and benchmark
 * components, assembling their results into a single MetricsReport.
 *
 * All annualized calculations default to 252 periods per year. The
 * risk-free rate defaults to 2% annualized and is converted internally to
 * a per-period rate where needed. CAGR uses calendar days (365 per year).
 */

#ifndef PERFRISK_ANALYTICS_PERFORMANCE_METRICS_HPP
#define PERFRISK_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "analytics/metrics_report.hpp"
#include "analytics/return_series.hpp"
#include "analytics/rolling_statistics.hpp"
#include "core/logging.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace perfrisk
{
    namespace analytics
    {

        /**
         * @struct MetricsConfig
         * @brief Parameters of the performance and risk calculations.
         */
        struct MetricsConfig
        {
            double risk_free_rate = 0.02;                         ///< Annualized risk-free rate
            int periods_per_year = 252;                           ///< Return periods per year
            std::vector<double> var_confidence_levels{0.95, 0.99}; ///< Each in (0, 1)
            double sortino_target = 0.0;                          ///< Minimum acceptable periodic return
            double omega_threshold = 0.0;                         ///< Periodic return threshold
            int tail_ratio_min_observations = 20;                 ///< Minimum sample for the tail ratio

            /**
             * @brief Read from a JSON object; absent keys keep their defaults.
             */
            static MetricsConfig from_json(const nlohmann::json &j);

            /**
             * @throws std::invalid_argument If any value is out of range.
             */
            void validate() const;
        };

        /**
         * @class MetricsCalculator
         * @brief Computes a MetricsReport from fills and an equity curve.
         *
         * Usage:
         * @code
         *   MetricsCalculator calculator(MetricsConfig{}, RollingConfig(63));
         *   MetricsReport report = calculator.calculate_metrics(fills, curve, 100000.0);
         *   std::cout << report.summary();
         *   std::string json = report.to_json().dump(2);
         * @endcode
         *
         * Thread safety: the calculator holds no mutable state; concurrent
         * calls are safe as long as the logger is thread-safe.
         */
        class MetricsCalculator
        {
        public:
            /**
             * @param config Metric parameters.
             * @param rolling Rolling window settings (its periods and risk-free
             *        rate are taken from @p config).
             * @param logger Logger (default logger if null).
             * @throws std::invalid_argument If either configuration is invalid.
             */
            explicit MetricsCalculator(const MetricsConfig &config = MetricsConfig(),
                                       const RollingConfig &rolling = RollingConfig(),
                                       LoggerPtr logger = nullptr);

            /**
             * @brief Full report for one run.
             * @param fills Executed fills (may be empty).
             * @param equity_curve Portfolio value over time.
             * @param initial_capital Starting capital (> 0).
             * @throws ValidationError If the equity curve is invalid, the
             *         initial capital is not positive, or a fill is malformed.
             */
            MetricsReport calculate_metrics(const std::vector<Fill> &fills,
                                            const EquityCurve &equity_curve,
                                            double initial_capital) const;

            /**
             * @brief Full report including beta, alpha and correlation
             *        against a benchmark curve sampled at the same points.
             * @throws ValidationError If the benchmark curve is invalid.
             * @throws std::invalid_argument If the curves differ in length.
             */
            MetricsReport calculate_metrics(const std::vector<Fill> &fills,
                                            const EquityCurve &equity_curve,
                                            double initial_capital,
                                            const EquityCurve &benchmark_curve) const;

            /** @brief Rolling Sharpe, volatility and drawdown table. */
            RollingTable calculate_rolling(const EquityCurve &equity_curve) const;

            /**
             * @brief Rolling table including correlation and beta.
             * @throws std::invalid_argument If the curves differ in length.
             */
            RollingTable calculate_rolling(const EquityCurve &equity_curve,
                                           const EquityCurve &benchmark_curve) const;

            /**
             * @brief Buy-and-hold baseline: invest all capital at @p start_price.
             *
             * Annualization uses 365.25-day years; periods shorter than 0.01
             * year report the total return as the annualized return.
             *
             * @return Empty (with a warning) if either price is not positive.
             * @throws ValidationError If initial_capital is not positive.
             */
            std::optional<BaselineResult> calculate_baseline(const std::string &symbol,
                                                             double start_price,
                                                             double end_price,
                                                             Timestamp start,
                                                             Timestamp end,
                                                             double initial_capital) const;

            const MetricsConfig &config() const { return config_; }

        private:
            MetricsReport calculate(const std::vector<Fill> &fills,
                                    const EquityCurve &equity_curve,
                                    double initial_capital,
                                    const EquityCurve *benchmark_curve) const;

            ReturnMetrics return_metrics(const EquityCurve &curve,
                                         const ReturnSeries &returns,
                                         double initial_capital) const;

            TimeAnalysis time_analysis(const EquityCurve &curve,
                                       const ReturnSeries &returns) const;

            MetricsConfig config_;
            RollingConfig rolling_;
            LoggerPtr logger_;
        };

    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_PERFORMANCE_METRICS_HPP
