/**
 * @file metrics_report.hpp
 * @brief Result structures produced by the metrics orchestrator.
 *
 * A MetricsReport groups the results of one invocation into five blocks
 * (returns, risk, trades, drawdown, time analysis). It renders itself to
 * JSON, to a human-readable text summary, and to label/value rows used as
 * the footer of the trade audit CSV.
 *
 * Unbounded ratios are encoded in JSON as the string "Infinity". Months
 * without any return are encoded as null.
 */

#ifndef PERFRISK_ANALYTICS_METRICS_REPORT_HPP
#define PERFRISK_ANALYTICS_METRICS_REPORT_HPP

#include "analytics/benchmark_analysis.hpp"
#include "analytics/drawdown_analysis.hpp"
#include "analytics/trade_statistics.hpp"
#include "core/ratio_value.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace perfrisk
{
    namespace analytics
    {

        /// Ordered (label, value) rows, e.g. for a CSV footer.
        using SummaryRows = std::vector<std::pair<std::string, std::string>>;

        /** @brief JSON encoding of a ratio: a number, or "Infinity". */
        nlohmann::json ratio_to_json(const RatioValue &ratio);

        /**
         * @struct ReturnMetrics
         * @brief Return block of the report.
         */
        struct ReturnMetrics
        {
            double initial_capital = 0.0;
            double final_value = 0.0;
            double total_return = 0.0;        ///< final / initial - 1
            double cagr = 0.0;                ///< (final / initial)^(365 / days) - 1
            double mean_period_return = 0.0;
            double best_period_return = 0.0;
            double worst_period_return = 0.0;
            int num_periods = 0;
        };

        /**
         * @struct VaREstimate
         * @brief VaR and CVaR at one confidence level.
         */
        struct VaREstimate
        {
            double confidence = 0.0;
            double historical = 0.0;
            double parametric = 0.0;
            double cornish_fisher = 0.0;
            double cvar = 0.0;
        };

        /**
         * @struct RiskMetrics
         * @brief Risk block of the report.
         */
        struct RiskMetrics
        {
            double annualized_volatility = 0.0;
            RatioValue sharpe;
            RatioValue sortino;
            RatioValue omega;
            RatioValue tail_ratio;
            RatioValue calmar;
            std::vector<VaREstimate> value_at_risk; ///< One entry per configured confidence
            double skewness = 0.0;
            double kurtosis = 0.0;
            std::optional<BenchmarkMetrics> benchmark; ///< Present when a benchmark was supplied
        };

        /**
         * @struct DrawdownMetrics
         * @brief Drawdown block of the report.
         */
        struct DrawdownMetrics
        {
            double max_drawdown = 0.0;
            DrawdownEpisode max_episode;
            int event_count = 0;
            DrawdownSummary events{};
        };

        /**
         * @struct MonthlyReturn
         * @brief One cell of the (year, month) return table.
         */
        struct MonthlyReturn
        {
            int year;
            int month;                   ///< 1-12
            std::optional<double> value; ///< Empty if no return fell in the month
        };

        /**
         * @struct TimeAnalysis
         * @brief Calendar block of the report.
         */
        struct TimeAnalysis
        {
            Timestamp start;
            Timestamp end;
            int calendar_days = 0;
            double years = 0.0;                         ///< calendar_days / 365.25
            std::vector<MonthlyReturn> monthly_returns; ///< Every month from first to last return
            std::map<int, double> annual_returns;       ///< Compounded return per calendar year
            std::optional<MonthlyReturn> best_month;
            std::optional<MonthlyReturn> worst_month;
            int positive_months = 0;
            int negative_months = 0;
        };

        /**
         * @struct MetricsReport
         * @brief Complete output of one metrics calculation.
         */
        struct MetricsReport
        {
            ReturnMetrics returns;
            RiskMetrics risk;
            TradeStatistics trades;
            DrawdownMetrics drawdown;
            TimeAnalysis time_analysis;

            /** @brief Nested JSON object with one key per block. */
            nlohmann::json to_json() const;

            /** @brief Formatted multi-line performance report. */
            std::string summary() const;

            /**
             * @brief Headline figures as (label, value) rows.
             *
             * Initial Capital, Final Value, Total Return, Annualized Return,
             * Sharpe Ratio, Max Drawdown, Total Trades and Win Rate.
             */
            SummaryRows summary_footer() const;
        };

        /**
         * @struct BaselineResult
         * @brief Buy-and-hold comparison for a single symbol.
         */
        struct BaselineResult
        {
            std::string symbol;
            double shares = 0.0;
            double final_value = 0.0;
            double total_return = 0.0;
            double annualized_return = 0.0;

            nlohmann::json to_json() const;
        };

    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_METRICS_REPORT_HPP
