/**
 * @file metrics_report.cpp
 * @brief JSON and text rendering of MetricsReport.
 */

#include "analytics/metrics_report.hpp"
#include "core/time_utils.hpp"

#include <iomanip>
#include <sstream>

namespace perfrisk
{
    namespace analytics
    {

        namespace
        {

            const char *const MONTH_NAMES[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                               "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

            nlohmann::json optional_to_json(const std::optional<double> &value)
            {
                if (!value)
                {
                    return nullptr;
                }
                return *value;
            }

            nlohmann::json point_to_json(const CurvePoint &point)
            {
                return {{"index", point.index},
                        {"timestamp", format_timestamp(point.timestamp)},
                        {"value", point.value}};
            }

            nlohmann::json episode_to_json(const DrawdownEpisode &episode)
            {
                nlohmann::json j;
                j["depth"] = episode.depth;
                j["peak"] = point_to_json(episode.peak);
                j["trough"] = point_to_json(episode.trough);
                j["recovery"] = episode.recovery ? point_to_json(*episode.recovery) : nlohmann::json(nullptr);
                j["duration_days"] = episode.duration_days;
                j["recovery_days"] = episode.recovery_days ? nlohmann::json(*episode.recovery_days) : nlohmann::json(nullptr);
                return j;
            }

            nlohmann::json month_to_json(const std::optional<MonthlyReturn> &month)
            {
                if (!month)
                {
                    return nullptr;
                }
                return {{"year", month->year},
                        {"month", month->month},
                        {"return", optional_to_json(month->value)}};
            }

            std::string percent(double fraction, int precision = 2)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(precision) << fraction * 100.0 << "%";
                return oss.str();
            }

            std::string fixed(double value, int precision)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(precision) << value;
                return oss.str();
            }

            std::string ratio_text(const RatioValue &ratio)
            {
                return ratio.is_infinite() ? "Infinity" : fixed(ratio.value(), 4);
            }

            std::string currency(double value)
            {
                std::string digits = fixed(value < 0.0 ? -value : value, 2);
                std::string::size_type dot = digits.find('.');
                std::string whole = digits.substr(0, dot);
                std::string grouped;
                int count = 0;
                for (auto it = whole.rbegin(); it != whole.rend(); ++it)
                {
                    if (count > 0 && count % 3 == 0)
                    {
                        grouped.insert(grouped.begin(), ',');
                    }
                    grouped.insert(grouped.begin(), *it);
                    ++count;
                }
                return std::string(value < 0.0 ? "-$" : "$") + grouped + digits.substr(dot);
            }

        } // anonymous namespace

        nlohmann::json ratio_to_json(const RatioValue &ratio)
        {
            if (ratio.is_infinite())
            {
                return "Infinity";
            }
            return ratio.value();
        }

        // ===================================================================
        // JSON
        // ===================================================================

        nlohmann::json MetricsReport::to_json() const
        {
            nlohmann::json j;

            j["returns"] = {
                {"initial_capital", returns.initial_capital},
                {"final_value", returns.final_value},
                {"total_return", returns.total_return},
                {"cagr", returns.cagr},
                {"mean_period_return", returns.mean_period_return},
                {"best_period_return", returns.best_period_return},
                {"worst_period_return", returns.worst_period_return},
                {"num_periods", returns.num_periods}};

            nlohmann::json var = nlohmann::json::array();
            for (const auto &estimate : risk.value_at_risk)
            {
                var.push_back({{"confidence", estimate.confidence},
                               {"historical", estimate.historical},
                               {"parametric", estimate.parametric},
                               {"cornish_fisher", estimate.cornish_fisher},
                               {"cvar", estimate.cvar}});
            }

            j["risk"] = {
                {"annualized_volatility", risk.annualized_volatility},
                {"sharpe_ratio", ratio_to_json(risk.sharpe)},
                {"sortino_ratio", ratio_to_json(risk.sortino)},
                {"omega_ratio", ratio_to_json(risk.omega)},
                {"tail_ratio", ratio_to_json(risk.tail_ratio)},
                {"calmar_ratio", ratio_to_json(risk.calmar)},
                {"value_at_risk", var},
                {"skewness", risk.skewness},
                {"kurtosis", risk.kurtosis}};
            if (risk.benchmark)
            {
                j["risk"]["benchmark"] = {
                    {"beta", risk.benchmark->beta},
                    {"alpha", risk.benchmark->alpha},
                    {"correlation", risk.benchmark->correlation},
                    {"num_observations", risk.benchmark->num_observations}};
            }

            j["trades"] = {
                {"total_fills", trades.total_fills},
                {"total_trades", trades.total_trades},
                {"winning_trades", trades.winning_trades},
                {"losing_trades", trades.losing_trades},
                {"win_rate", trades.win_rate},
                {"profit_factor", ratio_to_json(trades.profit_factor)},
                {"average_win", trades.average_win},
                {"average_loss", trades.average_loss},
                {"largest_win", trades.largest_win},
                {"largest_loss", trades.largest_loss},
                {"average_holding_days", trades.average_holding_days},
                {"total_commission", trades.total_commission},
                {"net_pnl", trades.net_pnl},
                {"open_lots", trades.open_lots}};

            j["drawdown"] = {
                {"max_drawdown", drawdown.max_drawdown},
                {"max_episode", episode_to_json(drawdown.max_episode)},
                {"event_count", drawdown.event_count},
                {"events",
                 {{"average_depth", drawdown.events.average_depth},
                  {"max_depth", drawdown.events.max_depth},
                  {"average_decline_days", drawdown.events.average_decline_days},
                  {"average_recovery_days", drawdown.events.average_recovery_days},
                  {"longest_decline_days", drawdown.events.longest_decline_days},
                  {"longest_recovery_days", drawdown.events.longest_recovery_days},
                  {"unrecovered_count", drawdown.events.unrecovered_count},
                  {"time_in_drawdown_pct", drawdown.events.time_in_drawdown_pct}}}};

            nlohmann::json monthly = nlohmann::json::object();
            for (const auto &cell : time_analysis.monthly_returns)
            {
                monthly[std::to_string(cell.year)][std::to_string(cell.month)] = optional_to_json(cell.value);
            }
            nlohmann::json annual = nlohmann::json::object();
            for (const auto &entry : time_analysis.annual_returns)
            {
                annual[std::to_string(entry.first)] = entry.second;
            }

            j["time_analysis"] = {
                {"start", format_timestamp(time_analysis.start)},
                {"end", format_timestamp(time_analysis.end)},
                {"calendar_days", time_analysis.calendar_days},
                {"years", time_analysis.years},
                {"monthly_returns", monthly},
                {"annual_returns", annual},
                {"best_month", month_to_json(time_analysis.best_month)},
                {"worst_month", month_to_json(time_analysis.worst_month)},
                {"positive_months", time_analysis.positive_months},
                {"negative_months", time_analysis.negative_months}};

            return j;
        }

        nlohmann::json BaselineResult::to_json() const
        {
            return {{"baseline_symbol", symbol},
                    {"baseline_shares", shares},
                    {"baseline_final_value", final_value},
                    {"baseline_total_return", total_return},
                    {"baseline_annualized_return", annualized_return}};
        }

        // ===================================================================
        // Text
        // ===================================================================

        std::string MetricsReport::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Performance Summary\n";
            oss << "===================\n";
            oss << "\n";

            oss << "Returns:\n";
            oss << "  Initial Capital:     " << currency(returns.initial_capital) << "\n";
            oss << "  Final Value:         " << currency(returns.final_value) << "\n";
            oss << "  Total Return:        " << percent(returns.total_return, 4) << "\n";
            oss << "  CAGR:                " << percent(returns.cagr, 4) << "\n";
            oss << "  Periods:             " << returns.num_periods << "\n";
            oss << "  Best Period:         " << percent(returns.best_period_return, 4) << "\n";
            oss << "  Worst Period:        " << percent(returns.worst_period_return, 4) << "\n";
            oss << "\n";

            oss << "Risk:\n";
            oss << "  Annualized Vol:      " << percent(risk.annualized_volatility, 4) << "\n";
            oss << "  Sharpe Ratio:        " << ratio_text(risk.sharpe) << "\n";
            oss << "  Sortino Ratio:       " << ratio_text(risk.sortino) << "\n";
            oss << "  Omega Ratio:         " << ratio_text(risk.omega) << "\n";
            oss << "  Tail Ratio:          " << ratio_text(risk.tail_ratio) << "\n";
            oss << "  Calmar Ratio:        " << ratio_text(risk.calmar) << "\n";
            for (const auto &estimate : risk.value_at_risk)
            {
                std::string level = fixed(estimate.confidence * 100.0, 1) + "%";
                oss << "  VaR (" << level << "):" << std::string(level.size() < 12 ? 12 - level.size() : 1, ' ')
                    << "hist " << percent(estimate.historical, 4)
                    << ", param " << percent(estimate.parametric, 4)
                    << ", cf " << percent(estimate.cornish_fisher, 4)
                    << ", cvar " << percent(estimate.cvar, 4) << "\n";
            }
            oss << "  Skewness:            " << fixed(risk.skewness, 4) << "\n";
            oss << "  Kurtosis:            " << fixed(risk.kurtosis, 4) << "\n";
            if (risk.benchmark)
            {
                oss << "  Beta:                " << fixed(risk.benchmark->beta, 4) << "\n";
                oss << "  Alpha:               " << percent(risk.benchmark->alpha, 4) << "\n";
                oss << "  Correlation:         " << fixed(risk.benchmark->correlation, 4) << "\n";
            }
            oss << "\n";

            oss << "Trades:\n";
            oss << "  Fills:               " << trades.total_fills << "\n";
            oss << "  Round Trips:         " << trades.total_trades << "\n";
            oss << "  Winning / Losing:    " << trades.winning_trades << " / " << trades.losing_trades << "\n";
            oss << "  Win Rate:            " << percent(trades.win_rate) << "\n";
            oss << "  Profit Factor:       " << ratio_text(trades.profit_factor) << "\n";
            oss << "  Average Win:         " << currency(trades.average_win) << "\n";
            oss << "  Average Loss:        " << currency(trades.average_loss) << "\n";
            oss << "  Avg Holding (days):  " << fixed(trades.average_holding_days, 1) << "\n";
            oss << "  Commission:          " << currency(trades.total_commission) << "\n";
            oss << "  Open Lots:           " << trades.open_lots << "\n";
            oss << "\n";

            oss << "Drawdown:\n";
            oss << "  Max Drawdown:        " << percent(drawdown.max_drawdown, 4) << "\n";
            oss << "  Peak:                " << format_date(drawdown.max_episode.peak.timestamp) << "\n";
            oss << "  Trough:              " << format_date(drawdown.max_episode.trough.timestamp) << "\n";
            oss << "  Recovery:            "
                << (drawdown.max_episode.recovered() ? format_date(drawdown.max_episode.recovery->timestamp) : "Unrecovered") << "\n";
            oss << "  Duration (days):     " << drawdown.max_episode.duration_days << "\n";
            oss << "  Events:              " << drawdown.event_count << "\n";
            oss << "\n";

            oss << "Time Analysis:\n";
            oss << "  Period:              " << format_date(time_analysis.start) << " to "
                << format_date(time_analysis.end) << " (" << time_analysis.calendar_days << " days)\n";
            oss << "  Positive Months:     " << time_analysis.positive_months << "\n";
            oss << "  Negative Months:     " << time_analysis.negative_months << "\n";

            if (!time_analysis.monthly_returns.empty())
            {
                oss << "\n";
                oss << "Monthly Returns:\n";
                oss << "  " << std::left << std::setw(6) << "Year";
                for (const char *name : MONTH_NAMES)
                {
                    oss << std::right << std::setw(9) << name;
                }
                oss << std::right << std::setw(10) << "Year" << "\n";

                std::map<int, std::map<int, std::optional<double>>> pivot;
                for (const auto &cell : time_analysis.monthly_returns)
                {
                    pivot[cell.year][cell.month] = cell.value;
                }
                for (const auto &row : pivot)
                {
                    oss << "  " << std::left << std::setw(6) << row.first << std::right;
                    for (int month = 1; month <= 12; ++month)
                    {
                        auto it = row.second.find(month);
                        if (it == row.second.end())
                        {
                            oss << std::setw(9) << "";
                        }
                        else if (!it->second)
                        {
                            oss << std::setw(9) << "N/A";
                        }
                        else
                        {
                            oss << std::setw(9) << percent(*it->second);
                        }
                    }
                    auto annual = time_analysis.annual_returns.find(row.first);
                    oss << std::setw(10)
                        << (annual == time_analysis.annual_returns.end() ? std::string("N/A") : percent(annual->second))
                        << "\n";
                }
            }

            return oss.str();
        }

        SummaryRows MetricsReport::summary_footer() const
        {
            return {
                {"Initial Capital", currency(returns.initial_capital)},
                {"Final Value", currency(returns.final_value)},
                {"Total Return", percent(returns.total_return)},
                {"Annualized Return", percent(returns.cagr)},
                {"Sharpe Ratio", risk.sharpe.is_infinite() ? "Infinity" : fixed(risk.sharpe.value(), 2)},
                {"Max Drawdown", percent(drawdown.max_drawdown)},
                {"Total Trades", std::to_string(trades.total_trades)},
                {"Win Rate", percent(trades.win_rate)}};
        }

    } // namespace analytics
} // namespace perfrisk
