/**
 * @file performance_metrics.cpp
 * @brief Implementation of the MetricsCalculator orchestrator.
 *
 * The return series is derived once per call and shared by every
 * component. Nothing is cached between calls.
 */

#include "analytics/performance_metrics.hpp"
#include "analytics/benchmark_analysis.hpp"
#include "analytics/drawdown_analysis.hpp"
#include "analytics/risk_ratios.hpp"
#include "analytics/statistics.hpp"
#include "analytics/trade_statistics.hpp"
#include "analytics/value_at_risk.hpp"
#include "core/errors.hpp"
#include "core/time_utils.hpp"

#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

namespace perfrisk
{
    namespace analytics
    {

        namespace
        {

            void check_initial_capital(double initial_capital)
            {
                if (!(initial_capital > 0.0) || !std::isfinite(initial_capital))
                {
                    throw ValidationError(
                        "Initial capital must be positive, got: " + std::to_string(initial_capital));
                }
            }

            void check_benchmark(const EquityCurve &equity_curve, const EquityCurve &benchmark_curve)
            {
                validate_equity_curve(benchmark_curve, "benchmark curve");
                if (benchmark_curve.size() != equity_curve.size())
                {
                    throw std::invalid_argument(
                        "Benchmark curve size (" + std::to_string(benchmark_curve.size()) + ") must match equity curve size (" + std::to_string(equity_curve.size()) + ")");
                }
            }

        } // anonymous namespace

        // ===================================================================
        // MetricsConfig
        // ===================================================================

        MetricsConfig MetricsConfig::from_json(const nlohmann::json &j)
        {
            MetricsConfig cfg;
            cfg.risk_free_rate = j.value("risk_free_rate", cfg.risk_free_rate);
            cfg.periods_per_year = j.value("periods_per_year", cfg.periods_per_year);
            cfg.var_confidence_levels = j.value("var_confidence_levels", cfg.var_confidence_levels);
            cfg.sortino_target = j.value("sortino_target", cfg.sortino_target);
            cfg.omega_threshold = j.value("omega_threshold", cfg.omega_threshold);
            cfg.tail_ratio_min_observations = j.value("tail_ratio_min_observations", cfg.tail_ratio_min_observations);
            return cfg;
        }

        void MetricsConfig::validate() const
        {
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("risk_free_rate must be finite");
            }
            if (periods_per_year < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'periods_per_year', got: " + std::to_string(periods_per_year));
            }
            for (double level : var_confidence_levels)
            {
                if (!(level > 0.0 && level < 1.0))
                {
                    throw std::invalid_argument(
                        "VaR confidence levels must be in (0, 1), got: " + std::to_string(level));
                }
            }
            if (!std::isfinite(sortino_target) || !std::isfinite(omega_threshold))
            {
                throw std::invalid_argument("sortino_target and omega_threshold must be finite");
            }
            if (tail_ratio_min_observations < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'tail_ratio_min_observations', got: " + std::to_string(tail_ratio_min_observations));
            }
        }

        // ===================================================================
        // Construction
        // ===================================================================

        MetricsCalculator::MetricsCalculator(const MetricsConfig &config,
                                             const RollingConfig &rolling,
                                             LoggerPtr logger)
            : config_(config), rolling_(rolling), logger_(resolve_logger(std::move(logger)))
        {
            config_.validate();
            rolling_.periods_per_year = config_.periods_per_year;
            rolling_.risk_free_rate = config_.risk_free_rate;
            rolling_.validate();
        }

        // ===================================================================
        // Full report
        // ===================================================================

        MetricsReport MetricsCalculator::calculate_metrics(const std::vector<Fill> &fills,
                                                           const EquityCurve &equity_curve,
                                                           double initial_capital) const
        {
            return calculate(fills, equity_curve, initial_capital, nullptr);
        }

        MetricsReport MetricsCalculator::calculate_metrics(const std::vector<Fill> &fills,
                                                           const EquityCurve &equity_curve,
                                                           double initial_capital,
                                                           const EquityCurve &benchmark_curve) const
        {
            return calculate(fills, equity_curve, initial_capital, &benchmark_curve);
        }

        MetricsReport MetricsCalculator::calculate(const std::vector<Fill> &fills,
                                                   const EquityCurve &equity_curve,
                                                   double initial_capital,
                                                   const EquityCurve *benchmark_curve) const
        {
            check_initial_capital(initial_capital);
            ReturnSeries returns = derive_returns(equity_curve);
            if (benchmark_curve != nullptr)
            {
                check_benchmark(equity_curve, *benchmark_curve);
            }

            logger_->info("Calculating metrics for {} equity points and {} fills",
                          equity_curve.size(), fills.size());

            RiskRatios ratios(config_.risk_free_rate, config_.periods_per_year,
                              config_.tail_ratio_min_observations, logger_);
            ValueAtRisk var(logger_);
            DrawdownAnalysis drawdowns(equity_curve, logger_);
            TradeStatisticsAggregator trade_aggregator(logger_);

            MetricsReport report;
            report.returns = return_metrics(equity_curve, returns, initial_capital);

            // Risk block
            const Eigen::VectorXd &r = returns.values;
            report.risk.annualized_volatility = ratios.annualized_volatility(r);
            report.risk.sharpe = ratios.sharpe(r);
            report.risk.sortino = ratios.sortino(r, config_.sortino_target);
            report.risk.omega = ratios.omega(r, config_.omega_threshold);
            report.risk.tail_ratio = ratios.tail_ratio(r);
            report.risk.calmar = ratios.calmar(report.returns.cagr, drawdowns.max_drawdown());
            for (double confidence : config_.var_confidence_levels)
            {
                VaREstimate estimate;
                estimate.confidence = confidence;
                estimate.historical = var.value_at_risk(r, confidence, VaRMethod::HISTORICAL);
                estimate.parametric = var.value_at_risk(r, confidence, VaRMethod::PARAMETRIC);
                estimate.cornish_fisher = var.value_at_risk(r, confidence, VaRMethod::CORNISH_FISHER);
                estimate.cvar = var.conditional_var(r, confidence);
                report.risk.value_at_risk.push_back(estimate);
            }
            report.risk.skewness = stats::skewness(r);
            report.risk.kurtosis = stats::kurtosis(r);

            if (benchmark_curve != nullptr)
            {
                ReturnSeries benchmark_returns = derive_returns(*benchmark_curve);
                BenchmarkAnalysis benchmark(config_.risk_free_rate, config_.periods_per_year, logger_);
                report.risk.benchmark = benchmark.analyze(r, benchmark_returns.values);
            }

            report.trades = trade_aggregator.calculate(fills);

            report.drawdown.max_drawdown = drawdowns.max_drawdown();
            report.drawdown.max_episode = drawdowns.max_drawdown_episode();
            report.drawdown.event_count = drawdowns.event_count();
            report.drawdown.events = drawdowns.summary();

            report.time_analysis = time_analysis(equity_curve, returns);

            logger_->info("Performance: return {:.2f}%, Sharpe {}, max drawdown {:.2f}%, {} round trips",
                          report.returns.total_return * 100.0, report.risk.sharpe.to_string(),
                          report.drawdown.max_drawdown * 100.0, report.trades.total_trades);
            return report;
        }

        // ===================================================================
        // Rolling
        // ===================================================================

        RollingTable MetricsCalculator::calculate_rolling(const EquityCurve &equity_curve) const
        {
            RollingStatistics rolling(rolling_, logger_);
            return rolling.compute(derive_returns(equity_curve));
        }

        RollingTable MetricsCalculator::calculate_rolling(const EquityCurve &equity_curve,
                                                          const EquityCurve &benchmark_curve) const
        {
            ReturnSeries returns = derive_returns(equity_curve);
            check_benchmark(equity_curve, benchmark_curve);

            RollingStatistics rolling(rolling_, logger_);
            return rolling.compute(returns, derive_returns(benchmark_curve));
        }

        // ===================================================================
        // Baseline
        // ===================================================================

        std::optional<BaselineResult> MetricsCalculator::calculate_baseline(const std::string &symbol,
                                                                            double start_price,
                                                                            double end_price,
                                                                            Timestamp start,
                                                                            Timestamp end,
                                                                            double initial_capital) const
        {
            check_initial_capital(initial_capital);
            if (!(start_price > 0.0) || !(end_price > 0.0))
            {
                logger_->warn("Invalid prices for baseline {}: start={}, end={}", symbol, start_price, end_price);
                return std::nullopt;
            }

            BaselineResult baseline;
            baseline.symbol = symbol;
            baseline.shares = initial_capital / start_price;
            baseline.final_value = baseline.shares * end_price;
            baseline.total_return = (baseline.final_value - initial_capital) / initial_capital;

            int days = days_between(start, end);
            double years = static_cast<double>(days) / 365.25;
            if (years < 0.01)
            {
                logger_->debug("Short baseline period ({} days); reporting total return as annualized", days);
                baseline.annualized_return = baseline.total_return;
            }
            else
            {
                baseline.annualized_return = std::pow(1.0 + baseline.total_return, 1.0 / years) - 1.0;
            }

            logger_->info("Baseline ({}): {:.2f}% total, {:.2f}% annualized over {} days",
                          symbol, baseline.total_return * 100.0, baseline.annualized_return * 100.0, days);
            return baseline;
        }

        // ===================================================================
        // Private helpers
        // ===================================================================

        ReturnMetrics MetricsCalculator::return_metrics(const EquityCurve &curve,
                                                        const ReturnSeries &returns,
                                                        double initial_capital) const
        {
            ReturnMetrics metrics;
            metrics.initial_capital = initial_capital;
            metrics.final_value = curve.back().value;
            metrics.total_return = metrics.final_value / initial_capital - 1.0;
            metrics.num_periods = returns.size();

            int days = days_between(curve.front().timestamp, curve.back().timestamp);
            if (days <= 0)
            {
                logger_->warn("Equity curve spans 0 calendar days; CAGR reported as 0");
            }
            else
            {
                metrics.cagr = std::pow(metrics.final_value / initial_capital, 365.0 / static_cast<double>(days)) - 1.0;
            }

            if (!returns.empty())
            {
                metrics.mean_period_return = returns.values.mean();
                metrics.best_period_return = returns.values.maxCoeff();
                metrics.worst_period_return = returns.values.minCoeff();
            }
            return metrics;
        }

        TimeAnalysis MetricsCalculator::time_analysis(const EquityCurve &curve,
                                                      const ReturnSeries &returns) const
        {
            TimeAnalysis analysis;
            analysis.start = curve.front().timestamp;
            analysis.end = curve.back().timestamp;
            analysis.calendar_days = days_between(analysis.start, analysis.end);
            analysis.years = static_cast<double>(analysis.calendar_days) / 365.25;

            if (returns.empty())
            {
                return analysis;
            }

            // Compound the returns falling in each (year, month) and year.
            std::map<std::pair<int, int>, double> growth_by_month;
            std::map<int, double> growth_by_year;
            for (int i = 0; i < returns.size(); ++i)
            {
                CivilDate date = civil_date(returns.timestamps[i]);
                double factor = 1.0 + returns.values(i);

                auto month_it = growth_by_month.emplace(std::make_pair(date.year, date.month), 1.0).first;
                month_it->second *= factor;
                auto year_it = growth_by_year.emplace(date.year, 1.0).first;
                year_it->second *= factor;
            }

            for (const auto &entry : growth_by_year)
            {
                analysis.annual_returns[entry.first] = entry.second - 1.0;
            }

            CivilDate first = civil_date(returns.timestamps.front());
            CivilDate last = civil_date(returns.timestamps.back());
            int year = first.year;
            int month = first.month;
            while (year < last.year || (year == last.year && month <= last.month))
            {
                MonthlyReturn cell{year, month, std::nullopt};
                auto it = growth_by_month.find(std::make_pair(year, month));
                if (it != growth_by_month.end())
                {
                    cell.value = it->second - 1.0;

                    if (*cell.value > 0.0)
                    {
                        ++analysis.positive_months;
                    }
                    else if (*cell.value < 0.0)
                    {
                        ++analysis.negative_months;
                    }
                    if (!analysis.best_month || *cell.value > *analysis.best_month->value)
                    {
                        analysis.best_month = cell;
                    }
                    if (!analysis.worst_month || *cell.value < *analysis.worst_month->value)
                    {
                        analysis.worst_month = cell;
                    }
                }
                analysis.monthly_returns.push_back(cell);

                if (++month > 12)
                {
                    month = 1;
                    ++year;
                }
            }
            return analysis;
        }

    } // namespace analytics
} // namespace perfrisk
