/**
 * @file rolling_statistics.cpp
 * @brief Implementation of the RollingStatistics class.
 *
 * Moments are kept as sums of values shifted by a reference point. The
 * sums are rebuilt around the current window mean once per window, so the
 * rounding residue left by values leaving the window never accumulates
 * beyond one window. A window whose values are all equal (window min ==
 * max) has exactly zero variance.
 *
 * Drawdowns use the compounded return index: its rolling maximum
 * (available from the first point) defines the drawdown, and the rolling
 * minimum of that drawdown is reported.
 */

#include "analytics/rolling_statistics.hpp"

#include <cmath>
#include <deque>
#include <functional>
#include <iterator>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace perfrisk
{
    namespace analytics
    {

        namespace
        {

            const double VARIANCE_EPS = 1e-18;

            /**
             * @brief Windowed sums of x, y, x^2, y^2 and x*y around shifts.
             */
            class WindowMoments
            {
            public:
                WindowMoments() : kx_(0.0), ky_(0.0), sx_(0.0), sy_(0.0), sxx_(0.0), syy_(0.0), sxy_(0.0) {}

                void add(double x, double y)
                {
                    double dx = x - kx_;
                    double dy = y - ky_;
                    sx_ += dx;
                    sy_ += dy;
                    sxx_ += dx * dx;
                    syy_ += dy * dy;
                    sxy_ += dx * dy;
                }

                void remove(double x, double y)
                {
                    double dx = x - kx_;
                    double dy = y - ky_;
                    sx_ -= dx;
                    sy_ -= dy;
                    sxx_ -= dx * dx;
                    syy_ -= dy * dy;
                    sxy_ -= dx * dy;
                }

                /**
                 * @brief Recompute the sums over [begin, end) shifted by their means.
                 */
                void rebuild(const Eigen::VectorXd &x, const Eigen::VectorXd &y, int begin, int end)
                {
                    const int n = end - begin;
                    kx_ = x.segment(begin, n).mean();
                    ky_ = y.segment(begin, n).mean();
                    sx_ = sy_ = sxx_ = syy_ = sxy_ = 0.0;
                    for (int i = begin; i < end; ++i)
                    {
                        add(x(i), y(i));
                    }
                }

                double mean_x(int n) const { return kx_ + sx_ / n; }

                double var_x(int n) const { return clamp((sxx_ - sx_ * sx_ / n) / (n - 1)); }

                double var_y(int n) const { return clamp((syy_ - sy_ * sy_ / n) / (n - 1)); }

                double cov(int n) const { return (sxy_ - sx_ * sy_ / n) / (n - 1); }

            private:
                static double clamp(double v) { return v < 0.0 ? 0.0 : v; }

                double kx_, ky_;
                double sx_, sy_, sxx_, syy_, sxy_;
            };

            /**
             * @brief Sliding-window extremum over the last @p window pushes.
             *
             * std::greater keeps the maximum at the front, std::less the minimum.
             */
            template <typename Compare>
            class MonotonicWindow
            {
            public:
                explicit MonotonicWindow(int window) : window_(window) {}

                void push(int t, double value)
                {
                    while (!items_.empty() && !Compare()(items_.back().second, value))
                    {
                        items_.pop_back();
                    }
                    items_.emplace_back(t, value);
                    if (items_.front().first <= t - window_)
                    {
                        items_.pop_front();
                    }
                }

                double front() const { return items_.front().second; }

            private:
                int window_;
                std::deque<std::pair<int, double>> items_;
            };

            /**
             * @brief Linear-interpolated quantile of a sliding window.
             *
             * The lowest (lower + 1) values sit in low_, the rest in high_, so
             * the two order statistics around the quantile are the largest of
             * low_ and the smallest of high_.
             */
            class WindowQuantile
            {
            public:
                WindowQuantile(int window, double q)
                    : window_(window)
                {
                    index_ = q * static_cast<double>(window - 1);
                    lower_ = static_cast<int>(std::floor(index_));
                    upper_ = static_cast<int>(std::ceil(index_));
                }

                void insert(double value)
                {
                    if (!low_.empty() && value <= *low_.rbegin())
                    {
                        low_.insert(value);
                    }
                    else
                    {
                        high_.insert(value);
                    }
                    rebalance();
                }

                void erase(double value)
                {
                    if (!low_.empty() && value <= *low_.rbegin())
                    {
                        low_.erase(low_.find(value));
                    }
                    else
                    {
                        high_.erase(high_.find(value));
                    }
                    rebalance();
                }

                /// Valid once the window holds exactly @c window values.
                double value() const
                {
                    double lower_value = *low_.rbegin();
                    if (lower_ == upper_ || upper_ >= window_)
                    {
                        return lower_value;
                    }
                    double frac = index_ - static_cast<double>(lower_);
                    return lower_value * (1.0 - frac) + *high_.begin() * frac;
                }

            private:
                void rebalance()
                {
                    const std::size_t target = static_cast<std::size_t>(lower_ + 1);
                    while (low_.size() > target)
                    {
                        auto last = std::prev(low_.end());
                        high_.insert(*last);
                        low_.erase(last);
                    }
                    while (low_.size() < target && !high_.empty())
                    {
                        low_.insert(*high_.begin());
                        high_.erase(high_.begin());
                    }
                }

                int window_;
                double index_;
                int lower_;
                int upper_;
                std::multiset<double> low_;
                std::multiset<double> high_;
            };

        } // anonymous namespace

        // ===================================================================
        // RollingConfig
        // ===================================================================

        RollingConfig RollingConfig::from_json(const nlohmann::json &j)
        {
            RollingConfig cfg;
            cfg.window = j.value("window", cfg.window);
            cfg.var_confidence = j.value("var_confidence", cfg.var_confidence);
            return cfg;
        }

        void RollingConfig::validate() const
        {
            if (window < 2)
            {
                throw std::invalid_argument(
                    "Expected window >= 2 for rolling statistics, got: " + std::to_string(window));
            }
            if (periods_per_year < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'periods_per_year', got: " + std::to_string(periods_per_year));
            }
            if (!(var_confidence > 0.0 && var_confidence < 1.0))
            {
                throw std::invalid_argument(
                    "Rolling VaR confidence must be in (0, 1), got: " + std::to_string(var_confidence));
            }
        }

        // ===================================================================
        // RollingStatistics
        // ===================================================================

        RollingStatistics::RollingStatistics(const RollingConfig &config, LoggerPtr logger)
            : config_(config), logger_(resolve_logger(std::move(logger)))
        {
            config_.validate();
        }

        RollingTable RollingStatistics::compute(const ReturnSeries &returns) const
        {
            return compute_impl(returns, nullptr);
        }

        RollingTable RollingStatistics::compute(const ReturnSeries &returns,
                                                const ReturnSeries &benchmark) const
        {
            if (benchmark.size() != returns.size())
            {
                throw std::invalid_argument(
                    "Benchmark return series size (" + std::to_string(benchmark.size()) + ") must match portfolio return series size (" + std::to_string(returns.size()) + ")");
            }
            return compute_impl(returns, &benchmark);
        }

        RollingTable RollingStatistics::compute_impl(const ReturnSeries &returns,
                                                     const ReturnSeries *benchmark) const
        {
            const int n = returns.size();
            const int w = config_.window;

            RollingTable table;
            table.window = w;
            table.timestamps = returns.timestamps;
            table.sharpe.assign(n, std::nullopt);
            table.volatility.assign(n, std::nullopt);
            table.max_drawdown.assign(n, std::nullopt);
            table.value_at_risk.assign(n, std::nullopt);
            if (benchmark != nullptr)
            {
                table.correlation.assign(n, std::nullopt);
                table.beta.assign(n, std::nullopt);
            }

            if (n < w)
            {
                logger_->warn("Return series length ({}) is shorter than the rolling window ({}); rolling metrics are empty",
                              n, w);
                return table;
            }

            const Eigen::VectorXd &x = returns.values;
            Eigen::VectorXd zeros;
            if (benchmark == nullptr)
            {
                zeros = Eigen::VectorXd::Zero(n);
            }
            const Eigen::VectorXd &y = (benchmark != nullptr) ? benchmark->values : zeros;

            const double periods = static_cast<double>(config_.periods_per_year);
            const double sqrt_periods = std::sqrt(periods);
            const double rf_period = config_.risk_free_rate / periods;

            WindowMoments moments;
            MonotonicWindow<std::greater<double>> max_x(w), max_y(w), max_wealth(w);
            MonotonicWindow<std::less<double>> min_x(w), min_y(w), min_drawdown(w);
            WindowQuantile quantile(w, 1.0 - config_.var_confidence);

            double level = 1.0;
            for (int t = 0; t < n; ++t)
            {
                moments.add(x(t), y(t));
                quantile.insert(x(t));
                if (t >= w)
                {
                    moments.remove(x(t - w), y(t - w));
                    quantile.erase(x(t - w));
                }
                if ((t + 1) % w == 0)
                {
                    moments.rebuild(x, y, t + 1 - w, t + 1);
                }

                max_x.push(t, x(t));
                min_x.push(t, x(t));
                max_y.push(t, y(t));
                min_y.push(t, y(t));

                level *= (1.0 + x(t));
                max_wealth.push(t, level);
                double running_max = max_wealth.front();
                min_drawdown.push(t, (level - running_max) / running_max);

                if (t < w - 1)
                {
                    continue;
                }

                const bool flat_x = max_x.front() == min_x.front();
                const bool flat_y = max_y.front() == min_y.front();
                double var_x = flat_x ? 0.0 : moments.var_x(w);
                double std_x = std::sqrt(var_x);

                table.volatility[t] = std_x * sqrt_periods;
                if (var_x < VARIANCE_EPS)
                {
                    table.sharpe[t] = 0.0;
                }
                else
                {
                    table.sharpe[t] = (moments.mean_x(w) - rf_period) / std_x * sqrt_periods;
                }
                table.max_drawdown[t] = min_drawdown.front();

                double var_value = -quantile.value();
                table.value_at_risk[t] = var_value < 0.0 ? 0.0 : var_value;

                if (benchmark != nullptr)
                {
                    double var_y = flat_y ? 0.0 : moments.var_y(w);
                    double cov = moments.cov(w);
                    table.beta[t] = (var_y < VARIANCE_EPS) ? 0.0 : cov / var_y;
                    table.correlation[t] = (var_x < VARIANCE_EPS || var_y < VARIANCE_EPS)
                                               ? 0.0
                                               : cov / std::sqrt(var_x * var_y);
                }
            }

            logger_->debug("Rolling statistics: {} returns, window {}, {} populated rows",
                           n, w, n - w + 1);
            return table;
        }

    } // namespace analytics
} // namespace perfrisk
