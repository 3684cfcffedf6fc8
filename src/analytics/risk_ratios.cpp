/**
 * @file risk_ratios.cpp
 * @brief Implementation of the RiskRatios calculator.
 */

#include "analytics/risk_ratios.hpp"
#include "analytics/statistics.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace perfrisk
{
    namespace analytics
    {

        RiskRatios::RiskRatios(double risk_free_rate,
                               int periods_per_year,
                               int tail_ratio_min_observations,
                               LoggerPtr logger)
            : risk_free_rate_(risk_free_rate), periods_per_year_(periods_per_year), tail_ratio_min_observations_(tail_ratio_min_observations), logger_(resolve_logger(std::move(logger)))
        {
            if (periods_per_year_ < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'periods_per_year', got: " + std::to_string(periods_per_year_));
            }
            if (tail_ratio_min_observations_ < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'tail_ratio_min_observations', got: " + std::to_string(tail_ratio_min_observations_));
            }
        }

        double RiskRatios::period_risk_free_rate() const
        {
            return risk_free_rate_ / static_cast<double>(periods_per_year_);
        }

        double RiskRatios::annualized_volatility(const Eigen::VectorXd &returns) const
        {
            return stats::sample_std(returns) * std::sqrt(static_cast<double>(periods_per_year_));
        }

        // ===================================================================
        // Sharpe
        // ===================================================================

        RatioValue RiskRatios::sharpe(const Eigen::VectorXd &returns) const
        {
            if (returns.size() < 2)
            {
                logger_->warn("Sharpe ratio needs at least 2 returns, got {}; reporting 0", returns.size());
                return RatioValue::finite(0.0);
            }

            double std_dev = stats::sample_std(returns);
            if (std_dev < 1e-18 || returns.maxCoeff() == returns.minCoeff())
            {
                logger_->warn("Sharpe ratio undefined for zero volatility; reporting 0");
                return RatioValue::finite(0.0);
            }

            double excess = stats::mean(returns) - period_risk_free_rate();
            return RatioValue::finite(excess / std_dev * std::sqrt(static_cast<double>(periods_per_year_)));
        }

        // ===================================================================
        // Sortino
        // ===================================================================

        RatioValue RiskRatios::sortino(const Eigen::VectorXd &returns, double target) const
        {
            if (returns.size() < 2)
            {
                logger_->warn("Sortino ratio needs at least 2 returns, got {}; reporting 0", returns.size());
                return RatioValue::finite(0.0);
            }

            std::vector<double> shortfall;
            for (Eigen::Index i = 0; i < returns.size(); ++i)
            {
                if (returns(i) < target)
                {
                    shortfall.push_back(returns(i) - target);
                }
            }

            if (shortfall.empty())
            {
                logger_->debug("Sortino ratio: no returns below target {}, ratio is unbounded", target);
                return RatioValue::positive_infinity();
            }

            double downside_std;
            if (shortfall.size() == 1)
            {
                downside_std = std::fabs(shortfall.front());
            }
            else
            {
                Eigen::VectorXd downside = Eigen::Map<const Eigen::VectorXd>(
                    shortfall.data(), static_cast<Eigen::Index>(shortfall.size()));
                downside_std = stats::sample_std(downside);
            }

            if (downside_std == 0.0)
            {
                logger_->debug("Sortino ratio: zero downside deviation, ratio is unbounded");
                return RatioValue::positive_infinity();
            }

            double periods = static_cast<double>(periods_per_year_);
            double annual_return = stats::mean(returns) * periods;
            return RatioValue::finite((annual_return - target) / (downside_std * std::sqrt(periods)));
        }

        // ===================================================================
        // Omega
        // ===================================================================

        RatioValue RiskRatios::omega(const Eigen::VectorXd &returns, double threshold) const
        {
            if (returns.size() < 2)
            {
                logger_->warn("Omega ratio needs at least 2 returns, got {}; reporting 0", returns.size());
                return RatioValue::finite(0.0);
            }

            double gains = 0.0;
            double losses = 0.0;
            for (Eigen::Index i = 0; i < returns.size(); ++i)
            {
                double excess = returns(i) - threshold;
                if (excess > 0.0)
                {
                    gains += excess;
                }
                else if (excess < 0.0)
                {
                    losses -= excess;
                }
            }

            if (losses == 0.0)
            {
                logger_->debug("Omega ratio: no returns below threshold {}, ratio is unbounded", threshold);
                return RatioValue::positive_infinity();
            }
            return RatioValue::finite(gains / losses);
        }

        // ===================================================================
        // Tail ratio
        // ===================================================================

        RatioValue RiskRatios::tail_ratio(const Eigen::VectorXd &returns) const
        {
            if (returns.size() < tail_ratio_min_observations_)
            {
                logger_->warn("Tail ratio needs at least {} returns, got {}; reporting 0",
                              tail_ratio_min_observations_, returns.size());
                return RatioValue::finite(0.0);
            }

            double right = stats::quantile(returns, 0.95);
            double left = stats::quantile(returns, 0.05);

            if (std::fabs(left) < 1e-10)
            {
                logger_->debug("Tail ratio: 5th percentile is zero, ratio is unbounded");
                return RatioValue::positive_infinity();
            }
            return RatioValue::finite(std::fabs(right / left));
        }

        // ===================================================================
        // Calmar
        // ===================================================================

        RatioValue RiskRatios::calmar(double annualized_return, double max_drawdown) const
        {
            if (max_drawdown == 0.0)
            {
                logger_->debug("Calmar ratio: no drawdown, ratio is unbounded");
                return RatioValue::positive_infinity();
            }
            return RatioValue::finite(annualized_return / std::fabs(max_drawdown));
        }

    } // namespace analytics
} // namespace perfrisk
