/**
 * @file risk_ratios.hpp
 * @brief Risk-adjusted return ratios computed from a periodic return series.
 *
 * All ratios return a RatioValue. Degenerate inputs (too few observations)
 * resolve to Finite(0) and are logged as warnings; unbounded ratios resolve
 * to PositiveInfinity and are logged at debug level.
 *
 * The risk-free rate is annual and is converted to a per-period rate by
 * dividing by the number of periods per year.
 */

#ifndef PERFRISK_ANALYTICS_RISK_RATIOS_HPP
#define PERFRISK_ANALYTICS_RISK_RATIOS_HPP

#include "core/logging.hpp"
#include "core/ratio_value.hpp"

#include <Eigen/Dense>

namespace perfrisk
{
    namespace analytics
    {

        /**
         * @class RiskRatios
         * @brief Sharpe, Sortino, Omega, Tail and Calmar ratios.
         *
         * Usage:
         * @code
         *   RiskRatios ratios(0.02, 252);
         *   RatioValue sharpe = ratios.sharpe(returns.values);
         *   RatioValue sortino = ratios.sortino(returns.values);
         * @endcode
         */
        class RiskRatios
        {
        public:
            /**
             * @brief Construct with annualization settings.
             * @param risk_free_rate Annualized risk-free rate (default 0.02).
             * @param periods_per_year Return periods per year (default 252).
             * @param tail_ratio_min_observations Minimum sample size for the
             *        tail ratio (default 20).
             * @param logger Logger for sentinel resolutions (default logger if null).
             * @throws std::invalid_argument If periods_per_year < 1 or
             *         tail_ratio_min_observations < 1.
             */
            explicit RiskRatios(double risk_free_rate = 0.02,
                                int periods_per_year = 252,
                                int tail_ratio_min_observations = 20,
                                LoggerPtr logger = nullptr);

            /**
             * @brief Annualized Sharpe ratio.
             *
             * (mean(r) - rf_p) / std(r) * sqrt(periods). Finite(0) for fewer
             * than 2 returns or zero volatility.
             */
            RatioValue sharpe(const Eigen::VectorXd &returns) const;

            /**
             * @brief Annualized Sortino ratio.
             * @param returns Periodic returns.
             * @param target Minimum acceptable return (default 0).
             *
             * Downside deviation is the sample standard deviation of
             * (r - target) over returns below the target; a single
             * sub-target return uses |r - target|. PositiveInfinity when
             * there is no downside.
             */
            RatioValue sortino(const Eigen::VectorXd &returns, double target = 0.0) const;

            /**
             * @brief Omega ratio: probability-weighted gains over losses
             *        relative to @p threshold.
             */
            RatioValue omega(const Eigen::VectorXd &returns, double threshold = 0.0) const;

            /**
             * @brief |95th percentile / 5th percentile| of the returns.
             *
             * Finite(0) below the minimum observation count, PositiveInfinity
             * if the 5th percentile is (numerically) zero.
             */
            RatioValue tail_ratio(const Eigen::VectorXd &returns) const;

            /**
             * @brief Annualized return over the magnitude of the maximum drawdown.
             * @param annualized_return CAGR as a fraction.
             * @param max_drawdown Maximum drawdown (non-positive fraction).
             */
            RatioValue calmar(double annualized_return, double max_drawdown) const;

            /** @brief Sample standard deviation scaled by sqrt(periods). */
            double annualized_volatility(const Eigen::VectorXd &returns) const;

            /** @brief Risk-free rate per return period. */
            double period_risk_free_rate() const;

            int periods_per_year() const { return periods_per_year_; }
            double risk_free_rate() const { return risk_free_rate_; }

        private:
            double risk_free_rate_;
            int periods_per_year_;
            int tail_ratio_min_observations_;
            LoggerPtr logger_;
        };

    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_RISK_RATIOS_HPP
