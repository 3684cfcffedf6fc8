/**
 * @file value_at_risk.hpp
 * @brief Value at Risk and Conditional VaR (Expected Shortfall).
 *
 * VaR is reported as a non-negative loss magnitude: a VaR of 0.02 at 95%
 * means that 95% of the time the periodic loss does not exceed 2%.
 */

#ifndef PERFRISK_ANALYTICS_VALUE_AT_RISK_HPP
#define PERFRISK_ANALYTICS_VALUE_AT_RISK_HPP

#include "core/logging.hpp"

#include <Eigen/Dense>

#include <string>

namespace perfrisk
{
    namespace analytics
    {

        /**
         * @enum VaRMethod
         * @brief Method used for Value at Risk calculations.
         */
        enum class VaRMethod
        {
            HISTORICAL,    ///< Empirical quantile of the return distribution
            PARAMETRIC,    ///< Normal distribution with sample mean and std dev
            CORNISH_FISHER ///< Normal quantile adjusted for skewness and excess kurtosis
        };

        /** @brief "historical", "parametric" or "cornish_fisher". */
        std::string to_string(VaRMethod method);

        /**
         * @brief Inverse of the standard normal CDF (probit).
         * @param p Probability in (0, 1).
         * @throws std::invalid_argument If p is outside (0, 1).
         */
        double inverse_normal_cdf(double p);

        /**
         * @class ValueAtRisk
         * @brief VaR and CVaR over a periodic return series.
         *
         * Fewer than 2 returns resolve to 0 with a warning. Negative VaR
         * estimates (a distribution with no downside at the chosen
         * confidence) are clamped to 0.
         */
        class ValueAtRisk
        {
        public:
            explicit ValueAtRisk(LoggerPtr logger = nullptr);

            /**
             * @brief Value at Risk at the given confidence.
             * @param returns Periodic returns.
             * @param confidence Confidence level in (0, 1), e.g. 0.95.
             * @param method Estimation method (default HISTORICAL).
             * @return Non-negative loss magnitude.
             * @throws std::invalid_argument If confidence is not in (0, 1).
             */
            double value_at_risk(const Eigen::VectorXd &returns,
                                 double confidence = 0.95,
                                 VaRMethod method = VaRMethod::HISTORICAL) const;

            /**
             * @brief Conditional VaR: mean loss of the returns beyond the
             *        historical VaR threshold.
             *
             * Equals the historical VaR when no return lies strictly below
             * the threshold.
             *
             * @throws std::invalid_argument If confidence is not in (0, 1).
             */
            double conditional_var(const Eigen::VectorXd &returns,
                                   double confidence = 0.95) const;

        private:
            LoggerPtr logger_;
        };

    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_VALUE_AT_RISK_HPP
