/**
 * @file statistics.hpp
 * @brief Descriptive statistics over return vectors.
 *
 * Conventions follow pandas so results can be cross-checked against the
 * research notebooks: sample standard deviation uses n - 1, skewness and
 * excess kurtosis are the bias-corrected estimators, and quantiles use
 * linear interpolation between order statistics.
 */

#ifndef PERFRISK_ANALYTICS_STATISTICS_HPP
#define PERFRISK_ANALYTICS_STATISTICS_HPP

#include <Eigen/Dense>

namespace perfrisk
{
    namespace analytics
    {
        namespace stats
        {

            /** @brief Arithmetic mean; 0 for an empty vector. */
            double mean(const Eigen::VectorXd &values);

            /** @brief Sample standard deviation (n - 1); 0 for fewer than 2 values. */
            double sample_std(const Eigen::VectorXd &values);

            /**
             * @brief Bias-corrected sample skewness (Fisher).
             * @return 0 for fewer than 3 values or zero variance.
             */
            double skewness(const Eigen::VectorXd &values);

            /**
             * @brief Bias-corrected excess kurtosis (0 for a normal distribution).
             * @return 0 for fewer than 4 values or zero variance.
             */
            double kurtosis(const Eigen::VectorXd &values);

            /**
             * @brief Quantile with linear interpolation.
             * @param values Non-empty sample.
             * @param q Probability in [0, 1].
             * @throws std::invalid_argument If values is empty or q is outside [0, 1].
             */
            double quantile(const Eigen::VectorXd &values, double q);

            /**
             * @brief Sample covariance (n - 1) of two equally sized vectors.
             * @throws std::invalid_argument If sizes differ.
             */
            double covariance(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

            /**
             * @brief Pearson correlation; 0 when either side has zero variance.
             * @throws std::invalid_argument If sizes differ.
             */
            double correlation(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

        } // namespace stats
    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_STATISTICS_HPP
