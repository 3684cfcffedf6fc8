/**
 * @file statistics.cpp
 * @brief Implementation of the descriptive statistics helpers.
 */

#include "analytics/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace perfrisk
{
    namespace analytics
    {
        namespace stats
        {

            double mean(const Eigen::VectorXd &values)
            {
                if (values.size() == 0)
                {
                    return 0.0;
                }
                return values.mean();
            }

            double sample_std(const Eigen::VectorXd &values)
            {
                const Eigen::Index n = values.size();
                if (n < 2)
                {
                    return 0.0;
                }
                double sum_sq = (values.array() - values.mean()).square().sum();
                return std::sqrt(sum_sq / static_cast<double>(n - 1));
            }

            double skewness(const Eigen::VectorXd &values)
            {
                const Eigen::Index n = values.size();
                if (n < 3)
                {
                    return 0.0;
                }

                Eigen::ArrayXd diff = values.array() - values.mean();
                double m2 = diff.square().mean();
                double m3 = diff.cube().mean();

                if (m2 < 1e-18)
                {
                    return 0.0;
                }

                double raw_skew = m3 / std::pow(m2, 1.5);
                double nd = static_cast<double>(n);
                double adjust = std::sqrt(nd * (nd - 1.0)) / (nd - 2.0);
                return adjust * raw_skew;
            }

            double kurtosis(const Eigen::VectorXd &values)
            {
                const Eigen::Index n = values.size();
                if (n < 4)
                {
                    return 0.0;
                }

                Eigen::ArrayXd diff = values.array() - values.mean();
                double m2 = diff.square().mean();
                double m4 = diff.square().square().mean();

                if (m2 < 1e-18)
                {
                    return 0.0;
                }

                double raw_kurt = m4 / (m2 * m2);
                double nd = static_cast<double>(n);
                return ((nd + 1.0) * raw_kurt - 3.0 * (nd - 1.0)) * (nd - 1.0) / ((nd - 2.0) * (nd - 3.0));
            }

            double quantile(const Eigen::VectorXd &values, double q)
            {
                if (values.size() == 0)
                {
                    throw std::invalid_argument("Cannot compute a quantile of an empty sample");
                }
                if (q < 0.0 || q > 1.0)
                {
                    throw std::invalid_argument(
                        "Quantile probability must be in [0, 1], got: " + std::to_string(q));
                }

                std::vector<double> sorted(values.data(), values.data() + values.size());
                std::sort(sorted.begin(), sorted.end());

                const int n = static_cast<int>(sorted.size());
                double index = q * static_cast<double>(n - 1);
                int lower = static_cast<int>(std::floor(index));
                int upper = static_cast<int>(std::ceil(index));

                if (lower == upper || upper >= n)
                {
                    return sorted[lower];
                }
                double frac = index - static_cast<double>(lower);
                return sorted[lower] * (1.0 - frac) + sorted[upper] * frac;
            }

            double covariance(const Eigen::VectorXd &x, const Eigen::VectorXd &y)
            {
                if (x.size() != y.size())
                {
                    throw std::invalid_argument(
                        "Covariance inputs must have equal size (" + std::to_string(x.size()) + " vs " + std::to_string(y.size()) + ")");
                }
                const Eigen::Index n = x.size();
                if (n < 2)
                {
                    return 0.0;
                }
                double sum = ((x.array() - x.mean()) * (y.array() - y.mean())).sum();
                return sum / static_cast<double>(n - 1);
            }

            double correlation(const Eigen::VectorXd &x, const Eigen::VectorXd &y)
            {
                double cov = covariance(x, y);
                double sx = sample_std(x);
                double sy = sample_std(y);
                if (sx < 1e-18 || sy < 1e-18)
                {
                    return 0.0;
                }
                return cov / (sx * sy);
            }

        } // namespace stats
    } // namespace analytics
} // namespace perfrisk
