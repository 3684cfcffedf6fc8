/**
 * @file value_at_risk.cpp
 * @brief Implementation of historical, parametric and Cornish-Fisher VaR.
 */

#include "analytics/value_at_risk.hpp"
#include "analytics/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace perfrisk
{
    namespace analytics
    {

        namespace
        {

            void check_confidence(double confidence)
            {
                if (!(confidence > 0.0 && confidence < 1.0))
                {
                    throw std::invalid_argument(
                        "Confidence level must be in (0, 1), got: " + std::to_string(confidence));
                }
            }

        } // anonymous namespace

        std::string to_string(VaRMethod method)
        {
            switch (method)
            {
            case VaRMethod::HISTORICAL:
                return "historical";
            case VaRMethod::PARAMETRIC:
                return "parametric";
            case VaRMethod::CORNISH_FISHER:
                return "cornish_fisher";
            }
            return "unknown";
        }

        /**
         * Beasley-Springer-Moro rational approximation, accurate to about
         * 1e-9 for p in [1e-8, 1 - 1e-8].
         */
        double inverse_normal_cdf(double p)
        {
            if (!(p > 0.0 && p < 1.0))
            {
                throw std::invalid_argument(
                    "Probability must be in (0, 1), got: " + std::to_string(p));
            }

            static const double a[] = {
                -3.969683028665376e+01, 2.209460984245205e+02,
                -2.759285104469687e+02, 1.383577518672690e+02,
                -3.066479806614716e+01, 2.506628277459239e+00};
            static const double b[] = {
                -5.447609879822406e+01, 1.615858368580409e+02,
                -1.556989798598866e+02, 6.680131188771972e+01,
                -1.328068155288572e+01};
            static const double c[] = {
                -7.784894002430293e-03, -3.223964580411365e-01,
                -2.400758277161838e+00, -2.549732539343734e+00,
                4.374664141464968e+00, 2.938163982698783e+00};
            static const double d[] = {
                7.784695709041462e-03, 3.224671290700398e-01,
                2.445134137142996e+00, 3.754408661907416e+00};

            static const double P_LOW = 0.02425;
            static const double P_HIGH = 1.0 - P_LOW;

            if (p < P_LOW)
            {
                double q = std::sqrt(-2.0 * std::log(p));
                return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) / ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
            }
            if (p <= P_HIGH)
            {
                double q = p - 0.5;
                double r = q * q;
                return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q / (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
            }
            double q = std::sqrt(-2.0 * std::log(1.0 - p));
            return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) / ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
        }

        ValueAtRisk::ValueAtRisk(LoggerPtr logger)
            : logger_(resolve_logger(std::move(logger)))
        {
        }

        // ===================================================================
        // VaR
        // ===================================================================

        double ValueAtRisk::value_at_risk(const Eigen::VectorXd &returns,
                                          double confidence,
                                          VaRMethod method) const
        {
            check_confidence(confidence);

            if (returns.size() < 2)
            {
                logger_->warn("VaR needs at least 2 returns, got {}; reporting 0", returns.size());
                return 0.0;
            }

            double var_value = 0.0;
            switch (method)
            {
            case VaRMethod::HISTORICAL:
                var_value = -stats::quantile(returns, 1.0 - confidence);
                break;

            case VaRMethod::PARAMETRIC:
            {
                double z = inverse_normal_cdf(1.0 - confidence);
                var_value = -(stats::mean(returns) + z * stats::sample_std(returns));
                break;
            }

            case VaRMethod::CORNISH_FISHER:
            {
                double z = inverse_normal_cdf(1.0 - confidence);
                double s = stats::skewness(returns);
                double k = stats::kurtosis(returns);
                double z2 = z * z;
                double z3 = z2 * z;
                double z_cf = z + (z2 - 1.0) * s / 6.0 + (z3 - 3.0 * z) * k / 24.0 - (2.0 * z3 - 5.0 * z) * s * s / 36.0;
                var_value = -(stats::mean(returns) + z_cf * stats::sample_std(returns));
                break;
            }
            }

            if (var_value < 0.0)
            {
                logger_->debug("{} VaR at {} is negative ({}); clamping to 0",
                               to_string(method), confidence, var_value);
                return 0.0;
            }
            return var_value;
        }

        // ===================================================================
        // CVaR
        // ===================================================================

        double ValueAtRisk::conditional_var(const Eigen::VectorXd &returns,
                                            double confidence) const
        {
            check_confidence(confidence);

            if (returns.size() < 2)
            {
                logger_->warn("CVaR needs at least 2 returns, got {}; reporting 0", returns.size());
                return 0.0;
            }

            double var_value = value_at_risk(returns, confidence, VaRMethod::HISTORICAL);
            double threshold = -var_value;

            double sum = 0.0;
            int count = 0;
            for (Eigen::Index i = 0; i < returns.size(); ++i)
            {
                if (returns(i) < threshold)
                {
                    sum += returns(i);
                    ++count;
                }
            }

            if (count == 0)
            {
                return var_value;
            }
            return std::max(0.0, -(sum / static_cast<double>(count)));
        }

    } // namespace analytics
} // namespace perfrisk
