/**
 * @file benchmark_analysis.hpp
 * @brief Relative performance against a benchmark return series.
 *
 * Computes the CAPM sensitivity (beta), the annualized excess return over
 * the CAPM expectation (alpha) and the correlation of periodic returns:
 *
 *   beta  = Cov(R_p, R_b) / Var(R_b)
 *   alpha = E[R_p] * P - (R_f + beta * (E[R_b] * P - R_f))
 *
 * where P is the number of periods per year and R_f the annual risk-free
 * rate.
 */

#ifndef PERFRISK_ANALYTICS_BENCHMARK_ANALYSIS_HPP
#define PERFRISK_ANALYTICS_BENCHMARK_ANALYSIS_HPP

#include "core/logging.hpp"

#include <Eigen/Dense>

namespace perfrisk
{
    namespace analytics
    {

        /**
         * @struct BenchmarkMetrics
         * @brief Benchmark-relative statistics.
         */
        struct BenchmarkMetrics
        {
            double beta = 0.0;        ///< Market sensitivity (0 if benchmark variance is 0)
            double alpha = 0.0;       ///< Annualized CAPM alpha
            double correlation = 0.0; ///< Pearson correlation of periodic returns
            int num_observations = 0; ///< Number of paired returns
        };

        /**
         * @class BenchmarkAnalysis
         * @brief Computes BenchmarkMetrics for a pair of aligned return series.
         *
         * Usage:
         * @code
         *   BenchmarkAnalysis bench(0.02, 252);
         *   BenchmarkMetrics m = bench.analyze(portfolio_returns, benchmark_returns);
         * @endcode
         */
        class BenchmarkAnalysis
        {
        public:
            /**
             * @param risk_free_rate Annualized risk-free rate (default 0.02).
             * @param periods_per_year Periods per year (default 252).
             * @param logger Logger (default logger if null).
             * @throws std::invalid_argument If periods_per_year < 1.
             */
            explicit BenchmarkAnalysis(double risk_free_rate = 0.02,
                                       int periods_per_year = 252,
                                       LoggerPtr logger = nullptr);

            /**
             * @brief Compute beta, alpha and correlation.
             *
             * Fewer than 2 paired returns yield all-zero metrics with a warning.
             *
             * @throws std::invalid_argument If the series lengths differ.
             */
            BenchmarkMetrics analyze(const Eigen::VectorXd &portfolio_returns,
                                     const Eigen::VectorXd &benchmark_returns) const;

        private:
            double risk_free_rate_;
            int periods_per_year_;
            LoggerPtr logger_;
        };

    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_BENCHMARK_ANALYSIS_HPP
