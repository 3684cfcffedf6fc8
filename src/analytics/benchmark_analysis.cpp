/**
 * @file benchmark_analysis.cpp
 * @brief Implementation of the BenchmarkAnalysis class.
 */

#include "analytics/benchmark_analysis.hpp"
#include "analytics/statistics.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace perfrisk
{
    namespace analytics
    {

        BenchmarkAnalysis::BenchmarkAnalysis(double risk_free_rate,
                                             int periods_per_year,
                                             LoggerPtr logger)
            : risk_free_rate_(risk_free_rate), periods_per_year_(periods_per_year), logger_(resolve_logger(std::move(logger)))
        {
            if (periods_per_year_ <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'periods_per_year', got: " + std::to_string(periods_per_year_));
            }
        }

        BenchmarkMetrics BenchmarkAnalysis::analyze(const Eigen::VectorXd &portfolio_returns,
                                                    const Eigen::VectorXd &benchmark_returns) const
        {
            if (portfolio_returns.size() != benchmark_returns.size())
            {
                throw std::invalid_argument(
                    "Portfolio return series size (" + std::to_string(portfolio_returns.size()) + ") must match benchmark return series size (" + std::to_string(benchmark_returns.size()) + ")");
            }

            BenchmarkMetrics metrics;
            metrics.num_observations = static_cast<int>(portfolio_returns.size());
            if (metrics.num_observations < 2)
            {
                logger_->warn("Benchmark metrics need at least 2 paired returns, got {}; reporting 0",
                              metrics.num_observations);
                return metrics;
            }

            double bench_var = stats::sample_std(benchmark_returns);
            bench_var *= bench_var;
            if (bench_var < 1e-18)
            {
                logger_->warn("Benchmark variance is zero; beta and correlation reported as 0");
            }
            else
            {
                metrics.beta = stats::covariance(portfolio_returns, benchmark_returns) / bench_var;
            }
            metrics.correlation = stats::correlation(portfolio_returns, benchmark_returns);

            double periods = static_cast<double>(periods_per_year_);
            double annual_return = stats::mean(portfolio_returns) * periods;
            double annual_benchmark = stats::mean(benchmark_returns) * periods;
            double expected = risk_free_rate_ + metrics.beta * (annual_benchmark - risk_free_rate_);
            metrics.alpha = annual_return - expected;

            logger_->debug("Benchmark metrics: beta {}, alpha {}, correlation {}",
                           metrics.beta, metrics.alpha, metrics.correlation);
            return metrics;
        }

    } // namespace analytics
} // namespace perfrisk
