#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/rolling_statistics.hpp"
#include "analytics/statistics.hpp"
#include "analytics/value_at_risk.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

using namespace perfrisk;
using namespace perfrisk::analytics;
using Catch::Matchers::WithinAbs;

namespace
{
    ReturnSeries make_series(const Eigen::VectorXd &values)
    {
        ReturnSeries series;
        series.values = values;
        Timestamp start = make_timestamp(2024, 1, 2);
        for (Eigen::Index i = 0; i < values.size(); ++i)
        {
            series.timestamps.push_back(start + std::chrono::hours(24 * static_cast<int>(i)));
        }
        return series;
    }

    Eigen::VectorXd normal_returns(int n, double mean, double stddev, unsigned seed)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(mean, stddev);
        Eigen::VectorXd v(n);
        for (int i = 0; i < n; ++i)
        {
            v(i) = dist(gen);
        }
        return v;
    }

    // Drawdown against the rolling peak of the wealth index, then the
    // rolling minimum of that drawdown.
    std::vector<double> reference_max_drawdown(const Eigen::VectorXd &r, int window)
    {
        const int n = static_cast<int>(r.size());
        std::vector<double> wealth(n);
        std::vector<double> drawdown(n);
        double level = 1.0;
        for (int t = 0; t < n; ++t)
        {
            level *= 1.0 + r(t);
            wealth[t] = level;
            double peak = wealth[t];
            for (int s = std::max(0, t - window + 1); s <= t; ++s)
            {
                peak = std::max(peak, wealth[s]);
            }
            drawdown[t] = (wealth[t] - peak) / peak;
        }

        std::vector<double> out(n, 0.0);
        for (int t = window - 1; t < n; ++t)
        {
            out[t] = *std::min_element(drawdown.begin() + (t - window + 1), drawdown.begin() + t + 1);
        }
        return out;
    }
}

TEST_CASE("Rolling configuration", "[Rolling]")
{
    RollingConfig config;
    REQUIRE(config.window == 252);
    REQUIRE(config.periods_per_year == 252);
    REQUIRE(config.risk_free_rate == 0.02);

    REQUIRE(config.var_confidence == 0.95);

    REQUIRE(RollingConfig::from_json({{"window", 63}}).window == 63);
    REQUIRE(RollingConfig::from_json(nlohmann::json::object()).window == 252);
    REQUIRE(RollingConfig::from_json({{"var_confidence", 0.99}}).var_confidence == 0.99);

    REQUIRE_THROWS_AS(RollingStatistics(RollingConfig(1), null_logger()), std::invalid_argument);
    REQUIRE_NOTHROW(RollingStatistics(RollingConfig(2), null_logger()));

    RollingConfig bad_confidence(20);
    bad_confidence.var_confidence = 1.0;
    REQUIRE_THROWS_AS(RollingStatistics(bad_confidence, null_logger()), std::invalid_argument);
}

TEST_CASE("Rolling metrics", "[Rolling]")
{
    const int window = 20;
    RollingConfig config(window);
    RollingStatistics rolling(config, null_logger());
    Eigen::VectorXd r = normal_returns(100, 0.0005, 0.01, 3);
    RollingTable table = rolling.compute(make_series(r));

    SECTION("Exactly window - 1 leading entries are empty")
    {
        REQUIRE(table.size() == 100);
        for (int t = 0; t < window - 1; ++t)
        {
            REQUIRE_FALSE(table.sharpe[t].has_value());
            REQUIRE_FALSE(table.volatility[t].has_value());
            REQUIRE_FALSE(table.max_drawdown[t].has_value());
            REQUIRE_FALSE(table.value_at_risk[t].has_value());
        }
        for (int t = window - 1; t < 100; ++t)
        {
            REQUIRE(table.sharpe[t].has_value());
            REQUIRE(table.volatility[t].has_value());
            REQUIRE(table.max_drawdown[t].has_value());
            REQUIRE(table.value_at_risk[t].has_value());
        }
        REQUIRE_FALSE(table.has_benchmark());
    }

    SECTION("Values match a direct computation over each window")
    {
        for (int t : {window - 1, 50, 99})
        {
            Eigen::VectorXd slice = r.segment(t - window + 1, window);
            double std_dev = stats::sample_std(slice);
            double expected_vol = std_dev * std::sqrt(252.0);
            double expected_sharpe = (stats::mean(slice) - 0.02 / 252.0) / std_dev * std::sqrt(252.0);

            REQUIRE_THAT(*table.volatility[t], WithinAbs(expected_vol, 1e-10));
            REQUIRE_THAT(*table.sharpe[t], WithinAbs(expected_sharpe, 1e-8));
            REQUIRE(*table.max_drawdown[t] <= 0.0);
        }
    }

    SECTION("Rolling drawdown uses the rolling peak of the wealth index")
    {
        std::vector<double> expected = reference_max_drawdown(r, window);
        for (int t = window - 1; t < 100; ++t)
        {
            REQUIRE_THAT(*table.max_drawdown[t], WithinAbs(expected[t], 1e-12));
        }
    }
}

TEST_CASE("Rolling historical VaR", "[Rolling]")
{
    Eigen::VectorXd r = normal_returns(120, 0.0, 0.015, 11);
    ValueAtRisk var(null_logger());

    SECTION("Default confidence matches the full-sample estimator on each window")
    {
        const int window = 20;
        RollingStatistics rolling(RollingConfig(window), null_logger());
        RollingTable table = rolling.compute(make_series(r));
        for (int t = window - 1; t < 120; ++t)
        {
            Eigen::VectorXd slice = r.segment(t - window + 1, window);
            double expected = var.value_at_risk(slice, 0.95, VaRMethod::HISTORICAL);
            REQUIRE_THAT(*table.value_at_risk[t], WithinAbs(expected, 1e-15));
            REQUIRE(*table.value_at_risk[t] >= 0.0);
        }
    }

    SECTION("Configured confidence and an odd window")
    {
        RollingConfig config(37);
        config.var_confidence = 0.9;
        RollingStatistics rolling(config, null_logger());
        RollingTable table = rolling.compute(make_series(r));
        for (int t = 36; t < 120; ++t)
        {
            Eigen::VectorXd slice = r.segment(t - 36, 37);
            double expected = var.value_at_risk(slice, 0.9, VaRMethod::HISTORICAL);
            REQUIRE_THAT(*table.value_at_risk[t], WithinAbs(expected, 1e-15));
        }
    }

    SECTION("Repeated values enter and leave the window")
    {
        Eigen::VectorXd steps(60);
        for (int i = 0; i < 60; ++i)
        {
            steps(i) = 0.01 * static_cast<double>((i * 7) % 5 - 2);
        }
        RollingStatistics rolling(RollingConfig(10), null_logger());
        RollingTable table = rolling.compute(make_series(steps));
        for (int t = 9; t < 60; ++t)
        {
            Eigen::VectorXd slice = steps.segment(t - 9, 10);
            double expected = var.value_at_risk(slice, 0.95, VaRMethod::HISTORICAL);
            REQUIRE_THAT(*table.value_at_risk[t], WithinAbs(expected, 1e-15));
        }
    }
}

TEST_CASE("Rolling metrics after a volatile stretch", "[Rolling]")
{
    // Large moves followed by a long run of identical returns.
    Eigen::VectorXd r(400);
    r.head(5) << -0.2, 0.37, 0.74, 1.11, 1.48;
    r.tail(395).setConstant(0.0013);

    const int window = 20;
    RollingStatistics rolling(RollingConfig(window), null_logger());

    SECTION("Windows of identical returns have zero volatility and Sharpe")
    {
        RollingTable table = rolling.compute(make_series(r));
        for (int t = 5 + window - 1; t < 400; ++t)
        {
            REQUIRE(*table.volatility[t] == 0.0);
            REQUIRE(*table.sharpe[t] == 0.0);
            REQUIRE(*table.max_drawdown[t] == 0.0);
            REQUIRE(*table.value_at_risk[t] == 0.0);
        }
        REQUIRE(*table.volatility[window - 1] > 0.0);
    }

    SECTION("Flat benchmark windows have zero beta and correlation")
    {
        RollingTable table = rolling.compute(make_series(r), make_series(r));
        for (int t = 5 + window - 1; t < 400; ++t)
        {
            REQUIRE(*table.beta[t] == 0.0);
            REQUIRE(*table.correlation[t] == 0.0);
        }
        REQUIRE_THAT(*table.beta[window - 1], WithinAbs(1.0, 1e-9));
    }

    SECTION("Mixed windows still match a direct computation")
    {
        Eigen::VectorXd mixed = r;
        Eigen::VectorXd noise = normal_returns(400, 0.0, 0.01, 23);
        mixed.tail(200) += noise.tail(200);
        RollingTable table = rolling.compute(make_series(mixed));
        for (int t : {window - 1, 210, 399})
        {
            Eigen::VectorXd slice = mixed.segment(t - window + 1, window);
            double expected_vol = stats::sample_std(slice) * std::sqrt(252.0);
            REQUIRE_THAT(*table.volatility[t], WithinAbs(expected_vol, 1e-10));
        }
    }
}

TEST_CASE("Rolling edge cases", "[Rolling]")
{
    RollingStatistics rolling(RollingConfig(5), null_logger());

    SECTION("Series shorter than the window is all empty")
    {
        Eigen::VectorXd r(3);
        r << 0.01, 0.02, -0.01;
        RollingTable table = rolling.compute(make_series(r));
        REQUIRE(table.size() == 3);
        for (int t = 0; t < 3; ++t)
        {
            REQUIRE_FALSE(table.sharpe[t].has_value());
        }
    }

    SECTION("Constant window has zero Sharpe")
    {
        Eigen::VectorXd r = Eigen::VectorXd::Constant(10, 0.001);
        RollingTable table = rolling.compute(make_series(r));
        REQUIRE(*table.sharpe[9] == 0.0);
        REQUIRE(*table.max_drawdown[9] == 0.0);
    }
}

TEST_CASE("Rolling benchmark metrics", "[Rolling]")
{
    RollingStatistics rolling(RollingConfig(10), null_logger());
    Eigen::VectorXd bench = normal_returns(40, 0.0, 0.01, 5);

    SECTION("Scaled benchmark has beta equal to the scale")
    {
        Eigen::VectorXd port = 1.5 * bench;
        RollingTable table = rolling.compute(make_series(port), make_series(bench));
        REQUIRE(table.has_benchmark());
        REQUIRE_FALSE(table.beta[8].has_value());
        REQUIRE_THAT(*table.beta[9], WithinAbs(1.5, 1e-9));
        REQUIRE_THAT(*table.beta[39], WithinAbs(1.5, 1e-9));
        REQUIRE_THAT(*table.correlation[39], WithinAbs(1.0, 1e-9));
    }

    SECTION("Constant benchmark gives zero beta")
    {
        Eigen::VectorXd flat = Eigen::VectorXd::Constant(40, 0.0);
        RollingTable table = rolling.compute(make_series(bench), make_series(flat));
        REQUIRE(*table.beta[20] == 0.0);
        REQUIRE(*table.correlation[20] == 0.0);
    }

    SECTION("Length mismatch is rejected")
    {
        Eigen::VectorXd shorter = bench.head(30);
        REQUIRE_THROWS_AS(rolling.compute(make_series(bench), make_series(shorter)), std::invalid_argument);
    }
}
