#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/risk_ratios.hpp"
#include "analytics/statistics.hpp"

#include <cmath>
#include <random>

using namespace perfrisk;
using namespace perfrisk::analytics;
using Catch::Matchers::WithinAbs;

namespace
{
    Eigen::VectorXd vec(std::initializer_list<double> values)
    {
        Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
        Eigen::Index i = 0;
        for (double x : values)
        {
            v(i++) = x;
        }
        return v;
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
}

TEST_CASE("Sharpe ratio", "[RiskRatios]")
{
    RiskRatios ratios(0.02, 252, 20, null_logger());

    SECTION("Matches the annualized formula")
    {
        Eigen::VectorXd r = vec({0.01, -0.005, 0.02, 0.0, 0.003});
        double expected = (stats::mean(r) - 0.02 / 252.0) / stats::sample_std(r) * std::sqrt(252.0);
        RatioValue sharpe = ratios.sharpe(r);
        REQUIRE(sharpe.is_finite());
        REQUIRE_THAT(sharpe.value(), WithinAbs(expected, 1e-12));
    }

    SECTION("Constant returns give exactly zero")
    {
        Eigen::VectorXd r = Eigen::VectorXd::Constant(50, 0.001);
        REQUIRE(ratios.sharpe(r).value() == 0.0);
    }

    SECTION("Fewer than two returns give zero")
    {
        REQUIRE(ratios.sharpe(vec({0.05})).value() == 0.0);
        REQUIRE(ratios.sharpe(Eigen::VectorXd()).value() == 0.0);
    }

    SECTION("Risk-free rate per period")
    {
        REQUIRE_THAT(ratios.period_risk_free_rate(), WithinAbs(0.02 / 252.0, 1e-15));
    }
}

TEST_CASE("Sortino ratio", "[RiskRatios]")
{
    RiskRatios ratios(0.02, 252, 20, null_logger());

    SECTION("All returns above target is unbounded")
    {
        RatioValue sortino = ratios.sortino(vec({0.01, 0.02, 0.005, 0.03}));
        REQUIRE(sortino.is_infinite());
    }

    SECTION("Single shortfall uses its absolute deviation")
    {
        Eigen::VectorXd r = vec({0.02, -0.01, 0.03});
        double expected = stats::mean(r) * 252.0 / (0.01 * std::sqrt(252.0));
        REQUIRE_THAT(ratios.sortino(r).value(), WithinAbs(expected, 1e-9));
    }

    SECTION("Several shortfalls use their sample deviation")
    {
        Eigen::VectorXd r = vec({0.02, -0.01, 0.03, -0.03});
        double downside = stats::sample_std(vec({-0.01, -0.03}));
        double expected = stats::mean(r) * 252.0 / (downside * std::sqrt(252.0));
        REQUIRE_THAT(ratios.sortino(r).value(), WithinAbs(expected, 1e-9));
    }

    SECTION("Equal shortfalls have zero downside deviation")
    {
        REQUIRE(ratios.sortino(vec({0.02, -0.01, -0.01})).is_infinite());
    }
}

TEST_CASE("Omega ratio", "[RiskRatios]")
{
    RiskRatios ratios(0.02, 252, 20, null_logger());

    REQUIRE_THAT(ratios.omega(vec({0.02, -0.01, 0.03, -0.02})).value(), WithinAbs(0.05 / 0.03, 1e-12));
    REQUIRE_THAT(ratios.omega(vec({0.02, -0.01, 0.03}), 0.02).value(), WithinAbs(0.01 / 0.03, 1e-12));
    REQUIRE(ratios.omega(vec({0.01, 0.02})).is_infinite());
}

TEST_CASE("Tail ratio", "[RiskRatios]")
{
    RiskRatios ratios(0.02, 252, 20, null_logger());

    SECTION("Requires the minimum sample")
    {
        Eigen::VectorXd r = normal_returns(19, 0.0, 0.01, 7);
        REQUIRE(ratios.tail_ratio(r).value() == 0.0);
    }

    SECTION("Symmetric tails are close to one")
    {
        Eigen::VectorXd r(21);
        for (int i = 0; i < 21; ++i)
        {
            r(i) = (i - 10) * 0.001;
        }
        REQUIRE_THAT(ratios.tail_ratio(r).value(), WithinAbs(1.0, 1e-9));
    }

    SECTION("Zero left tail is unbounded")
    {
        Eigen::VectorXd r = Eigen::VectorXd::Zero(30);
        r(29) = 0.05;
        REQUIRE(ratios.tail_ratio(r).is_infinite());
    }
}

TEST_CASE("Calmar ratio and volatility", "[RiskRatios]")
{
    RiskRatios ratios(0.02, 252, 20, null_logger());

    REQUIRE_THAT(ratios.calmar(0.12, -0.24).value(), WithinAbs(0.5, 1e-12));
    REQUIRE(ratios.calmar(0.12, 0.0).is_infinite());

    Eigen::VectorXd r = normal_returns(500, 0.0005, 0.01, 42);
    REQUIRE_THAT(ratios.annualized_volatility(r), WithinAbs(stats::sample_std(r) * std::sqrt(252.0), 1e-12));
}

TEST_CASE("Parameter validation", "[RiskRatios]")
{
    REQUIRE_THROWS_AS(RiskRatios(0.02, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(RiskRatios(0.02, 252, 0), std::invalid_argument);
}
