#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/statistics.hpp"
#include "analytics/value_at_risk.hpp"

#include <random>

using namespace perfrisk;
using namespace perfrisk::analytics;
using Catch::Matchers::WithinAbs;

namespace
{
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

    Eigen::VectorXd fat_tailed_returns(int n, unsigned seed)
    {
        std::mt19937 gen(seed);
        std::student_t_distribution<double> dist(3.0);
        Eigen::VectorXd v(n);
        for (int i = 0; i < n; ++i)
        {
            v(i) = 0.01 * dist(gen);
        }
        return v;
    }
}

TEST_CASE("Inverse normal CDF", "[VaR]")
{
    REQUIRE_THAT(inverse_normal_cdf(0.5), WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(inverse_normal_cdf(0.95), WithinAbs(1.644854, 1e-5));
    REQUIRE_THAT(inverse_normal_cdf(0.05), WithinAbs(-1.644854, 1e-5));
    REQUIRE_THAT(inverse_normal_cdf(0.01), WithinAbs(-2.326348, 1e-5));
    REQUIRE_THAT(inverse_normal_cdf(0.999), WithinAbs(3.090232, 1e-5));

    REQUIRE_THROWS_AS(inverse_normal_cdf(0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(inverse_normal_cdf(1.0), std::invalid_argument);
}

TEST_CASE("Value at risk", "[VaR]")
{
    ValueAtRisk var(null_logger());

    SECTION("Historical VaR is the negated lower quantile")
    {
        Eigen::VectorXd r = normal_returns(1000, 0.0, 0.01, 11);
        REQUIRE_THAT(var.value_at_risk(r, 0.95, VaRMethod::HISTORICAL),
                     WithinAbs(-stats::quantile(r, 0.05), 1e-12));
    }

    SECTION("Parametric VaR uses the normal quantile")
    {
        Eigen::VectorXd r = normal_returns(1000, 0.0005, 0.01, 12);
        double expected = -(stats::mean(r) + inverse_normal_cdf(0.05) * stats::sample_std(r));
        REQUIRE_THAT(var.value_at_risk(r, 0.95, VaRMethod::PARAMETRIC), WithinAbs(expected, 1e-12));
    }

    SECTION("Cornish-Fisher reduces to parametric for symmetric, mesokurtic data")
    {
        Eigen::VectorXd r = normal_returns(5000, 0.0, 0.01, 13);
        double parametric = var.value_at_risk(r, 0.99, VaRMethod::PARAMETRIC);
        double cornish_fisher = var.value_at_risk(r, 0.99, VaRMethod::CORNISH_FISHER);
        REQUIRE_THAT(cornish_fisher, WithinAbs(parametric, 0.002));
    }

    SECTION("VaR is never negative")
    {
        Eigen::VectorXd gains = Eigen::VectorXd::LinSpaced(50, 0.01, 0.05);
        for (auto method : {VaRMethod::HISTORICAL, VaRMethod::PARAMETRIC, VaRMethod::CORNISH_FISHER})
        {
            for (double confidence : {0.5, 0.9, 0.95, 0.99})
            {
                REQUIRE(var.value_at_risk(gains, confidence, method) >= 0.0);
            }
        }
    }

    SECTION("Higher confidence gives larger historical VaR")
    {
        Eigen::VectorXd r = normal_returns(2000, 0.0, 0.01, 14);
        REQUIRE(var.value_at_risk(r, 0.99) > var.value_at_risk(r, 0.95));
    }

    SECTION("Fewer than two returns give zero")
    {
        Eigen::VectorXd one(1);
        one << -0.5;
        REQUIRE(var.value_at_risk(one) == 0.0);
        REQUIRE(var.conditional_var(one) == 0.0);
    }

    SECTION("Confidence outside (0, 1) is rejected")
    {
        Eigen::VectorXd r = normal_returns(100, 0.0, 0.01, 15);
        REQUIRE_THROWS_AS(var.value_at_risk(r, 0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(var.value_at_risk(r, 1.0), std::invalid_argument);
        REQUIRE_THROWS_AS(var.conditional_var(r, 1.5), std::invalid_argument);
    }

    SECTION("Method names")
    {
        REQUIRE(to_string(VaRMethod::HISTORICAL) == "historical");
        REQUIRE(to_string(VaRMethod::PARAMETRIC) == "parametric");
        REQUIRE(to_string(VaRMethod::CORNISH_FISHER) == "cornish_fisher");
    }
}

TEST_CASE("Conditional value at risk", "[VaR]")
{
    ValueAtRisk var(null_logger());

    SECTION("CVaR is at least VaR on fat-tailed data")
    {
        Eigen::VectorXd r = fat_tailed_returns(2000, 21);
        for (double confidence : {0.9, 0.95, 0.99})
        {
            REQUIRE(var.conditional_var(r, confidence) >= var.value_at_risk(r, confidence));
        }
    }

    SECTION("Average of the returns beyond VaR")
    {
        Eigen::VectorXd r(10);
        r << -0.10, -0.05, -0.02, 0.0, 0.01, 0.01, 0.02, 0.02, 0.03, 0.04;
        // 10% quantile interpolates between -0.10 and -0.05: -0.055
        REQUIRE_THAT(var.value_at_risk(r, 0.9), WithinAbs(0.055, 1e-12));
        REQUIRE_THAT(var.conditional_var(r, 0.9), WithinAbs(0.10, 1e-12));
    }

    SECTION("No return beyond VaR falls back to VaR")
    {
        Eigen::VectorXd r(3);
        r << -0.01, -0.01, 0.01;
        double v = var.value_at_risk(r, 0.5);
        REQUIRE(v == 0.01);
        REQUIRE(var.conditional_var(r, 0.5) == v);
    }
}
