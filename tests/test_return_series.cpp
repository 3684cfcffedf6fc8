#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/return_series.hpp"
#include "core/errors.hpp"
#include "core/time_utils.hpp"

using namespace perfrisk;
using namespace perfrisk::analytics;
using Catch::Matchers::WithinAbs;

namespace
{
    EquityCurve daily_curve(const std::vector<double> &values)
    {
        EquityCurve curve;
        Timestamp start = make_timestamp(2024, 1, 1);
        for (size_t i = 0; i < values.size(); ++i)
        {
            curve.push_back({start + std::chrono::hours(24 * static_cast<int>(i)), values[i]});
        }
        return curve;
    }
}

TEST_CASE("Return series derivation", "[ReturnSeries]")
{
    SECTION("Length is n - 1 and values are simple returns")
    {
        auto curve = daily_curve({100.0, 110.0, 99.0, 99.0});
        ReturnSeries returns = derive_returns(curve);

        REQUIRE(returns.size() == 3);
        REQUIRE(returns.timestamps.size() == 3);
        REQUIRE_THAT(returns.values(0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(returns.values(1), WithinAbs(-0.10, 1e-12));
        REQUIRE_THAT(returns.values(2), WithinAbs(0.0, 1e-12));
    }

    SECTION("Each return is stamped with the later observation")
    {
        auto curve = daily_curve({100.0, 101.0, 102.0});
        ReturnSeries returns = derive_returns(curve);
        REQUIRE(returns.timestamps.front() == curve[1].timestamp);
        REQUIRE(returns.timestamps.back() == curve[2].timestamp);
    }

    SECTION("Single point gives an empty series")
    {
        ReturnSeries returns = derive_returns(daily_curve({100.0}));
        REQUIRE(returns.empty());
        REQUIRE(returns.size() == 0);
        REQUIRE(returns.timestamps.empty());
    }

    SECTION("Invalid curves are rejected")
    {
        REQUIRE_THROWS_AS(derive_returns(EquityCurve{}), ValidationError);
        REQUIRE_THROWS_AS(derive_returns(daily_curve({100.0, -5.0})), ValidationError);
    }

    SECTION("Equity values copies the value column")
    {
        Eigen::VectorXd values = equity_values(daily_curve({1.0, 2.0, 3.0}));
        REQUIRE(values.size() == 3);
        REQUIRE(values(2) == 3.0);
    }
}
