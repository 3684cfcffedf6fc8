#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "analytics/drawdown_analysis.hpp"
#include "core/errors.hpp"
#include "core/time_utils.hpp"

using namespace perfrisk;
using namespace perfrisk::analytics;
using Catch::Matchers::ContainsSubstring;
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

TEST_CASE("Maximum drawdown", "[Drawdown]")
{
    SECTION("Peak, trough and recovery")
    {
        DrawdownAnalysis dd(daily_curve({100.0, 110.0, 90.0, 95.0, 120.0}), null_logger());
        const DrawdownEpisode &max = dd.max_drawdown_episode();

        REQUIRE_THAT(dd.max_drawdown(), WithinAbs(-0.181818181818, 1e-9));
        REQUIRE(max.peak.index == 1);
        REQUIRE(max.peak.value == 110.0);
        REQUIRE(max.trough.index == 2);
        REQUIRE(max.trough.value == 90.0);
        REQUIRE(max.recovered());
        REQUIRE(max.recovery->index == 4);
        REQUIRE(max.recovery->value == 120.0);
        REQUIRE(max.duration_days == 1);
        REQUIRE(*max.recovery_days == 2);
    }

    SECTION("Monotonically rising curve has zero drawdown")
    {
        DrawdownAnalysis dd(daily_curve({100.0, 101.0, 102.0}), null_logger());
        const DrawdownEpisode &max = dd.max_drawdown_episode();

        REQUIRE(dd.max_drawdown() == 0.0);
        REQUIRE(max.peak.index == 2);
        REQUIRE(max.trough.index == 2);
        REQUIRE(max.recovery->index == 2);
        REQUIRE(dd.event_count() == 0);
    }

    SECTION("Single point")
    {
        DrawdownAnalysis dd(daily_curve({100.0}), null_logger());
        REQUIRE(dd.max_drawdown() == 0.0);
        REQUIRE(dd.underwater_curve().size() == 1);
    }

    SECTION("Unrecovered drawdown")
    {
        DrawdownAnalysis dd(daily_curve({100.0, 120.0, 80.0, 90.0}), null_logger());
        REQUIRE_THAT(dd.max_drawdown(), WithinAbs(-1.0 / 3.0, 1e-12));
        REQUIRE_FALSE(dd.max_drawdown_episode().recovered());
        REQUIRE_FALSE(dd.max_drawdown_episode().recovery_days.has_value());
    }

    SECTION("Equal troughs resolve to the first")
    {
        DrawdownAnalysis dd(daily_curve({100.0, 90.0, 100.0, 90.0, 100.0}), null_logger());
        const DrawdownEpisode &max = dd.max_drawdown_episode();
        REQUIRE(max.peak.index == 0);
        REQUIRE(max.trough.index == 1);
        REQUIRE(max.recovery->index == 2);
    }

    SECTION("Drawdown is never positive")
    {
        DrawdownAnalysis dd(daily_curve({100.0, 130.0, 70.0, 140.0, 60.0, 150.0}), null_logger());
        REQUIRE(dd.max_drawdown() <= 0.0);
        for (double u : dd.underwater_curve())
        {
            REQUIRE(u <= 0.0);
        }
    }

    SECTION("Invalid curve")
    {
        REQUIRE_THROWS_AS(DrawdownAnalysis(EquityCurve{}, null_logger()), ValidationError);
    }
}

TEST_CASE("Drawdown events", "[Drawdown]")
{
    DrawdownAnalysis dd(daily_curve({100.0, 90.0, 100.0, 80.0, 110.0, 105.0}), null_logger());

    SECTION("Events are split at each recovery")
    {
        const auto &events = dd.all_events();
        REQUIRE(events.size() == 3);

        REQUIRE(events[0].peak.index == 0);
        REQUIRE(events[0].trough.index == 1);
        REQUIRE(events[0].recovery->index == 2);
        REQUIRE_THAT(events[0].depth, WithinAbs(-0.1, 1e-12));

        REQUIRE(events[1].peak.index == 2);
        REQUIRE(events[1].trough.index == 3);
        REQUIRE_THAT(events[1].depth, WithinAbs(-0.2, 1e-12));

        REQUIRE(events[2].peak.index == 4);
        REQUIRE_FALSE(events[2].recovered());
    }

    SECTION("Top drawdowns are ordered deepest first")
    {
        auto top = dd.top_drawdowns(2);
        REQUIRE(top.size() == 2);
        REQUIRE_THAT(top[0].depth, WithinAbs(-0.2, 1e-12));
        REQUIRE_THAT(top[1].depth, WithinAbs(-0.1, 1e-12));

        REQUIRE(dd.top_drawdowns(10).size() == 3);
        REQUIRE_THROWS_AS(dd.top_drawdowns(0), std::invalid_argument);
    }

    SECTION("Summary")
    {
        DrawdownSummary s = dd.summary();
        REQUIRE(s.total_events == 3);
        REQUIRE(s.unrecovered_count == 1);
        REQUIRE_THAT(s.max_depth, WithinAbs(-0.2, 1e-12));
        REQUIRE_THAT(s.average_depth, WithinAbs((-0.1 - 0.2 - 5.0 / 110.0) / 3.0, 1e-12));
        REQUIRE_THAT(s.average_recovery_days, WithinAbs(1.0, 1e-12));
        REQUIRE(s.longest_decline_days == 1);
        // Under water on days 0-2, 2-4 and 4-5 of a 5 day span
        REQUIRE_THAT(s.time_in_drawdown_pct, WithinAbs(1.0, 1e-12));
    }

    SECTION("Report lists the events")
    {
        std::string text = dd.report(2);
        REQUIRE_THAT(text, ContainsSubstring("Total Events:           3"));
        REQUIRE_THAT(text, ContainsSubstring("Top 2 Drawdowns"));
        REQUIRE_THAT(text, ContainsSubstring("Unrecovered"));
    }

    SECTION("Summary without events")
    {
        DrawdownAnalysis flat(daily_curve({100.0, 100.0, 101.0}), null_logger());
        DrawdownSummary s = flat.summary();
        REQUIRE(s.total_events == 0);
        REQUIRE(s.average_recovery_days == -1.0);
        REQUIRE_THAT(flat.report(), ContainsSubstring("No drawdown events."));
    }
}
