/**
 * @file trade_statistics.cpp
 * @brief Implementation of FIFO round-trip matching and trade statistics.
 */

#include "analytics/trade_statistics.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <utility>

namespace perfrisk
{
    namespace analytics
    {

        std::string to_string(PositionSide side)
        {
            return side == PositionSide::LONG ? "LONG" : "SHORT";
        }

        TradeStatisticsAggregator::TradeStatisticsAggregator(LoggerPtr logger)
            : logger_(resolve_logger(std::move(logger)))
        {
        }

        // ===================================================================
        // FIFO matching
        // ===================================================================

        RoundTripResult TradeStatisticsAggregator::match_round_trips(const std::vector<Fill> &fills) const
        {
            for (const auto &fill : fills)
            {
                validate_fill(fill);
            }

            std::vector<const Fill *> ordered;
            ordered.reserve(fills.size());
            for (const auto &fill : fills)
            {
                ordered.push_back(&fill);
            }
            std::stable_sort(ordered.begin(), ordered.end(),
                             [](const Fill *a, const Fill *b)
                             { return a->timestamp < b->timestamp; });

            RoundTripResult result;
            std::map<std::string, std::deque<OpenLot>> books;

            for (const Fill *fill : ordered)
            {
                auto &lots = books[fill->symbol];
                double commission_per_share = fill->commission / static_cast<double>(fill->quantity);

                // Lots of the opposite side are closed first.
                PositionSide closes = (fill->direction == Direction::BUY) ? PositionSide::SHORT : PositionSide::LONG;
                PositionSide opens = (fill->direction == Direction::BUY) ? PositionSide::LONG : PositionSide::SHORT;

                long long remaining = fill->quantity;
                while (remaining > 0 && !lots.empty() && lots.front().side == closes)
                {
                    OpenLot &lot = lots.front();
                    long long slice = std::min(remaining, lot.quantity);
                    double qty = static_cast<double>(slice);
                    double sign = (lot.side == PositionSide::LONG) ? 1.0 : -1.0;

                    RoundTrip trip;
                    trip.symbol = fill->symbol;
                    trip.side = lot.side;
                    trip.quantity = slice;
                    trip.entry_price = lot.entry_price;
                    trip.exit_price = fill->fill_price;
                    trip.entry_time = lot.entry_time;
                    trip.exit_time = fill->timestamp;
                    trip.pnl = (fill->fill_price - lot.entry_price) * qty * sign - lot.commission_per_share * qty - commission_per_share * qty;
                    trip.return_pct = trip.pnl / (lot.entry_price * qty);
                    trip.holding_days = fractional_days(lot.entry_time, fill->timestamp);
                    result.round_trips.push_back(trip);

                    logger_->debug("Closed {} {} x{} @ {} -> {} (pnl {})",
                                   to_string(trip.side), trip.symbol, slice,
                                   trip.entry_price, trip.exit_price, trip.pnl);

                    lot.quantity -= slice;
                    remaining -= slice;
                    if (lot.quantity == 0)
                    {
                        lots.pop_front();
                    }
                }

                if (remaining > 0)
                {
                    lots.push_back(OpenLot{fill->symbol, opens, remaining, fill->fill_price,
                                           fill->timestamp, commission_per_share});
                }
            }

            for (const auto &entry : books)
            {
                for (const auto &lot : entry.second)
                {
                    result.open_lots.push_back(lot);
                }
            }
            return result;
        }

        // ===================================================================
        // Aggregation
        // ===================================================================

        TradeStatistics TradeStatisticsAggregator::aggregate(const std::vector<RoundTrip> &round_trips)
        {
            TradeStatistics stats;
            stats.total_trades = static_cast<int>(round_trips.size());
            if (round_trips.empty())
            {
                return stats;
            }

            double gross_gain = 0.0;
            double gross_loss = 0.0;
            double holding_sum = 0.0;

            for (const auto &trip : round_trips)
            {
                stats.net_pnl += trip.pnl;
                holding_sum += trip.holding_days;

                if (trip.pnl > 0.0)
                {
                    ++stats.winning_trades;
                    gross_gain += trip.pnl;
                    stats.largest_win = std::max(stats.largest_win, trip.pnl);
                }
                else
                {
                    ++stats.losing_trades;
                    gross_loss += -trip.pnl;
                    stats.largest_loss = std::min(stats.largest_loss, trip.pnl);
                }
            }

            double n = static_cast<double>(round_trips.size());
            stats.win_rate = static_cast<double>(stats.winning_trades) / n;
            stats.average_holding_days = holding_sum / n;
            if (stats.winning_trades > 0)
            {
                stats.average_win = gross_gain / static_cast<double>(stats.winning_trades);
            }
            if (stats.losing_trades > 0)
            {
                stats.average_loss = -gross_loss / static_cast<double>(stats.losing_trades);
            }

            if (gross_loss > 0.0)
            {
                stats.profit_factor = RatioValue::finite(gross_gain / gross_loss);
            }
            else if (stats.winning_trades > 0)
            {
                stats.profit_factor = RatioValue::positive_infinity();
            }
            return stats;
        }

        TradeStatistics TradeStatisticsAggregator::calculate(const std::vector<Fill> &fills) const
        {
            if (fills.empty())
            {
                logger_->warn("No fills supplied; trade statistics are all zero");
                return TradeStatistics{};
            }

            RoundTripResult matched = match_round_trips(fills);
            TradeStatistics stats = aggregate(matched.round_trips);

            stats.total_fills = static_cast<int>(fills.size());
            stats.open_lots = static_cast<int>(matched.open_lots.size());
            for (const auto &fill : fills)
            {
                stats.total_commission += fill.commission;
            }

            if (matched.round_trips.empty())
            {
                logger_->warn("{} fills produced no completed round trips", fills.size());
            }
            logger_->debug("Trade statistics: {} fills, {} round trips, {} open lots",
                           stats.total_fills, stats.total_trades, stats.open_lots);
            return stats;
        }

    } // namespace analytics
} // namespace perfrisk
