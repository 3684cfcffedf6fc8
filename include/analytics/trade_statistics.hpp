/**
 * @file trade_statistics.hpp
 * @brief Round-trip reconstruction and trade-level statistics from fills.
 *
 * Fills are grouped per symbol and matched first-in-first-out in
 * timestamp order (stable for equal timestamps). A BUY first closes open
 * short lots, and any remainder opens a long lot; a SELL first closes open
 * long lots, and any remainder opens a short lot. Every closed slice is a
 * RoundTrip. Each fill's commission is spread over its shares, so a slice
 * carries the entry and exit commission of exactly the shares it covers.
 */

#ifndef PERFRISK_ANALYTICS_TRADE_STATISTICS_HPP
#define PERFRISK_ANALYTICS_TRADE_STATISTICS_HPP

#include "core/logging.hpp"
#include "core/ratio_value.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace perfrisk
{
    namespace analytics
    {

        /**
         * @enum PositionSide
         * @brief Direction of an open lot or completed round trip.
         */
        enum class PositionSide
        {
            LONG,
            SHORT
        };

        /** @brief "LONG" or "SHORT". */
        std::string to_string(PositionSide side);

        /**
         * @struct RoundTrip
         * @brief A matched entry/exit slice.
         */
        struct RoundTrip
        {
            std::string symbol;
            PositionSide side;
            long long quantity;
            double entry_price;
            double exit_price;
            Timestamp entry_time;
            Timestamp exit_time;
            double pnl;          ///< Realized P&L net of entry and exit commission shares
            double return_pct;   ///< pnl / (entry_price * quantity)
            double holding_days; ///< Fractional calendar days from entry to exit
        };

        /**
         * @struct OpenLot
         * @brief Quantity still open after all fills were matched.
         */
        struct OpenLot
        {
            std::string symbol;
            PositionSide side;
            long long quantity;
            double entry_price;
            Timestamp entry_time;
            double commission_per_share; ///< Entry commission carried by each share
        };

        /**
         * @struct TradeStatistics
         * @brief Trade-level performance summary.
         *
         * Losses include break-even round trips (pnl <= 0). Average and
         * largest loss are reported as non-positive numbers.
         */
        struct TradeStatistics
        {
            int total_fills = 0;
            int total_trades = 0; ///< Completed round trips
            int winning_trades = 0;
            int losing_trades = 0;
            double win_rate = 0.0;
            RatioValue profit_factor;
            double average_win = 0.0;
            double average_loss = 0.0;
            double largest_win = 0.0;
            double largest_loss = 0.0;
            double average_holding_days = 0.0;
            double total_commission = 0.0;
            double net_pnl = 0.0; ///< Sum of round-trip P&L
            int open_lots = 0;
        };

        /**
         * @struct RoundTripResult
         * @brief Output of FIFO matching.
         */
        struct RoundTripResult
        {
            std::vector<RoundTrip> round_trips; ///< In order of closing fill
            std::vector<OpenLot> open_lots;     ///< Grouped by symbol, FIFO order
        };

        /**
         * @class TradeStatisticsAggregator
         * @brief Builds round trips from fills and aggregates them.
         *
         * Usage:
         * @code
         *   TradeStatisticsAggregator aggregator;
         *   TradeStatistics stats = aggregator.calculate(fills);
         * @endcode
         */
        class TradeStatisticsAggregator
        {
        public:
            explicit TradeStatisticsAggregator(LoggerPtr logger = nullptr);

            /**
             * @brief FIFO-match fills into round trips.
             * @throws ValidationError If any fill is malformed.
             */
            RoundTripResult match_round_trips(const std::vector<Fill> &fills) const;

            /**
             * @brief Aggregate statistics for a fill list.
             *
             * Zero fills or zero completed round trips yield an all-zero
             * block rather than an error.
             *
             * @throws ValidationError If any fill is malformed.
             */
            TradeStatistics calculate(const std::vector<Fill> &fills) const;

            /** @brief Aggregate statistics for already matched round trips. */
            static TradeStatistics aggregate(const std::vector<RoundTrip> &round_trips);

        private:
            LoggerPtr logger_;
        };

    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_TRADE_STATISTICS_HPP
