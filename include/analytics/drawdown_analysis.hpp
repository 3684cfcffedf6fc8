/**
 * @file drawdown_analysis.hpp
 * @brief Drawdown reconstruction for an equity curve.
 *
 * Locates the maximum drawdown (peak, trough and recovery) and decomposes
 * the curve into every drawdown event, with the top-N deepest events,
 * aggregate statistics and a text report.
 *
 * A drawdown event is a contiguous period where equity is below a prior
 * peak. Each event has a peak, a trough and an optional recovery point.
 * Depths are non-positive fractions (-0.15 means 15% below the peak) and
 * durations are calendar days.
 */

#ifndef PERFRISK_ANALYTICS_DRAWDOWN_ANALYSIS_HPP
#define PERFRISK_ANALYTICS_DRAWDOWN_ANALYSIS_HPP

#include "core/logging.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace perfrisk
{
    namespace analytics
    {

        /**
         * @struct CurvePoint
         * @brief A point of the equity curve referenced by a drawdown.
         */
        struct CurvePoint
        {
            int index;           ///< Position in the equity curve
            Timestamp timestamp; ///< Observation time
            double value;        ///< Equity value
        };

        /**
         * @struct DrawdownEpisode
         * @brief One peak-to-trough-to-recovery cycle.
         *
         * If the curve never regains the peak value, recovery and
         * recovery_days are empty.
         */
        struct DrawdownEpisode
        {
            CurvePoint peak;
            CurvePoint trough;
            std::optional<CurvePoint> recovery;

            double depth;                     ///< (trough - peak) / peak, always <= 0
            int duration_days;                ///< Calendar days from peak to trough
            std::optional<int> recovery_days; ///< Calendar days from trough to recovery

            bool recovered() const { return recovery.has_value(); }
        };

        /**
         * @struct DrawdownSummary
         * @brief Aggregate statistics across all drawdown events.
         */
        struct DrawdownSummary
        {
            int total_events;             ///< Number of distinct drawdown events
            double average_depth;         ///< Mean depth across events (<= 0)
            double max_depth;             ///< Deepest event (<= 0)
            double average_decline_days;  ///< Mean calendar days from peak to trough
            double average_recovery_days; ///< Mean recovery days of recovered events (-1 if none)
            int longest_decline_days;     ///< Longest peak-to-trough duration
            int longest_recovery_days;    ///< Longest trough-to-recovery duration
            int unrecovered_count;        ///< Events still under water at the end
            double time_in_drawdown_pct;  ///< Fraction of the calendar span spent under water
        };

        /**
         * @class DrawdownAnalysis
         * @brief Maximum drawdown and drawdown event decomposition.
         *
         * Usage:
         * @code
         *   DrawdownAnalysis analysis(curve);
         *   double mdd = analysis.max_drawdown();
         *   auto top5 = analysis.top_drawdowns(5);
         *   auto summary = analysis.summary();
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class DrawdownAnalysis
        {
        public:
            /**
             * @brief Analyze an equity curve.
             * @param curve Equity curve with at least one point.
             * @param logger Logger (default logger if null).
             * @throws ValidationError If the curve is empty, contains a
             *         non-positive value or timestamps that do not strictly increase.
             */
            explicit DrawdownAnalysis(const EquityCurve &curve, LoggerPtr logger = nullptr);

            // ---------------------------------------------------------------
            // Maximum drawdown
            // ---------------------------------------------------------------

            /** @brief Deepest drawdown as a non-positive fraction (0 if none). */
            double max_drawdown() const;

            /**
             * @brief The episode containing the maximum drawdown.
             *
             * Peak is the last point at the running maximum before the
             * trough; recovery is the first later point at or above the peak
             * value. A curve that never declines reports depth 0 with peak,
             * trough and recovery all at the final peak.
             */
            const DrawdownEpisode &max_drawdown_episode() const;

            // ---------------------------------------------------------------
            // Event access
            // ---------------------------------------------------------------

            /** @brief All drawdown events in chronological order. */
            const std::vector<DrawdownEpisode> &all_events() const;

            /**
             * @brief The @p n deepest events, deepest first.
             * @throws std::invalid_argument If n < 1.
             */
            std::vector<DrawdownEpisode> top_drawdowns(int n) const;

            int event_count() const;

            // ---------------------------------------------------------------
            // Aggregate statistics
            // ---------------------------------------------------------------

            DrawdownSummary summary() const;

            /**
             * @brief Drawdown from the running peak at each point.
             *
             * Values are non-positive; 0.0 means at a new high.
             */
            const std::vector<double> &underwater_curve() const;

            /**
             * @brief Formatted report of the summary and the deepest events.
             * @param max_events Maximum number of events to list (-1 for all).
             */
            std::string report(int max_events = -1) const;

        private:
            void compute_underwater_curve();
            void locate_max_drawdown();
            void identify_events();

            EquityCurve curve_;
            std::vector<double> underwater_curve_;
            std::vector<DrawdownEpisode> events_;
            DrawdownEpisode max_episode_;
            LoggerPtr logger_;
        };

    } // namespace analytics
} // namespace perfrisk

#endif // PERFRISK_ANALYTICS_DRAWDOWN_ANALYSIS_HPP
