/**
 * @file drawdown_analysis.cpp
 * @brief Implementation of the DrawdownAnalysis class.
 *
 * The underwater curve is computed against the running peak. Events are
 * identified by tracking transitions into and out of drawdown; the
 * maximum drawdown is located independently from the underwater curve so
 * that its peak and recovery follow the first-occurrence trough.
 */

#include "analytics/drawdown_analysis.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace perfrisk
{
    namespace analytics
    {

        namespace
        {

            CurvePoint point_at(const EquityCurve &curve, int index)
            {
                return CurvePoint{index, curve[index].timestamp, curve[index].value};
            }

            DrawdownEpisode make_episode(const EquityCurve &curve,
                                         int peak_idx,
                                         int trough_idx,
                                         int recovery_idx)
            {
                DrawdownEpisode episode;
                episode.peak = point_at(curve, peak_idx);
                episode.trough = point_at(curve, trough_idx);
                episode.depth = (episode.trough.value - episode.peak.value) / episode.peak.value;
                episode.duration_days = days_between(episode.peak.timestamp, episode.trough.timestamp);
                if (recovery_idx >= 0)
                {
                    episode.recovery = point_at(curve, recovery_idx);
                    episode.recovery_days = days_between(episode.trough.timestamp, episode.recovery->timestamp);
                }
                return episode;
            }

            std::string percent(double fraction, int precision)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(precision) << fraction * 100.0 << "%";
                return oss.str();
            }

        } // anonymous namespace

        // ===================================================================
        // Constructor
        // ===================================================================

        DrawdownAnalysis::DrawdownAnalysis(const EquityCurve &curve, LoggerPtr logger)
            : curve_(curve), logger_(resolve_logger(std::move(logger)))
        {
            validate_equity_curve(curve_);

            compute_underwater_curve();
            locate_max_drawdown();
            identify_events();

            logger_->debug("Drawdown analysis: {} points, {} events, max drawdown {}",
                           curve_.size(), events_.size(), max_episode_.depth);
        }

        // ===================================================================
        // Maximum drawdown
        // ===================================================================

        double DrawdownAnalysis::max_drawdown() const
        {
            return max_episode_.depth;
        }

        const DrawdownEpisode &DrawdownAnalysis::max_drawdown_episode() const
        {
            return max_episode_;
        }

        // ===================================================================
        // Event access
        // ===================================================================

        const std::vector<DrawdownEpisode> &DrawdownAnalysis::all_events() const
        {
            return events_;
        }

        std::vector<DrawdownEpisode> DrawdownAnalysis::top_drawdowns(int n) const
        {
            if (n < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'n', got: " + std::to_string(n));
            }

            std::vector<DrawdownEpisode> sorted_events(events_);
            std::stable_sort(sorted_events.begin(), sorted_events.end(),
                             [](const DrawdownEpisode &a, const DrawdownEpisode &b)
                             {
                                 return a.depth < b.depth; // Deepest first
                             });

            int count = std::min(n, static_cast<int>(sorted_events.size()));
            sorted_events.resize(count);
            return sorted_events;
        }

        int DrawdownAnalysis::event_count() const
        {
            return static_cast<int>(events_.size());
        }

        // ===================================================================
        // Aggregate statistics
        // ===================================================================

        DrawdownSummary DrawdownAnalysis::summary() const
        {
            DrawdownSummary result{};
            result.total_events = static_cast<int>(events_.size());
            result.average_recovery_days = -1.0;

            if (events_.empty())
            {
                return result;
            }

            double sum_depth = 0.0;
            double sum_decline = 0.0;
            double sum_recovery = 0.0;
            int recovery_count = 0;
            int underwater_days = 0;

            for (const auto &event : events_)
            {
                sum_depth += event.depth;
                sum_decline += static_cast<double>(event.duration_days);
                result.max_depth = std::min(result.max_depth, event.depth);
                result.longest_decline_days = std::max(result.longest_decline_days, event.duration_days);

                if (event.recovered())
                {
                    sum_recovery += static_cast<double>(*event.recovery_days);
                    ++recovery_count;
                    result.longest_recovery_days = std::max(result.longest_recovery_days, *event.recovery_days);
                    underwater_days += days_between(event.peak.timestamp, event.recovery->timestamp);
                }
                else
                {
                    underwater_days += days_between(event.peak.timestamp, curve_.back().timestamp);
                }
            }

            double n_events = static_cast<double>(events_.size());
            result.average_depth = sum_depth / n_events;
            result.average_decline_days = sum_decline / n_events;
            if (recovery_count > 0)
            {
                result.average_recovery_days = sum_recovery / static_cast<double>(recovery_count);
            }
            result.unrecovered_count = result.total_events - recovery_count;

            int span_days = days_between(curve_.front().timestamp, curve_.back().timestamp);
            if (span_days > 0)
            {
                result.time_in_drawdown_pct = static_cast<double>(underwater_days) / static_cast<double>(span_days);
            }
            return result;
        }

        const std::vector<double> &DrawdownAnalysis::underwater_curve() const
        {
            return underwater_curve_;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string DrawdownAnalysis::report(int max_events) const
        {
            std::ostringstream oss;
            oss << std::fixed;

            auto sum = summary();

            oss << "Drawdown Analysis Report\n";
            oss << "========================\n\n";

            oss << "Summary:\n";
            oss << "  Total Events:           " << sum.total_events << "\n";
            oss << "  Max Depth:              " << percent(sum.max_depth, 4) << "\n";
            oss << "  Average Depth:          " << percent(sum.average_depth, 4) << "\n";
            oss << "  Avg Decline Duration:   " << std::setprecision(1)
                << sum.average_decline_days << " days\n";
            oss << "  Avg Recovery Duration:  ";
            if (sum.average_recovery_days < 0)
            {
                oss << "N/A\n";
            }
            else
            {
                oss << std::setprecision(1) << sum.average_recovery_days << " days\n";
            }
            oss << "  Unrecovered Events:     " << sum.unrecovered_count << "\n";
            oss << "  Time in Drawdown:       " << percent(sum.time_in_drawdown_pct, 2) << "\n";
            oss << "\n";

            int events_to_show = static_cast<int>(events_.size());
            if (max_events >= 0 && max_events < events_to_show)
            {
                events_to_show = max_events;
            }
            if (events_to_show == 0)
            {
                oss << "No drawdown events.\n";
                return oss.str();
            }

            auto sorted = top_drawdowns(events_to_show);

            oss << "Top " << events_to_show << " Drawdowns:\n";
            oss << "  " << std::left
                << std::setw(6) << "Rank"
                << std::setw(10) << "Depth"
                << std::setw(14) << "Peak Date"
                << std::setw(14) << "Trough Date"
                << std::setw(14) << "Recovery"
                << std::setw(10) << "Decline"
                << std::setw(10) << "Recovery"
                << "\n";
            oss << "  " << std::setw(6) << "" << std::setw(10) << ""
                << std::setw(14) << "" << std::setw(14) << "" << std::setw(14) << "Date"
                << std::setw(10) << "Days" << std::setw(10) << "Days" << "\n";
            oss << "  " << std::string(78, '-') << "\n";

            for (int i = 0; i < static_cast<int>(sorted.size()); ++i)
            {
                const auto &e = sorted[i];
                oss << "  " << std::left
                    << std::setw(6) << (i + 1)
                    << std::setw(10) << percent(e.depth, 2)
                    << std::setw(14) << format_date(e.peak.timestamp)
                    << std::setw(14) << format_date(e.trough.timestamp)
                    << std::setw(14) << (e.recovered() ? format_date(e.recovery->timestamp) : "Unrecovered")
                    << std::setw(10) << e.duration_days;
                if (e.recovered())
                {
                    oss << std::setw(10) << *e.recovery_days;
                }
                else
                {
                    oss << std::setw(10) << "N/A";
                }
                oss << "\n";
            }

            return oss.str();
        }

        // ===================================================================
        // Private helpers
        // ===================================================================

        void DrawdownAnalysis::compute_underwater_curve()
        {
            int n = static_cast<int>(curve_.size());
            underwater_curve_.resize(n);

            double peak = curve_[0].value;
            for (int i = 0; i < n; ++i)
            {
                if (curve_[i].value > peak)
                {
                    peak = curve_[i].value;
                }
                underwater_curve_[i] = (curve_[i].value - peak) / peak;
            }
        }

        void DrawdownAnalysis::locate_max_drawdown()
        {
            int n = static_cast<int>(curve_.size());

            int trough_idx = 0;
            for (int i = 1; i < n; ++i)
            {
                if (underwater_curve_[i] < underwater_curve_[trough_idx])
                {
                    trough_idx = i;
                }
            }

            if (underwater_curve_[trough_idx] >= 0.0)
            {
                // No decline: anchor everything at the final peak.
                int final_peak = 0;
                for (int i = 1; i < n; ++i)
                {
                    if (curve_[i].value >= curve_[final_peak].value)
                    {
                        final_peak = i;
                    }
                }
                max_episode_ = make_episode(curve_, final_peak, final_peak, final_peak);
                max_episode_.depth = 0.0;
                return;
            }

            double peak_value = curve_[0].value;
            for (int i = 1; i <= trough_idx; ++i)
            {
                peak_value = std::max(peak_value, curve_[i].value);
            }

            int peak_idx = 0;
            for (int i = trough_idx; i >= 0; --i)
            {
                if (curve_[i].value == peak_value)
                {
                    peak_idx = i;
                    break;
                }
            }

            int recovery_idx = -1;
            for (int i = trough_idx; i < n; ++i)
            {
                if (curve_[i].value >= curve_[peak_idx].value)
                {
                    recovery_idx = i;
                    break;
                }
            }

            max_episode_ = make_episode(curve_, peak_idx, trough_idx, recovery_idx);
        }

        void DrawdownAnalysis::identify_events()
        {
            int n = static_cast<int>(curve_.size());

            // An event starts when equity drops below the running peak and
            // ends when equity regains it.
            double peak = curve_[0].value;
            int peak_idx = 0;
            bool in_drawdown = false;

            int event_peak_idx = 0;
            int event_trough_idx = 0;

            for (int i = 1; i < n; ++i)
            {
                double value = curve_[i].value;
                if (value >= peak)
                {
                    if (in_drawdown)
                    {
                        events_.push_back(make_episode(curve_, event_peak_idx, event_trough_idx, i));
                        in_drawdown = false;
                    }
                    peak = value;
                    peak_idx = i;
                }
                else if (!in_drawdown)
                {
                    in_drawdown = true;
                    event_peak_idx = peak_idx;
                    event_trough_idx = i;
                }
                else if (value < curve_[event_trough_idx].value)
                {
                    event_trough_idx = i;
                }
            }

            if (in_drawdown)
            {
                events_.push_back(make_episode(curve_, event_peak_idx, event_trough_idx, -1));
            }
        }

    } // namespace analytics
} // namespace perfrisk
