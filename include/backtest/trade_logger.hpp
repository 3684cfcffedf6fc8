#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/logging.hpp"
#include "core/types.hpp"

namespace perfrisk {
namespace backtest {

/// Dynamic indicator or threshold values keyed by name.
using ValueMap = std::map<std::string, double>;

/// (label, value) rows appended below the exported trade table.
using FooterRows = std::vector<std::pair<std::string, std::string>>;

struct TradeLoggerConfig {
    double match_tolerance_seconds = 60.0; ///< Max |fill time - context time| for a match
    int context_expiry_bars = 50;          ///< Bars a context may stay pending (0 = never expire)

    static TradeLoggerConfig from_json(const nlohmann::json& j);
    void validate() const;
};

/// Portfolio state captured immediately before or after a fill.
struct PortfolioSnapshot {
    double equity = 0.0;
    double cash = 0.0;
    std::map<std::string, double> allocation; ///< symbol -> percent of equity (0-100)
};

/// Strategy state logged at decision time, waiting for its fill.
struct StrategyContext {
    Timestamp timestamp;
    std::string symbol;
    long long bar_number = 0;
    std::string strategy_state;
    std::string decision_reason;
    ValueMap indicators;
    ValueMap thresholds;
};

/// A fill merged with its strategy context and the portfolio snapshots.
struct TradeRecord {
    int trade_id = 0;
    Timestamp date;
    long long bar_number = 0;
    std::string strategy_state;
    std::string ticker;
    Direction decision = Direction::BUY;
    std::string decision_reason;
    ValueMap indicators;
    ValueMap thresholds;

    long long shares = 0;
    double fill_price = 0.0;
    double position_value = 0.0; ///< shares * fill_price
    double commission = 0.0;

    PortfolioSnapshot before;
    PortfolioSnapshot after;
    double cumulative_return_pct = 0.0; ///< (after.equity - initial) / initial * 100

    bool context_matched = false;
};

struct TradeLogSummary {
    int total_records = 0;
    int matched_records = 0;
    int unmatched_records = 0;
    int buy_records = 0;
    int sell_records = 0;
    double total_commission = 0.0;
    int pending_contexts = 0;
    long long evicted_contexts = 0;
};

/**
 * Two-phase trade audit log.
 *
 * Decision logic calls log_strategy_context() when it decides to trade;
 * execution logic calls log_trade_execution() once the fill is known. The
 * fill is merged with the closest pending context of the same symbol
 * within the match tolerance (ties go to the most recently logged one).
 * A fill with no match is still recorded, with "Unknown" state.
 *
 * Pending contexts that fall more than context_expiry_bars behind the bar
 * counter are evicted. All operations are serialized by one mutex.
 */
class TradeLogger {
public:
    explicit TradeLogger(double initial_capital,
                         const TradeLoggerConfig& config = TradeLoggerConfig(),
                         LoggerPtr logger = nullptr);

    void increment_bar();
    long long current_bar() const;

    void log_strategy_context(Timestamp timestamp,
                              const std::string& symbol,
                              const std::string& strategy_state,
                              const std::string& decision_reason,
                              const ValueMap& indicators,
                              const ValueMap& thresholds);

    /// Returns a copy of the record that was appended.
    TradeRecord log_trade_execution(const Fill& fill,
                                    const PortfolioSnapshot& before,
                                    const PortfolioSnapshot& after);

    std::vector<TradeRecord> records() const;
    std::vector<TradeRecord> records_for_symbol(const std::string& symbol) const;
    int num_records() const;
    std::size_t pending_context_count() const;
    long long evicted_context_count() const;
    TradeLogSummary summary() const;

    /// Header of the CSV export: fixed columns, then Indicator_*, then Threshold_*.
    std::vector<std::string> export_columns() const;

    /**
     * Write all records as CSV, creating parent directories as needed.
     * Dates are "YYYY-MM-DD HH:MM:SS", with a ".mmm" (or ".uuuuuu")
     * fraction when the fill time is not on a whole second.
     * A non-empty footer is appended after a blank line and a
     * "Summary Statistics:" line.
     *
     * Throws ValidationError when there are no records and
     * std::runtime_error when the file cannot be written.
     */
    void export_to_csv(const std::string& filepath, const FooterRows& footer = {}) const;

    void clear();

    double initial_capital() const { return initial_capital_; }
    const TradeLoggerConfig& config() const { return config_; }

private:
    void evict_expired_locked();
    std::vector<std::string> export_columns_locked() const;

    double initial_capital_;
    TradeLoggerConfig config_;
    LoggerPtr logger_;

    mutable std::mutex mutex_;
    long long bar_counter_ = 0;
    int next_trade_id_ = 1;
    long long evicted_count_ = 0;
    std::map<std::string, std::vector<StrategyContext>> pending_; ///< Per symbol, in logging order
    std::vector<TradeRecord> records_;
    std::set<std::string> indicator_keys_;
    std::set<std::string> threshold_keys_;
};

/// "AAA: 60.0%, CASH: 40.0%"; an empty allocation is "CASH: 100.0%".
std::string format_allocation(const std::map<std::string, double>& allocation);

/// Quote a CSV field if it contains a comma, quote or line break.
std::string escape_csv_field(const std::string& field);

} // namespace backtest
} // namespace perfrisk
