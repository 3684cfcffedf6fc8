/**
 * @file trade_logger.cpp
 * @brief Implementation of the two-phase TradeLogger
 */

#include "backtest/trade_logger.hpp"
#include "core/errors.hpp"
#include "core/time_utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace perfrisk {
namespace backtest {

namespace {

const char* const FIXED_COLUMNS[] = {
    "Trade_ID", "Date", "Bar_Number", "Strategy_State", "Ticker", "Decision", "Decision_Reason",
    "Shares", "Fill_Price", "Position_Value", "Commission",
    "Portfolio_Value_Before", "Portfolio_Value_After", "Cash_Before", "Cash_After",
    "Cumulative_Return_Pct",
    "Allocation_Before", "Allocation_After"};

std::string number(double value)
{
    return fmt::format("{}", value);
}

std::string lookup(const ValueMap& values, const std::string& key)
{
    auto it = values.find(key);
    return it == values.end() ? std::string() : number(it->second);
}

// Whole seconds as format_timestamp, plus ".mmm" or ".uuuuuu" when the
// time carries a sub-second part.
std::string format_trade_time(Timestamp ts)
{
    auto whole = std::chrono::floor<std::chrono::seconds>(ts);
    long long micros = std::chrono::duration_cast<std::chrono::microseconds>(ts - whole).count();
    std::string text = format_timestamp(ts);
    if (micros == 0) return text;
    if (micros % 1000 == 0) return text + fmt::format(".{:03d}", micros / 1000);
    return text + fmt::format(".{:06d}", micros);
}

void write_row(std::ostream& out, const std::vector<std::string>& fields)
{
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out << ',';
        out << escape_csv_field(fields[i]);
    }
    out << '\n';
}

} // namespace

// ===========================================================================
// Free helpers
// ===========================================================================

std::string format_allocation(const std::map<std::string, double>& allocation)
{
    if (allocation.empty()) return "CASH: 100.0%";

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    bool first = true;
    for (const auto& [symbol, pct] : allocation) {
        if (!first) oss << ", ";
        oss << symbol << ": " << pct << "%";
        first = false;
    }
    return oss.str();
}

std::string escape_csv_field(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// ===========================================================================
// TradeLoggerConfig
// ===========================================================================

TradeLoggerConfig TradeLoggerConfig::from_json(const nlohmann::json& j)
{
    TradeLoggerConfig cfg;
    cfg.match_tolerance_seconds = j.value("match_tolerance_seconds", cfg.match_tolerance_seconds);
    cfg.context_expiry_bars = j.value("context_expiry_bars", cfg.context_expiry_bars);
    return cfg;
}

void TradeLoggerConfig::validate() const
{
    if (!(match_tolerance_seconds >= 0.0) || !std::isfinite(match_tolerance_seconds)) {
        throw std::invalid_argument("match_tolerance_seconds must be a non-negative number, got: " +
                                    std::to_string(match_tolerance_seconds));
    }
    if (context_expiry_bars < 0) {
        throw std::invalid_argument("context_expiry_bars must be >= 0, got: " +
                                    std::to_string(context_expiry_bars));
    }
}

// ===========================================================================
// TradeLogger
// ===========================================================================

TradeLogger::TradeLogger(double initial_capital, const TradeLoggerConfig& config, LoggerPtr logger)
    : initial_capital_(initial_capital), config_(config), logger_(resolve_logger(std::move(logger)))
{
    if (!(initial_capital_ > 0.0) || !std::isfinite(initial_capital_)) {
        throw ValidationError("Initial capital must be positive, got: " + std::to_string(initial_capital_));
    }
    config_.validate();
    logger_->info("TradeLogger initialized with initial capital {}", initial_capital_);
}

void TradeLogger::increment_bar()
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++bar_counter_;
    evict_expired_locked();
}

long long TradeLogger::current_bar() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return bar_counter_;
}

void TradeLogger::log_strategy_context(Timestamp timestamp,
                                       const std::string& symbol,
                                       const std::string& strategy_state,
                                       const std::string& decision_reason,
                                       const ValueMap& indicators,
                                       const ValueMap& thresholds)
{
    std::lock_guard<std::mutex> lock(mutex_);

    StrategyContext ctx;
    ctx.timestamp = timestamp;
    ctx.symbol = symbol;
    ctx.bar_number = bar_counter_;
    ctx.strategy_state = strategy_state;
    ctx.decision_reason = decision_reason;
    ctx.indicators = indicators;
    ctx.thresholds = thresholds;

    for (const auto& kv : indicators) indicator_keys_.insert(kv.first);
    for (const auto& kv : thresholds) threshold_keys_.insert(kv.first);

    pending_[symbol].push_back(std::move(ctx));

    logger_->debug("Logged strategy context: bar={}, symbol={}, state={}, {} indicators",
                   bar_counter_, symbol, strategy_state, indicators.size());
}

TradeRecord TradeLogger::log_trade_execution(const Fill& fill,
                                             const PortfolioSnapshot& before,
                                             const PortfolioSnapshot& after)
{
    validate_fill(fill);

    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired_locked();

    TradeRecord record;
    record.trade_id = next_trade_id_++;
    record.date = fill.timestamp;
    record.ticker = fill.symbol;
    record.decision = fill.direction;
    record.shares = fill.quantity;
    record.fill_price = fill.fill_price;
    record.position_value = fill.fill_price * static_cast<double>(fill.quantity);
    record.commission = fill.commission;
    record.before = before;
    record.after = after;
    record.cumulative_return_pct = (after.equity - initial_capital_) / initial_capital_ * 100.0;

    // Closest pending context for the symbol; ties go to the later entry.
    auto bucket = pending_.find(fill.symbol);
    int best = -1;
    double best_gap = std::numeric_limits<double>::infinity();
    if (bucket != pending_.end()) {
        const auto& contexts = bucket->second;
        for (size_t i = 0; i < contexts.size(); ++i) {
            double gap = std::fabs(std::chrono::duration<double>(fill.timestamp - contexts[i].timestamp).count());
            if (gap <= config_.match_tolerance_seconds && gap <= best_gap) {
                best_gap = gap;
                best = static_cast<int>(i);
            }
        }
    }

    if (best >= 0) {
        auto& contexts = bucket->second;
        StrategyContext ctx = std::move(contexts[best]);
        contexts.erase(contexts.begin() + best);
        if (contexts.empty()) pending_.erase(bucket);

        record.bar_number = ctx.bar_number;
        record.strategy_state = std::move(ctx.strategy_state);
        record.decision_reason = std::move(ctx.decision_reason);
        record.indicators = std::move(ctx.indicators);
        record.thresholds = std::move(ctx.thresholds);
        record.context_matched = true;
    } else {
        record.bar_number = bar_counter_;
        record.strategy_state = "Unknown";
        record.decision_reason = "No context available";
        logger_->warn("No strategy context found for {} at {}; trade #{} recorded without context",
                      fill.symbol, format_timestamp(fill.timestamp), record.trade_id);
    }

    records_.push_back(record);

    logger_->info("Trade #{}: {} {} {} @ {}, portfolio value {} -> {}, return {:.2f}%",
                  record.trade_id, to_string(fill.direction), fill.quantity, fill.symbol,
                  fill.fill_price, before.equity, after.equity, record.cumulative_return_pct);
    return record;
}

std::vector<TradeRecord> TradeLogger::records() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::vector<TradeRecord> TradeLogger::records_for_symbol(const std::string& symbol) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TradeRecord> out;
    for (const auto& r : records_) {
        if (r.ticker == symbol) out.push_back(r);
    }
    return out;
}

int TradeLogger::num_records() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(records_.size());
}

std::size_t TradeLogger::pending_context_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : pending_) count += entry.second.size();
    return count;
}

long long TradeLogger::evicted_context_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_count_;
}

TradeLogSummary TradeLogger::summary() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    TradeLogSummary s;
    s.total_records = static_cast<int>(records_.size());
    for (const auto& r : records_) {
        if (r.context_matched) ++s.matched_records;
        else ++s.unmatched_records;

        if (r.decision == Direction::BUY) ++s.buy_records;
        else ++s.sell_records;

        s.total_commission += r.commission;
    }
    for (const auto& entry : pending_) s.pending_contexts += static_cast<int>(entry.second.size());
    s.evicted_contexts = evicted_count_;
    return s;
}

std::vector<std::string> TradeLogger::export_columns() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return export_columns_locked();
}

void TradeLogger::export_to_csv(const std::string& filepath, const FooterRows& footer) const
{
    std::vector<TradeRecord> rows;
    std::vector<std::string> columns;
    std::vector<std::string> indicator_keys;
    std::vector<std::string> threshold_keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (records_.empty()) {
            throw ValidationError("Cannot export: no trade records available");
        }
        rows = records_;
        columns = export_columns_locked();
        indicator_keys.assign(indicator_keys_.begin(), indicator_keys_.end());
        threshold_keys.assign(threshold_keys_.begin(), threshold_keys_.end());
    }

    std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Could not create directory " + path.parent_path().string() +
                                     ": " + ec.message());
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    write_row(file, columns);

    for (const auto& r : rows) {
        std::vector<std::string> fields;
        fields.reserve(columns.size());
        fields.push_back(std::to_string(r.trade_id));
        fields.push_back(format_trade_time(r.date));
        fields.push_back(std::to_string(r.bar_number));
        fields.push_back(r.strategy_state);
        fields.push_back(r.ticker);
        fields.push_back(to_string(r.decision));
        fields.push_back(r.decision_reason);
        fields.push_back(std::to_string(r.shares));
        fields.push_back(number(r.fill_price));
        fields.push_back(number(r.position_value));
        fields.push_back(number(r.commission));
        fields.push_back(number(r.before.equity));
        fields.push_back(number(r.after.equity));
        fields.push_back(number(r.before.cash));
        fields.push_back(number(r.after.cash));
        fields.push_back(number(r.cumulative_return_pct));
        fields.push_back(format_allocation(r.before.allocation));
        fields.push_back(format_allocation(r.after.allocation));
        for (const auto& key : indicator_keys) fields.push_back(lookup(r.indicators, key));
        for (const auto& key : threshold_keys) fields.push_back(lookup(r.thresholds, key));
        write_row(file, fields);
    }

    if (!footer.empty()) {
        file << '\n' << "Summary Statistics:" << '\n';
        for (const auto& [label, value] : footer) {
            write_row(file, {label, value});
        }
    }

    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing trade log to " + filepath);
    }

    logger_->info("Exported {} trade records ({} columns) to {}", rows.size(), columns.size(), filepath);
}

void TradeLogger::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    pending_.clear();
    indicator_keys_.clear();
    threshold_keys_.clear();
    next_trade_id_ = 1;
    bar_counter_ = 0;
    evicted_count_ = 0;
}

// ===========================================================================
// Private helpers
// ===========================================================================

void TradeLogger::evict_expired_locked()
{
    if (config_.context_expiry_bars == 0) return;

    long long evicted = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        auto& contexts = it->second;
        for (auto ctx = contexts.begin(); ctx != contexts.end();) {
            if (bar_counter_ - ctx->bar_number > config_.context_expiry_bars) {
                ctx = contexts.erase(ctx);
                ++evicted;
            } else {
                ++ctx;
            }
        }
        if (contexts.empty()) it = pending_.erase(it);
        else ++it;
    }

    if (evicted > 0) {
        evicted_count_ += evicted;
        logger_->warn("Evicted {} unmatched strategy contexts older than {} bars (bar {})",
                      evicted, config_.context_expiry_bars, bar_counter_);
    }
}

std::vector<std::string> TradeLogger::export_columns_locked() const
{
    std::vector<std::string> columns(std::begin(FIXED_COLUMNS), std::end(FIXED_COLUMNS));
    for (const auto& key : indicator_keys_) columns.push_back("Indicator_" + key);
    for (const auto& key : threshold_keys_) columns.push_back("Threshold_" + key);
    return columns;
}

} // namespace backtest
} // namespace perfrisk
