#ifndef TRADEGATE_RISK_LIMITER_HPP
#define TRADEGATE_RISK_LIMITER_HPP

#include "config.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace tradegate {

// =============================================================================
// Rate State
// =============================================================================

struct RateState {
    Timestamp last_trade_timestamp = 0;
    Amount daily_trade_volume = 0;
    Timestamp last_day_reset = 0;
    uint64_t total_trades = 0;
    uint64_t successful_trades = 0;

    bool operator==(const RateState& other) const {
        return last_trade_timestamp == other.last_trade_timestamp &&
               daily_trade_volume == other.daily_trade_volume &&
               last_day_reset == other.last_day_reset &&
               total_trades == other.total_trades &&
               successful_trades == other.successful_trades;
    }
};

// =============================================================================
// RiskLimiter - size cap, cooldown, confidence floor, daily volume
// =============================================================================

class RiskLimiter {
public:
    explicit RiskLimiter(const TradingConfig& config) : config_(config) {}

    // Evaluated in order: size, cooldown, confidence, daily volume.
    // Pure: the state is never touched.
    Reason check(const RateState& state, Amount amount, uint64_t confidence_bps,
                 Timestamp now) const noexcept;

    // Same as check(), throws TradeError on rejection
    void admit(const RateState& state, Amount amount, uint64_t confidence_bps,
               Timestamp now) const;

    // Daily volume as seen at `now`: zero once the 24h window has elapsed
    static Amount current_day_volume(const RateState& state, Timestamp now) noexcept;

    // Rolls the day if due, adds the volume, stamps the trade, counts it
    static void commit(RateState& state, Amount amount, Timestamp now) noexcept;

    static void record_success(RateState& state) noexcept { ++state.successful_trades; }

    const TradingConfig& config() const { return config_; }
    void set_config(const TradingConfig& config) { config_ = config; }

private:
    TradingConfig config_;
};

} // namespace tradegate

#endif // TRADEGATE_RISK_LIMITER_HPP
