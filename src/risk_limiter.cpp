#include "tradegate/risk_limiter.hpp"

namespace tradegate {

Amount RiskLimiter::current_day_volume(const RateState& state, Timestamp now) noexcept {
    if (now >= state.last_day_reset + limits::SECONDS_PER_DAY) {
        return 0;
    }
    return state.daily_trade_volume;
}

Reason RiskLimiter::check(const RateState& state, Amount amount, uint64_t confidence_bps,
                          Timestamp now) const noexcept {
    if (amount > config_.max_trade_size) {
        return Reason::TRADE_AMOUNT_TOO_LARGE;
    }

    // Cooldown only applies once a trade has been recorded
    bool traded = state.total_trades > 0 || state.last_trade_timestamp > 0;
    if (traded && (now < state.last_trade_timestamp ||
                   now - state.last_trade_timestamp < config_.cooldown_period)) {
        return Reason::COOLDOWN_NOT_MET;
    }

    if (confidence_bps < config_.confidence_threshold_bps) {
        return Reason::CONFIDENCE_TOO_LOW;
    }

    Amount volume = current_day_volume(state, now);
    if (amount > config_.daily_trade_limit || volume > config_.daily_trade_limit - amount) {
        return Reason::DAILY_LIMIT_EXCEEDED;
    }

    return Reason::OK;
}

void RiskLimiter::admit(const RateState& state, Amount amount, uint64_t confidence_bps,
                        Timestamp now) const {
    Reason reason = check(state, amount, confidence_bps, now);
    if (reason != Reason::OK) {
        throw TradeError(reason);
    }
}

void RiskLimiter::commit(RateState& state, Amount amount, Timestamp now) noexcept {
    if (now >= state.last_day_reset + limits::SECONDS_PER_DAY) {
        state.daily_trade_volume = 0;
        state.last_day_reset = now;
    }
    state.daily_trade_volume += amount;
    state.last_trade_timestamp = now;
    ++state.total_trades;
}

} // namespace tradegate
