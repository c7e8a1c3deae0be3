#ifndef TRADEGATE_AUTHORIZER_HPP
#define TRADEGATE_AUTHORIZER_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "access.hpp"
#include "clock.hpp"
#include "compliance.hpp"
#include "config.hpp"
#include "custody.hpp"
#include "emergency.hpp"
#include "errors.hpp"
#include "feed.hpp"
#include "price_gateway.hpp"
#include "risk_limiter.hpp"
#include "single_flight.hpp"
#include "types.hpp"

namespace tradegate {

class EventListener;

// =============================================================================
// Results
// =============================================================================

struct TradeResult {
    uint64_t sequence = 0;      // total_trades once this trade was admitted
    PriceSnapshot price;
    ExecutionReceipt receipt;
};

struct Eligibility {
    bool allowed = false;
    Reason reason = Reason::OK;
    std::string message;
};

struct BatchElement {
    size_t index = 0;
    Amount amount_in = 0;
    bool skipped = false;        // zero amount
    bool executed = false;
    Reason reason = Reason::OK;  // gate rejection, OK otherwise
    std::string error;           // rejection or custody failure message
    std::optional<TradeResult> result;
};

struct BatchResult {
    std::vector<BatchElement> elements;
    size_t executed = 0;
    size_t failed = 0;
};

struct TradingStats {
    uint64_t total_trades = 0;
    uint64_t successful_trades = 0;
    uint64_t success_rate_bps = 0;  // 0 without trades
};

// =============================================================================
// TradeAuthorizer - gate orchestration, bookkeeping and custody hand-off
// =============================================================================

// Gate order for every trade: emergency/pause, risk admission, price
// staleness and threshold, eco score, then commit and custody execution.
// A custody failure restores the pre-commit state and rethrows.
class TradeAuthorizer {
public:
    TradeAuthorizer(const AgentConfig& config, const Clock& clock,
                    std::shared_ptr<DataFeed> price_feed, Custody& custody,
                    EventListener* events = nullptr);

    // Non-copyable
    TradeAuthorizer(const TradeAuthorizer&) = delete;
    TradeAuthorizer& operator=(const TradeAuthorizer&) = delete;

    // =========================================================================
    // Trading (SIGNAL)
    // =========================================================================

    TradeResult trigger_trade(const Actor& caller, Amount amount_in, Amount amount_out_min,
                              Timestamp deadline, uint64_t confidence_bps);

    // Up to 10 elements. The summed amount is admitted once, then each
    // non-zero element is authorized on its own; settled elements stay
    // settled when a later one fails.
    BatchResult trigger_batch_trade(const Actor& caller, const std::vector<Amount>& amounts_in,
                                    const std::vector<Amount>& amounts_out_min,
                                    Timestamp deadline, uint64_t confidence_bps);

    // Full trade path for a caller that already holds the single-flight
    TradeResult execute_in_flight(const SingleFlight::Flight& flight, Amount amount_in,
                                  Amount amount_out_min, Timestamp deadline,
                                  uint64_t confidence_bps, bool from_prediction);

    // =========================================================================
    // Views
    // =========================================================================

    // Same checks as trigger_trade, no mutation and no events
    Eligibility can_trade(Amount amount_in, uint64_t confidence_bps) const;

    // Fresh, validated oracle price; the basis is left untouched
    PriceSnapshot get_latest_price() const;

    Price last_valid_price() const { return price_.last_valid_price(); }
    uint64_t eco_score() const noexcept { return eco_.score(clock_.now()); }

    TradingStats trading_stats() const;
    RateState rate_state() const;
    TradingConfig config() const;
    Path path() const;
    uint64_t consecutive_failures() const noexcept {
        return consecutive_failures_.load(std::memory_order_acquire);
    }

    // =========================================================================
    // Administration (ADMIN)
    // =========================================================================

    void update_config(const Actor& caller, const TradingConfig& config);
    void set_price_threshold(const Actor& caller, Price threshold);
    void set_target_asset(const Actor& caller, const Address& asset);
    void set_price_feed(const Actor& caller, std::shared_ptr<DataFeed> feed);
    void set_eco_feed(const Actor& caller, std::shared_ptr<DataFeed> feed);

    // =========================================================================
    // Emergency (halt: EMERGENCY, resume: ADMIN)
    // =========================================================================

    void emergency_stop(const Actor& caller, const std::string& reason);
    void resume_trading(const Actor& caller);
    void pause(const Actor& caller);
    void unpause(const Actor& caller);

    // =========================================================================
    // Collaborators
    // =========================================================================

    AccessControl& access() { return access_; }
    const AccessControl& access() const { return access_; }
    const EmergencyControl& emergency() const { return emergency_; }
    SingleFlight& single_flight() { return flight_; }
    const Clock& clock() const { return clock_; }
    EventListener* events() const { return events_; }

private:
    // Steps after admission; `admit` is false for batch elements
    TradeResult authorize(Amount amount_in, Amount amount_out_min, Timestamp deadline,
                          uint64_t confidence_bps, bool admit, bool from_prediction);

    // Price threshold and eco score against `cfg`, emitting events when `notify`
    Reason check_gates(const PriceSnapshot& snapshot, const TradingConfig& cfg, Timestamp now,
                       bool notify) const;

    void apply_config(const Actor& caller, const TradingConfig& config);

    const Clock& clock_;
    Custody& custody_;
    EventListener* events_;

    AccessControl access_;
    EmergencyControl emergency_;
    PriceGateway price_;
    EcoGate eco_;
    SingleFlight flight_;

    mutable std::shared_mutex state_mutex_;
    TradingConfig config_;
    RiskLimiter risk_;
    RateState state_;
    Address source_asset_;
    Address target_asset_;

    std::atomic<uint64_t> consecutive_failures_{0};
};

} // namespace tradegate

#endif // TRADEGATE_AUTHORIZER_HPP
