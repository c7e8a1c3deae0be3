#ifndef TRADEGATE_EVENTS_HPP
#define TRADEGATE_EVENTS_HPP

#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace tradegate {

// =============================================================================
// Event Payloads
// =============================================================================

struct TradeTriggered {
    uint64_t sequence;         // total_trades after admission
    Amount amount_in;
    Amount amount_out_min;
    Amount amount_out;
    Price price;
    uint64_t confidence_bps;
    Timestamp timestamp;
    bool from_prediction;
};

struct PriceChecked {
    Price price;
    Price threshold;
    bool valid;
    Timestamp timestamp;
};

// Soft circuit breaker: the read is flagged, not blocked
struct PriceDeviation {
    Price previous;
    Price current;
    uint64_t deviation_bps;
};

struct ConfigUpdated {
    TradingConfig old_config;
    TradingConfig new_config;
    Actor by;
};

struct EmergencyActivated {
    Actor by;
    std::string reason;
    Timestamp timestamp;
};

struct EmergencyDeactivated {
    Actor by;
    Timestamp timestamp;
};

struct PauseChanged {
    Actor by;
    bool paused;
};

struct ComplianceValidated {
    RequestId request_id;
    Price predicted_price;
    bool approved;
};

struct EcoScoreChecked {
    uint64_t score;
    uint64_t threshold;
    bool passed;
};

struct PredictionRequested {
    RequestId request_id;
    Price price_at_request;
    Timestamp timestamp;
};

struct PredictionFulfilled {
    RequestId request_id;
    Price predicted_price;
    uint64_t confidence_bps;
    bool is_anomaly;
};

struct RewardMinted {
    uint64_t token_id;
    RequestId request_id;
    uint64_t confidence_bps;
};

struct PendingRequestReset {
    RequestId request_id;
    Actor by;
    uint64_t age;
};

struct PredictionStalled {
    RequestId request_id;
    uint64_t age;
};

struct ExecutionFailed {
    Amount amount_in;
    std::string reason;
    uint64_t consecutive_failures;
};

// =============================================================================
// Listener Interface
// =============================================================================

// Callback interface for engine notifications. All hooks default to no-ops.
class EventListener {
public:
    virtual ~EventListener() = default;

    virtual void on_trade_triggered(const TradeTriggered&) {}
    virtual void on_price_checked(const PriceChecked&) {}
    virtual void on_price_deviation(const PriceDeviation&) {}
    virtual void on_config_updated(const ConfigUpdated&) {}
    virtual void on_emergency_activated(const EmergencyActivated&) {}
    virtual void on_emergency_deactivated(const EmergencyDeactivated&) {}
    virtual void on_pause_changed(const PauseChanged&) {}
    virtual void on_compliance_validated(const ComplianceValidated&) {}
    virtual void on_eco_score_checked(const EcoScoreChecked&) {}
    virtual void on_prediction_requested(const PredictionRequested&) {}
    virtual void on_prediction_fulfilled(const PredictionFulfilled&) {}
    virtual void on_reward_minted(const RewardMinted&) {}
    virtual void on_pending_request_reset(const PendingRequestReset&) {}
    virtual void on_prediction_stalled(const PredictionStalled&) {}
    virtual void on_execution_failed(const ExecutionFailed&) {}
};

// =============================================================================
// EventSink - fans every event out to the registered listeners
// =============================================================================

class EventSink : public EventListener {
public:
    // Listeners are not owned and must outlive the sink
    void add_listener(EventListener* listener);
    void remove_listener(EventListener* listener);

    void on_trade_triggered(const TradeTriggered& e) override;
    void on_price_checked(const PriceChecked& e) override;
    void on_price_deviation(const PriceDeviation& e) override;
    void on_config_updated(const ConfigUpdated& e) override;
    void on_emergency_activated(const EmergencyActivated& e) override;
    void on_emergency_deactivated(const EmergencyDeactivated& e) override;
    void on_pause_changed(const PauseChanged& e) override;
    void on_compliance_validated(const ComplianceValidated& e) override;
    void on_eco_score_checked(const EcoScoreChecked& e) override;
    void on_prediction_requested(const PredictionRequested& e) override;
    void on_prediction_fulfilled(const PredictionFulfilled& e) override;
    void on_reward_minted(const RewardMinted& e) override;
    void on_pending_request_reset(const PendingRequestReset& e) override;
    void on_prediction_stalled(const PredictionStalled& e) override;
    void on_execution_failed(const ExecutionFailed& e) override;

private:
    template <typename Fn>
    void dispatch(Fn&& fn) const;

    mutable std::mutex mutex_;
    std::vector<EventListener*> listeners_;
};

// Writes every event to the default spdlog logger
class LogEventListener : public EventListener {
public:
    void on_trade_triggered(const TradeTriggered& e) override;
    void on_price_checked(const PriceChecked& e) override;
    void on_price_deviation(const PriceDeviation& e) override;
    void on_config_updated(const ConfigUpdated& e) override;
    void on_emergency_activated(const EmergencyActivated& e) override;
    void on_emergency_deactivated(const EmergencyDeactivated& e) override;
    void on_pause_changed(const PauseChanged& e) override;
    void on_compliance_validated(const ComplianceValidated& e) override;
    void on_eco_score_checked(const EcoScoreChecked& e) override;
    void on_prediction_requested(const PredictionRequested& e) override;
    void on_prediction_fulfilled(const PredictionFulfilled& e) override;
    void on_reward_minted(const RewardMinted& e) override;
    void on_pending_request_reset(const PendingRequestReset& e) override;
    void on_prediction_stalled(const PredictionStalled& e) override;
    void on_execution_failed(const ExecutionFailed& e) override;
};

} // namespace tradegate

#endif // TRADEGATE_EVENTS_HPP
