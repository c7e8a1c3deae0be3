#include "tradegate/events.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace tradegate {

// =============================================================================
// EventSink
// =============================================================================

void EventSink::add_listener(EventListener* listener) {
    if (listener == nullptr || listener == this) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void EventSink::remove_listener(EventListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

template <typename Fn>
void EventSink::dispatch(Fn&& fn) const {
    std::vector<EventListener*> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = listeners_;
    }
    for (auto* listener : snapshot) {
        fn(*listener);
    }
}

void EventSink::on_trade_triggered(const TradeTriggered& e) {
    dispatch([&](EventListener& l) { l.on_trade_triggered(e); });
}

void EventSink::on_price_checked(const PriceChecked& e) {
    dispatch([&](EventListener& l) { l.on_price_checked(e); });
}

void EventSink::on_price_deviation(const PriceDeviation& e) {
    dispatch([&](EventListener& l) { l.on_price_deviation(e); });
}

void EventSink::on_config_updated(const ConfigUpdated& e) {
    dispatch([&](EventListener& l) { l.on_config_updated(e); });
}

void EventSink::on_emergency_activated(const EmergencyActivated& e) {
    dispatch([&](EventListener& l) { l.on_emergency_activated(e); });
}

void EventSink::on_emergency_deactivated(const EmergencyDeactivated& e) {
    dispatch([&](EventListener& l) { l.on_emergency_deactivated(e); });
}

void EventSink::on_pause_changed(const PauseChanged& e) {
    dispatch([&](EventListener& l) { l.on_pause_changed(e); });
}

void EventSink::on_compliance_validated(const ComplianceValidated& e) {
    dispatch([&](EventListener& l) { l.on_compliance_validated(e); });
}

void EventSink::on_eco_score_checked(const EcoScoreChecked& e) {
    dispatch([&](EventListener& l) { l.on_eco_score_checked(e); });
}

void EventSink::on_prediction_requested(const PredictionRequested& e) {
    dispatch([&](EventListener& l) { l.on_prediction_requested(e); });
}

void EventSink::on_prediction_fulfilled(const PredictionFulfilled& e) {
    dispatch([&](EventListener& l) { l.on_prediction_fulfilled(e); });
}

void EventSink::on_reward_minted(const RewardMinted& e) {
    dispatch([&](EventListener& l) { l.on_reward_minted(e); });
}

void EventSink::on_pending_request_reset(const PendingRequestReset& e) {
    dispatch([&](EventListener& l) { l.on_pending_request_reset(e); });
}

void EventSink::on_prediction_stalled(const PredictionStalled& e) {
    dispatch([&](EventListener& l) { l.on_prediction_stalled(e); });
}

void EventSink::on_execution_failed(const ExecutionFailed& e) {
    dispatch([&](EventListener& l) { l.on_execution_failed(e); });
}

// =============================================================================
// LogEventListener
// =============================================================================

void LogEventListener::on_trade_triggered(const TradeTriggered& e) {
    spdlog::info("Trade #{} executed: in={} out={} (min {}) price={} confidence={}bps{}",
                 e.sequence, format_units(e.amount_in), format_units(e.amount_out),
                 format_units(e.amount_out_min), to_string(e.price), e.confidence_bps,
                 e.from_prediction ? " [prediction]" : "");
}

void LogEventListener::on_price_checked(const PriceChecked& e) {
    spdlog::debug("Price checked: {} vs threshold {} -> {}", to_string(e.price),
                  to_string(e.threshold), e.valid ? "valid" : "below threshold");
}

void LogEventListener::on_price_deviation(const PriceDeviation& e) {
    spdlog::warn("Price deviation {}bps: {} -> {}", e.deviation_bps,
                 to_string(e.previous), to_string(e.current));
}

void LogEventListener::on_config_updated(const ConfigUpdated& e) {
    spdlog::info("Config updated by {}: threshold {} -> {}, max trade {} -> {}, daily {} -> {}",
                 e.by, to_string(e.old_config.price_threshold),
                 to_string(e.new_config.price_threshold),
                 format_units(e.old_config.max_trade_size),
                 format_units(e.new_config.max_trade_size),
                 format_units(e.old_config.daily_trade_limit),
                 format_units(e.new_config.daily_trade_limit));
}

void LogEventListener::on_emergency_activated(const EmergencyActivated& e) {
    spdlog::error("EMERGENCY STOP activated by {} at {}: {}", e.by, e.timestamp, e.reason);
}

void LogEventListener::on_emergency_deactivated(const EmergencyDeactivated& e) {
    spdlog::warn("Emergency stop deactivated by {} at {}", e.by, e.timestamp);
}

void LogEventListener::on_pause_changed(const PauseChanged& e) {
    spdlog::warn("Trading {} by {}", e.paused ? "paused" : "unpaused", e.by);
}

void LogEventListener::on_compliance_validated(const ComplianceValidated& e) {
    spdlog::info("Compliance for request {}: predicted {} -> {}", e.request_id,
                 to_string(e.predicted_price), e.approved ? "approved" : "rejected");
}

void LogEventListener::on_eco_score_checked(const EcoScoreChecked& e) {
    spdlog::info("Eco score {} (threshold {}) -> {}", e.score, e.threshold,
                 e.passed ? "passed" : "blocked");
}

void LogEventListener::on_prediction_requested(const PredictionRequested& e) {
    spdlog::info("Prediction requested: {} at price {} ({})", e.request_id,
                 to_string(e.price_at_request), e.timestamp);
}

void LogEventListener::on_prediction_fulfilled(const PredictionFulfilled& e) {
    spdlog::info("Prediction fulfilled: {} -> {} confidence={}bps{}", e.request_id,
                 to_string(e.predicted_price), e.confidence_bps,
                 e.is_anomaly ? " anomaly" : "");
}

void LogEventListener::on_reward_minted(const RewardMinted& e) {
    spdlog::info("Reward #{} minted for {} (confidence {}bps)", e.token_id, e.request_id,
                 e.confidence_bps);
}

void LogEventListener::on_pending_request_reset(const PendingRequestReset& e) {
    spdlog::warn("Pending request {} reset by {} after {}s", e.request_id, e.by, e.age);
}

void LogEventListener::on_prediction_stalled(const PredictionStalled& e) {
    spdlog::warn("Prediction request {} pending for {}s", e.request_id, e.age);
}

void LogEventListener::on_execution_failed(const ExecutionFailed& e) {
    spdlog::error("Execution of {} failed ({} consecutive): {}", format_units(e.amount_in),
                  e.consecutive_failures, e.reason);
}

} // namespace tradegate
