#include "tradegate/prediction.hpp"
#include "tradegate/events.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

namespace tradegate {

const char* to_string(RequestState state) noexcept {
    switch (state) {
        case RequestState::REQUESTED: return "requested";
        case RequestState::FULFILLED: return "fulfilled";
        case RequestState::REJECTED: return "rejected";
        case RequestState::ERRORED: return "errored";
        case RequestState::EXPIRED: return "expired";
    }
    return "unknown";
}

const char* to_string(FulfillOutcome outcome) noexcept {
    switch (outcome) {
        case FulfillOutcome::IGNORED: return "ignored";
        case FulfillOutcome::ERRORED: return "errored";
        case FulfillOutcome::REJECTED: return "rejected";
        case FulfillOutcome::FULFILLED: return "fulfilled";
    }
    return "unknown";
}

PredictionLifecycle::PredictionLifecycle(TradeAuthorizer& authorizer, PredictionBridge& bridge,
                                         RewardLedger& rewards,
                                         std::shared_ptr<ComplianceGate> compliance,
                                         std::string source)
    : authorizer_(authorizer),
      bridge_(bridge),
      rewards_(rewards),
      events_(authorizer.events()),
      source_(std::move(source)),
      compliance_(std::move(compliance)) {}

Amount PredictionLifecycle::trade_size(Amount max_trade_size, uint64_t confidence_bps) noexcept {
    Amount base = max_trade_size / 4;
    // Split on the denominator so base * confidence * 3 cannot wrap
    Amount whole = base / limits::BPS_DENOMINATOR;
    Amount rest = base % limits::BPS_DENOMINATOR;
    Amount scaled = whole * confidence_bps * 3 + rest * confidence_bps * 3 / limits::BPS_DENOMINATOR;
    return std::min(scaled, max_trade_size);
}

// =============================================================================
// Requests
// =============================================================================

RequestId PredictionLifecycle::submit(Timestamp now) {
    authorizer_.emergency().require_active();

    if (has_pending_request()) {
        throw TradeError(Reason::PENDING_REQUEST_EXISTS);
    }

    PriceSnapshot snapshot = authorizer_.get_latest_price();

    std::vector<std::string> args{to_string(snapshot.price), std::to_string(now)};
    RequestId id = bridge_.submit_request(source_, args, "tradegate/price-prediction");

    PredictionRequest request;
    request.request_id = id;
    request.timestamp = now;
    request.price_at_request = snapshot.price;
    {
        std::unique_lock lock(mutex_);
        requests_[id] = request;
        pending_ = id;
        last_prediction_time_ = now;
        ++total_predictions_;
    }

    if (events_) events_->on_prediction_requested({id, snapshot.price, now});
    return id;
}

RequestId PredictionLifecycle::request_prediction(const Actor& caller) {
    authorizer_.access().require_any(caller, {Capability::SIGNAL, Capability::OPERATOR});
    SingleFlight::Flight flight(authorizer_.single_flight());
    return submit(authorizer_.clock().now());
}

bool PredictionLifecycle::upkeep_needed(Timestamp now) const {
    if (authorizer_.emergency().check() != Reason::OK) return false;

    uint64_t interval = authorizer_.config().prediction_interval;
    std::shared_lock lock(mutex_);
    if (pending_) return false;
    return now >= last_prediction_time_ && now - last_prediction_time_ >= interval;
}

UpkeepCheck PredictionLifecycle::check_upkeep() const {
    Timestamp now = authorizer_.clock().now();

    std::optional<PredictionRequest> stalled;
    {
        std::shared_lock lock(mutex_);
        if (pending_) {
            const auto& request = requests_.at(*pending_);
            uint64_t timeout = authorizer_.config().request_timeout;
            if (now >= request.timestamp && now - request.timestamp >= timeout) {
                stalled = request;
            }
        }
    }
    if (stalled && events_) {
        events_->on_prediction_stalled({stalled->request_id, now - stalled->timestamp});
    }

    UpkeepCheck check;
    check.needed = upkeep_needed(now);
    check.perform_data = abi::encode({authorizer_.last_valid_price(), static_cast<I128>(now)});
    return check;
}

RequestId PredictionLifecycle::perform_upkeep(const Actor& caller,
                                              const abi::Bytes& perform_data) {
    authorizer_.access().require(caller, Capability::KEEPER);
    SingleFlight::Flight flight(authorizer_.single_flight());

    Timestamp now = authorizer_.clock().now();
    if (!upkeep_needed(now)) {
        throw TradeError(Reason::UPKEEP_NOT_NEEDED);
    }

    if (auto words = abi::decode(perform_data, 2)) {
        spdlog::debug("Upkeep by {}: price {} checked at {}", caller, to_string((*words)[0]),
                      to_string((*words)[1]));
    }
    return submit(now);
}

// =============================================================================
// Fulfillment
// =============================================================================

void PredictionLifecycle::settle(const RequestId& request_id, RequestState state) {
    std::unique_lock lock(mutex_);
    requests_.at(request_id).state = state;
    if (pending_ && *pending_ == request_id) {
        pending_.reset();
    }
}

FulfillOutcome PredictionLifecycle::fulfill(const RequestId& request_id,
                                            const abi::Bytes& payload,
                                            const std::string& error) {
    SingleFlight::Flight flight(authorizer_.single_flight());

    {
        std::shared_lock lock(mutex_);
        auto it = requests_.find(request_id);
        if (it == requests_.end() || it->second.state != RequestState::REQUESTED) {
            spdlog::warn("Ignoring fulfillment for unknown or settled request {}", request_id);
            return FulfillOutcome::IGNORED;
        }
    }

    if (!error.empty()) {
        spdlog::error("Prediction {} failed: {}", request_id, error);
        settle(request_id, RequestState::ERRORED);
        return FulfillOutcome::ERRORED;
    }

    auto words = abi::decode(payload, 3);
    if (!words) {
        spdlog::warn("Prediction {} carries a malformed payload ({} bytes)", request_id,
                     payload.size());
        settle(request_id, RequestState::REJECTED);
        return FulfillOutcome::REJECTED;
    }

    Price predicted = (*words)[0];
    I128 confidence = (*words)[1];
    bool anomaly = (*words)[2] != 0;

    if (predicted <= 0 || confidence < 0 ||
        confidence > static_cast<I128>(limits::BPS_DENOMINATOR)) {
        spdlog::warn("Prediction {} out of range: price {} confidence {}", request_id,
                     to_string(predicted), to_string(confidence));
        settle(request_id, RequestState::REJECTED);
        return FulfillOutcome::REJECTED;
    }
    uint64_t confidence_bps = static_cast<uint64_t>(confidence);

    std::shared_ptr<ComplianceGate> compliance;
    {
        std::unique_lock lock(mutex_);
        auto& request = requests_.at(request_id);
        request.predicted_price = predicted;
        request.confidence_bps = confidence_bps;
        request.is_anomaly = anomaly;
        compliance = compliance_;
    }

    if (compliance) {
        bool approved = compliance->validate_prediction(request_id, predicted);
        if (events_) events_->on_compliance_validated({request_id, predicted, approved});
        if (!approved) {
            settle(request_id, RequestState::REJECTED);
            return FulfillOutcome::REJECTED;
        }
    }

    settle(request_id, RequestState::FULFILLED);
    {
        std::unique_lock lock(mutex_);
        ++predictions_fulfilled_;
    }
    if (events_) events_->on_prediction_fulfilled({request_id, predicted, confidence_bps, anomaly});

    if (confidence_bps >= limits::REWARD_CONFIDENCE_BPS) {
        uint64_t token_id =
            rewards_.mint(request_id, confidence_bps, authorizer_.clock().now());
        {
            std::unique_lock lock(mutex_);
            ++rewards_minted_;
        }
        if (events_) events_->on_reward_minted({token_id, request_id, confidence_bps});
    }

    evaluate_and_execute(flight, request_id);
    return FulfillOutcome::FULFILLED;
}

void PredictionLifecycle::evaluate_and_execute(const SingleFlight::Flight& flight,
                                               const RequestId& request_id) {
    PredictionRequest request;
    {
        std::shared_lock lock(mutex_);
        request = requests_.at(request_id);
    }
    TradingConfig cfg = authorizer_.config();

    if (request.is_anomaly) {
        spdlog::info("Prediction {} flagged as anomaly, not trading", request_id);
        return;
    }
    if (request.confidence_bps < cfg.confidence_threshold_bps) {
        spdlog::info("Prediction {} confidence {}bps below {}bps, not trading", request_id,
                     request.confidence_bps, cfg.confidence_threshold_bps);
        return;
    }

    uint64_t eco = authorizer_.eco_score();
    if (eco > cfg.eco_threshold) {
        if (events_) events_->on_eco_score_checked({eco, cfg.eco_threshold, false});
        spdlog::info("Eco score {} above {}, not trading", eco, cfg.eco_threshold);
        return;
    }

    if (request.predicted_price < cfg.price_threshold) {
        spdlog::info("Predicted price {} below threshold {}, not trading",
                     to_string(request.predicted_price), to_string(cfg.price_threshold));
        return;
    }

    Amount amount = trade_size(cfg.max_trade_size, request.confidence_bps);
    if (amount == 0) return;

    Timestamp deadline = authorizer_.clock().now() + limits::PREDICTION_TRADE_DEADLINE;
    try {
        authorizer_.execute_in_flight(flight, amount, 0, deadline, request.confidence_bps, true);
        std::unique_lock lock(mutex_);
        requests_.at(request_id).executed = true;
    } catch (const TradeError& e) {
        spdlog::warn("Prediction trade for {} rejected: {}", request_id, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Prediction trade for {} failed: {}", request_id, e.what());
    }
}

// =============================================================================
// Administration
// =============================================================================

void PredictionLifecycle::reset_pending_request(const Actor& caller) {
    authorizer_.access().require(caller, Capability::ADMIN);
    SingleFlight::Flight flight(authorizer_.single_flight());

    Timestamp now = authorizer_.clock().now();
    uint64_t timeout = authorizer_.config().request_timeout;

    RequestId id;
    uint64_t age = 0;
    {
        std::unique_lock lock(mutex_);
        if (!pending_) {
            throw TradeError(Reason::NO_PENDING_REQUEST);
        }
        auto& request = requests_.at(*pending_);
        age = now > request.timestamp ? now - request.timestamp : 0;
        if (age < timeout) {
            throw TradeError(Reason::REQUEST_NOT_TIMED_OUT,
                             std::to_string(age) + "s of " + std::to_string(timeout) + "s");
        }
        request.state = RequestState::EXPIRED;
        id = *pending_;
        pending_.reset();
    }

    if (events_) events_->on_pending_request_reset({id, caller, age});
}

void PredictionLifecycle::claim_reward(const Actor& caller, uint64_t token_id,
                                       const Actor& recipient) {
    authorizer_.access().require(caller, Capability::OPERATOR);
    rewards_.claim(token_id, recipient);
}

void PredictionLifecycle::set_compliance(const Actor& caller,
                                         std::shared_ptr<ComplianceGate> compliance) {
    authorizer_.access().require(caller, Capability::ADMIN);
    std::unique_lock lock(mutex_);
    compliance_ = std::move(compliance);
    spdlog::info("Compliance gate {} by {}", compliance_ ? "set" : "removed", caller);
}

// =============================================================================
// Views
// =============================================================================

uint64_t PredictionLifecycle::pending_requests() const {
    std::shared_lock lock(mutex_);
    return pending_ ? 1 : 0;
}

std::optional<PredictionRequest> PredictionLifecycle::request(const RequestId& request_id) const {
    std::shared_lock lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) return std::nullopt;
    return it->second;
}

std::optional<RequestId> PredictionLifecycle::pending_request_id() const {
    std::shared_lock lock(mutex_);
    return pending_;
}

AdvancedStats PredictionLifecycle::advanced_stats() const {
    std::shared_lock lock(mutex_);
    AdvancedStats stats;
    stats.total_predictions = total_predictions_;
    stats.predictions_fulfilled = predictions_fulfilled_;
    stats.rewards_minted = rewards_minted_;
    stats.pending_requests = pending_ ? 1 : 0;
    stats.last_prediction_time = last_prediction_time_;
    return stats;
}

} // namespace tradegate
