#ifndef TRADEGATE_PREDICTION_HPP
#define TRADEGATE_PREDICTION_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

#include "abi.hpp"
#include "authorizer.hpp"
#include "bridge.hpp"
#include "compliance.hpp"
#include "reward.hpp"
#include "types.hpp"

namespace tradegate {

// =============================================================================
// Prediction Requests
// =============================================================================

enum class RequestState : uint8_t {
    REQUESTED = 0,
    FULFILLED = 1,
    REJECTED = 2,
    ERRORED = 3,
    EXPIRED = 4
};

const char* to_string(RequestState state) noexcept;

enum class FulfillOutcome : uint8_t {
    IGNORED = 0,    // unknown, already settled or expired request
    ERRORED = 1,    // forecaster reported an error
    REJECTED = 2,   // malformed payload or compliance refusal
    FULFILLED = 3
};

const char* to_string(FulfillOutcome outcome) noexcept;

struct PredictionRequest {
    RequestId request_id;
    Timestamp timestamp = 0;
    Price price_at_request = 0;
    RequestState state = RequestState::REQUESTED;
    Price predicted_price = 0;
    uint64_t confidence_bps = 0;
    bool is_anomaly = false;
    bool executed = false;  // a trade followed the fulfillment
};

struct UpkeepCheck {
    bool needed = false;
    abi::Bytes perform_data;  // (last_valid_price, now) as two words
};

struct AdvancedStats {
    uint64_t total_predictions = 0;
    uint64_t predictions_fulfilled = 0;
    uint64_t rewards_minted = 0;
    uint64_t pending_requests = 0;
    Timestamp last_prediction_time = 0;
};

// =============================================================================
// PredictionLifecycle - request, fulfillment and autonomous execution
// =============================================================================

// At most one request is outstanding. A fulfillment never throws on bad
// data; the outcome is recorded on the request instead.
class PredictionLifecycle {
public:
    PredictionLifecycle(TradeAuthorizer& authorizer, PredictionBridge& bridge,
                        RewardLedger& rewards, std::shared_ptr<ComplianceGate> compliance,
                        std::string source);

    // Non-copyable
    PredictionLifecycle(const PredictionLifecycle&) = delete;
    PredictionLifecycle& operator=(const PredictionLifecycle&) = delete;

    // SIGNAL or OPERATOR. Throws PENDING_REQUEST_EXISTS, price gate errors
    // and BridgeError before any state change.
    RequestId request_prediction(const Actor& caller);

    UpkeepCheck check_upkeep() const;

    // KEEPER, else UNAUTHORIZED_KEEPER. Throws UPKEEP_NOT_NEEDED.
    RequestId perform_upkeep(const Actor& caller, const abi::Bytes& perform_data);

    // Payload: (predicted_price, confidence_bps, anomaly_flag) as 32-byte words
    FulfillOutcome fulfill(const RequestId& request_id, const abi::Bytes& payload,
                           const std::string& error);

    // ADMIN. Expires a request pending for at least request_timeout.
    void reset_pending_request(const Actor& caller);

    // OPERATOR
    void claim_reward(const Actor& caller, uint64_t token_id, const Actor& recipient);

    // ADMIN. Null disables the compliance check.
    void set_compliance(const Actor& caller, std::shared_ptr<ComplianceGate> compliance);

    uint64_t pending_requests() const;
    bool has_pending_request() const { return pending_requests() > 0; }
    std::optional<PredictionRequest> request(const RequestId& request_id) const;
    std::optional<RequestId> pending_request_id() const;
    AdvancedStats advanced_stats() const;

    // Confidence-scaled size: max/4 times a 0..3 multiplier, capped at max
    static Amount trade_size(Amount max_trade_size, uint64_t confidence_bps) noexcept;

private:
    RequestId submit(Timestamp now);
    bool upkeep_needed(Timestamp now) const;
    void evaluate_and_execute(const SingleFlight::Flight& flight, const RequestId& request_id);
    void settle(const RequestId& request_id, RequestState state);

    TradeAuthorizer& authorizer_;
    PredictionBridge& bridge_;
    RewardLedger& rewards_;
    EventListener* events_;
    std::string source_;

    mutable std::shared_mutex mutex_;
    std::shared_ptr<ComplianceGate> compliance_;
    std::map<RequestId, PredictionRequest> requests_;
    std::optional<RequestId> pending_;
    Timestamp last_prediction_time_ = 0;
    uint64_t total_predictions_ = 0;
    uint64_t predictions_fulfilled_ = 0;
    uint64_t rewards_minted_ = 0;
};

} // namespace tradegate

#endif // TRADEGATE_PREDICTION_HPP
