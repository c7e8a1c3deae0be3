// Shared fixtures for the tradegate tests

#ifndef TRADEGATE_TEST_SUPPORT_HPP
#define TRADEGATE_TEST_SUPPORT_HPP

#include <catch2/catch_tostring.hpp>

#include <tradegate/authorizer.hpp>
#include <tradegate/events.hpp>

#include <memory>
#include <vector>

namespace Catch {

template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 value) { return tradegate::to_string(value); }
};

template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 value) { return tradegate::to_string(value); }
};

template <>
struct StringMaker<tradegate::Reason> {
    static std::string convert(tradegate::Reason value) { return tradegate::to_string(value); }
};

} // namespace Catch

namespace tradegate::test {

constexpr Timestamp START = 1700000000;

inline Price usd(int64_t whole) { return static_cast<Price>(whole) * 100000000; }
inline Amount tokens(uint64_t whole) { return static_cast<Amount>(whole) * E18; }

inline const Address& source_asset() {
    static const Address addr = address::from_hex("0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
    return addr;
}

inline const Address& target_asset() {
    static const Address addr = address::from_hex("0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
    return addr;
}

// priceThreshold 2000e8, maxTradeSize 100e18, dailyTradeLimit 1000e18,
// cooldown 300s, confidence 7000
inline TradingConfig trading_config() {
    TradingConfig cfg = TradingConfig::defaults();
    cfg.price_threshold = usd(2000);
    cfg.max_trade_size = tokens(100);
    cfg.daily_trade_limit = tokens(1000);
    cfg.cooldown_period = 300;
    cfg.confidence_threshold_bps = 7000;
    cfg.eco_threshold = 1000;
    return cfg;
}

inline AgentConfig agent_config(const TradingConfig& trading = trading_config()) {
    AgentConfig cfg;
    cfg.trading = trading;
    cfg.source_asset = source_asset();
    cfg.target_asset = target_asset();
    cfg.admin = "admin";
    cfg.roles["signal"] = {Capability::SIGNAL};
    cfg.roles["ops"] = {Capability::OPERATOR};
    cfg.roles["guardian"] = {Capability::EMERGENCY};
    cfg.roles["keeper"] = {Capability::KEEPER};
    cfg.prediction_source = "functions/price_prediction.js";
    return cfg;
}

// Captures every event for later inspection
struct RecordingListener : EventListener {
    std::vector<TradeTriggered> trades;
    std::vector<PriceChecked> price_checks;
    std::vector<PriceDeviation> deviations;
    std::vector<ConfigUpdated> config_updates;
    std::vector<EmergencyActivated> emergency_activations;
    std::vector<EmergencyDeactivated> emergency_deactivations;
    std::vector<PauseChanged> pause_changes;
    std::vector<ComplianceValidated> compliance;
    std::vector<EcoScoreChecked> eco_checks;
    std::vector<PredictionRequested> requests;
    std::vector<PredictionFulfilled> fulfillments;
    std::vector<RewardMinted> rewards;
    std::vector<PendingRequestReset> resets;
    std::vector<PredictionStalled> stalls;
    std::vector<ExecutionFailed> failures;

    void on_trade_triggered(const TradeTriggered& e) override { trades.push_back(e); }
    void on_price_checked(const PriceChecked& e) override { price_checks.push_back(e); }
    void on_price_deviation(const PriceDeviation& e) override { deviations.push_back(e); }
    void on_config_updated(const ConfigUpdated& e) override { config_updates.push_back(e); }
    void on_emergency_activated(const EmergencyActivated& e) override {
        emergency_activations.push_back(e);
    }
    void on_emergency_deactivated(const EmergencyDeactivated& e) override {
        emergency_deactivations.push_back(e);
    }
    void on_pause_changed(const PauseChanged& e) override { pause_changes.push_back(e); }
    void on_compliance_validated(const ComplianceValidated& e) override {
        compliance.push_back(e);
    }
    void on_eco_score_checked(const EcoScoreChecked& e) override { eco_checks.push_back(e); }
    void on_prediction_requested(const PredictionRequested& e) override {
        requests.push_back(e);
    }
    void on_prediction_fulfilled(const PredictionFulfilled& e) override {
        fulfillments.push_back(e);
    }
    void on_reward_minted(const RewardMinted& e) override { rewards.push_back(e); }
    void on_pending_request_reset(const PendingRequestReset& e) override {
        resets.push_back(e);
    }
    void on_prediction_stalled(const PredictionStalled& e) override { stalls.push_back(e); }
    void on_execution_failed(const ExecutionFailed& e) override { failures.push_back(e); }
};

// Authorizer wired to a manual clock, a manual ETH/USD feed at 2500 and
// paper custody holding 100000 source tokens
struct Engine {
    explicit Engine(const TradingConfig& trading = trading_config())
        : clock(START),
          price_feed(std::make_shared<ManualFeed>("ETH / USD", usd(2500), START)),
          custody(clock, static_cast<U128>(usd(2500))) {
        custody.deposit(source_asset(), tokens(100000));
        authorizer = std::make_unique<TradeAuthorizer>(agent_config(trading), clock, price_feed,
                                                       custody, &events);
    }

    TradeResult trade(Amount amount, uint64_t confidence = 8000) {
        return authorizer->trigger_trade("signal", amount, 0, clock.now() + 300, confidence);
    }

    Reason trade_reason(Amount amount, uint64_t confidence = 8000) {
        try {
            trade(amount, confidence);
        } catch (const TradeError& e) {
            return e.reason();
        }
        return Reason::OK;
    }

    // Moves the clock and keeps the oracle fresh
    void advance(uint64_t seconds) {
        clock.advance(seconds);
        price_feed->set_updated_at(clock.now());
    }

    ManualClock clock;
    std::shared_ptr<ManualFeed> price_feed;
    PaperCustody custody;
    RecordingListener events;
    std::unique_ptr<TradeAuthorizer> authorizer;
};

} // namespace tradegate::test

#endif // TRADEGATE_TEST_SUPPORT_HPP
