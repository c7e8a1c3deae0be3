#include "tradegate/authorizer.hpp"
#include "tradegate/events.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace tradegate {

TradeAuthorizer::TradeAuthorizer(const AgentConfig& config, const Clock& clock,
                                 std::shared_ptr<DataFeed> price_feed, Custody& custody,
                                 EventListener* events)
    : clock_(clock),
      custody_(custody),
      events_(events),
      access_(config.admin),
      emergency_(access_, events),
      price_(std::move(price_feed), config.trading.deviation_threshold_bps, events),
      eco_(),
      config_(config.trading),
      risk_(config.trading),
      source_asset_(config.source_asset),
      target_asset_(config.target_asset) {
    config.validate();

    for (const auto& [actor, caps] : config.roles) {
        for (auto cap : caps) {
            access_.grant(config.admin, actor, cap);
        }
    }

    state_.last_day_reset = clock_.now();

    // Best effort: an unreadable oracle leaves the deviation basis at zero
    PriceSnapshot snapshot;
    Reason reason = price_.check(clock_.now(), snapshot);
    if (reason == Reason::OK) {
        price_.accept(snapshot);
        spdlog::info("Initial price {}", to_string(snapshot.price));
    } else {
        spdlog::warn("Initial price unavailable ({}), starting without a basis",
                     to_string(reason));
    }
}

// =============================================================================
// Trading
// =============================================================================

TradeResult TradeAuthorizer::trigger_trade(const Actor& caller, Amount amount_in,
                                           Amount amount_out_min, Timestamp deadline,
                                           uint64_t confidence_bps) {
    access_.require(caller, Capability::SIGNAL);
    SingleFlight::Flight flight(flight_);
    return authorize(amount_in, amount_out_min, deadline, confidence_bps, true, false);
}

TradeResult TradeAuthorizer::execute_in_flight(const SingleFlight::Flight& flight,
                                               Amount amount_in, Amount amount_out_min,
                                               Timestamp deadline, uint64_t confidence_bps,
                                               bool from_prediction) {
    if (!flight.guards(flight_)) {
        throw TradeError(Reason::REENTRANCY, "flight token belongs to another guard");
    }
    return authorize(amount_in, amount_out_min, deadline, confidence_bps, true,
                     from_prediction);
}

BatchResult TradeAuthorizer::trigger_batch_trade(const Actor& caller,
                                                 const std::vector<Amount>& amounts_in,
                                                 const std::vector<Amount>& amounts_out_min,
                                                 Timestamp deadline, uint64_t confidence_bps) {
    access_.require(caller, Capability::SIGNAL);
    SingleFlight::Flight flight(flight_);

    emergency_.require_active();

    if (amounts_in.size() != amounts_out_min.size()) {
        throw TradeError(Reason::INVALID_BATCH, "array length mismatch");
    }
    if (amounts_in.empty()) {
        throw TradeError(Reason::INVALID_BATCH, "empty batch");
    }
    if (amounts_in.size() > limits::MAX_BATCH_SIZE) {
        throw TradeError(Reason::TOO_MANY_TRADES);
    }

    Amount total = 0;
    for (auto amount : amounts_in) {
        if (amount > ~U128{0} - total) {
            throw TradeError(Reason::TRADE_AMOUNT_TOO_LARGE, "batch total overflows");
        }
        total += amount;
    }
    {
        std::shared_lock lock(state_mutex_);
        risk_.admit(state_, total, confidence_bps, clock_.now());
    }

    BatchResult result;
    result.elements.reserve(amounts_in.size());

    for (size_t i = 0; i < amounts_in.size(); ++i) {
        BatchElement element;
        element.index = i;
        element.amount_in = amounts_in[i];

        if (amounts_in[i] == 0) {
            element.skipped = true;
            result.elements.push_back(std::move(element));
            continue;
        }

        try {
            element.result = authorize(amounts_in[i], amounts_out_min[i], deadline,
                                       confidence_bps, false, false);
            element.executed = true;
            ++result.executed;
        } catch (const TradeError& e) {
            element.reason = e.reason();
            element.error = e.what();
            ++result.failed;
            spdlog::warn("Batch element {} rejected: {}", i, e.what());
        } catch (const std::exception& e) {
            element.error = e.what();
            ++result.failed;
            spdlog::warn("Batch element {} failed: {}", i, e.what());
        }
        result.elements.push_back(std::move(element));
    }

    spdlog::info("Batch of {} finished: {} executed, {} failed", amounts_in.size(),
                 result.executed, result.failed);
    return result;
}

Reason TradeAuthorizer::check_gates(const PriceSnapshot& snapshot, const TradingConfig& cfg,
                                    Timestamp now, bool notify) const {
    bool valid = snapshot.price >= cfg.price_threshold;
    if (notify && events_) {
        events_->on_price_checked({snapshot.price, cfg.price_threshold, valid, now});
    }
    if (!valid) return Reason::PRICE_BELOW_THRESHOLD;

    if (eco_.configured()) {
        uint64_t score = eco_.score(now);
        bool passed = score <= cfg.eco_threshold;
        if (notify && events_) {
            events_->on_eco_score_checked({score, cfg.eco_threshold, passed});
        }
        if (!passed) return Reason::ECO_SCORE_TOO_HIGH;
    }
    return Reason::OK;
}

TradeResult TradeAuthorizer::authorize(Amount amount_in, Amount amount_out_min,
                                       Timestamp deadline, uint64_t confidence_bps, bool admit,
                                       bool from_prediction) {
    Timestamp now = clock_.now();

    // 1. Emergency and pause supersede every other gate
    emergency_.require_active();

    if (amount_in == 0) {
        throw TradeError(Reason::ZERO_AMOUNT);
    }

    TradingConfig cfg;
    Path route;
    {
        std::shared_lock lock(state_mutex_);
        cfg = config_;
        route = {source_asset_, target_asset_};

        // 2-3. Day roll is only evaluated here and committed below
        if (admit) {
            risk_.admit(state_, amount_in, confidence_bps, now);
        }
    }

    // 4. Price
    PriceSnapshot snapshot = price_.read(now);

    // 5. Threshold and eco score
    Reason reason = check_gates(snapshot, cfg, now, true);
    if (reason != Reason::OK) {
        throw TradeError(reason);
    }

    // 6. Commit
    RateState before;
    {
        std::unique_lock lock(state_mutex_);
        before = state_;
        RiskLimiter::commit(state_, amount_in, now);
    }
    Price basis_before = price_.last_valid_price();
    price_.accept(snapshot);

    // 7. Execute
    ExecutionReceipt receipt;
    try {
        receipt = custody_.execute(amount_in, amount_out_min, route, deadline);
    } catch (const std::exception& e) {
        // 9. Roll back
        {
            std::unique_lock lock(state_mutex_);
            state_ = before;
        }
        price_.restore_basis(basis_before);

        uint64_t failures = consecutive_failures_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (events_) events_->on_execution_failed({amount_in, e.what(), failures});
        throw;
    }

    // 8. Settle
    consecutive_failures_.store(0, std::memory_order_release);

    TradeResult result;
    {
        std::unique_lock lock(state_mutex_);
        RiskLimiter::record_success(state_);
        result.sequence = state_.total_trades;
    }
    result.price = snapshot;
    result.receipt = receipt;

    if (events_) {
        events_->on_trade_triggered({result.sequence, amount_in, amount_out_min,
                                     receipt.amount_out, snapshot.price, confidence_bps, now,
                                     from_prediction});
    }
    return result;
}

// =============================================================================
// Views
// =============================================================================

Eligibility TradeAuthorizer::can_trade(Amount amount_in, uint64_t confidence_bps) const {
    Timestamp now = clock_.now();

    auto verdict = [](Reason reason) {
        Eligibility e;
        e.allowed = reason == Reason::OK;
        e.reason = reason;
        e.message = describe(reason);
        return e;
    };

    Reason reason = emergency_.check();
    if (reason != Reason::OK) return verdict(reason);

    if (amount_in == 0) return verdict(Reason::ZERO_AMOUNT);

    TradingConfig cfg;
    {
        std::shared_lock lock(state_mutex_);
        cfg = config_;
        reason = risk_.check(state_, amount_in, confidence_bps, now);
    }
    if (reason != Reason::OK) return verdict(reason);

    PriceSnapshot snapshot;
    reason = price_.check(now, snapshot);
    if (reason != Reason::OK) return verdict(reason);

    return verdict(check_gates(snapshot, cfg, now, false));
}

PriceSnapshot TradeAuthorizer::get_latest_price() const {
    return price_.read(clock_.now());
}

TradingStats TradeAuthorizer::trading_stats() const {
    std::shared_lock lock(state_mutex_);
    TradingStats stats;
    stats.total_trades = state_.total_trades;
    stats.successful_trades = state_.successful_trades;
    if (state_.total_trades > 0) {
        stats.success_rate_bps =
            state_.successful_trades * limits::BPS_DENOMINATOR / state_.total_trades;
    }
    return stats;
}

RateState TradeAuthorizer::rate_state() const {
    std::shared_lock lock(state_mutex_);
    return state_;
}

TradingConfig TradeAuthorizer::config() const {
    std::shared_lock lock(state_mutex_);
    return config_;
}

Path TradeAuthorizer::path() const {
    std::shared_lock lock(state_mutex_);
    return {source_asset_, target_asset_};
}

// =============================================================================
// Administration
// =============================================================================

void TradeAuthorizer::apply_config(const Actor& caller, const TradingConfig& config) {
    config.validate();

    TradingConfig old;
    {
        std::unique_lock lock(state_mutex_);
        old = config_;
        config_ = config;
        risk_.set_config(config);
    }
    price_.set_deviation_threshold(config.deviation_threshold_bps);

    if (events_) events_->on_config_updated({old, config, caller});
}

void TradeAuthorizer::update_config(const Actor& caller, const TradingConfig& config) {
    access_.require(caller, Capability::ADMIN);
    apply_config(caller, config);
}

void TradeAuthorizer::set_price_threshold(const Actor& caller, Price threshold) {
    access_.require(caller, Capability::ADMIN);
    TradingConfig next = config();
    next.price_threshold = threshold;
    apply_config(caller, next);
}

void TradeAuthorizer::set_target_asset(const Actor& caller, const Address& asset) {
    access_.require(caller, Capability::ADMIN);
    if (address::is_zero(asset)) {
        throw TradeError(Reason::INVALID_ADDRESS, "target asset is zero");
    }

    std::unique_lock lock(state_mutex_);
    if (asset == source_asset_) {
        throw TradeError(Reason::INVALID_ADDRESS, "target asset equals source asset");
    }
    target_asset_ = asset;
    spdlog::info("Target asset set to {} by {}", address::to_hex(asset), caller);
}

void TradeAuthorizer::set_price_feed(const Actor& caller, std::shared_ptr<DataFeed> feed) {
    access_.require(caller, Capability::ADMIN);
    if (!feed) {
        throw TradeError(Reason::INVALID_ADDRESS, "price feed is required");
    }
    spdlog::info("Price feed set to '{}' by {}", feed->description(), caller);
    price_.set_feed(std::move(feed));
}

void TradeAuthorizer::set_eco_feed(const Actor& caller, std::shared_ptr<DataFeed> feed) {
    access_.require(caller, Capability::ADMIN);
    spdlog::info("Eco feed {} by {}", feed ? "set to '" + feed->description() + "'" : "removed",
                 caller);
    eco_.set_feed(std::move(feed));
}

// =============================================================================
// Emergency
// =============================================================================

void TradeAuthorizer::emergency_stop(const Actor& caller, const std::string& reason) {
    emergency_.activate(caller, reason, clock_.now());
}

void TradeAuthorizer::resume_trading(const Actor& caller) {
    emergency_.deactivate(caller, clock_.now());
}

void TradeAuthorizer::pause(const Actor& caller) {
    emergency_.pause(caller);
}

void TradeAuthorizer::unpause(const Actor& caller) {
    emergency_.unpause(caller);
}

} // namespace tradegate
