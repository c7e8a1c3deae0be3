// tradegate - RiskLimiter tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <tradegate/risk_limiter.hpp>

using namespace tradegate;
using namespace tradegate::test;

TEST_CASE("RiskLimiter admits a trade within every limit", "[risk]") {
    RiskLimiter limiter(trading_config());
    RateState state;
    state.last_day_reset = START;

    REQUIRE(limiter.check(state, tokens(50), 8000, START) == Reason::OK);
    REQUIRE_NOTHROW(limiter.admit(state, tokens(50), 8000, START));
}

TEST_CASE("RiskLimiter rejection order", "[risk]") {
    RiskLimiter limiter(trading_config());
    RateState state;
    state.last_day_reset = START;
    state.last_trade_timestamp = START;
    state.total_trades = 1;
    state.successful_trades = 1;
    state.daily_trade_volume = tokens(990);

    SECTION("Size is checked before cooldown") {
        REQUIRE(limiter.check(state, tokens(101), 0, START + 10) ==
                Reason::TRADE_AMOUNT_TOO_LARGE);
    }

    SECTION("Cooldown is checked before confidence") {
        REQUIRE(limiter.check(state, tokens(50), 0, START + 10) == Reason::COOLDOWN_NOT_MET);
    }

    SECTION("Confidence is checked before daily volume") {
        REQUIRE(limiter.check(state, tokens(50), 6999, START + 300) ==
                Reason::CONFIDENCE_TOO_LOW);
    }

    SECTION("Daily volume") {
        REQUIRE(limiter.check(state, tokens(50), 7000, START + 300) ==
                Reason::DAILY_LIMIT_EXCEEDED);
        REQUIRE(limiter.check(state, tokens(10), 7000, START + 300) == Reason::OK);
    }

    SECTION("admit throws the same reason") {
        try {
            limiter.admit(state, tokens(50), 8000, START + 10);
            FAIL("expected CooldownNotMet");
        } catch (const TradeError& e) {
            REQUIRE(e.reason() == Reason::COOLDOWN_NOT_MET);
        }
    }
}

TEST_CASE("RiskLimiter cooldown boundary", "[risk]") {
    RiskLimiter limiter(trading_config());
    RateState state;
    state.last_day_reset = START;
    RiskLimiter::commit(state, tokens(10), START);

    REQUIRE(limiter.check(state, tokens(10), 8000, START + 299) == Reason::COOLDOWN_NOT_MET);
    REQUIRE(limiter.check(state, tokens(10), 8000, START + 300) == Reason::OK);
}

TEST_CASE("RiskLimiter cooldown near the end of time", "[risk]") {
    TradingConfig cfg = trading_config();
    cfg.cooldown_period = UINT64_MAX;
    RiskLimiter limiter(cfg);

    RateState state;
    state.last_day_reset = START;
    RiskLimiter::commit(state, tokens(10), START);

    REQUIRE(limiter.check(state, tokens(10), 8000, START + 1) == Reason::COOLDOWN_NOT_MET);
    REQUIRE(limiter.check(state, tokens(10), 8000, UINT64_MAX) == Reason::COOLDOWN_NOT_MET);
    REQUIRE(limiter.check(state, tokens(10), 8000, START - 1) == Reason::COOLDOWN_NOT_MET);
}

TEST_CASE("RiskLimiter has no cooldown before the first trade", "[risk]") {
    TradingConfig cfg = trading_config();
    cfg.cooldown_period = 86400;
    RiskLimiter limiter(cfg);

    RateState state;
    REQUIRE(limiter.check(state, tokens(10), 8000, 0) == Reason::OK);
}

TEST_CASE("Daily volume resets lazily after 24 hours", "[risk]") {
    RateState state;
    state.last_day_reset = START;
    state.daily_trade_volume = tokens(900);

    REQUIRE(RiskLimiter::current_day_volume(state, START + 86399) == tokens(900));
    REQUIRE(RiskLimiter::current_day_volume(state, START + 86400) == 0);

    // Viewing the volume never rolls the window
    REQUIRE(state.last_day_reset == START);

    SECTION("commit rolls the window") {
        RiskLimiter::commit(state, tokens(20), START + 90000);
        REQUIRE(state.daily_trade_volume == tokens(20));
        REQUIRE(state.last_day_reset == START + 90000);
        REQUIRE(state.last_trade_timestamp == START + 90000);
        REQUIRE(state.total_trades == 1);
        REQUIRE(state.successful_trades == 0);
    }

    SECTION("commit within the window accumulates") {
        RiskLimiter::commit(state, tokens(20), START + 100);
        REQUIRE(state.daily_trade_volume == tokens(920));
        REQUIRE(state.last_day_reset == START);
    }
}

TEST_CASE("Daily limit is inclusive", "[risk]") {
    RiskLimiter limiter(trading_config());
    RateState state;
    state.last_day_reset = START;
    state.daily_trade_volume = tokens(900);

    REQUIRE(limiter.check(state, tokens(100), 8000, START) == Reason::OK);
    REQUIRE(limiter.check(state, tokens(100) + 1, 8000, START) ==
            Reason::TRADE_AMOUNT_TOO_LARGE);

    state.daily_trade_volume = tokens(901);
    REQUIRE(limiter.check(state, tokens(100), 8000, START) == Reason::DAILY_LIMIT_EXCEEDED);
}
