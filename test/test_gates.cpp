// tradegate - compliance and eco gate tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <tradegate/compliance.hpp>

#include <limits>

using namespace tradegate;
using namespace tradegate::test;

TEST_CASE("ComplianceEngine without feeds only checks the price", "[compliance]") {
    ComplianceEngine engine(nullptr, nullptr);

    REQUIRE(engine.validate_prediction("req-1", usd(2600)));
    REQUIRE_FALSE(engine.validate_prediction("req-1", 0));
    REQUIRE_FALSE(engine.validate_prediction("req-1", -1));
}

TEST_CASE("ComplianceEngine volatility check", "[compliance]") {
    auto volatility = std::make_shared<ManualFeed>("volatility bps", 1500, START);
    ComplianceEngine engine(volatility, nullptr);

    REQUIRE(engine.validate_prediction("req-1", usd(2600)));

    SECTION("At the 20% cap") {
        volatility->update(2000, START);
        REQUIRE(engine.validate_prediction("req-1", usd(2600)));
    }

    SECTION("Above the cap") {
        volatility->update(2001, START);
        REQUIRE_FALSE(engine.validate_prediction("req-1", usd(2600)));
    }

    SECTION("Unreadable fails closed") {
        volatility->set_available(false);
        REQUIRE_FALSE(engine.validate_prediction("req-1", usd(2600)));
    }
}

TEST_CASE("ComplianceEngine regulatory check", "[compliance]") {
    auto regulatory = std::make_shared<ManualFeed>("regulatory status", 0, START);
    ComplianceEngine engine(nullptr, regulatory);

    REQUIRE(engine.validate_prediction("req-1", usd(2600)));

    SECTION("Halted") {
        regulatory->update(1, START);
        REQUIRE_FALSE(engine.validate_prediction("req-1", usd(2600)));
    }

    SECTION("Unreadable fails closed") {
        regulatory->set_available(false);
        REQUIRE_FALSE(engine.validate_prediction("req-1", usd(2600)));
    }

    SECTION("Feeds can be rotated") {
        regulatory->update(1, START);
        engine.set_feeds(nullptr, nullptr);
        REQUIRE(engine.validate_prediction("req-1", usd(2600)));
    }
}

TEST_CASE("EcoGate distinguishes absent from unreadable", "[eco]") {
    constexpr uint64_t worst = std::numeric_limits<uint64_t>::max();

    SECTION("No feed scores zero") {
        EcoGate gate;
        REQUIRE_FALSE(gate.configured());
        REQUIRE(gate.score(START) == 0);
    }

    auto feed = std::make_shared<ManualFeed>("eco score", 420, START);
    EcoGate gate(feed);

    SECTION("Fresh reading") {
        REQUIRE(gate.configured());
        REQUIRE(gate.score(START + 10) == 420);
    }

    SECTION("Unreadable feed scores the maximum") {
        feed->set_available(false);
        REQUIRE(gate.score(START) == worst);
    }

    SECTION("Negative reading scores the maximum") {
        feed->update(-5, START);
        REQUIRE(gate.score(START) == worst);
    }

    SECTION("Stale reading scores the maximum") {
        REQUIRE(gate.score(START + 3601) == worst);
    }

    SECTION("Removing the feed restores pass-through") {
        feed->set_available(false);
        gate.set_feed(nullptr);
        REQUIRE(gate.score(START) == 0);
    }
}
