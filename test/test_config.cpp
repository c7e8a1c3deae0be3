// tradegate - configuration loading and validation

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <tradegate/config.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>

using namespace tradegate;
using namespace tradegate::test;

namespace {

const char* kConfig = R"({
  "log_level": "debug",
  "admin": "owner",
  "assets": {
    "source": "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2",
    "target": "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48"
  },
  "trading": {
    "price_threshold": "2000e8",
    "max_trade_size": "100e18",
    "daily_trade_limit": "1000e18",
    "cooldown_period": 300,
    "confidence_threshold_bps": 7000,
    "eco_threshold": 800
  },
  "roles": {
    "bot": ["ai", "operator"],
    "keeper-1": ["keeper"]
  },
  "prediction": { "source": "functions/price_prediction.js" }
})";

} // namespace

TEST_CASE("TradingConfig defaults", "[config]") {
    TradingConfig cfg = TradingConfig::defaults();

    REQUIRE(cfg.price_threshold == usd(2000));
    REQUIRE(cfg.max_trade_size == tokens(100));
    REQUIRE(cfg.daily_trade_limit == tokens(1000));
    REQUIRE(cfg.cooldown_period == 300);
    REQUIRE(cfg.max_slippage_bps == 300);
    REQUIRE(cfg.confidence_threshold_bps == 7000);
    REQUIRE(cfg.deviation_threshold_bps == 500);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("TradingConfig validation", "[config]") {
    TradingConfig cfg = TradingConfig::defaults();

    auto reason_of = [](const TradingConfig& c) {
        try {
            c.validate();
        } catch (const TradeError& e) {
            return e.reason();
        }
        return Reason::OK;
    };

    SECTION("Zero price threshold") {
        cfg.price_threshold = 0;
        REQUIRE(reason_of(cfg) == Reason::INVALID_CONFIG);
    }

    SECTION("Zero max trade size") {
        cfg.max_trade_size = 0;
        REQUIRE(reason_of(cfg) == Reason::INVALID_CONFIG);
    }

    SECTION("Slippage above 10%") {
        cfg.max_slippage_bps = 1001;
        REQUIRE(reason_of(cfg) == Reason::INVALID_CONFIG);
        cfg.max_slippage_bps = 1000;
        REQUIRE(reason_of(cfg) == Reason::OK);
    }

    SECTION("Confidence above 100%") {
        cfg.confidence_threshold_bps = 10001;
        REQUIRE(reason_of(cfg) == Reason::INVALID_CONFIG);
    }

    SECTION("Deviation above 50%") {
        cfg.deviation_threshold_bps = 5001;
        REQUIRE(reason_of(cfg) == Reason::INVALID_CONFIG);
    }

    SECTION("Zero request timeout") {
        cfg.request_timeout = 0;
        REQUIRE(reason_of(cfg) == Reason::INVALID_CONFIG);
    }
}

TEST_CASE("AgentConfig parses a full document", "[config]") {
    AgentConfig cfg = AgentConfig::parse(kConfig);

    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.admin == "owner");
    REQUIRE(cfg.source_asset == source_asset());
    REQUIRE(cfg.target_asset == target_asset());
    REQUIRE(cfg.trading.max_trade_size == tokens(100));
    REQUIRE(cfg.trading.eco_threshold == 800);
    REQUIRE(cfg.prediction_source == "functions/price_prediction.js");

    SECTION("Missing trading keys keep their defaults") {
        REQUIRE(cfg.trading.max_slippage_bps == 300);
        REQUIRE(cfg.trading.prediction_interval == 3600);
    }

    SECTION("Roles map to capabilities") {
        REQUIRE(cfg.roles.at("bot") ==
                std::vector<Capability>{Capability::SIGNAL, Capability::OPERATOR});
        REQUIRE(cfg.roles.at("keeper-1") == std::vector<Capability>{Capability::KEEPER});
    }
}

TEST_CASE("AgentConfig rejects bad documents", "[config]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(AgentConfig::parse("{ not json"), ConfigError);
    }

    SECTION("Wrong value type") {
        REQUIRE_THROWS_AS(AgentConfig::parse(R"({"trading": {"cooldown_period": "soon"}})"),
                          ConfigError);
    }

    SECTION("Unknown capability") {
        auto doc = nlohmann::json::parse(kConfig);
        doc["roles"]["bot"] = {"superuser"};
        REQUIRE_THROWS_AS(AgentConfig::from_json(doc), ConfigError);
    }

    SECTION("Missing assets") {
        REQUIRE_THROWS_AS(AgentConfig::parse(R"({"admin": "owner"})"), TradeError);
    }

    SECTION("Identical assets") {
        auto doc = nlohmann::json::parse(kConfig);
        doc["assets"]["target"] = doc["assets"]["source"];
        REQUIRE_THROWS_AS(AgentConfig::from_json(doc), TradeError);
    }

    SECTION("Invalid trading limits") {
        auto doc = nlohmann::json::parse(kConfig);
        doc["trading"]["max_slippage_bps"] = 5000;
        REQUIRE_THROWS_AS(AgentConfig::from_json(doc), TradeError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(AgentConfig::from_file("/nonexistent/tradegate.json"), ConfigError);
    }
}

TEST_CASE("AgentConfig loads from a file", "[config]") {
    std::string path = "tradegate_test_config.json";
    {
        std::ofstream out(path);
        out << kConfig;
    }

    AgentConfig cfg = AgentConfig::from_file(path);
    REQUIRE(cfg.admin == "owner");
    REQUIRE(cfg.trading.price_threshold == usd(2000));

    std::remove(path.c_str());
}

TEST_CASE("TradingConfig serializes amounts as strings", "[config]") {
    TradingConfig cfg = trading_config();
    nlohmann::json j = cfg;

    REQUIRE(j.at("max_trade_size") == "100000000000000000000");
    REQUIRE(j.at("cooldown_period") == 300);

    TradingConfig parsed;
    j.get_to(parsed);
    REQUIRE(parsed == cfg);
}
