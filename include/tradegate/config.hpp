#ifndef TRADEGATE_CONFIG_HPP
#define TRADEGATE_CONFIG_HPP

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "access.hpp"
#include "types.hpp"

namespace tradegate {

// =============================================================================
// Trading Configuration (replaced wholesale by admin action)
// =============================================================================

struct TradingConfig {
    Price price_threshold = 0;          // minimum oracle price to trade
    Amount max_trade_size = 0;          // per-trade cap
    Amount daily_trade_limit = 0;       // rolling 24h volume cap
    uint64_t cooldown_period = 0;       // seconds between trades
    uint64_t max_slippage_bps = 0;      // <= 1000
    uint64_t confidence_threshold_bps = 0;  // 0..10000

    // Deviation breaker, eco gate and prediction schedule
    uint64_t deviation_threshold_bps = limits::DEFAULT_DEVIATION_BPS;  // <= 5000
    uint64_t eco_threshold = 0;
    uint64_t prediction_interval = 3600;  // seconds between scheduled requests
    uint64_t request_timeout = 3600;      // age after which a pending request may be reset

    // Throws TradeError(INVALID_CONFIG)
    void validate() const;

    // priceThreshold 2000e8, maxTradeSize 100e18, dailyTradeLimit 1000e18,
    // cooldown 300s, slippage 3%, confidence 70%, eco threshold 1000
    static TradingConfig defaults();

    bool operator==(const TradingConfig& other) const;
    bool operator!=(const TradingConfig& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const TradingConfig& config);
void from_json(const nlohmann::json& j, TradingConfig& config);

// =============================================================================
// Agent Configuration (file level)
// =============================================================================

struct AgentConfig {
    TradingConfig trading = TradingConfig::defaults();

    Address source_asset{};
    Address target_asset{};

    Actor admin = "admin";
    std::map<Actor, std::vector<Capability>> roles;

    // Source code and secrets reference forwarded to the prediction bridge
    std::string prediction_source;

    std::string log_level = "info";

    void validate() const;

    static AgentConfig from_file(std::string_view path);
    static AgentConfig parse(std::string_view content);
    static AgentConfig from_json(const nlohmann::json& j);
};

} // namespace tradegate

#endif // TRADEGATE_CONFIG_HPP
