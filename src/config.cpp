#include "tradegate/config.hpp"
#include "tradegate/errors.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tradegate {

namespace {

// Amounts exceed 64 bits, so files carry them as strings ("100e18").
// Plain unsigned numbers are accepted for small values.
Amount read_amount(const nlohmann::json& j, const char* key, Amount fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (it->is_string()) return parse_amount(it->get<std::string>());
    if (it->is_number_unsigned()) return static_cast<Amount>(it->get<uint64_t>());
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        return static_cast<Amount>(it->get<int64_t>());
    }
    throw ConfigError(std::string("expected amount string for '") + key + "'");
}

Price read_price(const nlohmann::json& j, const char* key, Price fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (it->is_string()) return parse_price(it->get<std::string>());
    if (it->is_number_integer()) return static_cast<Price>(it->get<int64_t>());
    throw ConfigError(std::string("expected price string for '") + key + "'");
}

uint64_t read_u64(const nlohmann::json& j, const char* key, uint64_t fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        return static_cast<uint64_t>(it->get<int64_t>());
    }
    throw ConfigError(std::string("expected non-negative integer for '") + key + "'");
}

} // namespace

// =============================================================================
// TradingConfig
// =============================================================================

void TradingConfig::validate() const {
    if (price_threshold <= 0) {
        throw TradeError(Reason::INVALID_CONFIG, "price_threshold must be positive");
    }
    if (max_trade_size == 0) {
        throw TradeError(Reason::INVALID_CONFIG, "max_trade_size must be positive");
    }
    if (max_slippage_bps > limits::MAX_SLIPPAGE_BPS) {
        throw TradeError(Reason::INVALID_CONFIG, "max_slippage_bps above 1000");
    }
    if (confidence_threshold_bps > limits::BPS_DENOMINATOR) {
        throw TradeError(Reason::INVALID_CONFIG, "confidence_threshold_bps above 10000");
    }
    if (deviation_threshold_bps > limits::MAX_DEVIATION_BPS) {
        throw TradeError(Reason::INVALID_CONFIG, "deviation_threshold_bps above 5000");
    }
    if (request_timeout == 0) {
        throw TradeError(Reason::INVALID_CONFIG, "request_timeout must be positive");
    }
}

TradingConfig TradingConfig::defaults() {
    TradingConfig cfg;
    cfg.price_threshold = static_cast<Price>(2000) * 100000000;
    cfg.max_trade_size = 100 * E18;
    cfg.daily_trade_limit = 1000 * E18;
    cfg.cooldown_period = 300;
    cfg.max_slippage_bps = 300;
    cfg.confidence_threshold_bps = 7000;
    cfg.deviation_threshold_bps = limits::DEFAULT_DEVIATION_BPS;
    cfg.eco_threshold = 1000;
    cfg.prediction_interval = 3600;
    cfg.request_timeout = 3600;
    return cfg;
}

bool TradingConfig::operator==(const TradingConfig& other) const {
    return price_threshold == other.price_threshold &&
           max_trade_size == other.max_trade_size &&
           daily_trade_limit == other.daily_trade_limit &&
           cooldown_period == other.cooldown_period &&
           max_slippage_bps == other.max_slippage_bps &&
           confidence_threshold_bps == other.confidence_threshold_bps &&
           deviation_threshold_bps == other.deviation_threshold_bps &&
           eco_threshold == other.eco_threshold &&
           prediction_interval == other.prediction_interval &&
           request_timeout == other.request_timeout;
}

void to_json(nlohmann::json& j, const TradingConfig& config) {
    j = nlohmann::json{
        {"price_threshold", to_string(config.price_threshold)},
        {"max_trade_size", to_string(config.max_trade_size)},
        {"daily_trade_limit", to_string(config.daily_trade_limit)},
        {"cooldown_period", config.cooldown_period},
        {"max_slippage_bps", config.max_slippage_bps},
        {"confidence_threshold_bps", config.confidence_threshold_bps},
        {"deviation_threshold_bps", config.deviation_threshold_bps},
        {"eco_threshold", config.eco_threshold},
        {"prediction_interval", config.prediction_interval},
        {"request_timeout", config.request_timeout},
    };
}

// Keys missing from the document keep the value already held by `config`
void from_json(const nlohmann::json& j, TradingConfig& config) {
    if (!j.is_object()) {
        throw ConfigError("trading section must be an object");
    }
    config.price_threshold = read_price(j, "price_threshold", config.price_threshold);
    config.max_trade_size = read_amount(j, "max_trade_size", config.max_trade_size);
    config.daily_trade_limit = read_amount(j, "daily_trade_limit", config.daily_trade_limit);
    config.cooldown_period = read_u64(j, "cooldown_period", config.cooldown_period);
    config.max_slippage_bps = read_u64(j, "max_slippage_bps", config.max_slippage_bps);
    config.confidence_threshold_bps =
        read_u64(j, "confidence_threshold_bps", config.confidence_threshold_bps);
    config.deviation_threshold_bps =
        read_u64(j, "deviation_threshold_bps", config.deviation_threshold_bps);
    config.eco_threshold = read_u64(j, "eco_threshold", config.eco_threshold);
    config.prediction_interval = read_u64(j, "prediction_interval", config.prediction_interval);
    config.request_timeout = read_u64(j, "request_timeout", config.request_timeout);
}

// =============================================================================
// AgentConfig
// =============================================================================

void AgentConfig::validate() const {
    trading.validate();

    if (address::is_zero(source_asset) || address::is_zero(target_asset)) {
        throw TradeError(Reason::INVALID_ADDRESS, "source and target assets are required");
    }
    if (source_asset == target_asset) {
        throw TradeError(Reason::INVALID_ADDRESS, "source and target assets are identical");
    }
    if (admin.empty()) {
        throw TradeError(Reason::INVALID_CONFIG, "admin actor is required");
    }
}

AgentConfig AgentConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    spdlog::debug("Loaded config file {}", path_str);
    return parse(buffer.str());
}

AgentConfig AgentConfig::parse(std::string_view content) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    return from_json(j);
}

AgentConfig AgentConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be an object");
    }

    AgentConfig cfg;
    try {
        if (j.contains("trading")) {
            tradegate::from_json(j.at("trading"), cfg.trading);
        }

        if (j.contains("assets")) {
            const auto& assets = j.at("assets");
            cfg.source_asset = address::from_hex(assets.at("source").get<std::string>());
            cfg.target_asset = address::from_hex(assets.at("target").get<std::string>());
        }

        cfg.admin = j.value("admin", cfg.admin);
        cfg.log_level = j.value("log_level", cfg.log_level);

        if (j.contains("roles")) {
            for (const auto& item : j.at("roles").items()) {
                auto& list = cfg.roles[item.key()];
                for (const auto& name : item.value()) {
                    list.push_back(parse_capability(name.get<std::string>()));
                }
            }
        }

        if (j.contains("prediction")) {
            cfg.prediction_source = j.at("prediction").value("source", std::string{});
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }

    cfg.validate();
    return cfg;
}

} // namespace tradegate
