#ifndef TRADEGATE_ERRORS_HPP
#define TRADEGATE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tradegate {

// =============================================================================
// Reason Codes
// =============================================================================

enum class Reason : uint8_t {
    OK = 0,

    // Emergency & pause
    EMERGENCY_STOP_ACTIVE,
    EMERGENCY_STOP_NOT_ACTIVE,
    PAUSED,
    NOT_PAUSED,

    // Risk limits
    TRADE_AMOUNT_TOO_LARGE,
    COOLDOWN_NOT_MET,
    CONFIDENCE_TOO_LOW,
    DAILY_LIMIT_EXCEEDED,
    ZERO_AMOUNT,

    // Price & gates
    ORACLE_UNAVAILABLE,
    INVALID_PRICE,
    PRICE_DATA_STALE,
    PRICE_BELOW_THRESHOLD,
    ECO_SCORE_TOO_HIGH,

    // Batch
    INVALID_BATCH,
    TOO_MANY_TRADES,

    // Prediction lifecycle
    PENDING_REQUEST_EXISTS,
    NO_PENDING_REQUEST,
    REQUEST_NOT_TIMED_OUT,
    UPKEEP_NOT_NEEDED,
    REWARD_NOT_FOUND,

    // Access & input validation
    UNAUTHORIZED,
    UNAUTHORIZED_KEEPER,
    INVALID_CONFIG,
    INVALID_ADDRESS,
    REENTRANCY
};

// Stable identifier, e.g. "PriceDataStale"
const char* to_string(Reason reason) noexcept;

// Operator-facing sentence, e.g. "Amount too large"
const char* describe(Reason reason) noexcept;

// =============================================================================
// Exceptions
// =============================================================================

// Gate rejection or invalid input; carries the reason code
class TradeError : public std::runtime_error {
public:
    explicit TradeError(Reason reason)
        : std::runtime_error(to_string(reason)), reason_(reason) {}

    TradeError(Reason reason, const std::string& detail)
        : std::runtime_error(std::string(to_string(reason)) + ": " + detail),
          reason_(reason) {}

    Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

// Execution failure reported by the custody component
class CustodyError : public std::runtime_error {
public:
    explicit CustodyError(const std::string& msg) : std::runtime_error(msg) {}
};

// Prediction bridge refused or failed to submit a request
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed configuration file
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace tradegate

#endif // TRADEGATE_ERRORS_HPP
