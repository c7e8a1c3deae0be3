#include "tradegate/errors.hpp"

namespace tradegate {

const char* to_string(Reason reason) noexcept {
    switch (reason) {
        case Reason::OK: return "Ok";
        case Reason::EMERGENCY_STOP_ACTIVE: return "EmergencyStopActive";
        case Reason::EMERGENCY_STOP_NOT_ACTIVE: return "EmergencyStopNotActive";
        case Reason::PAUSED: return "Paused";
        case Reason::NOT_PAUSED: return "NotPaused";
        case Reason::TRADE_AMOUNT_TOO_LARGE: return "TradeAmountTooLarge";
        case Reason::COOLDOWN_NOT_MET: return "CooldownNotMet";
        case Reason::CONFIDENCE_TOO_LOW: return "ConfidenceTooLow";
        case Reason::DAILY_LIMIT_EXCEEDED: return "DailyLimitExceeded";
        case Reason::ZERO_AMOUNT: return "ZeroAmount";
        case Reason::ORACLE_UNAVAILABLE: return "OracleUnavailable";
        case Reason::INVALID_PRICE: return "InvalidPrice";
        case Reason::PRICE_DATA_STALE: return "PriceDataStale";
        case Reason::PRICE_BELOW_THRESHOLD: return "PriceBelowThreshold";
        case Reason::ECO_SCORE_TOO_HIGH: return "EcoScoreTooHigh";
        case Reason::INVALID_BATCH: return "InvalidBatch";
        case Reason::TOO_MANY_TRADES: return "TooManyTrades";
        case Reason::PENDING_REQUEST_EXISTS: return "PendingRequestExists";
        case Reason::NO_PENDING_REQUEST: return "NoPendingRequest";
        case Reason::REQUEST_NOT_TIMED_OUT: return "RequestNotTimedOut";
        case Reason::UPKEEP_NOT_NEEDED: return "UpkeepNotNeeded";
        case Reason::REWARD_NOT_FOUND: return "RewardNotFound";
        case Reason::UNAUTHORIZED: return "Unauthorized";
        case Reason::UNAUTHORIZED_KEEPER: return "UnauthorizedKeeper";
        case Reason::INVALID_CONFIG: return "InvalidConfig";
        case Reason::INVALID_ADDRESS: return "InvalidAddress";
        case Reason::REENTRANCY: return "Reentrancy";
    }
    return "Unknown";
}

const char* describe(Reason reason) noexcept {
    switch (reason) {
        case Reason::OK: return "Trade allowed";
        case Reason::EMERGENCY_STOP_ACTIVE: return "Emergency stop active";
        case Reason::PAUSED: return "Contract paused";
        case Reason::TRADE_AMOUNT_TOO_LARGE: return "Amount too large";
        case Reason::COOLDOWN_NOT_MET: return "Cooldown period not met";
        case Reason::CONFIDENCE_TOO_LOW: return "Confidence too low";
        case Reason::DAILY_LIMIT_EXCEEDED: return "Daily limit exceeded";
        case Reason::ZERO_AMOUNT: return "Amount is zero";
        case Reason::ORACLE_UNAVAILABLE: return "Price feed unavailable";
        case Reason::INVALID_PRICE: return "Invalid price data";
        case Reason::PRICE_DATA_STALE: return "Price data stale";
        case Reason::PRICE_BELOW_THRESHOLD: return "Price below threshold";
        case Reason::ECO_SCORE_TOO_HIGH: return "Eco score too high";
        case Reason::TOO_MANY_TRADES: return "Too many trades";
        case Reason::INVALID_BATCH: return "Array length mismatch";
        default: return to_string(reason);
    }
}

} // namespace tradegate
