#ifndef TRADEGATE_TYPES_HPP
#define TRADEGATE_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tradegate {

// =============================================================================
// Fixed-Point Amounts and Prices
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Token amounts in base units (18 decimals for the source asset)
using Amount = U128;

// Oracle answers keep the sign so a negative reading can be rejected
using Price = I128;

// Unix seconds
using Timestamp = uint64_t;

constexpr U128 E18 = 1000000000000000000ULL;  // 1e18

namespace limits {
constexpr uint64_t BPS_DENOMINATOR = 10000;
constexpr uint64_t MAX_PRICE_AGE = 3600;             // 1 hour
constexpr uint64_t SECONDS_PER_DAY = 86400;
constexpr uint64_t MAX_SLIPPAGE_BPS = 1000;          // 10%
constexpr uint64_t MAX_DEVIATION_BPS = 5000;         // 50%
constexpr uint64_t DEFAULT_DEVIATION_BPS = 500;      // 5%
constexpr uint64_t MAX_VOLATILITY_BPS = 2000;        // 20%
constexpr uint64_t REWARD_CONFIDENCE_BPS = 8000;     // 80%
constexpr size_t MAX_BATCH_SIZE = 10;
constexpr uint64_t PREDICTION_TRADE_DEADLINE = 300;  // 5 minutes
}

// Parse a non-negative integer amount: "1500", "1_500", "100e18"
Amount parse_amount(std::string_view text);

// Signed variant used for prices: "2500e8", "-100"
Price parse_price(std::string_view text);

std::string to_string(U128 value);
std::string to_string(I128 value);

// Render an 18-decimal amount as a human readable number, e.g. "50.25"
std::string format_units(Amount value, unsigned decimals = 18);

// =============================================================================
// Addresses (EVM 20-byte)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace address {

// Parses "0x" followed by 40 hex digits, throws TradeError(InvalidAddress)
Address from_hex(std::string_view hex);

std::string to_hex(const Address& addr);

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace address

// Swap route handed to custody: [source asset, target asset]
using Path = std::vector<Address>;

// Actor identity as presented to AccessControl
using Actor = std::string;

// Opaque prediction request token
using RequestId = std::string;

} // namespace tradegate

#endif // TRADEGATE_TYPES_HPP
