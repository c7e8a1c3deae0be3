#include "tradegate/types.hpp"
#include "tradegate/errors.hpp"

#include <algorithm>
#include <cctype>

namespace tradegate {

namespace {

constexpr U128 U128_MAX = ~static_cast<U128>(0);

U128 checked_mul(U128 a, U128 b, std::string_view text) {
    if (a != 0 && b > U128_MAX / a) {
        throw ConfigError("amount out of range: " + std::string(text));
    }
    return a * b;
}

U128 checked_add(U128 a, U128 b, std::string_view text) {
    if (b > U128_MAX - a) {
        throw ConfigError("amount out of range: " + std::string(text));
    }
    return a + b;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

// =============================================================================
// Amount Parsing
// =============================================================================

Amount parse_amount(std::string_view text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c != '_' && c != ' ') cleaned.push_back(c);
    }
    if (cleaned.empty()) {
        throw ConfigError("empty amount");
    }

    std::string mantissa = cleaned;
    unsigned exponent = 0;
    auto e_pos = cleaned.find_first_of("eE");
    if (e_pos != std::string::npos) {
        mantissa = cleaned.substr(0, e_pos);
        std::string exp_str = cleaned.substr(e_pos + 1);
        if (exp_str.empty() || exp_str.size() > 2 ||
            !std::all_of(exp_str.begin(), exp_str.end(), is_digit)) {
            throw ConfigError("invalid exponent in amount: " + cleaned);
        }
        exponent = static_cast<unsigned>(std::stoul(exp_str));
    }

    std::string int_part = mantissa;
    std::string frac_part;
    auto dot = mantissa.find('.');
    if (dot != std::string::npos) {
        int_part = mantissa.substr(0, dot);
        frac_part = mantissa.substr(dot + 1);
    }
    // Trailing fractional zeros carry no value
    while (!frac_part.empty() && frac_part.back() == '0') frac_part.pop_back();

    if ((int_part.empty() && frac_part.empty()) ||
        !std::all_of(int_part.begin(), int_part.end(), is_digit) ||
        !std::all_of(frac_part.begin(), frac_part.end(), is_digit)) {
        throw ConfigError("invalid amount: " + cleaned);
    }
    if (frac_part.size() > exponent) {
        throw ConfigError("amount has more fractional digits than its exponent: " + cleaned);
    }

    U128 value = 0;
    for (char c : int_part + frac_part) {
        value = checked_add(checked_mul(value, 10, cleaned),
                            static_cast<U128>(c - '0'), cleaned);
    }
    for (size_t i = frac_part.size(); i < exponent; ++i) {
        value = checked_mul(value, 10, cleaned);
    }
    return value;
}

Price parse_price(std::string_view text) {
    bool negative = !text.empty() && text.front() == '-';
    if (negative) text.remove_prefix(1);

    U128 magnitude = parse_amount(text);
    if (magnitude > (U128_MAX >> 1)) {
        throw ConfigError("price out of range: " + std::string(text));
    }
    I128 value = static_cast<I128>(magnitude);
    return negative ? -value : value;
}

std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 value) {
    if (value < 0) {
        return "-" + to_string(static_cast<U128>(-(value + 1)) + 1);
    }
    return to_string(static_cast<U128>(value));
}

std::string format_units(Amount value, unsigned decimals) {
    std::string digits = to_string(value);
    if (decimals == 0) return digits;

    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }
    std::string int_part = digits.substr(0, digits.size() - decimals);
    std::string frac_part = digits.substr(digits.size() - decimals);
    while (!frac_part.empty() && frac_part.back() == '0') frac_part.pop_back();

    return frac_part.empty() ? int_part : int_part + "." + frac_part;
}

// =============================================================================
// Addresses
// =============================================================================

namespace address {

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw TradeError(Reason::INVALID_ADDRESS, std::string(hex));
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw TradeError(Reason::INVALID_ADDRESS, std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace address

} // namespace tradegate
