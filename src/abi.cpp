#include "tradegate/abi.hpp"

#include <string>

namespace tradegate {
namespace abi {

void append_word(Bytes& out, U128 value) {
    // Upper 16 bytes are zero for unsigned 128-bit values
    out.insert(out.end(), 16, 0);
    for (int i = 15; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void append_word(Bytes& out, I128 value) {
    uint8_t fill = value < 0 ? 0xff : 0x00;
    out.insert(out.end(), 16, fill);
    U128 bits = static_cast<U128>(value);
    for (int i = 15; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(bits >> (i * 8)));
    }
}

Bytes encode(const std::vector<I128>& words) {
    Bytes out;
    out.reserve(words.size() * WORD_SIZE);
    for (auto w : words) {
        append_word(out, w);
    }
    return out;
}

std::optional<std::vector<I128>> decode(const Bytes& data, size_t count) {
    if (data.size() != count * WORD_SIZE) return std::nullopt;

    std::vector<I128> words;
    words.reserve(count);

    for (size_t w = 0; w < count; ++w) {
        const uint8_t* word = data.data() + w * WORD_SIZE;

        U128 low = 0;
        for (size_t i = 16; i < WORD_SIZE; ++i) {
            low = (low << 8) | word[i];
        }

        // Sign extension must be consistent with bit 127 of the low half
        bool negative = (word[16] & 0x80) != 0;
        uint8_t fill = negative ? 0xff : 0x00;
        for (size_t i = 0; i < 16; ++i) {
            if (word[i] != fill) return std::nullopt;
        }

        words.push_back(static_cast<I128>(low));
    }
    return words;
}

std::string to_hex(const Bytes& data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + data.size() * 2);
    for (auto b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

namespace {

int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<Bytes> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) return std::nullopt;

    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace abi
} // namespace tradegate
