#ifndef TRADEGATE_ABI_HPP
#define TRADEGATE_ABI_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "types.hpp"

namespace tradegate {
namespace abi {

// Fixed 32-byte big-endian words, as carried by prediction payloads and
// upkeep perform data.
constexpr size_t WORD_SIZE = 32;

using Bytes = std::vector<uint8_t>;

// Two's complement for negative values
void append_word(Bytes& out, I128 value);
void append_word(Bytes& out, U128 value);

Bytes encode(const std::vector<I128>& words);

// std::nullopt unless the buffer holds exactly `count` words and every
// word fits the 128-bit signed range
std::optional<std::vector<I128>> decode(const Bytes& data, size_t count);

// Hex rendering with "0x" prefix, and the reverse (nullopt on bad input)
std::string to_hex(const Bytes& data);
std::optional<Bytes> from_hex(std::string_view hex);

} // namespace abi
} // namespace tradegate

#endif // TRADEGATE_ABI_HPP
