// tradegate - 32-byte word codec tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <tradegate/abi.hpp>

using namespace tradegate;
using namespace tradegate::test;

TEST_CASE("Words are big-endian and sign extended", "[abi]") {
    abi::Bytes positive = abi::encode({0x0102});
    REQUIRE(positive.size() == abi::WORD_SIZE);
    REQUIRE(positive[30] == 0x01);
    REQUIRE(positive[31] == 0x02);
    REQUIRE(positive[0] == 0x00);

    abi::Bytes negative = abi::encode({-1});
    for (auto b : negative) {
        REQUIRE(b == 0xff);
    }

    auto words = abi::decode(abi::encode({usd(2600), -42, 0}), 3);
    REQUIRE(words);
    REQUIRE((*words)[0] == usd(2600));
    REQUIRE((*words)[1] == -42);
    REQUIRE((*words)[2] == 0);
}

TEST_CASE("Unsigned words leave the upper half clear", "[abi]") {
    abi::Bytes out;
    abi::append_word(out, ~U128{0});
    REQUIRE(out.size() == abi::WORD_SIZE);
    REQUIRE(out[0] == 0x00);
    REQUIRE(out[15] == 0x00);
    REQUIRE(out[16] == 0xff);
    REQUIRE(abi::to_hex(out) == "0x" + std::string(32, '0') + std::string(32, 'f'));
}

TEST_CASE("decode rejects malformed buffers", "[abi]") {
    abi::Bytes two = abi::encode({1, 2});

    SECTION("Wrong word count") {
        REQUIRE_FALSE(abi::decode(two, 3));
        REQUIRE_FALSE(abi::decode(two, 1));
    }

    SECTION("Partial word") {
        two.pop_back();
        REQUIRE_FALSE(abi::decode(two, 2));
    }

    SECTION("Value beyond 128 bits") {
        two[0] = 0x01;
        REQUIRE_FALSE(abi::decode(two, 2));
    }

    SECTION("Inconsistent sign extension") {
        abi::Bytes negative = abi::encode({-5});
        negative[3] = 0x00;
        REQUIRE_FALSE(abi::decode(negative, 1));
    }
}

TEST_CASE("Hex conversion", "[abi]") {
    abi::Bytes data{0xde, 0xad, 0xbe, 0xef};
    REQUIRE(abi::to_hex(data) == "0xdeadbeef");
    REQUIRE(abi::from_hex("0xDEADbeef") == data);
    REQUIRE(abi::from_hex("deadbeef") == data);
    REQUIRE(abi::from_hex("0x") == abi::Bytes{});

    REQUIRE_FALSE(abi::from_hex("0xabc"));
    REQUIRE_FALSE(abi::from_hex("0xzz"));
}
