/**
 * @file test_hex.cpp
 * @brief Unit tests for the Hex encoder.
 */

#include <emstr/encode.hpp>
#include <emstr/hex.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdio>
#include <string_view>

using namespace emstr;

TEST_CASE("Hex encoding", "[hex]") {
    char buffer[32];
    std::size_t n = 0;

    SECTION("reference sequence") {
        std::uint8_t data[] = {0x00, 0x12, 0x34, 0x56, 0x78, 0x9a, 0xbc, 0xde};
        Hex hex(data);

        REQUIRE(hex.length() == 16);
        REQUIRE(hex.write(buffer, sizeof(buffer), n) == Error::Ok);
        REQUIRE(n == 16);
        REQUIRE(std::string_view(buffer, n) == "00123456789abcde");
    }

    SECTION("high values are lowercase") {
        std::array<std::uint8_t, 3> data = {0x12, 0x34, 0xff};
        std::string_view out;
        REQUIRE(encode_str(Hex(data), buffer, sizeof(buffer), out) == Error::Ok);
        REQUIRE(out == "1234ff");
    }

    SECTION("pointer and size") {
        std::uint8_t data[] = {0xde, 0xad, 0xbe, 0xef};
        Hex hex(data, 2);
        REQUIRE(hex.size() == 2);
        REQUIRE(hex.write(buffer, sizeof(buffer), n) == Error::Ok);
        REQUIRE(std::string_view(buffer, n) == "dead");
    }

    SECTION("bytes of a text slice") {
        REQUIRE(Hex(std::string_view("abc")).write(buffer, sizeof(buffer), n) == Error::Ok);
        REQUIRE(std::string_view(buffer, n) == "616263");
    }

    SECTION("empty input") {
        Hex hex(nullptr, 0);
        REQUIRE(hex.length() == 0);
        REQUIRE(hex.write(buffer, 0, n) == Error::Ok);
        REQUIRE(n == 0);
    }
}

TEST_CASE("Hex digit table matches printf", "[hex]") {
    for (unsigned i = 0; i < 256; ++i) {
        std::uint8_t byte = static_cast<std::uint8_t>(i);
        char buffer[2];
        std::size_t n = 0;
        REQUIRE(Hex(&byte, 1).write(buffer, sizeof(buffer), n) == Error::Ok);

        char expected[3];
        std::snprintf(expected, sizeof(expected), "%02x", i);
        REQUIRE(std::string_view(buffer, n) == std::string_view(expected, 2));
    }
}

TEST_CASE("Hex buffer too small", "[hex]") {
    std::uint8_t data[] = {0x01, 0x02, 0x03};
    char buffer[8] = {'x', 'x', 'x', 'x', 'x', 'x', 'x', 'x'};
    std::size_t n = 42;

    REQUIRE(Hex(data).write(buffer, 5, n) == Error::BufferLength);
    REQUIRE(n == 42);
    REQUIRE(std::string_view(buffer, 8) == "xxxxxxxx");

    REQUIRE(Hex(data).write(buffer, 6, n) == Error::Ok);
    REQUIRE(std::string_view(buffer, n) == "010203");
}
