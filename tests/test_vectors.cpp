/**
 * @file test_vectors.cpp
 * @brief Reference vector validation tests.
 *
 * Known inputs with their exact expected encodings, covering each encoder
 * and the composition of several of them.
 */

#include <emstr/emstr.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string_view>

using namespace emstr;

TEST_CASE("Reference vector: hex", "[vectors]") {
    const std::uint8_t data[] = {0x00, 0x12, 0x34, 0x56, 0x78, 0x9a, 0xbc, 0xde};

    char buffer[32];
    std::string_view out;
    REQUIRE(encode_str(Hex(data), buffer, sizeof(buffer), out) == Error::Ok);
    REQUIRE(out == "00123456789abcde");
}

TEST_CASE("Reference vector: composition", "[vectors]") {
    const char* name = "something";
    std::uint8_t progress = 15;

    char buffer[32];
    std::size_t n = 0;
    REQUIRE(write_all(buffer, sizeof(buffer), n, name, ' ', progress, '/', std::uint8_t{100}) ==
            Error::Ok);
    REQUIRE(n == 16);
    REQUIRE(std::string_view(buffer, n) == "something 15/100");
}

TEST_CASE("Reference vector: fractional boundaries", "[vectors]") {
    char buffer[32];
    std::string_view out;

    SECTION("zero with any positive divisor") {
        for (std::int64_t divisor = 1; divisor <= 1000000000000LL; divisor *= 10) {
            REQUIRE(encode_str(Fractional<std::int64_t>(0, divisor, Trim::None), buffer,
                               sizeof(buffer), out) == Error::Ok);
            REQUIRE(out == "0");
        }
    }

    SECTION("negative value below one divisor") {
        REQUIRE(encode_str(Fractional<int>(-10, 100, Trim::TrailingZeros), buffer, sizeof(buffer),
                           out) == Error::Ok);
        REQUIRE(out == "-0.1");
    }

    SECTION("scaled quantities") {
        REQUIRE(encode_str(Fractional<int>(1234056, 1000), buffer, sizeof(buffer), out) ==
                Error::Ok);
        REQUIRE(out == "1234.056");

        REQUIRE(encode_str(Fractional<int>(1050, 1000, Trim::TrailingZeros), buffer,
                           sizeof(buffer), out) == Error::Ok);
        REQUIRE(out == "1.05");

        REQUIRE(encode_str(Fractional<int>(1050, 1000, Trim::None), buffer, sizeof(buffer),
                           out) == Error::Ok);
        REQUIRE(out == "1.050");
    }
}

TEST_CASE("Reference vector: padding", "[vectors]") {
    char buffer[32];
    std::string_view out;

    REQUIRE(encode_str(pad_left("123", 6, ' '), buffer, sizeof(buffer), out) == Error::Ok);
    REQUIRE(out == "   123");
    REQUIRE(encode_str(pad_right("123", 6, ' '), buffer, sizeof(buffer), out) == Error::Ok);
    REQUIRE(out == "123   ");
    REQUIRE(encode_str(pad_left("123", 2, ' '), buffer, sizeof(buffer), out) == Error::Ok);
    REQUIRE(out == "123");
    REQUIRE(encode_str(pad_right("123", 2, ' '), buffer, sizeof(buffer), out) == Error::Ok);
    REQUIRE(out == "123");
}

TEST_CASE("Reference vector: telemetry line", "[vectors]") {
    // A housekeeping record rendered without any allocation
    const std::uint8_t serial[] = {0x0a, 0x1b, 0x2c, 0x3d};
    std::int32_t temperature_mdeg = -4250;
    std::uint16_t voltage_mv = 3307;
    std::uint32_t uptime_s = 86400;

    StrBuffer<64> line;
    REQUIRE(line.append("sn=", Hex(serial), " t=",
                        pad_left(Fractional<std::int32_t>(temperature_mdeg, 1000), 6), "C v=",
                        Fractional<std::int32_t>(voltage_mv, 1000, Trim::None), "V up=",
                        pad_left(uptime_s, 8, '0')) == Error::Ok);
    REQUIRE(line.view() == "sn=0a1b2c3d t= -4.25C v=3.307V up=00086400");
}
