/**
 * @file test_strbuffer.cpp
 * @brief Unit tests for StrBuffer class.
 */

#include <catch2/catch_test_macros.hpp>
#include <emstr/fractional.hpp>
#include <emstr/hex.hpp>
#include <emstr/strbuffer.hpp>

using namespace emstr;

TEST_CASE("StrBuffer construction", "[strbuffer]") {
    SECTION("default construction") {
        StrBuffer<32> sb;
        REQUIRE(sb.size() == 0);
        REQUIRE(sb.empty());
        REQUIRE(sb.capacity() == 32);
        REQUIRE(sb.remaining() == 32);
        REQUIRE(sb.view().empty());
    }

    SECTION("default capacity") {
        StrBuffer<> sb;
        REQUIRE(sb.capacity() == DEFAULT_BUFFER_SIZE);
    }
}

TEST_CASE("StrBuffer append", "[strbuffer]") {
    StrBuffer<32> sb;

    SECTION("single append") {
        REQUIRE(sb.append("something", ' ', std::uint8_t{15}, '/', std::uint8_t{100}) ==
                Error::Ok);
        REQUIRE(sb.size() == 16);
        REQUIRE(sb.view() == "something 15/100");
    }

    SECTION("successive appends") {
        REQUIRE(sb.append("T=") == Error::Ok);
        REQUIRE(sb.append(Fractional<int>(23041, 1000)) == Error::Ok);
        REQUIRE(sb.append('C') == Error::Ok);
        REQUIRE(sb.view() == "T=23.041C");
        REQUIRE(sb.remaining() == 32 - 9);
    }

    SECTION("hex") {
        std::uint8_t data[] = {0xca, 0xfe};
        REQUIRE(sb.append("0x", Hex(data)) == Error::Ok);
        REQUIRE(sb.view() == "0xcafe");
    }
}

TEST_CASE("StrBuffer overflow leaves content unchanged", "[strbuffer]") {
    StrBuffer<8> sb;
    REQUIRE(sb.append("abcde") == Error::Ok);

    SECTION("append that does not fit") {
        REQUIRE(sb.append("x", 1234) == Error::BufferLength);
        REQUIRE(sb.size() == 5);
        REQUIRE(sb.view() == "abcde");
    }

    SECTION("append that exactly fills") {
        REQUIRE(sb.append(-12) == Error::Ok);
        REQUIRE(sb.size() == 8);
        REQUIRE(sb.remaining() == 0);
        REQUIRE(sb.append('z') == Error::BufferLength);
        REQUIRE(sb.view() == "abcde-12");
    }
}

TEST_CASE("StrBuffer clear", "[strbuffer]") {
    StrBuffer<16> sb;
    REQUIRE(sb.append("hello") == Error::Ok);

    sb.clear();
    REQUIRE(sb.size() == 0);
    REQUIRE(sb.remaining() == 16);

    REQUIRE(sb.append(42) == Error::Ok);
    REQUIRE(sb.view() == "42");
}

TEST_CASE("StrBuffer text view", "[strbuffer][utf8]") {
    StrBuffer<16> sb;
    std::string_view out;

    SECTION("valid text") {
        REQUIRE(sb.append("ok ", 1) == Error::Ok);
        REQUIRE(sb.str(out) == Error::Ok);
        REQUIRE(out == "ok 1");
        REQUIRE(out.data() == sb.data());
    }

    SECTION("invalid text") {
        REQUIRE(sb.append('\xE2', '\x82') == Error::Ok);
        REQUIRE(sb.str(out) == Error::InvalidUtf8);

        // Completing the sequence makes it valid
        REQUIRE(sb.append('\xAC') == Error::Ok);
        REQUIRE(sb.str(out) == Error::Ok);
        REQUIRE(out == "\xE2\x82\xAC");
    }
}
