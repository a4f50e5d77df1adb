/**
 * @file test_error.cpp
 * @brief Unit tests for error codes and exceptions.
 */

#include <emstr/emstr.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>

using namespace emstr;

TEST_CASE("Error codes", "[error]") {
    REQUIRE(static_cast<int>(Error::Ok) == 0);
    REQUIRE(static_cast<int>(Error::BufferLength) < 0);
    REQUIRE(static_cast<int>(Error::InvalidUtf8) < 0);
    REQUIRE(Error::BufferLength != Error::InvalidUtf8);
}

TEST_CASE("Error strings", "[error]") {
    REQUIRE(std::string_view(error_string(Error::Ok)) == "Success");
    REQUIRE(std::string_view(error_string(Error::BufferLength)) == "Buffer too small");
    REQUIRE(std::string_view(error_string(Error::InvalidUtf8)) == "Invalid UTF-8");
    REQUIRE(std::string_view(error_string(static_cast<Error>(-99))) == "Unknown error");
}

#if !EMSTR_NO_EXCEPTIONS

TEST_CASE("throw_if_error", "[error]") {
    SECTION("Ok does not throw") {
        REQUIRE_NOTHROW(throw_if_error(Error::Ok));
    }

    SECTION("buffer length") {
        REQUIRE_THROWS_AS(throw_if_error(Error::BufferLength), BufferLengthException);

        try {
            throw_if_error(Error::BufferLength);
        } catch (const EmstrException& e) {
            REQUIRE(e.code() == Error::BufferLength);
            REQUIRE(std::string_view(e.what()) == "Buffer too small");
        }
    }

    SECTION("invalid utf8") {
        REQUIRE_THROWS_AS(throw_if_error(Error::InvalidUtf8), InvalidUtf8Exception);
    }

    SECTION("from an encoding result") {
        char buffer[2];
        std::size_t n = 0;
        REQUIRE_THROWS_AS(throw_if_error(encode(12345, buffer, sizeof(buffer), n)),
                          BufferLengthException);
    }
}

#endif // !EMSTR_NO_EXCEPTIONS
