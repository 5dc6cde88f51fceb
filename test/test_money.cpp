#include <bankit/common/money.hpp>
#include <doctest/doctest.h>

using namespace bankit;

TEST_SUITE("Money") {
    TEST_CASE("Formatting minor units") {
        CHECK(formatAmount(0) == "0.00");
        CHECK(formatAmount(5) == "0.05");
        CHECK(formatAmount(70) == "0.70");
        CHECK(formatAmount(12345) == "123.45");
        CHECK(formatAmount(-2000) == "-20.00");

        CHECK(formatSigned(10000) == "+100.00");
        CHECK(formatSigned(-3000) == "-30.00");
    }

    TEST_CASE("Parsing whole and fractional amounts") {
        SUBCASE("Whole units") {
            auto amount = parseAmount("100");
            REQUIRE(amount.is_ok());
            CHECK(amount.value() == 10000);
        }

        SUBCASE("One fractional digit") {
            auto amount = parseAmount("12.5");
            REQUIRE(amount.is_ok());
            CHECK(amount.value() == 1250);
        }

        SUBCASE("Two fractional digits and surrounding whitespace") {
            auto amount = parseAmount("  0.07 \n");
            REQUIRE(amount.is_ok());
            CHECK(amount.value() == 7);
        }

        SUBCASE("Leading point") {
            auto amount = parseAmount(".5");
            REQUIRE(amount.is_ok());
            CHECK(amount.value() == 50);
        }
    }

    TEST_CASE("Rejected amounts") {
        for (const char *text : {"", "   ", "-5", "0", "0.00", "abc", "1e3", "nan", "inf", "1.234", "1.2.3", "."}) {
            CAPTURE(text);
            auto amount = parseAmount(text);
            REQUIRE(amount.is_err());
            CHECK(amount.error().code == ERR_INVALID_AMOUNT);
        }
    }

    TEST_CASE("Upper bound") {
        auto at_limit = parseAmount("10000000000");
        REQUIRE(at_limit.is_ok());
        CHECK(at_limit.value() == kMaxAmount);

        CHECK(parseAmount("10000000000.01").is_err());
        CHECK(parseAmount("99999999999999999999999").is_err());

        CHECK(validateAmount(kMaxAmount).is_ok());
        CHECK(validateAmount(kMaxAmount + 1).is_err());
        CHECK(validateAmount(0).is_err());
        CHECK(validateAmount(-1).is_err());
    }
}
