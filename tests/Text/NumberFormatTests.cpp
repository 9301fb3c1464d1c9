/// @file NumberFormatTests.cpp
/// @brief Tests for UOM::Text::FormatNumber and FormattedNumber.

#include <UOM/Exceptions/NonFiniteValueException.hpp>
#include <UOM/Text/NumberFormat.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <version>
#if defined(__cpp_lib_format)
#include <format>
#endif

using namespace UOM::Text;

TEST_CASE("FormatNumber rounds to the requested precision", "[Text][NumberFormat]")
{
    CHECK(FormatNumber(1.2345, 2) == "1.23");
    CHECK(FormatNumber(29.777777777777778, 2) == "29.78");
    CHECK(FormatNumber(0.125, 2) == "0.13");
    CHECK(FormatNumber(-0.125, 2) == "-0.13");
}

TEST_CASE("FormatNumber truncates toward zero", "[Text][NumberFormat]")
{
    CHECK(FormatNumber(-0.5001, 2, RoundingMode::Truncate) == "-0.5");
    CHECK(FormatNumber(1.2399, 2, RoundingMode::Truncate) == "1.23");
    CHECK(FormatNumber(9.999, 1, RoundingMode::Truncate) == "9.9");
    CHECK(FormatNumber(-7.9, 0, RoundingMode::Truncate) == "-7");
}

TEST_CASE("FormatNumber trims trailing zeros and the decimal point", "[Text][NumberFormat]")
{
    CHECK(FormatNumber(2.0, 3) == "2");
    CHECK(FormatNumber(2.5, 3) == "2.5");
    CHECK(FormatNumber(1000.0, 2) == "1000");
    CHECK(FormatNumber(0.0, 4) == "0");
    CHECK(FormatNumber(-3.10, 2) == "-3.1");
}

TEST_CASE("FormatNumber with precision zero prints an integer", "[Text][NumberFormat]")
{
    CHECK(FormatNumber(3.7, 0) == "4");
    CHECK(FormatNumber(-3.7, 0) == "-4");
    CHECK(FormatNumber(2.5, 0) == "3");
    CHECK(FormatNumber(42.0, 0) == "42");
}

TEST_CASE("FormatNumber carries past a power of ten", "[Text][NumberFormat]")
{
    CHECK(FormatNumber(9.996, 2) == "10");
    CHECK(FormatNumber(-99.95, 1) == "-100");
    CHECK(FormatNumber(0.9999, 3) == "1");
}

TEST_CASE("FormatNumber never prints a negative zero", "[Text][NumberFormat]")
{
    CHECK(FormatNumber(-0.0, 2) == "0");
    CHECK(FormatNumber(-0.001, 2) == "0");
    CHECK(FormatNumber(-0.009, 2, RoundingMode::Truncate) == "0");
}

TEST_CASE("FormatNumber handles extreme magnitudes and precisions", "[Text][NumberFormat]")
{
    CHECK(FormatNumber(1.0e20, 2) == "100000000000000000000");
    CHECK(FormatNumber(0.5, 400) == "0.5");
    CHECK(FormatNumber(1.0e300, 20).size() == 301);
    CHECK(FormatNumber(1.0e-5, 3) == "0");
}

TEST_CASE("FormatNumber rejects non-finite values", "[Text][NumberFormat]")
{
    REQUIRE_THROWS_AS(FormatNumber(std::numeric_limits<double>::quiet_NaN(), 2), UOM::Exceptions::NonFiniteValueException);
    REQUIRE_THROWS_AS(FormatNumber(std::numeric_limits<double>::infinity(), 2), UOM::Exceptions::NonFiniteValueException);
    REQUIRE_THROWS_AS(FormatNumber(-std::numeric_limits<double>::infinity(), 0, RoundingMode::Truncate),
                      UOM::Exceptions::NonFiniteValueException);

    try
    {
        static_cast<void>(FormatNumber(std::numeric_limits<double>::infinity(), 1));
        FAIL("expected NonFiniteValueException");
    }
    catch (const UOM::Exceptions::NonFiniteValueException& exception)
    {
        CHECK(std::isinf(exception.GetValue()));
        CHECK(std::string {exception.GetMessage()}.starts_with("non-finite value"));
    }
}

TEST_CASE("FormattedNumber builders pick the rounding mode", "[Text][NumberFormat]")
{
    const FormattedNumber rounded = Smart(2.675, 1);
    CHECK(rounded.mode == RoundingMode::Round);
    CHECK(rounded.ToString() == "2.7");

    const FormattedNumber truncated = SmartTruncate(2.675, 1);
    CHECK(truncated.mode == RoundingMode::Truncate);
    CHECK(truncated.ToString() == "2.6");

    std::stringstream stream;
    stream << Smart(3280.839895, 3) << ' ' << SmartTruncate(3280.839895, 3);
    CHECK(stream.str() == "3280.84 3280.839");

#if defined(__cpp_lib_format)
    CHECK(std::format("[{:>6}]", Smart(1.5, 2)) == "[   1.5]");
#endif
}
