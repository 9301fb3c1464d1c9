/// @file LengthTests.cpp
/// @brief Tests for the length units (Meter, Kilometer, Foot).

#include <UOM/Units/Length.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <array>

using namespace UOM::Units;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Meters convert to kilometers", "[Units][Length]")
{
    CHECK_THAT(Length::FromUnit<Meter>(1000.0).ToUnit<Kilometer>(), WithinAbs(1.0, 1e-12));
    CHECK_THAT(Length::FromUnit<Meter>(2500.0).ToUnit<Kilometer>(), WithinAbs(2.5, 1e-12));
    CHECK_THAT(Length::FromUnit<Meter>(0.5).ToUnit<Kilometer>(), WithinAbs(0.0005, 1e-12));
}

TEST_CASE("Kilometers convert to meters", "[Units][Length]")
{
    CHECK(Length::FromUnit<Kilometer>(1.0).ToUnit<Meter>() == 1000.0);
    CHECK(Length::FromUnit<Kilometer>(2.5).ToUnit<Meter>() == 2500.0);
    CHECK_THAT(Length::FromUnit<Kilometer>(0.001).ToUnit<Meter>(), WithinAbs(1.0, 1e-12));
}

TEST_CASE("Meters convert to feet", "[Units][Length]")
{
    CHECK_THAT(Length::FromUnit<Meter>(1.0).ToUnit<Foot>(), WithinAbs(3.280839895, 1e-9));
    CHECK_THAT(Length::FromUnit<Meter>(0.3048).ToUnit<Foot>(), WithinAbs(1.0, 1e-12));
    CHECK_THAT(Length::FromUnit<Meter>(10.0).ToUnit<Foot>(), WithinAbs(32.80839895, 1e-8));
}

TEST_CASE("Feet convert to meters using the international foot", "[Units][Length]")
{
    CHECK(Length::FromUnit<Foot>(1.0).ToUnit<Meter>() == 0.3048);
    CHECK_THAT(Length::FromUnit<Foot>(3.280839895).ToUnit<Meter>(), WithinAbs(1.0, 1e-9));
    CHECK_THAT(Length::FromUnit<Foot>(10.0).ToUnit<Meter>(), WithinAbs(3.048, 1e-12));
}

TEST_CASE("Kilometers and feet convert both ways", "[Units][Length]")
{
    CHECK_THAT(Length::FromUnit<Kilometer>(1.0).ToUnit<Foot>(), WithinAbs(3280.839895, 1e-6));
    CHECK_THAT(Length::FromUnit<Kilometer>(2.0).ToUnit<Foot>(), WithinAbs(6561.67979, 1e-5));
    CHECK_THAT(Length::FromUnit<Foot>(1.0).ToUnit<Kilometer>(), WithinAbs(0.0003048, 1e-12));
    CHECK_THAT(Length::FromUnit<Foot>(6561.67979).ToUnit<Kilometer>(), WithinAbs(2.0, 1e-8));
}

TEST_CASE("Length units round-trip through meters", "[Units][Length]")
{
    constexpr std::array<UOM::F64, 8> values {-5.0e8, -12.5, -0.3048, 0.0, 1.0e-6, 1.0, 42.195, 4.0e10};

    for (const auto value: values)
    {
        CHECK(Meter::ToBase(value) == value);
        CHECK(Meter::FromBase(value) == value);
        CHECK_THAT(Kilometer::FromBase(Kilometer::ToBase(value)), WithinRel(value, 1e-9) || WithinAbs(value, 1e-9));
        CHECK_THAT(Foot::FromBase(Foot::ToBase(value)), WithinRel(value, 1e-9) || WithinAbs(value, 1e-9));
    }
}

TEST_CASE("Length units expose their symbols", "[Units][Length]")
{
    CHECK(Meter::Symbol() == "m");
    CHECK(Kilometer::Symbol() == "km");
    CHECK(Foot::Symbol() == "ft");
}
