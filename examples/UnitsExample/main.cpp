#include <initializer_list>
#include <iostream>

#include <UOM/Text/NumberFormat.hpp>
#include <UOM/Units.hpp>
using namespace UOM::Units;
using UOM::Text::Smart;

namespace
{
    template<typename From, typename To, typename Q>
    void PrintConversion(const char* label, const Q& quantity, UOM::UIntSize fromPrecision, UOM::UIntSize toPrecision)
    {
        std::cout << label << " = " << Smart(quantity.template ToUnit<From>(), fromPrecision) << ' ' << From::Symbol()
                  << " is " << Smart(quantity.template ToUnit<To>(), toPrecision) << ' ' << To::Symbol() << std::endl;
    }
}// namespace

int main()
{
    const auto fahrenheit = Temperature::FromUnit<Fahrenheit>(85.6);
    PrintConversion<Fahrenheit, Celsius>("Temp", fahrenheit, 2, 2);
    PrintConversion<Fahrenheit, Kelvin>("Temp", fahrenheit, 2, 2);

    const auto celsius = Temperature::FromUnit<Celsius>(41.0);
    PrintConversion<Celsius, Fahrenheit>("Temp", celsius, 2, 2);

    const auto distance = Length::FromUnit<Kilometer>(3.2);
    PrintConversion<Kilometer, Meter>("Length", distance, 2, 3);
    PrintConversion<Kilometer, Foot>("Length", distance, 2, 3);

    // Units picked at runtime go through the catalog
    for (const auto unit: {LengthUnit::Meter, LengthUnit::Kilometer, LengthUnit::Foot})
    {
        std::cout << "Marathon (" << GetName(unit) << "): " << Smart(Length::FromUnit<Kilometer>(42.195).ToUnit(unit), 1)
                  << ' ' << GetSymbol(unit) << std::endl;
    }

    // Quantities print in their natural unit
    std::cout << "Stored: " << celsius << ", " << distance << std::endl;

    return 0;
}
