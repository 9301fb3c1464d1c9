#pragma once
#include <UOM/Primitives.hpp>
#include <UOM/Units/Dimension.hpp>
#include <UOM/Units/Quantity.hpp>
#include <UOM/Units/UnitCatalog.hpp>

#include <string_view>

namespace UOM::Units
{
    namespace TemperatureConstants
    {
        /// @brief Kelvin reading of 0 °C (exact by definition).
        inline constexpr F64 CELSIUS_TO_KELVIN_OFFSET = 273.15;
        /// @brief Fahrenheit reading of 0 °C.
        inline constexpr F64 FAHRENHEIT_FREEZING_POINT = 32.0;
    }// namespace TemperatureConstants

#pragma region Temperature Units
    // Base unit: Kelvin
    struct Kelvin
    {
        using Dimension = TemperatureDimension;

        static constexpr std::string_view Symbol() noexcept { return "K"; }
        static constexpr std::string_view Name() noexcept { return "kelvin"; }

        static constexpr F64 ToBase(F64 value) noexcept
        {
            return value;// Base unit
        }

        static constexpr F64 FromBase(F64 value) noexcept
        {
            return value;// Base unit
        }
    };

    struct Celsius
    {
        using Dimension = TemperatureDimension;

        static constexpr std::string_view Symbol() noexcept { return "°C"; }
        static constexpr std::string_view Name() noexcept { return "celsius"; }

        static constexpr F64 ToBase(F64 value) noexcept
        {
            return value + TemperatureConstants::CELSIUS_TO_KELVIN_OFFSET;
        }

        static constexpr F64 FromBase(F64 value) noexcept
        {
            return value - TemperatureConstants::CELSIUS_TO_KELVIN_OFFSET;
        }
    };

    struct Fahrenheit
    {
        using Dimension = TemperatureDimension;

        static constexpr std::string_view Symbol() noexcept { return "°F"; }
        static constexpr std::string_view Name() noexcept { return "fahrenheit"; }

        static constexpr F64 ToBase(F64 value) noexcept
        {
            // F -> K
            return (value - TemperatureConstants::FAHRENHEIT_FREEZING_POINT) * 5.0 / 9.0 +
                   TemperatureConstants::CELSIUS_TO_KELVIN_OFFSET;
        }

        static constexpr F64 FromBase(F64 value) noexcept
        {
            // K -> F
            return (value - TemperatureConstants::CELSIUS_TO_KELVIN_OFFSET) * 9.0 / 5.0 +
                   TemperatureConstants::FAHRENHEIT_FREEZING_POINT;
        }
    };
#pragma endregion

    /// @brief A temperature, stored in kelvin.
    using Temperature = Quantity<Kelvin>;

    /// @brief The temperature units, in catalog order.
    enum class TemperatureUnit : UInt8
    {
        Kelvin,
        Celsius,
        Fahrenheit,
    };

    using TemperatureCatalog = UnitCatalog<TemperatureDimension, Kelvin, Celsius, Fahrenheit>;

    template<>
    struct UnitEnumTraits<TemperatureUnit>
    {
        using Dimension = TemperatureDimension;
        using Catalog   = TemperatureCatalog;
    };
}// namespace UOM::Units
