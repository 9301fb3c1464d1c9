#pragma once
#include <UOM/Primitives.hpp>
#include <UOM/Units/Dimension.hpp>
#include <UOM/Units/Quantity.hpp>
#include <UOM/Units/UnitCatalog.hpp>

#include <string_view>

namespace UOM::Units
{
    namespace LengthConstants
    {
        inline constexpr F64 METERS_PER_KILOMETER = 1000.0;
        /// @brief The international foot, exact by definition.
        inline constexpr F64 METERS_PER_FOOT = 0.3048;
    }// namespace LengthConstants

#pragma region Length Units
    // Base unit: Meter
    struct Meter
    {
        using Dimension = LengthDimension;

        static constexpr std::string_view Symbol() noexcept { return "m"; }
        static constexpr std::string_view Name() noexcept { return "meter"; }

        static constexpr F64 ToBase(F64 value) noexcept
        {
            return value;// Base unit
        }

        static constexpr F64 FromBase(F64 value) noexcept
        {
            return value;// Base unit
        }
    };

    struct Kilometer
    {
        using Dimension = LengthDimension;

        static constexpr std::string_view Symbol() noexcept { return "km"; }
        static constexpr std::string_view Name() noexcept { return "kilometer"; }

        static constexpr F64 ToBase(F64 value) noexcept
        {
            return value * LengthConstants::METERS_PER_KILOMETER;
        }

        static constexpr F64 FromBase(F64 value) noexcept
        {
            return value / LengthConstants::METERS_PER_KILOMETER;
        }
    };

    // Imperial
    struct Foot
    {
        using Dimension = LengthDimension;

        static constexpr std::string_view Symbol() noexcept { return "ft"; }
        static constexpr std::string_view Name() noexcept { return "foot"; }

        static constexpr F64 ToBase(F64 value) noexcept
        {
            return value * LengthConstants::METERS_PER_FOOT;
        }

        static constexpr F64 FromBase(F64 value) noexcept
        {
            return value / LengthConstants::METERS_PER_FOOT;
        }
    };
#pragma endregion

    /// @brief A length, stored in meters.
    using Length = Quantity<Meter>;

    enum class LengthUnit : UInt8
    {
        Meter,
        Kilometer,
        Foot,
    };

    using LengthCatalog = UnitCatalog<LengthDimension, Meter, Kilometer, Foot>;

    template<>
    struct UnitEnumTraits<LengthUnit>
    {
        using Dimension = LengthDimension;
        using Catalog   = LengthCatalog;
    };
}// namespace UOM::Units
