#pragma once
#include <UOM/Primitives.hpp>
#include <UOM/Units/Dimension.hpp>
#include <UOM/Units/UnitCatalog.hpp>

#include <compare>
#include <ostream>
#include <type_traits>
#include <version>
#if defined(__cpp_lib_format)
#include <format>
#endif

namespace UOM::Units
{
    /// @brief A physical quantity stored in the base unit of its dimension.
    ///
    /// @details
    /// `NaturalUnit` only fixes the dimension (and the unit used when the quantity is printed); the
    /// magnitude is always held in base units. Every conversion goes source → base → target, so a
    /// unit only has to know its own two conversions. Requesting a unit of another dimension does not
    /// compile:
    ///
    /// @code
    /// auto temperature = Temperature::FromUnit<Celsius>(25.0);
    /// temperature.ToUnit<Fahrenheit>();// 77
    /// temperature.ToUnit<Meter>();     // error: constraints not satisfied
    /// @endcode
    ///
    /// @tparam NaturalUnit Any unit of the dimension.
    template<UnitType NaturalUnit>
    class Quantity
    {
    public:
        using Dimension       = typename NaturalUnit::Dimension;
        using NaturalUnitType = NaturalUnit;

        /// @brief Creates a quantity from @p value expressed in @p SourceUnit.
        template<UnitOf<Dimension> SourceUnit>
        [[nodiscard]] static constexpr Quantity FromUnit(F64 value) noexcept
        {
            return Quantity(static_cast<F64>(SourceUnit::ToBase(value)));
        }

        /// @brief Creates a quantity from @p value expressed in a unit chosen at runtime.
        /// @throws UOM::Exceptions::InvalidUnitException when @p unit is not one of the enumerators.
        template<UnitEnumeration E>
            requires std::is_same_v<typename UnitEnumTraits<E>::Dimension, Dimension>
        [[nodiscard]] static constexpr Quantity FromUnit(E unit, F64 value)
        {
            return Quantity(Describe(unit).toBase(value));
        }

        /// @brief Returns the magnitude expressed in @p TargetUnit.
        template<UnitOf<Dimension> TargetUnit>
        [[nodiscard]] constexpr F64 ToUnit() const noexcept
        {
            return static_cast<F64>(TargetUnit::FromBase(m_base));
        }

        /// @brief Returns the magnitude expressed in a unit chosen at runtime.
        /// @throws UOM::Exceptions::InvalidUnitException when @p unit is not one of the enumerators.
        template<UnitEnumeration E>
            requires std::is_same_v<typename UnitEnumTraits<E>::Dimension, Dimension>
        [[nodiscard]] constexpr F64 ToUnit(E unit) const
        {
            return Describe(unit).fromBase(m_base);
        }

        /// @brief Raw stored value in the dimension's base unit.
        [[nodiscard]] constexpr F64 GetBaseValue() const noexcept
        {
            return m_base;
        }

        constexpr bool operator==(const Quantity& other) const noexcept = default;
        constexpr auto operator<=>(const Quantity& other) const noexcept = default;

        friend std::ostream& operator<<(std::ostream& os, const Quantity& quantity)
        {
            return os << quantity.template ToUnit<NaturalUnit>() << ' ' << NaturalUnit::Symbol();
        }

    private:
        constexpr explicit Quantity(F64 base) noexcept
            : m_base(base)
        {
        }

        F64 m_base;
    };
}// namespace UOM::Units

#if defined(__cpp_lib_format)

//=== std::formatter integration ===
namespace std
{
    template<UOM::Units::UnitType NaturalUnit, typename CharT>
    struct formatter<UOM::Units::Quantity<NaturalUnit>, CharT> : public std::formatter<UOM::F64, CharT>
    {
        // number parsing is delegated to std::formatter<F64, CharT>
        using Base = std::formatter<UOM::F64, CharT>;

        constexpr auto parse(std::basic_format_parse_context<CharT>& ctx)
        {
            return Base::parse(ctx);
        }

        template<typename FormatContext>
        auto format(const UOM::Units::Quantity<NaturalUnit>& quantity, FormatContext& ctx) const
        {
            ctx.advance_to(Base::format(quantity.template ToUnit<NaturalUnit>(), ctx));
            return std::format_to(ctx.out(), " {}", NaturalUnit::Symbol());
        }
    };
}// namespace std
#endif// __cpp_lib_format
