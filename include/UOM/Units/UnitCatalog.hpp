#pragma once
#include <UOM/Exceptions/InvalidUnitException.hpp>
#include <UOM/Primitives.hpp>
#include <UOM/Units/Dimension.hpp>

#include <array>
#include <concepts>
#include <string_view>
#include <type_traits>

namespace UOM::Units
{
    /// @brief Runtime view of a single unit: its two conversions and its display strings.
    struct UnitDescriptor
    {
        F64 (*toBase)(F64)   = nullptr;
        F64 (*fromBase)(F64) = nullptr;
        std::string_view symbol {};
        std::string_view name {};
    };

    /// @brief Concept: a unit that also carries a human-readable name.
    template<typename U>
    concept NamedUnitType = UnitType<U> && requires {
        { U::Name() } -> std::convertible_to<std::string_view>;
    };

    namespace detail
    {
        /// @brief Probes whether both conversions of @p U behave as the identity.
        template<typename U>
        constexpr bool IsIdentityUnit() noexcept
        {
            return U::ToBase(0.0) == 0.0 && U::ToBase(1.0) == 1.0 && U::ToBase(-2.5) == -2.5 &&
                   U::FromBase(1.0) == 1.0 && U::FromBase(-2.5) == -2.5;
        }
    }// namespace detail

    /// @brief Closed, ordered table of the units of one dimension.
    ///
    /// @details
    /// The catalog is built at compile time from the unit structs, so each entry dispatches straight
    /// to the same ToBase/FromBase used by the statically typed conversions. Entry order defines the
    /// index that a dimension's unit enumeration maps onto.
    ///
    /// @tparam Dimension The dimension tag shared by every unit.
    /// @tparam Units     The units of the dimension, in enumerator order.
    template<typename Dimension, typename... Units>
    class UnitCatalog
    {
        static_assert(sizeof...(Units) > 0, "UnitCatalog requires at least one unit");
        static_assert((NamedUnitType<Units> && ...), "UnitCatalog entries must be named units");
        static_assert((UnitOf<Units, Dimension> && ...), "UnitCatalog entries must share the catalog dimension");

        static_assert((static_cast<UIntSize>(detail::IsIdentityUnit<Units>()) + ...) == 1,
                      "Exactly one unit per dimension must be the base unit");

    public:
        using DimensionType = Dimension;

        [[nodiscard]] static constexpr UIntSize Count() noexcept
        {
            return sizeof...(Units);
        }

        /// @brief Returns the descriptor at @p index.
        /// @throws UOM::Exceptions::InvalidUnitException when @p index is not below Count().
        [[nodiscard]] static constexpr const UnitDescriptor& Get(UIntSize index)
        {
            if (index >= Count())
                throw Exceptions::InvalidUnitException(index, Count());
            return s_descriptors[index];
        }

        /// @brief Index of unit @p U within the catalog.
        template<typename U>
            requires(std::is_same_v<U, Units> || ...)
        [[nodiscard]] static constexpr UIntSize IndexOf() noexcept
        {
            UIntSize index = 0;
            UIntSize found = 0;
            ((std::is_same_v<U, Units> ? (found = index, ++index) : ++index), ...);
            return found;
        }

        /// @brief Index of the unit whose conversions are the identity.
        [[nodiscard]] static constexpr UIntSize GetBaseUnitIndex() noexcept
        {
            UIntSize index = 0;
            UIntSize found = 0;
            ((detail::IsIdentityUnit<Units>() ? (found = index, ++index) : ++index), ...);
            return found;
        }

    private:
        static constexpr std::array<UnitDescriptor, sizeof...(Units)> s_descriptors {
                UnitDescriptor {&Units::ToBase, &Units::FromBase, Units::Symbol(), Units::Name()}...};
    };

    /// @brief Binds a unit enumeration to its dimension and catalog.
    ///
    /// A valid specialization provides:
    /// using Dimension = ...;  // the dimension tag
    /// using Catalog   = ...;  // UnitCatalog whose entry order matches the enumerator values
    template<typename E>
    struct UnitEnumTraits;

    /// @brief Concept: an enumeration with a UnitEnumTraits specialization.
    template<typename E>
    concept UnitEnumeration = std::is_enum_v<E> && requires {
        typename UnitEnumTraits<E>::Dimension;
        typename UnitEnumTraits<E>::Catalog;
    };

    /// @brief Looks up the catalog entry for a runtime-selected unit.
    /// @throws UOM::Exceptions::InvalidUnitException when @p unit is not one of the enumerators.
    template<UnitEnumeration E>
    [[nodiscard]] constexpr const UnitDescriptor& Describe(E unit)
    {
        return UnitEnumTraits<E>::Catalog::Get(static_cast<UIntSize>(static_cast<std::underlying_type_t<E>>(unit)));
    }

    template<UnitEnumeration E>
    [[nodiscard]] constexpr std::string_view GetSymbol(E unit)
    {
        return Describe(unit).symbol;
    }

    template<UnitEnumeration E>
    [[nodiscard]] constexpr std::string_view GetName(E unit)
    {
        return Describe(unit).name;
    }
}// namespace UOM::Units
