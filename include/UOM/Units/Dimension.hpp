#pragma once
#include <UOM/Primitives.hpp>

#include <concepts>
#include <string_view>
#include <type_traits>

namespace UOM::Units
{
#pragma region Dimension Tags

    /// @brief Marker for the temperature dimension. Declared only, never instantiated.
    struct TemperatureDimension;
    /// @brief Marker for the length dimension. Declared only, never instantiated.
    struct LengthDimension;

#pragma endregion

    //=== C++20 Concepts ===

    /// @brief Concept: a stateless unit description.
    ///
    /// A unit names the dimension it belongs to and converts between its own scale and the base
    /// unit of that dimension. Both conversions are total over F64; no physical plausibility is
    /// checked. By convention exactly one unit per dimension implements both as the identity.
    template<typename U>
    concept UnitType = requires(F64 value) {
        typename U::Dimension;
        { U::ToBase(value) } -> std::convertible_to<F64>;
        { U::FromBase(value) } -> std::convertible_to<F64>;
        { U::Symbol() } -> std::convertible_to<std::string_view>;
    };

    /// @brief Concept: a unit of the given dimension.
    template<typename U, typename Dimension>
    concept UnitOf = UnitType<U> && std::is_same_v<typename U::Dimension, Dimension>;

    /// @brief Concept: two units measuring the same dimension.
    template<typename A, typename B>
    concept SameDimension = UnitType<A> && UnitOf<B, typename A::Dimension>;
}// namespace UOM::Units
