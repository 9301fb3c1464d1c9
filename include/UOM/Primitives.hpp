// Fundamental type aliases shared by every UOM header.
#pragma once
#include <cstddef>
#include <cstdint>

namespace UOM
{
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a 64-bit floating point number.
    /// @details Every magnitude stored or converted by the unit system is an F64.
    using F64 = double;

    using UIntSize = std::size_t;
}// namespace UOM
