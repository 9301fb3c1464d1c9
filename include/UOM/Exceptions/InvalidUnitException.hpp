#pragma once

/// @file InvalidUnitException.hpp
/// @brief Declares the InvalidUnitException class.

#include <UOM/Exceptions/Exception.hpp>
#include <UOM/Primitives.hpp>

#include <string>

namespace UOM::Exceptions
{
    /// @class InvalidUnitException
    /// @brief Thrown when a unit enumerator does not name a unit of its catalog.
    ///
    /// @details
    /// Only reachable by casting an out-of-range integer to a unit enumeration.
    class InvalidUnitException : public Exception
    {
    public:
        InvalidUnitException(UIntSize index, UIntSize count)
            : Exception("invalid unit index " + std::to_string(index) + " (catalog holds " + std::to_string(count) + " units)")
            , m_index(index)
        {
        }

        [[nodiscard]] UIntSize GetIndex() const noexcept { return m_index; }

    private:
        UIntSize m_index;
    };
}// namespace UOM::Exceptions
