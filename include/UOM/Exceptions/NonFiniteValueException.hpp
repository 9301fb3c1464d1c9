#pragma once

/// @file NonFiniteValueException.hpp
/// @brief Declares the NonFiniteValueException class.

#include <UOM/Exceptions/Exception.hpp>
#include <UOM/Primitives.hpp>

#include <string>

namespace UOM::Exceptions
{
    /// @class NonFiniteValueException
    /// @brief Thrown when NaN or an infinity reaches an operation that only accepts finite numbers.
    class NonFiniteValueException : public Exception
    {
    public:
        /// @param value The rejected value, kept for diagnostics.
        explicit NonFiniteValueException(F64 value)
            : Exception("non-finite value: " + std::to_string(value))
            , m_value(value)
        {
        }

        /// @brief The value that was rejected.
        [[nodiscard]] F64 GetValue() const noexcept { return m_value; }

    private:
        F64 m_value;
    };
}// namespace UOM::Exceptions
