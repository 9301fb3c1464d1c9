#pragma once

/// @file NumberFormat.hpp
/// @brief Fixed-precision number rendering with trailing zeros trimmed.

#include <UOM/Defines.hpp>
#include <UOM/Primitives.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <version>
#if defined(__cpp_lib_format)
#include <format>
#endif

namespace UOM::Text
{
    /// @brief How digits past the requested precision are discarded.
    enum class RoundingMode : UInt8
    {
        Round,   ///< Round to nearest, halfway cases away from zero.
        Truncate,///< Drop the extra digits (round toward zero).
    };

    /// @brief Renders @p value with at most @p precision fractional digits.
    ///
    /// @details
    /// The value is rounded (or truncated) at @p precision digits first and then written in fixed
    /// notation, so a carry such as 9.996 -> 10.00 is already part of the digits being written.
    /// Trailing fractional zeros are removed, followed by the decimal point if no digits remain.
    /// A result that is zero is written as "0", never "-0".
    ///
    /// @code
    /// FormatNumber(1.2345, 2);                          // "1.23"
    /// FormatNumber(2.0, 3);                             // "2"
    /// FormatNumber(-0.5001, 2, RoundingMode::Truncate); // "-0.5"
    /// @endcode
    ///
    /// @throws UOM::Exceptions::NonFiniteValueException when @p value is NaN or infinite.
    [[nodiscard]] UOM_API std::string FormatNumber(F64 value, UIntSize precision, RoundingMode mode = RoundingMode::Round);

    /// @brief A number bundled with the way it should be displayed.
    struct FormattedNumber
    {
        F64          value {0.0};
        UIntSize     precision {0};
        RoundingMode mode {RoundingMode::Round};

        [[nodiscard]] std::string ToString() const
        {
            return FormatNumber(value, precision, mode);
        }

        friend std::ostream& operator<<(std::ostream& os, const FormattedNumber& number)
        {
            return os << number.ToString();
        }
    };

    /// @brief @p value rounded to @p precision digits for display.
    [[nodiscard]] constexpr FormattedNumber Smart(F64 value, UIntSize precision) noexcept
    {
        return FormattedNumber {value, precision, RoundingMode::Round};
    }

    /// @brief @p value truncated to @p precision digits for display.
    [[nodiscard]] constexpr FormattedNumber SmartTruncate(F64 value, UIntSize precision) noexcept
    {
        return FormattedNumber {value, precision, RoundingMode::Truncate};
    }
}// namespace UOM::Text

#if defined(__cpp_lib_format)

//=== std::formatter integration ===
namespace std
{
    template<>
    struct formatter<UOM::Text::FormattedNumber, char> : public std::formatter<std::string_view, char>
    {
        template<typename FormatContext>
        auto format(const UOM::Text::FormattedNumber& number, FormatContext& ctx) const
        {
            const std::string text = number.ToString();
            return std::formatter<std::string_view, char>::format(text, ctx);
        }
    };
}// namespace std
#endif// __cpp_lib_format
