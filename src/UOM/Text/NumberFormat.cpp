#include <UOM/Text/NumberFormat.hpp>

#include <UOM/Exceptions/Exception.hpp>
#include <UOM/Exceptions/NonFiniteValueException.hpp>

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace UOM::Text
{
    namespace
    {
        // Fractional digits needed to write the smallest subnormal double exactly.
        constexpr UIntSize MAX_FRACTIONAL_DIGITS = 1074;
        // Sign, 309 integral digits and the decimal point.
        constexpr UIntSize MAX_NON_FRACTIONAL_CHARS = 1 + 309 + 1;

        [[nodiscard]] F64 ApplyRounding(F64 value, UIntSize precision, RoundingMode mode) noexcept
        {
            const F64 factor = std::pow(10.0, static_cast<F64>(precision));
            const F64 scaled = value * factor;
            // Overflow means the value has no digits left beyond the requested precision.
            if (!std::isfinite(scaled))
                return value;

            const F64 adjusted = mode == RoundingMode::Truncate ? std::trunc(scaled) : std::round(scaled);
            return adjusted / factor;
        }

        UOM_ALWAYS_INLINE void TrimFractionalZeros(std::string& text)
        {
            if (text.find('.') == std::string::npos)
                return;
            while (text.back() == '0')
                text.pop_back();
            if (text.back() == '.')
                text.pop_back();
        }
    }// namespace

    std::string FormatNumber(F64 value, UIntSize precision, RoundingMode mode)
    {
        if (!std::isfinite(value))
            throw Exceptions::NonFiniteValueException(value);

        const UIntSize digits  = precision < MAX_FRACTIONAL_DIGITS ? precision : MAX_FRACTIONAL_DIGITS;
        F64            rounded = ApplyRounding(value, digits, mode);
        if (rounded == 0.0)
            rounded = 0.0;// drops the sign of negative zero

        std::string text(MAX_NON_FRACTIONAL_CHARS + digits, '\0');
        const auto [end, ec] = std::to_chars(text.data(), text.data() + text.size(), rounded,
                                             std::chars_format::fixed, static_cast<int>(digits));
        if (ec != std::errc {})
            throw Exceptions::Exception("FormatNumber: fixed-point conversion failed");
        text.resize(static_cast<UIntSize>(end - text.data()));

        TrimFractionalZeros(text);
        return text;
    }
}// namespace UOM::Text
