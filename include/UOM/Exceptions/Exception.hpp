#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <version>
#if defined(__cpp_lib_stacktrace)
#include <stacktrace>
#endif

namespace UOM::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions thrown by UOM.
    ///
    /// @details
    /// Carries a message retrievable through `GetMessage`. Where the standard library ships
    /// `std::stacktrace`, the trace is captured lazily on the first call to `GetStacktrace`.
    class Exception : public std::runtime_error
    {
    public:
        explicit Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        explicit Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        virtual ~Exception() noexcept = default;

        /// @brief Returns the exception message.
        const char* GetMessage() const noexcept { return this->what(); }

#if defined(__cpp_lib_stacktrace)
        /// @brief Returns the stacktrace of the point where it was first requested.
        inline const std::stacktrace& GetStacktrace() const
        {
            if (!stacktrace.has_value())
                stacktrace = std::stacktrace::current();
            return stacktrace.value();
        }

    private:
        mutable std::optional<std::stacktrace> stacktrace;///< Lazily captured trace.
#endif
    };
}// namespace UOM::Exceptions
