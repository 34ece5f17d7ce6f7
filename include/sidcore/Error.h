#pragma once
#include <stdexcept>
#include <string>
#include "sidcore/SID.h"

namespace sidcore
{
/// @brief Renders an error code as "<message> (0x<code>)".
std::string FormatErrorMessage(DWORD error);

/// @brief Logs \p message at critical level, prints it to stderr and aborts.
///
/// Used when a platform call breaks a guarantee the library depends on, such as
/// handing back a SID whose revision is not 1.
[[noreturn]] void FailFast(std::string const &message);

class SidException : public std::runtime_error
{
    DWORD _errorCode;

public:
    /// @brief Constructor
    ///
    /// @param errorCode The platform error code
    /// @param message A description of the failed operation
    SidException(DWORD errorCode, std::string const &message)
        : std::runtime_error(message)
        , _errorCode(errorCode)
    {
    }

    /// @brief Gets the error code.
    ///
    /// @return The error code.
    DWORD GetErrorCode() const
    {
        return _errorCode;
    }
};

/// Thrown when a string cannot be converted to a SID.
class SidParseException : public SidException
{
public:
    using SidException::SidException;
};

/// Thrown when a SID cannot be converted to its string form.
class SidFormatException : public SidException
{
public:
    using SidException::SidException;
};
} // namespace sidcore
