#include "stdafx.h"
#include <cstdio>

namespace sidcore
{
namespace
{
std::string SystemErrorText(DWORD error)
{
#ifdef _WIN32
    std::wstring buf;
    buf.resize(1024);
    DWORD len = FormatMessageW(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, nullptr, error, 0,
                               buf.data(), 1023, nullptr);
    if (len == 0)
    {
        return "Unknown error";
    }
    buf.resize(len);
    buf.erase(std::remove(buf.begin(), buf.end(), L'\n'), buf.end());
    buf.erase(std::remove(buf.begin(), buf.end(), L'\r'), buf.end());
    return NativeToUtf8(buf.c_str());
#else
    switch (error)
    {
    case errors::kSuccess:
        return "The operation completed successfully.";
    case errors::kNotEnoughMemory:
        return "Not enough memory resources are available to process this command.";
    case errors::kNotSupported:
        return "The request is not supported.";
    case errors::kInvalidParameter:
        return "The parameter is incorrect.";
    case errors::kInsufficientBuffer:
        return "The data area passed to a system call is too small.";
    case errors::kNoneMapped:
        return "No mapping between account names and security IDs was done.";
    case errors::kInvalidSid:
        return "The security ID structure is invalid.";
    default:
        return "Unknown error";
    }
#endif
}
} // namespace

std::string FormatErrorMessage(DWORD error)
{
    std::stringstream sstream;
    sstream << SystemErrorText(error) << " (" << std::hex << "0x" << error << ")";
    return sstream.str();
}

void FailFast(std::string const &message)
{
    Log(SIDCORE_LOG_CRITICAL, "%s", message.c_str());
    fprintf(stderr, "sidcore: fatal: %s\n", message.c_str());
    fflush(stderr);
    std::abort();
}
} // namespace sidcore
