#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace sidcore
{
#ifdef _WIN32
using PSID = ::PSID;
using DWORD = ::DWORD;
using NativeChar = WCHAR;
#else
using PSID = void *;
using DWORD = std::uint32_t;
using NativeChar = char16_t;
#endif

/// The only SID revision the library understands.
constexpr std::uint8_t kSidRevision = 1;

/// Maximum number of sub-authorities a revision 1 SID can hold.
constexpr std::uint8_t kSidMaxSubAuthorities = 15;

/// Revision, sub-authority count and the 48-bit identifier authority.
constexpr std::size_t kSidHeaderLength = 8;

/// Each sub-authority is a little-endian 32-bit value.
constexpr std::size_t kSidSubAuthorityLength = 4;

/// Win32 error codes, available on every platform.
namespace errors
{
constexpr DWORD kSuccess = 0;
constexpr DWORD kNotEnoughMemory = 8;
constexpr DWORD kNotSupported = 50;
constexpr DWORD kInvalidParameter = 87;
constexpr DWORD kInsufficientBuffer = 122;
constexpr DWORD kNoneMapped = 1332;
constexpr DWORD kInvalidSid = 1337;
} // namespace errors

class ISecurityApi;

/// Releases memory allocated by an ISecurityApi conversion.
template <class P> struct local_deleter
{
    typedef P *pointer;

    ISecurityApi const *api = nullptr;

    local_deleter() = default;
    explicit local_deleter(ISecurityApi const &owner)
        : api(&owner)
    {
    }

    void operator()(pointer ptr) const;
};

template <class P> using local_ptr = std::unique_ptr<P, local_deleter<P>>;

/// Takes ownership of a native allocation returned by \p api.
template <class P> local_ptr<P> make_local(P *ptr, ISecurityApi const &api)
{
    return local_ptr<P>(ptr, local_deleter<P>(api));
}
} // namespace sidcore
