#include "stdafx.h"
#include "sidcore/SecurityIdentifier.h"

namespace sidcore
{
Sid::Sid(std::vector<std::uint8_t> bytes)
    : _bytes(std::move(bytes))
{
}

std::optional<Sid> Sid::FromPSID(PSID psid, ISecurityApi const &api)
{
    if (psid == nullptr)
    {
        return std::nullopt;
    }

    if (!api.IsValid(psid))
    {
        return std::nullopt;
    }

    DWORD length = api.Length(psid);
    std::vector<std::uint8_t> bytes(length, 0);

    DWORD err = api.Copy(length, bytes.data(), psid);
    if (err != errors::kSuccess)
    {
        Log(SIDCORE_LOG_DEBUG, "CopySid failed: %s", FormatErrorMessage(err).c_str());
        return std::nullopt;
    }

    // Comparing and hashing SIDs byte by byte is only sound for revision 1.
    // https://learn.microsoft.com/en-us/windows/win32/api/winnt/ns-winnt-sid
    if (bytes.empty() || bytes[0] != kSidRevision)
    {
        FailFast("Expected SID revision to be 1");
    }

    return Sid(std::move(bytes));
}

std::optional<Sid> Sid::FromBytes(std::vector<std::uint8_t> bytes)
{
    if (bytes.empty() || bytes[0] != kSidRevision)
    {
        return std::nullopt;
    }
    return Sid(std::move(bytes));
}

Sid Sid::FromString(std::string const &str, ISecurityApi const &api)
{
    native_string stringSid = Utf8ToNative(str);

    PSID psid = nullptr;
    DWORD err = api.FromStringSid(stringSid.c_str(), &psid);
    if (err != errors::kSuccess)
    {
        throw SidParseException(err, "ConvertStringSidToSid failed for \"" + str + "\": " + FormatErrorMessage(err));
    }
    local_ptr<void> guard = make_local<void>(psid, api);

    std::optional<Sid> sid = FromPSID(psid, api);
    if (!sid)
    {
        // the platform validated the string, it must hand back a valid SID
        FailFast("ConvertStringSidToSid returned an invalid SID for \"" + str + "\"");
    }
    return std::move(*sid);
}

std::string Sid::ToString(ISecurityApi const &api) const
{
    if (!IsWellFormed())
    {
        throw SidFormatException(errors::kInvalidSid, "Cannot format an incomplete SID of " +
                                                          std::to_string(_bytes.size()) + " bytes");
    }

    NativeChar *stringSid = nullptr;
    DWORD err = api.ToStringSid(GetSid(), &stringSid);
    if (err != errors::kSuccess)
    {
        Log(SIDCORE_LOG_DEBUG, "ConvertSidToStringSid failed: %s", FormatErrorMessage(err).c_str());
        throw SidFormatException(err, "ConvertSidToStringSid failed: " + FormatErrorMessage(err));
    }
    local_ptr<NativeChar> guard = make_local(stringSid, api);

    return NativeToUtf8(guard.get());
}

bool Sid::IsWellFormed() const
{
    if (_bytes.size() < kSidHeaderLength)
    {
        return false;
    }
    size_t subAuthorityCount = _bytes[1];
    return subAuthorityCount <= kSidMaxSubAuthorities &&
           _bytes.size() == kSidHeaderLength + kSidSubAuthorityLength * subAuthorityCount;
}

PSID Sid::GetSid() const
{
    return const_cast<std::uint8_t *>(_bytes.data());
}

std::size_t Sid::Hash() const noexcept
{
    std::uint64_t hash = 14695981039346656037ull;
    for (std::uint8_t b : _bytes)
    {
        hash ^= b;
        hash *= 1099511628211ull;
    }
    return static_cast<std::size_t>(hash);
}

std::ostream &operator<<(std::ostream &os, Sid const &sid)
{
    return os << sid.ToString();
}

namespace WellKnownSID
{
Sid World()
{
    return Sid::FromString("S-1-1-0");
}

Sid LocalSystem()
{
    return Sid::FromString("S-1-5-18");
}

Sid LocalService()
{
    return Sid::FromString("S-1-5-19");
}

Sid NetworkService()
{
    return Sid::FromString("S-1-5-20");
}

Sid Anonymous()
{
    return Sid::FromString("S-1-5-7");
}

Sid AuthenticatedUsers()
{
    return Sid::FromString("S-1-5-11");
}

Sid BuiltinAdministrators()
{
    return Sid::FromString("S-1-5-32-544");
}

Sid BuiltinUsers()
{
    return Sid::FromString("S-1-5-32-545");
}
} // namespace WellKnownSID
} // namespace sidcore
