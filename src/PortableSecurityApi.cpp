#include "stdafx.h"
#include "PortableSecurityApi.h"
#include <iomanip>
#include <iterator>

namespace sidcore
{
namespace
{
constexpr std::uint64_t kMaxAuthority = 0xFFFFFFFFFFFFull;

struct SddlAlias
{
    char const *alias;
    char const *sid;
};

const SddlAlias sddlAliases[] = {
    {"WD", "S-1-1-0"},      {"CO", "S-1-3-0"},      {"CG", "S-1-3-1"},      {"IU", "S-1-5-4"},
    {"AN", "S-1-5-7"},      {"AU", "S-1-5-11"},     {"SY", "S-1-5-18"},     {"LS", "S-1-5-19"},
    {"NS", "S-1-5-20"},     {"BA", "S-1-5-32-544"}, {"BU", "S-1-5-32-545"},
};

#ifdef SIDCORE_ACCOUNT_LOOKUP
struct WellKnownAccount
{
    char const *sid;
    char const *name;
    char const *domain;
};

const WellKnownAccount wellKnownAccounts[] = {
    {"S-1-1-0", "Everyone", ""},
    {"S-1-2-0", "LOCAL", ""},
    {"S-1-3-0", "CREATOR OWNER", ""},
    {"S-1-3-1", "CREATOR GROUP", ""},
    {"S-1-5-4", "INTERACTIVE", "NT AUTHORITY"},
    {"S-1-5-7", "ANONYMOUS LOGON", "NT AUTHORITY"},
    {"S-1-5-11", "Authenticated Users", "NT AUTHORITY"},
    {"S-1-5-18", "SYSTEM", "NT AUTHORITY"},
    {"S-1-5-19", "LOCAL SERVICE", "NT AUTHORITY"},
    {"S-1-5-20", "NETWORK SERVICE", "NT AUTHORITY"},
    {"S-1-5-32-544", "Administrators", "BUILTIN"},
    {"S-1-5-32-545", "Users", "BUILTIN"},
};
#endif

std::uint8_t const *SidBytes(PSID sid)
{
    return static_cast<std::uint8_t const *>(sid);
}

DWORD SidLength(std::uint8_t const *bytes)
{
    return static_cast<DWORD>(kSidHeaderLength + kSidSubAuthorityLength * bytes[1]);
}

std::string FormatSid(std::uint8_t const *bytes)
{
    std::uint64_t authority = 0;
    for (size_t i = 2; i < kSidHeaderLength; ++i)
    {
        authority = (authority << 8) | bytes[i];
    }

    std::ostringstream out;
    out << "S-" << static_cast<unsigned>(bytes[0]) << "-";
    if (authority > 0xFFFFFFFFull)
    {
        out << "0x" << std::uppercase << std::hex << std::setw(12) << std::setfill('0') << authority << std::dec;
    }
    else
    {
        out << authority;
    }

    size_t subAuthorityCount = bytes[1];
    for (size_t i = 0; i < subAuthorityCount; ++i)
    {
        std::uint8_t const *sub = bytes + kSidHeaderLength + kSidSubAuthorityLength * i;
        std::uint32_t value = static_cast<std::uint32_t>(sub[0]) | (static_cast<std::uint32_t>(sub[1]) << 8) |
                              (static_cast<std::uint32_t>(sub[2]) << 16) | (static_cast<std::uint32_t>(sub[3]) << 24);
        out << "-" << value;
    }
    return out.str();
}

bool ParseNumber(std::string const &component, std::uint64_t max, std::uint64_t &value)
{
    std::uint64_t base = 10;
    size_t pos = 0;
    if (component.size() > 2 && component[0] == '0' && (component[1] == 'x' || component[1] == 'X'))
    {
        base = 16;
        pos = 2;
    }
    if (pos >= component.size())
    {
        return false;
    }

    value = 0;
    for (; pos < component.size(); ++pos)
    {
        char ch = component[pos];
        std::uint64_t digit;
        if (ch >= '0' && ch <= '9')
        {
            digit = ch - '0';
        }
        else if (base == 16 && ch >= 'a' && ch <= 'f')
        {
            digit = ch - 'a' + 10;
        }
        else if (base == 16 && ch >= 'A' && ch <= 'F')
        {
            digit = ch - 'A' + 10;
        }
        else
        {
            return false;
        }

        if (value > (max - digit) / base)
        {
            return false;
        }
        value = value * base + digit;
    }
    return true;
}

std::optional<std::vector<std::uint8_t>> ParseSid(std::string str)
{
    for (auto const &sddl : sddlAliases)
    {
        if (str == sddl.alias)
        {
            str = sddl.sid;
            break;
        }
    }

    if (str.size() < 2 || (str[0] != 'S' && str[0] != 's') || str[1] != '-')
    {
        return std::nullopt;
    }

    std::vector<std::string> components;
    std::string::size_type start = 2;
    while (true)
    {
        std::string::size_type dash = str.find('-', start);
        components.push_back(str.substr(start, dash == std::string::npos ? std::string::npos : dash - start));
        if (dash == std::string::npos)
        {
            break;
        }
        start = dash + 1;
    }

    // revision and authority are mandatory
    if (components.size() < 2 || components.size() - 2 > kSidMaxSubAuthorities)
    {
        return std::nullopt;
    }

    std::uint64_t revision;
    if (!ParseNumber(components[0], 0xFF, revision) || revision != kSidRevision)
    {
        return std::nullopt;
    }

    std::uint64_t authority;
    if (!ParseNumber(components[1], kMaxAuthority, authority))
    {
        return std::nullopt;
    }

    size_t subAuthorityCount = components.size() - 2;
    std::vector<std::uint8_t> bytes(kSidHeaderLength + kSidSubAuthorityLength * subAuthorityCount, 0);
    bytes[0] = kSidRevision;
    bytes[1] = static_cast<std::uint8_t>(subAuthorityCount);
    for (size_t i = 0; i < 6; ++i)
    {
        bytes[kSidHeaderLength - 1 - i] = static_cast<std::uint8_t>(authority >> (8 * i));
    }

    for (size_t i = 0; i < subAuthorityCount; ++i)
    {
        std::uint64_t value;
        if (!ParseNumber(components[i + 2], 0xFFFFFFFFull, value))
        {
            return std::nullopt;
        }
        std::uint8_t *sub = bytes.data() + kSidHeaderLength + kSidSubAuthorityLength * i;
        sub[0] = static_cast<std::uint8_t>(value);
        sub[1] = static_cast<std::uint8_t>(value >> 8);
        sub[2] = static_cast<std::uint8_t>(value >> 16);
        sub[3] = static_cast<std::uint8_t>(value >> 24);
    }
    return bytes;
}
} // namespace

bool PortableSecurityApi::IsValid(PSID sid) const
{
    if (sid == nullptr)
    {
        return false;
    }
    std::uint8_t const *bytes = SidBytes(sid);
    return bytes[0] == kSidRevision && bytes[1] <= kSidMaxSubAuthorities;
}

DWORD PortableSecurityApi::Length(PSID sid) const
{
    if (!IsValid(sid))
    {
        return 0;
    }
    return SidLength(SidBytes(sid));
}

DWORD PortableSecurityApi::Copy(DWORD length, PSID dest, PSID src) const
{
    if (dest == nullptr)
    {
        return errors::kInvalidParameter;
    }
    if (!IsValid(src))
    {
        return errors::kInvalidSid;
    }
    DWORD required = SidLength(SidBytes(src));
    if (length < required)
    {
        return errors::kInsufficientBuffer;
    }
    std::memcpy(dest, src, required);
    return errors::kSuccess;
}

DWORD PortableSecurityApi::ToStringSid(PSID sid, NativeChar **stringSid) const
{
    if (stringSid == nullptr)
    {
        return errors::kInvalidParameter;
    }
    if (!IsValid(sid))
    {
        return errors::kInvalidSid;
    }

    native_string formatted = Utf8ToNative(FormatSid(SidBytes(sid)));
    auto *result = static_cast<NativeChar *>(std::malloc((formatted.size() + 1) * sizeof(NativeChar)));
    if (result == nullptr)
    {
        return errors::kNotEnoughMemory;
    }
    std::copy(formatted.begin(), formatted.end(), result);
    result[formatted.size()] = 0;

    *stringSid = result;
    return errors::kSuccess;
}

DWORD PortableSecurityApi::FromStringSid(NativeChar const *stringSid, PSID *sid) const
{
    if (stringSid == nullptr || sid == nullptr)
    {
        return errors::kInvalidParameter;
    }

    std::optional<std::vector<std::uint8_t>> bytes = ParseSid(NativeToUtf8(stringSid));
    if (!bytes)
    {
        return errors::kInvalidSid;
    }

    void *result = std::malloc(bytes->size());
    if (result == nullptr)
    {
        return errors::kNotEnoughMemory;
    }
    std::memcpy(result, bytes->data(), bytes->size());

    *sid = result;
    return errors::kSuccess;
}

#ifdef SIDCORE_ACCOUNT_LOOKUP
DWORD PortableSecurityApi::LookupAccount(NativeChar const *systemName, PSID sid, NativeChar *name, DWORD *cchName,
                                         NativeChar *domain, DWORD *cchDomain) const
{
    if (cchName == nullptr || cchDomain == nullptr)
    {
        return errors::kInvalidParameter;
    }
    if (!IsValid(sid))
    {
        return errors::kInvalidSid;
    }
    if (systemName != nullptr && systemName[0] != 0)
    {
        // remote machines cannot be queried without advapi32
        return errors::kNotSupported;
    }

    std::string formatted = FormatSid(SidBytes(sid));
    auto account = std::find_if(std::begin(wellKnownAccounts), std::end(wellKnownAccounts),
                                [&formatted](WellKnownAccount const &wk) { return formatted == wk.sid; });
    if (account == std::end(wellKnownAccounts))
    {
        return errors::kNoneMapped;
    }

    native_string accountName = Utf8ToNative(account->name);
    native_string domainName = Utf8ToNative(account->domain);
    auto nameRequired = static_cast<DWORD>(accountName.size() + 1);
    auto domainRequired = static_cast<DWORD>(domainName.size() + 1);
    if (name == nullptr || domain == nullptr || *cchName < nameRequired || *cchDomain < domainRequired)
    {
        *cchName = nameRequired;
        *cchDomain = domainRequired;
        return errors::kInsufficientBuffer;
    }

    std::copy(accountName.begin(), accountName.end(), name);
    name[accountName.size()] = 0;
    std::copy(domainName.begin(), domainName.end(), domain);
    domain[domainName.size()] = 0;

    *cchName = nameRequired - 1;
    *cchDomain = domainRequired - 1;
    return errors::kSuccess;
}
#endif

void PortableSecurityApi::Free(void *mem) const
{
    std::free(mem);
}

ISecurityApi const &DefaultSecurityApi()
{
    static PortableSecurityApi api;
    return api;
}
} // namespace sidcore
