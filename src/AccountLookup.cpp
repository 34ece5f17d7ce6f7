#include "stdafx.h"
#include "sidcore/SecurityIdentifier.h"

#ifdef SIDCORE_ACCOUNT_LOOKUP

namespace sidcore
{
std::optional<Account> Sid::LookupAccount(ISecurityApi const &api, std::string const &systemName) const
{
    if (!IsWellFormed())
    {
        Log(SIDCORE_LOG_DEBUG, "LookupAccountSid skipped: incomplete SID of %zu bytes", _bytes.size());
        return std::nullopt;
    }

    native_string system = Utf8ToNative(systemName);
    NativeChar const *host = systemName.empty() ? nullptr : system.c_str();

    DWORD cchName = 0;
    DWORD cchDomain = 0;
    DWORD err = api.LookupAccount(host, GetSid(), nullptr, &cchName, nullptr, &cchDomain);
    if (err != errors::kSuccess && err != errors::kInsufficientBuffer)
    {
        Log(SIDCORE_LOG_DEBUG, "LookupAccountSid failed: %s", FormatErrorMessage(err).c_str());
        return std::nullopt;
    }

    // +1 in case a length is 0
    std::vector<NativeChar> name(cchName + 1, 0);
    std::vector<NativeChar> domain(cchDomain + 1, 0);
    DWORD probedDomainLength = cchDomain;

    err = api.LookupAccount(host, GetSid(), name.data(), &cchName, domain.data(), &cchDomain);
    if (err != errors::kSuccess)
    {
        Log(SIDCORE_LOG_DEBUG, "LookupAccountSid failed: %s", FormatErrorMessage(err).c_str());
        return std::nullopt;
    }

    Account account;
    account.Name = NativeToUtf8(name.data(), name.size());
    // the probed length includes the terminator, so 1 means an empty domain
    if (probedDomainLength > 1)
    {
        std::string domainName = NativeToUtf8(domain.data(), domain.size());
        if (!domainName.empty())
        {
            account.Domain = std::move(domainName);
        }
    }
    return account;
}

std::optional<std::string> Sid::LookupAccountName(ISecurityApi const &api, std::string const &systemName) const
{
    std::optional<Account> account = LookupAccount(api, systemName);
    if (!account)
    {
        return std::nullopt;
    }
    return std::move(account->Name);
}
} // namespace sidcore

#endif
