#include "stdafx.h"
#include "Win32SecurityApi.h"

namespace sidcore
{
bool Win32SecurityApi::IsValid(PSID sid) const
{
    return IsValidSid(sid) != FALSE;
}

DWORD Win32SecurityApi::Length(PSID sid) const
{
    return GetLengthSid(sid);
}

DWORD Win32SecurityApi::Copy(DWORD length, PSID dest, PSID src) const
{
    if (!CopySid(length, dest, src))
    {
        return GetLastError();
    }
    return ERROR_SUCCESS;
}

DWORD Win32SecurityApi::ToStringSid(PSID sid, NativeChar **stringSid) const
{
    if (!ConvertSidToStringSidW(sid, stringSid))
    {
        return GetLastError();
    }
    return ERROR_SUCCESS;
}

DWORD Win32SecurityApi::FromStringSid(NativeChar const *stringSid, PSID *sid) const
{
    if (!ConvertStringSidToSidW(stringSid, sid))
    {
        return GetLastError();
    }
    return ERROR_SUCCESS;
}

#ifdef SIDCORE_ACCOUNT_LOOKUP
DWORD Win32SecurityApi::LookupAccount(NativeChar const *systemName, PSID sid, NativeChar *name, DWORD *cchName,
                                      NativeChar *domain, DWORD *cchDomain) const
{
    SID_NAME_USE use;
    if (!LookupAccountSidW(systemName, sid, name, cchName, domain, cchDomain, &use))
    {
        return GetLastError();
    }
    return ERROR_SUCCESS;
}
#endif

void Win32SecurityApi::Free(void *mem) const
{
    (void)LocalFree(mem);
}

ISecurityApi const &DefaultSecurityApi()
{
    static Win32SecurityApi api;
    return api;
}
} // namespace sidcore
