#pragma once
#include "sidcore/ISecurityApi.h"

namespace sidcore
{
/// ISecurityApi over advapi32.
class Win32SecurityApi : public ISecurityApi
{
public:
    bool IsValid(PSID sid) const override;
    DWORD Length(PSID sid) const override;
    DWORD Copy(DWORD length, PSID dest, PSID src) const override;
    DWORD ToStringSid(PSID sid, NativeChar **stringSid) const override;
    DWORD FromStringSid(NativeChar const *stringSid, PSID *sid) const override;
#ifdef SIDCORE_ACCOUNT_LOOKUP
    DWORD LookupAccount(NativeChar const *systemName, PSID sid, NativeChar *name, DWORD *cchName, NativeChar *domain,
                        DWORD *cchDomain) const override;
#endif
    void Free(void *mem) const override;
};
} // namespace sidcore
