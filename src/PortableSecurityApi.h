#pragma once
#include "sidcore/ISecurityApi.h"

namespace sidcore
{
/// <summary>
/// ISecurityApi for hosts without advapi32.
/// </summary>
/// Works directly on the revision 1 layout: revision, sub-authority count,
/// a 48-bit big-endian identifier authority, then the little-endian 32-bit
/// sub-authorities. Account lookup only knows the built-in well-known
/// principals.
class PortableSecurityApi : public ISecurityApi
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
