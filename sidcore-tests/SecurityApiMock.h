#pragma once

#include <gmock/gmock.h>
#include "sidcore/ISecurityApi.h"

class SecurityApiMock : public sidcore::ISecurityApi
{
public:
    MOCK_METHOD(bool,           IsValid,        (sidcore::PSID sid), (const, override));
    MOCK_METHOD(sidcore::DWORD, Length,         (sidcore::PSID sid), (const, override));
    MOCK_METHOD(sidcore::DWORD, Copy,           (sidcore::DWORD length, sidcore::PSID dest, sidcore::PSID src), (const, override));
    MOCK_METHOD(sidcore::DWORD, ToStringSid,    (sidcore::PSID sid, sidcore::NativeChar **stringSid), (const, override));
    MOCK_METHOD(sidcore::DWORD, FromStringSid,  (sidcore::NativeChar const *stringSid, sidcore::PSID *sid), (const, override));
#ifdef SIDCORE_ACCOUNT_LOOKUP
    MOCK_METHOD(sidcore::DWORD, LookupAccount,  (sidcore::NativeChar const *systemName, sidcore::PSID sid,
                                                 sidcore::NativeChar *name, sidcore::DWORD *cchName,
                                                 sidcore::NativeChar *domain, sidcore::DWORD *cchDomain), (const, override));
#endif
    MOCK_METHOD(void,           Free,           (void *mem), (const, override));
};
