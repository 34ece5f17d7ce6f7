#pragma once
#include "sidcore/SID.h"

namespace sidcore
{
/// <summary>
/// The operating system services a Sid relies on.
/// </summary>
/// Every method mirrors the advapi32 function of the same purpose, but returns
/// an error code instead of setting the thread's last error so that the
/// interface can be mocked.
class ISecurityApi
{
public:
    /// <summary>
    /// Check that the structure referenced by <paramref name="sid"/> is a well formed SID.
    /// </summary>
    virtual bool IsValid(PSID sid) const = 0;

    /// <summary>
    /// Get the length, in bytes, of a valid SID.
    /// </summary>
    virtual DWORD Length(PSID sid) const = 0;

    /// <summary>
    /// Copy <paramref name="src"/> into a buffer of <paramref name="length"/> bytes.
    /// </summary>
    /// <returns>errors::kSuccess if the SID was copied, an error code otherwise.</returns>
    virtual DWORD Copy(DWORD length, PSID dest, PSID src) const = 0;

    /// <summary>
    /// Convert a SID to its canonical string form.
    /// </summary>
    /// On success <paramref name="stringSid"/> receives a null-terminated string that
    /// must be released with <see cref="Free"/>.
    virtual DWORD ToStringSid(PSID sid, NativeChar **stringSid) const = 0;

    /// <summary>
    /// Convert a null-terminated canonical string to a SID.
    /// </summary>
    /// On success <paramref name="sid"/> receives a structure that must be released
    /// with <see cref="Free"/>.
    virtual DWORD FromStringSid(NativeChar const *stringSid, PSID *sid) const = 0;

#ifdef SIDCORE_ACCOUNT_LOOKUP
    /// <summary>
    /// Retrieve the account name and domain of a SID.
    /// </summary>
    /// When a buffer is too small, both lengths are set to the required sizes (in
    /// characters, terminator included) and errors::kInsufficientBuffer is returned.
    /// On success they are set to the copied lengths, terminator excluded.
    /// A null <paramref name="systemName"/> means the local machine.
    virtual DWORD LookupAccount(NativeChar const *systemName, PSID sid, NativeChar *name, DWORD *cchName,
                                NativeChar *domain, DWORD *cchDomain) const = 0;
#endif

    /// <summary>
    /// Release memory allocated by <see cref="ToStringSid"/> or <see cref="FromStringSid"/>.
    /// </summary>
    virtual void Free(void *mem) const = 0;

protected:
    virtual ~ISecurityApi()
    {
    }
};

/// The security API of the platform the library was built for.
ISecurityApi const &DefaultSecurityApi();

template <class P> void local_deleter<P>::operator()(pointer ptr) const
{
    if (api != nullptr && ptr != nullptr)
    {
        api->Free(ptr);
    }
}
} // namespace sidcore
