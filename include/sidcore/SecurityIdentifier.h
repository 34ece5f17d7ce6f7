#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "sidcore/ISecurityApi.h"

namespace sidcore
{
#ifdef SIDCORE_ACCOUNT_LOOKUP
/// The account a SID maps to.
struct Account
{
    std::string Name;
    std::optional<std::string> Domain;
};
#endif

/// <summary>
/// Sid is an owned copy of a revision 1 security identifier.
/// </summary>
/// The bytes are copied out of the platform structure at construction and never
/// change afterwards. For revision 1, two SIDs are equal exactly when their bytes
/// are, so equality, ordering and hashing all work on the raw bytes.
class Sid
{
public:
    /// <summary>
    /// Copies the SID referenced by <paramref name="psid"/>.
    /// </summary>
    /// The caller keeps ownership of <paramref name="psid"/>.
    /// <returns>The copy, or nothing if the handle is null, invalid, or cannot be copied.</returns>
    [[nodiscard]] static std::optional<Sid> FromPSID(PSID psid, ISecurityApi const &api = DefaultSecurityApi());

    /// <summary>
    /// Wraps bytes already holding a binary SID.
    /// </summary>
    /// The bytes are kept verbatim. A layout that is not a complete SID is
    /// refused later by <see cref="ToString"/> and <see cref="LookupAccount"/>.
    /// <returns>The SID, or nothing if <paramref name="bytes"/> is empty or not revision 1.</returns>
    [[nodiscard]] static std::optional<Sid> FromBytes(std::vector<std::uint8_t> bytes);

    /// <summary>
    /// Parses the canonical string form of a SID, e.g. "S-1-5-18".
    /// </summary>
    /// <exception cref="SidParseException">The platform rejected the string.</exception>
    [[nodiscard]] static Sid FromString(std::string const &str, ISecurityApi const &api = DefaultSecurityApi());

    /// <summary>
    /// Formats the SID in its canonical string form.
    /// </summary>
    /// <exception cref="SidFormatException">The bytes are not a complete SID, or the platform could not convert it.</exception>
    [[nodiscard]] std::string ToString(ISecurityApi const &api = DefaultSecurityApi()) const;

#ifdef SIDCORE_ACCOUNT_LOOKUP
    /// <summary>
    /// Resolves the account name and domain of this SID.
    /// </summary>
    /// Resolution is best effort: incomplete SIDs, unmapped SIDs and lookup failures give nothing.
    /// <param name="systemName">The machine to ask, empty for the local one.</param>
    [[nodiscard]] std::optional<Account> LookupAccount(ISecurityApi const &api = DefaultSecurityApi(),
                                                       std::string const &systemName = std::string()) const;

    /// <summary>
    /// Resolves the account name of this SID, see <see cref="LookupAccount"/>.
    /// </summary>
    [[nodiscard]] std::optional<std::string> LookupAccountName(ISecurityApi const &api = DefaultSecurityApi(),
                                                               std::string const &systemName = std::string()) const;
#endif

    [[nodiscard]] std::vector<std::uint8_t> const &Bytes() const
    {
        return _bytes;
    }

    /**
     * \brief Returns the SID as a platform handle.
     * Only use it when needed for API calls, do not store: the handle points
     * into this object.
     */
    [[nodiscard]] PSID GetSid() const;

    [[nodiscard]] bool operator==(Sid const &other) const
    {
        return _bytes == other._bytes;
    }
    [[nodiscard]] bool operator!=(Sid const &other) const
    {
        return _bytes != other._bytes;
    }
    [[nodiscard]] bool operator<(Sid const &other) const
    {
        return _bytes < other._bytes;
    }
    [[nodiscard]] bool operator<=(Sid const &other) const
    {
        return _bytes <= other._bytes;
    }
    [[nodiscard]] bool operator>(Sid const &other) const
    {
        return _bytes > other._bytes;
    }
    [[nodiscard]] bool operator>=(Sid const &other) const
    {
        return _bytes >= other._bytes;
    }

    /// 64-bit FNV-1a over the bytes.
    [[nodiscard]] std::size_t Hash() const noexcept;

private:
    std::vector<std::uint8_t> _bytes;

    explicit Sid(std::vector<std::uint8_t> bytes);

    // header, sub-authority count within bounds, and exactly that many sub-authorities
    bool IsWellFormed() const;
};

std::ostream &operator<<(std::ostream &os, Sid const &sid);

namespace WellKnownSID
{
Sid World();
Sid LocalSystem();
Sid LocalService();
Sid NetworkService();
Sid Anonymous();
Sid AuthenticatedUsers();
Sid BuiltinAdministrators();
Sid BuiltinUsers();
} // namespace WellKnownSID
} // namespace sidcore

namespace std
{
template <> struct hash<sidcore::Sid>
{
    std::size_t operator()(sidcore::Sid const &sid) const noexcept
    {
        return sid.Hash();
    }
};
} // namespace std
