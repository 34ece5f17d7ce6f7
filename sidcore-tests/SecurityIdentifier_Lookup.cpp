#include "stdafx.h"
#include "SecurityIdentifierTest.h"

#ifdef SIDCORE_ACCOUNT_LOOKUP

using sidcore::DWORD;
using sidcore::native_string;
using sidcore::NativeChar;
using sidcore::Sid;
using testing::_;
using testing::InSequence;
using testing::IsNull;
using testing::NotNull;
using testing::Return;

namespace
{
// Returns a LookupAccount action that reports the sizes needed for name and domain.
auto ReportSizes(DWORD nameSize, DWORD domainSize)
{
    return [nameSize, domainSize](NativeChar const *, sidcore::PSID, NativeChar *, DWORD *cchName, NativeChar *,
                                  DWORD *cchDomain) {
        *cchName = nameSize;
        *cchDomain = domainSize;
        return sidcore::errors::kInsufficientBuffer;
    };
}

// Returns a LookupAccount action that fills the caller's buffers.
auto FillBuffers(std::string const &name, std::string const &domain)
{
    return [name, domain](NativeChar const *, sidcore::PSID, NativeChar *nameBuf, DWORD *cchName,
                          NativeChar *domainBuf, DWORD *cchDomain) {
        native_string n = sidcore::Utf8ToNative(name);
        native_string d = sidcore::Utf8ToNative(domain);
        std::copy(n.begin(), n.end(), nameBuf);
        nameBuf[n.size()] = 0;
        std::copy(d.begin(), d.end(), domainBuf);
        domainBuf[d.size()] = 0;
        *cchName = static_cast<DWORD>(n.size());
        *cchDomain = static_cast<DWORD>(d.size());
        return sidcore::errors::kSuccess;
    };
}
} // namespace

TEST_F(SecurityIdentifierTest, With_MappedSid_LookupAccount_Returns_Name_And_Domain)
{
    Sid sid = MakeSid(localSystemBytes);
    InSequence seq;
    EXPECT_CALL(api, LookupAccount(IsNull(), sid.GetSid(), IsNull(), NotNull(), IsNull(), NotNull()))
        .WillOnce(ReportSizes(7, 13));
    EXPECT_CALL(api, LookupAccount(IsNull(), sid.GetSid(), NotNull(), NotNull(), NotNull(), NotNull()))
        .WillOnce(FillBuffers("SYSTEM", "NT AUTHORITY"));

    std::optional<sidcore::Account> account = sid.LookupAccount(api);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->Name, "SYSTEM");
    ASSERT_TRUE(account->Domain.has_value());
    EXPECT_EQ(*account->Domain, "NT AUTHORITY");
}

TEST_F(SecurityIdentifierTest, With_FillCall_LookupAccount_Passes_Probed_Sizes)
{
    Sid sid = MakeSid(localSystemBytes);
    InSequence seq;
    EXPECT_CALL(api, LookupAccount(_, _, IsNull(), _, IsNull(), _)).WillOnce(ReportSizes(7, 13));
    EXPECT_CALL(api, LookupAccount(_, _, NotNull(), NotNull(), NotNull(), NotNull()))
        .WillOnce([](NativeChar const *, sidcore::PSID, NativeChar *, DWORD *cchName, NativeChar *, DWORD *cchDomain) {
            EXPECT_EQ(*cchName, 7u);
            EXPECT_EQ(*cchDomain, 13u);
            return sidcore::errors::kNoneMapped;
        });

    EXPECT_FALSE(sid.LookupAccount(api).has_value());
}

TEST_F(SecurityIdentifierTest, With_UnmappedSid_LookupAccount_Returns_Nothing)
{
    Sid sid = MakeSid(localSystemBytes);
    EXPECT_CALL(api, LookupAccount(_, _, IsNull(), _, IsNull(), _)).WillOnce(Return(sidcore::errors::kNoneMapped));

    EXPECT_FALSE(sid.LookupAccount(api).has_value());
}

TEST_F(SecurityIdentifierTest, With_FailedFill_LookupAccount_Returns_Nothing)
{
    Sid sid = MakeSid(localSystemBytes);
    InSequence seq;
    EXPECT_CALL(api, LookupAccount(_, _, IsNull(), _, IsNull(), _)).WillOnce(ReportSizes(7, 13));
    EXPECT_CALL(api, LookupAccount(_, _, NotNull(), _, NotNull(), _))
        .WillOnce(Return(sidcore::errors::kNotEnoughMemory));

    EXPECT_FALSE(sid.LookupAccount(api).has_value());
}

TEST_F(SecurityIdentifierTest, With_TerminatorOnlyDomain_LookupAccount_Returns_No_Domain)
{
    Sid sid = MakeSid(everyoneBytes);
    InSequence seq;
    EXPECT_CALL(api, LookupAccount(_, _, IsNull(), _, IsNull(), _)).WillOnce(ReportSizes(9, 1));
    EXPECT_CALL(api, LookupAccount(_, _, NotNull(), _, NotNull(), _)).WillOnce(FillBuffers("Everyone", ""));

    std::optional<sidcore::Account> account = sid.LookupAccount(api);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->Name, "Everyone");
    EXPECT_FALSE(account->Domain.has_value());
}

TEST_F(SecurityIdentifierTest, With_EmptyDecodedDomain_LookupAccount_Returns_No_Domain)
{
    Sid sid = MakeSid(everyoneBytes);
    InSequence seq;
    EXPECT_CALL(api, LookupAccount(_, _, IsNull(), _, IsNull(), _)).WillOnce(ReportSizes(9, 8));
    EXPECT_CALL(api, LookupAccount(_, _, NotNull(), _, NotNull(), _)).WillOnce(FillBuffers("Everyone", ""));

    std::optional<sidcore::Account> account = sid.LookupAccount(api);
    ASSERT_TRUE(account.has_value());
    EXPECT_FALSE(account->Domain.has_value());
}

TEST_F(SecurityIdentifierTest, With_IncompleteBytes_LookupAccount_Returns_Nothing_Without_Platform_Call)
{
    Sid shortSid = MakeSid({1, 5});
    Sid truncated = MakeSid({1, 2, 0, 0, 0, 0, 0, 5, 32, 0, 0, 0});

    EXPECT_FALSE(shortSid.LookupAccount(api).has_value());
    EXPECT_FALSE(shortSid.LookupAccountName(api).has_value());
    EXPECT_FALSE(truncated.LookupAccount(api).has_value());
    EXPECT_FALSE(shortSid.LookupAccount().has_value());
}

TEST_F(SecurityIdentifierTest, With_SizingCallSucceeds_LookupAccount_Still_Fills)
{
    Sid sid = MakeSid(localSystemBytes);
    InSequence seq;
    EXPECT_CALL(api, LookupAccount(_, _, IsNull(), _, IsNull(), _))
        .WillOnce([](NativeChar const *, sidcore::PSID, NativeChar *, DWORD *cchName, NativeChar *, DWORD *cchDomain) {
            *cchName = 7;
            *cchDomain = 13;
            return sidcore::errors::kSuccess;
        });
    EXPECT_CALL(api, LookupAccount(_, _, NotNull(), _, NotNull(), _))
        .WillOnce(FillBuffers("SYSTEM", "NT AUTHORITY"));

    std::optional<sidcore::Account> account = sid.LookupAccount(api);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->Name, "SYSTEM");
    EXPECT_EQ(account->Domain, std::optional<std::string>("NT AUTHORITY"));
}

TEST_F(SecurityIdentifierTest, With_OneCharacterDomain_LookupAccount_Keeps_Domain)
{
    Sid sid = MakeSid(localSystemBytes);
    InSequence seq;
    // one character plus the terminator
    EXPECT_CALL(api, LookupAccount(_, _, IsNull(), _, IsNull(), _)).WillOnce(ReportSizes(6, 2));
    EXPECT_CALL(api, LookupAccount(_, _, NotNull(), _, NotNull(), _)).WillOnce(FillBuffers("alice", "X"));

    std::optional<sidcore::Account> account = sid.LookupAccount(api);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->Name, "alice");
    EXPECT_EQ(account->Domain, std::optional<std::string>("X"));
}

TEST_F(SecurityIdentifierTest, With_SystemName_LookupAccount_Asks_That_Machine)
{
    Sid sid = MakeSid(localSystemBytes);
    native_string expected = sidcore::Utf8ToNative("dc01");
    EXPECT_CALL(api, LookupAccount(NotNull(), _, IsNull(), _, IsNull(), _))
        .WillOnce([&expected](NativeChar const *systemName, sidcore::PSID, NativeChar *, DWORD *, NativeChar *,
                              DWORD *) {
            EXPECT_EQ(native_string(systemName), expected);
            return sidcore::errors::kNotSupported;
        });

    EXPECT_FALSE(sid.LookupAccount(api, "dc01").has_value());
}

TEST_F(SecurityIdentifierTest, With_MappedSid_LookupAccountName_Returns_Name_Only)
{
    Sid sid = MakeSid(localSystemBytes);
    InSequence seq;
    EXPECT_CALL(api, LookupAccount(_, _, IsNull(), _, IsNull(), _)).WillOnce(ReportSizes(7, 13));
    EXPECT_CALL(api, LookupAccount(_, _, NotNull(), _, NotNull(), _))
        .WillOnce(FillBuffers("SYSTEM", "NT AUTHORITY"));

    EXPECT_EQ(sid.LookupAccountName(api), std::optional<std::string>("SYSTEM"));
}

TEST_F(SecurityIdentifierTest, With_DefaultApi_UnmappedSid_LookupAccount_Returns_Nothing)
{
    Sid sid = Sid::FromString("S-1-5-21-1-2-3-4000");
    EXPECT_FALSE(sid.LookupAccount().has_value());
    EXPECT_FALSE(sid.LookupAccountName().has_value());
}

#ifndef _WIN32
// Windows localizes account names, only the portable backend has fixed ones.
TEST_F(SecurityIdentifierTest, With_DefaultApi_WellKnownSid_LookupAccount_Resolves)
{
    std::optional<sidcore::Account> system = Sid::FromString("S-1-5-18").LookupAccount();
    ASSERT_TRUE(system.has_value());
    EXPECT_EQ(system->Name, "SYSTEM");
    EXPECT_EQ(system->Domain, std::optional<std::string>("NT AUTHORITY"));

    std::optional<sidcore::Account> everyone = Sid::FromString("S-1-1-0").LookupAccount();
    ASSERT_TRUE(everyone.has_value());
    EXPECT_EQ(everyone->Name, "Everyone");
    EXPECT_FALSE(everyone->Domain.has_value());
}
#endif

#endif
