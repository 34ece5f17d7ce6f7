#include "stdafx.h"
#include "SecurityIdentifierTest.h"

using sidcore::Sid;
using testing::_;
using testing::Return;

TEST_F(SecurityIdentifierTest, With_NullHandle_FromPSID_Returns_Nothing)
{
    EXPECT_FALSE(Sid::FromPSID(nullptr, api).has_value());
}

TEST_F(SecurityIdentifierTest, With_InvalidSid_FromPSID_Returns_Nothing)
{
    EXPECT_CALL(api, IsValid(localSystemBytes.data())).WillOnce(Return(false));
    EXPECT_CALL(api, Length(_)).Times(0);
    EXPECT_CALL(api, Copy(_, _, _)).Times(0);

    EXPECT_FALSE(Sid::FromPSID(localSystemBytes.data(), api).has_value());
}

TEST_F(SecurityIdentifierTest, With_CopyFailure_FromPSID_Returns_Nothing)
{
    sidcore::PSID psid = localSystemBytes.data();
    EXPECT_CALL(api, IsValid(psid)).WillOnce(Return(true));
    EXPECT_CALL(api, Length(psid)).WillOnce(Return(12));
    EXPECT_CALL(api, Copy(12, _, psid)).WillOnce(Return(sidcore::errors::kInsufficientBuffer));

    EXPECT_FALSE(Sid::FromPSID(psid, api).has_value());
}

TEST_F(SecurityIdentifierTest, With_ValidSid_FromPSID_Copies_Bytes)
{
    ExpectCopyOf(localSystemBytes);

    std::optional<Sid> sid = Sid::FromPSID(localSystemBytes.data(), api);
    ASSERT_TRUE(sid.has_value());
    EXPECT_EQ(sid->Bytes(), localSystemBytes);
}

TEST_F(SecurityIdentifierTest, With_ValidSid_FromPSID_Does_Not_Alias_Handle)
{
    ExpectCopyOf(localSystemBytes);

    std::optional<Sid> sid = Sid::FromPSID(localSystemBytes.data(), api);
    ASSERT_TRUE(sid.has_value());
    EXPECT_NE(sid->GetSid(), static_cast<sidcore::PSID>(localSystemBytes.data()));

    std::vector<std::uint8_t> expected = localSystemBytes;
    localSystemBytes[8] = 19;
    EXPECT_EQ(sid->Bytes(), expected);
}

TEST_F(SecurityIdentifierTest, With_DefaultApi_FromPSID_Copies_Bytes)
{
    std::optional<Sid> sid = Sid::FromPSID(everyoneBytes.data());
    ASSERT_TRUE(sid.has_value());
    EXPECT_EQ(sid->Bytes(), everyoneBytes);
}

namespace
{
// Runs FromPSID against a platform that copies \p bytes verbatim.
void CopyThroughPlatform(std::vector<std::uint8_t> bytes)
{
    testing::NiceMock<SecurityApiMock> niceApi;
    auto length = static_cast<sidcore::DWORD>(bytes.size());
    ON_CALL(niceApi, IsValid(_)).WillByDefault(Return(true));
    ON_CALL(niceApi, Length(_)).WillByDefault(Return(length));
    ON_CALL(niceApi, Copy(_, _, _)).WillByDefault([&bytes](sidcore::DWORD len, sidcore::PSID dest, sidcore::PSID) {
        if (len > 0)
        {
            std::memcpy(dest, bytes.data(), len);
        }
        return sidcore::errors::kSuccess;
    });
    std::uint8_t handle = 1;
    (void)Sid::FromPSID(&handle, niceApi);
}

void CopyRevision2()
{
    CopyThroughPlatform({2, 1, 0, 0, 0, 0, 0, 5, 18, 0, 0, 0});
}

void CopyNothing()
{
    CopyThroughPlatform({});
}
} // namespace

using SecurityIdentifierDeathTest = SecurityIdentifierTest;

TEST_F(SecurityIdentifierDeathTest, With_Revision2_FromPSID_Fails_Fast)
{
    EXPECT_DEATH(CopyRevision2(), "Expected SID revision to be 1");
}

TEST_F(SecurityIdentifierDeathTest, With_EmptyCopy_FromPSID_Fails_Fast)
{
    EXPECT_DEATH(CopyNothing(), "Expected SID revision to be 1");
}
