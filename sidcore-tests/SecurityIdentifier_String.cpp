#include "stdafx.h"
#include "SecurityIdentifierTest.h"

using sidcore::native_string;
using sidcore::NativeChar;
using sidcore::Sid;
using sidcore::SidFormatException;
using sidcore::SidParseException;
using testing::_;
using testing::NotNull;
using testing::Return;

TEST_F(SecurityIdentifierTest, With_Everyone_FromString_Formats_Back)
{
    Sid everyone = Sid::FromString("S-1-1-0");
    EXPECT_EQ(everyone.Bytes(), everyoneBytes);
    EXPECT_EQ(everyone.ToString(), "S-1-1-0");
}

TEST_F(SecurityIdentifierTest, With_LocalSystem_FromString_Parse_Correctly)
{
    Sid localSystem = Sid::FromString("S-1-5-18");
    EXPECT_EQ(localSystem.Bytes(), localSystemBytes);
}

TEST_F(SecurityIdentifierTest, With_CanonicalStrings_Format_Is_Stable)
{
    std::vector<std::string> samples = {
        "S-1-1-0",
        "S-1-5-18",
        "s-1-5-32-544",
        "S-1-5-21-3623811015-3361044348-30300820-1013",
        "S-1-16-12288",
    };

    for (auto const &sample : samples)
    {
        Sid parsed = Sid::FromString(sample);
        std::string formatted = parsed.ToString();
        EXPECT_EQ(Sid::FromString(formatted), parsed) << sample;
        EXPECT_EQ(formatted.rfind("S-1-", 0), 0u) << formatted;
    }
}

TEST_F(SecurityIdentifierTest, With_InvalidStrings_FromString_Throws_ParseError)
{
    std::vector<std::string> samples = {"not-a-sid", "", "S-", "hello world"};

    for (auto const &sample : samples)
    {
        EXPECT_THROW((void)Sid::FromString(sample), SidParseException) << sample;
    }
}

TEST_F(SecurityIdentifierTest, With_InvalidString_ParseError_Describes_Failure)
{
    try
    {
        (void)Sid::FromString("not-a-sid");
        FAIL() << "expected a parse error";
    }
    catch (SidParseException const &e)
    {
        EXPECT_EQ(e.GetErrorCode(), sidcore::errors::kInvalidSid);
        EXPECT_THAT(e.what(), testing::HasSubstr("not-a-sid"));
    }
}

TEST_F(SecurityIdentifierTest, With_Sid_Stream_Writes_Canonical_String)
{
    std::ostringstream out;
    out << Sid::FromString("S-1-5-32-545");
    EXPECT_EQ(out.str(), "S-1-5-32-545");
}

TEST_F(SecurityIdentifierTest, With_SuccessfulConversion_ToString_Releases_Buffer_Once)
{
    Sid sid = MakeSid(localSystemBytes);
    native_string canonical = sidcore::Utf8ToNative("S-1-5-18");
    NativeChar *buffer = canonical.data();

    EXPECT_CALL(api, ToStringSid(sid.GetSid(), NotNull()))
        .WillOnce([buffer](sidcore::PSID, NativeChar **stringSid) {
            *stringSid = buffer;
            return sidcore::errors::kSuccess;
        });
    EXPECT_CALL(api, Free(buffer)).Times(1);

    EXPECT_EQ(sid.ToString(api), "S-1-5-18");
}

TEST_F(SecurityIdentifierTest, With_FailedConversion_ToString_Throws_Without_Release)
{
    Sid sid = MakeSid(localSystemBytes);

    EXPECT_CALL(api, ToStringSid(_, _)).WillOnce(Return(sidcore::errors::kNotEnoughMemory));
    EXPECT_CALL(api, Free(_)).Times(0);

    try
    {
        (void)sid.ToString(api);
        FAIL() << "expected a format error";
    }
    catch (SidFormatException const &e)
    {
        EXPECT_EQ(e.GetErrorCode(), sidcore::errors::kNotEnoughMemory);
    }
}

TEST_F(SecurityIdentifierTest, With_IncompleteBytes_ToString_Throws_Without_Platform_Call)
{
    std::vector<std::vector<std::uint8_t>> samples = {
        {1},
        {1, 5},
        {1, 0xFF, 0xAB},
        // claims one sub-authority but carries none
        {1, 1, 0, 0, 0, 0, 0, 5},
        // trailing byte after the only sub-authority
        {1, 1, 0, 0, 0, 0, 0, 5, 18, 0, 0, 0, 0},
    };

    for (auto const &bytes : samples)
    {
        Sid sid = MakeSid(bytes);
        try
        {
            (void)sid.ToString(api);
            FAIL() << "expected a format error for " << bytes.size() << " bytes";
        }
        catch (SidFormatException const &e)
        {
            EXPECT_EQ(e.GetErrorCode(), sidcore::errors::kInvalidSid);
        }
    }
}

TEST_F(SecurityIdentifierTest, With_IncompleteBytes_DefaultApi_ToString_Throws)
{
    Sid sid = MakeSid({1, 5});
    EXPECT_THROW((void)sid.ToString(), SidFormatException);
}

TEST_F(SecurityIdentifierTest, With_FifteenSubAuthorities_ToString_Reaches_Platform)
{
    std::vector<std::uint8_t> bytes(sidcore::kSidHeaderLength + 4 * 15, 0);
    bytes[0] = 1;
    bytes[1] = 15;
    bytes[7] = 5;
    Sid sid = MakeSid(bytes);

    EXPECT_CALL(api, ToStringSid(sid.GetSid(), NotNull())).WillOnce(Return(sidcore::errors::kNotEnoughMemory));
    EXPECT_THROW((void)sid.ToString(api), SidFormatException);
}

TEST_F(SecurityIdentifierTest, With_SuccessfulConversion_FromString_Releases_Structure_Once)
{
    sidcore::PSID psid = localSystemBytes.data();

    EXPECT_CALL(api, FromStringSid(NotNull(), NotNull()))
        .WillOnce([psid](NativeChar const *stringSid, sidcore::PSID *sid) {
            EXPECT_EQ(native_string(stringSid), sidcore::Utf8ToNative("S-1-5-18"));
            *sid = psid;
            return sidcore::errors::kSuccess;
        });
    ExpectCopyOf(localSystemBytes);
    EXPECT_CALL(api, Free(psid)).Times(1);

    Sid sid = Sid::FromString("S-1-5-18", api);
    EXPECT_EQ(sid.Bytes(), localSystemBytes);
}

TEST_F(SecurityIdentifierTest, With_RejectedString_FromString_Throws_Without_Release)
{
    EXPECT_CALL(api, FromStringSid(_, _)).WillOnce(Return(sidcore::errors::kInvalidSid));
    EXPECT_CALL(api, IsValid(_)).Times(0);
    EXPECT_CALL(api, Free(_)).Times(0);

    EXPECT_THROW((void)Sid::FromString("S-1-5-bogus", api), SidParseException);
}

namespace
{
// The platform accepts the string but hands back something that is not a SID.
void ParseIntoInvalidSid()
{
    testing::NiceMock<SecurityApiMock> niceApi;
    std::uint8_t garbage[12] = {};
    ON_CALL(niceApi, FromStringSid(_, _)).WillByDefault([&garbage](NativeChar const *, sidcore::PSID *sid) {
        *sid = garbage;
        return sidcore::errors::kSuccess;
    });
    ON_CALL(niceApi, IsValid(_)).WillByDefault(Return(false));
    (void)Sid::FromString("S-1-5-18", niceApi);
}
} // namespace

using SecurityIdentifierDeathTest = SecurityIdentifierTest;

TEST_F(SecurityIdentifierDeathTest, With_InvalidPlatformResult_FromString_Fails_Fast)
{
    EXPECT_DEATH(ParseIntoInvalidSid(), "returned an invalid SID");
}
