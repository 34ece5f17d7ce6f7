#include "stdafx.h"
#include "SecurityIdentifierTest.h"

using testing::_;
using testing::Return;

namespace
{
std::vector<std::pair<std::string, int>> messages;

void CaptureLog(char *message, int level)
{
    messages.emplace_back(message, level);
}
} // namespace

class LogTest : public SecurityIdentifierTest
{
  protected:
    void SetUp() override
    {
        SecurityIdentifierTest::SetUp();
        messages.clear();
        sidcore::SetLogCallback(CaptureLog);
    }

    void TearDown() override
    {
        sidcore::SetLogCallback(nullptr);
        messages.clear();
    }
};

TEST_F(LogTest, With_Callback_Log_Formats_Message)
{
    sidcore::Log(sidcore::SIDCORE_LOG_INFO, "value %d of %s", 42, "answer");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].first, "value 42 of answer");
    EXPECT_EQ(messages[0].second, sidcore::SIDCORE_LOG_INFO);
}

TEST_F(LogTest, Without_Callback_Log_Drops_Message)
{
    sidcore::SetLogCallback(nullptr);
    sidcore::Log(sidcore::SIDCORE_LOG_ERROR, "dropped");

    EXPECT_TRUE(messages.empty());
}

TEST_F(LogTest, With_CopyFailure_FromPSID_Logs_At_Debug_Level)
{
    sidcore::PSID psid = localSystemBytes.data();
    EXPECT_CALL(api, IsValid(psid)).WillOnce(Return(true));
    EXPECT_CALL(api, Length(psid)).WillOnce(Return(12));
    EXPECT_CALL(api, Copy(_, _, _)).WillOnce(Return(sidcore::errors::kInvalidSid));

    EXPECT_FALSE(sidcore::Sid::FromPSID(psid, api).has_value());
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_THAT(messages[0].first, testing::HasSubstr("CopySid failed"));
    EXPECT_EQ(messages[0].second, sidcore::SIDCORE_LOG_DEBUG);
}

TEST_F(LogTest, With_FailedConversion_ToString_Logs_At_Debug_Level)
{
    sidcore::Sid sid = MakeSid(localSystemBytes);
    EXPECT_CALL(api, ToStringSid(_, _)).WillOnce(Return(sidcore::errors::kInvalidSid));

    EXPECT_THROW((void)sid.ToString(api), sidcore::SidFormatException);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_THAT(messages[0].first, testing::HasSubstr("ConvertSidToStringSid failed"));
    EXPECT_EQ(messages[0].second, sidcore::SIDCORE_LOG_DEBUG);
}

TEST(FormatErrorMessageTest, With_ErrorCode_Message_Ends_With_Hex_Code)
{
    std::string message = sidcore::FormatErrorMessage(sidcore::errors::kInvalidSid);
    EXPECT_THAT(message, testing::EndsWith("(0x539)"));
}
