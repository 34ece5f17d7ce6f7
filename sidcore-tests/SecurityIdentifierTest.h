#pragma once

#include "stdafx.h"
#include "SecurityApiMock.h"

class SecurityIdentifierTest : public testing::Test
{
  protected:
    testing::StrictMock<SecurityApiMock> api;

    // S-1-5-18
    std::vector<std::uint8_t> localSystemBytes;
    // S-1-1-0
    std::vector<std::uint8_t> everyoneBytes;

    void SetUp() override
    {
        localSystemBytes = {1, 1, 0, 0, 0, 0, 0, 5, 18, 0, 0, 0};
        everyoneBytes = {1, 1, 0, 0, 0, 0, 0, 1, 0, 0, 0, 0};
    }

    /// Lets the mock hand out a copy of the SID stored in \p bytes.
    void ExpectCopyOf(std::vector<std::uint8_t> &bytes)
    {
        sidcore::PSID psid = bytes.data();
        auto length = static_cast<sidcore::DWORD>(bytes.size());
        EXPECT_CALL(api, IsValid(psid)).WillOnce(testing::Return(true));
        EXPECT_CALL(api, Length(psid)).WillOnce(testing::Return(length));
        EXPECT_CALL(api, Copy(length, testing::NotNull(), psid))
            .WillOnce([](sidcore::DWORD len, sidcore::PSID dest, sidcore::PSID src) {
                std::memcpy(dest, src, len);
                return sidcore::errors::kSuccess;
            });
    }

    static sidcore::Sid MakeSid(std::vector<std::uint8_t> bytes)
    {
        return sidcore::Sid::FromBytes(std::move(bytes)).value();
    }
};
